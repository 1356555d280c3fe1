#include "navigation_synthesizer.hpp"
#include <algorithm>
#include <map>
#include <queue>
#include <set>

const char* const ENTRY_PATH_LABEL = "entry \xE2\x86\x92 most-referenced";
const char* const ISOLATED_COMPONENT_LABEL = "isolated component";

NavigationSynthesizer::NavigationSynthesizer(NavigationOptions options)
    : options_(options) {
}

std::optional<NavigationPath> NavigationSynthesizer::entryPath(const ImportGraph& graph,
                                                               const std::string& entry) const {
    if (!graph.contains(entry)) {
        return std::nullopt;
    }

    std::map<std::string, std::string> parent;
    std::map<std::string, size_t> depth;
    std::queue<std::string> pending;

    depth[entry] = 0;
    pending.push(entry);

    // The visited set and hop limit keep cycles finite
    while (!pending.empty()) {
        const std::string current = pending.front();
        pending.pop();

        if (depth[current] >= options_.hopLimit) {
            continue;
        }

        for (const auto& next : graph.successors(current)) {
            if (depth.count(next)) {
                continue;
            }
            depth[next] = depth[current] + 1;
            parent[next] = current;
            pending.push(next);
        }
    }

    std::optional<std::string> best;
    size_t bestDegree = 0;
    for (const auto& item : depth) {
        if (item.first == entry) {
            continue;
        }
        const size_t degree = graph.inDegree(item.first);
        // depth is ordered by path, so the first maximum is the lexical winner
        if (!best || degree > bestDegree) {
            best = item.first;
            bestDegree = degree;
        }
    }

    if (!best) {
        return std::nullopt;
    }

    NavigationPath path;
    path.label = ENTRY_PATH_LABEL;
    for (std::string node = *best; ; node = parent[node]) {
        path.files.push_back(node);
        if (node == entry) {
            break;
        }
    }
    std::reverse(path.files.begin(), path.files.end());
    return path;
}

std::vector<NavigationPath> NavigationSynthesizer::isolatedClusters(
        const ImportGraph& graph, const std::vector<EntryPointCandidate>& entryPoints) const {
    std::set<std::string> entries;
    for (const auto& candidate : entryPoints) {
        entries.insert(candidate.path);
    }

    std::vector<std::vector<std::string>> clusters;
    for (auto& component : graph.weaklyConnectedComponents()) {
        if (component.size() < std::max<size_t>(options_.minClusterSize, 1)) {
            continue;
        }
        const bool hasEntry = std::any_of(component.begin(), component.end(),
            [&](const std::string& path) { return entries.count(path) > 0; });
        if (!hasEntry) {
            clusters.push_back(std::move(component));
        }
    }

    std::stable_sort(clusters.begin(), clusters.end(),
        [](const std::vector<std::string>& a, const std::vector<std::string>& b) {
            if (a.size() != b.size()) {
                return a.size() > b.size();
            }
            return a.front() < b.front();
        });

    std::vector<NavigationPath> paths;
    for (const auto& cluster : clusters) {
        if (paths.size() >= options_.maxClusters) {
            break;
        }
        NavigationPath path;
        path.label = ISOLATED_COMPONENT_LABEL;
        const size_t count = std::min(cluster.size(), options_.maxClusterMembers);
        path.files.assign(cluster.begin(), cluster.begin() + static_cast<std::ptrdiff_t>(count));
        paths.push_back(std::move(path));
    }
    return paths;
}

std::vector<NavigationPath> NavigationSynthesizer::synthesize(
        const ImportGraph& graph, const std::vector<EntryPointCandidate>& entryPoints) const {
    // Distinct entry files, most connected first
    std::vector<std::string> entries;
    for (const auto& candidate : entryPoints) {
        if (std::find(entries.begin(), entries.end(), candidate.path) == entries.end()) {
            entries.push_back(candidate.path);
        }
    }

    std::sort(entries.begin(), entries.end(),
        [&](const std::string& a, const std::string& b) {
            const size_t degreeA = graph.inDegree(a) + graph.outDegree(a);
            const size_t degreeB = graph.inDegree(b) + graph.outDegree(b);
            if (degreeA != degreeB) {
                return degreeA > degreeB;
            }
            return a < b;
        });

    if (entries.size() > options_.maxEntryPaths) {
        entries.resize(options_.maxEntryPaths);
    }

    std::vector<NavigationPath> paths;
    for (const auto& entry : entries) {
        if (auto path = entryPath(graph, entry)) {
            paths.push_back(std::move(*path));
        }
    }

    for (auto& cluster : isolatedClusters(graph, entryPoints)) {
        paths.push_back(std::move(cluster));
    }

    return paths;
}
