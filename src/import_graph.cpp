#include "import_graph.hpp"
#include <algorithm>
#include <queue>
#include <set>
#include <stdexcept>

ImportGraph::ImportGraph(std::vector<std::string> paths, std::vector<ImportEdge> edges)
    : nodes_(std::move(paths)), edges_(std::move(edges)) {
    std::sort(nodes_.begin(), nodes_.end());
    nodes_.erase(std::unique(nodes_.begin(), nodes_.end()), nodes_.end());

    for (size_t i = 0; i < nodes_.size(); ++i) {
        index_[nodes_[i]] = i;
    }

    outgoing_.resize(nodes_.size());
    incoming_.resize(nodes_.size());

    for (size_t e = 0; e < edges_.size(); ++e) {
        const ImportEdge& edge = edges_[e];

        auto source = index_.find(edge.source);
        if (source == index_.end()) {
            throw std::invalid_argument("Import edge from unknown file: " + edge.source);
        }
        outgoing_[source->second].push_back(e);

        if (edge.target) {
            auto target = index_.find(*edge.target);
            if (target == index_.end()) {
                throw std::invalid_argument("Import edge to unknown file: " + *edge.target);
            }
            incoming_[target->second].push_back(e);
        }
    }
}

ImportGraph ImportGraph::build(const std::vector<FileRecord>& records, const std::vector<ImportEdge>& edges) {
    std::vector<std::string> paths;
    paths.reserve(records.size());
    for (const auto& record : records) {
        paths.push_back(record.path);
    }
    return ImportGraph(std::move(paths), edges);
}

std::optional<size_t> ImportGraph::indexOf(const std::string& path) const {
    auto it = index_.find(path);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t ImportGraph::inDegree(const std::string& path) const {
    auto index = indexOf(path);
    if (!index) {
        return 0;
    }
    return static_cast<size_t>(std::count_if(incoming_[*index].begin(), incoming_[*index].end(),
        [&](size_t e) { return edges_[e].target && *edges_[e].target == path; }));
}

size_t ImportGraph::outDegree(const std::string& path) const {
    auto index = indexOf(path);
    if (!index) {
        return 0;
    }
    return static_cast<size_t>(std::count_if(outgoing_[*index].begin(), outgoing_[*index].end(),
        [&](size_t e) { return edges_[e].resolved(); }));
}

std::vector<std::string> ImportGraph::successors(const std::string& path) const {
    std::set<std::string> result;
    if (auto index = indexOf(path)) {
        for (size_t e : outgoing_[*index]) {
            if (edges_[e].target) {
                result.insert(*edges_[e].target);
            }
        }
    }
    return {result.begin(), result.end()};
}

std::vector<std::string> ImportGraph::predecessors(const std::string& path) const {
    std::set<std::string> result;
    if (auto index = indexOf(path)) {
        for (size_t e : incoming_[*index]) {
            result.insert(edges_[e].source);
        }
    }
    return {result.begin(), result.end()};
}

std::vector<ImportEdge> ImportGraph::edgesFrom(const std::string& path) const {
    std::vector<ImportEdge> result;
    if (auto index = indexOf(path)) {
        for (size_t e : outgoing_[*index]) {
            result.push_back(edges_[e]);
        }
    }
    return result;
}

std::vector<std::vector<std::string>> ImportGraph::weaklyConnectedComponents() const {
    // Undirected adjacency over resolved edges
    std::vector<std::vector<size_t>> neighbours(nodes_.size());
    for (const auto& edge : edges_) {
        if (!edge.target) {
            continue;
        }
        const size_t a = index_.at(edge.source);
        const size_t b = index_.at(*edge.target);
        neighbours[a].push_back(b);
        neighbours[b].push_back(a);
    }

    std::vector<bool> visited(nodes_.size(), false);
    std::vector<std::vector<std::string>> components;

    // Nodes are sorted, so components come out ordered by their first member
    for (size_t start = 0; start < nodes_.size(); ++start) {
        if (visited[start]) {
            continue;
        }

        std::vector<std::string> members;
        std::queue<size_t> pending;
        pending.push(start);
        visited[start] = true;

        while (!pending.empty()) {
            const size_t current = pending.front();
            pending.pop();
            members.push_back(nodes_[current]);

            for (size_t next : neighbours[current]) {
                if (!visited[next]) {
                    visited[next] = true;
                    pending.push(next);
                }
            }
        }

        std::sort(members.begin(), members.end());
        components.push_back(std::move(members));
    }

    return components;
}
