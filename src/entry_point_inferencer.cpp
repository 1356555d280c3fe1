#include "entry_point_inferencer.hpp"
#include "import_resolver.hpp"
#include <algorithm>
#include <map>
#include <sstream>

EntryPointInferencer::EntryPointInferencer(EntryPointOptions options, std::vector<std::string> rootDirectories)
    : options_(std::move(options)),
      rootDirectories_(rootDirectories.begin(), rootDirectories.end()) {
}

bool EntryPointInferencer::matchesEntryName(const std::string& path) const {
    const std::string stem = fileStem(path);
    return std::find(options_.stems.begin(), options_.stems.end(), stem) != options_.stems.end();
}

bool EntryPointInferencer::isPackageRootFile(const std::string& path) const {
    return rootDirectories_.count(parentDirectory(path)) > 0;
}

std::vector<EntryPointCandidate> EntryPointInferencer::infer(const ImportGraph& graph) const {
    return inferFor(graph, nullptr);
}

std::vector<EntryPointCandidate> EntryPointInferencer::infer(const ImportGraph& graph,
                                                             const std::vector<FileRecord>& records) const {
    std::unordered_set<std::string> sourceFiles;
    for (const auto& record : records) {
        if (LanguageClassifier::isSourceLanguage(record.language)) {
            sourceFiles.insert(record.path);
        }
    }
    return inferFor(graph, &sourceFiles);
}

std::vector<EntryPointCandidate> EntryPointInferencer::inferFor(
        const ImportGraph& graph, const std::unordered_set<std::string>* nameEligible) const {
    std::vector<EntryPointCandidate> candidates;

    for (const auto& path : graph.nodes()) {
        // Conventional file name
        if (matchesEntryName(path) && (!nameEligible || nameEligible->count(path))) {
            const bool atRoot = isPackageRootFile(path);
            if (atRoot || !options_.requirePackageRoot) {
                EntryPointCandidate candidate;
                candidate.path = path;
                candidate.reason = EntryReason::NamePattern;
                candidate.confidence = options_.patternConfidence;
                if (parentDirectory(path).empty()) {
                    candidate.confidence += options_.scanRootBonus;
                }

                std::ostringstream why;
                why << "file name '" << fileStem(path) << "' is a conventional entry point";
                if (atRoot) {
                    why << (parentDirectory(path).empty() ? " at the scan root" : " at a package root");
                }
                candidate.justification = why.str();
                candidates.push_back(std::move(candidate));
            }
        }

        // Imported by nobody, imports others
        const size_t in = graph.inDegree(path);
        const size_t out = graph.outDegree(path);
        if (in == 0 && out >= options_.outDegreeThreshold && out > 0) {
            EntryPointCandidate candidate;
            candidate.path = path;
            candidate.reason = EntryReason::GraphShape;
            candidate.confidence = options_.shapeConfidence +
                std::min(options_.shapeMaxBonus,
                         options_.shapeStep * static_cast<double>(out - options_.outDegreeThreshold));

            std::ostringstream why;
            why << "imported by no scanned file, imports " << out << (out == 1 ? " file" : " files");
            candidate.justification = why.str();
            candidates.push_back(std::move(candidate));
        }
    }

    std::map<std::string, double> totals;
    for (const auto& candidate : candidates) {
        totals[candidate.path] += candidate.confidence;
    }

    std::sort(candidates.begin(), candidates.end(),
        [&](const EntryPointCandidate& a, const EntryPointCandidate& b) {
            const double totalA = totals[a.path];
            const double totalB = totals[b.path];
            if (totalA != totalB) {
                return totalA > totalB;
            }
            if (a.path != b.path) {
                return a.path < b.path;
            }
            return a.reason == EntryReason::NamePattern && b.reason == EntryReason::GraphShape;
        });

    return candidates;
}
