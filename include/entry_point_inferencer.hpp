#pragma once

#include <string>
#include <vector>
#include <unordered_set>
#include "file_record.hpp"
#include "import_graph.hpp"

struct EntryPointOptions {
    // File stems that conventionally start a program
    std::vector<std::string> stems = {"main", "cli", "index", "app", "__main__"};

    // Graph shape fires for in-degree 0 and resolved out-degree >= threshold
    size_t outDegreeThreshold = 1;

    // Name matches only count inside a root-like directory
    bool requirePackageRoot = true;

    double patternConfidence = 0.6;
    double scanRootBonus = 0.2;
    double shapeConfidence = 0.5;
    double shapeStep = 0.1;      // Per import above the threshold
    double shapeMaxBonus = 0.4;
};

/**
 * @brief Flags likely program entry points
 *
 * Two independent signals, combined by union: a conventional file name at a
 * package root, and the "imports others, imported by nobody" graph shape. A
 * file matching both is reported twice, once per reason.
 *
 * Candidates are ordered by the file's summed confidence (descending), then by
 * path, then name-pattern before graph-shape.
 */
class EntryPointInferencer {
public:
    explicit EntryPointInferencer(EntryPointOptions options = {},
                                  std::vector<std::string> rootDirectories = {""});

    std::vector<EntryPointCandidate> infer(const ImportGraph& graph) const;

    // Same, but name matches are limited to files in a parsed source language
    std::vector<EntryPointCandidate> infer(const ImportGraph& graph, const std::vector<FileRecord>& records) const;

    bool matchesEntryName(const std::string& path) const;
    bool isPackageRootFile(const std::string& path) const;

    const EntryPointOptions& options() const { return options_; }

private:
    EntryPointOptions options_;
    std::unordered_set<std::string> rootDirectories_;

    std::vector<EntryPointCandidate> inferFor(const ImportGraph& graph,
                                              const std::unordered_set<std::string>* nameEligible) const;
};
