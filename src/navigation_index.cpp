#include "navigation_index.hpp"
#include <algorithm>
#include <unordered_set>

const FileRecord* NavigationIndex::find(const std::string& path) const {
    auto it = std::lower_bound(files_.begin(), files_.end(), path,
        [](const FileRecord& record, const std::string& key) { return record.path < key; });
    if (it != files_.end() && it->path == path) {
        return &*it;
    }
    return nullptr;
}

std::vector<ImportEdge> NavigationIndex::unresolvedEdges() const {
    std::vector<ImportEdge> result;
    for (const auto& edge : edges()) {
        if (!edge.resolved()) {
            result.push_back(edge);
        }
    }
    return result;
}

size_t NavigationIndex::totalLines() const {
    size_t total = 0;
    for (const auto& record : files_) {
        total += record.lineCount;
    }
    return total;
}

uint64_t NavigationIndex::totalBytes() const {
    uint64_t total = 0;
    for (const auto& record : files_) {
        total += record.size;
    }
    return total;
}

size_t NavigationIndex::functionCount() const {
    size_t total = 0;
    for (const auto& record : files_) {
        total += record.functions.size();
    }
    return total;
}

size_t NavigationIndex::classCount() const {
    size_t total = 0;
    for (const auto& record : files_) {
        total += record.classes.size();
    }
    return total;
}

NavigationIndex IndexAssembler::assemble(std::vector<FileRecord> records,
                                         std::vector<ImportEdge> edges,
                                         std::vector<EntryPointCandidate> entryPoints,
                                         std::vector<NavigationPath> paths,
                                         IndexDiagnostics diagnostics) {
    std::sort(records.begin(), records.end(),
        [](const FileRecord& a, const FileRecord& b) { return a.path < b.path; });

    std::unordered_set<std::string> known;
    for (const auto& record : records) {
        if (!known.insert(record.path).second) {
            throw IndexInvariantError("Duplicate file path in index: " + record.path);
        }
    }

    for (const auto& edge : edges) {
        if (!known.count(edge.source)) {
            throw IndexInvariantError("Import edge from unindexed file: " + edge.source);
        }
        if (edge.target && !known.count(*edge.target)) {
            throw IndexInvariantError("Import edge " + edge.source + " -> " + *edge.target +
                                      " targets an unindexed file");
        }
        if (edge.target.has_value() == (edge.confidence == Confidence::Unresolved)) {
            throw IndexInvariantError("Import edge " + edge.source + " (" + edge.token +
                                      ") has confidence inconsistent with its target");
        }
    }

    for (const auto& candidate : entryPoints) {
        if (!known.count(candidate.path)) {
            throw IndexInvariantError("Entry point is not an indexed file: " + candidate.path);
        }
    }

    for (const auto& path : paths) {
        for (const auto& file : path.files) {
            if (!known.count(file)) {
                throw IndexInvariantError("Navigation path '" + path.label + "' names unindexed file: " + file);
            }
        }
    }

    // Edges grouped by source, import order kept within a source
    std::stable_sort(edges.begin(), edges.end(),
        [](const ImportEdge& a, const ImportEdge& b) { return a.source < b.source; });

    diagnostics.unparsedFiles = static_cast<size_t>(std::count_if(records.begin(), records.end(),
        [](const FileRecord& record) { return record.parseFailed; }));
    diagnostics.unresolvedImports = static_cast<size_t>(std::count_if(edges.begin(), edges.end(),
        [](const ImportEdge& edge) { return !edge.resolved(); }));

    NavigationIndex index;
    index.graph_ = ImportGraph::build(records, edges);
    index.files_ = std::move(records);
    index.entryPoints_ = std::move(entryPoints);
    index.paths_ = std::move(paths);
    index.diagnostics_ = std::move(diagnostics);
    return index;
}
