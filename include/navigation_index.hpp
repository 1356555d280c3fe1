#pragma once

#include <string>
#include <vector>
#include <stdexcept>
#include "file_record.hpp"
#include "import_graph.hpp"

// Internal-consistency fault found while assembling an index. Indicates a bug
// upstream, not irregular input.
class IndexInvariantError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Per-run failures reported in aggregate instead of individually
struct IndexDiagnostics {
    size_t unparsedFiles = 0;       // Records degraded after a parse failure
    size_t unresolvedImports = 0;
    size_t parseInvocations = 0;
    size_t cacheHits = 0;
    size_t cacheMisses = 0;
    size_t skippedFiles = 0;        // Not indexed because the run was cancelled
    bool cancelled = false;
    std::vector<std::string> warnings;
};

/**
 * @brief Immutable result of one indexing run
 *
 * Records are ordered by path and edges by source path (import order within a
 * source). Only the assembler can create one; everything downstream reads it.
 */
class NavigationIndex {
public:
    const std::vector<FileRecord>& files() const { return files_; }
    const std::vector<ImportEdge>& edges() const { return graph_.edges(); }
    const std::vector<EntryPointCandidate>& entryPoints() const { return entryPoints_; }
    const std::vector<NavigationPath>& navigationPaths() const { return paths_; }
    const ImportGraph& graph() const { return graph_; }
    const IndexDiagnostics& diagnostics() const { return diagnostics_; }

    // nullptr when the path is not indexed
    const FileRecord* find(const std::string& path) const;

    std::vector<ImportEdge> unresolvedEdges() const;
    size_t totalLines() const;
    uint64_t totalBytes() const;
    size_t functionCount() const;
    size_t classCount() const;

private:
    friend class IndexAssembler;
    NavigationIndex() = default;

    std::vector<FileRecord> files_;
    ImportGraph graph_;
    std::vector<EntryPointCandidate> entryPoints_;
    std::vector<NavigationPath> paths_;
    IndexDiagnostics diagnostics_;
};

class IndexAssembler {
public:
    // Check the index invariants and freeze the result. Throws
    // IndexInvariantError on a duplicate path or a dangling reference.
    static NavigationIndex assemble(std::vector<FileRecord> records,
                                    std::vector<ImportEdge> edges,
                                    std::vector<EntryPointCandidate> entryPoints,
                                    std::vector<NavigationPath> paths,
                                    IndexDiagnostics diagnostics = {});
};
