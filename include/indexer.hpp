#pragma once

#include <string>
#include <vector>
#include <functional>
#include <thread>
#include "file_record.hpp"
#include "structural_parser.hpp"
#include "import_resolver.hpp"
#include "entry_point_inferencer.hpp"
#include "navigation_synthesizer.hpp"
#include "navigation_index.hpp"
#include "run_context.hpp"

// One scanned file as handed over by the directory scanner
struct SourceFile {
    std::string path;       // Repo-relative, '/' separated
    std::string content;
    uint64_t size = 0;
};

struct IndexerOptions {
    unsigned int numThreads = std::thread::hardware_concurrency();
    std::vector<std::string> sourceRoots = ImportResolver::defaultSourceRoots();
    EntryPointOptions entryPoints;
    NavigationOptions navigation;

    // Called after each file is parsed: (done, total, path). Calls are serialized.
    std::function<void(size_t, size_t, const std::string&)> progress;
};

/**
 * @brief Builds a NavigationIndex from scanned files
 *
 * Parse phase: fingerprint, classify, cache lookup and parse per file on a
 * worker pool. Resolve phase (after all records exist): import resolution per
 * importer, also in parallel. Graph, entry points, navigation paths and
 * assembly then run on the calling thread.
 *
 * Cancellation through the RunContext stops scheduling new files; records
 * already complete are kept.
 */
class Indexer {
public:
    explicit Indexer(IndexerOptions options = {});

    NavigationIndex index(const std::vector<SourceFile>& files, RunContext& context) const;

    // Parse phase for a single file. Parse failures degrade the record and are
    // reported through the context.
    FileRecord buildRecord(const SourceFile& file, RunContext& context) const;

    const StructuralParser& parser() const { return parser_; }
    const IndexerOptions& options() const { return options_; }

private:
    IndexerOptions options_;
    StructuralParser parser_;

    std::vector<FileRecord> parseFiles(const std::vector<SourceFile>& files, RunContext& context) const;
    std::vector<ImportEdge> resolveImports(const std::vector<FileRecord>& records,
                                           const ImportResolver& resolver) const;
};
