#include "indexer.hpp"
#include "fingerprint.hpp"
#include "logger.hpp"
#include <algorithm>
#include <exception>
#include <mutex>
#include <optional>
#include <queue>
#include <system_error>

namespace {

// Run task(i) for every i in [0, count) on up to numThreads workers. stop() is
// checked before each item is taken. The first exception thrown by a task is
// rethrown once all workers have finished.
void runParallel(size_t count, unsigned int numThreads,
                 const std::function<bool()>& stop,
                 const std::function<void(size_t)>& task) {
    if (count == 0) {
        return;
    }

    std::queue<size_t> pending;
    for (size_t i = 0; i < count; ++i) {
        pending.push(i);
    }

    std::mutex queueMutex;
    std::exception_ptr failure;

    auto worker = [&]() {
        while (true) {
            size_t index;
            {
                std::lock_guard<std::mutex> lock(queueMutex);
                if (pending.empty() || failure || (stop && stop())) {
                    return;
                }
                index = pending.front();
                pending.pop();
            }

            try {
                task(index);
            } catch (...) {
                std::lock_guard<std::mutex> lock(queueMutex);
                if (!failure) {
                    failure = std::current_exception();
                }
            }
        }
    };

    const unsigned int threadCount = static_cast<unsigned int>(
        std::min<size_t>(std::max(1u, numThreads), count));

    std::vector<std::thread> workers;
    try {
        for (unsigned int i = 0; i < threadCount; ++i) {
            workers.emplace_back(worker);
        }
    } catch (const std::system_error& e) {
        // Use whatever threads we managed to start
        Logger::getInstance().warning(std::string("Could not create worker thread: ") + e.what());
    }

    if (workers.empty()) {
        worker();
    }

    for (auto& thread : workers) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
}

} // namespace

Indexer::Indexer(IndexerOptions options)
    : options_(std::move(options)) {
    if (options_.numThreads == 0) {
        options_.numThreads = 1;
    }
}

FileRecord Indexer::buildRecord(const SourceFile& file, RunContext& context) const {
    FileRecord record;
    record.path = file.path;
    record.language = LanguageClassifier::classify(file.path);
    record.size = file.size;
    record.lineCount = countLines(file.content);
    record.fingerprint = fingerprint(file.content);

    // Unknown and data files stay inert
    if (!LanguageClassifier::isSourceLanguage(record.language)) {
        return record;
    }

    auto compute = [&]() {
        context.recordParse();
        return parser_.parse(file.content, record.language, record.path);
    };

    try {
        ParseResult result;
        if (ResultCache* cache = context.cache()) {
            bool hit = false;
            result = cache->getOrCompute(record.fingerprint, record.language, compute, hit);
            if (hit) {
                context.recordCacheHit();
            } else {
                context.recordCacheMiss();
            }
        } else {
            result = compute();
        }
        applyParseResult(record, std::move(result));
    } catch (const std::exception& e) {
        record.imports.clear();
        record.functions.clear();
        record.classes.clear();
        record.parseFailed = true;
        context.recordParseFailure();
        context.addWarning("Failed to parse " + record.path + ": " + e.what());
    }

    return record;
}

std::vector<FileRecord> Indexer::parseFiles(const std::vector<SourceFile>& files, RunContext& context) const {
    std::vector<std::optional<FileRecord>> slots(files.size());
    std::mutex resultsMutex;
    size_t done = 0;

    runParallel(files.size(), options_.numThreads,
        [&]() { return context.isCancelled(); },
        [&](size_t index) {
            FileRecord record = buildRecord(files[index], context);

            std::lock_guard<std::mutex> lock(resultsMutex);
            slots[index] = std::move(record);
            ++done;
            if (options_.progress) {
                options_.progress(done, files.size(), files[index].path);
            }
        });

    std::vector<FileRecord> records;
    records.reserve(done);
    for (auto& slot : slots) {
        if (slot) {
            records.push_back(std::move(*slot));
        }
    }
    return records;
}

std::vector<ImportEdge> Indexer::resolveImports(const std::vector<FileRecord>& records,
                                                const ImportResolver& resolver) const {
    // Each importer only touches its own slot
    std::vector<std::vector<ImportEdge>> perFile(records.size());

    runParallel(records.size(), options_.numThreads, nullptr,
        [&](size_t index) {
            perFile[index] = resolver.resolveAll(records[index]);
        });

    std::vector<ImportEdge> edges;
    for (auto& fileEdges : perFile) {
        for (auto& edge : fileEdges) {
            edges.push_back(std::move(edge));
        }
    }
    return edges;
}

NavigationIndex Indexer::index(const std::vector<SourceFile>& files, RunContext& context) const {
    auto& logger = Logger::getInstance();
    logger.debug("Indexing " + std::to_string(files.size()) + " files");

    std::vector<FileRecord> records = parseFiles(files, context);

    // Barrier: resolution needs the complete path set
    std::sort(records.begin(), records.end(),
        [](const FileRecord& a, const FileRecord& b) { return a.path < b.path; });

    std::vector<std::string> paths;
    paths.reserve(records.size());
    for (const auto& record : records) {
        paths.push_back(record.path);
    }

    const ImportResolver resolver(paths, options_.sourceRoots);
    std::vector<ImportEdge> edges = resolveImports(records, resolver);

    // The assembler reports duplicates as invariant violations
    std::vector<std::string> unique = paths;
    unique.erase(std::unique(unique.begin(), unique.end()), unique.end());

    std::vector<EntryPointCandidate> entryPoints;
    std::vector<NavigationPath> navigationPaths;
    if (unique.size() == paths.size()) {
        const ImportGraph graph = ImportGraph::build(records, edges);

        const EntryPointInferencer inferencer(options_.entryPoints, resolver.roots());
        entryPoints = inferencer.infer(graph, records);

        const NavigationSynthesizer synthesizer(options_.navigation);
        navigationPaths = synthesizer.synthesize(graph, entryPoints);
    }

    IndexDiagnostics diagnostics;
    diagnostics.parseInvocations = context.parseInvocations();
    diagnostics.cacheHits = context.cacheHits();
    diagnostics.cacheMisses = context.cacheMisses();
    diagnostics.cancelled = context.isCancelled();
    diagnostics.skippedFiles = files.size() - records.size();
    diagnostics.warnings = context.warnings();
    std::sort(diagnostics.warnings.begin(), diagnostics.warnings.end());

    if (diagnostics.cancelled) {
        logger.warning("Indexing cancelled after " + std::to_string(records.size()) + " of " +
                       std::to_string(files.size()) + " files");
    }

    logger.debug("Resolved imports: " + std::to_string(edges.size()) + " edges, " +
                 std::to_string(entryPoints.size()) + " entry point candidates");

    return IndexAssembler::assemble(std::move(records), std::move(edges), std::move(entryPoints),
                                    std::move(navigationPaths), std::move(diagnostics));
}
