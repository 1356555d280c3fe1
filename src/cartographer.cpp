#include "cartographer.hpp"
#include "logger.hpp"
#include "result_cache.hpp"
#include "run_context.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <unordered_map>

Cartographer::Cartographer(CartographerConfig config, bool showTiming)
    : config_(std::move(config)),
      showTiming_(showTiming) {
    config_.validate();
    setupPatternMatcher();
}

void Cartographer::setupPatternMatcher() {
    patternMatcher_ = std::make_unique<PatternMatcher>(config_.excludePatterns);

    const auto gitignorePath = config_.directory / ".gitignore";
    if (config_.useGitignore && fs::exists(gitignorePath)) {
        patternMatcher_->loadGitignore(gitignorePath);
    }

    for (const auto& pattern : config_.includePatterns) {
        patternMatcher_->addIncludePattern(pattern);
    }
}

void Cartographer::clearCache(const CartographerConfig& config) {
    ResultCache cache(config.cacheDir);
    cache.clear();
    Logger::getInstance().info("Cache cleared: " + config.cacheDir.string());
}

bool Cartographer::run() {
    try {
        auto& logger = Logger::getInstance();
        const auto startTime = std::chrono::steady_clock::now();

        logger.debug("Indexing directory: " + config_.directory.string());

        // Scan
        auto scanStart = std::chrono::steady_clock::now();
        FileProcessor processor(*patternMatcher_, config_.toScanOptions());
        std::vector<SourceFile> files = processor.processDirectory(config_.directory);
        scanStats_ = processor.stats();
        scanDuration_ = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - scanStart);

        logger.debug("Files selected: " + std::to_string(files.size()) + " of " +
                     std::to_string(scanStats_.candidates) + " candidates");

        // Index
        auto indexStart = std::chrono::steady_clock::now();
        std::shared_ptr<ResultCache> cache;
        if (config_.useCache) {
            cache = std::make_shared<ResultCache>(config_.cacheDir);
        }
        RunContext context(cache);

        IndexerOptions indexerOptions = config_.toIndexerOptions();
        indexerOptions.progress = [this, &context, &logger](size_t done, size_t total, const std::string& path) {
            if (cancelRequested_) {
                context.cancel();
            }
            logger.debug("[" + std::to_string(done) + "/" + std::to_string(total) + "] " + path);
        };
        if (cancelRequested_) {
            context.cancel();
        }

        const Indexer indexer(std::move(indexerOptions));
        try {
            index_.emplace(indexer.index(files, context));
        } catch (const std::exception&) {
            // Parse results are still worth keeping
            context.finish();
            throw;
        }
        context.finish();

        parseInvocations_ = context.parseInvocations();
        cacheHits_ = context.cacheHits();
        cacheMisses_ = context.cacheMisses();
        indexDuration_ = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - indexStart);

        // Encode and write
        auto outputStart = std::chrono::steady_clock::now();
        outputContent_ = encode(*index_, files);
        writeOutput();
        outputDuration_ = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - outputStart);

        duration_ = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startTime);

        return true;
    }
    catch (const std::exception& e) {
        Logger::getInstance().error(e.what());
        return false;
    }
}

std::string Cartographer::encode(const NavigationIndex& index, const std::vector<SourceFile>& files) const {
    auto encoder = OutputEncoder::create(config_.format);

    if (config_.snippets) {
        auto contents = std::make_shared<std::unordered_map<std::string, const std::string*>>();
        for (const auto& file : files) {
            (*contents)[file.path] = &file.content;
        }

        SnippetOptions snippetOptions;
        snippetOptions.enabled = true;
        snippetOptions.contextLines = config_.snippetContext;

        encoder->setSnippets(snippetOptions, [contents](const std::string& path) -> const std::string* {
            auto it = contents->find(path);
            return it == contents->end() ? nullptr : it->second;
        });
    }

    return encoder->encode(index);
}

void Cartographer::writeOutput() const {
    if (config_.outputPath.empty()) {
        std::cout << outputContent_;
        std::cout.flush();
        return;
    }

    if (config_.outputPath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(config_.outputPath.parent_path(), ec);
    }

    std::ofstream outFile(config_.outputPath, std::ios::binary);
    if (!outFile) {
        throw std::runtime_error("Could not open output file: " + config_.outputPath.string());
    }
    outFile << outputContent_;
    if (!outFile) {
        throw std::runtime_error("Failed to write output file: " + config_.outputPath.string());
    }

    Logger::getInstance().debug("Output written to " + config_.outputPath.string());
}

std::string Cartographer::getSummary() const {
    std::stringstream ss;
    ss << "Codebase index summary:" << std::endl;

    if (index_) {
        const auto& diagnostics = index_->diagnostics();
        ss << "  Files indexed: " << index_->files().size() << std::endl;
        ss << "  Total lines: " << index_->totalLines() << std::endl;
        ss << "  Total bytes: " << index_->totalBytes() << " bytes" << std::endl;
        ss << "  Functions: " << index_->functionCount() << ", classes: " << index_->classCount() << std::endl;
        ss << "  Import edges: " << index_->edges().size()
           << " (" << diagnostics.unresolvedImports << " unresolved)" << std::endl;
        ss << "  Entry points: " << index_->entryPoints().size()
           << ", navigation paths: " << index_->navigationPaths().size() << std::endl;
        if (diagnostics.unparsedFiles > 0) {
            ss << "  Parse failures: " << diagnostics.unparsedFiles << std::endl;
        }
        if (diagnostics.cancelled) {
            ss << "  Cancelled: " << diagnostics.skippedFiles << " files not indexed" << std::endl;
        }
    }

    const size_t skipped = scanStats_.oversized + scanStats_.binary + scanStats_.overLimit + scanStats_.unreadable;
    if (skipped > 0) {
        ss << "  Skipped while scanning: " << skipped
           << " (too large: " << scanStats_.oversized
           << ", binary: " << scanStats_.binary
           << ", over limit: " << scanStats_.overLimit
           << ", unreadable: " << scanStats_.unreadable << ")" << std::endl;
    }

    if (config_.useCache) {
        ss << "  Cache: " << cacheHits_ << " hits, " << cacheMisses_ << " misses, "
           << parseInvocations_ << " files parsed" << std::endl;
    } else {
        ss << "  Files parsed: " << parseInvocations_ << " (cache disabled)" << std::endl;
    }

    if (showTiming_) {
        ss << "  Scan time: " << scanDuration_.count() << " ms" << std::endl;
        ss << "  Index time: " << indexDuration_.count() << " ms" << std::endl;
        ss << "  Output generation time: " << outputDuration_.count() << " ms" << std::endl;
        ss << "  Total time: " << duration_.count() << " ms" << std::endl;
    }

    return ss.str();
}

std::string Cartographer::getTimingInfo() const {
    const auto total = duration_.count() ? duration_.count() : 1;

    std::stringstream ss;
    ss << "Timing Information:" << std::endl;
    ss << "- Total time: " << duration_.count() << "ms" << std::endl;
    ss << "- Scan time: " << scanDuration_.count() << "ms ("
       << (scanDuration_.count() * 100 / total) << "%)" << std::endl;
    ss << "- Index time: " << indexDuration_.count() << "ms ("
       << (indexDuration_.count() * 100 / total) << "%)" << std::endl;
    ss << "- Output generation time: " << outputDuration_.count() << "ms ("
       << (outputDuration_.count() * 100 / total) << "%)" << std::endl;

    auto overheadTime = duration_ - scanDuration_ - indexDuration_ - outputDuration_;
    ss << "- Overhead time: " << overheadTime.count() << "ms ("
       << (overheadTime.count() * 100 / total) << "%)" << std::endl;

    if (index_ && indexDuration_.count() > 0) {
        const double seconds = indexDuration_.count() / 1000.0;
        const double filesPerSecond = static_cast<double>(index_->files().size()) / seconds;
        const double linesPerSecond = static_cast<double>(index_->totalLines()) / seconds;
        const double kbPerSecond = static_cast<double>(index_->totalBytes()) / 1024.0 / seconds;

        ss << "- Performance:" << std::endl;
        ss << "  * " << std::fixed << std::setprecision(2) << filesPerSecond << " files/second" << std::endl;
        ss << "  * " << std::fixed << std::setprecision(2) << linesPerSecond << " lines/second" << std::endl;
        ss << "  * " << std::fixed << std::setprecision(2) << kbPerSecond << " KB/second" << std::endl;
    }

    return ss.str();
}
