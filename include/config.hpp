#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "output_encoder.hpp"
#include "file_processor.hpp"
#include "indexer.hpp"

namespace fs = std::filesystem;

/**
 * @brief Settings for one cartographer run
 *
 * Defaults match a plain `cartographer -i <dir>` invocation. A project may
 * carry a `.cartographer.json` in its root; values from the command line
 * override it. Every field round-trips through toJson/fromJson.
 */
struct CartographerConfig {
    static constexpr const char* PROJECT_CONFIG_NAME = ".cartographer.json";

    // Input and output
    fs::path directory = ".";
    fs::path outputPath;                    // Empty = standard output
    OutputFormat format = OutputFormat::Markdown;

    // File selection
    std::vector<std::string> excludePatterns = PatternMatcher::defaultIgnorePatterns();
    std::vector<std::string> includePatterns;
    std::vector<std::string> filterExtensions;
    size_t maxFiles = 100;
    uint64_t maxFileSize = 100 * 1024;
    bool followSymlinks = false;
    bool useGitignore = true;

    // Processing
    unsigned int numThreads = 0;            // 0 = hardware concurrency
    bool useCache = true;
    fs::path cacheDir = defaultCacheDir();

    // Output detail
    bool snippets = false;
    size_t snippetContext = 2;

    // Indexer tunables
    std::vector<std::string> sourceRoots = ImportResolver::defaultSourceRoots();
    EntryPointOptions entryPoints;
    NavigationOptions navigation;

    // Diagnostics
    bool verbose = false;
    std::string logFile;

    // $XDG_CACHE_HOME/cartographer, else ~/.cache/cartographer
    static fs::path defaultCacheDir();

    // Throws std::invalid_argument describing the first bad value
    void validate() const;

    nlohmann::json toJson() const;

    // Missing keys keep their defaults. Throws std::invalid_argument on values
    // of the wrong type or unknown enumerations.
    static CartographerConfig fromJson(const nlohmann::json& j);

    // Throws std::runtime_error when the file cannot be read or written,
    // std::invalid_argument when its content is not a valid configuration
    static CartographerConfig load(const fs::path& path);
    void save(const fs::path& path) const;

    // `.cartographer.json` directly inside dir, if present
    static std::optional<fs::path> findConfigFile(const fs::path& dir);

    ScanOptions toScanOptions() const;
    IndexerOptions toIndexerOptions() const;
    unsigned int effectiveThreads() const;
};
