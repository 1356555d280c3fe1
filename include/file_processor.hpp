#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <mutex>
#include <thread>
#include <queue>
#include <optional>
#include <cstdint>
#include "pattern_matcher.hpp"
#include "indexer.hpp"

namespace fs = std::filesystem;

struct ScanOptions {
    size_t maxFiles = 100;                  // 0 = unlimited
    uint64_t maxFileSize = 100 * 1024;      // bytes, 0 = unlimited
    std::vector<std::string> extensions;    // e.g. {".py", ".go"}; empty = every text file
    bool followSymlinks = false;
    unsigned int numThreads = std::thread::hardware_concurrency();
};

// What the last scan left out and why
struct ScanStats {
    size_t candidates = 0;      // Files that passed the patterns and extension filter
    size_t oversized = 0;
    size_t binary = 0;
    size_t overLimit = 0;       // Dropped by maxFiles
    size_t unreadable = 0;
};

/**
 * @brief Collects and reads the files of a directory tree
 *
 * Produces the ordered (path, content, size) list the indexer consumes. Paths
 * are relative to the scanned directory with '/' separators and sorted
 * lexicographically, so the max file limit always keeps the same files for the
 * same tree. Reading is spread over a small worker pool.
 */
class FileProcessor {
public:
    explicit FileProcessor(const PatternMatcher& patternMatcher, ScanOptions options = {});

    // Throws std::runtime_error when dir is not a directory
    std::vector<SourceFile> processDirectory(const fs::path& dir);

    // Read one file below root. Throws std::runtime_error on I/O failure.
    SourceFile processFile(const fs::path& root, const fs::path& filePath) const;

    const ScanStats& stats() const { return stats_; }
    const ScanOptions& options() const { return options_; }

    // Known binary extension, or NUL bytes / mostly non-text in the first block
    static bool isBinaryFile(const fs::path& filePath);

    static std::string readFile(const fs::path& filePath);

private:
    const PatternMatcher& patternMatcher_;
    ScanOptions options_;
    ScanStats stats_;

    std::queue<size_t> fileQueue_;
    std::mutex queueMutex_;
    std::mutex resultsMutex_;

    // Candidate files (absolute path, relative path), sorted by relative path
    std::vector<std::pair<fs::path, std::string>> collectFiles(const fs::path& dir);

    bool hasAllowedExtension(const fs::path& filePath) const;

    void workerThread(const fs::path& root,
                      const std::vector<std::pair<fs::path, std::string>>& files,
                      std::vector<std::optional<SourceFile>>& results);

    static std::string readLargeFile(const fs::path& filePath, uintmax_t fileSize);
};
