#include "file_processor.hpp"
#include "logger.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <set>
#include <unordered_set>
#include <system_error>
#include <sys/mman.h>
#include <fcntl.h>
#include <unistd.h>

// Size threshold for using memory mapping (files larger than this will use memory mapping)
constexpr size_t MMAP_THRESHOLD = 1 * 1024 * 1024; // 1 MB

constexpr size_t FILE_BUFFER_SIZE = 128 * 1024; // 128 KB

namespace {

std::string lowercaseExtension(std::string ext) {
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return ext;
}

} // namespace

FileProcessor::FileProcessor(const PatternMatcher& patternMatcher, ScanOptions options)
    : patternMatcher_(patternMatcher),
      options_(std::move(options)) {
    if (options_.numThreads == 0) {
        options_.numThreads = 1;
    }

    // Normalize extensions to ".ext", lowercase
    for (auto& ext : options_.extensions) {
        ext = lowercaseExtension(ext);
        if (!ext.empty() && ext[0] != '.') {
            ext = "." + ext;
        }
    }
}

std::vector<SourceFile> FileProcessor::processDirectory(const fs::path& dir) {
    if (!fs::exists(dir) || !fs::is_directory(dir)) {
        throw std::runtime_error("Invalid directory: " + dir.string());
    }

    stats_ = ScanStats{};
    const fs::path root = dir.lexically_normal();

    auto candidates = collectFiles(root);
    stats_.candidates = candidates.size();

    // Size and binary checks happen before the limit so skipped files do not use it up
    std::vector<std::pair<fs::path, std::string>> selected;
    for (auto& candidate : candidates) {
        std::error_code ec;
        const uintmax_t size = fs::file_size(candidate.first, ec);
        if (ec) {
            ++stats_.unreadable;
            Logger::getInstance().warning("Cannot stat " + candidate.second + ": " + ec.message());
            continue;
        }
        if (options_.maxFileSize > 0 && size > options_.maxFileSize) {
            ++stats_.oversized;
            Logger::getInstance().debug("Skipping large file: " + candidate.second);
            continue;
        }
        if (isBinaryFile(candidate.first)) {
            ++stats_.binary;
            Logger::getInstance().debug("Skipping binary file: " + candidate.second);
            continue;
        }
        if (options_.maxFiles > 0 && selected.size() >= options_.maxFiles) {
            ++stats_.overLimit;
            continue;
        }
        selected.push_back(std::move(candidate));
    }

    if (stats_.overLimit > 0) {
        Logger::getInstance().warning("File limit of " + std::to_string(options_.maxFiles) + " reached, " +
                                      std::to_string(stats_.overLimit) + " files not indexed");
    }

    std::vector<std::optional<SourceFile>> results(selected.size());
    fileQueue_ = std::queue<size_t>();
    for (size_t i = 0; i < selected.size(); ++i) {
        fileQueue_.push(i);
    }

    if (!selected.empty()) {
        const unsigned int actualThreads =
            std::min(options_.numThreads, static_cast<unsigned int>(selected.size()));
        std::vector<std::thread> workers;

        try {
            for (unsigned int i = 0; i < actualThreads; ++i) {
                workers.emplace_back(&FileProcessor::workerThread, this,
                                     std::cref(root), std::cref(selected), std::ref(results));
            }
        } catch (const std::system_error& e) {
            // Use whatever threads we managed to start
            Logger::getInstance().warning(std::string("Could not create reader thread: ") + e.what());
        }

        if (workers.empty()) {
            workerThread(root, selected, results);
        }

        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    std::vector<SourceFile> files;
    files.reserve(results.size());
    for (auto& result : results) {
        if (result) {
            files.push_back(std::move(*result));
        }
    }
    return files;
}

std::vector<std::pair<fs::path, std::string>> FileProcessor::collectFiles(const fs::path& dir) {
    std::vector<std::pair<fs::path, std::string>> files;

    auto iteratorOptions = fs::directory_options::skip_permission_denied;
    if (options_.followSymlinks) {
        iteratorOptions |= fs::directory_options::follow_directory_symlink;
    }

    // Guards against symlink cycles when following links
    std::set<fs::path> visitedDirectories;
    std::error_code ec;
    visitedDirectories.insert(fs::canonical(dir, ec));

    fs::recursive_directory_iterator it(dir, iteratorOptions, ec);
    if (ec) {
        throw std::runtime_error("Cannot read directory " + dir.string() + ": " + ec.message());
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            Logger::getInstance().warning("Error walking " + dir.string() + ": " + ec.message());
            ec.clear();
            continue;
        }

        const fs::directory_entry& entry = *it;
        const std::string relative = entry.path().lexically_relative(dir).generic_string();

        std::error_code entryEc;
        const bool isLink = entry.is_symlink(entryEc);
        if (isLink && !options_.followSymlinks) {
            if (entry.is_directory(entryEc)) {
                it.disable_recursion_pending();
            }
            continue;
        }

        if (entry.is_directory(entryEc)) {
            if (patternMatcher_.isIgnored(relative, true)) {
                it.disable_recursion_pending();
                continue;
            }
            if (isLink) {
                const fs::path target = fs::canonical(entry.path(), entryEc);
                if (entryEc || !visitedDirectories.insert(target).second) {
                    it.disable_recursion_pending();
                }
            }
            continue;
        }

        if (!entry.is_regular_file(entryEc)) {
            continue;
        }
        if (!patternMatcher_.shouldProcess(relative) || !hasAllowedExtension(entry.path())) {
            continue;
        }

        files.emplace_back(entry.path(), relative);
    }

    std::sort(files.begin(), files.end(),
        [](const auto& a, const auto& b) { return a.second < b.second; });
    return files;
}

bool FileProcessor::hasAllowedExtension(const fs::path& filePath) const {
    if (options_.extensions.empty()) {
        return true;
    }
    const std::string ext = lowercaseExtension(filePath.extension().string());
    return std::find(options_.extensions.begin(), options_.extensions.end(), ext) != options_.extensions.end();
}

void FileProcessor::workerThread(const fs::path& root,
                                 const std::vector<std::pair<fs::path, std::string>>& files,
                                 std::vector<std::optional<SourceFile>>& results) {
    while (true) {
        size_t index;
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (fileQueue_.empty()) {
                return;
            }
            index = fileQueue_.front();
            fileQueue_.pop();
        }

        try {
            SourceFile file = processFile(root, files[index].first);

            std::lock_guard<std::mutex> lock(resultsMutex_);
            results[index] = std::move(file);
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(resultsMutex_);
            ++stats_.unreadable;
            Logger::getInstance().warning("Failed to read " + files[index].second + ": " + e.what());
        }
    }
}

SourceFile FileProcessor::processFile(const fs::path& root, const fs::path& filePath) const {
    if (!fs::exists(filePath) || !fs::is_regular_file(filePath)) {
        throw std::runtime_error("File does not exist or is not a regular file: " + filePath.string());
    }

    SourceFile file;
    file.path = filePath.lexically_normal().lexically_relative(root).generic_string();
    file.content = readFile(filePath);
    file.size = file.content.size();
    return file;
}

std::string FileProcessor::readFile(const fs::path& filePath) {
    std::error_code ec;
    uintmax_t fileSize = fs::file_size(filePath, ec);

    if (ec) {
        throw std::runtime_error("Error getting file size for " + filePath.string() + ": " + ec.message());
    }

    if (fileSize == 0) {
        return "";
    }

    if (fileSize > MMAP_THRESHOLD) {
        return readLargeFile(filePath, fileSize);
    }

    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + filePath.string());
    }

    std::string content;
    content.reserve(static_cast<size_t>(fileSize));

    std::vector<char> buffer(FILE_BUFFER_SIZE);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        content.append(buffer.data(), static_cast<size_t>(file.gcount()));
    }

    return content;
}

std::string FileProcessor::readLargeFile(const fs::path& filePath, uintmax_t fileSize) {
    int fd = open(filePath.c_str(), O_RDONLY);
    if (fd == -1) {
        throw std::runtime_error("Failed to open file for memory mapping: " + filePath.string());
    }

    void* mapped = mmap(nullptr, fileSize, PROT_READ, MAP_PRIVATE, fd, 0);
    close(fd); // mmap keeps its own reference

    if (mapped == MAP_FAILED) {
        throw std::runtime_error("Memory mapping failed for file: " + filePath.string());
    }

    std::string content(static_cast<char*>(mapped), fileSize);
    munmap(mapped, fileSize);

    return content;
}

bool FileProcessor::isBinaryFile(const fs::path& filePath) {
    const std::string ext = lowercaseExtension(filePath.extension().string());

    static const std::unordered_set<std::string> binaryExtensions = {
        ".exe", ".dll", ".so", ".dylib", ".o", ".obj", ".a", ".lib",
        ".bin", ".dat", ".db", ".sqlite", ".class", ".jar", ".pyc",
        ".pyo", ".zip", ".tar", ".gz", ".xz", ".bz2", ".7z", ".rar",
        ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".ico", ".mp3",
        ".mp4", ".avi", ".mov", ".pdf", ".doc", ".docx", ".xls", ".xlsx",
        ".woff", ".woff2", ".ttf", ".otf", ".wasm"
    };

    if (binaryExtensions.find(ext) != binaryExtensions.end()) {
        return true;
    }

    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        // Unreadable files are reported when they are read
        return false;
    }

    char buffer[1024];
    file.read(buffer, sizeof(buffer));
    const std::streamsize bytesRead = file.gcount();
    if (bytesRead <= 0) {
        return false;
    }

    int textCount = 0;
    for (std::streamsize i = 0; i < bytesRead; i++) {
        const unsigned char c = static_cast<unsigned char>(buffer[i]);
        if (c == 0) {
            return true;
        }
        // Bytes >= 0x80 are counted as text so UTF-8 sources pass
        if (c >= 32 || c == '\n' || c == '\r' || c == '\t' || c == '\f') {
            textCount++;
        }
    }

    const double textRatio = static_cast<double>(textCount) / static_cast<double>(bytesRead);
    return textRatio < 0.8;
}
