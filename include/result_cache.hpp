#pragma once

#include <string>
#include <optional>
#include <functional>
#include <unordered_map>
#include <memory>
#include <mutex>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "file_record.hpp"

namespace fs = std::filesystem;

/**
 * @brief Parse results keyed by content fingerprint
 *
 * Entries are addressed solely by the fingerprint of a file's bytes. Each entry
 * holds one parse result per language, so identical bytes under a different
 * extension are a separate result rather than a stale hit. Only parse output is
 * stored, never resolution or graph data.
 *
 * On disk every fingerprint is one JSON document at
 * <cacheDir>/<fp[0..2]>/<fp>.json. Unreadable, malformed or version-mismatched
 * documents are treated as misses. An empty cache directory keeps the cache in
 * memory for the lifetime of the object.
 */
class ResultCache {
public:
    static constexpr int FORMAT_VERSION = 1;

    explicit ResultCache(fs::path cacheDir = {});

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    std::optional<ParseResult> get(const std::string& fingerprint, Language language);
    void put(const std::string& fingerprint, Language language, const ParseResult& result);

    // Look up and, on a miss, compute and store while holding the key's lock so
    // no two callers populate the same fingerprint concurrently. Exceptions from
    // compute propagate and store nothing.
    ParseResult getOrCompute(const std::string& fingerprint, Language language,
                             const std::function<ParseResult()>& compute, bool& hit);

    // Persist modified entries (write to a temporary file, then rename).
    // Failures are logged and skipped. Returns the number of entries written.
    size_t flush();

    // Drop every entry, in memory and on disk
    void clear();

    bool isPersistent() const { return !cacheDir_.empty(); }
    const fs::path& directory() const { return cacheDir_; }

    // Location of a fingerprint's document
    fs::path entryPath(const std::string& fingerprint) const;

private:
    struct Slot {
        std::mutex mutex;
        nlohmann::json languages = nlohmann::json::object();
        bool loaded = false;
        bool dirty = false;
    };

    fs::path cacheDir_;
    std::mutex slotsMutex_;
    std::unordered_map<std::string, std::unique_ptr<Slot>> slots_;

    Slot& slotFor(const std::string& fingerprint);
    void ensureLoaded(Slot& slot, const std::string& fingerprint);
    std::optional<ParseResult> lookup(Slot& slot, const std::string& fingerprint, Language language);
    void store(Slot& slot, Language language, const ParseResult& result);
};
