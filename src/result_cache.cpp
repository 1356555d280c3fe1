#include "result_cache.hpp"
#include "logger.hpp"
#include <fstream>
#include <sstream>

using json = nlohmann::json;

ResultCache::ResultCache(fs::path cacheDir)
    : cacheDir_(std::move(cacheDir)) {
}

fs::path ResultCache::entryPath(const std::string& fingerprint) const {
    const std::string shard = fingerprint.size() >= 2 ? fingerprint.substr(0, 2) : "00";
    return cacheDir_ / shard / (fingerprint + ".json");
}

ResultCache::Slot& ResultCache::slotFor(const std::string& fingerprint) {
    std::lock_guard<std::mutex> lock(slotsMutex_);
    auto& slot = slots_[fingerprint];
    if (!slot) {
        slot = std::make_unique<Slot>();
    }
    return *slot;
}

void ResultCache::ensureLoaded(Slot& slot, const std::string& fingerprint) {
    if (slot.loaded) {
        return;
    }
    slot.loaded = true;

    if (!isPersistent()) {
        return;
    }

    const fs::path path = entryPath(fingerprint);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return;
    }

    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            Logger::getInstance().debug("Cache entry not readable: " + path.string());
            return;
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        const json document = json::parse(buffer.str());

        if (!document.is_object() ||
            document.value("version", 0) != FORMAT_VERSION ||
            document.value("fingerprint", std::string()) != fingerprint ||
            !document.contains("languages") || !document["languages"].is_object()) {
            Logger::getInstance().debug("Ignoring stale cache entry: " + path.string());
            return;
        }

        slot.languages = document["languages"];
    }
    catch (const std::exception& e) {
        Logger::getInstance().debug("Ignoring corrupt cache entry " + path.string() + ": " + e.what());
        slot.languages = json::object();
    }
}

std::optional<ParseResult> ResultCache::lookup(Slot& slot, const std::string& fingerprint, Language language) {
    ensureLoaded(slot, fingerprint);

    const std::string key = LanguageClassifier::languageName(language);
    auto it = slot.languages.find(key);
    if (it == slot.languages.end()) {
        return std::nullopt;
    }

    try {
        return parseResultFromJson(*it, "");
    }
    catch (const json::exception& e) {
        Logger::getInstance().debug("Discarding malformed cached parse for " + fingerprint + ": " + e.what());
        slot.languages.erase(key);
        return std::nullopt;
    }
}

void ResultCache::store(Slot& slot, Language language, const ParseResult& result) {
    slot.languages[LanguageClassifier::languageName(language)] = toJson(result);
    slot.dirty = true;
}

std::optional<ParseResult> ResultCache::get(const std::string& fingerprint, Language language) {
    Slot& slot = slotFor(fingerprint);
    std::lock_guard<std::mutex> lock(slot.mutex);
    return lookup(slot, fingerprint, language);
}

void ResultCache::put(const std::string& fingerprint, Language language, const ParseResult& result) {
    Slot& slot = slotFor(fingerprint);
    std::lock_guard<std::mutex> lock(slot.mutex);
    ensureLoaded(slot, fingerprint);
    store(slot, language, result);
}

ParseResult ResultCache::getOrCompute(const std::string& fingerprint, Language language,
                                      const std::function<ParseResult()>& compute, bool& hit) {
    Slot& slot = slotFor(fingerprint);
    std::lock_guard<std::mutex> lock(slot.mutex);

    if (auto cached = lookup(slot, fingerprint, language)) {
        hit = true;
        return std::move(*cached);
    }

    hit = false;
    ParseResult result = compute();
    store(slot, language, result);
    return result;
}

size_t ResultCache::flush() {
    if (!isPersistent()) {
        return 0;
    }

    std::lock_guard<std::mutex> slotsLock(slotsMutex_);
    size_t written = 0;

    for (auto& item : slots_) {
        const std::string& fingerprint = item.first;
        Slot& slot = *item.second;
        std::lock_guard<std::mutex> lock(slot.mutex);

        if (!slot.dirty) {
            continue;
        }

        const fs::path path = entryPath(fingerprint);
        fs::path tempPath = path;
        tempPath += ".tmp";

        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            Logger::getInstance().warning("Failed to create cache directory " +
                                          path.parent_path().string() + ": " + ec.message());
            continue;
        }

        const json document = {
            {"version", FORMAT_VERSION},
            {"fingerprint", fingerprint},
            {"languages", slot.languages}
        };

        // Tokens taken from non-UTF-8 sources cannot be stored; the file is parsed again next run
        std::string serialized;
        try {
            serialized = document.dump();
        } catch (const json::exception& e) {
            Logger::getInstance().warning("Skipping cache entry " + fingerprint + ": " + e.what());
            continue;
        }

        {
            std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
            if (!file) {
                Logger::getInstance().warning("Failed to write cache entry: " + tempPath.string());
                continue;
            }
            file << serialized;
            if (!file) {
                Logger::getInstance().warning("Failed to write cache entry: " + tempPath.string());
                file.close();
                fs::remove(tempPath, ec);
                continue;
            }
        }

        fs::rename(tempPath, path, ec);
        if (ec) {
            Logger::getInstance().warning("Failed to store cache entry " + path.string() + ": " + ec.message());
            fs::remove(tempPath, ec);
            continue;
        }

        slot.dirty = false;
        ++written;
    }

    return written;
}

void ResultCache::clear() {
    std::lock_guard<std::mutex> lock(slotsMutex_);
    slots_.clear();

    if (!isPersistent()) {
        return;
    }

    std::error_code ec;
    if (fs::exists(cacheDir_, ec)) {
        fs::remove_all(cacheDir_, ec);
        if (ec) {
            Logger::getInstance().warning("Failed to clear cache directory " + cacheDir_.string() + ": " + ec.message());
        }
    }
}
