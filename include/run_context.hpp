#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <atomic>
#include "result_cache.hpp"

// State shared by every phase of one indexing run. Created at run start,
// finished (cache persisted) at run end.
class RunContext {
public:
    // A null cache disables caching for the run
    explicit RunContext(std::shared_ptr<ResultCache> cache = nullptr);

    RunContext(const RunContext&) = delete;
    RunContext& operator=(const RunContext&) = delete;

    ResultCache* cache() const { return cache_.get(); }

    // Stop scheduling new files; files already being parsed complete
    void cancel() { cancelled_ = true; }
    bool isCancelled() const { return cancelled_.load(); }

    // Thread-safe; the message is also logged as a warning
    void addWarning(const std::string& message);
    std::vector<std::string> warnings() const;

    void recordParse() { ++parseInvocations_; }
    void recordCacheHit() { ++cacheHits_; }
    void recordCacheMiss() { ++cacheMisses_; }
    void recordParseFailure() { ++parseFailures_; }

    size_t parseInvocations() const { return parseInvocations_.load(); }
    size_t cacheHits() const { return cacheHits_.load(); }
    size_t cacheMisses() const { return cacheMisses_.load(); }
    size_t parseFailures() const { return parseFailures_.load(); }

    // Persist the cache. Safe to call more than once.
    void finish();
    bool isFinished() const { return finished_; }

private:
    std::shared_ptr<ResultCache> cache_;
    std::atomic<bool> cancelled_{false};

    mutable std::mutex warningsMutex_;
    std::vector<std::string> warnings_;

    std::atomic<size_t> parseInvocations_{0};
    std::atomic<size_t> cacheHits_{0};
    std::atomic<size_t> cacheMisses_{0};
    std::atomic<size_t> parseFailures_{0};

    bool finished_ = false;
};
