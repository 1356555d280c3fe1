#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <chrono>
#include <atomic>
#include "config.hpp"
#include "pattern_matcher.hpp"
#include "file_processor.hpp"
#include "indexer.hpp"
#include "output_encoder.hpp"

/**
 * @brief Scan a directory, index it and write the encoded index
 *
 * One Cartographer performs one run: scan with the configured patterns and
 * limits, index with the result cache, encode in the configured format and
 * write to the output path (or keep the text for getOutput()).
 */
class Cartographer {
public:
    explicit Cartographer(CartographerConfig config, bool showTiming = false);

    // Errors are logged; returns false when the run failed
    bool run();

    // Ask a running index to stop scheduling files. Safe from a signal handler.
    void cancel() { cancelRequested_ = true; }

    std::string getSummary() const;
    std::string getTimingInfo() const;

    // Encoded index of the last successful run
    const std::string& getOutput() const { return outputContent_; }

    // Index of the last successful run, if any
    const NavigationIndex* getIndex() const { return index_ ? &*index_ : nullptr; }

    const CartographerConfig& config() const { return config_; }

    // Remove every cached parse result under the configured cache directory
    static void clearCache(const CartographerConfig& config);

private:
    CartographerConfig config_;
    bool showTiming_;
    std::atomic<bool> cancelRequested_{false};

    std::unique_ptr<PatternMatcher> patternMatcher_;
    std::optional<NavigationIndex> index_;
    std::string outputContent_;

    // Statistics
    ScanStats scanStats_;
    size_t parseInvocations_ = 0;
    size_t cacheHits_ = 0;
    size_t cacheMisses_ = 0;

    // Timing info
    std::chrono::milliseconds duration_{0};
    std::chrono::milliseconds scanDuration_{0};
    std::chrono::milliseconds indexDuration_{0};
    std::chrono::milliseconds outputDuration_{0};

    void setupPatternMatcher();
    std::string encode(const NavigationIndex& index, const std::vector<SourceFile>& files) const;
    void writeOutput() const;
};
