#include "run_context.hpp"
#include "logger.hpp"

RunContext::RunContext(std::shared_ptr<ResultCache> cache)
    : cache_(std::move(cache)) {
}

void RunContext::addWarning(const std::string& message) {
    Logger::getInstance().warning(message);

    std::lock_guard<std::mutex> lock(warningsMutex_);
    warnings_.push_back(message);
}

std::vector<std::string> RunContext::warnings() const {
    std::lock_guard<std::mutex> lock(warningsMutex_);
    return warnings_;
}

void RunContext::finish() {
    if (cache_) {
        const size_t written = cache_->flush();
        if (written > 0) {
            Logger::getInstance().debug("Cache entries written: " + std::to_string(written));
        }
    }
    finished_ = true;
}
