#pragma once

#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * @brief Process-wide logger
 *
 * Info and debug messages go to standard output, warnings and errors to
 * standard error with the usual "Warning: " / "Error: " prefixes. Debug
 * messages are only shown in verbose mode. When a log file is attached, every
 * message (debug included) is also appended there with a timestamp.
 */
class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setVerbose(bool verbose) {
        std::lock_guard<std::mutex> lock(mutex_);
        verbose_ = verbose;
    }

    // Send info and debug messages to standard error, e.g. while standard
    // output carries program output
    void setInfoToStderr(bool toStderr) {
        std::lock_guard<std::mutex> lock(mutex_);
        infoToStderr_ = toStderr;
    }

    // Throws std::runtime_error when the file cannot be opened
    void setLogFile(const fs::path& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (logFile_.is_open()) {
            logFile_.close();
        }
        if (path.empty()) {
            return;
        }
        if (path.has_parent_path()) {
            std::error_code ec;
            fs::create_directories(path.parent_path(), ec);
        }
        logFile_.open(path, std::ios::app);
        if (!logFile_) {
            throw std::runtime_error("Failed to open log file: " + path.string());
        }
    }

    void debug(const std::string& message) { log(LogLevel::Debug, message); }
    void info(const std::string& message) { log(LogLevel::Info, message); }
    void warning(const std::string& message) { log(LogLevel::Warning, message); }
    void error(const std::string& message) { log(LogLevel::Error, message); }

    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (logFile_.is_open()) {
            auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            logFile_ << std::put_time(std::localtime(&now), "%Y-%m-%d %H:%M:%S")
                     << " [" << levelName(level) << "] " << message << std::endl;
        }

        if (level == LogLevel::Debug && !verbose_) {
            return;
        }

        switch (level) {
            case LogLevel::Warning:
                std::cerr << "Warning: " << message << std::endl;
                break;
            case LogLevel::Error:
                std::cerr << "Error: " << message << std::endl;
                break;
            case LogLevel::Debug:
            case LogLevel::Info:
            default:
                (infoToStderr_ ? std::cerr : std::cout) << message << std::endl;
                break;
        }
    }

private:
    Logger() = default;

    static const char* levelName(LogLevel level) {
        switch (level) {
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info: return "INFO";
            case LogLevel::Warning: return "WARNING";
            case LogLevel::Error: return "ERROR";
        }
        return "INFO";
    }

    std::mutex mutex_;
    std::ofstream logFile_;
    bool verbose_ = false;
    bool infoToStderr_ = false;
};
