#include <iostream>
#include <csignal>
#include <sstream>
#include <CLI/CLI.hpp>
#include "cartographer.hpp"
#include "config.hpp"
#include "logger.hpp"

namespace {

Cartographer* activeRun = nullptr;

void handleInterrupt(int) {
    if (activeRun != nullptr) {
        activeRun->cancel();
    }
}

std::vector<std::string> splitList(const std::string& list) {
    std::vector<std::string> items;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

} // namespace

int main(int argc, char** argv) {
    try {
        CLI::App app{"cartographer - Build a navigation index of a source tree"};

        std::string inputDir = ".";
        std::string outputFile;
        std::string formatStr = "markdown";
        std::string configPath;
        std::string saveConfigPath;
        std::string includePatterns;
        std::string excludePatterns;
        std::vector<std::string> extensions;
        size_t maxFiles = 0;
        uint64_t maxFileSize = 0;
        unsigned int numThreads = 0;
        std::string cacheDir;
        bool noCache = false;
        bool clearCache = false;
        bool snippets = false;
        size_t snippetContext = 2;
        bool followSymlinks = false;
        bool noGitignore = false;
        bool verbose = false;
        std::string logFile;
        bool showTiming = false;

        app.add_option("-i,--input", inputDir, "Directory to index (default: current directory)")
            ->check(CLI::ExistingDirectory);

        app.add_option("-o,--output", outputFile, "Output file (default: standard output)");

        auto formatOpt = app.add_option("-f,--format", formatStr, "Output format: json, markdown, compact (default: markdown)")
            ->check(CLI::IsMember({"json", "markdown", "compact"}));

        app.add_option("--config", configPath, "Configuration file (default: .cartographer.json in the input directory)")
            ->check(CLI::ExistingFile);
        app.add_option("--save-config", saveConfigPath, "Write the effective configuration to this file");

        // File selection
        auto includeOpt = app.add_option("--include", includePatterns,
                     "Comma-separated list of glob patterns for files to include (e.g. *.py,src/**)");
        auto excludeOpt = app.add_option("--exclude", excludePatterns,
                     "Comma-separated list of glob patterns to exclude in addition to the defaults");
        auto extensionOpt = app.add_option("-e,--extension", extensions,
                     "Only index files with these extensions (repeatable, e.g. -e py -e js)");
        auto maxFilesOpt = app.add_option("--max-files", maxFiles, "Maximum number of files to index, 0 = unlimited (default: 100)");
        auto maxFileSizeOpt = app.add_option("--max-file-size", maxFileSize, "Skip files larger than this many bytes, 0 = unlimited (default: 102400)");
        auto followOpt = app.add_flag("--follow-symlinks", followSymlinks, "Follow symbolic links while scanning");
        auto gitignoreOpt = app.add_flag("--no-gitignore", noGitignore, "Do not apply the input directory's .gitignore");

        // Processing
        auto threadsOpt = app.add_option("--threads", numThreads, "Number of worker threads (default: number of CPU cores)")
            ->check(CLI::Range(1u, 64u));
        auto cacheDirOpt = app.add_option("--cache-dir", cacheDir, "Parse result cache directory (default: ~/.cache/cartographer)");
        auto noCacheOpt = app.add_flag("--no-cache", noCache, "Do not read or write the parse result cache");
        app.add_flag("--clear-cache", clearCache, "Remove all cached parse results before indexing");

        // Output detail
        auto snippetsOpt = app.add_flag("--snippets", snippets, "Include source snippets around each declaration");
        auto snippetContextOpt = app.add_option("--snippet-context", snippetContext, "Lines of context around each snippet (default: 2)")
            ->check(CLI::Range(0, 50));

        // Diagnostics
        auto verboseOpt = app.add_flag("-v,--verbose", verbose, "Enable verbose output");
        auto logFileOpt = app.add_option("--log-file", logFile, "Append log messages to this file");
        app.add_flag("-t,--timing", showTiming, "Show detailed timing information");

        CLI11_PARSE(app, argc, argv);

        // Configuration file first, then command line overrides
        CartographerConfig config;
        if (!configPath.empty()) {
            config = CartographerConfig::load(configPath);
        } else if (auto projectConfig = CartographerConfig::findConfigFile(inputDir)) {
            config = CartographerConfig::load(*projectConfig);
        }

        config.directory = inputDir;
        if (!outputFile.empty()) {
            config.outputPath = outputFile;
        }
        if (formatOpt->count() > 0) {
            config.format = formatFromName(formatStr);
        }
        if (includeOpt->count() > 0) {
            config.includePatterns = splitList(includePatterns);
        }
        if (excludeOpt->count() > 0) {
            for (const auto& pattern : splitList(excludePatterns)) {
                config.excludePatterns.push_back(pattern);
            }
        }
        if (extensionOpt->count() > 0) {
            config.filterExtensions = extensions;
        }
        if (maxFilesOpt->count() > 0) {
            config.maxFiles = maxFiles;
        }
        if (maxFileSizeOpt->count() > 0) {
            config.maxFileSize = maxFileSize;
        }
        if (followOpt->count() > 0) {
            config.followSymlinks = followSymlinks;
        }
        if (gitignoreOpt->count() > 0) {
            config.useGitignore = !noGitignore;
        }
        if (threadsOpt->count() > 0) {
            config.numThreads = numThreads;
        }
        if (cacheDirOpt->count() > 0) {
            config.cacheDir = cacheDir;
        }
        if (noCacheOpt->count() > 0) {
            config.useCache = !noCache;
        }
        if (snippetsOpt->count() > 0) {
            config.snippets = snippets;
        }
        if (snippetContextOpt->count() > 0) {
            config.snippetContext = snippetContext;
        }
        if (verboseOpt->count() > 0) {
            config.verbose = verbose;
        }
        if (logFileOpt->count() > 0) {
            config.logFile = logFile;
        }

        config.validate();

        auto& logger = Logger::getInstance();
        logger.setVerbose(config.verbose);
        logger.setInfoToStderr(config.outputPath.empty());
        if (!config.logFile.empty()) {
            logger.setLogFile(config.logFile);
        }

        if (!saveConfigPath.empty()) {
            config.save(saveConfigPath);
        }

        if (clearCache) {
            Cartographer::clearCache(config);
        }

        Cartographer cartographer(config, showTiming);
        activeRun = &cartographer;
        std::signal(SIGINT, handleInterrupt);

        const bool ok = cartographer.run();

        std::signal(SIGINT, SIG_DFL);
        activeRun = nullptr;

        if (!ok) {
            return 1;
        }

        // Keep standard output clean when it carries the index
        std::ostream& report = config.outputPath.empty() ? std::cerr : std::cout;
        if (config.verbose || showTiming) {
            report << cartographer.getSummary() << std::endl;
        } else if (!config.outputPath.empty()) {
            report << "Index written to " << config.outputPath.string() << std::endl;
        }
        if (showTiming) {
            report << cartographer.getTimingInfo() << std::endl;
        }

        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
