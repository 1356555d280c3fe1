#include "config.hpp"
#include "logger.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <thread>

using json = nlohmann::json;

namespace {

// "~" and "~/..." relative to $HOME
fs::path expandHome(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (home == nullptr || (path.size() > 1 && path[1] != '/')) {
        return path;
    }
    return fs::path(home) / path.substr(path.size() > 1 ? 2 : 1);
}

template <typename T>
void readValue(const json& j, const char* key, T& target) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

} // namespace

fs::path CartographerConfig::defaultCacheDir() {
    if (const char* xdg = std::getenv("XDG_CACHE_HOME")) {
        if (*xdg != '\0') {
            return fs::path(xdg) / "cartographer";
        }
    }
    if (const char* home = std::getenv("HOME")) {
        return fs::path(home) / ".cache" / "cartographer";
    }
    return fs::temp_directory_path() / "cartographer-cache";
}

void CartographerConfig::validate() const {
    if (directory.empty()) {
        throw std::invalid_argument("Input directory must not be empty");
    }
    if (useCache && cacheDir.empty()) {
        throw std::invalid_argument("Cache directory must not be empty when caching is enabled");
    }
    if (snippetContext > 50) {
        throw std::invalid_argument("Snippet context must be between 0 and 50 lines, got " +
                                    std::to_string(snippetContext));
    }
    if (entryPoints.stems.empty()) {
        throw std::invalid_argument("At least one entry point stem is required");
    }
    for (const auto& ext : filterExtensions) {
        if (ext.empty() || ext == ".") {
            throw std::invalid_argument("Empty file extension in filter list");
        }
    }

    const double confidences[] = {entryPoints.patternConfidence, entryPoints.scanRootBonus,
                                  entryPoints.shapeConfidence, entryPoints.shapeStep,
                                  entryPoints.shapeMaxBonus};
    for (double value : confidences) {
        if (value < 0.0 || value > 1.0) {
            throw std::invalid_argument("Entry point confidence values must be within [0, 1]");
        }
    }

    if (navigation.hopLimit == 0) {
        throw std::invalid_argument("Navigation hop limit must be at least 1");
    }
    if (navigation.minClusterSize < 2) {
        throw std::invalid_argument("Minimum cluster size must be at least 2");
    }
}

json CartographerConfig::toJson() const {
    return {
        {"directory", directory.string()},
        {"output_path", outputPath.empty() ? json(nullptr) : json(outputPath.string())},
        {"format", formatName(format)},
        {"exclude_patterns", excludePatterns},
        {"include_patterns", includePatterns},
        {"filter_extensions", filterExtensions},
        {"max_files", maxFiles},
        {"max_file_size", maxFileSize},
        {"follow_symlinks", followSymlinks},
        {"use_gitignore", useGitignore},
        {"threads", numThreads},
        {"use_cache", useCache},
        {"cache_dir", cacheDir.string()},
        {"snippets", snippets},
        {"snippet_context", snippetContext},
        {"source_roots", sourceRoots},
        {"entry_points", {
            {"stems", entryPoints.stems},
            {"out_degree_threshold", entryPoints.outDegreeThreshold},
            {"require_package_root", entryPoints.requirePackageRoot},
            {"pattern_confidence", entryPoints.patternConfidence},
            {"scan_root_bonus", entryPoints.scanRootBonus},
            {"shape_confidence", entryPoints.shapeConfidence},
            {"shape_step", entryPoints.shapeStep},
            {"shape_max_bonus", entryPoints.shapeMaxBonus}
        }},
        {"navigation", {
            {"max_entry_paths", navigation.maxEntryPaths},
            {"hop_limit", navigation.hopLimit},
            {"max_clusters", navigation.maxClusters},
            {"max_cluster_members", navigation.maxClusterMembers},
            {"min_cluster_size", navigation.minClusterSize}
        }},
        {"verbose", verbose},
        {"log_file", logFile.empty() ? json(nullptr) : json(logFile)}
    };
}

CartographerConfig CartographerConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Configuration must be a JSON object");
    }

    CartographerConfig config;
    try {
        std::string text;

        text.clear();
        readValue(j, "directory", text);
        if (!text.empty()) {
            config.directory = expandHome(text);
        }

        text.clear();
        readValue(j, "output_path", text);
        config.outputPath = text;

        if (j.contains("format") && !j["format"].is_null()) {
            config.format = formatFromName(j["format"].get<std::string>());
        }

        readValue(j, "exclude_patterns", config.excludePatterns);
        readValue(j, "include_patterns", config.includePatterns);
        readValue(j, "filter_extensions", config.filterExtensions);
        readValue(j, "max_files", config.maxFiles);
        readValue(j, "max_file_size", config.maxFileSize);
        readValue(j, "follow_symlinks", config.followSymlinks);
        readValue(j, "use_gitignore", config.useGitignore);
        readValue(j, "threads", config.numThreads);
        readValue(j, "use_cache", config.useCache);

        text.clear();
        readValue(j, "cache_dir", text);
        if (!text.empty()) {
            config.cacheDir = expandHome(text);
        }

        readValue(j, "snippets", config.snippets);
        readValue(j, "snippet_context", config.snippetContext);
        readValue(j, "source_roots", config.sourceRoots);

        if (j.contains("entry_points") && j["entry_points"].is_object()) {
            const json& e = j["entry_points"];
            readValue(e, "stems", config.entryPoints.stems);
            readValue(e, "out_degree_threshold", config.entryPoints.outDegreeThreshold);
            readValue(e, "require_package_root", config.entryPoints.requirePackageRoot);
            readValue(e, "pattern_confidence", config.entryPoints.patternConfidence);
            readValue(e, "scan_root_bonus", config.entryPoints.scanRootBonus);
            readValue(e, "shape_confidence", config.entryPoints.shapeConfidence);
            readValue(e, "shape_step", config.entryPoints.shapeStep);
            readValue(e, "shape_max_bonus", config.entryPoints.shapeMaxBonus);
        }

        if (j.contains("navigation") && j["navigation"].is_object()) {
            const json& n = j["navigation"];
            readValue(n, "max_entry_paths", config.navigation.maxEntryPaths);
            readValue(n, "hop_limit", config.navigation.hopLimit);
            readValue(n, "max_clusters", config.navigation.maxClusters);
            readValue(n, "max_cluster_members", config.navigation.maxClusterMembers);
            readValue(n, "min_cluster_size", config.navigation.minClusterSize);
        }

        readValue(j, "verbose", config.verbose);
        readValue(j, "log_file", config.logFile);
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Invalid configuration value: ") + e.what());
    }

    return config;
}

CartographerConfig CartographerConfig::load(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Configuration file not found: " + path.string());
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::invalid_argument("Malformed configuration file " + path.string() + ": " + e.what());
    }

    CartographerConfig config = fromJson(j);
    Logger::getInstance().debug("Configuration loaded from " + path.string());
    return config;
}

void CartographerConfig::save(const fs::path& path) const {
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
    }

    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to write configuration file: " + path.string());
    }
    file << toJson().dump(2) << std::endl;

    Logger::getInstance().info("Configuration saved to " + path.string());
}

std::optional<fs::path> CartographerConfig::findConfigFile(const fs::path& dir) {
    const fs::path candidate = dir / PROJECT_CONFIG_NAME;
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec)) {
        return candidate;
    }
    return std::nullopt;
}

unsigned int CartographerConfig::effectiveThreads() const {
    if (numThreads > 0) {
        return numThreads;
    }
    const unsigned int hardware = std::thread::hardware_concurrency();
    return hardware > 0 ? hardware : 1;
}

ScanOptions CartographerConfig::toScanOptions() const {
    ScanOptions options;
    options.maxFiles = maxFiles;
    options.maxFileSize = maxFileSize;
    options.extensions = filterExtensions;
    options.followSymlinks = followSymlinks;
    options.numThreads = effectiveThreads();
    return options;
}

IndexerOptions CartographerConfig::toIndexerOptions() const {
    IndexerOptions options;
    options.numThreads = effectiveThreads();
    options.sourceRoots = sourceRoots;
    options.entryPoints = entryPoints;
    options.navigation = navigation;
    return options;
}
