#include "pattern_matcher.hpp"
#include "logger.hpp"
#include <cctype>
#include <fstream>
#include <algorithm>
#include <sstream>

namespace {

std::string trim(const std::string& text) {
    std::string result = text;
    result.erase(result.begin(), std::find_if(result.begin(), result.end(),
        [](unsigned char ch) { return !std::isspace(ch); }));
    result.erase(std::find_if(result.rbegin(), result.rend(),
        [](unsigned char ch) { return !std::isspace(ch); }).base(), result.end());
    return result;
}

} // namespace

PatternMatcher::PatternMatcher()
    : PatternMatcher(defaultIgnorePatterns()) {
}

PatternMatcher::PatternMatcher(const std::vector<std::string>& ignorePatterns) {
    for (const auto& pattern : ignorePatterns) {
        addIgnorePattern(pattern);
    }
}

const std::vector<std::string>& PatternMatcher::defaultIgnorePatterns() {
    static const std::vector<std::string> patterns = {
        "node_modules", ".git", "__pycache__", "*.pyc", "*.pyo", "*.pyd",
        "*.so", "*.dll", "*.exe", "*.bin", "*.obj", "*.o", "*.a", "*.lib",
        "*.dylib", "*.ncb", "*.sdf", "*.suo", "*.pdb", "*.idb", "venv",
        "env", ".env", ".venv", ".pytest_cache", ".mypy_cache", ".ruff_cache",
        "build", "dist", "*.egg-info", "*.egg", ".tox", ".nox", ".coverage",
        ".DS_Store", "*.min.js", "*.min.css", "*.map", "package-lock.json",
        "yarn.lock", ".vscode", ".idea", "*.swp", "*.swo", ".ipynb_checkpoints",
        "debug", "target", "vendor"
    };
    return patterns;
}

void PatternMatcher::addIgnorePattern(const std::string& pattern) {
    const std::string trimmed = trim(pattern);
    if (trimmed.empty() || trimmed == "!" || trimmed == "/") {
        return;
    }
    ignorePatterns_.push_back(trimmed);
    ignoreRules_.push_back(makeRule(trimmed));
}

void PatternMatcher::addIncludePattern(const std::string& pattern) {
    const std::string trimmed = trim(pattern);
    if (trimmed.empty()) {
        return;
    }
    includeRules_.push_back(makeRule(trimmed));
}

void PatternMatcher::setIncludePatterns(const std::string& patternsStr) {
    includeRules_.clear();
    for (const auto& pattern : splitPatternString(patternsStr)) {
        addIncludePattern(pattern);
    }
}

void PatternMatcher::setExcludePatterns(const std::string& patternsStr) {
    for (const auto& pattern : splitPatternString(patternsStr)) {
        addIgnorePattern(pattern);
    }
}

std::vector<std::string> PatternMatcher::splitPatternString(const std::string& patternsStr) {
    std::vector<std::string> patterns;
    std::stringstream ss(patternsStr);
    std::string pattern;

    while (std::getline(ss, pattern, ',')) {
        pattern = trim(pattern);
        if (!pattern.empty()) {
            patterns.push_back(pattern);
        }
    }

    return patterns;
}

std::vector<std::string> PatternMatcher::splitComponents(const fs::path& relativePath) {
    std::vector<std::string> components;
    for (const auto& part : relativePath) {
        const std::string name = part.generic_string();
        if (name.empty() || name == "." || name == "/") {
            continue;
        }
        components.push_back(name);
    }
    return components;
}

size_t PatternMatcher::loadGitignore(const fs::path& gitignorePath) {
    std::ifstream file(gitignorePath);
    if (!file) {
        Logger::getInstance().warning("Failed to open .gitignore file: " + gitignorePath.string());
        return 0;
    }

    size_t added = 0;
    std::string line;
    while (std::getline(file, line)) {
        // Skip comments
        if (line.empty() || line[0] == '#') {
            continue;
        }

        line = trim(line);
        if (line.empty()) {
            continue;
        }

        addIgnorePattern(line);
        ++added;
    }

    Logger::getInstance().debug("Loaded " + std::to_string(added) + " patterns from " + gitignorePath.string());
    return added;
}

PatternMatcher::Rule PatternMatcher::makeRule(std::string pattern) {
    Rule rule;

    if (!pattern.empty() && pattern[0] == '!') {
        rule.negated = true;
        pattern.erase(0, 1);
    }
    if (!pattern.empty() && pattern.back() == '/') {
        rule.directoryOnly = true;
        pattern.pop_back();
    }
    if (!pattern.empty() && pattern[0] == '/') {
        rule.anchored = true;
        pattern.erase(0, 1);
    }
    if (pattern.find('/') != std::string::npos) {
        rule.anchored = true;
    }

    rule.regex = patternToRegex(pattern);
    return rule;
}

bool PatternMatcher::ruleMatches(const Rule& rule, const std::vector<std::string>& components, bool isDirectory) {
    const size_t count = components.size();

    if (!rule.anchored) {
        // Any single component
        for (size_t i = 0; i < count; ++i) {
            const bool isLast = i + 1 == count;
            if (rule.directoryOnly && isLast && !isDirectory) {
                continue;
            }
            if (std::regex_match(components[i], rule.regex)) {
                return true;
            }
        }
        return false;
    }

    // Anchored: the path itself or any of its parent directories
    std::string prefix;
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) {
            prefix += '/';
        }
        prefix += components[i];

        const bool isLast = i + 1 == count;
        if (rule.directoryOnly && isLast && !isDirectory) {
            continue;
        }
        if (std::regex_match(prefix, rule.regex)) {
            return true;
        }
    }
    return false;
}

bool PatternMatcher::shouldProcess(const fs::path& relativePath) const {
    if (isIgnored(relativePath)) {
        return false;
    }

    if (!includeRules_.empty()) {
        return isIncluded(relativePath);
    }

    return true;
}

bool PatternMatcher::isIgnored(const fs::path& relativePath, bool isDirectory) const {
    const auto components = splitComponents(relativePath);
    if (components.empty()) {
        return false;
    }

    // Later rules override earlier ones, as in .gitignore
    bool ignored = false;
    for (const auto& rule : ignoreRules_) {
        if (ignored == !rule.negated) {
            continue;
        }
        if (ruleMatches(rule, components, isDirectory)) {
            ignored = !rule.negated;
        }
    }
    return ignored;
}

bool PatternMatcher::isIncluded(const fs::path& relativePath) const {
    if (includeRules_.empty()) {
        return true;
    }

    const auto components = splitComponents(relativePath);
    if (components.empty()) {
        return false;
    }

    std::string fullPath;
    for (size_t i = 0; i < components.size(); ++i) {
        fullPath += (i > 0 ? "/" : "") + components[i];
    }

    for (const auto& rule : includeRules_) {
        // Unanchored include patterns match the file name
        const std::string& subject = rule.anchored ? fullPath : components.back();
        if (std::regex_match(subject, rule.regex)) {
            return true;
        }
    }

    return false;
}

std::regex PatternMatcher::patternToRegex(const std::string& pattern) {
    std::string regexStr = "^";

    for (size_t i = 0; i < pattern.size(); ++i) {
        const char c = pattern[i];

        if (c == '*') {
            if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
                if (i + 2 < pattern.size() && pattern[i + 2] == '/') {
                    // **/ matches any directory depth, including none
                    regexStr += "(?:.*/)?";
                    i += 2;
                } else {
                    regexStr += ".*";
                    i++;
                }
            } else {
                // * matches any character except directory separator
                regexStr += "[^/]*";
            }
        } else if (c == '?') {
            regexStr += "[^/]";
        } else if (c == '.' || c == '(' || c == ')' || c == '[' || c == ']' || c == '{' || c == '}' ||
                   c == '+' || c == '^' || c == '$' || c == '|' || c == '\\') {
            regexStr += '\\';
            regexStr += c;
        } else {
            regexStr += c;
        }
    }

    regexStr += "$";
    return std::regex(regexStr);
}
