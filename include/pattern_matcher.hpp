#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <regex>

namespace fs = std::filesystem;

/**
 * @brief Glob matching for exclude and include patterns.
 *
 * Exclude patterns follow .gitignore rules: a pattern without a slash
 * (e.g. "node_modules" or "*.pyc") matches any single path component, a
 * pattern with a slash is anchored at the scan root, a trailing slash
 * restricts the pattern to directories and a leading '!' re-includes a path.
 * Paths are relative to the scan root and use '/' separators.
 */
class PatternMatcher {
public:
    // Default constructor with the default exclusion list
    PatternMatcher();

    // Constructor with an explicit exclusion list (defaults are not added)
    explicit PatternMatcher(const std::vector<std::string>& ignorePatterns);

    // Default exclusion list: VCS metadata, dependency folders, build output, binaries
    static const std::vector<std::string>& defaultIgnorePatterns();

    void addIgnorePattern(const std::string& pattern);
    void addIncludePattern(const std::string& pattern);

    // Set include patterns from a comma-separated string (e.g., "*.cpp,*.hpp")
    void setIncludePatterns(const std::string& patternsStr);

    // Add exclude patterns from a comma-separated string (e.g., "*.txt,docs/")
    void setExcludePatterns(const std::string& patternsStr);

    // Load patterns from a .gitignore file, returns the number of patterns added
    size_t loadGitignore(const fs::path& gitignorePath);

    // Not ignored, and matches an include pattern when any are set
    bool shouldProcess(const fs::path& relativePath) const;

    bool isIgnored(const fs::path& relativePath, bool isDirectory = false) const;
    bool isIncluded(const fs::path& relativePath) const;

    bool hasIncludePatterns() const { return !includeRules_.empty(); }
    const std::vector<std::string>& ignorePatterns() const { return ignorePatterns_; }

private:
    struct Rule {
        std::regex regex;
        bool anchored = false;
        bool directoryOnly = false;
        bool negated = false;
    };

    std::vector<std::string> ignorePatterns_;
    std::vector<Rule> ignoreRules_;
    std::vector<Rule> includeRules_;

    static Rule makeRule(std::string pattern);
    static bool ruleMatches(const Rule& rule, const std::vector<std::string>& components, bool isDirectory);
    static std::regex patternToRegex(const std::string& pattern);
    static std::vector<std::string> splitPatternString(const std::string& patternsStr);
    static std::vector<std::string> splitComponents(const fs::path& relativePath);
};
