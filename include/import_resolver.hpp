#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include "file_record.hpp"

/**
 * @brief Maps raw import tokens onto files of the scanned tree
 *
 * Built once from the complete path set (repo-relative, '/' separated). Never
 * touches the file system and never resolves outside the scanned tree.
 *
 * Resolution order for a token:
 *  1. relative tokens ("./x", "../x", Python leading dots, C/C++ quoted includes
 *     next to the importer) resolve against the importer's directory with
 *     extension and index-file inference -> Confidence::Exact
 *  2. package-style tokens (dotted, "::", backslash or slash paths) resolve
 *     against root-like directories, then by path-suffix match anywhere in the
 *     tree -> Confidence::Heuristic
 *  3. anything else -> Confidence::Unresolved
 *
 * Ties prefer the importer's top-level directory, then the shortest path, then
 * lexical order.
 */
class ImportResolver {
public:
    struct Resolution {
        std::optional<std::string> target;
        Confidence confidence = Confidence::Unresolved;
    };

    explicit ImportResolver(const std::vector<std::string>& paths,
                            const std::vector<std::string>& sourceRootNames = defaultSourceRoots());

    Resolution resolve(const std::string& token, const std::string& fromFile, Language language) const;

    // One edge per import token of the record, unresolved ones included
    std::vector<ImportEdge> resolveAll(const FileRecord& record) const;

    // Root-like directories, sorted; "" is the scan root
    const std::vector<std::string>& roots() const { return roots_; }
    bool isRoot(const std::string& directory) const { return rootSet_.count(directory) > 0; }

    bool contains(const std::string& path) const { return files_.count(path) > 0; }

    // File names that make their directory a package root
    static const std::vector<std::string>& manifestMarkers();
    static const std::vector<std::string>& defaultSourceRoots();

private:
    std::unordered_set<std::string> files_;
    std::unordered_set<std::string> directories_;
    std::unordered_map<std::string, std::vector<std::string>> filesByName_;
    std::map<std::string, std::vector<std::string>> filesByDirectory_;
    std::vector<std::string> roots_;
    std::unordered_set<std::string> rootSet_;

    std::optional<std::string> findWithExtensions(const std::string& base, Language language) const;
    std::optional<std::string> firstSourceFileIn(const std::string& directory, Language language,
                                                 const std::string& fromFile) const;
    std::optional<std::string> resolveRelative(const std::string& token, const std::string& fromFile,
                                               Language language) const;
    std::optional<std::string> resolvePackage(const std::string& token, const std::string& fromFile,
                                              Language language) const;
    std::optional<std::string> resolveGoPackage(const std::string& token, const std::string& fromFile) const;
    std::vector<std::string> packageBases(const std::string& token, Language language) const;
    std::string pickBest(std::vector<std::string> candidates, const std::string& fromFile) const;
};

// Path helpers shared by the graph stages
std::string parentDirectory(const std::string& path);   // "" for top-level files
std::string topLevelDirectory(const std::string& path); // "" for top-level files
std::string fileStem(const std::string& path);
