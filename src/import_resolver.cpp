#include "import_resolver.hpp"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

struct ResolutionRules {
    std::vector<std::string> extensions;   // Tried after the exact name
    std::vector<std::string> indexFiles;   // Tried when the base is a directory
    bool suffixMatch = true;               // Allow matching anywhere in the tree
};

const ResolutionRules& rulesFor(Language language) {
    static const ResolutionRules script{
        {".ts", ".tsx", ".js", ".jsx", ".mjs", ".cjs", ".d.ts"},
        {"index.ts", "index.tsx", "index.js", "index.jsx", "index.mjs"},
        false};
    static const ResolutionRules python{{".py", ".pyi"}, {"__init__.py"}, true};
    static const ResolutionRules cFamily{{".h", ".hpp", ".hh", ".hxx", ".c", ".cpp", ".cc"}, {}, true};
    static const ResolutionRules rust{{".rs"}, {"mod.rs", "lib.rs"}, true};
    static const ResolutionRules go{{".go"}, {}, true};
    static const ResolutionRules ruby{{".rb"}, {}, true};
    static const ResolutionRules php{{".php"}, {"index.php"}, true};
    static const ResolutionRules lua{{".lua"}, {"init.lua"}, true};
    static const ResolutionRules shell{{".sh", ".bash"}, {}, true};
    static const ResolutionRules java{{".java"}, {}, true};
    static const ResolutionRules kotlin{{".kt", ".kts", ".java"}, {}, true};
    static const ResolutionRules scala{{".scala", ".java"}, {}, true};
    static const ResolutionRules csharp{{".cs"}, {}, true};
    static const ResolutionRules swift{{".swift"}, {}, true};
    static const ResolutionRules dart{{".dart"}, {}, true};
    static const ResolutionRules none{{}, {}, true};

    switch (language) {
        case Language::JavaScript:
        case Language::TypeScript:
            return script;
        case Language::Python:
            return python;
        case Language::C:
        case Language::Cpp:
            return cFamily;
        case Language::Rust:
            return rust;
        case Language::Go:
            return go;
        case Language::Ruby:
            return ruby;
        case Language::Php:
            return php;
        case Language::Lua:
            return lua;
        case Language::Shell:
            return shell;
        case Language::Java:
            return java;
        case Language::Kotlin:
            return kotlin;
        case Language::Scala:
            return scala;
        case Language::CSharp:
            return csharp;
        case Language::Swift:
            return swift;
        case Language::Dart:
            return dart;
        default:
            return none;
    }
}

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string replaceAll(std::string value, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = value.find(from, pos)) != std::string::npos) {
        value.replace(pos, from.size(), to);
        pos += to.size();
    }
    return value;
}

std::vector<std::string> splitSegments(const std::string& path) {
    std::vector<std::string> segments;
    std::string current;
    for (char ch : path) {
        if (ch == '/') {
            if (!current.empty()) {
                segments.push_back(current);
            }
            current.clear();
        } else {
            current += ch;
        }
    }
    if (!current.empty()) {
        segments.push_back(current);
    }
    return segments;
}

std::string joinSegments(const std::vector<std::string>& segments, size_t from = 0) {
    std::string result;
    for (size_t i = from; i < segments.size(); ++i) {
        if (!result.empty()) {
            result += '/';
        }
        result += segments[i];
    }
    return result;
}

std::string joinPath(const std::string& directory, const std::string& name) {
    if (directory.empty()) {
        return name;
    }
    if (name.empty()) {
        return directory;
    }
    return directory + "/" + name;
}

// Lexically normalize directory + relative; nullopt when ".." escapes the root
std::optional<std::string> normalize(const std::string& directory, const std::string& relative) {
    std::vector<std::string> segments = splitSegments(directory);
    for (const auto& segment : splitSegments(relative)) {
        if (segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (segments.empty()) {
                return std::nullopt;
            }
            segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }
    return joinSegments(segments);
}

bool isRelativeToken(const std::string& token) {
    return token == "." || token == ".." || startsWith(token, "./") || startsWith(token, "../");
}

} // namespace

std::string parentDirectory(const std::string& path) {
    const auto slash = path.rfind('/');
    return slash == std::string::npos ? "" : path.substr(0, slash);
}

std::string topLevelDirectory(const std::string& path) {
    const auto slash = path.find('/');
    return slash == std::string::npos ? "" : path.substr(0, slash);
}

std::string fileStem(const std::string& path) {
    return fs::path(path).stem().string();
}

const std::vector<std::string>& ImportResolver::manifestMarkers() {
    static const std::vector<std::string> markers = {
        "package.json", "tsconfig.json", "pyproject.toml", "setup.py", "setup.cfg",
        "requirements.txt", "go.mod", "Cargo.toml", "pom.xml", "build.gradle",
        "build.gradle.kts", "build.sbt", "composer.json", "Gemfile", "CMakeLists.txt",
        "Makefile", "pubspec.yaml", "Package.swift", "mix.exs", "deno.json"
    };
    return markers;
}

const std::vector<std::string>& ImportResolver::defaultSourceRoots() {
    static const std::vector<std::string> names = {"src", "lib", "include", "source", "app", "pkg"};
    return names;
}

ImportResolver::ImportResolver(const std::vector<std::string>& paths,
                               const std::vector<std::string>& sourceRootNames) {
    const auto& markers = manifestMarkers();
    std::unordered_set<std::string> manifestDirs;

    for (const auto& path : paths) {
        files_.insert(path);

        const std::string directory = parentDirectory(path);
        const std::string name = path.substr(directory.empty() ? 0 : directory.size() + 1);
        filesByName_[name].push_back(path);
        filesByDirectory_[directory].push_back(path);

        if (std::find(markers.begin(), markers.end(), name) != markers.end()) {
            manifestDirs.insert(directory);
        }

        // Register every ancestor directory
        std::string ancestor = directory;
        while (!ancestor.empty() && directories_.insert(ancestor).second) {
            ancestor = parentDirectory(ancestor);
        }
    }

    for (auto& item : filesByName_) {
        std::sort(item.second.begin(), item.second.end());
    }
    for (auto& item : filesByDirectory_) {
        std::sort(item.second.begin(), item.second.end());
    }

    // Scan root, manifest directories, and source roots directly under any of them
    std::vector<std::string> baseRoots = {""};
    for (const auto& directory : manifestDirs) {
        if (!directory.empty()) {
            baseRoots.push_back(directory);
        }
    }

    for (const auto& root : baseRoots) {
        rootSet_.insert(root);
        for (const auto& name : sourceRootNames) {
            const std::string candidate = joinPath(root, name);
            if (directories_.count(candidate)) {
                rootSet_.insert(candidate);
            }
        }
    }

    roots_.assign(rootSet_.begin(), rootSet_.end());
    std::sort(roots_.begin(), roots_.end());
}

std::optional<std::string> ImportResolver::findWithExtensions(const std::string& base, Language language) const {
    if (base.empty()) {
        return std::nullopt;
    }

    if (files_.count(base)) {
        return base;
    }

    const auto& rules = rulesFor(language);
    for (const auto& extension : rules.extensions) {
        const std::string candidate = base + extension;
        if (files_.count(candidate)) {
            return candidate;
        }
    }

    for (const auto& indexFile : rules.indexFiles) {
        const std::string candidate = joinPath(base, indexFile);
        if (files_.count(candidate)) {
            return candidate;
        }
    }

    return std::nullopt;
}

std::optional<std::string> ImportResolver::firstSourceFileIn(const std::string& directory, Language language,
                                                             const std::string& fromFile) const {
    auto it = filesByDirectory_.find(directory);
    if (it == filesByDirectory_.end()) {
        return std::nullopt;
    }

    const auto& extensions = rulesFor(language).extensions;
    std::optional<std::string> fallback;

    for (const auto& path : it->second) {
        if (path == fromFile) {
            continue;
        }
        const bool sourceFile = std::any_of(extensions.begin(), extensions.end(),
            [&](const std::string& extension) { return endsWith(path, extension); });
        if (!sourceFile) {
            continue;
        }
        // Go test files are not part of the imported package
        if (language == Language::Go && endsWith(path, "_test.go")) {
            if (!fallback) {
                fallback = path;
            }
            continue;
        }
        return path;
    }
    return fallback;
}

std::optional<std::string> ImportResolver::resolveRelative(const std::string& token, const std::string& fromFile,
                                                           Language language) const {
    const std::string directory = parentDirectory(fromFile);

    // Python: one leading dot is the current package, each extra dot goes up
    if (language == Language::Python && startsWith(token, ".")) {
        size_t dots = 0;
        while (dots < token.size() && token[dots] == '.') {
            ++dots;
        }
        std::string relative;
        for (size_t i = 1; i < dots; ++i) {
            relative += "../";
        }
        relative += replaceAll(token.substr(dots), ".", "/");

        auto base = normalize(directory, relative);
        if (!base) {
            return std::nullopt;
        }
        return findWithExtensions(*base, language);
    }

    // Root-anchored paths
    if (startsWith(token, "/")) {
        auto base = normalize("", token.substr(1));
        return base ? findWithExtensions(*base, language) : std::nullopt;
    }

    auto base = normalize(directory, token);
    if (!base) {
        return std::nullopt;
    }

    if (auto found = findWithExtensions(*base, language)) {
        return found;
    }

    // Rust "mod x;" inside foo.rs may live in foo/x.rs
    if (language == Language::Rust) {
        const std::string stem = fileStem(fromFile);
        if (stem != "mod" && stem != "lib" && stem != "main") {
            auto nested = normalize(joinPath(directory, stem), token);
            if (nested) {
                return findWithExtensions(*nested, language);
            }
        }
    }

    return std::nullopt;
}

std::vector<std::string> ImportResolver::packageBases(const std::string& token, Language language) const {
    std::vector<std::string> bases;

    switch (language) {
        case Language::Python:
        case Language::Lua:
        case Language::Swift:
        case Language::CSharp:
            bases.push_back(replaceAll(token, ".", "/"));
            break;

        case Language::Java:
        case Language::Kotlin:
        case Language::Scala: {
            std::string path = token;
            if (endsWith(path, ".*")) {
                path = path.substr(0, path.size() - 2);
            }
            bases.push_back(replaceAll(path, ".", "/"));
            // Static imports and nested types name a member of the file
            const auto dot = path.rfind('.');
            if (dot != std::string::npos) {
                bases.push_back(replaceAll(path.substr(0, dot), ".", "/"));
            }
            break;
        }

        case Language::Rust: {
            std::vector<std::string> segments;
            size_t start = 0;
            while (start <= token.size()) {
                const auto sep = token.find("::", start);
                const std::string segment = token.substr(start, sep == std::string::npos ? std::string::npos : sep - start);
                if (!segment.empty() && segment != "crate" && segment != "self" && segment != "super") {
                    segments.push_back(segment);
                }
                if (sep == std::string::npos) {
                    break;
                }
                start = sep + 2;
            }
            // use a::b::Item -> a/b/Item, a/b, a
            for (size_t count = segments.size(); count > 0; --count) {
                bases.push_back(joinSegments(std::vector<std::string>(segments.begin(), segments.begin() + count)));
            }
            break;
        }

        case Language::Php: {
            std::string path = replaceAll(token, "\\", "/");
            while (startsWith(path, "/")) {
                path.erase(0, 1);
            }
            bases.push_back(path);
            break;
        }

        case Language::Dart: {
            if (startsWith(token, "package:")) {
                const auto slash = token.find('/');
                if (slash != std::string::npos) {
                    bases.push_back(token.substr(slash + 1));
                }
            }
            break;
        }

        case Language::JavaScript:
        case Language::TypeScript: {
            // Common path aliases for the project root
            if (startsWith(token, "@/") || startsWith(token, "~/")) {
                bases.push_back(token.substr(2));
            } else {
                bases.push_back(token);
            }
            break;
        }

        default:
            bases.push_back(token);
            break;
    }

    bases.erase(std::remove(bases.begin(), bases.end(), std::string()), bases.end());
    return bases;
}

std::optional<std::string> ImportResolver::resolvePackage(const std::string& token, const std::string& fromFile,
                                                          Language language) const {
    const auto bases = packageBases(token, language);
    const bool wildcard = endsWith(token, ".*");

    // Against every root-like directory
    for (const auto& base : bases) {
        std::vector<std::string> candidates;
        for (const auto& root : roots_) {
            const std::string joined = joinPath(root, base);
            if (wildcard && directories_.count(joined)) {
                if (auto first = firstSourceFileIn(joined, language, fromFile)) {
                    candidates.push_back(*first);
                }
                continue;
            }
            auto found = findWithExtensions(joined, language);
            if (found && *found != fromFile) {
                candidates.push_back(*found);
            }
        }
        if (!candidates.empty()) {
            return pickBest(std::move(candidates), fromFile);
        }
    }

    if (!rulesFor(language).suffixMatch) {
        return std::nullopt;
    }

    // Path-suffix match anywhere in the tree, dropping leading segments
    const auto& rules = rulesFor(language);
    for (const auto& base : bases) {
        const auto segments = splitSegments(base);
        if (segments.empty()) {
            continue;
        }
        const size_t keep = std::min<size_t>(2, segments.size());

        for (size_t drop = 0; drop + keep <= segments.size(); ++drop) {
            const std::string suffix = joinSegments(segments, drop);

            std::vector<std::string> names;
            names.push_back(suffix);
            for (const auto& extension : rules.extensions) {
                names.push_back(suffix + extension);
            }
            for (const auto& indexFile : rules.indexFiles) {
                names.push_back(joinPath(suffix, indexFile));
            }

            std::vector<std::string> candidates;
            for (const auto& name : names) {
                const auto nameSegments = splitSegments(name);
                auto it = filesByName_.find(nameSegments.back());
                if (it == filesByName_.end()) {
                    continue;
                }
                for (const auto& path : it->second) {
                    if (path != fromFile && (path == name || endsWith(path, "/" + name))) {
                        candidates.push_back(path);
                    }
                }
            }
            if (!candidates.empty()) {
                return pickBest(std::move(candidates), fromFile);
            }
        }
    }

    return std::nullopt;
}

std::optional<std::string> ImportResolver::resolveGoPackage(const std::string& token, const std::string& fromFile) const {
    const auto segments = splitSegments(token);
    const std::string importerDir = parentDirectory(fromFile);

    // Longest suffix of the import path that names a directory in the tree
    for (size_t drop = 0; drop < segments.size(); ++drop) {
        const std::string suffix = joinSegments(segments, drop);

        std::vector<std::string> candidates;
        for (const auto& directory : directories_) {
            if (directory == importerDir) {
                continue;
            }
            if (directory == suffix || endsWith(directory, "/" + suffix)) {
                if (auto file = firstSourceFileIn(directory, Language::Go, fromFile)) {
                    candidates.push_back(*file);
                }
            }
        }
        if (!candidates.empty()) {
            return pickBest(std::move(candidates), fromFile);
        }
    }
    return std::nullopt;
}

std::string ImportResolver::pickBest(std::vector<std::string> candidates, const std::string& fromFile) const {
    const std::string importerTop = topLevelDirectory(fromFile);

    std::sort(candidates.begin(), candidates.end(),
        [&](const std::string& a, const std::string& b) {
            const bool aSame = topLevelDirectory(a) == importerTop;
            const bool bSame = topLevelDirectory(b) == importerTop;
            if (aSame != bSame) {
                return aSame;
            }
            if (a.size() != b.size()) {
                return a.size() < b.size();
            }
            return a < b;
        });
    return candidates.front();
}

ImportResolver::Resolution ImportResolver::resolve(const std::string& token, const std::string& fromFile,
                                                   Language language) const {
    Resolution resolution;
    if (token.empty()) {
        return resolution;
    }

    const bool pythonRelative = language == Language::Python && startsWith(token, ".");
    const bool dartRelative = language == Language::Dart && token.find(':') == std::string::npos;

    if (isRelativeToken(token) || pythonRelative || dartRelative || startsWith(token, "/")) {
        if (auto target = resolveRelative(dartRelative && !isRelativeToken(token) ? "./" + token : token,
                                          fromFile, language)) {
            resolution.target = target;
            resolution.confidence = Confidence::Exact;
        }
        return resolution;
    }

    // Quoted includes are looked up next to the including file first
    if (language == Language::C || language == Language::Cpp) {
        if (auto target = resolveRelative("./" + token, fromFile, language)) {
            resolution.target = target;
            resolution.confidence = Confidence::Exact;
            return resolution;
        }
    }

    std::optional<std::string> target;
    if (language == Language::Go) {
        target = resolveGoPackage(token, fromFile);
    } else {
        target = resolvePackage(token, fromFile, language);
    }

    if (target) {
        resolution.target = target;
        resolution.confidence = Confidence::Heuristic;
    }
    return resolution;
}

std::vector<ImportEdge> ImportResolver::resolveAll(const FileRecord& record) const {
    std::vector<ImportEdge> edges;
    edges.reserve(record.imports.size());

    for (const auto& token : record.imports) {
        const Resolution resolution = resolve(token, record.path, record.language);

        ImportEdge edge;
        edge.source = record.path;
        edge.token = token;
        edge.target = resolution.target;
        edge.confidence = resolution.confidence;
        edges.push_back(std::move(edge));
    }

    return edges;
}
