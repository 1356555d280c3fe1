#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

// Language tags understood by the classifier
enum class Language {
    Unknown,
    // Source languages (parsed)
    C,
    Cpp,
    CSharp,
    Java,
    Kotlin,
    Scala,
    Go,
    Rust,
    Swift,
    Dart,
    JavaScript,
    TypeScript,
    Php,
    Python,
    Ruby,
    Lua,
    Shell,
    // Data, markup and build files (classified but not parsed)
    Markdown,
    Json,
    Yaml,
    Toml,
    Xml,
    Html,
    Css,
    Sql,
    Makefile,
    CMake,
    Dockerfile,
    Text
};

// Structural family that decides how declaration scopes are delimited
enum class ParserFamily {
    None,           // Not parsed
    BraceBlock,     // { ... } scoping: C, Java, JS, Go, Rust, ...
    IndentBlock,    // Indentation scoping: Python
    KeywordBlock    // Keyword ... end scoping: Ruby, Lua, shell
};

class LanguageClassifier {
public:
    // Map a path to a language tag. Pure function of the file name.
    static Language classify(const fs::path& path);

    // Parser family for a language (None for data files and Unknown)
    static ParserFamily family(Language language);

    // True if the language has a structural parser
    static bool isSourceLanguage(Language language) {
        return family(language) != ParserFamily::None;
    }

    // Stable lower-case name used in serialized output
    static std::string languageName(Language language);

    // Inverse of languageName; returns Unknown for unrecognized names
    static Language languageFromName(const std::string& name);

    // Every tag except Unknown, in declaration order
    static const std::vector<Language>& allLanguages();
};
