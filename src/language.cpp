#include "language.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

// Whole-name rules, checked before the extension table
const std::unordered_map<std::string, Language>& fileNameTable() {
    static const std::unordered_map<std::string, Language> table = {
        {"makefile", Language::Makefile},
        {"gnumakefile", Language::Makefile},
        {"dockerfile", Language::Dockerfile},
        {"cmakelists.txt", Language::CMake},
        {"rakefile", Language::Ruby},
        {"gemfile", Language::Ruby},
        {"vagrantfile", Language::Ruby}
    };
    return table;
}

const std::unordered_map<std::string, Language>& extensionTable() {
    static const std::unordered_map<std::string, Language> table = {
        {".c", Language::C},
        {".h", Language::C},
        {".cpp", Language::Cpp},
        {".cc", Language::Cpp},
        {".cxx", Language::Cpp},
        {".c++", Language::Cpp},
        {".hpp", Language::Cpp},
        {".hh", Language::Cpp},
        {".hxx", Language::Cpp},
        {".inl", Language::Cpp},
        {".ipp", Language::Cpp},
        {".cs", Language::CSharp},
        {".java", Language::Java},
        {".kt", Language::Kotlin},
        {".kts", Language::Kotlin},
        {".scala", Language::Scala},
        {".sc", Language::Scala},
        {".go", Language::Go},
        {".rs", Language::Rust},
        {".swift", Language::Swift},
        {".dart", Language::Dart},
        {".js", Language::JavaScript},
        {".jsx", Language::JavaScript},
        {".mjs", Language::JavaScript},
        {".cjs", Language::JavaScript},
        {".ts", Language::TypeScript},
        {".tsx", Language::TypeScript},
        {".mts", Language::TypeScript},
        {".cts", Language::TypeScript},
        {".php", Language::Php},
        {".py", Language::Python},
        {".pyw", Language::Python},
        {".pyi", Language::Python},
        {".rb", Language::Ruby},
        {".rake", Language::Ruby},
        {".lua", Language::Lua},
        {".sh", Language::Shell},
        {".bash", Language::Shell},
        {".zsh", Language::Shell},
        {".md", Language::Markdown},
        {".markdown", Language::Markdown},
        {".rst", Language::Text},
        {".txt", Language::Text},
        {".json", Language::Json},
        {".yaml", Language::Yaml},
        {".yml", Language::Yaml},
        {".toml", Language::Toml},
        {".xml", Language::Xml},
        {".html", Language::Html},
        {".htm", Language::Html},
        {".css", Language::Css},
        {".scss", Language::Css},
        {".sass", Language::Css},
        {".less", Language::Css},
        {".sql", Language::Sql},
        {".mk", Language::Makefile},
        {".cmake", Language::CMake}
    };
    return table;
}

struct LanguageInfo {
    Language language;
    const char* name;
    ParserFamily family;
};

const std::vector<LanguageInfo>& languageInfo() {
    static const std::vector<LanguageInfo> info = {
        {Language::C, "c", ParserFamily::BraceBlock},
        {Language::Cpp, "cpp", ParserFamily::BraceBlock},
        {Language::CSharp, "csharp", ParserFamily::BraceBlock},
        {Language::Java, "java", ParserFamily::BraceBlock},
        {Language::Kotlin, "kotlin", ParserFamily::BraceBlock},
        {Language::Scala, "scala", ParserFamily::BraceBlock},
        {Language::Go, "go", ParserFamily::BraceBlock},
        {Language::Rust, "rust", ParserFamily::BraceBlock},
        {Language::Swift, "swift", ParserFamily::BraceBlock},
        {Language::Dart, "dart", ParserFamily::BraceBlock},
        {Language::JavaScript, "javascript", ParserFamily::BraceBlock},
        {Language::TypeScript, "typescript", ParserFamily::BraceBlock},
        {Language::Php, "php", ParserFamily::BraceBlock},
        {Language::Python, "python", ParserFamily::IndentBlock},
        {Language::Ruby, "ruby", ParserFamily::KeywordBlock},
        {Language::Lua, "lua", ParserFamily::KeywordBlock},
        {Language::Shell, "shell", ParserFamily::KeywordBlock},
        {Language::Markdown, "markdown", ParserFamily::None},
        {Language::Json, "json", ParserFamily::None},
        {Language::Yaml, "yaml", ParserFamily::None},
        {Language::Toml, "toml", ParserFamily::None},
        {Language::Xml, "xml", ParserFamily::None},
        {Language::Html, "html", ParserFamily::None},
        {Language::Css, "css", ParserFamily::None},
        {Language::Sql, "sql", ParserFamily::None},
        {Language::Makefile, "makefile", ParserFamily::None},
        {Language::CMake, "cmake", ParserFamily::None},
        {Language::Dockerfile, "dockerfile", ParserFamily::None},
        {Language::Text, "text", ParserFamily::None}
    };
    return info;
}

} // namespace

Language LanguageClassifier::classify(const fs::path& path) {
    const std::string filename = toLower(path.filename().string());
    if (filename.empty()) {
        return Language::Unknown;
    }

    const auto& names = fileNameTable();
    auto nameIt = names.find(filename);
    if (nameIt != names.end()) {
        return nameIt->second;
    }

    // Dockerfile.dev, Makefile.am and friends
    if (filename.rfind("dockerfile.", 0) == 0) {
        return Language::Dockerfile;
    }
    if (filename.rfind("makefile.", 0) == 0) {
        return Language::Makefile;
    }

    const std::string extension = toLower(path.extension().string());
    if (extension.empty()) {
        return Language::Unknown;
    }

    const auto& extensions = extensionTable();
    auto extIt = extensions.find(extension);
    if (extIt != extensions.end()) {
        return extIt->second;
    }

    return Language::Unknown;
}

ParserFamily LanguageClassifier::family(Language language) {
    for (const auto& info : languageInfo()) {
        if (info.language == language) {
            return info.family;
        }
    }
    return ParserFamily::None;
}

std::string LanguageClassifier::languageName(Language language) {
    for (const auto& info : languageInfo()) {
        if (info.language == language) {
            return info.name;
        }
    }
    return "unknown";
}

Language LanguageClassifier::languageFromName(const std::string& name) {
    const std::string lowered = toLower(name);
    for (const auto& info : languageInfo()) {
        if (lowered == info.name) {
            return info.language;
        }
    }
    return Language::Unknown;
}

const std::vector<Language>& LanguageClassifier::allLanguages() {
    static const std::vector<Language> languages = [] {
        std::vector<Language> result;
        for (const auto& info : languageInfo()) {
            result.push_back(info.language);
        }
        return result;
    }();
    return languages;
}
