#pragma once

#include <string>
#include <vector>
#include <regex>
#include <memory>
#include <optional>
#include <atomic>
#include <stdexcept>
#include <unordered_set>
#include "file_record.hpp"
#include "language.hpp"

// Raised when a file cannot be treated as source text at all.
// Callers degrade the file to an empty structural record.
class ParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Import statement recognizer. Capture group 1 (or the first non-empty group)
// holds the token.
struct ImportPattern {
    std::regex regex;
    bool relativeToImporter = false;   // Token is relative even without "./"
    bool commaList = false;            // Group holds "a, b as c" style lists
    bool memberModules = false;        // "from . import a, b": group 1 is the dots, group 2 the modules
};

// Function header recognizer. Group 1 is the name. When the match ends at an
// opening parenthesis the parameter list is read with balanced-paren scanning;
// otherwise group 2, if present, holds the parameters inline.
struct FunctionPattern {
    std::regex regex;
    std::optional<std::regex> trailer;   // Must match right after the closing ')'
    bool checkLeadingWord = false;       // Reject lines starting with a reserved word
};

// Type declaration recognizer. Group 1 is the name, baseGroups hold parent lists.
struct TypePattern {
    std::regex regex;
    std::vector<int> baseGroups;
    bool requiresBody = false;           // Next non-space character must be '{'
};

enum class ParamStyle {
    NameFirst,   // name: Type, name Type, name
    TypeFirst    // Type name
};

// Vocabulary one language contributes to the shared recognizers
struct LanguageSpec {
    Language language = Language::Unknown;
    ParserFamily family = ParserFamily::None;

    std::vector<std::string> lineComments;
    std::vector<std::pair<std::string, std::string>> blockComments;
    std::string quotes;                          // String delimiters (single line)

    std::vector<ImportPattern> imports;
    std::optional<std::regex> importBlockStart;  // e.g. Go "import ("
    std::optional<std::regex> importBlockItem;
    std::optional<std::regex> importContinuation; // Import head whose token is on a later line

    std::vector<FunctionPattern> functions;
    std::vector<TypePattern> types;
    std::optional<std::regex> implBlock;         // Block whose functions belong to group 1 type
    std::optional<std::regex> receiver;          // Function receiver naming its type (group 1)

    std::optional<std::regex> blockOpen;         // Keyword family openers
    std::optional<std::regex> blockClose;        // Keyword family closers

    std::unordered_set<std::string> reservedNames;
    ParamStyle paramStyle = ParamStyle::NameFirst;

    // Registry lookup; returns nullptr for languages without a parser
    static const LanguageSpec* forLanguage(Language language);
};

// Determines where a declaration's body ends
class ScopeStrategy {
public:
    virtual ~ScopeStrategy() = default;

    // Index of the last line belonging to the declaration that starts at
    // startLine (both 0-based) in comment- and string-blanked code lines.
    virtual size_t blockEnd(const std::vector<std::string>& code,
                            size_t startLine,
                            const LanguageSpec& spec) const = 0;

    static std::unique_ptr<ScopeStrategy> create(ParserFamily family);
};

class BraceScope : public ScopeStrategy {
public:
    size_t blockEnd(const std::vector<std::string>& code, size_t startLine,
                    const LanguageSpec& spec) const override;
};

class IndentScope : public ScopeStrategy {
public:
    size_t blockEnd(const std::vector<std::string>& code, size_t startLine,
                    const LanguageSpec& spec) const override;
};

class KeywordScope : public ScopeStrategy {
public:
    size_t blockEnd(const std::vector<std::string>& code, size_t startLine,
                    const LanguageSpec& spec) const override;
};

// Source split into two views that keep line numbering intact
struct SourceLines {
    std::vector<std::string> text;   // Comments blanked, strings kept
    std::vector<std::string> code;   // Comments and string contents blanked
};

class StructuralParser {
public:
    StructuralParser() = default;

    // Extract imports, function headers and type declarations. Lines that
    // cannot be classified contribute nothing. Throws ParseError when the
    // content is not text. Languages without a parser yield an empty result.
    ParseResult parse(const std::string& content, Language language,
                      const std::string& filePath = "") const;

    // Number of parse() calls that ran a language parser
    size_t invocationCount() const { return invocations_.load(); }
    void resetInvocationCount() { invocations_ = 0; }

    // Blank comments (and, in the code view, string contents)
    static SourceLines splitSource(const std::string& content, const LanguageSpec& spec);

    // Split a raw parameter list into parameter names
    static std::vector<std::string> parameterNames(const std::string& params, ParamStyle style);

private:
    mutable std::atomic<size_t> invocations_{0};

    std::vector<std::string> extractImports(const SourceLines& lines, const LanguageSpec& spec) const;
    std::vector<FunctionEntry> extractFunctions(const SourceLines& lines, const LanguageSpec& spec,
                                                const std::string& filePath) const;
    std::vector<ClassEntry> extractClasses(const SourceLines& lines, const LanguageSpec& spec,
                                           const std::string& filePath) const;
    void countMethods(const SourceLines& lines, const LanguageSpec& spec,
                      const std::vector<FunctionEntry>& functions,
                      std::vector<ClassEntry>& classes) const;
};
