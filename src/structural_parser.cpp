#include "structural_parser.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace {

// Longest text handed to a regex. Longer lines are skipped (minified or
// generated code); std::regex recurses per character and would exhaust the stack.
constexpr size_t MAX_LINE_LENGTH = 2000;

// How far balanced-paren scanning and lookahead may run
constexpr size_t MAX_SCAN_LINES = 60;
constexpr size_t TRAILER_LOOKAHEAD_LINES = 3;

std::regex re(const char* pattern) {
    return std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

bool isBlank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

bool isIdentChar(char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_' || ch == '$';
}

// Split on separator characters that appear outside (), [], {} and <>
std::vector<std::string> splitTopLevel(const std::string& text, const std::string& separators) {
    std::vector<std::string> parts;
    std::string current;
    int depth = 0;

    for (size_t i = 0; i < text.size(); ++i) {
        const char ch = text[i];
        if (ch == '(' || ch == '[' || ch == '{' || ch == '<') {
            ++depth;
        } else if (ch == ')' || ch == ']' || ch == '}' || (ch == '>' && !(i > 0 && text[i - 1] == '-'))) {
            depth = std::max(0, depth - 1);
        } else if (depth == 0 && separators.find(ch) != std::string::npos) {
            parts.push_back(current);
            current.clear();
            continue;
        }
        current += ch;
    }
    parts.push_back(current);
    return parts;
}

// Remove a default value ("= 3") that appears at nesting depth zero
std::string stripDefault(const std::string& param) {
    int depth = 0;
    for (size_t i = 0; i < param.size(); ++i) {
        const char ch = param[i];
        if (ch == '(' || ch == '[' || ch == '{' || ch == '<') {
            ++depth;
        } else if (ch == ')' || ch == ']' || ch == '}' || ch == '>') {
            depth = std::max(0, depth - 1);
        } else if (ch == '=' && depth == 0) {
            const char next = i + 1 < param.size() ? param[i + 1] : '\0';
            const char prev = i > 0 ? param[i - 1] : '\0';
            if (next != '=' && next != '>' && prev != '=' && prev != '!' && prev != '<' && prev != '>') {
                return param.substr(0, i);
            }
        }
    }
    return param;
}

// Drop bracketed segments, keeping the text around them
std::string stripBracketed(const std::string& text, char open, char close) {
    std::string result;
    int depth = 0;
    for (char ch : text) {
        if (ch == open) {
            ++depth;
        } else if (ch == close && depth > 0) {
            --depth;
        } else if (depth == 0) {
            result += ch;
        }
    }
    return result;
}

std::vector<std::string> identifiers(const std::string& text) {
    static const std::regex identRegex = re(R"re([A-Za-z_$][\w$]*(?:::[A-Za-z_$][\w$]*)*)re");
    std::vector<std::string> result;
    for (std::sregex_iterator it(text.begin(), text.end(), identRegex), end; it != end; ++it) {
        result.push_back(it->str());
    }
    return result;
}

std::string firstWord(const std::string& line) {
    size_t start = 0;
    while (start < line.size() && std::isspace(static_cast<unsigned char>(line[start]))) {
        ++start;
    }
    size_t end = start;
    while (end < line.size() && (isIdentChar(line[end]) || line[end] == '#')) {
        ++end;
    }
    return line.substr(start, end - start);
}

// Text from (line, col) onwards, joined with the next few lines, at most MAX_LINE_LENGTH characters
std::string lookahead(const std::vector<std::string>& lines, size_t line, size_t col, size_t extraLines) {
    std::string text = col < lines[line].size() ? lines[line].substr(col) : "";
    for (size_t i = line + 1; i < lines.size() && i <= line + extraLines && text.size() < MAX_LINE_LENGTH; ++i) {
        text += ' ';
        text += lines[i];
    }
    if (text.size() > MAX_LINE_LENGTH) {
        text.resize(MAX_LINE_LENGTH);
    }
    return text;
}

int indentOf(const std::string& line) {
    int indent = 0;
    for (char ch : line) {
        if (ch == ' ') {
            ++indent;
        } else if (ch == '\t') {
            indent += 4;
        } else {
            break;
        }
    }
    return indent;
}

std::vector<std::string> cleanBases(const std::string& raw) {
    static const std::regex withRegex = re(R"re(\s+with\s+)re");
    static const std::regex keywordRegex =
        re(R"re(^(?:public|protected|private|internal|virtual|extends|implements|open|with)\s+)re");

    std::vector<std::string> bases;
    const std::string normalized = std::regex_replace(raw, withRegex, ",");

    for (auto piece : splitTopLevel(normalized, ",+")) {
        if (piece.find('=') != std::string::npos) {
            continue;   // keyword arguments such as metaclass=ABCMeta
        }
        piece = stripBracketed(piece, '<', '>');
        piece = stripBracketed(piece, '(', ')');
        piece = stripBracketed(piece, '[', ']');
        piece = trim(piece);

        std::string previous;
        while (previous != piece) {
            previous = piece;
            piece = trim(std::regex_replace(piece, keywordRegex, ""));
        }

        while (!piece.empty() && (piece.back() == '{' || piece.back() == ':' || piece.back() == ';')) {
            piece.pop_back();
            piece = trim(piece);
        }

        if (!piece.empty() && (isIdentChar(piece.front()) || piece.front() == '\\' || piece.front() == ':')) {
            bases.push_back(piece);
        }
    }
    return bases;
}

struct Extent {
    size_t start = 0;   // 0-based line
    size_t end = 0;     // 0-based line, inclusive
    bool contains(size_t line) const { return line > start && line <= end; }
};

// Vocabulary shared by the C-derived languages
const std::unordered_set<std::string>& cLikeReserved() {
    static const std::unordered_set<std::string> words = {
        "if", "else", "for", "foreach", "while", "do", "switch", "case", "default", "catch",
        "return", "sizeof", "alignof", "decltype", "typeof", "new", "delete", "throw", "goto",
        "static_assert", "using", "namespace", "typedef", "operator", "defined", "lock",
        "fixed", "synchronized", "await", "yield", "co_return", "co_await", "co_yield",
        "assert", "when", "function", "with", "super", "import", "export", "require"
    };
    return words;
}

const char* const CLIKE_FUNCTION =
    R"re(^\s*(?:[\w:<>,\*&\[\]@\.]+\s+)+[\*&]*(~?[A-Za-z_]\w*(?:::~?[A-Za-z_]\w*)*)\s*\()re";
const char* const QUALIFIED_FUNCTION =
    R"re(^\s*((?:[A-Za-z_]\w*::)+~?[A-Za-z_]\w*)\s*\()re";

LanguageSpec cLikeBase(Language language) {
    LanguageSpec spec;
    spec.language = language;
    spec.family = ParserFamily::BraceBlock;
    spec.lineComments = {"//"};
    spec.blockComments = {{"/*", "*/"}};
    spec.quotes = "\"'";
    spec.reservedNames = cLikeReserved();
    spec.paramStyle = ParamStyle::TypeFirst;
    return spec;
}

LanguageSpec makeCFamily(Language language) {
    LanguageSpec spec = cLikeBase(language);
    spec.imports.push_back({re(R"re(^\s*#\s*(?:include|import)\s*[<"]([^>"]+)[>"])re")});
    spec.functions.push_back({re(CLIKE_FUNCTION), re(R"re(^[^;{}]*\{)re"), true});
    spec.functions.push_back({re(QUALIFIED_FUNCTION), re(R"re(^[^;{}]*\{)re"), true});
    spec.types.push_back({re(R"re(^\s*(?:template\s*<.*>\s*)?(?:typedef\s+)?(?:class|struct|union)\s+(?:(?:alignas\s*\([^)]*\)|__declspec\s*\([^)]*\)|[A-Z][A-Z0-9_]*_API|\[\[.*?\]\])\s+)?([A-Za-z_]\w*)(?:\s+final)?\s*(?::\s*([^{;]*))?)re"), {2}, true});
    spec.receiver = re(R"re((?:^|::)([A-Za-z_]\w*)::~?[A-Za-z_]\w*$)re");
    return spec;
}

LanguageSpec makeJava() {
    LanguageSpec spec = cLikeBase(Language::Java);
    spec.imports.push_back({re(R"re(^\s*import\s+(?:static\s+)?([\w.]+(?:\.\*)?)\s*;)re")});
    spec.functions.push_back({re(CLIKE_FUNCTION), re(R"re(^[^;{}]*\{)re"), true});
    spec.types.push_back({re(R"re(^\s*(?:(?:public|private|protected|static|final|abstract|sealed|non-sealed|strictfp)\s+)*(?:class|interface|enum|record|@interface)\s+([A-Za-z_]\w*)\s*(?:<.*?>)?\s*(?:\([^)]*\))?\s*(?:extends\s+([^{]+?))?\s*(?:implements\s+([^{]+?))?\s*(?:permits\s+[^{]+?)?\s*(?=\{|$))re"), {2, 3}, true});
    return spec;
}

LanguageSpec makeCSharp() {
    LanguageSpec spec = cLikeBase(Language::CSharp);
    spec.imports.push_back({re(R"re(^\s*(?:global\s+)?using\s+(?:static\s+)?(?:\w+\s*=\s*)?([\w.]+)\s*;)re")});
    spec.functions.push_back({re(CLIKE_FUNCTION), re(R"re(^[^;{}]*(?:\{|=>))re"), true});
    spec.types.push_back({re(R"re(^\s*(?:(?:public|private|protected|internal|static|sealed|abstract|partial|readonly|ref|unsafe|new)\s+)*(?:class|struct|interface|record)\s+([A-Za-z_]\w*)\s*(?:<.*?>)?\s*(?:\([^)]*\))?\s*(?::\s*([^{]+?))?\s*(?=\{|$|where\b))re"), {2}, false});
    return spec;
}

LanguageSpec makeDart() {
    LanguageSpec spec = cLikeBase(Language::Dart);
    spec.imports.push_back({re(R"re(^\s*(?:import|export|part)\s+['"]([^'"]+)['"])re")});
    spec.functions.push_back({re(CLIKE_FUNCTION), re(R"re(^[^;{}]*(?:\{|=>))re"), true});
    spec.types.push_back({re(R"re(^\s*(?:abstract\s+)?(?:class|mixin)\s+([A-Za-z_]\w*)(?:<.*?>)?(?:\s+extends\s+([\w<>.]+))?(?:\s+with\s+([\w<>.,\s]+?))?(?:\s+implements\s+([\w<>.,\s]+?))?\s*(?=\{|$))re"), {2, 3, 4}, false});
    return spec;
}

LanguageSpec makeKotlin() {
    LanguageSpec spec = cLikeBase(Language::Kotlin);
    spec.quotes = "\"'";
    spec.paramStyle = ParamStyle::NameFirst;
    spec.imports.push_back({re(R"re(^\s*import\s+([\w.]+(?:\.\*)?))re")});
    spec.functions.push_back({re(R"re(^\s*(?:(?:public|private|protected|internal|override|open|abstract|suspend|inline|operator|infix|tailrec|external|final|actual|expect)\s+)*fun\s+(?:<.*?>\s*)?(?:[\w.]+\.)?([A-Za-z_]\w*)\s*\()re")});
    spec.types.push_back({re(R"re(^\s*(?:(?:public|private|protected|internal|open|abstract|sealed|data|enum|annotation|inner|final|value)\s+)*(?:class|interface|object)\s+([A-Za-z_]\w*)(?:<.*?>)?(?:\s*(?:private\s+|protected\s+|internal\s+)?(?:constructor\s*)?\([^)]*\))?\s*(?::\s*([^{]+?))?\s*(?=\{|$))re"), {2}, false});
    return spec;
}

LanguageSpec makeScala() {
    LanguageSpec spec = cLikeBase(Language::Scala);
    spec.quotes = "\"";
    spec.paramStyle = ParamStyle::NameFirst;
    spec.imports.push_back({re(R"re(^\s*import\s+([\w.]+))re")});
    spec.functions.push_back({re(R"re(^\s*(?:(?:override|private|protected|final|implicit|inline)\s+)*def\s+([A-Za-z_]\w*)\s*(?:\[.*?\])?\s*\()re")});
    spec.functions.push_back({re(R"re(^\s*(?:(?:override|private|protected|final|implicit|inline)\s+)*def\s+([A-Za-z_]\w*)\s*[:=])re")});
    spec.types.push_back({re(R"re(^\s*(?:(?:abstract|final|sealed|case|implicit|private|protected)\s+)*(?:class|trait|object)\s+([A-Za-z_]\w*)(?:\[.*?\])?(?:\s*\([^)]*\))?(?:\s+extends\s+([^{]+?))?\s*(?=\{|$))re"), {2}, false});
    return spec;
}

LanguageSpec makeGo() {
    LanguageSpec spec = cLikeBase(Language::Go);
    spec.quotes = "\"'`";
    spec.paramStyle = ParamStyle::NameFirst;
    spec.imports.push_back({re(R"re(^\s*import\s+(?:[\w.]+\s+)?"([^"]+)")re")});
    spec.importBlockStart = re(R"re(^\s*import\s*\(\s*$)re");
    spec.importBlockItem = re(R"re(^\s*(?:[\w.]+\s+)?"([^"]+)")re");
    spec.functions.push_back({re(R"re(^\s*func\s+(?:\([^)]*\)\s*)?([A-Za-z_]\w*)\s*(?:\[[^\]]*\])?\s*\()re")});
    spec.types.push_back({re(R"re(^\s*type\s+([A-Za-z_]\w*)\s*(?:\[.*?\])?\s+(?:struct|interface)\b)re"), {}, false});
    spec.receiver = re(R"re(^\s*func\s+\(\s*(?:[A-Za-z_]\w*\s+)?\*?\s*([A-Za-z_]\w*))re");
    return spec;
}

LanguageSpec makeRust() {
    LanguageSpec spec = cLikeBase(Language::Rust);
    spec.quotes = "\"";
    spec.paramStyle = ParamStyle::NameFirst;
    spec.imports.push_back({re(R"re(^\s*(?:pub(?:\s*\([^)]*\))?\s+)?use\s+([\w:]+))re")});
    spec.imports.push_back({re(R"re(^\s*(?:pub(?:\s*\([^)]*\))?\s+)?mod\s+([A-Za-z_]\w*)\s*;)re"), true});
    spec.functions.push_back({re(R"re(^\s*(?:pub(?:\s*\([^)]*\))?\s+)?(?:default\s+)?(?:const\s+)?(?:async\s+)?(?:unsafe\s+)?(?:extern\s+"[^"]*"\s+)?fn\s+([A-Za-z_]\w*)\s*(?:<.*?>)?\s*\()re")});
    spec.types.push_back({re(R"re(^\s*(?:pub(?:\s*\([^)]*\))?\s+)?(?:unsafe\s+)?(?:struct|enum|trait|union)\s+([A-Za-z_]\w*)(?:<.*?>)?\s*(?::\s*([^{;]+?))?\s*(?=\{|;|\(|where\b|$))re"), {2}, false});
    spec.implBlock = re(R"re(^\s*(?:unsafe\s+)?impl(?:<.*?>)?\s+(?:[\w:]+(?:<.*?>)?\s+for\s+)?([A-Za-z_]\w*))re");
    return spec;
}

LanguageSpec makeSwift() {
    LanguageSpec spec = cLikeBase(Language::Swift);
    spec.quotes = "\"";
    spec.paramStyle = ParamStyle::NameFirst;
    spec.imports.push_back({re(R"re(^\s*(?:@\w+\s+)*import\s+(?:(?:typealias|struct|class|enum|protocol|let|var|func)\s+)?([\w.]+))re")});
    spec.functions.push_back({re(R"re(^\s*(?:(?:public|private|fileprivate|internal|open|static|class|override|final|mutating|nonmutating|@\w+)\s+)*func\s+([A-Za-z_]\w*)\s*(?:<.*?>)?\s*\()re")});
    spec.types.push_back({re(R"re(^\s*(?:(?:public|private|fileprivate|internal|open|final|indirect)\s+)*(?:class|struct|protocol|enum|actor)\s+([A-Za-z_]\w*)(?:<.*?>)?\s*(?::\s*([^{]+?))?\s*(?=\{|$|where\b))re"), {2}, false});
    spec.implBlock = re(R"re(^\s*(?:(?:public|private|fileprivate|internal)\s+)?extension\s+([A-Za-z_]\w*))re");
    return spec;
}

LanguageSpec makeScript(Language language) {
    LanguageSpec spec = cLikeBase(language);
    spec.quotes = "\"'`";
    spec.paramStyle = ParamStyle::NameFirst;
    spec.imports.push_back({re(R"re(\bimport\s+(?:type\s+)?(?:[\w$*{}\s,]+\s+from\s+)?['"]([^'"]+)['"])re")});
    spec.imports.push_back({re(R"re(\bexport\s+(?:type\s+)?(?:[\w$*{}\s,]+\s+)?from\s+['"]([^'"]+)['"])re")});
    spec.imports.push_back({re(R"re(\brequire\s*\(\s*['"]([^'"]+)['"]\s*\))re")});
    spec.imports.push_back({re(R"re(\bimport\s*\(\s*['"]([^'"]+)['"]\s*\))re")});
    spec.importContinuation = re(R"re(^\s*(?:import|export)\s+(?:type\s+)?(?:[\w$]+\s*,\s*)?\{[^}]*$)re");

    spec.functions.push_back({re(R"re(^\s*(?:export\s+)?(?:default\s+)?(?:declare\s+)?(?:async\s+)?function\s*\*?\s*([A-Za-z_$][\w$]*)\s*(?:<.*?>)?\s*\()re")});
    spec.functions.push_back({re(R"re(^\s*(?:export\s+)?(?:const|let|var)\s+([A-Za-z_$][\w$]*)\s*(?::[^=]+)?=\s*(?:async\s*)?(?:function\s*\*?\s*)?(?:<.*?>)?\s*\()re"),
                              re(R"re(^\s*(?::\s*[^={;]+)?(?:=>|\{))re")});
    spec.functions.push_back({re(R"re(^\s*(?:export\s+)?(?:const|let|var)\s+([A-Za-z_$][\w$]*)\s*=\s*(?:async\s+)?([A-Za-z_$][\w$]*)\s*=>)re")});
    spec.functions.push_back({re(R"re(^\s*(?:(?:public|private|protected|static|async|readonly|override|abstract|get|set)\s+)*\*?([A-Za-z_$][\w$]*)\s*(?:<.*?>)?\s*\()re"),
                              re(R"re(^\s*(?::\s*[^{;=]+)?\{)re"), true});

    spec.types.push_back({re(R"re(^\s*(?:export\s+)?(?:default\s+)?(?:declare\s+)?(?:abstract\s+)?class\s+([A-Za-z_$][\w$]*)(?:<.*?>)?(?:\s+extends\s+([\w$.]+)(?:<.*?>)?)?(?:\s+implements\s+([\w$.,\s<>]+?))?\s*(?=\{|$))re"), {2, 3}, false});
    if (language == Language::TypeScript) {
        spec.types.push_back({re(R"re(^\s*(?:export\s+)?(?:declare\s+)?interface\s+([A-Za-z_$][\w$]*)(?:<.*?>)?(?:\s+extends\s+([^{]+?))?\s*(?=\{|$))re"), {2}, false});
    }
    spec.reservedNames.insert({"constructor_", "catch", "then"});
    return spec;
}

LanguageSpec makePhp() {
    LanguageSpec spec = cLikeBase(Language::Php);
    spec.lineComments = {"//", "#"};
    spec.paramStyle = ParamStyle::NameFirst;
    spec.imports.push_back({re(R"re(\b(?:require|include)(?:_once)?\s*\(?\s*['"]([^'"]+)['"])re"), true});
    spec.imports.push_back({re(R"re(^\s*use\s+(?:function\s+|const\s+)?([\w\\]+))re")});
    spec.functions.push_back({re(R"re(^\s*(?:(?:public|private|protected|static|abstract|final)\s+)*function\s+&?([A-Za-z_]\w*)\s*\()re")});
    spec.types.push_back({re(R"re(^\s*(?:(?:abstract|final|readonly)\s+)*(?:class|interface|trait|enum)\s+([A-Za-z_]\w*)(?:\s+extends\s+([\w\\,\s]+?))?(?:\s+implements\s+([\w\\,\s]+?))?\s*(?=\{|$))re"), {2, 3}, false});
    return spec;
}

LanguageSpec makePython() {
    LanguageSpec spec;
    spec.language = Language::Python;
    spec.family = ParserFamily::IndentBlock;
    spec.lineComments = {"#"};
    spec.blockComments = {{"\"\"\"", "\"\"\""}, {"'''", "'''"}};
    spec.quotes = "\"'";
    spec.imports.push_back({re(R"re(^\s*from\s+(\.+)\s+import\s*\(?\s*([\w\s,]*))re"), false, false, true});
    spec.imports.push_back({re(R"re(^\s*from\s+(\.*\w[\w.]*)\s+import\b)re")});
    spec.imports.push_back({re(R"re(^\s*import\s+(.+))re"), false, true});
    spec.functions.push_back({re(R"re(^\s*(?:async\s+)?def\s+([A-Za-z_]\w*)\s*\()re")});
    spec.types.push_back({re(R"re(^\s*class\s+([A-Za-z_]\w*)\s*(?:\[.*?\])?\s*(?:\((.*)\))?\s*:)re"), {2}, false});
    return spec;
}

LanguageSpec makeRuby() {
    LanguageSpec spec;
    spec.language = Language::Ruby;
    spec.family = ParserFamily::KeywordBlock;
    spec.lineComments = {"#"};
    spec.blockComments = {{"=begin", "=end"}};
    spec.quotes = "\"'";
    spec.imports.push_back({re(R"re(^\s*require\s*\(?\s*['"]([^'"]+)['"])re")});
    spec.imports.push_back({re(R"re(^\s*require_relative\s*\(?\s*['"]([^'"]+)['"])re"), true});
    spec.imports.push_back({re(R"re(^\s*load\s*\(?\s*['"]([^'"]+)['"])re"), true});
    spec.functions.push_back({re(R"re(^\s*def\s+(?:self\.)?([A-Za-z_]\w*[?!=]?)\s*\()re")});
    spec.functions.push_back({re(R"re(^\s*def\s+(?:self\.)?([A-Za-z_]\w*[?!]?)\s*(.*)$)re")});
    spec.types.push_back({re(R"re(^\s*class\s+([A-Z][\w:]*)(?:\s*<\s*([\w:.]+))?)re"), {2}, false});
    spec.types.push_back({re(R"re(^\s*module\s+([A-Z][\w:]*))re"), {}, false});
    spec.blockOpen = re(R"re(^\s*(?:class|module|def|if|unless|while|until|case|begin|for)\b|\bdo\s*(?:\|[^|]*\|)?\s*$)re");
    spec.blockClose = re(R"re(\bend\b)re");
    return spec;
}

LanguageSpec makeLua() {
    LanguageSpec spec;
    spec.language = Language::Lua;
    spec.family = ParserFamily::KeywordBlock;
    spec.lineComments = {"--"};
    spec.blockComments = {{"--[[", "]]"}};
    spec.quotes = "\"'";
    spec.imports.push_back({re(R"re(\brequire\s*\(?\s*['"]([^'"]+)['"])re")});
    spec.functions.push_back({re(R"re(^\s*(?:local\s+)?function\s+([A-Za-z_][\w.:]*)\s*\()re")});
    spec.functions.push_back({re(R"re(^\s*(?:local\s+)?([A-Za-z_][\w.]*)\s*=\s*function\s*\()re")});
    spec.blockOpen = re(R"re(\b(?:function|if|do|repeat)\b)re");
    spec.blockClose = re(R"re(\b(?:end|until)\b)re");
    return spec;
}

LanguageSpec makeShell() {
    LanguageSpec spec;
    spec.language = Language::Shell;
    spec.family = ParserFamily::KeywordBlock;
    spec.lineComments = {"#"};
    spec.quotes = "\"'";
    spec.imports.push_back({re(R"re(^\s*(?:source|\.)\s+['"]?([^\s'";]+))re"), true});
    spec.functions.push_back({re(R"re(^\s*(?:function\s+)?([A-Za-z_][\w:-]*)\s*\(\s*\))re"), std::nullopt, true});
    spec.functions.push_back({re(R"re(^\s*function\s+([A-Za-z_][\w:-]*)\s*(?:\{|$))re")});
    spec.reservedNames = {"if", "then", "else", "elif", "fi", "for", "while", "until", "do", "done", "case", "esac"};
    return spec;
}

const std::unordered_map<Language, LanguageSpec>& registry() {
    static const std::unordered_map<Language, LanguageSpec> specs = [] {
        std::unordered_map<Language, LanguageSpec> table;
        table.emplace(Language::C, makeCFamily(Language::C));
        table.emplace(Language::Cpp, makeCFamily(Language::Cpp));
        table.emplace(Language::Java, makeJava());
        table.emplace(Language::CSharp, makeCSharp());
        table.emplace(Language::Dart, makeDart());
        table.emplace(Language::Kotlin, makeKotlin());
        table.emplace(Language::Scala, makeScala());
        table.emplace(Language::Go, makeGo());
        table.emplace(Language::Rust, makeRust());
        table.emplace(Language::Swift, makeSwift());
        table.emplace(Language::JavaScript, makeScript(Language::JavaScript));
        table.emplace(Language::TypeScript, makeScript(Language::TypeScript));
        table.emplace(Language::Php, makePhp());
        table.emplace(Language::Python, makePython());
        table.emplace(Language::Ruby, makeRuby());
        table.emplace(Language::Lua, makeLua());
        table.emplace(Language::Shell, makeShell());
        return table;
    }();
    return specs;
}

} // namespace

const LanguageSpec* LanguageSpec::forLanguage(Language language) {
    const auto& specs = registry();
    auto it = specs.find(language);
    return it == specs.end() ? nullptr : &it->second;
}

// ---------------------------------------------------------------------------
// Scope strategies

std::unique_ptr<ScopeStrategy> ScopeStrategy::create(ParserFamily family) {
    switch (family) {
        case ParserFamily::IndentBlock:
            return std::make_unique<IndentScope>();
        case ParserFamily::KeywordBlock:
            return std::make_unique<KeywordScope>();
        case ParserFamily::BraceBlock:
        case ParserFamily::None:
        default:
            return std::make_unique<BraceScope>();
    }
}

size_t BraceScope::blockEnd(const std::vector<std::string>& code, size_t startLine,
                            const LanguageSpec& /*spec*/) const {
    static const std::regex continuationRegex =
        re(R"re(^\s*(?:\{|:|,|->|=>|extends\b|implements\b|where\b|with\b|throws\b))re");

    int parenDepth = 0;
    for (size_t i = startLine; i < code.size() && i < startLine + MAX_SCAN_LINES; ++i) {
        const std::string& line = code[i];

        // A following line only continues the header if it looks like one
        if (i > startLine && parenDepth == 0 && !isBlank(line) &&
            (line.size() > MAX_LINE_LENGTH || !std::regex_search(line, continuationRegex))) {
            return startLine;
        }

        for (size_t col = 0; col < line.size(); ++col) {
            const char ch = line[col];
            if (ch == '(') {
                ++parenDepth;
            } else if (ch == ')') {
                parenDepth = std::max(0, parenDepth - 1);
            } else if (ch == ';' && parenDepth == 0) {
                return startLine;   // declaration without a body
            } else if (ch == '{' && parenDepth == 0) {
                // Match braces from here
                int depth = 0;
                for (size_t j = i; j < code.size(); ++j) {
                    const std::string& body = code[j];
                    for (size_t k = (j == i ? col : 0); k < body.size(); ++k) {
                        if (body[k] == '{') {
                            ++depth;
                        } else if (body[k] == '}') {
                            if (--depth == 0) {
                                return j;
                            }
                        }
                    }
                }
                return code.empty() ? 0 : code.size() - 1;
            }
        }
    }
    return startLine;
}

size_t IndentScope::blockEnd(const std::vector<std::string>& code, size_t startLine,
                             const LanguageSpec& /*spec*/) const {
    const int startIndent = indentOf(code[startLine]);

    // The header may continue over several lines while brackets are open
    size_t headerEnd = startLine;
    int depth = 0;
    for (size_t i = startLine; i < code.size() && i < startLine + MAX_SCAN_LINES; ++i) {
        for (char ch : code[i]) {
            if (ch == '(' || ch == '[' || ch == '{') {
                ++depth;
            } else if (ch == ')' || ch == ']' || ch == '}') {
                --depth;
            }
        }
        headerEnd = i;
        if (depth <= 0) {
            break;
        }
    }

    size_t end = headerEnd;
    for (size_t i = headerEnd + 1; i < code.size(); ++i) {
        if (isBlank(code[i])) {
            continue;
        }
        if (indentOf(code[i]) <= startIndent) {
            break;
        }
        end = i;
    }
    return end;
}

size_t KeywordScope::blockEnd(const std::vector<std::string>& code, size_t startLine,
                              const LanguageSpec& spec) const {
    if (!spec.blockOpen || !spec.blockClose) {
        return startLine;
    }

    int depth = 0;
    for (size_t i = startLine; i < code.size(); ++i) {
        const std::string& line = code[i];
        if (line.size() > MAX_LINE_LENGTH) {
            continue;
        }
        const auto opens = std::distance(
            std::sregex_iterator(line.begin(), line.end(), *spec.blockOpen), std::sregex_iterator());
        const auto closes = std::distance(
            std::sregex_iterator(line.begin(), line.end(), *spec.blockClose), std::sregex_iterator());
        depth += static_cast<int>(opens) - static_cast<int>(closes);

        if (i == startLine && opens == 0) {
            return startLine;
        }
        if (depth <= 0) {
            return i;
        }
    }
    return code.empty() ? 0 : code.size() - 1;
}

// ---------------------------------------------------------------------------
// Shared recognizers

SourceLines StructuralParser::splitSource(const std::string& content, const LanguageSpec& spec) {
    enum class State { Code, Block, String };

    SourceLines lines;
    std::string text;
    std::string code;
    State state = State::Code;
    std::string blockEnd;
    char quote = '\0';
    const size_t n = content.size();

    for (size_t i = 0; i < n; ++i) {
        const char ch = content[i];

        if (ch == '\n') {
            lines.text.push_back(std::move(text));
            lines.code.push_back(std::move(code));
            text.clear();
            code.clear();
            // Strings never span lines here
            if (state == State::String) {
                state = State::Code;
            }
            continue;
        }
        if (ch == '\r') {
            continue;
        }

        if (state == State::Block) {
            if (content.compare(i, blockEnd.size(), blockEnd) == 0) {
                text.append(blockEnd.size(), ' ');
                code.append(blockEnd.size(), ' ');
                i += blockEnd.size() - 1;
                state = State::Code;
            } else {
                text += ' ';
                code += ' ';
            }
            continue;
        }

        if (state == State::String) {
            text += ch;
            if (ch == '\\' && i + 1 < n && content[i + 1] != '\n') {
                text += content[i + 1];
                code += "  ";
                ++i;
                continue;
            }
            if (ch == quote) {
                code += ch;
                state = State::Code;
            } else {
                code += ' ';
            }
            continue;
        }

        bool consumed = false;
        for (const auto& block : spec.blockComments) {
            const bool atLineStart = i == 0 || content[i - 1] == '\n';
            if (block.first[0] == '=' && !atLineStart) {
                continue;
            }
            if (content.compare(i, block.first.size(), block.first) == 0) {
                state = State::Block;
                blockEnd = block.second;
                text.append(block.first.size(), ' ');
                code.append(block.first.size(), ' ');
                i += block.first.size() - 1;
                consumed = true;
                break;
            }
        }
        if (consumed) {
            continue;
        }

        for (const auto& marker : spec.lineComments) {
            if (content.compare(i, marker.size(), marker) != 0) {
                continue;
            }
            // In shell, '#' only starts a comment at a word boundary ($#, ${#x})
            if (spec.language == Language::Shell && i > 0) {
                const char prev = content[i - 1];
                if (!std::isspace(static_cast<unsigned char>(prev)) && prev != ';') {
                    continue;
                }
            }
            while (i + 1 < n && content[i + 1] != '\n') {
                ++i;
            }
            consumed = true;
            break;
        }
        if (consumed) {
            continue;
        }

        if (spec.quotes.find(ch) != std::string::npos) {
            state = State::String;
            quote = ch;
        }
        text += ch;
        code += ch;
    }

    if (!content.empty() && content.back() != '\n') {
        lines.text.push_back(std::move(text));
        lines.code.push_back(std::move(code));
    }

    return lines;
}

std::vector<std::string> StructuralParser::parameterNames(const std::string& params, ParamStyle style) {
    static const std::regex annotationRegex = re(R"re(@[\w.]+(?:\([^)]*\))?)re");
    static const std::unordered_set<std::string> modifiers = {
        "mut", "ref", "const", "final", "var", "val", "let", "readonly", "public", "private",
        "protected", "internal", "in", "out", "inout", "params", "this", "override", "vararg",
        "noinline", "crossinline", "static", "volatile", "struct", "enum", "class", "register",
        "scoped", "required", "covariant", "dyn", "impl"
    };

    std::vector<std::string> names;
    if (trim(params).empty()) {
        return names;
    }

    for (auto param : splitTopLevel(params, ",")) {
        param = std::regex_replace(param, annotationRegex, " ");
        param = trim(stripDefault(param));
        if (param.empty()) {
            continue;
        }

        // Variadic and reference markers in front of the name
        while (!param.empty() && (param[0] == '*' || param[0] == '&' || param[0] == '.')) {
            param.erase(0, 1);
        }

        std::vector<std::string> idents;

        if (style == ParamStyle::TypeFirst) {
            std::string cleaned = stripBracketed(param, '[', ']');
            cleaned = stripBracketed(cleaned, '(', ')');
            for (const auto& ident : identifiers(cleaned)) {
                if (!modifiers.count(ident)) {
                    idents.push_back(ident);
                }
            }
            // A lone type ("void", "int") names nothing
            if (idents.size() < 2) {
                continue;
            }
            names.push_back(idents.back());
            continue;
        }

        // Name-first: everything before a lone ':' is the binding
        size_t colon = std::string::npos;
        int depth = 0;
        for (size_t i = 0; i < param.size(); ++i) {
            const char ch = param[i];
            if (ch == '(' || ch == '[' || ch == '{' || ch == '<') {
                ++depth;
            } else if (ch == ')' || ch == ']' || ch == '}' || ch == '>') {
                depth = std::max(0, depth - 1);
            } else if (ch == ':' && depth == 0) {
                const bool doubled = (i + 1 < param.size() && param[i + 1] == ':') ||
                                     (i > 0 && param[i - 1] == ':');
                if (!doubled) {
                    colon = i;
                    break;
                }
            }
        }
        const std::string binding = colon == std::string::npos ? param : param.substr(0, colon);

        for (const auto& ident : identifiers(binding)) {
            if (!modifiers.count(ident)) {
                idents.push_back(ident);
            }
        }
        if (idents.empty()) {
            continue;
        }

        auto dollar = std::find_if(idents.begin(), idents.end(),
            [](const std::string& ident) { return ident[0] == '$'; });
        if (dollar != idents.end()) {
            names.push_back(dollar->substr(1));
        } else if (colon != std::string::npos) {
            names.push_back(idents.back());
        } else {
            names.push_back(idents.front());
        }
    }

    return names;
}

std::vector<std::string> StructuralParser::extractImports(const SourceLines& lines, const LanguageSpec& spec) const {
    std::vector<std::string> tokens;
    std::unordered_set<std::string> seen;

    auto addToken = [&](std::string token, bool relative) {
        token = trim(token);
        while (token.size() > 1 && token.back() == ':') {
            token.pop_back();   // "std::io::{...}" leaves a trailing "::"
        }
        if (token.empty()) {
            return;
        }
        if (relative && token[0] != '.' && token[0] != '/') {
            token = "./" + token;
        }
        if (seen.insert(token).second) {
            tokens.push_back(std::move(token));
        }
    };

    auto applyPatterns = [&](const std::string& text) {
        for (const auto& pattern : spec.imports) {
            for (std::sregex_iterator it(text.begin(), text.end(), pattern.regex), end; it != end; ++it) {
                const std::smatch& match = *it;

                if (pattern.memberModules) {
                    // Each imported name is a module beside the importer; a bare or
                    // starred import refers to the package itself
                    const std::string dots = match[1].str();
                    bool added = false;
                    if (match.size() > 2 && match[2].matched) {
                        for (const auto& item : splitTopLevel(match[2].str(), ",")) {
                            const std::string cleaned = trim(item);
                            const std::string name = cleaned.substr(0, cleaned.find_first_of(" \t"));
                            if (!name.empty()) {
                                addToken(dots + name, false);
                                added = true;
                            }
                        }
                    }
                    if (!added) {
                        addToken(dots, false);
                    }
                    continue;
                }

                std::string token;
                for (size_t group = 1; group < match.size(); ++group) {
                    if (match[group].matched && match[group].length() > 0) {
                        token = match[group].str();
                        break;
                    }
                }
                if (token.empty()) {
                    continue;
                }

                if (pattern.commaList) {
                    for (const auto& item : splitTopLevel(token, ",")) {
                        const std::string cleaned = trim(stripBracketed(item, '(', ')'));
                        addToken(cleaned.substr(0, cleaned.find_first_of(" \t")), pattern.relativeToImporter);
                    }
                } else {
                    addToken(token, pattern.relativeToImporter);
                }
            }
        }
    };

    bool inBlock = false;
    for (size_t i = 0; i < lines.text.size(); ++i) {
        const std::string& line = lines.text[i];
        if (line.size() > MAX_LINE_LENGTH) {
            continue;
        }

        if (inBlock) {
            std::smatch match;
            if (spec.importBlockItem && std::regex_search(line, match, *spec.importBlockItem)) {
                addToken(match[1].str(), false);
            }
            if (lines.code[i].find(')') != std::string::npos) {
                inBlock = false;
            }
            continue;
        }

        if (spec.importBlockStart && std::regex_search(line, *spec.importBlockStart)) {
            inBlock = true;
            continue;
        }

        if (spec.importContinuation && std::regex_search(lines.code[i], *spec.importContinuation)) {
            // import { a,
            //          b } from "x"
            std::string joined = line;
            size_t last = i;
            while (last + 1 < lines.text.size() && last < i + MAX_SCAN_LINES &&
                   lines.code[last].find('}') == std::string::npos) {
                ++last;
                joined += ' ';
                joined += lines.text[last];
            }
            if (joined.size() <= MAX_LINE_LENGTH) {
                applyPatterns(joined);
            }
            i = last;
            continue;
        }

        applyPatterns(line);
    }

    return tokens;
}

std::vector<FunctionEntry> StructuralParser::extractFunctions(const SourceLines& lines, const LanguageSpec& spec,
                                                              const std::string& filePath) const {
    std::vector<FunctionEntry> functions;
    const auto& code = lines.code;

    for (size_t i = 0; i < code.size(); ++i) {
        const std::string& line = code[i];
        if (line.size() > MAX_LINE_LENGTH || isBlank(line)) {
            continue;
        }

        for (const auto& pattern : spec.functions) {
            std::smatch match;
            if (!std::regex_search(line, match, pattern.regex)) {
                continue;
            }

            const std::string name = match[1].str();
            const std::string bareName = name.substr(name.rfind(':') == std::string::npos ? 0 : name.rfind(':') + 1);
            if (name.empty()) {
                continue;
            }
            // Keyword-led headers (fn, def, func) may use any name; the rest must not look like statements
            if (pattern.checkLeadingWord &&
                (spec.reservedNames.count(name) || spec.reservedNames.count(bareName) ||
                 spec.reservedNames.count(firstWord(line)))) {
                continue;
            }

            std::string params;
            const std::string matched = match[0].str();

            if (!matched.empty() && matched.back() == '(') {
                // Balanced scan for the closing parenthesis, possibly on a later line
                size_t row = i;
                size_t col = static_cast<size_t>(match.position(0) + match.length(0));
                int depth = 1;
                bool closed = false;

                while (row < code.size() && row < i + MAX_SCAN_LINES && !closed) {
                    const std::string& current = code[row];
                    for (; col < current.size(); ++col) {
                        const char ch = current[col];
                        if (ch == '(') {
                            ++depth;
                        } else if (ch == ')') {
                            if (--depth == 0) {
                                closed = true;
                                break;
                            }
                        }
                        params += ch;
                    }
                    if (!closed) {
                        params += ' ';
                        ++row;
                        col = 0;
                    }
                }

                if (!closed || params.size() > MAX_LINE_LENGTH) {
                    continue;   // unbalanced or oversized header, skip it
                }

                if (pattern.trailer) {
                    const std::string rest = lookahead(code, row, col + 1, TRAILER_LOOKAHEAD_LINES);
                    if (!std::regex_search(rest, *pattern.trailer)) {
                        continue;
                    }
                }
            } else if (match.size() > 2 && match[2].matched) {
                params = match[2].str();
            }

            FunctionEntry entry;
            entry.name = name;
            entry.file = filePath;
            entry.line = i + 1;
            entry.params = parameterNames(params, spec.paramStyle);
            functions.push_back(std::move(entry));
            break;
        }
    }

    return functions;
}

std::vector<ClassEntry> StructuralParser::extractClasses(const SourceLines& lines, const LanguageSpec& spec,
                                                         const std::string& filePath) const {
    std::vector<ClassEntry> classes;
    const auto& code = lines.code;

    for (size_t i = 0; i < code.size(); ++i) {
        const std::string& line = code[i];
        if (line.size() > MAX_LINE_LENGTH || isBlank(line)) {
            continue;
        }

        for (const auto& pattern : spec.types) {
            std::smatch match;
            if (!std::regex_search(line, match, pattern.regex)) {
                continue;
            }

            if (pattern.requiresBody) {
                const std::string rest = lookahead(code, i, static_cast<size_t>(match.position(0) + match.length(0)),
                                                   TRAILER_LOOKAHEAD_LINES);
                const auto next = rest.find_first_not_of(" \t");
                if (next == std::string::npos || rest[next] != '{') {
                    continue;   // forward declaration or variable
                }
            }

            ClassEntry entry;
            entry.name = match[1].str();
            entry.file = filePath;
            entry.line = i + 1;
            for (int group : pattern.baseGroups) {
                if (group < static_cast<int>(match.size()) && match[group].matched) {
                    for (auto& base : cleanBases(match[group].str())) {
                        entry.bases.push_back(std::move(base));
                    }
                }
            }
            classes.push_back(std::move(entry));
            break;
        }
    }

    return classes;
}

void StructuralParser::countMethods(const SourceLines& lines, const LanguageSpec& spec,
                                    const std::vector<FunctionEntry>& functions,
                                    std::vector<ClassEntry>& classes) const {
    if (classes.empty() || functions.empty()) {
        return;
    }

    const auto scope = ScopeStrategy::create(spec.family);
    const auto& code = lines.code;

    std::vector<Extent> classExtents;
    for (const auto& cls : classes) {
        const size_t start = cls.line - 1;
        classExtents.push_back({start, scope->blockEnd(code, start, spec)});
    }

    std::vector<Extent> functionExtents;
    for (const auto& function : functions) {
        const size_t start = function.line - 1;
        functionExtents.push_back({start, scope->blockEnd(code, start, spec)});
    }

    auto classIndexByName = [&](const std::string& name) -> int {
        for (size_t c = 0; c < classes.size(); ++c) {
            if (classes[c].name == name) {
                return static_cast<int>(c);
            }
        }
        return -1;
    };

    // A function nested in another function is not a method of the outer type
    auto nestedInFunction = [&](size_t f, size_t after) {
        const size_t line = functionExtents[f].start;
        for (size_t g = 0; g < functions.size(); ++g) {
            if (g != f && functionExtents[g].start > after && functionExtents[g].contains(line)) {
                return true;
            }
        }
        return false;
    };

    // Impl/extension blocks attach their functions to a named type
    std::vector<std::pair<Extent, int>> implBlocks;
    if (spec.implBlock) {
        for (size_t i = 0; i < code.size(); ++i) {
            std::smatch match;
            if (code[i].size() <= MAX_LINE_LENGTH && std::regex_search(code[i], match, *spec.implBlock)) {
                const int owner = classIndexByName(match[1].str());
                if (owner >= 0) {
                    implBlocks.push_back({{i, scope->blockEnd(code, i, spec)}, owner});
                }
            }
        }
    }

    for (size_t f = 0; f < functions.size(); ++f) {
        const size_t line = functionExtents[f].start;

        // Innermost enclosing type declaration
        int owner = -1;
        for (size_t c = 0; c < classes.size(); ++c) {
            if (classExtents[c].contains(line) &&
                (owner < 0 || classExtents[c].start > classExtents[static_cast<size_t>(owner)].start)) {
                owner = static_cast<int>(c);
            }
        }
        if (owner >= 0) {
            if (!nestedInFunction(f, classExtents[static_cast<size_t>(owner)].start)) {
                ++classes[static_cast<size_t>(owner)].methodCount;
            }
            continue;
        }

        bool attached = false;
        for (const auto& block : implBlocks) {
            if (block.first.contains(line) && !nestedInFunction(f, block.first.start)) {
                ++classes[static_cast<size_t>(block.second)].methodCount;
                attached = true;
                break;
            }
        }
        if (attached || !spec.receiver) {
            continue;
        }

        // Receiver syntax outside the type body: Go "func (s *T) m()", C++ "T::m"
        std::smatch match;
        const bool onName = spec.language == Language::C || spec.language == Language::Cpp;
        const std::string& subject = onName ? functions[f].name : code[line];
        if (std::regex_search(subject, match, *spec.receiver)) {
            const int receiverOwner = classIndexByName(match[1].str());
            if (receiverOwner >= 0) {
                ++classes[static_cast<size_t>(receiverOwner)].methodCount;
            }
        }
    }
}

ParseResult StructuralParser::parse(const std::string& content, Language language,
                                    const std::string& filePath) const {
    const LanguageSpec* spec = LanguageSpec::forLanguage(language);
    if (spec == nullptr) {
        return {};
    }

    if (content.find('\0') != std::string::npos) {
        throw ParseError("Binary content in " + (filePath.empty() ? std::string("<memory>") : filePath));
    }

    ++invocations_;

    const SourceLines lines = splitSource(content, *spec);

    ParseResult result;
    result.imports = extractImports(lines, *spec);
    result.functions = extractFunctions(lines, *spec, filePath);
    result.classes = extractClasses(lines, *spec, filePath);
    countMethods(lines, *spec, result.functions, result.classes);
    return result;
}
