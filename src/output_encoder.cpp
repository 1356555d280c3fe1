#include "output_encoder.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

double roundConfidence(double value) {
    return std::round(value * 100.0) / 100.0;
}

std::string joinStrings(const std::vector<std::string>& items, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += items[i];
    }
    return result;
}

// Files ordered by total degree (descending), then path
std::vector<const FileRecord*> rankByConnectivity(const NavigationIndex& index) {
    std::vector<const FileRecord*> ranked;
    for (const auto& record : index.files()) {
        ranked.push_back(&record);
    }

    const ImportGraph& graph = index.graph();
    std::stable_sort(ranked.begin(), ranked.end(),
        [&](const FileRecord* a, const FileRecord* b) {
            const size_t degreeA = graph.inDegree(a->path) + graph.outDegree(a->path);
            const size_t degreeB = graph.inDegree(b->path) + graph.outDegree(b->path);
            if (degreeA != degreeB) {
                return degreeA > degreeB;
            }
            return a->path < b->path;
        });
    return ranked;
}

std::string reasonsFor(const NavigationIndex& index, const std::string& path) {
    std::vector<std::string> reasons;
    for (const auto& candidate : index.entryPoints()) {
        if (candidate.path == path) {
            reasons.push_back(entryReasonName(candidate.reason));
        }
    }
    return joinStrings(reasons, ",");
}

} // namespace

std::string formatName(OutputFormat format) {
    switch (format) {
        case OutputFormat::Markdown:
            return "markdown";
        case OutputFormat::Compact:
            return "compact";
        case OutputFormat::Json:
        default:
            return "json";
    }
}

OutputFormat formatFromName(const std::string& name) {
    if (name == "json") {
        return OutputFormat::Json;
    }
    if (name == "markdown" || name == "md") {
        return OutputFormat::Markdown;
    }
    if (name == "compact") {
        return OutputFormat::Compact;
    }
    throw std::invalid_argument("Unknown output format: " + name);
}

std::string extractSnippet(const std::string& content, size_t line, size_t contextLines) {
    if (line == 0) {
        return "";
    }

    const size_t first = line > contextLines ? line - contextLines : 1;
    const size_t last = line + contextLines;

    std::string snippet;
    size_t current = 1;
    size_t start = 0;

    while (start < content.size() && current <= last) {
        size_t end = content.find('\n', start);
        if (end == std::string::npos) {
            end = content.size();
        }
        if (current >= first) {
            snippet.append(content, start, end - start);
            snippet += '\n';
        }
        if (end == content.size()) {
            break;
        }
        start = end + 1;
        ++current;
    }

    // Declaration line beyond the end of the file
    if (current < line) {
        return "";
    }
    return snippet;
}

json toJson(const NavigationIndex& index) {
    const ImportGraph& graph = index.graph();

    json files = json::array();
    for (const auto& record : index.files()) {
        json file = toJson(ParseResult{record.imports, record.functions, record.classes});
        file["path"] = record.path;
        file["language"] = LanguageClassifier::languageName(record.language);
        file["size"] = record.size;
        file["lines"] = record.lineCount;
        file["fingerprint"] = record.fingerprint;
        file["parse_failed"] = record.parseFailed;
        file["in_degree"] = graph.inDegree(record.path);
        file["out_degree"] = graph.outDegree(record.path);
        files.push_back(file);
    }

    json edges = json::array();
    for (const auto& edge : index.edges()) {
        edges.push_back({
            {"source", edge.source},
            {"token", edge.token},
            {"target", edge.target ? json(*edge.target) : json(nullptr)},
            {"confidence", confidenceName(edge.confidence)}
        });
    }

    json entryPoints = json::array();
    for (const auto& candidate : index.entryPoints()) {
        entryPoints.push_back({
            {"path", candidate.path},
            {"reason", entryReasonName(candidate.reason)},
            {"justification", candidate.justification},
            {"confidence", roundConfidence(candidate.confidence)}
        });
    }

    json paths = json::array();
    for (const auto& path : index.navigationPaths()) {
        paths.push_back({
            {"label", path.label},
            {"files", path.files}
        });
    }

    const IndexDiagnostics& diagnostics = index.diagnostics();

    return {
        {"summary", {
            {"files", index.files().size()},
            {"lines", index.totalLines()},
            {"bytes", index.totalBytes()},
            {"functions", index.functionCount()},
            {"classes", index.classCount()},
            {"edges", index.edges().size()}
        }},
        {"files", files},
        {"edges", edges},
        {"entry_points", entryPoints},
        {"navigation_paths", paths},
        // Cache counters vary between runs and are left out
        {"diagnostics", {
            {"unparsed_files", diagnostics.unparsedFiles},
            {"unresolved_imports", diagnostics.unresolvedImports},
            {"skipped_files", diagnostics.skippedFiles},
            {"cancelled", diagnostics.cancelled},
            {"warnings", diagnostics.warnings}
        }}
    };
}

std::unique_ptr<OutputEncoder> OutputEncoder::create(OutputFormat format) {
    switch (format) {
        case OutputFormat::Markdown:
            return std::make_unique<MarkdownEncoder>();
        case OutputFormat::Compact:
            return std::make_unique<CompactEncoder>();
        case OutputFormat::Json:
        default:
            return std::make_unique<JsonEncoder>();
    }
}

void OutputEncoder::setSnippets(SnippetOptions options, SourceLookup lookup) {
    snippetOptions_ = options;
    lookup_ = std::move(lookup);
}

std::optional<std::string> OutputEncoder::snippetFor(const std::string& path, size_t line) const {
    if (!snippetOptions_.enabled || !lookup_) {
        return std::nullopt;
    }
    const std::string* content = lookup_(path);
    if (content == nullptr) {
        return std::nullopt;
    }
    std::string snippet = extractSnippet(*content, line, snippetOptions_.contextLines);
    if (snippet.empty()) {
        return std::nullopt;
    }
    return snippet;
}

// ---------------------------------------------------------------------------

std::string JsonEncoder::encode(const NavigationIndex& index) const {
    json document = toJson(index);

    if (snippetOptions_.enabled) {
        auto& files = document["files"];
        for (size_t i = 0; i < index.files().size(); ++i) {
            const FileRecord& record = index.files()[i];
            for (size_t f = 0; f < record.functions.size(); ++f) {
                if (auto snippet = snippetFor(record.path, record.functions[f].line)) {
                    files[i]["functions"][f]["snippet"] = *snippet;
                }
            }
            for (size_t c = 0; c < record.classes.size(); ++c) {
                if (auto snippet = snippetFor(record.path, record.classes[c].line)) {
                    files[i]["classes"][c]["snippet"] = *snippet;
                }
            }
        }
    }

    // Invalid UTF-8 in paths or import tokens becomes U+FFFD
    return document.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

// ---------------------------------------------------------------------------

std::string MarkdownEncoder::encode(const NavigationIndex& index) const {
    const ImportGraph& graph = index.graph();
    std::stringstream output;

    output << "# Codebase Navigation Index\n\n";
    output << "| Files | Lines | Size | Functions | Classes | Imports | Unresolved |\n";
    output << "|-------|-------|------|-----------|---------|---------|------------|\n";
    output << "| " << index.files().size() << " | " << index.totalLines() << " | "
           << (index.totalBytes() / 1024) << " KB | " << index.functionCount() << " | "
           << index.classCount() << " | " << index.edges().size() << " | "
           << index.diagnostics().unresolvedImports << " |\n\n";

    // Key files
    output << "## Key Files\n\n";
    const auto ranked = rankByConnectivity(index);
    const size_t keyCount = std::min(KEY_FILE_COUNT, ranked.size());
    if (keyCount == 0) {
        output << "_No files indexed._\n\n";
    } else {
        output << "| File | Language | Lines | Imported by | Imports |\n";
        output << "|------|----------|-------|-------------|---------|\n";
        for (size_t i = 0; i < keyCount; ++i) {
            const FileRecord* record = ranked[i];
            output << "| `" << record->path << "` | " << LanguageClassifier::languageName(record->language)
                   << " | " << record->lineCount << " | " << graph.inDegree(record->path)
                   << " | " << graph.outDegree(record->path) << " |\n";
        }
        output << "\n";
    }

    // Entry points
    output << "## Entry Points\n\n";
    if (index.entryPoints().empty()) {
        output << "_No entry points detected._\n\n";
    } else {
        for (const auto& candidate : index.entryPoints()) {
            output << "- `" << candidate.path << "` (" << entryReasonName(candidate.reason) << ", "
                   << std::fixed << std::setprecision(2) << candidate.confidence << "): "
                   << candidate.justification << "\n";
        }
        output << "\n";
    }

    // Navigation paths
    output << "## Navigation Paths\n\n";
    if (index.navigationPaths().empty()) {
        output << "_No navigation paths._\n\n";
    } else {
        for (const auto& path : index.navigationPaths()) {
            output << "- **" << path.label << "**: ";
            for (size_t i = 0; i < path.files.size(); ++i) {
                output << (i > 0 ? " -> " : "") << "`" << path.files[i] << "`";
            }
            output << "\n";
        }
        output << "\n";
    }

    // Function index, grouped by file
    output << "## Function Index\n\n";
    for (const auto& record : index.files()) {
        if (record.functions.empty()) {
            continue;
        }
        output << "### " << record.path << "\n\n";
        for (const auto& function : record.functions) {
            output << "- `" << function.name << "(" << joinStrings(function.params, ", ") << ")` line "
                   << function.line << "\n";
            if (auto snippet = snippetFor(record.path, function.line)) {
                output << "\n```" << LanguageClassifier::languageName(record.language) << "\n"
                       << *snippet << "```\n\n";
            }
        }
        output << "\n";
    }

    // Class index, grouped by file
    output << "## Class Index\n\n";
    for (const auto& record : index.files()) {
        if (record.classes.empty()) {
            continue;
        }
        output << "### " << record.path << "\n\n";
        for (const auto& cls : record.classes) {
            output << "- `" << cls.name << "`";
            if (!cls.bases.empty()) {
                output << " : " << joinStrings(cls.bases, ", ");
            }
            output << " line " << cls.line << ", " << cls.methodCount
                   << (cls.methodCount == 1 ? " method" : " methods") << "\n";
            if (auto snippet = snippetFor(record.path, cls.line)) {
                output << "\n```" << LanguageClassifier::languageName(record.language) << "\n"
                       << *snippet << "```\n\n";
            }
        }
        output << "\n";
    }

    // Unresolved imports, grouped by token
    const auto unresolved = index.unresolvedEdges();
    if (!unresolved.empty()) {
        std::map<std::string, std::vector<std::string>> byToken;
        for (const auto& edge : unresolved) {
            byToken[edge.token].push_back(edge.source);
        }

        output << "## Unresolved Imports\n\n";
        for (const auto& item : byToken) {
            output << "- `" << item.first << "` from " << item.second.size()
                   << (item.second.size() == 1 ? " file" : " files") << "\n";
        }
        output << "\n";
    }

    const IndexDiagnostics& diagnostics = index.diagnostics();
    if (diagnostics.unparsedFiles > 0 || diagnostics.cancelled) {
        output << "## Diagnostics\n\n";
        output << "- Unparsed files: " << diagnostics.unparsedFiles << "\n";
        if (diagnostics.cancelled) {
            output << "- Indexing was cancelled; " << diagnostics.skippedFiles << " files were skipped\n";
        }
        output << "\n";
    }

    return output.str();
}

// ---------------------------------------------------------------------------

std::string CompactEncoder::encode(const NavigationIndex& index) const {
    const ImportGraph& graph = index.graph();
    std::stringstream output;

    output << "INDEX files=" << index.files().size()
           << " lines=" << index.totalLines()
           << " fn=" << index.functionCount()
           << " cls=" << index.classCount()
           << " edges=" << index.edges().size()
           << " unresolved=" << index.diagnostics().unresolvedImports << "\n";

    std::vector<std::string> seen;
    for (const auto& candidate : index.entryPoints()) {
        if (std::find(seen.begin(), seen.end(), candidate.path) != seen.end()) {
            continue;
        }
        seen.push_back(candidate.path);
        output << "E " << candidate.path << " [" << reasonsFor(index, candidate.path) << "]\n";
    }

    for (const auto& path : index.navigationPaths()) {
        output << "P " << path.label << ": " << joinStrings(path.files, ">") << "\n";
    }

    for (const auto& record : index.files()) {
        output << "F " << record.path << " " << LanguageClassifier::languageName(record.language)
               << " " << record.lineCount << "L in" << graph.inDegree(record.path)
               << " out" << graph.outDegree(record.path);
        if (record.parseFailed) {
            output << " !parse";
        }
        output << "\n";

        std::vector<std::string> targets;
        for (const auto& edge : graph.edgesFrom(record.path)) {
            targets.push_back(edge.target ? *edge.target : "?" + edge.token);
        }
        if (!targets.empty()) {
            output << " i " << joinStrings(targets, ",") << "\n";
        }

        if (!record.functions.empty()) {
            std::vector<std::string> functions;
            for (const auto& function : record.functions) {
                functions.push_back(function.name + "(" + joinStrings(function.params, ",") + "):" +
                                    std::to_string(function.line));
            }
            output << " f " << joinStrings(functions, " ") << "\n";
        }

        if (!record.classes.empty()) {
            std::vector<std::string> classes;
            for (const auto& cls : record.classes) {
                std::string entry = cls.name;
                if (!cls.bases.empty()) {
                    entry += "<" + joinStrings(cls.bases, ",") + ">";
                }
                entry += ":" + std::to_string(cls.line) + "#" + std::to_string(cls.methodCount);
                classes.push_back(entry);
            }
            output << " c " << joinStrings(classes, " ") << "\n";
        }
    }

    return output.str();
}
