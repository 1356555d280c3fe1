#include "file_record.hpp"
#include <algorithm>
#include <stdexcept>

using json = nlohmann::json;

std::string confidenceName(Confidence confidence) {
    switch (confidence) {
        case Confidence::Exact:
            return "exact";
        case Confidence::Heuristic:
            return "heuristic";
        case Confidence::Unresolved:
        default:
            return "unresolved";
    }
}

Confidence confidenceFromName(const std::string& name) {
    if (name == "exact") {
        return Confidence::Exact;
    }
    if (name == "heuristic") {
        return Confidence::Heuristic;
    }
    if (name == "unresolved") {
        return Confidence::Unresolved;
    }
    throw std::invalid_argument("Unknown confidence: " + name);
}

std::string entryReasonName(EntryReason reason) {
    switch (reason) {
        case EntryReason::GraphShape:
            return "graph_shape";
        case EntryReason::NamePattern:
        default:
            return "name_pattern";
    }
}

size_t countLines(const std::string& content) {
    size_t count = std::count(content.begin(), content.end(), '\n');

    // If the last line doesn't end with a newline, count it too
    if (!content.empty() && content.back() != '\n') {
        ++count;
    }

    return count;
}

json toJson(const FunctionEntry& entry) {
    return {
        {"name", entry.name},
        {"line", entry.line},
        {"params", entry.params}
    };
}

json toJson(const ClassEntry& entry) {
    return {
        {"name", entry.name},
        {"line", entry.line},
        {"bases", entry.bases},
        {"methods", entry.methodCount}
    };
}

json toJson(const ParseResult& result) {
    json functions = json::array();
    for (const auto& function : result.functions) {
        functions.push_back(toJson(function));
    }

    json classes = json::array();
    for (const auto& cls : result.classes) {
        classes.push_back(toJson(cls));
    }

    return {
        {"imports", result.imports},
        {"functions", functions},
        {"classes", classes}
    };
}

ParseResult parseResultFromJson(const json& j, const std::string& file) {
    ParseResult result;
    result.imports = j.at("imports").get<std::vector<std::string>>();

    for (const auto& item : j.at("functions")) {
        FunctionEntry entry;
        entry.name = item.at("name").get<std::string>();
        entry.file = file;
        entry.line = item.at("line").get<size_t>();
        entry.params = item.at("params").get<std::vector<std::string>>();
        result.functions.push_back(std::move(entry));
    }

    for (const auto& item : j.at("classes")) {
        ClassEntry entry;
        entry.name = item.at("name").get<std::string>();
        entry.file = file;
        entry.line = item.at("line").get<size_t>();
        entry.bases = item.at("bases").get<std::vector<std::string>>();
        entry.methodCount = item.at("methods").get<size_t>();
        result.classes.push_back(std::move(entry));
    }

    return result;
}

void applyParseResult(FileRecord& record, ParseResult result) {
    record.imports = std::move(result.imports);
    record.functions = std::move(result.functions);
    record.classes = std::move(result.classes);

    for (auto& function : record.functions) {
        function.file = record.path;
    }
    for (auto& cls : record.classes) {
        cls.file = record.path;
    }
}
