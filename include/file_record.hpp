#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "language.hpp"

// A function or method header recognized by the structural parser
struct FunctionEntry {
    std::string name;
    std::string file;                  // Declaring file (repo-relative)
    size_t line = 0;                   // 1-based, file-relative
    std::vector<std::string> params;   // Best effort; empty if unparseable
};

// A class, struct, interface, trait or similar type declaration
struct ClassEntry {
    std::string name;
    std::string file;                  // Declaring file (repo-relative)
    size_t line = 0;                   // 1-based, file-relative
    std::vector<std::string> bases;    // Parent types as written, may be empty
    size_t methodCount = 0;            // Functions declared directly inside the type
};

// Everything the structural parser derives from a file's bytes.
// This is the only part of a FileRecord that may be cached.
struct ParseResult {
    std::vector<std::string> imports;  // Raw tokens, first-occurrence order
    std::vector<FunctionEntry> functions;
    std::vector<ClassEntry> classes;
};

struct FileRecord {
    std::string path;                  // Unique key, repo-relative with '/' separators
    Language language = Language::Unknown;
    uint64_t size = 0;                 // Bytes
    size_t lineCount = 0;
    std::string fingerprint;           // Content hash of the bytes
    std::vector<std::string> imports;
    std::vector<FunctionEntry> functions;
    std::vector<ClassEntry> classes;
    bool parseFailed = false;          // Degraded to an empty structural record
};

enum class Confidence {
    Exact,
    Heuristic,
    Unresolved
};

struct ImportEdge {
    std::string source;                // Importing file
    std::string token;                 // Raw import token as written
    std::optional<std::string> target; // Resolved file, absent when unresolved
    Confidence confidence = Confidence::Unresolved;

    bool resolved() const { return target.has_value(); }
};

enum class EntryReason {
    NamePattern,   // File name matches a conventional entry-point stem
    GraphShape     // Imported by nothing, imports something
};

struct EntryPointCandidate {
    std::string path;
    EntryReason reason = EntryReason::NamePattern;
    std::string justification;
    double confidence = 0.0;
};

struct NavigationPath {
    std::vector<std::string> files;
    std::string label;
};

// Names used in serialized output
std::string confidenceName(Confidence confidence);
Confidence confidenceFromName(const std::string& name);
std::string entryReasonName(EntryReason reason);

// Count lines the same way the file processor always has: a trailing
// fragment without a newline still counts as a line.
size_t countLines(const std::string& content);

// JSON conversion. The from* functions throw nlohmann::json::exception on
// malformed input.
nlohmann::json toJson(const FunctionEntry& entry);
nlohmann::json toJson(const ClassEntry& entry);
nlohmann::json toJson(const ParseResult& result);
ParseResult parseResultFromJson(const nlohmann::json& j, const std::string& file);

// Attach a parse result to a record, rebinding declaring-file fields to the
// record's path (cached results may come from a renamed file).
void applyParseResult(FileRecord& record, ParseResult result);
