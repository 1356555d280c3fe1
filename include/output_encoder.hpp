#pragma once

#include <string>
#include <memory>
#include <functional>
#include <optional>
#include <nlohmann/json.hpp>
#include "navigation_index.hpp"

enum class OutputFormat {
    Json,       // Full per-entity detail
    Markdown,   // Grouped, human-scannable sections
    Compact     // Single token-lean block
};

std::string formatName(OutputFormat format);
OutputFormat formatFromName(const std::string& name);   // Throws std::invalid_argument

// Supplies the bytes of an indexed file for snippets; nullptr when unavailable
using SourceLookup = std::function<const std::string*(const std::string& path)>;

struct SnippetOptions {
    bool enabled = false;
    size_t contextLines = 2;    // Lines shown on each side of the declaration
};

// Declaration line +/- context, 1-based line numbers. Empty when out of range.
std::string extractSnippet(const std::string& content, size_t line, size_t contextLines);

// Full structured form of an index; keys are sorted so output is stable
nlohmann::json toJson(const NavigationIndex& index);

/**
 * @brief Renders a NavigationIndex
 *
 * Encoders only read the index; degrees and entry points come from it rather
 * than being derived again.
 */
class OutputEncoder {
public:
    virtual ~OutputEncoder() = default;

    virtual std::string encode(const NavigationIndex& index) const = 0;
    virtual OutputFormat format() const = 0;
    virtual std::string fileExtension() const = 0;

    void setSnippets(SnippetOptions options, SourceLookup lookup);

    static std::unique_ptr<OutputEncoder> create(OutputFormat format);

protected:
    SnippetOptions snippetOptions_;
    SourceLookup lookup_;

    std::optional<std::string> snippetFor(const std::string& path, size_t line) const;
};

class JsonEncoder : public OutputEncoder {
public:
    std::string encode(const NavigationIndex& index) const override;
    OutputFormat format() const override { return OutputFormat::Json; }
    std::string fileExtension() const override { return ".json"; }
};

class MarkdownEncoder : public OutputEncoder {
public:
    std::string encode(const NavigationIndex& index) const override;
    OutputFormat format() const override { return OutputFormat::Markdown; }
    std::string fileExtension() const override { return ".md"; }

    // Files shown under "Key Files"
    static constexpr size_t KEY_FILE_COUNT = 10;
};

class CompactEncoder : public OutputEncoder {
public:
    std::string encode(const NavigationIndex& index) const override;
    OutputFormat format() const override { return OutputFormat::Compact; }
    std::string fileExtension() const override { return ".txt"; }
};
