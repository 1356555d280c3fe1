#pragma once

#include <string>
#include <vector>
#include <optional>
#include "file_record.hpp"
#include "import_graph.hpp"

struct NavigationOptions {
    size_t maxEntryPaths = 5;       // Entry points followed, most connected first
    size_t hopLimit = 3;            // BFS depth from an entry point
    size_t maxClusters = 5;
    size_t maxClusterMembers = 10;
    size_t minClusterSize = 2;
};

// Labels carried by synthesized paths
extern const char* const ENTRY_PATH_LABEL;
extern const char* const ISOLATED_COMPONENT_LABEL;

/**
 * @brief Derives short reading paths through the import graph
 *
 * For each selected entry point, a bounded breadth-first walk along imports
 * finds the most-imported file within reach and records the route to it.
 * Components with no entry point are listed as isolated clusters. Every tie is
 * broken by lexical path order.
 */
class NavigationSynthesizer {
public:
    explicit NavigationSynthesizer(NavigationOptions options = {});

    std::vector<NavigationPath> synthesize(const ImportGraph& graph,
                                           const std::vector<EntryPointCandidate>& entryPoints) const;

    // Route from entry to the most-referenced file within the hop limit
    std::optional<NavigationPath> entryPath(const ImportGraph& graph, const std::string& entry) const;

    std::vector<NavigationPath> isolatedClusters(const ImportGraph& graph,
                                                 const std::vector<EntryPointCandidate>& entryPoints) const;

    const NavigationOptions& options() const { return options_; }

private:
    NavigationOptions options_;
};
