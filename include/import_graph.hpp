#pragma once

#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include "file_record.hpp"

/**
 * @brief Directed file-level import graph
 *
 * Arena storage: files and edges are flat vectors addressed by index, so import
 * cycles are plain data. Degrees are derived from the edge set when queried and
 * never stored separately. Only resolved edges connect nodes; unresolved edges
 * stay listed under their source.
 */
class ImportGraph {
public:
    ImportGraph() = default;

    // Throws std::invalid_argument if an edge names a file outside the set
    ImportGraph(std::vector<std::string> paths, std::vector<ImportEdge> edges);

    static ImportGraph build(const std::vector<FileRecord>& records, const std::vector<ImportEdge>& edges);

    const std::vector<std::string>& nodes() const { return nodes_; }
    const std::vector<ImportEdge>& edges() const { return edges_; }
    size_t nodeCount() const { return nodes_.size(); }

    bool contains(const std::string& path) const { return index_.count(path) > 0; }
    std::optional<size_t> indexOf(const std::string& path) const;

    // Number of resolved edges pointing at / leaving the file
    size_t inDegree(const std::string& path) const;
    size_t outDegree(const std::string& path) const;

    // Distinct resolved neighbours in lexical order
    std::vector<std::string> successors(const std::string& path) const;
    std::vector<std::string> predecessors(const std::string& path) const;

    // All edges from the file in import order, unresolved ones included
    std::vector<ImportEdge> edgesFrom(const std::string& path) const;

    // Components ignoring edge direction; members sorted, components ordered
    // by their first member
    std::vector<std::vector<std::string>> weaklyConnectedComponents() const;

private:
    std::vector<std::string> nodes_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<ImportEdge> edges_;
    std::vector<std::vector<size_t>> outgoing_;   // Edge indices by source node
    std::vector<std::vector<size_t>> incoming_;   // Resolved edge indices by target node
};
