#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace flowcore {
namespace workflow {

/**
 * Arena-plus-index view of a workflow's dependency graph.
 *
 * Nodes are step names stored once in insertion order and addressed by
 * index; edges are kept as adjacency lists of indices in both directions.
 * An edge `from -> to` means `to` cannot start before `from` completed.
 *
 * The graph itself accepts cycles; `topological_order()` and
 * `find_cycle()` report them.
 */
class StepGraph {
public:
    using NodeIndex = std::size_t;

    // Throws ValidationError (duplicate_step) when the name is already present
    NodeIndex add_node(const std::string& name);

    // Throws ValidationError (unknown_step) when either end is not a node.
    // Repeated edges are ignored.
    void add_edge(const std::string& from, const std::string& to);

    std::optional<NodeIndex> index_of(const std::string& name) const;
    const std::string& name_of(NodeIndex index) const { return names_.at(index); }
    std::size_t size() const { return names_.size(); }

    const std::vector<NodeIndex>& prerequisites(NodeIndex index) const { return incoming_.at(index); }
    const std::vector<NodeIndex>& dependents(NodeIndex index) const { return outgoing_.at(index); }

    /**
     * Kahn's algorithm. The zero in-degree queue is seeded in insertion
     * order, so the result is deterministic. Returns nullopt when the graph
     * has a cycle; never a partial order.
     */
    std::optional<std::vector<NodeIndex>> topological_order() const;

    /**
     * Depth-first search with a current-path set. Returns the name of the
     * node that closes the first cycle found, or nullopt when acyclic.
     */
    std::optional<std::string> find_cycle() const;

private:
    bool visit(NodeIndex node,
               std::vector<char>& visited,
               std::vector<char>& on_path,
               NodeIndex& cycle_node) const;

    std::vector<std::string> names_;
    std::unordered_map<std::string, NodeIndex> index_;
    std::vector<std::vector<NodeIndex>> outgoing_;
    std::vector<std::vector<NodeIndex>> incoming_;
};

} // namespace workflow
} // namespace flowcore
