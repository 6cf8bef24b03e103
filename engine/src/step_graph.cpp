#include "flowcore/workflow/step_graph.hpp"
#include "flowcore/workflow/errors.hpp"
#include <algorithm>
#include <deque>

namespace flowcore {
namespace workflow {

StepGraph::NodeIndex StepGraph::add_node(const std::string& name) {
    if (index_.count(name) > 0) {
        throw ValidationError(ValidationIssue::duplicate_step, "duplicate step name: " + name, name);
    }
    NodeIndex index = names_.size();
    names_.push_back(name);
    index_.emplace(name, index);
    outgoing_.emplace_back();
    incoming_.emplace_back();
    return index;
}

void StepGraph::add_edge(const std::string& from, const std::string& to) {
    auto from_index = index_of(from);
    if (!from_index) {
        throw ValidationError(ValidationIssue::unknown_step, "dependency references unknown step: " + from, from);
    }
    auto to_index = index_of(to);
    if (!to_index) {
        throw ValidationError(ValidationIssue::unknown_step, "dependency references unknown step: " + to, to);
    }

    auto& out = outgoing_[*from_index];
    if (std::find(out.begin(), out.end(), *to_index) != out.end()) {
        return;
    }
    out.push_back(*to_index);
    incoming_[*to_index].push_back(*from_index);
}

std::optional<StepGraph::NodeIndex> StepGraph::index_of(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::vector<StepGraph::NodeIndex>> StepGraph::topological_order() const {
    std::vector<std::size_t> in_degree(names_.size(), 0);
    for (NodeIndex i = 0; i < names_.size(); ++i) {
        in_degree[i] = incoming_[i].size();
    }

    std::deque<NodeIndex> ready;
    for (NodeIndex i = 0; i < names_.size(); ++i) {
        if (in_degree[i] == 0) {
            ready.push_back(i);
        }
    }

    std::vector<NodeIndex> order;
    order.reserve(names_.size());
    while (!ready.empty()) {
        NodeIndex node = ready.front();
        ready.pop_front();
        order.push_back(node);
        for (NodeIndex next : outgoing_[node]) {
            if (--in_degree[next] == 0) {
                ready.push_back(next);
            }
        }
    }

    if (order.size() != names_.size()) {
        return std::nullopt;
    }
    return order;
}

std::optional<std::string> StepGraph::find_cycle() const {
    std::vector<char> visited(names_.size(), 0);
    std::vector<char> on_path(names_.size(), 0);
    NodeIndex cycle_node = 0;

    for (NodeIndex i = 0; i < names_.size(); ++i) {
        if (!visited[i] && visit(i, visited, on_path, cycle_node)) {
            return names_[cycle_node];
        }
    }
    return std::nullopt;
}

bool StepGraph::visit(NodeIndex node,
                      std::vector<char>& visited,
                      std::vector<char>& on_path,
                      NodeIndex& cycle_node) const {
    visited[node] = 1;
    on_path[node] = 1;
    for (NodeIndex next : outgoing_[node]) {
        if (on_path[next]) {
            cycle_node = next;
            return true;
        }
        if (!visited[next] && visit(next, visited, on_path, cycle_node)) {
            return true;
        }
    }
    on_path[node] = 0;
    return false;
}

} // namespace workflow
} // namespace flowcore
