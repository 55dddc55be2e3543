#include "kernel/services/graph_traversal_service.hpp"

#include <algorithm>
#include <deque>
#include <map>
#include <set>
#include <unordered_set>

namespace og {

namespace {

void print_dep_tree_recursive(const Flow& flow,
                              std::ostream& os,
                              const NodeId& node_id,
                              int level,
                              std::unordered_set<NodeId>& path,
                              bool show_parameters) {
    auto indent = [&](int l) {
        for (int i = 0; i < l; ++i) {
            os << "  ";
        }
    };

    if (path.count(node_id)) {
        indent(level);
        os << "- ... (Cycle detected on Node " << node_id << ") ...\n";
        return;
    }
    path.insert(node_id);

    indent(level);
    const auto& node = flow.node(node_id);
    os << "- Node " << node.id() << " (" << node.name() << " | " << node.type() << ")";
    if (!node.enabled()) os << " [disabled]";
    os << "\n";

    if (show_parameters && !node.parameters().empty()) {
        indent(level + 1);
        os << "params:\n";
        std::map<std::string, Value> sorted(node.parameters().begin(), node.parameters().end());
        for (const auto& [key, value] : sorted) {
            indent(level + 2);
            os << key << ": " << describe(value) << "\n";
        }
    }

    for (const auto& c : flow.connections_into(node_id)) {
        if (!flow.has_node(c.source_node)) continue;
        indent(level + 1);
        os << "(" << c.target_port << " from " << c.source_node << ":" << c.source_port << ")\n";
        print_dep_tree_recursive(flow, os, c.source_node, level + 2, path, show_parameters);
    }
    path.erase(node_id);
}

} // namespace

std::vector<NodeId> GraphTraversalService::ending_nodes(const Flow& flow) const {
    std::unordered_set<NodeId> is_input_to_something;
    for (const auto& c : flow.connections_) {
        is_input_to_something.insert(c.source_node);
    }
    std::vector<NodeId> ends;
    ends.reserve(flow.nodes_.size());
    for (const auto& pair : flow.nodes_) {
        if (is_input_to_something.find(pair.first) == is_input_to_something.end()) {
            ends.push_back(pair.first);
        }
    }
    return ends;
}

std::vector<NodeId> GraphTraversalService::source_nodes(const Flow& flow) const {
    std::unordered_set<NodeId> has_producer;
    for (const auto& c : flow.connections_) {
        has_producer.insert(c.target_node);
    }
    std::vector<NodeId> sources;
    for (const auto& pair : flow.nodes_) {
        if (!has_producer.count(pair.first)) sources.push_back(pair.first);
    }
    return sources;
}

std::vector<NodeId> GraphTraversalService::parents_of(const Flow& flow, const NodeId& node_id) const {
    std::set<NodeId> parents;
    for (const auto& c : flow.connections_) {
        if (c.target_node == node_id) parents.insert(c.source_node);
    }
    return {parents.begin(), parents.end()};
}

std::vector<NodeId> GraphTraversalService::descendants_of(const Flow& flow, const NodeId& node_id) const {
    std::set<NodeId> seen;
    std::deque<NodeId> queue{node_id};
    while (!queue.empty()) {
        NodeId current = queue.front();
        queue.pop_front();
        for (const auto& c : flow.connections_) {
            if (c.source_node == current && c.target_node != node_id && seen.insert(c.target_node).second) {
                queue.push_back(c.target_node);
            }
        }
    }
    return {seen.begin(), seen.end()};
}

std::vector<std::vector<NodeId>> GraphTraversalService::execution_layers(const Flow& flow) const {
    std::map<NodeId, int> in_degree;
    for (const auto& pair : flow.nodes_) in_degree[pair.first] = 0;
    for (const auto& c : flow.connections_) {
        if (in_degree.count(c.target_node) && in_degree.count(c.source_node)) ++in_degree[c.target_node];
    }

    std::vector<std::vector<NodeId>> layers;
    std::vector<NodeId> current;
    for (const auto& [id, deg] : in_degree) {
        if (deg == 0) current.push_back(id);
    }
    std::size_t placed = 0;
    while (!current.empty()) {
        placed += current.size();
        std::vector<NodeId> next;
        for (const auto& id : current) {
            for (const auto& c : flow.connections_) {
                if (c.source_node != id || !in_degree.count(c.target_node)) continue;
                if (--in_degree[c.target_node] == 0) next.push_back(c.target_node);
            }
        }
        std::sort(next.begin(), next.end());
        layers.push_back(std::move(current));
        current = std::move(next);
    }
    if (placed != flow.nodes_.size()) {
        throw GraphError(GraphErrc::CycleDetected,
                         "Cycle detected in flow '" + flow.name() + "' during traversal.");
    }
    return layers;
}

std::vector<NodeId> GraphTraversalService::topo_order(const Flow& flow) const {
    std::vector<NodeId> order;
    for (auto& layer : execution_layers(flow)) {
        order.insert(order.end(), layer.begin(), layer.end());
    }
    return order;
}

void GraphTraversalService::print_dependency_tree(const Flow& flow,
                                                  std::ostream& os,
                                                  bool show_parameters) const {
    os << "Dependency Tree (reversed from ending nodes):\n";
    auto ends = ending_nodes(flow);
    if (ends.empty() && !flow.nodes_.empty()) {
        os << "(Flow has cycles)\n";
    } else if (flow.nodes_.empty()) {
        os << "(Flow is empty)\n";
    }

    for (const auto& end_node_id : ends) {
        std::unordered_set<NodeId> path;
        print_dep_tree_recursive(flow, os, end_node_id, 0, path, show_parameters);
    }
}

void GraphTraversalService::print_dependency_tree(const Flow& flow,
                                                  std::ostream& os,
                                                  const NodeId& start_node_id,
                                                  bool show_parameters) const {
    os << "Dependency Tree (starting from Node " << start_node_id << "):\n";
    if (!flow.has_node(start_node_id)) {
        os << "(Node " << start_node_id << " not found in flow)\n";
        return;
    }
    std::unordered_set<NodeId> path;
    print_dep_tree_recursive(flow, os, start_node_id, 0, path, show_parameters);
}

} // namespace og
