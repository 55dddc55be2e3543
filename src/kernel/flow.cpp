#include "flow.hpp"

#include <algorithm>
#include <deque>
#include <map>
#include <set>
#include <unordered_set>

namespace og {

namespace {

using Adjacency = std::map<NodeId, std::vector<NodeId>>;

// visited 与 on_path 必须是两个独立集合：
// visited 只用于剪枝，只有命中 on_path（当前 DFS 路径上的祖先）才算环。
bool find_cycle_from(const NodeId& node_id,
                     const Adjacency& adjacency,
                     std::unordered_set<NodeId>& visited,
                     std::unordered_set<NodeId>& on_path,
                     std::vector<NodeId>& path,
                     std::vector<NodeId>& cycle) {
    visited.insert(node_id);
    on_path.insert(node_id);
    path.push_back(node_id);

    auto it = adjacency.find(node_id);
    if (it != adjacency.end()) {
        for (const auto& next : it->second) {
            if (on_path.count(next)) {
                auto start = std::find(path.begin(), path.end(), next);
                cycle.assign(start, path.end());
                return true;
            }
            if (!visited.count(next) &&
                find_cycle_from(next, adjacency, visited, on_path, path, cycle)) {
                return true;
            }
        }
    }

    on_path.erase(node_id);
    path.pop_back();
    return false;
}

} // namespace

std::string to_string(const Connection& c) {
    return c.source_node + "." + c.source_port + " -> " + c.target_node + "." + c.target_port;
}

Flow::Flow(std::string name, std::optional<std::string> id)
    : id_(id ? std::move(*id) : generate_id()), name_(std::move(name)) {}

void Flow::add_node(Node node) {
    if (has_node(node.id())) {
        throw GraphError(GraphErrc::DuplicateNodeId,
                         "Node with id '" + node.id() + "' already exists in flow '" + name_ + "'.");
    }
    NodeId id = node.id();
    nodes_.emplace(std::move(id), std::move(node));
}

bool Flow::remove_node(const NodeId& id) {
    if (nodes_.erase(id) == 0) return false;
    connections_.erase(std::remove_if(connections_.begin(), connections_.end(),
                                      [&](const Connection& c) {
                                          return c.source_node == id || c.target_node == id;
                                      }),
                       connections_.end());
    std::lock_guard<std::mutex> lk(exec_mutex_);
    last_exec_.erase(id);
    return true;
}

const Node& Flow::node(const NodeId& id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        throw GraphError(GraphErrc::UnknownNode, "Node '" + id + "' not found in flow '" + name_ + "'.");
    }
    return it->second;
}

Node& Flow::mutable_node(const NodeId& id) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        throw GraphError(GraphErrc::UnknownNode, "Node '" + id + "' not found in flow '" + name_ + "'.");
    }
    return it->second;
}

void Flow::add_connection(const Connection& c) {
    const std::string desc = to_string(c);
    auto src_it = nodes_.find(c.source_node);
    auto dst_it = nodes_.find(c.target_node);
    if (src_it == nodes_.end() || dst_it == nodes_.end()) {
        const NodeId& missing = src_it == nodes_.end() ? c.source_node : c.target_node;
        throw GraphError(GraphErrc::UnknownNode,
                         "Connection " + desc + " references unknown node '" + missing + "'.");
    }
    const Node& src = src_it->second;
    const Node& dst = dst_it->second;

    const Port* out = src.find_output(c.source_port);
    if (!out) {
        if (src.find_input(c.source_port)) {
            throw GraphError(GraphErrc::PortDirectionMismatch,
                             "Connection " + desc + ": source port is an input.");
        }
        throw GraphError(GraphErrc::UnknownPort,
                         "Connection " + desc + ": node '" + src.id() + "' has no port '" + c.source_port + "'.");
    }
    const Port* in = dst.find_input(c.target_port);
    if (!in) {
        if (dst.find_output(c.target_port)) {
            throw GraphError(GraphErrc::PortDirectionMismatch,
                             "Connection " + desc + ": target port is an output.");
        }
        throw GraphError(GraphErrc::UnknownPort,
                         "Connection " + desc + ": node '" + dst.id() + "' has no port '" + c.target_port + "'.");
    }
    if (!is_compatible(out->type, in->type)) {
        throw GraphError(GraphErrc::PortTypeMismatch,
                         "Connection " + desc + ": " + to_string(out->type) + " output cannot feed " +
                             to_string(in->type) + " input.");
    }
    for (const auto& existing : connections_) {
        if (existing.target_node == c.target_node && existing.target_port == c.target_port) {
            throw GraphError(GraphErrc::InputAlreadyBound,
                             "Connection " + desc + ": input already bound by " + to_string(existing) + ".");
        }
    }
    if (c.source_node == c.target_node) {
        throw GraphError(GraphErrc::SelfConnection, "Connection " + desc + " is a self-loop.");
    }
    if (reachable(c.target_node, c.source_node)) {
        throw GraphError(GraphErrc::CycleDetected, "Connection " + desc + " would create a cycle.");
    }
    connections_.push_back(c);
}

bool Flow::remove_connection(const Connection& c) {
    auto it = std::find(connections_.begin(), connections_.end(), c);
    if (it == connections_.end()) return false;
    connections_.erase(it);
    return true;
}

std::vector<Connection> Flow::connections_into(const NodeId& id) const {
    std::vector<Connection> out;
    for (const auto& c : connections_) {
        if (c.target_node == id) out.push_back(c);
    }
    return out;
}

std::vector<Connection> Flow::connections_from(const NodeId& id) const {
    std::vector<Connection> out;
    for (const auto& c : connections_) {
        if (c.source_node == id) out.push_back(c);
    }
    return out;
}

bool Flow::reachable(const NodeId& from, const NodeId& to) const {
    if (from == to) return true;
    std::unordered_set<NodeId> seen{from};
    std::deque<NodeId> queue{from};
    while (!queue.empty()) {
        NodeId current = queue.front();
        queue.pop_front();
        for (const auto& c : connections_) {
            if (c.source_node != current) continue;
            if (c.target_node == to) return true;
            if (seen.insert(c.target_node).second) queue.push_back(c.target_node);
        }
    }
    return false;
}

FlowValidationReport Flow::validate() const {
    FlowValidationReport report;
    Adjacency adjacency;
    std::set<std::pair<NodeId, std::string>> bound_inputs;

    for (const auto& c : connections_) {
        const std::string desc = to_string(c);
        auto src_it = nodes_.find(c.source_node);
        auto dst_it = nodes_.find(c.target_node);
        if (src_it == nodes_.end() || dst_it == nodes_.end()) {
            report.errors.push_back("Dangling connection " + desc + ": unknown node.");
            continue;
        }
        const Port* out = src_it->second.find_output(c.source_port);
        const Port* in = dst_it->second.find_input(c.target_port);
        if (!out || !in) {
            report.errors.push_back("Dangling connection " + desc + ": unknown port or wrong direction.");
        } else if (!is_compatible(out->type, in->type)) {
            report.errors.push_back("Connection " + desc + ": incompatible port types.");
        }
        if (!bound_inputs.emplace(c.target_node, c.target_port).second) {
            report.errors.push_back("Input " + c.target_node + "." + c.target_port +
                                    " has more than one producer.");
        }
        adjacency[c.source_node].push_back(c.target_node);
    }

    std::unordered_set<NodeId> visited;
    std::unordered_set<NodeId> on_path;
    std::vector<NodeId> path;
    for (const auto& [id, node] : nodes_) {
        if (visited.count(id)) continue;
        if (find_cycle_from(id, adjacency, visited, on_path, path, report.cycle)) {
            report.is_acyclic = false;
            std::string chain;
            for (const auto& n : report.cycle) chain += n + " -> ";
            chain += report.cycle.front();
            report.errors.push_back("Cycle detected: " + chain);
            break;
        }
    }
    return report;
}

LastExecution Flow::last_execution(const NodeId& id) const {
    std::lock_guard<std::mutex> lk(exec_mutex_);
    auto it = last_exec_.find(id);
    return it == last_exec_.end() ? LastExecution{} : it->second;
}

void Flow::record_last_execution(const NodeId& id, LastExecution exec) const {
    std::lock_guard<std::mutex> lk(exec_mutex_);
    last_exec_[id] = std::move(exec);
}

} // namespace og
