#pragma once

#include "node.hpp"
#include "og_types.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace og {

class GraphTraversalService;

struct Connection {
    NodeId source_node;
    std::string source_port;
    NodeId target_node;
    std::string target_port;

    bool operator==(const Connection& o) const {
        return source_node == o.source_node && source_port == o.source_port &&
               target_node == o.target_node && target_port == o.target_port;
    }
};

OPGRAPH_API std::string to_string(const Connection& c);

// Result of Flow::validate(). `cycle` lists the node ids of one detected
// cycle in path order (first id repeated implicitly at the end).
struct FlowValidationReport {
    bool is_acyclic = true;
    std::vector<NodeId> cycle;
    std::vector<std::string> errors;

    bool ok() const { return errors.empty(); }
};

/**
 * @class Flow
 * @brief 算子 DAG：节点 + 连接。
 *
 * 所有编辑操作都会立即检查不变量，失败时抛出 GraphError 且不改变图：
 * 端口存在、方向正确、类型兼容、每个输入端口至多一个生产者、无自环、无环。
 * 执行期间 Flow 只读，可被多个并发 Run 共享；唯一的可变部分是
 * 每个节点的上一次执行摘要，由内部互斥锁保护。
 */
class OPGRAPH_API Flow {
public:
    explicit Flow(std::string name, std::optional<std::string> id = std::nullopt);

    Flow(const Flow&) = delete;
    Flow& operator=(const Flow&) = delete;

    const std::string& id() const { return id_; }
    const std::string& name() const { return name_; }

    void add_node(Node node);
    bool remove_node(const NodeId& id);
    bool has_node(const NodeId& id) const { return nodes_.count(id) > 0; }
    const Node& node(const NodeId& id) const;
    Node& mutable_node(const NodeId& id);
    const std::map<NodeId, Node>& nodes() const { return nodes_; }

    void add_connection(const Connection& c);
    void connect(const NodeId& source, const std::string& source_port,
                 const NodeId& target, const std::string& target_port) {
        add_connection(Connection{source, source_port, target, target_port});
    }
    bool remove_connection(const Connection& c);
    void clear_connections() { connections_.clear(); }
    const std::vector<Connection>& connections() const { return connections_; }
    std::vector<Connection> connections_into(const NodeId& id) const;
    std::vector<Connection> connections_from(const NodeId& id) const;

    // Raw access that skips every invariant check. Used by importers that
    // re-verify with validate() afterwards.
    std::vector<Connection>& connections_unchecked() { return connections_; }

    // Full re-verification: acyclicity plus dangling references and
    // duplicate input bindings, independent of add_connection's checks.
    FlowValidationReport validate() const;

    LastExecution last_execution(const NodeId& id) const;
    void record_last_execution(const NodeId& id, LastExecution exec) const;

private:
    friend class GraphTraversalService;

    // True when `to` can be reached from `from` along existing connections.
    bool reachable(const NodeId& from, const NodeId& to) const;

    std::string id_;
    std::string name_;
    std::map<NodeId, Node> nodes_;
    std::vector<Connection> connections_;

    mutable std::mutex exec_mutex_;
    mutable std::unordered_map<NodeId, LastExecution> last_exec_;
};

} // namespace og
