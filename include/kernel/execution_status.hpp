// opgraph kernel: per-run execution status table
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "og_types.hpp"

namespace og {

struct NodeExecutionRecord {
    NodeStatus status = NodeStatus::Pending;
    std::optional<std::chrono::system_clock::time_point> started_at;
    double duration_ms = 0.0;
    std::string error_message;
    RunErrc error_code = RunErrc::None;
};

/**
 * @brief 单次 Run 独占的节点状态表。
 *
 * 每个 Run 新建一张表，不同 Run 之间互不可见。
 * 结构（插入）由读写锁保护，每个条目有自己的互斥锁，
 * 因此同一 Run 内对不同节点的并发更新互不阻塞，调用方无需额外加锁。
 */
class OPGRAPH_API ExecutionStatusTable {
public:
    ExecutionStatusTable() = default;
    explicit ExecutionStatusTable(const std::vector<NodeId>& node_ids);

    ExecutionStatusTable(const ExecutionStatusTable&) = delete;
    ExecutionStatusTable& operator=(const ExecutionStatusTable&) = delete;

    // Inserts a Pending entry when absent.
    void ensure(const NodeId& id);

    // Pending -> Running; stamps started_at. Returns false for any other state.
    bool mark_running(const NodeId& id);

    // Moves a non-terminal entry to a terminal status. Returns false (and leaves
    // the entry untouched) if it already reached a terminal status.
    bool finish(const NodeId& id, NodeStatus status, double duration_ms = 0.0,
                std::string error_message = {}, RunErrc error_code = RunErrc::None);

    // Generic in-place update under the entry's lock.
    void update(const NodeId& id, const std::function<void(NodeExecutionRecord&)>& fn);

    std::optional<NodeExecutionRecord> get(const NodeId& id) const;
    std::map<NodeId, NodeExecutionRecord> snapshot() const;

    std::size_t size() const;
    std::size_t count(NodeStatus status) const;
    // Percentage of entries in a terminal status.
    double progress() const;

private:
    struct Entry {
        mutable std::mutex mutex;
        NodeExecutionRecord record;
    };

    Entry& entry(const NodeId& id);

    mutable std::shared_mutex structure_mutex_;
    std::unordered_map<NodeId, std::unique_ptr<Entry>> entries_;
};

} // namespace og
