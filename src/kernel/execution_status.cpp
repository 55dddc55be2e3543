// opgraph kernel: ExecutionStatusTable implementation
#include "kernel/execution_status.hpp"

namespace og {

ExecutionStatusTable::ExecutionStatusTable(const std::vector<NodeId>& node_ids) {
    for (const auto& id : node_ids) {
        entries_.emplace(id, std::make_unique<Entry>());
    }
}

ExecutionStatusTable::Entry& ExecutionStatusTable::entry(const NodeId& id) {
    {
        std::shared_lock<std::shared_mutex> lk(structure_mutex_);
        auto it = entries_.find(id);
        if (it != entries_.end()) return *it->second;
    }
    std::unique_lock<std::shared_mutex> lk(structure_mutex_);
    auto& slot = entries_[id];
    if (!slot) slot = std::make_unique<Entry>();
    return *slot;
}

void ExecutionStatusTable::ensure(const NodeId& id) {
    (void)entry(id);
}

bool ExecutionStatusTable::mark_running(const NodeId& id) {
    Entry& e = entry(id);
    std::lock_guard<std::mutex> lk(e.mutex);
    if (e.record.status != NodeStatus::Pending) return false;
    e.record.status = NodeStatus::Running;
    e.record.started_at = std::chrono::system_clock::now();
    return true;
}

bool ExecutionStatusTable::finish(const NodeId& id, NodeStatus status, double duration_ms,
                                  std::string error_message, RunErrc error_code) {
    Entry& e = entry(id);
    std::lock_guard<std::mutex> lk(e.mutex);
    if (is_terminal(e.record.status)) return false;
    e.record.status = status;
    e.record.duration_ms = duration_ms;
    e.record.error_message = std::move(error_message);
    e.record.error_code = error_code;
    return true;
}

void ExecutionStatusTable::update(const NodeId& id,
                                  const std::function<void(NodeExecutionRecord&)>& fn) {
    Entry& e = entry(id);
    std::lock_guard<std::mutex> lk(e.mutex);
    fn(e.record);
}

std::optional<NodeExecutionRecord> ExecutionStatusTable::get(const NodeId& id) const {
    std::shared_lock<std::shared_mutex> lk(structure_mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    std::lock_guard<std::mutex> elk(it->second->mutex);
    return it->second->record;
}

std::map<NodeId, NodeExecutionRecord> ExecutionStatusTable::snapshot() const {
    std::map<NodeId, NodeExecutionRecord> out;
    std::shared_lock<std::shared_mutex> lk(structure_mutex_);
    for (const auto& [id, e] : entries_) {
        std::lock_guard<std::mutex> elk(e->mutex);
        out.emplace(id, e->record);
    }
    return out;
}

std::size_t ExecutionStatusTable::size() const {
    std::shared_lock<std::shared_mutex> lk(structure_mutex_);
    return entries_.size();
}

std::size_t ExecutionStatusTable::count(NodeStatus status) const {
    std::size_t n = 0;
    std::shared_lock<std::shared_mutex> lk(structure_mutex_);
    for (const auto& [id, e] : entries_) {
        std::lock_guard<std::mutex> elk(e->mutex);
        if (e->record.status == status) ++n;
    }
    return n;
}

double ExecutionStatusTable::progress() const {
    std::size_t done = 0;
    std::size_t total = 0;
    std::shared_lock<std::shared_mutex> lk(structure_mutex_);
    for (const auto& [id, e] : entries_) {
        std::lock_guard<std::mutex> elk(e->mutex);
        ++total;
        if (is_terminal(e->record.status)) ++done;
    }
    return total == 0 ? 100.0 : 100.0 * static_cast<double>(done) / static_cast<double>(total);
}

} // namespace og
