#include "kernel/services/graph_event_service.hpp"

namespace og {

void GraphEventService::push(const std::string& run_id,
                             const NodeId& node_id,
                             const std::string& name,
                             NodeStatus status,
                             double ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (capacity_ == 0) {
        ++dropped_;
        return;
    }
    if (buffer_.size() >= capacity_) {
        buffer_.pop_front();
        ++dropped_;
    }
    buffer_.push_back(ComputeEvent{ run_id, node_id, name, status, ms });
}

std::vector<GraphEventService::ComputeEvent> GraphEventService::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ComputeEvent> out(buffer_.begin(), buffer_.end());
    buffer_.clear();
    return out;
}

std::size_t GraphEventService::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size();
}

std::size_t GraphEventService::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

std::size_t GraphEventService::capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_;
}

void GraphEventService::set_capacity(std::size_t capacity) {
    std::lock_guard<std::mutex> lock(mutex_);
    capacity_ = capacity;
    while (buffer_.size() > capacity_) {
        buffer_.pop_front();
        ++dropped_;
    }
}

} // namespace og
