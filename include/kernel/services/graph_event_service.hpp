#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "og_types.hpp"

namespace og {

// Buffer of per-node completion events; frontends drain it to print progress.
// Holds at most capacity() events, dropping the oldest when full.
class OPGRAPH_API GraphEventService {
 public:
  struct ComputeEvent {
    std::string run_id;
    NodeId node_id;
    std::string name;
    NodeStatus status;
    double elapsed_ms;
  };

  explicit GraphEventService(std::size_t capacity = 1024) : capacity_(capacity) {}

  void push(const std::string& run_id, const NodeId& node_id,
            const std::string& name, NodeStatus status, double ms);
  std::vector<ComputeEvent> drain();
  std::size_t pending() const;
  // Events discarded because the buffer was full.
  std::size_t dropped() const;

  std::size_t capacity() const;
  void set_capacity(std::size_t capacity);

 private:
  mutable std::mutex mutex_;
  std::size_t capacity_;
  std::size_t dropped_ = 0;
  std::deque<ComputeEvent> buffer_;
};

}  // namespace og
