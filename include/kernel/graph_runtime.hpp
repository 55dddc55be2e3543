// opgraph kernel: GraphRuntime - worker thread pool shared by all runs
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "og_types.hpp"

namespace og {

using Task = std::function<void()>;

class OPGRAPH_API GraphRuntime {
public:
  struct SchedulerEvent {
    enum Action { ASSIGN_INITIAL, EXECUTE };
    std::string run_id;
    NodeId node_id;
    int worker_id;
    Action action;
    std::chrono::time_point<std::chrono::high_resolution_clock> timestamp;
  };

  // 0 selects std::thread::hardware_concurrency().
  explicit GraphRuntime(unsigned int num_workers = 0);
  ~GraphRuntime();

  GraphRuntime(const GraphRuntime&) = delete;
  GraphRuntime& operator=(const GraphRuntime&) = delete;

  void start();
  // Drains queued tasks, then joins the workers.
  void stop();
  bool running() const { return running_; }
  unsigned int worker_count() const { return num_workers_; }

  void submit(Task&& task);

  // First exception that escaped a task; tasks are expected to handle their own.
  std::exception_ptr first_exception() const;
  void set_exception(std::exception_ptr e);

  // The log keeps the most recent `capacity` events; 0 disables logging.
  void log_event(SchedulerEvent::Action action, const std::string& run_id,
                 const NodeId& node_id);
  void set_scheduler_log_capacity(std::size_t capacity);
  std::vector<SchedulerEvent> get_scheduler_log() const;
  void clear_scheduler_log();

  // -1 outside worker threads.
  static int this_worker_id();

private:
  void run_loop(int thread_id);

  std::vector<std::thread> workers_;
  unsigned int num_workers_{0};
  std::atomic<bool> running_{false};
  bool stopping_{false};

  std::deque<Task> queue_;
  std::mutex queue_mutex_;
  std::condition_variable cv_task_available_;

  mutable std::mutex exception_mutex_;
  std::exception_ptr first_exception_{nullptr};

  static thread_local int tls_worker_id_;

  mutable std::mutex log_mutex_;
  std::deque<SchedulerEvent> scheduler_log_;
  std::size_t scheduler_log_capacity_{4096};
};

}  // namespace og
