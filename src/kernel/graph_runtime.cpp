// opgraph kernel: GraphRuntime implementation
#include "kernel/graph_runtime.hpp"

namespace og {

thread_local int GraphRuntime::tls_worker_id_ = -1;

GraphRuntime::GraphRuntime(unsigned int num_workers) : num_workers_(num_workers) {
    if (num_workers_ == 0) {
        num_workers_ = std::thread::hardware_concurrency();
        if (num_workers_ == 0) num_workers_ = 2;
    }
}

GraphRuntime::~GraphRuntime() { stop(); }

void GraphRuntime::start() {
    if (running_) return;
    {
        std::lock_guard<std::mutex> lk(queue_mutex_);
        stopping_ = false;
    }
    running_ = true;
    workers_.reserve(num_workers_);
    for (unsigned int i = 0; i < num_workers_; ++i) {
        workers_.emplace_back(&GraphRuntime::run_loop, this, static_cast<int>(i));
    }
}

void GraphRuntime::stop() {
    if (!running_) return;
    {
        std::lock_guard<std::mutex> lk(queue_mutex_);
        stopping_ = true;
    }
    cv_task_available_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
    running_ = false;
}

void GraphRuntime::submit(Task&& task) {
    {
        std::lock_guard<std::mutex> lk(queue_mutex_);
        if (stopping_ || !running_) {
            throw GraphError(GraphErrc::Unknown, "GraphRuntime: submit on a stopped runtime.");
        }
        queue_.push_back(std::move(task));
    }
    cv_task_available_.notify_one();
}

void GraphRuntime::run_loop(int thread_id) {
    tls_worker_id_ = thread_id;
    while (true) {
        Task job;
        {
            std::unique_lock<std::mutex> lk(queue_mutex_);
            cv_task_available_.wait(lk, [&] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) break;  // stopping and drained
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        try {
            job();
        } catch (...) {
            // 保持工作线程存活，异常留给调用方检查
            set_exception(std::current_exception());
        }
    }
    tls_worker_id_ = -1;
}

std::exception_ptr GraphRuntime::first_exception() const {
    std::lock_guard<std::mutex> lk(exception_mutex_);
    return first_exception_;
}

void GraphRuntime::set_exception(std::exception_ptr e) {
    std::lock_guard<std::mutex> lk(exception_mutex_);
    if (!first_exception_) first_exception_ = e;
}

void GraphRuntime::log_event(SchedulerEvent::Action action, const std::string& run_id,
                             const NodeId& node_id) {
    std::lock_guard<std::mutex> lk(log_mutex_);
    if (scheduler_log_capacity_ == 0) return;
    if (scheduler_log_.size() >= scheduler_log_capacity_) scheduler_log_.pop_front();
    scheduler_log_.push_back(SchedulerEvent{run_id, node_id, tls_worker_id_, action,
                                            std::chrono::high_resolution_clock::now()});
}

void GraphRuntime::set_scheduler_log_capacity(std::size_t capacity) {
    std::lock_guard<std::mutex> lk(log_mutex_);
    scheduler_log_capacity_ = capacity;
    while (scheduler_log_.size() > scheduler_log_capacity_) scheduler_log_.pop_front();
}

std::vector<GraphRuntime::SchedulerEvent> GraphRuntime::get_scheduler_log() const {
    std::lock_guard<std::mutex> lk(log_mutex_);
    return std::vector<SchedulerEvent>(scheduler_log_.begin(), scheduler_log_.end());
}

void GraphRuntime::clear_scheduler_log() {
    std::lock_guard<std::mutex> lk(log_mutex_);
    scheduler_log_.clear();
}

int GraphRuntime::this_worker_id() { return tls_worker_id_; }

} // namespace og
