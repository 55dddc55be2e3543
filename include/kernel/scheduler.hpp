// opgraph kernel: Scheduler - dependency-ordered concurrent execution of a Flow
#pragma once

#include <chrono>
#include <cstddef>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "flow.hpp"
#include "kernel/buffer_pool.hpp"
#include "kernel/execution_status.hpp"
#include "kernel/graph_runtime.hpp"
#include "kernel/operator_executor.hpp"
#include "kernel/services/graph_event_service.hpp"
#include "og_types.hpp"
#include "value.hpp"

namespace og {

enum class RunStatus { Succeeded, Failed };

OPGRAPH_API const char* to_string(RunStatus status);

struct RunOutcome {
    std::string run_id;
    std::string flow_id;
    RunStatus status = RunStatus::Failed;
    RunErrc error_code = RunErrc::None;
    std::optional<NodeId> failed_node;   // first node that ended Failed
    std::string error_message;           // primary diagnostic
    std::map<NodeId, NodeExecutionRecord> nodes;
    ValueMap outputs;                    // terminal node outputs, "<node id>.<port>"
    double total_ms = 0.0;

    bool succeeded() const { return status == RunStatus::Succeeded; }
    NodeStatus node_status(const NodeId& id) const {
        auto it = nodes.find(id);
        return it == nodes.end() ? NodeStatus::Pending : it->second.status;
    }
};

// Result of executing a single node outside of any Flow.
struct NodeRunOutcome {
    std::string run_id;
    NodeExecutionRecord record;
    ValueMap outputs;   // keyed by output port name

    bool succeeded() const { return record.status == NodeStatus::Succeeded; }
};

struct RunHandle {
    std::string run_id;
    std::shared_future<RunOutcome> outcome;
};

struct SchedulerOptions {
    // 单个 Run 同时在执行的节点数上限；0 表示等于工作线程数
    std::size_t max_parallel_nodes = 0;
    std::chrono::milliseconds default_timeout{30000};
    // 取消/超时后等待在途节点结束的宽限期
    std::chrono::milliseconds cancel_grace{200};
};

struct ParameterReport {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    bool ok() const { return errors.empty(); }
};

namespace detail { struct RunState; }

/**
 * @brief 调度器：校验图、按依赖顺序并发派发节点、路由端口值、
 *        施加超时与取消、汇总 Run 结果。
 *
 * 调度器自身不保存任何跨 Run 的可变状态；每次执行都新建一个 RunState
 * （状态表、就绪队列、取消源、截止时间），仅在执行期间登记在 active runs 中，
 * 供 cancel_run / run_status 查询。
 * 节点级失败从不以异常形式抛出，而是记录到状态表并通过跳过下游节点传播。
 */
class OPGRAPH_API Scheduler {
public:
    Scheduler(GraphRuntime& runtime, OperatorRegistry& registry,
              BufferPool* pool = nullptr, GraphEventService* events = nullptr,
              SchedulerOptions options = {});
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Blocking. Always returns within timeout + cancel_grace (plus scheduling slack).
    RunOutcome run_flow(const Flow& flow, const ValueMap& initial_inputs,
                        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Runs on a dedicated coordinator thread; the id is valid for cancel_run immediately.
    RunHandle submit_run(std::shared_ptr<const Flow> flow, ValueMap initial_inputs,
                         std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Executes one operator on its own with the same input fallback, pool
    // leases, exception capture and timeout as a node inside run_flow.
    // `inputs` may be keyed "<port>" or "<node id>.<port>".
    NodeRunOutcome run_node(const Node& node, const ValueMap& inputs,
                            std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    bool cancel_run(const std::string& run_id);
    std::optional<std::map<NodeId, NodeExecutionRecord>> run_status(const std::string& run_id) const;
    std::vector<std::string> active_runs() const;

    // Runs every executor's parameter validation and flags suspicious structure.
    ParameterReport validate_parameters(const Flow& flow) const;

    const SchedulerOptions& options() const { return options_; }

private:
    std::shared_ptr<detail::RunState> begin_run(const Flow& flow, const ValueMap& initial_inputs,
                                                std::optional<std::chrono::milliseconds> timeout);
    RunOutcome drive(const Flow& flow, const std::shared_ptr<detail::RunState>& run);
    void dispatch_locked(const std::shared_ptr<detail::RunState>& run, const NodeId& id);
    void unregister(const std::string& run_id);

    GraphRuntime& runtime_;
    OperatorRegistry& registry_;
    BufferPool* pool_;
    GraphEventService* events_;
    SchedulerOptions options_;

    mutable std::mutex runs_mutex_;
    std::unordered_map<std::string, std::shared_ptr<detail::RunState>> active_runs_;
    std::vector<std::shared_future<RunOutcome>> async_runs_;
};

} // namespace og
