// opgraph kernel: Scheduler implementation
#include "kernel/scheduler.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>

namespace og {

const char* to_string(RunStatus status) {
    return status == RunStatus::Succeeded ? "Succeeded" : "Failed";
}

namespace detail {

// 单次执行的全部可变状态。工作线程上的任务通过 shared_ptr 持有它，
// 因此被放弃的（超时后仍在运行的）节点返回时不会访问已销毁的对象。
struct RunState {
    struct NodeSlot {
        std::shared_ptr<const Node> node;
        std::vector<Connection> incoming;
        std::vector<Connection> outgoing;
        int pending_producers = 0;
        bool blocked = false;
        std::string block_reason;
        ValueMap inputs;
    };

    std::string run_id;
    std::string flow_id;
    ValueMap initial_inputs;
    FlowValidationReport validation;

    CancellationSource cancel;
    Clock::time_point started;
    Clock::time_point deadline;
    std::chrono::milliseconds timeout{0};

    ExecutionStatusTable status;
    std::map<NodeId, NodeSlot> slots;
    std::unordered_map<NodeId, ValueMap> produced;

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<NodeId> ready;
    std::size_t in_flight = 0;
    bool aborted = false;
    std::optional<NodeId> first_failed;
    std::string first_error;
    RunErrc first_error_code = RunErrc::None;

    RunState(const std::vector<NodeId>& ids, Clock::time_point deadline_at)
        : cancel(deadline_at), status(ids) {}
};

} // namespace detail

namespace {

using detail::RunState;

double elapsed_ms(Clock::time_point since) {
    return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
}

void note_failure_locked(RunState& run, const NodeId& id, const std::string& message, RunErrc code) {
    if (run.first_failed) return;
    run.first_failed = id;
    run.first_error = message;
    run.first_error_code = code;
}

void emit(GraphEventService* events, const RunState& run, const Node& node, NodeStatus status, double ms) {
    if (events) events->push(run.run_id, node.id(), node.name(), status, ms);
}

// Looks up a fallback value for an input port: "<node>.<port>" initial input,
// then "<port>" initial input, then a node parameter of the same name.
const Value* lookup_fallback(const RunState& run, const Node& node, const Port& port) {
    auto it = run.initial_inputs.find(make_port_key(node.id(), port.name));
    if (it != run.initial_inputs.end() && value_matches(it->second, port.type)) return &it->second;
    it = run.initial_inputs.find(port.name);
    if (it != run.initial_inputs.end() && value_matches(it->second, port.type)) return &it->second;
    const Value* p = node.param(port.name);
    if (p && value_matches(*p, port.type)) return p;
    return nullptr;
}

// Called once all producers of `id` have finished. Returns true when the node
// reached a terminal status immediately (skipped or failed) and its own
// dependents need to be settled; false when it was queued as ready.
bool evaluate_locked(RunState& run, const NodeId& id, GraphEventService* events) {
    auto& slot = run.slots.at(id);
    const Node& node = *slot.node;

    if (slot.blocked) {
        if (run.status.finish(id, NodeStatus::Skipped, 0.0, slot.block_reason)) {
            emit(events, run, node, NodeStatus::Skipped, 0.0);
        }
        return true;
    }
    if (!node.enabled()) {
        if (run.status.finish(id, NodeStatus::Skipped, 0.0, "Node is disabled.")) {
            emit(events, run, node, NodeStatus::Skipped, 0.0);
        }
        return true;
    }

    ValueMap inputs;
    for (const auto& [port_name, port] : node.inputs()) {
        std::string why = "no connection, initial input or parameter supplies it";
        const Value* value = nullptr;

        auto bound = std::find_if(slot.incoming.begin(), slot.incoming.end(),
                                  [&](const Connection& c) { return c.target_port == port_name; });
        if (bound != slot.incoming.end()) {
            auto produced = run.produced.find(bound->source_node);
            if (produced != run.produced.end()) {
                auto pv = produced->second.find(bound->source_port);
                if (pv != produced->second.end() && value_matches(pv->second, port.type)) {
                    value = &pv->second;
                } else {
                    why = "producer '" + bound->source_node + "' did not emit '" + bound->source_port + "'";
                }
            } else {
                why = "producer '" + bound->source_node + "' did not succeed";
            }
        }
        if (!value) value = lookup_fallback(run, node, port);

        if (value) {
            inputs.emplace(port_name, *value);
        } else if (port.required) {
            std::string msg = "Missing required input '" + port_name + "': " + why + ".";
            if (run.status.finish(id, NodeStatus::Failed, 0.0, msg, RunErrc::MissingInput)) {
                note_failure_locked(run, id, msg, RunErrc::MissingInput);
                emit(events, run, node, NodeStatus::Failed, 0.0);
            }
            return true;
        }
    }

    slot.inputs = std::move(inputs);
    run.ready.push_back(id);
    return false;
}

// Settles dependents of a finished node, cascading through nodes that finish
// without executing (skipped / missing input).
void propagate_locked(RunState& run, const NodeId& finished_id, GraphEventService* events) {
    std::vector<NodeId> work{finished_id};
    while (!work.empty()) {
        NodeId id = work.back();
        work.pop_back();
        auto record = run.status.get(id);
        const NodeStatus status = record ? record->status : NodeStatus::Failed;

        for (const auto& c : run.slots.at(id).outgoing) {
            auto& target = run.slots.at(c.target_node);
            --target.pending_producers;
            const Port* in = target.node->find_input(c.target_port);
            if (status != NodeStatus::Succeeded && in && in->required && !target.blocked) {
                target.blocked = true;
                target.block_reason = "Upstream node '" + id + "' " + to_string(status) +
                                      "; required input '" + c.target_port + "' unresolved.";
            }
            if (target.pending_producers == 0 && evaluate_locked(run, c.target_node, events)) {
                work.push_back(c.target_node);
            }
        }
    }
}

ExecutionOutcome invoke_node(const Node& node, const ValueMap& inputs,
                             const std::shared_ptr<OperatorExecutor>& executor,
                             BufferPool* pool, const CancellationToken& token,
                             const std::string& run_id) {
    if (!executor) {
        return ExecutionOutcome::failure("No executor registered for operator type '" + node.type() + "'.");
    }
    // 上下文在返回前析构，借出的缓冲在节点结束时即归还
    ExecutionContext ctx(token, run_id);
    try {
        if (pool && node.working_size()) {
            auto attach = [&](const std::map<std::string, Port>& ports) {
                for (const auto& [name, port] : ports) {
                    if (port.type != PortDataType::Image || ctx.working_buffer(name)) continue;
                    ctx.attach_buffer(name, pool->acquire(*node.working_size(), token));
                }
            };
            attach(node.inputs());
            attach(node.outputs());
        }

        ExecutionOutcome outcome = executor->execute(node, inputs, ctx);
        if (!outcome.success) {
            if (outcome.error_message.empty()) outcome.error_message = "Operator reported failure.";
            return outcome;
        }
        for (auto it = outcome.outputs.begin(); it != outcome.outputs.end();) {
            const Port* port = node.find_output(it->first);
            if (!port) {
                it = outcome.outputs.erase(it);
                continue;
            }
            if (!value_matches(it->second, port->type)) {
                auto actual = type_of(it->second);
                return ExecutionOutcome::failure(
                    "Output '" + it->first + "' produced " +
                    (actual ? to_string(*actual) : "an empty value") +
                    ", port expects " + to_string(port->type) + ".");
            }
            ++it;
        }
        return outcome;
    } catch (const GraphError& e) {
        return ExecutionOutcome::failure(std::string(to_string(e.code())) + ": " + e.what());
    } catch (const std::exception& e) {
        return ExecutionOutcome::failure(std::string("Exception: ") + e.what());
    } catch (...) {
        return ExecutionOutcome::failure("Unknown exception thrown by operator.");
    }
}

std::string abort_message(const RunState& run, CancelReason reason) {
    return reason == CancelReason::Timeout
               ? "Run exceeded timeout of " + std::to_string(run.timeout.count()) + " ms."
               : std::string("Run cancelled.");
}

// Pending -> Running on the worker thread. A node whose Run was cancelled,
// timed out or aborted while it sat in the queue is settled as Cancelled
// without touching the pool or the executor; returns false in that case.
bool begin_node(RunState& run, const Node& node, GraphEventService* events) {
    std::lock_guard<std::mutex> lk(run.mutex);
    const CancelReason reason = run.cancel.token().reason();
    if (reason == CancelReason::None && !run.aborted && run.status.mark_running(node.id())) {
        return true;
    }
    --run.in_flight;
    const CancelReason why = reason == CancelReason::None ? CancelReason::Cancelled : reason;
    const RunErrc code = why == CancelReason::Timeout ? RunErrc::Timeout : RunErrc::Cancelled;
    if (run.status.finish(node.id(), NodeStatus::Cancelled, 0.0,
                          abort_message(run, why) + " Node never started.", code)) {
        emit(events, run, node, NodeStatus::Cancelled, 0.0);
    }
    run.cv.notify_all();
    return false;
}

void complete_node(RunState& run, const Node& node, ExecutionOutcome outcome, double ms,
                   GraphEventService* events) {
    std::lock_guard<std::mutex> lk(run.mutex);
    --run.in_flight;
    NodeStatus status = outcome.success ? NodeStatus::Succeeded : NodeStatus::Failed;
    RunErrc code = outcome.success ? RunErrc::None : RunErrc::ExecutorFailure;
    // 在取消/超时之后才失败的节点记为 Cancelled，而不是执行失败
    if (!outcome.success) {
        const CancelReason reason = run.cancel.token().reason();
        if (reason != CancelReason::None) {
            status = NodeStatus::Cancelled;
            code = reason == CancelReason::Timeout ? RunErrc::Timeout : RunErrc::Cancelled;
        }
    }
    // 已被标记为 Cancelled 的被放弃节点：结果直接丢弃
    if (run.status.finish(node.id(), status, ms, outcome.error_message, code)) {
        if (outcome.success) {
            run.produced[node.id()] = std::move(outcome.outputs);
        } else if (status == NodeStatus::Failed) {
            note_failure_locked(run, node.id(), outcome.error_message, code);
        }
        emit(events, run, node, status, ms);
        if (!run.aborted) propagate_locked(run, node.id(), events);
    }
    run.cv.notify_all();
}

} // namespace

Scheduler::Scheduler(GraphRuntime& runtime, OperatorRegistry& registry, BufferPool* pool,
                     GraphEventService* events, SchedulerOptions options)
    : runtime_(runtime), registry_(registry), pool_(pool), events_(events), options_(options) {}

Scheduler::~Scheduler() {
    std::vector<std::shared_future<RunOutcome>> pending;
    {
        std::lock_guard<std::mutex> lk(runs_mutex_);
        for (auto& [id, run] : active_runs_) {
            run->cancel.cancel(CancelReason::Cancelled);
            { std::lock_guard<std::mutex> rlk(run->mutex); }
            run->cv.notify_all();
        }
        pending.swap(async_runs_);
    }
    for (auto& f : pending) f.wait();
}

std::shared_ptr<detail::RunState> Scheduler::begin_run(const Flow& flow, const ValueMap& initial_inputs,
                                                       std::optional<std::chrono::milliseconds> timeout) {
    std::vector<NodeId> ids;
    ids.reserve(flow.nodes().size());
    for (const auto& [id, node] : flow.nodes()) ids.push_back(id);

    auto effective = timeout && timeout->count() > 0 ? *timeout : options_.default_timeout;
    const auto started = Clock::now();
    auto run = std::make_shared<RunState>(ids, started + effective);
    run->run_id = "run-" + generate_id();
    run->flow_id = flow.id();
    run->initial_inputs = initial_inputs;
    run->started = started;
    run->deadline = started + effective;
    run->timeout = effective;
    run->validation = flow.validate();

    if (run->validation.ok()) {
        for (const auto& [id, node] : flow.nodes()) {
            auto& slot = run->slots[id];
            slot.node = std::make_shared<const Node>(node);
        }
        for (const auto& c : flow.connections()) {
            run->slots[c.source_node].outgoing.push_back(c);
            auto& target = run->slots[c.target_node];
            target.incoming.push_back(c);
            ++target.pending_producers;
        }
    }

    std::lock_guard<std::mutex> lk(runs_mutex_);
    active_runs_[run->run_id] = run;
    return run;
}

void Scheduler::unregister(const std::string& run_id) {
    std::lock_guard<std::mutex> lk(runs_mutex_);
    active_runs_.erase(run_id);
}

void Scheduler::dispatch_locked(const std::shared_ptr<RunState>& run, const NodeId& id) {
    auto& slot = run->slots.at(id);
    auto node = slot.node;
    auto inputs = std::move(slot.inputs);
    auto executor = registry_.find(node->type());
    ++run->in_flight;

    BufferPool* pool = pool_;
    GraphEventService* events = events_;
    GraphRuntime& runtime = runtime_;
    try {
        runtime_.submit([run, node, inputs = std::move(inputs), executor, pool, events, &runtime]() {
            // 节点在工作线程真正开始时才进入 Running；排队期间 Run 已结束则不再执行
            if (!begin_node(*run, *node, events)) return;
            runtime.log_event(GraphRuntime::SchedulerEvent::EXECUTE, run->run_id, node->id());
            const auto t0 = Clock::now();
            ExecutionOutcome outcome =
                invoke_node(*node, inputs, executor, pool, run->cancel.token(), run->run_id);
            complete_node(*run, *node, std::move(outcome), elapsed_ms(t0), events);
        });
    } catch (const GraphError& e) {
        --run->in_flight;
        std::string msg = std::string("Dispatch failed: ") + e.what();
        if (run->status.finish(id, NodeStatus::Failed, 0.0, msg, RunErrc::ExecutorFailure)) {
            note_failure_locked(*run, id, msg, RunErrc::ExecutorFailure);
            emit(events_, *run, *node, NodeStatus::Failed, 0.0);
            propagate_locked(*run, id, events_);
        }
    }
}

RunOutcome Scheduler::drive(const Flow& flow, const std::shared_ptr<RunState>& run) {
    struct Unregister {
        Scheduler* self;
        std::string id;
        ~Unregister() { self->unregister(id); }
    } guard{this, run->run_id};

    RunOutcome out;
    out.run_id = run->run_id;
    out.flow_id = run->flow_id;

    if (!run->validation.ok()) {
        out.status = RunStatus::Failed;
        out.error_code = RunErrc::GraphInvalid;
        std::string msg = "Flow '" + flow.name() + "' is invalid:";
        for (const auto& e : run->validation.errors) msg += " " + e;
        out.error_message = msg;
        out.nodes = run->status.snapshot();
        out.total_ms = elapsed_ms(run->started);
        return out;
    }

    const std::size_t limit = std::max<std::size_t>(
        1, options_.max_parallel_nodes > 0 ? options_.max_parallel_nodes : runtime_.worker_count());
    const CancellationToken token = run->cancel.token();

    std::unique_lock<std::mutex> lk(run->mutex);

    // Seed: nodes without producers. Collected first because settling a
    // failed seed can bring other nodes to zero pending producers.
    std::vector<NodeId> seeds;
    for (const auto& [id, slot] : run->slots) {
        if (slot.pending_producers == 0) seeds.push_back(id);
    }
    for (const auto& id : seeds) {
        if (evaluate_locked(*run, id, events_)) {
            propagate_locked(*run, id, events_);
        } else {
            runtime_.log_event(GraphRuntime::SchedulerEvent::ASSIGN_INITIAL, run->run_id, id);
        }
    }

    while (true) {
        if (token.is_cancelled()) break;
        while (!run->ready.empty() && run->in_flight < limit) {
            NodeId id = run->ready.front();
            run->ready.pop_front();
            dispatch_locked(run, id);
        }
        if (run->ready.empty() && run->in_flight == 0) break;
        run->cv.wait_until(lk, run->deadline, [&] {
            return token.is_cancelled() || run->in_flight == 0 ||
                   (!run->ready.empty() && run->in_flight < limit);
        });
    }

    const CancelReason reason = token.reason();
    if (reason != CancelReason::None) {
        run->aborted = true;
        const RunErrc code = reason == CancelReason::Timeout ? RunErrc::Timeout : RunErrc::Cancelled;
        const std::string msg = abort_message(*run, reason);
        run->ready.clear();
        for (const auto& [id, slot] : run->slots) {
            bool cancelled = false;
            run->status.update(id, [&](NodeExecutionRecord& r) {
                if (r.status != NodeStatus::Pending) return;
                r.status = NodeStatus::Cancelled;
                r.error_message = msg;
                r.error_code = code;
                cancelled = true;
            });
            if (cancelled) emit(events_, *run, *slot.node, NodeStatus::Cancelled, 0.0);
        }

        // 宽限期内等待在途节点自行结束，之后直接放弃
        run->cv.wait_until(lk, Clock::now() + options_.cancel_grace, [&] { return run->in_flight == 0; });
        const auto now = std::chrono::system_clock::now();
        for (const auto& [id, slot] : run->slots) {
            auto rec = run->status.get(id);
            if (!rec || rec->status != NodeStatus::Running) continue;
            double ran = rec->started_at
                             ? std::chrono::duration<double, std::milli>(now - *rec->started_at).count()
                             : 0.0;
            if (run->status.finish(id, NodeStatus::Cancelled, ran,
                                   msg + " Node abandoned after grace period.", code)) {
                emit(events_, *run, *slot.node, NodeStatus::Cancelled, ran);
            }
        }
        out.error_code = code;
        out.error_message = msg;
        out.failed_node = run->first_failed;
    } else if (run->first_failed) {
        const Node& failed = *run->slots.at(*run->first_failed).node;
        out.error_code = run->first_error_code;
        out.failed_node = run->first_failed;
        out.error_message = "Node '" + failed.name() + "' (" + failed.id() + ") failed: " + run->first_error;
    }

    out.nodes = run->status.snapshot();
    const bool any_failed = std::any_of(out.nodes.begin(), out.nodes.end(), [](const auto& kv) {
        return kv.second.status == NodeStatus::Failed || kv.second.status == NodeStatus::Cancelled;
    });
    out.status = (reason == CancelReason::None && !any_failed) ? RunStatus::Succeeded : RunStatus::Failed;

    for (const auto& [id, slot] : run->slots) {
        if (!slot.outgoing.empty()) continue;
        auto produced = run->produced.find(id);
        if (produced == run->produced.end()) continue;
        for (const auto& [port, value] : produced->second) {
            out.outputs[make_port_key(id, port)] = value;
        }
    }
    out.total_ms = elapsed_ms(run->started);
    lk.unlock();

    for (const auto& [id, rec] : out.nodes) {
        flow.record_last_execution(id, LastExecution{rec.status, rec.duration_ms, rec.error_message, out.run_id});
    }
    return out;
}

RunOutcome Scheduler::run_flow(const Flow& flow, const ValueMap& initial_inputs,
                               std::optional<std::chrono::milliseconds> timeout) {
    auto run = begin_run(flow, initial_inputs, timeout);
    return drive(flow, run);
}

NodeRunOutcome Scheduler::run_node(const Node& node, const ValueMap& inputs,
                                   std::optional<std::chrono::milliseconds> timeout) {
    Flow single(node.name());
    single.add_node(node);
    RunOutcome run = run_flow(single, inputs, timeout);

    NodeRunOutcome out;
    out.run_id = run.run_id;
    auto it = run.nodes.find(node.id());
    if (it != run.nodes.end()) out.record = it->second;
    const std::string prefix = node.id() + ".";
    for (auto& [key, value] : run.outputs) {
        if (key.compare(0, prefix.size(), prefix) == 0) out.outputs.emplace(key.substr(prefix.size()), std::move(value));
    }
    return out;
}

RunHandle Scheduler::submit_run(std::shared_ptr<const Flow> flow, ValueMap initial_inputs,
                                std::optional<std::chrono::milliseconds> timeout) {
    if (!flow) {
        throw GraphError(GraphErrc::InvalidParameter, "submit_run: flow is null.");
    }
    auto run = begin_run(*flow, initial_inputs, timeout);
    std::shared_future<RunOutcome> fut =
        std::async(std::launch::async, [this, flow, run] { return drive(*flow, run); }).share();

    std::lock_guard<std::mutex> lk(runs_mutex_);
    async_runs_.erase(std::remove_if(async_runs_.begin(), async_runs_.end(),
                                     [](const std::shared_future<RunOutcome>& f) {
                                         return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
                                     }),
                      async_runs_.end());
    async_runs_.push_back(fut);
    return RunHandle{run->run_id, fut};
}

bool Scheduler::cancel_run(const std::string& run_id) {
    std::shared_ptr<RunState> run;
    {
        std::lock_guard<std::mutex> lk(runs_mutex_);
        auto it = active_runs_.find(run_id);
        if (it == active_runs_.end()) return false;
        run = it->second;
    }
    run->cancel.cancel(CancelReason::Cancelled);
    { std::lock_guard<std::mutex> lk(run->mutex); }
    run->cv.notify_all();
    return true;
}

std::optional<std::map<NodeId, NodeExecutionRecord>> Scheduler::run_status(const std::string& run_id) const {
    std::shared_ptr<RunState> run;
    {
        std::lock_guard<std::mutex> lk(runs_mutex_);
        auto it = active_runs_.find(run_id);
        if (it == active_runs_.end()) return std::nullopt;
        run = it->second;
    }
    return run->status.snapshot();
}

std::vector<std::string> Scheduler::active_runs() const {
    std::lock_guard<std::mutex> lk(runs_mutex_);
    std::vector<std::string> ids;
    ids.reserve(active_runs_.size());
    for (const auto& [id, run] : active_runs_) ids.push_back(id);
    std::sort(ids.begin(), ids.end());
    return ids;
}

ParameterReport Scheduler::validate_parameters(const Flow& flow) const {
    ParameterReport report;
    if (flow.nodes().empty()) {
        report.errors.push_back("Flow '" + flow.name() + "' has no nodes.");
        return report;
    }
    for (const auto& [id, node] : flow.nodes()) {
        auto executor = registry_.find(node.type());
        if (!executor) {
            report.errors.push_back(node.name() + ": no executor registered for type '" + node.type() + "'.");
            continue;
        }
        auto result = executor->validate(node);
        for (const auto& e : result.errors) report.errors.push_back(node.name() + ": " + e);

        if (!node.enabled()) {
            report.warnings.push_back(node.name() + ": node is disabled and will be skipped.");
        }
        auto incoming = flow.connections_into(id);
        for (const auto& [port_name, port] : node.inputs()) {
            if (!port.required) continue;
            bool bound = std::any_of(incoming.begin(), incoming.end(),
                                     [&](const Connection& c) { return c.target_port == port_name; });
            if (!bound && !node.param(port_name)) {
                report.warnings.push_back(node.name() + ": required input '" + port_name +
                                          "' must be supplied as an initial input.");
            }
        }
    }
    return report;
}

} // namespace og
