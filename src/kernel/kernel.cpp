// opgraph kernel: Kernel facade implementation
#include "kernel/kernel.hpp"

#include <algorithm>
#include <sstream>

namespace og {

namespace {

BufferPoolOptions pool_options_from(const EngineConfig& c) {
    BufferPoolOptions o;
    o.budget_bytes = static_cast<std::size_t>(std::max(1, c.pool_budget_mb)) * 1024 * 1024;
    o.max_idle_per_key = static_cast<std::size_t>(std::max(0, c.pool_max_idle_per_key));
    o.acquire_wait = std::chrono::milliseconds(std::max(0, c.pool_acquire_wait_ms));
    o.quiet = c.quiet;
    return o;
}

SchedulerOptions scheduler_options_from(const EngineConfig& c) {
    SchedulerOptions o;
    o.max_parallel_nodes = static_cast<std::size_t>(std::max(0, c.max_parallel_nodes));
    o.default_timeout = std::chrono::milliseconds(c.default_timeout_ms > 0 ? c.default_timeout_ms : 30000);
    o.cancel_grace = std::chrono::milliseconds(std::max(0, c.cancel_grace_ms));
    return o;
}

} // namespace

Kernel::Kernel(EngineConfig config, OperatorRegistry& registry)
    : config_(std::move(config)),
      registry_(registry),
      plugin_mgr_(registry),
      events_(static_cast<std::size_t>(std::max(0, config_.event_buffer_capacity))),
      pool_(pool_options_from(config_)),
      runtime_(static_cast<unsigned int>(std::max(0, config_.worker_threads))),
      scheduler_(runtime_, registry_, &pool_, &events_, scheduler_options_from(config_)),
      inspection_(scheduler_) {
    plugin_mgr_.seed_builtins_from_registry();
    runtime_.set_scheduler_log_capacity(static_cast<std::size_t>(std::max(0, config_.scheduler_log_capacity)));
    runtime_.start();
}

Kernel::~Kernel() = default;

PluginLoadResult Kernel::load_plugins() {
    return plugin_mgr_.load_from_dirs(config_.plugin_dirs);
}

void Kernel::set_error(const std::string& name, GraphErrc code, const std::string& message, RunErrc run_code) {
    std::lock_guard<std::mutex> lk(mutex_);
    last_error_[name] = LastError{code, run_code, message};
}

void Kernel::clear_error(const std::string& name) {
    std::lock_guard<std::mutex> lk(mutex_);
    last_error_.erase(name);
}

std::optional<Kernel::LastError> Kernel::last_error(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = last_error_.find(name);
    if (it == last_error_.end()) return std::nullopt;
    return it->second;
}

std::shared_ptr<Flow> Kernel::require_flow(const std::string& name) {
    auto f = flow(name);
    if (!f) set_error(name, GraphErrc::NotFound, "Flow '" + name + "' is not loaded.");
    return f;
}

bool Kernel::add_flow(std::shared_ptr<Flow> flow) {
    if (!flow) return false;
    const std::string name = flow->name();
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (flows_.count(name)) {
            last_error_[name] = LastError{GraphErrc::InvalidParameter, RunErrc::None,
                                          "Flow '" + name + "' is already loaded."};
            return false;
        }
        flows_[name] = std::move(flow);
    }
    clear_error(name);
    return true;
}

std::shared_ptr<Flow> Kernel::flow(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = flows_.find(name);
    return it == flows_.end() ? nullptr : it->second;
}

bool Kernel::close_flow(const std::string& name) {
    std::lock_guard<std::mutex> lk(mutex_);
    last_error_.erase(name);
    return flows_.erase(name) > 0;
}

std::vector<std::string> Kernel::list_flows() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, f] : flows_) names.push_back(name);
    return names;
}

std::optional<FlowValidationReport> Kernel::validate(const std::string& name) {
    auto f = require_flow(name);
    if (!f) return std::nullopt;
    auto report = f->validate();
    if (!report.ok()) {
        set_error(name, report.is_acyclic ? GraphErrc::InvalidParameter : GraphErrc::CycleDetected,
                  report.errors.front(), RunErrc::GraphInvalid);
    }
    return report;
}

std::optional<ParameterReport> Kernel::validate_parameters(const std::string& name) {
    auto f = require_flow(name);
    if (!f) return std::nullopt;
    auto report = scheduler_.validate_parameters(*f);
    if (!report.ok()) set_error(name, GraphErrc::InvalidParameter, report.errors.front());
    return report;
}

std::optional<RunOutcome> Kernel::run(const std::string& name, const ValueMap& inputs,
                                      std::optional<std::chrono::milliseconds> timeout) {
    auto f = require_flow(name);
    if (!f) return std::nullopt;
    RunOutcome outcome = scheduler_.run_flow(*f, inputs, timeout);
    if (outcome.succeeded()) {
        clear_error(name);
    } else {
        set_error(name, GraphErrc::Unknown, outcome.error_message, outcome.error_code);
    }
    return outcome;
}

std::optional<RunHandle> Kernel::run_async(const std::string& name, ValueMap inputs,
                                           std::optional<std::chrono::milliseconds> timeout) {
    auto f = require_flow(name);
    if (!f) return std::nullopt;
    return scheduler_.submit_run(f, std::move(inputs), timeout);
}

bool Kernel::cancel(const std::string& run_id) {
    return scheduler_.cancel_run(run_id);
}

std::optional<std::map<NodeId, NodeExecutionRecord>> Kernel::run_status(const std::string& run_id) const {
    return scheduler_.run_status(run_id);
}

std::optional<InspectionResult> Kernel::inspect(const std::string& name, const ImageBuffer& image,
                                                std::optional<std::chrono::milliseconds> timeout) {
    auto f = require_flow(name);
    if (!f) return std::nullopt;
    InspectionResult result = inspection_.inspect(*f, image, timeout);
    if (result.status == InspectionStatus::Error) {
        set_error(name, GraphErrc::Unknown, result.message, result.run.error_code);
    } else {
        clear_error(name);
    }
    return result;
}

std::optional<std::string> Kernel::dump_dependency_tree(const std::string& name, std::optional<NodeId> node_id,
                                                        bool show_parameters) {
    auto f = require_flow(name);
    if (!f) return std::nullopt;
    std::ostringstream oss;
    if (node_id) {
        traversal_.print_dependency_tree(*f, oss, *node_id, show_parameters);
    } else {
        traversal_.print_dependency_tree(*f, oss, show_parameters);
    }
    return oss.str();
}

std::optional<std::vector<NodeId>> Kernel::ending_nodes(const std::string& name) {
    auto f = require_flow(name);
    if (!f) return std::nullopt;
    return traversal_.ending_nodes(*f);
}

std::optional<std::vector<std::vector<NodeId>>> Kernel::execution_layers(const std::string& name) {
    auto f = require_flow(name);
    if (!f) return std::nullopt;
    try {
        return traversal_.execution_layers(*f);
    } catch (const GraphError& e) {
        set_error(name, e.code(), e.what(), RunErrc::GraphInvalid);
        return std::nullopt;
    }
}

} // namespace og
