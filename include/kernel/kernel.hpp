// opgraph kernel: multi-flow Kernel facade
#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "engine_config.hpp"
#include "flow.hpp"
#include "kernel/buffer_pool.hpp"
#include "kernel/graph_runtime.hpp"
#include "kernel/operator_executor.hpp"
#include "kernel/plugin_manager.hpp"
#include "kernel/scheduler.hpp"
#include "kernel/services/graph_event_service.hpp"
#include "kernel/services/graph_traversal_service.hpp"
#include "kernel/services/inspection_service.hpp"

namespace og {

// Owns the engine-wide resources (registry, worker pool, buffer pool, scheduler)
// and a set of named flows. Errors are reported through optional/bool returns
// and last_error(); nothing here writes to the console.
class OPGRAPH_API Kernel {
public:
    struct LastError {
        GraphErrc code = GraphErrc::Unknown;
        RunErrc run_code = RunErrc::None;
        std::string message;
    };

    explicit Kernel(EngineConfig config = {}, OperatorRegistry& registry = OperatorRegistry::instance());
    ~Kernel();

    Kernel(const Kernel&) = delete;
    Kernel& operator=(const Kernel&) = delete;

    const EngineConfig& config() const { return config_; }

    // Loads plugins from config().plugin_dirs.
    PluginLoadResult load_plugins();

    bool add_flow(std::shared_ptr<Flow> flow);
    std::shared_ptr<Flow> flow(const std::string& name) const;
    bool close_flow(const std::string& name);
    std::vector<std::string> list_flows() const;

    std::optional<FlowValidationReport> validate(const std::string& name);
    std::optional<ParameterReport> validate_parameters(const std::string& name);

    std::optional<RunOutcome> run(const std::string& name, const ValueMap& inputs,
                                  std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    std::optional<RunHandle> run_async(const std::string& name, ValueMap inputs,
                                       std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    // Runs a single operator outside any loaded flow.
    NodeRunOutcome run_node(const Node& node, const ValueMap& inputs,
                            std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
        return scheduler_.run_node(node, inputs, timeout);
    }
    bool cancel(const std::string& run_id);
    std::optional<std::map<NodeId, NodeExecutionRecord>> run_status(const std::string& run_id) const;

    std::optional<InspectionResult> inspect(const std::string& name, const ImageBuffer& image,
                                            std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    void set_result_sink(ResultSink* sink) { inspection_.set_sink(sink); }

    std::optional<std::string> dump_dependency_tree(const std::string& name, std::optional<NodeId> node_id,
                                                    bool show_parameters);
    std::optional<std::vector<NodeId>> ending_nodes(const std::string& name);
    std::optional<std::vector<std::vector<NodeId>>> execution_layers(const std::string& name);

    std::vector<GraphEventService::ComputeEvent> drain_compute_events() { return events_.drain(); }
    const GraphEventService& events() const { return events_; }
    BufferPoolStats pool_stats() const { return pool_.stats(); }
    std::optional<LastError> last_error(const std::string& name) const;

    OperatorRegistry& registry() { return registry_; }
    PluginManager& plugins() { return plugin_mgr_; }
    GraphRuntime& runtime() { return runtime_; }
    Scheduler& scheduler() { return scheduler_; }
    BufferPool& pool() { return pool_; }

private:
    void set_error(const std::string& name, GraphErrc code, const std::string& message,
                   RunErrc run_code = RunErrc::None);
    void clear_error(const std::string& name);
    std::shared_ptr<Flow> require_flow(const std::string& name);

    // 成员声明顺序即析构逆序：调度器先等待异步 Run，运行时再回收工作线程，
    // 最后才释放缓冲池。
    EngineConfig config_;
    OperatorRegistry& registry_;
    PluginManager plugin_mgr_;
    GraphEventService events_;
    BufferPool pool_;
    GraphRuntime runtime_;
    Scheduler scheduler_;
    InspectionService inspection_;
    GraphTraversalService traversal_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Flow>> flows_;
    std::map<std::string, LastError> last_error_;
};

} // namespace og
