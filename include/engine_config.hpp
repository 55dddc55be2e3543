// Engine configuration definition and YAML I/O declarations
#pragma once

#include <string>
#include <vector>

#include "og_types.hpp"

namespace og {

struct EngineConfig {
    std::string loaded_config_path;
    // 0 selects hardware concurrency.
    int worker_threads = 0;
    // Per-run in-flight node limit; 0 means worker_threads.
    int max_parallel_nodes = 0;
    int default_timeout_ms = 30000;
    int cancel_grace_ms = 200;
    int pool_budget_mb = 512;
    int pool_max_idle_per_key = 10;
    int pool_acquire_wait_ms = 2000;
    // Retained compute events / scheduler log entries; oldest are dropped.
    int event_buffer_capacity = 1024;
    int scheduler_log_capacity = 4096;
    std::vector<std::string> plugin_dirs = {"build/plugins"};
    bool quiet = true;
};

// Persist the configuration to a YAML file at `path`.
// Returns true on success.
OPGRAPH_API bool write_config_to_file(const EngineConfig& config, const std::string& path);

// Load an existing config from `config_path` if it exists.
// If `config_path` is the default "opgraph.yaml" and does not exist, create it with defaults.
OPGRAPH_API void load_or_create_config(const std::string& config_path, EngineConfig& config);

} // namespace og
