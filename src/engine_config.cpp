// Engine configuration YAML read/write implementation
#include "engine_config.hpp"

#include <fstream>
#include <iostream>
#include <yaml-cpp/yaml.h>

namespace og {

bool write_config_to_file(const EngineConfig& config, const std::string& path) {
    YAML::Node root;
    root["_comment1"] = "opgraph engine configuration.";
    root["worker_threads"] = config.worker_threads;
    root["max_parallel_nodes"] = config.max_parallel_nodes;
    root["default_timeout_ms"] = config.default_timeout_ms;
    root["cancel_grace_ms"] = config.cancel_grace_ms;
    root["pool_budget_mb"] = config.pool_budget_mb;
    root["pool_max_idle_per_key"] = config.pool_max_idle_per_key;
    root["pool_acquire_wait_ms"] = config.pool_acquire_wait_ms;
    root["event_buffer_capacity"] = config.event_buffer_capacity;
    root["scheduler_log_capacity"] = config.scheduler_log_capacity;
    root["plugin_dirs"] = config.plugin_dirs;
    root["quiet"] = config.quiet;

    std::ofstream fout(path);
    if (!fout) return false;
    fout << root;
    return static_cast<bool>(fout);
}

void load_or_create_config(const std::string& config_path, EngineConfig& config) {
    if (fs::exists(config_path)) {
        config.loaded_config_path = fs::absolute(config_path).string();
        try {
            YAML::Node root = YAML::LoadFile(config_path);
            if (root["worker_threads"]) config.worker_threads = root["worker_threads"].as<int>();
            if (root["max_parallel_nodes"]) config.max_parallel_nodes = root["max_parallel_nodes"].as<int>();
            if (root["default_timeout_ms"]) config.default_timeout_ms = root["default_timeout_ms"].as<int>();
            if (root["cancel_grace_ms"]) config.cancel_grace_ms = root["cancel_grace_ms"].as<int>();
            if (root["pool_budget_mb"]) config.pool_budget_mb = root["pool_budget_mb"].as<int>();
            if (root["pool_max_idle_per_key"]) config.pool_max_idle_per_key = root["pool_max_idle_per_key"].as<int>();
            if (root["pool_acquire_wait_ms"]) config.pool_acquire_wait_ms = root["pool_acquire_wait_ms"].as<int>();
            if (root["event_buffer_capacity"]) config.event_buffer_capacity = root["event_buffer_capacity"].as<int>();
            if (root["scheduler_log_capacity"]) config.scheduler_log_capacity = root["scheduler_log_capacity"].as<int>();

            if (root["plugin_dirs"] && root["plugin_dirs"].IsSequence()) {
                config.plugin_dirs = root["plugin_dirs"].as<std::vector<std::string>>();
            } else if (root["plugin_dir"] && root["plugin_dir"].IsScalar()) {
                config.plugin_dirs.clear();
                config.plugin_dirs.push_back(root["plugin_dir"].as<std::string>());
            }
            if (root["quiet"]) config.quiet = root["quiet"].as<bool>();
        } catch (const std::exception& e) {
            if (!config.quiet) {
                std::cerr << "Warning: Could not parse config file '" << config_path
                          << "'. Using default settings. Error: " << e.what() << std::endl;
            }
            config = EngineConfig{};
            config.loaded_config_path = fs::absolute(config_path).string();
        }
    } else if (config_path == "opgraph.yaml") {
        if (write_config_to_file(config, "opgraph.yaml")) {
            config.loaded_config_path = fs::absolute("opgraph.yaml").string();
        }
    }
}

} // namespace og
