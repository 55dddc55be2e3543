// Plugin loading utilities for opgraph
#pragma once

#include <map>
#include <string>
#include <vector>

// Scans directories for plugins and loads them, registering ops.
// - plugin_dir_paths: list of directories or simple wildcard patterns to scan for shared libraries.
//   Suffix semantics:
//     - "path" or "path/*"  => shallow scan (only the directory itself)
//     - "path/**"            => recursive scan of all subdirectories
// - op_sources: map updated with op type -> plugin path.
#include "kernel/operator_executor.hpp"
#include "kernel/plugin_result.hpp"

namespace og {

// Load plugins and report result (no console I/O in kernel).
OPGRAPH_API PluginLoadResult load_plugins(const std::vector<std::string>& plugin_dir_paths,
                                          OperatorRegistry& registry,
                                          std::map<std::string, std::string>& op_sources);

} // namespace og
