// opgraph kernel: PluginManager interface
#pragma once

#include <map>
#include <string>
#include <vector>

#include "kernel/plugin_result.hpp"

namespace og {

class OperatorRegistry;

// Manages dynamic plugins and the ops they register.
// - Loads shared libraries using load_plugins().
// - Tracks which ops came from which plugin path so they can be unloaded.
class OPGRAPH_API PluginManager {
public:
    explicit PluginManager(OperatorRegistry& registry) : registry_(registry) {}

    // Load plugins from the given directory patterns and record op->source mapping.
    PluginLoadResult load_from_dirs(const std::vector<std::string>& dir_patterns);
    // Register built-in ops and record them as "built-in".
    void seed_builtins_from_registry();

    // Unload all ops registered from any plugin (does not touch built-ins).
    int unload_all_plugins();

    // List registered ops with their sources ("built-in" or absolute .so/.dylib path).
    const std::map<std::string, std::string>& op_sources() const { return op_sources_; }

private:
    int unregister_keys(const std::vector<std::string>& keys);

    OperatorRegistry& registry_;
    // Map: op type -> source ("built-in" or plugin absolute path)
    std::map<std::string, std::string> op_sources_;
};

} // namespace og
