// opgraph kernel: PluginManager implementation
#include "kernel/plugin_manager.hpp"

#include "kernel/ops.hpp"     // register_builtin()
#include "plugin_loader.hpp"  // load_plugins(dir_patterns, registry, op_sources)

namespace og {

int PluginManager::unregister_keys(const std::vector<std::string>& keys) {
  int count = 0;
  for (const auto& k : keys)
    count += registry_.unregister_key(k) ? 1 : 0;
  return count;
}

PluginLoadResult PluginManager::load_from_dirs(
    const std::vector<std::string>& dir_patterns) {
  return load_plugins(dir_patterns, registry_, op_sources_);
}

void PluginManager::seed_builtins_from_registry() {
  ops::register_builtin(registry_);
  for (const auto& key : registry_.get_keys()) {
    if (!op_sources_.count(key))
      op_sources_[key] = "built-in";
  }
}

int PluginManager::unload_all_plugins() {
  std::vector<std::string> plugin_keys;
  for (const auto& [key, src] : op_sources_)
    if (src != "built-in")
      plugin_keys.push_back(key);
  if (plugin_keys.empty())
    return 0;
  int removed = unregister_keys(plugin_keys);
  for (const auto& k : plugin_keys)
    op_sources_.erase(k);
  return removed;
}

}  // namespace og
