// Kernel plugin loader result and error reporting structures
#pragma once

#include <string>
#include <vector>

#include "og_types.hpp"

namespace og {

struct PluginLoadError {
  std::string path;  // attempted plugin path
  GraphErrc code = GraphErrc::Unknown;
  std::string message;
};

struct PluginLoadResult {
  int attempted = 0;
  int loaded = 0;
  std::vector<PluginLoadError> errors;
  std::vector<std::string> new_op_keys;  // operator types registered by the loaded plugins
};

}  // namespace og
