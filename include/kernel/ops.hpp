#pragma once

#include <optional>
#include <string>
#include <vector>

#include "kernel/operator_executor.hpp"
#include "node.hpp"

namespace og { namespace ops {

// Registers the OpenCV-backed built-in operators into `registry`.
OPGRAPH_API void register_builtin(OperatorRegistry& registry);

// Type tags of the built-in operators.
OPGRAPH_API std::vector<std::string> builtin_types();

// Creates a node with the ports and default parameters of a built-in type.
// Throws GraphError(NotFound) for unknown types.
OPGRAPH_API Node make_node(const std::string& type, const std::string& name,
               std::optional<NodeId> id = std::nullopt);

}} // namespace og::ops
