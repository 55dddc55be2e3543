#pragma once

#include <ostream>
#include <vector>

#include "flow.hpp"

namespace og {

class OPGRAPH_API GraphTraversalService {
 public:
  // Nodes without outgoing connections.
  std::vector<NodeId> ending_nodes(const Flow& flow) const;
  // Nodes without incoming connections.
  std::vector<NodeId> source_nodes(const Flow& flow) const;
  // Direct producers of `node_id`.
  std::vector<NodeId> parents_of(const Flow& flow, const NodeId& node_id) const;
  // Every node reachable from `node_id`, excluding itself.
  std::vector<NodeId> descendants_of(const Flow& flow, const NodeId& node_id) const;

  // Kahn order; throws GraphError(CycleDetected) on cyclic input.
  std::vector<NodeId> topo_order(const Flow& flow) const;
  // Groups of mutually independent nodes; layer k depends only on layers < k.
  std::vector<std::vector<NodeId>> execution_layers(const Flow& flow) const;

  void print_dependency_tree(const Flow& flow, std::ostream& os,
                             bool show_parameters = true) const;
  void print_dependency_tree(const Flow& flow, std::ostream& os,
                             const NodeId& start_node_id,
                             bool show_parameters = true) const;
};

}  // namespace og
