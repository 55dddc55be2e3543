#include <gtest/gtest.h>

#include <algorithm>
#include <sstream>
#include <string>

#include "flow.hpp"
#include "kernel/services/graph_traversal_service.hpp"

namespace {

og::Node scalar_node(const std::string& id) {
  og::Node n(id, "passthrough", id);
  n.add_input("in", og::PortDataType::Scalar, false)
      .add_output("out", og::PortDataType::Scalar);
  return n;
}

// 期望某个调用抛出带有指定错误码的 GraphError
template <typename Fn>
void expect_graph_error(og::GraphErrc code, Fn&& fn) {
  try {
    fn();
    FAIL() << "expected GraphError(" << og::to_string(code) << ")";
  } catch (const og::GraphError& e) {
    EXPECT_EQ(e.code(), code) << e.what();
  }
}

}  // namespace

TEST(FlowTest, RejectsConnectionThatClosesCycle) {
  og::Flow flow("cycle");
  flow.add_node(scalar_node("A"));
  flow.add_node(scalar_node("B"));

  flow.connect("A", "out", "B", "in");
  ASSERT_EQ(flow.connections().size(), 1u);

  expect_graph_error(og::GraphErrc::CycleDetected,
                     [&] { flow.connect("B", "out", "A", "in"); });

  // 被拒绝的连接不得改变图
  ASSERT_EQ(flow.connections().size(), 1u);
  EXPECT_EQ(flow.connections()[0], (og::Connection{"A", "out", "B", "in"}));
  EXPECT_TRUE(flow.validate().ok());
}

TEST(FlowTest, DiamondIsNotACycle) {
  og::Flow flow("diamond");
  og::Node a("A", "source", std::string("A"));
  a.add_output("out", og::PortDataType::Scalar);
  og::Node d("D", "join", std::string("D"));
  d.add_input("left", og::PortDataType::Scalar)
      .add_input("right", og::PortDataType::Scalar);
  flow.add_node(a);
  flow.add_node(scalar_node("B"));
  flow.add_node(scalar_node("C"));
  flow.add_node(d);

  flow.connect("A", "out", "B", "in");
  flow.connect("A", "out", "C", "in");
  flow.connect("B", "out", "D", "left");
  EXPECT_NO_THROW(flow.connect("C", "out", "D", "right"));

  auto report = flow.validate();
  EXPECT_TRUE(report.ok());
  EXPECT_TRUE(report.is_acyclic);
  EXPECT_TRUE(report.cycle.empty());
}

TEST(FlowTest, ConnectionErrorCodes) {
  og::Flow flow("errors");
  flow.add_node(scalar_node("A"));
  flow.add_node(scalar_node("B"));
  og::Node img("I", "image_op", std::string("I"));
  img.add_input("image", og::PortDataType::Image)
      .add_output("image", og::PortDataType::Image);
  flow.add_node(img);

  expect_graph_error(og::GraphErrc::DuplicateNodeId,
                     [&] { flow.add_node(scalar_node("A")); });
  expect_graph_error(og::GraphErrc::UnknownNode,
                     [&] { flow.connect("A", "out", "Z", "in"); });
  expect_graph_error(og::GraphErrc::UnknownPort,
                     [&] { flow.connect("A", "nope", "B", "in"); });
  expect_graph_error(og::GraphErrc::PortDirectionMismatch,
                     [&] { flow.connect("A", "in", "B", "in"); });
  expect_graph_error(og::GraphErrc::PortDirectionMismatch,
                     [&] { flow.connect("A", "out", "B", "out"); });
  expect_graph_error(og::GraphErrc::PortTypeMismatch,
                     [&] { flow.connect("A", "out", "I", "image"); });
  expect_graph_error(og::GraphErrc::SelfConnection,
                     [&] { flow.connect("A", "out", "A", "in"); });

  flow.connect("A", "out", "B", "in");
  flow.add_node(scalar_node("C"));
  expect_graph_error(og::GraphErrc::InputAlreadyBound,
                     [&] { flow.connect("C", "out", "B", "in"); });

  EXPECT_EQ(flow.connections().size(), 1u);
}

TEST(FlowTest, AnyPortAcceptsEveryType) {
  og::Flow flow("any");
  og::Node img("I", "image_op", std::string("I"));
  img.add_output("image", og::PortDataType::Image);
  og::Node sink("S", "sink", std::string("S"));
  sink.add_input("value", og::PortDataType::Any);
  flow.add_node(img);
  flow.add_node(sink);
  EXPECT_NO_THROW(flow.connect("I", "image", "S", "value"));
}

TEST(FlowTest, ValidateFindsCycleInsertedBehindTheChecks) {
  og::Flow flow("bypass");
  flow.add_node(scalar_node("A"));
  flow.add_node(scalar_node("B"));
  flow.add_node(scalar_node("C"));
  flow.connect("A", "out", "B", "in");
  flow.connect("B", "out", "C", "in");

  // 绕过 add_connection 的检查直接写入回边，validate 仍须独立发现环
  flow.connections_unchecked().push_back(og::Connection{"C", "out", "A", "in"});

  auto report = flow.validate();
  EXPECT_FALSE(report.ok());
  EXPECT_FALSE(report.is_acyclic);
  ASSERT_EQ(report.cycle.size(), 3u);
  for (const char* id : {"A", "B", "C"}) {
    EXPECT_NE(std::find(report.cycle.begin(), report.cycle.end(), id), report.cycle.end()) << id;
  }
}

TEST(FlowTest, ValidateReportsDanglingAndDuplicateBindings) {
  og::Flow flow("dangling");
  flow.add_node(scalar_node("A"));
  flow.add_node(scalar_node("B"));
  flow.add_node(scalar_node("C"));
  flow.connect("A", "out", "C", "in");
  flow.connections_unchecked().push_back(og::Connection{"B", "out", "C", "in"});
  flow.connections_unchecked().push_back(og::Connection{"ghost", "out", "B", "in"});

  auto report = flow.validate();
  EXPECT_TRUE(report.is_acyclic);
  EXPECT_EQ(report.errors.size(), 2u);
}

TEST(FlowTest, RemoveNodeDropsItsConnections) {
  og::Flow flow("remove");
  flow.add_node(scalar_node("A"));
  flow.add_node(scalar_node("B"));
  flow.add_node(scalar_node("C"));
  flow.connect("A", "out", "B", "in");
  flow.connect("B", "out", "C", "in");

  EXPECT_TRUE(flow.remove_node("B"));
  EXPECT_FALSE(flow.remove_node("B"));
  EXPECT_TRUE(flow.connections().empty());
  EXPECT_FALSE(flow.has_node("B"));
  expect_graph_error(og::GraphErrc::UnknownNode, [&] { flow.node("B"); });
}

TEST(FlowTest, NodeIdsAreStableAndExplicit) {
  og::Node generated("blur", "gaussian_blur");
  EXPECT_EQ(generated.id().size(), 16u);
  og::Node imported("blur", "gaussian_blur", std::string("n-42"));
  EXPECT_EQ(imported.id(), "n-42");
  expect_graph_error(og::GraphErrc::InvalidParameter,
                     [] { og::Node bad("x", "y", std::string()); });
}

TEST(TraversalTest, LayersAndEndingNodes) {
  og::Flow flow("layers");
  og::Node a("A", "source", std::string("A"));
  a.add_output("out", og::PortDataType::Scalar);
  og::Node d("D", "join", std::string("D"));
  d.add_input("left", og::PortDataType::Scalar)
      .add_input("right", og::PortDataType::Scalar);
  flow.add_node(a);
  flow.add_node(scalar_node("B"));
  flow.add_node(scalar_node("C"));
  flow.add_node(d);
  flow.connect("A", "out", "B", "in");
  flow.connect("A", "out", "C", "in");
  flow.connect("B", "out", "D", "left");
  flow.connect("C", "out", "D", "right");

  og::GraphTraversalService traversal;
  auto layers = traversal.execution_layers(flow);
  ASSERT_EQ(layers.size(), 3u);
  EXPECT_EQ(layers[0], std::vector<og::NodeId>{"A"});
  EXPECT_EQ(layers[1].size(), 2u);
  EXPECT_EQ(layers[2], std::vector<og::NodeId>{"D"});

  EXPECT_EQ(traversal.ending_nodes(flow), std::vector<og::NodeId>{"D"});
  EXPECT_EQ(traversal.source_nodes(flow), std::vector<og::NodeId>{"A"});
  EXPECT_EQ(traversal.descendants_of(flow, "B"), std::vector<og::NodeId>{"D"});

  auto parents = traversal.parents_of(flow, "D");
  std::sort(parents.begin(), parents.end());
  EXPECT_EQ(parents, (std::vector<og::NodeId>{"B", "C"}));

  auto order = traversal.topo_order(flow);
  ASSERT_EQ(order.size(), 4u);
  EXPECT_EQ(order.front(), "A");
  EXPECT_EQ(order.back(), "D");

  std::ostringstream oss;
  traversal.print_dependency_tree(flow, oss, /*show_parameters*/ false);
  EXPECT_NE(oss.str().find("D"), std::string::npos);
}

TEST(TraversalTest, LayersRejectCycles) {
  og::Flow flow("cyclic");
  flow.add_node(scalar_node("A"));
  flow.add_node(scalar_node("B"));
  flow.connect("A", "out", "B", "in");
  flow.connections_unchecked().push_back(og::Connection{"B", "out", "A", "in"});

  og::GraphTraversalService traversal;
  expect_graph_error(og::GraphErrc::CycleDetected,
                     [&] { traversal.execution_layers(flow); });
}
