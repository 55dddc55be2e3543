#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "adapter/buffer_adapter_opencv.hpp"
#include "engine_config.hpp"
#include "kernel/kernel.hpp"
#include "kernel/ops.hpp"

#ifndef OPGRAPH_TEST_PLUGIN_DIR
#define OPGRAPH_TEST_PLUGIN_DIR "build/plugins"
#endif

namespace fs = std::filesystem;

namespace {

og::EngineConfig test_config() {
  og::EngineConfig cfg;
  cfg.worker_threads = 2;
  cfg.default_timeout_ms = 5000;
  cfg.pool_budget_mb = 16;
  cfg.plugin_dirs = {OPGRAPH_TEST_PLUGIN_DIR};
  return cfg;
}

// 收集所有判定结果，模拟结果仓库
class RecordingSink : public og::ResultSink {
 public:
  void consume(const og::InspectionResult& result) override { results.push_back(result.status); }
  std::vector<og::InspectionStatus> results;
};

std::shared_ptr<og::Flow> inspection_flow(double max_blobs) {
  auto flow = std::make_shared<og::Flow>("inspection");
  flow->add_node(og::ops::make_node("image_source", "source", std::string("source")));
  flow->add_node(og::ops::make_node("threshold", "bin", std::string("bin")));
  flow->add_node(og::ops::make_node("blob_analysis", "blobs", std::string("blobs")));
  flow->add_node(og::ops::make_node("range_judge", "judge", std::string("judge"))
                     .set_param("min", 0.0)
                     .set_param("max", max_blobs));
  flow->connect("source", "image", "bin", "image");
  flow->connect("bin", "image", "blobs", "image");
  flow->connect("blobs", "count", "judge", "value");
  return flow;
}

cv::Mat image_with_blobs(int n) {
  cv::Mat img = cv::Mat::zeros(64, 64, CV_8UC1);
  for (int i = 0; i < n; ++i) {
    cv::rectangle(img, cv::Rect(4 + 14 * i, 20, 8, 8), cv::Scalar(255), cv::FILLED);
  }
  return img;
}

}  // namespace

TEST(EngineConfigTest, WriteAndReloadRoundTrip) {
  const fs::path path = fs::temp_directory_path() / "opgraph_config_roundtrip.yaml";
  og::EngineConfig cfg;
  cfg.worker_threads = 3;
  cfg.default_timeout_ms = 1234;
  cfg.pool_max_idle_per_key = 4;
  cfg.event_buffer_capacity = 64;
  cfg.scheduler_log_capacity = 0;
  cfg.plugin_dirs = {"a/plugins", "b/plugins/**"};
  cfg.quiet = false;
  ASSERT_TRUE(og::write_config_to_file(cfg, path.string()));

  og::EngineConfig loaded;
  og::load_or_create_config(path.string(), loaded);
  EXPECT_EQ(loaded.worker_threads, 3);
  EXPECT_EQ(loaded.default_timeout_ms, 1234);
  EXPECT_EQ(loaded.pool_max_idle_per_key, 4);
  EXPECT_EQ(loaded.event_buffer_capacity, 64);
  EXPECT_EQ(loaded.scheduler_log_capacity, 0);
  EXPECT_EQ(loaded.plugin_dirs, cfg.plugin_dirs);
  EXPECT_FALSE(loaded.quiet);
  EXPECT_FALSE(loaded.loaded_config_path.empty());
  fs::remove(path);
}

TEST(EngineConfigTest, MalformedFileFallsBackToDefaults) {
  const fs::path path = fs::temp_directory_path() / "opgraph_config_broken.yaml";
  {
    std::ofstream out(path);
    out << "worker_threads: [not, an, int\n";
  }
  og::EngineConfig cfg;
  cfg.worker_threads = 7;
  og::load_or_create_config(path.string(), cfg);
  EXPECT_EQ(cfg.worker_threads, 0);
  EXPECT_EQ(cfg.default_timeout_ms, 30000);
  fs::remove(path);
}

TEST(KernelTest, InspectionVerdictsReachTheSink) {
  og::OperatorRegistry registry;
  og::Kernel kernel(test_config(), registry);
  RecordingSink sink;
  kernel.set_result_sink(&sink);
  ASSERT_TRUE(kernel.add_flow(inspection_flow(/*max_blobs*/ 2.0)));

  auto ok = kernel.inspect("inspection", og::fromCvMat(image_with_blobs(2)));
  ASSERT_TRUE(ok.has_value());
  EXPECT_EQ(ok->status, og::InspectionStatus::OK) << ok->message;
  EXPECT_DOUBLE_EQ(ok->defect_count, 0.0);

  auto ng = kernel.inspect("inspection", og::fromCvMat(image_with_blobs(3)));
  ASSERT_TRUE(ng.has_value());
  EXPECT_EQ(ng->status, og::InspectionStatus::NG);
  EXPECT_DOUBLE_EQ(ng->defect_count, 1.0);

  // 空图像：image_source 无法产生输出，Run 失败
  auto err = kernel.inspect("inspection", og::ImageBuffer{});
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->status, og::InspectionStatus::Error);
  EXPECT_FALSE(err->run.succeeded());
  auto last = kernel.last_error("inspection");
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(last->run_code, og::RunErrc::ExecutorFailure);

  EXPECT_EQ(sink.results,
            (std::vector<og::InspectionStatus>{og::InspectionStatus::OK, og::InspectionStatus::NG,
                                               og::InspectionStatus::Error}));
  EXPECT_FALSE(kernel.drain_compute_events().empty());
  EXPECT_EQ(kernel.pool_stats().active_count, 0u);
}

TEST(KernelTest, RepeatedInspectionsKeepBuffersBounded) {
  og::OperatorRegistry registry;
  auto cfg = test_config();
  cfg.event_buffer_capacity = 6;
  cfg.scheduler_log_capacity = 10;
  og::Kernel kernel(cfg, registry);
  ASSERT_TRUE(kernel.add_flow(inspection_flow(2.0)));

  const cv::Mat img = image_with_blobs(1);
  for (int i = 0; i < 25; ++i) {
    auto r = kernel.inspect("inspection", og::fromCvMat(img));
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->status, og::InspectionStatus::OK) << r->message;
  }
  EXPECT_EQ(kernel.events().pending(), 6u);
  EXPECT_EQ(kernel.events().dropped(), 25u * 4u - 6u);
  EXPECT_EQ(kernel.runtime().get_scheduler_log().size(), 10u);
}

TEST(KernelTest, RunsSingleOperatorOutsideAFlow) {
  og::OperatorRegistry registry;
  og::Kernel kernel(test_config(), registry);

  auto node = og::ops::make_node("threshold", "bin", std::string("bin"));
  cv::Mat img(10, 10, CV_8UC1, cv::Scalar(200));
  auto result = kernel.run_node(node, {{"image", og::fromCvMat(img)}});
  ASSERT_TRUE(result.succeeded()) << result.record.error_message;
  auto out = og::toCvMat(std::get<og::ImageBuffer>(result.outputs.at("image")));
  EXPECT_EQ(cv::countNonZero(out), 100);

  auto missing = kernel.run_node(node, {});
  EXPECT_EQ(missing.record.status, og::NodeStatus::Failed);
  EXPECT_EQ(missing.record.error_code, og::RunErrc::MissingInput);
  EXPECT_TRUE(kernel.list_flows().empty());
}

TEST(KernelTest, JudgeMapsOutcomes) {
  og::RunOutcome failed;
  failed.status = og::RunStatus::Failed;
  failed.error_code = og::RunErrc::Timeout;
  EXPECT_EQ(og::InspectionService::judge(failed).status, og::InspectionStatus::Error);

  og::RunOutcome passed;
  passed.status = og::RunStatus::Succeeded;
  passed.outputs["judge.pass"] = true;
  passed.outputs["judge.defect_count"] = 0.0;
  EXPECT_EQ(og::InspectionService::judge(passed).status, og::InspectionStatus::OK);

  og::RunOutcome defects = passed;
  defects.outputs["other.defect_count"] = 2.0;
  auto r = og::InspectionService::judge(defects);
  EXPECT_EQ(r.status, og::InspectionStatus::NG);
  EXPECT_DOUBLE_EQ(r.defect_count, 2.0);
}

TEST(KernelTest, UnknownFlowIsReportedThroughLastError) {
  og::OperatorRegistry registry;
  og::Kernel kernel(test_config(), registry);
  EXPECT_FALSE(kernel.run("ghost", {}).has_value());
  auto err = kernel.last_error("ghost");
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->code, og::GraphErrc::NotFound);

  ASSERT_TRUE(kernel.add_flow(inspection_flow(1.0)));
  EXPECT_FALSE(kernel.add_flow(inspection_flow(1.0)));
  EXPECT_EQ(kernel.list_flows(), std::vector<std::string>{"inspection"});
  EXPECT_TRUE(kernel.close_flow("inspection"));
  EXPECT_FALSE(kernel.close_flow("inspection"));
}

TEST(KernelTest, TraversalQueriesAndTreeDump) {
  og::OperatorRegistry registry;
  og::Kernel kernel(test_config(), registry);
  ASSERT_TRUE(kernel.add_flow(inspection_flow(1.0)));

  auto ends = kernel.ending_nodes("inspection");
  ASSERT_TRUE(ends.has_value());
  EXPECT_EQ(*ends, std::vector<og::NodeId>{"judge"});

  auto layers = kernel.execution_layers("inspection");
  ASSERT_TRUE(layers.has_value());
  EXPECT_EQ(layers->size(), 4u);

  auto tree = kernel.dump_dependency_tree("inspection", std::nullopt, /*show_parameters*/ true);
  ASSERT_TRUE(tree.has_value());
  EXPECT_NE(tree->find("range_judge"), std::string::npos);
  EXPECT_NE(tree->find("max"), std::string::npos);

  auto report = kernel.validate("inspection");
  ASSERT_TRUE(report.has_value());
  EXPECT_TRUE(report->ok());

  auto params = kernel.validate_parameters("inspection");
  ASSERT_TRUE(params.has_value());
  EXPECT_TRUE(params->ok());
}

TEST(KernelTest, AsyncRunCanBeCancelled) {
  og::OperatorRegistry registry;
  registry.register_function("wait", [](const og::Node&, const og::ValueMap&, og::ExecutionContext& ctx) {
    ctx.cancellation().wait_for(std::chrono::seconds(10));
    return og::ExecutionOutcome::ok({{"out", 1.0}});
  });
  og::Kernel kernel(test_config(), registry);
  auto flow = std::make_shared<og::Flow>("waiting");
  og::Node n("W", "wait", std::string("W"));
  n.add_output("out", og::PortDataType::Scalar);
  flow->add_node(n);
  ASSERT_TRUE(kernel.add_flow(flow));

  auto handle = kernel.run_async("waiting", {});
  ASSERT_TRUE(handle.has_value());
  EXPECT_TRUE(kernel.run_status(handle->run_id).has_value());
  EXPECT_TRUE(kernel.cancel(handle->run_id));

  ASSERT_EQ(handle->outcome.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_EQ(handle->outcome.get().error_code, og::RunErrc::Cancelled);
}

TEST(KernelTest, LoadsInvertPlugin) {
  og::OperatorRegistry registry;
  og::Kernel kernel(test_config(), registry);
  ASSERT_FALSE(registry.contains("invert"));

  auto result = kernel.load_plugins();
  ASSERT_GE(result.loaded, 1) << (result.errors.empty() ? std::string("no plugin found")
                                                         : result.errors.front().message);
  ASSERT_TRUE(registry.contains("invert"));
  EXPECT_NE(kernel.plugins().op_sources().at("invert"), "built-in");
  EXPECT_EQ(kernel.plugins().op_sources().at("threshold"), "built-in");

  auto flow = std::make_shared<og::Flow>("inverted");
  og::Node inv("I", "invert", std::string("I"));
  inv.add_input("image", og::PortDataType::Image).add_output("image", og::PortDataType::Image);
  flow->add_node(inv);
  ASSERT_TRUE(kernel.add_flow(flow));

  cv::Mat img(8, 8, CV_8UC1, cv::Scalar(10));
  auto outcome = kernel.run("inverted", {{"image", og::fromCvMat(img)}});
  ASSERT_TRUE(outcome.has_value());
  ASSERT_TRUE(outcome->succeeded()) << outcome->error_message;
  cv::Mat out = og::toCvMat(std::get<og::ImageBuffer>(outcome->outputs.at("I.image")));
  EXPECT_EQ(out.at<uchar>(3, 3), 245);

  EXPECT_EQ(kernel.plugins().unload_all_plugins(), 1);
  EXPECT_FALSE(registry.contains("invert"));
}
