#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "kernel/cancellation.hpp"
#include "kernel/execution_status.hpp"

TEST(ExecutionStatusTest, LifecycleTransitions) {
  og::ExecutionStatusTable table({"a", "b"});
  EXPECT_EQ(table.size(), 2u);
  EXPECT_EQ(table.count(og::NodeStatus::Pending), 2u);
  EXPECT_DOUBLE_EQ(table.progress(), 0.0);

  EXPECT_TRUE(table.mark_running("a"));
  EXPECT_FALSE(table.mark_running("a"));
  auto a = table.get("a");
  ASSERT_TRUE(a.has_value());
  EXPECT_EQ(a->status, og::NodeStatus::Running);
  EXPECT_TRUE(a->started_at.has_value());

  EXPECT_TRUE(table.finish("a", og::NodeStatus::Succeeded, 12.5));
  EXPECT_DOUBLE_EQ(table.progress(), 50.0);

  // 终态不可被覆盖：迟到的结果被丢弃
  EXPECT_FALSE(table.finish("a", og::NodeStatus::Failed, 1.0, "late", og::RunErrc::ExecutorFailure));
  a = table.get("a");
  EXPECT_EQ(a->status, og::NodeStatus::Succeeded);
  EXPECT_DOUBLE_EQ(a->duration_ms, 12.5);
  EXPECT_TRUE(a->error_message.empty());

  EXPECT_TRUE(table.finish("b", og::NodeStatus::Skipped, 0.0, "upstream failed"));
  EXPECT_FALSE(table.mark_running("b"));
  EXPECT_DOUBLE_EQ(table.progress(), 100.0);
  EXPECT_FALSE(table.get("missing").has_value());
}

TEST(ExecutionStatusTest, TablesAreIndependent) {
  og::ExecutionStatusTable first({"n"});
  og::ExecutionStatusTable second({"n"});
  first.finish("n", og::NodeStatus::Failed, 0.0, "boom", og::RunErrc::ExecutorFailure);
  EXPECT_EQ(second.get("n")->status, og::NodeStatus::Pending);
  EXPECT_EQ(first.snapshot().at("n").error_code, og::RunErrc::ExecutorFailure);
}

TEST(ExecutionStatusTest, ConcurrentUpdatesOnDistinctNodes) {
  constexpr int kNodes = 64;
  std::vector<og::NodeId> ids;
  for (int i = 0; i < kNodes; ++i) ids.push_back("node-" + std::to_string(i));
  og::ExecutionStatusTable table(ids);

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t] {
      for (int i = t; i < kNodes; i += 4) {
        table.mark_running(ids[i]);
        table.finish(ids[i], og::NodeStatus::Succeeded, static_cast<double>(i));
      }
    });
  }
  // 同时读取快照不应阻塞或看到不一致的条目
  std::atomic<bool> saw_inconsistent{false};
  std::thread reader([&] {
    for (int k = 0; k < 100; ++k) {
      for (const auto& [id, rec] : table.snapshot()) {
        if (rec.status == og::NodeStatus::Succeeded && !rec.started_at) saw_inconsistent = true;
      }
    }
  });
  for (auto& th : threads) th.join();
  reader.join();

  EXPECT_FALSE(saw_inconsistent);
  EXPECT_EQ(table.count(og::NodeStatus::Succeeded), static_cast<std::size_t>(kNodes));
}

TEST(ExecutionStatusTest, EnsureAndUpdate) {
  og::ExecutionStatusTable table;
  table.ensure("late");
  table.update("late", [](og::NodeExecutionRecord& r) {
    r.status = og::NodeStatus::Cancelled;
    r.error_code = og::RunErrc::Cancelled;
  });
  EXPECT_EQ(table.get("late")->status, og::NodeStatus::Cancelled);
  EXPECT_EQ(table.size(), 1u);
}

TEST(CancellationTest, DeadlineTripsTimeout) {
  og::CancellationSource source(og::Clock::now() + std::chrono::milliseconds(30));
  auto token = source.token();
  EXPECT_FALSE(token.is_cancelled());
  EXPECT_TRUE(token.wait_for(std::chrono::milliseconds(2000)));
  EXPECT_EQ(token.reason(), og::CancelReason::Timeout);

  // 先记录的原因优先
  source.cancel(og::CancelReason::Cancelled);
  EXPECT_EQ(token.reason(), og::CancelReason::Timeout);
}

TEST(CancellationTest, ExplicitCancelWakesWaiters) {
  og::CancellationSource source;
  auto token = source.token();
  std::thread t([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    source.cancel();
  });
  EXPECT_TRUE(token.wait_for(std::chrono::milliseconds(5000)));
  t.join();
  EXPECT_EQ(token.reason(), og::CancelReason::Cancelled);
  EXPECT_THROW(token.throw_if_cancelled(), og::GraphError);

  og::CancellationToken never;
  EXPECT_FALSE(never.is_cancelled());
  EXPECT_FALSE(never.wait_for(std::chrono::milliseconds(1)));
}
