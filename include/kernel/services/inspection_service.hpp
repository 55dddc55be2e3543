#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "flow.hpp"
#include "image_buffer.hpp"
#include "kernel/scheduler.hpp"

namespace og {

enum class InspectionStatus { OK, NG, Error };

OPGRAPH_API const char* to_string(InspectionStatus status);

struct InspectionResult {
  InspectionStatus status = InspectionStatus::Error;
  double defect_count = 0.0;
  std::string message;
  RunOutcome run;
};

// Receives every inspection verdict (e.g. a results repository).
class OPGRAPH_API ResultSink {
 public:
  virtual ~ResultSink() = default;
  virtual void consume(const InspectionResult& result) = 0;
};

/**
 * @brief 一次检测：以图像作为根输入 "image" 执行 Flow，并把 Run 结果映射为判定。
 *
 * - Run 失败 -> Error
 * - 任一终端节点输出 pass == false，或 defect_count 之和 > 0 -> NG
 * - 否则 -> OK
 */
class OPGRAPH_API InspectionService {
 public:
  static constexpr const char* kImageInput = "image";

  explicit InspectionService(Scheduler& scheduler, ResultSink* sink = nullptr)
      : scheduler_(scheduler), sink_(sink) {}

  void set_sink(ResultSink* sink) { sink_ = sink; }

  InspectionResult inspect(const Flow& flow, const ImageBuffer& image,
                           std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  // Verdict mapping only; exposed for callers that run flows themselves.
  static InspectionResult judge(RunOutcome outcome);

 private:
  Scheduler& scheduler_;
  ResultSink* sink_;
};

}  // namespace og
