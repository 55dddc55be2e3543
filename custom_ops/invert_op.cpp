#include <opencv2/core.hpp>

#include "plugin_api.hpp"
#include "adapter/buffer_adapter_opencv.hpp"

namespace {

// 对整幅图像取反：8 位图像按 255 取反，浮点图像按 1.0 取反
og::ExecutionOutcome op_invert(const og::Node&, const og::ValueMap& inputs, og::ExecutionContext& ctx) {
    ctx.cancellation().throw_if_cancelled();
    auto it = inputs.find("image");
    const og::ImageBuffer* in = it == inputs.end() ? nullptr : std::get_if<og::ImageBuffer>(&it->second);
    if (!in || in->empty()) {
        return og::ExecutionOutcome::failure("invert requires one valid input image.");
    }

    cv::Mat src = og::toCvMat(*in);
    cv::Mat dst;
    if (src.depth() == CV_32F || src.depth() == CV_64F) {
        cv::subtract(cv::Scalar::all(1.0), src, dst);
    } else {
        cv::bitwise_not(src, dst);
    }
    return og::ExecutionOutcome::ok({{"image", og::fromCvMat(dst)}});
}

} // namespace

extern "C" OPGRAPH_PLUGIN_API void register_opgraph_ops(og::OperatorRegistry& registry) {
    registry.register_function("invert", op_invert);
}
