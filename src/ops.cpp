#include "kernel/ops.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "adapter/buffer_adapter_opencv.hpp"
#include "kernel/param_utils.hpp"

namespace og { namespace ops {

namespace {

const ImageBuffer* image_input(const ValueMap& inputs, const std::string& port) {
    auto it = inputs.find(port);
    if (it == inputs.end()) return nullptr;
    return std::get_if<ImageBuffer>(&it->second);
}

// 8 位单通道视图，其他格式先转换
cv::Mat to_gray_u8(const cv::Mat& src) {
    cv::Mat gray = src;
    if (gray.channels() == 3) {
        cv::cvtColor(gray, gray, cv::COLOR_BGR2GRAY);
    } else if (gray.channels() == 4) {
        cv::cvtColor(gray, gray, cv::COLOR_BGRA2GRAY);
    }
    if (gray.depth() != CV_8U) {
        double scale = (gray.depth() == CV_32F || gray.depth() == CV_64F) ? 255.0 : 1.0;
        cv::Mat converted;
        gray.convertTo(converted, CV_8U, scale);
        gray = converted;
    }
    return gray;
}

// --- image_source ---

ExecutionOutcome op_image_source(const Node& node, const ValueMap& inputs, ExecutionContext& ctx) {
    ctx.cancellation().throw_if_cancelled();
    if (const ImageBuffer* in = image_input(inputs, "image"); in && !in->empty()) {
        return ExecutionOutcome::ok({{"image", *in}});
    }
    std::string path = as_str(node, "path");
    if (path.empty()) {
        return ExecutionOutcome::failure("image_source: no 'image' input and no 'path' parameter.");
    }
    cv::Mat img = cv::imread(path, cv::IMREAD_UNCHANGED);
    if (img.empty()) {
        return ExecutionOutcome::failure("image_source: failed to read image '" + path + "'.");
    }
    return ExecutionOutcome::ok({{"image", fromCvMat(img)}});
}

// --- gaussian_blur ---

constexpr int kMaxKernelSize = 255;

ValidationResult validate_gaussian_blur(const Node& node) {
    ValidationResult r;
    int k = as_int_flexible(node, "ksize", 3);
    if (k <= 0 || k % 2 == 0) r.add_error("ksize must be a positive odd number, got " + std::to_string(k) + ".");
    else if (k > kMaxKernelSize) r.add_error("ksize must not exceed " + std::to_string(kMaxKernelSize) + ".");
    if (as_double_flexible(node, "sigma", 0.0) < 0.0) r.add_error("sigma must not be negative.");
    return r;
}

ExecutionOutcome op_gaussian_blur(const Node& node, const ValueMap& inputs, ExecutionContext& ctx) {
    ctx.cancellation().throw_if_cancelled();
    const ImageBuffer* in = image_input(inputs, "image");
    if (!in) return ExecutionOutcome::failure("gaussian_blur: missing 'image' input.");

    int k = as_int_flexible(node, "ksize", 3);
    if (k > 0 && k % 2 == 0) k++;
    if (k <= 0) k = 1;
    if (k > kMaxKernelSize) {
        return ExecutionOutcome::failure("gaussian_blur: ksize " + std::to_string(k) + " exceeds " +
                                         std::to_string(kMaxKernelSize) + ".");
    }
    double sigma = as_double_flexible(node, "sigma", 0.0);

    cv::Mat blurred;
    cv::GaussianBlur(toCvMat(*in), blurred, cv::Size(k, k), sigma, 0, cv::BORDER_REPLICATE);
    return ExecutionOutcome::ok({{"image", fromCvMat(blurred)}});
}

// --- threshold ---

ValidationResult validate_threshold(const Node& node) {
    ValidationResult r;
    double t = as_double_flexible(node, "thresh", 128.0);
    double maxval = as_double_flexible(node, "maxval", 255.0);
    if (t < 0.0 || t > 255.0) r.add_error("thresh must be within [0, 255].");
    if (maxval <= 0.0 || maxval > 255.0) r.add_error("maxval must be within (0, 255].");
    return r;
}

ExecutionOutcome op_threshold(const Node& node, const ValueMap& inputs, ExecutionContext& ctx) {
    ctx.cancellation().throw_if_cancelled();
    const ImageBuffer* in = image_input(inputs, "image");
    if (!in) return ExecutionOutcome::failure("threshold: missing 'image' input.");

    cv::Mat gray = to_gray_u8(toCvMat(*in));
    int type = as_bool_flexible(node, "invert", false) ? cv::THRESH_BINARY_INV : cv::THRESH_BINARY;
    if (as_bool_flexible(node, "otsu", false)) type |= cv::THRESH_OTSU;

    cv::Mat binary;
    double actual = cv::threshold(gray, binary, as_double_flexible(node, "thresh", 128.0),
                                  as_double_flexible(node, "maxval", 255.0), type);
    return ExecutionOutcome::ok({{"image", fromCvMat(binary)}, {"threshold", actual}});
}

// --- blob_analysis ---

ValidationResult validate_blob_analysis(const Node& node) {
    if (as_double_flexible(node, "min_area", 0.0) < 0.0) {
        return ValidationResult::invalid("min_area must not be negative.");
    }
    return ValidationResult::valid();
}

ExecutionOutcome op_blob_analysis(const Node& node, const ValueMap& inputs, ExecutionContext& ctx) {
    ctx.cancellation().throw_if_cancelled();
    const ImageBuffer* in = image_input(inputs, "image");
    if (!in) return ExecutionOutcome::failure("blob_analysis: missing 'image' input.");

    cv::Mat binary = to_gray_u8(toCvMat(*in));

    // 开运算去除孤立噪点；优先写入缓冲池借出的工作缓冲
    cv::Mat cleaned;
    ImageBuffer* scratch = ctx.working_buffer("image");
    if (scratch && scratch->width == binary.cols && scratch->height == binary.rows &&
        scratch->channels == 1 && scratch->type == DataType::UINT8) {
        cleaned = toCvMat(*scratch);
    }
    cv::morphologyEx(binary, cleaned, cv::MORPH_OPEN,
                     cv::getStructuringElement(cv::MORPH_RECT, cv::Size(3, 3)));

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(cleaned, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    const double min_area = as_double_flexible(node, "min_area", 0.0);
    PointSet centroids;
    for (const auto& contour : contours) {
        cv::Moments m = cv::moments(contour);
        if (m.m00 <= 0.0 || m.m00 < min_area) continue;
        centroids.emplace_back(m.m10 / m.m00, m.m01 / m.m00);
    }
    const double count = static_cast<double>(centroids.size());
    return ExecutionOutcome::ok({{"count", count}, {"centroids", std::move(centroids)}});
}

// --- range_judge ---

ValidationResult validate_range_judge(const Node& node) {
    if (as_double_flexible(node, "min", 0.0) > as_double_flexible(node, "max", 0.0)) {
        return ValidationResult::invalid("min must not exceed max.");
    }
    return ValidationResult::valid();
}

ExecutionOutcome op_range_judge(const Node& node, const ValueMap& inputs, ExecutionContext& ctx) {
    ctx.cancellation().throw_if_cancelled();
    auto it = inputs.find("value");
    const double* v = it == inputs.end() ? nullptr : std::get_if<double>(&it->second);
    if (!v) return ExecutionOutcome::failure("range_judge: missing 'value' input.");

    const double lo = as_double_flexible(node, "min", 0.0);
    const double hi = as_double_flexible(node, "max", 0.0);
    const bool pass = *v >= lo && *v <= hi;
    return ExecutionOutcome::ok({{"pass", pass},
                                 {"defect_count", pass ? 0.0 : 1.0},
                                 {"verdict", std::string(pass ? "OK" : "NG")}});
}

} // namespace

std::vector<std::string> builtin_types() {
    return {"image_source", "gaussian_blur", "threshold", "blob_analysis", "range_judge"};
}

void register_builtin(OperatorRegistry& R) {
    R.register_function("image_source", op_image_source);
    R.register_function("gaussian_blur", op_gaussian_blur, validate_gaussian_blur);
    R.register_function("threshold", op_threshold, validate_threshold);
    R.register_function("blob_analysis", op_blob_analysis, validate_blob_analysis);
    R.register_function("range_judge", op_range_judge, validate_range_judge);
}

Node make_node(const std::string& type, const std::string& name, std::optional<NodeId> id) {
    Node n(name, type, std::move(id));
    if (type == "image_source") {
        n.add_input("image", PortDataType::Image, false)
         .add_output("image", PortDataType::Image);
    } else if (type == "gaussian_blur") {
        n.add_input("image", PortDataType::Image)
         .add_output("image", PortDataType::Image)
         .set_param("ksize", 3.0)
         .set_param("sigma", 0.0);
    } else if (type == "threshold") {
        n.add_input("image", PortDataType::Image)
         .add_output("image", PortDataType::Image)
         .add_output("threshold", PortDataType::Scalar)
         .set_param("thresh", 128.0)
         .set_param("maxval", 255.0)
         .set_param("otsu", false)
         .set_param("invert", false);
    } else if (type == "blob_analysis") {
        n.add_input("image", PortDataType::Image)
         .add_output("count", PortDataType::Scalar)
         .add_output("centroids", PortDataType::PointSet)
         .set_param("min_area", 0.0);
    } else if (type == "range_judge") {
        n.add_input("value", PortDataType::Scalar)
         .add_output("pass", PortDataType::Boolean)
         .add_output("defect_count", PortDataType::Scalar)
         .add_output("verdict", PortDataType::Text)
         .set_param("min", 0.0)
         .set_param("max", 0.0);
    } else {
        throw GraphError(GraphErrc::NotFound, "Unknown built-in operator type '" + type + "'.");
    }
    return n;
}

}} // namespace og::ops
