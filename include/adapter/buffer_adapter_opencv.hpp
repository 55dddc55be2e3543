#pragma once

#include "image_buffer.hpp"
#include <opencv2/core.hpp>

namespace og {

/**
 * @brief 将 ImageBuffer 转换为 cv::Mat 视图。
 * @note 零拷贝：返回的 Mat 直接指向 buffer 的内存，不持有引用计数，
 *       调用方必须保证 buffer 在 Mat 使用期间存活。
 * @return 一个 cv::Mat 对象。
 */
OPGRAPH_API cv::Mat toCvMat(const ImageBuffer& buffer);

/**
 * @brief 将一个 cv::Mat 包装为 ImageBuffer。
 * @note 零拷贝操作。返回的 ImageBuffer 通过 std::shared_ptr
 *       共享 cv::Mat 的内存和引用计数，确保内存安全。
 *       非连续的 Mat（例如 ROI）保留其 step。
 * @param mat 输入的 cv::Mat。
 * @return 一个 ImageBuffer。
 */
OPGRAPH_API ImageBuffer fromCvMat(const cv::Mat& mat);

OPGRAPH_API int toCvType(DataType type, int channels);
OPGRAPH_API DataType fromCvType(int cv_type);

} // namespace og
