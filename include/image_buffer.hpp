#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "og_types.hpp"

namespace og {

// 描述像素数据类型，实现与具体库解耦
enum class DataType {
    UINT8, INT8, UINT16, INT16, FLOAT32, FLOAT64
};

inline std::size_t element_size(DataType type) {
    switch (type) {
        case DataType::UINT8:
        case DataType::INT8:    return 1;
        case DataType::UINT16:
        case DataType::INT16:   return 2;
        case DataType::FLOAT32: return 4;
        case DataType::FLOAT64: return 8;
    }
    return 0;
}

// 通用的、与具体库无关的图像数据描述符。
// 算子之间传递的 Image 值都以这种形式出现。
struct ImageBuffer {
    int width = 0;
    int height = 0;
    int channels = 0;
    DataType type = DataType::UINT8;
    std::size_t step = 0; // 每行字节数 (stride)

    // 带自定义删除器的 shared_ptr 统一管理不同来源的内存：
    // 自己分配的、来自 OpenCV 的、或者缓冲池借出的。
    std::shared_ptr<void> data = nullptr;

    bool empty() const { return !data || width <= 0 || height <= 0; }
};

/**
 * @brief 缓冲池的键：宽、高、通道数与元素类型共同决定一块缓冲的大小与布局。
 */
struct ShapeKey {
    int width = 0;
    int height = 0;
    int channels = 1;
    DataType type = DataType::UINT8;

    std::size_t row_bytes() const {
        return static_cast<std::size_t>(width) * static_cast<std::size_t>(channels) * element_size(type);
    }
    std::size_t bytes() const { return row_bytes() * static_cast<std::size_t>(height); }

    bool operator==(const ShapeKey& o) const {
        return width == o.width && height == o.height && channels == o.channels && type == o.type;
    }
    bool operator!=(const ShapeKey& o) const { return !(*this == o); }
};

struct ShapeKeyHash {
    std::size_t operator()(const ShapeKey& k) const noexcept {
        std::size_t h = std::hash<int>()(k.width);
        h = h * 31 + std::hash<int>()(k.height);
        h = h * 31 + std::hash<int>()(k.channels);
        h = h * 31 + std::hash<int>()(static_cast<int>(k.type));
        return h;
    }
};

inline ShapeKey shape_of(const ImageBuffer& buffer) {
    return ShapeKey{buffer.width, buffer.height, buffer.channels, buffer.type};
}

OPGRAPH_API std::string to_string(const ShapeKey& key);

} // namespace og
