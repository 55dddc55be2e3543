#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>
#include <opencv2/core/types.hpp>

#include "image_buffer.hpp"
#include "og_types.hpp"

namespace og {

using PointSet = std::vector<cv::Point2d>;

// 端口值、初始输入与参数共用的封闭标签联合。
// monostate 表示 "空"，不满足任何必需输入。
using Value = std::variant<std::monostate, ImageBuffer, double, PointSet, std::string, bool>;

using ValueMap = std::unordered_map<std::string, Value>;
using ParamMap = std::unordered_map<std::string, Value>;

// Data-type tag of a value; nullopt for the empty alternative.
OPGRAPH_API std::optional<PortDataType> type_of(const Value& value);

// True when a non-empty value may be bound to a port of the given type.
OPGRAPH_API bool value_matches(const Value& value, PortDataType type);

// Short human-readable rendering used by the CLI and diagnostics.
OPGRAPH_API std::string describe(const Value& value);

} // namespace og
