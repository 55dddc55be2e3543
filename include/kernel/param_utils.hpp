#pragma once
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>

#include "node.hpp"
#include "value.hpp"

namespace og {

/**
 * @brief 从节点参数中宽松地提取一个 double 值。
 * @param node 节点。
 * @param key 参数名。
 * @param defv 参数不存在或无法转换时返回的默认值。
 * @return 提取到的值或默认值。Boolean 映射为 0/1，Text 按数字解析。
 */
inline double as_double_flexible(const Node& node, const std::string& key, double defv) {
    const Value* v = node.param(key);
    if (!v) return defv;
    if (auto d = std::get_if<double>(v)) return *d;
    if (auto b = std::get_if<bool>(v)) return *b ? 1.0 : 0.0;
    if (auto s = std::get_if<std::string>(v)) {
        char* end = nullptr;
        double parsed = std::strtod(s->c_str(), &end);
        if (end != s->c_str() && *end == '\0') return parsed;
    }
    return defv;
}

/**
 * @brief 从节点参数中宽松地提取一个 int 值。
 *
 * 超出 int 范围的值截断到 int 的上下限，NaN 返回默认值。
 */
inline int as_int_flexible(const Node& node, const std::string& key, int defv) {
    const double d = as_double_flexible(node, key, static_cast<double>(defv));
    if (std::isnan(d)) return defv;
    if (d >= static_cast<double>(std::numeric_limits<int>::max())) return std::numeric_limits<int>::max();
    if (d <= static_cast<double>(std::numeric_limits<int>::min())) return std::numeric_limits<int>::min();
    return static_cast<int>(d);
}

inline bool as_bool_flexible(const Node& node, const std::string& key, bool defv) {
    const Value* v = node.param(key);
    if (!v) return defv;
    if (auto b = std::get_if<bool>(v)) return *b;
    if (auto d = std::get_if<double>(v)) return *d != 0.0;
    if (auto s = std::get_if<std::string>(v)) {
        if (*s == "true" || *s == "1" || *s == "yes") return true;
        if (*s == "false" || *s == "0" || *s == "no") return false;
    }
    return defv;
}

/**
 * @brief 从节点参数中提取一个 string 值。
 */
inline std::string as_str(const Node& node, const std::string& key, const std::string& defv = {}) {
    const Value* v = node.param(key);
    if (!v) return defv;
    if (auto s = std::get_if<std::string>(v)) return *s;
    return defv;
}

} // namespace og
