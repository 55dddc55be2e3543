#include "value.hpp"

#include <sstream>
#include <type_traits>

namespace og {

std::optional<PortDataType> type_of(const Value& value) {
    return std::visit([](const auto& v) -> std::optional<PortDataType> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, ImageBuffer>) {
            return PortDataType::Image;
        } else if constexpr (std::is_same_v<T, double>) {
            return PortDataType::Scalar;
        } else if constexpr (std::is_same_v<T, PointSet>) {
            return PortDataType::PointSet;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return PortDataType::Text;
        } else {
            static_assert(std::is_same_v<T, bool>, "non-exhaustive Value visitor");
            return PortDataType::Boolean;
        }
    }, value);
}

bool value_matches(const Value& value, PortDataType type) {
    auto actual = type_of(value);
    if (!actual) return false;
    return type == PortDataType::Any || *actual == type;
}

std::string describe(const Value& value) {
    std::ostringstream oss;
    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "<empty>";
        } else if constexpr (std::is_same_v<T, ImageBuffer>) {
            oss << "Image(" << to_string(shape_of(v)) << ")";
        } else if constexpr (std::is_same_v<T, double>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, PointSet>) {
            oss << "PointSet[" << v.size() << "]";
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << '"' << v << '"';
        } else {
            oss << (v ? "true" : "false");
        }
    }, value);
    return oss.str();
}

} // namespace og
