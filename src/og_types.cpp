#include "og_types.hpp"
#include "image_buffer.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace og {

const char* to_string(GraphErrc code) {
    switch (code) {
        case GraphErrc::Unknown:               return "Unknown";
        case GraphErrc::NotFound:              return "NotFound";
        case GraphErrc::Io:                    return "Io";
        case GraphErrc::InvalidParameter:      return "InvalidParameter";
        case GraphErrc::DuplicateNodeId:       return "DuplicateNodeId";
        case GraphErrc::UnknownNode:           return "UnknownNode";
        case GraphErrc::UnknownPort:           return "UnknownPort";
        case GraphErrc::PortDirectionMismatch: return "PortDirectionMismatch";
        case GraphErrc::PortTypeMismatch:      return "PortTypeMismatch";
        case GraphErrc::InputAlreadyBound:     return "InputAlreadyBound";
        case GraphErrc::SelfConnection:        return "SelfConnection";
        case GraphErrc::CycleDetected:         return "CycleDetected";
        case GraphErrc::CapacityExceeded:      return "CapacityExceeded";
        case GraphErrc::PoolExhausted:         return "PoolExhausted";
        case GraphErrc::PoolShutdown:          return "PoolShutdown";
        case GraphErrc::Cancelled:             return "Cancelled";
    }
    return "Unknown";
}

const char* to_string(RunErrc code) {
    switch (code) {
        case RunErrc::None:            return "None";
        case RunErrc::GraphInvalid:    return "GraphInvalid";
        case RunErrc::MissingInput:    return "MissingInput";
        case RunErrc::ExecutorFailure: return "ExecutorFailure";
        case RunErrc::Timeout:         return "Timeout";
        case RunErrc::Cancelled:       return "Cancelled";
    }
    return "None";
}

const char* to_string(PortDataType type) {
    switch (type) {
        case PortDataType::Image:    return "Image";
        case PortDataType::Scalar:   return "Scalar";
        case PortDataType::PointSet: return "PointSet";
        case PortDataType::Text:     return "Text";
        case PortDataType::Boolean:  return "Boolean";
        case PortDataType::Any:      return "Any";
    }
    return "Any";
}

const char* to_string(PortDirection direction) {
    return direction == PortDirection::Input ? "Input" : "Output";
}

const char* to_string(NodeStatus status) {
    switch (status) {
        case NodeStatus::Pending:   return "Pending";
        case NodeStatus::Running:   return "Running";
        case NodeStatus::Succeeded: return "Succeeded";
        case NodeStatus::Failed:    return "Failed";
        case NodeStatus::Skipped:   return "Skipped";
        case NodeStatus::Cancelled: return "Cancelled";
    }
    return "Pending";
}

std::string generate_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << rng();
    return oss.str();
}

std::string to_string(const ShapeKey& key) {
    static const char* names[] = {"u8", "s8", "u16", "s16", "f32", "f64"};
    std::ostringstream oss;
    oss << key.width << "x" << key.height << "x" << key.channels << ":"
        << names[static_cast<int>(key.type)];
    return oss.str();
}

} // namespace og
