#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>

namespace og {
namespace fs = std::filesystem;

#if defined(_WIN32)
    #if defined(OPGRAPH_LIB_BUILD)
        #define OPGRAPH_API __declspec(dllexport)
    #else
        #define OPGRAPH_API __declspec(dllimport)
    #endif
#else // Non-Windows platforms
    #if defined(OPGRAPH_LIB_BUILD)
        #define OPGRAPH_API __attribute__((visibility("default")))
    #else
        #define OPGRAPH_API
    #endif
#endif

// 图编辑与资源层面的错误码；节点执行失败不走异常，见 RunErrc
enum class GraphErrc {
    Unknown = 1, NotFound, Io, InvalidParameter,
    DuplicateNodeId, UnknownNode, UnknownPort, PortDirectionMismatch,
    PortTypeMismatch, InputAlreadyBound, SelfConnection, CycleDetected,
    CapacityExceeded, PoolExhausted, PoolShutdown, Cancelled,
};

OPGRAPH_API const char* to_string(GraphErrc code);

struct OPGRAPH_API GraphError : public std::runtime_error {
    explicit GraphError(const std::string& what)
        : std::runtime_error(what), code_(GraphErrc::Unknown) {}
    GraphError(GraphErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    GraphErrc code() const noexcept { return code_; }
private:
    GraphErrc code_;
};

// Run-level / node-level error taxonomy recorded in outcomes and status tables.
enum class RunErrc {
    None, GraphInvalid, MissingInput, ExecutorFailure, Timeout, Cancelled,
};

OPGRAPH_API const char* to_string(RunErrc code);

using NodeId = std::string;

enum class PortDataType { Image, Scalar, PointSet, Text, Boolean, Any };
enum class PortDirection { Input, Output };

OPGRAPH_API const char* to_string(PortDataType type);
OPGRAPH_API const char* to_string(PortDirection direction);

// Equal tags are compatible; Any on either side accepts everything.
inline bool is_compatible(PortDataType source, PortDataType target) {
    return source == target || source == PortDataType::Any || target == PortDataType::Any;
}

enum class NodeStatus { Pending, Running, Succeeded, Failed, Skipped, Cancelled };

OPGRAPH_API const char* to_string(NodeStatus status);

inline bool is_terminal(NodeStatus status) {
    return status != NodeStatus::Pending && status != NodeStatus::Running;
}

// Random 16 hex digit identifier, used for nodes, flows and runs.
OPGRAPH_API std::string generate_id();

// "<node id>.<port>" addressing for initial inputs and terminal outputs.
inline std::string make_port_key(const NodeId& node_id, const std::string& port) {
    return node_id + "." + port;
}

} // namespace og
