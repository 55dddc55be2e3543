#pragma once
#include <map>
#include <optional>
#include <string>

#include "image_buffer.hpp"
#include "og_types.hpp"
#include "value.hpp"

namespace og {

struct Port {
    std::string name;
    PortDataType type = PortDataType::Any;
    PortDirection direction = PortDirection::Input;
    bool required = true; // 仅对输入端口有意义
};

// 调度器写入的上一次执行摘要，由 Flow 在自身互斥锁下保存
struct LastExecution {
    NodeStatus status = NodeStatus::Pending;
    double duration_ms = 0.0;
    std::string error_message;
    std::string run_id;
};

/**
 * @class Node
 * @brief 图中的一个算子实例。
 *
 * - id：构造时确定且之后不可更改；可传入已有 id 以复现导入数据的身份，
 *   否则随机生成。
 * - type：绑定到哪一个 OperatorExecutor。
 * - inputs / outputs：按端口名索引的端口描述。
 * - parameters：类型化参数（默认值 + 用户覆盖）。
 * - enabled：被禁用的节点不会执行，记为 Skipped。
 * - working_size：声明后，调度器为该节点的每个 Image 端口从缓冲池借出一块工作缓冲。
 */
class OPGRAPH_API Node {
public:
    Node(std::string name, std::string type, std::optional<NodeId> id = std::nullopt);

    const NodeId& id() const { return id_; }
    const std::string& name() const { return name_; }
    const std::string& type() const { return type_; }

    Node& add_input(const std::string& port, PortDataType type, bool required = true);
    Node& add_output(const std::string& port, PortDataType type);

    const std::map<std::string, Port>& inputs() const { return inputs_; }
    const std::map<std::string, Port>& outputs() const { return outputs_; }
    const Port* find_input(const std::string& port) const;
    const Port* find_output(const std::string& port) const;

    Node& set_param(const std::string& key, Value value);
    const ParamMap& parameters() const { return parameters_; }
    const Value* param(const std::string& key) const;

    bool enabled() const { return enabled_; }
    Node& set_enabled(bool enabled) { enabled_ = enabled; return *this; }

    const std::optional<ShapeKey>& working_size() const { return working_size_; }
    Node& set_working_size(const ShapeKey& key) { working_size_ = key; return *this; }

private:
    NodeId id_;
    std::string name_;
    std::string type_;
    std::map<std::string, Port> inputs_;
    std::map<std::string, Port> outputs_;
    ParamMap parameters_;
    bool enabled_ = true;
    std::optional<ShapeKey> working_size_;
};

} // namespace og
