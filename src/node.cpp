#include "node.hpp"

namespace og {

Node::Node(std::string name, std::string type, std::optional<NodeId> id)
    : id_(id ? std::move(*id) : generate_id()),
      name_(std::move(name)),
      type_(std::move(type)) {
    if (id_.empty()) {
        throw GraphError(GraphErrc::InvalidParameter, "Node id must not be empty.");
    }
}

Node& Node::add_input(const std::string& port, PortDataType type, bool required) {
    inputs_[port] = Port{port, type, PortDirection::Input, required};
    return *this;
}

Node& Node::add_output(const std::string& port, PortDataType type) {
    outputs_[port] = Port{port, type, PortDirection::Output, false};
    return *this;
}

const Port* Node::find_input(const std::string& port) const {
    auto it = inputs_.find(port);
    return it == inputs_.end() ? nullptr : &it->second;
}

const Port* Node::find_output(const std::string& port) const {
    auto it = outputs_.find(port);
    return it == outputs_.end() ? nullptr : &it->second;
}

Node& Node::set_param(const std::string& key, Value value) {
    parameters_[key] = std::move(value);
    return *this;
}

const Value* Node::param(const std::string& key) const {
    auto it = parameters_.find(key);
    return it == parameters_.end() ? nullptr : &it->second;
}

} // namespace og
