#include "kernel/operator_executor.hpp"

#include <algorithm>

namespace og {

OperatorRegistry& OperatorRegistry::instance() {
    static OperatorRegistry inst;
    return inst;
}

void OperatorRegistry::register_executor(std::shared_ptr<OperatorExecutor> executor) {
    if (!executor) {
        throw GraphError(GraphErrc::InvalidParameter, "Cannot register a null operator executor.");
    }
    auto key = executor->type();
    std::lock_guard<std::mutex> lk(mutex_);
    table_[key] = std::move(executor);
}

void OperatorRegistry::register_function(const std::string& type, ExecuteFn execute, ValidateFn validate) {
    register_executor(std::make_shared<FunctionExecutor>(type, std::move(execute), std::move(validate)));
}

std::shared_ptr<OperatorExecutor> OperatorRegistry::find(const std::string& type) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = table_.find(type);
    if (it == table_.end()) return nullptr;
    return it->second;
}

bool OperatorRegistry::contains(const std::string& type) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return table_.count(type) > 0;
}

std::vector<std::string> OperatorRegistry::get_keys() const {
    std::vector<std::string> keys;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        keys.reserve(table_.size());
        for (const auto& pair : table_) keys.push_back(pair.first);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

bool OperatorRegistry::unregister_key(const std::string& type) {
    std::lock_guard<std::mutex> lk(mutex_);
    return table_.erase(type) > 0;
}

} // namespace og
