// opgraph kernel: operator executor capability and registry
#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "kernel/buffer_pool.hpp"
#include "kernel/cancellation.hpp"
#include "node.hpp"
#include "og_types.hpp"
#include "value.hpp"

namespace og {

struct ExecutionOutcome {
    bool success = false;
    ValueMap outputs;
    std::string error_message;
    double duration_ms = 0.0;

    static ExecutionOutcome ok(ValueMap outputs) {
        ExecutionOutcome o;
        o.success = true;
        o.outputs = std::move(outputs);
        return o;
    }
    static ExecutionOutcome failure(std::string message) {
        ExecutionOutcome o;
        o.error_message = std::move(message);
        return o;
    }
};

struct ValidationResult {
    bool is_valid = true;
    std::vector<std::string> errors;

    static ValidationResult valid() { return {}; }
    static ValidationResult invalid(std::string error) {
        ValidationResult r;
        r.add_error(std::move(error));
        return r;
    }
    void add_error(std::string error) {
        is_valid = false;
        errors.push_back(std::move(error));
    }
};

/**
 * @brief 单个节点一次执行的上下文。
 *
 * 携带 Run 的取消令牌，以及调度器为该节点从缓冲池借出的工作缓冲
 * （按端口名索引）。上下文随执行结束析构，借出的缓冲随之归还。
 */
class OPGRAPH_API ExecutionContext {
public:
    ExecutionContext(CancellationToken token, std::string run_id)
        : token_(std::move(token)), run_id_(std::move(run_id)) {}

    const CancellationToken& cancellation() const { return token_; }
    const std::string& run_id() const { return run_id_; }

    void attach_buffer(const std::string& port, BufferLease lease) {
        buffers_[port] = std::move(lease);
    }
    // nullptr when no pooled buffer was attached for the port.
    ImageBuffer* working_buffer(const std::string& port) {
        auto it = buffers_.find(port);
        return it == buffers_.end() ? nullptr : &it->second.buffer();
    }
    std::size_t buffer_count() const { return buffers_.size(); }

private:
    CancellationToken token_;
    std::string run_id_;
    std::map<std::string, BufferLease> buffers_;
};

// 由具体算子实现；必须可重复调用，且不得在调用结束后保留对输入的引用。
class OPGRAPH_API OperatorExecutor {
public:
    virtual ~OperatorExecutor() = default;

    virtual std::string type() const = 0;
    virtual ExecutionOutcome execute(const Node& node, const ValueMap& inputs, ExecutionContext& ctx) = 0;
    virtual ValidationResult validate(const Node& node) const { (void)node; return ValidationResult::valid(); }
};

using ExecuteFn = std::function<ExecutionOutcome(const Node&, const ValueMap&, ExecutionContext&)>;
using ValidateFn = std::function<ValidationResult(const Node&)>;

// Adapts plain callables to the executor interface.
class OPGRAPH_API FunctionExecutor : public OperatorExecutor {
public:
    FunctionExecutor(std::string type, ExecuteFn execute, ValidateFn validate = {})
        : type_(std::move(type)), execute_(std::move(execute)), validate_(std::move(validate)) {}

    std::string type() const override { return type_; }
    ExecutionOutcome execute(const Node& node, const ValueMap& inputs, ExecutionContext& ctx) override {
        return execute_(node, inputs, ctx);
    }
    ValidationResult validate(const Node& node) const override {
        return validate_ ? validate_(node) : ValidationResult::valid();
    }

private:
    std::string type_;
    ExecuteFn execute_;
    ValidateFn validate_;
};

class OPGRAPH_API OperatorRegistry {
public:
    static OperatorRegistry& instance();

    // Registering an existing type replaces its executor.
    void register_executor(std::shared_ptr<OperatorExecutor> executor);
    void register_function(const std::string& type, ExecuteFn execute, ValidateFn validate = {});

    std::shared_ptr<OperatorExecutor> find(const std::string& type) const;
    bool contains(const std::string& type) const;
    std::vector<std::string> get_keys() const;
    bool unregister_key(const std::string& type);

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<OperatorExecutor>> table_;
};

} // namespace og
