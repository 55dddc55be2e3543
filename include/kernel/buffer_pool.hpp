// opgraph kernel: BufferPool - reusable native image buffers shared by all runs
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

#include "image_buffer.hpp"
#include "kernel/cancellation.hpp"
#include "og_types.hpp"

namespace og {

struct BufferPoolOptions {
    std::size_t budget_bytes = std::size_t(512) * 1024 * 1024;
    // 每个 ShapeKey 最多保留的空闲缓冲数，超出时归还即释放
    std::size_t max_idle_per_key = 10;
    // 池满时 acquire 的最长等待时间
    std::chrono::milliseconds acquire_wait{2000};
    bool quiet = true;
};

struct BufferPoolStats {
    std::size_t budget_bytes = 0;
    std::size_t footprint_bytes = 0;  // idle + active
    std::size_t idle_bytes = 0;
    std::size_t active_count = 0;
    std::size_t idle_count = 0;
    std::uint64_t allocations = 0;
    std::uint64_t reuses = 0;
    std::uint64_t releases = 0;
    std::uint64_t evictions = 0;
    std::uint64_t detached = 0;

    double hit_rate() const {
        auto total = allocations + reuses;
        return total == 0 ? 0.0 : static_cast<double>(reuses) / static_cast<double>(total);
    }
};

class BufferPool;

/**
 * @brief 缓冲池借出凭证（RAII）。
 *
 * 析构或调用 release() 时把缓冲归还给池；只可移动，不可复制。
 * 持有池内部状态的共享引用，因此即使在池 shutdown 之后归还也是安全的，
 * 此时内存被直接释放。
 */
class OPGRAPH_API BufferLease {
public:
    BufferLease() = default;
    ~BufferLease();

    BufferLease(BufferLease&& other) noexcept;
    BufferLease& operator=(BufferLease&& other) noexcept;
    BufferLease(const BufferLease&) = delete;
    BufferLease& operator=(const BufferLease&) = delete;

    explicit operator bool() const { return static_cast<bool>(core_); }

    // View of the pooled memory. Copies that are still alive when the lease is
    // released detach the block from the pool instead of recycling it.
    ImageBuffer& buffer() { return buffer_; }
    const ImageBuffer& buffer() const { return buffer_; }
    const ShapeKey& key() const { return key_; }

    void release();

private:
    friend class BufferPool;
    struct Core;
    BufferLease(std::shared_ptr<Core> core, std::uint64_t block_id, ShapeKey key, ImageBuffer buffer)
        : core_(std::move(core)), block_id_(block_id), key_(key), buffer_(std::move(buffer)) {}

    std::shared_ptr<Core> core_;
    std::uint64_t block_id_ = 0;
    ShapeKey key_;
    ImageBuffer buffer_;
};

/**
 * @brief 跨 Run 共享的缓冲池，所有可变操作在内部加锁。
 *
 * - acquire：同 key 有空闲缓冲则复用，否则分配；为腾出预算会先按 LRU 淘汰空闲缓冲。
 *   单个请求超过整个预算时在任何淘汰之前直接抛出 CapacityExceeded。
 *   活跃缓冲占满预算时进行有界、可取消的等待，超时抛出 PoolExhausted。
 * - release（由 BufferLease 触发）：放回空闲集合，或按保留策略释放。
 * - shutdown：确定性地释放所有空闲缓冲，之后拒绝新的 acquire。
 */
class OPGRAPH_API BufferPool {
public:
    explicit BufferPool(BufferPoolOptions options = {});
    ~BufferPool();

    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    BufferLease acquire(const ShapeKey& key, const CancellationToken& token = {});

    void shutdown();
    bool is_shut_down() const;

    // Frees every idle buffer without shutting the pool down.
    std::size_t trim();

    BufferPoolStats stats() const;
    const BufferPoolOptions& options() const { return options_; }

private:
    BufferPoolOptions options_;
    std::shared_ptr<BufferLease::Core> core_;
};

} // namespace og
