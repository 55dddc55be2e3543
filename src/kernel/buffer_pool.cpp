// opgraph kernel: BufferPool implementation
#include "kernel/buffer_pool.hpp"

#include <algorithm>
#include <condition_variable>
#include <iostream>
#include <list>
#include <mutex>
#include <unordered_map>
#include <vector>

#include <opencv2/core.hpp>

namespace og {

struct BufferLease::Core {
    struct Block {
        ShapeKey key;
        std::size_t bytes = 0;
        std::shared_ptr<void> memory;
        bool checked_out = true;
        std::list<std::uint64_t>::iterator lru_pos;
    };

    explicit Core(const BufferPoolOptions& opts) : options(opts) {}

    BufferPoolOptions options;
    std::mutex mutex;
    std::condition_variable cv;

    std::unordered_map<std::uint64_t, Block> blocks;
    std::unordered_map<ShapeKey, std::vector<std::uint64_t>, ShapeKeyHash> idle_by_key;
    std::list<std::uint64_t> lru;  // idle block ids, front = least recently used
    std::uint64_t next_id = 1;
    std::size_t footprint = 0;
    std::size_t idle_bytes = 0;
    bool shut_down = false;
    BufferPoolStats counters;

    // 以下 *_locked 函数要求调用方已持有 mutex
    void free_idle_locked(std::uint64_t id) {
        auto it = blocks.find(id);
        Block& b = it->second;
        lru.erase(b.lru_pos);
        auto& idle = idle_by_key[b.key];
        idle.erase(std::remove(idle.begin(), idle.end(), id), idle.end());
        if (idle.empty()) idle_by_key.erase(b.key);
        idle_bytes -= b.bytes;
        footprint -= b.bytes;
        blocks.erase(it);
    }

    void evict_lru_locked() {
        free_idle_locked(lru.front());
        ++counters.evictions;
    }

    void release(std::uint64_t id) {
        std::lock_guard<std::mutex> lk(mutex);
        auto it = blocks.find(id);
        if (it == blocks.end()) return;
        Block& b = it->second;
        ++counters.releases;

        // 仍有外部 ImageBuffer 引用这块内存：脱离池管理，由最后一个引用释放
        if (b.memory.use_count() > 1) {
            footprint -= b.bytes;
            ++counters.detached;
            blocks.erase(it);
            cv.notify_all();
            return;
        }
        if (shut_down) {
            footprint -= b.bytes;
            blocks.erase(it);
            cv.notify_all();
            return;
        }
        auto& idle = idle_by_key[b.key];
        if (idle.size() >= options.max_idle_per_key) {
            footprint -= b.bytes;
            ++counters.evictions;
            blocks.erase(it);
            cv.notify_all();
            return;
        }
        b.checked_out = false;
        b.lru_pos = lru.insert(lru.end(), id);
        idle.push_back(id);
        idle_bytes += b.bytes;
        while (footprint > options.budget_bytes && !lru.empty()) {
            evict_lru_locked();
        }
        cv.notify_all();
    }
};

BufferLease::~BufferLease() { release(); }

BufferLease::BufferLease(BufferLease&& other) noexcept
    : core_(std::move(other.core_)),
      block_id_(other.block_id_),
      key_(other.key_),
      buffer_(std::move(other.buffer_)) {
    other.core_.reset();
}

BufferLease& BufferLease::operator=(BufferLease&& other) noexcept {
    if (this != &other) {
        release();
        core_ = std::move(other.core_);
        block_id_ = other.block_id_;
        key_ = other.key_;
        buffer_ = std::move(other.buffer_);
        other.core_.reset();
    }
    return *this;
}

void BufferLease::release() {
    if (!core_) return;
    buffer_ = ImageBuffer{};
    core_->release(block_id_);
    core_.reset();
}

BufferPool::BufferPool(BufferPoolOptions options)
    : options_(options), core_(std::make_shared<BufferLease::Core>(options)) {
    core_->counters.budget_bytes = options_.budget_bytes;
}

BufferPool::~BufferPool() { shutdown(); }

BufferLease BufferPool::acquire(const ShapeKey& key, const CancellationToken& token) {
    const std::size_t bytes = key.bytes();
    if (bytes == 0) {
        throw GraphError(GraphErrc::InvalidParameter, "BufferPool: empty shape " + to_string(key) + ".");
    }
    // 必须在任何淘汰之前拒绝，否则会先清空池再失败
    if (bytes > options_.budget_bytes) {
        throw GraphError(GraphErrc::CapacityExceeded,
                         "BufferPool: buffer " + to_string(key) + " (" + std::to_string(bytes) +
                             " bytes) exceeds pool budget of " + std::to_string(options_.budget_bytes) +
                             " bytes.");
    }

    auto make_lease = [&](std::uint64_t id, const BufferLease::Core::Block& b) {
        ImageBuffer view;
        view.width = key.width;
        view.height = key.height;
        view.channels = key.channels;
        view.type = key.type;
        view.step = key.row_bytes();
        view.data = b.memory;
        return BufferLease(core_, id, key, std::move(view));
    };

    auto& core = *core_;
    const auto wait_deadline = Clock::now() + options_.acquire_wait;
    std::unique_lock<std::mutex> lk(core.mutex);
    while (true) {
        if (core.shut_down) {
            throw GraphError(GraphErrc::PoolShutdown, "BufferPool: acquire after shutdown.");
        }

        auto idle_it = core.idle_by_key.find(key);
        if (idle_it != core.idle_by_key.end() && !idle_it->second.empty()) {
            std::uint64_t id = idle_it->second.back();
            idle_it->second.pop_back();
            if (idle_it->second.empty()) core.idle_by_key.erase(idle_it);
            auto& b = core.blocks.at(id);
            core.lru.erase(b.lru_pos);
            b.checked_out = true;
            core.idle_bytes -= b.bytes;
            ++core.counters.reuses;
            return make_lease(id, b);
        }

        // 仅当淘汰全部空闲缓冲足以容纳本次请求时才淘汰，否则保留缓存继续等待
        const std::size_t active_bytes = core.footprint - core.idle_bytes;
        if (active_bytes + bytes <= options_.budget_bytes) {
            while (core.footprint + bytes > options_.budget_bytes && !core.lru.empty()) {
                core.evict_lru_locked();
            }
        }
        if (core.footprint + bytes <= options_.budget_bytes) {
            std::uint64_t id = core.next_id++;
            BufferLease::Core::Block b;
            b.key = key;
            b.bytes = bytes;
            b.memory = std::shared_ptr<void>(cv::fastMalloc(bytes), [](void* p) { cv::fastFree(p); });
            b.checked_out = true;
            auto& stored = core.blocks.emplace(id, std::move(b)).first->second;
            core.footprint += bytes;
            ++core.counters.allocations;
            return make_lease(id, stored);
        }

        // 剩余预算全部被活跃缓冲占用：等待归还
        if (token.is_cancelled()) {
            throw GraphError(GraphErrc::Cancelled, "BufferPool: acquire cancelled while waiting for capacity.");
        }
        auto now = Clock::now();
        if (now >= wait_deadline) {
            throw GraphError(GraphErrc::PoolExhausted,
                             "BufferPool: no capacity for " + to_string(key) + " within " +
                                 std::to_string(options_.acquire_wait.count()) + " ms.");
        }
        // 分片等待，以便观察到取消信号
        core.cv.wait_until(lk, std::min(wait_deadline, now + std::chrono::milliseconds(20)));
    }
}

void BufferPool::shutdown() {
    std::size_t still_active = 0;
    {
        std::lock_guard<std::mutex> lk(core_->mutex);
        if (core_->shut_down) return;
        core_->shut_down = true;
        while (!core_->lru.empty()) {
            core_->free_idle_locked(core_->lru.front());
        }
        still_active = core_->blocks.size();
    }
    core_->cv.notify_all();
    if (still_active > 0 && !options_.quiet) {
        std::cerr << "Warning: BufferPool shut down with " << still_active
                  << " buffer(s) still checked out; they will be freed on release." << std::endl;
    }
}

bool BufferPool::is_shut_down() const {
    std::lock_guard<std::mutex> lk(core_->mutex);
    return core_->shut_down;
}

std::size_t BufferPool::trim() {
    std::size_t freed = 0;
    {
        std::lock_guard<std::mutex> lk(core_->mutex);
        while (!core_->lru.empty()) {
            core_->free_idle_locked(core_->lru.front());
            ++freed;
        }
    }
    core_->cv.notify_all();
    return freed;
}

BufferPoolStats BufferPool::stats() const {
    std::lock_guard<std::mutex> lk(core_->mutex);
    BufferPoolStats s = core_->counters;
    s.footprint_bytes = core_->footprint;
    s.idle_bytes = core_->idle_bytes;
    s.idle_count = core_->lru.size();
    s.active_count = core_->blocks.size() - core_->lru.size();
    return s;
}

} // namespace og
