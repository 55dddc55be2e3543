// opgraph kernel: cooperative cancellation shared between a Run and its operators
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

#include "og_types.hpp"

namespace og {

using Clock = std::chrono::steady_clock;

enum class CancelReason { None, Cancelled, Timeout };

class CancellationToken;

// Owner side. The first reason recorded wins; a passed deadline counts as
// Timeout the first time anyone observes it.
class OPGRAPH_API CancellationSource {
public:
    CancellationSource();
    explicit CancellationSource(Clock::time_point deadline);

    void cancel(CancelReason reason = CancelReason::Cancelled);
    CancellationToken token() const;

private:
    friend class CancellationToken;
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        std::atomic<int> reason{static_cast<int>(CancelReason::None)};
        std::optional<Clock::time_point> deadline;

        bool trip(CancelReason r);
    };
    std::shared_ptr<State> state_;
};

// Observer side handed to operators. Default-constructed tokens never cancel.
class OPGRAPH_API CancellationToken {
public:
    CancellationToken() = default;

    bool is_cancelled() const;
    CancelReason reason() const;
    std::optional<Clock::time_point> deadline() const;

    // Sleeps up to `timeout`, returning early (true) once cancelled.
    bool wait_for(std::chrono::milliseconds timeout) const;

    // Throws GraphError(Cancelled) when cancelled.
    void throw_if_cancelled() const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<CancellationSource::State> state)
        : state_(std::move(state)) {}
    std::shared_ptr<CancellationSource::State> state_;
};

} // namespace og
