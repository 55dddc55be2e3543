// opgraph kernel: cancellation source/token implementation
#include "kernel/cancellation.hpp"

#include <thread>

namespace og {

bool CancellationSource::State::trip(CancelReason r) {
    int expected = static_cast<int>(CancelReason::None);
    bool first = reason.compare_exchange_strong(expected, static_cast<int>(r));
    if (first) {
        { std::lock_guard<std::mutex> lk(mutex); }
        cv.notify_all();
    }
    return first;
}

CancellationSource::CancellationSource() : state_(std::make_shared<State>()) {}

CancellationSource::CancellationSource(Clock::time_point deadline)
    : state_(std::make_shared<State>()) {
    state_->deadline = deadline;
}

void CancellationSource::cancel(CancelReason reason) {
    if (reason == CancelReason::None) return;
    state_->trip(reason);
}

CancellationToken CancellationSource::token() const {
    return CancellationToken(state_);
}

bool CancellationToken::is_cancelled() const {
    return reason() != CancelReason::None;
}

CancelReason CancellationToken::reason() const {
    if (!state_) return CancelReason::None;
    auto r = static_cast<CancelReason>(state_->reason.load());
    if (r == CancelReason::None && state_->deadline && Clock::now() >= *state_->deadline) {
        state_->trip(CancelReason::Timeout);
        r = static_cast<CancelReason>(state_->reason.load());
    }
    return r;
}

std::optional<Clock::time_point> CancellationToken::deadline() const {
    if (!state_) return std::nullopt;
    return state_->deadline;
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const {
    auto until = Clock::now() + timeout;
    if (!state_) {
        std::this_thread::sleep_until(until);
        return false;
    }
    if (state_->deadline && *state_->deadline < until) until = *state_->deadline;
    {
        std::unique_lock<std::mutex> lk(state_->mutex);
        state_->cv.wait_until(lk, until, [&] {
            return state_->reason.load() != static_cast<int>(CancelReason::None);
        });
    }
    return is_cancelled();
}

void CancellationToken::throw_if_cancelled() const {
    switch (reason()) {
        case CancelReason::None:
            return;
        case CancelReason::Timeout:
            throw GraphError(GraphErrc::Cancelled, "Operation timed out.");
        case CancelReason::Cancelled:
            throw GraphError(GraphErrc::Cancelled, "Operation cancelled.");
    }
}

} // namespace og
