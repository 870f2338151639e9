#include "streamfetch/cancellation.hpp"
#include "streamfetch/errors.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace streamfetch {

namespace {

using detail::CancellationState;
using Clock = CancellationState::Clock;

bool cancelledInChain(const CancellationState* state) {
    for (; state != nullptr; state = state->parent.get()) {
        if (state->cancelled.load(std::memory_order_acquire)) {
            return true;
        }
    }
    return false;
}

Clock::rep earliestDeadline(const CancellationState* state) {
    Clock::rep earliest = CancellationState::kNoDeadline;
    for (; state != nullptr; state = state->parent.get()) {
        earliest = std::min(earliest, state->deadline.load(std::memory_order_acquire));
    }
    return earliest;
}

bool deadlinePassed(const CancellationState* state) {
    const auto deadline = earliestDeadline(state);
    return deadline != CancellationState::kNoDeadline &&
           Clock::now().time_since_epoch().count() >= deadline;
}

void fire(const std::shared_ptr<CancellationState>& state) {
    std::map<std::uint64_t, std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->cancelled.load(std::memory_order_acquire)) {
            return;
        }
        state->cancelled.store(true, std::memory_order_release);
        callbacks.swap(state->callbacks);
    }
    state->cv.notify_all();

    for (auto& [id, callback] : callbacks) {
        (void)id;
        callback();
    }
}

} // namespace

bool CancellationToken::isCancellationRequested() const {
    if (!state_) {
        return false;
    }
    return cancelledInChain(state_.get()) || deadlinePassed(state_.get());
}

bool CancellationToken::isDeadlineExpired() const {
    if (!state_) {
        return false;
    }
    return !cancelledInChain(state_.get()) && deadlinePassed(state_.get());
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const {
    if (!state_) {
        std::this_thread::sleep_for(duration);
        return false;
    }

    const auto end = Clock::now() + duration;
    std::unique_lock<std::mutex> lock(state_->mutex);
    while (true) {
        if (isCancellationRequested()) {
            return true;
        }
        if (Clock::now() >= end) {
            return false;
        }

        auto wake = end;
        const auto deadline = earliestDeadline(state_.get());
        if (deadline != CancellationState::kNoDeadline) {
            wake = std::min(wake, Clock::time_point(Clock::duration(deadline)));
        }
        state_->cv.wait_until(lock, wake);
    }
}

void CancellationToken::throwIfCancellationRequested() const {
    if (!state_) {
        return;
    }
    if (cancelledInChain(state_.get())) {
        throw CancelledError(CancelledError::Cause::External);
    }
    if (deadlinePassed(state_.get())) {
        throw CancelledError(CancelledError::Cause::Deadline, "Request timed out");
    }
}

CancellationSource::CancellationSource() : state_(std::make_shared<CancellationState>()) {}

CancellationSource::CancellationSource(const CancellationToken& parent) : CancellationSource() {
    if (!parent.state_) {
        return;
    }

    state_->parent = parent.state_;
    std::weak_ptr<CancellationState> weak = state_;
    bool parent_cancelled = false;
    {
        std::lock_guard<std::mutex> lock(parent.state_->mutex);
        if (parent.state_->cancelled.load(std::memory_order_acquire)) {
            parent_cancelled = true;
        } else {
            parent_callback_id_ = ++parent.state_->next_callback_id;
            parent.state_->callbacks.emplace(parent_callback_id_, [weak]() {
                if (auto state = weak.lock()) {
                    fire(state);
                }
            });
        }
    }

    if (parent_cancelled) {
        fire(state_);
    }
}

CancellationSource::~CancellationSource() {
    if (state_->parent && parent_callback_id_ != 0) {
        std::lock_guard<std::mutex> lock(state_->parent->mutex);
        state_->parent->callbacks.erase(parent_callback_id_);
    }
}

void CancellationSource::cancel() { fire(state_); }

void CancellationSource::cancelAfter(std::chrono::milliseconds delay) {
    const auto deadline = Clock::now() + delay;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->deadline.store(deadline.time_since_epoch().count(), std::memory_order_release);
    }
    state_->cv.notify_all();
}

void CancellationSource::clearDeadline() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->deadline.store(CancellationState::kNoDeadline, std::memory_order_release);
}

bool CancellationSource::isCancellationRequested() const { return token().isCancellationRequested(); }

} // namespace streamfetch
