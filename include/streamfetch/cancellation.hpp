#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <mutex>

namespace streamfetch {

namespace detail {

struct CancellationState {
    using Clock = std::chrono::steady_clock;
    static constexpr Clock::rep kNoDeadline = std::numeric_limits<Clock::rep>::max();

    std::mutex mutex;
    std::condition_variable cv;
    std::atomic<bool> cancelled{false};
    std::atomic<Clock::rep> deadline{kNoDeadline};
    std::shared_ptr<CancellationState> parent;

    std::uint64_t next_callback_id{0};
    std::map<std::uint64_t, std::function<void()>> callbacks;
};

} // namespace detail

class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;

    [[nodiscard]] bool isCancellationRequested() const;

    // True when the signal fired because a deadline passed rather than cancel().
    [[nodiscard]] bool isDeadlineExpired() const;

    // Sleeps for up to `duration`. Returns true if cancellation arrived first.
    bool waitFor(std::chrono::milliseconds duration) const;

    // Throws CancelledError describing the cause if cancellation was requested.
    void throwIfCancellationRequested() const;

    [[nodiscard]] bool canBeCancelled() const noexcept { return static_cast<bool>(state_); }

private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

// Fires on cancel(), on its own deadline, or when the parent token fires. Never affects the parent.
class CancellationSource {
public:
    CancellationSource();
    explicit CancellationSource(const CancellationToken& parent);
    ~CancellationSource();

    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;

    void cancel();
    void cancelAfter(std::chrono::milliseconds delay);
    void clearDeadline();

    [[nodiscard]] bool isCancellationRequested() const;
    [[nodiscard]] CancellationToken token() const { return CancellationToken{state_}; }

private:
    std::shared_ptr<detail::CancellationState> state_;
    std::uint64_t parent_callback_id_{0};
};

} // namespace streamfetch
