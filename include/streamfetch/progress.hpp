#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

namespace streamfetch {

struct ProgressSample {
    std::int64_t bytes_done{0};
    std::int64_t bytes_total{0}; // 0 when the server did not declare a length
    double percentage{0.0};
    double bytes_per_second{0.0};
    double eta_seconds{0.0};
};

using ProgressCallback = std::function<void(const ProgressSample&)>;

// One sampler per attempt; reset() when a new attempt begins.
class ProgressSampler {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::milliseconds kDefaultInterval{500};

    explicit ProgressSampler(std::chrono::milliseconds interval = kDefaultInterval,
                             Clock::time_point start = Clock::now());

    void reset(Clock::time_point now);

    // Returns a sample only when at least one interval passed since the last one.
    [[nodiscard]] std::optional<ProgressSample> offer(std::int64_t bytes_done,
                                                      std::int64_t bytes_total,
                                                      Clock::time_point now);

    // Unthrottled closing sample for the end of an attempt.
    [[nodiscard]] ProgressSample finish(std::int64_t bytes_done, std::int64_t bytes_total,
                                        Clock::time_point now);

    [[nodiscard]] std::chrono::milliseconds interval() const noexcept { return interval_; }

private:
    ProgressSample makeSample(std::int64_t bytes_done, std::int64_t bytes_total,
                              double elapsed_ms);

    std::chrono::milliseconds interval_;
    Clock::time_point last_sample_time_;
    std::int64_t last_sample_bytes_{0};
};

} // namespace streamfetch
