#include "streamfetch/progress.hpp"

#include <algorithm>

namespace streamfetch {

ProgressSampler::ProgressSampler(std::chrono::milliseconds interval, Clock::time_point start)
    : interval_(interval), last_sample_time_(start) {}

void ProgressSampler::reset(Clock::time_point now) {
    last_sample_time_ = now;
    last_sample_bytes_ = 0;
}

std::optional<ProgressSample> ProgressSampler::offer(std::int64_t bytes_done,
                                                     std::int64_t bytes_total,
                                                     Clock::time_point now) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_sample_time_);
    if (elapsed < interval_) {
        return std::nullopt;
    }

    auto sample = makeSample(bytes_done, bytes_total, static_cast<double>(elapsed.count()));
    last_sample_time_ = now;
    last_sample_bytes_ = bytes_done;
    return sample;
}

ProgressSample ProgressSampler::finish(std::int64_t bytes_done, std::int64_t bytes_total,
                                       Clock::time_point now) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_sample_time_);
    auto sample = makeSample(bytes_done, bytes_total, static_cast<double>(elapsed.count()));
    last_sample_time_ = now;
    last_sample_bytes_ = bytes_done;
    return sample;
}

ProgressSample ProgressSampler::makeSample(std::int64_t bytes_done, std::int64_t bytes_total,
                                           double elapsed_ms) {
    ProgressSample sample;
    sample.bytes_done = bytes_done;
    sample.bytes_total = bytes_total > 0 ? bytes_total : 0;

    if (sample.bytes_total > 0) {
        const double ratio = static_cast<double>(bytes_done) / static_cast<double>(sample.bytes_total);
        sample.percentage = std::clamp(ratio * 100.0, 0.0, 100.0);
    }

    if (elapsed_ms > 0.0) {
        sample.bytes_per_second =
            static_cast<double>(bytes_done - last_sample_bytes_) / elapsed_ms * 1000.0;
    }

    if (sample.bytes_total > 0 && sample.bytes_per_second > 0.0) {
        const auto remaining = std::max<std::int64_t>(0, sample.bytes_total - bytes_done);
        sample.eta_seconds = static_cast<double>(remaining) / sample.bytes_per_second;
    }

    return sample;
}

} // namespace streamfetch
