#include <streamfetch/progress.hpp>

#include <gtest/gtest.h>

#include <chrono>

using namespace streamfetch;
using namespace std::chrono_literals;

namespace {

using Clock = ProgressSampler::Clock;

} // namespace

TEST(ProgressSamplerTest, DefaultIntervalIsHalfASecond) {
    ProgressSampler sampler;
    EXPECT_EQ(sampler.interval(), 500ms);
}

TEST(ProgressSamplerTest, NoSampleBeforeIntervalElapses) {
    const auto start = Clock::now();
    ProgressSampler sampler(500ms, start);

    EXPECT_FALSE(sampler.offer(100, 1000, start + 10ms).has_value());
    EXPECT_FALSE(sampler.offer(400, 1000, start + 499ms).has_value());
}

TEST(ProgressSamplerTest, SampleCarriesPercentageSpeedAndEta) {
    const auto start = Clock::now();
    ProgressSampler sampler(500ms, start);

    const auto sample = sampler.offer(500, 2000, start + 500ms);
    ASSERT_TRUE(sample.has_value());
    EXPECT_EQ(sample->bytes_done, 500);
    EXPECT_EQ(sample->bytes_total, 2000);
    EXPECT_DOUBLE_EQ(sample->percentage, 25.0);
    EXPECT_DOUBLE_EQ(sample->bytes_per_second, 1000.0);
    EXPECT_DOUBLE_EQ(sample->eta_seconds, 1.5);
}

TEST(ProgressSamplerTest, SpeedUsesBytesSinceThePreviousSample) {
    const auto start = Clock::now();
    ProgressSampler sampler(500ms, start);

    ASSERT_TRUE(sampler.offer(1000, 0, start + 500ms).has_value());
    EXPECT_FALSE(sampler.offer(1200, 0, start + 700ms).has_value());

    const auto second = sampler.offer(1500, 0, start + 1500ms);
    ASSERT_TRUE(second.has_value());
    EXPECT_DOUBLE_EQ(second->bytes_per_second, 500.0);
}

TEST(ProgressSamplerTest, UnknownTotalReportsZeroPercentAndEta) {
    const auto start = Clock::now();
    ProgressSampler sampler(100ms, start);

    const auto sample = sampler.offer(4096, 0, start + 200ms);
    ASSERT_TRUE(sample.has_value());
    EXPECT_EQ(sample->bytes_total, 0);
    EXPECT_DOUBLE_EQ(sample->percentage, 0.0);
    EXPECT_DOUBLE_EQ(sample->eta_seconds, 0.0);
    EXPECT_GT(sample->bytes_per_second, 0.0);
}

TEST(ProgressSamplerTest, PercentageIsClampedWhenServerUnderstatesLength) {
    const auto start = Clock::now();
    ProgressSampler sampler(100ms, start);

    const auto sample = sampler.offer(3000, 1000, start + 100ms);
    ASSERT_TRUE(sample.has_value());
    EXPECT_DOUBLE_EQ(sample->percentage, 100.0);
    EXPECT_DOUBLE_EQ(sample->eta_seconds, 0.0);
}

TEST(ProgressSamplerTest, FinishIsNotThrottled) {
    const auto start = Clock::now();
    ProgressSampler sampler(500ms, start);

    const auto sample = sampler.finish(1000, 1000, start + 1ms);
    EXPECT_DOUBLE_EQ(sample.percentage, 100.0);
    EXPECT_EQ(sample.bytes_done, 1000);
}

TEST(ProgressSamplerTest, ResetRestartsTheWindow) {
    const auto start = Clock::now();
    ProgressSampler sampler(500ms, start);
    ASSERT_TRUE(sampler.offer(100, 0, start + 600ms).has_value());

    sampler.reset(start + 1000ms);
    EXPECT_FALSE(sampler.offer(50, 0, start + 1200ms).has_value());

    const auto sample = sampler.offer(500, 0, start + 1500ms);
    ASSERT_TRUE(sample.has_value());
    EXPECT_DOUBLE_EQ(sample->bytes_per_second, 1000.0);
}
