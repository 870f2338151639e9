#include <streamfetch/config.hpp>

#include <gtest/gtest.h>

#include <cstdlib>
#include <optional>
#include <string>

using namespace streamfetch;
using namespace std::chrono_literals;

namespace {

class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : name_(name) {
        if (const char* previous = std::getenv(name)) {
            previous_ = previous;
        }
        ::setenv(name, value, 1);
    }

    ~EnvGuard() {
        if (previous_) {
            ::setenv(name_.c_str(), previous_->c_str(), 1);
        } else {
            ::unsetenv(name_.c_str());
        }
    }

    EnvGuard(const EnvGuard&) = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

private:
    std::string name_;
    std::optional<std::string> previous_;
};

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : {"STREAMFETCH_RETRIES", "STREAMFETCH_RETRY_DELAY_MS", "STREAMFETCH_TIMEOUT_MS",
                                 "STREAMFETCH_MAX_DOWNLOADS", "STREAMFETCH_USER_AGENT", "STREAMFETCH_LOG_LEVEL",
                                 "STREAMFETCH_LOG_FILE"}) {
            ::unsetenv(name);
        }
    }
};

} // namespace

TEST_F(ConfigTest, DefaultsWithoutEnvironment) {
    const auto config = DownloaderConfig::fromEnvironment();
    EXPECT_EQ(config.max_retries, 3);
    EXPECT_EQ(config.initial_backoff, 1000ms);
    EXPECT_EQ(config.timeout, 30000ms);
    EXPECT_EQ(config.concurrency, 5);
    EXPECT_EQ(config.progress_interval, 500ms);
    EXPECT_EQ(config.log.level, "info");
    EXPECT_TRUE(config.log.file.empty());
}

TEST_F(ConfigTest, ReadsOverridesFromEnvironment) {
    EnvGuard retries("STREAMFETCH_RETRIES", "7");
    EnvGuard delay("STREAMFETCH_RETRY_DELAY_MS", "250");
    EnvGuard timeout("STREAMFETCH_TIMEOUT_MS", "5000");
    EnvGuard downloads("STREAMFETCH_MAX_DOWNLOADS", "2");
    EnvGuard agent("STREAMFETCH_USER_AGENT", "mirror-bot/2.1");
    EnvGuard level("STREAMFETCH_LOG_LEVEL", "debug");
    EnvGuard file("STREAMFETCH_LOG_FILE", "/tmp/streamfetch.log");

    const auto config = DownloaderConfig::fromEnvironment();
    EXPECT_EQ(config.max_retries, 7);
    EXPECT_EQ(config.initial_backoff, 250ms);
    EXPECT_EQ(config.timeout, 5000ms);
    EXPECT_EQ(config.concurrency, 2);
    EXPECT_EQ(config.user_agent, "mirror-bot/2.1");
    EXPECT_EQ(config.log.level, "debug");
    EXPECT_EQ(config.log.file, "/tmp/streamfetch.log");
}

TEST_F(ConfigTest, ZeroRetriesIsAccepted) {
    EnvGuard retries("STREAMFETCH_RETRIES", "0");
    EXPECT_EQ(DownloaderConfig::fromEnvironment().max_retries, 0);
}

TEST_F(ConfigTest, InvalidValuesKeepDefaults) {
    EnvGuard retries("STREAMFETCH_RETRIES", "-1");
    EnvGuard delay("STREAMFETCH_RETRY_DELAY_MS", "soon");
    EnvGuard timeout("STREAMFETCH_TIMEOUT_MS", "0");
    EnvGuard downloads("STREAMFETCH_MAX_DOWNLOADS", "4x");
    EnvGuard level("STREAMFETCH_LOG_LEVEL", "loud");

    const auto config = DownloaderConfig::fromEnvironment();
    EXPECT_EQ(config.max_retries, 3);
    EXPECT_EQ(config.initial_backoff, 1000ms);
    EXPECT_EQ(config.timeout, 30000ms);
    EXPECT_EQ(config.concurrency, 5);
    EXPECT_EQ(config.log.level, "info");
}

TEST(LogLevelTest, RecognisesSpdlogLevels) {
    EXPECT_TRUE(isValidLogLevel("trace"));
    EXPECT_TRUE(isValidLogLevel("warn"));
    EXPECT_TRUE(isValidLogLevel("off"));
    EXPECT_FALSE(isValidLogLevel("WARN"));
    EXPECT_FALSE(isValidLogLevel(""));
}
