#include "streamfetch/config.hpp"

#include <array>
#include <cstdlib>
#include <exception>
#include <optional>
#include <string_view>

namespace streamfetch {

namespace {

std::optional<std::string> readEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string{value};
}

// Positive integers only; anything else leaves the default in place.
std::optional<long long> readPositiveEnv(const char* name) {
    const auto raw = readEnv(name);
    if (!raw) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        const long long value = std::stoll(*raw, &consumed);
        if (consumed != raw->size() || value <= 0) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

bool isValidLogLevel(const std::string& level) {
    static constexpr std::array<std::string_view, 7> kLevels{
        "trace", "debug", "info", "warn", "error", "critical", "off"};
    for (const auto candidate : kLevels) {
        if (candidate == level) {
            return true;
        }
    }
    return false;
}

DownloaderConfig DownloaderConfig::fromEnvironment() {
    DownloaderConfig config;

    // Zero retries is meaningful, so this one accepts 0.
    if (const auto raw = readEnv("STREAMFETCH_RETRIES")) {
        try {
            std::size_t consumed = 0;
            const int value = std::stoi(*raw, &consumed);
            if (consumed == raw->size() && value >= 0) {
                config.max_retries = value;
            }
        } catch (const std::exception&) {
            // keep default
        }
    }
    if (const auto value = readPositiveEnv("STREAMFETCH_RETRY_DELAY_MS")) {
        config.initial_backoff = std::chrono::milliseconds{*value};
    }
    if (const auto value = readPositiveEnv("STREAMFETCH_TIMEOUT_MS")) {
        config.timeout = std::chrono::milliseconds{*value};
    }
    if (const auto value = readPositiveEnv("STREAMFETCH_MAX_DOWNLOADS")) {
        config.concurrency = static_cast<int>(*value);
    }
    if (auto value = readEnv("STREAMFETCH_USER_AGENT")) {
        config.user_agent = std::move(*value);
    }
    if (auto value = readEnv("STREAMFETCH_LOG_LEVEL")) {
        if (isValidLogLevel(*value)) {
            config.log.level = std::move(*value);
        }
    }
    if (auto value = readEnv("STREAMFETCH_LOG_FILE")) {
        config.log.file = std::move(*value);
    }

    return config;
}

} // namespace streamfetch
