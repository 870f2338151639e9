#pragma once

#include "logger.hpp"

#include <chrono>
#include <string>

namespace streamfetch {

struct DownloaderConfig {
    int max_retries{3};
    std::chrono::milliseconds initial_backoff{1000};
    std::chrono::milliseconds timeout{30000};
    int concurrency{5};
    std::string user_agent{"streamfetch/1.0"};
    std::chrono::milliseconds progress_interval{500};
    LogSettings log{};

    // Defaults overridden by STREAMFETCH_* environment variables. Values that are not
    // valid for their setting are ignored.
    static DownloaderConfig fromEnvironment();
};

[[nodiscard]] bool isValidLogLevel(const std::string& level);

} // namespace streamfetch
