#pragma once

#include "progress.hpp"
#include "transport.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace streamfetch {

struct TransferRequest {
    std::string url;
    std::filesystem::path destination;
    HeaderMap headers;
    std::chrono::milliseconds timeout{30000};
    int max_retries{3};
    std::chrono::milliseconds initial_backoff{1000};
};

struct TransferOutcome {
    bool succeeded{false};
    std::optional<std::filesystem::path> destination;
    std::optional<std::string> error_message;
    std::int64_t bytes_transferred{0};
    std::int64_t duration_ms{0};
    int attempts{0};
};

struct MemoryOutcome {
    bool succeeded{false};
    std::optional<std::string> data;
    std::optional<std::string> error_message;
};

struct BatchItem {
    std::size_t index{0};
    TransferRequest request;
};

struct BatchResult {
    std::vector<TransferOutcome> outcomes; // index-aligned with the input items
    std::size_t success_count{0};
    std::size_t failure_count{0};
};

} // namespace streamfetch
