#pragma once

#include "logger.hpp"
#include "transport.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace streamfetch {

class SizeProbe {
public:
    SizeProbe(HttpTransportPtr transport, Logger logger, std::string user_agent = "streamfetch/1.0",
              std::chrono::milliseconds timeout = std::chrono::milliseconds{30000});

    [[nodiscard]] std::optional<std::int64_t> peekSize(const std::string& url,
                                                       const CancellationToken& cancel = {}) const;

private:
    HttpTransportPtr transport_;
    Logger logger_;
    std::string user_agent_;
    std::chrono::milliseconds timeout_;
};

} // namespace streamfetch
