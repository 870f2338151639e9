#include "streamfetch/errors.hpp"

#include <fmt/format.h>

namespace streamfetch {

HttpStatusError::HttpStatusError(long status_code, const std::string& reason)
    : TransferError(reason.empty() ? fmt::format("HTTP {}", status_code)
                                   : fmt::format("HTTP {}: {}", status_code, reason)),
      status_code_(status_code) {}

} // namespace streamfetch
