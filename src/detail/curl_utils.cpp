#include "streamfetch/detail/curl_utils.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>

#include <fmt/format.h>

namespace streamfetch::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            throw std::runtime_error(fmt::format("Failed to initialize libcurl: {}", curl_easy_strerror(rc)));
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

std::string formatHeaderLine(const std::string& name, const std::string& value) {
    if (value.empty()) {
        return name + ";";
    }
    return fmt::format("{}: {}", name, value);
}

std::string describeCurlError(CURLcode code, const char* error_buffer) {
    if (error_buffer != nullptr && error_buffer[0] != '\0') {
        return fmt::format("curl error: {}", error_buffer);
    }
    return fmt::format("curl error: {}", curl_easy_strerror(code));
}

} // namespace streamfetch::detail
