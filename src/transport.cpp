#include "streamfetch/transport.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace streamfetch {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    const auto it = headers.find(toLower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::int64_t HttpResponse::contentLength() const {
    const auto value = header("content-length");
    if (!value) {
        return 0;
    }
    return parseContentLength(*value).value_or(0);
}

std::optional<std::int64_t> parseContentLength(const std::string& value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    if (begin == end) {
        return std::nullopt;
    }

    std::int64_t length = 0;
    const char* first = value.data() + begin;
    const char* last = value.data() + end;
    const auto result = std::from_chars(first, last, length);
    if (result.ec != std::errc() || result.ptr != last || length < 0) {
        return std::nullopt;
    }
    return length;
}

} // namespace streamfetch
