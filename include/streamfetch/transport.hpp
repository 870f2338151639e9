#pragma once

#include "cancellation.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace streamfetch {

using HeaderMap = std::map<std::string, std::string>;

// read() blocks for the next chunk and returns false once the stream is exhausted.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    virtual bool read(std::string& chunk) = 0;
};

struct HttpRequest {
    std::string url;
    std::string method{"GET"};
    HeaderMap headers;
    // Abort the body read when no byte arrives for this long; zero disables the guard.
    std::chrono::milliseconds stall_timeout{0};
};

struct HttpResponse {
    long status_code{0};
    std::string reason;
    HeaderMap headers; // names lower-cased
    std::unique_ptr<ByteStream> body;

    [[nodiscard]] bool ok() const noexcept { return status_code >= 200 && status_code < 300; }
    [[nodiscard]] std::optional<std::string> header(const std::string& name) const;

    // Declared content-length, or 0 when absent or not numeric.
    [[nodiscard]] std::int64_t contentLength() const;
};

/**
 * HTTP client seam. send() returns once the response headers are available; the
 * cancellation token is honoured while connecting and while the body is read.
 * Implementations must allow concurrent send() calls from different threads.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse send(const HttpRequest& request, const CancellationToken& cancel) = 0;
};

using HttpTransportPtr = std::shared_ptr<HttpTransport>;

// Parses a content-length value; nullopt unless the whole value is a non-negative integer.
[[nodiscard]] std::optional<std::int64_t> parseContentLength(const std::string& value);

} // namespace streamfetch
