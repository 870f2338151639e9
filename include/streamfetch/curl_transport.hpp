#pragma once

#include "transport.hpp"

#include <chrono>
#include <cstddef>

namespace streamfetch {

struct CurlTransportOptions {
    bool follow_redirects{true};
    long max_redirects{5};
    bool verify_tls{true};
    // Upper bound on body bytes held between two ByteStream::read() calls.
    std::size_t max_buffered_bytes{256 * 1024};
    std::chrono::milliseconds poll_interval{50};
};

// One easy handle per send(), driven from the caller's thread.
class CurlTransport final : public HttpTransport {
public:
    explicit CurlTransport(CurlTransportOptions options = {});
    ~CurlTransport() override;

    HttpResponse send(const HttpRequest& request, const CancellationToken& cancel) override;

private:
    CurlTransportOptions options_;
};

} // namespace streamfetch
