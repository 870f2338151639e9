#include "streamfetch/size_probe.hpp"

#include <exception>
#include <utility>

#include <fmt/format.h>

namespace streamfetch {

SizeProbe::SizeProbe(HttpTransportPtr transport, Logger logger, std::string user_agent,
                     std::chrono::milliseconds timeout)
    : transport_(std::move(transport)),
      logger_(std::move(logger)),
      user_agent_(std::move(user_agent)),
      timeout_(timeout) {}

std::optional<std::int64_t> SizeProbe::peekSize(const std::string& url, const CancellationToken& cancel) const {
    HttpRequest request;
    request.url = url;
    request.method = "HEAD";
    if (!user_agent_.empty()) {
        request.headers["User-Agent"] = user_agent_;
    }

    try {
        CancellationSource probe_cancel(cancel);
        if (timeout_.count() > 0) {
            probe_cancel.cancelAfter(timeout_);
        }

        const HttpResponse response = transport_->send(request, probe_cancel.token());
        if (!response.ok()) {
            logger_.debug(fmt::format("Size probe of {} returned HTTP {}", url, response.status_code));
            return std::nullopt;
        }

        const auto length = response.header("content-length");
        if (!length) {
            return std::nullopt;
        }
        return parseContentLength(*length);
    } catch (const std::exception& ex) {
        logger_.debug(fmt::format("Size probe of {} failed: {}", url, ex.what()));
        return std::nullopt;
    }
}

} // namespace streamfetch
