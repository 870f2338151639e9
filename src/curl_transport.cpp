#include "streamfetch/curl_transport.hpp"
#include "streamfetch/detail/curl_utils.hpp"
#include "streamfetch/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace streamfetch {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

std::string toLower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

bool hasNoBody(const HttpRequest& request, long status_code) {
    return request.method == "HEAD" || status_code == 204 || status_code == 205 ||
           status_code == 304;
}

/**
 * One in-flight request. Owned by send() until the headers arrive, then by the body
 * stream, so the connection stays open exactly as long as the body is readable.
 */
class CurlCall {
public:
    CurlCall(const CurlTransportOptions& options, const HttpRequest& request)
        : options_(options),
          multi_(curl_multi_init(), &curl_multi_cleanup),
          header_list_(nullptr, &curl_slist_free_all),
          easy_(curl_easy_init(), &curl_easy_cleanup) {
        if (!multi_ || !easy_) {
            throw TransportError("Failed to allocate curl handle");
        }

        CURL* curl = easy_.get();
        for (const auto& [name, value] : request.headers) {
            curl_slist* appended = curl_slist_append(header_list_.get(), detail::formatHeaderLine(name, value).c_str());
            if (!appended) {
                throw TransportError("Failed to build request headers");
            }
            header_list_.release();
            header_list_.reset(appended);
        }

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list_.get());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &CurlCall::onBody);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &CurlCall::onHeader);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, this);
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer_.data());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options_.follow_redirects ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, options_.max_redirects);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options_.verify_tls ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options_.verify_tls ? 2L : 0L);

        if (request.method == "HEAD") {
            curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
        } else if (request.method != "GET") {
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        }

        if (request.stall_timeout.count() > 0) {
            // Fewer than 1 byte/s for the whole window counts as a stalled transfer.
            const long seconds = static_cast<long>(std::max<long long>(1, (request.stall_timeout.count() + 999) / 1000));
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, seconds);
        }

        const CURLMcode mc = curl_multi_add_handle(multi_.get(), curl);
        if (mc != CURLM_OK) {
            throw TransportError(fmt::format("curl multi error: {}", curl_multi_strerror(mc)));
        }
        attached_ = true;
    }

    ~CurlCall() {
        if (attached_) {
            curl_multi_remove_handle(multi_.get(), easy_.get());
        }
    }

    CurlCall(const CurlCall&) = delete;
    CurlCall& operator=(const CurlCall&) = delete;

    // Drives the transfer until `ready` holds or curl reports completion.
    template <typename Ready>
    void pump(Ready ready, const CancellationToken& cancel) {
        while (!ready() && !done_) {
            cancel.throwIfCancellationRequested();

            int running = 0;
            CURLMcode mc = curl_multi_perform(multi_.get(), &running);
            if (mc != CURLM_OK) {
                throw TransportError(fmt::format("curl multi error: {}", curl_multi_strerror(mc)));
            }
            collectCompletion();
            if (ready() || done_) {
                break;
            }

            mc = curl_multi_poll(multi_.get(), nullptr, 0, static_cast<int>(options_.poll_interval.count()), nullptr);
            if (mc != CURLM_OK) {
                throw TransportError(fmt::format("curl multi error: {}", curl_multi_strerror(mc)));
            }
        }
    }

    void throwIfFailed() const {
        if (done_ && result_ != CURLE_OK) {
            throw TransportError(detail::describeCurlError(result_, error_buffer_.data()),
                                 static_cast<int>(result_));
        }
    }

    [[nodiscard]] long statusCode() const {
        long code = 0;
        curl_easy_getinfo(easy_.get(), CURLINFO_RESPONSE_CODE, &code);
        return code;
    }

    // Hands the buffered bytes to the caller and resumes a paused transfer.
    bool takeChunk(std::string& chunk) {
        if (buffer_.empty()) {
            return false;
        }
        chunk.swap(buffer_);
        buffer_.clear();
        if (paused_) {
            paused_ = false;
            curl_easy_pause(easy_.get(), CURLPAUSE_CONT);
        }
        return true;
    }

    [[nodiscard]] bool headersComplete() const noexcept { return headers_complete_; }
    [[nodiscard]] bool hasBufferedData() const noexcept { return !buffer_.empty(); }
    [[nodiscard]] const std::string& reason() const noexcept { return reason_; }
    HeaderMap takeHeaders() { return std::move(headers_); }

private:
    static size_t onBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlCall*>(userdata);
        const size_t total = size * nmemb;
        if (!self) {
            return 0;
        }

        self->headers_complete_ = true;
        if (!self->buffer_.empty() && self->buffer_.size() + total > self->options_.max_buffered_bytes) {
            self->paused_ = true;
            return CURL_WRITEFUNC_PAUSE;
        }
        self->buffer_.append(ptr, total);
        return total;
    }

    static size_t onHeader(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* self = static_cast<CurlCall*>(userdata);
        const size_t total = size * nitems;
        if (!self) {
            return 0;
        }

        const std::string_view line = trim(std::string_view(buffer, total));
        if (line.rfind("HTTP/", 0) == 0) {
            // A new status line starts a new header block (redirects, 100-continue).
            self->headers_.clear();
            self->reason_.clear();
            const auto code_start = line.find(' ');
            if (code_start != std::string_view::npos) {
                const auto reason_start = line.find(' ', code_start + 1);
                if (reason_start != std::string_view::npos) {
                    self->reason_ = std::string(trim(line.substr(reason_start + 1)));
                }
            }
            return total;
        }

        const auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return total;
        }
        self->headers_[toLower(trim(line.substr(0, colon)))] = std::string(trim(line.substr(colon + 1)));
        return total;
    }

    void collectCompletion() {
        int remaining = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_.get(), &remaining)) {
            if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_.get()) {
                done_ = true;
                headers_complete_ = true;
                result_ = msg->data.result;
            }
        }
    }

    CurlTransportOptions options_;
    detail::CurlMultiHandle multi_;
    detail::CurlHeaderList header_list_;
    detail::CurlEasyHandle easy_;
    std::array<char, CURL_ERROR_SIZE> error_buffer_{};
    bool attached_{false};

    std::string buffer_;
    bool paused_{false};
    bool headers_complete_{false};
    bool done_{false};
    CURLcode result_{CURLE_OK};

    std::string reason_;
    HeaderMap headers_;
};

class CurlBodyStream final : public ByteStream {
public:
    CurlBodyStream(std::unique_ptr<CurlCall> call, CancellationToken cancel)
        : call_(std::move(call)), cancel_(std::move(cancel)) {}

    bool read(std::string& chunk) override {
        call_->pump([this] { return call_->hasBufferedData(); }, cancel_);
        if (call_->takeChunk(chunk)) {
            return true;
        }
        call_->throwIfFailed();
        return false;
    }

private:
    std::unique_ptr<CurlCall> call_;
    CancellationToken cancel_;
};

} // namespace

CurlTransport::CurlTransport(CurlTransportOptions options) : options_(std::move(options)) {
    detail::ensureCurlInitialized();
}

CurlTransport::~CurlTransport() = default;

HttpResponse CurlTransport::send(const HttpRequest& request, const CancellationToken& cancel) {
    auto call = std::make_unique<CurlCall>(options_, request);
    call->pump([&call] { return call->headersComplete(); }, cancel);

    // Errors surface before the body only when nothing was received at all.
    if (!call->hasBufferedData()) {
        call->throwIfFailed();
    }

    HttpResponse response;
    response.status_code = call->statusCode();
    response.reason = call->reason();
    response.headers = call->takeHeaders();
    if (!hasNoBody(request, response.status_code)) {
        response.body = std::make_unique<CurlBodyStream>(std::move(call), cancel);
    }
    return response;
}

} // namespace streamfetch
