#include "streamfetch/single_transfer.hpp"
#include "streamfetch/errors.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <utility>

#include <fmt/format.h>

namespace streamfetch {

namespace {

using Clock = std::chrono::steady_clock;

constexpr const char* kCancelledMessage = "Download cancelled";

std::int64_t elapsedMs(Clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since).count();
}

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

} // namespace

SingleTransfer::SingleTransfer(HttpTransportPtr transport, StoragePtr storage, Logger logger,
                               std::string user_agent, std::chrono::milliseconds progress_interval)
    : transport_(std::move(transport)),
      storage_(std::move(storage)),
      logger_(std::move(logger)),
      user_agent_(std::move(user_agent)),
      progress_interval_(progress_interval) {}

std::chrono::milliseconds SingleTransfer::backoffDelay(std::chrono::milliseconds initial, int attempt) {
    if (initial.count() <= 0 || attempt < 0) {
        return std::chrono::milliseconds{0};
    }
    const int shift = std::min(attempt, 30);
    return initial * (std::int64_t{1} << shift);
}

HeaderMap SingleTransfer::mergeHeaders(const HeaderMap& extra) const {
    HeaderMap merged;
    const bool caller_sets_agent = std::any_of(extra.begin(), extra.end(), [](const auto& header) {
        return equalsIgnoreCase(header.first, "User-Agent");
    });
    if (!caller_sets_agent && !user_agent_.empty()) {
        merged["User-Agent"] = user_agent_;
    }
    for (const auto& [name, value] : extra) {
        merged[name] = value;
    }
    return merged;
}

template <typename Attempt>
SingleTransfer::RetryResult SingleTransfer::retryWithBackoff(const TransferRequest& request,
                                                             const CancellationToken& cancel,
                                                             Attempt&& attempt) const {
    RetryResult result;
    const int max_retries = std::max(0, request.max_retries);

    for (int index = 0; index <= max_retries; ++index) {
        result.attempts = index + 1;

        std::string failure;
        try {
            CancellationSource attempt_cancel(cancel);
            if (request.timeout.count() > 0) {
                attempt_cancel.cancelAfter(request.timeout);
            }
            attempt(attempt_cancel);
            result.status = RetryResult::Status::Succeeded;
            return result;
        } catch (const CancelledError& ex) {
            if (!ex.byDeadline() || cancel.isCancellationRequested()) {
                result.status = RetryResult::Status::Cancelled;
                result.error = kCancelledMessage;
                return result;
            }
            failure = fmt::format("Request timed out after {}ms", request.timeout.count());
        } catch (const std::exception& ex) {
            if (cancel.isCancellationRequested()) {
                result.status = RetryResult::Status::Cancelled;
                result.error = kCancelledMessage;
                return result;
            }
            failure = ex.what();
        }

        logger_.error(fmt::format("Attempt {} failed:", index + 1), failure);
        result.error = std::move(failure);

        if (index < max_retries) {
            const auto delay = backoffDelay(request.initial_backoff, index);
            logger_.info(fmt::format("Retrying in {}ms...", delay.count()));
            if (cancel.waitFor(delay)) {
                result.status = RetryResult::Status::Cancelled;
                result.error = kCancelledMessage;
                return result;
            }
        }
    }

    result.status = RetryResult::Status::Exhausted;
    if (result.error.empty()) {
        result.error = "Max retries exceeded";
    }
    return result;
}

TransferOutcome SingleTransfer::run(const TransferRequest& request, const ProgressCallback& on_progress,
                                    const CancellationToken& cancel) const {
    const auto started = Clock::now();
    TransferOutcome outcome;

    try {
        storage_->ensureDir(request.destination.parent_path());
    } catch (const std::exception& ex) {
        logger_.error(fmt::format("Cannot prepare destination {}:", request.destination.string()), ex.what());
        outcome.error_message = ex.what();
        outcome.duration_ms = elapsedMs(started);
        return outcome;
    }

    logger_.debug(fmt::format("Downloading {} -> {}", request.url, request.destination.string()));

    TransferAttemptState state{0, 0, ProgressSampler{progress_interval_, started}};
    // Set once an attempt truncated the destination; until then the path is not ours to remove.
    bool opened_destination = false;
    const auto result = retryWithBackoff(request, cancel, [&](CancellationSource& attempt_cancel) {
        state = TransferAttemptState{0, 0, ProgressSampler{progress_interval_, Clock::now()}};

        HttpResponse response = openResponse(request, attempt_cancel);
        auto sink = storage_->openForWrite(request.destination);
        opened_destination = true;
        state.bytes_total = response.contentLength();
        state.sampler.reset(Clock::now());

        relayBody(*response.body, *sink, state, on_progress, attempt_cancel.token());
        sink->close();

        if (on_progress) {
            emitProgress(on_progress, state.sampler.finish(state.bytes_done, state.bytes_total, Clock::now()));
        }
    });

    outcome.attempts = result.attempts;
    outcome.bytes_transferred = state.bytes_done;
    switch (result.status) {
        case RetryResult::Status::Succeeded:
            outcome.succeeded = true;
            outcome.destination = request.destination;
            outcome.duration_ms = elapsedMs(started);
            logger_.info(fmt::format("Downloaded {} ({} bytes in {}ms)", request.destination.string(),
                                     outcome.bytes_transferred, outcome.duration_ms));
            return outcome;
        case RetryResult::Status::Cancelled:
            logger_.info(fmt::format("Download of {} cancelled", request.url));
            break;
        case RetryResult::Status::Exhausted:
            break;
    }

    if (opened_destination) {
        removePartial(request.destination);
    }

    outcome.error_message = result.error;
    outcome.duration_ms = elapsedMs(started);
    return outcome;
}

MemoryOutcome SingleTransfer::fetchToMemory(const TransferRequest& request, const CancellationToken& cancel) const {
    MemoryOutcome outcome;
    std::string data;

    const auto result = retryWithBackoff(request, cancel, [&](CancellationSource& attempt_cancel) {
        data.clear();
        HttpResponse response = openResponse(request, attempt_cancel, false);
        if (!response.body) {
            return;
        }
        const auto token = attempt_cancel.token();

        std::string chunk;
        while (response.body->read(chunk)) {
            token.throwIfCancellationRequested();
            data.append(chunk);
        }
    });

    if (result.status == RetryResult::Status::Succeeded) {
        outcome.succeeded = true;
        outcome.data = std::move(data);
    } else {
        outcome.error_message = result.error;
    }
    return outcome;
}

HttpResponse SingleTransfer::openResponse(const TransferRequest& request, CancellationSource& attempt_cancel,
                                          bool require_body) const {
    HttpRequest http;
    http.url = request.url;
    http.headers = mergeHeaders(request.headers);
    http.stall_timeout = request.timeout;

    HttpResponse response = transport_->send(http, attempt_cancel.token());
    // The deadline covers connecting and the response headers; the body has the stall guard.
    attempt_cancel.clearDeadline();

    if (!response.ok()) {
        throw HttpStatusError(response.status_code, response.reason);
    }
    if (require_body && !response.body) {
        throw EmptyBodyError();
    }
    return response;
}

void SingleTransfer::relayBody(ByteStream& body, ByteSink& sink, TransferAttemptState& state,
                               const ProgressCallback& on_progress, const CancellationToken& cancel) const {
    std::string chunk;
    while (body.read(chunk)) {
        cancel.throwIfCancellationRequested();

        sink.write(chunk.data(), chunk.size());
        state.bytes_done += static_cast<std::int64_t>(chunk.size());

        if (on_progress) {
            if (const auto sample = state.sampler.offer(state.bytes_done, state.bytes_total, Clock::now())) {
                emitProgress(on_progress, *sample);
            }
        }
    }
}

void SingleTransfer::emitProgress(const ProgressCallback& on_progress, const ProgressSample& sample) const {
    try {
        on_progress(sample);
    } catch (const std::exception& ex) {
        logger_.warn(fmt::format("Progress callback threw: {}", ex.what()));
    } catch (...) {
        logger_.warn("Progress callback threw a non-standard exception");
    }
}

void SingleTransfer::removePartial(const std::filesystem::path& destination) const {
    try {
        storage_->remove(destination);
    } catch (const std::exception& ex) {
        logger_.debug(fmt::format("Cleanup of {} failed: {}", destination.string(), ex.what()));
    }
}

} // namespace streamfetch
