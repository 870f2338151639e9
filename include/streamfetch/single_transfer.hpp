#pragma once

#include "cancellation.hpp"
#include "logger.hpp"
#include "progress.hpp"
#include "storage.hpp"
#include "transfer_types.hpp"
#include "transport.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace streamfetch {

// Per-attempt counters threaded through the body relay; rebuilt for every attempt.
struct TransferAttemptState {
    std::int64_t bytes_done{0};
    std::int64_t bytes_total{0};
    ProgressSampler sampler;
};

/**
 * Drives one URL to one destination with retry and exponential backoff. On failure the
 * destination is removed only if an attempt had opened it; an existing file is otherwise kept.
 *
 * run() and fetchToMemory() never throw; every failure is reported in the outcome.
 * An instance holds no per-transfer state and may be shared between threads.
 */
class SingleTransfer {
public:
    SingleTransfer(HttpTransportPtr transport, StoragePtr storage, Logger logger,
                   std::string user_agent = "streamfetch/1.0",
                   std::chrono::milliseconds progress_interval = ProgressSampler::kDefaultInterval);

    TransferOutcome run(const TransferRequest& request, const ProgressCallback& on_progress = {},
                        const CancellationToken& cancel = {}) const;

    // Same retry and cancellation rules; the body is buffered whole and request.destination
    // is ignored.
    MemoryOutcome fetchToMemory(const TransferRequest& request, const CancellationToken& cancel = {}) const;

    // initial * 2^attempt, where attempt is the zero-based index of the failed attempt.
    [[nodiscard]] static std::chrono::milliseconds backoffDelay(std::chrono::milliseconds initial, int attempt);

    [[nodiscard]] HeaderMap mergeHeaders(const HeaderMap& extra) const;

private:
    struct RetryResult {
        enum class Status { Succeeded, Cancelled, Exhausted };

        Status status{Status::Exhausted};
        std::string error;
        int attempts{0};
    };

    template <typename Attempt>
    RetryResult retryWithBackoff(const TransferRequest& request, const CancellationToken& cancel,
                                 Attempt&& attempt) const;

    HttpResponse openResponse(const TransferRequest& request, CancellationSource& attempt_cancel,
                              bool require_body = true) const;
    void relayBody(ByteStream& body, ByteSink& sink, TransferAttemptState& state,
                   const ProgressCallback& on_progress, const CancellationToken& cancel) const;
    void emitProgress(const ProgressCallback& on_progress, const ProgressSample& sample) const;
    void removePartial(const std::filesystem::path& destination) const;

    HttpTransportPtr transport_;
    StoragePtr storage_;
    Logger logger_;
    std::string user_agent_;
    std::chrono::milliseconds progress_interval_;
};

} // namespace streamfetch
