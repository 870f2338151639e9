#include "streamfetch/batch_orchestrator.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/format.h>

namespace streamfetch {

BatchOrchestrator::BatchOrchestrator(std::shared_ptr<const SingleTransfer> transfer, Logger logger)
    : transfer_(std::move(transfer)), logger_(std::move(logger)) {}

BatchResult BatchOrchestrator::runAll(const std::vector<BatchItem>& items, int concurrency_limit,
                                      const BatchCallbacks& callbacks, const CancellationToken& cancel) const {
    BatchResult result;
    result.outcomes.resize(items.size());
    if (items.empty()) {
        return result;
    }

    const std::size_t worker_count =
        std::min<std::size_t>(static_cast<std::size_t>(std::max(1, concurrency_limit)), items.size());

    std::atomic<std::size_t> next_item{0};
    std::mutex result_mutex;

    auto worker = [&]() {
        while (true) {
            const std::size_t position = next_item.fetch_add(1);
            if (position >= items.size()) {
                return;
            }

            const BatchItem& item = items[position];
            const std::string filename = item.request.destination.filename().string();

            ProgressCallback on_progress;
            if (callbacks.on_file_progress) {
                on_progress = [&callbacks, index = item.index, &filename](const ProgressSample& sample) {
                    callbacks.on_file_progress(index, filename, sample);
                };
            }

            TransferOutcome outcome = transfer_->run(item.request, on_progress, cancel);
            const bool succeeded = outcome.succeeded;
            {
                std::lock_guard<std::mutex> lock(result_mutex);
                result.outcomes[position] = std::move(outcome);
                if (succeeded) {
                    ++result.success_count;
                } else {
                    ++result.failure_count;
                }
            }

            if (callbacks.on_file_complete) {
                try {
                    callbacks.on_file_complete(item.index, filename, succeeded);
                } catch (const std::exception& ex) {
                    logger_.warn(fmt::format("Completion callback for {} threw: {}", filename, ex.what()));
                } catch (...) {
                    logger_.warn(fmt::format("Completion callback for {} threw a non-standard exception", filename));
                }
            }
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        try {
            workers.emplace_back(worker);
        } catch (const std::system_error& ex) {
            logger_.warn(fmt::format("Could only start {} of {} workers: {}", workers.size(), worker_count, ex.what()));
            break;
        }
    }
    if (workers.empty()) {
        worker();
    }

    for (auto& thread : workers) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    logger_.info(fmt::format("Batch finished: {} succeeded, {} failed", result.success_count, result.failure_count));
    return result;
}

} // namespace streamfetch
