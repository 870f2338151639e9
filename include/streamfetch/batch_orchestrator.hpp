#pragma once

#include "cancellation.hpp"
#include "logger.hpp"
#include "single_transfer.hpp"
#include "transfer_types.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace streamfetch {

using FileProgressCallback =
    std::function<void(std::size_t index, const std::string& filename, const ProgressSample& sample)>;
using FileCompleteCallback =
    std::function<void(std::size_t index, const std::string& filename, bool succeeded)>;

struct BatchCallbacks {
    FileProgressCallback on_file_progress;
    FileCompleteCallback on_file_complete;
};

// Callbacks run on worker threads. A failed item never stops its siblings.
class BatchOrchestrator {
public:
    BatchOrchestrator(std::shared_ptr<const SingleTransfer> transfer, Logger logger);

    BatchResult runAll(const std::vector<BatchItem>& items, int concurrency_limit,
                       const BatchCallbacks& callbacks = {}, const CancellationToken& cancel = {}) const;

private:
    std::shared_ptr<const SingleTransfer> transfer_;
    Logger logger_;
};

} // namespace streamfetch
