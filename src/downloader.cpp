#include "streamfetch/downloader.hpp"
#include "streamfetch/curl_transport.hpp"

#include <utility>

namespace streamfetch {

Downloader::Downloader(HttpTransportPtr transport, StoragePtr storage, Logger logger, DownloaderConfig config)
    : config_(std::move(config)),
      logger_(std::move(logger)),
      transfer_(std::make_shared<SingleTransfer>(transport, std::move(storage), logger_, config_.user_agent,
                                                 config_.progress_interval)),
      batch_(transfer_, logger_),
      probe_(std::move(transport), logger_, config_.user_agent, config_.timeout) {}

Downloader Downloader::createDefault(const DownloaderConfig& config) {
    return Downloader{std::make_shared<CurlTransport>(), std::make_shared<FileStorage>(),
                      Logger::create("download", config.log), config};
}

TransferRequest Downloader::makeRequest(const std::string& url, const std::filesystem::path& destination,
                                        const TransferSettings& settings) const {
    TransferRequest request;
    request.url = url;
    request.destination = destination;
    request.headers = settings.headers;
    request.timeout = settings.timeout.value_or(config_.timeout);
    request.max_retries = settings.retries.value_or(config_.max_retries);
    request.initial_backoff = settings.retry_delay.value_or(config_.initial_backoff);
    return request;
}

TransferOutcome Downloader::downloadFile(const std::string& url, const std::filesystem::path& destination,
                                         const DownloadOptions& options) const {
    return transfer_->run(makeRequest(url, destination, options), options.on_progress, options.cancel);
}

MemoryOutcome Downloader::downloadToMemory(const std::string& url, const MemoryOptions& options) const {
    return transfer_->fetchToMemory(makeRequest(url, {}, options), options.cancel);
}

BatchResult Downloader::downloadBatch(const std::vector<BatchDownload>& downloads, const BatchOptions& options) const {
    std::vector<BatchItem> items;
    items.reserve(downloads.size());
    for (std::size_t i = 0; i < downloads.size(); ++i) {
        items.push_back(BatchItem{i, makeRequest(downloads[i].url, downloads[i].destination, options)});
    }

    BatchCallbacks callbacks{options.on_file_progress, options.on_file_complete};
    return batch_.runAll(items, options.concurrency.value_or(config_.concurrency), callbacks, options.cancel);
}

std::optional<std::int64_t> Downloader::peekSize(const std::string& url) const { return probe_.peekSize(url); }

} // namespace streamfetch
