#pragma once

#include "batch_orchestrator.hpp"
#include "cancellation.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "progress.hpp"
#include "single_transfer.hpp"
#include "size_probe.hpp"
#include "storage.hpp"
#include "transfer_types.hpp"
#include "transport.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace streamfetch {

// Per-call overrides; anything left unset falls back to the DownloaderConfig.
struct TransferSettings {
    std::optional<int> retries;
    std::optional<std::chrono::milliseconds> retry_delay;
    std::optional<std::chrono::milliseconds> timeout;
    HeaderMap headers;
    CancellationToken cancel;
};

struct DownloadOptions : TransferSettings {
    ProgressCallback on_progress;
};

using MemoryOptions = TransferSettings;

struct BatchOptions : TransferSettings {
    std::optional<int> concurrency;
    FileProgressCallback on_file_progress;
    FileCompleteCallback on_file_complete;
};

struct BatchDownload {
    std::string url;
    std::filesystem::path destination;
};

class Downloader {
public:
    Downloader(HttpTransportPtr transport, StoragePtr storage, Logger logger, DownloaderConfig config = {});

    // libcurl transport, local filesystem and a "download" spdlog logger.
    static Downloader createDefault(const DownloaderConfig& config = DownloaderConfig::fromEnvironment());

    TransferOutcome downloadFile(const std::string& url, const std::filesystem::path& destination,
                                 const DownloadOptions& options = {}) const;

    // Buffers the whole body in memory. Not meant for large payloads.
    MemoryOutcome downloadToMemory(const std::string& url, const MemoryOptions& options = {}) const;

    BatchResult downloadBatch(const std::vector<BatchDownload>& downloads, const BatchOptions& options = {}) const;

    [[nodiscard]] std::optional<std::int64_t> peekSize(const std::string& url) const;

    [[nodiscard]] const DownloaderConfig& config() const noexcept { return config_; }

private:
    TransferRequest makeRequest(const std::string& url, const std::filesystem::path& destination,
                                const TransferSettings& settings) const;

    DownloaderConfig config_;
    Logger logger_;
    std::shared_ptr<SingleTransfer> transfer_;
    BatchOrchestrator batch_;
    SizeProbe probe_;
};

} // namespace streamfetch
