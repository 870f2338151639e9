#include "fake_transport.hpp"

#include <streamfetch/downloader.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

using namespace streamfetch;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class DownloaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fakes::makeTempDir();
        transport_ = std::make_shared<fakes::FakeTransport>();

        DownloaderConfig config;
        config.max_retries = 1;
        config.initial_backoff = 10ms;
        config.timeout = 2000ms;
        config.concurrency = 2;
        config.user_agent = "streamfetch-test/0.1";
        downloader_ = std::make_unique<Downloader>(transport_, std::make_shared<FileStorage>(), Logger::null(),
                                                   config);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
    std::shared_ptr<fakes::FakeTransport> transport_;
    std::unique_ptr<Downloader> downloader_;
};

TEST_F(DownloaderTest, DownloadFileUsesConfiguredDefaults) {
    transport_->script("https://example.com/a", fakes::ScriptedResponse::withStatus(500, "Internal Server Error"));

    const auto outcome = downloader_->downloadFile("https://example.com/a", dir_ / "a.bin");

    EXPECT_FALSE(outcome.succeeded);
    EXPECT_EQ(outcome.attempts, 2);
    const auto sent = transport_->requests();
    ASSERT_FALSE(sent.empty());
    EXPECT_EQ(sent[0].headers.at("User-Agent"), "streamfetch-test/0.1");
}

TEST_F(DownloaderTest, PerCallOptionsOverrideDefaults) {
    transport_->script("https://example.com/b", fakes::ScriptedResponse::withStatus(500, "Internal Server Error"));
    DownloadOptions options;
    options.retries = 0;
    options.headers["X-Trace"] = "abc";

    const auto outcome = downloader_->downloadFile("https://example.com/b", dir_ / "b.bin", options);

    EXPECT_EQ(outcome.attempts, 1);
    EXPECT_EQ(transport_->requests().at(0).headers.at("X-Trace"), "abc");
}

TEST_F(DownloaderTest, DownloadFileReportsProgress) {
    transport_->script("https://example.com/c", fakes::ScriptedResponse::ok(fakes::makePayload(4096)));
    std::vector<ProgressSample> samples;
    DownloadOptions options;
    options.on_progress = [&samples](const ProgressSample& sample) { samples.push_back(sample); };

    const auto outcome = downloader_->downloadFile("https://example.com/c", dir_ / "c.bin", options);

    ASSERT_TRUE(outcome.succeeded);
    ASSERT_FALSE(samples.empty());
    EXPECT_DOUBLE_EQ(samples.back().percentage, 100.0);
}

TEST_F(DownloaderTest, DownloadToMemoryReturnsBody) {
    transport_->script("https://example.com/config.json", fakes::ScriptedResponse::ok("{\"ok\":true}", 3));

    const auto outcome = downloader_->downloadToMemory("https://example.com/config.json");

    ASSERT_TRUE(outcome.succeeded);
    EXPECT_EQ(outcome.data, std::optional<std::string>{"{\"ok\":true}"});
    EXPECT_FALSE(outcome.error_message.has_value());
}

TEST_F(DownloaderTest, DownloadToMemoryRetriesThenSucceeds) {
    transport_->script("https://example.com/m", fakes::ScriptedResponse::withStatus(502, "Bad Gateway"));
    transport_->script("https://example.com/m", fakes::ScriptedResponse::ok("second time"));

    const auto outcome = downloader_->downloadToMemory("https://example.com/m");

    ASSERT_TRUE(outcome.succeeded);
    EXPECT_EQ(*outcome.data, "second time");
    EXPECT_EQ(transport_->sendCount(), 2u);
}

TEST_F(DownloaderTest, DownloadToMemoryReportsFailure) {
    transport_->script("https://example.com/gone", fakes::ScriptedResponse::withStatus(410, "Gone"));

    const auto outcome = downloader_->downloadToMemory("https://example.com/gone");

    EXPECT_FALSE(outcome.succeeded);
    EXPECT_FALSE(outcome.data.has_value());
    EXPECT_EQ(*outcome.error_message, "HTTP 410: Gone");
}

TEST_F(DownloaderTest, DownloadToMemoryAcceptsNoContent) {
    fakes::ScriptedResponse response;
    response.status = 204;
    response.reason = "No Content";
    response.no_body = true;
    transport_->script("https://example.com/none", response);

    const auto outcome = downloader_->downloadToMemory("https://example.com/none");

    ASSERT_TRUE(outcome.succeeded);
    EXPECT_EQ(*outcome.data, "");
}

TEST_F(DownloaderTest, DownloadToMemoryHonoursCancel) {
    CancellationSource source;
    source.cancel();
    MemoryOptions options;
    options.cancel = source.token();
    transport_->script("https://example.com/x", fakes::ScriptedResponse::ok("x"));

    const auto outcome = downloader_->downloadToMemory("https://example.com/x", options);

    EXPECT_FALSE(outcome.succeeded);
    EXPECT_EQ(*outcome.error_message, "Download cancelled");
}

TEST_F(DownloaderTest, DownloadBatchAlignsOutcomesWithInput) {
    std::vector<BatchDownload> downloads;
    for (int i = 0; i < 4; ++i) {
        const std::string url = "https://example.com/batch" + std::to_string(i);
        auto response = fakes::ScriptedResponse::ok("batch body " + std::to_string(i));
        response.chunk_delay = std::chrono::milliseconds{(4 - i) * 10};
        transport_->script(url, response);
        downloads.push_back({url, dir_ / ("batch" + std::to_string(i) + ".txt")});
    }

    std::vector<std::size_t> completed;
    std::mutex mutex;
    BatchOptions options;
    options.on_file_complete = [&](std::size_t index, const std::string&, bool) {
        std::lock_guard<std::mutex> lock(mutex);
        completed.push_back(index);
    };

    const auto result = downloader_->downloadBatch(downloads, options);

    EXPECT_EQ(result.success_count, 4u);
    EXPECT_LE(transport_->maxOpenConnections(), 2);
    ASSERT_EQ(result.outcomes.size(), 4u);
    for (std::size_t i = 0; i < downloads.size(); ++i) {
        EXPECT_EQ(*result.outcomes[i].destination, downloads[i].destination);
        EXPECT_EQ(fakes::readFile(downloads[i].destination), "batch body " + std::to_string(i));
    }
    EXPECT_EQ(completed.size(), 4u);
}

TEST_F(DownloaderTest, BatchConcurrencyOverride) {
    std::vector<BatchDownload> downloads;
    for (int i = 0; i < 6; ++i) {
        const std::string url = "https://example.com/o" + std::to_string(i);
        auto response = fakes::ScriptedResponse::ok("o", 1);
        response.chunk_delay = 20ms;
        transport_->script(url, response);
        downloads.push_back({url, dir_ / ("o" + std::to_string(i))});
    }
    BatchOptions options;
    options.concurrency = 1;

    const auto result = downloader_->downloadBatch(downloads, options);

    EXPECT_EQ(result.success_count, 6u);
    EXPECT_EQ(transport_->maxOpenConnections(), 1);
}

TEST_F(DownloaderTest, PeekSizeUsesHead) {
    fakes::ScriptedResponse response;
    response.no_body = true;
    response.headers["content-length"] = "2048";
    transport_->script("https://example.com/size", response);

    EXPECT_EQ(downloader_->peekSize("https://example.com/size"), std::optional<std::int64_t>{2048});
    EXPECT_FALSE(downloader_->peekSize("https://example.com/unscripted").has_value());
}
