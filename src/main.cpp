#include "streamfetch/downloader.hpp"
#include "streamfetch/progress_board.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void onInterrupt(int) { g_interrupted = 1; }

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName
              << " [options] <url1> <file1> [<url2> <file2> ...]\n"
              << "       " << programName << " --size <url>"
              << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>   Set download directory (default: current directory)\n"
              << "  -c <count>       Maximum concurrent downloads (default: 5)\n"
              << "  -r <count>       Retries per file (default: 3)\n"
              << "  -b <ms>          Initial retry delay, doubled on each retry (default: 1000)\n"
              << "  -t <ms>          Connection timeout (default: 30000)\n"
              << "  -H <header>      Extra request header, \"Name: value\" (repeatable)\n"
              << "  --size <url>     Print the remote file size and exit\n"
              << "  -q               Do not draw the progress panel\n"
              << "  -v               Verbose logging\n"
              << "  -h, --help       Show this message" << std::endl;
}

int parseInt(const std::string& text, const char* what, int min, int max) {
    int value = 0;
    try {
        std::size_t consumed = 0;
        value = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument(text);
        }
    } catch (const std::exception&) {
        throw std::runtime_error(fmt::format("Invalid {}: {}", what, text));
    }
    if (value < min || value > max) {
        throw std::runtime_error(fmt::format("{} must be between {} and {}", what, min, max));
    }
    return value;
}

std::pair<std::string, std::string> parseHeader(const std::string& text) {
    const auto colon = text.find(':');
    if (colon == std::string::npos || colon == 0) {
        throw std::runtime_error("Invalid header (expected \"Name: value\"): " + text);
    }
    std::string value = text.substr(colon + 1);
    const auto first = value.find_first_not_of(" \t");
    value = first == std::string::npos ? std::string{} : value.substr(first);
    return {text.substr(0, colon), value};
}

} // namespace

int main(int argc, char** argv) {
    try {
        auto config = streamfetch::DownloaderConfig::fromEnvironment();
        streamfetch::BatchOptions options;
        std::filesystem::path download_dir = std::filesystem::current_path();
        std::string size_url;
        bool quiet = false;
        int arg_index = 1;

        auto requireValue = [&](const std::string& option) -> std::string {
            if (arg_index + 1 >= argc) {
                throw std::runtime_error("Missing value for " + option);
            }
            return argv[arg_index + 1];
        };

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-d") {
                download_dir = requireValue(option);
                arg_index += 2;
            } else if (option == "-c") {
                config.concurrency = parseInt(requireValue(option), "concurrency", 1, 64);
                arg_index += 2;
            } else if (option == "-r") {
                config.max_retries = parseInt(requireValue(option), "retry count", 0, 20);
                arg_index += 2;
            } else if (option == "-b") {
                config.initial_backoff = std::chrono::milliseconds{parseInt(requireValue(option), "retry delay", 0, 600000)};
                arg_index += 2;
            } else if (option == "-t") {
                config.timeout = std::chrono::milliseconds{parseInt(requireValue(option), "timeout", 1, 3600000)};
                arg_index += 2;
            } else if (option == "-H") {
                options.headers.insert(parseHeader(requireValue(option)));
                arg_index += 2;
            } else if (option == "--size") {
                size_url = requireValue(option);
                arg_index += 2;
            } else if (option == "-q") {
                quiet = true;
                ++arg_index;
            } else if (option == "-v") {
                config.log.level = "debug";
                ++arg_index;
            } else if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                printUsage(argv[0]);
                return 1;
            }
        }

        if (!quiet && config.log.level == "info") {
            // Keep per-attempt chatter from scrolling the panel.
            config.log.level = "warn";
        }
        const auto downloader = streamfetch::Downloader::createDefault(config);

        if (!size_url.empty()) {
            const auto size = downloader.peekSize(size_url);
            if (size) {
                std::cout << *size << " (" << streamfetch::ProgressBoard::formatSize(static_cast<std::uint64_t>(*size)) << ")" << std::endl;
            } else {
                std::cout << "unknown" << std::endl;
            }
            return 0;
        }

        if (argc - arg_index < 2 || (argc - arg_index) % 2 != 0) {
            printUsage(argv[0]);
            return 1;
        }

        streamfetch::ProgressBoard board(std::cout);
        std::vector<streamfetch::BatchDownload> downloads;
        for (int i = arg_index; i < argc; i += 2) {
            const std::filesystem::path destination = download_dir / argv[i + 1];
            downloads.push_back({argv[i], destination});
            board.addFile(argv[i], destination.string());
        }

        streamfetch::CancellationSource interrupt;
        options.cancel = interrupt.token();
        options.on_file_progress = [&board](std::size_t index, const std::string&, const streamfetch::ProgressSample& sample) {
            board.update(index, sample);
        };
        options.on_file_complete = [&board](std::size_t index, const std::string&, bool succeeded) {
            board.complete(index, succeeded);
        };
        std::signal(SIGINT, onInterrupt);

        streamfetch::BatchResult result;
        std::atomic<bool> finished{false};
        std::thread runner([&] {
            result = downloader.downloadBatch(downloads, options);
            finished = true;
        });

        while (!finished) {
            if (g_interrupted && !interrupt.isCancellationRequested()) {
                interrupt.cancel();
            }
            if (!quiet) {
                board.redraw();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        runner.join();

        for (std::size_t i = 0; i < result.outcomes.size(); ++i) {
            const auto& outcome = result.outcomes[i];
            board.complete(i, outcome.succeeded, outcome.error_message.value_or(""));
        }
        if (!quiet) {
            board.redraw();
        }
        board.printErrors(std::cerr);

        std::cout << fmt::format("{} succeeded, {} failed", result.success_count, result.failure_count) << std::endl;
        return result.failure_count == 0 ? 0 : 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
