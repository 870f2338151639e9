#include "streamfetch/logger.hpp"

#include <utility>
#include <vector>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace streamfetch {

Logger::Logger(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {
    if (!logger_) {
        logger_ = std::make_shared<spdlog::logger>("null", std::make_shared<spdlog::sinks::null_sink_mt>());
    }
}

Logger Logger::create(const std::string& name, const LogSettings& settings) {
    if (auto existing = spdlog::get(name)) {
        return Logger{existing};
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!settings.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                settings.file, settings.max_file_bytes, settings.max_files));
        } catch (const spdlog::spdlog_ex& ex) {
            spdlog::warn("Log file {} unavailable: {}", settings.file, ex.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(settings.level));
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%n] [%^%l%$] %v");

    try {
        spdlog::register_logger(logger);
    } catch (const spdlog::spdlog_ex&) {
        // Registered concurrently under the same name.
        if (auto existing = spdlog::get(name)) {
            return Logger{existing};
        }
    }
    return Logger{logger};
}

Logger Logger::null() { return Logger{nullptr}; }

void Logger::debug(std::string_view message) const { logger_->debug(message); }

void Logger::info(std::string_view message) const { logger_->info(message); }

void Logger::warn(std::string_view message) const { logger_->warn(message); }

void Logger::error(std::string_view message, std::string_view detail) const {
    if (detail.empty()) {
        logger_->error(message);
    } else {
        logger_->error("{} {}", message, detail);
    }
}

} // namespace streamfetch
