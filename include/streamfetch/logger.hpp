#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

namespace streamfetch {

struct LogSettings {
    std::string level{"info"};
    std::string file; // empty = stderr only
    std::size_t max_file_bytes{10 * 1024 * 1024};
    std::size_t max_files{5};
};

class Logger {
public:
    explicit Logger(std::shared_ptr<spdlog::logger> logger);

    // Registers (or reuses) a stderr logger named `name`, adding a rotating file sink
    // when settings.file is set.
    static Logger create(const std::string& name, const LogSettings& settings = {});

    // Logger that drops everything.
    static Logger null();

    void debug(std::string_view message) const;
    void info(std::string_view message) const;
    void warn(std::string_view message) const;
    void error(std::string_view message, std::string_view detail = {}) const;

    [[nodiscard]] const std::shared_ptr<spdlog::logger>& raw() const noexcept { return logger_; }

private:
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace streamfetch
