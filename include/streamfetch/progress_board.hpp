#pragma once

#include "progress.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace streamfetch {

struct FileProgress {
    std::string url;
    std::string filename;
    std::uint64_t total_bytes{0};
    std::uint64_t downloaded_bytes{0};
    double bytes_per_second{0.0};
    bool is_running{false};
    bool is_finished{false};
    bool has_error{false};
    std::string error_message;
};

// update() and complete() may come from transfer threads, redraw() from one thread only.
class ProgressBoard {
public:
    explicit ProgressBoard(std::ostream& out);

    std::size_t addFile(std::string url, std::string filename);
    void update(std::size_t index, const ProgressSample& sample);
    void complete(std::size_t index, bool succeeded, std::string error_message = {});

    void redraw();
    void printErrors(std::ostream& err) const;

    [[nodiscard]] std::string buildPanel() const;
    [[nodiscard]] FileProgress snapshot(std::size_t index) const;

    static std::string formatTaskLine(const FileProgress& progress);
    static std::string formatSize(std::uint64_t bytes);

private:
    std::ostream& out_;
    mutable std::mutex mutex_;
    std::vector<FileProgress> files_;
    std::size_t previous_lines_{0};
};

} // namespace streamfetch
