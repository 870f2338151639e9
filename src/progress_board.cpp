#include "streamfetch/progress_board.hpp"

#include <algorithm>
#include <filesystem>
#include <utility>

#include <fmt/format.h>

namespace streamfetch {

ProgressBoard::ProgressBoard(std::ostream& out) : out_(out) {}

std::size_t ProgressBoard::addFile(std::string url, std::string filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    FileProgress progress;
    progress.url = std::move(url);
    progress.filename = std::move(filename);
    files_.push_back(std::move(progress));
    return files_.size() - 1;
}

void ProgressBoard::update(std::size_t index, const ProgressSample& sample) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= files_.size()) {
        return;
    }
    auto& file = files_[index];
    file.is_running = true;
    file.downloaded_bytes = static_cast<std::uint64_t>(std::max<std::int64_t>(0, sample.bytes_done));
    file.total_bytes = static_cast<std::uint64_t>(std::max<std::int64_t>(0, sample.bytes_total));
    file.bytes_per_second = sample.bytes_per_second;
}

void ProgressBoard::complete(std::size_t index, bool succeeded, std::string error_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= files_.size()) {
        return;
    }
    auto& file = files_[index];
    file.is_running = false;
    file.is_finished = true;
    file.has_error = !succeeded;
    if (!error_message.empty()) {
        file.error_message = std::move(error_message);
    }
}

FileProgress ProgressBoard::snapshot(std::size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index < files_.size() ? files_[index] : FileProgress{};
}

std::string ProgressBoard::buildPanel() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string panel;
    panel.reserve(files_.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("streamfetch ({} files)\n", files_.size());
    panel.append("--------------------------------------------------\n");

    std::uint64_t total_all = 0;
    std::uint64_t downloaded_all = 0;
    std::size_t finished = 0;
    for (const auto& file : files_) {
        panel += formatTaskLine(file);
        panel.push_back('\n');

        total_all += file.total_bytes;
        downloaded_all += std::min(file.downloaded_bytes, file.total_bytes);
        if (file.is_finished) {
            ++finished;
        }
    }

    panel.append("--------------------------------------------------\n");
    if (total_all > 0) {
        const double ratio = static_cast<double>(downloaded_all) / static_cast<double>(total_all);
        panel += fmt::format("Overall: {:>3}%  ({}/{} files)", static_cast<int>(ratio * 100.0), finished, files_.size());
    } else {
        panel += fmt::format("Overall: N/A  ({}/{} files)", finished, files_.size());
    }
    panel.push_back('\n');
    panel.append("==================================================\n");

    return panel;
}

std::string ProgressBoard::formatTaskLine(const FileProgress& progress) {
    std::string line;
    line.reserve(256);

    std::string display_name;
    if (!progress.filename.empty()) {
        display_name = std::filesystem::path{progress.filename}.filename().string();
    }
    if (display_name.empty()) {
        display_name = progress.filename;
    }
    if (display_name.size() > 20) {
        display_name = display_name.substr(0, 20);
    }
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }

    if (progress.total_bytes > 0) {
        const double ratio = std::min(1.0, static_cast<double>(progress.downloaded_bytes) /
                                               static_cast<double>(progress.total_bytes));
        const int percent = static_cast<int>(ratio * 100.0);
        constexpr int bar_width = 30;
        const int bar_pos = static_cast<int>(ratio * bar_width);

        std::string bar;
        bar.reserve(static_cast<std::size_t>(bar_width) * 3);
        for (int i = 0; i < bar_width; ++i) {
            bar += (i < bar_pos) ? "█" : "░";
        }

        line += fmt::format("{:<20} [{}] {:>3}% ({}/{})", display_name, bar, percent,
                            formatSize(progress.downloaded_bytes), formatSize(progress.total_bytes));
    } else if (progress.downloaded_bytes > 0 || progress.is_finished) {
        line += fmt::format("{:<20} [size unknown] {}", display_name, formatSize(progress.downloaded_bytes));
    } else {
        line += fmt::format("{:<20} [Waiting...]", display_name);
    }

    if (progress.has_error) {
        line += progress.error_message.empty() ? "  ❌ Failed" : fmt::format("  ❌ {}", progress.error_message);
    } else if (progress.is_finished) {
        line.append("  ✅ Done");
    } else if (progress.is_running && progress.bytes_per_second > 0.0) {
        line += fmt::format("  {}/s", formatSize(static_cast<std::uint64_t>(progress.bytes_per_second)));
    }

    return line;
}

std::string ProgressBoard::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

void ProgressBoard::redraw() {
    const auto panel = buildPanel();
    const std::size_t current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << panel << std::flush;
    previous_lines_ = current_lines;
}

void ProgressBoard::printErrors(std::ostream& err) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& file : files_) {
        if (file.has_error) {
            err << fmt::format("{} <- {}: {}", file.filename, file.url,
                               file.error_message.empty() ? "failed" : file.error_message)
                << '\n';
        }
    }
}

} // namespace streamfetch
