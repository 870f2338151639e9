#include "streamfetch/errors.hpp"
#include "streamfetch/storage.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <system_error>

#include <fmt/format.h>

namespace streamfetch {

namespace {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

class FileSink final : public ByteSink {
public:
    FileSink(std::filesystem::path path, FILE* file) : path_(std::move(path)), file_(file) {}

    void write(const char* data, std::size_t size) override {
        if (!file_) {
            throw StorageError(fmt::format("Write to closed file: {}", path_.string()));
        }
        if (size == 0) {
            return;
        }

        const std::size_t written = std::fwrite(data, 1, size, file_.get());
        if (written != size) {
            throw StorageError(fmt::format("Failed to write output file {}: {}", path_.string(),
                                           std::strerror(errno)));
        }
    }

    void close() override {
        if (!file_) {
            return;
        }

        const bool flushed = std::fflush(file_.get()) == 0;
        FILE* raw = file_.release();
        const bool closed = std::fclose(raw) == 0;
        if (!flushed || !closed) {
            throw StorageError(fmt::format("Failed to finalize output file {}: {}", path_.string(),
                                           std::strerror(errno)));
        }
    }

private:
    std::filesystem::path path_;
    std::unique_ptr<FILE, FileDeleter> file_;
};

} // namespace

void FileStorage::ensureDir(const std::filesystem::path& dir) {
    if (dir.empty()) {
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw StorageError(fmt::format("Failed to create directory: {} - {}", dir.string(), ec.message()));
    }
}

std::unique_ptr<ByteSink> FileStorage::openForWrite(const std::filesystem::path& path) {
    FILE* file = std::fopen(path.c_str(), "wb");
    if (!file) {
        throw StorageError(fmt::format("Cannot create destination file {}: {}", path.string(),
                                       std::strerror(errno)));
    }
    return std::make_unique<FileSink>(path, file);
}

void FileStorage::remove(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw StorageError(fmt::format("Failed to remove {}: {}", path.string(), ec.message()));
    }
}

} // namespace streamfetch
