#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>

namespace streamfetch {

class ByteSink {
public:
    virtual ~ByteSink() = default;

    virtual void write(const char* data, std::size_t size) = 0;
    // Flushes and releases the underlying file. Further writes are errors.
    virtual void close() = 0;
};

class Storage {
public:
    virtual ~Storage() = default;

    virtual void ensureDir(const std::filesystem::path& dir) = 0;
    // Opens for writing, truncating existing content.
    virtual std::unique_ptr<ByteSink> openForWrite(const std::filesystem::path& path) = 0;
    // Idempotent: removing a missing path is not an error.
    virtual void remove(const std::filesystem::path& path) = 0;
};

using StoragePtr = std::shared_ptr<Storage>;

class FileStorage final : public Storage {
public:
    void ensureDir(const std::filesystem::path& dir) override;
    std::unique_ptr<ByteSink> openForWrite(const std::filesystem::path& path) override;
    void remove(const std::filesystem::path& path) override;
};

} // namespace streamfetch
