#include "fake_transport.hpp"

#include <streamfetch/errors.hpp>
#include <streamfetch/storage.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace streamfetch;
namespace fs = std::filesystem;

class FileStorageTest : public ::testing::Test {
protected:
    void SetUp() override { root_ = fakes::makeTempDir(); }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    fs::path root_;
    FileStorage storage_;
};

TEST_F(FileStorageTest, EnsureDirCreatesNestedDirectories) {
    const auto dir = root_ / "a" / "b" / "c";
    storage_.ensureDir(dir);
    EXPECT_TRUE(fs::is_directory(dir));

    EXPECT_NO_THROW(storage_.ensureDir(dir));
    EXPECT_NO_THROW(storage_.ensureDir(fs::path{}));
}

TEST_F(FileStorageTest, EnsureDirFailsWhenPathIsAFile) {
    const auto blocker = root_ / "blocker";
    std::ofstream(blocker) << "x";
    EXPECT_THROW(storage_.ensureDir(blocker / "child"), StorageError);
}

TEST_F(FileStorageTest, OpenForWriteTruncatesExistingContent) {
    const auto path = root_ / "out.bin";
    std::ofstream(path) << "previous content that is longer";

    auto sink = storage_.openForWrite(path);
    sink->write("new", 3);
    sink->close();

    EXPECT_EQ(fakes::readFile(path), "new");
}

TEST_F(FileStorageTest, WriteAfterCloseThrows) {
    auto sink = storage_.openForWrite(root_ / "closed.bin");
    sink->close();
    EXPECT_NO_THROW(sink->close());
    EXPECT_THROW(sink->write("x", 1), StorageError);
}

TEST_F(FileStorageTest, OpenInMissingDirectoryThrows) {
    EXPECT_THROW(storage_.openForWrite(root_ / "missing" / "file.bin"), StorageError);
}

TEST_F(FileStorageTest, RemoveIsIdempotent) {
    const auto path = root_ / "gone.bin";
    std::ofstream(path) << "data";

    storage_.remove(path);
    EXPECT_FALSE(fs::exists(path));
    EXPECT_NO_THROW(storage_.remove(path));
}
