#include <gtest/gtest.h>
#include <peerlink/core/checksum.hpp>
#include <peerlink/transfer/chunk_source.hpp>

#include <filesystem>
#include <fstream>

namespace peerlink::transfer::test {

namespace {

core::ByteBuffer pattern(std::size_t size) {
    core::ByteBuffer data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::uint8_t>(i * 31 + 7);
    }
    return data;
}

} // namespace

class FileChunkSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("peerlink_source_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path write(const std::string& name, const core::ByteBuffer& data) {
        auto path = dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        return path;
    }

    std::filesystem::path dir_;
};

TEST(MemoryChunkSourceTest, ReadsRanges) {
    MemoryChunkSource source("blob.bin", pattern(100));
    EXPECT_EQ(source.name(), "blob.bin");
    EXPECT_EQ(source.size(), 100u);

    auto slice = source.read(90, 10);
    ASSERT_EQ(slice.size(), 10u);
    EXPECT_EQ(slice[0], pattern(100)[90]);

    EXPECT_TRUE(source.read(100, 0).empty());
    EXPECT_THROW(source.read(95, 10), core::Error);
    EXPECT_THROW(source.read(101, 0), core::Error);
}

TEST(MemoryChunkSourceTest, ChecksumIsSha256OfContent) {
    auto data = pattern(5000);
    MemoryChunkSource source("blob.bin", data);
    EXPECT_EQ(source.checksum(), core::sha256Hex(data));

    MemoryChunkSource empty("empty", {});
    EXPECT_EQ(empty.checksum(), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(FileChunkSourceTest, OpensAndReadsFile) {
    auto data = pattern(70000);
    auto path = write("video.mp4", data);

    auto opened = FileChunkSource::open(path);
    ASSERT_TRUE(opened.is_ok());
    auto source = std::move(opened).value();

    EXPECT_EQ(source->name(), "video.mp4");
    EXPECT_EQ(source->size(), 70000u);
    EXPECT_EQ(source->checksum(), core::sha256Hex(data));

    auto tail = source->read(65536, 70000 - 65536);
    EXPECT_EQ(tail, core::ByteBuffer(data.begin() + 65536, data.end()));
    EXPECT_THROW(source->read(69999, 2), core::Error);
}

TEST_F(FileChunkSourceTest, MissingFileIsReported) {
    auto opened = FileChunkSource::open(dir_ / "nope.bin");
    ASSERT_TRUE(opened.is_error());
    EXPECT_EQ(opened.error().code(), core::ErrorCode::FileNotFound);
}

TEST_F(FileChunkSourceTest, DirectoryIsNotAFile) {
    auto opened = FileChunkSource::open(dir_);
    ASSERT_TRUE(opened.is_error());
    EXPECT_EQ(opened.error().code(), core::ErrorCode::InvalidArgument);
}

} // namespace peerlink::transfer::test
