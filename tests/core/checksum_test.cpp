#include <gtest/gtest.h>
#include <peerlink/core/checksum.hpp>

namespace peerlink::core::test {

TEST(ChecksumTest, KnownDigests) {
    EXPECT_EQ(sha256Hex(ByteBuffer{}),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256Hex(to_bytes("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(ChecksumTest, IncrementalMatchesOneShot) {
    ByteBuffer data = to_bytes("The quick brown fox jumps over the lazy dog");

    Sha256 hasher;
    hasher.update(data.data(), 10);
    hasher.update(data.data() + 10, data.size() - 10);
    EXPECT_EQ(hasher.finalHex(), sha256Hex(data));
}

TEST(ChecksumTest, FinalizeTwiceThrows) {
    Sha256 hasher;
    hasher.update(to_bytes("x"));
    hasher.finalHex();
    EXPECT_THROW(hasher.finalHex(), Error);
}

TEST(ChecksumTest, BytesToHex) {
    std::uint8_t bytes[] = {0x00, 0x0f, 0xa0, 0xff};
    EXPECT_EQ(bytesToHex(bytes, sizeof(bytes)), "000fa0ff");
}

} // namespace peerlink::core::test
