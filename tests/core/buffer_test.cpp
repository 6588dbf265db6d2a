#include <gtest/gtest.h>
#include <peerlink/core/buffer.hpp>

namespace peerlink::core::test {

TEST(BufferTest, WriterUsesNetworkByteOrder) {
    ByteWriter writer;
    writer.writeU8(0x01);
    writer.writeU16(0x0203);
    writer.writeU32(0x04050607);

    ByteBuffer expected{0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07};
    EXPECT_EQ(writer.data(), expected);
}

TEST(BufferTest, ReaderReadsWhatWriterWrote) {
    ByteWriter writer;
    writer.writeU32(0xDEADBEEF);
    writer.writeU64(0x0102030405060708ull);
    writer.writeBytes(to_bytes("tail"));

    ByteBuffer data = writer.release();
    ByteReader reader(data);
    EXPECT_EQ(reader.readU32(), 0xDEADBEEFu);
    EXPECT_EQ(reader.readU64(), 0x0102030405060708ull);
    EXPECT_EQ(reader.remaining(), 4u);
    EXPECT_EQ(to_string(reader.readRemaining()), "tail");
    EXPECT_EQ(reader.remaining(), 0u);
}

TEST(BufferTest, UnderflowThrowsInvalidData) {
    ByteBuffer data{0x01, 0x02, 0x03};
    ByteReader reader(data);
    reader.readU16();

    try {
        reader.readU32();
        FAIL() << "Expected underflow";
    }
    catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidData);
    }
    // Posisi tidak bergeser setelah gagal
    EXPECT_EQ(reader.position(), 2u);
    EXPECT_EQ(reader.readU8(), 0x03);
}

TEST(BufferTest, StringConversion) {
    EXPECT_EQ(to_string(to_bytes("peerlink")), "peerlink");
    EXPECT_TRUE(to_bytes("").empty());
}

} // namespace peerlink::core::test
