#include <gtest/gtest.h>
#include "ed2kwire/protocol/byte_io.hpp"
#include "ed2kwire/protocol/codec_error.hpp"

using namespace ed2kwire::protocol;

class ByteIoTest : public ::testing::Test {
protected:
    std::vector<std::uint8_t> buffer;
};

TEST_F(ByteIoTest, WritesLittleEndian) {
    ByteWriter writer(buffer);
    writer.write_u16(0x0102);
    writer.write_u32(0x03040506);
    writer.write_u64(0x0708090A0B0C0D0EULL);

    std::vector<std::uint8_t> expected = {
        0x02, 0x01,
        0x06, 0x05, 0x04, 0x03,
        0x0E, 0x0D, 0x0C, 0x0B, 0x0A, 0x09, 0x08, 0x07
    };
    EXPECT_EQ(buffer, expected);
}

TEST_F(ByteIoTest, ReadsBackWrittenValues) {
    ByteWriter writer(buffer);
    writer.write_u8(0xAB);
    writer.write_u16(0xBEEF);
    writer.write_u32(0xDEADBEEF);
    writer.write_u64(0x0123456789ABCDEFULL);
    writer.write_f32(3.5f);

    ByteReader reader(buffer);
    EXPECT_EQ(reader.read_u8(), 0xAB);
    EXPECT_EQ(reader.read_u16(), 0xBEEF);
    EXPECT_EQ(reader.read_u32(), 0xDEADBEEFu);
    EXPECT_EQ(reader.read_u64(), 0x0123456789ABCDEFULL);
    EXPECT_FLOAT_EQ(reader.read_f32(), 3.5f);
    EXPECT_TRUE(reader.empty());
}

TEST_F(ByteIoTest, ShortReadThrowsAndKeepsCursor) {
    buffer = {0x01, 0x02, 0x03};
    ByteReader reader(buffer);

    try {
        reader.read_u32();
        FAIL() << "expected CodecError";
    } catch (const CodecError& e) {
        EXPECT_EQ(e.code(), CodecErrc::SHORT_BUFFER);
    }

    EXPECT_EQ(reader.remaining(), 3u);
    EXPECT_EQ(reader.read_u16(), 0x0201);
}

TEST_F(ByteIoTest, PatchOverwritesInPlace) {
    ByteWriter writer(buffer);
    writer.write_u8(0xE3);
    writer.write_u32(0);
    writer.write_u8(0x14);
    writer.patch_u32(1, 1);

    std::vector<std::uint8_t> expected = {0xE3, 0x01, 0x00, 0x00, 0x00, 0x14};
    EXPECT_EQ(buffer, expected);
    EXPECT_THROW(writer.patch_u32(4, 0), CodecError);
}

TEST_F(ByteIoTest, ReadRestConsumesEverything) {
    buffer = {0x01, 0x02, 0x03, 0x04};
    ByteReader reader(buffer);
    reader.read_u8();

    auto rest = reader.read_rest();
    EXPECT_EQ(rest.size(), 3u);
    EXPECT_TRUE(reader.empty());
}
