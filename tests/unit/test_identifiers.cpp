#include <gtest/gtest.h>
#include "ed2kwire/protocol/identifiers.hpp"
#include "ed2kwire/protocol/codec_error.hpp"

using namespace ed2kwire::protocol;

class IdentifiersTest : public ::testing::Test {};

TEST_F(IdentifiersTest, UidCopiesSixteenBytes) {
    std::vector<std::uint8_t> data(20);
    for (std::size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<std::uint8_t>(i);
    }

    auto uid = Uid::deserialize(data);
    for (std::size_t i = 0; i < UID_SIZE; ++i) {
        EXPECT_EQ(uid.bytes[i], i);
    }
    EXPECT_EQ(uid.serialize(), uid.bytes);
    EXPECT_EQ(uid.to_string(), "000102030405060708090A0B0C0D0E0F");
}

TEST_F(IdentifiersTest, UidShortBuffer) {
    std::vector<std::uint8_t> data(15, 0xFF);

    try {
        Uid::deserialize(data);
        FAIL() << "expected CodecError";
    } catch (const CodecError& e) {
        EXPECT_EQ(e.code(), CodecErrc::SHORT_BUFFER);
    }
}

TEST_F(IdentifiersTest, GeneratedUidCarriesClientMarkers) {
    auto first = Uid::generate();
    auto second = Uid::generate();

    EXPECT_EQ(first.bytes[5], 14);
    EXPECT_EQ(first.bytes[14], 111);
    EXPECT_NE(first, second);
}

TEST_F(IdentifiersTest, LowIdThreshold) {
    EXPECT_TRUE(ClientId{0}.is_low_id());
    EXPECT_TRUE(ClientId{LOW_ID_THRESHOLD - 1}.is_low_id());
    EXPECT_FALSE(ClientId{LOW_ID_THRESHOLD}.is_low_id());

    EXPECT_EQ(ClientId{12345}.describe(), "low-id");
}

TEST_F(IdentifiersTest, HighIdIsLittleEndianPackedAddress) {
    ClientId id{0x0100007F};
    EXPECT_EQ(id.describe(), "127.0.0.1");

    ClientId other{0x01020304};
    EXPECT_EQ(other.describe(), "4.3.2.1");
}

TEST_F(IdentifiersTest, FromAddressPacksFirstOctetLow) {
    auto id = ClientId::from_address(boost::asio::ip::make_address_v4("192.168.1.20"));

    EXPECT_EQ(id.value, 0x1401A8C0u);
    EXPECT_EQ(id.address().to_string(), "192.168.1.20");
    EXPECT_EQ(pack_ipv4(unpack_ipv4(0xCAFEBABE)), 0xCAFEBABEu);
}
