#include <gtest/gtest.h>
#include "ed2kwire/protocol/message.hpp"
#include "ed2kwire/protocol/codec_error.hpp"

using namespace ed2kwire::protocol;

class MessageDispatchTest : public ::testing::Test {
protected:
    static std::vector<Message> sample_messages() {
        LoginMessage login;
        login.uid = Uid::generate();
        login.port = 4662;
        login.tags = {Tag{tag_id::CLIENT_NAME, std::string("peer")}};

        ServerMessage server_message;
        server_message.messages = "welcome";

        IdChangeMessage id_change;
        id_change.client_id = 0x0A000001;
        id_change.bitmap = 0x1;

        OfferFilesMessage offer;
        FileEntry entry;
        entry.tags = {Tag{tag_id::FILE_NAME, std::string("a.txt")}};
        offer.files = {entry};

        ServerListMessage server_list;
        server_list.servers = {boost::asio::ip::tcp::endpoint(
            boost::asio::ip::make_address_v4("1.2.3.4"), 4661)};

        ServerStatusMessage status;
        status.user_count = 10;
        status.file_count = 20;

        ServerIdentMessage ident;
        ident.port = 4661;

        SearchRequestMessage search;
        search.query = {0x01, 0x00, 0x00};

        return {login, server_message, id_change, offer, GetServerListMessage{},
                server_list, status, ident, search};
    }
};

TEST_F(MessageDispatchTest, DecodeSelectsVariantByDiscriminant) {
    for (const auto& message : sample_messages()) {
        auto bytes = encode_message(message);
        auto decoded = decode_message(bytes);

        EXPECT_EQ(decoded.index(), message.index());
        EXPECT_EQ(message_type(decoded), message_type(message));
        EXPECT_EQ(encode_message(decoded), bytes) << to_string(message_type(message));
    }
}

TEST_F(MessageDispatchTest, DecodedFieldsSurvive) {
    ServerStatusMessage status;
    status.user_count = 4242;
    status.file_count = 99;

    auto decoded = decode_message(status.serialize());
    ASSERT_TRUE(std::holds_alternative<ServerStatusMessage>(decoded));
    EXPECT_EQ(std::get<ServerStatusMessage>(decoded).user_count, 4242u);
    EXPECT_EQ(std::get<ServerStatusMessage>(decoded).file_count, 99u);
}

TEST_F(MessageDispatchTest, NullMessageEncodesToNothing) {
    const Message* missing = nullptr;
    EXPECT_TRUE(encode_message(missing).empty());

    Message present = GetServerListMessage{};
    EXPECT_EQ(encode_message(&present).size(), HEADER_SIZE + 1);
}

TEST_F(MessageDispatchTest, UnknownDiscriminant) {
    std::vector<std::uint8_t> bytes = {0xE3, 0x01, 0x00, 0x00, 0x00, 0x99};

    try {
        decode_message(bytes);
        FAIL() << "expected CodecError";
    } catch (const CodecError& e) {
        EXPECT_EQ(e.code(), CodecErrc::WRONG_MESSAGE_TYPE);
    }
}

TEST_F(MessageDispatchTest, MissingDiscriminant) {
    std::vector<std::uint8_t> header_only = {0xE3, 0x01, 0x00, 0x00, 0x00};
    std::vector<std::uint8_t> partial_header = {0xE3, 0x01};

    for (const auto* bytes : {&header_only, &partial_header}) {
        try {
            decode_message(*bytes);
            FAIL() << "expected CodecError";
        } catch (const CodecError& e) {
            EXPECT_EQ(e.code(), CodecErrc::SHORT_BUFFER);
        }
    }
}

TEST_F(MessageDispatchTest, DescribeNamesVariant) {
    auto messages = sample_messages();
    EXPECT_NE(describe(messages[0]).find("[login]"), std::string::npos);
    EXPECT_NE(describe(messages[5]).find("1.2.3.4:4661"), std::string::npos);
    EXPECT_NE(describe(messages[6]).find("users: 10, files: 20"), std::string::npos);
    EXPECT_EQ(to_string(MessageType::OFFER_FILES), "offer-files");
}
