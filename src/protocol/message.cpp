#include "ed2kwire/protocol/message.hpp"
#include "ed2kwire/protocol/codec_error.hpp"
#include <sstream>
#include <iomanip>

namespace ed2kwire::protocol {

Message decode_message(std::span<const std::uint8_t> data) {
    auto header = Header::deserialize(data);
    if (data.size() <= TYPE_OFFSET) {
        throw CodecError(CodecErrc::SHORT_BUFFER, "no message type after header");
    }

    switch (static_cast<MessageType>(data[TYPE_OFFSET])) {
        case MessageType::LOGIN_REQUEST:   return LoginMessage::deserialize(data);
        case MessageType::SERVER_MESSAGE:  return ServerMessage::deserialize(data);
        case MessageType::ID_CHANGE:       return IdChangeMessage::deserialize(data);
        case MessageType::OFFER_FILES:     return OfferFilesMessage::deserialize(data);
        case MessageType::GET_SERVER_LIST: return GetServerListMessage::deserialize(data);
        case MessageType::SERVER_LIST:     return ServerListMessage::deserialize(data);
        case MessageType::SERVER_STATUS:   return ServerStatusMessage::deserialize(data);
        case MessageType::SERVER_IDENT:    return ServerIdentMessage::deserialize(data);
        case MessageType::SEARCH_REQUEST:  return SearchRequestMessage::deserialize(data);
    }

    std::ostringstream oss;
    oss << "no message variant for type 0x" << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(data[TYPE_OFFSET]) << " (protocol 0x" << std::setw(2)
        << static_cast<int>(header.protocol) << ")";
    throw CodecError(CodecErrc::WRONG_MESSAGE_TYPE, oss.str());
}

std::vector<std::uint8_t> encode_message(const Message& message) {
    return std::visit([](const auto& msg) { return msg.serialize(); }, message);
}

std::vector<std::uint8_t> encode_message(const Message* message) {
    if (message == nullptr) {
        return {};
    }
    return encode_message(*message);
}

MessageType message_type(const Message& message) {
    return std::visit([](const auto& msg) { return msg.type(); }, message);
}

std::string describe(const Message& message) {
    return std::visit([](const auto& msg) { return msg.describe(); }, message);
}

std::string_view to_string(MessageType type) {
    switch (type) {
        case MessageType::LOGIN_REQUEST:   return "login";
        case MessageType::SERVER_MESSAGE:  return "server-message";
        case MessageType::ID_CHANGE:       return "id-change";
        case MessageType::OFFER_FILES:     return "offer-files";
        case MessageType::GET_SERVER_LIST: return "get-server-list";
        case MessageType::SERVER_LIST:     return "server-list";
        case MessageType::SERVER_STATUS:   return "server-status";
        case MessageType::SERVER_IDENT:    return "server-ident";
        case MessageType::SEARCH_REQUEST:  return "search-request";
    }
    return "unknown";
}

}
