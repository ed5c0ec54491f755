#pragma once

#include "ed2kwire/protocol/messages.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ed2kwire::protocol {

using Message = std::variant<
    LoginMessage,
    ServerMessage,
    IdChangeMessage,
    OfferFilesMessage,
    GetServerListMessage,
    ServerListMessage,
    ServerStatusMessage,
    ServerIdentMessage,
    SearchRequestMessage
>;

// Reads the discriminant at offset 5 and decodes the matching variant.
// An unrecognized discriminant throws CodecError(WRONG_MESSAGE_TYPE).
Message decode_message(std::span<const std::uint8_t> data);

std::vector<std::uint8_t> encode_message(const Message& message);

// A null message encodes to zero bytes.
std::vector<std::uint8_t> encode_message(const Message* message);

MessageType message_type(const Message& message);
std::string describe(const Message& message);

std::string_view to_string(MessageType type);

}
