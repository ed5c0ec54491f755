#include "ed2kwire/protocol/header.hpp"
#include "ed2kwire/protocol/byte_io.hpp"
#include "ed2kwire/protocol/codec_error.hpp"
#include <algorithm>
#include <sstream>
#include <iomanip>

namespace ed2kwire::protocol {

bool Header::is_known_protocol() const {
    return protocol == PROTOCOL_EDONKEY ||
           protocol == PROTOCOL_EMULE ||
           protocol == PROTOCOL_PACKED;
}

std::array<std::uint8_t, HEADER_SIZE> Header::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(HEADER_SIZE);

    ByteWriter writer(buffer);
    writer.write_u8(protocol);
    writer.write_u32(payload_size);

    std::array<std::uint8_t, HEADER_SIZE> result;
    std::copy(buffer.begin(), buffer.end(), result.begin());
    return result;
}

Header Header::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() < HEADER_SIZE) {
        throw CodecError(CodecErrc::SHORT_BUFFER,
                         "header needs " + std::to_string(HEADER_SIZE) + " bytes, have " +
                         std::to_string(data.size()));
    }

    ByteReader reader(data.subspan(0, HEADER_SIZE));
    Header header;
    header.protocol = reader.read_u8();
    header.payload_size = reader.read_u32();
    return header;
}

void Header::patch_payload_size(std::vector<std::uint8_t>& frame) {
    if (frame.size() < HEADER_SIZE) {
        throw CodecError(CodecErrc::SHORT_BUFFER, "frame shorter than its header");
    }
    ByteWriter writer(frame);
    writer.patch_u32(PAYLOAD_SIZE_OFFSET, static_cast<std::uint32_t>(frame.size() - HEADER_SIZE));
}

std::string Header::describe() const {
    std::ostringstream oss;
    oss << "protocol: 0x" << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(protocol) << std::dec
        << ", size: " << payload_size;
    return oss.str();
}

std::optional<std::size_t> frame_length(std::span<const std::uint8_t> data,
                                        std::uint32_t max_payload) {
    if (data.size() < HEADER_SIZE) {
        return std::nullopt;
    }

    auto header = Header::deserialize(data);
    if (header.payload_size == 0) {
        throw CodecError(CodecErrc::INVALID_LENGTH, "frame declares an empty payload");
    }
    if (header.payload_size > max_payload) {
        throw CodecError(CodecErrc::INVALID_LENGTH,
                         "frame declares " + std::to_string(header.payload_size) +
                         " payload bytes, limit is " + std::to_string(max_payload));
    }

    if (header.payload_size > data.size() - HEADER_SIZE) {
        return std::nullopt;
    }
    return HEADER_SIZE + static_cast<std::size_t>(header.payload_size);
}

}
