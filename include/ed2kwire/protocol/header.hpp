#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace ed2kwire::protocol {

constexpr std::uint8_t PROTOCOL_EDONKEY = 0xE3;
constexpr std::uint8_t PROTOCOL_EMULE   = 0xC5;
constexpr std::uint8_t PROTOCOL_PACKED  = 0xD4;

constexpr std::size_t HEADER_SIZE = 5;
constexpr std::size_t PAYLOAD_SIZE_OFFSET = 1;
constexpr std::size_t TYPE_OFFSET = HEADER_SIZE;

// Frames larger than this are treated as corrupt by frame_length().
constexpr std::uint32_t DEFAULT_MAX_PAYLOAD_SIZE = 2 * 1024 * 1024;

struct Header {
    std::uint8_t protocol = PROTOCOL_EDONKEY;
    std::uint32_t payload_size = 0;   // Bytes following the header

    bool is_known_protocol() const;

    std::array<std::uint8_t, HEADER_SIZE> serialize() const;
    static Header deserialize(std::span<const std::uint8_t> data);

    // Rewrites the length field of a fully written frame.
    static void patch_payload_size(std::vector<std::uint8_t>& frame);

    std::string describe() const;

    bool operator==(const Header&) const = default;
};

// Returns the length of the first complete frame in data, or nullopt when
// more bytes are needed. Throws CodecError(INVALID_LENGTH) for a declared
// payload that is empty or larger than max_payload.
std::optional<std::size_t> frame_length(std::span<const std::uint8_t> data,
                                        std::uint32_t max_payload = DEFAULT_MAX_PAYLOAD_SIZE);

}
