#pragma once

#include "ed2kwire/protocol/byte_io.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace ed2kwire::protocol {

// Value variant codes, stored in the low seven bits of a tag's type byte.
enum class TagType : std::uint8_t {
    STRING  = 0x02,
    UINT32  = 0x03,
    FLOAT32 = 0x04,
    BLOB    = 0x07,
    UINT16  = 0x08,
    UINT8   = 0x09,
    UINT64  = 0x0B
};

// Set in the type byte when the key is a one byte id instead of a name.
constexpr std::uint8_t TAG_NUMERIC_KEY_FLAG = 0x80;
constexpr std::uint8_t TAG_TYPE_MASK = 0x7F;

constexpr std::size_t MAX_TAG_STRING_SIZE = 0xFFFF;
constexpr std::size_t MAX_TAG_BLOB_SIZE = 1024 * 1024;

// Well-known tag ids. Ids are scoped by the message that carries them, so
// several names share a value.
namespace tag_id {
    constexpr std::uint8_t FILE_NAME        = 0x01;
    constexpr std::uint8_t FILE_SIZE        = 0x02;
    constexpr std::uint8_t FILE_TYPE        = 0x03;
    constexpr std::uint8_t FILE_FORMAT      = 0x04;
    constexpr std::uint8_t FILE_SOURCES     = 0x15;
    constexpr std::uint8_t FILE_SIZE_HI     = 0x3A;

    constexpr std::uint8_t CLIENT_NAME      = 0x01;
    constexpr std::uint8_t CLIENT_PORT      = 0x0F;
    constexpr std::uint8_t CLIENT_VERSION   = 0x11;
    constexpr std::uint8_t SERVER_FLAGS     = 0x20;
    constexpr std::uint8_t EMULE_VERSION    = 0xFB;

    constexpr std::uint8_t SERVER_NAME        = 0x01;
    constexpr std::uint8_t SERVER_DESCRIPTION = 0x0B;
}

// Opaque byte payload, kept distinct from text values.
struct TagBlob {
    std::vector<std::uint8_t> bytes;

    bool operator==(const TagBlob&) const = default;
};

using TagKey = std::variant<std::uint8_t, std::string>;
using TagValue = std::variant<std::uint8_t, std::uint16_t, std::uint32_t, std::uint64_t,
                              float, std::string, TagBlob>;

struct Tag {
    TagKey key;
    TagValue value;

    bool has_numeric_key() const { return std::holds_alternative<std::uint8_t>(key); }
    TagType type() const;
    std::uint8_t type_byte() const;

    // Number of bytes write_tag() emits for this tag.
    std::size_t encoded_size() const;

    std::string name() const;
    std::string value_string() const;

    std::vector<std::uint8_t> serialize() const;
    static Tag deserialize(std::span<const std::uint8_t> data);

    // Float values compare by bit pattern, so a NaN tag equals its own
    // decoded copy and 0.0 differs from -0.0 as it does on the wire.
    bool operator==(const Tag& other) const;
};

void write_tag(ByteWriter& writer, const Tag& tag);
Tag read_tag(ByteReader& reader);

// Count-prefixed (uint32) tag lists, as embedded in login, server ident
// and file entries.
void write_tags(ByteWriter& writer, const std::vector<Tag>& tags);
std::vector<Tag> read_tags(ByteReader& reader);

}
