#include "ed2kwire/protocol/tag.hpp"
#include "ed2kwire/protocol/codec_error.hpp"
#include "ed2kwire/core/utils.hpp"
#include <algorithm>
#include <bit>
#include <sstream>
#include <iomanip>

namespace ed2kwire::protocol {

namespace {
    template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
    template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

    bool is_known_type(std::uint8_t code) {
        switch (static_cast<TagType>(code)) {
            case TagType::STRING:
            case TagType::UINT32:
            case TagType::FLOAT32:
            case TagType::BLOB:
            case TagType::UINT16:
            case TagType::UINT8:
            case TagType::UINT64:
                return true;
        }
        return false;
    }

    void write_short_string(ByteWriter& writer, const std::string& str, const char* what) {
        if (str.size() > MAX_TAG_STRING_SIZE) {
            throw CodecError(CodecErrc::INVALID_LENGTH,
                             std::string(what) + " of " + std::to_string(str.size()) +
                             " bytes exceeds the 16-bit length prefix");
        }
        writer.write_u16(static_cast<std::uint16_t>(str.size()));
        writer.write_bytes(std::span(reinterpret_cast<const std::uint8_t*>(str.data()), str.size()));
    }

    std::string read_short_string(ByteReader& reader) {
        auto length = reader.read_u16();
        auto bytes = reader.read_bytes(length);
        return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    }
}

TagType Tag::type() const {
    return std::visit(overloaded{
        [](std::uint8_t)        { return TagType::UINT8; },
        [](std::uint16_t)       { return TagType::UINT16; },
        [](std::uint32_t)       { return TagType::UINT32; },
        [](std::uint64_t)       { return TagType::UINT64; },
        [](float)               { return TagType::FLOAT32; },
        [](const std::string&)  { return TagType::STRING; },
        [](const TagBlob&)      { return TagType::BLOB; }
    }, value);
}

std::uint8_t Tag::type_byte() const {
    auto code = static_cast<std::uint8_t>(type());
    return has_numeric_key() ? (code | TAG_NUMERIC_KEY_FLAG) : code;
}

std::size_t Tag::encoded_size() const {
    std::size_t size = 1;
    if (has_numeric_key()) {
        size += 1;
    } else {
        size += 2 + std::get<std::string>(key).size();
    }

    size += std::visit(overloaded{
        [](std::uint8_t)               -> std::size_t { return 1; },
        [](std::uint16_t)              -> std::size_t { return 2; },
        [](std::uint32_t)              -> std::size_t { return 4; },
        [](std::uint64_t)              -> std::size_t { return 8; },
        [](float)                      -> std::size_t { return 4; },
        [](const std::string& str)     -> std::size_t { return 2 + str.size(); },
        [](const TagBlob& blob)        -> std::size_t { return 4 + blob.bytes.size(); }
    }, value);
    return size;
}

bool Tag::operator==(const Tag& other) const {
    if (key != other.key || value.index() != other.value.index()) {
        return false;
    }
    if (std::holds_alternative<float>(value)) {
        return std::bit_cast<std::uint32_t>(std::get<float>(value)) ==
               std::bit_cast<std::uint32_t>(std::get<float>(other.value));
    }
    return value == other.value;
}

std::string Tag::name() const {
    if (has_numeric_key()) {
        std::ostringstream oss;
        oss << "0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
            << static_cast<int>(std::get<std::uint8_t>(key));
        return oss.str();
    }
    return std::get<std::string>(key);
}

std::string Tag::value_string() const {
    return std::visit(overloaded{
        [](std::uint8_t v)          { return std::to_string(v); },
        [](std::uint16_t v)         { return std::to_string(v); },
        [](std::uint32_t v)         { return std::to_string(v); },
        [](std::uint64_t v)         { return std::to_string(v); },
        [](float v) {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        },
        [](const std::string& str)  { return str; },
        [](const TagBlob& blob)     { return core::utils::StringUtils::to_hex(blob.bytes); }
    }, value);
}

std::vector<std::uint8_t> Tag::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(encoded_size());
    ByteWriter writer(buffer);
    write_tag(writer, *this);
    return buffer;
}

Tag Tag::deserialize(std::span<const std::uint8_t> data) {
    ByteReader reader(data);
    return read_tag(reader);
}

void write_tag(ByteWriter& writer, const Tag& tag) {
    writer.write_u8(tag.type_byte());

    if (tag.has_numeric_key()) {
        writer.write_u8(std::get<std::uint8_t>(tag.key));
    } else {
        write_short_string(writer, std::get<std::string>(tag.key), "tag name");
    }

    std::visit(overloaded{
        [&](std::uint8_t v)          { writer.write_u8(v); },
        [&](std::uint16_t v)         { writer.write_u16(v); },
        [&](std::uint32_t v)         { writer.write_u32(v); },
        [&](std::uint64_t v)         { writer.write_u64(v); },
        [&](float v)                 { writer.write_f32(v); },
        [&](const std::string& str)  { write_short_string(writer, str, "tag string"); },
        [&](const TagBlob& blob) {
            if (blob.bytes.size() > MAX_TAG_BLOB_SIZE) {
                throw CodecError(CodecErrc::INVALID_LENGTH,
                                 "tag blob of " + std::to_string(blob.bytes.size()) +
                                 " bytes exceeds " + std::to_string(MAX_TAG_BLOB_SIZE));
            }
            writer.write_u32(static_cast<std::uint32_t>(blob.bytes.size()));
            writer.write_bytes(blob.bytes);
        }
    }, tag.value);
}

Tag read_tag(ByteReader& reader) {
    auto type_byte = reader.read_u8();
    std::uint8_t code = type_byte & TAG_TYPE_MASK;
    if (!is_known_type(code)) {
        std::ostringstream oss;
        oss << "tag type byte 0x" << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(type_byte);
        throw CodecError(CodecErrc::UNKNOWN_TAG_TYPE, oss.str());
    }

    Tag tag;
    if (type_byte & TAG_NUMERIC_KEY_FLAG) {
        tag.key = reader.read_u8();
    } else {
        tag.key = read_short_string(reader);
    }

    switch (static_cast<TagType>(code)) {
        case TagType::UINT8:
            tag.value = reader.read_u8();
            break;
        case TagType::UINT16:
            tag.value = reader.read_u16();
            break;
        case TagType::UINT32:
            tag.value = reader.read_u32();
            break;
        case TagType::UINT64:
            tag.value = reader.read_u64();
            break;
        case TagType::FLOAT32:
            tag.value = reader.read_f32();
            break;
        case TagType::STRING:
            tag.value = read_short_string(reader);
            break;
        case TagType::BLOB: {
            auto length = reader.read_u32();
            if (length > MAX_TAG_BLOB_SIZE) {
                throw CodecError(CodecErrc::INVALID_LENGTH,
                                 "tag blob declares " + std::to_string(length) +
                                 " bytes, limit is " + std::to_string(MAX_TAG_BLOB_SIZE));
            }
            auto bytes = reader.read_bytes(length);
            tag.value = TagBlob{std::vector<std::uint8_t>(bytes.begin(), bytes.end())};
            break;
        }
    }
    return tag;
}

void write_tags(ByteWriter& writer, const std::vector<Tag>& tags) {
    writer.write_u32(static_cast<std::uint32_t>(tags.size()));
    for (const auto& tag : tags) {
        write_tag(writer, tag);
    }
}

std::vector<Tag> read_tags(ByteReader& reader) {
    auto count = reader.read_u32();
    std::vector<Tag> tags;
    // Each tag takes at least three bytes; cap the reservation by what is left.
    tags.reserve(std::min<std::size_t>(count, reader.remaining() / 3));
    for (std::uint32_t i = 0; i < count; ++i) {
        tags.push_back(read_tag(reader));
    }
    return tags;
}

}
