#include "ed2kwire/protocol/file_entry.hpp"
#include "ed2kwire/protocol/codec_error.hpp"
#include "ed2kwire/core/utils.hpp"
#include <sstream>

namespace ed2kwire::protocol {

void write_file_entry(ByteWriter& writer, const FileEntry& entry) {
    writer.write_bytes(entry.hash);
    writer.write_u32(entry.client_id);
    writer.write_u16(entry.port);
    write_tags(writer, entry.tags);
}

FileEntry read_file_entry(ByteReader& reader) {
    if (reader.remaining() < FILE_ENTRY_HEAD_SIZE) {
        throw CodecError(CodecErrc::SHORT_BUFFER,
                         "file entry needs " + std::to_string(FILE_ENTRY_HEAD_SIZE) +
                         " bytes, have " + std::to_string(reader.remaining()));
    }

    FileEntry entry;
    entry.hash = reader.read_array<HASH_SIZE>();
    entry.client_id = reader.read_u32();
    entry.port = reader.read_u16();
    entry.tags = read_tags(reader);
    return entry;
}

std::vector<std::uint8_t> FileEntry::serialize() const {
    std::vector<std::uint8_t> buffer;
    ByteWriter writer(buffer);
    write_file_entry(writer, *this);
    return buffer;
}

FileEntry FileEntry::deserialize(std::span<const std::uint8_t> data) {
    ByteReader reader(data);
    return read_file_entry(reader);
}

std::string FileEntry::describe() const {
    std::ostringstream oss;
    oss << core::utils::StringUtils::to_hex(hash) << " "
        << ClientId{client_id}.describe() << ":" << port << "\n";
    for (std::size_t i = 0; i < tags.size(); ++i) {
        oss << "  tag" << i << " - " << tags[i].name() << ": " << tags[i].value_string() << "\n";
    }
    return oss.str();
}

}
