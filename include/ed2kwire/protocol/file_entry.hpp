#pragma once

#include "ed2kwire/protocol/byte_io.hpp"
#include "ed2kwire/protocol/identifiers.hpp"
#include "ed2kwire/protocol/tag.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace ed2kwire::protocol {

// Hash, client id and port.
constexpr std::size_t FILE_ENTRY_HEAD_SIZE = HASH_SIZE + 4 + 2;

// One file offered by a client.
struct FileEntry {
    Hash hash{};
    std::uint32_t client_id = 0;
    std::uint16_t port = 0;
    std::vector<Tag> tags;

    std::vector<std::uint8_t> serialize() const;
    static FileEntry deserialize(std::span<const std::uint8_t> data);

    std::string describe() const;

    bool operator==(const FileEntry&) const = default;
};

void write_file_entry(ByteWriter& writer, const FileEntry& entry);
FileEntry read_file_entry(ByteReader& reader);

}
