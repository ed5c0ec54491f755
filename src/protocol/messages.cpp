#include "ed2kwire/protocol/messages.hpp"
#include "ed2kwire/protocol/byte_io.hpp"
#include "ed2kwire/protocol/codec_error.hpp"
#include "ed2kwire/core/utils.hpp"
#include <algorithm>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <tuple>

namespace ed2kwire::protocol {

namespace {
    // Writes the header with a zero length placeholder and the type byte.
    std::vector<std::uint8_t> begin_frame(const Header& header, MessageType type) {
        std::vector<std::uint8_t> buffer;
        buffer.reserve(HEADER_SIZE + 1);
        ByteWriter writer(buffer);
        writer.write_u8(header.protocol);
        writer.write_u32(0);
        writer.write_u8(static_cast<std::uint8_t>(type));
        return buffer;
    }

    std::vector<std::uint8_t> finish_frame(std::vector<std::uint8_t> buffer) {
        Header::patch_payload_size(buffer);
        return buffer;
    }

    struct Frame {
        Header header;
        ByteReader body;
    };

    // Validates the header, the declared and minimum sizes and the
    // discriminant, and returns a reader over the body that stops at the
    // declared payload end.
    Frame open_frame(std::span<const std::uint8_t> data, MessageType expected, std::size_t min_body) {
        auto header = Header::deserialize(data);

        // data holds at least HEADER_SIZE bytes once the header parsed
        std::size_t available = data.size() - HEADER_SIZE;
        if (header.payload_size > available || min_body > available) {
            throw CodecError(CodecErrc::SHORT_BUFFER,
                             "header declares " + std::to_string(header.payload_size) +
                             " payload bytes (minimum " + std::to_string(min_body) +
                             "), have " + std::to_string(available));
        }
        if (header.payload_size < min_body) {
            throw CodecError(CodecErrc::INVALID_LENGTH,
                             "header declares " + std::to_string(header.payload_size) +
                             " payload bytes, message needs at least " + std::to_string(min_body));
        }
        if (data[TYPE_OFFSET] != static_cast<std::uint8_t>(expected)) {
            std::ostringstream oss;
            oss << "expected type 0x" << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<int>(expected) << ", got 0x" << std::setw(2)
                << static_cast<int>(data[TYPE_OFFSET]);
            throw CodecError(CodecErrc::WRONG_MESSAGE_TYPE, oss.str());
        }

        return Frame{header, ByteReader(data.subspan(TYPE_OFFSET + 1, header.payload_size - 1))};
    }

    void describe_tags(std::ostringstream& oss, const std::vector<Tag>& tags) {
        for (std::size_t i = 0; i < tags.size(); ++i) {
            oss << "tag" << i << " - " << tags[i].name() << ": " << tags[i].value_string() << "\n";
        }
    }

    bool same_protocol(const Header& a, const Header& b) {
        return a.protocol == b.protocol;
    }

    std::string describe_client_id(std::uint32_t client_id) {
        std::ostringstream oss;
        oss << "0x" << std::hex << client_id << std::dec << "(" << ClientId{client_id}.describe() << ")";
        return oss.str();
    }
}

std::vector<std::uint8_t> LoginMessage::serialize() const {
    auto buffer = begin_frame(header, TYPE);
    ByteWriter writer(buffer);
    writer.write_bytes(uid.bytes);
    writer.write_u32(client_id);
    writer.write_u16(port);
    write_tags(writer, tags);
    return finish_frame(std::move(buffer));
}

LoginMessage LoginMessage::deserialize(std::span<const std::uint8_t> data) {
    auto frame = open_frame(data, TYPE, MIN_BODY_SIZE);

    LoginMessage msg;
    msg.header = frame.header;
    msg.uid = Uid::deserialize(frame.body.read_bytes(UID_SIZE));
    msg.client_id = frame.body.read_u32();
    msg.port = frame.body.read_u16();
    msg.tags = read_tags(frame.body);
    return msg;
}

std::string LoginMessage::describe() const {
    std::ostringstream oss;
    oss << "[login]\n" << header.describe() << "\n";
    oss << "uid: " << uid.to_string() << ", clientID: " << describe_client_id(client_id)
        << ", port: " << port << "\n";
    describe_tags(oss, tags);
    return oss.str();
}

bool LoginMessage::operator==(const LoginMessage& other) const {
    return same_protocol(header, other.header) &&
           std::tie(uid, client_id, port, tags) ==
           std::tie(other.uid, other.client_id, other.port, other.tags);
}

std::vector<std::string> ServerMessage::lines() const {
    std::vector<std::string> result;
    std::string current;
    for (char c : messages) {
        if (c == '\r' || c == '\n') {
            if (!current.empty()) {
                result.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        result.push_back(std::move(current));
    }
    return result;
}

std::vector<std::uint8_t> ServerMessage::serialize() const {
    if (messages.size() > 0xFFFF) {
        throw CodecError(CodecErrc::INVALID_LENGTH,
                         "server message of " + std::to_string(messages.size()) +
                         " bytes exceeds the 16-bit length prefix");
    }
    auto buffer = begin_frame(header, TYPE);
    ByteWriter writer(buffer);
    writer.write_u16(static_cast<std::uint16_t>(messages.size()));
    writer.write_bytes(std::span(reinterpret_cast<const std::uint8_t*>(messages.data()), messages.size()));
    return finish_frame(std::move(buffer));
}

ServerMessage ServerMessage::deserialize(std::span<const std::uint8_t> data) {
    auto frame = open_frame(data, TYPE, MIN_BODY_SIZE);

    ServerMessage msg;
    msg.header = frame.header;
    auto length = frame.body.read_u16();
    auto text = frame.body.read_bytes(length);
    msg.messages.assign(reinterpret_cast<const char*>(text.data()), text.size());
    return msg;
}

std::string ServerMessage::describe() const {
    std::ostringstream oss;
    oss << "[server-message]\n" << header.describe() << "\n" << messages;
    return oss.str();
}

bool ServerMessage::operator==(const ServerMessage& other) const {
    return same_protocol(header, other.header) && messages == other.messages;
}

std::vector<std::uint8_t> IdChangeMessage::serialize() const {
    auto buffer = begin_frame(header, TYPE);
    ByteWriter writer(buffer);
    writer.write_u32(client_id);
    writer.write_u32(bitmap);
    return finish_frame(std::move(buffer));
}

IdChangeMessage IdChangeMessage::deserialize(std::span<const std::uint8_t> data) {
    auto frame = open_frame(data, TYPE, MIN_BODY_SIZE);

    IdChangeMessage msg;
    msg.header = frame.header;
    msg.client_id = frame.body.read_u32();
    msg.bitmap = frame.body.read_u32();
    return msg;
}

std::string IdChangeMessage::describe() const {
    std::ostringstream oss;
    oss << "[id-change]\n" << header.describe() << "\n";
    oss << "clientID: " << describe_client_id(client_id)
        << ", bitmap: 0x" << std::hex << bitmap;
    return oss.str();
}

bool IdChangeMessage::operator==(const IdChangeMessage& other) const {
    return same_protocol(header, other.header) &&
           client_id == other.client_id && bitmap == other.bitmap;
}

std::vector<std::uint8_t> OfferFilesMessage::serialize() const {
    auto buffer = begin_frame(header, TYPE);
    ByteWriter writer(buffer);
    writer.write_u32(static_cast<std::uint32_t>(files.size()));
    for (const auto& file : files) {
        write_file_entry(writer, file);
    }
    return finish_frame(std::move(buffer));
}

OfferFilesMessage OfferFilesMessage::deserialize(std::span<const std::uint8_t> data) {
    auto frame = open_frame(data, TYPE, MIN_BODY_SIZE);

    OfferFilesMessage msg;
    msg.header = frame.header;
    auto count = frame.body.read_u32();
    msg.files.reserve(std::min<std::size_t>(count, frame.body.remaining() / (FILE_ENTRY_HEAD_SIZE + 4)));
    for (std::uint32_t i = 0; i < count; ++i) {
        msg.files.push_back(read_file_entry(frame.body));
    }
    return msg;
}

std::string OfferFilesMessage::describe() const {
    std::ostringstream oss;
    oss << "[offer-files]\n" << header.describe() << "\nfiles:\n";
    for (std::size_t i = 0; i < files.size(); ++i) {
        oss << "file" << i << " - " << files[i].describe();
    }
    return oss.str();
}

bool OfferFilesMessage::operator==(const OfferFilesMessage& other) const {
    return same_protocol(header, other.header) && files == other.files;
}

std::vector<std::uint8_t> GetServerListMessage::serialize() const {
    return finish_frame(begin_frame(header, TYPE));
}

GetServerListMessage GetServerListMessage::deserialize(std::span<const std::uint8_t> data) {
    auto frame = open_frame(data, TYPE, MIN_BODY_SIZE);

    GetServerListMessage msg;
    msg.header = frame.header;
    return msg;
}

std::string GetServerListMessage::describe() const {
    return "[get-server-list]\n" + header.describe();
}

bool GetServerListMessage::operator==(const GetServerListMessage& other) const {
    return same_protocol(header, other.header);
}

std::vector<std::uint8_t> ServerListMessage::serialize() const {
    if (servers.size() > MAX_SERVER_LIST_ENTRIES) {
        throw CodecError(CodecErrc::INVALID_LENGTH,
                         std::to_string(servers.size()) + " servers do not fit a one byte count");
    }

    auto buffer = begin_frame(header, TYPE);
    ByteWriter writer(buffer);
    writer.write_u8(static_cast<std::uint8_t>(servers.size()));
    for (const auto& server : servers) {
        boost::asio::ip::address_v4 address;
        std::uint16_t port = 0;
        if (server) {
            if (!server->address().is_v4()) {
                throw std::invalid_argument("server list entries must be IPv4: " +
                                            server->address().to_string());
            }
            address = server->address().to_v4();
            port = server->port();
        }
        writer.write_bytes(address.to_bytes());
        writer.write_u16(port);
    }
    return finish_frame(std::move(buffer));
}

ServerListMessage ServerListMessage::deserialize(std::span<const std::uint8_t> data) {
    auto frame = open_frame(data, TYPE, MIN_BODY_SIZE);

    ServerListMessage msg;
    msg.header = frame.header;
    auto count = frame.body.read_u8();
    auto entries = frame.body.read_bytes(static_cast<std::size_t>(count) * SERVER_LIST_ENTRY_SIZE);

    ByteReader reader(entries);
    msg.servers.reserve(count);
    for (std::uint8_t i = 0; i < count; ++i) {
        auto octets = reader.read_array<4>();
        auto port = reader.read_u16();
        msg.servers.emplace_back(boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4(octets), port));
    }
    return msg;
}

std::string ServerListMessage::describe() const {
    std::vector<std::string> entries;
    entries.reserve(servers.size());
    for (const auto& server : servers) {
        if (server) {
            entries.push_back(server->address().to_string() + ":" + std::to_string(server->port()));
        } else {
            entries.push_back("0.0.0.0:0");
        }
    }

    std::ostringstream oss;
    oss << "[server-list]\n" << header.describe() << "\nservers:\n"
        << core::utils::StringUtils::join(entries, ",");
    return oss.str();
}

bool ServerListMessage::operator==(const ServerListMessage& other) const {
    return same_protocol(header, other.header) && servers == other.servers;
}

std::vector<std::uint8_t> ServerStatusMessage::serialize() const {
    auto buffer = begin_frame(header, TYPE);
    ByteWriter writer(buffer);
    writer.write_u32(user_count);
    writer.write_u32(file_count);
    return finish_frame(std::move(buffer));
}

ServerStatusMessage ServerStatusMessage::deserialize(std::span<const std::uint8_t> data) {
    auto frame = open_frame(data, TYPE, MIN_BODY_SIZE);

    ServerStatusMessage msg;
    msg.header = frame.header;
    msg.user_count = frame.body.read_u32();
    msg.file_count = frame.body.read_u32();
    return msg;
}

std::string ServerStatusMessage::describe() const {
    std::ostringstream oss;
    oss << "[server-status]\n" << header.describe() << "\n";
    oss << "users: " << user_count << ", files: " << file_count;
    return oss.str();
}

bool ServerStatusMessage::operator==(const ServerStatusMessage& other) const {
    return same_protocol(header, other.header) &&
           user_count == other.user_count && file_count == other.file_count;
}

std::vector<std::uint8_t> ServerIdentMessage::serialize() const {
    auto buffer = begin_frame(header, TYPE);
    ByteWriter writer(buffer);
    writer.write_bytes(hash);
    writer.write_u32(ip);
    writer.write_u16(port);
    write_tags(writer, tags);
    return finish_frame(std::move(buffer));
}

ServerIdentMessage ServerIdentMessage::deserialize(std::span<const std::uint8_t> data) {
    auto frame = open_frame(data, TYPE, MIN_BODY_SIZE);

    ServerIdentMessage msg;
    msg.header = frame.header;
    msg.hash = frame.body.read_array<HASH_SIZE>();
    msg.ip = frame.body.read_u32();
    msg.port = frame.body.read_u16();
    msg.tags = read_tags(frame.body);
    return msg;
}

std::string ServerIdentMessage::describe() const {
    std::ostringstream oss;
    oss << "[server-ident]\n" << header.describe() << "\n";
    oss << "addr: " << unpack_ipv4(ip).to_string() << ":" << port
        << ", hash: " << core::utils::StringUtils::to_hex(hash) << "\n";
    describe_tags(oss, tags);
    return oss.str();
}

bool ServerIdentMessage::operator==(const ServerIdentMessage& other) const {
    return same_protocol(header, other.header) &&
           std::tie(hash, ip, port, tags) ==
           std::tie(other.hash, other.ip, other.port, other.tags);
}

std::vector<std::uint8_t> SearchRequestMessage::serialize() const {
    auto buffer = begin_frame(header, TYPE);
    ByteWriter writer(buffer);
    writer.write_bytes(query);
    return finish_frame(std::move(buffer));
}

SearchRequestMessage SearchRequestMessage::deserialize(std::span<const std::uint8_t> data) {
    auto frame = open_frame(data, TYPE, MIN_BODY_SIZE);

    SearchRequestMessage msg;
    msg.header = frame.header;
    auto query = frame.body.read_rest();
    msg.query.assign(query.begin(), query.end());
    return msg;
}

std::string SearchRequestMessage::describe() const {
    std::ostringstream oss;
    oss << "[search-request]\n" << header.describe() << "\n";
    oss << "query: " << core::utils::StringUtils::to_hex(query);
    return oss.str();
}

bool SearchRequestMessage::operator==(const SearchRequestMessage& other) const {
    return same_protocol(header, other.header) && query == other.query;
}

}
