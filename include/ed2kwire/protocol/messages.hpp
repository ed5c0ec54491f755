#pragma once

#include "ed2kwire/protocol/file_entry.hpp"
#include "ed2kwire/protocol/header.hpp"
#include "ed2kwire/protocol/identifiers.hpp"
#include "ed2kwire/protocol/tag.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <concepts>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace ed2kwire::protocol {

enum class MessageType : std::uint8_t {
    LOGIN_REQUEST   = 0x01,
    GET_SERVER_LIST = 0x14,
    OFFER_FILES     = 0x15,
    SEARCH_REQUEST  = 0x16,
    SERVER_LIST     = 0x32,
    SERVER_STATUS   = 0x34,
    SERVER_MESSAGE  = 0x38,
    ID_CHANGE       = 0x40,
    SERVER_IDENT    = 0x41
};

// Bit 0 of the id-change bitmap. Remaining bits are reserved and carried
// through untouched.
constexpr std::uint32_t ID_CHANGE_COMPRESSION_FLAG = 0x00000001;

// Servers accept at most this many files per offer.
constexpr std::size_t MAX_OFFERED_FILES = 200;

constexpr std::size_t MAX_SERVER_LIST_ENTRIES = 0xFF;
constexpr std::size_t SERVER_LIST_ENTRY_SIZE = 6;

// Messages compare equal when their fields and protocol marker match. The
// header's payload size is derived on encode and is not compared.
template<typename T>
concept WireMessage = requires(const T t) {
    { T::TYPE } -> std::convertible_to<MessageType>;
    { t.type() } -> std::same_as<MessageType>;
    { t.serialize() } -> std::convertible_to<std::vector<std::uint8_t>>;
    { T::deserialize(std::declval<std::span<const std::uint8_t>>()) } -> std::same_as<T>;
    { t.describe() } -> std::convertible_to<std::string>;
    { t == t } -> std::same_as<bool>;
};

// First message a client sends after connecting.
struct LoginMessage {
    static constexpr MessageType TYPE = MessageType::LOGIN_REQUEST;
    static constexpr std::size_t MIN_BODY_SIZE = 1 + UID_SIZE + 4 + 2 + 4;

    Header header;
    Uid uid;
    std::uint32_t client_id = 0;
    std::uint16_t port = 0;         // Client TCP listening port
    std::vector<Tag> tags;

    MessageType type() const { return TYPE; }
    std::vector<std::uint8_t> serialize() const;
    static LoginMessage deserialize(std::span<const std::uint8_t> data);
    std::string describe() const;

    bool operator==(const LoginMessage& other) const;
};

// Free text from the server. May hold several lines; lines starting with
// "server version", "warning", "error" or "emDynIP" mean something to
// clients.
struct ServerMessage {
    static constexpr MessageType TYPE = MessageType::SERVER_MESSAGE;
    static constexpr std::size_t MIN_BODY_SIZE = 1 + 2;

    Header header;
    std::string messages;

    std::vector<std::string> lines() const;

    MessageType type() const { return TYPE; }
    std::vector<std::uint8_t> serialize() const;
    static ServerMessage deserialize(std::span<const std::uint8_t> data);
    std::string describe() const;

    bool operator==(const ServerMessage& other) const;
};

// Server reply accepting a login and assigning the client id.
struct IdChangeMessage {
    static constexpr MessageType TYPE = MessageType::ID_CHANGE;
    static constexpr std::size_t MIN_BODY_SIZE = 1 + 4 + 4;

    Header header;
    std::uint32_t client_id = 0;
    std::uint32_t bitmap = 0;

    bool supports_compression() const { return (bitmap & ID_CHANGE_COMPRESSION_FLAG) != 0; }

    MessageType type() const { return TYPE; }
    std::vector<std::uint8_t> serialize() const;
    static IdChangeMessage deserialize(std::span<const std::uint8_t> data);
    std::string describe() const;

    bool operator==(const IdChangeMessage& other) const;
};

// Files the client shares.
struct OfferFilesMessage {
    static constexpr MessageType TYPE = MessageType::OFFER_FILES;
    static constexpr std::size_t MIN_BODY_SIZE = 1 + 4;

    Header header;
    std::vector<FileEntry> files;

    // Producer-side check; neither serialize() nor deserialize() enforce it.
    bool exceeds_server_limit() const { return files.size() > MAX_OFFERED_FILES; }

    MessageType type() const { return TYPE; }
    std::vector<std::uint8_t> serialize() const;
    static OfferFilesMessage deserialize(std::span<const std::uint8_t> data);
    std::string describe() const;

    bool operator==(const OfferFilesMessage& other) const;
};

struct GetServerListMessage {
    static constexpr MessageType TYPE = MessageType::GET_SERVER_LIST;
    static constexpr std::size_t MIN_BODY_SIZE = 1;

    Header header;

    MessageType type() const { return TYPE; }
    std::vector<std::uint8_t> serialize() const;
    static GetServerListMessage deserialize(std::span<const std::uint8_t> data);
    std::string describe() const;

    bool operator==(const GetServerListMessage& other) const;
};

// Additional servers for the client's list. Entries are 4 address bytes
// in network order followed by a little-endian port; an empty slot is
// written as 0.0.0.0:0.
struct ServerListMessage {
    static constexpr MessageType TYPE = MessageType::SERVER_LIST;
    static constexpr std::size_t MIN_BODY_SIZE = 1 + 1;

    Header header;
    std::vector<std::optional<boost::asio::ip::tcp::endpoint>> servers;

    MessageType type() const { return TYPE; }
    std::vector<std::uint8_t> serialize() const;
    static ServerListMessage deserialize(std::span<const std::uint8_t> data);
    std::string describe() const;

    bool operator==(const ServerListMessage& other) const;
};

struct ServerStatusMessage {
    static constexpr MessageType TYPE = MessageType::SERVER_STATUS;
    static constexpr std::size_t MIN_BODY_SIZE = 1 + 4 + 4;

    Header header;
    std::uint32_t user_count = 0;
    std::uint32_t file_count = 0;

    MessageType type() const { return TYPE; }
    std::vector<std::uint8_t> serialize() const;
    static ServerStatusMessage deserialize(std::span<const std::uint8_t> data);
    std::string describe() const;

    bool operator==(const ServerStatusMessage& other) const;
};

struct ServerIdentMessage {
    static constexpr MessageType TYPE = MessageType::SERVER_IDENT;
    static constexpr std::size_t MIN_BODY_SIZE = 1 + HASH_SIZE + 4 + 2 + 4;

    Header header;
    Hash hash{};
    std::uint32_t ip = 0;           // Little-endian packed, like a client id
    std::uint16_t port = 0;
    std::vector<Tag> tags;

    MessageType type() const { return TYPE; }
    std::vector<std::uint8_t> serialize() const;
    static ServerIdentMessage deserialize(std::span<const std::uint8_t> data);
    std::string describe() const;

    bool operator==(const ServerIdentMessage& other) const;
};

// The query expression is carried as opaque bytes.
struct SearchRequestMessage {
    static constexpr MessageType TYPE = MessageType::SEARCH_REQUEST;
    static constexpr std::size_t MIN_BODY_SIZE = 1;

    Header header;
    std::vector<std::uint8_t> query;

    MessageType type() const { return TYPE; }
    std::vector<std::uint8_t> serialize() const;
    static SearchRequestMessage deserialize(std::span<const std::uint8_t> data);
    std::string describe() const;

    bool operator==(const SearchRequestMessage& other) const;
};

}

static_assert(ed2kwire::protocol::WireMessage<ed2kwire::protocol::LoginMessage>);
static_assert(ed2kwire::protocol::WireMessage<ed2kwire::protocol::ServerIdentMessage>);
