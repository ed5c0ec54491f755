#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <boost/asio/ip/address_v4.hpp>

namespace ed2kwire::protocol {

constexpr std::size_t UID_SIZE = 16;
constexpr std::size_t HASH_SIZE = 16;

// Client ids below this value are server-assigned low ids.
constexpr std::uint32_t LOW_ID_THRESHOLD = 0x01000000;

using Hash = std::array<std::uint8_t, HASH_SIZE>;

// Session-scoped client identity (the "user hash").
struct Uid {
    std::array<std::uint8_t, UID_SIZE> bytes{};

    // Random hash carrying the eMule client markers.
    static Uid generate();

    std::array<std::uint8_t, UID_SIZE> serialize() const { return bytes; }
    static Uid deserialize(std::span<const std::uint8_t> data);

    std::string to_string() const;

    bool operator==(const Uid&) const = default;
};

// A client id is either a low id or an IPv4 address packed little-endian
// (first octet in the least significant byte). Display only; protocol
// logic must not branch on describe().
struct ClientId {
    std::uint32_t value = 0;

    bool is_low_id() const { return value < LOW_ID_THRESHOLD; }
    boost::asio::ip::address_v4 address() const;
    std::string describe() const;

    static ClientId from_address(const boost::asio::ip::address_v4& address);

    bool operator==(const ClientId&) const = default;
};

// Renders a little-endian packed IPv4 value as a dotted quad.
boost::asio::ip::address_v4 unpack_ipv4(std::uint32_t packed);
std::uint32_t pack_ipv4(const boost::asio::ip::address_v4& address);

}
