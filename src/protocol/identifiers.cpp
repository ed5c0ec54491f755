#include "ed2kwire/protocol/identifiers.hpp"
#include "ed2kwire/protocol/codec_error.hpp"
#include "ed2kwire/core/utils.hpp"
#include <sodium.h>
#include <algorithm>

namespace ed2kwire::protocol {

Uid Uid::generate() {
    if (sodium_init() < 0) {
        throw std::runtime_error("Failed to initialize libsodium");
    }

    Uid uid;
    randombytes_buf(uid.bytes.data(), uid.bytes.size());
    // eMule clients mark their user hash with these two bytes
    uid.bytes[5] = 14;
    uid.bytes[14] = 111;
    return uid;
}

Uid Uid::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() < UID_SIZE) {
        throw CodecError(CodecErrc::SHORT_BUFFER,
                         "uid needs " + std::to_string(UID_SIZE) + " bytes, have " +
                         std::to_string(data.size()));
    }
    Uid uid;
    std::copy(data.begin(), data.begin() + UID_SIZE, uid.bytes.begin());
    return uid;
}

std::string Uid::to_string() const {
    return core::utils::StringUtils::to_hex(bytes);
}

boost::asio::ip::address_v4 unpack_ipv4(std::uint32_t packed) {
    boost::asio::ip::address_v4::bytes_type octets{
        static_cast<unsigned char>(packed & 0xFF),
        static_cast<unsigned char>((packed >> 8) & 0xFF),
        static_cast<unsigned char>((packed >> 16) & 0xFF),
        static_cast<unsigned char>((packed >> 24) & 0xFF)
    };
    return boost::asio::ip::address_v4(octets);
}

std::uint32_t pack_ipv4(const boost::asio::ip::address_v4& address) {
    auto octets = address.to_bytes();
    return static_cast<std::uint32_t>(octets[0]) |
           (static_cast<std::uint32_t>(octets[1]) << 8) |
           (static_cast<std::uint32_t>(octets[2]) << 16) |
           (static_cast<std::uint32_t>(octets[3]) << 24);
}

boost::asio::ip::address_v4 ClientId::address() const {
    return unpack_ipv4(value);
}

std::string ClientId::describe() const {
    if (is_low_id()) {
        return "low-id";
    }
    return address().to_string();
}

ClientId ClientId::from_address(const boost::asio::ip::address_v4& address) {
    return ClientId{pack_ipv4(address)};
}

}
