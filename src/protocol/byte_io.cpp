#include "ed2kwire/protocol/byte_io.hpp"
#include "ed2kwire/protocol/codec_error.hpp"
#include <cstring>
#include <string>

namespace ed2kwire::protocol {

ByteWriter::ByteWriter(std::vector<std::uint8_t>& buffer) : buffer_(buffer) {}

void ByteWriter::write_u8(std::uint8_t value) {
    buffer_.push_back(value);
}

void ByteWriter::write_u16(std::uint16_t value) {
    buffer_.push_back(value & 0xFF);
    buffer_.push_back((value >> 8) & 0xFF);
}

void ByteWriter::write_u32(std::uint32_t value) {
    buffer_.push_back(value & 0xFF);
    buffer_.push_back((value >> 8) & 0xFF);
    buffer_.push_back((value >> 16) & 0xFF);
    buffer_.push_back((value >> 24) & 0xFF);
}

void ByteWriter::write_u64(std::uint64_t value) {
    write_u32(static_cast<std::uint32_t>(value & 0xFFFFFFFF));
    write_u32(static_cast<std::uint32_t>(value >> 32));
}

void ByteWriter::write_f32(float value) {
    static_assert(sizeof(float) == sizeof(std::uint32_t));
    std::uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    write_u32(bits);
}

void ByteWriter::write_bytes(std::span<const std::uint8_t> bytes) {
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

void ByteWriter::patch_u32(std::size_t offset, std::uint32_t value) {
    if (offset + 4 > buffer_.size()) {
        throw CodecError(CodecErrc::SHORT_BUFFER, "patch offset " + std::to_string(offset) +
                         " beyond written data");
    }
    buffer_[offset]     = value & 0xFF;
    buffer_[offset + 1] = (value >> 8) & 0xFF;
    buffer_[offset + 2] = (value >> 16) & 0xFF;
    buffer_[offset + 3] = (value >> 24) & 0xFF;
}

ByteReader::ByteReader(std::span<const std::uint8_t> data) : data_(data) {}

void ByteReader::require(std::size_t count, const char* what) const {
    if (data_.size() < count) {
        throw CodecError(CodecErrc::SHORT_BUFFER,
                         std::string("need ") + std::to_string(count) + " bytes for " + what +
                         ", have " + std::to_string(data_.size()));
    }
}

std::uint8_t ByteReader::read_u8() {
    require(1, "uint8");
    auto value = data_[0];
    data_ = data_.subspan(1);
    return value;
}

std::uint16_t ByteReader::read_u16() {
    require(2, "uint16");
    std::uint16_t value = static_cast<std::uint16_t>(data_[0]) |
                          (static_cast<std::uint16_t>(data_[1]) << 8);
    data_ = data_.subspan(2);
    return value;
}

std::uint32_t ByteReader::read_u32() {
    require(4, "uint32");
    std::uint32_t value = static_cast<std::uint32_t>(data_[0]) |
                          (static_cast<std::uint32_t>(data_[1]) << 8) |
                          (static_cast<std::uint32_t>(data_[2]) << 16) |
                          (static_cast<std::uint32_t>(data_[3]) << 24);
    data_ = data_.subspan(4);
    return value;
}

std::uint64_t ByteReader::read_u64() {
    require(8, "uint64");
    std::uint64_t low = read_u32();
    std::uint64_t high = read_u32();
    return low | (high << 32);
}

float ByteReader::read_f32() {
    auto bits = read_u32();
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

std::span<const std::uint8_t> ByteReader::read_bytes(std::size_t count) {
    require(count, "byte run");
    auto bytes = data_.subspan(0, count);
    data_ = data_.subspan(count);
    return bytes;
}

std::span<const std::uint8_t> ByteReader::read_rest() {
    auto bytes = data_;
    data_ = data_.subspan(data_.size());
    return bytes;
}

}
