#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace ed2kwire::protocol {

// Appends little-endian fields to a caller-owned buffer.
class ByteWriter {
public:
    explicit ByteWriter(std::vector<std::uint8_t>& buffer);

    std::size_t size() const { return buffer_.size(); }

    void write_u8(std::uint8_t value);
    void write_u16(std::uint16_t value);
    void write_u32(std::uint32_t value);
    void write_u64(std::uint64_t value);
    void write_f32(float value);
    void write_bytes(std::span<const std::uint8_t> bytes);

    // Overwrites four already written bytes at offset.
    void patch_u32(std::size_t offset, std::uint32_t value);

private:
    std::vector<std::uint8_t>& buffer_;
};

// Bounds-checked little-endian cursor over a byte span. Every read that
// would run past the end throws CodecError(SHORT_BUFFER) and leaves the
// cursor untouched.
class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> data);

    std::size_t remaining() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    std::uint8_t read_u8();
    std::uint16_t read_u16();
    std::uint32_t read_u32();
    std::uint64_t read_u64();
    float read_f32();

    // The returned span aliases the reader's input; copy it out before
    // the input goes away.
    std::span<const std::uint8_t> read_bytes(std::size_t count);

    template<std::size_t N>
    std::array<std::uint8_t, N> read_array() {
        auto bytes = read_bytes(N);
        std::array<std::uint8_t, N> result;
        std::copy(bytes.begin(), bytes.end(), result.begin());
        return result;
    }

    std::span<const std::uint8_t> read_rest();

private:
    void require(std::size_t count, const char* what) const;

    std::span<const std::uint8_t> data_;
};

}
