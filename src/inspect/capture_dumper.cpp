#include "ed2kwire/inspect/capture_dumper.hpp"
#include "ed2kwire/core/logger.hpp"
#include "ed2kwire/protocol/codec_error.hpp"
#include "ed2kwire/protocol/message.hpp"

namespace ed2kwire::inspect {

DumpStats dump_capture(std::span<const std::uint8_t> data, std::ostream& out,
                       std::uint32_t max_payload) {
    DumpStats stats;
    std::size_t offset = 0;

    while (offset < data.size()) {
        auto rest = data.subspan(offset);

        std::optional<std::size_t> length;
        try {
            length = protocol::frame_length(rest, max_payload);
        } catch (const protocol::CodecError& e) {
            LOG_ERROR("Invalid frame at offset {}: {}", offset, e.what());
            stats.aborted = true;
            break;
        }

        if (!length) {
            stats.trailing_bytes = rest.size();
            LOG_WARN("Capture ends with a partial frame ({} bytes at offset {})", rest.size(), offset);
            break;
        }

        auto frame = rest.subspan(0, *length);
        auto header = protocol::Header::deserialize(frame);
        if (!header.is_known_protocol()) {
            LOG_WARN("Frame at offset {} has unknown protocol marker 0x{:02x}", offset, header.protocol);
        } else if (header.protocol == protocol::PROTOCOL_PACKED) {
            LOG_WARN("Frame at offset {} is packed; its body is decoded as is", offset);
        }

        try {
            auto message = protocol::decode_message(frame);
            out << protocol::describe(message) << "\n\n";
            ++stats.frames_decoded;
            LOG_DEBUG("Decoded {} ({} bytes) at offset {}",
                      protocol::to_string(protocol::message_type(message)), *length, offset);
        } catch (const protocol::CodecError& e) {
            ++stats.frames_failed;
            LOG_ERROR("Failed to decode frame at offset {} ({} bytes): {}", offset, *length, e.what());
        }

        offset += *length;
    }

    LOG_INFO("Capture summary: {} decoded, {} failed, {} trailing bytes",
             stats.frames_decoded, stats.frames_failed, stats.trailing_bytes);
    return stats;
}

}
