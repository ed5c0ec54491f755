#pragma once

#include "ed2kwire/protocol/header.hpp"
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <span>

namespace ed2kwire::inspect {

struct DumpStats {
    std::size_t frames_decoded = 0;
    std::size_t frames_failed = 0;
    std::size_t trailing_bytes = 0;   // Partial frame left at the end
    bool aborted = false;             // Stopped on an implausible frame length

    bool clean() const { return frames_failed == 0 && trailing_bytes == 0 && !aborted; }
};

// Walks concatenated frames, writing describe() of every decoded message
// to out. A frame that fails to decode is logged and skipped; an invalid
// frame length ends the walk since the next boundary is unknown.
DumpStats dump_capture(std::span<const std::uint8_t> data, std::ostream& out,
                       std::uint32_t max_payload = protocol::DEFAULT_MAX_PAYLOAD_SIZE);

}
