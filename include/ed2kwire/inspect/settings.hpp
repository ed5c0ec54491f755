#pragma once

#include <map>
#include <string>

namespace ed2kwire::inspect {

// Configuration keys read by ed2kwire-dump.
namespace settings {
    constexpr const char* MAX_PAYLOAD_SIZE = "codec.max_payload_size";
    constexpr const char* HEX_INPUT        = "dump.hex_input";
    constexpr const char* LOG_LEVEL        = "log.level";
    constexpr const char* LOG_FILE         = "log.file";
}

std::map<std::string, std::string> default_settings();

}
