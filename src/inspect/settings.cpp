#include "ed2kwire/inspect/settings.hpp"
#include "ed2kwire/protocol/header.hpp"

namespace ed2kwire::inspect {

std::map<std::string, std::string> default_settings() {
    return {
        {settings::MAX_PAYLOAD_SIZE, std::to_string(protocol::DEFAULT_MAX_PAYLOAD_SIZE)},
        {settings::HEX_INPUT, "false"},
        {settings::LOG_LEVEL, "info"},
        {settings::LOG_FILE, "ed2kwire.log"}
    };
}

}
