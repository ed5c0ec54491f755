#include "ed2kwire/protocol/codec_error.hpp"

namespace ed2kwire::protocol {

std::string_view to_string(CodecErrc code) {
    switch (code) {
        case CodecErrc::SHORT_BUFFER:       return "short buffer";
        case CodecErrc::WRONG_MESSAGE_TYPE: return "wrong message type";
        case CodecErrc::UNKNOWN_TAG_TYPE:   return "unknown tag type";
        case CodecErrc::INVALID_LENGTH:     return "invalid length";
    }
    return "unknown error";
}

CodecError::CodecError(CodecErrc code, const std::string& detail)
    : std::runtime_error(std::string(to_string(code)) + ": " + detail)
    , code_(code) {
}

}
