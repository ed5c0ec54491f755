#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace ed2kwire::protocol {

enum class CodecErrc {
    SHORT_BUFFER,        // Input ends before a declared or required length
    WRONG_MESSAGE_TYPE,  // Discriminant does not match the decoding variant
    UNKNOWN_TAG_TYPE,    // Tag type byte maps to no value variant
    INVALID_LENGTH       // Declared length is implausible or unencodable
};

std::string_view to_string(CodecErrc code);

class CodecError : public std::runtime_error {
public:
    CodecError(CodecErrc code, const std::string& detail);

    CodecErrc code() const noexcept { return code_; }

private:
    CodecErrc code_;
};

}
