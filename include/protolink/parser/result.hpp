#pragma once

#include <cstdint>
#include <string_view>


namespace protolink::parser {

// ===============================================
// PARSER RESULT ENUM
// ===============================================
// Shared by every JSON document parser of the project (client handshake
// declarations, compiler configuration files).
enum class Result : std::uint8_t {
    Parsed         = 0,            // Parsed successfully
    Ignored        = 1,            // Nothing to parse (empty input)
    IoError        = 2,            // Input could not be read
    InvalidJson    = 3,            // Structural failure
    InvalidSchema  = 4,            // Missing required field, type mismatch, etc.
    InvalidValue   = 5             // Field present but semantically invalid
};

// -----------------------------------------------------------------------------
// Convert enum → string (for logging / diagnostics)
// -----------------------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Parsed:         return "Parsed";
        case Result::Ignored:        return "Ignored";
        case Result::IoError:        return "IoError";
        case Result::InvalidJson:    return "InvalidJson";
        case Result::InvalidSchema:  return "InvalidSchema";
        case Result::InvalidValue:   return "InvalidValue";
        default:                     return "unknown";
    }
}

} // namespace protolink::parser
