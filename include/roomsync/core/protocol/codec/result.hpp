#pragma once

#include <cstdint>
#include <string_view>


namespace roomsync::core::protocol::codec {

// ===============================================
// DECODER RESULT ENUM
// ===============================================
enum class Result : std::uint8_t {
    Ok             = 0,            // Field-level success (helpers only)
    Ignored        = 1,            // Well-formed envelope with an unknown type
    InvalidJson    = 2,            // Structural failure
    InvalidSchema  = 3,            // Missing required field or type mismatch
    InvalidValue   = 4,            // Field present but semantically invalid
    Parsed         = 5             // Parsed successfully
};

[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Ok:             return "Ok";
        case Result::Ignored:        return "Ignored";
        case Result::InvalidJson:    return "InvalidJson";
        case Result::InvalidSchema:  return "InvalidSchema";
        case Result::InvalidValue:   return "InvalidValue";
        case Result::Parsed:         return "Parsed";
        default:                     return "unknown";
    }
}

} // namespace roomsync::core::protocol::codec
