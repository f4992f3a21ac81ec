#pragma once

#include <cstdint>
#include <string>


namespace roomsync::core {

// Ephemeral pointer position of one participant (latest write wins, never versioned)
struct CursorPosition {
    std::string participant_id;
    double x{0.0};
    double y{0.0};
    double z{0.0};
    std::uint64_t timestamp{0};   // ms since epoch

    bool operator==(const CursorPosition&) const = default;
};

} // namespace roomsync::core
