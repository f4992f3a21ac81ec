#pragma once

#include <array>
#include <random>
#include <string_view>


namespace roomsync::core {

// Participant display colors
inline constexpr std::array<std::string_view, 10> PARTICIPANT_COLORS = {
    "#FF6B6B", "#4ECDC4", "#45B7D1", "#96CEB4", "#FFEAA7",
    "#DDA5E9", "#FF8CC6", "#6C5CE7", "#A29BFE", "#FD79A8",
};

template<class Rng>
[[nodiscard]] inline std::string_view pick_color(Rng& rng) {
    std::uniform_int_distribution<std::size_t> dist(0, PARTICIPANT_COLORS.size() - 1);
    return PARTICIPANT_COLORS[dist(rng)];
}

} // namespace roomsync::core
