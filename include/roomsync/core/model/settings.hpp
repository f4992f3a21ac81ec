#pragma once

#include <cstdint>


namespace roomsync::core {

constexpr std::uint32_t DEFAULT_MAX_PARTICIPANTS = 10;
constexpr std::uint32_t DEFAULT_EXPIRES_IN_MIN   = 120;

// Per-session policy chosen by the host at creation time
struct Settings {
    bool allow_editing{true};        // false → only the host may mutate shared content
    bool require_approval{false};    // carried on the wire, not enforced locally
    bool auto_sync{true};            // periodic full-state sync
    std::uint32_t max_participants{DEFAULT_MAX_PARTICIPANTS};
    std::uint32_t expires_in{DEFAULT_EXPIRES_IN_MIN}; // minutes after creation

    bool operator==(const Settings&) const = default;
};

} // namespace roomsync::core
