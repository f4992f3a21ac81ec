#pragma once

#include <cstdint>
#include <string>
#include <iosfwd>

#include "roomsync/core/model/role.hpp"


namespace roomsync::core {

// One identity inside a session.
// Participants are never removed from a roster: leaving only clears is_active,
// so attribution of measurements and annotations survives departures.
struct Participant {
    std::string id;            // participant_<user_id>
    std::string user_id;
    std::string name;
    Role role{Role::Editor};
    std::string color;         // stable display color (#RRGGBB)
    bool is_active{true};
    std::uint64_t joined_at{0}; // ms since epoch
    std::uint64_t last_seen{0}; // ms since epoch

    [[nodiscard]] bool is_host() const noexcept;

    // Host or editor
    [[nodiscard]] bool can_edit() const noexcept;

    bool operator==(const Participant&) const = default;
};

std::ostream& operator<<(std::ostream& os, const Participant& p);

} // namespace roomsync::core
