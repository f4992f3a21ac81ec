#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <unordered_map>
#include <iosfwd>

#include "roomsync/core/model/participant.hpp"
#include "roomsync/core/model/measurement.hpp"
#include "roomsync/core/model/annotation.hpp"
#include "roomsync/core/model/cursor.hpp"
#include "roomsync/core/model/settings.hpp"


namespace roomsync::core {

/*
===============================================================================
 roomsync::core::Session
===============================================================================

One live, time-boxed collaborative room.

Invariants (maintained by state::Store, the only mutator):
  - at most one participant has Role::Host
  - participants never contains two entries with the same id
  - updated_at >= created_at
===============================================================================
*/
struct Session {
    std::string id;
    std::string room_code;
    std::string host_id;
    std::vector<Participant> participants;
    std::vector<SharedMeasurement> measurements;
    std::unordered_map<std::string, CursorPosition> cursors;
    std::vector<Annotation> annotations;
    std::uint64_t created_at{0};  // ms since epoch
    std::uint64_t updated_at{0};  // ms since epoch
    Settings settings;

    // created_at + expires_in minutes
    [[nodiscard]] std::uint64_t expires_at() const noexcept;

    [[nodiscard]] bool is_expired(std::uint64_t now_ms) const noexcept;

    [[nodiscard]] const Participant* find_participant(const std::string& participant_id) const noexcept;

    [[nodiscard]] std::size_t active_participants() const noexcept;

    bool operator==(const Session&) const = default;
};

std::ostream& operator<<(std::ostream& os, const Session& s);

} // namespace roomsync::core
