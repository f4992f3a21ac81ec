#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "roomsync/core/error.hpp"
#include "roomsync/core/model/session.hpp"
#include "lcr/optional.hpp"


namespace roomsync::core::state {

/*
===============================================================================
 roomsync::core::state::Store
===============================================================================

In-memory authoritative copy of the one active Session. Every mutation of the
session goes through this class; everything else only reads it.

Local mutations (share/update/add) are validated and either applied in full or
rejected with an Error, leaving the session untouched. Inbound mutations
(apply_*) report what happened through Apply so the caller can route stale
versions to the ConflictResolver.

Invariants kept at every step:
  - at most one host
  - no two participants with the same id
  - updated_at >= created_at
  - a measurement's version only ever grows
===============================================================================
*/

// Outcome of applying an inbound entity
enum class Apply : std::uint8_t {
    Inserted,     // unknown id, stored as is
    Overwritten,  // newer version replaced the local copy
    Stale,        // version <= local with different content, local copy kept
    Duplicate,    // exact replay of the local copy
    Rejected      // sender may not edit this entity
};

[[nodiscard]]
inline constexpr std::string_view to_string(Apply a) noexcept {
    switch (a) {
        case Apply::Inserted:    return "Inserted";
        case Apply::Overwritten: return "Overwritten";
        case Apply::Stale:       return "Stale";
        case Apply::Duplicate:   return "Duplicate";
        case Apply::Rejected:    return "Rejected";
        default:                 return "Unknown";
    }
}


class Store {
public:
    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    // Replaces the held session. Rejects sessions violating the roster invariants.
    [[nodiscard]]
    Error install(Session session);

    void clear() noexcept;

    [[nodiscard]]
    inline bool has_session() const noexcept {
        return active_;
    }

    // Precondition: has_session()
    [[nodiscard]]
    inline const Session& session() const noexcept {
        return session_;
    }

    // -------------------------------------------------------------------------
    // Roster
    // -------------------------------------------------------------------------

    // Adds a participant or reactivates a returning one. A second host is demoted to editor.
    [[nodiscard]]
    Error add_participant(Participant participant, std::uint64_t now_ms);

    // Returns false when the participant was unknown or already inactive
    bool deactivate_participant(const std::string& participant_id, std::uint64_t now_ms);

    void touch_participant(const std::string& participant_id, std::uint64_t now_ms) noexcept;

    [[nodiscard]]
    std::size_t active_participants() const noexcept;

    // Role::Unknown for ids not on the roster
    [[nodiscard]]
    Role role_of(const std::string& participant_id) const noexcept;

    // Viewers never edit. With allow_editing off only the host does.
    // Senders not (yet) on the roster are treated as editors.
    [[nodiscard]]
    bool can_edit(const std::string& participant_id) const noexcept;

    // -------------------------------------------------------------------------
    // Measurements
    // -------------------------------------------------------------------------

    [[nodiscard]]
    Error share_measurement(const std::string& author_id, const MeasurementInput& input,
                            std::uint64_t now_ms, SharedMeasurement& out);

    [[nodiscard]]
    Error update_measurement(const std::string& editor_id, const std::string& measurement_id,
                             const MeasurementPatch& patch, std::uint64_t now_ms, SharedMeasurement& out);

    [[nodiscard]]
    Apply apply_measurement(const std::string& sender_id, const SharedMeasurement& incoming, std::uint64_t now_ms);

    // Moves the local copy to new_version (> current). Used by the conflict resolver.
    [[nodiscard]]
    bool rebase_measurement(const std::string& measurement_id, std::uint64_t new_version,
                            std::uint64_t now_ms, SharedMeasurement& out);

    [[nodiscard]]
    const SharedMeasurement* find_measurement(const std::string& measurement_id) const noexcept;

    // -------------------------------------------------------------------------
    // Annotations
    // -------------------------------------------------------------------------

    [[nodiscard]]
    Error add_annotation(const std::string& author_id, Annotation annotation, std::uint64_t now_ms);

    [[nodiscard]]
    Apply apply_annotation(const std::string& sender_id, const Annotation& incoming, std::uint64_t now_ms);

    // -------------------------------------------------------------------------
    // Cursors & sync
    // -------------------------------------------------------------------------

    // Latest write wins
    void set_cursor(const CursorPosition& cursor);

    // Blind overwrite of the shared content (sync)
    void replace_content(std::vector<SharedMeasurement> measurements, std::vector<Annotation> annotations,
                         std::uint64_t now_ms);

private:
    Session session_;
    bool active_{false};

    [[nodiscard]]
    Participant* find_participant_(const std::string& participant_id) noexcept;

    [[nodiscard]]
    SharedMeasurement* find_measurement_(const std::string& measurement_id) noexcept;

    inline void touch_(std::uint64_t now_ms) noexcept {
        if (now_ms > session_.updated_at) {
            session_.updated_at = now_ms;
        }
    }
};

} // namespace roomsync::core::state
