#pragma once

#include <concepts>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

#include "roomsync/core/error.hpp"
#include "roomsync/core/model/session.hpp"
#include "lcr/log/logger.hpp"


namespace roomsync::core::lifecycle {

// -----------------------------------------------------------------------------
// DirectoryConcept
// -----------------------------------------------------------------------------
//
// Remote authority that maps room codes to sessions.
//
//   publish(session)                        → announce a freshly created room
//   admit(code, participant, now, out)      → authoritative state for a joiner,
//                                             with the participant on the roster
//   release(code, participant_id, now)      → participant left the room
//
// admit() fails with NotFound (unknown or expired code) or CapacityExceeded
// (max_participants active participants already present).
// -----------------------------------------------------------------------------
template<class D>
concept DirectoryConcept =
    requires(
        D d,
        const Session& session,
        const std::string& code,
        const std::string& participant_id,
        const Participant& participant,
        std::uint64_t now_ms,
        Session& out
    )
{
    { d.publish(session) } -> std::same_as<Error>;
    { d.admit(code, participant, now_ms, out) } -> std::same_as<Error>;
    { d.release(code, participant_id, now_ms) } -> std::same_as<void>;
};


namespace directory {

/*
===============================================================================
 directory::Registry
===============================================================================

In-process directory: a mutex-guarded map from room code to the published
session. Engines sharing one Registry can find each other's rooms, which is what
the example client and the tests rely on.

Expired rooms are dropped lazily on admit() and in bulk by purge_expired().
===============================================================================
*/
class Registry {
public:
    Registry() = default;
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    [[nodiscard]]
    inline Error publish(const Session& session) {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = rooms_.find(session.room_code);
        if (it != rooms_.end() && it->second.id != session.id) {
            RS_WARN("[REGISTRY] Room code " << session.room_code << " already taken by " << it->second.id);
            return Error::InvalidArgument;
        }
        rooms_[session.room_code] = session;
        RS_DEBUG("[REGISTRY] Published room " << session.room_code << " (" << session.id << ")");
        return Error::None;
    }

    [[nodiscard]]
    inline Error admit(const std::string& code, const Participant& participant, std::uint64_t now_ms, Session& out) {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = rooms_.find(code);
        if (it == rooms_.end()) {
            RS_WARN("[REGISTRY] Unknown room code " << code);
            return Error::NotFound;
        }
        Session& room = it->second;
        if (room.is_expired(now_ms)) {
            RS_INFO("[REGISTRY] Room " << code << " expired, discarding");
            rooms_.erase(it);
            return Error::NotFound;
        }
        Participant* existing = nullptr;
        for (auto& p : room.participants) {
            if (p.id == participant.id) {
                existing = &p;
                break;
            }
        }
        const bool already_active = existing && existing->is_active;
        if (!already_active && room.active_participants() >= room.settings.max_participants) {
            RS_WARN("[REGISTRY] Room " << code << " is full (" << room.settings.max_participants << ")");
            return Error::CapacityExceeded;
        }
        if (existing) {
            existing->is_active = true;
            existing->name = participant.name;
            // Colour stays stable across rejoins
            if (existing->color.empty()) {
                existing->color = participant.color;
            }
            existing->last_seen = now_ms;
        }
        else {
            Participant joined = participant;
            if (joined.is_host()) {
                joined.role = Role::Editor;
            }
            joined.is_active = true;
            joined.joined_at = now_ms;
            joined.last_seen = now_ms;
            room.participants.push_back(std::move(joined));
        }
        if (now_ms > room.updated_at) {
            room.updated_at = now_ms;
        }
        out = room;
        return Error::None;
    }

    inline void release(const std::string& code, const std::string& participant_id, std::uint64_t now_ms) {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = rooms_.find(code);
        if (it == rooms_.end()) {
            return;
        }
        for (auto& p : it->second.participants) {
            if (p.id == participant_id && p.is_active) {
                p.is_active = false;
                p.last_seen = now_ms;
                RS_DEBUG("[REGISTRY] " << participant_id << " released room " << code);
            }
        }
    }

    // Returns the number of rooms removed
    inline std::size_t purge_expired(std::uint64_t now_ms) {
        std::lock_guard<std::mutex> lock(mtx_);
        std::size_t removed = 0;
        for (auto it = rooms_.begin(); it != rooms_.end();) {
            if (it->second.is_expired(now_ms)) {
                it = rooms_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    [[nodiscard]]
    inline std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return rooms_.size();
    }

private:
    mutable std::mutex mtx_;
    std::unordered_map<std::string, Session> rooms_;
};

static_assert(DirectoryConcept<Registry>);

} // namespace directory
} // namespace roomsync::core::lifecycle
