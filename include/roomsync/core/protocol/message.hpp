#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <variant>

#include "roomsync/core/protocol/message_type.hpp"
#include "roomsync/core/model/participant.hpp"
#include "roomsync/core/model/measurement.hpp"
#include "roomsync/core/model/annotation.hpp"
#include "roomsync/core/model/cursor.hpp"
#include "lcr/optional.hpp"


namespace roomsync::core::protocol {

/*
===============================================================================
 Wire envelope
===============================================================================

    { "type", "sessionId", "participantId", "data", "timestamp", "sequence" }

The shape of "data" depends on "type". Each type maps to exactly one payload
alternative below, in the same order as MessageType:

    join         → JoinPayload         { participant, roomCode? }
    leave        → LeavePayload        null
    measurement  → SharedMeasurement
    cursor       → CursorPosition
    annotation   → Annotation
    sync         → SyncPayload         { measurements, annotations } | { request: true }
    chat         → ChatPayload         { message, author, color }

sequence is strictly increasing per originating participant, starting at 1.
===============================================================================
*/

struct JoinPayload {
    Participant participant;
    lcr::optional<std::string> room_code;   // present when announcing a new session

    bool operator==(const JoinPayload&) const = default;
};

struct LeavePayload {
    bool operator==(const LeavePayload&) const = default;
};

struct SyncPayload {
    bool request{false};                        // true → ask peers for a full sync
    std::vector<SharedMeasurement> measurements;
    std::vector<Annotation> annotations;

    bool operator==(const SyncPayload&) const = default;
};

struct ChatPayload {
    std::string message;
    std::string author;
    std::string color;

    bool operator==(const ChatPayload&) const = default;
};

using Payload = std::variant<
    JoinPayload,
    LeavePayload,
    SharedMeasurement,
    CursorPosition,
    Annotation,
    SyncPayload,
    ChatPayload
>;

struct Message {
    std::string session_id;
    std::string participant_id;
    Payload data;
    std::uint64_t timestamp{0};   // ms since epoch
    std::uint64_t sequence{0};

    [[nodiscard]] inline MessageType type() const noexcept {
        return static_cast<MessageType>(data.index());
    }

    bool operator==(const Message&) const = default;
};

static_assert(std::variant_size_v<Payload> == static_cast<std::size_t>(MessageType::Unknown),
              "Payload alternatives must mirror MessageType");

} // namespace roomsync::core::protocol
