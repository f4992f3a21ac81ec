#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "roomsync/core/model/participant.hpp"
#include "roomsync/core/model/measurement.hpp"
#include "roomsync/core/model/annotation.hpp"
#include "roomsync/core/model/cursor.hpp"


namespace roomsync::core::events {

/*
===============================================================================
 Engine events
===============================================================================

Typed facts published on the event bus after the session state has changed.
Handlers observe; they never mutate the session through these values.

Each event carries a static name used for logging.
===============================================================================
*/

// Where a change came from
enum class Origin : std::uint8_t {
    Local,
    Remote
};

[[nodiscard]]
inline constexpr std::string_view to_string(Origin o) noexcept {
    switch (o) {
        case Origin::Local:  return "local";
        case Origin::Remote: return "remote";
        default:             return "unknown";
    }
}

struct ParticipantJoined {
    static constexpr std::string_view name = "participantJoined";
    Participant participant;
};

struct ParticipantLeft {
    static constexpr std::string_view name = "participantLeft";
    Participant participant;
};

struct MeasurementShared {
    static constexpr std::string_view name = "measurementShared";
    SharedMeasurement measurement;
    Origin origin{Origin::Local};
};

struct MeasurementUpdated {
    static constexpr std::string_view name = "measurementUpdated";
    SharedMeasurement measurement;
    Origin origin{Origin::Remote};
};

struct AnnotationUpdated {
    static constexpr std::string_view name = "annotationUpdated";
    Annotation annotation;
    Origin origin{Origin::Remote};
};

struct CursorUpdated {
    static constexpr std::string_view name = "cursorUpdated";
    CursorPosition cursor;
};

struct ChatMessage {
    static constexpr std::string_view name = "chatMessage";
    std::string message;
    std::string author;
    std::string color;
    Origin origin{Origin::Remote};
};

// Shared content was replaced by a full sync from a peer
struct SessionSynced {
    static constexpr std::string_view name = "sessionSynced";
    std::string session_id;
    std::size_t measurements{0};
    std::size_t annotations{0};
};

// The link exhausted its retry budget
struct ConnectionLost {
    static constexpr std::string_view name = "connectionLost";
    std::uint32_t attempts{0};
};

// Fire-and-forget text for a local notification layer
struct Notification {
    static constexpr std::string_view name = "notification";
    std::string title;
    std::string body;
};

} // namespace roomsync::core::events
