#pragma once

/*
===============================================================================
 roomsync::core::transport::websocket::Event
===============================================================================

Control-plane event emitted by a WebSocket transport and drained by the owning
Link through poll_event().

    • Close  → transport closed (local or remote), delivered exactly once
    • Error  → transport-level failure, delivered before the matching Close

Data frames never travel through this channel (see poll_message()).
===============================================================================
*/

#include <cstdint>
#include <type_traits>

#include "roomsync/core/transport/error.hpp"

namespace roomsync::core::transport::websocket {

enum class EventType : std::uint8_t {
    Close = 0,
    Error = 1,
};

struct Event {
    EventType type{EventType::Close};
    transport::Error error{transport::Error::None}; // meaningful only if type == EventType::Error

    static constexpr Event make_close() noexcept {
        return Event{EventType::Close, transport::Error::None};
    }

    static constexpr Event make_error(transport::Error e) noexcept {
        return Event{EventType::Error, e};
    }
};

static_assert(std::is_trivially_copyable_v<Event>, "websocket::Event must be trivially copyable");

} // namespace roomsync::core::transport::websocket
