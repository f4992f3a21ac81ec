#pragma once

#include <cstdint>
#include <string_view>


namespace roomsync::core::transport {

// ===============================================================
// LINK STATE ENUM
// ===============================================================
//
//   Disconnected → Connecting → Connected → Reconnecting → (Connected | ConnectionLost)
//
// ConnectionLost is terminal until the caller opens the link again.
enum class State : std::uint8_t {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting,
    ConnectionLost
};

[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Disconnected:    return "Disconnected";
        case State::Connecting:      return "Connecting";
        case State::Connected:       return "Connected";
        case State::Reconnecting:    return "Reconnecting";
        case State::ConnectionLost:  return "ConnectionLost";
        default:                     return "Unknown";
    }
}


// ===============================================================
// EVENT ENUM
// ===============================================================
enum class Event : std::uint8_t {
    // --- User intent ---
    OpenRequested,
    CloseRequested,
    CancelRequested,

    // --- Transport lifecycle ---
    TransportConnected,          // Succeeded (open/retry → connect)
    TransportConnectFailed,      // Failed (open → connect)
    TransportReconnectFailed,    // Failed (retry → connect)
    TransportClosed,

    // --- Retry ---
    RetryTimerExpired
};

[[nodiscard]]
inline constexpr std::string_view to_string(Event e) noexcept {
    switch (e) {
        case Event::OpenRequested:             return "OpenRequested";
        case Event::CloseRequested:            return "CloseRequested";
        case Event::CancelRequested:           return "CancelRequested";
        case Event::TransportConnected:        return "TransportConnected";
        case Event::TransportConnectFailed:    return "TransportConnectFailed";
        case Event::TransportReconnectFailed:  return "TransportReconnectFailed";
        case Event::TransportClosed:           return "TransportClosed";
        case Event::RetryTimerExpired:         return "RetryTimerExpired";
        default:                               return "UnknownEvent";
    }
}


// ===============================================================
// DISCONNECT REASON ENUM
// ===============================================================
enum class DisconnectReason : std::uint8_t {
    None,
    LocalClose,        // explicit close() by user
    TransportError,    // websocket / IO error
    RetriesExhausted   // reconnection budget consumed
};

[[nodiscard]]
inline constexpr std::string_view to_string(DisconnectReason r) noexcept {
    switch (r) {
        case DisconnectReason::None:             return "None";
        case DisconnectReason::LocalClose:       return "LocalClose";
        case DisconnectReason::TransportError:   return "TransportError";
        case DisconnectReason::RetriesExhausted: return "RetriesExhausted";
        default:                                 return "Unknown";
    }
}

} // namespace roomsync::core::transport
