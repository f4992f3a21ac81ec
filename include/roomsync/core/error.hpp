#pragma once

#include <cstdint>
#include <string_view>


namespace roomsync::core {

/*
===============================================================================
 roomsync::core::Error
===============================================================================

Engine-level error classification returned by every session operation.

Local validation failures (capacity, permission, missing session) are reported
synchronously through these values and always leave the session state
unchanged. Transport failures never surface here directly: the transport link
retries them and reports exhaustion as ConnectionLost.
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,

    // --- Session directory ---------------------------------------------------
    NotFound,          // Unknown or expired room code
    CapacityExceeded,  // Room already holds max_participants active participants

    // --- Authorization -------------------------------------------------------
    PermissionDenied,  // Locked entity, viewer role, or editing disabled

    // --- Transport / wire ----------------------------------------------------
    ConnectionLost,    // Reconnection budget exhausted
    DecodeError,       // Malformed inbound envelope (dropped, never fatal)

    // --- Caller contract -----------------------------------------------------
    NoActiveSession,   // Operation requires an active session
    AlreadyInSession,  // create/join while a session is active
    InvalidArgument,   // Unknown entity id, duplicate id, empty payload

    // --- Local persistence ---------------------------------------------------
    StorageFailure     // Snapshot could not be written or read
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
        case Error::None:              return "None";
        case Error::NotFound:          return "NotFound";
        case Error::CapacityExceeded:  return "CapacityExceeded";
        case Error::PermissionDenied:  return "PermissionDenied";
        case Error::ConnectionLost:    return "ConnectionLost";
        case Error::DecodeError:       return "DecodeError";
        case Error::NoActiveSession:   return "NoActiveSession";
        case Error::AlreadyInSession:  return "AlreadyInSession";
        case Error::InvalidArgument:   return "InvalidArgument";
        case Error::StorageFailure:    return "StorageFailure";
        default:                       return "Unknown";
    }
}

} // namespace roomsync::core
