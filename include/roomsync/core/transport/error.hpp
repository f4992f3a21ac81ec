#pragma once

#include <cstdint>
#include <string_view>

namespace roomsync::core {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Transport-level error classification.

Semantic transport failures, abstracted away from library-specific error codes
(Boost.Beast / Asio, OpenSSL). The Link uses this classification to decide
whether a failure is transient (retried with backoff) or final.
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,

    // --- Control / contract errors (caller responsibility) ------------------
    InvalidUrl,       // Malformed or unsupported URL (scheme, host, port)
    InvalidState,     // Operation not allowed in current link state

    // --- Expected / benign termination --------------------------------------
    LocalShutdown,    // Connection was closed intentionally by the local endpoint
    RemoteClosed,     // Remote endpoint closed the connection

    // --- Transient / recoverable failures -----------------------------------
    Timeout,          // Transport-level timeout (idle, stalled network, etc)
    ConnectionFailed, // Resolve or TCP connect failed
    HandshakeFailed,  // TLS or WebSocket upgrade failed

    // --- Protocol / framing issues ------------------------------------------
    ProtocolError,    // Invalid frame or protocol violation

    // --- Unspecified transport failure --------------------------------------
    TransportFailure, // Unclassified transport failure
};


inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::InvalidUrl:        return "InvalidUrl";
    case Error::InvalidState:      return "InvalidState";
    case Error::LocalShutdown:     return "LocalShutdown";
    case Error::RemoteClosed:      return "RemoteClosed";
    case Error::Timeout:           return "Timeout";
    case Error::ConnectionFailed:  return "ConnectionFailed";
    case Error::HandshakeFailed:   return "HandshakeFailed";
    case Error::ProtocolError:     return "ProtocolError";
    case Error::TransportFailure:  return "TransportFailure";
    default:                       return "Unknown";
    }
}

} // namespace transport
} // namespace roomsync::core
