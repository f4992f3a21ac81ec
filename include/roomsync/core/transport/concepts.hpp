#pragma once

#include <string>
#include <string_view>
#include <concepts>

#include "roomsync/core/transport/error.hpp"
#include "roomsync/core/transport/websocket/events.hpp"

namespace roomsync::core::transport {

// -----------------------------------------------------------------------------
// WebSocketConcept
// -----------------------------------------------------------------------------
//
// Defines the minimal contract required by the Link layer.
//
// The WebSocket implementation:
//
//   • Is default constructible (one instance per connection attempt)
//   • Connects synchronously and reports failures as transport::Error
//   • Owns its IO thread once connected
//   • Exposes poll_event() for control-plane events (Close exactly once)
//   • Exposes poll_message() for inbound text frames, in arrival order
//
// -----------------------------------------------------------------------------

template<class WS>
concept WebSocketConcept =
    std::default_initializable<WS> &&
    requires(
        WS ws,
        const std::string& host,
        const std::string& port,
        const std::string& path,
        bool secure,
        std::string_view msg,
        std::string& inbound,
        websocket::Event& ev
    )
{
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    { ws.connect(host, port, path, secure) } noexcept -> std::same_as<Error>;
    { ws.close() } noexcept -> std::same_as<void>;

    // ---------------------------------------------------------------------
    // Sending
    // ---------------------------------------------------------------------

    { ws.send(msg) } noexcept -> std::same_as<bool>;

    // ---------------------------------------------------------------------
    // Polling
    // ---------------------------------------------------------------------

    { ws.poll_event(ev) } noexcept -> std::same_as<bool>;
    { ws.poll_message(inbound) } noexcept -> std::same_as<bool>;
};

} // namespace roomsync::core::transport
