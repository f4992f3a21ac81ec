#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "roomsync/core/transport/concepts.hpp"
#include "roomsync/core/transport/error.hpp"
#include "roomsync/core/transport/websocket/events.hpp"

/*
================================================================================
WebSocket Transport (Boost.Beast)
================================================================================

Single-connection WebSocket transport over Boost.Beast, with TLS through
Boost.Asio SSL (OpenSSL).

  • No retries, no reconnection logic. Recovery lives in transport::Link
  • connect() is synchronous: resolve, TCP connect, TLS handshake (wss),
    WebSocket upgrade
  • Once connected, an IO thread owns the socket. Inbound text frames and
    control events are handed to the caller's thread through mutex-guarded
    queues drained by poll_message() / poll_event()
  • Errors are delivered before the Close event, and Close is delivered
    exactly once per instance
  • close() is idempotent and joins the IO thread

Library types stay behind a pImpl so that only this translation unit pulls in
the Beast / Asio / OpenSSL headers.
================================================================================
*/

namespace roomsync::core::transport::beast {

class WebSocket {
public:
    WebSocket();
    ~WebSocket();

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    [[nodiscard]]
    Error connect(const std::string& host, const std::string& port, const std::string& path, bool secure) noexcept;

    // Accepted for writing. Write failures surface as Error + Close events.
    [[nodiscard]]
    bool send(std::string_view msg) noexcept;

    void close() noexcept;

    [[nodiscard]]
    bool poll_event(websocket::Event& out) noexcept;

    [[nodiscard]]
    bool poll_message(std::string& out) noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Assert that WebSocket conforms to transport::WebSocketConcept concept
static_assert(WebSocketConcept<WebSocket>);

} // namespace roomsync::core::transport::beast
