/*
===============================================================================
 Link Signals
===============================================================================

link::Signal represents externally observable, edge-triggered facts emitted by
transport::Link via its poll_signal() interface.

Signals are:
  - Edge-triggered (not level- or state-based)
  - Single-shot per occurrence
  - Deterministic and poll-driven

-------------------------------------------------------------------------------
 Signal Meanings
-------------------------------------------------------------------------------

Connected
  A WebSocket connection has been established and the outbound queue has been
  flushed. Emitted once per transport lifetime (increments the epoch).

Disconnected
  An established connection became unusable.

RetryScheduled
  A reconnection attempt has been scheduled according to the backoff policy.

ConnectionLost
  The retry budget is exhausted. Emitted exactly once per retry cycle; the link
  stays down until open() is called again.

===============================================================================
*/

#pragma once

#include <cstdint>
#include <string_view>


namespace roomsync::core::transport::link {

enum class Signal : std::uint8_t {
    None,
    Connected,
    Disconnected,
    RetryScheduled,
    ConnectionLost
};

[[nodiscard]]
inline constexpr std::string_view to_string(Signal sig) noexcept {
    switch (sig) {
        case Signal::None:            return "None";
        case Signal::Connected:       return "Connected";
        case Signal::Disconnected:    return "Disconnected";
        case Signal::RetryScheduled:  return "RetryScheduled";
        case Signal::ConnectionLost:  return "ConnectionLost";
        default:                      return "Unknown";
    }
}

} // namespace roomsync::core::transport::link
