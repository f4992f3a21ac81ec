#pragma once

/*
===============================================================================
 roomsync::core::transport::Link
===============================================================================

A transport-level WebSocket link with a poll-driven reconnection state machine
and an outbound queue.

The Link owns exactly one logical connection to a sync endpoint. Every
connection attempt uses a freshly constructed WS instance, so state never leaks
from a dead socket into the next one.

-------------------------------------------------------------------------------
 State machine
-------------------------------------------------------------------------------

  Disconnected ──open()──► Connecting ──ok──► Connected
                               │                  │ transport closed
                               │ retryable        ▼
                               └───────────► Reconnecting ──ok──► Connected
                                                  │
                                                  │ attempt N == max_attempts failed
                                                  ▼
                                            ConnectionLost (terminal until open())

- A retry cycle schedules attempt k after base_delay * 2^(k-1).
  With the default policy this is 1s, 2s, 4s, 8s, 16s.
- When the last attempt fails the link enters ConnectionLost and emits
  Signal::ConnectionLost exactly once for that cycle.
- close() and cancel_reconnect() abort a pending retry cycle immediately.

-------------------------------------------------------------------------------
 Outbound semantics
-------------------------------------------------------------------------------

- send() never blocks and never fails for lack of connectivity. While the link
  is not Connected (or older envelopes are still waiting) the envelope is
  appended to the OutboundQueue.
- Every transition to Connected flushes the queue in FIFO order before any new
  envelope is written.
- A failed write keeps the envelope at the head of the queue; the transport
  reports the failure through its Close event and the retry cycle takes over.

-------------------------------------------------------------------------------
 Usage model
-------------------------------------------------------------------------------

- open(url) once, then drive all progress with poll()
- Observe edges through poll_signal() and payloads through poll_message()
- No background threads live here. The WS implementation may own an IO thread,
  but everything the Link does happens on the caller's thread.

===============================================================================
*/

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <string_view>

#include "roomsync/core/transport/concepts.hpp"
#include "roomsync/core/transport/error.hpp"
#include "roomsync/core/transport/state.hpp"
#include "roomsync/core/transport/signal.hpp"
#include "roomsync/core/transport/parse_url.hpp"
#include "roomsync/core/transport/outbound_queue.hpp"
#include "roomsync/core/transport/websocket/events.hpp"
#include "lcr/system/clock.hpp"
#include "lcr/optional.hpp"
#include "lcr/log/logger.hpp"


namespace roomsync::core::transport {

// Bounded exponential backoff
struct RetryPolicy {
    std::uint32_t max_attempts{5};
    std::chrono::milliseconds base_delay{1000};

    // Delay before the given 1-based attempt
    [[nodiscard]]
    inline std::chrono::milliseconds delay(std::uint32_t attempt) const noexcept {
        if (attempt == 0) {
            attempt = 1;
        }
        const std::uint32_t shift = (attempt - 1 < 20u) ? attempt - 1 : 20u;
        return base_delay * (1LL << shift);
    }
};

// Outcome of Link::send()
enum class Dispatch : std::uint8_t {
    Sent,    // written to the transport
    Queued   // appended to the outbound queue
};

[[nodiscard]]
inline constexpr std::string_view to_string(Dispatch d) noexcept {
    switch (d) {
        case Dispatch::Sent:   return "Sent";
        case Dispatch::Queued: return "Queued";
        default:               return "Unknown";
    }
}


template <
    transport::WebSocketConcept WS,
    lcr::system::ClockConcept Clock = lcr::system::steady_clock
>
class Link {
public:
    using time_point = std::chrono::steady_clock::time_point;

    explicit Link(RetryPolicy policy = RetryPolicy{}) noexcept
        : policy_(policy)
    {}

    Link(const Link&) = delete;
    Link& operator=(const Link&) = delete;

    // Transport is closed on destruction. No reconnection outlives the Link.
    ~Link() {
        close();
    }

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    // Allowed from Disconnected and ConnectionLost.
    [[nodiscard]]
    inline Error open(const std::string& url) noexcept {
        RS_DEBUG("[LINK] Connecting to: " << url);
        if (state_ != State::Disconnected && state_ != State::ConnectionLost) {
            RS_WARN("[LINK] open() called while " << to_string(state_) << ". Ignoring.");
            return Error::InvalidState;
        }
        ParsedUrl tmp;
        last_error_ = parse_url(url, tmp);
        if (last_error_ != Error::None) {
            RS_ERROR("[LINK] Invalid URL '" << url << "'");
            return last_error_;
        }
        url_ = url;
        parsed_url_ = std::move(tmp);
        transition_(Event::OpenRequested);
        last_error_ = connect_();
        if (last_error_ != Error::None) {
            RS_ERROR("[LINK] Connection failed (" << to_string(last_error_) << ")");
            transition_(Event::TransportConnectFailed, last_error_);
            return last_error_;
        }
        transition_(Event::TransportConnected);
        RS_INFO("[LINK] Connected to server: " << url_);
        return Error::None;
    }

    // Unconditional shutdown. Cancels any retry cycle. Idempotent.
    inline void close() noexcept {
        if (state_ == State::Disconnected) {
            return;
        }
        transition_(Event::CloseRequested);
    }

    // Aborts a pending retry cycle without touching an established connection
    inline void cancel_reconnect() noexcept {
        if (state_ == State::Reconnecting) {
            transition_(Event::CancelRequested);
        }
    }

    // -------------------------------------------------------------------------
    // Sending
    // -------------------------------------------------------------------------

    inline Dispatch send(std::string envelope) {
        if (state_ == State::Connected && outbound_.empty()) {
            if (ws_->send(envelope)) {
                ++tx_messages_;
                return Dispatch::Sent;
            }
            RS_WARN("[LINK] Write failed, queueing envelope until the link recovers");
        }
        outbound_.push(std::move(envelope));
        RS_TRACE("[LINK] Envelope queued (pending: " << outbound_.size() << ", state: " << to_string(state_) << ")");
        return Dispatch::Queued;
    }

    // -------------------------------------------------------------------------
    // Event loop
    // -------------------------------------------------------------------------

    inline void poll() noexcept {
        // === Drain transport events ===
        if (ws_) {
            websocket::Event ev;
            while (ws_ && ws_->poll_event(ev)) {
                switch (ev.type) {
                    case websocket::EventType::Close:
                        on_transport_closed_();
                        break;

                    case websocket::EventType::Error:
                        on_transport_error_(ev.error);
                        break;
                }
            }
        }
        // === Reconnection ===
        if (state_ == State::Reconnecting && Clock::now() >= next_retry_) {
            reconnect_();
        }
        // === Backlog ===
        if (state_ == State::Connected && !outbound_.empty()) {
            flush_outbound_();
        }
    }

    [[nodiscard]]
    inline bool poll_signal(link::Signal& out) noexcept {
        if (signals_.empty()) {
            return false;
        }
        out = signals_.front();
        signals_.pop_front();
        return true;
    }

    [[nodiscard]]
    inline bool poll_message(std::string& out) noexcept {
        if (!ws_ || !ws_->poll_message(out)) {
            return false;
        }
        ++rx_messages_;
        return true;
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline State state() const noexcept {
        return state_;
    }

    // Incremented on every transition to Connected
    [[nodiscard]]
    inline std::uint64_t epoch() const noexcept {
        return epoch_;
    }

    [[nodiscard]]
    inline std::size_t pending() const noexcept {
        return outbound_.size();
    }

    inline void clear_outbound() noexcept {
        outbound_.clear();
    }

    // Ordinal of the current (or last) retry attempt within the cycle
    [[nodiscard]]
    inline std::uint32_t attempts() const noexcept {
        return retry_attempts_;
    }

    [[nodiscard]]
    inline DisconnectReason disconnect_reason() const noexcept {
        return disconnect_reason_;
    }

    [[nodiscard]]
    inline Error last_error() const noexcept {
        return last_error_;
    }

    [[nodiscard]]
    inline time_point next_retry() const noexcept {
        return next_retry_;
    }

    [[nodiscard]]
    inline const RetryPolicy& policy() const noexcept {
        return policy_;
    }

    [[nodiscard]]
    inline std::uint64_t rx_messages() const noexcept {
        return rx_messages_;
    }

    [[nodiscard]]
    inline std::uint64_t tx_messages() const noexcept {
        return tx_messages_;
    }

#ifdef RS_UNIT_TEST
public:
    WS& ws() {
        return *ws_;
    }

    [[nodiscard]]
    bool has_ws() const noexcept {
        return static_cast<bool>(ws_);
    }
#endif // RS_UNIT_TEST

private:
    RetryPolicy policy_;
    std::string url_;
    lcr::optional<ParsedUrl> parsed_url_;   // Invariant: has() once open() validated a URL

    std::unique_ptr<WS> ws_;                // One instance per connection attempt
    OutboundQueue outbound_;
    std::deque<link::Signal> signals_;

    State state_{State::Disconnected};
    DisconnectReason disconnect_reason_{DisconnectReason::None};
    Error last_error_{Error::None};

    time_point next_retry_{};
    std::uint32_t retry_attempts_{0};       // 1-based ordinal of the scheduled attempt

    std::uint64_t epoch_{0};
    std::uint64_t rx_messages_{0};
    std::uint64_t tx_messages_{0};

private:
    inline void set_state_(State next) noexcept {
        RS_TRACE("[LINK] State: " << to_string(state_) << " -> " << to_string(next));
        state_ = next;
    }

    inline void emit_(link::Signal sig) noexcept {
        RS_TRACE("[LINK] Emitting signal: " << to_string(sig));
        signals_.push_back(sig);
    }

    // State machine transition function
    inline void transition_(Event event, Error error = Error::None) noexcept {
        RS_TRACE("[FSM] (" << to_string(state_) << ") --" << to_string(event) << "-->");

        switch (state_) {

        // ================================================================
        case State::Disconnected:
        case State::ConnectionLost:
            switch (event) {
            case Event::OpenRequested:
                retry_attempts_ = 0;
                disconnect_reason_ = DisconnectReason::None;
                set_state_(State::Connecting);
                break;

            case Event::CloseRequested:
                set_state_(State::Disconnected);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Connecting:
            switch (event) {
            case Event::TransportConnected:
                set_state_(State::Connected);
                ++epoch_;
                retry_attempts_ = 0;
                disconnect_reason_ = DisconnectReason::None;
                emit_(link::Signal::Connected);
                flush_outbound_();
                break;

            case Event::TransportConnectFailed:
                disconnect_reason_ = DisconnectReason::TransportError;
                if (should_retry_(error)) {
                    start_retry_cycle_();
                } else {
                    destroy_transport_();
                    set_state_(State::Disconnected);
                }
                break;

            case Event::TransportReconnectFailed:
                disconnect_reason_ = DisconnectReason::TransportError;
                destroy_transport_();
                if (retry_attempts_ >= policy_.max_attempts || !should_retry_(error)) {
                    RS_ERROR("[LINK] Giving up on '" << url_ << "' after " << retry_attempts_ << " attempt(s)");
                    disconnect_reason_ = DisconnectReason::RetriesExhausted;
                    set_state_(State::ConnectionLost);
                    emit_(link::Signal::ConnectionLost);
                } else {
                    set_state_(State::Reconnecting);
                    schedule_next_retry_();
                }
                break;

            case Event::CloseRequested:
                destroy_transport_();
                set_state_(State::Disconnected);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Connected:
            switch (event) {
            case Event::CloseRequested:
                disconnect_reason_ = DisconnectReason::LocalClose;
                destroy_transport_();
                set_state_(State::Disconnected);
                emit_(link::Signal::Disconnected);
                RS_INFO("[LINK] Disconnected from server: " << url_);
                break;

            case Event::TransportClosed:
                // The dead transport is kept until the next attempt so frames
                // received before the close can still be drained
                emit_(link::Signal::Disconnected);
                if (should_retry_(error)) {
                    start_retry_cycle_();
                } else {
                    disconnect_reason_ = DisconnectReason::TransportError;
                    set_state_(State::Disconnected);
                }
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Reconnecting:
            switch (event) {
            case Event::RetryTimerExpired:
                set_state_(State::Connecting);
                break;

            case Event::CloseRequested:
            case Event::CancelRequested:
                RS_DEBUG("[LINK] Retry cycle cancelled");
                destroy_transport_();
                retry_attempts_ = 0;
                next_retry_ = time_point{};
                disconnect_reason_ = DisconnectReason::LocalClose;
                set_state_(State::Disconnected);
                break;

            default:
                break;
            }
            break;
        }
    }

    [[nodiscard]]
    inline Error connect_() noexcept {
        destroy_transport_();
        ws_ = std::make_unique<WS>();
        const ParsedUrl& u = parsed_url_.value();
        return ws_->connect(u.host, u.port, u.path, u.secure);
    }

    inline void destroy_transport_() noexcept {
        if (ws_) {
            ws_->close();
            ws_.reset();
        }
    }

    inline void reconnect_() noexcept {
        RS_DEBUG("[LINK] Reconnecting to: " << url_ << " (attempt " << retry_attempts_ << "/" << policy_.max_attempts << ")");
        transition_(Event::RetryTimerExpired);
        last_error_ = connect_();
        if (last_error_ != Error::None) {
            RS_WARN("[LINK] Reconnection attempt " << retry_attempts_ << " failed (" << to_string(last_error_) << ")");
            transition_(Event::TransportReconnectFailed, last_error_);
            return;
        }
        transition_(Event::TransportConnected);
        RS_INFO("[LINK] Connection re-established with server '" << url_ << "'");
    }

    inline void start_retry_cycle_() noexcept {
        retry_attempts_ = 0;
        set_state_(State::Reconnecting);
        schedule_next_retry_();
    }

    inline void schedule_next_retry_() noexcept {
        ++retry_attempts_;
        const auto delay = policy_.delay(retry_attempts_);
        next_retry_ = Clock::now() + delay;
        emit_(link::Signal::RetryScheduled);
        RS_INFO("[LINK] Next reconnection attempt (" << retry_attempts_ << "/" << policy_.max_attempts
                << ") in " << delay.count() << " ms");
    }

    // Writes queued envelopes in order, stopping at the first failure
    inline void flush_outbound_() noexcept {
        if (outbound_.empty()) {
            return;
        }
        RS_DEBUG("[LINK] Flushing " << outbound_.size() << " queued envelope(s)");
        while (!outbound_.empty() && ws_) {
            if (!ws_->send(outbound_.front())) {
                RS_WARN("[LINK] Flush interrupted with " << outbound_.size() << " envelope(s) pending");
                return;
            }
            ++tx_messages_;
            outbound_.pop();
        }
    }

    inline void on_transport_error_(Error error) noexcept {
        RS_WARN("[LINK] Transport error: " << to_string(error));
        last_error_ = error;
    }

    inline void on_transport_closed_() noexcept {
        if (state_ != State::Connected) {
            return;
        }
        // A clean close from the peer still warrants a reconnect
        if (last_error_ == Error::None) {
            last_error_ = Error::RemoteClosed;
        }
        RS_INFO("[LINK] Connection closed by transport (" << to_string(last_error_) << ")");
        const Error cause = last_error_;
        transition_(Event::TransportClosed, cause);
    }

    // Caller misuse and intentional shutdown are never retried
    [[nodiscard]]
    inline bool should_retry_(Error error) const noexcept {
        switch (error) {
            case Error::RemoteClosed:
            case Error::Timeout:
            case Error::ConnectionFailed:
            case Error::HandshakeFailed:
            case Error::ProtocolError:
            case Error::TransportFailure:
                return true;

            case Error::None:
            case Error::InvalidUrl:
            case Error::InvalidState:
            case Error::LocalShutdown:
            default:
                return false;
        }
    }
};

} // namespace roomsync::core::transport
