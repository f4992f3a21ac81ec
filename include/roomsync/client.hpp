#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include "roomsync/core/error.hpp"
#include "roomsync/core/model/session.hpp"
#include "roomsync/core/events/events.hpp"
#include "roomsync/core/events/bus.hpp"
#include "roomsync/core/lifecycle/directory.hpp"


namespace roomsync {

// -----------------------------------------------------------------------------
// Client configuration
// -----------------------------------------------------------------------------
struct client_config {
    /// Relay endpoint (ws:// or wss://)
    std::string endpoint = "wss://collaborate.roomsnap.app";

    /// Identity of the local user
    std::string user_id;
    std::string display_name;

    /// Full-state sync period while a session is active
    std::chrono::milliseconds sync_interval{5'000};

    /// Minimum spacing between two cursor broadcasts
    std::chrono::milliseconds cursor_throttle{100};

    /// Reconnection budget: attempt N waits base_delay * 2^(N-1)
    std::uint32_t max_reconnect_attempts = 5;
    std::chrono::milliseconds reconnect_base_delay{1'000};

    /// Directory for session snapshots. Empty disables persistence.
    std::string snapshot_dir;
};


/*
===============================================================================
RoomSync Client (public API)
===============================================================================

User-facing facade over the session engine, bound to the Boost.Beast
WebSocket transport. Room codes are resolved through the directory passed at
construction, which must outlive the client.

The directory is an in-process directory::Registry, so join_session() only
finds rooms created by clients sharing that registry. Peers in separate
processes need a DirectoryConcept implementation backed by a shared service,
driven through lifecycle::Engine directly.

The client is poll-driven: no callback fires outside poll() or the operation
that caused it, and every method must be called from the same thread.
===============================================================================
*/
class Client {
public:
    template<class E>
    using handler = std::function<void(const E&)>;

    Client(client_config cfg, core::lifecycle::directory::Registry& directory);
    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    ~Client();

    // -------------------------------------------------------------------------
    // Connection
    // -------------------------------------------------------------------------
    [[nodiscard]] core::Error connect();
    void disconnect();
    void poll();

    [[nodiscard]] bool is_connected() const;

    // Executes poll() while the caller's condition holds.
    // tick == 0 busy-polls.
    template<class StopFn>
    void run_while(StopFn&& should_continue, std::chrono::milliseconds tick = std::chrono::milliseconds{10}) {
        const bool cooperative = (tick.count() > 0);
        while (should_continue()) [[likely]] {
            poll();
            if (cooperative) [[likely]] {
                std::this_thread::sleep_for(tick);
            }
        }
    }

    template<class StopFn>
    void run_until(StopFn&& should_stop, std::chrono::milliseconds tick = std::chrono::milliseconds{10}) {
        const bool cooperative = (tick.count() > 0);
        while (!should_stop()) [[likely]] {
            poll();
            if (cooperative) [[likely]] {
                std::this_thread::sleep_for(tick);
            }
        }
    }

    // -------------------------------------------------------------------------
    // Session lifecycle
    // -------------------------------------------------------------------------
    [[nodiscard]] core::Error create_session(const core::Settings& settings, core::Session& out);
    [[nodiscard]] core::Error join_session(const std::string& room_code, core::Session& out);
    core::Error leave_session();
    [[nodiscard]] core::Error resume_session(core::Session& out);

    // -------------------------------------------------------------------------
    // Shared content
    // -------------------------------------------------------------------------
    [[nodiscard]] core::Error share_measurement(const core::MeasurementInput& input, core::SharedMeasurement& out);
    [[nodiscard]] core::Error update_measurement(const std::string& measurement_id, const core::MeasurementPatch& patch,
                                                 core::SharedMeasurement& out);
    [[nodiscard]] core::Error update_cursor(double x, double y, double z);
    [[nodiscard]] core::Error add_annotation(core::AnnotationType type, const core::Point3& position,
                                             const std::string& content, const core::AnnotationStylePatch& style,
                                             core::Annotation& out);
    [[nodiscard]] core::Error send_chat(const std::string& text);

    // -------------------------------------------------------------------------
    // Observation
    // -------------------------------------------------------------------------

    // nullptr when no session is active. Invalidated by the next client call.
    [[nodiscard]] const core::Session* session() const;
    [[nodiscard]] const core::Participant* local_participant() const;

    core::events::SubscriptionId on_participant_joined(handler<core::events::ParticipantJoined> cb);
    core::events::SubscriptionId on_participant_left(handler<core::events::ParticipantLeft> cb);
    core::events::SubscriptionId on_measurement_shared(handler<core::events::MeasurementShared> cb);
    core::events::SubscriptionId on_measurement_updated(handler<core::events::MeasurementUpdated> cb);
    core::events::SubscriptionId on_annotation_updated(handler<core::events::AnnotationUpdated> cb);
    core::events::SubscriptionId on_cursor_updated(handler<core::events::CursorUpdated> cb);
    core::events::SubscriptionId on_chat_message(handler<core::events::ChatMessage> cb);
    core::events::SubscriptionId on_session_synced(handler<core::events::SessionSynced> cb);
    core::events::SubscriptionId on_connection_lost(handler<core::events::ConnectionLost> cb);
    core::events::SubscriptionId on_notification(handler<core::events::Notification> cb);

    bool unsubscribe(core::events::SubscriptionId id);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace roomsync
