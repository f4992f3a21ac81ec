#include "roomsync/client.hpp"

// ---- Core includes (PRIVATE) ----
#include "roomsync/core/lifecycle/engine.hpp"
#include "roomsync/core/transport/beast/websocket.hpp"


namespace roomsync {

namespace lifecycle = core::lifecycle;
namespace events    = core::events;

using WS = core::transport::beast::WebSocket;

// -----------------------------
// Impl
// -----------------------------

struct Client::Impl {
    client_config cfg;
    lifecycle::Engine<WS, lifecycle::directory::Registry> engine;

    Impl(client_config c, lifecycle::directory::Registry& directory)
        : cfg(std::move(c))
        , engine(
            lifecycle::Identity{ .user_id = cfg.user_id, .display_name = cfg.display_name },
            lifecycle::EngineConfig{
                .sync_interval   = cfg.sync_interval,
                .cursor_throttle = cfg.cursor_throttle,
                .reconnect       = core::transport::RetryPolicy{
                    .max_attempts = cfg.max_reconnect_attempts,
                    .base_delay   = cfg.reconnect_base_delay
                },
                .snapshot_dir    = cfg.snapshot_dir
            },
            directory)
    {
    }
};

// -----------------------------
// Client methods
// -----------------------------

Client::Client(client_config cfg, lifecycle::directory::Registry& directory)
    : impl_(std::make_unique<Impl>(std::move(cfg), directory)) {}

Client::~Client() = default;

core::Error Client::connect() {
    return impl_->engine.connect(impl_->cfg.endpoint);
}

void Client::disconnect() {
    impl_->engine.disconnect();
}

void Client::poll() {
    impl_->engine.poll();
}

bool Client::is_connected() const {
    return impl_->engine.link().state() == core::transport::State::Connected;
}

core::Error Client::create_session(const core::Settings& settings, core::Session& out) {
    return impl_->engine.create_session(settings, out);
}

core::Error Client::join_session(const std::string& room_code, core::Session& out) {
    return impl_->engine.join_session(room_code, out);
}

core::Error Client::leave_session() {
    return impl_->engine.leave_session();
}

core::Error Client::resume_session(core::Session& out) {
    return impl_->engine.resume_session(out);
}

core::Error Client::share_measurement(const core::MeasurementInput& input, core::SharedMeasurement& out) {
    return impl_->engine.share_measurement(input, out);
}

core::Error Client::update_measurement(const std::string& measurement_id, const core::MeasurementPatch& patch,
                                       core::SharedMeasurement& out) {
    return impl_->engine.update_measurement(measurement_id, patch, out);
}

core::Error Client::update_cursor(double x, double y, double z) {
    return impl_->engine.update_cursor(x, y, z);
}

core::Error Client::add_annotation(core::AnnotationType type, const core::Point3& position, const std::string& content,
                                   const core::AnnotationStylePatch& style, core::Annotation& out) {
    return impl_->engine.add_annotation(type, position, content, style, out);
}

core::Error Client::send_chat(const std::string& text) {
    return impl_->engine.send_chat(text);
}

const core::Session* Client::session() const {
    return impl_->engine.session();
}

const core::Participant* Client::local_participant() const {
    return impl_->engine.local_participant();
}

// -----------------------------
// Event handlers
// -----------------------------

events::SubscriptionId Client::on_participant_joined(handler<events::ParticipantJoined> cb) {
    return impl_->engine.events().subscribe<events::ParticipantJoined>(std::move(cb));
}

events::SubscriptionId Client::on_participant_left(handler<events::ParticipantLeft> cb) {
    return impl_->engine.events().subscribe<events::ParticipantLeft>(std::move(cb));
}

events::SubscriptionId Client::on_measurement_shared(handler<events::MeasurementShared> cb) {
    return impl_->engine.events().subscribe<events::MeasurementShared>(std::move(cb));
}

events::SubscriptionId Client::on_measurement_updated(handler<events::MeasurementUpdated> cb) {
    return impl_->engine.events().subscribe<events::MeasurementUpdated>(std::move(cb));
}

events::SubscriptionId Client::on_annotation_updated(handler<events::AnnotationUpdated> cb) {
    return impl_->engine.events().subscribe<events::AnnotationUpdated>(std::move(cb));
}

events::SubscriptionId Client::on_cursor_updated(handler<events::CursorUpdated> cb) {
    return impl_->engine.events().subscribe<events::CursorUpdated>(std::move(cb));
}

events::SubscriptionId Client::on_chat_message(handler<events::ChatMessage> cb) {
    return impl_->engine.events().subscribe<events::ChatMessage>(std::move(cb));
}

events::SubscriptionId Client::on_session_synced(handler<events::SessionSynced> cb) {
    return impl_->engine.events().subscribe<events::SessionSynced>(std::move(cb));
}

events::SubscriptionId Client::on_connection_lost(handler<events::ConnectionLost> cb) {
    return impl_->engine.events().subscribe<events::ConnectionLost>(std::move(cb));
}

events::SubscriptionId Client::on_notification(handler<events::Notification> cb) {
    return impl_->engine.events().subscribe<events::Notification>(std::move(cb));
}

bool Client::unsubscribe(events::SubscriptionId id) {
    return impl_->engine.events().unsubscribe(id);
}

} // namespace roomsync
