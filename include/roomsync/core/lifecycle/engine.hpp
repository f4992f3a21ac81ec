#pragma once

/*
===============================================================================
 roomsync::core::lifecycle::Engine
===============================================================================

The session engine: one logical actor that owns the transport link, the session
state store, the conflict resolver, the snapshot store and the event bus.

Everything happens on the thread that calls the engine. poll() is the only
place where inbound traffic, link signals and timers are processed, so the
Store is never touched concurrently.

-------------------------------------------------------------------------------
 Data flow
-------------------------------------------------------------------------------

  outbound: local op → Store → codec → Link (or its outbound queue)
  inbound : Link → codec → scope / echo / sequence filters
                 → ConflictResolver (measurements) or Store → EventBus

-------------------------------------------------------------------------------
 poll() order
-------------------------------------------------------------------------------

  1) link.poll()            transport events, retry timer, backlog flush
  2) link signals           reconnect catch-up, connectionLost
  3) inbound messages       decoded and applied in arrival order
  4) conflict resolution    rebroadcast of locally winning measurements
  5) periodic tick          full sync (auto_sync) and snapshot

-------------------------------------------------------------------------------
 Ordering
-------------------------------------------------------------------------------

- Outgoing envelopes carry a sequence that starts at 1 and never resets for
  the lifetime of the engine.
- Inbound envelopes with sequence <= the last accepted one from the same sender
  are dropped. A join resets tracking for its sender.
===============================================================================
*/

#include <chrono>
#include <cstdint>
#include <random>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "roomsync/core/error.hpp"
#include "roomsync/core/model/session.hpp"
#include "roomsync/core/model/palette.hpp"
#include "roomsync/core/protocol/message.hpp"
#include "roomsync/core/protocol/codec/encoder.hpp"
#include "roomsync/core/protocol/codec/decoder.hpp"
#include "roomsync/core/transport/concepts.hpp"
#include "roomsync/core/transport/link.hpp"
#include "roomsync/core/state/store.hpp"
#include "roomsync/core/state/conflict_resolver.hpp"
#include "roomsync/core/events/bus.hpp"
#include "roomsync/core/lifecycle/directory.hpp"
#include "roomsync/core/lifecycle/ids.hpp"
#include "roomsync/core/lifecycle/room_code.hpp"
#include "roomsync/core/lifecycle/snapshot_store.hpp"
#include "lcr/system/clock.hpp"
#include "lcr/optional.hpp"
#include "lcr/log/logger.hpp"


namespace roomsync::core::lifecycle {

// Who the local user is (supplied by the identity layer)
struct Identity {
    std::string user_id;
    std::string display_name;
};

struct EngineConfig {
    std::chrono::milliseconds sync_interval{5000};
    std::chrono::milliseconds cursor_throttle{100};
    transport::RetryPolicy reconnect{};
    std::string snapshot_dir;              // empty → no persistence
};

// Room code generation is retried on directory collisions
constexpr int MAX_ROOM_CODE_ATTEMPTS = 8;


template <
    transport::WebSocketConcept WS,
    DirectoryConcept Directory,
    lcr::system::ClockConcept Clock = lcr::system::steady_clock
>
class Engine {
public:
    using LinkType   = transport::Link<WS, Clock>;
    using time_point = std::chrono::steady_clock::time_point;

    Engine(Identity identity, EngineConfig config, Directory& directory)
        : identity_(std::move(identity))
        , config_(std::move(config))
        , directory_(directory)
        , link_(config_.reconnect)
        , snapshots_(config_.snapshot_dir)
        , rng_(std::random_device{}())
        , local_id_(ids::participant_id(identity_.user_id))
    {
    }

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // -------------------------------------------------------------------------
    // Connection
    // -------------------------------------------------------------------------

    // Transport failures are retried by the link and never reported here
    [[nodiscard]]
    inline Error connect(const std::string& url) {
        const transport::Error err = link_.open(url);
        switch (err) {
            case transport::Error::None:
                return Error::None;
            case transport::Error::InvalidUrl:
                return Error::InvalidArgument;
            case transport::Error::InvalidState:
                RS_DEBUG("[ENGINE] connect() ignored, link is " << to_string(link_.state()));
                return Error::None;
            default:
                if (link_.state() == transport::State::Reconnecting) {
                    RS_WARN("[ENGINE] Initial connect failed (" << to_string(err) << "), retrying in background");
                    return Error::None;
                }
                return Error::ConnectionLost;
        }
    }

    inline void disconnect() noexcept {
        link_.close();
    }

    // -------------------------------------------------------------------------
    // Session lifecycle
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline Error create_session(const Settings& settings, Session& out) {
        if (store_.has_session()) {
            return Error::AlreadyInSession;
        }
        if (settings.max_participants == 0) {
            return Error::InvalidArgument;
        }
        const std::uint64_t now = Clock::epoch_ms();
        Session session;
        session.id = ids::session_id(now);
        session.host_id = local_id_;
        session.participants.push_back(make_local_participant_(Role::Host, now));
        session.created_at = now;
        session.updated_at = now;
        session.settings = settings;

        Error published = Error::InvalidArgument;
        for (int attempt = 0; attempt < MAX_ROOM_CODE_ATTEMPTS && published == Error::InvalidArgument; ++attempt) {
            session.room_code = generate_room_code(rng_);
            published = directory_.publish(session);
        }
        if (published != Error::None) {
            RS_ERROR("[ENGINE] Could not publish session " << session.id << " (" << to_string(published) << ")");
            return published;
        }
        const Error installed = store_.install(session);
        if (installed != Error::None) {
            return installed;
        }
        begin_session_();
        persist_();

        protocol::JoinPayload join;
        join.participant = session.participants.front();
        join.room_code = session.room_code;
        send_(std::move(join));

        RS_INFO("[ENGINE] Created session " << session.id << " with room code " << session.room_code);
        events_.publish(events::Notification{"Session created", "Room code: " + session.room_code});
        out = store_.session();
        return Error::None;
    }

    [[nodiscard]]
    inline Error join_session(const std::string& room_code, Session& out) {
        if (store_.has_session()) {
            return Error::AlreadyInSession;
        }
        if (!is_valid_room_code(room_code)) {
            RS_WARN("[ENGINE] Malformed room code '" << room_code << "'");
            return Error::NotFound;
        }
        const std::uint64_t now = Clock::epoch_ms();
        Session session;
        const Error admitted = directory_.admit(room_code, make_local_participant_(Role::Editor, now), now, session);
        if (admitted != Error::None) {
            RS_WARN("[ENGINE] Join " << room_code << " refused (" << to_string(admitted) << ")");
            return admitted;
        }
        const Error installed = store_.install(std::move(session));
        if (installed != Error::None) {
            return installed;
        }
        begin_session_();
        persist_();
        announce_and_request_sync_();

        RS_INFO("[ENGINE] Joined session " << store_.session().id << " (" << room_code << ")");
        events_.publish(events::Notification{"Joined session", "Room code: " + room_code});
        out = store_.session();
        return Error::None;
    }

    // Emits leave and drops every trace of the session. Idempotent.
    inline Error leave_session() {
        if (!store_.has_session()) {
            return Error::None;
        }
        const Session& session = store_.session();
        const std::string session_id = session.id;
        const std::string room_code = session.room_code;
        // The leave becomes the only envelope still pending
        link_.clear_outbound();
        send_(protocol::LeavePayload{});

        directory_.release(room_code, local_id_, Clock::epoch_ms());
        const Error removed = snapshots_.remove(session_id);
        if (removed != Error::None) {
            RS_WARN("[ENGINE] Snapshot of " << session_id << " could not be removed");
        }
        store_.clear();
        resolver_.clear();
        last_accepted_.clear();
        last_cursor_.reset();
        sync_active_ = false;
        link_.cancel_reconnect();
        RS_INFO("[ENGINE] Left session " << session_id);
        return Error::None;
    }

    // Picks the most recent persisted session this user belongs to
    [[nodiscard]]
    inline Error resume_session(Session& out) {
        if (store_.has_session()) {
            return Error::AlreadyInSession;
        }
        const std::uint64_t now = Clock::epoch_ms();
        std::vector<Session> snapshots;
        const Error loaded = snapshots_.load_all(now, snapshots);
        if (loaded != Error::None) {
            return loaded;
        }
        for (auto& candidate : snapshots) {
            if (!candidate.find_participant(local_id_)) {
                continue;
            }
            const Error installed = store_.install(std::move(candidate));
            if (installed != Error::None) {
                continue;
            }
            const Participant* me = store_.session().find_participant(local_id_);
            Participant again = *me;
            again.name = identity_.display_name;
            const Error rejoined = store_.add_participant(std::move(again), now);
            if (rejoined != Error::None) {
                RS_WARN("[ENGINE] Could not reactivate " << local_id_ << " in " << store_.session().id
                        << " (" << to_string(rejoined) << ")");
                store_.clear();
                continue;
            }
            begin_session_();
            announce_and_request_sync_();
            RS_INFO("[ENGINE] Resumed session " << store_.session().id);
            out = store_.session();
            return Error::None;
        }
        return Error::NotFound;
    }

    // -------------------------------------------------------------------------
    // Shared content
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline Error share_measurement(const MeasurementInput& input, SharedMeasurement& out) {
        if (!store_.has_session()) {
            return Error::NoActiveSession;
        }
        const Error err = store_.share_measurement(local_id_, input, Clock::epoch_ms(), out);
        if (err != Error::None) {
            return err;
        }
        send_(out);
        events_.publish(events::MeasurementShared{out, events::Origin::Local});
        return Error::None;
    }

    [[nodiscard]]
    inline Error update_measurement(const std::string& measurement_id, const MeasurementPatch& patch, SharedMeasurement& out) {
        if (!store_.has_session()) {
            return Error::NoActiveSession;
        }
        const Error err = store_.update_measurement(local_id_, measurement_id, patch, Clock::epoch_ms(), out);
        if (err != Error::None) {
            return err;
        }
        send_(out);
        events_.publish(events::MeasurementUpdated{out, events::Origin::Local});
        return Error::None;
    }

    // Broadcast at most once per cursor_throttle. Throttled positions are dropped.
    [[nodiscard]]
    inline Error update_cursor(double x, double y, double z) {
        if (!store_.has_session()) {
            return Error::NoActiveSession;
        }
        const time_point now = Clock::now();
        if (last_cursor_.has() && now - last_cursor_.value() < config_.cursor_throttle) {
            return Error::None;
        }
        last_cursor_ = now;
        CursorPosition cursor{local_id_, x, y, z, Clock::epoch_ms()};
        store_.set_cursor(cursor);
        send_(std::move(cursor));
        return Error::None;
    }

    [[nodiscard]]
    inline Error add_annotation(AnnotationType type, const Point3& position, const std::string& content,
                                const AnnotationStylePatch& style, Annotation& out) {
        if (!store_.has_session()) {
            return Error::NoActiveSession;
        }
        const Participant* me = store_.session().find_participant(local_id_);
        const std::uint64_t now = Clock::epoch_ms();
        Annotation a;
        a.id = ids::annotation_id(now);
        a.author_id = local_id_;
        a.type = type;
        a.position = position;
        a.content = content;
        a.style.color = style.color.value_or(me ? me->color : std::string(PARTICIPANT_COLORS.front()));
        a.style.font_size = style.font_size.value_or(DEFAULT_FONT_SIZE);
        a.style.stroke_width = style.stroke_width.value_or(DEFAULT_STROKE_WIDTH);
        a.timestamp = now;
        const Error err = store_.add_annotation(local_id_, a, now);
        if (err != Error::None) {
            return err;
        }
        out = a;
        send_(std::move(a));
        events_.publish(events::AnnotationUpdated{out, events::Origin::Local});
        return Error::None;
    }

    [[nodiscard]]
    inline Error send_chat(const std::string& text) {
        if (!store_.has_session()) {
            return Error::NoActiveSession;
        }
        if (text.empty()) {
            return Error::InvalidArgument;
        }
        const Participant* me = store_.session().find_participant(local_id_);
        protocol::ChatPayload chat{text, identity_.display_name, me ? me->color : std::string()};
        events_.publish(events::ChatMessage{chat.message, chat.author, chat.color, events::Origin::Local});
        send_(std::move(chat));
        return Error::None;
    }

    // Rebroadcasts every measurement whose local copy won a conflict.
    // Returns the number of rebroadcast measurements.
    inline std::size_t resolve_conflicts() {
        if (!store_.has_session() || resolver_.pending() == 0) {
            return 0;
        }
        std::vector<SharedMeasurement> rebased;
        resolver_.resolve(store_, Clock::epoch_ms(), rebased);
        for (auto& m : rebased) {
            events_.publish(events::MeasurementUpdated{m, events::Origin::Local});
            send_(std::move(m));
        }
        return rebased.size();
    }

    // -------------------------------------------------------------------------
    // Event loop
    // -------------------------------------------------------------------------

    inline void poll() {
        // 1) Transport
        link_.poll();
        // 2) Link signals
        transport::link::Signal sig;
        while (link_.poll_signal(sig)) {
            on_link_signal_(sig);
        }
        // 3) Inbound traffic
        while (link_.poll_message(rx_buffer_)) {
            on_raw_message_(rx_buffer_);
        }
        // 4) Conflicts
        resolve_conflicts();
        // 5) Periodic sync + snapshot
        if (sync_active_ && Clock::now() >= next_sync_) {
            next_sync_ = Clock::now() + config_.sync_interval;
            if (store_.session().settings.auto_sync) {
                send_full_sync_();
            }
            persist_();
        }
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline events::EventBus& events() noexcept {
        return events_;
    }

    // nullptr when no session is active
    [[nodiscard]]
    inline const Session* session() const noexcept {
        return store_.has_session() ? &store_.session() : nullptr;
    }

    [[nodiscard]]
    inline const Participant* local_participant() const noexcept {
        return store_.has_session() ? store_.session().find_participant(local_id_) : nullptr;
    }

    [[nodiscard]]
    inline const std::string& local_id() const noexcept {
        return local_id_;
    }

    [[nodiscard]]
    inline const LinkType& link() const noexcept {
        return link_;
    }

    [[nodiscard]]
    inline bool sync_active() const noexcept {
        return sync_active_;
    }

    [[nodiscard]]
    inline std::size_t pending_conflicts() const noexcept {
        return resolver_.pending();
    }

#ifdef RS_UNIT_TEST
public:
    LinkType& link_for_test() noexcept {
        return link_;
    }
#endif // RS_UNIT_TEST

private:
    Identity identity_;
    EngineConfig config_;
    Directory& directory_;

    LinkType link_;
    state::Store store_;
    state::ConflictResolver resolver_;
    SnapshotStore snapshots_;
    protocol::codec::Decoder decoder_;
    events::EventBus events_;

    std::mt19937 rng_;
    std::string local_id_;

    // Ordering
    struct SenderOrder {
        std::uint64_t sequence{0};    // last accepted
        std::uint64_t timestamp{0};   // newest accepted envelope timestamp
    };
    std::uint64_t sequence_{0};       // last sequence sent
    std::unordered_map<std::string, SenderOrder> last_accepted_;

    // Timers
    bool sync_active_{false};
    time_point next_sync_{};
    lcr::optional<time_point> last_cursor_;

    std::string rx_buffer_;

private:
    [[nodiscard]]
    inline Participant make_local_participant_(Role role, std::uint64_t now) {
        Participant p;
        p.id = local_id_;
        p.user_id = identity_.user_id;
        p.name = identity_.display_name;
        p.role = role;
        p.color = std::string(pick_color(rng_));
        p.is_active = true;
        p.joined_at = now;
        p.last_seen = now;
        return p;
    }

    inline void begin_session_() {
        last_accepted_.clear();
        resolver_.clear();
        last_cursor_.reset();
        sync_active_ = true;
        next_sync_ = Clock::now() + config_.sync_interval;
    }

    inline void persist_() {
        if (!store_.has_session()) {
            return;
        }
        const Error err = snapshots_.save(store_.session());
        if (err != Error::None) {
            RS_WARN("[ENGINE] Snapshot of " << store_.session().id << " not saved (" << to_string(err) << ")");
        }
    }

    inline void announce_and_request_sync_() {
        const Participant* me = store_.session().find_participant(local_id_);
        if (me) {
            protocol::JoinPayload join;
            join.participant = *me;
            send_(std::move(join));
        }
        protocol::SyncPayload request;
        request.request = true;
        send_(std::move(request));
    }

    inline void send_full_sync_() {
        protocol::SyncPayload sync;
        sync.measurements = store_.session().measurements;
        sync.annotations = store_.session().annotations;
        send_(std::move(sync));
    }

    inline void send_(protocol::Payload payload) {
        if (!store_.has_session()) {
            return;
        }
        protocol::Message msg;
        msg.session_id = store_.session().id;
        msg.participant_id = local_id_;
        msg.data = std::move(payload);
        msg.timestamp = Clock::epoch_ms();
        msg.sequence = ++sequence_;
        const auto dispatch = link_.send(protocol::codec::encode(msg));
        RS_TRACE("[ENGINE] " << to_string(msg.type()) << " #" << msg.sequence << " " << to_string(dispatch));
    }

    // -------------------------------------------------------------------------
    // Link signals
    // -------------------------------------------------------------------------

    inline void on_link_signal_(transport::link::Signal sig) {
        switch (sig) {
            case transport::link::Signal::Connected:
                // Catch up on whatever happened while the link was down
                if (link_.epoch() > 1 && store_.has_session()) {
                    RS_INFO("[ENGINE] Link re-established, requesting sync");
                    protocol::SyncPayload request;
                    request.request = true;
                    send_(std::move(request));
                }
                break;

            case transport::link::Signal::ConnectionLost:
                RS_ERROR("[ENGINE] Connection lost after " << link_.attempts() << " attempt(s)");
                events_.publish(events::ConnectionLost{link_.attempts()});
                break;

            case transport::link::Signal::Disconnected:
                RS_WARN("[ENGINE] Link disconnected");
                break;

            case transport::link::Signal::RetryScheduled:
            default:
                break;
        }
    }

    // -------------------------------------------------------------------------
    // Inbound
    // -------------------------------------------------------------------------

    inline void on_raw_message_(std::string_view raw) {
        protocol::Message msg;
        const auto r = decoder_.decode(raw, msg);
        if (r != protocol::codec::Result::Parsed) {
            // Unknown types are already logged by the decoder. Malformed envelopes are dropped.
            if (r != protocol::codec::Result::Ignored) {
                RS_WARN("[ENGINE] " << to_string(Error::DecodeError) << " (" << to_string(r) << "), message dropped");
            }
            return;
        }
        on_message_(msg);
    }

    inline void on_message_(protocol::Message& msg) {
        if (!store_.has_session()) {
            RS_TRACE("[ENGINE] No active session, ignoring " << to_string(msg.type()));
            return;
        }
        if (msg.session_id != store_.session().id) {
            RS_TRACE("[ENGINE] Ignoring " << to_string(msg.type()) << " for session " << msg.session_id);
            return;
        }
        if (msg.participant_id == local_id_) {
            return; // own echo
        }
        // Per-sender ordering. Only a join newer than anything accepted from
        // the sender restarts its numbering; a redelivered join is a replay.
        auto [it, first_seen] = last_accepted_.try_emplace(msg.participant_id);
        SenderOrder& order = it->second;
        const bool restart = msg.type() == protocol::MessageType::Join
                          && (first_seen || msg.timestamp > order.timestamp);
        if (!restart && msg.sequence <= order.sequence) {
            RS_DEBUG("[ENGINE] Dropping " << to_string(msg.type()) << " #" << msg.sequence << " from '"
                     << msg.participant_id << "' (last #" << order.sequence << ")");
            return;
        }
        order.sequence = msg.sequence;
        if (msg.timestamp > order.timestamp) {
            order.timestamp = msg.timestamp;
        }
        const std::uint64_t now = Clock::epoch_ms();
        store_.touch_participant(msg.participant_id, now);

        std::visit([&](auto& payload) { on_payload_(msg, payload, now); }, msg.data);
    }

    inline void on_payload_(const protocol::Message& msg, protocol::JoinPayload& join, std::uint64_t now) {
        if (join.participant.id != msg.participant_id) {
            RS_WARN("[ENGINE] Join for '" << join.participant.id << "' sent by '" << msg.participant_id << "', ignoring");
            return;
        }
        const Participant* before = store_.session().find_participant(join.participant.id);
        const bool was_active = before && before->is_active;
        if (store_.add_participant(join.participant, now) != Error::None) {
            return;
        }
        if (was_active) {
            return; // re-announce after reconnect
        }
        const Participant* joined = store_.session().find_participant(join.participant.id);
        RS_INFO("[ENGINE] " << joined->name << " joined");
        events_.publish(events::ParticipantJoined{*joined});
        events_.publish(events::Notification{"Participant joined", joined->name + " joined the session"});
    }

    inline void on_payload_(const protocol::Message& msg, protocol::LeavePayload&, std::uint64_t now) {
        if (!store_.deactivate_participant(msg.participant_id, now)) {
            return;
        }
        const Participant* left = store_.session().find_participant(msg.participant_id);
        RS_INFO("[ENGINE] " << left->name << " left");
        events_.publish(events::ParticipantLeft{*left});
        events_.publish(events::Notification{"Participant left", left->name + " left the session"});
    }

    inline void on_payload_(const protocol::Message& msg, SharedMeasurement& m, std::uint64_t now) {
        switch (resolver_.admit(store_, msg.participant_id, m, now)) {
            case state::Apply::Inserted:
                events_.publish(events::MeasurementShared{m, events::Origin::Remote});
                events_.publish(events::MeasurementUpdated{m, events::Origin::Remote});
                break;
            case state::Apply::Overwritten:
                events_.publish(events::MeasurementUpdated{m, events::Origin::Remote});
                break;
            case state::Apply::Stale:
            case state::Apply::Duplicate:
            case state::Apply::Rejected:
            default:
                break;
        }
    }

    inline void on_payload_(const protocol::Message& msg, CursorPosition& cursor, std::uint64_t) {
        cursor.participant_id = msg.participant_id;
        store_.set_cursor(cursor);
        events_.publish(events::CursorUpdated{cursor});
    }

    inline void on_payload_(const protocol::Message& msg, Annotation& a, std::uint64_t now) {
        const state::Apply outcome = store_.apply_annotation(msg.participant_id, a, now);
        if (outcome == state::Apply::Inserted || outcome == state::Apply::Overwritten) {
            events_.publish(events::AnnotationUpdated{a, events::Origin::Remote});
        }
    }

    inline void on_payload_(const protocol::Message& msg, protocol::SyncPayload& sync, std::uint64_t now) {
        if (sync.request) {
            if (should_answer_sync_()) {
                RS_DEBUG("[ENGINE] Answering sync request from '" << msg.participant_id << "'");
                send_full_sync_();
            }
            return;
        }
        if (!store_.can_edit(msg.participant_id)) {
            RS_WARN("[ENGINE] Ignoring sync from '" << msg.participant_id << "' (not allowed to edit)");
            return;
        }
        const std::size_t measurements = sync.measurements.size();
        const std::size_t annotations = sync.annotations.size();
        store_.replace_content(std::move(sync.measurements), std::move(sync.annotations), now);
        events_.publish(events::SessionSynced{store_.session().id, measurements, annotations});
    }

    inline void on_payload_(const protocol::Message&, protocol::ChatPayload& chat, std::uint64_t) {
        events_.publish(events::ChatMessage{chat.message, chat.author, chat.color, events::Origin::Remote});
    }

    // The host answers. Without an active host every peer does.
    [[nodiscard]]
    inline bool should_answer_sync_() const noexcept {
        const Session& s = store_.session();
        if (s.host_id == local_id_) {
            return true;
        }
        const Participant* host = s.find_participant(s.host_id);
        return !host || !host->is_active;
    }
};

} // namespace roomsync::core::lifecycle
