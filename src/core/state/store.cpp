#include "roomsync/core/state/store.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

#include "lcr/log/logger.hpp"


namespace roomsync::core::state {

// ============================================================================
// Lifecycle
// ============================================================================

Error Store::install(Session session) {
    std::unordered_set<std::string> ids;
    std::size_t hosts = 0;
    for (const auto& p : session.participants) {
        if (!ids.insert(p.id).second) {
            RS_ERROR("[STORE] Refusing session " << session.id << ": duplicate participant '" << p.id << "'");
            return Error::InvalidArgument;
        }
        if (p.is_host()) {
            ++hosts;
        }
    }
    if (hosts > 1) {
        RS_ERROR("[STORE] Refusing session " << session.id << ": " << hosts << " hosts");
        return Error::InvalidArgument;
    }
    if (session.updated_at < session.created_at) {
        session.updated_at = session.created_at;
    }
    session_ = std::move(session);
    active_ = true;
    RS_DEBUG("[STORE] Installed " << session_);
    return Error::None;
}

void Store::clear() noexcept {
    session_ = Session{};
    active_ = false;
}

// ============================================================================
// Roster
// ============================================================================

Error Store::add_participant(Participant participant, std::uint64_t now_ms) {
    if (!active_) {
        return Error::NoActiveSession;
    }
    if (participant.id.empty()) {
        return Error::InvalidArgument;
    }
    if (participant.is_host() && !session_.host_id.empty() && session_.host_id != participant.id) {
        RS_WARN("[STORE] Participant '" << participant.id << "' claims host, session host is '"
                << session_.host_id << "'. Demoting to editor.");
        participant.role = Role::Editor;
    }
    participant.last_seen = now_ms;
    if (Participant* existing = find_participant_(participant.id)) {
        existing->is_active = true;
        existing->name = std::move(participant.name);
        if (existing->color.empty()) {
            existing->color = std::move(participant.color);
        }
        existing->last_seen = now_ms;
        if (!existing->is_host()) {
            existing->role = participant.role;
        }
        RS_DEBUG("[STORE] Reactivated " << *existing);
    }
    else {
        participant.is_active = true;
        if (participant.joined_at == 0) {
            participant.joined_at = now_ms;
        }
        if (participant.is_host() && session_.host_id.empty()) {
            session_.host_id = participant.id;
        }
        RS_DEBUG("[STORE] Added " << participant);
        session_.participants.push_back(std::move(participant));
    }
    touch_(now_ms);
    return Error::None;
}

bool Store::deactivate_participant(const std::string& participant_id, std::uint64_t now_ms) {
    Participant* p = active_ ? find_participant_(participant_id) : nullptr;
    if (!p || !p->is_active) {
        return false;
    }
    p->is_active = false;
    p->last_seen = now_ms;
    session_.cursors.erase(participant_id);
    touch_(now_ms);
    RS_DEBUG("[STORE] Deactivated " << *p);
    return true;
}

void Store::touch_participant(const std::string& participant_id, std::uint64_t now_ms) noexcept {
    if (Participant* p = find_participant_(participant_id)) {
        p->last_seen = std::max(p->last_seen, now_ms);
    }
}

std::size_t Store::active_participants() const noexcept {
    return session_.active_participants();
}

Role Store::role_of(const std::string& participant_id) const noexcept {
    const Participant* p = session_.find_participant(participant_id);
    return p ? p->role : Role::Unknown;
}

bool Store::can_edit(const std::string& participant_id) const noexcept {
    Role role = role_of(participant_id);
    if (role == Role::Unknown) {
        role = Role::Editor;
    }
    if (role == Role::Viewer) {
        return false;
    }
    return session_.settings.allow_editing || role == Role::Host;
}

// ============================================================================
// Measurements
// ============================================================================

Error Store::share_measurement(const std::string& author_id, const MeasurementInput& input,
                               std::uint64_t now_ms, SharedMeasurement& out) {
    if (!active_) {
        return Error::NoActiveSession;
    }
    if (!can_edit(author_id)) {
        RS_WARN("[STORE] '" << author_id << "' may not share measurements");
        return Error::PermissionDenied;
    }
    if (input.id.empty() || find_measurement_(input.id)) {
        RS_WARN("[STORE] Measurement id '" << input.id << "' is empty or already shared");
        return Error::InvalidArgument;
    }
    SharedMeasurement m;
    m.id = input.id;
    m.author_id = author_id;
    m.points = input.points;
    m.distance = input.distance;
    m.unit = input.unit;
    m.label = input.label;
    m.timestamp = now_ms;
    m.version = 1;
    m.locked = false;
    session_.measurements.push_back(m);
    touch_(now_ms);
    out = std::move(m);
    return Error::None;
}

Error Store::update_measurement(const std::string& editor_id, const std::string& measurement_id,
                                const MeasurementPatch& patch, std::uint64_t now_ms, SharedMeasurement& out) {
    if (!active_) {
        return Error::NoActiveSession;
    }
    SharedMeasurement* local = find_measurement_(measurement_id);
    if (!local || patch.empty()) {
        RS_WARN("[STORE] Nothing to update for measurement '" << measurement_id << "'");
        return Error::InvalidArgument;
    }
    const bool host = role_of(editor_id) == Role::Host;
    if (!can_edit(editor_id)) {
        return Error::PermissionDenied;
    }
    if ((local->locked || patch.locked.has()) && !host) {
        RS_WARN("[STORE] '" << editor_id << "' may not modify locked state of measurement '" << measurement_id << "'");
        return Error::PermissionDenied;
    }
    // Build the next revision aside and commit it in one assignment
    SharedMeasurement next = *local;
    if (patch.points.has())   next.points = patch.points.value();
    if (patch.distance.has()) next.distance = patch.distance.value();
    if (patch.unit.has())     next.unit = patch.unit.value();
    if (patch.label.has())    next.label = patch.label.value();
    if (patch.locked.has())   next.locked = patch.locked.value();
    next.version = local->version + 1;
    next.timestamp = now_ms;
    *local = next;
    touch_(now_ms);
    out = std::move(next);
    return Error::None;
}

Apply Store::apply_measurement(const std::string& sender_id, const SharedMeasurement& incoming, std::uint64_t now_ms) {
    if (!active_ || !can_edit(sender_id)) {
        RS_WARN("[STORE] Rejected measurement '" << incoming.id << "' from '" << sender_id << "'");
        return Apply::Rejected;
    }
    SharedMeasurement* local = find_measurement_(incoming.id);
    if (!local) {
        session_.measurements.push_back(incoming);
        touch_(now_ms);
        return Apply::Inserted;
    }
    if (incoming.version <= local->version) {
        if (incoming == *local) {
            return Apply::Duplicate;
        }
        RS_DEBUG("[STORE] Stale measurement '" << incoming.id << "' v" << incoming.version
                 << " (local v" << local->version << ")");
        return Apply::Stale;
    }
    if (local->locked && role_of(sender_id) != Role::Host) {
        RS_WARN("[STORE] Rejected update of locked measurement '" << incoming.id << "' from '" << sender_id << "'");
        return Apply::Rejected;
    }
    *local = incoming;
    touch_(now_ms);
    return Apply::Overwritten;
}

bool Store::rebase_measurement(const std::string& measurement_id, std::uint64_t new_version,
                               std::uint64_t now_ms, SharedMeasurement& out) {
    SharedMeasurement* local = active_ ? find_measurement_(measurement_id) : nullptr;
    if (!local || new_version <= local->version) {
        return false;
    }
    local->version = new_version;
    local->timestamp = now_ms;
    touch_(now_ms);
    out = *local;
    return true;
}

const SharedMeasurement* Store::find_measurement(const std::string& measurement_id) const noexcept {
    for (const auto& m : session_.measurements) {
        if (m.id == measurement_id) {
            return &m;
        }
    }
    return nullptr;
}

// ============================================================================
// Annotations
// ============================================================================

Error Store::add_annotation(const std::string& author_id, Annotation annotation, std::uint64_t now_ms) {
    if (!active_) {
        return Error::NoActiveSession;
    }
    if (!can_edit(author_id)) {
        RS_WARN("[STORE] '" << author_id << "' may not annotate");
        return Error::PermissionDenied;
    }
    if (annotation.id.empty() || annotation.type == AnnotationType::Unknown
        || (annotation.type == AnnotationType::Text && annotation.content.empty())) {
        return Error::InvalidArgument;
    }
    for (const auto& a : session_.annotations) {
        if (a.id == annotation.id) {
            return Error::InvalidArgument;
        }
    }
    annotation.author_id = author_id;
    session_.annotations.push_back(std::move(annotation));
    touch_(now_ms);
    return Error::None;
}

Apply Store::apply_annotation(const std::string& sender_id, const Annotation& incoming, std::uint64_t now_ms) {
    if (!active_ || !can_edit(sender_id)) {
        RS_WARN("[STORE] Rejected annotation '" << incoming.id << "' from '" << sender_id << "'");
        return Apply::Rejected;
    }
    for (auto& a : session_.annotations) {
        if (a.id == incoming.id) {
            if (a == incoming) {
                return Apply::Duplicate;
            }
            a = incoming;
            touch_(now_ms);
            return Apply::Overwritten;
        }
    }
    session_.annotations.push_back(incoming);
    touch_(now_ms);
    return Apply::Inserted;
}

// ============================================================================
// Cursors & sync
// ============================================================================

void Store::set_cursor(const CursorPosition& cursor) {
    if (!active_) {
        return;
    }
    session_.cursors[cursor.participant_id] = cursor;
}

void Store::replace_content(std::vector<SharedMeasurement> measurements, std::vector<Annotation> annotations,
                            std::uint64_t now_ms) {
    if (!active_) {
        return;
    }
    session_.measurements = std::move(measurements);
    session_.annotations = std::move(annotations);
    touch_(now_ms);
}

// ============================================================================
// Internals
// ============================================================================

Participant* Store::find_participant_(const std::string& participant_id) noexcept {
    for (auto& p : session_.participants) {
        if (p.id == participant_id) {
            return &p;
        }
    }
    return nullptr;
}

SharedMeasurement* Store::find_measurement_(const std::string& measurement_id) noexcept {
    for (auto& m : session_.measurements) {
        if (m.id == measurement_id) {
            return &m;
        }
    }
    return nullptr;
}

} // namespace roomsync::core::state
