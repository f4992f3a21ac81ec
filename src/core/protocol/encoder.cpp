#include "roomsync/core/protocol/codec/encoder.hpp"

#include <variant>
#include <vector>
#include <algorithm>

#include "lcr/json.hpp"


namespace roomsync::core::protocol::codec {

namespace {

using lcr::json::append;
using lcr::json::append_key;
using lcr::json::append_string;

// ---------------------------------------------------------------------------
// Value writers
// ---------------------------------------------------------------------------

void write_point(std::string& out, const Point3& p) {
    out += '{';
    append_key(out, "x"); append(out, p.x); out += ',';
    append_key(out, "y"); append(out, p.y); out += ',';
    append_key(out, "z"); append(out, p.z);
    out += '}';
}

void write_participant(std::string& out, const Participant& p) {
    out += '{';
    append_key(out, "id");       append_string(out, p.id);           out += ',';
    append_key(out, "userId");   append_string(out, p.user_id);      out += ',';
    append_key(out, "name");     append_string(out, p.name);         out += ',';
    append_key(out, "role");     append_string(out, to_string(p.role)); out += ',';
    append_key(out, "color");    append_string(out, p.color);        out += ',';
    append_key(out, "isActive"); append(out, p.is_active);           out += ',';
    append_key(out, "joinedAt"); append(out, p.joined_at);           out += ',';
    append_key(out, "lastSeen"); append(out, p.last_seen);
    out += '}';
}

void write_measurement(std::string& out, const SharedMeasurement& m) {
    out += '{';
    append_key(out, "id");       append_string(out, m.id);        out += ',';
    append_key(out, "authorId"); append_string(out, m.author_id); out += ',';
    append_key(out, "points");
    out += '[';
    for (std::size_t i = 0; i < m.points.size(); ++i) {
        if (i) out += ',';
        write_point(out, m.points[i]);
    }
    out += "],";
    append_key(out, "distance"); append(out, m.distance);    out += ',';
    append_key(out, "unit");     append_string(out, m.unit); out += ',';
    if (m.label.has()) {
        append_key(out, "label"); append_string(out, m.label.value()); out += ',';
    }
    append_key(out, "timestamp"); append(out, m.timestamp); out += ',';
    append_key(out, "version");   append(out, m.version);   out += ',';
    append_key(out, "locked");    append(out, m.locked);
    out += '}';
}

void write_cursor(std::string& out, const CursorPosition& c) {
    out += '{';
    append_key(out, "participantId"); append_string(out, c.participant_id); out += ',';
    append_key(out, "x"); append(out, c.x); out += ',';
    append_key(out, "y"); append(out, c.y); out += ',';
    append_key(out, "z"); append(out, c.z); out += ',';
    append_key(out, "timestamp"); append(out, c.timestamp);
    out += '}';
}

void write_annotation(std::string& out, const Annotation& a) {
    out += '{';
    append_key(out, "id");       append_string(out, a.id);               out += ',';
    append_key(out, "authorId"); append_string(out, a.author_id);        out += ',';
    append_key(out, "type");     append_string(out, to_string(a.type));  out += ',';
    append_key(out, "position"); write_point(out, a.position);           out += ',';
    append_key(out, "content");  append_string(out, a.content);          out += ',';
    append_key(out, "style");
    out += '{';
    append_key(out, "color");       append_string(out, a.style.color); out += ',';
    append_key(out, "fontSize");    append(out, a.style.font_size);    out += ',';
    append_key(out, "strokeWidth"); append(out, a.style.stroke_width);
    out += "},";
    append_key(out, "timestamp"); append(out, a.timestamp);
    out += '}';
}

void write_settings(std::string& out, const Settings& s) {
    out += '{';
    append_key(out, "allowEditing");    append(out, s.allow_editing);    out += ',';
    append_key(out, "requireApproval"); append(out, s.require_approval); out += ',';
    append_key(out, "autoSync");        append(out, s.auto_sync);        out += ',';
    append_key(out, "maxParticipants"); append(out, static_cast<std::uint64_t>(s.max_participants)); out += ',';
    append_key(out, "expiresIn");       append(out, static_cast<std::uint64_t>(s.expires_in));
    out += '}';
}

template<class T, class Writer>
void write_array(std::string& out, const std::vector<T>& items, Writer writer) {
    out += '[';
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i) out += ',';
        writer(out, items[i]);
    }
    out += ']';
}

// ---------------------------------------------------------------------------
// Payload writers (one per MessageType)
// ---------------------------------------------------------------------------

struct PayloadWriter {
    std::string& out;

    void operator()(const JoinPayload& p) const {
        out += '{';
        append_key(out, "participant");
        write_participant(out, p.participant);
        if (p.room_code.has()) {
            out += ',';
            append_key(out, "roomCode");
            append_string(out, p.room_code.value());
        }
        out += '}';
    }

    void operator()(const LeavePayload&) const {
        out += "null";
    }

    void operator()(const SharedMeasurement& m) const {
        write_measurement(out, m);
    }

    void operator()(const CursorPosition& c) const {
        write_cursor(out, c);
    }

    void operator()(const Annotation& a) const {
        write_annotation(out, a);
    }

    void operator()(const SyncPayload& p) const {
        if (p.request) {
            out += "{\"request\":true}";
            return;
        }
        out += '{';
        append_key(out, "measurements");
        write_array(out, p.measurements, write_measurement);
        out += ',';
        append_key(out, "annotations");
        write_array(out, p.annotations, write_annotation);
        out += '}';
    }

    void operator()(const ChatPayload& p) const {
        out += '{';
        append_key(out, "message"); append_string(out, p.message); out += ',';
        append_key(out, "author");  append_string(out, p.author);  out += ',';
        append_key(out, "color");   append_string(out, p.color);
        out += '}';
    }
};

} // namespace


void encode_to(std::string& out, const Message& msg) {
    out += '{';
    append_key(out, "type");          append_string(out, to_string(msg.type())); out += ',';
    append_key(out, "sessionId");     append_string(out, msg.session_id);         out += ',';
    append_key(out, "participantId"); append_string(out, msg.participant_id);     out += ',';
    append_key(out, "data");
    std::visit(PayloadWriter{out}, msg.data);
    out += ',';
    append_key(out, "timestamp"); append(out, msg.timestamp); out += ',';
    append_key(out, "sequence");  append(out, msg.sequence);
    out += '}';
}

std::string encode(const Message& msg) {
    std::string out;
    out.reserve(256);
    encode_to(out, msg);
    return out;
}

std::string encode_session(const Session& s) {
    std::string out;
    out.reserve(1024);
    out += '{';
    append_key(out, "id");       append_string(out, s.id);        out += ',';
    append_key(out, "roomCode"); append_string(out, s.room_code); out += ',';
    append_key(out, "hostId");   append_string(out, s.host_id);   out += ',';
    append_key(out, "participants");
    write_array(out, s.participants, write_participant);
    out += ',';
    append_key(out, "measurements");
    write_array(out, s.measurements, write_measurement);
    out += ',';
    // Cursors are written sorted by participant id so equal sessions encode identically
    std::vector<const CursorPosition*> cursors;
    cursors.reserve(s.cursors.size());
    for (const auto& [id, c] : s.cursors) {
        cursors.push_back(&c);
    }
    std::sort(cursors.begin(), cursors.end(),
        [](const CursorPosition* a, const CursorPosition* b) { return a->participant_id < b->participant_id; });
    append_key(out, "cursors");
    out += '[';
    for (std::size_t i = 0; i < cursors.size(); ++i) {
        if (i) out += ',';
        write_cursor(out, *cursors[i]);
    }
    out += "],";
    append_key(out, "annotations");
    write_array(out, s.annotations, write_annotation);
    out += ',';
    append_key(out, "createdAt"); append(out, s.created_at); out += ',';
    append_key(out, "updatedAt"); append(out, s.updated_at); out += ',';
    append_key(out, "settings");
    write_settings(out, s.settings);
    out += '}';
    return out;
}

} // namespace roomsync::core::protocol::codec
