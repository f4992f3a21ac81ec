#include "roomsync/core/protocol/codec/decoder.hpp"

#include <cstdint>
#include <string>
#include <vector>

#include "roomsync/core/protocol/codec/helpers.hpp"
#include "lcr/log/logger.hpp"


namespace roomsync::core::protocol::codec {

namespace {

using simdjson::dom::element;
using simdjson::dom::array;

// Evaluates a helper call and propagates any non-Ok result
#define RS_CODEC_TRY(expr)                  \
    do {                                    \
        const Result rs_r_ = (expr);        \
        if (rs_r_ != Result::Ok) {          \
            return rs_r_;                   \
        }                                   \
    } while (0)

// ---------------------------------------------------------------------------
// Entity parsers
// ---------------------------------------------------------------------------

[[nodiscard]]
Result parse_point(const element& el, Point3& out) noexcept {
    RS_CODEC_TRY(helper::parse_double_required(el, "x", out.x));
    RS_CODEC_TRY(helper::parse_double_required(el, "y", out.y));
    RS_CODEC_TRY(helper::parse_double_required(el, "z", out.z));
    return Result::Ok;
}

[[nodiscard]]
Result parse_participant(const element& el, Participant& out) noexcept {
    RS_CODEC_TRY(helper::parse_string_required(el, "id", out.id));
    RS_CODEC_TRY(helper::parse_string_required(el, "userId", out.user_id));
    RS_CODEC_TRY(helper::parse_string_required(el, "name", out.name));
    std::string role;
    RS_CODEC_TRY(helper::parse_string_required(el, "role", role));
    out.role = to_role_enum(role);
    if (out.role == Role::Unknown) {
        RS_WARN("[CODEC] Unknown participant role '" << role << "'");
        return Result::InvalidValue;
    }
    RS_CODEC_TRY(helper::parse_string_required(el, "color", out.color));
    RS_CODEC_TRY(helper::parse_bool_required(el, "isActive", out.is_active));
    RS_CODEC_TRY(helper::parse_uint64_required(el, "joinedAt", out.joined_at));
    RS_CODEC_TRY(helper::parse_uint64_required(el, "lastSeen", out.last_seen));
    if (out.id.empty()) {
        return Result::InvalidValue;
    }
    return Result::Ok;
}

[[nodiscard]]
Result parse_measurement(const element& el, SharedMeasurement& out) noexcept {
    RS_CODEC_TRY(helper::parse_string_required(el, "id", out.id));
    RS_CODEC_TRY(helper::parse_string_required(el, "authorId", out.author_id));
    array points;
    RS_CODEC_TRY(helper::parse_array_required(el, "points", points));
    out.points.clear();
    for (element p : points) {
        Point3 pt;
        RS_CODEC_TRY(parse_point(p, pt));
        out.points.push_back(pt);
    }
    RS_CODEC_TRY(helper::parse_double_required(el, "distance", out.distance));
    RS_CODEC_TRY(helper::parse_string_required(el, "unit", out.unit));
    RS_CODEC_TRY(helper::parse_string_optional(el, "label", out.label));
    RS_CODEC_TRY(helper::parse_uint64_required(el, "timestamp", out.timestamp));
    RS_CODEC_TRY(helper::parse_uint64_required(el, "version", out.version));
    RS_CODEC_TRY(helper::parse_bool_required(el, "locked", out.locked));
    if (out.id.empty()) {
        RS_WARN("[CODEC] Measurement without id");
        return Result::InvalidValue;
    }
    if (out.version == 0) {
        RS_WARN("[CODEC] Measurement '" << out.id << "' carries version 0");
        return Result::InvalidValue;
    }
    return Result::Ok;
}

[[nodiscard]]
Result parse_cursor(const element& el, CursorPosition& out) noexcept {
    RS_CODEC_TRY(helper::parse_string_required(el, "participantId", out.participant_id));
    RS_CODEC_TRY(helper::parse_double_required(el, "x", out.x));
    RS_CODEC_TRY(helper::parse_double_required(el, "y", out.y));
    RS_CODEC_TRY(helper::parse_double_required(el, "z", out.z));
    RS_CODEC_TRY(helper::parse_uint64_required(el, "timestamp", out.timestamp));
    return Result::Ok;
}

[[nodiscard]]
Result parse_annotation(const element& el, Annotation& out) noexcept {
    RS_CODEC_TRY(helper::parse_string_required(el, "id", out.id));
    RS_CODEC_TRY(helper::parse_string_required(el, "authorId", out.author_id));
    std::string type;
    RS_CODEC_TRY(helper::parse_string_required(el, "type", type));
    out.type = to_annotation_type_enum(type);
    if (out.type == AnnotationType::Unknown) {
        RS_WARN("[CODEC] Unknown annotation type '" << type << "'");
        return Result::InvalidValue;
    }
    element position;
    RS_CODEC_TRY(helper::parse_object_required(el, "position", position));
    RS_CODEC_TRY(parse_point(position, out.position));
    RS_CODEC_TRY(helper::parse_string_required(el, "content", out.content));
    element style;
    RS_CODEC_TRY(helper::parse_object_required(el, "style", style));
    RS_CODEC_TRY(helper::parse_string_required(style, "color", out.style.color));
    // fontSize / strokeWidth are optional on the wire and fall back to defaults
    lcr::optional<double> font_size;
    lcr::optional<double> stroke_width;
    RS_CODEC_TRY(helper::parse_double_optional(style, "fontSize", font_size));
    RS_CODEC_TRY(helper::parse_double_optional(style, "strokeWidth", stroke_width));
    out.style.font_size = font_size.value_or(DEFAULT_FONT_SIZE);
    out.style.stroke_width = stroke_width.value_or(DEFAULT_STROKE_WIDTH);
    RS_CODEC_TRY(helper::parse_uint64_required(el, "timestamp", out.timestamp));
    if (out.id.empty()) {
        return Result::InvalidValue;
    }
    return Result::Ok;
}

[[nodiscard]]
Result parse_settings(const element& el, Settings& out) noexcept {
    RS_CODEC_TRY(helper::parse_bool_required(el, "allowEditing", out.allow_editing));
    RS_CODEC_TRY(helper::parse_bool_required(el, "requireApproval", out.require_approval));
    RS_CODEC_TRY(helper::parse_bool_required(el, "autoSync", out.auto_sync));
    std::uint64_t max_participants{0};
    std::uint64_t expires_in{0};
    RS_CODEC_TRY(helper::parse_uint64_required(el, "maxParticipants", max_participants));
    RS_CODEC_TRY(helper::parse_uint64_required(el, "expiresIn", expires_in));
    if (max_participants == 0 || max_participants > UINT32_MAX || expires_in > UINT32_MAX) {
        return Result::InvalidValue;
    }
    out.max_participants = static_cast<std::uint32_t>(max_participants);
    out.expires_in = static_cast<std::uint32_t>(expires_in);
    return Result::Ok;
}

template<class T, class Parser>
[[nodiscard]]
Result parse_list(const element& parent, const char* key, std::vector<T>& out, Parser parser) noexcept {
    array items;
    RS_CODEC_TRY(helper::parse_array_required(parent, key, items));
    out.clear();
    for (element item : items) {
        T value;
        RS_CODEC_TRY(parser(item, value));
        out.push_back(std::move(value));
    }
    return Result::Ok;
}

// ---------------------------------------------------------------------------
// Payload parsers (one per MessageType)
// ---------------------------------------------------------------------------

[[nodiscard]]
Result parse_payload(MessageType type, const element& data, Payload& out) noexcept {
    switch (type) {
        case MessageType::Join: {
            JoinPayload p;
            element participant;
            RS_CODEC_TRY(helper::parse_object_required(data, "participant", participant));
            RS_CODEC_TRY(parse_participant(participant, p.participant));
            RS_CODEC_TRY(helper::parse_string_optional(data, "roomCode", p.room_code));
            out = std::move(p);
            return Result::Ok;
        }
        case MessageType::Leave:
            // data is null for leave, anything else is tolerated and ignored
            out = LeavePayload{};
            return Result::Ok;

        case MessageType::Measurement: {
            SharedMeasurement m;
            RS_CODEC_TRY(parse_measurement(data, m));
            out = std::move(m);
            return Result::Ok;
        }
        case MessageType::Cursor: {
            CursorPosition c;
            RS_CODEC_TRY(parse_cursor(data, c));
            out = std::move(c);
            return Result::Ok;
        }
        case MessageType::Annotation: {
            Annotation a;
            RS_CODEC_TRY(parse_annotation(data, a));
            out = std::move(a);
            return Result::Ok;
        }
        case MessageType::Sync: {
            SyncPayload p;
            lcr::optional<bool> request;
            RS_CODEC_TRY(helper::parse_bool_optional(data, "request", request));
            if (request.value_or(false)) {
                p.request = true;
                out = std::move(p);
                return Result::Ok;
            }
            RS_CODEC_TRY(parse_list(data, "measurements", p.measurements, parse_measurement));
            RS_CODEC_TRY(parse_list(data, "annotations", p.annotations, parse_annotation));
            out = std::move(p);
            return Result::Ok;
        }
        case MessageType::Chat: {
            ChatPayload p;
            RS_CODEC_TRY(helper::parse_string_required(data, "message", p.message));
            RS_CODEC_TRY(helper::parse_string_required(data, "author", p.author));
            RS_CODEC_TRY(helper::parse_string_required(data, "color", p.color));
            out = std::move(p);
            return Result::Ok;
        }
        default:
            return Result::Ignored;
    }
}

} // namespace


Result Decoder::decode(std::string_view raw, Message& out) noexcept {
    element root;
    auto error = parser_.parse(raw.data(), raw.size()).get(root);
    if (error) {
        RS_WARN("[CODEC] JSON parse error: " << error << " in message: " << raw);
        return Result::InvalidJson;
    }
    if (helper::require_object(root) != Result::Ok) {
        RS_WARN("[CODEC] Envelope is not an object: " << raw);
        return Result::InvalidSchema;
    }
    // 1) Type dispatch
    std::string type_name;
    if (helper::parse_string_required(root, "type", type_name) != Result::Ok) {
        RS_WARN("[CODEC] Missing 'type' in message: " << raw);
        return Result::InvalidSchema;
    }
    const MessageType type = to_message_type_enum(type_name);
    if (type == MessageType::Unknown) {
        RS_WARN("[CODEC] Dropping message with unknown type '" << type_name << "'");
        return Result::Ignored;
    }
    // 2) Envelope fields
    Message msg;
    Result r = helper::parse_string_required(root, "sessionId", msg.session_id);
    if (r == Result::Ok) r = helper::parse_string_required(root, "participantId", msg.participant_id);
    if (r == Result::Ok) r = helper::parse_uint64_required(root, "timestamp", msg.timestamp);
    if (r == Result::Ok) r = helper::parse_uint64_required(root, "sequence", msg.sequence);
    if (r != Result::Ok) {
        RS_WARN("[CODEC] Invalid envelope (" << to_string(r) << "): " << raw);
        return r;
    }
    if (msg.session_id.empty() || msg.participant_id.empty() || msg.sequence == 0) {
        RS_WARN("[CODEC] Invalid envelope values: " << raw);
        return Result::InvalidValue;
    }
    // 3) Payload
    auto data = root["data"];
    if (data.error()) {
        RS_WARN("[CODEC] Missing 'data' in " << type_name << " message");
        return Result::InvalidSchema;
    }
    r = parse_payload(type, data.value_unsafe(), msg.data);
    if (r != Result::Ok) {
        RS_WARN("[CODEC] Invalid " << type_name << " payload (" << to_string(r) << "): " << raw);
        return r;
    }
    out = std::move(msg);
    return Result::Parsed;
}

Result Decoder::decode_session(std::string_view raw, Session& out) noexcept {
    element root;
    auto error = parser_.parse(raw.data(), raw.size()).get(root);
    if (error) {
        RS_WARN("[CODEC] Session document parse error: " << error);
        return Result::InvalidJson;
    }
    Session s;
    Result r = [&]() noexcept -> Result {
        RS_CODEC_TRY(helper::require_object(root));
        RS_CODEC_TRY(helper::parse_string_required(root, "id", s.id));
        RS_CODEC_TRY(helper::parse_string_required(root, "roomCode", s.room_code));
        RS_CODEC_TRY(helper::parse_string_required(root, "hostId", s.host_id));
        RS_CODEC_TRY(parse_list(root, "participants", s.participants, parse_participant));
        RS_CODEC_TRY(parse_list(root, "measurements", s.measurements, parse_measurement));
        std::vector<CursorPosition> cursors;
        RS_CODEC_TRY(parse_list(root, "cursors", cursors, parse_cursor));
        for (auto& c : cursors) {
            std::string key = c.participant_id;
            s.cursors.insert_or_assign(std::move(key), std::move(c));
        }
        RS_CODEC_TRY(parse_list(root, "annotations", s.annotations, parse_annotation));
        RS_CODEC_TRY(helper::parse_uint64_required(root, "createdAt", s.created_at));
        RS_CODEC_TRY(helper::parse_uint64_required(root, "updatedAt", s.updated_at));
        element settings;
        RS_CODEC_TRY(helper::parse_object_required(root, "settings", settings));
        RS_CODEC_TRY(parse_settings(settings, s.settings));
        return Result::Ok;
    }();
    if (r != Result::Ok) {
        RS_WARN("[CODEC] Invalid session document (" << to_string(r) << ")");
        return r;
    }
    if (s.id.empty() || s.updated_at < s.created_at) {
        RS_WARN("[CODEC] Session document violates invariants");
        return Result::InvalidValue;
    }
    out = std::move(s);
    return Result::Parsed;
}

#undef RS_CODEC_TRY

} // namespace roomsync::core::protocol::codec
