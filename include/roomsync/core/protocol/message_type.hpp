#pragma once

#include <cstdint>
#include <string_view>


namespace roomsync::core::protocol {

// ===============================================================
// MESSAGE TYPE ENUM
// ===============================================================
// Order matches the alternatives of protocol::Payload.
enum class MessageType : std::uint8_t {
    Join,
    Leave,
    Measurement,
    Cursor,
    Annotation,
    Sync,
    Chat,
    Unknown
};

// ===============================================================
// 1) Standard conversion: enum → string
// ===============================================================
[[nodiscard]] inline constexpr std::string_view to_string(MessageType t) noexcept {
    switch (t) {
        case MessageType::Join:        return "join";
        case MessageType::Leave:       return "leave";
        case MessageType::Measurement: return "measurement";
        case MessageType::Cursor:      return "cursor";
        case MessageType::Annotation:  return "annotation";
        case MessageType::Sync:        return "sync";
        case MessageType::Chat:        return "chat";
        default:                       return "unknown";
    }
}

// ===============================================================
// 2) Standard conversion: string → enum
// ===============================================================
[[nodiscard]] inline constexpr MessageType to_message_type_enum(std::string_view s) noexcept {
    switch (s.size()) {
        case 4: // join, sync, chat
            if (s == "join") return MessageType::Join;
            if (s == "sync") return MessageType::Sync;
            if (s == "chat") return MessageType::Chat;
            break;
        case 5: // leave
            if (s == "leave") return MessageType::Leave;
            break;
        case 6: // cursor
            if (s == "cursor") return MessageType::Cursor;
            break;
        case 10: // annotation
            if (s == "annotation") return MessageType::Annotation;
            break;
        case 11: // measurement
            if (s == "measurement") return MessageType::Measurement;
            break;
    }
    return MessageType::Unknown;
}

} // namespace roomsync::core::protocol
