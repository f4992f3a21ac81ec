#pragma once

#include <cstdint>
#include <string_view>


namespace roomsync::core {

// ===============================================================
// PARTICIPANT ROLE ENUM
// ===============================================================
enum class Role : std::uint8_t {
    Host,
    Editor,
    Viewer,
    Unknown
};

[[nodiscard]] inline constexpr std::string_view to_string(Role r) noexcept {
    switch (r) {
        case Role::Host:   return "host";
        case Role::Editor: return "editor";
        case Role::Viewer: return "viewer";
        default:           return "unknown";
    }
}

[[nodiscard]] inline constexpr Role to_role_enum(std::string_view s) noexcept {
    if (s == "host")   return Role::Host;
    if (s == "editor") return Role::Editor;
    if (s == "viewer") return Role::Viewer;
    return Role::Unknown;
}

} // namespace roomsync::core
