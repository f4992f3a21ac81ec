#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>


namespace roomsync::core::lifecycle::ids {

// Process-wide counter shared by every generated id
[[nodiscard]] inline std::uint64_t next_serial() noexcept {
    static std::atomic<std::uint64_t> serial{0};
    return serial.fetch_add(1, std::memory_order_relaxed) + 1;
}

// participant_<userId>
[[nodiscard]] inline std::string participant_id(std::string_view user_id) {
    std::string id("participant_");
    id.append(user_id);
    return id;
}

// session_<epochMs>_<n>
[[nodiscard]] inline std::string session_id(std::uint64_t now_ms) {
    return "session_" + std::to_string(now_ms) + "_" + std::to_string(next_serial());
}

// annotation_<epochMs>_<n>
[[nodiscard]] inline std::string annotation_id(std::uint64_t now_ms) {
    return "annotation_" + std::to_string(now_ms) + "_" + std::to_string(next_serial());
}

} // namespace roomsync::core::lifecycle::ids
