#pragma once

#include <random>
#include <string>
#include <string_view>


namespace roomsync::core::lifecycle {

constexpr std::size_t ROOM_CODE_LENGTH = 6;
constexpr std::string_view ROOM_CODE_ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

// Six characters drawn uniformly from A-Z0-9
template<class Rng>
[[nodiscard]] inline std::string generate_room_code(Rng& rng) {
    std::uniform_int_distribution<std::size_t> dist(0, ROOM_CODE_ALPHABET.size() - 1);
    std::string code(ROOM_CODE_LENGTH, '\0');
    for (auto& c : code) {
        c = ROOM_CODE_ALPHABET[dist(rng)];
    }
    return code;
}

[[nodiscard]] inline std::string generate_room_code() {
    thread_local std::mt19937 rng{std::random_device{}()};
    return generate_room_code(rng);
}

// ^[A-Z0-9]{6}$ (case-sensitive)
[[nodiscard]] inline constexpr bool is_valid_room_code(std::string_view code) noexcept {
    if (code.size() != ROOM_CODE_LENGTH) {
        return false;
    }
    for (char c : code) {
        const bool upper = (c >= 'A' && c <= 'Z');
        const bool digit = (c >= '0' && c <= '9');
        if (!upper && !digit) {
            return false;
        }
    }
    return true;
}

} // namespace roomsync::core::lifecycle
