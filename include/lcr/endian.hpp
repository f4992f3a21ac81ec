#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <type_traits>


// -------------------------------------------------------------
// Little-endian byte serialization helpers
// -------------------------------------------------------------
// Canonical on-disk format: LITTLE-ENDIAN, independent of the host.
// Values are written and read byte by byte, so no alignment or
// host byte order assumptions leak into persisted files.
// -------------------------------------------------------------

namespace lcr {

// Appends the little-endian encoding of value to out
template <typename T>
inline void append_le(std::string& out, T value) {
    static_assert(std::is_unsigned_v<T>, "append_le expects an unsigned integer");
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        out += static_cast<char>(static_cast<std::uint8_t>(value >> (8 * i)));
    }
}

// Reads a little-endian value starting at data (caller guarantees sizeof(T) bytes)
template <typename T>
[[nodiscard]] inline T read_le(const char* data) noexcept {
    static_assert(std::is_unsigned_v<T>, "read_le expects an unsigned integer");
    T value = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<T>(static_cast<std::uint8_t>(data[i])) << (8 * i);
    }
    return value;
}

} // namespace lcr
