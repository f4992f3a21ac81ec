#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>


namespace lcr {
namespace system {

// -----------------------------------------------------------------------------
// ClockConcept
// -----------------------------------------------------------------------------
//
// Compile-time time source used by poll-driven components.
//
//   now()      → monotonic time point, drives timers (retry, throttle, sync)
//   epoch_ms() → wall clock in milliseconds since the Unix epoch, used for
//                timestamps that leave the process (wire, snapshots, expiry)
//
// Both are static so a clock is a policy type, never an object.
// -----------------------------------------------------------------------------
template<class C>
concept ClockConcept = requires {
    { C::now() } -> std::same_as<std::chrono::steady_clock::time_point>;
    { C::epoch_ms() } -> std::same_as<std::uint64_t>;
};


// Production clock
struct steady_clock {
    [[nodiscard]]
    static inline std::chrono::steady_clock::time_point now() noexcept {
        return std::chrono::steady_clock::now();
    }

    [[nodiscard]]
    static inline std::uint64_t epoch_ms() noexcept {
        using namespace std::chrono;
        return static_cast<std::uint64_t>(
            duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
    }
};
static_assert(ClockConcept<steady_clock>);

} // namespace system
} // namespace lcr
