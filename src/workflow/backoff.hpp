#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <limits>

/**
 * @brief Delay to wait before retry attempt number `attempt`
 *
 * 2^attempt seconds, saturating instead of overflowing. A non-zero cap bounds the delay.
 */
inline std::chrono::seconds backoff_delay(uint64_t attempt, uint64_t cap_seconds = 0) {
    constexpr auto max_seconds = static_cast<uint64_t>(std::numeric_limits<std::chrono::seconds::rep>::max());

    auto seconds = attempt >= 63 ? max_seconds : (uint64_t{ 1 } << attempt);
    if(cap_seconds > 0)
        seconds = std::min(seconds, cap_seconds);

    return std::chrono::seconds{ static_cast<std::chrono::seconds::rep>(seconds) };
}
