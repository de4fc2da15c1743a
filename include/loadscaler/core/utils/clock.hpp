// ============================================================================
// MONOTONIC CLOCK

#pragma once

#include <chrono>
#include <cstdint>

namespace LoadScaler {

class Clock {
public:
    // Get current time in milliseconds (monotonic, steady)
    static inline uint64_t now_ms() {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ).count();
    }
};

} // namespace LoadScaler
