// ============================================================================
// MONOTONIC + WALL CLOCK HELPERS

#pragma once

#include <chrono>
#include <cstdint>

namespace LedgerStream {

class Clock {
public:
    // Monotonic nanoseconds (steady_clock), for elapsed-time measurement only
    static inline uint64_t now_ns() {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            now.time_since_epoch()
        ).count();
    }

    // Wall clock as fractional unix seconds (UTC); this is what gets persisted
    static inline double unix_seconds() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration<double>(now.time_since_epoch()).count();
    }

    static inline double elapsed_seconds(uint64_t start_ns) {
        return static_cast<double>(now_ns() - start_ns) / 1e9;
    }
};

} // namespace LedgerStream
