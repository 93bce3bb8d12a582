#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>

// Capped exponential backoff: delay(attempt) = min(base * 2^attempt, max).
// attempt counts reconnects scheduled since the last successful open.
struct ReconnectPolicy {
    std::chrono::milliseconds baseDelay{1000};
    std::chrono::milliseconds maxDelay{30000};

    std::chrono::milliseconds delayFor(uint32_t attempt) const {
        if (attempt >= 32) return maxDelay;
        const int64_t base = baseDelay.count();
        const int64_t cap = maxDelay.count();
        if (base <= 0) return std::chrono::milliseconds{0};
        // Stop doubling once past the cap so the shift cannot overflow
        int64_t d = base;
        for (uint32_t i = 0; i < attempt && d < cap; ++i) d *= 2;
        return std::chrono::milliseconds{std::min(d, cap)};
    }
};
