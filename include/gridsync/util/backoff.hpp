#pragma once

#include <algorithm>
#include <chrono>

namespace gridsync {

/**
 * Exponential backoff: base, 2*base, 4*base ... capped at max_delay,
 * for at most max_retries attempts.
 */
struct RetryPolicy {
    std::chrono::milliseconds base_delay{200};
    std::chrono::milliseconds max_delay{5000};
    int max_retries = 5;

    // Delay before retry number `attempt` (1-based).
    std::chrono::milliseconds delay(int attempt) const {
        if (attempt <= 1) return std::min(base_delay, max_delay);
        auto d = base_delay;
        for (int i = 1; i < attempt && d < max_delay; ++i) {
            d *= 2;
        }
        return std::min(d, max_delay);
    }

    bool exhausted(int attempt) const { return attempt > max_retries; }
};

} // namespace gridsync
