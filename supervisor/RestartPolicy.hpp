/**
 * \file supervisor/RestartPolicy.hpp
 * \brief Bounded linear backoff for worker restarts.
 */
#pragma once

#include <algorithm>
#include <chrono>

namespace SysTask::Supervisor {

/**
 * \brief Restart budget and delays.
 * \details Attempt `n` (1-based) waits `min(n * base_delay, max_delay)`. Once the
 * attempt counter exceeds `max_attempts` the supervisor enters cooldown instead.
 */
struct RestartPolicy {
    int max_attempts{5};
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{10000};

    std::chrono::milliseconds delay_for(int attempt) const {
        if (attempt < 1) attempt = 1;
        return std::min(base_delay * attempt, max_delay);
    }

    bool exhausted(int attempt) const { return attempt > max_attempts; }
};

} // namespace SysTask::Supervisor
