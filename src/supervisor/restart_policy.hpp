#pragma once

#include <chrono>
#include <cstdint>
#include <deque>

namespace polarbear::supervisor {

/// @brief Sliding-window failure counter.
class RestartPolicy {
public:
    using Clock = std::chrono::steady_clock;

    RestartPolicy(std::chrono::seconds window, uint32_t max_failures)
        : m_window(window), m_max_failures(max_failures) {}

    /// Records a failure at @p now. Returns true once `max_failures` fall inside the window.
    auto record_failure(Clock::time_point now) -> bool;
    [[nodiscard]] auto failures_in_window(Clock::time_point now) const -> uint32_t;
    void reset() { m_failures.clear(); }

private:
    void expire(Clock::time_point now);

    std::chrono::seconds m_window;
    uint32_t m_max_failures;
    std::deque<Clock::time_point> m_failures;
};

} // namespace polarbear::supervisor
