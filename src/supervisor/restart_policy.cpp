#include "restart_policy.hpp"

#include <algorithm>

namespace polarbear::supervisor {

auto RestartPolicy::record_failure(Clock::time_point now) -> bool {
    expire(now);
    m_failures.push_back(now);
    return m_failures.size() >= m_max_failures;
}

auto RestartPolicy::failures_in_window(Clock::time_point now) const -> uint32_t {
    return static_cast<uint32_t>(std::ranges::count_if(
        m_failures, [&](Clock::time_point t) { return now - t < m_window; }));
}

void RestartPolicy::expire(Clock::time_point now) {
    while (!m_failures.empty() && now - m_failures.front() >= m_window) {
        m_failures.pop_front();
    }
}

} // namespace polarbear::supervisor
