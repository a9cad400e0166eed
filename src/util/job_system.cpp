#include "job_system.hpp"

#include "logging.hpp"
#include "profiling.hpp"

#include <algorithm>

namespace polarbear::util {

std::unique_ptr<BS::thread_pool> JobSystem::s_pool = nullptr;
std::atomic<size_t> JobSystem::s_long_running{0};

void JobSystem::initialize(size_t thread_count) {
    if (s_pool) {
        return;
    }
    thread_count = std::max(thread_count, MIN_THREADS);
    s_pool = std::make_unique<BS::thread_pool>(thread_count);
    POLARBEAR_LOG_DEBUG("Job pool started with {} workers", thread_count);
}

void JobSystem::shutdown() {
    if (s_pool) {
        s_pool->wait_for_tasks();
        s_pool.reset();
    }
}

void JobSystem::wait_all() {
    if (s_pool) {
        s_pool->wait_for_tasks();
    }
}

auto JobSystem::thread_count() -> size_t {
    if (s_pool) {
        return s_pool->get_thread_count();
    }
    return 0;
}

void JobSystem::ensure_initialized() {
    if (!s_pool) {
        initialize();
    }
}

void JobSystem::begin_long_running() {
    const size_t running = s_long_running.fetch_add(1, std::memory_order_acq_rel) + 1;
    POLARBEAR_PROFILE_COUNT("LongRunningJobs", running);
    if (running >= thread_count()) {
        POLARBEAR_LOG_WARN("{} long-running jobs on {} workers, short tasks will queue", running,
                           thread_count());
    }
}

void JobSystem::end_long_running() {
    const size_t running = s_long_running.fetch_sub(1, std::memory_order_acq_rel) - 1;
    POLARBEAR_PROFILE_COUNT("LongRunningJobs", running);
}

} // namespace polarbear::util
