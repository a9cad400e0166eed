#include "util/job_system.hpp"

#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <stop_token>
#include <thread>

using namespace polarbear::util;

namespace {

struct JobSystemGuard {
    explicit JobSystemGuard(size_t threads) { JobSystem::initialize(threads); }
    ~JobSystemGuard() { JobSystem::shutdown(); }
    JobSystemGuard(const JobSystemGuard&) = delete;
    JobSystemGuard& operator=(const JobSystemGuard&) = delete;
};

} // namespace

TEST_CASE("JobSystem lifecycle", "[job_system]") {
    REQUIRE_FALSE(JobSystem::is_initialized());
    {
        JobSystemGuard guard(2);
        REQUIRE(JobSystem::is_initialized());
        REQUIRE(JobSystem::thread_count() == 2);

        // A second initialize keeps the existing pool
        JobSystem::initialize(4);
        REQUIRE(JobSystem::thread_count() == 2);
    }
    REQUIRE_FALSE(JobSystem::is_initialized());
    REQUIRE(JobSystem::thread_count() == 0);
}

TEST_CASE("JobSystem keeps a worker beside a long-running job", "[job_system]") {
    SECTION("Default and undersized pools get the minimum") {
        JobSystemGuard guard(1);
        REQUIRE(JobSystem::thread_count() == JobSystem::MIN_THREADS);
    }

    SECTION("Short tasks run while a cancellable job holds a worker") {
        JobSystemGuard guard(0);
        REQUIRE(JobSystem::thread_count() == JobSystem::MIN_THREADS);

        auto job = JobSystem::submit_cancellable([](std::stop_token stop) {
            while (!stop.stop_requested()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            return 0;
        });
        REQUIRE(JobSystem::long_running_jobs() == 1);

        auto quick = JobSystem::submit([] { return 3; });
        REQUIRE(quick.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
        REQUIRE(quick.get() == 3);
        REQUIRE_FALSE(job.ready());

        job.cancel();
        REQUIRE(job.future.get() == 0);
        REQUIRE(JobSystem::long_running_jobs() == 0);
    }
}

TEST_CASE("JobSystem submit returns results", "[job_system]") {
    JobSystemGuard guard(2);

    auto sum = JobSystem::submit([](int a, int b) { return a + b; }, 20, 22);
    REQUIRE(sum.get() == 42);

    std::atomic<int> counter{0};
    for (int i = 0; i < 16; ++i) {
        (void)JobSystem::submit([&counter] { counter.fetch_add(1); });
    }
    JobSystem::wait_all();
    REQUIRE(counter.load() == 16);
}

TEST_CASE("JobSystem initializes lazily on first submit", "[job_system]") {
    auto value = JobSystem::submit([] { return 7; });
    REQUIRE(value.get() == 7);
    REQUIRE(JobSystem::is_initialized());
    JobSystem::shutdown();
}

TEST_CASE("Cancellable jobs observe their stop token", "[job_system]") {
    JobSystemGuard guard(2);

    auto job = JobSystem::submit_cancellable([](std::stop_token stop) {
        int spins = 0;
        while (!stop.stop_requested()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            ++spins;
        }
        return spins;
    });
    REQUIRE(job.valid());
    REQUIRE_FALSE(job.ready());

    job.cancel();
    REQUIRE(job.future.get() >= 0);
}

TEST_CASE("Cancellable job completes without a stop request", "[job_system]") {
    JobSystemGuard guard(1);

    auto job = JobSystem::submit_cancellable(
        [](std::stop_token stop) { return stop.stop_requested() ? -1 : 1; });
    job.future.wait();
    REQUIRE(job.ready());
    REQUIRE(job.future.get() == 1);
}
