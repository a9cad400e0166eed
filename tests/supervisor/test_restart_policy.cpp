#include "supervisor/restart_policy.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace std::chrono_literals;
using polarbear::supervisor::RestartPolicy;

TEST_CASE("Failures inside the window trip the threshold", "[restart_policy]") {
    RestartPolicy policy(60s, 3);
    const auto t0 = RestartPolicy::Clock::now();

    REQUIRE_FALSE(policy.record_failure(t0));
    REQUIRE_FALSE(policy.record_failure(t0 + 10s));
    REQUIRE(policy.failures_in_window(t0 + 20s) == 2);
    REQUIRE(policy.record_failure(t0 + 20s));
}

TEST_CASE("Old failures expire", "[restart_policy]") {
    RestartPolicy policy(60s, 3);
    const auto t0 = RestartPolicy::Clock::now();

    REQUIRE_FALSE(policy.record_failure(t0));
    REQUIRE_FALSE(policy.record_failure(t0 + 30s));
    REQUIRE(policy.failures_in_window(t0 + 61s) == 1);
    REQUIRE_FALSE(policy.record_failure(t0 + 61s));
    REQUIRE(policy.record_failure(t0 + 70s));
}

TEST_CASE("Reset clears history", "[restart_policy]") {
    RestartPolicy policy(60s, 2);
    const auto t0 = RestartPolicy::Clock::now();

    REQUIRE_FALSE(policy.record_failure(t0));
    policy.reset();
    REQUIRE(policy.failures_in_window(t0) == 0);
    REQUIRE_FALSE(policy.record_failure(t0 + 1s));
}
