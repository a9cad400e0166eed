#include "bootstrap/bootstrap_state.hpp"

#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <limits>

using namespace polarbear;
using namespace polarbear::bootstrap;

TEST_CASE("Stages map onto fixed percent bands", "[bootstrap_state]") {
    ProgressTracker tracker;

    REQUIRE(tracker.update(ProgressStage::download, 0.5, "Downloading").percent == 30);
    REQUIRE(tracker.current().phase == BootstrapPhase::downloading);

    REQUIRE(tracker.update(ProgressStage::verify, 0.0, "Verifying").percent == 60);
    REQUIRE(tracker.current().phase == BootstrapPhase::verifying);

    REQUIRE(tracker.update(ProgressStage::extract, 1.0, "Extracting").percent == 90);
    REQUIRE(tracker.current().phase == BootstrapPhase::extracting);

    REQUIRE(tracker.update(ProgressStage::guest_setup, 1.0, "Configuring").percent == 99);

    const auto& done = tracker.finish("Installed");
    REQUIRE(done.phase == BootstrapPhase::ready);
    REQUIRE(done.percent == 100);
    REQUIRE(done.message == "Installed");
}

TEST_CASE("Percent never decreases", "[bootstrap_state]") {
    ProgressTracker tracker;
    static_cast<void>(tracker.update(ProgressStage::download, 0.9, "a"));
    REQUIRE(tracker.current().percent == 54);

    static_cast<void>(tracker.update(ProgressStage::download, 0.1, "resumed"));
    REQUIRE(tracker.current().percent == 54);
    REQUIRE(tracker.current().message == "resumed");
}

TEST_CASE("Fractions are clamped", "[bootstrap_state]") {
    ProgressTracker tracker;
    REQUIRE(tracker.update(ProgressStage::download, -3.0, "x").percent == 0);
    REQUIRE(tracker.update(ProgressStage::download, std::numeric_limits<double>::quiet_NaN(), "x")
                .percent == 0);
    REQUIRE(tracker.update(ProgressStage::download, 7.0, "x").percent == 60);
}

TEST_CASE("Failure keeps the reached percent", "[bootstrap_state]") {
    ProgressTracker tracker;
    static_cast<void>(tracker.update(ProgressStage::extract, 0.4, "Extracting"));
    const uint8_t reached = tracker.current().percent;

    const auto& failed = tracker.fail(Error{ErrorCode::corrupt_archive, "bad entry"});
    REQUIRE(failed.is_error());
    REQUIRE(failed.percent == reached);
    REQUIRE(failed.error == ErrorCode::corrupt_archive);
    REQUIRE(failed.message == "bad entry");

    SECTION("A later update clears the error") {
        static_cast<void>(tracker.update(ProgressStage::extract, 0.5, "Retrying"));
        REQUIRE_FALSE(tracker.current().is_error());
        REQUIRE_FALSE(tracker.current().error.has_value());
    }

    SECTION("Pause is resumable and keeps percent") {
        const auto& paused = tracker.pause("Cancelled");
        REQUIRE(paused.phase == BootstrapPhase::uninstalled);
        REQUIRE(paused.percent == reached);
    }

    SECTION("Reset returns to zero") {
        const auto& fresh = tracker.reset();
        REQUIRE(fresh.phase == BootstrapPhase::uninstalled);
        REQUIRE(fresh.percent == 0);
        REQUIRE(fresh.message.empty());
    }
}

TEST_CASE("Phase names", "[bootstrap_state]") {
    REQUIRE(std::string(to_string(BootstrapPhase::downloading)) == "downloading");
    REQUIRE(std::string(to_string(BootstrapPhase::error)) == "error");
}
