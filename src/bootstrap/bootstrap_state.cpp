#include "bootstrap_state.hpp"

#include <algorithm>
#include <cmath>

namespace polarbear::bootstrap {

namespace {

struct Band {
    BootstrapPhase phase;
    uint8_t begin;
    uint8_t end;
};

constexpr auto band_for(ProgressStage stage) -> Band {
    switch (stage) {
    case ProgressStage::download:
        return {BootstrapPhase::downloading, 0, 60};
    case ProgressStage::verify:
        return {BootstrapPhase::verifying, 60, 65};
    case ProgressStage::extract:
        return {BootstrapPhase::extracting, 65, 90};
    case ProgressStage::guest_setup:
        return {BootstrapPhase::extracting, 90, 99};
    }
    return {BootstrapPhase::extracting, 0, 0};
}

} // namespace

auto to_string(BootstrapPhase phase) -> const char* {
    switch (phase) {
    case BootstrapPhase::uninstalled:
        return "uninstalled";
    case BootstrapPhase::downloading:
        return "downloading";
    case BootstrapPhase::verifying:
        return "verifying";
    case BootstrapPhase::extracting:
        return "extracting";
    case BootstrapPhase::ready:
        return "ready";
    case BootstrapPhase::error:
        return "error";
    }
    return "unknown";
}

auto ProgressTracker::update(ProgressStage stage, double fraction, std::string message)
    -> const BootstrapState& {
    const Band band = band_for(stage);
    if (std::isnan(fraction)) {
        fraction = 0.0;
    }
    fraction = std::clamp(fraction, 0.0, 1.0);
    const auto percent = static_cast<uint8_t>(
        band.begin + std::floor(fraction * static_cast<double>(band.end - band.begin)));

    m_state.phase = band.phase;
    m_state.percent = std::max(m_state.percent, percent);
    m_state.message = std::move(message);
    m_state.error.reset();
    return m_state;
}

auto ProgressTracker::finish(std::string message) -> const BootstrapState& {
    m_state.phase = BootstrapPhase::ready;
    m_state.percent = 100;
    m_state.message = std::move(message);
    m_state.error.reset();
    return m_state;
}

auto ProgressTracker::fail(const Error& error) -> const BootstrapState& {
    m_state.phase = BootstrapPhase::error;
    m_state.message = error.message;
    m_state.error = error.code;
    return m_state;
}

auto ProgressTracker::pause(std::string message) -> const BootstrapState& {
    m_state.phase = BootstrapPhase::uninstalled;
    m_state.message = std::move(message);
    m_state.error.reset();
    return m_state;
}

auto ProgressTracker::reset() -> const BootstrapState& {
    m_state = BootstrapState{};
    return m_state;
}

} // namespace polarbear::bootstrap
