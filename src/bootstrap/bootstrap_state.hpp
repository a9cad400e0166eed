#pragma once

#include <util/error.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace polarbear::bootstrap {

enum class BootstrapPhase : std::uint8_t {
    uninstalled,
    downloading,
    verifying,
    extracting,
    ready,
    error
};

[[nodiscard]] auto to_string(BootstrapPhase phase) -> const char*;

/// Sub-stages with fixed percent bands: download 0-60, verify 60-65, extract 65-90,
/// guest setup 90-99.
enum class ProgressStage : std::uint8_t {
    download,
    verify,
    extract,
    guest_setup
};

struct BootstrapState {
    BootstrapPhase phase = BootstrapPhase::uninstalled;
    uint8_t percent = 0;
    std::string message;
    std::optional<ErrorCode> error;

    [[nodiscard]] auto is_error() const -> bool { return phase == BootstrapPhase::error; }
};

using StateListener = std::function<void(const BootstrapState&)>;

/// @brief Maps stage progress onto overall percent. Never decreases until `reset()`.
class ProgressTracker {
public:
    /// @param fraction Stage completion in [0, 1]; out-of-range values are clamped.
    auto update(ProgressStage stage, double fraction, std::string message) -> const BootstrapState&;
    auto finish(std::string message) -> const BootstrapState&;
    /// Keeps the reached percent so the failure shows where it happened.
    auto fail(const Error& error) -> const BootstrapState&;
    /// Interrupted but resumable: back to `uninstalled` with the reached percent kept.
    auto pause(std::string message) -> const BootstrapState&;
    /// Back to zero. Only a user reset does this.
    auto reset() -> const BootstrapState&;

    [[nodiscard]] auto current() const -> const BootstrapState& { return m_state; }

private:
    BootstrapState m_state;
};

} // namespace polarbear::bootstrap
