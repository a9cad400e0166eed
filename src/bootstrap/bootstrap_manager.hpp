#pragma once

#include "bootstrap_state.hpp"
#include "downloader.hpp"

#include <util/error.hpp>

#include <filesystem>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>

namespace polarbear {
struct Config;
}

namespace polarbear::bootstrap {

/// @brief On-disk locations owned by the bootstrap, all under the data directory.
struct BootstrapLayout {
    std::filesystem::path rootfs;
    std::filesystem::path staging;
    std::filesystem::path archive;
    std::filesystem::path marker;

    [[nodiscard]] auto partial_archive() const -> std::filesystem::path;
};

[[nodiscard]] auto layout_for(const std::filesystem::path& data_dir) -> BootstrapLayout;

struct BootstrapConfig {
    std::string url;
    /// Empty skips verification.
    std::string sha256;
    uint32_t strip_components = 1;
    bool keep_archive = false;
    DownloadOptions download;
};

[[nodiscard]] auto bootstrap_config_from(const Config& config) -> BootstrapConfig;

/// @brief Reports whether @p layout holds a completed install.
[[nodiscard]] auto has_valid_marker(const BootstrapLayout& layout) -> bool;

/**
 * @brief Installs the guest root filesystem: download, verify, extract, guest setup.
 *
 * `run()` is idempotent. A valid completion marker short-circuits to Ready, a complete archive
 * is reused, a partial download is resumed, and half-extracted trees are discarded. An
 * integrity failure (digest mismatch or corrupt archive) deletes the archive and retries once.
 */
class BootstrapManager {
public:
    BootstrapManager(BootstrapLayout layout, BootstrapConfig config,
                     std::shared_ptr<Fetcher> fetcher);

    BootstrapManager(const BootstrapManager&) = delete;
    BootstrapManager& operator=(const BootstrapManager&) = delete;
    BootstrapManager(BootstrapManager&&) = delete;
    BootstrapManager& operator=(BootstrapManager&&) = delete;

    /// Called from whichever thread changes the state, outside the internal lock.
    void set_state_listener(StateListener listener);

    /// Runs to completion on the calling thread. Call from a worker.
    [[nodiscard]] auto run(std::stop_token stop) -> Result<void>;

    /// Returns progress to zero and, with @p wipe, deletes the install, staging and archive.
    /// Must not overlap `run()`.
    [[nodiscard]] auto reset(bool wipe) -> Result<void>;

    [[nodiscard]] auto state() const -> BootstrapState;
    [[nodiscard]] auto is_installed() const -> bool { return has_valid_marker(m_layout); }
    [[nodiscard]] auto layout() const -> const BootstrapLayout& { return m_layout; }

private:
    [[nodiscard]] auto attempt(bool last_chance, std::stop_token stop) -> Result<void>;
    [[nodiscard]] auto discard_leftovers() -> Result<void>;
    [[nodiscard]] auto write_marker() -> Result<void>;

    void update(ProgressStage stage, double fraction, std::string message);
    void publish(const BootstrapState& state, bool force = false);

    BootstrapLayout m_layout;
    BootstrapConfig m_config;
    std::shared_ptr<Fetcher> m_fetcher;

    mutable std::mutex m_mutex;
    ProgressTracker m_tracker;
    BootstrapState m_last_published;
    StateListener m_listener;
};

} // namespace polarbear::bootstrap
