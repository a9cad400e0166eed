#include "bootstrap_manager.hpp"

#include "archive.hpp"
#include "checksum.hpp"
#include "guest_setup.hpp"

#include <util/config.hpp>
#include <util/logging.hpp>
#include <util/unique_fd.hpp>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <string_view>
#include <unistd.h>

namespace polarbear::bootstrap {

namespace {

constexpr std::string_view MARKER_HEADER = "polarbear-rootfs 1";

auto remove_tree(const std::filesystem::path& path) -> Result<void> {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        return make_error<void>(ErrorCode::file_write_failed,
                                "Cannot remove " + path.string() + ": " + ec.message());
    }
    return {};
}

auto write_all(int fd, std::string_view data) -> bool {
    while (!data.empty()) {
        const ssize_t n = ::write(fd, data.data(), data.size());
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data.remove_prefix(static_cast<size_t>(n));
    }
    return true;
}

auto fsync_dir(const std::filesystem::path& dir) -> void {
    util::UniqueFd fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (fd.valid() && ::fsync(fd.get()) != 0) {
        POLARBEAR_LOG_WARN("fsync {} failed: {}", dir.string(), std::strerror(errno));
    }
}

auto fraction(uint64_t done, uint64_t total) -> double {
    return total == 0 ? 0.0 : static_cast<double>(done) / static_cast<double>(total);
}

} // namespace

auto BootstrapLayout::partial_archive() const -> std::filesystem::path {
    auto part = archive;
    part += ".part";
    return part;
}

auto layout_for(const std::filesystem::path& data_dir) -> BootstrapLayout {
    return BootstrapLayout{
        .rootfs = data_dir / "rootfs",
        .staging = data_dir / "rootfs.staging",
        .archive = data_dir / "rootfs.tar.xz",
        .marker = data_dir / "rootfs" / ".polarbear-installed",
    };
}

auto bootstrap_config_from(const Config& config) -> BootstrapConfig {
    return BootstrapConfig{
        .url = config.rootfs.url,
        .sha256 = config.rootfs.sha256,
        .strip_components = config.rootfs.strip_components,
        .keep_archive = config.rootfs.keep_archive,
        .download =
            DownloadOptions{
                .max_attempts = config.download.max_attempts,
                .initial_backoff_ms = config.download.initial_backoff_ms,
                .max_backoff_ms = config.download.max_backoff_ms,
                .connect_timeout_s = config.download.connect_timeout_s,
                .low_speed_timeout_s = config.download.low_speed_timeout_s,
            },
    };
}

auto has_valid_marker(const BootstrapLayout& layout) -> bool {
    std::ifstream in(layout.marker);
    std::string first_line;
    return in && std::getline(in, first_line) && first_line == MARKER_HEADER;
}

BootstrapManager::BootstrapManager(BootstrapLayout layout, BootstrapConfig config,
                                   std::shared_ptr<Fetcher> fetcher)
    : m_layout(std::move(layout)), m_config(std::move(config)), m_fetcher(std::move(fetcher)) {}

void BootstrapManager::set_state_listener(StateListener listener) {
    std::lock_guard lock(m_mutex);
    m_listener = std::move(listener);
}

auto BootstrapManager::state() const -> BootstrapState {
    std::lock_guard lock(m_mutex);
    return m_tracker.current();
}

void BootstrapManager::publish(const BootstrapState& state, bool force) {
    StateListener listener;
    {
        std::lock_guard lock(m_mutex);
        // Byte-level download progress would flood observers; only percent steps matter.
        if (!force && state.phase == m_last_published.phase &&
            state.percent == m_last_published.percent && state.error == m_last_published.error &&
            state.phase != BootstrapPhase::ready) {
            return;
        }
        m_last_published = state;
        listener = m_listener;
    }
    if (listener) {
        listener(state);
    }
}

void BootstrapManager::update(ProgressStage stage, double fraction, std::string message) {
    BootstrapState snapshot;
    {
        std::lock_guard lock(m_mutex);
        snapshot = m_tracker.update(stage, fraction, std::move(message));
    }
    publish(snapshot);
}

auto BootstrapManager::run(std::stop_token stop) -> Result<void> {
    if (has_valid_marker(m_layout)) {
        POLARBEAR_LOG_INFO("Root filesystem already installed at {}", m_layout.rootfs.string());
        BootstrapState snapshot;
        {
            std::lock_guard lock(m_mutex);
            snapshot = m_tracker.finish("Environment ready");
        }
        publish(snapshot);
        return {};
    }

    Result<void> result = discard_leftovers();
    if (result) {
        result = attempt(false, stop);
        if (!result && is_integrity_error(result.error().code)) {
            POLARBEAR_LOG_WARN("Integrity check failed ({}), downloading again",
                               result.error().message);
            result = attempt(true, stop);
        }
    }

    BootstrapState snapshot;
    {
        std::lock_guard lock(m_mutex);
        if (result) {
            snapshot = m_tracker.finish("Environment ready");
        } else if (result.error().code == ErrorCode::cancelled) {
            snapshot = m_tracker.pause("Installation paused");
        } else {
            snapshot = m_tracker.fail(result.error());
        }
    }
    publish(snapshot);

    if (!result && result.error().code != ErrorCode::cancelled) {
        POLARBEAR_LOG_ERROR("Bootstrap failed [{}]: {}", error_code_name(result.error().code),
                            result.error().message);
    }
    return result;
}

auto BootstrapManager::discard_leftovers() -> Result<void> {
    std::error_code ec;
    if (std::filesystem::exists(m_layout.rootfs, ec)) {
        POLARBEAR_LOG_WARN("Discarding incomplete install at {}", m_layout.rootfs.string());
        POLARBEAR_TRY(remove_tree(m_layout.rootfs));
    }
    if (std::filesystem::exists(m_layout.staging, ec)) {
        POLARBEAR_LOG_INFO("Discarding leftover staging tree");
        POLARBEAR_TRY(remove_tree(m_layout.staging));
    }
    return {};
}

auto BootstrapManager::attempt(bool last_chance, std::stop_token stop) -> Result<void> {
    std::error_code ec;
    if (!std::filesystem::exists(m_layout.archive, ec)) {
        update(ProgressStage::download, 0.0, "Downloading root filesystem");
        POLARBEAR_TRY(download_with_retry(
            *m_fetcher, m_config.url, m_layout.archive, m_config.download,
            [this](uint64_t received, uint64_t total) {
                update(ProgressStage::download, fraction(received, total),
                       "Downloading root filesystem");
            },
            stop));
    } else {
        POLARBEAR_LOG_INFO("Reusing downloaded archive {}", m_layout.archive.string());
    }
    update(ProgressStage::download, 1.0, "Download complete");

    update(ProgressStage::verify, 0.0, "Verifying archive");
    if (m_config.sha256.empty()) {
        POLARBEAR_LOG_WARN("No rootfs.sha256 configured, skipping archive verification");
    } else {
        auto verified = verify_sha256(m_layout.archive, m_config.sha256, stop,
                                      [this](uint64_t hashed, uint64_t total) {
                                          update(ProgressStage::verify, fraction(hashed, total),
                                                 "Verifying archive");
                                      });
        if (!verified) {
            if (!last_chance && is_integrity_error(verified.error().code)) {
                std::filesystem::remove(m_layout.archive, ec);
            }
            return verified;
        }
    }
    update(ProgressStage::verify, 1.0, "Archive verified");

    update(ProgressStage::extract, 0.0, "Extracting root filesystem");
    auto extracted = extract_tar_xz(
        m_layout.archive, m_layout.staging,
        ExtractOptions{.strip_components = m_config.strip_components},
        [this](uint64_t consumed, uint64_t total) {
            update(ProgressStage::extract, fraction(consumed, total), "Extracting root filesystem");
        },
        stop);
    if (!extracted) {
        std::filesystem::remove_all(m_layout.staging, ec);
        if (!last_chance && is_integrity_error(extracted.error().code)) {
            std::filesystem::remove(m_layout.archive, ec);
        }
        return nonstd::make_unexpected(extracted.error());
    }

    update(ProgressStage::guest_setup, 0.0, "Preparing guest system");
    POLARBEAR_TRY(run_guest_setup(m_layout.staging));
    if (stop.stop_requested()) {
        return make_error<void>(ErrorCode::cancelled, "Installation cancelled");
    }

    std::filesystem::rename(m_layout.staging, m_layout.rootfs, ec);
    if (ec) {
        return make_error<void>(ErrorCode::file_write_failed,
                                "Cannot move staging tree into place: " + ec.message());
    }
    fsync_dir(m_layout.rootfs.parent_path());
    POLARBEAR_TRY(write_marker());
    update(ProgressStage::guest_setup, 1.0, "Guest system prepared");

    if (!m_config.keep_archive) {
        std::filesystem::remove(m_layout.archive, ec);
        if (ec) {
            POLARBEAR_LOG_WARN("Could not delete archive: {}", ec.message());
        }
    }
    POLARBEAR_LOG_INFO("Root filesystem installed at {}", m_layout.rootfs.string());
    return {};
}

auto BootstrapManager::write_marker() -> Result<void> {
    auto tmp = m_layout.marker;
    tmp += ".tmp";
    util::UniqueFd fd(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!fd.valid()) {
        return make_error<void>(ErrorCode::file_write_failed,
                                "Cannot create " + tmp.string() + ": " + std::strerror(errno));
    }
    const std::string contents = std::string(MARKER_HEADER) + "\nurl=" + m_config.url +
                                 "\nsha256=" + m_config.sha256 + "\n";
    if (!write_all(fd.get(), contents) || ::fsync(fd.get()) != 0) {
        const int err = errno;
        return make_error<void>(err == ENOSPC ? ErrorCode::disk_full : ErrorCode::file_write_failed,
                                "Cannot write install marker: " + std::string(std::strerror(err)));
    }
    if (!fd.close()) {
        return make_error<void>(ErrorCode::file_write_failed,
                                "Cannot close install marker: " + std::string(std::strerror(errno)));
    }

    std::error_code ec;
    std::filesystem::rename(tmp, m_layout.marker, ec);
    if (ec) {
        return make_error<void>(ErrorCode::file_write_failed,
                                "Cannot commit install marker: " + ec.message());
    }
    fsync_dir(m_layout.rootfs);
    return {};
}

auto BootstrapManager::reset(bool wipe) -> Result<void> {
    if (wipe) {
        POLARBEAR_LOG_INFO("Wiping guest installation");
        POLARBEAR_TRY(remove_tree(m_layout.rootfs));
        POLARBEAR_TRY(remove_tree(m_layout.staging));
        POLARBEAR_TRY(remove_tree(m_layout.archive));
        POLARBEAR_TRY(remove_tree(m_layout.partial_archive()));
    }
    BootstrapState snapshot;
    {
        std::lock_guard lock(m_mutex);
        snapshot = m_tracker.reset();
    }
    publish(snapshot, true);
    return {};
}

} // namespace polarbear::bootstrap
