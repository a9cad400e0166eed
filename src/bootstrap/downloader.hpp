#pragma once

#include <util/error.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <stop_token>
#include <string>

namespace polarbear::bootstrap {

struct DownloadOptions {
    uint32_t max_attempts = 5;
    uint32_t initial_backoff_ms = 1000;
    uint32_t max_backoff_ms = 30000;
    uint32_t connect_timeout_s = 30;
    /// Abort when fewer than one byte per second arrives for this long.
    uint32_t low_speed_timeout_s = 60;
};

/// Bytes present on disk so far and the expected total (0 when unknown).
using DownloadProgress = std::function<void(uint64_t received, uint64_t total)>;

/// @brief Transfers one URL into a partial file, appending to what is already there.
class Fetcher {
public:
    virtual ~Fetcher() = default;

    /// @return `transient_network` for retryable failures, `download_failed` for permanent
    /// ones, `disk_full` on ENOSPC and `cancelled` when @p stop fires.
    [[nodiscard]] virtual auto fetch(const std::string& url, const std::filesystem::path& part_path,
                                     const DownloadProgress& progress, std::stop_token stop)
        -> Result<void> = 0;
};

/// @brief libcurl fetcher with HTTP Range resume.
class CurlFetcher : public Fetcher {
public:
    explicit CurlFetcher(DownloadOptions options);

    [[nodiscard]] auto fetch(const std::string& url, const std::filesystem::path& part_path,
                             const DownloadProgress& progress, std::stop_token stop)
        -> Result<void> override;

private:
    DownloadOptions m_options;
};

/// Delay before retry number @p attempt (1-based): initial * 2^(attempt-1), capped.
[[nodiscard]] auto backoff_delay(uint32_t attempt, const DownloadOptions& options)
    -> std::chrono::milliseconds;

/// Classifies an HTTP status; 408, 429 and 5xx are transient.
[[nodiscard]] auto classify_http_status(long status) -> ErrorCode;

/// @brief Downloads @p url to @p dest through `<dest>.part`, retrying transient failures.
///
/// The partial file survives failures and cancellation so the next call resumes it.
[[nodiscard]] auto download_with_retry(Fetcher& fetcher, const std::string& url,
                                       const std::filesystem::path& dest,
                                       const DownloadOptions& options,
                                       const DownloadProgress& progress, std::stop_token stop)
    -> Result<void>;

/// Sleeps for @p delay unless @p stop fires first. Returns false when stopped.
auto wait_or_stop(std::chrono::milliseconds delay, std::stop_token stop) -> bool;

} // namespace polarbear::bootstrap
