#include "downloader.hpp"

#include <util/logging.hpp>

#include <algorithm>
#include <cerrno>
#include <condition_variable>
#include <cstdio>
#include <cstring>
#include <curl/curl.h>
#include <memory>
#include <mutex>
#include <system_error>
#include <unistd.h>

namespace polarbear::bootstrap {

namespace {

struct TransferContext {
    CURL* curl = nullptr;
    std::FILE* file = nullptr;
    uint64_t resume_offset = 0;
    bool status_checked = false;
    bool discard = false;
    int write_errno = 0;
    const DownloadProgress* progress = nullptr;
    std::stop_token stop;
};

auto write_callback(char* data, size_t size, size_t nmemb, void* userdata) -> size_t {
    auto* ctx = static_cast<TransferContext*>(userdata);
    const size_t bytes = size * nmemb;

    if (!ctx->status_checked) {
        ctx->status_checked = true;
        long status = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
        if (status >= 400) {
            // Error pages must not end up in the archive.
            ctx->discard = true;
        } else if (status == 200 && ctx->resume_offset > 0) {
            POLARBEAR_LOG_WARN("Server ignored range request, restarting download from zero");
            if (std::fflush(ctx->file) != 0 || ftruncate(fileno(ctx->file), 0) != 0) {
                ctx->write_errno = errno;
                return 0;
            }
            std::rewind(ctx->file);
            ctx->resume_offset = 0;
        }
    }
    if (ctx->discard) {
        return bytes;
    }
    if (std::fwrite(data, 1, bytes, ctx->file) != bytes) {
        ctx->write_errno = errno;
        return 0;
    }
    return bytes;
}

auto xferinfo_callback(void* userdata, curl_off_t dltotal, curl_off_t dlnow, curl_off_t /*ultotal*/,
                       curl_off_t /*ulnow*/) -> int {
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (ctx->stop.stop_requested()) {
        return 1;
    }
    if (ctx->progress != nullptr && *ctx->progress && !ctx->discard) {
        const uint64_t total = dltotal > 0 ? ctx->resume_offset + static_cast<uint64_t>(dltotal) : 0;
        (*ctx->progress)(ctx->resume_offset + static_cast<uint64_t>(dlnow), total);
    }
    return 0;
}

auto classify_curl_code(CURLcode code) -> ErrorCode {
    switch (code) {
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
    case CURLE_OPERATION_TIMEDOUT:
    case CURLE_PARTIAL_FILE:
    case CURLE_GOT_NOTHING:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_HTTP2:
    case CURLE_HTTP2_STREAM:
        return ErrorCode::transient_network;
    default:
        return ErrorCode::download_failed;
    }
}

auto errno_error(int err, const std::filesystem::path& path) -> Error {
    const ErrorCode code = err == ENOSPC ? ErrorCode::disk_full : ErrorCode::file_write_failed;
    return Error{code, "Write to " + path.string() + " failed: " + std::strerror(err)};
}

} // namespace

CurlFetcher::CurlFetcher(DownloadOptions options) : m_options(options) {
    static std::once_flag s_curl_init;
    std::call_once(s_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

auto CurlFetcher::fetch(const std::string& url, const std::filesystem::path& part_path,
                        const DownloadProgress& progress, std::stop_token stop) -> Result<void> {
    std::error_code ec;
    uint64_t existing = 0;
    if (std::filesystem::exists(part_path, ec)) {
        existing = std::filesystem::file_size(part_path, ec);
        if (ec) {
            existing = 0;
        }
    }

    std::unique_ptr<std::FILE, decltype(&std::fclose)> file(std::fopen(part_path.c_str(), "ab"),
                                                            &std::fclose);
    if (!file) {
        return nonstd::make_unexpected(errno_error(errno, part_path));
    }
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        return make_error<void>(ErrorCode::download_failed, "curl_easy_init failed");
    }

    TransferContext ctx{
        .curl = curl.get(),
        .file = file.get(),
        .resume_offset = existing,
        .progress = &progress,
        .stop = stop,
    };
    char error_buffer[CURL_ERROR_SIZE] = {};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "polarbear/0.1");
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &xferinfo_callback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT,
                     static_cast<long>(m_options.connect_timeout_s));
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME,
                     static_cast<long>(m_options.low_speed_timeout_s));
    if (existing > 0) {
        POLARBEAR_LOG_INFO("Resuming download at {} bytes", existing);
        curl_easy_setopt(curl.get(), CURLOPT_RESUME_FROM_LARGE,
                         static_cast<curl_off_t>(existing));
    }

    const CURLcode code = curl_easy_perform(curl.get());
    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);

    if (std::fflush(file.get()) != 0 && code == CURLE_OK) {
        return nonstd::make_unexpected(errno_error(errno, part_path));
    }
    file.reset();

    if (code == CURLE_ABORTED_BY_CALLBACK) {
        return make_error<void>(ErrorCode::cancelled, "Download cancelled");
    }
    if (code == CURLE_WRITE_ERROR && ctx.write_errno != 0) {
        return nonstd::make_unexpected(errno_error(ctx.write_errno, part_path));
    }
    if (status == 416) {
        // The partial file no longer matches the remote object; start over.
        std::filesystem::remove(part_path, ec);
        return make_error<void>(ErrorCode::transient_network,
                                "Range not satisfiable, discarded partial download");
    }
    if (status >= 400) {
        return make_error<void>(classify_http_status(status),
                                "HTTP " + std::to_string(status) + " for " + url);
    }
    if (code != CURLE_OK) {
        const std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(code);
        return make_error<void>(classify_curl_code(code), "Download failed: " + detail);
    }
    return {};
}

auto backoff_delay(uint32_t attempt, const DownloadOptions& options) -> std::chrono::milliseconds {
    uint64_t delay = options.initial_backoff_ms;
    for (uint32_t i = 1; i < attempt && delay < options.max_backoff_ms; ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min<uint64_t>(delay, options.max_backoff_ms));
}

auto classify_http_status(long status) -> ErrorCode {
    if (status == 408 || status == 429 || (status >= 500 && status < 600)) {
        return ErrorCode::transient_network;
    }
    return ErrorCode::download_failed;
}

auto wait_or_stop(std::chrono::milliseconds delay, std::stop_token stop) -> bool {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    cv.wait_for(lock, stop, delay, [] { return false; });
    return !stop.stop_requested();
}

auto download_with_retry(Fetcher& fetcher, const std::string& url,
                         const std::filesystem::path& dest, const DownloadOptions& options,
                         const DownloadProgress& progress, std::stop_token stop) -> Result<void> {
    auto part_path = dest;
    part_path += ".part";
    const uint32_t max_attempts = std::max<uint32_t>(options.max_attempts, 1);

    for (uint32_t attempt = 1;; ++attempt) {
        if (stop.stop_requested()) {
            return make_error<void>(ErrorCode::cancelled, "Download cancelled");
        }
        auto fetched = fetcher.fetch(url, part_path, progress, stop);
        if (fetched) {
            break;
        }
        const auto& error = fetched.error();
        if (!is_transient(error.code) || attempt >= max_attempts) {
            if (is_transient(error.code)) {
                return make_error<void>(ErrorCode::download_failed,
                                        "Giving up after " + std::to_string(attempt) +
                                            " attempts: " + error.message);
            }
            return fetched;
        }
        const auto delay = backoff_delay(attempt, options);
        POLARBEAR_LOG_WARN("Download attempt {}/{} failed ({}), retrying in {} ms", attempt,
                           max_attempts, error.message, delay.count());
        if (!wait_or_stop(delay, stop)) {
            return make_error<void>(ErrorCode::cancelled, "Download cancelled");
        }
    }

    std::error_code ec;
    std::filesystem::rename(part_path, dest, ec);
    if (ec) {
        return make_error<void>(ErrorCode::file_write_failed,
                                "Failed to finalize " + dest.string() + ": " + ec.message());
    }
    return {};
}

} // namespace polarbear::bootstrap
