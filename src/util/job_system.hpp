#pragma once

#include <BS_thread_pool.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <stop_token>
#include <type_traits>

namespace polarbear::util {

/// @brief Handle to a background job that observes a stop token.
template <typename T>
struct CancellableJob {
    std::stop_source stop;
    std::future<T> future;

    void cancel() { stop.request_stop(); }

    [[nodiscard]] auto valid() const -> bool { return future.valid(); }

    [[nodiscard]] auto ready() const -> bool {
        return future.valid() &&
               future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }
};

/// @brief Process-wide worker pool.
///
/// The heavy workload is the rootfs bootstrap: one cancellable job that downloads and then
/// extracts for minutes at a time, blocked on the network or the disk rather than the CPU.
/// Cancellable jobs are treated as long-running, and the pool never has fewer workers than
/// `MIN_THREADS` so a short `submit()` is not queued behind a bootstrap.
class JobSystem {
public:
    static constexpr size_t MIN_THREADS = 2;

    /// @p thread_count 0 picks `MIN_THREADS`; smaller requests are raised to it.
    static void initialize(size_t thread_count = 0);
    static void shutdown();

    template <typename Func, typename... Args>
    static auto submit(Func&& func, Args&&... args)
        -> std::future<std::invoke_result_t<Func, Args...>> {
        ensure_initialized();
        return s_pool->submit(std::forward<Func>(func), std::forward<Args>(args)...);
    }

    /// Runs `func(std::stop_token)` on the pool as a long-running job; the returned handle
    /// can request a stop.
    template <typename Func>
    static auto submit_cancellable(Func&& func)
        -> CancellableJob<std::invoke_result_t<Func, std::stop_token>> {
        ensure_initialized();
        begin_long_running();
        CancellableJob<std::invoke_result_t<Func, std::stop_token>> job;
        job.future = s_pool->submit(
            [fn = std::forward<Func>(func), token = job.stop.get_token()]() mutable {
                LongRunningScope scope;
                return fn(token);
            });
        return job;
    }

    static void wait_all();
    static auto thread_count() -> size_t;
    static auto is_initialized() -> bool { return s_pool != nullptr; }
    /// Cancellable jobs submitted and not yet returned.
    static auto long_running_jobs() -> size_t {
        return s_long_running.load(std::memory_order_acquire);
    }

private:
    JobSystem() = delete;
    ~JobSystem() = delete;
    JobSystem(const JobSystem&) = delete;
    JobSystem& operator=(const JobSystem&) = delete;

    struct LongRunningScope {
        LongRunningScope() = default;
        LongRunningScope(const LongRunningScope&) = delete;
        LongRunningScope& operator=(const LongRunningScope&) = delete;
        ~LongRunningScope() { end_long_running(); }
    };

    static void ensure_initialized();
    static void begin_long_running();
    static void end_long_running();

    static std::unique_ptr<BS::thread_pool> s_pool;
    static std::atomic<size_t> s_long_running;
};

} // namespace polarbear::util
