/**
 * @file thread_adapter.hpp
 * @brief Adapter for running analyzers on thread_system's pool
 *
 * A process-wide kcenon::thread::thread_pool shared by every validation
 * runner configured for parallel execution.
 *
 * @code
 * thread_adapter::configure({.worker_count = 4});
 * if (auto started = thread_adapter::start(); started.is_err()) {
 *     // run sequentially instead
 * }
 * auto future = thread_adapter::submit([] { return 42; });
 * if (future.is_ok()) {
 *     int answer = future.value().get();
 * }
 * thread_adapter::shutdown();
 * @endcode
 */

#pragma once

#include <tagcheck/core/result.hpp>

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace kcenon::thread {
class thread_pool;
}  // namespace kcenon::thread

namespace tagcheck::integration {

/**
 * @brief Configuration of the shared worker pool
 */
struct thread_pool_config {
    /// Number of worker threads, at least one
    std::size_t worker_count = std::thread::hardware_concurrency();

    /// Pool name used in thread_system diagnostics
    std::string pool_name = "tagcheck_pool";
};

// ─────────────────────────────────────────────────────
// Thread Adapter Class
// ─────────────────────────────────────────────────────

/**
 * @brief Static facade over the shared thread pool
 *
 * Thread Safety: All methods are thread-safe.
 */
class thread_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Thread Pool Management
    // ─────────────────────────────────────────────────────

    /**
     * @brief Set the pool configuration
     *
     * Takes effect on the next start() after a shutdown(). A worker count
     * of zero is raised to one.
     */
    static void configure(const thread_pool_config& config);

    [[nodiscard]] static auto get_config() -> thread_pool_config;

    /**
     * @brief Create the workers and start the pool
     *
     * Starting a running pool succeeds without side effects.
     *
     * @return error pool_worker_rejected or pool_start_failed when
     *         thread_system refuses a worker or the start
     */
    [[nodiscard]] static auto start() -> VoidResult;

    [[nodiscard]] static auto is_running() -> bool;

    /**
     * @brief Stop the pool
     * @param wait_for_completion Finish queued jobs before stopping
     */
    static void shutdown(bool wait_for_completion = true);

    // ─────────────────────────────────────────────────────
    // Job Submission
    // ─────────────────────────────────────────────────────

    /**
     * @brief Run @p task on the pool
     *
     * The pool must have been started.
     *
     * @return Future of the task result, or pool_submit_failed when the pool
     *         is not running or rejects the job
     */
    template <typename F>
    [[nodiscard]] static auto submit(F&& task)
        -> Result<std::future<std::invoke_result_t<std::decay_t<F>>>>;

    /**
     * @brief Wait for every future in @p futures
     *
     * All futures are waited on even when one of them holds an exception;
     * the first exception in sequence order is rethrown afterwards.
     */
    static void wait_all(std::vector<std::future<void>>& futures);

    // ─────────────────────────────────────────────────────
    // Statistics
    // ─────────────────────────────────────────────────────

    [[nodiscard]] static auto get_thread_count() -> std::size_t;

    [[nodiscard]] static auto get_pending_job_count() -> std::size_t;

private:
    static auto submit_job_internal(std::function<void()> task) -> VoidResult;

    static std::shared_ptr<kcenon::thread::thread_pool> pool_;
    static thread_pool_config config_;
    static std::mutex mutex_;

    thread_adapter() = delete;
    ~thread_adapter() = delete;
    thread_adapter(const thread_adapter&) = delete;
    thread_adapter& operator=(const thread_adapter&) = delete;
};

// ─────────────────────────────────────────────────────
// Template Implementation
// ─────────────────────────────────────────────────────

template <typename F>
auto thread_adapter::submit(F&& task)
    -> Result<std::future<std::invoke_result_t<std::decay_t<F>>>> {
    using return_type = std::invoke_result_t<std::decay_t<F>>;
    using future_type = std::future<return_type>;

    auto packaged_task =
        std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(task));
    auto future = packaged_task->get_future();

    auto submitted = submit_job_internal([packaged_task]() { (*packaged_task)(); });
    if (submitted.is_err()) {
        return Result<future_type>(submitted.error());
    }
    return Result<future_type>::ok(std::move(future));
}

}  // namespace tagcheck::integration
