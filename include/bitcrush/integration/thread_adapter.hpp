/**
 * @file thread_adapter.hpp
 * @brief Worker pool for CPU-bound image transforms
 *
 * This file provides the thread_adapter class, a process-wide facade over
 * thread_system's thread pool. HTTP handlers hand the decode, transform
 * and encode work of a submission to this pool and wait on the returned
 * future, so the web server's own worker threads only shuttle bytes.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>

namespace kcenon::thread {
class thread_pool;
}  // namespace kcenon::thread

namespace bitcrush::integration {

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

/**
 * @struct thread_pool_config
 * @brief Configuration options for the transform pool
 */
struct thread_pool_config {
    /// Number of worker threads started by start()
    std::size_t worker_count = 2;

    /// Thread pool name for logging
    std::string pool_name = "bitcrush_transform_pool";
};

/**
 * @struct pool_statistics
 * @brief Snapshot of pool activity
 */
struct pool_statistics {
    bool running = false;
    std::size_t thread_count = 0;
    std::size_t pending_jobs = 0;
    std::size_t idle_workers = 0;
};

// ─────────────────────────────────────────────────────
// Thread Adapter Class
// ─────────────────────────────────────────────────────

/**
 * @class thread_adapter
 * @brief Static facade over a single kcenon::thread::thread_pool
 *
 * The pool is created lazily. Submitting to a pool that has not been
 * started starts it with the current configuration.
 *
 * Thread Safety: All public methods are thread-safe.
 *
 * @example
 * @code
 * thread_pool_config config;
 * config.worker_count = 4;
 * thread_adapter::configure(config);
 * (void)thread_adapter::start();
 *
 * auto future = thread_adapter::submit([&]() {
 *     return service.submit(bytes);
 * });
 * auto id = future.get();
 *
 * thread_adapter::shutdown();
 * @endcode
 */
class thread_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Thread Pool Management
    // ─────────────────────────────────────────────────────

    /**
     * @brief Get the shared pool, creating it on first use
     */
    [[nodiscard]] static auto get_pool() -> std::shared_ptr<kcenon::thread::thread_pool>;

    /**
     * @brief Replace the pool configuration
     *
     * Takes effect on the next start(). A worker count of zero is raised
     * to one.
     */
    static void configure(const thread_pool_config& config);

    [[nodiscard]] static auto get_config() -> thread_pool_config;

    /**
     * @brief Start the worker threads
     *
     * Safe to call repeatedly; a running pool is left as is.
     *
     * @return true if the pool is running afterwards
     */
    [[nodiscard]] static auto start() -> bool;

    [[nodiscard]] static auto is_running() -> bool;

    /**
     * @brief Stop the pool and release it
     *
     * @param wait_for_completion If true, queued jobs are drained first
     */
    static void shutdown(bool wait_for_completion = true);

    // ─────────────────────────────────────────────────────
    // Job Submission
    // ─────────────────────────────────────────────────────

    /**
     * @brief Run a task on the pool and get a future for its result
     *
     * Exceptions thrown by the task are delivered through the future.
     *
     * @throws std::runtime_error if the pool cannot be started or rejects
     *         the job
     */
    template <typename F>
    [[nodiscard]] static auto submit(F&& task)
        -> std::future<std::invoke_result_t<std::decay_t<F>>>;

    /**
     * @brief Run a task on the pool without observing its result
     */
    template <typename F>
    static void submit_fire_and_forget(F&& task);

    // ─────────────────────────────────────────────────────
    // Statistics
    // ─────────────────────────────────────────────────────

    [[nodiscard]] static auto get_thread_count() -> std::size_t;

    [[nodiscard]] static auto get_pending_job_count() -> std::size_t;

    [[nodiscard]] static auto get_idle_worker_count() -> std::size_t;

    /// All counters read under one lock
    [[nodiscard]] static auto get_statistics() -> pool_statistics;

private:
    static void submit_job_internal(std::function<void()> task);

    [[nodiscard]] static auto start_locked() -> bool;

    static std::shared_ptr<kcenon::thread::thread_pool> pool_;
    static thread_pool_config config_;
    static std::mutex mutex_;
    static bool initialized_;

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
    -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using return_type = std::invoke_result_t<std::decay_t<F>>;

    auto packaged_task =
        std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(task));
    auto future = packaged_task->get_future();

    submit_job_internal([packaged_task]() { (*packaged_task)(); });

    return future;
}

template <typename F>
void thread_adapter::submit_fire_and_forget(F&& task) {
    submit_job_internal(std::forward<F>(task));
}

}  // namespace bitcrush::integration
