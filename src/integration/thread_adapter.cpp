/**
 * @file thread_adapter.cpp
 * @brief Implementation of thread_adapter for thread_system integration
 */

#include <bitcrush/integration/thread_adapter.hpp>

#include <kcenon/thread/core/thread_pool.h>

#include <stdexcept>

namespace bitcrush::integration {

// ─────────────────────────────────────────────────────
// Static Member Definitions
// ─────────────────────────────────────────────────────

std::shared_ptr<kcenon::thread::thread_pool> thread_adapter::pool_ = nullptr;
thread_pool_config thread_adapter::config_;
std::mutex thread_adapter::mutex_;
bool thread_adapter::initialized_ = false;

// ─────────────────────────────────────────────────────
// Thread Pool Management
// ─────────────────────────────────────────────────────

auto thread_adapter::get_pool() -> std::shared_ptr<kcenon::thread::thread_pool> {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!pool_) {
        pool_ = std::make_shared<kcenon::thread::thread_pool>(config_.pool_name);
    }

    return pool_;
}

void thread_adapter::configure(const thread_pool_config& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;

    if (config_.worker_count == 0) {
        config_.worker_count = 1;
    }
}

auto thread_adapter::get_config() -> thread_pool_config {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

auto thread_adapter::start() -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return start_locked();
}

auto thread_adapter::start_locked() -> bool {
    if (initialized_ && pool_ && pool_->is_running()) {
        return true;  // Already running
    }

    if (!pool_) {
        pool_ = std::make_shared<kcenon::thread::thread_pool>(config_.pool_name);
    }

    for (std::size_t i = 0; i < config_.worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool_->get_job_queue());
        auto result = pool_->enqueue(std::move(worker));
        if (!result) {
            return false;
        }
    }

    auto start_result = pool_->start();
    if (!start_result) {
        return false;
    }

    initialized_ = true;
    return true;
}

auto thread_adapter::is_running() -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_ && pool_->is_running();
}

void thread_adapter::shutdown(bool wait_for_completion) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (pool_) {
        pool_->stop(!wait_for_completion);
        pool_.reset();
    }

    initialized_ = false;
}

// ─────────────────────────────────────────────────────
// Job Submission Internal
// ─────────────────────────────────────────────────────

void thread_adapter::submit_job_internal(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!pool_ || !pool_->is_running()) {
        if (!start_locked()) {
            throw std::runtime_error("Failed to start transform pool");
        }
    }

    if (!pool_->submit_task(std::move(task))) {
        throw std::runtime_error("Failed to submit task to transform pool");
    }
}

// ─────────────────────────────────────────────────────
// Statistics
// ─────────────────────────────────────────────────────

auto thread_adapter::get_thread_count() -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pool_) {
        return pool_->get_thread_count();
    }
    return 0;
}

auto thread_adapter::get_pending_job_count() -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pool_) {
        return pool_->get_pending_task_count();
    }
    return 0;
}

auto thread_adapter::get_idle_worker_count() -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pool_) {
        return pool_->get_idle_worker_count();
    }
    return 0;
}

auto thread_adapter::get_statistics() -> pool_statistics {
    std::lock_guard<std::mutex> lock(mutex_);
    pool_statistics stats;
    if (pool_) {
        stats.running = pool_->is_running();
        stats.thread_count = pool_->get_thread_count();
        stats.pending_jobs = pool_->get_pending_task_count();
        stats.idle_workers = pool_->get_idle_worker_count();
    }
    return stats;
}

}  // namespace bitcrush::integration
