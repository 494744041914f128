/**
 * @file thread_adapter.cpp
 * @brief Implementation of thread_adapter for thread_system integration
 */

#include <tagcheck/integration/thread_adapter.hpp>

#include <kcenon/thread/core/thread_pool.h>

#include <exception>

namespace tagcheck::integration {

// ─────────────────────────────────────────────────────
// Static Member Definitions
// ─────────────────────────────────────────────────────

std::shared_ptr<kcenon::thread::thread_pool> thread_adapter::pool_ = nullptr;
thread_pool_config thread_adapter::config_;
std::mutex thread_adapter::mutex_;

// ─────────────────────────────────────────────────────
// Thread Pool Management
// ─────────────────────────────────────────────────────

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

auto thread_adapter::start() -> VoidResult {
    std::lock_guard<std::mutex> lock(mutex_);

    if (pool_ && pool_->is_running()) {
        return ok();
    }

    pool_ = std::make_shared<kcenon::thread::thread_pool>(config_.pool_name);

    const std::size_t workers = config_.worker_count == 0 ? 1 : config_.worker_count;
    for (std::size_t i = 0; i < workers; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool_->get_job_queue());
        auto enqueued = pool_->enqueue(std::move(worker));
        if (!enqueued) {
            pool_.reset();
            return tagcheck_void_error(error_codes::pool_worker_rejected,
                                       "Thread pool rejected a worker",
                                       "worker " + std::to_string(i));
        }
    }

    auto started = pool_->start();
    if (!started) {
        pool_.reset();
        return tagcheck_void_error(error_codes::pool_start_failed,
                                   "Failed to start thread pool", config_.pool_name);
    }

    return ok();
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
}

// ─────────────────────────────────────────────────────
// Job Submission Internal
// ─────────────────────────────────────────────────────

auto thread_adapter::submit_job_internal(std::function<void()> task) -> VoidResult {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!pool_ || !pool_->is_running()) {
        return tagcheck_void_error(error_codes::pool_submit_failed,
                                   "Thread pool is not running");
    }

    if (!pool_->submit_task(std::move(task))) {
        return tagcheck_void_error(error_codes::pool_submit_failed,
                                   "Failed to submit task to thread pool", config_.pool_name);
    }

    return ok();
}

void thread_adapter::wait_all(std::vector<std::future<void>>& futures) {
    std::exception_ptr first_failure;
    for (auto& future : futures) {
        if (!future.valid()) {
            continue;
        }
        try {
            future.get();
        } catch (...) {
            if (!first_failure) {
                first_failure = std::current_exception();
            }
        }
    }
    if (first_failure) {
        std::rethrow_exception(first_failure);
    }
}

// ─────────────────────────────────────────────────────
// Statistics
// ─────────────────────────────────────────────────────

auto thread_adapter::get_thread_count() -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_ ? pool_->get_thread_count() : 0;
}

auto thread_adapter::get_pending_job_count() -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_ ? pool_->get_pending_task_count() : 0;
}

}  // namespace tagcheck::integration
