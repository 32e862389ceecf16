/**
 * @file thread_pool_adapter.cpp
 * @brief Implementation of thread_pool_adapter
 */

#include <recall/integration/thread_pool_adapter.hpp>

#include <recall/integration/logger_adapter.hpp>

#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/interfaces/thread_context.h>

#include <exception>
#include <stdexcept>
#include <utility>
#include <vector>

namespace recall::integration {

thread_pool_adapter::thread_pool_adapter(thread_pool_config config)
    : config_(std::move(config)), counters_(std::make_shared<task_counters>()) {
    if (config_.worker_count == 0) {
        config_.worker_count = 1;
    }
}

thread_pool_adapter::~thread_pool_adapter() {
    shutdown(true);
}

// =============================================================================
// Lifecycle
// =============================================================================

auto thread_pool_adapter::start() -> bool {
    std::lock_guard lock(mutex_);
    return spawn_workers();
}

auto thread_pool_adapter::spawn_workers() -> bool {
    if (running_) {
        return true;
    }

    // Fresh pool per start; a stopped pool is never reused
    kcenon::thread::thread_context context;
    auto pool = std::make_shared<kcenon::thread::thread_pool>(config_.pool_name, context);

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(config_.worker_count);
    for (std::size_t i = 0; i < config_.worker_count; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>(false, context));
    }

    if (auto enqueued = pool->enqueue_batch(std::move(workers)); enqueued.is_err()) {
        logger_adapter::error("{}: could not create {} workers", config_.pool_name,
                              config_.worker_count);
        return false;
    }
    if (auto started = pool->start(); started.is_err()) {
        logger_adapter::error("{}: workers failed to start", config_.pool_name);
        return false;
    }

    pool_ = std::move(pool);
    running_ = true;
    logger_adapter::debug("{}: started {} workers", config_.pool_name, config_.worker_count);
    return true;
}

auto thread_pool_adapter::is_running() const noexcept -> bool {
    std::lock_guard lock(mutex_);
    return running_;
}

void thread_pool_adapter::shutdown(bool wait_for_completion) {
    std::lock_guard lock(mutex_);
    if (!running_) {
        return;
    }

    pool_->stop(!wait_for_completion);
    running_ = false;
    logger_adapter::debug("{}: stopped after {} pushes ({} failed)", config_.pool_name,
                          counters_->completed.load(), counters_->failed.load());
}

// =============================================================================
// Submission
// =============================================================================

void thread_pool_adapter::submit_fire_and_forget(std::function<void()> task) {
    std::lock_guard lock(mutex_);
    if (!spawn_workers()) {
        throw std::runtime_error(config_.pool_name + " is not running");
    }

    std::function<void()> wrapped = [task = std::move(task), counters = counters_,
                                     name = config_.pool_name]() {
        try {
            task();
            counters->completed++;
        } catch (const std::exception& e) {
            counters->failed++;
            logger_adapter::error("{}: push task threw: {}", name, e.what());
        }
    };

    (void)pool_->submit(std::move(wrapped));
}

// =============================================================================
// Statistics
// =============================================================================

auto thread_pool_adapter::get_pending_task_count() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return running_ ? pool_->get_pending_task_count() : 0;
}

auto thread_pool_adapter::get_completed_task_count() const noexcept -> std::size_t {
    return counters_->completed.load();
}

auto thread_pool_adapter::get_failed_task_count() const noexcept -> std::size_t {
    return counters_->failed.load();
}

auto thread_pool_adapter::get_config() const noexcept -> const thread_pool_config& {
    return config_;
}

}  // namespace recall::integration
