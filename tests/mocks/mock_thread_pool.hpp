/**
 * @file mock_thread_pool.hpp
 * @brief Mock implementation of thread_pool_interface for testing
 *
 * Lets sync tests decide when remote pushes actually run.
 */

#pragma once

#include <recall/integration/thread_pool_interface.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace recall::integration::testing {

/**
 * @brief Mock implementation of thread_pool_interface
 *
 * Modes of operation:
 * - **Synchronous mode**: tasks run immediately on the calling thread
 * - **Recording mode**: tasks are queued until run_pending() is called
 * - **Failure mode**: submissions throw std::runtime_error
 *
 * Thread Safety: All public methods are thread-safe.
 *
 * @code
 * auto pool = std::make_shared<mock_thread_pool>();
 * pool->set_execution_mode(mock_thread_pool::execution_mode::recording);
 * engine.push(card);
 * REQUIRE(pool->get_pending_task_count() == 1);
 * pool->run_pending();
 * @endcode
 */
class mock_thread_pool final : public thread_pool_interface {
public:
    enum class execution_mode {
        synchronous,  ///< Execute tasks immediately on calling thread
        recording     ///< Queue tasks until run_pending()
    };

    mock_thread_pool() = default;
    ~mock_thread_pool() override = default;

    mock_thread_pool(const mock_thread_pool&) = delete;
    mock_thread_pool& operator=(const mock_thread_pool&) = delete;
    mock_thread_pool(mock_thread_pool&&) = delete;
    mock_thread_pool& operator=(mock_thread_pool&&) = delete;

    // =========================================================================
    // thread_pool_interface Implementation
    // =========================================================================

    [[nodiscard]] auto start() -> bool override {
        running_ = true;
        return true;
    }

    [[nodiscard]] auto is_running() const noexcept -> bool override {
        return running_;
    }

    void shutdown(bool wait_for_completion = true) override {
        if (wait_for_completion) {
            run_pending();
        }
        running_ = false;
    }

    void submit_fire_and_forget(std::function<void()> task) override {
        if (should_fail_submit_) {
            throw std::runtime_error("mock_thread_pool: submission rejected");
        }
        ++submitted_count_;
        if (mode_ == execution_mode::synchronous) {
            task();
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push_back(std::move(task));
    }

    [[nodiscard]] auto get_pending_task_count() const -> std::size_t override {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

    // =========================================================================
    // Test Configuration
    // =========================================================================

    void set_execution_mode(execution_mode mode) { mode_ = mode; }

    void set_should_fail_submit(bool fail) { should_fail_submit_ = fail; }

    /**
     * @brief Execute queued tasks in submission order
     * @return Number of tasks executed
     */
    auto run_pending() -> std::size_t {
        std::vector<std::function<void()>> tasks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tasks.swap(pending_);
        }
        for (auto& task : tasks) {
            task();
        }
        return tasks.size();
    }

    [[nodiscard]] auto get_submitted_task_count() const noexcept -> std::size_t {
        return submitted_count_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::function<void()>> pending_;
    std::atomic<bool> running_{false};
    std::atomic<bool> should_fail_submit_{false};
    std::atomic<std::size_t> submitted_count_{0};
    execution_mode mode_{execution_mode::synchronous};
};

}  // namespace recall::integration::testing
