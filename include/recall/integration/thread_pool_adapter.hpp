/**
 * @file thread_pool_adapter.hpp
 * @brief Push executor running on kcenon thread_system
 */

#pragma once

#include <recall/integration/thread_pool_interface.hpp>

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>

namespace kcenon::thread {
class thread_pool;
}  // namespace kcenon::thread

namespace recall::integration {

/**
 * @class thread_pool_adapter
 * @brief thread_pool_interface backed by kcenon::thread::thread_pool
 *
 * Workers are spawned by start() or, failing that, by the first
 * submission. Each task is wrapped so that an exception escaping a push
 * is logged through logger_adapter and counted instead of reaching the
 * worker loop.
 *
 * Thread Safety: All public methods are thread-safe.
 */
class thread_pool_adapter final : public thread_pool_interface {
public:
    /**
     * @param config Pool sizing; a worker_count of 0 is raised to 1
     */
    explicit thread_pool_adapter(thread_pool_config config);

    /// Drains queued pushes before the workers are joined
    ~thread_pool_adapter() override;

    thread_pool_adapter(const thread_pool_adapter&) = delete;
    thread_pool_adapter& operator=(const thread_pool_adapter&) = delete;

    [[nodiscard]] auto start() -> bool override;
    [[nodiscard]] auto is_running() const noexcept -> bool override;
    void shutdown(bool wait_for_completion = true) override;

    void submit_fire_and_forget(std::function<void()> task) override;

    [[nodiscard]] auto get_pending_task_count() const -> std::size_t override;

    /// Tasks that ran to completion
    [[nodiscard]] auto get_completed_task_count() const noexcept -> std::size_t;

    /// Tasks that threw
    [[nodiscard]] auto get_failed_task_count() const noexcept -> std::size_t;

    [[nodiscard]] auto get_config() const noexcept -> const thread_pool_config&;

private:
    [[nodiscard]] auto spawn_workers() -> bool;

    struct task_counters {
        std::atomic<std::size_t> completed{0};
        std::atomic<std::size_t> failed{0};
    };

    thread_pool_config config_;
    std::shared_ptr<kcenon::thread::thread_pool> pool_;
    std::shared_ptr<task_counters> counters_;
    mutable std::mutex mutex_;
    bool running_{false};
};

}  // namespace recall::integration
