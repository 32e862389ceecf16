/**
 * @file thread_pool_interface.hpp
 * @brief Background executor used for remote pushes
 *
 * Local writes are committed synchronously; mirroring them to the remote
 * store happens on an executor received through this interface. The CLI
 * hands the sync engine a thread_system pool, tests hand it
 * testing::mock_thread_pool so pushes run when the test decides.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace recall::integration {

/**
 * @struct thread_pool_config
 * @brief Sizing of the push executor
 *
 * Maps to the "threads" section of recall.json.
 */
struct thread_pool_config {
    /// Workers draining the push queue; pushes are independent documents
    std::size_t worker_count = 1;

    /// Name reported by thread_system and in log lines
    std::string pool_name = "recall_sync_pool";
};

/**
 * @brief Executor for fire-and-forget push tasks
 *
 * Implementations must accept submissions from any thread.
 */
class thread_pool_interface {
public:
    virtual ~thread_pool_interface() = default;

    /**
     * @brief Spawn workers; calling it on a running pool returns true
     */
    [[nodiscard]] virtual auto start() -> bool = 0;

    [[nodiscard]] virtual auto is_running() const noexcept -> bool = 0;

    /**
     * @brief Stop the workers
     * @param wait_for_completion Run every queued push before returning
     */
    virtual void shutdown(bool wait_for_completion = true) = 0;

    /**
     * @brief Queue a push task
     *
     * Nobody waits on the task, so it has to record its own outcome in
     * the push counters.
     *
     * @throws std::runtime_error if the task cannot be queued
     */
    virtual void submit_fire_and_forget(std::function<void()> task) = 0;

    /**
     * @brief Pushes queued but not yet picked up by a worker
     */
    [[nodiscard]] virtual auto get_pending_task_count() const -> std::size_t = 0;

protected:
    thread_pool_interface() = default;

    thread_pool_interface(const thread_pool_interface&) = delete;
    thread_pool_interface& operator=(const thread_pool_interface&) = delete;
};

}  // namespace recall::integration
