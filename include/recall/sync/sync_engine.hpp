/**
 * @file sync_engine.hpp
 * @brief Reconciles the local card store with the remote store
 *
 * One sync_engine exists per login session. activate() pulls the remote
 * partition once and merges it into the local replica; afterwards every
 * local write is mirrored with a fire-and-forget push.
 */

#pragma once

#include <recall/core/card.hpp>
#include <recall/core/result.hpp>
#include <recall/di/ilogger.hpp>
#include <recall/integration/thread_pool_interface.hpp>
#include <recall/sync/remote_store.hpp>
#include <recall/sync/sync_types.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace recall::storage {
class card_database;
}  // namespace recall::storage

namespace recall::sync {

/// Settings key holding the identity the local replica was last reconciled for
inline constexpr std::string_view replica_identity_setting = "sync_identity";

/**
 * @brief Per-session replication engine
 *
 * Conflict rule for cards present on both sides: the replica with the
 * larger progress (repetitions + interval_days) wins, ties go to the
 * remote replica. This can keep an older, more advanced replica over a
 * newer lapse.
 *
 * Pushes are best effort: a failed push is logged and dropped; the next
 * activation on any device is the consistency backstop.
 *
 * Thread Safety: activate() and the push methods must be called from the
 * session thread; push tasks run on the injected pool.
 *
 * @code
 * sync_engine engine(*db, remote, pool, logger);
 * auto result = engine.activate("learner-42");
 * // ... wait for activate() before building study queues ...
 * engine.push(updated_card);
 * @endcode
 */
class sync_engine {
public:
    sync_engine(storage::card_database& store,
                std::shared_ptr<remote_store> remote,
                std::shared_ptr<integration::thread_pool_interface> pool,
                std::shared_ptr<di::ILogger> logger = nullptr);

    ~sync_engine();

    sync_engine(const sync_engine&) = delete;
    auto operator=(const sync_engine&) -> sync_engine& = delete;
    sync_engine(sync_engine&&) = delete;
    auto operator=(sync_engine&&) -> sync_engine& = delete;

    // =========================================================================
    // Activation
    // =========================================================================

    /**
     * @brief Bind the session to @p identity and reconcile once
     *
     * Discards local cards, decks and review logs, then adopts the remote
     * partition. Fetch failures are reported in sync_result::errors and do
     * not fail the call. Repeating the call with the same identity returns
     * the first result without touching any data.
     *
     * @return error_codes::sync_identity_missing for an empty identity
     *         (local data untouched), error_codes::sync_invalid_state when
     *         the session is already bound to another identity, or a store
     *         error if the local wipe fails
     */
    [[nodiscard]] auto activate(std::string_view identity,
                                sync_progress_callback progress = nullptr)
        -> Result<sync_result>;

    /**
     * @brief Bind to @p identity, reconciling only when needed
     *
     * When the local replica was last reconciled cleanly for @p identity
     * (see replica_identity_setting) the session is bound for pushes and
     * local data is left alone. Otherwise this is activate().
     *
     * @return the activation result, or a result with replica_replaced
     *         false when only bound; the same errors as activate()
     */
    [[nodiscard]] auto resume(std::string_view identity,
                              sync_progress_callback progress = nullptr)
        -> Result<sync_result>;

    [[nodiscard]] auto is_activated() const noexcept -> bool;

    /**
     * @brief Bound identity, empty before activation
     */
    [[nodiscard]] auto identity() const -> std::string;

    [[nodiscard]] auto last_result() const -> std::optional<sync_result>;

    // =========================================================================
    // Mirroring
    // =========================================================================

    void push(const card& c);
    void push(const deck& d);
    void push(const review_log& log);

    /**
     * @brief Mirror a local deletion
     */
    void push_delete(entity_kind kind, std::string_view id);

    // =========================================================================
    // Statistics
    // =========================================================================

    [[nodiscard]] auto get_statistics() const -> sync_statistics;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace recall::sync
