/**
 * @file sync_types.hpp
 * @brief Types shared by the remote store adapter and the sync engine
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace recall::sync {

// =============================================================================
// Entity Kinds
// =============================================================================

/**
 * @brief Replicated collections inside a learner's remote partition
 */
enum class entity_kind {
    card,
    deck,
    review_log
};

/**
 * @brief Remote collection name for an entity kind
 */
[[nodiscard]] constexpr auto to_string(entity_kind kind) noexcept -> std::string_view {
    switch (kind) {
        case entity_kind::card: return "flashcards";
        case entity_kind::deck: return "decks";
        case entity_kind::review_log: return "logs";
    }
    return "flashcards";
}

[[nodiscard]] inline auto entity_kind_from_string(std::string_view name)
    -> std::optional<entity_kind> {
    for (auto kind : {entity_kind::card, entity_kind::deck, entity_kind::review_log}) {
        if (to_string(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Activation Result
// =============================================================================

/**
 * @brief Outcome of a login-time reconciliation
 *
 * success is true even when some fetches failed: whatever was adopted is
 * kept and the failures are listed in errors.
 */
struct sync_result {
    std::string identity;
    bool success{false};

    /// false when sync_engine::resume() bound the session without reconciling
    bool replica_replaced{false};

    // =========================================================================
    // Counts
    // =========================================================================

    std::size_t cards_fetched{0};
    std::size_t cards_adopted{0};     ///< Remote replica written locally
    std::size_t cards_kept_local{0};  ///< Local replica won and was re-pushed
    std::size_t decks_adopted{0};
    std::size_t logs_adopted{0};
    std::size_t documents_skipped{0}; ///< Undecodable remote documents

    // =========================================================================
    // Issues
    // =========================================================================

    std::vector<std::string> errors;

    // =========================================================================
    // Timing
    // =========================================================================

    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point completed_at;
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Cumulative counters of a sync engine
 */
struct sync_statistics {
    std::size_t pushes_submitted{0};
    std::size_t pushes_failed{0};
    std::size_t deletes_submitted{0};
    std::size_t deletes_failed{0};
};

// =============================================================================
// Callbacks
// =============================================================================

/**
 * @brief Activation progress callback
 *
 * @param kind Collection being processed
 * @param processed Documents of that collection processed so far
 * @param total Documents fetched for that collection
 */
using sync_progress_callback = std::function<void(
    entity_kind kind,
    std::size_t processed,
    std::size_t total)>;

}  // namespace recall::sync
