/**
 * @file due_selector.hpp
 * @brief Builds the bounded, ordered study queue
 */

#pragma once

#include <recall/core/card.hpp>
#include <recall/core/result.hpp>
#include <recall/di/ilogger.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace recall::storage {
class card_database;
}  // namespace recall::storage

namespace recall::scheduling {

/**
 * @brief Queue sizing numbers behind a due_cards() call
 */
struct due_summary {
    /// Non-mastered cards due now (after deck filtering)
    std::size_t due_total{0};

    /// Reviews logged since local midnight, across all decks
    std::size_t studied_today{0};

    int daily_limit{0};

    /// Cards the learner may still review today
    std::size_t quota{0};

    /// Due cards withheld by the daily limit
    std::size_t backlog{0};
};

/**
 * @brief Orders due cards for study: learning phase before review phase,
 *        then oldest due time first
 *
 * Pure helper used by due_selector; exposed for reuse and tests.
 */
void sort_for_study(std::vector<card>& cards);

/**
 * @brief Read-only selector over the local card store
 *
 * The daily limit is global: studying one deck consumes the allowance of
 * all others.
 *
 * Thread Safety: NOT thread-safe (shares the store's connection).
 */
class due_selector {
public:
    explicit due_selector(storage::card_database& store,
                          std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Cards to study now, already truncated to the remaining quota
     * @param deck_id Restrict to one deck; std::nullopt for all cards
     */
    [[nodiscard]] auto due_cards(const std::optional<std::string>& deck_id,
                                 time_point now) const -> Result<std::vector<card>>;

    /**
     * @brief Queue sizing without materializing the queue
     */
    [[nodiscard]] auto summary(const std::optional<std::string>& deck_id,
                               time_point now) const -> Result<due_summary>;

private:
    [[nodiscard]] auto collect_due(const std::optional<std::string>& deck_id,
                                   time_point now) const -> Result<std::vector<card>>;
    [[nodiscard]] auto remaining_quota(time_point now, due_summary& out) const
        -> VoidResult;

    storage::card_database& store_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace recall::scheduling
