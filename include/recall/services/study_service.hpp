/**
 * @file study_service.hpp
 * @brief Application-level study operations
 *
 * study_service is the single entry point the front end uses to change
 * learner data. Each operation writes the local card store first and then
 * mirrors the change through the sync engine, if one is attached.
 */

#pragma once

#include <recall/core/card.hpp>
#include <recall/core/result.hpp>
#include <recall/di/ilogger.hpp>
#include <recall/scheduling/scheduler.hpp>

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace recall::storage {
class card_database;
}  // namespace recall::storage

namespace recall::sync {
class sync_engine;
}  // namespace recall::sync

namespace recall::services {

/**
 * @brief Content of a card being saved from a lookup
 */
struct new_card {
    std::string term;
    std::string meaning;
    std::string explanation;
    std::string phonetic;
    std::optional<std::string> deck_id;
};

enum class save_outcome {
    added,
    not_added  ///< Same term already saved in the same deck
};

/**
 * @brief Result of save_card(): the stored card, or the existing duplicate
 */
struct save_result {
    save_outcome outcome{save_outcome::added};
    recall::card card;
};

/**
 * @brief Rejected row of a bulk import
 */
struct import_issue {
    std::size_t line{0};  ///< 1-based line number in the input
    std::string message;
};

struct import_report {
    std::size_t imported{0};
    std::size_t duplicates{0};
    std::vector<import_issue> issues;  ///< malformed rows and duplicates
};

/**
 * @brief Normalized form used for duplicate detection (trimmed, lowercase)
 *
 * Only ASCII letters are folded. Bytes of multi-byte UTF-8 sequences are
 * kept as-is, so "Éclat" and "éclat" are different terms.
 */
[[nodiscard]] auto normalize_term(std::string_view term) -> std::string;

/**
 * @brief Orchestrates scheduler, card store and sync engine
 *
 * Thread Safety: NOT thread-safe; owned by the session thread.
 */
class study_service {
public:
    /**
     * @param sync Optional; without it the service is purely local
     */
    study_service(storage::card_database& store,
                  scheduling::scheduler sched,
                  std::shared_ptr<sync::sync_engine> sync = nullptr,
                  std::shared_ptr<di::ILogger> logger = nullptr);

    // =========================================================================
    // Cards
    // =========================================================================

    /**
     * @brief Save a looked-up term as a new card, due immediately
     *
     * A duplicate is reported through save_outcome::not_added, not as an
     * error.
     * @return error_codes::empty_term for a blank term
     */
    [[nodiscard]] auto save_card(const new_card& content, time_point now)
        -> Result<save_result>;

    /**
     * @brief Cards of a deck, or all cards when @p deck_id is std::nullopt
     */
    [[nodiscard]] auto list_cards(const std::optional<std::string>& deck_id) const
        -> Result<std::vector<card>>;

    /**
     * @brief Bulk import of tab-separated rows
     *
     * Row format: term TAB meaning [TAB explanation [TAB phonetic]]. Blank
     * lines and lines starting with '#' are ignored. Malformed rows and
     * duplicates are reported per line; other rows are imported.
     * @return An error only if the store fails
     */
    [[nodiscard]] auto import_cards(std::string_view rows,
                                    const std::optional<std::string>& deck_id,
                                    time_point now) -> Result<import_report>;

    // =========================================================================
    // Decks
    // =========================================================================

    /**
     * @return error_codes::invalid_argument for a blank name
     */
    [[nodiscard]] auto create_deck(std::string_view name,
                                   std::optional<std::string> description,
                                   time_point now) -> Result<deck>;

    [[nodiscard]] auto list_decks() const -> Result<std::vector<deck>>;

    /**
     * @brief Delete a deck together with all of its cards
     * @return Number of cards removed, or error_codes::deck_not_found
     */
    [[nodiscard]] auto delete_deck(std::string_view deck_id) -> Result<std::size_t>;

    // =========================================================================
    // Reviews
    // =========================================================================

    /**
     * @brief Apply a rating: reschedule the card, persist it, log the review
     *        and mirror both writes
     * @return The updated card, or error_codes::card_not_found
     */
    [[nodiscard]] auto submit_review(std::string_view card_id, rating r, time_point now)
        -> Result<card>;

    /**
     * @brief Resulting intervals of each rating for a stored card
     */
    [[nodiscard]] auto preview(std::string_view card_id, time_point now) const
        -> Result<std::array<scheduling::interval_preview, 4>>;

    // =========================================================================
    // Daily Limit
    // =========================================================================

    [[nodiscard]] auto daily_limit() const -> Result<int>;

    /**
     * @return error_codes::invalid_daily_limit for @p limit <= 0; the
     *         previous limit stays in effect
     */
    [[nodiscard]] auto set_daily_limit(int limit) -> VoidResult;

private:
    [[nodiscard]] auto find_duplicate(const std::vector<card>& existing,
                                      const new_card& content) const
        -> std::optional<card>;

    storage::card_database& store_;
    scheduling::scheduler scheduler_;
    std::shared_ptr<sync::sync_engine> sync_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace recall::services
