/**
 * @file card_repository.hpp
 * @brief SQLite persistence for vocabulary cards
 */

#pragma once

#include <recall/core/card.hpp>
#include <recall/core/result.hpp>

#include <cstddef>
#include <string_view>
#include <vector>

struct sqlite3;

namespace recall::storage {

/**
 * @brief Repository for card rows
 *
 * Every write is a single statement, so a concurrent reader sees either
 * the previous or the new version of a card and never a mix.
 *
 * Thread Safety:
 * - This class is NOT thread-safe. External synchronization is required
 *   for concurrent access.
 */
class card_repository {
public:
    /**
     * @param db SQLite handle (must outlive the repository)
     */
    explicit card_repository(sqlite3* db);
    ~card_repository() = default;

    card_repository(const card_repository&) = delete;
    auto operator=(const card_repository&) -> card_repository& = delete;
    card_repository(card_repository&&) noexcept = default;
    auto operator=(card_repository&&) noexcept -> card_repository& = default;

    /**
     * @brief Insert or replace the card with the same id
     */
    [[nodiscard]] auto save(const card& c) -> VoidResult;

    /**
     * @brief Find a card by id
     * @return error_codes::card_not_found if absent
     */
    [[nodiscard]] auto find_by_id(std::string_view id) const -> Result<card>;

    [[nodiscard]] auto find_all() const -> Result<std::vector<card>>;

    /**
     * @brief Cards belonging to a deck, or uncategorized cards if @p deck_id
     *        is std::nullopt
     */
    [[nodiscard]] auto find_by_deck(const std::optional<std::string>& deck_id) const
        -> Result<std::vector<card>>;

    /**
     * @brief Remove a card; removing a missing card is not an error
     */
    [[nodiscard]] auto remove(std::string_view id) -> VoidResult;

    /**
     * @brief Remove every card of a deck
     * @return Number of removed cards
     */
    [[nodiscard]] auto remove_by_deck(std::string_view deck_id) -> Result<std::size_t>;

    [[nodiscard]] auto count() const -> Result<std::size_t>;

    /**
     * @brief Remove all cards
     */
    [[nodiscard]] auto clear() -> VoidResult;

private:
    sqlite3* db_{nullptr};
};

}  // namespace recall::storage
