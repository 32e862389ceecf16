/**
 * @file deck_repository.hpp
 * @brief SQLite persistence for decks
 */

#pragma once

#include <recall/core/card.hpp>
#include <recall/core/result.hpp>

#include <string_view>
#include <vector>

struct sqlite3;

namespace recall::storage {

/**
 * @brief Repository for deck rows
 *
 * Removing a deck does not touch its cards; the cascade is performed by
 * card_database::remove_deck_cascade inside a single transaction.
 *
 * Thread Safety: NOT thread-safe.
 */
class deck_repository {
public:
    explicit deck_repository(sqlite3* db);

    [[nodiscard]] auto save(const deck& d) -> VoidResult;

    /**
     * @return error_codes::deck_not_found if absent
     */
    [[nodiscard]] auto find_by_id(std::string_view id) const -> Result<deck>;

    /**
     * @brief All decks ordered by creation time
     */
    [[nodiscard]] auto find_all() const -> Result<std::vector<deck>>;

    [[nodiscard]] auto remove(std::string_view id) -> VoidResult;

    [[nodiscard]] auto clear() -> VoidResult;

private:
    sqlite3* db_{nullptr};
};

}  // namespace recall::storage
