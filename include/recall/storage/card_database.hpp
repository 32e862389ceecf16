/**
 * @file card_database.hpp
 * @brief Local SQLite card store: connection, schema and repositories
 *
 * card_database is the authoritative local replica of a learner's cards,
 * decks and review logs, plus device-local settings. It owns the SQLite
 * connection and hands out per-entity repositories bound to it.
 */

#pragma once

#include <recall/core/result.hpp>
#include <recall/storage/card_repository.hpp>
#include <recall/storage/deck_repository.hpp>
#include <recall/storage/review_log_repository.hpp>
#include <recall/storage/settings_repository.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

struct sqlite3;

namespace recall::storage {

/**
 * @brief Open options for the card store
 */
struct card_database_config {
    /// Use write-ahead logging (ignored for ":memory:")
    bool wal_mode{true};

    /// Milliseconds SQLite waits on a locked database
    int busy_timeout_ms{5000};
};

/**
 * @brief Owner of the local card store connection
 *
 * @code
 * auto db = card_database::open("recall.db");
 * if (db.is_err()) { ... }
 * auto& store = *db.value();
 * auto cards = store.cards().find_all();
 * @endcode
 *
 * Thread Safety: NOT thread-safe; one session thread owns it.
 */
class card_database {
public:
    /**
     * @brief Open or create a database and migrate it to the latest schema
     * @param db_path File path, or ":memory:" for a private in-memory store
     */
    [[nodiscard]] static auto open(std::string_view db_path)
        -> Result<std::unique_ptr<card_database>>;

    [[nodiscard]] static auto open(std::string_view db_path,
                                   const card_database_config& config)
        -> Result<std::unique_ptr<card_database>>;

    ~card_database();

    card_database(const card_database&) = delete;
    auto operator=(const card_database&) -> card_database& = delete;
    card_database(card_database&&) = delete;
    auto operator=(card_database&&) -> card_database& = delete;

    // =========================================================================
    // Repositories
    // =========================================================================

    [[nodiscard]] auto cards() noexcept -> card_repository& { return cards_; }
    [[nodiscard]] auto cards() const noexcept -> const card_repository& { return cards_; }

    [[nodiscard]] auto decks() noexcept -> deck_repository& { return decks_; }
    [[nodiscard]] auto decks() const noexcept -> const deck_repository& { return decks_; }

    [[nodiscard]] auto review_logs() noexcept -> review_log_repository& { return logs_; }
    [[nodiscard]] auto review_logs() const noexcept -> const review_log_repository& {
        return logs_;
    }

    [[nodiscard]] auto settings() noexcept -> settings_repository& { return settings_; }
    [[nodiscard]] auto settings() const noexcept -> const settings_repository& {
        return settings_;
    }

    // =========================================================================
    // Multi-table Operations
    // =========================================================================

    /**
     * @brief Delete a deck and every card assigned to it in one transaction
     * @return Number of cards removed
     */
    [[nodiscard]] auto remove_deck_cascade(std::string_view deck_id) -> Result<std::size_t>;

    /**
     * @brief Store a rescheduled card and its review log in one transaction
     *
     * Either both rows are written or neither is.
     */
    [[nodiscard]] auto record_review(const card& updated, const review_log& log)
        -> VoidResult;

    /**
     * @brief Discard all cards, decks and review logs in one transaction
     *
     * Settings are kept.
     */
    [[nodiscard]] auto clear_replica() -> VoidResult;

    [[nodiscard]] auto path() const noexcept -> const std::string& { return path_; }

    [[nodiscard]] auto native_handle() const noexcept -> sqlite3* { return db_; }

private:
    card_database(sqlite3* db, std::string path);

    [[nodiscard]] auto begin() -> VoidResult;
    [[nodiscard]] auto commit() -> VoidResult;
    void rollback();

    sqlite3* db_{nullptr};
    std::string path_;
    card_repository cards_;
    deck_repository decks_;
    review_log_repository logs_;
    settings_repository settings_;
};

}  // namespace recall::storage
