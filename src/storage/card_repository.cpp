/**
 * @file card_repository.cpp
 * @brief Implementation of the card repository
 */

#include <recall/storage/card_repository.hpp>

#include "sqlite_helpers.hpp"

#include <sqlite3.h>

namespace recall::storage {

using namespace detail;

namespace {

constexpr const char* select_columns = R"(
    SELECT id, term, meaning, explanation, phonetic, deck_id,
           created_at, updated_at, interval_days, ease_factor,
           repetitions, step, next_review_at
    FROM cards
)";

[[nodiscard]] auto parse_card_row(sqlite3_stmt* stmt) -> card {
    card c;
    c.id = get_text_column(stmt, 0);
    c.term = get_text_column(stmt, 1);
    c.meaning = get_text_column(stmt, 2);
    c.explanation = get_text_column(stmt, 3);
    c.phonetic = get_text_column(stmt, 4);
    c.deck_id = get_optional_text_column(stmt, 5);
    c.created_at = get_time_column(stmt, 6);
    c.updated_at = get_time_column(stmt, 7);
    c.interval_days = get_double_column(stmt, 8);
    c.ease_factor = get_double_column(stmt, 9, initial_ease_factor);
    c.repetitions = get_int_column(stmt, 10);
    c.step = get_int_column(stmt, 11);
    c.next_review_at = get_optional_time_column(stmt, 12);
    return c;
}

[[nodiscard]] auto collect_cards(sqlite3* db, sqlite3_stmt* stmt)
    -> Result<std::vector<card>> {
    std::vector<card> cards;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        cards.push_back(parse_card_row(stmt));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return db_error<std::vector<card>>(db, "Failed to read cards");
    }
    return cards;
}

}  // namespace

card_repository::card_repository(sqlite3* db) : db_(db) {}

auto card_repository::save(const card& c) -> VoidResult {
    const char* sql = R"(
        INSERT INTO cards (
            id, term, meaning, explanation, phonetic, deck_id,
            created_at, updated_at, interval_days, ease_factor,
            repetitions, step, next_review_at
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            term = excluded.term,
            meaning = excluded.meaning,
            explanation = excluded.explanation,
            phonetic = excluded.phonetic,
            deck_id = excluded.deck_id,
            created_at = excluded.created_at,
            updated_at = excluded.updated_at,
            interval_days = excluded.interval_days,
            ease_factor = excluded.ease_factor,
            repetitions = excluded.repetitions,
            step = excluded.step,
            next_review_at = excluded.next_review_at
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return db_void_error(db_, "Failed to prepare card upsert");
    }

    bind_text(stmt, 1, c.id);
    bind_text(stmt, 2, c.term);
    bind_text(stmt, 3, c.meaning);
    bind_text(stmt, 4, c.explanation);
    bind_text(stmt, 5, c.phonetic);
    bind_optional_text(stmt, 6, c.deck_id);
    bind_time(stmt, 7, c.created_at);
    bind_time(stmt, 8, c.updated_at);
    sqlite3_bind_double(stmt, 9, c.interval_days);
    sqlite3_bind_double(stmt, 10, c.ease_factor);
    sqlite3_bind_int(stmt, 11, c.repetitions);
    sqlite3_bind_int(stmt, 12, c.step);
    bind_optional_time(stmt, 13, c.next_review_at);

    return step_done(db_, stmt, "Failed to save card");
}

auto card_repository::find_by_id(std::string_view id) const -> Result<card> {
    const std::string sql = std::string(select_columns) + " WHERE id = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return db_error<card>(db_, "Failed to prepare card lookup");
    }
    bind_text(stmt, 1, id);

    auto rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        auto found = parse_card_row(stmt);
        sqlite3_finalize(stmt);
        return found;
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return db_error<card>(db_, "Failed to look up card");
    }
    return recall_error<card>(error_codes::card_not_found,
                              recall::compat::format("Card not found: {}", id));
}

auto card_repository::find_all() const -> Result<std::vector<card>> {
    const std::string sql = std::string(select_columns) + " ORDER BY created_at, id";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return db_error<std::vector<card>>(db_, "Failed to prepare card listing");
    }
    return collect_cards(db_, stmt);
}

auto card_repository::find_by_deck(const std::optional<std::string>& deck_id) const
    -> Result<std::vector<card>> {
    const std::string sql =
        std::string(select_columns) +
        (deck_id ? " WHERE deck_id = ?" : " WHERE deck_id IS NULL") +
        " ORDER BY created_at, id";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return db_error<std::vector<card>>(db_, "Failed to prepare deck card listing");
    }
    if (deck_id) {
        bind_text(stmt, 1, *deck_id);
    }
    return collect_cards(db_, stmt);
}

auto card_repository::remove(std::string_view id) -> VoidResult {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM cards WHERE id = ?", -1, &stmt,
                           nullptr) != SQLITE_OK) {
        return db_void_error(db_, "Failed to prepare card delete");
    }
    bind_text(stmt, 1, id);
    return step_done(db_, stmt, "Failed to delete card");
}

auto card_repository::remove_by_deck(std::string_view deck_id) -> Result<std::size_t> {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM cards WHERE deck_id = ?", -1, &stmt,
                           nullptr) != SQLITE_OK) {
        return db_error<std::size_t>(db_, "Failed to prepare deck card delete");
    }
    bind_text(stmt, 1, deck_id);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return db_error<std::size_t>(db_, "Failed to delete deck cards");
    }
    return static_cast<std::size_t>(sqlite3_changes(db_));
}

auto card_repository::count() const -> Result<std::size_t> {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM cards", -1, &stmt, nullptr) !=
        SQLITE_OK) {
        return db_error<std::size_t>(db_, "Failed to prepare card count");
    }
    std::size_t total = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        total = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return total;
}

auto card_repository::clear() -> VoidResult {
    return execute(db_, "DELETE FROM cards;");
}

}  // namespace recall::storage
