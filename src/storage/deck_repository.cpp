/**
 * @file deck_repository.cpp
 * @brief Implementation of the deck repository
 */

#include <recall/storage/deck_repository.hpp>

#include "sqlite_helpers.hpp"

#include <sqlite3.h>

namespace recall::storage {

using namespace detail;

namespace {

[[nodiscard]] auto parse_deck_row(sqlite3_stmt* stmt) -> deck {
    deck d;
    d.id = get_text_column(stmt, 0);
    d.name = get_text_column(stmt, 1);
    d.description = get_optional_text_column(stmt, 2);
    d.created_at = get_time_column(stmt, 3);
    return d;
}

}  // namespace

deck_repository::deck_repository(sqlite3* db) : db_(db) {}

auto deck_repository::save(const deck& d) -> VoidResult {
    const char* sql = R"(
        INSERT INTO decks (id, name, description, created_at)
        VALUES (?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            name = excluded.name,
            description = excluded.description,
            created_at = excluded.created_at
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return db_void_error(db_, "Failed to prepare deck upsert");
    }

    bind_text(stmt, 1, d.id);
    bind_text(stmt, 2, d.name);
    bind_optional_text(stmt, 3, d.description);
    bind_time(stmt, 4, d.created_at);

    return step_done(db_, stmt, "Failed to save deck");
}

auto deck_repository::find_by_id(std::string_view id) const -> Result<deck> {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_,
                           "SELECT id, name, description, created_at FROM decks WHERE id = ?",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return db_error<deck>(db_, "Failed to prepare deck lookup");
    }
    bind_text(stmt, 1, id);

    auto rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        auto found = parse_deck_row(stmt);
        sqlite3_finalize(stmt);
        return found;
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return db_error<deck>(db_, "Failed to look up deck");
    }
    return recall_error<deck>(error_codes::deck_not_found,
                              recall::compat::format("Deck not found: {}", id));
}

auto deck_repository::find_all() const -> Result<std::vector<deck>> {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(
            db_, "SELECT id, name, description, created_at FROM decks ORDER BY created_at, id",
            -1, &stmt, nullptr) != SQLITE_OK) {
        return db_error<std::vector<deck>>(db_, "Failed to prepare deck listing");
    }

    std::vector<deck> decks;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        decks.push_back(parse_deck_row(stmt));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return db_error<std::vector<deck>>(db_, "Failed to read decks");
    }
    return decks;
}

auto deck_repository::remove(std::string_view id) -> VoidResult {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM decks WHERE id = ?", -1, &stmt,
                           nullptr) != SQLITE_OK) {
        return db_void_error(db_, "Failed to prepare deck delete");
    }
    bind_text(stmt, 1, id);
    return step_done(db_, stmt, "Failed to delete deck");
}

auto deck_repository::clear() -> VoidResult {
    return execute(db_, "DELETE FROM decks;");
}

}  // namespace recall::storage
