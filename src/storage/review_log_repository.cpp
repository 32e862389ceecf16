/**
 * @file review_log_repository.cpp
 * @brief Implementation of the review log repository
 */

#include <recall/storage/review_log_repository.hpp>

#include "sqlite_helpers.hpp"

#include <sqlite3.h>

namespace recall::storage {

using namespace detail;

review_log_repository::review_log_repository(sqlite3* db) : db_(db) {}

auto review_log_repository::save(const review_log& log) -> VoidResult {
    const char* sql = R"(
        INSERT INTO review_logs (id, card_id, rating, reviewed_at)
        VALUES (?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            card_id = excluded.card_id,
            rating = excluded.rating,
            reviewed_at = excluded.reviewed_at
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return db_void_error(db_, "Failed to prepare review log insert");
    }

    bind_text(stmt, 1, log.id);
    bind_text(stmt, 2, log.card_id);
    bind_text(stmt, 3, to_string(log.rating));
    bind_time(stmt, 4, log.reviewed_at);

    return step_done(db_, stmt, "Failed to save review log");
}

auto review_log_repository::find_all() const -> Result<std::vector<review_log>> {
    return query(
        "SELECT id, card_id, rating, reviewed_at FROM review_logs "
        "ORDER BY reviewed_at, id",
        std::nullopt);
}

auto review_log_repository::find_since(time_point from) const
    -> Result<std::vector<review_log>> {
    return query(
        "SELECT id, card_id, rating, reviewed_at FROM review_logs "
        "WHERE reviewed_at >= ? ORDER BY reviewed_at, id",
        from);
}

auto review_log_repository::count_since(time_point from) const -> Result<std::size_t> {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM review_logs WHERE reviewed_at >= ?",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return db_error<std::size_t>(db_, "Failed to prepare review log count");
    }
    bind_time(stmt, 1, from);

    std::size_t total = 0;
    auto rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        total = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW) {
        return db_error<std::size_t>(db_, "Failed to count review logs");
    }
    return total;
}

auto review_log_repository::clear() -> VoidResult {
    return execute(db_, "DELETE FROM review_logs;");
}

auto review_log_repository::query(const char* sql, std::optional<time_point> from) const
    -> Result<std::vector<review_log>> {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return db_error<std::vector<review_log>>(db_, "Failed to prepare review log query");
    }
    if (from) {
        bind_time(stmt, 1, *from);
    }

    std::vector<review_log> logs;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        review_log log;
        log.id = get_text_column(stmt, 0);
        log.card_id = get_text_column(stmt, 1);
        // CHECK constraint guarantees a valid name
        log.rating = rating_from_string(get_text_column(stmt, 2)).value_or(rating::again);
        log.reviewed_at = get_time_column(stmt, 3);
        logs.push_back(std::move(log));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return db_error<std::vector<review_log>>(db_, "Failed to read review logs");
    }
    return logs;
}

}  // namespace recall::storage
