/**
 * @file migration_runner.cpp
 * @brief Implementation of the local card store schema migrations
 */

#include <recall/storage/migration_runner.hpp>

#include <recall/compat/format.hpp>

#include <sqlite3.h>

#include <string>

namespace recall::storage {

// ============================================================================
// Construction
// ============================================================================

migration_runner::migration_runner() {
    migrations_.push_back({1, [this](sqlite3* db) { return migrate_v1(db); }});
}

// ============================================================================
// Migration Operations
// ============================================================================

auto migration_runner::run_migrations(sqlite3* db) -> VoidResult {
    return run_migrations_to(db, LATEST_VERSION);
}

auto migration_runner::run_migrations_to(sqlite3* db, int target_version)
    -> VoidResult {
    if (target_version > LATEST_VERSION) {
        return recall_void_error(
            error_codes::database_migration_error,
            recall::compat::format("Target version {} exceeds latest version {}",
                                   target_version, LATEST_VERSION));
    }

    auto ensure_result = ensure_schema_version_table(db);
    if (ensure_result.is_err()) {
        return ensure_result;
    }

    auto current_version = get_current_version(db);

    while (current_version < target_version) {
        auto next_version = current_version + 1;

        auto begin_result = execute_sql(db, "BEGIN TRANSACTION;");
        if (begin_result.is_err()) {
            return begin_result;
        }

        auto migration_result = apply_migration(db, next_version);
        if (migration_result.is_err()) {
            (void)execute_sql(db, "ROLLBACK;");
            return migration_result;
        }

        auto commit_result = execute_sql(db, "COMMIT;");
        if (commit_result.is_err()) {
            (void)execute_sql(db, "ROLLBACK;");
            return commit_result;
        }

        current_version = next_version;
    }

    return ok();
}

// ============================================================================
// Version Information
// ============================================================================

auto migration_runner::get_current_version(sqlite3* db) const -> int {
    const char* check_sql =
        "SELECT name FROM sqlite_master WHERE type='table' AND name='schema_version';";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, check_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW) {
        return 0;
    }

    if (sqlite3_prepare_v2(db, "SELECT MAX(version) FROM schema_version;", -1,
                           &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    int version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        version = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);

    return version;
}

auto migration_runner::get_latest_version() const noexcept -> int {
    return LATEST_VERSION;
}

auto migration_runner::needs_migration(sqlite3* db) const -> bool {
    return get_current_version(db) < LATEST_VERSION;
}

// ============================================================================
// Internal Implementation
// ============================================================================

auto migration_runner::ensure_schema_version_table(sqlite3* db) -> VoidResult {
    return execute_sql(db, R"(
        CREATE TABLE IF NOT EXISTS schema_version (
            version     INTEGER PRIMARY KEY,
            description TEXT NOT NULL,
            applied_at  TEXT NOT NULL DEFAULT (datetime('now'))
        );
    )");
}

auto migration_runner::apply_migration(sqlite3* db, int version) -> VoidResult {
    for (const auto& [ver, func] : migrations_) {
        if (ver == version) {
            return func(db);
        }
    }

    return recall_void_error(
        error_codes::database_migration_error,
        recall::compat::format("Migration for version {} not found", version));
}

auto migration_runner::record_migration(sqlite3* db, int version,
                                        std::string_view description)
    -> VoidResult {
    const char* sql =
        "INSERT INTO schema_version (version, description) VALUES (?, ?);";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return recall_void_error(
            error_codes::database_migration_error,
            recall::compat::format("Failed to prepare statement: {}", sqlite3_errmsg(db)));
    }

    sqlite3_bind_int(stmt, 1, version);
    sqlite3_bind_text(stmt, 2, description.data(),
                      static_cast<int>(description.size()), SQLITE_TRANSIENT);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return recall_void_error(
            error_codes::database_migration_error,
            recall::compat::format("Failed to record migration: {}", sqlite3_errmsg(db)));
    }

    return ok();
}

auto migration_runner::execute_sql(sqlite3* db, std::string_view sql)
    -> VoidResult {
    char* errmsg = nullptr;
    const std::string statement(sql);
    auto rc = sqlite3_exec(db, statement.c_str(), nullptr, nullptr, &errmsg);

    if (rc != SQLITE_OK) {
        std::string error_str = errmsg ? errmsg : "Unknown error";
        sqlite3_free(errmsg);
        return recall_void_error(
            error_codes::database_query_error,
            recall::compat::format("SQL execution failed: {}", error_str));
    }

    return ok();
}

// ============================================================================
// Migration Implementations
// ============================================================================

auto migration_runner::migrate_v1(sqlite3* db) -> VoidResult {
    // Timestamps are epoch milliseconds. deck_id has no foreign key: cards
    // replicated before their deck must still be storable.
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS cards (
            id              TEXT PRIMARY KEY,
            term            TEXT NOT NULL,
            meaning         TEXT NOT NULL DEFAULT '',
            explanation     TEXT NOT NULL DEFAULT '',
            phonetic        TEXT NOT NULL DEFAULT '',
            deck_id         TEXT,
            created_at      INTEGER NOT NULL,
            updated_at      INTEGER NOT NULL,
            interval_days   REAL NOT NULL DEFAULT 0,
            ease_factor     REAL NOT NULL DEFAULT 2.5,
            repetitions     INTEGER NOT NULL DEFAULT 0,
            step            INTEGER NOT NULL DEFAULT 0,
            next_review_at  INTEGER
        );
        CREATE INDEX IF NOT EXISTS idx_cards_deck ON cards(deck_id);
        CREATE INDEX IF NOT EXISTS idx_cards_next_review ON cards(next_review_at);

        CREATE TABLE IF NOT EXISTS decks (
            id          TEXT PRIMARY KEY,
            name        TEXT NOT NULL,
            description TEXT,
            created_at  INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS review_logs (
            id          TEXT PRIMARY KEY,
            card_id     TEXT NOT NULL,
            rating      TEXT NOT NULL
                        CHECK (rating IN ('again', 'hard', 'good', 'easy')),
            reviewed_at INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_review_logs_time ON review_logs(reviewed_at);
        CREATE INDEX IF NOT EXISTS idx_review_logs_card ON review_logs(card_id);

        CREATE TABLE IF NOT EXISTS settings (
            key   TEXT PRIMARY KEY,
            value TEXT NOT NULL
        );
    )";

    auto result = execute_sql(db, sql);
    if (result.is_err()) {
        return result;
    }

    return record_migration(db, 1, "Initial card store schema");
}

}  // namespace recall::storage
