/**
 * @file card_database.cpp
 * @brief Implementation of the local card store
 */

#include <recall/storage/card_database.hpp>
#include <recall/storage/migration_runner.hpp>

#include "sqlite_helpers.hpp"

#include <sqlite3.h>

namespace recall::storage {

using namespace detail;

// ============================================================================
// Construction
// ============================================================================

auto card_database::open(std::string_view db_path)
    -> Result<std::unique_ptr<card_database>> {
    return open(db_path, card_database_config{});
}

auto card_database::open(std::string_view db_path, const card_database_config& config)
    -> Result<std::unique_ptr<card_database>> {
    sqlite3* db = nullptr;

    auto rc = sqlite3_open(std::string(db_path).c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string error_msg = db ? sqlite3_errmsg(db) : "Failed to allocate memory";
        if (db) {
            sqlite3_close(db);
        }
        return recall_error<std::unique_ptr<card_database>>(
            error_codes::database_open_error,
            recall::compat::format("Failed to open database: {}", error_msg));
    }

    sqlite3_busy_timeout(db, config.busy_timeout_ms);

    if (config.wal_mode && db_path != ":memory:") {
        if (sqlite3_exec(db, "PRAGMA journal_mode = WAL;", nullptr, nullptr, nullptr) !=
            SQLITE_OK) {
            sqlite3_close(db);
            return recall_error<std::unique_ptr<card_database>>(
                error_codes::database_open_error, "Failed to enable WAL mode");
        }
        // Not critical; default FULL is still correct
        (void)sqlite3_exec(db, "PRAGMA synchronous = NORMAL;", nullptr, nullptr, nullptr);
    }

    migration_runner runner;
    auto migrated = runner.run_migrations(db);
    if (migrated.is_err()) {
        sqlite3_close(db);
        return recall_error<std::unique_ptr<card_database>>(
            error_codes::database_migration_error,
            recall::compat::format("Schema migration failed: {}", migrated.error().message));
    }

    return std::unique_ptr<card_database>(new card_database(db, std::string(db_path)));
}

card_database::card_database(sqlite3* db, std::string path)
    : db_(db),
      path_(std::move(path)),
      cards_(db),
      decks_(db),
      logs_(db),
      settings_(db) {}

card_database::~card_database() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// Multi-table Operations
// ============================================================================

auto card_database::remove_deck_cascade(std::string_view deck_id) -> Result<std::size_t> {
    auto started = begin();
    if (started.is_err()) {
        return Result<std::size_t>(started.error());
    }

    auto removed = cards_.remove_by_deck(deck_id);
    if (removed.is_err()) {
        rollback();
        return removed;
    }

    auto deck_removed = decks_.remove(deck_id);
    if (deck_removed.is_err()) {
        rollback();
        return Result<std::size_t>(deck_removed.error());
    }

    auto committed = commit();
    if (committed.is_err()) {
        rollback();
        return Result<std::size_t>(committed.error());
    }
    return removed;
}

auto card_database::record_review(const card& updated, const review_log& log)
    -> VoidResult {
    auto started = begin();
    if (started.is_err()) {
        return started;
    }

    auto saved = cards_.save(updated);
    if (saved.is_err()) {
        rollback();
        return saved;
    }

    auto logged = logs_.save(log);
    if (logged.is_err()) {
        rollback();
        return logged;
    }

    auto committed = commit();
    if (committed.is_err()) {
        rollback();
    }
    return committed;
}

auto card_database::clear_replica() -> VoidResult {
    auto started = begin();
    if (started.is_err()) {
        return started;
    }

    for (auto* clear_sql : {"DELETE FROM cards;", "DELETE FROM decks;",
                            "DELETE FROM review_logs;"}) {
        auto cleared = execute(db_, clear_sql);
        if (cleared.is_err()) {
            rollback();
            return cleared;
        }
    }

    auto committed = commit();
    if (committed.is_err()) {
        rollback();
    }
    return committed;
}

auto card_database::begin() -> VoidResult {
    auto result = execute(db_, "BEGIN IMMEDIATE TRANSACTION;");
    if (result.is_err()) {
        return recall_void_error(error_codes::database_transaction_error,
                                 result.error().message);
    }
    return ok();
}

auto card_database::commit() -> VoidResult {
    auto result = execute(db_, "COMMIT;");
    if (result.is_err()) {
        return recall_void_error(error_codes::database_transaction_error,
                                 result.error().message);
    }
    return ok();
}

void card_database::rollback() {
    // Fails harmlessly when no transaction is active
    (void)sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
}

}  // namespace recall::storage
