/**
 * @file migration_runner.hpp
 * @brief Versioned schema migrations for the local card store
 */

#pragma once

#include <recall/core/result.hpp>

#include <functional>
#include <string_view>
#include <utility>
#include <vector>

struct sqlite3;

namespace recall::storage {

/**
 * @brief Function type for a single schema upgrade step
 */
using migration_function = std::function<VoidResult(sqlite3* db)>;

/**
 * @brief Applies pending schema migrations
 *
 * The applied version is tracked in a schema_version table. Each version is
 * applied inside its own transaction and rolled back on failure, so a
 * database is always at a well defined version.
 *
 * @code
 * migration_runner runner;
 * auto result = runner.run_migrations(db);
 * if (result.is_err()) {
 *     // database left at its previous version
 * }
 * @endcode
 */
class migration_runner {
public:
    migration_runner();
    ~migration_runner() = default;

    migration_runner(const migration_runner&) = delete;
    auto operator=(const migration_runner&) -> migration_runner& = delete;
    migration_runner(migration_runner&&) = delete;
    auto operator=(migration_runner&&) -> migration_runner& = delete;

    /**
     * @brief Upgrade the schema to the latest version
     */
    [[nodiscard]] auto run_migrations(sqlite3* db) -> VoidResult;

    /**
     * @brief Upgrade the schema up to (and including) @p target_version
     */
    [[nodiscard]] auto run_migrations_to(sqlite3* db, int target_version)
        -> VoidResult;

    /**
     * @brief Version currently recorded in the database (0 if none)
     */
    [[nodiscard]] auto get_current_version(sqlite3* db) const -> int;

    [[nodiscard]] auto get_latest_version() const noexcept -> int;

    [[nodiscard]] auto needs_migration(sqlite3* db) const -> bool;

private:
    [[nodiscard]] auto ensure_schema_version_table(sqlite3* db) -> VoidResult;
    [[nodiscard]] auto apply_migration(sqlite3* db, int version) -> VoidResult;
    [[nodiscard]] auto record_migration(sqlite3* db, int version,
                                        std::string_view description) -> VoidResult;
    [[nodiscard]] static auto execute_sql(sqlite3* db, std::string_view sql)
        -> VoidResult;

    /// V1: cards, decks, review_logs, settings
    [[nodiscard]] auto migrate_v1(sqlite3* db) -> VoidResult;

    static constexpr int LATEST_VERSION = 1;

    std::vector<std::pair<int, migration_function>> migrations_;
};

}  // namespace recall::storage
