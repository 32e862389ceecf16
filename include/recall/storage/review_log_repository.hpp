/**
 * @file review_log_repository.hpp
 * @brief Append-only SQLite persistence for review logs
 */

#pragma once

#include <recall/core/card.hpp>
#include <recall/core/result.hpp>

#include <cstddef>
#include <optional>
#include <vector>

struct sqlite3;

namespace recall::storage {

/**
 * @brief Repository for the review ledger
 *
 * Logs are never updated in place. save() is an id-keyed upsert only so
 * that replaying the same remote log twice during activation is harmless.
 *
 * Thread Safety: NOT thread-safe.
 */
class review_log_repository {
public:
    explicit review_log_repository(sqlite3* db);

    [[nodiscard]] auto save(const review_log& log) -> VoidResult;

    /**
     * @brief All logs in chronological order
     */
    [[nodiscard]] auto find_all() const -> Result<std::vector<review_log>>;

    /**
     * @brief Logs with reviewed_at >= @p from, chronological
     */
    [[nodiscard]] auto find_since(time_point from) const
        -> Result<std::vector<review_log>>;

    /**
     * @brief Number of logs with reviewed_at >= @p from
     */
    [[nodiscard]] auto count_since(time_point from) const -> Result<std::size_t>;

    [[nodiscard]] auto clear() -> VoidResult;

private:
    [[nodiscard]] auto query(const char* sql, std::optional<time_point> from) const
        -> Result<std::vector<review_log>>;

    sqlite3* db_{nullptr};
};

}  // namespace recall::storage
