/**
 * @file sqlite_helpers.hpp
 * @brief Column/bind helpers shared by the card store repositories
 *
 * Private header; not installed.
 */

#pragma once

#include <recall/compat/format.hpp>
#include <recall/compat/time.hpp>
#include <recall/core/result.hpp>

#include <sqlite3.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace recall::storage::detail {

/// Get text column safely (returns empty string if NULL)
[[nodiscard]] inline auto get_text_column(sqlite3_stmt* stmt, int col) -> std::string {
    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

[[nodiscard]] inline auto get_optional_text_column(sqlite3_stmt* stmt, int col)
    -> std::optional<std::string> {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    return get_text_column(stmt, col);
}

[[nodiscard]] inline auto get_int_column(sqlite3_stmt* stmt, int col, int default_val = 0)
    -> int {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return default_val;
    }
    return sqlite3_column_int(stmt, col);
}

[[nodiscard]] inline auto get_double_column(sqlite3_stmt* stmt, int col,
                                            double default_val = 0.0) -> double {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return default_val;
    }
    return sqlite3_column_double(stmt, col);
}

/// Epoch-millisecond column as a time point (epoch if NULL)
[[nodiscard]] inline auto get_time_column(sqlite3_stmt* stmt, int col)
    -> std::chrono::system_clock::time_point {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return {};
    }
    return compat::from_epoch_ms(sqlite3_column_int64(stmt, col));
}

[[nodiscard]] inline auto get_optional_time_column(sqlite3_stmt* stmt, int col)
    -> std::optional<std::chrono::system_clock::time_point> {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    return compat::from_epoch_ms(sqlite3_column_int64(stmt, col));
}

inline void bind_text(sqlite3_stmt* stmt, int idx, std::string_view value) {
    sqlite3_bind_text(stmt, idx, value.data(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
}

inline void bind_optional_text(sqlite3_stmt* stmt, int idx,
                               const std::optional<std::string>& value) {
    if (value) {
        bind_text(stmt, idx, *value);
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

inline void bind_time(sqlite3_stmt* stmt, int idx,
                      std::chrono::system_clock::time_point tp) {
    sqlite3_bind_int64(stmt, idx, compat::to_epoch_ms(tp));
}

inline void bind_optional_time(
    sqlite3_stmt* stmt, int idx,
    const std::optional<std::chrono::system_clock::time_point>& tp) {
    if (tp) {
        bind_time(stmt, idx, *tp);
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

/// Error result describing the connection's last failure
template <typename T>
[[nodiscard]] auto db_error(sqlite3* db, std::string_view what) -> Result<T> {
    return recall_error<T>(error_codes::database_query_error,
                           recall::compat::format("{}: {}", what, sqlite3_errmsg(db)));
}

[[nodiscard]] inline auto db_void_error(sqlite3* db, std::string_view what) -> VoidResult {
    return recall_void_error(error_codes::database_query_error,
                             recall::compat::format("{}: {}", what, sqlite3_errmsg(db)));
}

/// Execute a statement without parameters or result rows
[[nodiscard]] inline auto execute(sqlite3* db, const char* sql) -> VoidResult {
    char* errmsg = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &errmsg) != SQLITE_OK) {
        std::string message = errmsg ? errmsg : "Unknown error";
        sqlite3_free(errmsg);
        return recall_void_error(error_codes::database_query_error,
                                 recall::compat::format("SQL execution failed: {}", message));
    }
    return ok();
}

/// Run a prepared statement to completion and finalize it
[[nodiscard]] inline auto step_done(sqlite3* db, sqlite3_stmt* stmt,
                                    std::string_view what) -> VoidResult {
    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return db_void_error(db, what);
    }
    return ok();
}

}  // namespace recall::storage::detail
