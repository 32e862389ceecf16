/**
 * @file settings_repository.cpp
 * @brief Implementation of the settings repository
 */

#include <recall/storage/settings_repository.hpp>

#include "sqlite_helpers.hpp"

#include <sqlite3.h>

#include <charconv>

namespace recall::storage {

using namespace detail;

namespace {
constexpr std::string_view daily_limit_key = "daily_limit";
}  // namespace

settings_repository::settings_repository(sqlite3* db) : db_(db) {}

auto settings_repository::get(std::string_view key) const
    -> Result<std::optional<std::string>> {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT value FROM settings WHERE key = ?", -1, &stmt,
                           nullptr) != SQLITE_OK) {
        return db_error<std::optional<std::string>>(db_, "Failed to prepare settings lookup");
    }
    bind_text(stmt, 1, key);

    std::optional<std::string> value;
    auto rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        value = get_text_column(stmt, 0);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return db_error<std::optional<std::string>>(db_, "Failed to read setting");
    }
    return value;
}

auto settings_repository::set(std::string_view key, std::string_view value) -> VoidResult {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_,
                           "INSERT INTO settings (key, value) VALUES (?, ?) "
                           "ON CONFLICT(key) DO UPDATE SET value = excluded.value",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return db_void_error(db_, "Failed to prepare settings upsert");
    }
    bind_text(stmt, 1, key);
    bind_text(stmt, 2, value);
    return step_done(db_, stmt, "Failed to save setting");
}

auto settings_repository::daily_limit() const -> Result<int> {
    auto stored = get(daily_limit_key);
    if (stored.is_err()) {
        return Result<int>(stored.error());
    }
    if (!stored.value()) {
        return default_daily_limit;
    }

    const auto& text = *stored.value();
    int limit = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), limit);
    if (ec != std::errc{} || ptr != text.data() + text.size() || limit <= 0) {
        return recall_error<int>(
            error_codes::invalid_daily_limit,
            recall::compat::format("Stored daily limit '{}' is not a positive integer", text));
    }
    return limit;
}

auto settings_repository::set_daily_limit(int limit) -> VoidResult {
    if (limit <= 0) {
        return recall_void_error(
            error_codes::invalid_daily_limit,
            recall::compat::format("Daily limit must be positive, got {}", limit));
    }
    return set(daily_limit_key, std::to_string(limit));
}

}  // namespace recall::storage
