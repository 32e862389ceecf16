/**
 * @file settings_repository.hpp
 * @brief Device-local key/value settings (daily limit)
 */

#pragma once

#include <recall/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

struct sqlite3;

namespace recall::storage {

/// Daily review cap used when none has been configured
inline constexpr int default_daily_limit = 50;

/**
 * @brief Repository for local settings
 *
 * Settings are per device and never replicated, so they survive the
 * activation-time replica wipe.
 *
 * Thread Safety: NOT thread-safe.
 */
class settings_repository {
public:
    explicit settings_repository(sqlite3* db);

    [[nodiscard]] auto get(std::string_view key) const -> Result<std::optional<std::string>>;

    [[nodiscard]] auto set(std::string_view key, std::string_view value) -> VoidResult;

    /**
     * @brief Configured daily limit, default_daily_limit when unset
     * @return a database error when the setting cannot be read, or
     *         error_codes::invalid_daily_limit when the stored value is not a
     *         positive integer
     */
    [[nodiscard]] auto daily_limit() const -> Result<int>;

    /**
     * @brief Persist a new daily limit
     * @return error_codes::invalid_daily_limit for @p limit <= 0; the
     *         stored value is left unchanged
     */
    [[nodiscard]] auto set_daily_limit(int limit) -> VoidResult;

private:
    sqlite3* db_{nullptr};
};

}  // namespace recall::storage
