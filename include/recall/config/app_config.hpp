/**
 * @file app_config.hpp
 * @brief Application configuration loaded from JSON and the environment
 */

#pragma once

#include <recall/core/result.hpp>
#include <recall/integration/logger_adapter.hpp>
#include <recall/integration/thread_pool_interface.hpp>
#include <recall/scheduling/scheduler.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace recall::config {

/**
 * @brief Everything needed to wire a study session
 *
 * JSON layout (all keys optional):
 * @code
 * {
 *   "database": { "path": "recall.db" },
 *   "sync":     { "identity": "learner-42", "remoteRoot": "/mnt/share/recall" },
 *   "study":    { "learningStepsMinutes": [1, 10], "hardDelayMinutes": 6 },
 *   "logging":  { "directory": "logs", "level": "info", "console": true, "file": true,
 *                 "activity": false },
 *   "threads":  { "syncWorkers": 1 }
 * }
 * @endcode
 *
 * Environment overrides: RECALL_DB_PATH, RECALL_SYNC_IDENTITY,
 * RECALL_REMOTE_ROOT, RECALL_LOG_LEVEL.
 */
struct app_config {
    std::filesystem::path database_path{"recall.db"};

    /// Empty = purely local session
    std::string sync_identity;

    /// Root of the file_remote_store; unset disables remote sync
    std::optional<std::filesystem::path> remote_root;

    scheduling::scheduler_config scheduling;
    integration::logger_config logging;
    integration::thread_pool_config threads;
};

/**
 * @brief Parse a JSON document into a configuration
 * @return error_codes::config_parse_error for malformed JSON or wrong types,
 *         error_codes::config_invalid_value for out-of-range values
 */
[[nodiscard]] auto parse_app_config(std::string_view json_text) -> Result<app_config>;

/**
 * @brief Load configuration from a file, then apply environment overrides
 *
 * A missing file yields the defaults.
 */
[[nodiscard]] auto load_app_config(const std::filesystem::path& path) -> Result<app_config>;

/**
 * @brief Apply RECALL_* environment variables on top of @p config
 */
[[nodiscard]] auto apply_environment(app_config config) -> Result<app_config>;

}  // namespace recall::config
