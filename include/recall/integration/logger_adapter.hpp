/**
 * @file logger_adapter.hpp
 * @brief Adapter for application and study-activity logging using logger_system
 *
 * This file provides the logger_adapter class for integrating logger_system
 * with recall. It supports standard leveled logging plus a structured
 * activity trail (review submissions, sync activations, deck deletions)
 * written as JSON lines.
 */

#pragma once

#include <recall/compat/format.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace recall::integration {

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @brief Convert log_level to its lowercase name
 */
[[nodiscard]] constexpr auto to_string(log_level level) noexcept -> std::string_view {
    switch (level) {
        case log_level::trace: return "trace";
        case log_level::debug: return "debug";
        case log_level::info: return "info";
        case log_level::warn: return "warn";
        case log_level::error: return "error";
        case log_level::fatal: return "fatal";
        case log_level::off: return "off";
    }
    return "off";
}

/**
 * @brief Parse a log level name ("info", "WARN", ...)
 * @return std::nullopt for unknown names
 */
[[nodiscard]] auto log_level_from_string(std::string_view name) -> std::optional<log_level>;

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable rotating file output (recall.log)
    bool enable_file{true};

    /// Enable the JSON-lines activity trail (activity.jsonl)
    bool enable_activity_log{false};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{10};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{5};

    /// Use asynchronous logging
    bool async_mode{true};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

// ─────────────────────────────────────────────────────
// Logger Adapter Class
// ─────────────────────────────────────────────────────

/**
 * @class logger_adapter
 * @brief Process-wide logging facade over logger_system
 *
 * Components never call this class directly; they receive a
 * di::ILogger and production wiring hands them di::LoggerService,
 * which forwards here.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/recall";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Loaded {} cards", count);
 * logger_adapter::log_review_submitted("card-1", "good", 2.5);
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Initialization
    // ─────────────────────────────────────────────────────

    /**
     * @brief Initialize writers and levels; later calls are ignored
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and release the logger
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void debug(recall::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::debug, recall::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(recall::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, recall::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(recall::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, recall::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(recall::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, recall::compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a preformatted message; dropped before initialize()
     */
    static void log(log_level level, const std::string& message);

    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    // ─────────────────────────────────────────────────────
    // Study Activity Trail
    // ─────────────────────────────────────────────────────

    /**
     * @brief Record a rating submission
     * @param card_id Reviewed card
     * @param rating Rating name (again/hard/good/easy)
     * @param interval_days Interval chosen by the scheduler
     */
    static void log_review_submitted(const std::string& card_id,
                                     const std::string& rating,
                                     double interval_days);

    /**
     * @brief Record the outcome of a login-time activation
     */
    static void log_sync_activation(const std::string& identity,
                                    std::size_t cards_adopted,
                                    std::size_t cards_kept_local,
                                    std::size_t fetch_errors);

    /**
     * @brief Record a cascading deck deletion
     */
    static void log_deck_deleted(const std::string& deck_id,
                                 std::size_t cards_removed);

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

private:
    static void write_activity(const std::string& event_type,
                               const std::map<std::string, std::string>& fields);

    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace recall::integration
