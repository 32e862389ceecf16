/**
 * @file ilogger.hpp
 * @brief Logger dependency injected into recall components
 *
 * Components (due_selector, statistics_engine, sync_engine, study_service)
 * take a std::shared_ptr<ILogger>. A null pointer means "do not log" and is
 * resolved to null_logger(). The CLI wires LoggerService, which forwards to
 * logger_system through integration::logger_adapter, and wraps it in a
 * component_logger per subsystem so log lines carry their origin.
 */

#pragma once

#include <recall/integration/logger_adapter.hpp>
#include <recall/compat/format.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace recall::di {

using integration::log_level;

/**
 * @brief Abstract logger sink
 *
 * Implementations only provide write() and is_enabled(); the level helpers
 * and the *_fmt variants are built on top of them. write() may be called
 * from pool workers concurrently with the session thread.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void write(log_level level, std::string_view message) = 0;

    [[nodiscard]] virtual bool is_enabled(log_level level) const noexcept = 0;

    void trace(std::string_view message) { write(log_level::trace, message); }
    void debug(std::string_view message) { write(log_level::debug, message); }
    void info(std::string_view message) { write(log_level::info, message); }
    void warn(std::string_view message) { write(log_level::warn, message); }
    void error(std::string_view message) { write(log_level::error, message); }
    void fatal(std::string_view message) { write(log_level::fatal, message); }

    // Formatting is skipped entirely when the level is filtered out

    template <typename... Args>
    void trace_fmt(recall::compat::format_string<Args...> fmt, Args&&... args) {
        write_fmt(log_level::trace, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug_fmt(recall::compat::format_string<Args...> fmt, Args&&... args) {
        write_fmt(log_level::debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info_fmt(recall::compat::format_string<Args...> fmt, Args&&... args) {
        write_fmt(log_level::info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn_fmt(recall::compat::format_string<Args...> fmt, Args&&... args) {
        write_fmt(log_level::warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error_fmt(recall::compat::format_string<Args...> fmt, Args&&... args) {
        write_fmt(log_level::error, fmt, std::forward<Args>(args)...);
    }

protected:
    ILogger() = default;
    ILogger(const ILogger&) = default;
    ILogger& operator=(const ILogger&) = default;

private:
    template <typename... Args>
    void write_fmt(log_level level, recall::compat::format_string<Args...> fmt,
                   Args&&... args) {
        if (is_enabled(level)) {
            write(level, recall::compat::format(fmt, std::forward<Args>(args)...));
        }
    }
};

/**
 * @brief Discards everything
 */
class NullLogger final : public ILogger {
public:
    void write(log_level /*level*/, std::string_view /*message*/) override {}

    [[nodiscard]] bool is_enabled(log_level /*level*/) const noexcept override {
        return false;
    }
};

/**
 * @brief Forwards to the process-wide logger_adapter
 *
 * Safe to use before logger_adapter::initialize(); messages are dropped.
 */
class LoggerService final : public ILogger {
public:
    void write(log_level level, std::string_view message) override {
        integration::logger_adapter::log(level, std::string{message});
    }

    [[nodiscard]] bool is_enabled(log_level level) const noexcept override {
        return integration::logger_adapter::is_level_enabled(level);
    }
};

/**
 * @brief Prefixes every message with "[component] "
 *
 * @code
 * auto base = std::make_shared<LoggerService>();
 * sync_engine engine(db, remote, pool, std::make_shared<component_logger>("sync", base));
 * @endcode
 */
class component_logger final : public ILogger {
public:
    component_logger(std::string component, std::shared_ptr<ILogger> sink)
        : prefix_("[" + std::move(component) + "] "), sink_(std::move(sink)) {}

    void write(log_level level, std::string_view message) override {
        if (sink_) {
            sink_->write(level, prefix_ + std::string{message});
        }
    }

    [[nodiscard]] bool is_enabled(log_level level) const noexcept override {
        return sink_ && sink_->is_enabled(level);
    }

private:
    std::string prefix_;
    std::shared_ptr<ILogger> sink_;
};

/**
 * @brief Shared NullLogger instance
 */
[[nodiscard]] inline std::shared_ptr<ILogger> null_logger() {
    static auto instance = std::make_shared<NullLogger>();
    return instance;
}

/**
 * @brief @p logger, or null_logger() when it is empty
 */
[[nodiscard]] inline std::shared_ptr<ILogger> or_null(std::shared_ptr<ILogger> logger) {
    return logger ? std::move(logger) : null_logger();
}

}  // namespace recall::di
