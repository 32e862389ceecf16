/**
 * @file logger_adapter.cpp
 * @brief Implementation of the logger_system adapter
 */

#include <recall/integration/logger_adapter.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <fstream>
#include <mutex>

namespace recall::integration {

auto log_level_from_string(std::string_view name) -> std::optional<log_level> {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (auto level : {log_level::trace, log_level::debug, log_level::info,
                       log_level::warn, log_level::error, log_level::fatal,
                       log_level::off}) {
        if (to_string(level) == lower) {
            return level;
        }
    }
    if (lower == "warning") {
        return log_level::warn;
    }
    return std::nullopt;
}

// =============================================================================
// Implementation Class
// =============================================================================

class logger_adapter::impl {
public:
    impl() = default;
    ~impl() { shutdown(); }

    void initialize(const logger_config& config) {
        std::lock_guard lock(mutex_);

        if (initialized_) {
            return;
        }

        config_ = config;
        min_level_.store(config.min_level);

        if (config.enable_file || config.enable_activity_log) {
            std::error_code ec;
            std::filesystem::create_directories(config.log_directory, ec);
        }

        logger_ = std::make_unique<kcenon::logger::logger>(
            config.async_mode, config.buffer_size);
        logger_->set_min_level(convert_log_level(config.min_level));

        if (config.enable_console) {
            logger_->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }

        if (config.enable_file) {
            auto log_path = config.log_directory / "recall.log";
            logger_->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
                log_path.string(),
                config.max_file_size_mb * 1024 * 1024,
                config.max_files));
        }

        logger_->start();

        if (config.enable_activity_log) {
            std::lock_guard activity_lock(activity_mutex_);
            activity_.open(config.log_directory / "activity.jsonl", std::ios::app);
            if (!activity_) {
                logger_->log(kcenon::logger::log_level::warn,
                             "activity trail disabled: cannot open " +
                                 (config.log_directory / "activity.jsonl").string());
            }
        }

        initialized_ = true;
    }

    void shutdown() {
        std::lock_guard lock(mutex_);

        if (!initialized_) {
            return;
        }

        {
            std::lock_guard activity_lock(activity_mutex_);
            if (activity_.is_open()) {
                activity_.close();
            }
        }

        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }

        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const noexcept -> bool {
        return initialized_.load();
    }

    void log(log_level level, const std::string& message) {
        if (!initialized_ || !logger_ || !is_level_enabled(level)) {
            return;
        }
        logger_->log(convert_log_level(level), message);
    }

    [[nodiscard]] auto is_level_enabled(log_level level) const noexcept -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void flush() {
        if (logger_) {
            logger_->flush();
        }
    }

    void set_min_level(log_level level) {
        min_level_.store(level);
        if (logger_) {
            logger_->set_min_level(convert_log_level(level));
        }
    }

    [[nodiscard]] auto get_min_level() const noexcept -> log_level {
        return min_level_.load();
    }

    [[nodiscard]] auto get_config() const -> const logger_config& { return config_; }

    void write_activity(const std::string& event_type,
                        const std::map<std::string, std::string>& fields) {
        if (!initialized_) {
            return;
        }

        std::lock_guard lock(activity_mutex_);
        if (!activity_.is_open()) {
            return;
        }

        nlohmann::json entry;
        entry["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::system_clock::now().time_since_epoch())
                                 .count();
        entry["event_type"] = event_type;
        for (const auto& [key, value] : fields) {
            entry[key] = value;
        }
        // One JSON object per line
        activity_ << entry.dump() << '\n';
        activity_.flush();
    }

private:
    [[nodiscard]] static auto convert_log_level(log_level level) -> kcenon::logger::log_level {
        using target = kcenon::logger::log_level;
        switch (level) {
            case log_level::trace: return target::trace;
            case log_level::debug: return target::debug;
            case log_level::info: return target::info;
            case log_level::warn: return target::warn;
            case log_level::error: return target::error;
            case log_level::fatal: return target::fatal;
            case log_level::off: break;
        }
        return target::off;
    }

    std::mutex mutex_;
    std::mutex activity_mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<log_level> min_level_{log_level::info};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> logger_;
    std::ofstream activity_;
};

// =============================================================================
// Static Members
// =============================================================================

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

// =============================================================================
// Public Interface
// =============================================================================

void logger_adapter::initialize(const logger_config& config) {
    pimpl_->initialize(config);
}

void logger_adapter::shutdown() { pimpl_->shutdown(); }

auto logger_adapter::is_initialized() noexcept -> bool {
    return pimpl_->is_initialized();
}

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->log(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->is_level_enabled(level);
}

void logger_adapter::flush() { pimpl_->flush(); }

void logger_adapter::log_review_submitted(const std::string& card_id,
                                          const std::string& rating,
                                          double interval_days) {
    log(log_level::debug,
        recall::compat::format("review card={} rating={} interval={:.4f}d",
                               card_id, rating, interval_days));
    write_activity("review_submitted", {{"card_id", card_id},
                                        {"rating", rating},
                                        {"interval_days", std::to_string(interval_days)}});
}

void logger_adapter::log_sync_activation(const std::string& identity,
                                         std::size_t cards_adopted,
                                         std::size_t cards_kept_local,
                                         std::size_t fetch_errors) {
    log(fetch_errors == 0 ? log_level::info : log_level::warn,
        recall::compat::format("sync activation identity={} adopted={} kept_local={} errors={}",
                               identity, cards_adopted, cards_kept_local, fetch_errors));
    write_activity("sync_activation", {{"identity", identity},
                                       {"cards_adopted", std::to_string(cards_adopted)},
                                       {"cards_kept_local", std::to_string(cards_kept_local)},
                                       {"fetch_errors", std::to_string(fetch_errors)}});
}

void logger_adapter::log_deck_deleted(const std::string& deck_id,
                                      std::size_t cards_removed) {
    log(log_level::info,
        recall::compat::format("deck {} deleted with {} cards", deck_id, cards_removed));
    write_activity("deck_deleted", {{"deck_id", deck_id},
                                    {"cards_removed", std::to_string(cards_removed)}});
}

void logger_adapter::set_min_level(log_level level) {
    pimpl_->set_min_level(level);
}

auto logger_adapter::get_min_level() noexcept -> log_level {
    return pimpl_->get_min_level();
}

auto logger_adapter::get_config() -> const logger_config& {
    return pimpl_->get_config();
}

void logger_adapter::write_activity(const std::string& event_type,
                                    const std::map<std::string, std::string>& fields) {
    pimpl_->write_activity(event_type, fields);
}

}  // namespace recall::integration
