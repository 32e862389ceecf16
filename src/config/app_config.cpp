/**
 * @file app_config.cpp
 * @brief JSON and environment configuration loading
 */

#include <recall/config/app_config.hpp>

#include <recall/compat/format.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace recall::config {

using json = nlohmann::json;

namespace {

[[nodiscard]] auto invalid(const std::string& message) -> Result<app_config> {
    return recall_error<app_config>(error_codes::config_invalid_value, message);
}

[[nodiscard]] auto env(const char* name) -> std::optional<std::string> {
    const char* value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

}  // namespace

auto parse_app_config(std::string_view json_text) -> Result<app_config> {
    app_config config;

    json root = json::parse(json_text, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        return recall_error<app_config>(error_codes::config_parse_error,
                                        "Configuration is not a JSON object");
    }

    try {
        if (root.contains("database")) {
            const auto& database = root["database"];
            if (database.contains("path")) {
                config.database_path = database["path"].get<std::string>();
            }
        }

        if (root.contains("sync")) {
            const auto& sync_section = root["sync"];
            if (sync_section.contains("identity")) {
                config.sync_identity = sync_section["identity"].get<std::string>();
            }
            if (sync_section.contains("remoteRoot") && !sync_section["remoteRoot"].is_null()) {
                config.remote_root = sync_section["remoteRoot"].get<std::string>();
            }
        }

        if (root.contains("study")) {
            const auto& study = root["study"];
            if (study.contains("learningStepsMinutes")) {
                config.scheduling.learning_steps.clear();
                for (const auto& step : study["learningStepsMinutes"]) {
                    config.scheduling.learning_steps.emplace_back(step.get<int>());
                }
            }
            if (study.contains("hardDelayMinutes")) {
                config.scheduling.hard_learning_delay =
                    std::chrono::minutes{study["hardDelayMinutes"].get<int>()};
            }
        }

        if (root.contains("logging")) {
            const auto& logging = root["logging"];
            if (logging.contains("directory")) {
                config.logging.log_directory = logging["directory"].get<std::string>();
            }
            if (logging.contains("level")) {
                auto level = integration::log_level_from_string(
                    logging["level"].get<std::string>());
                if (!level) {
                    return invalid("Unknown log level: " + logging["level"].get<std::string>());
                }
                config.logging.min_level = *level;
            }
            config.logging.enable_console =
                logging.value("console", config.logging.enable_console);
            config.logging.enable_file = logging.value("file", config.logging.enable_file);
            config.logging.enable_activity_log =
                logging.value("activity", config.logging.enable_activity_log);
        }

        if (root.contains("threads")) {
            const auto workers = root["threads"].value("syncWorkers", 1);
            if (workers <= 0) {
                return invalid("threads.syncWorkers must be positive");
            }
            config.threads.worker_count = static_cast<std::size_t>(workers);
        }
    } catch (const json::exception& e) {
        return recall_error<app_config>(
            error_codes::config_parse_error,
            recall::compat::format("Invalid configuration value: {}", e.what()));
    }

    auto ladder = scheduling::validate(config.scheduling);
    if (ladder.is_err()) {
        return invalid(ladder.error().message);
    }
    return config;
}

auto apply_environment(app_config config) -> Result<app_config> {
    if (auto path = env("RECALL_DB_PATH")) {
        config.database_path = *path;
    }
    if (auto identity = env("RECALL_SYNC_IDENTITY")) {
        config.sync_identity = *identity;
    }
    if (auto remote = env("RECALL_REMOTE_ROOT")) {
        config.remote_root = *remote;
    }
    if (auto level_name = env("RECALL_LOG_LEVEL")) {
        auto level = integration::log_level_from_string(*level_name);
        if (!level) {
            return invalid("Unknown RECALL_LOG_LEVEL: " + *level_name);
        }
        config.logging.min_level = *level;
    }
    return config;
}

auto load_app_config(const std::filesystem::path& path) -> Result<app_config> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return apply_environment(app_config{});
    }

    std::ifstream in(path);
    if (!in) {
        return recall_error<app_config>(
            error_codes::config_parse_error,
            recall::compat::format("Cannot read configuration {}", path.string()));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto parsed = parse_app_config(buffer.str());
    if (parsed.is_err()) {
        return parsed;
    }
    return apply_environment(parsed.value());
}

}  // namespace recall::config
