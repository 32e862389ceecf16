/**
 * @file logger_adapter_test.cpp
 * @brief Unit tests for logger_adapter
 */

#include <recall/integration/logger_adapter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace recall::integration;

// =============================================================================
// Test Helpers
// =============================================================================

namespace {

auto create_temp_log_directory() -> std::filesystem::path {
    auto temp_dir = std::filesystem::temp_directory_path() / "recall_logger_test";
    std::filesystem::create_directories(temp_dir);
    return temp_dir;
}

void cleanup_temp_directory(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
}

auto read_file_contents(const std::filesystem::path& path) -> std::string {
    std::ifstream file(path);
    if (!file) {
        return "";
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

/**
 * @brief RAII wrapper for logger initialization/shutdown
 */
class logger_test_fixture {
public:
    explicit logger_test_fixture(const logger_config& config) : log_dir_(config.log_directory) {
        logger_adapter::initialize(config);
    }

    ~logger_test_fixture() {
        logger_adapter::shutdown();
        cleanup_temp_directory(log_dir_);
    }

    logger_test_fixture(const logger_test_fixture&) = delete;
    logger_test_fixture& operator=(const logger_test_fixture&) = delete;

private:
    std::filesystem::path log_dir_;
};

}  // namespace

// =============================================================================
// Level Names
// =============================================================================

TEST_CASE("log_level names", "[logger_adapter][level]") {
    CHECK(to_string(log_level::warn) == "warn");
    CHECK(log_level_from_string("INFO") == log_level::info);
    CHECK(log_level_from_string("warning") == log_level::warn);
    CHECK_FALSE(log_level_from_string("loud").has_value());
}

// =============================================================================
// Initialization Tests
// =============================================================================

TEST_CASE("logger_adapter initialization and shutdown", "[logger_adapter][init]") {
    auto temp_dir = create_temp_log_directory();

    SECTION("Basic initialization") {
        logger_config config;
        config.log_directory = temp_dir;
        config.enable_console = false;
        config.enable_file = true;

        logger_adapter::initialize(config);
        REQUIRE(logger_adapter::is_initialized());

        logger_adapter::shutdown();
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    SECTION("Multiple initialization calls are safe") {
        logger_config config;
        config.log_directory = temp_dir;
        config.enable_console = false;

        logger_adapter::initialize(config);
        logger_adapter::initialize(config);
        REQUIRE(logger_adapter::is_initialized());

        logger_adapter::shutdown();
    }

    SECTION("Shutdown without initialization is safe") {
        logger_adapter::shutdown();
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    SECTION("Logging before initialization is dropped") {
        logger_adapter::info("not initialized: {}", 1);
        logger_adapter::log_review_submitted("card", "good", 1.0);
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    cleanup_temp_directory(temp_dir);
}

// =============================================================================
// Standard Logging Tests
// =============================================================================

TEST_CASE("logger_adapter level filtering", "[logger_adapter][logging]") {
    logger_config config;
    config.log_directory = create_temp_log_directory();
    config.enable_console = false;
    config.min_level = log_level::trace;

    logger_test_fixture fixture(config);

    logger_adapter::debug("Debug message: {}", 2);
    logger_adapter::info("Info message: {}", 3);
    logger_adapter::flush();

    logger_adapter::set_min_level(log_level::warn);
    REQUIRE(logger_adapter::get_min_level() == log_level::warn);

    REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::debug));
    REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::info));
    REQUIRE(logger_adapter::is_level_enabled(log_level::warn));
    REQUIRE(logger_adapter::is_level_enabled(log_level::error));
}

TEST_CASE("logger_adapter configuration", "[logger_adapter][config]") {
    logger_config config;
    config.log_directory = create_temp_log_directory();
    config.min_level = log_level::debug;
    config.enable_console = false;
    config.enable_activity_log = true;
    config.max_file_size_mb = 50;
    config.max_files = 3;

    logger_test_fixture fixture(config);

    const auto& retrieved = logger_adapter::get_config();
    REQUIRE(retrieved.min_level == log_level::debug);
    REQUIRE(retrieved.enable_activity_log);
    REQUIRE(retrieved.max_file_size_mb == 50);
    REQUIRE(retrieved.max_files == 3);
}

// =============================================================================
// Activity Trail Tests
// =============================================================================

TEST_CASE("logger_adapter activity trail", "[logger_adapter][activity]") {
    auto temp_dir = create_temp_log_directory();
    logger_config config;
    config.log_directory = temp_dir;
    config.enable_console = false;
    config.enable_file = false;
    config.enable_activity_log = true;

    logger_test_fixture fixture(config);

    logger_adapter::log_review_submitted("card-1", "good", 2.5);
    logger_adapter::log_sync_activation("learner-42", 10, 1, 0);
    logger_adapter::log_deck_deleted("deck-9", 4);

    auto content = read_file_contents(temp_dir / "activity.jsonl");

    std::vector<std::string> lines;
    std::istringstream stream(content);
    for (std::string line; std::getline(stream, line);) {
        lines.push_back(line);
    }
    REQUIRE(lines.size() == 3);
    CHECK(lines[0].find("\"event_type\":\"review_submitted\"") != std::string::npos);
    CHECK(lines[0].find("\"card_id\":\"card-1\"") != std::string::npos);
    CHECK(lines[1].find("\"identity\":\"learner-42\"") != std::string::npos);
    CHECK(lines[2].find("\"cards_removed\":\"4\"") != std::string::npos);
    CHECK(lines[2].find("\"timestamp\"") != std::string::npos);
}

TEST_CASE("logger_adapter activity trail is off by default", "[logger_adapter][activity]") {
    auto temp_dir = create_temp_log_directory();
    logger_config config;
    config.log_directory = temp_dir;
    config.enable_console = false;
    config.enable_file = false;

    logger_test_fixture fixture(config);
    logger_adapter::log_deck_deleted("deck-9", 4);

    CHECK_FALSE(std::filesystem::exists(temp_dir / "activity.jsonl"));
}

// =============================================================================
// Thread Safety Tests
// =============================================================================

TEST_CASE("logger_adapter thread safety", "[logger_adapter][thread]") {
    logger_config config;
    config.log_directory = create_temp_log_directory();
    config.enable_console = false;
    config.enable_activity_log = true;
    config.async_mode = true;

    logger_test_fixture fixture(config);

    constexpr int kNumThreads = 4;
    constexpr int kMessagesPerThread = 100;

    std::vector<std::thread> threads;
    threads.reserve(kNumThreads);

    for (int t = 0; t < kNumThreads; ++t) {
        threads.emplace_back([t]() {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                logger_adapter::info("Thread {} message {}", t, i);
                if (i % 10 == 0) {
                    logger_adapter::log_review_submitted("card-" + std::to_string(t), "good",
                                                         1.0);
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    logger_adapter::flush();
    REQUIRE(logger_adapter::is_initialized());
}
