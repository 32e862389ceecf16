/**
 * @file thread_pool_adapter_test.cpp
 * @brief Unit tests for the thread_system push executor
 */

#include <recall/integration/thread_pool_adapter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace recall::integration;
using namespace std::chrono_literals;

namespace {

template <typename Pred>
bool wait_for(Pred condition, std::chrono::milliseconds timeout = 5000ms) {
    auto start = std::chrono::steady_clock::now();
    while (!condition()) {
        if (std::chrono::steady_clock::now() - start > timeout) {
            return false;
        }
        std::this_thread::sleep_for(10ms);
    }
    return true;
}

}  // namespace

TEST_CASE("thread_pool_adapter configuration", "[thread_pool_adapter][config]") {
    SECTION("defaults") {
        thread_pool_config config;
        CHECK(config.worker_count == 1);
        CHECK(config.pool_name == "recall_sync_pool");
    }

    SECTION("zero workers is raised to one") {
        thread_pool_config config;
        config.worker_count = 0;
        thread_pool_adapter pool(config);
        CHECK(pool.get_config().worker_count == 1);
        CHECK_FALSE(pool.is_running());
    }
}

TEST_CASE("thread_pool_adapter lifecycle", "[thread_pool_adapter][pool][!mayfail]") {
    thread_pool_config config;
    config.worker_count = 2;
    thread_pool_adapter pool(config);

    REQUIRE(pool.start());
    CHECK(pool.is_running());
    CHECK(pool.start());

    pool.shutdown(true);
    CHECK_FALSE(pool.is_running());
    pool.shutdown(true);

    SECTION("a stopped pool can be started again") {
        REQUIRE(pool.start());
        CHECK(pool.is_running());
        pool.shutdown(true);
    }
}

TEST_CASE("thread_pool_adapter runs pushes", "[thread_pool_adapter][submit][!mayfail]") {
    thread_pool_config config;
    config.worker_count = 2;
    auto pool = std::make_shared<thread_pool_adapter>(config);

    SECTION("submission starts the pool lazily") {
        std::atomic<bool> executed{false};
        pool->submit_fire_and_forget([&executed]() { executed = true; });

        REQUIRE(wait_for([&executed]() { return executed.load(); }));
        CHECK(pool->is_running());
    }

    SECTION("graceful shutdown drains queued pushes") {
        std::atomic<int> counter{0};
        for (int i = 0; i < 10; ++i) {
            pool->submit_fire_and_forget([&counter]() {
                std::this_thread::sleep_for(5ms);
                counter++;
            });
        }

        pool->shutdown(true);
        CHECK(counter.load() == 10);
        CHECK(pool->get_completed_task_count() == 10);
        CHECK(pool->get_pending_task_count() == 0);
    }

    SECTION("a throwing push is counted and does not stop the pool") {
        std::atomic<bool> later{false};
        pool->submit_fire_and_forget([]() { throw std::runtime_error("remote offline"); });
        pool->submit_fire_and_forget([&later]() { later = true; });

        REQUIRE(wait_for([&later]() { return later.load(); }));
        pool->shutdown(true);
        CHECK(pool->get_failed_task_count() == 1);
        CHECK(pool->get_completed_task_count() == 1);
    }

    pool->shutdown(true);
}
