/**
 * @file sync_engine_test.cpp
 * @brief Unit tests for activation and remote mirroring
 */

#include <recall/di/ilogger.hpp>
#include <recall/storage/card_database.hpp>
#include <recall/sync/entity_codec.hpp>
#include <recall/sync/memory_remote_store.hpp>
#include <recall/sync/sync_engine.hpp>

#include "../mocks/mock_thread_pool.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace recall;
using namespace recall::sync;
using recall::integration::testing::mock_thread_pool;
using recall::storage::card_database;
using nlohmann::json;

// =============================================================================
// Test Doubles
// =============================================================================

namespace {

class MockLogger final : public recall::di::ILogger {
public:
    void write(recall::di::log_level level, std::string_view message) override {
        if (level == recall::di::log_level::warn) {
            warn_count_.fetch_add(1, std::memory_order_relaxed);
            last_warning_ = std::string(message);
        }
    }

    [[nodiscard]] bool is_enabled(recall::di::log_level) const noexcept override {
        return true;
    }

    [[nodiscard]] size_t warn_count() const noexcept {
        return warn_count_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] const std::string& last_warning() const noexcept { return last_warning_; }

private:
    std::atomic<size_t> warn_count_{0};
    std::string last_warning_;
};

/**
 * @brief Remote store serving canned documents, optionally failing per kind
 */
class scripted_remote_store final : public remote_store {
public:
    std::map<entity_kind, std::vector<json>> documents;
    std::map<entity_kind, bool> fail_fetch;
    bool fail_writes{false};
    std::vector<std::pair<entity_kind, std::string>> upserts;
    std::vector<std::pair<entity_kind, std::string>> removals;

protected:
    auto do_fetch_all(entity_kind kind, std::string_view)
        -> Result<std::vector<json>> override {
        if (fail_fetch[kind]) {
            return recall_error<std::vector<json>>(error_codes::remote_fetch_failed,
                                                   "remote unreachable");
        }
        return documents[kind];
    }

    auto do_upsert(entity_kind kind, std::string_view, std::string_view id, const json&)
        -> VoidResult override {
        if (fail_writes) {
            return recall_void_error(error_codes::remote_write_failed, "write rejected");
        }
        upserts.emplace_back(kind, std::string(id));
        return ok();
    }

    auto do_remove(entity_kind kind, std::string_view, std::string_view id)
        -> VoidResult override {
        if (fail_writes) {
            return recall_void_error(error_codes::remote_write_failed, "delete rejected");
        }
        removals.emplace_back(kind, std::string(id));
        return ok();
    }
};

auto open_store() -> std::unique_ptr<card_database> {
    auto db = card_database::open(":memory:");
    REQUIRE(db.is_ok());
    return std::move(db.value());
}

auto replica(const std::string& id, int repetitions, double interval,
             const std::string& term = "term") -> card {
    card c;
    c.id = id;
    c.term = term;
    c.repetitions = repetitions;
    c.interval_days = interval;
    c.next_review_at = recall::clock::now();
    return c;
}

}  // namespace

// =============================================================================
// Type Conversions
// =============================================================================

TEST_CASE("entity_kind names the remote collections", "[sync_types]") {
    CHECK(to_string(entity_kind::card) == "flashcards");
    CHECK(to_string(entity_kind::deck) == "decks");
    CHECK(to_string(entity_kind::review_log) == "logs");

    CHECK(entity_kind_from_string("logs") == entity_kind::review_log);
    CHECK_FALSE(entity_kind_from_string("cards").has_value());
}

// =============================================================================
// Activation
// =============================================================================

TEST_CASE("activation replaces local data with the remote partition",
          "[sync][activation]") {
    auto db = open_store();
    auto remote = std::make_shared<memory_remote_store>();
    auto pool = std::make_shared<mock_thread_pool>();

    // Left over from a previous learner
    REQUIRE(db->cards().save(replica("stale", 2, 3.0)).is_ok());
    REQUIRE(db->settings().set_daily_limit(15).is_ok());

    deck d;
    d.id = "d1";
    d.name = "Greek";
    review_log log;
    log.id = "l1";
    log.card_id = "c1";
    log.rating = rating::good;
    log.reviewed_at = recall::clock::now();

    REQUIRE(remote->upsert(entity_kind::card, "learner", "c1", encode(replica("c1", 1, 1.0)))
                .is_ok());
    REQUIRE(remote->upsert(entity_kind::card, "learner", "c2", encode(replica("c2", 0, 0.0)))
                .is_ok());
    REQUIRE(remote->upsert(entity_kind::deck, "learner", "d1", encode(d)).is_ok());
    REQUIRE(remote->upsert(entity_kind::review_log, "learner", "l1", encode(log)).is_ok());

    sync_engine engine(*db, remote, pool);
    std::size_t progress_calls = 0;
    auto result = engine.activate("learner", [&](entity_kind, std::size_t processed,
                                                 std::size_t total) {
        ++progress_calls;
        CHECK(processed <= total);
    });

    REQUIRE(result.is_ok());
    CHECK(result.value().success);
    CHECK(result.value().cards_fetched == 2);
    CHECK(result.value().cards_adopted == 2);
    CHECK(result.value().decks_adopted == 1);
    CHECK(result.value().logs_adopted == 1);
    CHECK(result.value().errors.empty());
    CHECK(progress_calls == 4);

    CHECK(db->cards().find_by_id("stale").is_err());
    CHECK(db->cards().find_by_id("c1").is_ok());
    CHECK(db->decks().find_by_id("d1").is_ok());
    CHECK(db->settings().daily_limit().value() == 15);

    CHECK(engine.is_activated());
    CHECK(engine.identity() == "learner");
}

TEST_CASE("activation resolves duplicate replicas by progress", "[sync][activation]") {
    auto db = open_store();
    auto remote = std::make_shared<scripted_remote_store>();
    auto pool = std::make_shared<mock_thread_pool>();

    SECTION("more advanced replica wins") {
        remote->documents[entity_kind::card] = {encode(replica("c1", 5, 10.0, "advanced")),
                                                encode(replica("c1", 1, 1.0, "behind"))};
        sync_engine engine(*db, remote, pool);
        auto result = engine.activate("learner");
        REQUIRE(result.is_ok());

        auto stored = db->cards().find_by_id("c1");
        REQUIRE(stored.is_ok());
        CHECK(stored.value().term == "advanced");
        CHECK(result.value().cards_kept_local == 1);

        // The local winner is pushed back
        REQUIRE(remote->upserts.size() == 1);
        CHECK(remote->upserts[0].second == "c1");
    }

    SECTION("later remote replica with more progress replaces the local one") {
        remote->documents[entity_kind::card] = {encode(replica("c1", 1, 1.0, "behind")),
                                                encode(replica("c1", 5, 10.0, "advanced"))};
        sync_engine engine(*db, remote, pool);
        auto result = engine.activate("learner");
        REQUIRE(result.is_ok());

        CHECK(db->cards().find_by_id("c1").value().term == "advanced");
        CHECK(result.value().cards_kept_local == 0);
        CHECK(remote->upserts.empty());
    }

    SECTION("ties go to the remote replica") {
        remote->documents[entity_kind::card] = {encode(replica("c1", 2, 3.0, "first")),
                                                encode(replica("c1", 3, 2.0, "second"))};
        sync_engine engine(*db, remote, pool);
        REQUIRE(engine.activate("learner").is_ok());

        CHECK(db->cards().find_by_id("c1").value().term == "second");
        CHECK(remote->upserts.empty());
    }
}

TEST_CASE("activation identity rules", "[sync][activation]") {
    auto db = open_store();
    auto remote = std::make_shared<memory_remote_store>();
    auto pool = std::make_shared<mock_thread_pool>();
    sync_engine engine(*db, remote, pool);

    SECTION("empty identity is rejected without touching local data") {
        REQUIRE(db->cards().save(replica("local", 1, 1.0)).is_ok());
        auto result = engine.activate("");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::sync_identity_missing);
        CHECK(db->cards().find_by_id("local").is_ok());
        CHECK_FALSE(engine.is_activated());
    }

    SECTION("repeating with the same identity is a no-op") {
        REQUIRE(engine.activate("learner").is_ok());
        REQUIRE(db->cards().save(replica("after", 1, 1.0)).is_ok());

        auto again = engine.activate("learner");
        REQUIRE(again.is_ok());
        CHECK(db->cards().find_by_id("after").is_ok());
    }

    SECTION("another identity needs a new session") {
        REQUIRE(engine.activate("learner").is_ok());
        auto other = engine.activate("someone-else");
        REQUIRE(other.is_err());
        CHECK(other.error().code == error_codes::sync_invalid_state);
        CHECK(engine.identity() == "learner");
    }
}

TEST_CASE("activation survives remote failures", "[sync][activation]") {
    auto db = open_store();
    auto remote = std::make_shared<scripted_remote_store>();
    auto pool = std::make_shared<mock_thread_pool>();
    auto logger = std::make_shared<MockLogger>();

    deck d;
    d.id = "d1";
    d.name = "kept";
    remote->documents[entity_kind::card] = {encode(replica("c1", 1, 1.0)),
                                            json{{"term", "no id"}}};
    remote->documents[entity_kind::deck] = {encode(d)};
    remote->fail_fetch[entity_kind::review_log] = true;

    sync_engine engine(*db, remote, pool, logger);
    auto result = engine.activate("learner");

    REQUIRE(result.is_ok());
    CHECK(result.value().success);
    CHECK(result.value().cards_adopted == 1);
    CHECK(result.value().documents_skipped == 1);
    CHECK(result.value().decks_adopted == 1);
    REQUIRE(result.value().errors.size() == 1);
    CHECK(result.value().errors[0].find("logs") != std::string::npos);
    CHECK(logger->warn_count() >= 2);
    CHECK(engine.is_activated());
}

TEST_CASE("resume keeps a replica already reconciled for the identity",
          "[sync][activation][resume]") {
    auto db = open_store();
    auto remote = std::make_shared<memory_remote_store>();
    auto pool = std::make_shared<mock_thread_pool>();
    REQUIRE(remote->upsert(entity_kind::card, "learner", "c1", encode(replica("c1", 1, 1.0)))
                .is_ok());

    {
        sync_engine first(*db, remote, pool);
        auto activated = first.resume("learner");
        REQUIRE(activated.is_ok());
        CHECK(activated.value().replica_replaced);
        CHECK(db->settings().get(replica_identity_setting).value() ==
              std::optional<std::string>("learner"));
    }

    // Written locally while the remote was out of reach
    REQUIRE(db->cards().save(replica("offline", 2, 3.0)).is_ok());

    SECTION("a second session with the same identity keeps local data") {
        sync_engine second(*db, remote, pool);
        auto resumed = second.resume("learner");
        REQUIRE(resumed.is_ok());
        CHECK(resumed.value().success);
        CHECK_FALSE(resumed.value().replica_replaced);
        CHECK(db->cards().find_by_id("offline").is_ok());
        CHECK(db->cards().find_by_id("c1").is_ok());
        CHECK(second.identity() == "learner");

        // Bound for pushes without reconciling
        second.push(replica("offline", 3, 6.0));
        CHECK(remote->size(entity_kind::card, "learner") == 2);

        auto other = second.activate("someone-else");
        REQUIRE(other.is_err());
        CHECK(other.error().code == error_codes::sync_invalid_state);
    }

    SECTION("another identity reconciles from its own partition") {
        sync_engine second(*db, remote, pool);
        auto switched = second.resume("someone-else");
        REQUIRE(switched.is_ok());
        CHECK(switched.value().replica_replaced);
        CHECK(db->cards().find_by_id("offline").is_err());
        CHECK(db->cards().find_by_id("c1").is_err());
        CHECK(db->settings().get(replica_identity_setting).value() ==
              std::optional<std::string>("someone-else"));
    }

    SECTION("an explicit activation reconciles again") {
        sync_engine second(*db, remote, pool);
        auto again = second.activate("learner");
        REQUIRE(again.is_ok());
        CHECK(again.value().replica_replaced);
        CHECK(db->cards().find_by_id("offline").is_err());
        CHECK(db->cards().find_by_id("c1").is_ok());
    }
}

TEST_CASE("resume reconciles again after an incomplete activation",
          "[sync][activation][resume]") {
    auto db = open_store();
    auto remote = std::make_shared<scripted_remote_store>();
    auto pool = std::make_shared<mock_thread_pool>();
    remote->fail_fetch[entity_kind::card] = true;

    {
        sync_engine first(*db, remote, pool);
        auto partial = first.resume("learner");
        REQUIRE(partial.is_ok());
        CHECK_FALSE(partial.value().errors.empty());
        CHECK(db->settings().get(replica_identity_setting).value() ==
              std::optional<std::string>(""));
    }

    remote->fail_fetch[entity_kind::card] = false;
    remote->documents[entity_kind::card] = {encode(replica("c1", 1, 1.0))};

    sync_engine second(*db, remote, pool);
    auto retried = second.resume("learner");
    REQUIRE(retried.is_ok());
    CHECK(retried.value().replica_replaced);
    CHECK(retried.value().cards_adopted == 1);
    CHECK(db->cards().find_by_id("c1").is_ok());
}

// =============================================================================
// Mirroring
// =============================================================================

TEST_CASE("push mirrors local writes after activation", "[sync][push]") {
    auto db = open_store();
    auto remote = std::make_shared<memory_remote_store>();
    auto pool = std::make_shared<mock_thread_pool>();
    sync_engine engine(*db, remote, pool);

    SECTION("nothing is pushed before activation") {
        engine.push(replica("c1", 1, 1.0));
        CHECK(pool->get_submitted_task_count() == 0);
        CHECK(engine.get_statistics().pushes_submitted == 0);
    }

    SECTION("pushes run on the pool") {
        REQUIRE(engine.activate("learner").is_ok());
        pool->set_execution_mode(mock_thread_pool::execution_mode::recording);

        engine.push(replica("c1", 1, 1.0));
        deck d;
        d.id = "d1";
        d.name = "Deck";
        engine.push(d);

        CHECK(remote->size(entity_kind::card, "learner") == 0);
        CHECK(pool->run_pending() == 2);
        CHECK(remote->size(entity_kind::card, "learner") == 1);
        CHECK(remote->size(entity_kind::deck, "learner") == 1);
        CHECK(remote->get(entity_kind::card, "learner", "c1")["repetitions"] == 1);
        CHECK(engine.get_statistics().pushes_submitted == 2);
    }

    SECTION("deletes are mirrored") {
        REQUIRE(engine.activate("learner").is_ok());
        engine.push(replica("c1", 1, 1.0));
        REQUIRE(remote->size(entity_kind::card, "learner") == 1);

        engine.push_delete(entity_kind::card, "c1");
        CHECK(remote->size(entity_kind::card, "learner") == 0);
        CHECK(engine.get_statistics().deletes_submitted == 1);
    }
}

TEST_CASE("push failures never reach the caller", "[sync][push]") {
    auto db = open_store();
    auto remote = std::make_shared<scripted_remote_store>();
    auto pool = std::make_shared<mock_thread_pool>();
    auto logger = std::make_shared<MockLogger>();
    sync_engine engine(*db, remote, pool, logger);
    REQUIRE(engine.activate("learner").is_ok());

    SECTION("remote rejects the write") {
        remote->fail_writes = true;
        engine.push(replica("c1", 1, 1.0));
        engine.push_delete(entity_kind::deck, "d1");

        auto stats = engine.get_statistics();
        CHECK(stats.pushes_submitted == 1);
        CHECK(stats.pushes_failed == 1);
        CHECK(stats.deletes_failed == 1);
        CHECK(logger->warn_count() == 2);
    }

    SECTION("pool refuses the task") {
        pool->set_should_fail_submit(true);
        engine.push(replica("c1", 1, 1.0));

        CHECK(engine.get_statistics().pushes_failed == 1);
        CHECK(remote->upserts.empty());
        CHECK(logger->last_warning().find("could not schedule") != std::string::npos);
    }
}
