/**
 * @file due_selector_test.cpp
 * @brief Unit tests for due-set selection and the daily limit
 */

#include <recall/compat/time.hpp>
#include <recall/scheduling/due_selector.hpp>
#include <recall/scheduling/scheduler.hpp>
#include <recall/storage/card_database.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>

using namespace recall;
using namespace recall::scheduling;
using recall::storage::card_database;

namespace {

auto open_store() -> std::unique_ptr<card_database> {
    auto db = card_database::open(":memory:");
    REQUIRE(db.is_ok());
    return std::move(db.value());
}

auto make_card(const std::string& id, double interval, time_point due,
               std::optional<std::string> deck = std::nullopt) -> card {
    card c;
    c.id = id;
    c.term = "term-" + id;
    c.meaning = "meaning";
    c.interval_days = interval;
    c.repetitions = interval > 0.0 ? 1 : 0;
    c.next_review_at = due;
    c.deck_id = std::move(deck);
    return c;
}

void log_reviews(card_database& db, std::size_t count, time_point at) {
    for (std::size_t i = 0; i < count; ++i) {
        review_log log;
        log.id = "log-" + std::to_string(i);
        log.card_id = "card";
        log.rating = rating::good;
        log.reviewed_at = at;
        REQUIRE(db.review_logs().save(log).is_ok());
    }
}

}  // namespace

TEST_CASE("due_cards returns only due, non-mastered cards", "[scheduling][due]") {
    auto db = open_store();
    const auto now = recall::clock::now();
    const auto past = now - std::chrono::hours{2};

    REQUIRE(db->cards().save(make_card("due", 3.0, past)).is_ok());
    REQUIRE(db->cards().save(make_card("future", 3.0, now + std::chrono::hours{5})).is_ok());
    REQUIRE(db->cards().save(make_card("mastered", mastered_interval_days, past)).is_ok());

    due_selector selector(*db);
    auto due = selector.due_cards(std::nullopt, now);
    REQUIRE(due.is_ok());
    REQUIRE(due.value().size() == 1);
    CHECK(due.value()[0].id == "due");
}

TEST_CASE("due_cards puts learning cards first", "[scheduling][due]") {
    auto db = open_store();
    const auto now = recall::clock::now();

    // Review card due long ago, learning card due just now
    REQUIRE(db->cards().save(make_card("review", 4.0, now - std::chrono::hours{48})).is_ok());
    REQUIRE(db->cards().save(make_card("learning", 10.0 / 1440.0, now - std::chrono::minutes{1}))
                .is_ok());
    REQUIRE(db->cards().save(make_card("older-review", 2.0, now - std::chrono::hours{72}))
                .is_ok());

    due_selector selector(*db);
    auto due = selector.due_cards(std::nullopt, now);
    REQUIRE(due.is_ok());
    REQUIRE(due.value().size() == 3);
    CHECK(due.value()[0].id == "learning");
    CHECK(due.value()[1].id == "older-review");
    CHECK(due.value()[2].id == "review");
}

TEST_CASE("due_cards respects the remaining daily quota", "[scheduling][due][limit]") {
    auto db = open_store();
    const auto now = recall::clock::now();
    const auto past = now - std::chrono::minutes{5};

    for (int i = 0; i < 10; ++i) {
        REQUIRE(db->cards().save(make_card("c" + std::to_string(i), 2.0, past)).is_ok());
    }
    REQUIRE(db->settings().set_daily_limit(6).is_ok());

    due_selector selector(*db);

    SECTION("nothing studied yet") {
        auto due = selector.due_cards(std::nullopt, now);
        REQUIRE(due.is_ok());
        CHECK(due.value().size() == 6);
    }

    SECTION("reviews today consume the quota") {
        log_reviews(*db, 4, compat::start_of_local_day(now));
        auto due = selector.due_cards(std::nullopt, now);
        REQUIRE(due.is_ok());
        CHECK(due.value().size() == 2);
    }

    SECTION("reviews before midnight do not count") {
        log_reviews(*db, 4, compat::start_of_local_day(now) - std::chrono::minutes{1});
        auto due = selector.due_cards(std::nullopt, now);
        REQUIRE(due.is_ok());
        CHECK(due.value().size() == 6);
    }

    SECTION("limit reached leaves an empty queue") {
        log_reviews(*db, 8, compat::start_of_local_day(now));
        auto due = selector.due_cards(std::nullopt, now);
        REQUIRE(due.is_ok());
        CHECK(due.value().empty());
    }
}

TEST_CASE("deck filter shares the global daily limit", "[scheduling][due][deck]") {
    auto db = open_store();
    const auto now = recall::clock::now();
    const auto past = now - std::chrono::minutes{5};

    for (int i = 0; i < 4; ++i) {
        REQUIRE(db->cards().save(make_card("a" + std::to_string(i), 2.0, past, "deck-a")).is_ok());
        REQUIRE(db->cards().save(make_card("b" + std::to_string(i), 2.0, past, "deck-b")).is_ok());
    }
    REQUIRE(db->settings().set_daily_limit(5).is_ok());
    log_reviews(*db, 3, compat::start_of_local_day(now));

    due_selector selector(*db);
    auto due = selector.due_cards(std::string("deck-a"), now);
    REQUIRE(due.is_ok());
    CHECK(due.value().size() == 2);
    CHECK(std::all_of(due.value().begin(), due.value().end(),
                      [](const card& c) { return c.deck_id == "deck-a"; }));
}

TEST_CASE("summary reports the backlog", "[scheduling][due][summary]") {
    auto db = open_store();
    const auto now = recall::clock::now();
    const auto past = now - std::chrono::minutes{5};

    for (int i = 0; i < 7; ++i) {
        REQUIRE(db->cards().save(make_card("c" + std::to_string(i), 2.0, past)).is_ok());
    }
    REQUIRE(db->settings().set_daily_limit(5).is_ok());
    log_reviews(*db, 2, compat::start_of_local_day(now));

    due_selector selector(*db);
    auto summary = selector.summary(std::nullopt, now);
    REQUIRE(summary.is_ok());
    CHECK(summary.value().due_total == 7);
    CHECK(summary.value().studied_today == 2);
    CHECK(summary.value().daily_limit == 5);
    CHECK(summary.value().quota == 3);
    CHECK(summary.value().backlog == 4);
}

TEST_CASE("sort_for_study breaks ties by id", "[scheduling][due]") {
    const auto at = recall::clock::now();
    std::vector<card> cards{make_card("b", 3.0, at), make_card("a", 3.0, at)};
    sort_for_study(cards);
    CHECK(cards[0].id == "a");
    CHECK(cards[1].id == "b");
}
