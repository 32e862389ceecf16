/**
 * @file entity_codec.cpp
 * @brief JSON encoding and decoding of cards, decks and review logs
 */

#include <recall/sync/entity_codec.hpp>

#include <recall/compat/format.hpp>
#include <recall/compat/time.hpp>

#include <algorithm>
#include <cstdint>
#include <string>

namespace recall::sync {

using nlohmann::json;

namespace {

[[nodiscard]] auto decode_failure(std::string_view what, const std::string& detail) {
    return recall::compat::format("Cannot decode {}: {}", what, detail);
}

[[nodiscard]] auto string_or(const json& doc, const char* key, std::string fallback = {})
    -> std::string {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return fallback;
    }
    return it->get<std::string>();
}

[[nodiscard]] auto optional_string(const json& doc, const char* key)
    -> std::optional<std::string> {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

[[nodiscard]] auto optional_time(const json& doc, const char* key)
    -> std::optional<time_point> {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return std::nullopt;
    }
    return compat::from_epoch_ms(it->get<std::int64_t>());
}

[[nodiscard]] auto required_id(const json& doc) -> std::optional<std::string> {
    if (!doc.is_object()) {
        return std::nullopt;
    }
    auto it = doc.find("id");
    if (it == doc.end() || !it->is_string() || it->get<std::string>().empty()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

}  // namespace

// =============================================================================
// Encoding
// =============================================================================

auto encode(const card& c) -> json {
    json doc{
        {"id", c.id},
        {"term", c.term},
        {"meaning", c.meaning},
        {"explanation", c.explanation},
        {"phonetic", c.phonetic},
        {"createdAt", compat::to_epoch_ms(c.created_at)},
        {"lastUpdated", compat::to_epoch_ms(c.updated_at)},
        {"interval", c.interval_days},
        {"easeFactor", c.ease_factor},
        {"repetitions", c.repetitions},
        {"step", c.step},
    };
    doc["deckId"] = c.deck_id ? json(*c.deck_id) : json(nullptr);
    doc["nextReview"] =
        c.next_review_at ? json(compat::to_epoch_ms(*c.next_review_at)) : json(nullptr);
    return doc;
}

auto encode(const deck& d) -> json {
    json doc{
        {"id", d.id},
        {"name", d.name},
        {"createdAt", compat::to_epoch_ms(d.created_at)},
    };
    if (d.description) {
        doc["description"] = *d.description;
    }
    return doc;
}

auto encode(const review_log& log) -> json {
    return json{
        {"id", log.id},
        {"cardId", log.card_id},
        {"rating", std::string(to_string(log.rating))},
        {"timestamp", compat::to_epoch_ms(log.reviewed_at)},
    };
}

// =============================================================================
// Decoding
// =============================================================================

auto decode_card(const json& doc) -> Result<card> {
    auto id = required_id(doc);
    if (!id) {
        return recall_error<card>(error_codes::remote_decode_error,
                                  decode_failure("card", "missing id"));
    }

    try {
        card c;
        c.id = *id;
        c.term = string_or(doc, "term");
        c.meaning = string_or(doc, "meaning");
        c.explanation = string_or(doc, "explanation");
        c.phonetic = string_or(doc, "phonetic");
        c.deck_id = optional_string(doc, "deckId");
        c.created_at = optional_time(doc, "createdAt").value_or(time_point{});
        c.updated_at = optional_time(doc, "lastUpdated").value_or(c.created_at);
        c.interval_days = doc.value("interval", 0.0);
        c.ease_factor = std::max(minimum_ease_factor,
                                 doc.value("easeFactor", initial_ease_factor));
        c.repetitions = doc.value("repetitions", 0);
        c.step = doc.value("step", 0);
        c.next_review_at = optional_time(doc, "nextReview");

        if (c.interval_days < 0.0) {
            c.interval_days = 0.0;
        }
        return c;
    } catch (const json::exception& e) {
        return recall_error<card>(error_codes::remote_decode_error,
                                  decode_failure("card " + *id, e.what()));
    }
}

auto decode_deck(const json& doc) -> Result<deck> {
    auto id = required_id(doc);
    if (!id) {
        return recall_error<deck>(error_codes::remote_decode_error,
                                  decode_failure("deck", "missing id"));
    }

    try {
        deck d;
        d.id = *id;
        d.name = string_or(doc, "name");
        d.description = optional_string(doc, "description");
        d.created_at = optional_time(doc, "createdAt").value_or(time_point{});
        return d;
    } catch (const json::exception& e) {
        return recall_error<deck>(error_codes::remote_decode_error,
                                  decode_failure("deck " + *id, e.what()));
    }
}

auto decode_review_log(const json& doc) -> Result<review_log> {
    auto id = required_id(doc);
    if (!id) {
        return recall_error<review_log>(error_codes::remote_decode_error,
                                        decode_failure("review log", "missing id"));
    }

    try {
        review_log log;
        log.id = *id;
        log.card_id = string_or(doc, "cardId");

        auto parsed = rating_from_string(string_or(doc, "rating"));
        if (!parsed) {
            return recall_error<review_log>(
                error_codes::remote_decode_error,
                decode_failure("review log " + *id, "unknown rating"));
        }
        log.rating = *parsed;
        log.reviewed_at = optional_time(doc, "timestamp").value_or(time_point{});
        return log;
    } catch (const json::exception& e) {
        return recall_error<review_log>(error_codes::remote_decode_error,
                                        decode_failure("review log " + *id, e.what()));
    }
}

}  // namespace recall::sync
