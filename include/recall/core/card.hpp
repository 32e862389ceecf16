/**
 * @file card.hpp
 * @brief Vocabulary card, deck, review log and rating types
 *
 * These are the three persisted entity kinds plus the four-valued rating a
 * learner gives after recalling a card. All timestamps are system_clock
 * time points; storage and wire layers convert them to epoch milliseconds.
 */

#pragma once

#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace recall {

using clock = std::chrono::system_clock;
using time_point = clock::time_point;

// =============================================================================
// Rating
// =============================================================================

/**
 * @brief Learner's recall grade for a single review
 */
enum class rating {
    again,  ///< Failed to recall
    hard,   ///< Recalled with significant effort
    good,   ///< Recalled normally
    easy    ///< Trivially recalled; retires the card
};

/// All ratings in presentation order
inline constexpr std::array<rating, 4> all_ratings{
    rating::again, rating::hard, rating::good, rating::easy};

[[nodiscard]] constexpr auto to_string(rating r) noexcept -> std::string_view {
    switch (r) {
        case rating::again: return "again";
        case rating::hard: return "hard";
        case rating::good: return "good";
        case rating::easy: return "easy";
    }
    return "again";
}

/**
 * @brief Parse a rating name, case-insensitively
 * @return std::nullopt unless the input is one of the four rating names
 */
[[nodiscard]] auto rating_from_string(std::string_view name) -> std::optional<rating>;

// =============================================================================
// Card
// =============================================================================

/// Ease factor floor
inline constexpr double minimum_ease_factor = 1.3;

/// Ease factor assigned to newly saved cards
inline constexpr double initial_ease_factor = 2.5;

/// Interval (days) at and above which a card is retired
inline constexpr double mastered_interval_days = 10000.0;

/**
 * @brief One saved vocabulary item and its scheduling state
 *
 * interval_days below 1 encodes a sub-day learning delay (e.g. 10 minutes is
 * 10 / 1440). step indexes the learning ladder and is only meaningful while
 * the card is in the learning phase.
 */
struct card {
    std::string id;
    std::string term;
    std::string meaning;
    std::string explanation;
    std::string phonetic;
    std::optional<std::string> deck_id;
    time_point created_at{};
    time_point updated_at{};

    double interval_days{0.0};
    double ease_factor{initial_ease_factor};
    int repetitions{0};
    int step{0};
    std::optional<time_point> next_review_at;

    /**
     * @brief Replication progress used to arbitrate conflicting replicas
     */
    [[nodiscard]] auto progress() const noexcept -> double {
        return static_cast<double>(repetitions) + interval_days;
    }

    [[nodiscard]] auto is_mastered() const noexcept -> bool {
        return interval_days >= mastered_interval_days;
    }

    [[nodiscard]] auto is_new() const noexcept -> bool {
        return repetitions == 0 && interval_days == 0.0;
    }
};

/**
 * @brief Named grouping of cards
 */
struct deck {
    std::string id;
    std::string name;
    std::optional<std::string> description;
    time_point created_at{};
};

/**
 * @brief Immutable record of a single rating submission
 */
struct review_log {
    std::string id;
    std::string card_id;
    recall::rating rating{rating::again};
    time_point reviewed_at{};
};

/**
 * @brief Generate a random RFC 4122 version 4 identifier
 */
[[nodiscard]] auto generate_id() -> std::string;

}  // namespace recall
