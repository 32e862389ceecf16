/**
 * @file scheduler.hpp
 * @brief Spaced-repetition transition function
 *
 * The scheduler maps (card state, rating, now) to the card's next
 * scheduling state. It never touches storage; callers persist the result.
 */

#pragma once

#include <recall/core/card.hpp>
#include <recall/core/result.hpp>

#include <array>
#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace recall::scheduling {

// =============================================================================
// Phases
// =============================================================================

/**
 * @brief Scheduling phase derived from a card's interval
 */
enum class card_phase {
    learning,  ///< interval below one day; driven by the learning ladder
    review,    ///< one day or more, not yet mastered
    mastered   ///< retired; never scheduled again
};

[[nodiscard]] constexpr auto to_string(card_phase phase) noexcept -> std::string_view {
    switch (phase) {
        case card_phase::learning: return "learning";
        case card_phase::review: return "review";
        case card_phase::mastered: return "mastered";
    }
    return "learning";
}

/**
 * @brief Phase for a raw interval in days
 */
[[nodiscard]] constexpr auto phase_of(double interval_days) noexcept -> card_phase {
    if (interval_days >= mastered_interval_days) {
        return card_phase::mastered;
    }
    return interval_days < 1.0 ? card_phase::learning : card_phase::review;
}

[[nodiscard]] constexpr auto phase_of(const card& c) noexcept -> card_phase {
    return phase_of(c.interval_days);
}

// =============================================================================
// Configuration
// =============================================================================

/**
 * @brief Tunables of the transition function
 */
struct scheduler_config {
    /// Learning ladder; graduation follows a good on the last step
    std::vector<std::chrono::minutes> learning_steps{std::chrono::minutes{1},
                                                     std::chrono::minutes{10}};

    /// Delay for hard while learning (step unchanged)
    std::chrono::minutes hard_learning_delay{6};

    /// Interval assigned on graduation from the ladder
    double graduation_interval_days{1.0};

    /// Growth factor applied to review intervals on hard
    double hard_interval_multiplier{1.2};

    double hard_ease_penalty{0.15};
    double lapse_ease_penalty{0.2};

    /// Upper bound for hard/good review growth; only easy retires a card
    double maximum_review_interval_days{9999.0};
};

/**
 * @brief Validate a scheduler configuration
 * @return error_codes::invalid_learning_ladder for an empty ladder or a
 *         non-positive step
 */
[[nodiscard]] auto validate(const scheduler_config& config) -> VoidResult;

// =============================================================================
// Scheduler
// =============================================================================

/**
 * @brief New scheduling fields for a card after one rating
 */
struct schedule_update {
    time_point next_review_at{};
    double interval_days{0.0};
    double ease_factor{initial_ease_factor};
    int repetitions{0};
    int step{0};
};

/**
 * @brief What a rating would do, for rendering answer buttons
 */
struct interval_preview {
    recall::rating rating{rating::again};
    double interval_days{0.0};
    std::string label;
};

/**
 * @brief Human readable interval: "<n>m" below a day, "<n>d" below a year,
 *        "<x.y>y" beyond
 */
[[nodiscard]] auto format_interval(double interval_days) -> std::string;

/**
 * @brief Pure, deterministic spaced-repetition transition function
 *
 * Thread Safety: immutable after construction; safe to share.
 *
 * @code
 * scheduler sched;
 * auto update = sched.compute_next(card, rating::good, now);
 * auto updated = sched.apply(card, rating::good, now);
 * @endcode
 */
class scheduler {
public:
    /**
     * @brief Construct with the default 1 and 10 minute ladder
     */
    scheduler();

    /**
     * @brief Construct with custom tunables
     *
     * An invalid configuration (see validate()) falls back to the default
     * ladder; use validate() first to reject it instead.
     */
    explicit scheduler(scheduler_config config);

    /**
     * @brief Next scheduling state for @p c rated @p r at @p now
     */
    [[nodiscard]] auto compute_next(const card& c, rating r, time_point now) const
        -> schedule_update;

    /**
     * @brief compute_next() anchored at the current system time
     */
    [[nodiscard]] auto compute_next(const card& c, rating r) const -> schedule_update;

    /**
     * @brief Copy of @p c with the update applied and updated_at = @p now
     */
    [[nodiscard]] auto apply(const card& c, rating r, time_point now) const -> card;

    /**
     * @brief Resulting interval of each rating, without mutating @p c
     */
    [[nodiscard]] auto preview(const card& c, time_point now) const
        -> std::array<interval_preview, 4>;

    [[nodiscard]] auto config() const noexcept -> const scheduler_config& {
        return config_;
    }

private:
    [[nodiscard]] auto ladder_interval(int step) const -> double;
    [[nodiscard]] auto last_step() const noexcept -> int;

    scheduler_config config_;
};

}  // namespace recall::scheduling
