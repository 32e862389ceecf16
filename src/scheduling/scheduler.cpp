/**
 * @file scheduler.cpp
 * @brief Implementation of the spaced-repetition transition function
 */

#include <recall/scheduling/scheduler.hpp>

#include <recall/compat/format.hpp>

#include <algorithm>
#include <cmath>
#include <utility>

namespace recall::scheduling {

namespace {

constexpr double minutes_per_day = 1440.0;

[[nodiscard]] auto to_days(std::chrono::minutes m) -> double {
    return static_cast<double>(m.count()) / minutes_per_day;
}

[[nodiscard]] auto days_to_duration(double days) -> clock::duration {
    return std::chrono::duration_cast<clock::duration>(
        std::chrono::duration<double, std::ratio<86400>>(days));
}

}  // namespace

auto validate(const scheduler_config& config) -> VoidResult {
    if (config.learning_steps.empty()) {
        return recall_void_error(error_codes::invalid_learning_ladder,
                                 "Learning ladder must have at least one step");
    }
    for (const auto& step : config.learning_steps) {
        if (step.count() <= 0) {
            return recall_void_error(
                error_codes::invalid_learning_ladder,
                recall::compat::format("Learning step must be positive, got {}m",
                                       step.count()));
        }
    }
    if (config.hard_learning_delay.count() <= 0) {
        return recall_void_error(error_codes::invalid_learning_ladder,
                                 "Hard learning delay must be positive");
    }
    return ok();
}

auto format_interval(double interval_days) -> std::string {
    if (interval_days < 1.0) {
        auto minutes = static_cast<long long>(std::lround(interval_days * minutes_per_day));
        return recall::compat::format("{}m", std::max(1LL, minutes));
    }
    if (interval_days < 365.0) {
        return recall::compat::format("{}d", std::lround(interval_days));
    }
    return recall::compat::format("{:.1f}y", interval_days / 365.0);
}

// =============================================================================
// scheduler
// =============================================================================

scheduler::scheduler() : scheduler(scheduler_config{}) {}

scheduler::scheduler(scheduler_config config) : config_(std::move(config)) {
    if (validate(config_).is_err()) {
        config_.learning_steps = scheduler_config{}.learning_steps;
        config_.hard_learning_delay = scheduler_config{}.hard_learning_delay;
    }
}

auto scheduler::last_step() const noexcept -> int {
    return static_cast<int>(config_.learning_steps.size()) - 1;
}

auto scheduler::ladder_interval(int step) const -> double {
    step = std::clamp(step, 0, last_step());
    return to_days(config_.learning_steps[static_cast<std::size_t>(step)]);
}

auto scheduler::compute_next(const card& c, rating r, time_point now) const
    -> schedule_update {
    schedule_update next;
    next.interval_days = c.interval_days;
    next.ease_factor = std::max(minimum_ease_factor, c.ease_factor);
    next.repetitions = c.repetitions;
    next.step = c.step;

    const auto phase = phase_of(c);

    switch (r) {
        case rating::easy:
            next.interval_days = mastered_interval_days;
            next.step = 0;
            break;

        case rating::again:
            if (phase == card_phase::learning) {
                next.step = 0;
                next.interval_days = ladder_interval(0);
            } else {
                // Lapse: back onto the ladder at its second rung
                next.step = std::min(1, last_step());
                next.interval_days = ladder_interval(next.step);
                next.ease_factor = next.ease_factor - config_.lapse_ease_penalty;
                next.repetitions = 0;
            }
            break;

        case rating::hard:
            if (phase == card_phase::learning) {
                next.interval_days = to_days(config_.hard_learning_delay);
            } else if (phase == card_phase::review) {
                next.interval_days =
                    std::min(c.interval_days * config_.hard_interval_multiplier,
                             config_.maximum_review_interval_days);
                next.ease_factor = next.ease_factor - config_.hard_ease_penalty;
            }
            break;

        case rating::good:
            if (phase == card_phase::learning) {
                if (c.step < last_step()) {
                    next.step = std::max(0, c.step) + 1;
                    next.interval_days = ladder_interval(next.step);
                } else {
                    next.step = 0;
                    next.interval_days = config_.graduation_interval_days;
                }
            } else if (phase == card_phase::review) {
                next.interval_days = std::min(c.interval_days * next.ease_factor,
                                              config_.maximum_review_interval_days);
            }
            break;
    }

    if (r != rating::again) {
        next.repetitions += 1;
    }
    next.ease_factor = std::max(minimum_ease_factor, next.ease_factor);
    next.next_review_at = now + days_to_duration(next.interval_days);

    return next;
}

auto scheduler::compute_next(const card& c, rating r) const -> schedule_update {
    return compute_next(c, r, clock::now());
}

auto scheduler::apply(const card& c, rating r, time_point now) const -> card {
    const auto update = compute_next(c, r, now);

    card updated = c;
    updated.interval_days = update.interval_days;
    updated.ease_factor = update.ease_factor;
    updated.repetitions = update.repetitions;
    updated.step = update.step;
    updated.next_review_at = update.next_review_at;
    updated.updated_at = now;
    return updated;
}

auto scheduler::preview(const card& c, time_point now) const
    -> std::array<interval_preview, 4> {
    std::array<interval_preview, 4> previews;
    for (std::size_t i = 0; i < all_ratings.size(); ++i) {
        const auto update = compute_next(c, all_ratings[i], now);
        previews[i].rating = all_ratings[i];
        previews[i].interval_days = update.interval_days;
        previews[i].label = format_interval(update.interval_days);
    }
    return previews;
}

}  // namespace recall::scheduling
