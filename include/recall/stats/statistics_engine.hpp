/**
 * @file statistics_engine.hpp
 * @brief Read-only aggregate views over cards and the review ledger
 */

#pragma once

#include <recall/core/card.hpp>
#include <recall/core/result.hpp>
#include <recall/di/ilogger.hpp>

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace recall::storage {
class card_database;
}  // namespace recall::storage

namespace recall::stats {

/// Interval (days) from which a review card counts as mature
inline constexpr double mature_interval_days = 21.0;

/// Days covered by the due forecast, day 0 being today
inline constexpr std::size_t forecast_days = 365;

// =============================================================================
// Views
// =============================================================================

/**
 * @brief Today's study activity, counted from local midnight
 */
struct today_summary {
    std::size_t studied{0};
    int daily_limit{0};
    std::size_t again_count{0};
    std::size_t pass_count{0};  ///< hard, good or easy
};

/**
 * @brief Cards per maturity bucket; new, learning, young and mature are
 *        mutually exclusive
 */
struct card_counts {
    std::size_t new_cards{0};
    std::size_t learning{0};
    std::size_t young{0};
    std::size_t mature{0};    ///< includes mastered cards
    std::size_t mastered{0};  ///< subset of mature
    std::size_t total{0};
};

/**
 * @brief Non-mastered cards falling due per day
 *
 * Bucket 0 is today and also holds overdue cards. Learning cards count as
 * young. sum(young) + sum(mature) + beyond_horizon equals the number of
 * non-mastered cards with a due time.
 */
struct due_forecast {
    std::array<std::size_t, forecast_days> young{};
    std::array<std::size_t, forecast_days> mature{};
    std::size_t beyond_horizon{0};

    [[nodiscard]] auto total() const noexcept -> std::size_t;
};

/**
 * @brief Named interval range and the number of cards in it
 */
struct histogram_bucket {
    std::string label;
    std::size_t count{0};
};

/**
 * @brief Ranges of the interval histogram: 0-1, 2-7, 8-30, 31-90, 91-180,
 *        181-365 and >365 days
 */
inline constexpr std::array<double, 6> interval_bucket_upper_bounds{
    1.0, 7.0, 30.0, 90.0, 180.0, 365.0};

/**
 * @brief Period covered by the review history chart
 */
enum class history_range {
    week,   ///< 7 daily points
    month,  ///< 30 daily points
    year    ///< 12 monthly points
};

[[nodiscard]] constexpr auto to_string(history_range range) noexcept -> std::string_view {
    switch (range) {
        case history_range::week: return "week";
        case history_range::month: return "month";
        case history_range::year: return "year";
    }
    return "week";
}

[[nodiscard]] auto history_range_from_string(std::string_view name)
    -> std::optional<history_range>;

/**
 * @brief Rating breakdown of one day or month
 */
struct history_point {
    std::string label;  ///< YYYY-MM-DD, or YYYY-MM for the year range
    std::size_t again{0};
    std::size_t hard{0};
    std::size_t good{0};
    std::size_t easy{0};
    std::size_t total{0};
};

/**
 * @brief All dashboard views computed from one read of the store
 */
struct statistics_snapshot {
    today_summary today;
    card_counts counts;
    due_forecast forecast;
    std::vector<histogram_bucket> intervals;
    std::size_t due_now{0};
};

// =============================================================================
// Pure Aggregations
// =============================================================================

[[nodiscard]] auto count_cards(const std::vector<card>& cards) -> card_counts;

/**
 * @param today_start Local midnight of the current day
 */
[[nodiscard]] auto build_forecast(const std::vector<card>& cards, time_point today_start)
    -> due_forecast;

[[nodiscard]] auto build_interval_histogram(const std::vector<card>& cards)
    -> std::vector<histogram_bucket>;

[[nodiscard]] auto summarize_today(const std::vector<review_log>& logs_today,
                                   int daily_limit) -> today_summary;

// =============================================================================
// Statistics Engine
// =============================================================================

/**
 * @brief Computes statistics on demand from the local card store
 *
 * Nothing is cached; every call reflects the store at call time.
 *
 * Thread Safety: NOT thread-safe (shares the store's connection).
 */
class statistics_engine {
public:
    explicit statistics_engine(const storage::card_database& store,
                               std::shared_ptr<di::ILogger> logger = nullptr);

    [[nodiscard]] auto today(time_point now) const -> Result<today_summary>;

    [[nodiscard]] auto counts() const -> Result<card_counts>;

    [[nodiscard]] auto forecast(time_point now) const -> Result<due_forecast>;

    [[nodiscard]] auto interval_histogram() const -> Result<std::vector<histogram_bucket>>;

    /**
     * @brief Per-period rating breakdown, oldest period first
     */
    [[nodiscard]] auto review_history(history_range range, time_point now) const
        -> Result<std::vector<history_point>>;

    [[nodiscard]] auto snapshot(time_point now) const -> Result<statistics_snapshot>;

private:
    const storage::card_database& store_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace recall::stats
