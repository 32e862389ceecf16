/**
 * @file statistics_engine.cpp
 * @brief Implementation of the statistics views
 */

#include <recall/stats/statistics_engine.hpp>

#include <recall/compat/time.hpp>
#include <recall/storage/card_database.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <numeric>

namespace recall::stats {

namespace {

constexpr auto one_day = std::chrono::hours{24};

/// Whole local calendar days from @p from_midnight to the day of @p tp
[[nodiscard]] auto local_day_offset(time_point from_midnight, time_point tp) -> long long {
    const auto day_start = compat::start_of_local_day(tp);
    const auto hours =
        std::chrono::duration_cast<std::chrono::hours>(day_start - from_midnight).count();
    // DST shifts move midnight by an hour; round to the nearest day
    return static_cast<long long>(std::llround(static_cast<double>(hours) / 24.0));
}

}  // namespace

auto history_range_from_string(std::string_view name) -> std::optional<history_range> {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (auto range : {history_range::week, history_range::month, history_range::year}) {
        if (to_string(range) == lower) {
            return range;
        }
    }
    return std::nullopt;
}

auto due_forecast::total() const noexcept -> std::size_t {
    return std::accumulate(young.begin(), young.end(), std::size_t{0}) +
           std::accumulate(mature.begin(), mature.end(), std::size_t{0}) + beyond_horizon;
}

// =============================================================================
// Pure Aggregations
// =============================================================================

auto count_cards(const std::vector<card>& cards) -> card_counts {
    card_counts counts;
    counts.total = cards.size();

    for (const auto& c : cards) {
        if (c.is_new()) {
            counts.new_cards++;
        } else if (c.interval_days < 1.0) {
            counts.learning++;
        } else if (c.interval_days < mature_interval_days) {
            counts.young++;
        } else {
            counts.mature++;
            if (c.is_mastered()) {
                counts.mastered++;
            }
        }
    }
    return counts;
}

auto build_forecast(const std::vector<card>& cards, time_point today_start) -> due_forecast {
    due_forecast forecast;

    for (const auto& c : cards) {
        if (c.is_mastered() || !c.next_review_at) {
            continue;
        }

        const auto offset = std::max(0LL, local_day_offset(today_start, *c.next_review_at));
        if (offset >= static_cast<long long>(forecast_days)) {
            forecast.beyond_horizon++;
            continue;
        }

        const auto day = static_cast<std::size_t>(offset);
        if (c.interval_days >= mature_interval_days) {
            forecast.mature[day]++;
        } else {
            forecast.young[day]++;
        }
    }
    return forecast;
}

auto build_interval_histogram(const std::vector<card>& cards)
    -> std::vector<histogram_bucket> {
    std::vector<histogram_bucket> buckets{
        {"0-1", 0},    {"2-7", 0},     {"8-30", 0},  {"31-90", 0},
        {"91-180", 0}, {"181-365", 0}, {">365", 0},
    };

    for (const auto& c : cards) {
        if (c.is_mastered()) {
            continue;
        }
        auto bound = std::find_if(interval_bucket_upper_bounds.begin(),
                                  interval_bucket_upper_bounds.end(),
                                  [&](double upper) { return c.interval_days <= upper; });
        const auto index =
            static_cast<std::size_t>(bound - interval_bucket_upper_bounds.begin());
        buckets[index].count++;
    }
    return buckets;
}

auto summarize_today(const std::vector<review_log>& logs_today, int daily_limit)
    -> today_summary {
    today_summary today;
    today.daily_limit = daily_limit;
    today.studied = logs_today.size();
    for (const auto& log : logs_today) {
        if (log.rating == rating::again) {
            today.again_count++;
        } else {
            today.pass_count++;
        }
    }
    return today;
}

// =============================================================================
// statistics_engine
// =============================================================================

statistics_engine::statistics_engine(const storage::card_database& store,
                                     std::shared_ptr<di::ILogger> logger)
    : store_(store), logger_(di::or_null(std::move(logger))) {}

auto statistics_engine::today(time_point now) const -> Result<today_summary> {
    auto logs = store_.review_logs().find_since(compat::start_of_local_day(now));
    if (logs.is_err()) {
        return Result<today_summary>(logs.error());
    }
    auto limit = store_.settings().daily_limit();
    if (limit.is_err()) {
        logger_->error_fmt("Cannot read daily limit: {}", limit.error().message);
        return Result<today_summary>(limit.error());
    }
    return summarize_today(logs.value(), limit.value());
}

auto statistics_engine::counts() const -> Result<card_counts> {
    auto cards = store_.cards().find_all();
    if (cards.is_err()) {
        return Result<card_counts>(cards.error());
    }
    return count_cards(cards.value());
}

auto statistics_engine::forecast(time_point now) const -> Result<due_forecast> {
    auto cards = store_.cards().find_all();
    if (cards.is_err()) {
        return Result<due_forecast>(cards.error());
    }
    return build_forecast(cards.value(), compat::start_of_local_day(now));
}

auto statistics_engine::interval_histogram() const
    -> Result<std::vector<histogram_bucket>> {
    auto cards = store_.cards().find_all();
    if (cards.is_err()) {
        return Result<std::vector<histogram_bucket>>(cards.error());
    }
    return build_interval_histogram(cards.value());
}

auto statistics_engine::review_history(history_range range, time_point now) const
    -> Result<std::vector<history_point>> {
    std::vector<time_point> starts;
    const char* label_pattern = "%Y-%m-%d";

    switch (range) {
        case history_range::week:
        case history_range::month: {
            const int days = range == history_range::week ? 7 : 30;
            for (int i = days - 1; i >= 0; --i) {
                starts.push_back(compat::start_of_local_day(now, -i));
            }
            break;
        }
        case history_range::year:
            label_pattern = "%Y-%m";
            for (int i = 11; i >= 0; --i) {
                starts.push_back(compat::start_of_local_month(now, -i));
            }
            break;
    }

    auto logs = store_.review_logs().find_since(starts.front());
    if (logs.is_err()) {
        return Result<std::vector<history_point>>(logs.error());
    }

    std::vector<history_point> points(starts.size());
    for (std::size_t i = 0; i < starts.size(); ++i) {
        points[i].label = compat::format_local(starts[i], label_pattern);
    }

    for (const auto& log : logs.value()) {
        if (log.reviewed_at > now) {
            continue;
        }
        // Last period whose start is not after the review
        auto it = std::upper_bound(starts.begin(), starts.end(), log.reviewed_at);
        if (it == starts.begin()) {
            continue;
        }
        auto& point = points[static_cast<std::size_t>(std::prev(it) - starts.begin())];
        switch (log.rating) {
            case rating::again: point.again++; break;
            case rating::hard: point.hard++; break;
            case rating::good: point.good++; break;
            case rating::easy: point.easy++; break;
        }
        point.total++;
    }

    return points;
}

auto statistics_engine::snapshot(time_point now) const -> Result<statistics_snapshot> {
    auto cards = store_.cards().find_all();
    if (cards.is_err()) {
        return Result<statistics_snapshot>(cards.error());
    }
    auto today_result = today(now);
    if (today_result.is_err()) {
        return Result<statistics_snapshot>(today_result.error());
    }

    const auto& all = cards.value();

    statistics_snapshot snap;
    snap.today = today_result.value();
    snap.counts = count_cards(all);
    snap.forecast = build_forecast(all, compat::start_of_local_day(now));
    snap.intervals = build_interval_histogram(all);
    snap.due_now = static_cast<std::size_t>(
        std::count_if(all.begin(), all.end(), [&](const card& c) {
            return !c.is_mastered() && c.next_review_at && *c.next_review_at <= now;
        }));

    logger_->debug_fmt("statistics: {} cards, {} due now, {} studied today",
                       snap.counts.total, snap.due_now, snap.today.studied);
    return snap;
}

}  // namespace recall::stats
