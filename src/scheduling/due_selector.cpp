/**
 * @file due_selector.cpp
 * @brief Implementation of the due-set selector
 */

#include <recall/scheduling/due_selector.hpp>

#include <recall/compat/time.hpp>
#include <recall/scheduling/scheduler.hpp>
#include <recall/storage/card_database.hpp>

#include <algorithm>

namespace recall::scheduling {

void sort_for_study(std::vector<card>& cards) {
    std::sort(cards.begin(), cards.end(), [](const card& a, const card& b) {
        const bool a_learning = phase_of(a) == card_phase::learning;
        const bool b_learning = phase_of(b) == card_phase::learning;
        if (a_learning != b_learning) {
            return a_learning;
        }
        const auto a_due = a.next_review_at.value_or(time_point{});
        const auto b_due = b.next_review_at.value_or(time_point{});
        if (a_due != b_due) {
            return a_due < b_due;
        }
        return a.id < b.id;
    });
}

due_selector::due_selector(storage::card_database& store,
                           std::shared_ptr<di::ILogger> logger)
    : store_(store), logger_(di::or_null(std::move(logger))) {}

auto due_selector::collect_due(const std::optional<std::string>& deck_id,
                               time_point now) const -> Result<std::vector<card>> {
    auto all = store_.cards().find_all();
    if (all.is_err()) {
        return all;
    }

    std::vector<card> due;
    for (const auto& c : all.value()) {
        if (c.is_mastered()) {
            continue;
        }
        if (deck_id && c.deck_id != deck_id) {
            continue;
        }
        if (!c.next_review_at || *c.next_review_at > now) {
            continue;
        }
        due.push_back(c);
    }
    return due;
}

auto due_selector::remaining_quota(time_point now, due_summary& out) const -> VoidResult {
    auto studied = store_.review_logs().count_since(compat::start_of_local_day(now));
    if (studied.is_err()) {
        return VoidResult(studied.error());
    }

    auto limit_setting = store_.settings().daily_limit();
    if (limit_setting.is_err()) {
        logger_->error_fmt("Cannot read daily limit: {}", limit_setting.error().message);
        return VoidResult(limit_setting.error());
    }

    out.studied_today = studied.value();
    out.daily_limit = limit_setting.value();

    const auto limit = static_cast<std::size_t>(std::max(0, out.daily_limit));
    out.quota = limit > out.studied_today ? limit - out.studied_today : 0;
    return ok();
}

auto due_selector::due_cards(const std::optional<std::string>& deck_id,
                             time_point now) const -> Result<std::vector<card>> {
    auto due = collect_due(deck_id, now);
    if (due.is_err()) {
        return due;
    }

    due_summary sizing;
    auto quota_result = remaining_quota(now, sizing);
    if (quota_result.is_err()) {
        return Result<std::vector<card>>(quota_result.error());
    }

    auto queue = std::move(due.value());
    sort_for_study(queue);
    if (queue.size() > sizing.quota) {
        queue.resize(sizing.quota);
    }

    logger_->debug_fmt("due queue: {} cards (studied today {}, limit {})",
                       queue.size(), sizing.studied_today, sizing.daily_limit);
    return queue;
}

auto due_selector::summary(const std::optional<std::string>& deck_id,
                           time_point now) const -> Result<due_summary> {
    auto due = collect_due(deck_id, now);
    if (due.is_err()) {
        return Result<due_summary>(due.error());
    }

    due_summary sizing;
    auto quota_result = remaining_quota(now, sizing);
    if (quota_result.is_err()) {
        return Result<due_summary>(quota_result.error());
    }

    sizing.due_total = due.value().size();
    sizing.backlog = sizing.due_total > sizing.quota ? sizing.due_total - sizing.quota : 0;
    return sizing;
}

}  // namespace recall::scheduling
