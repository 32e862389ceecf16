/**
 * @file study_service.cpp
 * @brief Implementation of the study operations
 */

#include <recall/services/study_service.hpp>

#include <recall/compat/format.hpp>
#include <recall/integration/logger_adapter.hpp>
#include <recall/storage/card_database.hpp>
#include <recall/sync/sync_engine.hpp>

#include <algorithm>
#include <cctype>

namespace recall::services {

namespace {

[[nodiscard]] auto trim(std::string_view text) -> std::string_view {
    const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!text.empty() && is_space(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

[[nodiscard]] auto split_tabs(std::string_view line) -> std::vector<std::string_view> {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true) {
        auto tab = line.find('\t', start);
        if (tab == std::string_view::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
    return fields;
}

[[nodiscard]] auto make_card(const new_card& content, time_point now) -> card {
    card c;
    c.id = generate_id();
    c.term = std::string(trim(content.term));
    c.meaning = content.meaning;
    c.explanation = content.explanation;
    c.phonetic = content.phonetic;
    c.deck_id = content.deck_id;
    c.created_at = now;
    c.updated_at = now;
    c.next_review_at = now;
    return c;
}

}  // namespace

auto normalize_term(std::string_view term) -> std::string {
    std::string normalized(trim(term));
    // ASCII only; std::tolower would be locale dependent for bytes >= 0x80
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) {
                       return c >= 'A' && c <= 'Z' ? static_cast<char>(c - 'A' + 'a')
                                                   : static_cast<char>(c);
                   });
    return normalized;
}

study_service::study_service(storage::card_database& store,
                             scheduling::scheduler sched,
                             std::shared_ptr<sync::sync_engine> sync,
                             std::shared_ptr<di::ILogger> logger)
    : store_(store),
      scheduler_(std::move(sched)),
      sync_(std::move(sync)),
      logger_(di::or_null(std::move(logger))) {}

// =============================================================================
// Cards
// =============================================================================

auto study_service::find_duplicate(const std::vector<card>& existing,
                                   const new_card& content) const
    -> std::optional<card> {
    const auto wanted = normalize_term(content.term);
    for (const auto& c : existing) {
        if (c.deck_id == content.deck_id && normalize_term(c.term) == wanted) {
            return c;
        }
    }
    return std::nullopt;
}

auto study_service::save_card(const new_card& content, time_point now)
    -> Result<save_result> {
    if (trim(content.term).empty()) {
        return recall_error<save_result>(error_codes::empty_term,
                                         "Cannot save a card without a term");
    }

    auto existing = store_.cards().find_by_deck(content.deck_id);
    if (existing.is_err()) {
        return Result<save_result>(existing.error());
    }

    if (auto duplicate = find_duplicate(existing.value(), content)) {
        logger_->debug_fmt("'{}' already saved as {}", content.term, duplicate->id);
        return save_result{save_outcome::not_added, *duplicate};
    }

    auto created = make_card(content, now);
    auto saved = store_.cards().save(created);
    if (saved.is_err()) {
        return Result<save_result>(saved.error());
    }

    if (sync_) {
        sync_->push(created);
    }
    logger_->info_fmt("Saved card {} '{}'", created.id, created.term);
    return save_result{save_outcome::added, std::move(created)};
}

auto study_service::list_cards(const std::optional<std::string>& deck_id) const
    -> Result<std::vector<card>> {
    if (!deck_id) {
        return store_.cards().find_all();
    }
    return store_.cards().find_by_deck(deck_id);
}

auto study_service::import_cards(std::string_view rows,
                                 const std::optional<std::string>& deck_id,
                                 time_point now) -> Result<import_report> {
    import_report report;
    std::size_t line_no = 0;

    while (!rows.empty()) {
        auto eol = rows.find('\n');
        auto line = rows.substr(0, eol);
        rows = eol == std::string_view::npos ? std::string_view{} : rows.substr(eol + 1);
        ++line_no;

        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (trim(line).empty() || trim(line).front() == '#') {
            continue;
        }

        auto fields = split_tabs(line);
        if (fields.size() < 2 || fields.size() > 4) {
            report.issues.push_back(
                {line_no, recall::compat::format("expected 2 to 4 tab-separated fields, got {}",
                                                 fields.size())});
            continue;
        }

        new_card content;
        content.term = std::string(trim(fields[0]));
        content.meaning = std::string(trim(fields[1]));
        content.explanation = fields.size() > 2 ? std::string(trim(fields[2])) : "";
        content.phonetic = fields.size() > 3 ? std::string(trim(fields[3])) : "";
        content.deck_id = deck_id;

        if (content.term.empty() || content.meaning.empty()) {
            report.issues.push_back({line_no, "term and meaning must not be empty"});
            continue;
        }

        auto saved = save_card(content, now);
        if (saved.is_err()) {
            return Result<import_report>(saved.error());
        }
        if (saved.value().outcome == save_outcome::not_added) {
            report.duplicates++;
            report.issues.push_back(
                {line_no, recall::compat::format("duplicate of '{}'", saved.value().card.term)});
        } else {
            report.imported++;
        }
    }

    logger_->info_fmt("Imported {} cards ({} duplicates, {} issues)", report.imported,
                      report.duplicates, report.issues.size());
    return report;
}

// =============================================================================
// Decks
// =============================================================================

auto study_service::create_deck(std::string_view name,
                                std::optional<std::string> description,
                                time_point now) -> Result<deck> {
    if (trim(name).empty()) {
        return recall_error<deck>(error_codes::invalid_argument, "Deck name must not be empty");
    }

    deck d;
    d.id = generate_id();
    d.name = std::string(trim(name));
    d.description = std::move(description);
    d.created_at = now;

    auto saved = store_.decks().save(d);
    if (saved.is_err()) {
        return Result<deck>(saved.error());
    }

    if (sync_) {
        sync_->push(d);
    }
    return d;
}

auto study_service::list_decks() const -> Result<std::vector<deck>> {
    return store_.decks().find_all();
}

auto study_service::delete_deck(std::string_view deck_id) -> Result<std::size_t> {
    auto found = store_.decks().find_by_id(deck_id);
    if (found.is_err()) {
        return Result<std::size_t>(found.error());
    }

    auto members = store_.cards().find_by_deck(std::string(deck_id));
    if (members.is_err()) {
        return Result<std::size_t>(members.error());
    }

    auto removed = store_.remove_deck_cascade(deck_id);
    if (removed.is_err()) {
        return removed;
    }

    if (sync_) {
        sync_->push_delete(sync::entity_kind::deck, deck_id);
        for (const auto& c : members.value()) {
            sync_->push_delete(sync::entity_kind::card, c.id);
        }
    }

    integration::logger_adapter::log_deck_deleted(std::string(deck_id), removed.value());
    return removed;
}

// =============================================================================
// Reviews
// =============================================================================

auto study_service::submit_review(std::string_view card_id, rating r, time_point now)
    -> Result<card> {
    auto current = store_.cards().find_by_id(card_id);
    if (current.is_err()) {
        return current;
    }

    auto updated = scheduler_.apply(current.value(), r, now);

    review_log log;
    log.id = generate_id();
    log.card_id = updated.id;
    log.rating = r;
    log.reviewed_at = now;

    auto recorded = store_.record_review(updated, log);
    if (recorded.is_err()) {
        logger_->error_fmt("Review of {} not recorded: {}", updated.id,
                           recorded.error().message);
        return Result<card>(recorded.error());
    }

    if (sync_) {
        sync_->push(updated);
        sync_->push(log);
    }

    integration::logger_adapter::log_review_submitted(
        updated.id, std::string(to_string(r)), updated.interval_days);
    return updated;
}

auto study_service::preview(std::string_view card_id, time_point now) const
    -> Result<std::array<scheduling::interval_preview, 4>> {
    auto current = store_.cards().find_by_id(card_id);
    if (current.is_err()) {
        return Result<std::array<scheduling::interval_preview, 4>>(current.error());
    }
    return scheduler_.preview(current.value(), now);
}

// =============================================================================
// Daily Limit
// =============================================================================

auto study_service::daily_limit() const -> Result<int> {
    return store_.settings().daily_limit();
}

auto study_service::set_daily_limit(int limit) -> VoidResult {
    auto result = store_.settings().set_daily_limit(limit);
    if (result.is_err()) {
        logger_->warn_fmt("Rejected daily limit {}: {}", limit, result.error().message);
        return result;
    }
    logger_->info_fmt("Daily limit set to {}", limit);
    return result;
}

}  // namespace recall::services
