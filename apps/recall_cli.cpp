/**
 * @file recall_cli.cpp
 * @brief Recall - vocabulary review from the command line
 *
 * A command-line front end for the spaced-repetition core: saving terms as
 * cards, managing decks, reviewing due cards and inspecting statistics.
 * When a sync identity and a remote root are configured, every invocation
 * is a session bound to that identity and mirrors its writes remotely.
 *
 * Usage:
 *   recall_cli [--config <file>] <command> [arguments] [options]
 *
 * Example:
 *   recall_cli add serendipity --meaning "happy accident"
 *   recall_cli due --deck 5b0c...
 *   recall_cli review 7f3e... good
 *   recall_cli stats
 */

#include <recall/compat/time.hpp>
#include <recall/config/app_config.hpp>
#include <recall/di/ilogger.hpp>
#include <recall/integration/logger_adapter.hpp>
#include <recall/integration/thread_pool_adapter.hpp>
#include <recall/scheduling/due_selector.hpp>
#include <recall/scheduling/scheduler.hpp>
#include <recall/services/study_service.hpp>
#include <recall/stats/statistics_engine.hpp>
#include <recall/storage/card_database.hpp>
#include <recall/sync/file_remote_store.hpp>
#include <recall/sync/sync_engine.hpp>

#include <charconv>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace recall;

namespace {

/// Exit codes
constexpr int exit_ok = 0;
constexpr int exit_usage = 1;
constexpr int exit_store = 2;
constexpr int exit_sync = 3;

/**
 * @brief Command types supported by the CLI
 */
enum class command_type {
    add,
    deck_add,
    deck_rm,
    decks,
    due,
    review,
    preview,
    stats,
    history,
    limit,
    import_file,
    sync,
    help
};

/**
 * @brief Command line options
 */
struct options {
    fs::path config_path{"recall.json"};
    command_type command{command_type::help};
    std::vector<std::string> positional;

    std::optional<std::string> deck_id;
    std::string meaning;
    std::string explanation;
    std::string phonetic;
    std::optional<std::string> description;
    std::string range{"week"};
    std::string identity;
};

/**
 * @brief Everything a command needs, wired from the configuration
 */
struct session {
    std::unique_ptr<storage::card_database> db;
    std::shared_ptr<integration::thread_pool_adapter> pool;
    std::shared_ptr<sync::sync_engine> sync;
    std::unique_ptr<services::study_service> service;
    std::shared_ptr<di::ILogger> logger;
};

void print_usage(const char* program_name) {
    std::cout << R"(
Recall - Vocabulary Review

Usage: )" << program_name
              << R"( [--config <file>] <command> [arguments] [options]

Commands:
  add <term>              Save a term as a new card (due immediately)
  deck-add <name>         Create a deck
  deck-rm <deck-id>       Delete a deck and all of its cards
  decks                   List decks
  due                     List cards to study now (within the daily limit)
  review <card-id> <r>    Rate a card: again, hard, good or easy
  preview <card-id>       Show the interval each rating would produce
  stats                   Show the statistics dashboard
  history                 Show reviews per day or month
  limit [<n>]             Show or set the daily review limit
  import <file>           Import tab-separated rows: term, meaning,
                          [explanation], [phonetic]
  sync                    Reconcile the local replica with the remote

Options:
  --config <file>         Configuration file (default: recall.json)
  --deck <id>             Restrict to / save into a deck
  --meaning <text>        Meaning of the term (add)
  --explanation <text>    Explanation of the term (add)
  --phonetic <text>       Phonetic transcription (add)
  --description <text>    Deck description (deck-add)
  --range <r>             week, month or year (history, default: week)
  --identity <id>         Override the configured sync identity
  --help, -h              Show this help message

Exit Codes:
  0  Success
  1  Invalid arguments or command
  2  Card store error
  3  Sync error
)";
}

command_type parse_command(const std::string& cmd) {
    if (cmd == "add") return command_type::add;
    if (cmd == "deck-add") return command_type::deck_add;
    if (cmd == "deck-rm") return command_type::deck_rm;
    if (cmd == "decks") return command_type::decks;
    if (cmd == "due") return command_type::due;
    if (cmd == "review") return command_type::review;
    if (cmd == "preview") return command_type::preview;
    if (cmd == "stats") return command_type::stats;
    if (cmd == "history") return command_type::history;
    if (cmd == "limit") return command_type::limit;
    if (cmd == "import") return command_type::import_file;
    if (cmd == "sync") return command_type::sync;
    return command_type::help;
}

/**
 * @brief Number of positional arguments each command requires
 */
std::size_t required_arguments(command_type cmd) {
    switch (cmd) {
        case command_type::add:
        case command_type::deck_add:
        case command_type::deck_rm:
        case command_type::preview:
        case command_type::import_file:
            return 1;
        case command_type::review:
            return 2;
        default:
            return 0;
    }
}

/**
 * @brief Parse command line arguments
 * @return true if arguments are valid
 */
bool parse_arguments(int argc, char* argv[], options& opts) {
    bool have_command = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            return false;
        }
        if (arg == "--config" && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (arg == "--deck" && i + 1 < argc) {
            opts.deck_id = std::string(argv[++i]);
        } else if (arg == "--meaning" && i + 1 < argc) {
            opts.meaning = argv[++i];
        } else if (arg == "--explanation" && i + 1 < argc) {
            opts.explanation = argv[++i];
        } else if (arg == "--phonetic" && i + 1 < argc) {
            opts.phonetic = argv[++i];
        } else if (arg == "--description" && i + 1 < argc) {
            opts.description = std::string(argv[++i]);
        } else if (arg == "--range" && i + 1 < argc) {
            opts.range = argv[++i];
        } else if (arg == "--identity" && i + 1 < argc) {
            opts.identity = argv[++i];
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: Unknown option '" << arg << "'\n";
            return false;
        } else if (!have_command) {
            opts.command = parse_command(arg);
            if (opts.command == command_type::help) {
                std::cerr << "Error: Unknown command '" << arg << "'\n";
                return false;
            }
            have_command = true;
        } else {
            opts.positional.push_back(arg);
        }
    }

    if (!have_command) {
        return false;
    }
    if (opts.positional.size() < required_arguments(opts.command)) {
        std::cerr << "Error: Missing argument for command\n";
        return false;
    }
    return true;
}

/**
 * @brief Print a one-line error for a failed result
 */
template <typename T>
int report_error(const Result<T>& result, const char* what, int code = exit_store) {
    std::cerr << "Error: " << what << ": " << result.error().message << "\n";
    return code;
}

std::string format_time(std::optional<time_point> tp) {
    if (!tp) {
        return "-";
    }
    return compat::format_local(*tp, "%Y-%m-%d %H:%M");
}

std::string truncate(const std::string& str, std::size_t max_len) {
    if (str.length() <= max_len) {
        return str;
    }
    if (max_len <= 3) {
        return str.substr(0, max_len);
    }
    return str.substr(0, max_len - 3) + "...";
}

void print_card_row(const card& c) {
    std::cout << "  " << std::left << std::setw(38) << c.id << " "
              << std::setw(22) << truncate(c.term, 22) << " "
              << std::setw(9) << scheduling::to_string(scheduling::phase_of(c)) << " "
              << std::setw(8) << scheduling::format_interval(c.interval_days) << " "
              << format_time(c.next_review_at) << "\n";
}

// =============================================================================
// Session Wiring
// =============================================================================

/**
 * @brief Open the store and, when configured, bind remote sync
 * @return Exit code; exit_ok when @p out is ready
 */
int open_session(const config::app_config& cfg, const options& opts, session& out) {
    out.logger = std::make_shared<di::LoggerService>();

    auto db_result = storage::card_database::open(cfg.database_path.string());
    if (db_result.is_err()) {
        return report_error(db_result, "Failed to open card store");
    }
    out.db = std::move(db_result.value());

    const std::string identity = opts.identity.empty() ? cfg.sync_identity : opts.identity;
    if (cfg.remote_root && !identity.empty()) {
        out.pool = std::make_shared<integration::thread_pool_adapter>(cfg.threads);
        auto remote = std::make_shared<sync::file_remote_store>(*cfg.remote_root);
        auto sync_log = std::make_shared<di::component_logger>("sync", out.logger);
        out.sync = std::make_shared<sync::sync_engine>(*out.db, remote, out.pool, sync_log);

        // Only the sync command forces a fresh reconcile of the local replica
        auto activation = opts.command == command_type::sync ? out.sync->activate(identity)
                                                             : out.sync->resume(identity);
        if (activation.is_err()) {
            return report_error(activation, "Sync activation failed", exit_sync);
        }
        for (const auto& err : activation.value().errors) {
            std::cerr << "Warning: " << err << "\n";
        }
    } else if (opts.command == command_type::sync) {
        std::cerr << "Error: sync needs an identity and a remote root\n";
        return exit_sync;
    }

    out.service = std::make_unique<services::study_service>(
        *out.db, scheduling::scheduler(cfg.scheduling), out.sync,
        std::make_shared<di::component_logger>("study", out.logger));
    return exit_ok;
}

// =============================================================================
// Commands
// =============================================================================

int do_add(session& s, const options& opts) {
    services::new_card content;
    content.term = opts.positional[0];
    content.meaning = opts.meaning;
    content.explanation = opts.explanation;
    content.phonetic = opts.phonetic;
    content.deck_id = opts.deck_id;

    auto result = s.service->save_card(content, recall::clock::now());
    if (result.is_err()) {
        return report_error(result, "Failed to save card");
    }

    const auto& saved = result.value();
    if (saved.outcome == services::save_outcome::not_added) {
        std::cout << "Already saved: " << saved.card.term << " (" << saved.card.id << ")\n";
    } else {
        std::cout << "Added: " << saved.card.term << " (" << saved.card.id << ")\n";
    }
    return exit_ok;
}

int do_deck_add(session& s, const options& opts) {
    auto result = s.service->create_deck(opts.positional[0], opts.description, recall::clock::now());
    if (result.is_err()) {
        return report_error(result, "Failed to create deck");
    }
    std::cout << "Created deck: " << result.value().name << " (" << result.value().id << ")\n";
    return exit_ok;
}

int do_deck_rm(session& s, const options& opts) {
    auto result = s.service->delete_deck(opts.positional[0]);
    if (result.is_err()) {
        return report_error(result, "Failed to delete deck");
    }
    std::cout << "Deleted deck and " << result.value() << " card(s)\n";
    return exit_ok;
}

int do_decks(session& s) {
    auto decks = s.service->list_decks();
    if (decks.is_err()) {
        return report_error(decks, "Failed to list decks");
    }

    std::cout << "Decks (" << decks.value().size() << "):\n";
    for (const auto& d : decks.value()) {
        auto cards = s.service->list_cards(d.id);
        const std::size_t count = cards.is_ok() ? cards.value().size() : 0;
        std::cout << "  " << std::left << std::setw(38) << d.id << " "
                  << std::setw(24) << truncate(d.name, 24) << " " << count
                  << " card(s)";
        if (d.description && !d.description->empty()) {
            std::cout << "  " << truncate(*d.description, 40);
        }
        std::cout << "\n";
    }
    return exit_ok;
}

int do_due(session& s, const options& opts) {
    scheduling::due_selector selector(*s.db, s.logger);
    const auto now = recall::clock::now();

    auto summary = selector.summary(opts.deck_id, now);
    if (summary.is_err()) {
        return report_error(summary, "Failed to compute queue");
    }
    auto cards = selector.due_cards(opts.deck_id, now);
    if (cards.is_err()) {
        return report_error(cards, "Failed to select due cards");
    }

    const auto& info = summary.value();
    std::cout << "Due: " << info.due_total << "  Studied today: " << info.studied_today
              << "/" << info.daily_limit << "  Backlog: " << info.backlog << "\n\n";
    for (const auto& c : cards.value()) {
        print_card_row(c);
    }
    if (cards.value().empty()) {
        std::cout << "  Nothing to study right now.\n";
    }
    return exit_ok;
}

int do_review(session& s, const options& opts) {
    auto r = rating_from_string(opts.positional[1]);
    if (!r) {
        std::cerr << "Error: Unknown rating '" << opts.positional[1]
                  << "' (expected again, hard, good or easy)\n";
        return exit_usage;
    }

    auto result = s.service->submit_review(opts.positional[0], *r, recall::clock::now());
    if (result.is_err()) {
        return report_error(result, "Failed to submit review");
    }

    const auto& c = result.value();
    std::cout << c.term << ": " << to_string(*r) << " -> "
              << scheduling::format_interval(c.interval_days) << ", next "
              << format_time(c.next_review_at) << "\n";
    return exit_ok;
}

int do_preview(session& s, const options& opts) {
    auto result = s.service->preview(opts.positional[0], recall::clock::now());
    if (result.is_err()) {
        return report_error(result, "Failed to preview card");
    }
    for (const auto& p : result.value()) {
        std::cout << "  " << std::left << std::setw(6) << to_string(p.rating) << " "
                  << p.label << "\n";
    }
    return exit_ok;
}

int do_stats(session& s) {
    stats::statistics_engine engine(*s.db, s.logger);
    auto snap = engine.snapshot(recall::clock::now());
    if (snap.is_err()) {
        return report_error(snap, "Failed to compute statistics");
    }
    const auto& v = snap.value();

    std::cout << "Today\n"
              << "  Studied:     " << v.today.studied << "/" << v.today.daily_limit << "\n"
              << "  Again:       " << v.today.again_count << "\n"
              << "  Passed:      " << v.today.pass_count << "\n"
              << "  Due now:     " << v.due_now << "\n\n";

    std::cout << "Cards\n"
              << "  New:         " << v.counts.new_cards << "\n"
              << "  Learning:    " << v.counts.learning << "\n"
              << "  Young:       " << v.counts.young << "\n"
              << "  Mature:      " << v.counts.mature << " (mastered "
              << v.counts.mastered << ")\n"
              << "  Total:       " << v.counts.total << "\n\n";

    std::cout << "Due in the next 7 days (young/mature)\n";
    for (std::size_t day = 0; day < 7; ++day) {
        std::cout << "  " << (day == 0 ? std::string("today") : "+" + std::to_string(day))
                  << ": " << v.forecast.young[day] << "/" << v.forecast.mature[day] << "\n";
    }
    std::cout << "\nIntervals\n";
    for (const auto& bucket : v.intervals) {
        std::cout << "  " << std::left << std::setw(8) << bucket.label << " "
                  << bucket.count << "\n";
    }
    return exit_ok;
}

int do_history(session& s, const options& opts) {
    auto range = stats::history_range_from_string(opts.range);
    if (!range) {
        std::cerr << "Error: Unknown range '" << opts.range << "'\n";
        return exit_usage;
    }

    stats::statistics_engine engine(*s.db, s.logger);
    auto points = engine.review_history(*range, recall::clock::now());
    if (points.is_err()) {
        return report_error(points, "Failed to compute history");
    }

    std::cout << std::left << std::setw(12) << "Period" << std::right << std::setw(7)
              << "again" << std::setw(7) << "hard" << std::setw(7) << "good"
              << std::setw(7) << "easy" << std::setw(7) << "total" << "\n";
    for (const auto& p : points.value()) {
        std::cout << std::left << std::setw(12) << p.label << std::right << std::setw(7)
                  << p.again << std::setw(7) << p.hard << std::setw(7) << p.good
                  << std::setw(7) << p.easy << std::setw(7) << p.total << "\n";
    }
    return exit_ok;
}

int do_limit(session& s, const options& opts) {
    if (opts.positional.empty()) {
        auto limit = s.service->daily_limit();
        if (limit.is_err()) {
            return report_error(limit, "Failed to read daily limit");
        }
        std::cout << "Daily limit: " << limit.value() << "\n";
        return exit_ok;
    }

    const auto& text = opts.positional[0];
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        std::cerr << "Error: Daily limit must be a number\n";
        return exit_usage;
    }

    auto result = s.service->set_daily_limit(value);
    if (result.is_err()) {
        std::cerr << "Error: " << result.error().message << "\n";
        return exit_usage;
    }
    std::cout << "Daily limit: " << value << "\n";
    return exit_ok;
}

int do_import(session& s, const options& opts) {
    std::ifstream in(opts.positional[0], std::ios::binary);
    if (!in) {
        std::cerr << "Error: Cannot read " << opts.positional[0] << "\n";
        return exit_usage;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    auto result = s.service->import_cards(buffer.str(), opts.deck_id, recall::clock::now());
    if (result.is_err()) {
        return report_error(result, "Import failed");
    }

    const auto& report = result.value();
    std::cout << "Imported " << report.imported << " card(s), skipped "
              << report.duplicates << " duplicate(s)\n";
    for (const auto& issue : report.issues) {
        std::cout << "  line " << issue.line << ": " << issue.message << "\n";
    }
    return exit_ok;
}

int do_sync(session& s) {
    auto last = s.sync->last_result();
    if (!last) {
        std::cerr << "Error: Session is not activated\n";
        return exit_sync;
    }
    const auto& r = *last;
    std::cout << "Identity:        " << r.identity << "\n"
              << "Cards fetched:   " << r.cards_fetched << "\n"
              << "Cards adopted:   " << r.cards_adopted << "\n"
              << "Kept local:      " << r.cards_kept_local << "\n"
              << "Decks adopted:   " << r.decks_adopted << "\n"
              << "Logs adopted:    " << r.logs_adopted << "\n"
              << "Skipped:         " << r.documents_skipped << "\n"
              << "Elapsed:         " << r.elapsed.count() << " ms\n";
    return r.errors.empty() ? exit_ok : exit_sync;
}

int run_command(session& s, const options& opts) {
    switch (opts.command) {
        case command_type::add:
            return do_add(s, opts);
        case command_type::deck_add:
            return do_deck_add(s, opts);
        case command_type::deck_rm:
            return do_deck_rm(s, opts);
        case command_type::decks:
            return do_decks(s);
        case command_type::due:
            return do_due(s, opts);
        case command_type::review:
            return do_review(s, opts);
        case command_type::preview:
            return do_preview(s, opts);
        case command_type::stats:
            return do_stats(s);
        case command_type::history:
            return do_history(s, opts);
        case command_type::limit:
            return do_limit(s, opts);
        case command_type::import_file:
            return do_import(s, opts);
        case command_type::sync:
            return do_sync(s);
        case command_type::help:
            break;
    }
    return exit_usage;
}

}  // namespace

int main(int argc, char* argv[]) {
    options opts;

    if (!parse_arguments(argc, argv, opts)) {
        print_usage(argv[0]);
        return exit_usage;
    }

    auto cfg = config::load_app_config(opts.config_path);
    if (cfg.is_err()) {
        std::cerr << "Error: Invalid configuration " << opts.config_path << ": "
                  << cfg.error().message << "\n";
        return exit_usage;
    }

    integration::logger_adapter::initialize(cfg.value().logging);

    session s;
    int rc = open_session(cfg.value(), opts, s);
    if (rc == exit_ok) {
        rc = run_command(s, opts);
    }

    // Wait for queued remote writes before the store goes away
    if (s.pool) {
        s.pool->shutdown(true);
    }
    s.service.reset();
    s.sync.reset();

    integration::logger_adapter::shutdown();
    return rc;
}
