/**
 * @file sync_engine.cpp
 * @brief Implementation of the per-session replication engine
 */

#include <recall/sync/sync_engine.hpp>

#include <recall/compat/format.hpp>
#include <recall/integration/logger_adapter.hpp>
#include <recall/storage/card_database.hpp>
#include <recall/sync/entity_codec.hpp>

#include <atomic>
#include <exception>
#include <mutex>

namespace recall::sync {

namespace {

/// Counters shared with in-flight push tasks, which may outlive the engine
struct push_counters {
    std::atomic<std::size_t> pushes_submitted{0};
    std::atomic<std::size_t> pushes_failed{0};
    std::atomic<std::size_t> deletes_submitted{0};
    std::atomic<std::size_t> deletes_failed{0};
};

}  // namespace

// =============================================================================
// Implementation Structure
// =============================================================================

struct sync_engine::impl {
    storage::card_database& store;
    std::shared_ptr<remote_store> remote;
    std::shared_ptr<integration::thread_pool_interface> pool;
    std::shared_ptr<di::ILogger> logger;
    std::shared_ptr<push_counters> counters = std::make_shared<push_counters>();

    mutable std::mutex state_mutex;
    std::string identity;
    std::optional<sync_result> activation;

    impl(storage::card_database& s,
         std::shared_ptr<remote_store> r,
         std::shared_ptr<integration::thread_pool_interface> p,
         std::shared_ptr<di::ILogger> l)
        : store(s),
          remote(std::move(r)),
          pool(std::move(p)),
          logger(di::or_null(std::move(l))) {}

    [[nodiscard]] auto bound_identity() const -> std::string {
        std::lock_guard lock(state_mutex);
        return identity;
    }

    // =========================================================================
    // Push
    // =========================================================================

    void submit_upsert(entity_kind kind, std::string id, nlohmann::json doc) {
        auto who = bound_identity();
        if (who.empty() || !remote || !pool) {
            return;
        }

        counters->pushes_submitted++;
        auto task = [remote = remote, log = logger, stats = counters, kind,
                     who = std::move(who), id = std::move(id), doc = std::move(doc)]() {
            auto result = remote->upsert(kind, who, id, doc);
            if (result.is_err()) {
                stats->pushes_failed++;
                log->warn_fmt("push of {} {} failed: {}", to_string(kind), id,
                              result.error().message);
            }
        };
        submit(std::move(task), kind, counters->pushes_failed);
    }

    void submit_delete(entity_kind kind, std::string id) {
        auto who = bound_identity();
        if (who.empty() || !remote || !pool) {
            return;
        }

        counters->deletes_submitted++;
        auto task = [remote = remote, log = logger, stats = counters, kind,
                     who = std::move(who), id = std::move(id)]() {
            auto result = remote->remove(kind, who, id);
            if (result.is_err()) {
                stats->deletes_failed++;
                log->warn_fmt("remote delete of {} {} failed: {}", to_string(kind), id,
                              result.error().message);
            }
        };
        submit(std::move(task), kind, counters->deletes_failed);
    }

    void submit(std::function<void()> task, entity_kind kind,
                std::atomic<std::size_t>& failed) {
        try {
            pool->submit_fire_and_forget(std::move(task));
        } catch (const std::exception& e) {
            failed++;
            logger->warn_fmt("could not schedule {} push: {}", to_string(kind), e.what());
        }
    }

    // =========================================================================
    // Activation
    // =========================================================================

    void merge_cards(const std::string& who, sync_result& result,
                     const sync_progress_callback& progress) {
        auto fetched = remote->fetch_all(entity_kind::card, who);
        if (fetched.is_err()) {
            record_fetch_error(entity_kind::card, fetched.error().message, result);
            return;
        }

        const auto& documents = fetched.value();
        result.cards_fetched = documents.size();

        std::size_t processed = 0;
        for (const auto& doc : documents) {
            ++processed;
            auto decoded = decode_card(doc);
            if (decoded.is_err()) {
                result.documents_skipped++;
                logger->warn(decoded.error().message);
                continue;
            }
            const auto& remote_card = decoded.value();

            auto local = store.cards().find_by_id(remote_card.id);
            if (local.is_ok() && local.value().progress() > remote_card.progress()) {
                result.cards_kept_local++;
                submit_upsert(entity_kind::card, local.value().id, encode(local.value()));
            } else if (local.is_ok() || local.error().code == error_codes::card_not_found) {
                auto saved = store.cards().save(remote_card);
                if (saved.is_err()) {
                    result.errors.push_back(saved.error().message);
                } else {
                    result.cards_adopted++;
                }
            } else {
                result.errors.push_back(local.error().message);
            }

            if (progress) {
                progress(entity_kind::card, processed, documents.size());
            }
        }
    }

    template <typename Decode, typename Save>
    void adopt_all(entity_kind kind, const std::string& who, sync_result& result,
                   std::size_t& adopted, Decode decode, Save save,
                   const sync_progress_callback& progress) {
        auto fetched = remote->fetch_all(kind, who);
        if (fetched.is_err()) {
            record_fetch_error(kind, fetched.error().message, result);
            return;
        }

        const auto& documents = fetched.value();
        std::size_t processed = 0;
        for (const auto& doc : documents) {
            ++processed;
            auto decoded = decode(doc);
            if (decoded.is_err()) {
                result.documents_skipped++;
                logger->warn(decoded.error().message);
            } else {
                auto saved = save(decoded.value());
                if (saved.is_err()) {
                    result.errors.push_back(saved.error().message);
                } else {
                    adopted++;
                }
            }

            if (progress) {
                progress(kind, processed, documents.size());
            }
        }
    }

    void record_fetch_error(entity_kind kind, const std::string& message,
                            sync_result& result) {
        logger->warn_fmt("fetching {} failed, keeping what was adopted: {}",
                         to_string(kind), message);
        result.errors.push_back(
            recall::compat::format("fetch {}: {}", to_string(kind), message));
    }
};

// =============================================================================
// Construction / Destruction
// =============================================================================

sync_engine::sync_engine(storage::card_database& store,
                         std::shared_ptr<remote_store> remote,
                         std::shared_ptr<integration::thread_pool_interface> pool,
                         std::shared_ptr<di::ILogger> logger)
    : impl_(std::make_unique<impl>(store, std::move(remote), std::move(pool),
                                   std::move(logger))) {}

sync_engine::~sync_engine() = default;

// =============================================================================
// Activation
// =============================================================================

auto sync_engine::activate(std::string_view identity, sync_progress_callback progress)
    -> Result<sync_result> {
    if (identity.empty()) {
        return recall_error<sync_result>(error_codes::sync_identity_missing,
                                         "Cannot activate sync without an identity");
    }

    {
        std::lock_guard lock(impl_->state_mutex);
        if (!impl_->identity.empty() && impl_->identity != identity) {
            return recall_error<sync_result>(
                error_codes::sync_invalid_state,
                recall::compat::format("Session already bound to identity '{}'",
                                       impl_->identity));
        }
        if (impl_->activation) {
            return *impl_->activation;
        }
    }

    if (!impl_->remote) {
        return recall_error<sync_result>(error_codes::sync_invalid_state,
                                         "No remote store configured");
    }

    sync_result result;
    result.identity = std::string(identity);
    result.started_at = std::chrono::system_clock::now();

    impl_->logger->info_fmt("Activating sync for identity '{}'", result.identity);

    // Forgotten first so an interrupted activation is redone by the next resume()
    auto forgotten = impl_->store.settings().set(replica_identity_setting, "");
    if (forgotten.is_err()) {
        impl_->logger->error_fmt("Could not reset reconciled identity: {}",
                                 forgotten.error().message);
        return Result<sync_result>(forgotten.error());
    }

    auto cleared = impl_->store.clear_replica();
    if (cleared.is_err()) {
        impl_->logger->error_fmt("Could not discard local replica: {}",
                                 cleared.error().message);
        return Result<sync_result>(cleared.error());
    }

    {
        std::lock_guard lock(impl_->state_mutex);
        impl_->identity = result.identity;
    }

    impl_->merge_cards(result.identity, result, progress);

    impl_->adopt_all(
        entity_kind::deck, result.identity, result, result.decks_adopted,
        [](const nlohmann::json& doc) { return decode_deck(doc); },
        [this](const deck& d) { return impl_->store.decks().save(d); }, progress);

    impl_->adopt_all(
        entity_kind::review_log, result.identity, result, result.logs_adopted,
        [](const nlohmann::json& doc) { return decode_review_log(doc); },
        [this](const review_log& log) { return impl_->store.review_logs().save(log); },
        progress);

    result.success = true;
    result.replica_replaced = true;
    result.completed_at = std::chrono::system_clock::now();

    // An incomplete merge is not remembered, so the next resume() reconciles again
    if (result.errors.empty()) {
        auto remembered =
            impl_->store.settings().set(replica_identity_setting, result.identity);
        if (remembered.is_err()) {
            impl_->logger->warn_fmt("Could not record reconciled identity: {}",
                                    remembered.error().message);
        }
    }
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        result.completed_at - result.started_at);

    integration::logger_adapter::log_sync_activation(
        result.identity, result.cards_adopted, result.cards_kept_local,
        result.errors.size());
    impl_->logger->info_fmt(
        "Activation done in {}ms: {} cards adopted, {} kept local, {} decks, {} logs, "
        "{} skipped, {} errors",
        result.elapsed.count(), result.cards_adopted, result.cards_kept_local,
        result.decks_adopted, result.logs_adopted, result.documents_skipped,
        result.errors.size());

    {
        std::lock_guard lock(impl_->state_mutex);
        impl_->activation = result;
    }
    return result;
}

auto sync_engine::resume(std::string_view identity, sync_progress_callback progress)
    -> Result<sync_result> {
    if (identity.empty()) {
        return recall_error<sync_result>(error_codes::sync_identity_missing,
                                         "Cannot resume sync without an identity");
    }

    auto stored = impl_->store.settings().get(replica_identity_setting);
    if (stored.is_err()) {
        return Result<sync_result>(stored.error());
    }
    if (!stored.value() || *stored.value() != identity) {
        return activate(identity, std::move(progress));
    }

    std::lock_guard lock(impl_->state_mutex);
    if (!impl_->identity.empty() && impl_->identity != identity) {
        return recall_error<sync_result>(
            error_codes::sync_invalid_state,
            recall::compat::format("Session already bound to identity '{}'",
                                   impl_->identity));
    }
    if (impl_->activation) {
        return *impl_->activation;
    }

    impl_->identity = std::string(identity);
    impl_->logger->info_fmt("Resumed sync for identity '{}' without reconciling",
                            impl_->identity);

    sync_result result;
    result.identity = impl_->identity;
    result.success = true;
    result.started_at = std::chrono::system_clock::now();
    result.completed_at = result.started_at;
    return result;
}

auto sync_engine::is_activated() const noexcept -> bool {
    std::lock_guard lock(impl_->state_mutex);
    return impl_->activation.has_value();
}

auto sync_engine::identity() const -> std::string {
    return impl_->bound_identity();
}

auto sync_engine::last_result() const -> std::optional<sync_result> {
    std::lock_guard lock(impl_->state_mutex);
    return impl_->activation;
}

// =============================================================================
// Mirroring
// =============================================================================

void sync_engine::push(const card& c) {
    impl_->submit_upsert(entity_kind::card, c.id, encode(c));
}

void sync_engine::push(const deck& d) {
    impl_->submit_upsert(entity_kind::deck, d.id, encode(d));
}

void sync_engine::push(const review_log& log) {
    impl_->submit_upsert(entity_kind::review_log, log.id, encode(log));
}

void sync_engine::push_delete(entity_kind kind, std::string_view id) {
    impl_->submit_delete(kind, std::string(id));
}

// =============================================================================
// Statistics
// =============================================================================

auto sync_engine::get_statistics() const -> sync_statistics {
    sync_statistics stats;
    stats.pushes_submitted = impl_->counters->pushes_submitted.load();
    stats.pushes_failed = impl_->counters->pushes_failed.load();
    stats.deletes_submitted = impl_->counters->deletes_submitted.load();
    stats.deletes_failed = impl_->counters->deletes_failed.load();
    return stats;
}

}  // namespace recall::sync
