/**
 * @file remote_store.hpp
 * @brief Read/write contract of the remote keyed document store
 *
 * A learner's remote partition is addressed by a sync identity and holds
 * one collection per entity_kind, each a map from record id to JSON
 * document. Transport is up to the implementation.
 */

#pragma once

#include <recall/core/result.hpp>
#include <recall/sync/sync_types.hpp>

#include <nlohmann/json.hpp>

#include <string_view>
#include <vector>

namespace recall::sync {

/**
 * @brief Abstract remote store adapter
 *
 * Every operation is a successful no-op when @p identity is empty, so
 * callers never special-case offline or signed-out sessions. Concrete
 * stores implement the do_* hooks, which only see non-empty identities.
 *
 * Thread Safety: implementations must be thread-safe; pushes arrive from
 * thread pool workers.
 */
class remote_store {
public:
    virtual ~remote_store() = default;

    /**
     * @brief All documents of one collection
     */
    [[nodiscard]] auto fetch_all(entity_kind kind, std::string_view identity)
        -> Result<std::vector<nlohmann::json>> {
        if (identity.empty()) {
            return std::vector<nlohmann::json>{};
        }
        return do_fetch_all(kind, identity);
    }

    /**
     * @brief Create or replace the document with id @p id
     */
    [[nodiscard]] auto upsert(entity_kind kind, std::string_view identity,
                              std::string_view id, const nlohmann::json& document)
        -> VoidResult {
        if (identity.empty()) {
            return ok();
        }
        return do_upsert(kind, identity, id, document);
    }

    /**
     * @brief Delete the document with id @p id; deleting a missing one succeeds
     */
    [[nodiscard]] auto remove(entity_kind kind, std::string_view identity,
                              std::string_view id) -> VoidResult {
        if (identity.empty()) {
            return ok();
        }
        return do_remove(kind, identity, id);
    }

protected:
    remote_store() = default;
    remote_store(const remote_store&) = delete;
    remote_store& operator=(const remote_store&) = delete;

    [[nodiscard]] virtual auto do_fetch_all(entity_kind kind, std::string_view identity)
        -> Result<std::vector<nlohmann::json>> = 0;

    [[nodiscard]] virtual auto do_upsert(entity_kind kind, std::string_view identity,
                                         std::string_view id,
                                         const nlohmann::json& document) -> VoidResult = 0;

    [[nodiscard]] virtual auto do_remove(entity_kind kind, std::string_view identity,
                                         std::string_view id) -> VoidResult = 0;
};

}  // namespace recall::sync
