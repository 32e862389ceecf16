/**
 * @file memory_remote_store.hpp
 * @brief In-process remote store
 */

#pragma once

#include <recall/sync/remote_store.hpp>

#include <cstddef>
#include <map>
#include <mutex>
#include <string>

namespace recall::sync {

/**
 * @brief remote_store kept in memory
 *
 * Used for loopback sessions and tests; several card stores sharing one
 * instance behave like devices sharing a remote partition.
 */
class memory_remote_store final : public remote_store {
public:
    memory_remote_store() = default;
    ~memory_remote_store() override = default;

    /**
     * @brief Number of documents stored for an identity and kind
     */
    [[nodiscard]] auto size(entity_kind kind, std::string_view identity) const
        -> std::size_t;

    /**
     * @brief Document by id, or null json if absent
     */
    [[nodiscard]] auto get(entity_kind kind, std::string_view identity,
                           std::string_view id) const -> nlohmann::json;

protected:
    [[nodiscard]] auto do_fetch_all(entity_kind kind, std::string_view identity)
        -> Result<std::vector<nlohmann::json>> override;

    [[nodiscard]] auto do_upsert(entity_kind kind, std::string_view identity,
                                 std::string_view id,
                                 const nlohmann::json& document) -> VoidResult override;

    [[nodiscard]] auto do_remove(entity_kind kind, std::string_view identity,
                                 std::string_view id) -> VoidResult override;

private:
    using collection = std::map<std::string, nlohmann::json, std::less<>>;
    using partition = std::map<entity_kind, collection>;

    mutable std::mutex mutex_;
    std::map<std::string, partition, std::less<>> partitions_;
};

}  // namespace recall::sync
