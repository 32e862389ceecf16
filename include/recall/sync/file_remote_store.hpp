/**
 * @file file_remote_store.hpp
 * @brief Remote store backed by a shared directory tree
 */

#pragma once

#include <recall/sync/remote_store.hpp>

#include <filesystem>
#include <shared_mutex>
#include <string>

namespace recall::sync {

/**
 * @brief remote_store persisting one JSON file per record
 *
 * Layout: `<root>/<identity>/<collection>/<id>.json`, where collection is
 * to_string(entity_kind). Writes go to a temporary file that is renamed
 * over the target, so a reader never sees a torn document. Pointing the
 * root at a synced folder (network share, cloud drive) replicates between
 * devices.
 */
class file_remote_store final : public remote_store {
public:
    explicit file_remote_store(std::filesystem::path root);
    ~file_remote_store() override = default;

    [[nodiscard]] auto root() const noexcept -> const std::filesystem::path& {
        return root_;
    }

protected:
    [[nodiscard]] auto do_fetch_all(entity_kind kind, std::string_view identity)
        -> Result<std::vector<nlohmann::json>> override;

    [[nodiscard]] auto do_upsert(entity_kind kind, std::string_view identity,
                                 std::string_view id,
                                 const nlohmann::json& document) -> VoidResult override;

    [[nodiscard]] auto do_remove(entity_kind kind, std::string_view identity,
                                 std::string_view id) -> VoidResult override;

private:
    [[nodiscard]] auto collection_path(entity_kind kind, std::string_view identity) const
        -> std::filesystem::path;

    /// Replace path-hostile characters so ids map to single file names
    [[nodiscard]] static auto sanitize(std::string_view name) -> std::string;

    std::filesystem::path root_;
    mutable std::shared_mutex mutex_;
};

}  // namespace recall::sync
