/**
 * @file memory_remote_store.cpp
 * @brief Implementation of the in-process remote store
 */

#include <recall/sync/memory_remote_store.hpp>

namespace recall::sync {

auto memory_remote_store::size(entity_kind kind, std::string_view identity) const
    -> std::size_t {
    std::lock_guard lock(mutex_);
    auto part = partitions_.find(identity);
    if (part == partitions_.end()) {
        return 0;
    }
    auto coll = part->second.find(kind);
    return coll == part->second.end() ? 0 : coll->second.size();
}

auto memory_remote_store::get(entity_kind kind, std::string_view identity,
                              std::string_view id) const -> nlohmann::json {
    std::lock_guard lock(mutex_);
    auto part = partitions_.find(identity);
    if (part == partitions_.end()) {
        return nullptr;
    }
    auto coll = part->second.find(kind);
    if (coll == part->second.end()) {
        return nullptr;
    }
    auto doc = coll->second.find(id);
    return doc == coll->second.end() ? nlohmann::json(nullptr) : doc->second;
}

auto memory_remote_store::do_fetch_all(entity_kind kind, std::string_view identity)
    -> Result<std::vector<nlohmann::json>> {
    std::lock_guard lock(mutex_);

    std::vector<nlohmann::json> documents;
    auto part = partitions_.find(identity);
    if (part == partitions_.end()) {
        return documents;
    }
    auto coll = part->second.find(kind);
    if (coll == part->second.end()) {
        return documents;
    }

    documents.reserve(coll->second.size());
    for (const auto& [id, doc] : coll->second) {
        documents.push_back(doc);
    }
    return documents;
}

auto memory_remote_store::do_upsert(entity_kind kind, std::string_view identity,
                                    std::string_view id,
                                    const nlohmann::json& document) -> VoidResult {
    std::lock_guard lock(mutex_);
    auto part = partitions_.find(identity);
    if (part == partitions_.end()) {
        part = partitions_.emplace(std::string(identity), partition{}).first;
    }
    part->second[kind].insert_or_assign(std::string(id), document);
    return ok();
}

auto memory_remote_store::do_remove(entity_kind kind, std::string_view identity,
                                    std::string_view id) -> VoidResult {
    std::lock_guard lock(mutex_);
    auto part = partitions_.find(identity);
    if (part == partitions_.end()) {
        return ok();
    }
    auto coll = part->second.find(kind);
    if (coll != part->second.end()) {
        auto doc = coll->second.find(id);
        if (doc != coll->second.end()) {
            coll->second.erase(doc);
        }
    }
    return ok();
}

}  // namespace recall::sync
