/**
 * @file file_remote_store.cpp
 * @brief Implementation of the directory-backed remote store
 */

#include <recall/sync/file_remote_store.hpp>

#include <recall/compat/format.hpp>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <random>

namespace recall::sync {

namespace {

constexpr const char* document_extension = ".json";

auto generate_temp_filename(const std::filesystem::path& base)
    -> std::filesystem::path {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    static thread_local std::uniform_int_distribution<std::uint64_t> dist;

    auto temp_name = base.filename().string() + ".tmp." + std::to_string(dist(gen));
    return base.parent_path() / temp_name;
}

}  // namespace

file_remote_store::file_remote_store(std::filesystem::path root)
    : root_(std::move(root)) {}

auto file_remote_store::sanitize(std::string_view name) -> std::string {
    std::string safe(name);
    std::replace_if(
        safe.begin(), safe.end(),
        [](char c) {
            return c == '/' || c == '\\' || c == ':' || c == '*' || c == '?' ||
                   c == '"' || c == '<' || c == '>' || c == '|';
        },
        '_');
    if (safe == "." || safe == "..") {
        safe = "_";
    }
    return safe;
}

auto file_remote_store::collection_path(entity_kind kind,
                                        std::string_view identity) const
    -> std::filesystem::path {
    return root_ / sanitize(identity) / std::string(to_string(kind));
}

auto file_remote_store::do_fetch_all(entity_kind kind, std::string_view identity)
    -> Result<std::vector<nlohmann::json>> {
    std::shared_lock lock(mutex_);

    std::vector<nlohmann::json> documents;
    const auto dir = collection_path(kind, identity);

    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) {
        return recall_error<std::vector<nlohmann::json>>(
            error_codes::remote_fetch_failed,
            recall::compat::format("Remote root {} is not available", root_.string()));
    }
    if (!std::filesystem::exists(dir, ec)) {
        return documents;
    }

    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return recall_error<std::vector<nlohmann::json>>(
            error_codes::remote_fetch_failed,
            recall::compat::format("Cannot list {}: {}", dir.string(), ec.message()));
    }

    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec) || entry.path().extension() != document_extension) {
            continue;
        }

        std::ifstream in(entry.path());
        if (!in) {
            return recall_error<std::vector<nlohmann::json>>(
                error_codes::remote_fetch_failed,
                recall::compat::format("Cannot read {}", entry.path().string()));
        }

        // Unparsable files are passed on as discarded values; the sync
        // engine counts them as skipped documents.
        documents.push_back(nlohmann::json::parse(in, nullptr, false));
    }
    return documents;
}

auto file_remote_store::do_upsert(entity_kind kind, std::string_view identity,
                                  std::string_view id,
                                  const nlohmann::json& document) -> VoidResult {
    std::unique_lock lock(mutex_);

    const auto dir = collection_path(kind, identity);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return recall_void_error(
            error_codes::remote_write_failed,
            recall::compat::format("Cannot create {}: {}", dir.string(), ec.message()));
    }

    const auto target = dir / (sanitize(id) + document_extension);
    const auto temp_path = generate_temp_filename(target);
    {
        std::ofstream out(temp_path, std::ios::trunc);
        if (!out) {
            return recall_void_error(
                error_codes::remote_write_failed,
                recall::compat::format("Cannot write {}", temp_path.string()));
        }
        out << document.dump(2);
        if (!out.flush()) {
            std::filesystem::remove(temp_path, ec);
            return recall_void_error(
                error_codes::remote_write_failed,
                recall::compat::format("Short write to {}", temp_path.string()));
        }
    }

    std::filesystem::rename(temp_path, target, ec);
    if (ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(temp_path, cleanup_ec);
        return recall_void_error(
            error_codes::remote_write_failed,
            recall::compat::format("Failed to rename temp file: {}", ec.message()));
    }
    return ok();
}

auto file_remote_store::do_remove(entity_kind kind, std::string_view identity,
                                  std::string_view id) -> VoidResult {
    std::unique_lock lock(mutex_);

    const auto target = collection_path(kind, identity) / (sanitize(id) + document_extension);
    std::error_code ec;
    std::filesystem::remove(target, ec);
    if (ec) {
        return recall_void_error(
            error_codes::remote_write_failed,
            recall::compat::format("Cannot delete {}: {}", target.string(), ec.message()));
    }
    return ok();
}

}  // namespace recall::sync
