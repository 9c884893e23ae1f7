#include <leaf-cpp/storage_manager.hpp>

#include "../crypto/sha256.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace leaf_cpp {

StorageManager::StorageManager(std::shared_ptr<StorageInterface> storage)
    : storage_{std::move(storage)} {}

auto StorageManager::entity_prefix(const EntityId& id) -> StorageKey {
    return StorageKey{std::string{storage_data_prefix}, id.to_string()};
}

auto StorageManager::chunk_key(const EntityId& id, const ChunkInfo& chunk) -> StorageKey {
    auto key = entity_prefix(id);
    key.emplace_back(to_string_view(chunk.kind));
    key.push_back(chunk.hash);
    return key;
}

auto StorageManager::load(Entity& entity) -> Task<bool> {
    const auto id = entity.id();
    auto entries = co_await storage_->load_range(entity_prefix(id));

    auto chunks = std::vector<ChunkInfo>{};
    for (const auto& entry : entries) {
        if (!entry.data || entry.key.size() < 2) continue;
        auto chunk = ChunkInfo{
            .kind = entry.key[entry.key.size() - 2] == to_string_view(ChunkKind::snapshot)
                ? ChunkKind::snapshot
                : ChunkKind::incremental,
            .hash = entry.key.back(),
            .size = entry.data->size(),
        };
        if (!entity.doc().merge(*entry.data)) {
            spdlog::warn("skipping undecodable chunk {}", to_string(entry.key));
            continue;
        }
        chunks.push_back(std::move(chunk));
    }

    if (chunks.empty()) co_return false;

    spdlog::debug("loaded {} chunk(s) for {}", chunks.size(), id.to_string());
    index_[id] = IndexEntry{.chunks = std::move(chunks), .version = entity.doc().version()};
    co_return true;
}

auto StorageManager::save(Entity& entity) -> Task<> {
    const auto id = entity.id();

    // Capture the recorded chunks before the first suspension, so a
    // concurrent load cannot make us delete chunks this save does not cover
    auto to_delete = std::vector<ChunkInfo>{};
    auto recorded = VersionVector{};
    if (auto it = index_.find(id); it != index_.end()) {
        to_delete = it->second.chunks;
        recorded = it->second.version;
    }

    auto version = entity.doc().version();
    if (compare(version, recorded) == VersionOrder::equal) co_return;

    auto snapshot = entity.doc().export_snapshot();
    auto chunk = ChunkInfo{
        .kind = ChunkKind::snapshot,
        .hash = crypto::content_hash(snapshot),
        .size = snapshot.size(),
    };

    co_await storage_->save(chunk_key(id, chunk), std::move(snapshot));

    std::erase_if(to_delete, [&](const ChunkInfo& old) { return old.hash == chunk.hash; });
    for (const auto& old : to_delete) {
        try {
            co_await storage_->remove(chunk_key(id, old));
        } catch (const std::exception& e) {
            spdlog::warn("failed to remove stale chunk {}: {}",
                         to_string(chunk_key(id, old)), e.what());
        }
    }

    spdlog::debug("saved {} ({} bytes), removed {} stale chunk(s)",
                  to_string(chunk_key(id, chunk)), chunk.size, to_delete.size());
    index_[id] = IndexEntry{.chunks = {chunk}, .version = std::move(version)};
}

auto StorageManager::remove(const EntityId& id) -> Task<> {
    const auto key = entity_prefix(id);
    co_await storage_->remove_range(key);
    index_.erase(id);
}

auto StorageManager::loaded_chunks(const EntityId& id) const -> std::vector<ChunkInfo> {
    auto it = index_.find(id);
    return it == index_.end() ? std::vector<ChunkInfo>{} : it->second.chunks;
}

auto StorageManager::loaded_version(const EntityId& id) const -> std::optional<VersionVector> {
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return it->second.version;
}

}  // namespace leaf_cpp
