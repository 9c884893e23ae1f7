/// @file storage_manager.hpp
/// @brief Persists entities as content-addressed snapshot chunks.

#pragma once

#include <leaf-cpp/entity.hpp>
#include <leaf-cpp/entity_id.hpp>
#include <leaf-cpp/scheduler.hpp>
#include <leaf-cpp/storage.hpp>
#include <leaf-cpp/throttle.hpp>
#include <leaf-cpp/version.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace leaf_cpp {

/// First element of every chunk key.
inline constexpr std::string_view storage_data_prefix = "data";

/// How a stored chunk relates to the entity's state.
enum class ChunkKind : std::uint8_t {
    snapshot,     ///< Reconstructs the full state known at save time.
    incremental,  ///< Applies on top of earlier chunks.
};

constexpr auto to_string_view(ChunkKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ChunkKind::snapshot:    return "snapshot";
        case ChunkKind::incremental: return "incremental";
    }
    return "unknown";
}

/// Descriptor of one stored chunk.
struct ChunkInfo {
    ChunkKind kind{ChunkKind::snapshot};
    std::string hash;        ///< Crockford base-32 SHA-256 of the chunk bytes.
    std::size_t size{0};     ///< Byte length of the chunk.

    auto operator==(const ChunkInfo&) const -> bool = default;
};

/// Loads and saves entities through a StorageInterface.
///
/// Each entity is stored under `["data", <entity id>, <kind>, <hash>]`.
/// The manager remembers which chunks it last loaded or wrote for each
/// entity, and every save replaces all of them with a single new snapshot.
/// The new snapshot is written before any old chunk is removed.
///
/// Several managers (and processes) may share one storage: chunks written
/// by others are never removed unless this manager has loaded them.
class StorageManager {
public:
    explicit StorageManager(std::shared_ptr<StorageInterface> storage);

    auto storage() const -> const std::shared_ptr<StorageInterface>& { return storage_; }

    /// Merge every stored chunk of the entity into its document.
    ///
    /// Chunks that fail to decode are logged and skipped.
    /// @return true if at least one chunk was merged.
    /// @throws Exception with ErrorKind::storage_error on I/O failure.
    auto load(Entity& entity) -> Task<bool>;

    /// Write a snapshot of the entity and remove the chunks it supersedes.
    /// Does nothing if the version matches the last load or save.
    /// @throws Exception with ErrorKind::storage_error if the snapshot cannot
    ///   be written; the recorded chunks are then left unchanged. Failures
    ///   to remove old chunks are only logged.
    auto save(Entity& entity) -> Task<>;

    /// Remove every stored chunk of the entity and forget it.
    auto remove(const EntityId& id) -> Task<>;

    /// Chunks recorded at the last load or save (empty if none).
    auto loaded_chunks(const EntityId& id) const -> std::vector<ChunkInfo>;

    /// Version recorded at the last load or save.
    auto loaded_version(const EntityId& id) const -> std::optional<VersionVector>;

    /// The storage key of a chunk.
    static auto chunk_key(const EntityId& id, const ChunkInfo& chunk) -> StorageKey;

    /// The storage prefix holding every chunk of an entity.
    static auto entity_prefix(const EntityId& id) -> StorageKey;

private:
    struct IndexEntry {
        std::vector<ChunkInfo> chunks;
        VersionVector version;
    };

    std::shared_ptr<StorageInterface> storage_;
    std::unordered_map<EntityId, IndexEntry> index_;
};

/// One storage attached to a peer.
struct StorageConfig {
    std::shared_ptr<StorageManager> manager;
    bool read{true};    ///< Load entities from this storage.
    bool write{true};   ///< Save entities to this storage.
    /// Coalesces saves; nullptr saves on every change.
    std::shared_ptr<WriteThrottle> throttle;
};

}  // namespace leaf_cpp
