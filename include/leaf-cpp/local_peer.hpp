/// @file local_peer.hpp
/// @brief LocalPeer: opens, persists, syncs and closes entities for an application.

#pragma once

#include <leaf-cpp/entity.hpp>
#include <leaf-cpp/entity_id.hpp>
#include <leaf-cpp/scheduler.hpp>
#include <leaf-cpp/storage_manager.hpp>
#include <leaf-cpp/sync.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace leaf_cpp {

/// Everything a LocalPeer is wired to.
struct LocalPeerConfig {
    std::vector<StorageConfig> storages;
    std::vector<std::shared_ptr<Syncer>> syncers;
    /// How long open() waits for a syncer when the entity is not in local
    /// storage. Unset waits until a syncer delivers.
    std::optional<std::chrono::milliseconds> create_after_timeout;
    /// How long an entity without handles stays open. Unset leaves
    /// collection to collect_idle().
    std::optional<std::chrono::milliseconds> idle_timeout;
};

struct OpenOptions {
    /// Overrides LocalPeerConfig::create_after_timeout for this call.
    std::optional<std::chrono::milliseconds> create_after_timeout;
};

namespace detail {

/// Shared by every copy of an EntityHandle; runs its callback when the
/// last copy is gone.
struct HandleToken {
    std::function<void()> on_last_release;

    HandleToken() = default;
    HandleToken(const HandleToken&) = delete;
    auto operator=(const HandleToken&) -> HandleToken& = delete;

    ~HandleToken() {
        if (on_last_release) on_last_release();
    }
};

}  // namespace detail

/// A counted reference to an entity opened by a LocalPeer.
///
/// While any handle to an entity exists it is never collected as idle.
/// close() and remove() release the entity regardless of handles.
class EntityHandle {
public:
    EntityHandle() = default;

    auto entity() const -> Entity& { return *entity_; }
    auto operator*() const -> Entity& { return *entity_; }
    auto operator->() const -> Entity* { return entity_.get(); }
    auto id() const -> const EntityId& { return entity_->id(); }

    /// The entity as a shared pointer, for handing to a Syncer.
    auto shared() const -> const std::shared_ptr<Entity>& { return entity_; }

    explicit operator bool() const { return entity_ != nullptr; }

private:
    friend class LocalPeer;

    EntityHandle(std::shared_ptr<Entity> entity, std::shared_ptr<detail::HandleToken> token)
        : entity_{std::move(entity)}, token_{std::move(token)} {}

    std::shared_ptr<Entity> entity_;
    std::shared_ptr<detail::HandleToken> token_;
};

/// The application-facing peer.
///
/// Opening an entity loads it from local storage, starts every syncer on
/// it and saves it to the writable storages whenever it changes. Always
/// create through std::make_shared, and close() entities before dropping
/// the peer: the destructor stops syncing but does not save.
///
/// @code
/// auto peer = std::make_shared<LocalPeer>(io.get_executor(), std::move(config));
/// auto handle = co_await peer->open(id);
/// handle->get_or_init(Name).set("first", std::string{"John"});
/// handle->commit();
/// co_await peer->close(id);
/// @endcode
class LocalPeer : public std::enable_shared_from_this<LocalPeer> {
public:
    LocalPeer(Executor executor, LocalPeerConfig config);
    ~LocalPeer();

    LocalPeer(const LocalPeer&) = delete;
    auto operator=(const LocalPeer&) -> LocalPeer& = delete;

    /// Open the entity, or return the already open one.
    ///
    /// If no readable storage has the entity, waits for the first syncer
    /// to deliver it, at most `create_after_timeout`; after the timeout the
    /// entity is returned empty.
    /// @throws Exception with ErrorKind::storage_error if loading fails.
    auto open(EntityId id, OpenOptions options = {}) -> Task<EntityHandle>;

    /// Open a new entity with a random id without waiting for syncers.
    auto create() -> Task<EntityHandle>;

    /// Commit, save and release the entity. Unknown ids are a no-op.
    /// @throws Exception with ErrorKind::storage_error if the final save
    ///   fails; the entity is released anyway.
    auto close(EntityId id) -> Task<>;

    /// Release the entity and delete it from every writable storage.
    /// Remote peers keep their copies.
    auto remove(EntityId id) -> Task<>;

    /// Close every entity that has had no handle for at least the idle
    /// timeout (immediately if none is configured).
    /// @return the number of entities closed.
    auto collect_idle() -> Task<std::size_t>;

    auto is_open(const EntityId& id) const -> bool { return open_.contains(id); }
    auto open_count() const -> std::size_t { return open_.size(); }

    auto config() const -> const LocalPeerConfig& { return config_; }

private:
    using Clock = std::chrono::steady_clock;

    struct OpenEntity {
        std::shared_ptr<Entity> entity;
        std::weak_ptr<detail::HandleToken> token;
        Unsubscribe unsubscribe_changes;
        std::vector<std::shared_ptr<Signal>> saves;
        std::optional<Clock::time_point> idle_since;
        bool closing{false};
    };

    auto open_entity(EntityId id, OpenOptions options, bool wait_for_remote)
        -> Task<EntityHandle>;
    auto load_and_sync(const EntityId& id, const OpenOptions& options, bool wait_for_remote)
        -> Task<std::shared_ptr<OpenEntity>>;

    auto make_handle(const std::shared_ptr<OpenEntity>& record) -> EntityHandle;
    void schedule_saves(const std::shared_ptr<OpenEntity>& record);
    void start_save(const std::shared_ptr<OpenEntity>& record,
                    const std::shared_ptr<StorageManager>& manager);
    void arm_idle_collection();

    /// Detach the entity from syncers and listeners and free its document.
    void shut_down(OpenEntity& record);

    /// Wait until no open, close or remove of `id` is in progress, then
    /// claim it.
    auto claim(const EntityId& id) -> Task<std::shared_ptr<Signal>>;
    void release_claim(const EntityId& id, const std::shared_ptr<Signal>& claimed);

    Executor executor_;
    LocalPeerConfig config_;
    std::unordered_map<EntityId, std::shared_ptr<OpenEntity>> open_;
    // Entities with an open, close or remove in progress
    std::unordered_map<EntityId, std::shared_ptr<Signal>> busy_;
};

}  // namespace leaf_cpp
