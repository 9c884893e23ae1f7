/// @file hub_peer.hpp
/// @brief HubPeer: the storage-backed rendezvous node clients sync through.

#pragma once

#include <leaf-cpp/entity.hpp>
#include <leaf-cpp/entity_id.hpp>
#include <leaf-cpp/scheduler.hpp>
#include <leaf-cpp/storage_manager.hpp>
#include <leaf-cpp/sync.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace leaf_cpp {

/// A storage-backed peer that relays updates between its subscribers.
///
/// The hub keeps no entity in memory. Every subscription and every update
/// loads the entity from the readable storages; updates that advance it
/// are saved to the writable storages and forwarded to every subscriber
/// except the one they came from.
///
/// Work on one entity runs strictly in arrival order. Failures are logged
/// and never reach the caller or other entities. Always create through
/// std::make_shared.
class HubPeer : public SyncInterface, public std::enable_shared_from_this<HubPeer> {
public:
    HubPeer(Executor executor, std::vector<StorageConfig> storages);

    HubPeer(const HubPeer&) = delete;
    auto operator=(const HubPeer&) -> HubPeer& = delete;

    auto subscribe(const EntityId& id, std::optional<VersionVector> version,
                   UpdateHandler handler) -> Unsubscribe override;

    auto open_subscription(const EntityId& id, std::optional<VersionVector> version,
                           UpdateHandler handler) -> Subscription override;

    void send_update(const EntityId& id, Bytes update) override;

    void send_update_from(const EntityId& id, Bytes update,
                          std::optional<SubscriptionId> origin) override;

    auto subscriber_count(const EntityId& id) const -> std::size_t;

    auto storages() const -> const std::vector<StorageConfig>& { return storages_; }

private:
    auto deliver_initial(EntityId id, std::optional<VersionVector> version,
                         SubscriptionId subscription) -> Task<>;
    auto process_update(EntityId id, Bytes update, std::optional<SubscriptionId> origin) -> Task<>;

    /// Load the entity from every readable storage.
    auto load(Entity& entity) -> Task<bool>;

    void fan_out(const EntityId& id, std::span<const std::byte> update,
                 std::optional<SubscriptionId> origin);
    void remove_subscriber(const EntityId& id, SubscriptionId subscription);

    auto enter_lane(const EntityId& id) -> Task<std::shared_ptr<Signal>>;
    void leave_lane(const EntityId& id, const std::shared_ptr<Signal>& done);

    Executor executor_;
    std::vector<StorageConfig> storages_;
    std::unordered_map<EntityId, std::map<SubscriptionId, UpdateHandler>> subscribers_;
    // Tail of each entity's queue of pending work
    std::unordered_map<EntityId, std::shared_ptr<Signal>> lanes_;
    SubscriptionId next_subscription_{1};
};

}  // namespace leaf_cpp
