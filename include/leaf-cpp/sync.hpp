/// @file sync.hpp
/// @brief The remote peer contract and the Syncer that keeps entities in sync with it.

#pragma once

#include <leaf-cpp/document.hpp>
#include <leaf-cpp/entity.hpp>
#include <leaf-cpp/entity_id.hpp>
#include <leaf-cpp/scheduler.hpp>
#include <leaf-cpp/types.hpp>
#include <leaf-cpp/version.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace leaf_cpp {

/// Receives updates for a subscribed entity.
using UpdateHandler = std::function<void(const EntityId&, std::span<const std::byte>)>;

/// Identifies one subscription to a peer. Zero is never assigned.
using SubscriptionId = std::uint64_t;

/// A peer that entities can be synced against: a HubPeer in the same
/// process, or a RemoteHub speaking the binary protocol.
class SyncInterface {
public:
    virtual ~SyncInterface() = default;

    /// Start receiving updates for `id`.
    ///
    /// If the peer knows the entity it answers once with the changes
    /// `version` lacks (a full snapshot when no version is given), then
    /// forwards every update it accepts from other peers.
    virtual auto subscribe(const EntityId& id, std::optional<VersionVector> version,
                           UpdateHandler handler) -> Unsubscribe = 0;

    /// Hand an update to the peer.
    virtual void send_update(const EntityId& id, Bytes update) = 0;

    struct Subscription {
        SubscriptionId id{0};  ///< Zero when the peer does not track subscriptions.
        Unsubscribe unsubscribe;
    };

    /// Like subscribe(), but also returns an id that send_update_from()
    /// accepts as the origin of an update.
    virtual auto open_subscription(const EntityId& id, std::optional<VersionVector> version,
                                   UpdateHandler handler) -> Subscription {
        return Subscription{.id = 0,
                            .unsubscribe = subscribe(id, std::move(version), std::move(handler))};
    }

    /// Like send_update(), but the subscription `origin` is not sent the
    /// update back.
    virtual void send_update_from(const EntityId& id, Bytes update,
                                  std::optional<SubscriptionId> origin) {
        static_cast<void>(origin);
        send_update(id, std::move(update));
    }
};

/// Lifecycle of one entity's sync session.
enum class SyncStatus : std::uint8_t {
    idle,         ///< Not synced.
    subscribing,  ///< Subscribed, no update received yet.
    active,       ///< At least one update received.
    stopped,      ///< unsync() was called; late updates are ignored.
};

constexpr auto to_string_view(SyncStatus status) noexcept -> std::string_view {
    switch (status) {
        case SyncStatus::idle:        return "idle";
        case SyncStatus::subscribing: return "subscribing";
        case SyncStatus::active:      return "active";
        case SyncStatus::stopped:     return "stopped";
    }
    return "unknown";
}

/// Keeps local entities in sync with one remote peer.
///
/// Local commits are forwarded on the next turn of the executor. Updates
/// from the remote are merged, and whenever the remote turns out to lack
/// local changes the missing delta is sent straight back.
///
/// Entities are held weakly: when one is destroyed or released its session
/// is torn down. Always create through std::make_shared.
class Syncer : public std::enable_shared_from_this<Syncer> {
public:
    Syncer(Executor executor, std::shared_ptr<SyncInterface> remote);
    ~Syncer();

    Syncer(const Syncer&) = delete;
    auto operator=(const Syncer&) -> Syncer& = delete;

    /// Start syncing the entity. No-op if it is already synced.
    void sync(const std::shared_ptr<Entity>& entity);

    /// Stop syncing. Unknown ids are a no-op.
    void unsync(const EntityId& id);

    auto status(const EntityId& id) const -> SyncStatus;
    auto is_syncing(const EntityId& id) const -> bool;

    /// Notified when the first update for the entity has been merged;
    /// nullptr if the entity is not synced.
    auto initial_load(const EntityId& id) const -> std::shared_ptr<Signal>;

    auto session_count() const -> std::size_t { return sessions_.size(); }

    auto remote() const -> const std::shared_ptr<SyncInterface>& { return remote_; }

private:
    struct Session {
        std::weak_ptr<Entity> entity;
        SyncStatus status{SyncStatus::subscribing};
        std::shared_ptr<Signal> initial_load;
        std::optional<SubscriptionId> subscription;
        Unsubscribe unsubscribe_local;
        Unsubscribe unsubscribe_remote;
    };

    void handle_update(Session& session, const EntityId& id, std::span<const std::byte> update);
    void forward_local_update(const EntityId& id, Bytes update,
                              std::optional<SubscriptionId> origin);

    Executor executor_;
    std::shared_ptr<SyncInterface> remote_;
    std::unordered_map<EntityId, std::shared_ptr<Session>> sessions_;
};

}  // namespace leaf_cpp
