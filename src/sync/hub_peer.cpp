#include <leaf-cpp/hub_peer.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace leaf_cpp {

HubPeer::HubPeer(Executor executor, std::vector<StorageConfig> storages)
    : executor_{std::move(executor)}, storages_{std::move(storages)} {}

auto HubPeer::subscribe(const EntityId& id, std::optional<VersionVector> version,
                        UpdateHandler handler) -> Unsubscribe {
    return open_subscription(id, std::move(version), std::move(handler)).unsubscribe;
}

auto HubPeer::open_subscription(const EntityId& id, std::optional<VersionVector> version,
                                UpdateHandler handler) -> Subscription {
    const auto subscription = next_subscription_++;
    subscribers_[id].emplace(subscription, std::move(handler));
    spdlog::debug("subscription {} to {}", subscription, id.to_string());

    net::co_spawn(executor_,
        [self = shared_from_this(), id, version = std::move(version), subscription]() -> Task<> {
            co_await self->deliver_initial(id, version, subscription);
        },
        net::detached);

    return Subscription{
        .id = subscription,
        .unsubscribe = [weak = weak_from_this(), id, subscription]() {
            if (auto self = weak.lock()) self->remove_subscriber(id, subscription);
        },
    };
}

void HubPeer::remove_subscriber(const EntityId& id, SubscriptionId subscription) {
    auto it = subscribers_.find(id);
    if (it == subscribers_.end()) return;
    it->second.erase(subscription);
    if (it->second.empty()) subscribers_.erase(it);
}

auto HubPeer::subscriber_count(const EntityId& id) const -> std::size_t {
    auto it = subscribers_.find(id);
    return it == subscribers_.end() ? 0 : it->second.size();
}

void HubPeer::send_update(const EntityId& id, Bytes update) {
    send_update_from(id, std::move(update), std::nullopt);
}

void HubPeer::send_update_from(const EntityId& id, Bytes update,
                               std::optional<SubscriptionId> origin) {
    net::co_spawn(executor_,
        [self = shared_from_this(), id, update = std::move(update), origin]() mutable -> Task<> {
            co_await self->process_update(id, std::move(update), origin);
        },
        net::detached);
}

auto HubPeer::load(Entity& entity) -> Task<bool> {
    auto found = false;
    for (const auto& storage : storages_) {
        if (!storage.read) continue;
        if (co_await storage.manager->load(entity)) found = true;
    }
    co_return found;
}

auto HubPeer::deliver_initial(EntityId id, std::optional<VersionVector> version,
                              SubscriptionId subscription) -> Task<> {
    auto done = co_await enter_lane(id);
    try {
        auto entity = Entity{id};
        auto found = false;
        for (const auto& storage : storages_) {
            if (!storage.read) continue;
            try {
                if (co_await storage.manager->load(entity)) found = true;
            } catch (const std::exception& e) {
                spdlog::error("failed to load {} for subscription {}: {}",
                              id.to_string(), subscription, e.what());
            }
        }

        // The subscriber may have left while we were loading
        auto handler = UpdateHandler{};
        if (auto it = subscribers_.find(id); it != subscribers_.end()) {
            if (auto sub = it->second.find(subscription); sub != it->second.end()) {
                handler = sub->second;
            }
        }

        if (found && handler) {
            auto update = version ? entity.doc().export_delta(*version)
                                  : entity.doc().export_snapshot();
            spdlog::debug("initial response for subscription {} ({} bytes)",
                          subscription, update.size());
            handler(id, update);
        }
    } catch (const std::exception& e) {
        spdlog::error("failed to answer subscription {} to {}: {}",
                      subscription, id.to_string(), e.what());
    }
    leave_lane(id, done);
}

auto HubPeer::process_update(EntityId id, Bytes update, std::optional<SubscriptionId> origin)
    -> Task<> {
    auto done = co_await enter_lane(id);
    try {
        auto entity = Entity{id};
        co_await load(entity);

        auto before = entity.doc().version();
        if (!entity.doc().merge(update)) {
            spdlog::warn("dropping malformed update for {} ({} bytes)", id.to_string(), update.size());
        } else if (compare(before, entity.doc().version()) == VersionOrder::before) {
            for (const auto& storage : storages_) {
                if (storage.write) co_await storage.manager->save(entity);
            }
            fan_out(id, update, origin);
        } else {
            spdlog::debug("update for {} carried nothing new", id.to_string());
        }
    } catch (const std::exception& e) {
        spdlog::error("failed to process update for {}: {}", id.to_string(), e.what());
    }
    leave_lane(id, done);
}

void HubPeer::fan_out(const EntityId& id, std::span<const std::byte> update,
                      std::optional<SubscriptionId> origin) {
    auto it = subscribers_.find(id);
    if (it == subscribers_.end()) return;

    // Handlers may unsubscribe while we iterate
    auto handlers = it->second;
    for (const auto& [subscription, handler] : handlers) {
        if (subscription == origin) continue;
        try {
            handler(id, update);
        } catch (const std::exception& e) {
            spdlog::error("subscriber {} of {} failed: {}", subscription, id.to_string(), e.what());
        }
    }
}

auto HubPeer::enter_lane(const EntityId& id) -> Task<std::shared_ptr<Signal>> {
    auto done = std::make_shared<Signal>(executor_);
    auto previous = std::exchange(lanes_[id], done);
    if (previous) co_await previous->wait();
    co_return done;
}

void HubPeer::leave_lane(const EntityId& id, const std::shared_ptr<Signal>& done) {
    done->notify();
    if (auto it = lanes_.find(id); it != lanes_.end() && it->second == done) {
        lanes_.erase(it);
    }
}

}  // namespace leaf_cpp
