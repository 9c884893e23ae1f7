#include <leaf-cpp/error.hpp>
#include <leaf-cpp/sync.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <optional>
#include <vector>

namespace leaf_cpp {

Syncer::Syncer(Executor executor, std::shared_ptr<SyncInterface> remote)
    : executor_{std::move(executor)}, remote_{std::move(remote)} {}

Syncer::~Syncer() {
    auto ids = std::vector<EntityId>{};
    ids.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) ids.push_back(id);
    for (const auto& id : ids) unsync(id);
}

void Syncer::sync(const std::shared_ptr<Entity>& entity) {
    const auto id = entity->id();
    if (sessions_.contains(id)) return;

    auto session = std::make_shared<Session>();
    session->entity = entity;
    session->initial_load = std::make_shared<Signal>(executor_);
    sessions_.emplace(id, session);

    auto weak_self = weak_from_this();
    auto weak_session = std::weak_ptr<Session>{session};

    // Never call into the remote from inside a document listener. An update
    // committed before unsync() is still sent once its turn comes.
    session->unsubscribe_local = entity->doc().subscribe_local_updates(
        [this, weak_self, weak_session, id](std::span<const std::byte> update) {
            auto bytes = Bytes(update.begin(), update.end());
            net::post(executor_, [weak_self, weak_session, id, bytes = std::move(bytes)]() mutable {
                auto self = weak_self.lock();
                if (!self) return;
                auto origin = std::optional<SubscriptionId>{};
                if (auto session = weak_session.lock()) origin = session->subscription;
                self->forward_local_update(id, std::move(bytes), origin);
            });
        });

    auto version = entity->doc().version();
    spdlog::debug("subscribing to {} at {} actor(s)", id.to_string(), version.size());
    auto subscription = remote_->open_subscription(
        id, version.empty() ? std::nullopt : std::optional<VersionVector>{std::move(version)},
        [weak_self, weak_session](const EntityId& id, std::span<const std::byte> update) {
            auto self = weak_self.lock();
            auto session = weak_session.lock();
            if (!self || !session || session->status == SyncStatus::stopped) return;
            self->handle_update(*session, id, update);
        });
    if (subscription.id != 0) session->subscription = subscription.id;
    session->unsubscribe_remote = std::move(subscription.unsubscribe);
}

void Syncer::forward_local_update(const EntityId& id, Bytes update,
                                  std::optional<SubscriptionId> origin) {
    try {
        spdlog::debug("sending local update for {} ({} bytes)", id.to_string(), update.size());
        remote_->send_update_from(id, std::move(update), origin);
    } catch (const std::exception& e) {
        spdlog::error("failed to send update for {}: {}", id.to_string(), e.what());
    }
}

void Syncer::handle_update(Session& session, const EntityId& id,
                           std::span<const std::byte> update) {
    auto entity = session.entity.lock();
    if (!entity || entity->released()) {
        net::post(executor_, [weak_self = weak_from_this(), id]() {
            if (auto self = weak_self.lock()) self->unsync(id);
        });
        return;
    }

    try {
        auto meta = Document::inspect_update(update);
        if (!meta || !entity->doc().merge(update)) {
            spdlog::warn("dropping malformed update for {} ({} bytes)", id.to_string(), update.size());
            return;
        }
        spdlog::debug("merged {} change(s) into {}", meta->change_count, id.to_string());

        session.status = SyncStatus::active;
        session.initial_load->notify();

        // The remote lacks changes we have: send them back
        if (!meta->to.includes(entity->doc().version())) {
            remote_->send_update_from(id, entity->doc().export_delta(meta->to),
                                      session.subscription);
        }
    } catch (const std::exception& e) {
        spdlog::error("failed to apply update for {}: {}", id.to_string(), e.what());
    }
}

void Syncer::unsync(const EntityId& id) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return;
    auto session = std::move(it->second);
    sessions_.erase(it);

    session->status = SyncStatus::stopped;
    if (session->unsubscribe_remote) session->unsubscribe_remote();
    if (session->unsubscribe_local) session->unsubscribe_local();
    spdlog::debug("stopped syncing {}", id.to_string());
}

auto Syncer::status(const EntityId& id) const -> SyncStatus {
    auto it = sessions_.find(id);
    return it == sessions_.end() ? SyncStatus::idle : it->second->status;
}

auto Syncer::is_syncing(const EntityId& id) const -> bool {
    return sessions_.contains(id);
}

auto Syncer::initial_load(const EntityId& id) const -> std::shared_ptr<Signal> {
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second->initial_load;
}

}  // namespace leaf_cpp
