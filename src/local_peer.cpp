#include <leaf-cpp/local_peer.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace leaf_cpp {

LocalPeer::LocalPeer(Executor executor, LocalPeerConfig config)
    : executor_{std::move(executor)}, config_{std::move(config)} {}

LocalPeer::~LocalPeer() {
    for (auto& [id, record] : open_) {
        shut_down(*record);
    }
}

// -- Opening ------------------------------------------------------------------

auto LocalPeer::open(EntityId id, OpenOptions options) -> Task<EntityHandle> {
    co_return co_await open_entity(id, std::move(options), true);
}

auto LocalPeer::create() -> Task<EntityHandle> {
    co_return co_await open_entity(EntityId::random(), OpenOptions{}, false);
}

auto LocalPeer::open_entity(EntityId id, OpenOptions options, bool wait_for_remote)
    -> Task<EntityHandle> {
    auto claimed = co_await claim(id);
    auto record = std::shared_ptr<OpenEntity>{};
    try {
        if (auto it = open_.find(id); it != open_.end()) {
            record = it->second;
        } else {
            record = co_await load_and_sync(id, options, wait_for_remote);
        }
    } catch (const std::exception&) {
        release_claim(id, claimed);
        throw;
    }
    release_claim(id, claimed);
    co_return make_handle(record);
}

auto LocalPeer::load_and_sync(const EntityId& id, const OpenOptions& options,
                              bool wait_for_remote) -> Task<std::shared_ptr<OpenEntity>> {
    auto entity = std::make_shared<Entity>(id);

    auto found = false;
    for (const auto& storage : config_.storages) {
        if (!storage.read) continue;
        if (co_await storage.manager->load(*entity)) found = true;
    }

    auto record = std::make_shared<OpenEntity>();
    record->entity = entity;
    record->unsubscribe_changes = entity->subscribe(
        [executor = executor_, weak_self = weak_from_this(),
         weak_record = std::weak_ptr<OpenEntity>{record}]() {
            // Listeners must not suspend or mutate; save on the next turn
            net::post(executor, [weak_self, weak_record]() {
                auto self = weak_self.lock();
                auto record = weak_record.lock();
                if (self && record) self->schedule_saves(record);
            });
        });

    for (const auto& syncer : config_.syncers) {
        syncer->sync(entity);
    }
    open_.emplace(id, record);
    spdlog::info("opened {} ({})", id.to_string(), found ? "found locally" : "not found locally");

    if (found || !wait_for_remote) co_return record;

    auto timeout = options.create_after_timeout ? options.create_after_timeout
                                                : config_.create_after_timeout;
    auto signals = std::vector<std::shared_ptr<Signal>>{};
    for (const auto& syncer : config_.syncers) {
        if (auto signal = syncer->initial_load(id)) signals.push_back(std::move(signal));
    }

    if (!signals.empty()) {
        auto any = Signal::any(executor_, signals);
        if (!timeout) {
            co_await any->wait();
        } else if (!co_await any->wait_for(*timeout)) {
            spdlog::debug("no remote copy of {} after {} ms, starting empty",
                          id.to_string(), timeout->count());
        }
    } else if (timeout) {
        co_await sleep_for(*timeout);
    }
    co_return record;
}

auto LocalPeer::make_handle(const std::shared_ptr<OpenEntity>& record) -> EntityHandle {
    auto token = record->token.lock();
    if (!token) {
        token = std::make_shared<detail::HandleToken>();
        token->on_last_release = [weak_self = weak_from_this(),
                                  weak_record = std::weak_ptr<OpenEntity>{record}]() {
            auto record = weak_record.lock();
            if (!record) return;
            record->idle_since = Clock::now();
            if (auto self = weak_self.lock()) self->arm_idle_collection();
        };
        record->token = token;
        record->idle_since.reset();
    }
    return EntityHandle{record->entity, std::move(token)};
}

// -- Saving -------------------------------------------------------------------

void LocalPeer::schedule_saves(const std::shared_ptr<OpenEntity>& record) {
    if (record->closing) return;
    for (const auto& storage : config_.storages) {
        if (!storage.write) continue;
        auto write = [weak_self = weak_from_this(), weak_record = std::weak_ptr<OpenEntity>{record},
                      manager = storage.manager]() {
            auto self = weak_self.lock();
            auto record = weak_record.lock();
            if (!self || !record || record->closing) return;
            self->start_save(record, manager);
        };
        if (storage.throttle) {
            storage.throttle->schedule(record->entity->id(), std::move(write));
        } else {
            write();
        }
    }
}

void LocalPeer::start_save(const std::shared_ptr<OpenEntity>& record,
                           const std::shared_ptr<StorageManager>& manager) {
    auto done = std::make_shared<Signal>(executor_);
    record->saves.push_back(done);
    net::co_spawn(executor_,
        [record, manager, done]() -> Task<> {
            try {
                if (!record->entity->released()) co_await manager->save(*record->entity);
            } catch (const std::exception& e) {
                spdlog::error("failed to save {}: {}", record->entity->id().to_string(), e.what());
            }
            std::erase(record->saves, done);
            done->notify();
        },
        net::detached);
}

// -- Closing ------------------------------------------------------------------

auto LocalPeer::close(EntityId id) -> Task<> {
    // Let changes committed in the current turn reach their listeners
    co_await next_turn();

    auto claimed = co_await claim(id);
    auto it = open_.find(id);
    if (it == open_.end()) {
        release_claim(id, claimed);
        co_return;
    }
    auto record = it->second;
    open_.erase(it);
    record->closing = true;

    auto error = std::exception_ptr{};
    try {
        auto& entity = *record->entity;
        if (!entity.released()) {
            entity.commit();
            for (const auto& storage : config_.storages) {
                if (storage.throttle) storage.throttle->flush(id);
            }
            for (auto saves = record->saves; const auto& save : saves) {
                co_await save->wait();
            }
            for (const auto& storage : config_.storages) {
                if (storage.write) co_await storage.manager->save(entity);
            }
        }
    } catch (const std::exception&) {
        error = std::current_exception();
    }

    shut_down(*record);
    release_claim(id, claimed);
    spdlog::info("closed {}", id.to_string());
    if (error) std::rethrow_exception(error);
}

auto LocalPeer::remove(EntityId id) -> Task<> {
    co_await next_turn();

    auto claimed = co_await claim(id);
    auto error = std::exception_ptr{};
    try {
        if (auto it = open_.find(id); it != open_.end()) {
            auto record = it->second;
            open_.erase(it);
            record->closing = true;
            // A save finishing after the delete would resurrect the entity
            for (auto saves = record->saves; const auto& save : saves) {
                co_await save->wait();
            }
            shut_down(*record);
        }
        for (const auto& storage : config_.storages) {
            if (storage.write) co_await storage.manager->remove(id);
        }
        spdlog::info("removed {}", id.to_string());
    } catch (const std::exception&) {
        error = std::current_exception();
    }
    release_claim(id, claimed);
    if (error) std::rethrow_exception(error);
}

void LocalPeer::shut_down(OpenEntity& record) {
    record.closing = true;
    for (const auto& syncer : config_.syncers) {
        syncer->unsync(record.entity->id());
    }
    if (record.unsubscribe_changes) record.unsubscribe_changes();
    record.entity->release();
}

// -- Idle collection ----------------------------------------------------------

auto LocalPeer::collect_idle() -> Task<std::size_t> {
    const auto threshold = config_.idle_timeout.value_or(std::chrono::milliseconds{0});
    const auto now = Clock::now();

    auto idle = std::vector<EntityId>{};
    for (const auto& [id, record] : open_) {
        if (record->token.expired() && record->idle_since &&
            now - *record->idle_since >= threshold) {
            idle.push_back(id);
        }
    }

    auto closed = std::size_t{0};
    for (const auto& id : idle) {
        // A handle may have been taken out while we were closing others
        auto it = open_.find(id);
        if (it == open_.end() || !it->second->token.expired()) continue;
        try {
            co_await close(id);
            ++closed;
        } catch (const std::exception& e) {
            spdlog::error("failed to close idle entity {}: {}", id.to_string(), e.what());
        }
    }
    if (closed > 0) spdlog::debug("collected {} idle entit{}", closed, closed == 1 ? "y" : "ies");
    co_return closed;
}

void LocalPeer::arm_idle_collection() {
    if (!config_.idle_timeout) return;
    net::co_spawn(executor_,
        [weak = weak_from_this(), timeout = *config_.idle_timeout]() -> Task<> {
            co_await sleep_for(timeout);
            if (auto self = weak.lock()) co_await self->collect_idle();
        },
        net::detached);
}

// -- Claims -------------------------------------------------------------------

auto LocalPeer::claim(const EntityId& id) -> Task<std::shared_ptr<Signal>> {
    for (auto it = busy_.find(id); it != busy_.end(); it = busy_.find(id)) {
        auto other = it->second;
        co_await other->wait();
    }
    auto claimed = std::make_shared<Signal>(executor_);
    busy_.emplace(id, claimed);
    co_return claimed;
}

void LocalPeer::release_claim(const EntityId& id, const std::shared_ptr<Signal>& claimed) {
    claimed->notify();
    if (auto it = busy_.find(id); it != busy_.end() && it->second == claimed) {
        busy_.erase(it);
    }
}

}  // namespace leaf_cpp
