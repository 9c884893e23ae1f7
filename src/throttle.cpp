#include <leaf-cpp/throttle.hpp>

#include <spdlog/spdlog.h>

namespace leaf_cpp {

DebounceThrottle::DebounceThrottle(Executor executor, std::chrono::milliseconds delay)
    : executor_{std::move(executor)}, delay_{delay} {}

DebounceThrottle::~DebounceThrottle() {
    for (auto& [id, pending] : pending_) {
        pending.timer->cancel();
    }
}

void DebounceThrottle::schedule(const EntityId& id, std::function<void()> write) {
    auto [it, inserted] = pending_.try_emplace(id);
    auto& pending = it->second;
    if (inserted) {
        pending.timer = std::make_unique<net::steady_timer>(executor_);
    }
    pending.write = std::move(write);
    arm(id, pending);
}

void DebounceThrottle::arm(const EntityId& id, Pending& pending) {
    pending.generation = next_generation_++;
    // expires_after cancels the previous wait, if any
    pending.timer->expires_after(delay_);
    pending.timer->async_wait(
        [this, alive = std::weak_ptr<int>{lifetime_}, id,
         generation = pending.generation](const boost::system::error_code& ec) {
            // A handler that completed just before destruction may still run
            if (ec || alive.expired()) return;
            auto it = pending_.find(id);
            if (it == pending_.end() || it->second.generation != generation) return;
            auto write = std::move(it->second.write);
            pending_.erase(it);
            write();
        });
}

void DebounceThrottle::flush(const EntityId& id) {
    auto it = pending_.find(id);
    if (it == pending_.end()) return;
    spdlog::debug("flushing throttled write for {}", id.to_string());
    it->second.timer->cancel();
    auto write = std::move(it->second.write);
    pending_.erase(it);
    write();
}

auto DebounceThrottle::pending(const EntityId& id) const -> bool {
    return pending_.contains(id);
}

}  // namespace leaf_cpp
