/// @file throttle.hpp
/// @brief Pluggable policies for coalescing storage writes.

#pragma once

#include <leaf-cpp/entity_id.hpp>
#include <leaf-cpp/scheduler.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <unordered_map>

namespace leaf_cpp {

/// Decides when a scheduled write for an entity actually runs.
class WriteThrottle {
public:
    virtual ~WriteThrottle() = default;

    /// Arrange for `write` to run. A later schedule for the same entity may
    /// replace a write that has not run yet.
    virtual void schedule(const EntityId& id, std::function<void()> write) = 0;

    /// Run the pending write for `id` now, if there is one.
    virtual void flush(const EntityId& id) = 0;

    /// Whether a write for `id` is waiting.
    virtual auto pending(const EntityId& id) const -> bool = 0;
};

/// Runs the latest scheduled write once no new write was scheduled for
/// the entity within `delay`.
class DebounceThrottle : public WriteThrottle {
public:
    DebounceThrottle(Executor executor, std::chrono::milliseconds delay);
    ~DebounceThrottle() override;

    DebounceThrottle(const DebounceThrottle&) = delete;
    auto operator=(const DebounceThrottle&) -> DebounceThrottle& = delete;

    void schedule(const EntityId& id, std::function<void()> write) override;
    void flush(const EntityId& id) override;
    auto pending(const EntityId& id) const -> bool override;

    auto delay() const -> std::chrono::milliseconds { return delay_; }

private:
    struct Pending {
        std::unique_ptr<net::steady_timer> timer;
        std::function<void()> write;
        std::uint64_t generation{0};
    };

    void arm(const EntityId& id, Pending& pending);

    Executor executor_;
    std::chrono::milliseconds delay_;
    std::unordered_map<EntityId, Pending> pending_;
    std::uint64_t next_generation_{1};
    std::shared_ptr<int> lifetime_{std::make_shared<int>(0)};
};

}  // namespace leaf_cpp
