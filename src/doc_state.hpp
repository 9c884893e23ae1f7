#pragma once

// Internal header — not installed. Implementation detail of Document.

#include <leaf-cpp/change.hpp>
#include <leaf-cpp/op.hpp>
#include <leaf-cpp/types.hpp>
#include <leaf-cpp/value.hpp>
#include <leaf-cpp/version.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace leaf_cpp::detail {

// The current value at a map key. An empty value is a tombstone: it keeps
// the id of the delete so an older concurrent put cannot resurrect the key.
struct MapRegister {
    OpId id;
    std::optional<ScalarValue> value;
};

// Every container holds both a register map and a counter.
struct ContainerState {
    std::map<std::string, MapRegister> entries;
    std::int64_t counter{0};
};

// The complete internal state of a Document.
struct DocState {
    ActorId actor;
    std::uint64_t max_op{0};
    std::map<std::string, ContainerState> containers;

    // Applied changes per actor; changes[a][i] has seq i + 1.
    std::map<ActorId, std::vector<Change>> changes;
    // Remote changes waiting for an earlier seq of the same actor.
    std::map<ActorId, std::map<std::uint64_t, Change>> queued;

    // Local ops applied to `containers` but not yet sealed into a Change.
    std::vector<Op> staged;
    std::uint64_t staged_start_op{0};

    auto applied_seq(const ActorId& a) const -> std::uint64_t {
        auto it = changes.find(a);
        return it == changes.end() ? 0 : it->second.size();
    }

    auto version() const -> VersionVector {
        auto v = VersionVector{};
        for (const auto& [a, list] : changes) {
            v.set(a, list.size());
        }
        return v;
    }

    auto queued_count() const -> std::size_t {
        auto n = std::size_t{0};
        for (const auto& [a, by_seq] : queued) n += by_seq.size();
        return n;
    }

    auto get_container(const std::string& name) const -> const ContainerState* {
        auto it = containers.find(name);
        return it != containers.end() ? &it->second : nullptr;
    }

    // -- Applying operations --------------------------------------------------

    void apply_op(const Op& op, OpId id) {
        auto& container = containers[op.container];
        switch (op.action) {
            case OpType::put:
            case OpType::del: {
                auto value = op.action == OpType::put
                    ? std::optional<ScalarValue>{op.value}
                    : std::nullopt;
                auto [it, inserted] = container.entries.try_emplace(
                    op.key, MapRegister{.id = id, .value = value});
                if (!inserted && it->second.id < id) {
                    it->second = MapRegister{.id = id, .value = std::move(value)};
                }
                break;
            }
            case OpType::increment:
                // Two's-complement wraparound, identical on every replica
                container.counter = static_cast<std::int64_t>(
                    static_cast<std::uint64_t>(container.counter) +
                    static_cast<std::uint64_t>(std::get<std::int64_t>(op.value)));
                break;
        }
        if (id.counter > max_op) max_op = id.counter;
    }

    // A change is structurally valid if its op ids do not overflow and
    // every increment carries an integer delta.
    static auto is_valid(const Change& change) -> bool {
        if (change.start_op == 0) return false;
        if (change.operations.size() >
            std::numeric_limits<std::uint64_t>::max() - change.start_op) {
            return false;
        }
        for (const auto& op : change.operations) {
            if (op.action == OpType::increment &&
                !std::holds_alternative<std::int64_t>(op.value)) {
                return false;
            }
        }
        return true;
    }

    // Apply a change whose seq is the next expected for its actor.
    void apply_change(Change change) {
        for (std::size_t i = 0; i < change.operations.size(); ++i) {
            apply_op(change.operations[i], OpId{change.start_op + i, change.actor});
        }
        changes[change.actor].push_back(std::move(change));
    }

    // Apply, buffer, or drop a remote change. Returns the number of changes
    // that were applied as a result (0 for duplicates and gaps).
    auto receive_change(Change change) -> std::size_t {
        const auto actor = change.actor;
        const auto next = applied_seq(actor) + 1;
        if (change.seq < next) return 0;  // already applied
        if (change.seq > next) {
            queued[actor].try_emplace(change.seq, std::move(change));
            return 0;
        }

        apply_change(std::move(change));
        auto applied = std::size_t{1};

        // Drain changes the gap was holding back
        auto q = queued.find(actor);
        if (q != queued.end()) {
            auto& by_seq = q->second;
            while (!by_seq.empty()) {
                auto first = by_seq.begin();
                auto expected = applied_seq(actor) + 1;
                if (first->first < expected) {
                    by_seq.erase(first);
                    continue;
                }
                if (first->first != expected) break;
                auto next_change = std::move(first->second);
                by_seq.erase(first);
                apply_change(std::move(next_change));
                ++applied;
            }
            if (by_seq.empty()) queued.erase(q);
        }
        return applied;
    }

    // -- Local staging --------------------------------------------------------

    void stage(Op op) {
        if (staged.empty()) staged_start_op = max_op + 1;
        auto id = OpId{staged_start_op + staged.size(), actor};
        apply_op(op, id);
        staged.push_back(std::move(op));
    }

    // Seal staged ops into the next local change. Returns nullopt if nothing
    // is staged.
    auto seal_staged(std::optional<std::string> message, std::int64_t timestamp)
        -> std::optional<Change> {
        if (staged.empty()) return std::nullopt;
        auto change = Change{
            .actor = actor,
            .seq = applied_seq(actor) + 1,
            .start_op = staged_start_op,
            .timestamp = timestamp,
            .message = std::move(message),
            .operations = std::move(staged),
        };
        staged.clear();
        staged_start_op = 0;
        changes[actor].push_back(change);
        return change;
    }

    // Changes the given version lacks, sorted by (actor, seq).
    auto changes_since(const VersionVector& from) const -> std::vector<const Change*> {
        auto result = std::vector<const Change*>{};
        for (const auto& [a, list] : changes) {
            auto have = from.get(a);
            for (auto i = have; i < list.size(); ++i) {
                result.push_back(&list[static_cast<std::size_t>(i)]);
            }
        }
        return result;
    }
};

// Listener bookkeeping shared with unsubscribe closures through a weak_ptr,
// so an unsubscribe that outlives its Document is a no-op.
struct ListenerRegistry {
    std::uint64_t next_id{1};
    std::map<std::uint64_t, std::function<void()>> change_listeners;
    std::map<std::uint64_t, std::function<void(std::span<const std::byte>)>> local_update_listeners;
    bool notifying{false};
};

}  // namespace leaf_cpp::detail
