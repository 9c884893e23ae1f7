#include <leaf-cpp/document.hpp>
#include <leaf-cpp/error.hpp>

#include "doc_state.hpp"
#include "storage/update_chunk.hpp"

#include <algorithm>
#include <chrono>
#include <vector>

namespace leaf_cpp {

namespace {

auto now_millis() -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Marks the registry as notifying for the lifetime of the scope.
class NotifyingScope {
public:
    explicit NotifyingScope(detail::ListenerRegistry& registry) : registry_{registry} {
        registry_.notifying = true;
    }
    ~NotifyingScope() { registry_.notifying = false; }

    NotifyingScope(const NotifyingScope&) = delete;
    auto operator=(const NotifyingScope&) -> NotifyingScope& = delete;

private:
    detail::ListenerRegistry& registry_;
};

template <typename Map>
auto listener_ids(const Map& listeners) -> std::vector<std::uint64_t> {
    auto ids = std::vector<std::uint64_t>{};
    ids.reserve(listeners.size());
    for (const auto& [id, fn] : listeners) ids.push_back(id);
    return ids;
}

}  // namespace

Document::Document() : Document{ActorId::random()} {}

Document::Document(ActorId actor)
    : state_{std::make_unique<detail::DocState>()},
      listeners_{std::make_shared<detail::ListenerRegistry>()} {
    state_->actor = actor;
}

Document::~Document() = default;

Document::Document(Document&&) noexcept = default;
auto Document::operator=(Document&&) noexcept -> Document& = default;

auto Document::fork() const -> Document {
    auto copy = Document{};
    for (const auto* change : state_->changes_since(VersionVector{})) {
        copy.state_->apply_change(*change);
    }
    return copy;
}

auto Document::actor_id() const -> const ActorId& {
    return state_->actor;
}

// -- Local mutation -----------------------------------------------------------

void Document::ensure_not_notifying() const {
    if (listeners_->notifying) {
        throw Exception{ErrorKind::reentrant_call,
                        "document mutated from inside one of its listeners"};
    }
}

void Document::put(std::string_view container, std::string_view key, ScalarValue val) {
    ensure_not_notifying();
    state_->stage(Op{
        .action = OpType::put,
        .container = std::string{container},
        .key = std::string{key},
        .value = std::move(val),
    });
}

void Document::delete_key(std::string_view container, std::string_view key) {
    ensure_not_notifying();
    state_->stage(Op{
        .action = OpType::del,
        .container = std::string{container},
        .key = std::string{key},
        .value = Null{},
    });
}

void Document::increment(std::string_view container, std::int64_t delta) {
    ensure_not_notifying();
    state_->stage(Op{
        .action = OpType::increment,
        .container = std::string{container},
        .key = {},
        .value = delta,
    });
}

void Document::commit(std::optional<std::string> message) {
    ensure_not_notifying();
    auto before = state_->version();
    auto change = state_->seal_staged(std::move(message), now_millis());
    if (!change) return;

    auto update = storage::encode_update(before, state_->version(), {&*change});
    notify(std::span<const std::byte>{update});
}

auto Document::has_pending_changes() const -> bool {
    return !state_->staged.empty();
}

void Document::transact(const std::function<void(Transaction&)>& fn) {
    ensure_not_notifying();
    auto tx = Transaction{*state_};
    fn(tx);
    for (auto& op : tx.pending_ops_) {
        state_->stage(std::move(op));
    }
    commit(std::move(tx.message_));
}

// -- Reading ------------------------------------------------------------------

auto Document::get(std::string_view container, std::string_view key) const
    -> std::optional<ScalarValue> {
    const auto* state = state_->get_container(std::string{container});
    if (!state) return std::nullopt;
    auto it = state->entries.find(std::string{key});
    if (it == state->entries.end()) return std::nullopt;
    return it->second.value;
}

auto Document::keys(std::string_view container) const -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    const auto* state = state_->get_container(std::string{container});
    if (!state) return result;
    for (const auto& [key, reg] : state->entries) {
        if (reg.value) result.push_back(key);
    }
    return result;
}

auto Document::length(std::string_view container) const -> std::size_t {
    const auto* state = state_->get_container(std::string{container});
    if (!state) return 0;
    return static_cast<std::size_t>(std::ranges::count_if(state->entries,
        [](const auto& entry) { return entry.second.value.has_value(); }));
}

auto Document::counter(std::string_view container) const -> std::int64_t {
    const auto* state = state_->get_container(std::string{container});
    return state ? state->counter : 0;
}

auto Document::containers() const -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    result.reserve(state_->containers.size());
    for (const auto& [name, state] : state_->containers) result.push_back(name);
    return result;
}

// -- Versions and history -----------------------------------------------------

auto Document::version() const -> VersionVector {
    return state_->version();
}

auto Document::get_changes() const -> std::vector<Change> {
    auto result = std::vector<Change>{};
    for (const auto* change : state_->changes_since(VersionVector{})) {
        result.push_back(*change);
    }
    return result;
}

auto Document::queued_change_count() const -> std::size_t {
    return state_->queued_count();
}

// -- Exchange -----------------------------------------------------------------

auto Document::merge(std::span<const std::byte> update) -> bool {
    ensure_not_notifying();
    auto decoded = storage::decode_update(update);
    if (!decoded) return false;
    if (!std::ranges::all_of(decoded->changes, &detail::DocState::is_valid)) return false;

    commit();

    auto applied = std::size_t{0};
    for (auto& change : decoded->changes) {
        applied += state_->receive_change(std::move(change));
    }
    if (applied > 0) notify(std::nullopt);
    return true;
}

auto Document::export_snapshot() const -> Bytes {
    return export_delta(VersionVector{});
}

auto Document::export_delta(const VersionVector& from) const -> Bytes {
    auto to = state_->version();
    auto changes = state_->changes_since(from);
    // `from` may name changes we never saw; only what we share is relevant
    auto effective_from = VersionVector{};
    for (const auto& [actor, seq] : from.entries()) {
        effective_from.set(actor, std::min(seq, to.get(actor)));
    }
    return storage::encode_update(effective_from, to, changes);
}

auto Document::inspect_update(std::span<const std::byte> update) -> std::optional<UpdateMeta> {
    auto decoded = storage::decode_update(update, /*header_only=*/true);
    if (!decoded) return std::nullopt;
    return std::move(decoded->meta);
}

// -- Listeners ----------------------------------------------------------------

auto Document::subscribe(Listener listener) -> Unsubscribe {
    auto id = listeners_->next_id++;
    listeners_->change_listeners.emplace(id, std::move(listener));
    return [weak = std::weak_ptr<detail::ListenerRegistry>{listeners_}, id]() {
        if (auto registry = weak.lock()) registry->change_listeners.erase(id);
    };
}

auto Document::subscribe_local_updates(LocalUpdateListener listener) -> Unsubscribe {
    auto id = listeners_->next_id++;
    listeners_->local_update_listeners.emplace(id, std::move(listener));
    return [weak = std::weak_ptr<detail::ListenerRegistry>{listeners_}, id]() {
        if (auto registry = weak.lock()) registry->local_update_listeners.erase(id);
    };
}

void Document::notify(std::optional<std::span<const std::byte>> local_update) {
    // Keep the registry alive even if a listener releases this document
    auto registry = listeners_;
    auto scope = NotifyingScope{*registry};

    if (local_update) {
        for (auto id : listener_ids(registry->local_update_listeners)) {
            auto it = registry->local_update_listeners.find(id);
            if (it == registry->local_update_listeners.end()) continue;
            auto fn = it->second;
            fn(*local_update);
        }
    }
    for (auto id : listener_ids(registry->change_listeners)) {
        auto it = registry->change_listeners.find(id);
        if (it == registry->change_listeners.end()) continue;
        auto fn = it->second;
        fn();
    }
}

}  // namespace leaf_cpp
