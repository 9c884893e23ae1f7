/// @file document.hpp
/// @brief The Document class: the CRDT state of one entity.

#pragma once

#include <leaf-cpp/change.hpp>
#include <leaf-cpp/transaction.hpp>
#include <leaf-cpp/types.hpp>
#include <leaf-cpp/update.hpp>
#include <leaf-cpp/value.hpp>
#include <leaf-cpp/version.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace leaf_cpp {

namespace detail {
struct DocState;
struct ListenerRegistry;
}  // namespace detail

/// Removes a listener or subscription. Calling it more than once is a no-op.
using Unsubscribe = std::function<void()>;

/// A CRDT document made of named containers.
///
/// Each container holds a last-writer-wins map of scalar values and a
/// counter. Local edits are staged with put()/delete_key()/increment() and
/// sealed into a Change by commit(). Remote state arrives through merge(),
/// which is commutative, associative and idempotent.
///
/// Listeners may read the document but must not mutate it; a mutating
/// call from inside a listener throws Exception{ErrorKind::reentrant_call}.
///
/// @code
/// auto doc = Document{};
/// doc.put("name", "first", std::string{"John"});
/// doc.commit();
/// auto other = Document{};
/// other.merge(doc.export_snapshot());
/// @endcode
class Document {
public:
    using Listener = std::function<void()>;
    using LocalUpdateListener = std::function<void(std::span<const std::byte>)>;

    /// Construct a new empty document with a random actor ID.
    Document();

    /// Construct an empty document writing as the given actor.
    explicit Document(ActorId actor);

    ~Document();

    Document(Document&&) noexcept;
    auto operator=(Document&&) noexcept -> Document&;

    Document(const Document&) = delete;
    auto operator=(const Document&) -> Document& = delete;

    /// Copy the committed state into an independent document with a fresh
    /// actor. Listeners and staged ops are not copied.
    auto fork() const -> Document;

    auto actor_id() const -> const ActorId&;

    // -- Local mutation -------------------------------------------------------

    void put(std::string_view container, std::string_view key, ScalarValue val);
    void delete_key(std::string_view container, std::string_view key);
    void increment(std::string_view container, std::int64_t delta);

    /// Seal all staged ops into a change and notify listeners.
    /// No-op if nothing is staged.
    void commit(std::optional<std::string> message = std::nullopt);

    /// True if there are staged ops waiting for commit().
    auto has_pending_changes() const -> bool;

    /// Run `fn` against a Transaction, then stage and commit its ops.
    /// If `fn` throws, the document is unchanged.
    void transact(const std::function<void(Transaction&)>& fn);

    /// Run `fn` against a Transaction and return its result.
    template <typename Fn>
        requires std::invocable<Fn, Transaction&> &&
                 (!std::is_void_v<std::invoke_result_t<Fn, Transaction&>>)
    auto transact(Fn&& fn) -> std::invoke_result_t<Fn, Transaction&>;

    // -- Reading --------------------------------------------------------------

    auto get(std::string_view container, std::string_view key) const
        -> std::optional<ScalarValue>;

    /// Live (non-deleted) keys of a container, sorted.
    auto keys(std::string_view container) const -> std::vector<std::string>;

    /// Number of live keys in a container.
    auto length(std::string_view container) const -> std::size_t;

    auto counter(std::string_view container) const -> std::int64_t;

    /// Names of every container that has ever been written.
    auto containers() const -> std::vector<std::string>;

    // -- Versions and history -------------------------------------------------

    /// The version of all committed changes.
    auto version() const -> VersionVector;

    /// Committed changes, sorted by (actor, seq).
    auto get_changes() const -> std::vector<Change>;

    /// Number of remote changes buffered until an earlier change arrives.
    auto queued_change_count() const -> std::size_t;

    // -- Exchange -------------------------------------------------------------

    /// Merge an update or snapshot produced by export_snapshot()/export_delta().
    ///
    /// Staged local ops are committed first. Changes already applied are
    /// skipped; changes that arrive ahead of their predecessors are held
    /// until the gap fills.
    /// @return false if the bytes fail to decode; the document is unchanged.
    auto merge(std::span<const std::byte> update) -> bool;

    /// Export every committed change. Staged ops are not included.
    auto export_snapshot() const -> Bytes;

    /// Export the committed changes `from` does not include.
    /// An empty `from` produces a snapshot.
    auto export_delta(const VersionVector& from) const -> Bytes;

    /// Decode the header of an update without applying it.
    static auto inspect_update(std::span<const std::byte> update) -> std::optional<UpdateMeta>;

    // -- Listeners ------------------------------------------------------------

    /// Called after every commit or merge that changed the version.
    auto subscribe(Listener listener) -> Unsubscribe;

    /// Called after each local commit with an update containing exactly
    /// that change.
    auto subscribe_local_updates(LocalUpdateListener listener) -> Unsubscribe;

private:
    void ensure_not_notifying() const;
    void notify(std::optional<std::span<const std::byte>> local_update);

    std::unique_ptr<detail::DocState> state_;
    std::shared_ptr<detail::ListenerRegistry> listeners_;
};

// -- Template implementations (must be in header) ----------------------------

template <typename Fn>
    requires std::invocable<Fn, Transaction&> &&
             (!std::is_void_v<std::invoke_result_t<Fn, Transaction&>>)
auto Document::transact(Fn&& fn) -> std::invoke_result_t<Fn, Transaction&> {
    auto result = std::optional<std::invoke_result_t<Fn, Transaction&>>{};
    transact(std::function<void(Transaction&)>{[&](Transaction& tx) {
        result.emplace(fn(tx));
    }});
    return std::move(*result);
}

}  // namespace leaf_cpp
