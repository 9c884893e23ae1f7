/// @file transaction.hpp
/// @brief Transaction class for batching document mutations.

#pragma once

#include <leaf-cpp/op.hpp>
#include <leaf-cpp/types.hpp>
#include <leaf-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace leaf_cpp {

namespace detail { struct DocState; }

/// A batch of mutations applied to a Document as one change.
///
/// Transactions are created exclusively by Document::transact(). Nothing
/// touches the document until the transaction function returns; if it
/// throws, the batch is discarded.
///
/// @code
/// doc.transact([](Transaction& tx) {
///     tx.put("name", "first", std::string{"Alice"});
///     tx.increment("visits", 1);
/// });
/// @endcode
class Transaction {
    friend class Document;
    explicit Transaction(const detail::DocState& state);

public:
    /// Set a scalar value at a map key.
    void put(std::string_view container, std::string_view key, ScalarValue val);

    /// Delete a map key.
    void delete_key(std::string_view container, std::string_view key);

    /// Add `delta` to the container's counter.
    void increment(std::string_view container, std::int64_t delta);

    /// Attach a commit message to the resulting change.
    void set_message(std::string message);

    // -- Reads (see this transaction's own pending writes) --------------------

    auto get(std::string_view container, std::string_view key) const
        -> std::optional<ScalarValue>;

    auto counter(std::string_view container) const -> std::int64_t;

    /// Number of operations buffered so far.
    auto pending_ops() const -> std::size_t { return pending_ops_.size(); }

private:
    const detail::DocState& state_;
    std::vector<Op> pending_ops_;
    std::optional<std::string> message_;
};

}  // namespace leaf_cpp
