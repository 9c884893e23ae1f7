/// @file change.hpp
/// @brief Change type: an atomic group of operations.

#pragma once

#include <leaf-cpp/op.hpp>
#include <leaf-cpp/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace leaf_cpp {

/// A group of operations committed atomically by a single actor.
///
/// Changes are the unit of replication. Each actor numbers its changes
/// 1, 2, 3, ... so a VersionVector can describe exactly which changes a
/// replica has applied.
struct Change {
    ActorId actor;                       ///< The actor that authored this change.
    std::uint64_t seq{0};                ///< Sequence number (per-actor, 1-based).
    std::uint64_t start_op{0};           ///< Lamport counter of the first operation.
    std::int64_t timestamp{0};           ///< Unix timestamp in milliseconds.
    std::optional<std::string> message;  ///< Optional human-readable commit message.
    std::vector<Op> operations;          ///< The operations in this change.

    auto operator==(const Change&) const -> bool = default;
};

}  // namespace leaf_cpp
