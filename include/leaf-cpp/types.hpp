/// @file types.hpp
/// @brief Core identity types: ActorId, OpId, Bytes.

#pragma once

#include <algorithm>
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <vector>

namespace leaf_cpp {

/// Raw byte buffer used for updates, snapshots and stored chunks.
using Bytes = std::vector<std::byte>;

/// A 16-byte unique identifier for one replica of a document.
///
/// Every Document writes its changes under its own ActorId. Actor ordering
/// breaks ties between concurrent writes to the same map key, so the
/// ordering must be the same on every peer: lexicographic on raw bytes.
struct ActorId {
    static constexpr std::size_t size = 16;  ///< Fixed size in bytes.
    std::array<std::byte, size> bytes{};     ///< Raw identifier bytes.

    /// A fresh actor from the OS entropy source.
    static auto random() -> ActorId;

    auto operator<=>(const ActorId&) const = default;

    /// The all-zero actor never writes; it marks an unset id.
    auto is_zero() const -> bool {
        return std::ranges::all_of(bytes, [](std::byte b) { return b == std::byte{0}; });
    }
};

/// Orders writes for last-writer-wins: a Lamport counter shared by every
/// container of a document, then the writing actor.
struct OpId {
    std::uint64_t counter{0};
    ActorId actor{};

    auto operator<=>(const OpId&) const = default;
};

/// Fill a span with bytes from a non-deterministic random source.
void fill_random(std::span<std::byte> out);

}  // namespace leaf_cpp

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<leaf_cpp::ActorId> {
    auto operator()(const leaf_cpp::ActorId& id) const noexcept -> std::size_t {
        // Actors are random, so any eight bytes hash well
        auto h = std::uint64_t{0};
        for (std::size_t i = 0; i < 8; ++i) {
            h = (h << 8) | std::to_integer<std::uint64_t>(id.bytes[i]);
        }
        return static_cast<std::size_t>(h);
    }
};

/// @endcond
