/// @file version.hpp
/// @brief VersionVector and causal comparison of document versions.

#pragma once

#include <leaf-cpp/types.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string_view>

namespace leaf_cpp {

/// How two versions relate in causal order.
enum class VersionOrder : std::uint8_t {
    before,      ///< The left version is strictly contained in the right one.
    equal,       ///< Both versions describe the same history.
    after,       ///< The left version strictly contains the right one.
    concurrent,  ///< Each side has changes the other lacks.
};

/// Convert a VersionOrder to its string representation.
constexpr auto to_string_view(VersionOrder order) noexcept -> std::string_view {
    switch (order) {
        case VersionOrder::before:     return "before";
        case VersionOrder::equal:      return "equal";
        case VersionOrder::after:      return "after";
        case VersionOrder::concurrent: return "concurrent";
    }
    return "unknown";
}

/// Summary of a document's causal history.
///
/// Maps each actor to the highest sequence number of its changes that has
/// been applied. Sequences are contiguous per actor, so the vector fully
/// describes which changes a replica holds.
class VersionVector {
public:
    VersionVector() = default;

    /// The highest applied sequence for an actor (0 if none).
    auto get(const ActorId& actor) const -> std::uint64_t;

    /// Set the sequence for an actor. Setting 0 removes the entry.
    void set(const ActorId& actor, std::uint64_t seq);

    /// Pointwise maximum with another vector.
    void merge(const VersionVector& other);

    /// True if every change described by `other` is also described here.
    auto includes(const VersionVector& other) const -> bool;

    auto entries() const -> const std::map<ActorId, std::uint64_t>& { return entries_; }
    auto empty() const -> bool { return entries_.empty(); }
    auto size() const -> std::size_t { return entries_.size(); }

    /// Encode as ULEB128 count followed by (actor, ULEB128 seq) pairs.
    auto encode() const -> Bytes;

    /// Decode a vector produced by encode().
    /// @return nullopt on truncation, trailing bytes, unsorted or duplicate
    ///   actors, or zero sequences.
    static auto decode(std::span<const std::byte> data) -> std::optional<VersionVector>;

    auto operator==(const VersionVector&) const -> bool = default;

private:
    std::map<ActorId, std::uint64_t> entries_;
};

/// Compare two versions.
auto compare(const VersionVector& a, const VersionVector& b) -> VersionOrder;

}  // namespace leaf_cpp
