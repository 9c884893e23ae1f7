/// @file entity_id.hpp
/// @brief EntityId: the 32-byte identity of an entity and its text form.

#pragma once

#include <algorithm>
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace leaf_cpp {

/// The globally unique id of an Entity.
///
/// In text form an id looks like
///
///     leaf:ey02v80j9x376qgcczy8sq0pwvdbx01kbx0n7nbj90f87fnj5c50
///
/// i.e. the `leaf:` prefix followed by the 32 bytes in Crockford base-32,
/// lower case. Parsing is case-insensitive.
struct EntityId {
    static constexpr std::size_t size = 32;             ///< Fixed size in bytes.
    static constexpr std::string_view prefix = "leaf:";  ///< Text form prefix.
    std::array<std::byte, size> bytes{};                ///< Raw identifier bytes.

    constexpr EntityId() = default;

    /// Construct from a byte array.
    explicit constexpr EntityId(std::array<std::byte, size> b) : bytes{b} {}

    /// Generate a new random id.
    static auto random() -> EntityId;

    /// Parse the text form.
    /// @throws Exception with ErrorKind::invalid_entity_id if the prefix is
    ///   missing, a character is outside the Crockford alphabet, or the
    ///   decoded length is not 32 bytes.
    static auto parse(std::string_view text) -> EntityId;

    /// Parse the text form, returning nullopt instead of throwing.
    static auto try_parse(std::string_view text) -> std::optional<EntityId>;

    /// The canonical (lower-case) text form.
    auto to_string() const -> std::string;

    auto operator<=>(const EntityId&) const = default;
    auto operator==(const EntityId&) const -> bool = default;
};

}  // namespace leaf_cpp

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<leaf_cpp::EntityId> {
    auto operator()(const leaf_cpp::EntityId& id) const noexcept -> std::size_t {
        // Ids are random bytes, the first 8 are already well-distributed
        auto result = std::size_t{0};
        const auto* p = reinterpret_cast<const unsigned char*>(id.bytes.data());
        for (std::size_t i = 0; i < sizeof(std::size_t); ++i) {
            result = (result << 8) | p[i];
        }
        return result;
    }
};

/// @endcond
