/// @file update.hpp
/// @brief Metadata of an exported update or snapshot.

#pragma once

#include <leaf-cpp/version.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace leaf_cpp {

/// Whether an exported buffer is a full snapshot or a delta.
enum class UpdateKind : std::uint8_t {
    snapshot,  ///< Exported from the empty version; reconstructs full state.
    update,    ///< Exported from a non-empty version.
};

constexpr auto to_string_view(UpdateKind kind) noexcept -> std::string_view {
    switch (kind) {
        case UpdateKind::snapshot: return "snapshot";
        case UpdateKind::update:   return "update";
    }
    return "unknown";
}

/// The header fields of an update, decoded without applying it.
struct UpdateMeta {
    UpdateKind kind{UpdateKind::update};
    VersionVector from;          ///< Version the delta was exported against.
    VersionVector to;            ///< Full version of the exporter at export time.
    std::size_t change_count{0}; ///< Number of changes carried.

    auto operator==(const UpdateMeta&) const -> bool = default;
};

}  // namespace leaf_cpp
