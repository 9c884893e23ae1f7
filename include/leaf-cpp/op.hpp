/// @file op.hpp
/// @brief Operation types for the document change log.

#pragma once

#include <leaf-cpp/types.hpp>
#include <leaf-cpp/value.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace leaf_cpp {

/// The kind of mutation an operation represents.
enum class OpType : std::uint8_t {
    put,        ///< Set a scalar at a map key.
    del,        ///< Delete a map key (stores a tombstone).
    increment,  ///< Add to a container's counter.
};

/// Convert an OpType to its string representation.
constexpr auto to_string_view(OpType type) noexcept -> std::string_view {
    switch (type) {
        case OpType::put:       return "put";
        case OpType::del:       return "del";
        case OpType::increment: return "increment";
    }
    return "unknown";
}

/// A single operation in a change.
///
/// Operations target a named container (a component id) and, for map
/// operations, a key inside it. The op id is not stored: it is derived from
/// the enclosing Change's start_op and the op's position.
struct Op {
    OpType action{OpType::put};  ///< The type of mutation.
    std::string container;       ///< The component id the op targets.
    std::string key;             ///< Map key (empty for increment).
    ScalarValue value{};         ///< Value for put, int64 delta for increment.

    auto operator==(const Op&) const -> bool = default;
};

}  // namespace leaf_cpp
