/// @file value.hpp
/// @brief Scalar values stored in map components.

#pragma once

#include <leaf-cpp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace leaf_cpp {

/// Represents a JSON null value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// A closed set of primitive values stored in the document.
///
/// Alternatives: Null, bool, int64_t, double, string, Bytes.
/// The alternative index is part of the binary format; append only.
using ScalarValue = std::variant<
    Null,
    bool,
    std::int64_t,
    double,
    std::string,
    Bytes
>;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& s) { spdlog::info("{}", s); },
///     [](auto&&) {},
/// }, some_variant);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

// -- Typed scalar extraction helpers ------------------------------------------

/// Extract a typed scalar, or nullopt on type mismatch.
/// @code
/// auto name = get_scalar<std::string>(value);
/// @endcode
template <typename T>
auto get_scalar(const ScalarValue& v) -> std::optional<T> {
    if (const auto* t = std::get_if<T>(&v)) {
        return *t;
    }
    return std::nullopt;
}

/// Extract a typed scalar from an optional<ScalarValue>.
template <typename T>
auto get_scalar(const std::optional<ScalarValue>& v) -> std::optional<T> {
    if (!v) return std::nullopt;
    return get_scalar<T>(*v);
}

}  // namespace leaf_cpp
