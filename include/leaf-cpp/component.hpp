/// @file component.hpp
/// @brief Component definitions and typed component accessors.

#pragma once

#include <leaf-cpp/value.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace leaf_cpp {

class Entity;

/// The globally unique id of a component type, e.g. "name:01JNVY76XPH6Q5AVA385HP04G7".
using ComponentId = std::string;

/// The container in which an Entity records which components it carries.
/// Component ids must never use this name.
inline constexpr std::string_view entity_components_key = "___leaf_components___";

// -- Accessors ----------------------------------------------------------------

/// A component holding a map of scalar values.
///
/// Accessors are cheap views: they hold a pointer to their Entity and read
/// through it on every call, so they throw Exception{entity_released} once
/// the entity has been released.
class MapComponent {
public:
    MapComponent(Entity& entity, ComponentId id);

    auto id() const -> const ComponentId& { return id_; }

    void set(std::string_view key, ScalarValue value);
    auto get(std::string_view key) const -> std::optional<ScalarValue>;

    /// Typed read; nullopt if absent or of another type.
    template <typename T>
    auto get_as(std::string_view key) const -> std::optional<T> {
        return get_scalar<T>(get(key));
    }

    void remove(std::string_view key);
    auto contains(std::string_view key) const -> bool;
    auto keys() const -> std::vector<std::string>;
    auto size() const -> std::size_t;

    /// Delete every key.
    void clear();

private:
    Entity* entity_;
    ComponentId id_;
};

/// A component holding a single mergeable counter.
class CounterComponent {
public:
    CounterComponent(Entity& entity, ComponentId id);

    auto id() const -> const ComponentId& { return id_; }

    void increment(std::int64_t delta = 1);
    void decrement(std::int64_t delta = 1);
    auto value() const -> std::int64_t;

    /// Bring the counter back to zero.
    void clear();

private:
    Entity* entity_;
    ComponentId id_;
};

/// A component without data: only its presence on the entity matters.
class Marker {
public:
    Marker(Entity& /*entity*/, ComponentId id) : id_{std::move(id)} {}

    auto id() const -> const ComponentId& { return id_; }

    void clear() {}

private:
    ComponentId id_;
};

/// Every kind of component an Entity can carry.
using ComponentHandle = std::variant<MapComponent, CounterComponent, Marker>;

/// Satisfied by the alternatives of ComponentHandle.
template <typename T>
concept ComponentType = std::same_as<T, MapComponent> ||
                        std::same_as<T, CounterComponent> ||
                        std::same_as<T, Marker>;

/// Reset a component to the empty value of its kind.
void clear_component(ComponentHandle& handle);

// -- Definitions --------------------------------------------------------------

/// A component definition: its id, kind and initialiser.
template <ComponentType T>
struct ComponentDef {
    ComponentId id;                      ///< Globally unique component id.
    std::function<void(T&)> init;        ///< Called when the component is first added.
};

/// Define a new component type.
///
/// @code
/// const auto Name = def_component<MapComponent>(
///     "name:01JNVY76XPH6Q5AVA385HP04G7",
///     [](MapComponent& map) { map.set("first", std::string{}); });
/// @endcode
template <ComponentType T>
auto def_component(ComponentId id, std::function<void(T&)> init = {}) -> ComponentDef<T> {
    return ComponentDef<T>{.id = std::move(id), .init = std::move(init)};
}

}  // namespace leaf_cpp
