/// @file entity.hpp
/// @brief Entity: an EntityId paired with the Document holding its components.

#pragma once

#include <leaf-cpp/component.hpp>
#include <leaf-cpp/document.hpp>
#include <leaf-cpp/entity_id.hpp>

#include <optional>
#include <string>
#include <vector>

namespace leaf_cpp {

/// A container for a collection of components.
///
/// The Entity exclusively owns its Document. Inside the document every
/// component is a container named by its component id, and the special
/// container `entity_components_key` maps each present component id to
/// `true`.
///
/// Once release() has been called the document is gone and every access
/// throws Exception{ErrorKind::entity_released}.
///
/// @code
/// auto entity = Entity{};
/// auto name = entity.get_or_init(Name);
/// name.set("first", std::string{"John"});
/// entity.commit();
/// @endcode
class Entity {
public:
    /// Create an empty entity with a random id.
    Entity();

    /// Create an empty entity with the given id.
    explicit Entity(EntityId id);

    // Component accessors keep a pointer to their Entity
    Entity(const Entity&) = delete;
    auto operator=(const Entity&) -> Entity& = delete;
    Entity(Entity&&) = delete;
    auto operator=(Entity&&) -> Entity& = delete;

    auto id() const -> const EntityId& { return id_; }

    /// The underlying document.
    /// @throws Exception with ErrorKind::entity_released after release().
    auto doc() -> Document&;
    auto doc() const -> const Document&;

    // -- Components -----------------------------------------------------------

    /// Whether the component is on the entity.
    template <ComponentType T>
    auto has(const ComponentDef<T>& def) const -> bool { return has(def.id); }

    auto has(std::string_view component_id) const -> bool;

    /// Ids of every component on the entity.
    auto components() const -> std::vector<ComponentId>;

    /// Add the component with its initial value if it is not present yet.
    template <ComponentType T>
    auto init(const ComponentDef<T>& def) -> Entity& {
        get_or_init(def);
        return *this;
    }

    /// Get the component, adding it with its initial value if needed.
    template <ComponentType T>
    auto get_or_init(const ComponentDef<T>& def) -> T {
        auto component = T{*this, def.id};
        if (!has(def.id)) {
            if (def.init) def.init(component);
            mark_present(def.id);
        }
        return component;
    }

    /// Get the component, or nullopt if it is not on the entity.
    template <ComponentType T>
    auto get(const ComponentDef<T>& def) -> std::optional<T> {
        if (!has(def.id)) return std::nullopt;
        return T{*this, def.id};
    }

    /// Remove the component and clear its data.
    template <ComponentType T>
    void remove(const ComponentDef<T>& def) {
        auto handle = ComponentHandle{T{*this, def.id}};
        remove(handle);
    }

    void remove(ComponentHandle& handle);

    // -- Changes --------------------------------------------------------------

    /// Commit staged edits as one change.
    void commit(std::optional<std::string> message = std::nullopt);

    /// Called after every commit or merge that changed the document.
    auto subscribe(Document::Listener listener) -> Unsubscribe;

    // -- Lifetime -------------------------------------------------------------

    /// Free the document. Idempotent.
    void release();

    auto released() const -> bool { return !doc_.has_value(); }

private:
    void mark_present(const ComponentId& id);

    EntityId id_;
    std::optional<Document> doc_;
};

}  // namespace leaf_cpp
