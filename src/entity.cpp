#include <leaf-cpp/entity.hpp>
#include <leaf-cpp/error.hpp>

namespace leaf_cpp {

// -- Entity -------------------------------------------------------------------

Entity::Entity() : Entity{EntityId::random()} {}

Entity::Entity(EntityId id) : id_{id}, doc_{std::in_place} {}

auto Entity::doc() -> Document& {
    if (!doc_) {
        throw Exception{ErrorKind::entity_released,
                        "entity " + id_.to_string() + " has been released"};
    }
    return *doc_;
}

auto Entity::doc() const -> const Document& {
    if (!doc_) {
        throw Exception{ErrorKind::entity_released,
                        "entity " + id_.to_string() + " has been released"};
    }
    return *doc_;
}

auto Entity::has(std::string_view component_id) const -> bool {
    return get_scalar<bool>(doc().get(entity_components_key, component_id)) == true;
}

auto Entity::components() const -> std::vector<ComponentId> {
    auto result = std::vector<ComponentId>{};
    for (auto& key : doc().keys(entity_components_key)) {
        if (has(key)) result.push_back(std::move(key));
    }
    return result;
}

void Entity::mark_present(const ComponentId& id) {
    doc().put(entity_components_key, id, true);
}

void Entity::remove(ComponentHandle& handle) {
    auto id = std::visit([](const auto& component) { return component.id(); }, handle);
    doc().delete_key(entity_components_key, id);
    clear_component(handle);
}

void Entity::commit(std::optional<std::string> message) {
    doc().commit(std::move(message));
}

auto Entity::subscribe(Document::Listener listener) -> Unsubscribe {
    return doc().subscribe(std::move(listener));
}

void Entity::release() {
    doc_.reset();
}

// -- Accessors ----------------------------------------------------------------

MapComponent::MapComponent(Entity& entity, ComponentId id)
    : entity_{&entity}, id_{std::move(id)} {}

void MapComponent::set(std::string_view key, ScalarValue value) {
    entity_->doc().put(id_, key, std::move(value));
}

auto MapComponent::get(std::string_view key) const -> std::optional<ScalarValue> {
    return entity_->doc().get(id_, key);
}

void MapComponent::remove(std::string_view key) {
    entity_->doc().delete_key(id_, key);
}

auto MapComponent::contains(std::string_view key) const -> bool {
    return get(key).has_value();
}

auto MapComponent::keys() const -> std::vector<std::string> {
    return entity_->doc().keys(id_);
}

auto MapComponent::size() const -> std::size_t {
    return entity_->doc().length(id_);
}

void MapComponent::clear() {
    auto& doc = entity_->doc();
    for (const auto& key : doc.keys(id_)) {
        doc.delete_key(id_, key);
    }
}

CounterComponent::CounterComponent(Entity& entity, ComponentId id)
    : entity_{&entity}, id_{std::move(id)} {}

void CounterComponent::increment(std::int64_t delta) {
    entity_->doc().increment(id_, delta);
}

void CounterComponent::decrement(std::int64_t delta) {
    // Negate without overflow so that decrement(INT64_MIN) wraps like increment
    entity_->doc().increment(id_, static_cast<std::int64_t>(0 - static_cast<std::uint64_t>(delta)));
}

auto CounterComponent::value() const -> std::int64_t {
    return entity_->doc().counter(id_);
}

void CounterComponent::clear() {
    auto current = value();
    if (current != 0) decrement(current);
}

void clear_component(ComponentHandle& handle) {
    std::visit(overload{
        [](MapComponent& map) { map.clear(); },
        [](CounterComponent& counter) { counter.clear(); },
        [](Marker&) {},
    }, handle);
}

}  // namespace leaf_cpp
