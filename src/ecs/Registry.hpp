#pragma once

#include "ecs/Entity.hpp"
#include "ecs/EcsErrors.hpp"
#include "ecs/Query.hpp"

#include <entt/entt.hpp>

#include <optional>
#include <vector>
#include <functional>
#include <string>
#include <type_traits>

namespace overworld {

/// Component store built on an EnTT registry.
///
/// Access modes:
///  - get<T>() returns a COPY. Changes to the copy are lost unless written
///    back with set<T>(). This is intentional: value reads are safe to hold
///    across structural changes.
///  - getRef<T>() / query() hand out references into storage. Writes land
///    directly; the reference is only valid until the next structural change
///    (create/destroy/add/remove) of that component type.
///  - modify<T>() wraps read-mutate-write in a single call.
class Registry {
public:
    Registry() = default;
    ~Registry() = default;

    // Non-copyable, movable
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;
    Registry(Registry&&) = default;
    Registry& operator=(Registry&&) = default;

    /// Create a new entity
    Entity create() {
        return m_registry.create();
    }

    /// Create a new entity with given components
    template<typename... Components>
    Entity create(Components&&... components) {
        Entity entity = m_registry.create();
        (m_registry.emplace<std::decay_t<Components>>(entity, std::forward<Components>(components)), ...);
        return entity;
    }

    /// Destroy an entity. Destruction signals fire for each of its components.
    void destroy(Entity entity) {
        if (valid(entity)) {
            m_registry.destroy(entity);
        }
    }

    /// Destroy a batch of entities, skipping any that are already gone.
    /// Returns the number destroyed.
    size_t destroyMany(const std::vector<Entity>& entities) {
        size_t destroyed = 0;
        for (Entity entity : entities) {
            if (valid(entity)) {
                m_registry.destroy(entity);
                ++destroyed;
            }
        }
        return destroyed;
    }

    /// Check if entity is valid
    bool valid(Entity entity) const {
        return m_registry.valid(entity);
    }

    /// Add a component to an entity (must not already have it)
    template<typename Component, typename... Args>
    Component& add(Entity entity, Args&&... args) {
        return m_registry.emplace<Component>(entity, std::forward<Args>(args)...);
    }

    /// Persist a component value: replaces the stored value if present
    /// (firing update signals), otherwise adds it.
    template<typename Component>
    void set(Entity entity, Component value) {
        if (m_registry.all_of<Component>(entity)) {
            m_registry.replace<Component>(entity, std::move(value));
        } else {
            m_registry.emplace<Component>(entity, std::move(value));
        }
    }

    /// Remove a component from an entity
    template<typename Component>
    void remove(Entity entity) {
        if (has<Component>(entity)) {
            m_registry.remove<Component>(entity);
        }
    }

    /// Value copy of a component. Throws ComponentNotFound if absent.
    template<typename Component>
    Component get(Entity entity) const {
        const Component* component = m_registry.try_get<Component>(entity);
        if (!component) {
            throw ComponentNotFound(entity, entt::type_id<Component>().name());
        }
        return *component;
    }

    /// In-place reference to a component. Throws ComponentNotFound if absent.
    template<typename Component>
    Component& getRef(Entity entity) {
        Component* component = m_registry.try_get<Component>(entity);
        if (!component) {
            throw ComponentNotFound(entity, entt::type_id<Component>().name());
        }
        return *component;
    }

    /// Value copy of a component, or nullopt if absent
    template<typename Component>
    std::optional<Component> tryGet(Entity entity) const {
        if (!valid(entity)) return std::nullopt;
        const Component* component = m_registry.try_get<Component>(entity);
        if (!component) return std::nullopt;
        return *component;
    }

    /// Pointer into storage, or nullptr if absent
    template<typename Component>
    Component* tryGetRef(Entity entity) {
        if (!valid(entity)) return nullptr;
        return m_registry.try_get<Component>(entity);
    }

    template<typename Component>
    const Component* tryGetRef(Entity entity) const {
        if (!valid(entity)) return nullptr;
        return m_registry.try_get<Component>(entity);
    }

    /// Read-modify-write in one call. The mutation is applied through
    /// replace(), so update signals fire. Returns false if absent.
    template<typename Component, typename Func>
    bool modify(Entity entity, Func&& mutate) {
        if (!valid(entity) || !m_registry.all_of<Component>(entity)) {
            return false;
        }
        m_registry.patch<Component>(entity, std::forward<Func>(mutate));
        return true;
    }

    /// Check if entity has a component
    template<typename Component>
    bool has(Entity entity) const {
        return valid(entity) && m_registry.all_of<Component>(entity);
    }

    /// Check if entity has all specified components
    template<typename... Components>
    bool hasAll(Entity entity) const {
        return valid(entity) && m_registry.all_of<Components...>(entity);
    }

    /// Check if entity has any of specified components
    template<typename... Components>
    bool hasAny(Entity entity) const {
        return valid(entity) && m_registry.any_of<Components...>(entity);
    }

    /// Iterate entities having all Components, with in-place references.
    /// Callback: (Entity, Components&...)
    template<typename... Components, typename Func>
    void query(Func&& func) {
        m_registry.view<Components...>().each(std::forward<Func>(func));
    }

    /// Iterate entities having all Components and none of Ex.
    template<typename... Components, typename... Ex, typename Func>
    void query(Exclude<Ex...>, Func&& func) {
        m_registry.view<Components...>(entt::exclude<Ex...>).each(std::forward<Func>(func));
    }

    /// Iterate entities matching a runtime description. Callback: (Entity)
    void query(const QueryDescription& description, const std::function<void(Entity)>& func) {
        if (description.includes().empty()) {
            return;
        }
        entt::runtime_view view{};
        for (entt::id_type id : description.includes()) {
            auto* storage = m_registry.storage(id);
            if (!storage) {
                return; // no entity ever had this component
            }
            view.iterate(*storage);
        }
        for (entt::id_type id : description.excludes()) {
            if (auto* storage = m_registry.storage(id)) {
                view.exclude(*storage);
            }
        }
        view.each(func);
    }

    /// Count entities with specific components
    template<typename... Components>
    size_t count() const {
        size_t n = 0;
        for ([[maybe_unused]] auto _ : m_registry.view<Components...>()) {
            ++n;
        }
        return n;
    }

    /// Collect all entities with specified components
    template<typename... Components>
    std::vector<Entity> collect() {
        std::vector<Entity> results;
        for (auto entity : m_registry.view<Components...>()) {
            results.push_back(entity);
        }
        return results;
    }

    /// Alive entity count
    size_t alive() const {
        auto* storage = m_registry.storage<entt::entity>();
        return storage ? storage->free_list() : 0;
    }

    /// Check if registry has no alive entities
    bool empty() const {
        return alive() == 0;
    }

    /// Clear all entities and components (destruction signals fire)
    void clear() {
        m_registry.clear();
    }

    /// Pre-size storage for a component type
    template<typename Component>
    void reserve(size_t additional) {
        auto& storage = m_registry.storage<Component>();
        storage.reserve(storage.size() + additional);
    }

    /// Capacity ceiling on alive entities. 0 means unlimited.
    void setEntityLimit(size_t limit) { m_entityLimit = limit; }
    size_t entityLimit() const { return m_entityLimit; }

    /// How many more entities may be created before the ceiling
    size_t remainingCapacity() const {
        if (m_entityLimit == 0) return static_cast<size_t>(-1);
        size_t used = alive();
        return used >= m_entityLimit ? 0 : m_entityLimit - used;
    }

    /// Get the underlying EnTT registry (signals, range operations)
    entt::registry& raw() { return m_registry; }
    const entt::registry& raw() const { return m_registry; }

private:
    entt::registry m_registry;
    size_t m_entityLimit = 0;
};

} // namespace overworld
