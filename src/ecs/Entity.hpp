#pragma once

#include <entt/entt.hpp>

namespace overworld {

/// Entity handle - an EnTT identifier (index + version). Carries no data.
using Entity = entt::entity;

/// Null entity constant
constexpr Entity NullEntity = entt::null;

/// Index part of an entity identifier
inline uint32_t entityIndex(Entity entity) {
    return static_cast<uint32_t>(entt::to_entity(entity));
}

/// Generation (version) part of an entity identifier
inline uint32_t entityGeneration(Entity entity) {
    return static_cast<uint32_t>(entt::to_version(entity));
}

} // namespace overworld
