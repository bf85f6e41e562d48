#include "world/CollisionService.hpp"
#include "engine/Log.hpp"

namespace overworld {

bool CollisionService::isWalkable(MapId mapId, int x, int y, Direction movingIn) const {
    if (!m_maps.inBounds(mapId, x, y)) {
        ++m_outOfBounds;
        LOG_TRACE("CollisionService: ({}, {}) is outside map {}", x, y, mapId);
        return false;
    }

    for (Entity entity : m_index.getEntitiesAt(mapId, x, y)) {
        const Collision* collision = m_registry.tryGetRef<Collision>(entity);
        if (!collision || !collision->solid) continue;

        const TileLedge* ledge = m_registry.tryGetRef<TileLedge>(entity);
        if (ledge && !ledge->isBlockedFrom(movingIn)) {
            continue;   // Jumping down the ledge
        }
        return false;
    }
    return true;
}

bool CollisionService::isLedge(MapId mapId, int x, int y) const {
    return getLedgeJumpDirection(mapId, x, y) != Direction::None;
}

Direction CollisionService::getLedgeJumpDirection(MapId mapId, int x, int y) const {
    for (Entity entity : m_index.getEntitiesAt(mapId, x, y)) {
        if (const TileLedge* ledge = m_registry.tryGetRef<TileLedge>(entity)) {
            return ledge->jumpDirection;
        }
    }
    return Direction::None;
}

} // namespace overworld
