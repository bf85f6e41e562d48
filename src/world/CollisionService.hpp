#pragma once

#include "ecs/Registry.hpp"
#include "ecs/Components.hpp"
#include "map/MapRegistry.hpp"
#include "world/SpatialIndex.hpp"

namespace overworld {

/// Tile walkability queries over the spatial index.
///
/// A cell outside the map's extents is simply not walkable (out-of-bounds
/// queries never throw). A cell is blocked by any solid Collision entity on
/// it, except a ledge entered in its jump direction.
class CollisionService {
public:
    CollisionService(const Registry& registry, const SpatialIndex& index, const MapRegistry& maps)
        : m_registry(registry), m_index(index), m_maps(maps) {}

    /// Can an entity moving in `movingIn` enter (x, y) on `mapId`?
    bool isWalkable(MapId mapId, int x, int y, Direction movingIn = Direction::None) const;

    /// Does the cell hold a ledge?
    bool isLedge(MapId mapId, int x, int y) const;

    /// Jump direction of the ledge at the cell, None if there is no ledge
    Direction getLedgeJumpDirection(MapId mapId, int x, int y) const;

    size_t outOfBoundsQueries() const { return m_outOfBounds; }

private:
    const Registry& m_registry;
    const SpatialIndex& m_index;
    const MapRegistry& m_maps;
    mutable size_t m_outOfBounds = 0;
};

} // namespace overworld
