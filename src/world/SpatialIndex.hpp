#pragma once

#include "ecs/Registry.hpp"
#include "ecs/Components.hpp"

#include <cstdint>
#include <functional>
#include <unordered_map>
#include <vector>

namespace overworld {

/// Cell coordinate within a specific map
struct CellKey {
    MapId mapId = InvalidMapId;
    int x = 0;
    int y = 0;

    bool operator==(const CellKey& other) const {
        return mapId == other.mapId && x == other.x && y == other.y;
    }
};

struct CellKeyHash {
    size_t operator()(const CellKey& key) const {
        uint64_t packed = (static_cast<uint64_t>(static_cast<uint32_t>(key.x)) << 32) |
                          static_cast<uint32_t>(key.y);
        return std::hash<uint64_t>{}(packed) ^ (std::hash<uint32_t>{}(key.mapId) * 0x9E3779B97F4A7C15ull);
    }
};

/// "What is on this tile" index keyed by (mapId, x, y).
///
/// Entries are added by the map loader (and by gameplay code for spawned
/// entities). Once attached to a registry the index keeps itself
/// consistent: destroying an entity or removing its Position drops the
/// entry, and replacing Position through Registry::set moves it.
class SpatialIndex {
public:
    SpatialIndex() = default;
    ~SpatialIndex();

    SpatialIndex(const SpatialIndex&) = delete;
    SpatialIndex& operator=(const SpatialIndex&) = delete;

    /// Subscribe to Position destroy/update signals. The registry must
    /// outlive the index or be detached first.
    void attach(Registry& registry);
    void detach();
    bool isAttached() const { return m_registry != nullptr; }

    /// Index an entity at a cell. Re-adding an indexed entity moves it.
    void add(Entity entity, MapId mapId, int x, int y);
    void add(Entity entity, const Position& pos) { add(entity, pos.mapId, pos.x, pos.y); }

    /// Drop an entity. Returns false if it was not indexed.
    bool remove(Entity entity);

    /// Move an indexed entity to another cell. Returns false if not indexed.
    bool move(Entity entity, MapId mapId, int x, int y);

    /// Entities at a cell (empty if none). Invalidated by the next mutation.
    const std::vector<Entity>& getEntitiesAt(MapId mapId, int x, int y) const;

    /// Entities inside inclusive tile bounds on a map
    std::vector<Entity> getEntitiesInBounds(MapId mapId, const TileBounds& bounds) const;

    bool contains(Entity entity) const { return m_entityCells.contains(entity); }

    /// Cell of an indexed entity, or nullptr
    const CellKey* cellOf(Entity entity) const;

    /// Drop every entry belonging to a map. Returns the number removed.
    size_t removeMap(MapId mapId);

    void clear();

    size_t entityCount() const { return m_entityCells.size(); }
    size_t occupiedCellCount() const { return m_cells.size(); }
    size_t mapEntityCount(MapId mapId) const;

private:
    void onPositionDestroyed(entt::registry& registry, entt::entity entity);
    void onPositionUpdated(entt::registry& registry, entt::entity entity);

    void eraseFromCell(Entity entity, const CellKey& key);

    std::unordered_map<CellKey, std::vector<Entity>, CellKeyHash> m_cells;
    std::unordered_map<Entity, CellKey> m_entityCells;
    std::unordered_map<MapId, size_t> m_mapCounts;
    Registry* m_registry = nullptr;
};

} // namespace overworld
