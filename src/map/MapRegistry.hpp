#pragma once

#include "ecs/Registry.hpp"
#include "ecs/Components.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace overworld {

/// Identifies a loaded map: its id and its MapInfo root entity
struct MapHandle {
    MapId mapId = InvalidMapId;
    Entity root = NullEntity;

    bool valid() const { return mapId != InvalidMapId && root != NullEntity; }
};

/// Book-keeping for one loaded map
struct LoadedMap {
    MapHandle handle;
    MapInfo info;
    std::vector<Entity> entities;       // Everything the load created, root included
};

/// Assigns stable map ids by name and tracks which maps are loaded.
/// A name keeps its id across unload/reload for the process lifetime.
class MapRegistry {
public:
    /// Id for a map name, assigning the next free one on first sight
    MapId getOrAssignId(const std::string& mapName);

    /// Id for a known name, or nullopt
    std::optional<MapId> findId(const std::string& mapName) const;

    /// Name for an assigned id, or nullptr
    const std::string* findName(MapId mapId) const;

    bool isLoaded(MapId mapId) const { return m_loaded.contains(mapId); }

    void recordLoaded(LoadedMap map);

    /// Forget a loaded map and hand back its record
    std::optional<LoadedMap> release(MapId mapId);

    const LoadedMap* find(MapId mapId) const;

    /// Map extents in tiles, or nullopt if the map is not loaded
    std::optional<TileBounds> bounds(MapId mapId) const;

    bool inBounds(MapId mapId, int x, int y) const;

    std::vector<MapId> loadedMaps() const;
    size_t loadedCount() const { return m_loaded.size(); }

private:
    std::unordered_map<std::string, MapId> m_idsByName;
    std::unordered_map<MapId, std::string> m_namesById;
    std::unordered_map<MapId, LoadedMap> m_loaded;
    MapId m_nextId = 1;
};

} // namespace overworld
