#include "map/MapRegistry.hpp"

#include <algorithm>

namespace overworld {

MapId MapRegistry::getOrAssignId(const std::string& mapName) {
    auto it = m_idsByName.find(mapName);
    if (it != m_idsByName.end()) {
        return it->second;
    }
    MapId id = m_nextId++;
    m_idsByName.emplace(mapName, id);
    m_namesById.emplace(id, mapName);
    return id;
}

std::optional<MapId> MapRegistry::findId(const std::string& mapName) const {
    auto it = m_idsByName.find(mapName);
    if (it == m_idsByName.end()) {
        return std::nullopt;
    }
    return it->second;
}

const std::string* MapRegistry::findName(MapId mapId) const {
    auto it = m_namesById.find(mapId);
    return it != m_namesById.end() ? &it->second : nullptr;
}

void MapRegistry::recordLoaded(LoadedMap map) {
    MapId id = map.handle.mapId;
    m_loaded[id] = std::move(map);
}

std::optional<LoadedMap> MapRegistry::release(MapId mapId) {
    auto it = m_loaded.find(mapId);
    if (it == m_loaded.end()) {
        return std::nullopt;
    }
    LoadedMap map = std::move(it->second);
    m_loaded.erase(it);
    return map;
}

const LoadedMap* MapRegistry::find(MapId mapId) const {
    auto it = m_loaded.find(mapId);
    return it != m_loaded.end() ? &it->second : nullptr;
}

std::optional<TileBounds> MapRegistry::bounds(MapId mapId) const {
    const LoadedMap* map = find(mapId);
    if (!map) {
        return std::nullopt;
    }
    return TileBounds(0, 0, map->info.width - 1, map->info.height - 1);
}

bool MapRegistry::inBounds(MapId mapId, int x, int y) const {
    const LoadedMap* map = find(mapId);
    return map && map->info.inBounds(x, y);
}

std::vector<MapId> MapRegistry::loadedMaps() const {
    std::vector<MapId> ids;
    ids.reserve(m_loaded.size());
    for (const auto& [id, map] : m_loaded) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace overworld
