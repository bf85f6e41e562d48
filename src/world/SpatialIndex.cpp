#include "world/SpatialIndex.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <cstdint>

namespace overworld {

SpatialIndex::~SpatialIndex() {
    detach();
}

void SpatialIndex::attach(Registry& registry) {
    if (m_registry == &registry) return;
    detach();

    m_registry = &registry;
    auto& raw = registry.raw();
    raw.on_destroy<Position>().connect<&SpatialIndex::onPositionDestroyed>(*this);
    raw.on_update<Position>().connect<&SpatialIndex::onPositionUpdated>(*this);
}

void SpatialIndex::detach() {
    if (!m_registry) return;

    auto& raw = m_registry->raw();
    raw.on_destroy<Position>().disconnect<&SpatialIndex::onPositionDestroyed>(*this);
    raw.on_update<Position>().disconnect<&SpatialIndex::onPositionUpdated>(*this);
    m_registry = nullptr;
}

void SpatialIndex::add(Entity entity, MapId mapId, int x, int y) {
    if (contains(entity)) {
        move(entity, mapId, x, y);
        return;
    }
    CellKey key{mapId, x, y};
    m_cells[key].push_back(entity);
    m_entityCells.emplace(entity, key);
    ++m_mapCounts[mapId];
}

bool SpatialIndex::remove(Entity entity) {
    auto it = m_entityCells.find(entity);
    if (it == m_entityCells.end()) {
        return false;
    }
    CellKey key = it->second;
    m_entityCells.erase(it);
    eraseFromCell(entity, key);

    auto countIt = m_mapCounts.find(key.mapId);
    if (countIt != m_mapCounts.end() && --countIt->second == 0) {
        m_mapCounts.erase(countIt);
    }
    return true;
}

bool SpatialIndex::move(Entity entity, MapId mapId, int x, int y) {
    auto it = m_entityCells.find(entity);
    if (it == m_entityCells.end()) {
        return false;
    }

    CellKey to{mapId, x, y};
    CellKey from = it->second;
    if (from == to) {
        return true;
    }

    eraseFromCell(entity, from);
    m_cells[to].push_back(entity);
    it->second = to;

    if (from.mapId != mapId) {
        auto countIt = m_mapCounts.find(from.mapId);
        if (countIt != m_mapCounts.end() && --countIt->second == 0) {
            m_mapCounts.erase(countIt);
        }
        ++m_mapCounts[mapId];
    }
    return true;
}

void SpatialIndex::eraseFromCell(Entity entity, const CellKey& key) {
    auto cellIt = m_cells.find(key);
    if (cellIt == m_cells.end()) return;

    auto& entities = cellIt->second;
    auto pos = std::find(entities.begin(), entities.end(), entity);
    if (pos != entities.end()) {
        // Order within a cell is not meaningful
        *pos = entities.back();
        entities.pop_back();
    }
    if (entities.empty()) {
        m_cells.erase(cellIt);
    }
}

const std::vector<Entity>& SpatialIndex::getEntitiesAt(MapId mapId, int x, int y) const {
    static const std::vector<Entity> empty;
    auto it = m_cells.find(CellKey{mapId, x, y});
    return it != m_cells.end() ? it->second : empty;
}

std::vector<Entity> SpatialIndex::getEntitiesInBounds(MapId mapId, const TileBounds& bounds) const {
    std::vector<Entity> results;
    if (bounds.empty()) {
        return results;
    }

    // Extents in 64 bits: a rectangle may span the whole int range
    const int64_t width = int64_t{bounds.maxX} - bounds.minX + 1;
    const int64_t height = int64_t{bounds.maxY} - bounds.minY + 1;
    const auto cells = static_cast<int64_t>(m_cells.size());

    if (height <= cells && width <= cells / height) {
        for (int64_t y = bounds.minY; y <= bounds.maxY; ++y) {
            for (int64_t x = bounds.minX; x <= bounds.maxX; ++x) {
                auto it = m_cells.find(CellKey{mapId, static_cast<int>(x), static_cast<int>(y)});
                if (it != m_cells.end()) {
                    results.insert(results.end(), it->second.begin(), it->second.end());
                }
            }
        }
    } else {
        // Sparse index: walking occupied cells is cheaper than the rectangle
        for (const auto& [key, entities] : m_cells) {
            if (key.mapId == mapId && bounds.contains(key.x, key.y)) {
                results.insert(results.end(), entities.begin(), entities.end());
            }
        }
    }
    return results;
}

const CellKey* SpatialIndex::cellOf(Entity entity) const {
    auto it = m_entityCells.find(entity);
    return it != m_entityCells.end() ? &it->second : nullptr;
}

size_t SpatialIndex::removeMap(MapId mapId) {
    size_t removed = 0;
    for (auto it = m_cells.begin(); it != m_cells.end();) {
        if (it->first.mapId == mapId) {
            for (Entity entity : it->second) {
                m_entityCells.erase(entity);
                ++removed;
            }
            it = m_cells.erase(it);
        } else {
            ++it;
        }
    }
    m_mapCounts.erase(mapId);

    if (removed > 0) {
        LOG_DEBUG("SpatialIndex: removed {} entries for map {}", removed, mapId);
    }
    return removed;
}

void SpatialIndex::clear() {
    m_cells.clear();
    m_entityCells.clear();
    m_mapCounts.clear();
}

size_t SpatialIndex::mapEntityCount(MapId mapId) const {
    auto it = m_mapCounts.find(mapId);
    return it != m_mapCounts.end() ? it->second : 0;
}

void SpatialIndex::onPositionDestroyed(entt::registry& /*registry*/, entt::entity entity) {
    remove(entity);
}

void SpatialIndex::onPositionUpdated(entt::registry& registry, entt::entity entity) {
    if (!contains(entity)) return;
    const Position& pos = registry.get<Position>(entity);
    move(entity, pos.mapId, pos.x, pos.y);
}

} // namespace overworld
