#include "map/AnimatedTileLookup.hpp"
#include "ecs/Components.hpp"

namespace overworld {

void AnimatedTileLookup::build(const Registry& registry, const std::vector<Entity>& tiles) {
    clear();
    m_byGid.reserve(tiles.size() / 4 + 1);

    for (Entity entity : tiles) {
        ++m_tilesScanned;
        const TileSprite* sprite = registry.tryGetRef<TileSprite>(entity);
        if (!sprite) continue;
        m_byGid[sprite->gid].push_back(entity);
    }
}

const std::vector<Entity>* AnimatedTileLookup::find(uint32_t gid) const {
    ++m_lookups;
    auto it = m_byGid.find(gid);
    return it != m_byGid.end() ? &it->second : nullptr;
}

void AnimatedTileLookup::clear() {
    m_byGid.clear();
    m_tilesScanned = 0;
    m_lookups = 0;
}

} // namespace overworld
