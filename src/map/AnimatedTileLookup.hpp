#pragma once

#include "ecs/Registry.hpp"

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace overworld {

/// Load-time index from global tile id to the tile entities that use it.
///
/// Built in one pass over freshly created tiles, then each tileset animation
/// resolves its tiles with a single hash lookup, which keeps attachment at
/// O(tiles + animations). Discard it once attachment is done.
class AnimatedTileLookup {
public:
    /// Index `tiles` by their TileSprite gid. Each entity is visited once;
    /// entities without TileSprite are skipped.
    void build(const Registry& registry, const std::vector<Entity>& tiles);

    /// Entities using `gid`, or nullptr if none
    const std::vector<Entity>* find(uint32_t gid) const;

    size_t tilesScanned() const { return m_tilesScanned; }
    size_t lookups() const { return m_lookups; }
    size_t distinctGids() const { return m_byGid.size(); }

    void clear();

private:
    std::unordered_map<uint32_t, std::vector<Entity>> m_byGid;
    size_t m_tilesScanned = 0;
    mutable size_t m_lookups = 0;
};

} // namespace overworld
