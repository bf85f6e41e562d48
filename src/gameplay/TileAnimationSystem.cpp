#include "gameplay/TileAnimationSystem.hpp"
#include "engine/Log.hpp"

#include <functional>

namespace overworld {

size_t TileAnimationSystem::RectKeyHash::operator()(const RectKey& key) const {
    size_t h = std::hash<uint32_t>{}(key.gid);
    auto mix = [&h](int value) {
        h ^= std::hash<int>{}(value) + 0x9E3779B9u + (h << 6) + (h >> 2);
    };
    mix(static_cast<int>(key.geometry.firstGid));
    mix(key.geometry.tileWidth);
    mix(key.geometry.tileHeight);
    mix(key.geometry.tilesPerRow);
    mix(key.geometry.spacing);
    mix(key.geometry.margin);
    return h;
}

void TileAnimationSystem::update(float dt) {
    getRegistry().query<AnimatedTile>([this, dt](Entity, AnimatedTile& tile) {
        advance(tile, dt);
    });
}

bool TileAnimationSystem::advance(AnimatedTile& tile, float dt) {
    if (tile.frameGids.empty() || tile.frameDurations.size() != tile.frameGids.size()) {
        if (m_inconsistentTiles.insert(tile.baseGid).second) {
            LOG_WARN("Animated tile {} has inconsistent frame data, not animating", tile.baseGid);
        }
        return false;
    }
    if (tile.currentFrameIndex >= tile.frameGids.size()) {
        tile.currentFrameIndex = 0;
    }

    tile.frameTimer += dt;
    if (tile.frameTimer < tile.frameDurations[tile.currentFrameIndex]) {
        return false;
    }

    tile.currentFrameIndex = (tile.currentFrameIndex + 1) % tile.frameGids.size();
    tile.frameTimer = 0.0f;

    uint32_t gid = tile.frameGids[tile.currentFrameIndex];
    if (gid < tile.geometry.firstGid) {
        if (m_badFrameTiles.insert(tile.baseGid).second) {
            LOG_WARN("Animated tile {} frame gid {} is below its tileset's first gid {}",
                     tile.baseGid, gid, tile.geometry.firstGid);
        }
        return false;
    }
    tile.currentGid = gid;
    tile.sourceRect = sourceRectFor(tile.geometry, gid);
    ++m_frameChanges;
    return true;
}

const Rect& TileAnimationSystem::sourceRectFor(const TilesetGeometry& geometry, uint32_t gid) {
    RectKey key{geometry, gid};
    auto it = m_rectCache.find(key);
    if (it == m_rectCache.end()) {
        it = m_rectCache.emplace(key, geometry.sourceRectFor(gid - geometry.firstGid)).first;
    }
    return it->second;
}

} // namespace overworld
