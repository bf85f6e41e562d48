#pragma once

#include "ecs/Systems.hpp"
#include "ecs/Components.hpp"

#include <unordered_map>
#include <unordered_set>

namespace overworld {

/// Advances tileset-driven tile animations (water, flowers, swaying grass).
///
/// Each AnimatedTile shows frameGids[currentFrameIndex] for
/// frameDurations[currentFrameIndex] seconds, then moves to the next frame
/// and wraps. The frame's source rect is written into AnimatedTile; the
/// TileSprite keeps the tile's static graphic.
class TileAnimationSystem : public System {
public:
    TileAnimationSystem() : System("TileAnimationSystem", SystemPriority::TileAnimation) {}

    void update(float dt) override;

    /// Advance one tile. Returns true if the frame changed.
    bool advance(AnimatedTile& tile, float dt);

    /// Source rect for a gid in a tileset layout, computed once per layout
    const Rect& sourceRectFor(const TilesetGeometry& geometry, uint32_t gid);

    size_t cachedRects() const { return m_rectCache.size(); }
    size_t frameChanges() const { return m_frameChanges; }

private:
    struct RectKey {
        TilesetGeometry geometry;
        uint32_t gid = 0;

        bool operator==(const RectKey& other) const {
            return gid == other.gid && geometry == other.geometry;
        }
    };

    struct RectKeyHash {
        size_t operator()(const RectKey& key) const;
    };

    std::unordered_map<RectKey, Rect, RectKeyHash> m_rectCache;
    size_t m_frameChanges = 0;
    // Base gids already reported, so broken tiles warn once without per-frame strings
    std::unordered_set<uint32_t> m_inconsistentTiles;
    std::unordered_set<uint32_t> m_badFrameTiles;
};

} // namespace overworld
