#pragma once

#include "engine/Geometry.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace overworld {

/// Stable identifier of a loaded map (assigned by MapRegistry, 0 = none)
using MapId = uint32_t;
constexpr MapId InvalidMapId = 0;

/// Cardinal direction. None means "no direction" (e.g. no ledge restriction).
enum class Direction : uint8_t {
    None  = 0,
    South = 1,
    West  = 2,
    North = 3,
    East  = 4
};

inline const char* directionName(Direction dir) {
    switch (dir) {
        case Direction::South: return "south";
        case Direction::West:  return "west";
        case Direction::North: return "north";
        case Direction::East:  return "east";
        case Direction::None:  break;
    }
    return "none";
}

/// Parse "south"/"down", "north"/"up", "west"/"left", "east"/"right".
inline Direction parseDirection(const std::string& text) {
    if (text == "south" || text == "down")  return Direction::South;
    if (text == "north" || text == "up")    return Direction::North;
    if (text == "west"  || text == "left")  return Direction::West;
    if (text == "east"  || text == "right") return Direction::East;
    return Direction::None;
}

inline Direction opposite(Direction dir) {
    switch (dir) {
        case Direction::South: return Direction::North;
        case Direction::North: return Direction::South;
        case Direction::West:  return Direction::East;
        case Direction::East:  return Direction::West;
        case Direction::None:  break;
    }
    return Direction::None;
}

/// Tile offset of one step in a direction
inline void directionDelta(Direction dir, int& dx, int& dy) {
    dx = 0;
    dy = 0;
    switch (dir) {
        case Direction::South: dy = 1;  break;
        case Direction::North: dy = -1; break;
        case Direction::West:  dx = -1; break;
        case Direction::East:  dx = 1;  break;
        case Direction::None:  break;
    }
}

/// Grid position on a map. The pixel offset is the visual displacement
/// while an entity is between tiles; it is zero at rest.
struct Position {
    int x = 0;
    int y = 0;
    MapId mapId = InvalidMapId;
    Vec2 pixelOffset{0.0f, 0.0f};

    Position() = default;
    Position(int tileX, int tileY, MapId map = InvalidMapId)
        : x(tileX), y(tileY), mapId(map) {}

    bool sameTile(const Position& other) const {
        return x == other.x && y == other.y && mapId == other.mapId;
    }
};

/// Pixel layout of a tileset image. Shared by the loader and the tile
/// animation system to compute source rectangles.
struct TilesetGeometry {
    uint32_t firstGid = 1;
    int tileWidth = 16;
    int tileHeight = 16;
    int tilesPerRow = 1;
    int spacing = 0;
    int margin = 0;

    Rect sourceRectFor(uint32_t localId) const {
        int columns = tilesPerRow > 0 ? tilesPerRow : 1;
        int col = static_cast<int>(localId) % columns;
        int row = static_cast<int>(localId) / columns;
        int sp = spacing > 0 ? spacing : 0;
        int mg = margin > 0 ? margin : 0;
        return Rect(
            static_cast<float>(mg + col * (tileWidth + sp)),
            static_cast<float>(mg + row * (tileHeight + sp)),
            static_cast<float>(tileWidth),
            static_cast<float>(tileHeight)
        );
    }

    bool operator==(const TilesetGeometry& other) const {
        return firstGid == other.firstGid && tileWidth == other.tileWidth &&
               tileHeight == other.tileHeight && tilesPerRow == other.tilesPerRow &&
               spacing == other.spacing && margin == other.margin;
    }
};

/// Static tile graphic. Never mutated after the loader creates it; animated
/// tiles carry their changing frame in AnimatedTile.
struct TileSprite {
    std::string tilesetId;
    uint32_t gid = 0;           // Global tile id, flip bits stripped
    uint32_t localId = 0;       // gid - tileset firstGid
    int layer = 0;              // Index of the tile layer in document order
    bool flipHorizontal = false;
    bool flipVertical = false;
    bool flipDiagonal = false;
    Rect sourceRect;
};

/// Tileset-driven tile animation. Frame gids are global ids; durations are
/// seconds per frame.
struct AnimatedTile {
    uint32_t baseGid = 0;
    std::vector<uint32_t> frameGids;
    std::vector<float> frameDurations;
    TilesetGeometry geometry;

    size_t currentFrameIndex = 0;
    float frameTimer = 0.0f;
    uint32_t currentGid = 0;
    Rect sourceRect;
};

/// Per-map metadata, attached to the map's root entity
struct MapInfo {
    MapId mapId = InvalidMapId;
    std::string name;
    int width = 0;              // Tiles
    int height = 0;             // Tiles
    int tileSize = 16;          // Pixels

    MapInfo() = default;
    MapInfo(MapId id, std::string mapName, int w, int h, int tile = 16)
        : mapId(id), name(std::move(mapName)), width(w), height(h), tileSize(tile) {}

    int pixelWidth() const { return width * tileSize; }
    int pixelHeight() const { return height * tileSize; }

    bool inBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < width && y < height;
    }
};

/// One per tileset used by a map
struct TilesetInfo {
    std::string tilesetId;
    MapId mapId = InvalidMapId;
    TilesetGeometry geometry;
    uint32_t tileCount = 0;
    std::string imagePath;
    int imageWidth = 0;
    int imageHeight = 0;
    uint32_t textureHandle = 0;     // 0 when no texture loader is installed
};

/// Blocks movement into the cell when solid
struct Collision {
    bool solid = true;
};

/// One-way ledge: can only be entered while moving in jumpDirection
struct TileLedge {
    Direction jumpDirection = Direction::South;

    /// A ledge blocks every approach except the jump direction
    bool isBlockedFrom(Direction movingIn) const {
        return movingIn != jumpDirection;
    }
};

/// Wild-encounter cell
struct EncounterZone {
    std::string encounterTable;
    int encounterRate = 0;      // Out of 255
};

/// Terrain kind for footsteps and surfing checks
struct TerrainType {
    std::string type;
    std::string footstepSound;
};

struct Name {
    std::string value;
};

/// Free-form Tiled properties of an object, stringified
struct ObjectProperties {
    uint32_t objectId = 0;
    std::string type;
    std::string templateId;
    std::unordered_map<std::string, std::string> values;

    const std::string* find(const std::string& key) const {
        auto it = values.find(key);
        return it != values.end() ? &it->second : nullptr;
    }
};

/// Non-player character metadata resolved from a template
struct Npc {
    std::string npcId;
    std::string behavior;       // Opaque to the core; read by gameplay code
    Direction facing = Direction::South;
};

/// Marks the controllable entity
struct Player {
    int playerIndex = 0;
};

} // namespace overworld
