#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace overworld {

// Tiled stores flip state in the top bits of every global tile id
constexpr uint32_t FLIPPED_HORIZONTALLY_FLAG = 0x80000000u;
constexpr uint32_t FLIPPED_VERTICALLY_FLAG   = 0x40000000u;
constexpr uint32_t FLIPPED_DIAGONALLY_FLAG   = 0x20000000u;
constexpr uint32_t ROTATED_HEXAGONAL_FLAG    = 0x10000000u;
constexpr uint32_t GID_MASK = ~(FLIPPED_HORIZONTALLY_FLAG | FLIPPED_VERTICALLY_FLAG |
                                FLIPPED_DIAGONALLY_FLAG | ROTATED_HEXAGONAL_FLAG);

/// A raw gid split into its id and flip flags
struct DecodedGid {
    uint32_t gid = 0;
    bool flipHorizontal = false;
    bool flipVertical = false;
    bool flipDiagonal = false;
};

DecodedGid decodeGid(uint32_t rawGid);

/// Custom properties keyed by name. Values keep their JSON type
/// (string, int, float, bool, color, file).
using PropertyMap = std::map<std::string, nlohmann::json>;

std::string propertyString(const PropertyMap& props, const std::string& key,
                           const std::string& defaultVal = "");
int propertyInt(const PropertyMap& props, const std::string& key, int defaultVal = 0);
bool propertyBool(const PropertyMap& props, const std::string& key, bool defaultVal = false);

/// Property value rendered as text (strings unquoted)
std::string propertyToText(const nlohmann::json& value);

struct TileAnimationFrame {
    uint32_t localId = 0;
    int durationMs = 100;
};

/// Per-tile metadata inside a tileset
struct TileDefinition {
    uint32_t id = 0;                            // Local id
    std::string type;
    std::vector<TileAnimationFrame> animation;  // Empty if not animated
    PropertyMap properties;
};

struct TilesetDefinition {
    std::string name;
    int tileWidth = 0;
    int tileHeight = 0;
    int columns = 0;
    uint32_t tileCount = 0;
    int spacing = 0;
    int margin = 0;
    std::string image;
    int imageWidth = 0;
    int imageHeight = 0;
    std::map<uint32_t, TileDefinition> tiles;   // Only tiles with metadata

    const TileDefinition* findTile(uint32_t localId) const {
        auto it = tiles.find(localId);
        return it != tiles.end() ? &it->second : nullptr;
    }
};

/// A map's reference to a tileset: inline definition or external file
struct TilesetReference {
    uint32_t firstGid = 0;
    std::string source;                                 // External file, empty if inline
    std::optional<TilesetDefinition> definition;        // Set for inline tilesets
};

struct TileChunk {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
    std::vector<uint32_t> data;
};

struct TileLayerData {
    int id = 0;
    std::string name;
    int order = 0;                      // Position among tile layers, bottom first
    int width = 0;
    int height = 0;
    bool visible = true;
    float opacity = 1.0f;
    std::vector<uint32_t> data;         // Dense, row-major raw gids
    std::vector<TileChunk> chunks;      // Sparse (infinite maps)
    PropertyMap properties;
};

struct MapObject {
    uint32_t id = 0;
    std::string name;
    std::string type;                   // Tiled "type" or "class"
    std::string templatePath;
    float x = 0.0f;                     // Pixels
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
    uint32_t gid = 0;                   // Tile objects only
    bool visible = true;
    PropertyMap properties;
};

struct ObjectLayerData {
    int id = 0;
    std::string name;
    bool visible = true;
    std::vector<MapObject> objects;
    PropertyMap properties;
};

/// In-memory form of a Tiled JSON map. Holds raw gids; nothing resolved.
struct MapDocument {
    std::string sourcePath;             // Empty when parsed from a string
    std::string orientation = "orthogonal";
    int width = 0;
    int height = 0;
    int tileWidth = 0;
    int tileHeight = 0;
    bool infinite = false;
    std::vector<TilesetReference> tilesets;
    std::vector<TileLayerData> tileLayers;
    std::vector<ObjectLayerData> objectLayers;
    PropertyMap properties;

    /// Directory of sourcePath, used to resolve relative tileset/template paths
    std::string baseDirectory() const;

    /// Number of non-empty tile placements across all tile layers
    size_t countPlacements() const;
};

} // namespace overworld
