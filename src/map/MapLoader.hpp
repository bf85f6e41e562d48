#pragma once

#include "ecs/Registry.hpp"
#include "ecs/QueryCache.hpp"
#include "map/MapDocument.hpp"
#include "map/MapLoadStatus.hpp"
#include "map/MapRegistry.hpp"
#include "map/LoadTransaction.hpp"
#include "map/TemplateRegistry.hpp"
#include "map/TilesetResolver.hpp"
#include "world/SpatialIndex.hpp"

#include <future>
#include <string>
#include <vector>

namespace overworld {

/// Counters collected while instantiating a map
struct MapLoadStats {
    size_t tileEntities = 0;
    size_t objectEntities = 0;
    size_t tilesetEntities = 0;
    size_t animationDefinitions = 0;    // Animated tile ids declared by the tilesets
    size_t animatedTiles = 0;           // AnimatedTile components attached
    size_t lookupTilesScanned = 0;      // Tiles visited while building the gid lookup
    size_t lookupCalls = 0;             // gid lookups made while attaching
    size_t propertyComponents = 0;      // Collision/TileLedge/EncounterZone/TerrainType added
    size_t unknownTemplates = 0;
    size_t indexedEntities = 0;
    double instantiateMs = 0.0;
};

struct MapLoadResult {
    MapLoadStatus status = MapLoadStatus::Success;
    std::string message;
    MapHandle handle;
    MapLoadStats stats;

    bool ok() const { return status == MapLoadStatus::Success; }
};

/// One non-empty cell of a tile layer
struct TilePlacement {
    int x = 0;
    int y = 0;
    uint32_t gid = 0;               // Flip bits stripped
    uint32_t tilesetIndex = 0;      // Into PreparedMap::tilesets
    int layer = 0;
    bool flipHorizontal = false;
    bool flipVertical = false;
    bool flipDiagonal = false;
};

/// Everything needed to instantiate a map, produced without touching any
/// registry. Safe to build on a worker thread.
struct PreparedMap {
    MapLoadStatus status = MapLoadStatus::Success;
    std::string message;
    std::string mapName;
    MapDocument document;
    std::vector<ResolvedTileset> tilesets;
    std::vector<TilePlacement> placements;

    bool ok() const { return status == MapLoadStatus::Success; }
};

/// Turns Tiled maps into entities.
///
/// Loading is split in two: prepare*() does file I/O, tileset resolution and
/// validation; instantiate() does every world mutation and must run on the
/// thread that owns the registry. A failed or cancelled instantiate leaves
/// the registry and the spatial index exactly as they were.
class MapLoader {
public:
    MapLoader(MapRegistry& maps, SpatialIndex& index, QueryCache& queries)
        : m_maps(maps), m_index(index), m_queries(queries) {}

    /// Object templates. Without a resolver, objects spawn with their
    /// Position, Name and ObjectProperties only.
    void setTemplateResolver(const ITemplateResolver* resolver) { m_templates = resolver; }

    /// Texture collaborator. With prepareMapAsync() it is called from the
    /// worker thread.
    void setTextureLoader(ITextureLoader* textures) { m_textures = textures; }

    /// Validate a parsed document and resolve its tilesets
    PreparedMap prepare(MapDocument document, const std::string& mapName,
                        const CancellationToken* cancel = nullptr) const;

    /// Read, parse and validate a map file. The map name is the file stem.
    PreparedMap prepareMap(const std::string& path, const CancellationToken* cancel = nullptr) const;

    /// prepareMap() on a worker thread. The token must outlive the future.
    std::future<PreparedMap> prepareMapAsync(const std::string& path,
                                             const CancellationToken* cancel = nullptr) const;

    /// Create every entity of a prepared map, all or nothing
    MapLoadResult instantiate(Registry& registry, const PreparedMap& prepared,
                              const CancellationToken* cancel = nullptr);

    /// prepare() + instantiate()
    MapLoadResult loadMap(Registry& registry, const MapDocument& document,
                          const std::string& mapName, const CancellationToken* cancel = nullptr);

    /// prepareMap() + instantiate()
    MapLoadResult loadMapFile(Registry& registry, const std::string& path,
                              const CancellationToken* cancel = nullptr);

    /// Destroy a loaded map's entities and purge its index entries. Entities
    /// spawned onto the map after loading go with it, except players.
    /// Returns false if the handle does not name a loaded map.
    bool unloadMap(Registry& registry, const MapHandle& handle);

    const std::string& getLastError() const { return m_lastError; }

private:
    MapLoadResult fail(MapLoadResult& result, MapLoadStatus status, std::string message);

    static bool collectPlacements(PreparedMap& prepared);

    void attachTileProperties(Registry& registry, const PreparedMap& prepared,
                              const std::vector<Entity>& tiles, MapLoadStats& stats) const;
    void attachAnimatedTiles(Registry& registry, const PreparedMap& prepared,
                             const std::vector<Entity>& tiles, MapLoadStats& stats) const;
    void spawnObjects(Registry& registry, const PreparedMap& prepared, MapId mapId,
                      LoadTransaction& txn, MapLoadStats& stats) const;

    MapRegistry& m_maps;
    SpatialIndex& m_index;
    QueryCache& m_queries;
    const ITemplateResolver* m_templates = nullptr;
    ITextureLoader* m_textures = nullptr;
    std::string m_lastError;
};

} // namespace overworld
