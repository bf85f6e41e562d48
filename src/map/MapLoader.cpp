#include "map/MapLoader.hpp"
#include "map/MapDocumentParser.hpp"
#include "map/AnimatedTileLookup.hpp"
#include "ecs/BulkOperations.hpp"
#include "engine/Log.hpp"

#include <chrono>
#include <cmath>
#include <filesystem>

namespace overworld {

namespace {

PreparedMap failedPrepare(PreparedMap prepared, MapLoadStatus status, std::string message) {
    LOADER_LOG_ERROR("Map '{}' rejected: {}", prepared.mapName, message);
    prepared.status = status;
    prepared.message = std::move(message);
    prepared.tilesets.clear();
    prepared.placements.clear();
    return prepared;
}

} // namespace

MapLoadResult MapLoader::fail(MapLoadResult& result, MapLoadStatus status, std::string message) {
    result.status = status;
    result.message = std::move(message);
    result.handle = MapHandle{};
    m_lastError = result.message;
    if (status == MapLoadStatus::Cancelled) {
        LOADER_LOG_INFO("Map load cancelled: {}", result.message);
    } else {
        LOADER_LOG_ERROR("Map load failed ({}): {}", mapLoadStatusToString(status), result.message);
    }
    return result;
}

// --- Prepare (no world access) ---

PreparedMap MapLoader::prepare(MapDocument document, const std::string& mapName,
                               const CancellationToken* cancel) const {
    PreparedMap prepared;
    prepared.mapName = mapName;
    prepared.document = std::move(document);

    if (mapName.empty()) {
        return failedPrepare(std::move(prepared), MapLoadStatus::MapDocumentInvalid,
                             "map name is empty");
    }
    if (prepared.document.width <= 0 || prepared.document.height <= 0 ||
        prepared.document.tileWidth <= 0 || prepared.document.tileHeight <= 0) {
        return failedPrepare(std::move(prepared), MapLoadStatus::MapDocumentInvalid,
                             "map dimensions must be positive");
    }
    if (cancelled(cancel)) {
        return failedPrepare(std::move(prepared), MapLoadStatus::Cancelled, "before tileset resolution");
    }

    TilesetResolver resolver(m_textures);
    MapLoadStatus status = resolver.resolve(prepared.document, prepared.tilesets, cancel);
    if (status != MapLoadStatus::Success) {
        return failedPrepare(std::move(prepared), status, resolver.getLastError());
    }

    if (!collectPlacements(prepared)) {
        std::string message = std::move(prepared.message);
        return failedPrepare(std::move(prepared), MapLoadStatus::MapDocumentInvalid, std::move(message));
    }
    if (cancelled(cancel)) {
        return failedPrepare(std::move(prepared), MapLoadStatus::Cancelled, "after validation");
    }

    LOADER_LOG_DEBUG("Prepared map '{}': {}x{}, {} tilesets, {} placements",
                     mapName, prepared.document.width, prepared.document.height,
                     prepared.tilesets.size(), prepared.placements.size());
    return prepared;
}

PreparedMap MapLoader::prepareMap(const std::string& path, const CancellationToken* cancel) const {
    std::string mapName = std::filesystem::path(path).stem().string();

    MapDocument document;
    MapDocumentParser parser;
    MapLoadStatus status = parser.parseFile(path, document);
    if (status != MapLoadStatus::Success) {
        PreparedMap prepared;
        prepared.mapName = mapName;
        return failedPrepare(std::move(prepared), status, parser.getLastError());
    }
    return prepare(std::move(document), mapName, cancel);
}

std::future<PreparedMap> MapLoader::prepareMapAsync(const std::string& path,
                                                    const CancellationToken* cancel) const {
    return std::async(std::launch::async, [this, path, cancel]() {
        return prepareMap(path, cancel);
    });
}

bool MapLoader::collectPlacements(PreparedMap& prepared) {
    const MapDocument& doc = prepared.document;
    prepared.placements.clear();
    prepared.placements.reserve(doc.countPlacements());

    auto place = [&prepared, &doc](const TileLayerData& layer, int x, int y, uint32_t raw) {
        DecodedGid decoded = decodeGid(raw);
        if (decoded.gid == 0) {
            return true;
        }
        const ResolvedTileset* owner = TilesetResolver::findOwner(prepared.tilesets, decoded.gid);
        if (!owner) {
            prepared.message = "tile layer '" + layer.name + "' at (" + std::to_string(x) + ", " +
                               std::to_string(y) + ") references gid " + std::to_string(decoded.gid) +
                               " not declared by any tileset";
            return false;
        }
        if (x < 0 || y < 0 || x >= doc.width || y >= doc.height) {
            prepared.message = "tile layer '" + layer.name + "' places a tile outside the map at (" +
                               std::to_string(x) + ", " + std::to_string(y) + ")";
            return false;
        }

        TilePlacement placement;
        placement.x = x;
        placement.y = y;
        placement.gid = decoded.gid;
        placement.tilesetIndex = static_cast<uint32_t>(owner - prepared.tilesets.data());
        placement.layer = layer.order;
        placement.flipHorizontal = decoded.flipHorizontal;
        placement.flipVertical = decoded.flipVertical;
        placement.flipDiagonal = decoded.flipDiagonal;
        prepared.placements.push_back(placement);
        return true;
    };

    for (const auto& layer : doc.tileLayers) {
        if (layer.width > 0) {
            for (size_t i = 0; i < layer.data.size(); ++i) {
                int x = static_cast<int>(i % static_cast<size_t>(layer.width));
                int y = static_cast<int>(i / static_cast<size_t>(layer.width));
                if (!place(layer, x, y, layer.data[i])) return false;
            }
        }
        for (const auto& chunk : layer.chunks) {
            if (chunk.width <= 0) continue;
            for (size_t i = 0; i < chunk.data.size(); ++i) {
                int x = chunk.x + static_cast<int>(i % static_cast<size_t>(chunk.width));
                int y = chunk.y + static_cast<int>(i / static_cast<size_t>(chunk.width));
                if (!place(layer, x, y, chunk.data[i])) return false;
            }
        }
    }

    for (const auto& layer : doc.objectLayers) {
        for (const auto& object : layer.objects) {
            if (object.gid == 0) continue;
            uint32_t gid = decodeGid(object.gid).gid;
            if (!TilesetResolver::findOwner(prepared.tilesets, gid)) {
                prepared.message = "object " + std::to_string(object.id) + " in layer '" + layer.name +
                                   "' references gid " + std::to_string(gid) +
                                   " not declared by any tileset";
                return false;
            }
        }
    }
    return true;
}

// --- Instantiate (world thread) ---

MapLoadResult MapLoader::instantiate(Registry& registry, const PreparedMap& prepared,
                                     const CancellationToken* cancel) {
    auto startTime = std::chrono::steady_clock::now();
    MapLoadResult result;
    m_lastError.clear();

    if (!prepared.ok()) {
        return fail(result, prepared.status, prepared.message);
    }
    if (cancelled(cancel)) {
        return fail(result, MapLoadStatus::Cancelled, "before instantiation of '" + prepared.mapName + "'");
    }

    const MapDocument& doc = prepared.document;
    if (auto existing = m_maps.findId(prepared.mapName); existing && m_maps.isLoaded(*existing)) {
        return fail(result, MapLoadStatus::MapDocumentInvalid,
                    "map '" + prepared.mapName + "' is already loaded");
    }

    size_t objectCount = 0;
    for (const auto& layer : doc.objectLayers) {
        objectCount += layer.objects.size();
    }
    size_t needed = prepared.placements.size() + objectCount + prepared.tilesets.size() + 1;
    size_t remaining = registry.remainingCapacity();
    if (needed > remaining) {
        return fail(result, MapLoadStatus::BulkCreateFailed,
                    "map '" + prepared.mapName + "' needs " + std::to_string(needed) +
                    " entities, only " + std::to_string(remaining) + " available");
    }

    MapId mapId = m_maps.getOrAssignId(prepared.mapName);
    LoadTransaction txn(registry);

    // Index entries must go with the entities even when the index is not
    // attached to this registry's signals
    auto abort = [&](MapLoadStatus status, std::string message) {
        for (Entity entity : txn.entities()) {
            m_index.remove(entity);
        }
        txn.rollback();
        return fail(result, status, std::move(message));
    };

    // Step 2: every tile in one bulk call
    const auto& placements = prepared.placements;
    const auto& tilesets = prepared.tilesets;
    BulkCreateResult tiles = createMany<Position, TileSprite>(registry, placements.size(),
        [&](size_t i) -> BulkRow<Position, TileSprite> {
            const TilePlacement& p = placements[i];
            const ResolvedTileset& tileset = tilesets[p.tilesetIndex];
            uint32_t localId = p.gid - tileset.firstGid();

            TileSprite sprite;
            sprite.tilesetId = tileset.tilesetId;
            sprite.gid = p.gid;
            sprite.localId = localId;
            sprite.layer = p.layer;
            sprite.flipHorizontal = p.flipHorizontal;
            sprite.flipVertical = p.flipVertical;
            sprite.flipDiagonal = p.flipDiagonal;
            sprite.sourceRect = tileset.geometry.sourceRectFor(localId);
            return std::make_tuple(Position(p.x, p.y, mapId), std::move(sprite));
        });
    if (!tiles.ok()) {
        return abort(MapLoadStatus::BulkCreateFailed,
                     tiles.message + " (" + std::to_string(tiles.wouldHaveSucceeded) + " of " +
                     std::to_string(tiles.requested) + " tiles)");
    }
    txn.track(tiles.entities);
    result.stats.tileEntities = tiles.entities.size();

    attachTileProperties(registry, prepared, tiles.entities, result.stats);
    if (cancelled(cancel)) {
        return abort(MapLoadStatus::Cancelled, "after creating tiles of '" + prepared.mapName + "'");
    }

    // Step 3
    attachAnimatedTiles(registry, prepared, tiles.entities, result.stats);
    if (cancelled(cancel)) {
        return abort(MapLoadStatus::Cancelled, "after animating tiles of '" + prepared.mapName + "'");
    }

    // Step 4
    spawnObjects(registry, prepared, mapId, txn, result.stats);
    if (cancelled(cancel)) {
        return abort(MapLoadStatus::Cancelled, "after spawning objects of '" + prepared.mapName + "'");
    }

    // Step 5
    for (Entity entity : txn.entities()) {
        if (const Position* pos = registry.tryGetRef<Position>(entity)) {
            m_index.add(entity, *pos);
            ++result.stats.indexedEntities;
        }
    }
    if (cancelled(cancel)) {
        return abort(MapLoadStatus::Cancelled, "after indexing '" + prepared.mapName + "'");
    }

    // Step 6
    MapInfo info(mapId, prepared.mapName, doc.width, doc.height, doc.tileWidth);
    Entity root = registry.create(info, Name{prepared.mapName});
    txn.track(root);

    for (const auto& tileset : tilesets) {
        TilesetInfo tilesetInfo;
        tilesetInfo.tilesetId = tileset.tilesetId;
        tilesetInfo.mapId = mapId;
        tilesetInfo.geometry = tileset.geometry;
        tilesetInfo.tileCount = tileset.tileCount;
        tilesetInfo.imagePath = tileset.definition.image;
        tilesetInfo.imageWidth = tileset.definition.imageWidth;
        tilesetInfo.imageHeight = tileset.definition.imageHeight;
        tilesetInfo.textureHandle = tileset.textureHandle;
        txn.track(registry.create(std::move(tilesetInfo)));
        ++result.stats.tilesetEntities;
    }

    LoadedMap loaded;
    loaded.handle = MapHandle{mapId, root};
    loaded.info = info;
    loaded.entities = txn.commit();
    m_maps.recordLoaded(std::move(loaded));

    result.handle = MapHandle{mapId, root};
    result.stats.instantiateMs = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - startTime).count();

    LOADER_LOG_INFO("Loaded map '{}' (id {}): {} tiles, {} animated, {} objects, {} indexed in {:.2f} ms",
                    prepared.mapName, mapId, result.stats.tileEntities, result.stats.animatedTiles,
                    result.stats.objectEntities, result.stats.indexedEntities,
                    result.stats.instantiateMs);
    return result;
}

void MapLoader::attachTileProperties(Registry& registry, const PreparedMap& prepared,
                                     const std::vector<Entity>& tiles, MapLoadStats& stats) const {
    for (size_t i = 0; i < tiles.size(); ++i) {
        const TilePlacement& p = prepared.placements[i];
        const ResolvedTileset& tileset = prepared.tilesets[p.tilesetIndex];
        const TileDefinition* def = tileset.definition.findTile(p.gid - tileset.firstGid());
        if (!def || def->properties.empty()) continue;

        const PropertyMap& props = def->properties;
        Entity entity = tiles[i];

        // Ledges are solid unless "solid" says otherwise
        bool isLedge = props.contains("ledge_direction");
        bool solid = props.contains("solid") ? propertyBool(props, "solid") : isLedge;
        if (solid) {
            registry.add<Collision>(entity, Collision{true});
            ++stats.propertyComponents;
        }

        if (isLedge) {
            Direction jump = parseDirection(propertyString(props, "ledge_direction"));
            if (jump != Direction::None) {
                registry.add<TileLedge>(entity, TileLedge{jump});
                ++stats.propertyComponents;
            } else {
                LOG_WARN_ONCE("ledge:" + tileset.tilesetId,
                              "Tileset '{}' has a ledge with unknown direction '{}'",
                              tileset.tilesetId, propertyString(props, "ledge_direction"));
            }
        }

        int rate = propertyInt(props, "encounter_rate", 0);
        if (rate > 0) {
            registry.add<EncounterZone>(entity,
                EncounterZone{propertyString(props, "encounter_table"), rate});
            ++stats.propertyComponents;
        }

        std::string terrain = propertyString(props, "terrain_type");
        if (!terrain.empty()) {
            registry.add<TerrainType>(entity,
                TerrainType{terrain, propertyString(props, "footstep_sound")});
            ++stats.propertyComponents;
        }
    }
}

void MapLoader::attachAnimatedTiles(Registry& registry, const PreparedMap& prepared,
                                    const std::vector<Entity>& tiles, MapLoadStats& stats) const {
    // One pass over the tiles, then one lookup per animation definition
    AnimatedTileLookup lookup;
    lookup.build(registry, tiles);

    for (const auto& tileset : prepared.tilesets) {
        const uint32_t firstGid = tileset.firstGid();
        for (const auto& [localId, def] : tileset.definition.tiles) {
            if (def.animation.empty()) continue;
            ++stats.animationDefinitions;

            const uint32_t gid = firstGid + localId;
            const std::vector<Entity>* users = lookup.find(gid);
            if (!users) continue;

            AnimatedTile anim;
            anim.baseGid = gid;
            anim.geometry = tileset.geometry;
            anim.frameGids.reserve(def.animation.size());
            anim.frameDurations.reserve(def.animation.size());
            for (const auto& frame : def.animation) {
                anim.frameGids.push_back(firstGid + frame.localId);
                anim.frameDurations.push_back(static_cast<float>(frame.durationMs) / 1000.0f);
            }
            anim.currentGid = anim.frameGids.front();
            anim.sourceRect = tileset.geometry.sourceRectFor(anim.currentGid - firstGid);

            for (Entity entity : *users) {
                registry.add<AnimatedTile>(entity, anim);
            }
            stats.animatedTiles += users->size();
        }
    }

    stats.lookupTilesScanned = lookup.tilesScanned();
    stats.lookupCalls = lookup.lookups();
}

void MapLoader::spawnObjects(Registry& registry, const PreparedMap& prepared, MapId mapId,
                             LoadTransaction& txn, MapLoadStats& stats) const {
    const MapDocument& doc = prepared.document;
    const int tileSize = doc.tileWidth;

    for (const auto& layer : doc.objectLayers) {
        for (const auto& object : layer.objects) {
            // Tile objects are anchored at their bottom-left corner
            float top = object.gid != 0 ? object.y - object.height : object.y;
            int x = static_cast<int>(std::floor(object.x / static_cast<float>(doc.tileWidth)));
            int y = static_cast<int>(std::floor(top / static_cast<float>(doc.tileHeight)));

            ObjectProperties props;
            props.objectId = object.id;
            props.type = object.type;
            for (const auto& [key, value] : object.properties) {
                props.values.emplace(key, propertyToText(value));
            }
            if (const std::string* tmpl = props.find("template")) {
                props.templateId = *tmpl;
            } else {
                props.templateId = object.type;
            }

            std::string name = object.name.empty() ? "object_" + std::to_string(object.id) : object.name;
            Entity entity = registry.create(Position(x, y, mapId), Name{name});
            txn.track(entity);
            ++stats.objectEntities;

            if (!props.templateId.empty()) {
                const EntityTemplate* tmpl = m_templates ? m_templates->resolve(props.templateId) : nullptr;
                if (tmpl) {
                    TemplateRegistry::apply(registry, entity, *tmpl, tileSize, &props);
                } else {
                    ++stats.unknownTemplates;
                    LOADER_LOG_WARN("Map '{}': object '{}' uses unknown template '{}'",
                                    prepared.mapName, name, props.templateId);
                }
            }
            registry.add<ObjectProperties>(entity, std::move(props));
        }
    }
}

MapLoadResult MapLoader::loadMap(Registry& registry, const MapDocument& document,
                                 const std::string& mapName, const CancellationToken* cancel) {
    return instantiate(registry, prepare(document, mapName, cancel), cancel);
}

MapLoadResult MapLoader::loadMapFile(Registry& registry, const std::string& path,
                                     const CancellationToken* cancel) {
    return instantiate(registry, prepareMap(path, cancel), cancel);
}

// --- Unload ---

bool MapLoader::unloadMap(Registry& registry, const MapHandle& handle) {
    std::optional<LoadedMap> loaded = m_maps.release(handle.mapId);
    if (!loaded) {
        LOADER_LOG_WARN("unloadMap: map {} is not loaded", handle.mapId);
        return false;
    }

    // Players outlive the map, even one the map itself placed
    std::vector<Entity> owned;
    owned.reserve(loaded->entities.size());
    for (Entity entity : loaded->entities) {
        if (!registry.has<Player>(entity)) {
            owned.push_back(entity);
        }
    }
    size_t destroyed = registry.destroyMany(owned);

    // Entities spawned onto the map after loading
    std::vector<Entity> strays;
    const QueryDescription& positioned = m_queries.getOrCreate<Position>(Exclude<Player>{});
    registry.query(positioned, [&](Entity entity) {
        if (registry.getRef<Position>(entity).mapId == handle.mapId) {
            strays.push_back(entity);
        }
    });
    destroyed += registry.destroyMany(strays);

    size_t purged = m_index.removeMap(handle.mapId);

    LOADER_LOG_INFO("Unloaded map '{}' (id {}): {} entities destroyed, {} index entries purged",
                    loaded->info.name, handle.mapId, destroyed, purged);
    return true;
}

} // namespace overworld
