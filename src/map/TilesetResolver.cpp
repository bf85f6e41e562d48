#include "map/TilesetResolver.hpp"
#include "map/MapDocumentParser.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <future>

namespace overworld {

namespace {

/// Outcome of reading one external tileset file on a worker
struct ExternalRead {
    MapLoadStatus status = MapLoadStatus::Success;
    std::string message;
    TilesetDefinition definition;
};

ExternalRead readExternalTileset(const std::string& path) {
    ExternalRead result;
    std::ifstream file(path);
    if (!file.is_open()) {
        result.status = MapLoadStatus::TilesetLoadFailed;
        result.message = "cannot open tileset file '" + path + "'";
        return result;
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        result.status = MapLoadStatus::TilesetLoadFailed;
        result.message = "malformed tileset file '" + path + "': " + e.what();
        return result;
    }

    MapDocumentParser parser;
    if (parser.parseTileset(json, result.definition) != MapLoadStatus::Success) {
        result.status = MapLoadStatus::TilesetLoadFailed;
        result.message = "invalid tileset file '" + path + "': " + parser.getLastError();
    }
    return result;
}

std::string joinPath(const std::string& base, const std::string& relative) {
    if (base.empty()) {
        return relative;
    }
    return (std::filesystem::path(base) / relative).lexically_normal().string();
}

} // namespace

MapLoadStatus TilesetResolver::fail(MapLoadStatus status, std::string message) {
    m_lastError = std::move(message);
    LOADER_LOG_ERROR("TilesetResolver: {}", m_lastError);
    return status;
}

MapLoadStatus TilesetResolver::resolve(const MapDocument& doc, std::vector<ResolvedTileset>& out,
                                       const CancellationToken* cancel) {
    m_lastError.clear();
    const std::string baseDir = doc.baseDirectory();

    // Independent files: read them all concurrently, join in document order
    std::vector<std::future<ExternalRead>> pending(doc.tilesets.size());
    for (size_t i = 0; i < doc.tilesets.size(); ++i) {
        const auto& ref = doc.tilesets[i];
        if (!ref.source.empty()) {
            pending[i] = std::async(std::launch::async, readExternalTileset,
                                    joinPath(baseDir, ref.source));
        }
    }

    std::vector<ResolvedTileset> resolved;
    resolved.reserve(doc.tilesets.size());
    MapLoadStatus firstFailure = MapLoadStatus::Success;

    for (size_t i = 0; i < doc.tilesets.size(); ++i) {
        const auto& ref = doc.tilesets[i];
        ResolvedTileset tileset;
        tileset.geometry.firstGid = ref.firstGid;

        if (ref.source.empty()) {
            if (!ref.definition) {
                if (firstFailure == MapLoadStatus::Success) {
                    firstFailure = fail(MapLoadStatus::MapDocumentInvalid,
                        "tileset at firstgid " + std::to_string(ref.firstGid) + " has neither source nor definition");
                }
                continue;
            }
            tileset.definition = *ref.definition;
        } else {
            // Always join so no worker outlives this call
            ExternalRead read = pending[i].get();
            if (read.status != MapLoadStatus::Success) {
                if (firstFailure == MapLoadStatus::Success) {
                    firstFailure = fail(read.status, read.message);
                }
                continue;
            }
            tileset.sourcePath = joinPath(baseDir, ref.source);
            tileset.definition = std::move(read.definition);
        }

        if (firstFailure == MapLoadStatus::Success) {
            resolved.push_back(std::move(tileset));
        }
    }

    if (firstFailure != MapLoadStatus::Success) {
        return firstFailure;
    }
    if (cancelled(cancel)) {
        m_lastError = "cancelled";
        return MapLoadStatus::Cancelled;
    }

    for (auto& tileset : resolved) {
        bool external = !tileset.sourcePath.empty();
        std::string dir = external
            ? std::filesystem::path(tileset.sourcePath).parent_path().string()
            : baseDir;
        MapLoadStatus status = finish(tileset, dir, external);
        if (status != MapLoadStatus::Success) {
            return status;
        }
    }

    std::sort(resolved.begin(), resolved.end(),
        [](const ResolvedTileset& a, const ResolvedTileset& b) {
            return a.firstGid() < b.firstGid();
        });

    // Ranges must not overlap once tile counts are known
    for (size_t i = 1; i < resolved.size(); ++i) {
        const auto& prev = resolved[i - 1];
        if (prev.firstGid() + prev.tileCount > resolved[i].firstGid()) {
            return fail(MapLoadStatus::MapDocumentInvalid,
                "tileset '" + prev.tilesetId + "' overlaps gids of '" + resolved[i].tilesetId + "'");
        }
    }

    out = std::move(resolved);
    return MapLoadStatus::Success;
}

MapLoadStatus TilesetResolver::finish(ResolvedTileset& tileset, const std::string& baseDir,
                                      bool external) {
    const TilesetDefinition& def = tileset.definition;
    // A bad external file is a tileset failure; a bad inline one is a bad map
    const MapLoadStatus badData = external ? MapLoadStatus::TilesetLoadFailed
                                           : MapLoadStatus::MapDocumentInvalid;

    if (!def.image.empty()) {
        tileset.tilesetId = std::filesystem::path(def.image).stem().string();
    } else if (!def.name.empty()) {
        tileset.tilesetId = def.name;
    } else {
        tileset.tilesetId = "tileset_" + std::to_string(tileset.firstGid());
    }

    tileset.geometry.tileWidth = def.tileWidth;
    tileset.geometry.tileHeight = def.tileHeight;
    tileset.geometry.tilesPerRow = def.columns > 0 ? def.columns : 1;
    tileset.geometry.spacing = def.spacing;
    tileset.geometry.margin = def.margin;

    tileset.tileCount = def.tileCount;
    if (tileset.tileCount == 0 && def.imageHeight > 0) {
        int rows = (def.imageHeight - 2 * def.margin + def.spacing) / (def.tileHeight + def.spacing);
        if (rows > 0) {
            tileset.tileCount = static_cast<uint32_t>(rows * tileset.geometry.tilesPerRow);
        }
    }
    if (tileset.tileCount == 0 && !def.tiles.empty()) {
        // Image-collection tileset: ids are whatever the tiles declare
        tileset.tileCount = def.tiles.rbegin()->first + 1;
    }
    if (tileset.tileCount == 0) {
        return fail(badData, "tileset '" + tileset.tilesetId + "' has no tiles");
    }

    for (const auto& [localId, tile] : def.tiles) {
        if (localId >= tileset.tileCount) {
            return fail(badData, "tileset '" + tileset.tilesetId + "' describes tile " +
                        std::to_string(localId) + " beyond its " +
                        std::to_string(tileset.tileCount) + " tiles");
        }
        for (const auto& frame : tile.animation) {
            if (frame.localId >= tileset.tileCount) {
                return fail(badData, "tileset '" + tileset.tilesetId + "' animation of tile " +
                            std::to_string(localId) + " references missing tile " +
                            std::to_string(frame.localId));
            }
        }
    }

    if (m_textures && !def.image.empty()) {
        std::string imagePath = joinPath(baseDir, def.image);
        auto handle = m_textures->loadTexture(tileset.tilesetId, imagePath);
        if (!handle) {
            return fail(MapLoadStatus::TilesetLoadFailed,
                        "cannot load texture '" + imagePath + "' for tileset '" + tileset.tilesetId + "'");
        }
        tileset.textureHandle = *handle;
    }

    LOADER_LOG_DEBUG("TilesetResolver: '{}' firstgid={} tiles={} columns={}",
                     tileset.tilesetId, tileset.firstGid(), tileset.tileCount,
                     tileset.geometry.tilesPerRow);
    return MapLoadStatus::Success;
}

const ResolvedTileset* TilesetResolver::findOwner(const std::vector<ResolvedTileset>& tilesets,
                                                  uint32_t gid) {
    // Sorted by firstGid: the owner is the last tileset starting at or before gid
    auto it = std::upper_bound(tilesets.begin(), tilesets.end(), gid,
        [](uint32_t value, const ResolvedTileset& ts) { return value < ts.firstGid(); });
    if (it == tilesets.begin()) {
        return nullptr;
    }
    --it;
    return it->owns(gid) ? &*it : nullptr;
}

} // namespace overworld
