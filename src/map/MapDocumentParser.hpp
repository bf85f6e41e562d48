#pragma once

#include "map/MapDocument.hpp"
#include "map/MapLoadStatus.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace overworld {

/// Reads Tiled JSON maps and tilesets into MapDocument / TilesetDefinition.
///
/// Every parse call returns a status; on anything other than Success the
/// output is left untouched and getLastError() says why. Tile data is kept
/// as raw gids; nothing here knows about entities.
///
/// Supported layer data: dense "data" arrays (CSV-style JSON arrays or
/// uncompressed base64) and sparse "chunks". Compressed data is rejected.
class MapDocumentParser {
public:
    /// Parse a map from a JSON string. sourcePath only sets the document's
    /// base directory for resolving external tilesets.
    MapLoadStatus parse(const std::string& text, MapDocument& out,
                        const std::string& sourcePath = "");

    /// Read and parse a map file. An unreadable file is MapDocumentInvalid.
    MapLoadStatus parseFile(const std::string& path, MapDocument& out);

    /// Parse an already-decoded JSON map
    MapLoadStatus parseJson(const nlohmann::json& json, MapDocument& out,
                            const std::string& sourcePath = "");

    /// Parse a tileset body (inline "tilesets" entry or external tileset file)
    MapLoadStatus parseTileset(const nlohmann::json& json, TilesetDefinition& out);

    const std::string& getLastError() const { return m_lastError; }

private:
    MapLoadStatus fail(std::string message);

    bool parseLayerList(const nlohmann::json& layers, MapDocument& doc,
                        int& tileOrder, const std::string& groupPrefix);
    bool parseTileLayer(const nlohmann::json& json, const MapDocument& doc, TileLayerData& out);
    bool parseObjectLayer(const nlohmann::json& json, ObjectLayerData& out);
    bool parseLayerData(const nlohmann::json& json, const std::string& layerName,
                        size_t expected, std::vector<uint32_t>& out);
    bool validateTilesetReferences(const MapDocument& doc);

    /// Shift infinite-map chunks and objects so the map starts at (0, 0)
    static void normalizeInfinite(MapDocument& doc);

    static PropertyMap parseProperties(const nlohmann::json& json);

    std::string m_lastError;
};

} // namespace overworld
