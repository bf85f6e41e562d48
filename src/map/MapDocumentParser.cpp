#include "map/MapDocumentParser.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <climits>
#include <fstream>
#include <set>

namespace overworld {

namespace {

int base64Value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

/// Decode base64 into bytes. Whitespace is skipped; returns false on bad input.
bool decodeBase64(const std::string& text, std::vector<uint8_t>& bytes) {
    uint32_t buffer = 0;
    int bits = 0;
    for (char c : text) {
        if (c == '=') break;
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
        int value = base64Value(c);
        if (value < 0) return false;
        buffer = (buffer << 6) | static_cast<uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            bytes.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFF));
        }
    }
    return true;
}

} // namespace

MapLoadStatus MapDocumentParser::fail(std::string message) {
    m_lastError = std::move(message);
    LOADER_LOG_ERROR("MapDocumentParser: {}", m_lastError);
    return MapLoadStatus::MapDocumentInvalid;
}

MapLoadStatus MapDocumentParser::parse(const std::string& text, MapDocument& out,
                                       const std::string& sourcePath) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return fail("malformed JSON in '" + sourcePath + "': " + e.what());
    }
    return parseJson(json, out, sourcePath);
}

MapLoadStatus MapDocumentParser::parseFile(const std::string& path, MapDocument& out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return fail("cannot open map file '" + path + "'");
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        return fail("malformed JSON in '" + path + "': " + e.what());
    }
    return parseJson(json, out, path);
}

// ---------------------------------------------------------------------------
// Map
// ---------------------------------------------------------------------------

MapLoadStatus MapDocumentParser::parseJson(const nlohmann::json& json, MapDocument& out,
                                           const std::string& sourcePath) {
    m_lastError.clear();

    if (!json.is_object()) {
        return fail("map root must be a JSON object");
    }

    MapDocument doc;
    doc.sourcePath = sourcePath;

    try {
        std::string type = json.value("type", "map");
        if (type != "map") {
            return fail("document type is '" + type + "', expected 'map'");
        }

        for (const char* field : {"width", "height", "tilewidth", "tileheight"}) {
            if (!json.contains(field) || !json[field].is_number_integer()) {
                return fail(std::string("missing or non-integer field '") + field + "'");
            }
        }

        doc.width = json["width"].get<int>();
        doc.height = json["height"].get<int>();
        doc.tileWidth = json["tilewidth"].get<int>();
        doc.tileHeight = json["tileheight"].get<int>();
        doc.infinite = json.value("infinite", false);
        doc.orientation = json.value("orientation", "orthogonal");

        if (doc.tileWidth <= 0 || doc.tileHeight <= 0) {
            return fail("tile size must be positive (got " + std::to_string(doc.tileWidth) +
                        "x" + std::to_string(doc.tileHeight) + ")");
        }
        if (!doc.infinite && (doc.width <= 0 || doc.height <= 0)) {
            return fail("map dimensions must be positive (got " + std::to_string(doc.width) +
                        "x" + std::to_string(doc.height) + ")");
        }
        if (doc.orientation != "orthogonal") {
            LOADER_LOG_WARN("MapDocumentParser: orientation '{}' treated as orthogonal",
                            doc.orientation);
        }

        doc.properties = parseProperties(json);

        // Tilesets
        if (!json.contains("tilesets") || !json["tilesets"].is_array()) {
            return fail("missing 'tilesets' array");
        }
        for (const auto& tsJson : json["tilesets"]) {
            TilesetReference ref;
            int firstGid = tsJson.value("firstgid", 0);
            if (firstGid <= 0) {
                return fail("tileset entry has invalid firstgid " + std::to_string(firstGid));
            }
            ref.firstGid = static_cast<uint32_t>(firstGid);
            ref.source = tsJson.value("source", "");

            if (ref.source.empty()) {
                TilesetDefinition def;
                if (parseTileset(tsJson, def) != MapLoadStatus::Success) {
                    return MapLoadStatus::MapDocumentInvalid;
                }
                ref.definition = std::move(def);
            }
            doc.tilesets.push_back(std::move(ref));
        }
        if (!validateTilesetReferences(doc)) {
            return MapLoadStatus::MapDocumentInvalid;
        }

        // Layers
        if (!json.contains("layers") || !json["layers"].is_array()) {
            return fail("missing 'layers' array");
        }
        int tileOrder = 0;
        if (!parseLayerList(json["layers"], doc, tileOrder, "")) {
            return MapLoadStatus::MapDocumentInvalid;
        }
    } catch (const nlohmann::json::exception& e) {
        return fail(std::string("unexpected value type: ") + e.what());
    }

    if (doc.infinite) {
        normalizeInfinite(doc);
        if (doc.width <= 0 || doc.height <= 0) {
            return fail("infinite map has no tile chunks");
        }
    }

    LOADER_LOG_DEBUG("MapDocumentParser: parsed {}x{} map with {} tilesets, {} tile layers, {} object layers",
                     doc.width, doc.height, doc.tilesets.size(),
                     doc.tileLayers.size(), doc.objectLayers.size());
    out = std::move(doc);
    return MapLoadStatus::Success;
}

bool MapDocumentParser::validateTilesetReferences(const MapDocument& doc) {
    std::set<uint32_t> seen;
    for (const auto& ref : doc.tilesets) {
        if (!seen.insert(ref.firstGid).second) {
            fail("two tilesets share firstgid " + std::to_string(ref.firstGid));
            return false;
        }
    }
    return true;
}

bool MapDocumentParser::parseLayerList(const nlohmann::json& layers, MapDocument& doc,
                                       int& tileOrder, const std::string& groupPrefix) {
    for (const auto& layerJson : layers) {
        std::string type = layerJson.value("type", "");
        std::string name = groupPrefix + layerJson.value("name", "");

        if (type == "tilelayer") {
            TileLayerData layer;
            layer.name = name;
            layer.order = tileOrder;
            if (!parseTileLayer(layerJson, doc, layer)) {
                return false;
            }
            doc.tileLayers.push_back(std::move(layer));
            ++tileOrder;
        } else if (type == "objectgroup") {
            ObjectLayerData layer;
            layer.name = name;
            if (!parseObjectLayer(layerJson, layer)) {
                return false;
            }
            doc.objectLayers.push_back(std::move(layer));
        } else if (type == "group") {
            if (layerJson.contains("layers") && layerJson["layers"].is_array()) {
                if (!parseLayerList(layerJson["layers"], doc, tileOrder, name + "/")) {
                    return false;
                }
            }
        } else if (type == "imagelayer") {
            LOADER_LOG_DEBUG("MapDocumentParser: skipping image layer '{}'", name);
        } else {
            fail("layer '" + name + "' has unknown type '" + type + "'");
            return false;
        }
    }
    return true;
}

bool MapDocumentParser::parseTileLayer(const nlohmann::json& json, const MapDocument& doc,
                                       TileLayerData& out) {
    out.id = json.value("id", 0);
    out.visible = json.value("visible", true);
    out.opacity = json.value("opacity", 1.0f);
    out.properties = parseProperties(json);

    std::string compression = json.value("compression", "");
    if (!compression.empty()) {
        fail("layer '" + out.name + "' uses unsupported compression '" + compression + "'");
        return false;
    }

    if (json.contains("chunks")) {
        if (!doc.infinite) {
            fail("layer '" + out.name + "' has chunks but the map is not infinite");
            return false;
        }
        for (const auto& chunkJson : json["chunks"]) {
            TileChunk chunk;
            chunk.x = chunkJson.value("x", 0);
            chunk.y = chunkJson.value("y", 0);
            chunk.width = chunkJson.value("width", 0);
            chunk.height = chunkJson.value("height", 0);
            if (chunk.width <= 0 || chunk.height <= 0) {
                fail("layer '" + out.name + "' has a chunk with non-positive size");
                return false;
            }
            if (!chunkJson.contains("data")) {
                fail("layer '" + out.name + "' has a chunk without data");
                return false;
            }
            size_t expected = static_cast<size_t>(chunk.width) * static_cast<size_t>(chunk.height);
            if (!parseLayerData(chunkJson["data"], out.name, expected, chunk.data)) {
                return false;
            }
            out.chunks.push_back(std::move(chunk));
        }
        out.width = json.value("width", 0);
        out.height = json.value("height", 0);
        return true;
    }

    out.width = json.value("width", doc.width);
    out.height = json.value("height", doc.height);
    if (out.width != doc.width || out.height != doc.height) {
        fail("layer '" + out.name + "' is " + std::to_string(out.width) + "x" +
             std::to_string(out.height) + " but the map is " + std::to_string(doc.width) +
             "x" + std::to_string(doc.height));
        return false;
    }
    if (!json.contains("data")) {
        fail("tile layer '" + out.name + "' has no data");
        return false;
    }

    size_t expected = static_cast<size_t>(out.width) * static_cast<size_t>(out.height);
    return parseLayerData(json["data"], out.name, expected, out.data);
}

bool MapDocumentParser::parseLayerData(const nlohmann::json& json, const std::string& layerName,
                                       size_t expected, std::vector<uint32_t>& out) {
    out.clear();
    out.reserve(expected);

    if (json.is_array()) {
        for (const auto& value : json) {
            if (!value.is_number_unsigned() && !value.is_number_integer()) {
                fail("layer '" + layerName + "' has a non-integer gid");
                return false;
            }
            // Flip bits push gids above INT_MAX; read as unsigned
            out.push_back(static_cast<uint32_t>(value.get<uint64_t>() & 0xFFFFFFFFull));
        }
    } else if (json.is_string()) {
        std::vector<uint8_t> bytes;
        if (!decodeBase64(json.get<std::string>(), bytes) || bytes.size() % 4 != 0) {
            fail("layer '" + layerName + "' has malformed base64 data");
            return false;
        }
        for (size_t i = 0; i < bytes.size(); i += 4) {
            out.push_back(static_cast<uint32_t>(bytes[i]) |
                          (static_cast<uint32_t>(bytes[i + 1]) << 8) |
                          (static_cast<uint32_t>(bytes[i + 2]) << 16) |
                          (static_cast<uint32_t>(bytes[i + 3]) << 24));
        }
    } else {
        fail("layer '" + layerName + "' data must be an array or base64 string");
        return false;
    }

    if (out.size() != expected) {
        fail("layer '" + layerName + "' has " + std::to_string(out.size()) +
             " tiles, expected " + std::to_string(expected));
        return false;
    }
    return true;
}

bool MapDocumentParser::parseObjectLayer(const nlohmann::json& json, ObjectLayerData& out) {
    out.id = json.value("id", 0);
    out.visible = json.value("visible", true);
    out.properties = parseProperties(json);

    if (!json.contains("objects")) {
        return true;
    }
    if (!json["objects"].is_array()) {
        fail("object layer '" + out.name + "' objects must be an array");
        return false;
    }

    for (const auto& objJson : json["objects"]) {
        MapObject obj;
        obj.id = objJson.value("id", 0u);
        obj.name = objJson.value("name", "");
        obj.type = objJson.value("type", "");
        if (obj.type.empty()) {
            obj.type = objJson.value("class", "");
        }
        obj.templatePath = objJson.value("template", "");
        obj.x = objJson.value("x", 0.0f);
        obj.y = objJson.value("y", 0.0f);
        obj.width = objJson.value("width", 0.0f);
        obj.height = objJson.value("height", 0.0f);
        obj.gid = static_cast<uint32_t>(objJson.value("gid", 0ull) & 0xFFFFFFFFull);
        obj.visible = objJson.value("visible", true);
        obj.properties = parseProperties(objJson);
        out.objects.push_back(std::move(obj));
    }
    return true;
}

// ---------------------------------------------------------------------------
// Tileset
// ---------------------------------------------------------------------------

MapLoadStatus MapDocumentParser::parseTileset(const nlohmann::json& json, TilesetDefinition& out) {
    if (!json.is_object()) {
        return fail("tileset must be a JSON object");
    }

    TilesetDefinition def;
    try {
        def.name = json.value("name", "");
        def.tileWidth = json.value("tilewidth", 0);
        def.tileHeight = json.value("tileheight", 0);
        def.columns = json.value("columns", 0);
        def.tileCount = json.value("tilecount", 0u);
        def.spacing = json.value("spacing", 0);
        def.margin = json.value("margin", 0);
        def.image = json.value("image", "");
        def.imageWidth = json.value("imagewidth", 0);
        def.imageHeight = json.value("imageheight", 0);

        if (def.tileWidth <= 0 || def.tileHeight <= 0) {
            return fail("tileset '" + def.name + "' tile size must be positive");
        }
        if (def.spacing < 0 || def.margin < 0) {
            return fail("tileset '" + def.name + "' has negative spacing or margin");
        }
        if (def.columns <= 0 && def.imageWidth > 0) {
            def.columns = (def.imageWidth - 2 * def.margin + def.spacing) /
                          (def.tileWidth + def.spacing);
        }
        if (def.columns <= 0) {
            def.columns = 1;
        }

        if (json.contains("tiles")) {
            for (const auto& tileJson : json["tiles"]) {
                if (!tileJson.contains("id")) {
                    return fail("tileset '" + def.name + "' has a tile without 'id'");
                }
                TileDefinition tile;
                tile.id = tileJson["id"].get<uint32_t>();
                tile.type = tileJson.value("type", "");
                if (tile.type.empty()) {
                    tile.type = tileJson.value("class", "");
                }
                tile.properties = parseProperties(tileJson);

                if (tileJson.contains("animation")) {
                    for (const auto& frameJson : tileJson["animation"]) {
                        TileAnimationFrame frame;
                        frame.localId = frameJson.value("tileid", 0u);
                        frame.durationMs = frameJson.value("duration", 0);
                        if (frame.durationMs <= 0) {
                            return fail("tileset '" + def.name + "' tile " + std::to_string(tile.id) +
                                        " has a non-positive frame duration");
                        }
                        tile.animation.push_back(frame);
                    }
                }
                def.tiles[tile.id] = std::move(tile);
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return fail("tileset '" + def.name + "': unexpected value type: " + e.what());
    }

    out = std::move(def);
    return MapLoadStatus::Success;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

PropertyMap MapDocumentParser::parseProperties(const nlohmann::json& json) {
    PropertyMap props;
    if (!json.contains("properties")) {
        return props;
    }

    const auto& list = json["properties"];
    if (list.is_array()) {
        // Current format: [{"name": ..., "type": ..., "value": ...}]
        for (const auto& entry : list) {
            if (!entry.is_object() || !entry.contains("name")) continue;
            props[entry["name"].get<std::string>()] =
                entry.contains("value") ? entry["value"] : nlohmann::json();
        }
    } else if (list.is_object()) {
        // Legacy format: {"key": value}
        for (auto it = list.begin(); it != list.end(); ++it) {
            props[it.key()] = it.value();
        }
    }
    return props;
}

void MapDocumentParser::normalizeInfinite(MapDocument& doc) {
    int minX = INT_MAX, minY = INT_MAX;
    int maxX = INT_MIN, maxY = INT_MIN;
    for (const auto& layer : doc.tileLayers) {
        for (const auto& chunk : layer.chunks) {
            minX = std::min(minX, chunk.x);
            minY = std::min(minY, chunk.y);
            maxX = std::max(maxX, chunk.x + chunk.width);
            maxY = std::max(maxY, chunk.y + chunk.height);
        }
    }
    if (minX == INT_MAX) {
        doc.width = 0;
        doc.height = 0;
        return;
    }

    for (auto& layer : doc.tileLayers) {
        for (auto& chunk : layer.chunks) {
            chunk.x -= minX;
            chunk.y -= minY;
        }
        layer.width = maxX - minX;
        layer.height = maxY - minY;
    }
    for (auto& layer : doc.objectLayers) {
        for (auto& obj : layer.objects) {
            obj.x -= static_cast<float>(minX * doc.tileWidth);
            obj.y -= static_cast<float>(minY * doc.tileHeight);
        }
    }
    doc.width = maxX - minX;
    doc.height = maxY - minY;
}

} // namespace overworld
