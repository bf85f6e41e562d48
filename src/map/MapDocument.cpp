#include "map/MapDocument.hpp"

#include <filesystem>

namespace overworld {

DecodedGid decodeGid(uint32_t rawGid) {
    DecodedGid decoded;
    decoded.flipHorizontal = (rawGid & FLIPPED_HORIZONTALLY_FLAG) != 0;
    decoded.flipVertical = (rawGid & FLIPPED_VERTICALLY_FLAG) != 0;
    decoded.flipDiagonal = (rawGid & FLIPPED_DIAGONALLY_FLAG) != 0;
    decoded.gid = rawGid & GID_MASK;
    return decoded;
}

// ---------------------------------------------------------------------------
// Properties
// ---------------------------------------------------------------------------

std::string propertyString(const PropertyMap& props, const std::string& key,
                           const std::string& defaultVal) {
    auto it = props.find(key);
    if (it == props.end()) {
        return defaultVal;
    }
    return propertyToText(it->second);
}

int propertyInt(const PropertyMap& props, const std::string& key, int defaultVal) {
    auto it = props.find(key);
    if (it == props.end()) {
        return defaultVal;
    }
    const auto& value = it->second;
    if (value.is_number()) {
        return value.get<int>();
    }
    if (value.is_string()) {
        try {
            return std::stoi(value.get<std::string>());
        } catch (const std::exception&) {
            return defaultVal;
        }
    }
    return defaultVal;
}

bool propertyBool(const PropertyMap& props, const std::string& key, bool defaultVal) {
    auto it = props.find(key);
    if (it == props.end()) {
        return defaultVal;
    }
    const auto& value = it->second;
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        return text == "true" || text == "1";
    }
    if (value.is_number_integer()) {
        return value.get<int>() != 0;
    }
    return defaultVal;
}

std::string propertyToText(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return "";
    }
    return value.dump();
}

// ---------------------------------------------------------------------------
// MapDocument
// ---------------------------------------------------------------------------

std::string MapDocument::baseDirectory() const {
    if (sourcePath.empty()) {
        return "";
    }
    return std::filesystem::path(sourcePath).parent_path().string();
}

size_t MapDocument::countPlacements() const {
    size_t count = 0;
    for (const auto& layer : tileLayers) {
        for (uint32_t raw : layer.data) {
            if ((raw & GID_MASK) != 0) ++count;
        }
        for (const auto& chunk : layer.chunks) {
            for (uint32_t raw : chunk.data) {
                if ((raw & GID_MASK) != 0) ++count;
            }
        }
    }
    return count;
}

} // namespace overworld
