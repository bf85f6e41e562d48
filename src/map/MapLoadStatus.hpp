#pragma once

namespace overworld {

/// Outcome of parsing, resolving or loading a map
enum class MapLoadStatus {
    Success,
    MapDocumentInvalid,     // Malformed document, bad dimensions, dangling tileset reference
    TilesetLoadFailed,      // Tileset file or texture missing/unreadable
    BulkCreateFailed,       // Entity creation failed; everything rolled back
    Cancelled               // Cancellation requested; world left unchanged
};

inline const char* mapLoadStatusToString(MapLoadStatus status) {
    switch (status) {
        case MapLoadStatus::Success:            return "Success";
        case MapLoadStatus::MapDocumentInvalid: return "Map document invalid";
        case MapLoadStatus::TilesetLoadFailed:  return "Tileset load failed";
        case MapLoadStatus::BulkCreateFailed:   return "Bulk create failed";
        case MapLoadStatus::Cancelled:          return "Cancelled";
    }
    return "Unknown error";
}

} // namespace overworld
