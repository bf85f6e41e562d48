#pragma once

#include "ecs/Components.hpp"
#include "map/MapDocument.hpp"
#include "map/MapLoadStatus.hpp"
#include "map/LoadTransaction.hpp"

#include <optional>
#include <string>
#include <vector>

namespace overworld {

/// Texture collaborator. Returns a non-zero handle, or nullopt when the
/// image cannot be loaded.
class ITextureLoader {
public:
    virtual ~ITextureLoader() = default;
    virtual std::optional<uint32_t> loadTexture(const std::string& textureId,
                                                const std::string& imagePath) = 0;
};

/// A tileset with its external file read and its geometry computed
struct ResolvedTileset {
    std::string tilesetId;          // Image file stem, else tileset name
    std::string sourcePath;         // External file, empty if inline
    TilesetGeometry geometry;
    TilesetDefinition definition;
    uint32_t tileCount = 0;
    uint32_t textureHandle = 0;

    uint32_t firstGid() const { return geometry.firstGid; }

    bool owns(uint32_t gid) const {
        return gid >= geometry.firstGid && gid - geometry.firstGid < tileCount;
    }
};

/// Resolves a document's tileset references: reads external tileset files
/// (in parallel), validates animation frames, computes tiles per row and
/// optionally loads textures. Touches no registry.
class TilesetResolver {
public:
    explicit TilesetResolver(ITextureLoader* textures = nullptr) : m_textures(textures) {}

    void setTextureLoader(ITextureLoader* textures) { m_textures = textures; }

    /// Resolve every tileset of `doc` into `out`, sorted by firstGid.
    /// Missing/unreadable tileset file or texture is TilesetLoadFailed;
    /// a malformed inline tileset is MapDocumentInvalid.
    MapLoadStatus resolve(const MapDocument& doc, std::vector<ResolvedTileset>& out,
                          const CancellationToken* cancel = nullptr);

    /// Tileset owning a gid (flip bits stripped), or nullptr
    static const ResolvedTileset* findOwner(const std::vector<ResolvedTileset>& tilesets,
                                            uint32_t gid);

    const std::string& getLastError() const { return m_lastError; }

private:
    MapLoadStatus fail(MapLoadStatus status, std::string message);
    MapLoadStatus finish(ResolvedTileset& tileset, const std::string& baseDir, bool external);

    ITextureLoader* m_textures = nullptr;
    std::string m_lastError;
};

} // namespace overworld
