#pragma once

#include "TileTypes.h"

#include <glm/glm.hpp>

#include <stdexcept>
#include <string>

/**
 * @enum TilemapErrorKind
 * @brief Contract violations that abort a storage or pipeline operation.
 *
 * Out-of-bounds edits and textures that are still loading are not errors
 * and never produce a TilemapError.
 */
enum class TilemapErrorKind
{
    LayerConflict,      ///< Texture layer written over an animated slot or vice versa
    MissingAnimation,   ///< Animation id not present in the tilemap's table
    MissingTexture,     ///< Texture handle never registered with the TextureRegistry
    InvalidDescriptor   ///< Non-positive chunk, slot or render size
};

inline const char* ToString(TilemapErrorKind kind)
{
    switch (kind)
    {
        case TilemapErrorKind::LayerConflict:
            return "LayerConflict";
        case TilemapErrorKind::MissingAnimation:
            return "MissingAnimation";
        case TilemapErrorKind::MissingTexture:
            return "MissingTexture";
        case TilemapErrorKind::InvalidDescriptor:
            return "InvalidDescriptor";
        default:
            return "Unknown";
    }
}

/**
 * @class TilemapError
 * @brief Exception raised for caller or configuration bugs.
 * @ingroup Storage
 *
 * The message always names the tilemap and, when relevant, the cell, e.g.
 * `[LayerConflict] tilemap 3 cell (12,-4): slot 1 holds an animation`.
 */
class TilemapError : public std::runtime_error
{
public:
    TilemapError(TilemapErrorKind kind, const std::string& detail,
                 TilemapId tilemap = INVALID_TILEMAP_ID,
                 std::optional<glm::ivec2> cell = std::nullopt)
        : std::runtime_error(Format(kind, detail, tilemap, cell))
        , m_Kind(kind)
        , m_Tilemap(tilemap)
        , m_Cell(cell)
        , m_Detail(detail)
    {
    }

    TilemapErrorKind GetKind() const { return m_Kind; }
    TilemapId GetTilemap() const { return m_Tilemap; }
    const std::optional<glm::ivec2>& GetCell() const { return m_Cell; }
    const std::string& GetDetail() const { return m_Detail; }

    /// Copy of this error with tilemap and cell context filled in.
    TilemapError WithContext(TilemapId tilemap, glm::ivec2 cell) const
    {
        return TilemapError(m_Kind, m_Detail, tilemap, cell);
    }

private:
    static std::string Format(TilemapErrorKind kind, const std::string& detail,
                              TilemapId tilemap, const std::optional<glm::ivec2>& cell)
    {
        std::string msg = "[";
        msg += ToString(kind);
        msg += "]";
        if (tilemap != INVALID_TILEMAP_ID)
            msg += " tilemap " + std::to_string(tilemap);
        if (cell)
            msg += " cell (" + std::to_string(cell->x) + "," + std::to_string(cell->y) + ")";
        msg += ": " + detail;
        return msg;
    }

    TilemapErrorKind m_Kind;
    TilemapId m_Tilemap;
    std::optional<glm::ivec2> m_Cell;
    std::string m_Detail;
};
