#pragma once

#include "TileTypes.h"

#include <glm/glm.hpp>

/**
 * @struct GridGeometry
 * @brief Lattice parameters shared by mesh building and culling.
 * @ingroup Rendering
 *
 * `slotSize` is the spacing of the logical grid, `renderSize` the size of
 * the quad drawn for each cell. They differ when tiles overlap on purpose.
 */
struct GridGeometry
{
    TileType type{TileType::Square};
    int hexLegs{0};                    ///< Hexagonal only: length of the vertical edge
    glm::vec2 slotSize{16.0f, 16.0f};
    glm::vec2 renderSize{16.0f, 16.0f};

    bool operator==(const GridGeometry& other) const = default;
};

/**
 * @struct TilemapTransform
 * @brief World placement of a tilemap.
 *
 * Rotation is applied around the tilemap origin before translation.
 * zIndex orders overlapping tilemaps: higher is drawn later, on top.
 */
struct TilemapTransform
{
    glm::vec2 translation{0.0f, 0.0f};
    int zIndex{0};
    float rotation{0.0f};  ///< Radians, counter-clockwise

    bool operator==(const TilemapTransform& other) const = default;
};

/**
 * @brief Tilemap-local center of a cell.
 *
 * World Y increases upward and cell (0,0) sits at the bottom-left.
 *
 * | Type      | x                                      | y                                      |
 * |-----------|----------------------------------------|----------------------------------------|
 * | Square    | (x + 0.5) * render.x                   | (y + 0.5) * render.y                   |
 * | Isometric | (x - y) / 2 * render.x                 | (x + y + 1) / 2 * render.y             |
 * | Hexagonal | slot.x * (x - 0.5 y) + 0.5 render.x    | (slot.y + legs) / 2 * y + 0.5 render.y |
 *
 * The `+ 1` of the isometric row aligns the diamond's bottom vertex with
 * the cell origin.
 */
glm::vec2 CellToLocal(const GridGeometry& geometry, glm::ivec2 cell);

/// Apply rotation then translation.
glm::vec2 LocalToWorld(const TilemapTransform& transform, glm::vec2 local);

/// Convenience: CellToLocal followed by LocalToWorld.
glm::vec2 CellToWorld(const GridGeometry& geometry, const TilemapTransform& transform, glm::ivec2 cell);

/**
 * @brief Tilemap-local bounds of every quad a chunk can hold.
 *
 * The lattice maps are affine, so the extreme cell centers are the four
 * corner cells; the box is their hull grown by half the render size.
 */
Aabb2d ChunkLocalAabb(const GridGeometry& geometry, glm::ivec2 chunkCoord, int chunkSize);

/// World-space bounds of a chunk, including tilemap rotation.
Aabb2d ChunkWorldAabb(const GridGeometry& geometry, const TilemapTransform& transform,
                      glm::ivec2 chunkCoord, int chunkSize);
