#include "CoordinateMapping.h"

#include <algorithm>
#include <cmath>

glm::vec2 CellToLocal(const GridGeometry &geometry, glm::ivec2 cell)
{
    const float x = static_cast<float>(cell.x);
    const float y = static_cast<float>(cell.y);

    switch (geometry.type)
    {
        case TileType::Isometric:
            return glm::vec2((x - y) / 2.0f * geometry.renderSize.x,
                             (x + y + 1.0f) / 2.0f * geometry.renderSize.y);

        case TileType::Hexagonal:
            return glm::vec2(geometry.slotSize.x * (x - 0.5f * y) + 0.5f * geometry.renderSize.x,
                             (geometry.slotSize.y + static_cast<float>(geometry.hexLegs)) / 2.0f * y +
                                 0.5f * geometry.renderSize.y);

        case TileType::Square:
        default:
            return glm::vec2((x + 0.5f) * geometry.renderSize.x,
                             (y + 0.5f) * geometry.renderSize.y);
    }
}

glm::vec2 LocalToWorld(const TilemapTransform &transform, glm::vec2 local)
{
    if (transform.rotation != 0.0f)
    {
        float cosR = std::cos(transform.rotation);
        float sinR = std::sin(transform.rotation);
        local = glm::vec2(local.x * cosR - local.y * sinR,
                          local.x * sinR + local.y * cosR);
    }
    return local + transform.translation;
}

glm::vec2 CellToWorld(const GridGeometry &geometry, const TilemapTransform &transform, glm::ivec2 cell)
{
    return LocalToWorld(transform, CellToLocal(geometry, cell));
}

Aabb2d ChunkLocalAabb(const GridGeometry &geometry, glm::ivec2 chunkCoord, int chunkSize)
{
    const TileArea cells = ChunkCellArea(chunkCoord, chunkSize);
    const glm::ivec2 first = cells.origin;
    const glm::ivec2 last = cells.dest;

    const glm::vec2 corners[4] = {
        CellToLocal(geometry, first),
        CellToLocal(geometry, glm::ivec2(last.x, first.y)),
        CellToLocal(geometry, last),
        CellToLocal(geometry, glm::ivec2(first.x, last.y)),
    };

    Aabb2d box{corners[0], corners[0]};
    for (const glm::vec2 &c : corners)
    {
        box.min = glm::min(box.min, c);
        box.max = glm::max(box.max, c);
    }

    const glm::vec2 half = geometry.renderSize * 0.5f;
    box.min -= half;
    box.max += half;
    return box;
}

Aabb2d ChunkWorldAabb(const GridGeometry &geometry, const TilemapTransform &transform,
                      glm::ivec2 chunkCoord, int chunkSize)
{
    Aabb2d local = ChunkLocalAabb(geometry, chunkCoord, chunkSize);
    if (transform.rotation == 0.0f)
        return {local.min + transform.translation, local.max + transform.translation};

    // Rotated box: hull of the four transformed corners
    const glm::vec2 corners[4] = {
        LocalToWorld(transform, local.min),
        LocalToWorld(transform, glm::vec2(local.max.x, local.min.y)),
        LocalToWorld(transform, local.max),
        LocalToWorld(transform, glm::vec2(local.min.x, local.max.y)),
    };

    Aabb2d box{corners[0], corners[0]};
    for (const glm::vec2 &c : corners)
    {
        box.min = glm::min(box.min, c);
        box.max = glm::max(box.max, c);
    }
    return box;
}
