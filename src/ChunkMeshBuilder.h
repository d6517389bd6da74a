#pragma once

#include "ChunkMesh.h"
#include "CoordinateMapping.h"
#include "TileTypes.h"

#include <vector>

/**
 * @brief Rebuild the packed mesh of one chunk.
 * @ingroup Rendering
 *
 * Walks `tiles` in order and emits one quad per visible tile with at least
 * one layer. Each quad is centered on CellToLocal() and spans the render
 * size; corners are emitted counter-clockwise from bottom-left:
 * @code
 *   3 ---- 2
 *   |    / |
 *   |  /   |
 *   0 ---- 1     indices: 0 1 2, 0 2 3
 * @endcode
 *
 * Animated layers keep textureIndex -1 and are listed in
 * ChunkMesh::animatedLayers for the per-frame patch.
 *
 * @param geometry Lattice of the owning tilemap.
 * @param tiles    Chunk snapshot, expected in row-major cell order.
 * @param out      Destination, cleared first; its capacity is reused.
 */
void BuildChunkMesh(const GridGeometry& geometry, const std::vector<Tile>& tiles, ChunkMesh& out);

/// Value-returning form of BuildChunkMesh().
ChunkMesh BuildChunkMesh(const GridGeometry& geometry, const std::vector<Tile>& tiles);
