#pragma once

#include "TileTypes.h"

#include <glm/glm.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

/**
 * @struct ChunkVertex
 * @brief One corner of a tile quad, laid out for a single interleaved vertex buffer.
 * @ingroup Rendering
 *
 * All four corners of a quad carry identical per-tile attributes. Layer lanes
 * are fixed-width so the shader composites MAX_LAYER_COUNT layers without
 * branching on the stack depth.
 *
 * | Field          | Type  | Content                                        |
 * |----------------|-------|------------------------------------------------|
 * | position       | vec3  | Tilemap-local corner, z = 0                    |
 * | gridIndex      | ivec2 | Cell coordinate                                |
 * | textureIndices | ivec4 | Atlas index per layer, -1 = empty or animated  |
 * | animations     | ivec4 | Animation id per layer, -1 = static            |
 * | flips          | uvec4 | TileFlip bits per layer                        |
 * | color          | vec4  | RGBA tint                                      |
 */
struct ChunkVertex
{
    glm::vec3 position{0.0f};
    glm::ivec2 gridIndex{0, 0};
    glm::ivec4 textureIndices{-1};
    glm::ivec4 animations{-1};
    glm::uvec4 flips{0u};
    glm::vec4 color{1.0f};
};

/// Location of an animated layer lane inside a chunk mesh.
struct AnimatedLayerRef
{
    uint32_t firstVertex;  ///< First of the quad's four vertices
    int layer;             ///< Lane in textureIndices
    int animationId;       ///< Index into the tilemap's animation table
};

/**
 * @struct ChunkMesh
 * @brief Packed geometry of one chunk, four vertices and six indices per tile.
 * @ingroup Rendering
 *
 * Quads appear in row-major cell order (y outer, x inner), so two builds of
 * the same chunk content are byte-identical.
 */
struct ChunkMesh
{
    std::vector<ChunkVertex> vertices;
    std::vector<uint32_t> indices;
    std::vector<AnimatedLayerRef> animatedLayers;

    [[nodiscard]] bool IsEmpty() const { return indices.empty(); }
    [[nodiscard]] uint32_t GetIndexCount() const { return static_cast<uint32_t>(indices.size()); }
    [[nodiscard]] uint32_t GetQuadCount() const { return static_cast<uint32_t>(vertices.size() / 4); }
    [[nodiscard]] bool HasAnimation() const { return !animatedLayers.empty(); }

    void Clear()
    {
        vertices.clear();
        indices.clear();
        animatedLayers.clear();
    }
};

/**
 * @struct RenderChunkKey
 * @brief Identity of a packed chunk buffer on the GPU side.
 */
struct RenderChunkKey
{
    TilemapId tilemap{INVALID_TILEMAP_ID};
    MaterialId material{STANDARD_MATERIAL};
    glm::ivec2 chunk{0, 0};

    bool operator==(const RenderChunkKey& other) const = default;
};

struct RenderChunkKeyHash
{
    std::size_t operator()(const RenderChunkKey& key) const noexcept
    {
        std::size_t h = IVec2Hash{}(key.chunk);
        h ^= std::hash<uint64_t>{}((static_cast<uint64_t>(key.tilemap) << 32) | key.material) +
             0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
        return h;
    }
};
