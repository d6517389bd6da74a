#pragma once

#include "ChunkMesh.h"
#include "TileTypes.h"

#include <glm/glm.hpp>

#include <compare>
#include <cstdint>
#include <vector>

/**
 * @struct TilemapUniform
 * @brief Per-tilemap uniform block, std140-friendly field order.
 * @ingroup Rendering
 */
struct TilemapUniform
{
    glm::vec4 layerOpacities{1.0f};
    glm::vec2 translation{0.0f};
    glm::vec2 slotSize{16.0f};
    glm::vec2 renderSize{16.0f};
    glm::vec2 atlasSize{0.0f};   ///< Pixels; (0, 0) for untextured tilemaps
    glm::vec2 tileSize{16.0f};   ///< Atlas tile size in pixels
    float rotation{0.0f};
    int32_t zIndex{0};
    uint32_t tileType{0};        ///< TileType
    int32_t hexLegs{0};
    uint32_t textureRotation{0}; ///< TilemapRotation in degrees
    uint32_t flip{0};            ///< Tilemap-wide FLIP_* bits

    bool operator==(const TilemapUniform& other) const = default;
};

/// Current atlas index of one animated lane.
struct AnimationLane
{
    uint32_t firstVertex;
    int layer;
    int textureIndex;

    bool operator==(const AnimationLane& other) const = default;
};

/**
 * @struct AnimationPatch
 * @brief Lightweight per-frame attribute update of an animated chunk.
 *
 * Only the listed lanes change; geometry and static lanes stay untouched.
 */
struct AnimationPatch
{
    RenderChunkKey key;
    std::vector<AnimationLane> lanes;
};

/**
 * @struct DrawSortKey
 * @brief Total draw order: z-index, then tilemap id, then chunk row, then column.
 *
 * Compares lexicographically, so draw lists of several cameras or passes
 * can be merged by key alone. Higher z-index draws later and lands on top.
 */
struct DrawSortKey
{
    int32_t zIndex{0};
    TilemapId tilemap{0};
    int32_t chunkY{0};
    int32_t chunkX{0};

    static DrawSortKey For(const RenderChunkKey& key, int32_t zIndex)
    {
        return {zIndex, key.tilemap, key.chunk.y, key.chunk.x};
    }

    auto operator<=>(const DrawSortKey& other) const = default;
};

/**
 * @struct DrawSubmission
 * @brief One indexed draw of a prepared chunk for one camera.
 */
struct DrawSubmission
{
    RenderChunkKey key;
    uint32_t indexCount{0};
    DrawSortKey sortKey;

    bool operator==(const DrawSubmission& other) const = default;
};
    int zIndex{0};

    bool operator==(const DrawSubmission& other) const = default;
};

/**
 * @class IGpuUploader
 * @brief Abstract sink for chunk buffers and tilemap uniforms.
 * @ingroup Rendering
 *
 * The pipeline never talks to a graphics API directly. Every GPU-facing
 * write goes through this interface, so the host chooses the backend:
 * - **CpuMirrorUploader**: keeps copies in host memory (headless, tests)
 * - **VulkanChunkUploader**: host-visible vertex, index and uniform buffers
 *
 * All calls happen on the thread driving TilemapRenderPipeline, after the
 * parallel part of Prepare has finished.
 */
class IGpuUploader
{
public:
    virtual ~IGpuUploader() = default;

    /// Create or replace the buffers of a chunk. Never called with an empty mesh.
    virtual void UploadChunk(const RenderChunkKey& key, const ChunkMesh& mesh) = 0;

    /// Overwrite the texture index of animated lanes in an uploaded chunk.
    virtual void PatchAnimation(const AnimationPatch& patch) = 0;

    /// Free the buffers of a chunk. Unknown keys are ignored.
    virtual void ReleaseChunk(const RenderChunkKey& key) = 0;

    /// Create or replace the uniform block of a tilemap.
    virtual void UploadUniform(TilemapId tilemap, const TilemapUniform& uniform) = 0;

    /// Free the uniform block of a tilemap. Unknown ids are ignored.
    virtual void ReleaseTilemap(TilemapId tilemap) = 0;
};
