#pragma once

#include "Camera.h"
#include "ChunkMesh.h"
#include "CoordinateMapping.h"
#include "IGpuUploader.h"
#include "Tilemap.h"
#include "TileTypes.h"

#include <glm/glm.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <unordered_map>
#include <unordered_set>
#include <vector>

/**
 * @enum ChunkState
 * @brief Lifecycle of a render-side chunk.
 *
 * @code
 *   Populated --build--> Clean / Empty --snapshot--> Dirty --build--> Clean / Empty
 * @endcode
 * `Dirty` returns to `Clean` only after a rebuild in a frame where the
 * chunk was visible to at least one camera. A released chunk leaves the
 * mirror and only its key survives, in RenderWorld's pending release set.
 */
enum class ChunkState
{
    Empty,      ///< Built, but no visible tile produced geometry
    Populated,  ///< Snapshot taken, never built
    Dirty,      ///< Built once, content changed since
    Clean       ///< Buffer matches the snapshot
};

const char* ToString(ChunkState state);

/**
 * @struct RenderChunk
 * @brief Render-side mirror of one chunk: tile snapshot plus built mesh.
 */
struct RenderChunk
{
    RenderChunkKey key;
    std::vector<Tile> tiles;        ///< Row-major snapshot taken by extraction
    ChunkMesh mesh;                 ///< Last build output
    ChunkState state{ChunkState::Populated};
    bool hasAnimation{false};
    bool hasBuffer{false};          ///< An uploaded GPU buffer exists
    uint32_t buildCount{0};         ///< Number of rebuilds since creation

    [[nodiscard]] bool NeedsBuild() const
    {
        return state == ChunkState::Populated || state == ChunkState::Dirty;
    }
};

/**
 * @struct ExtractedTilemap
 * @brief Render-side copy of a tilemap descriptor and its chunks.
 */
struct ExtractedTilemap
{
    using ChunkMap = std::unordered_map<glm::ivec2, RenderChunk, IVec2Hash>;

    TilemapId id{INVALID_TILEMAP_ID};
    GridGeometry geometry;
    TilemapTransform transform;
    TilemapTexture texture;
    MaterialId material{STANDARD_MATERIAL};
    std::array<float, MAX_LAYER_COUNT> layerOpacities{1.0f, 1.0f, 1.0f, 1.0f};
    uint32_t flip{FLIP_NONE};
    std::vector<AnimatedTile> animations;
    int chunkSize{32};

    uint64_t revision{0};          ///< Descriptor revision last copied
    uint64_t uploadedRevision{0};  ///< Revision of the last uniform upload
    bool textureReady{false};

    ChunkMap chunks;

    [[nodiscard]] RenderChunkKey MakeKey(glm::ivec2 chunkCoord) const { return {id, material, chunkCoord}; }
    [[nodiscard]] TilemapUniform BuildUniform() const;
};

/**
 * @struct CameraView
 * @brief Per-camera culling result and draw list of the current frame.
 */
struct CameraView
{
    Camera camera;
    std::vector<RenderChunkKey> visible;
    std::vector<DrawSubmission> draws;
};

/**
 * @class RenderWorld
 * @brief Render-side mirror written by extraction and prepare, read by culling and queue.
 * @ingroup Pipeline
 *
 * The mirror is derived state. Nothing outside the pipeline stages writes
 * to it, and it holds no reference into simulation-side storage, so
 * simulation edits may proceed while the previous frame is still being
 * culled, prepared and queued.
 *
 * @par Deferred Release
 * Chunk buffers and uniforms are never freed inline. Keys go into a
 * deduplicated pending set and are handed to IGpuUploader at the start of
 * the next extraction, after the frame that might still read them.
 */
class RenderWorld
{
public:
    using TilemapMap = std::map<TilemapId, ExtractedTilemap>;

    /// @name Tilemaps
    /// @{
    [[nodiscard]] TilemapMap& GetTilemaps() { return m_Tilemaps; }
    [[nodiscard]] const TilemapMap& GetTilemaps() const { return m_Tilemaps; }
    [[nodiscard]] ExtractedTilemap* FindTilemap(TilemapId id);
    [[nodiscard]] const ExtractedTilemap* FindTilemap(TilemapId id) const;
    [[nodiscard]] RenderChunk* FindChunk(const RenderChunkKey& key);
    [[nodiscard]] const RenderChunk* FindChunk(const RenderChunkKey& key) const;
    [[nodiscard]] std::size_t GetChunkCount() const;
    /// @}

    /// @name Deferred Release
    /// @{

    /**
     * @brief Queue a chunk buffer for release on the next extraction.
     * @return `false` if the key was already queued.
     */
    bool QueueChunkRelease(const RenderChunkKey& key);

    /**
     * @brief Queue the buffer of a mirror chunk for release and clear its `hasBuffer` flag.
     *
     * Chunks without an uploaded buffer are skipped, so a key handed to
     * release once is never handed over again.
     *
     * @return `true` if a release was queued.
     */
    bool ReleaseChunkBuffer(RenderChunk& chunk);

    /// Queue a tilemap uniform for release on the next extraction.
    bool QueueTilemapRelease(TilemapId id);

    std::vector<RenderChunkKey> TakePendingChunkReleases();
    std::vector<TilemapId> TakePendingTilemapReleases();

    [[nodiscard]] std::size_t GetPendingChunkReleaseCount() const { return m_PendingChunkReleases.size(); }
    /// @}

    /// @name Frame Inputs
    /// @{
    void SetCameras(const std::vector<Camera>& cameras);
    [[nodiscard]] std::vector<CameraView>& GetViews() { return m_Views; }
    [[nodiscard]] const std::vector<CameraView>& GetViews() const { return m_Views; }

    /// View of a camera by id, or `nullptr`.
    [[nodiscard]] const CameraView* FindView(uint32_t cameraId) const;

    void SetTime(float seconds) { m_Time = seconds; }
    [[nodiscard]] float GetTime() const { return m_Time; }
    /// @}

private:
    TilemapMap m_Tilemaps;
    std::unordered_set<RenderChunkKey, RenderChunkKeyHash> m_PendingChunkReleases;
    std::vector<RenderChunkKey> m_PendingChunkOrder;
    std::vector<TilemapId> m_PendingTilemapReleases;
    std::vector<CameraView> m_Views;
    float m_Time{0.0f};
};
