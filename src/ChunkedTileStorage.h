#pragma once

#include "TileChunk.h"
#include "TileTypes.h"

#include <glm/glm.hpp>

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

/**
 * @class ChunkedTileStorage
 * @brief Sparse, chunk-indexed mapping from cell coordinate to tile record.
 * @ingroup Storage
 *
 * This is the authoritative simulation-side tile grid of one tilemap. Cells
 * are grouped into square chunks of `chunkSize` cells per edge; only chunks
 * that ever received a tile are allocated.
 *
 * @par Chunk Addressing
 * @f[
 * chunk = \lfloor \frac{cell}{chunkSize} \rfloor, \quad
 * local = cell - chunk \times chunkSize
 * @f]
 * Negative cells work: cell (-1, 0) with chunkSize 16 lives in chunk (-1, 0)
 * at local (15, 0).
 *
 * @par Change Tracking
 * Every mutation records the owning chunk in one of two sets that the
 * extraction stage drains once per frame:
 * | Set      | Meaning                                             |
 * |----------|-----------------------------------------------------|
 * | dirty    | Chunk content changed, render mirror must re-copy   |
 * | released | Chunk emptied or tilemap despawned, free GPU data   |
 *
 * A chunk is never in both sets at once.
 *
 * @par Bounds
 * Without declared bounds the tilemap AABB grows with every write. With
 * enforced bounds, writes outside the declared box are silently ignored and
 * rectangle operations are clipped.
 *
 * @par Thread Safety
 * Not thread-safe. Written only by edit calls, read only by extraction.
 */
class ChunkedTileStorage
{
public:
    using ChunkMap = std::unordered_map<glm::ivec2, TileChunk, IVec2Hash>;
    using ChunkSet = std::unordered_set<glm::ivec2, IVec2Hash>;

    /**
     * @brief Construct an empty storage.
     * @param chunkSize Cells per chunk edge (power of two recommended).
     */
    explicit ChunkedTileStorage(int chunkSize = 32);

    /**
     * @name Edit Operations
     * @{
     */

    /**
     * @brief Insert or replace the tile at a cell.
     *
     * The previous tile's layers are dropped before the new one is written.
     * Out-of-bounds cells are ignored when bounds are enforced.
     */
    void Set(glm::ivec2 coord, const TileBuilder& builder);

    /**
     * @brief Set every cell of an inclusive rectangle.
     *
     * Observationally equal to calling Set() for each cell, but every touched
     * chunk is looked up and dirtied once.
     */
    void FillRect(const TileArea& area, const TileBuilder& builder);

    /**
     * @brief Partially mutate the existing tiles of a rectangle.
     *
     * Cells without a tile are skipped, never created.
     *
     * @throws TilemapError on a layer conflict, with the offending cell.
     */
    void UpdateRect(const TileArea& area, const TileUpdater& updater);

    /// Point form of UpdateRect(). Returns `false` if no tile exists.
    bool Update(glm::ivec2 coord, const TileUpdater& updater);

    /**
     * @brief Remove the tile at a cell.
     * @return `true` if a tile was removed; absent tiles are a no-op.
     */
    bool Remove(glm::ivec2 coord);

    /// Remove every tile of an inclusive rectangle. Returns the number removed.
    std::size_t RemoveRect(const TileArea& area);

    /**
     * @brief Remove every tile and queue every chunk for release.
     *
     * After despawn the storage is empty and can be reused.
     */
    void Despawn();
    /** @} */

    /**
     * @name Queries
     * @{
     */

    /**
     * @brief Tile at a cell.
     * @return Pointer to the tile, or `nullptr` if absent. Never throws.
     */
    [[nodiscard]] const Tile* Get(glm::ivec2 coord) const;

    /// Chunk by chunk coordinate, or `nullptr`.
    [[nodiscard]] const TileChunk* GetChunk(glm::ivec2 chunkCoord) const;

    [[nodiscard]] const ChunkMap& GetChunks() const { return m_Chunks; }
    [[nodiscard]] std::size_t GetChunkCount() const { return m_Chunks.size(); }
    [[nodiscard]] std::size_t GetTileCount() const { return m_TileCount; }
    [[nodiscard]] int GetChunkSize() const { return m_ChunkSize; }

    /// Bounding box of every cell ever written (empty until the first write).
    [[nodiscard]] const IAabb2d& GetAabb() const { return m_Aabb; }
    /** @} */

    /// Tilemap id reported in TilemapError diagnostics.
    void SetOwner(TilemapId owner) { m_Owner = owner; }
    [[nodiscard]] TilemapId GetOwner() const { return m_Owner; }

    /**
     * @name Bounds
     * @{
     */
    /// Declare an extent. With `enforce`, edits outside it become no-ops.
    void SetBounds(const IAabb2d& bounds, bool enforce);
    void ClearBounds();
    [[nodiscard]] const std::optional<IAabb2d>& GetBounds() const { return m_Bounds; }
    [[nodiscard]] bool IsEnforcingBounds() const { return m_EnforceBounds; }
    /** @} */

    /**
     * @name Change Tracking
     * @{
     */
    [[nodiscard]] const ChunkSet& GetDirtyChunks() const { return m_DirtyChunks; }
    [[nodiscard]] const ChunkSet& GetReleasedChunks() const { return m_ReleasedChunks; }

    /// Drain the dirty set, clearing each chunk's dirty flag.
    std::vector<glm::ivec2> TakeDirtyChunks();

    /// Drain the released set.
    std::vector<glm::ivec2> TakeReleasedChunks();

    /// Queue every non-empty chunk for rebuild, e.g. after a geometry change.
    void MarkAllDirty();
    /** @} */

private:
    [[nodiscard]] bool Accepts(glm::ivec2 coord) const;
    TileChunk& GetOrCreateChunk(glm::ivec2 chunkCoord);
    void MarkDirty(glm::ivec2 chunkCoord);
    void MarkEmptied(glm::ivec2 chunkCoord);

    /// Visit the part of `area` inside each chunk: fn(chunkCoord, subArea).
    template<typename Fn>
    void ForEachChunkSpan(const TileArea& area, Fn&& fn) const;

    /// As ForEachChunkSpan(), restricted to allocated chunks, in (y, x) order.
    template<typename Fn>
    void ForEachAllocatedChunkSpan(const TileArea& area, Fn&& fn) const;

    int m_ChunkSize;
    TilemapId m_Owner{INVALID_TILEMAP_ID};
    ChunkMap m_Chunks;
    ChunkSet m_DirtyChunks;
    ChunkSet m_ReleasedChunks;
    IAabb2d m_Aabb;
    std::optional<IAabb2d> m_Bounds;
    bool m_EnforceBounds{false};
    std::size_t m_TileCount{0};
};
