#pragma once

#include "IGpuUploader.h"

#include <cstddef>
#include <unordered_map>
#include <vector>

/**
 * @class CpuMirrorUploader
 * @brief IGpuUploader that keeps every buffer in host memory.
 * @ingroup Rendering
 *
 * Used by the headless demo and by tests. Besides the resident buffers it
 * records counters and the full release history, so callers can check that
 * a buffer was uploaded, patched or released exactly when expected.
 */
class CpuMirrorUploader : public IGpuUploader
{
public:
    void UploadChunk(const RenderChunkKey& key, const ChunkMesh& mesh) override;
    void PatchAnimation(const AnimationPatch& patch) override;
    void ReleaseChunk(const RenderChunkKey& key) override;
    void UploadUniform(TilemapId tilemap, const TilemapUniform& uniform) override;
    void ReleaseTilemap(TilemapId tilemap) override;

    /// Resident mesh of a chunk, or `nullptr`.
    [[nodiscard]] const ChunkMesh* FindChunk(const RenderChunkKey& key) const;
    [[nodiscard]] const TilemapUniform* FindUniform(TilemapId tilemap) const;

    [[nodiscard]] std::size_t GetResidentChunkCount() const { return m_Chunks.size(); }
    [[nodiscard]] std::size_t GetResidentUniformCount() const { return m_Uniforms.size(); }

    /// Number of UploadChunk() calls for one key.
    [[nodiscard]] std::size_t GetUploadCount(const RenderChunkKey& key) const;

    /// Number of ReleaseChunk() calls for one key.
    [[nodiscard]] std::size_t GetReleaseCount(const RenderChunkKey& key) const;

    [[nodiscard]] std::size_t GetTotalUploads() const { return m_TotalUploads; }
    [[nodiscard]] std::size_t GetTotalPatches() const { return m_TotalPatches; }
    [[nodiscard]] std::size_t GetTotalReleases() const { return m_ReleaseHistory.size(); }
    [[nodiscard]] std::size_t GetTotalUniformUploads() const { return m_TotalUniformUploads; }
    [[nodiscard]] const std::vector<RenderChunkKey>& GetReleaseHistory() const { return m_ReleaseHistory; }
    [[nodiscard]] const std::vector<TilemapId>& GetReleasedTilemaps() const { return m_ReleasedTilemaps; }

    /// Reset counters and histories, keeping resident buffers.
    void ResetCounters();

private:
    std::unordered_map<RenderChunkKey, ChunkMesh, RenderChunkKeyHash> m_Chunks;
    std::unordered_map<TilemapId, TilemapUniform> m_Uniforms;
    std::unordered_map<RenderChunkKey, std::size_t, RenderChunkKeyHash> m_UploadCounts;

    std::vector<RenderChunkKey> m_ReleaseHistory;
    std::vector<TilemapId> m_ReleasedTilemaps;
    std::size_t m_TotalUploads{0};
    std::size_t m_TotalPatches{0};
    std::size_t m_TotalUniformUploads{0};
};
