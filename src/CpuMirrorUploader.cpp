#include "CpuMirrorUploader.h"

#include <algorithm>

void CpuMirrorUploader::UploadChunk(const RenderChunkKey &key, const ChunkMesh &mesh)
{
    m_Chunks[key] = mesh;
    ++m_UploadCounts[key];
    ++m_TotalUploads;
}

void CpuMirrorUploader::PatchAnimation(const AnimationPatch &patch)
{
    auto it = m_Chunks.find(patch.key);
    if (it == m_Chunks.end())
        return;

    std::vector<ChunkVertex> &vertices = it->second.vertices;
    for (const AnimationLane &lane : patch.lanes)
    {
        if (lane.layer < 0 || lane.layer >= MAX_LAYER_COUNT)
            continue;
        for (uint32_t v = lane.firstVertex; v < lane.firstVertex + 4 && v < vertices.size(); ++v)
            vertices[v].textureIndices[lane.layer] = lane.textureIndex;
    }
    ++m_TotalPatches;
}

void CpuMirrorUploader::ReleaseChunk(const RenderChunkKey &key)
{
    m_Chunks.erase(key);
    m_ReleaseHistory.push_back(key);
}

void CpuMirrorUploader::UploadUniform(TilemapId tilemap, const TilemapUniform &uniform)
{
    m_Uniforms[tilemap] = uniform;
    ++m_TotalUniformUploads;
}

void CpuMirrorUploader::ReleaseTilemap(TilemapId tilemap)
{
    m_Uniforms.erase(tilemap);
    m_ReleasedTilemaps.push_back(tilemap);
}

const ChunkMesh *CpuMirrorUploader::FindChunk(const RenderChunkKey &key) const
{
    auto it = m_Chunks.find(key);
    return it == m_Chunks.end() ? nullptr : &it->second;
}

const TilemapUniform *CpuMirrorUploader::FindUniform(TilemapId tilemap) const
{
    auto it = m_Uniforms.find(tilemap);
    return it == m_Uniforms.end() ? nullptr : &it->second;
}

std::size_t CpuMirrorUploader::GetUploadCount(const RenderChunkKey &key) const
{
    auto it = m_UploadCounts.find(key);
    return it == m_UploadCounts.end() ? 0 : it->second;
}

std::size_t CpuMirrorUploader::GetReleaseCount(const RenderChunkKey &key) const
{
    return static_cast<std::size_t>(std::count(m_ReleaseHistory.begin(), m_ReleaseHistory.end(), key));
}

void CpuMirrorUploader::ResetCounters()
{
    m_UploadCounts.clear();
    m_ReleaseHistory.clear();
    m_ReleasedTilemaps.clear();
    m_TotalUploads = 0;
    m_TotalPatches = 0;
    m_TotalUniformUploads = 0;
}
