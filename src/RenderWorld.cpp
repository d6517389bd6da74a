#include "RenderWorld.h"

#include <utility>

const char *ToString(ChunkState state)
{
    switch (state)
    {
        case ChunkState::Empty:
            return "Empty";
        case ChunkState::Populated:
            return "Populated";
        case ChunkState::Dirty:
            return "Dirty";
        case ChunkState::Clean:
            return "Clean";
        default:
            return "Unknown";
    }
}

TilemapUniform ExtractedTilemap::BuildUniform() const
{
    TilemapUniform u;
    u.layerOpacities = glm::vec4(layerOpacities[0], layerOpacities[1], layerOpacities[2], layerOpacities[3]);
    u.translation = transform.translation;
    u.slotSize = geometry.slotSize;
    u.renderSize = geometry.renderSize;
    u.atlasSize = glm::vec2(texture.atlasSize);
    u.tileSize = texture.tileSize;
    u.rotation = transform.rotation;
    u.zIndex = transform.zIndex;
    u.tileType = static_cast<uint32_t>(geometry.type);
    u.hexLegs = geometry.hexLegs;
    u.textureRotation = static_cast<uint32_t>(texture.rotation);
    u.flip = flip;
    return u;
}

ExtractedTilemap *RenderWorld::FindTilemap(TilemapId id)
{
    auto it = m_Tilemaps.find(id);
    return it == m_Tilemaps.end() ? nullptr : &it->second;
}

const ExtractedTilemap *RenderWorld::FindTilemap(TilemapId id) const
{
    auto it = m_Tilemaps.find(id);
    return it == m_Tilemaps.end() ? nullptr : &it->second;
}

RenderChunk *RenderWorld::FindChunk(const RenderChunkKey &key)
{
    ExtractedTilemap *tilemap = FindTilemap(key.tilemap);
    if (!tilemap || tilemap->material != key.material)
        return nullptr;
    auto it = tilemap->chunks.find(key.chunk);
    return it == tilemap->chunks.end() ? nullptr : &it->second;
}

const RenderChunk *RenderWorld::FindChunk(const RenderChunkKey &key) const
{
    const ExtractedTilemap *tilemap = FindTilemap(key.tilemap);
    if (!tilemap || tilemap->material != key.material)
        return nullptr;
    auto it = tilemap->chunks.find(key.chunk);
    return it == tilemap->chunks.end() ? nullptr : &it->second;
}

std::size_t RenderWorld::GetChunkCount() const
{
    std::size_t count = 0;
    for (const auto &[id, tilemap] : m_Tilemaps)
    {
        (void)id;
        count += tilemap.chunks.size();
    }
    return count;
}

bool RenderWorld::QueueChunkRelease(const RenderChunkKey &key)
{
    if (!m_PendingChunkReleases.insert(key).second)
        return false;
    m_PendingChunkOrder.push_back(key);
    return true;
}

bool RenderWorld::ReleaseChunkBuffer(RenderChunk &chunk)
{
    if (!chunk.hasBuffer)
        return false;
    chunk.hasBuffer = false;
    return QueueChunkRelease(chunk.key);
}

bool RenderWorld::QueueTilemapRelease(TilemapId id)
{
    for (TilemapId pending : m_PendingTilemapReleases)
        if (pending == id)
            return false;
    m_PendingTilemapReleases.push_back(id);
    return true;
}

std::vector<RenderChunkKey> RenderWorld::TakePendingChunkReleases()
{
    std::vector<RenderChunkKey> out;
    out.swap(m_PendingChunkOrder);
    m_PendingChunkReleases.clear();
    return out;
}

std::vector<TilemapId> RenderWorld::TakePendingTilemapReleases()
{
    std::vector<TilemapId> out;
    out.swap(m_PendingTilemapReleases);
    return out;
}

void RenderWorld::SetCameras(const std::vector<Camera> &cameras)
{
    m_Views.clear();
    m_Views.reserve(cameras.size());
    for (const Camera &camera : cameras)
    {
        CameraView view;
        view.camera = camera;
        m_Views.push_back(std::move(view));
    }
}

const CameraView *RenderWorld::FindView(uint32_t cameraId) const
{
    for (const CameraView &view : m_Views)
        if (view.camera.id == cameraId)
            return &view;
    return nullptr;
}
