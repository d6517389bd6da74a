#include "ExtractStage.h"
#include "TilemapError.h"

#include <iostream>
#include <string>

void ExtractStage::Run(TilemapWorld &world, const TextureRegistry &textures,
                       const std::vector<Camera> &cameras, const FrameClock &clock,
                       RenderWorld &render, IGpuUploader &uploader, FrameStats &stats)
{
    FlushReleases(render, uploader, stats);
    ExtractStructure(world, textures, render, stats);
    ExtractContent(world, render, stats);

    render.SetCameras(cameras);
    render.SetTime(clock.GetElapsed());
}

void ExtractStage::FlushReleases(RenderWorld &render, IGpuUploader &uploader, FrameStats &stats)
{
    for (const RenderChunkKey &key : render.TakePendingChunkReleases())
    {
        uploader.ReleaseChunk(key);
        ++stats.chunksReleased;
    }
    for (TilemapId id : render.TakePendingTilemapReleases())
    {
        uploader.ReleaseTilemap(id);
        ++stats.tilemapsReleased;
    }
}

void ExtractStage::ExtractStructure(TilemapWorld &world, const TextureRegistry &textures,
                                    RenderWorld &render, FrameStats &stats)
{
    RenderWorld::TilemapMap &mirrors = render.GetTilemaps();

    for (TilemapId id : world.TakeDespawned())
    {
        auto it = mirrors.find(id);
        if (it == mirrors.end())
            continue;

        std::size_t released = 0;
        for (auto &[coord, chunk] : it->second.chunks)
        {
            (void)coord;
            if (render.ReleaseChunkBuffer(chunk))
                ++released;
        }
        render.QueueTilemapRelease(id);
        std::cout << "[Extract] Tilemap " << id << " despawned, releasing "
                  << released << " chunk buffers" << std::endl;
        mirrors.erase(it);
    }

    for (const auto &[id, tilemap] : world.GetTilemaps())
    {
        const TilemapDescriptor &desc = tilemap->GetDescriptor();

        TextureState textureState = textures.GetState(desc.texture.handle);
        if (textureState == TextureState::Unregistered)
        {
            throw TilemapError(TilemapErrorKind::MissingTexture,
                               "texture handle " + std::to_string(desc.texture.handle) + " is not registered",
                               id);
        }

        auto [it, inserted] = mirrors.try_emplace(id);
        ExtractedTilemap &mirror = it->second;
        mirror.textureReady = textureState == TextureState::Ready;

        if (!inserted && mirror.revision == tilemap->GetRevision())
            continue;

        if (inserted)
        {
            mirror.id = id;
            std::cout << "[Extract] Mirrored tilemap " << id << " '" << desc.name << "'" << std::endl;
        }
        else if (mirror.material != desc.material)
        {
            // Buffers are keyed by material; every chunk is re-snapshotted under the new key
            for (auto &[coord, chunk] : mirror.chunks)
            {
                (void)coord;
                render.ReleaseChunkBuffer(chunk);
            }
            mirror.chunks.clear();
        }

        mirror.geometry = desc.geometry;
        mirror.transform = desc.transform;
        mirror.texture = desc.texture;
        mirror.material = desc.material;
        mirror.layerOpacities = desc.layerOpacities;
        mirror.flip = desc.flip;
        mirror.animations = desc.animations;
        mirror.chunkSize = desc.chunkSize;
        mirror.revision = tilemap->GetRevision();
        ++stats.tilemapsExtracted;
    }
}

void ExtractStage::ExtractContent(TilemapWorld &world, RenderWorld &render, FrameStats &stats)
{
    for (auto &[id, tilemap] : world.GetTilemaps())
    {
        ExtractedTilemap *mirror = render.FindTilemap(id);
        if (!mirror)
            continue;

        ChunkedTileStorage &storage = tilemap->GetStorage();

        auto release = [&](glm::ivec2 coord)
        {
            auto it = mirror->chunks.find(coord);
            if (it == mirror->chunks.end())
                return;
            render.ReleaseChunkBuffer(it->second);
            mirror->chunks.erase(it);
        };

        for (const glm::ivec2 &coord : storage.TakeReleasedChunks())
            release(coord);

        for (const glm::ivec2 &coord : storage.TakeDirtyChunks())
        {
            const TileChunk *chunk = storage.GetChunk(coord);
            if (!chunk || chunk->IsEmpty())
            {
                release(coord);
                continue;
            }

            auto [it, inserted] = mirror->chunks.try_emplace(coord);
            RenderChunk &rc = it->second;
            if (inserted)
            {
                rc.key = mirror->MakeKey(coord);
                rc.state = ChunkState::Populated;
            }
            else if (rc.state != ChunkState::Populated)
            {
                rc.state = ChunkState::Dirty;
            }

            rc.tiles.clear();
            rc.tiles.reserve(static_cast<std::size_t>(chunk->GetTileCount()));
            chunk->ForEachTile([&rc](const Tile &tile) { rc.tiles.push_back(tile); });
            rc.hasAnimation = chunk->HasAnimation();
            ++stats.chunksExtracted;
        }
    }
}
