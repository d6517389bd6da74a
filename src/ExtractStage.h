#pragma once

#include "Camera.h"
#include "FrameClock.h"
#include "FrameStats.h"
#include "IGpuUploader.h"
#include "RenderWorld.h"
#include "TextureRegistry.h"
#include "TilemapWorld.h"

#include <vector>

/**
 * @class ExtractStage
 * @brief One-directional per-frame copy of simulation state into the RenderWorld.
 * @ingroup Pipeline
 *
 * Runs first in every frame, in three steps:
 * 1. **Flush**: hand the releases queued by the previous frame to the uploader.
 * 2. **Structural pass**: drop despawned tilemaps, mirror new tilemaps and
 *    copy changed descriptors.
 * 3. **Content pass**: snapshot dirty chunks and queue released ones.
 *
 * The structural pass always completes before the content pass, so a
 * tilemap created in the same frame as its tiles is resolved regardless of
 * the order in which the host issued the calls.
 *
 * Change detection uses the storage's dirty and released sets and the
 * tilemap descriptor revision; nothing is diffed.
 */
class ExtractStage
{
public:
    /**
     * @brief Run extraction.
     *
     * @throws TilemapError (MissingTexture) if a tilemap is bound to a texture
     *         handle the registry does not know.
     */
    void Run(TilemapWorld& world, const TextureRegistry& textures,
             const std::vector<Camera>& cameras, const FrameClock& clock,
             RenderWorld& render, IGpuUploader& uploader, FrameStats& stats);

private:
    void FlushReleases(RenderWorld& render, IGpuUploader& uploader, FrameStats& stats);
    void ExtractStructure(TilemapWorld& world, const TextureRegistry& textures,
                          RenderWorld& render, FrameStats& stats);
    void ExtractContent(TilemapWorld& world, RenderWorld& render, FrameStats& stats);
};
