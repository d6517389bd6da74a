#pragma once

#include "FrameStats.h"
#include "IGpuUploader.h"
#include "RenderWorld.h"

#include <vector>

/**
 * @class PrepareStage
 * @brief Rebuilds and uploads chunk buffers, uniforms and animation patches.
 * @ingroup Pipeline
 *
 * @par Chunk Rebuilds
 * A chunk is rebuilt when it is visible to at least one camera and
 * NeedsBuild() holds (never built, or its snapshot changed). Invisible dirty
 * chunks stay dirty until a camera sees them.
 *
 * Mesh builds run on worker threads; each worker writes only the meshes of
 * the chunks it was handed, so no locking is needed. Uploads happen
 * afterwards on the calling thread, in visible-set order.
 *
 * A build that produces no geometry (every tile hidden) uploads nothing; if
 * the chunk had a buffer it is queued for release.
 *
 * @par Uniforms
 * Uploaded for every mirrored tilemap whose descriptor revision differs from
 * the last uploaded one, visible or not.
 *
 * @par Animation
 * Every frame, each visible chunk with animated layers and an uploaded
 * buffer receives an AnimationPatch holding the current frame of each
 * animated lane. Chunks without animation are skipped.
 */
class PrepareStage
{
public:
    /// @param workerCount Mesh build threads; values below 1 mean 1.
    explicit PrepareStage(int workerCount = 1);

    void SetWorkerCount(int workerCount);
    int GetWorkerCount() const { return m_WorkerCount; }

    void Run(RenderWorld& render, IGpuUploader& uploader, FrameStats& stats);

private:
    struct BuildJob
    {
        RenderChunk* chunk;
        const GridGeometry* geometry;
    };

    void BuildMeshes(const std::vector<BuildJob>& jobs) const;
    void UploadUniforms(RenderWorld& render, IGpuUploader& uploader, FrameStats& stats) const;
    void PatchAnimations(RenderWorld& render, const std::vector<RenderChunkKey>& visible,
                         IGpuUploader& uploader, FrameStats& stats) const;

    int m_WorkerCount;
};
