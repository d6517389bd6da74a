#include "PrepareStage.h"
#include "ChunkMeshBuilder.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>
#include <unordered_set>

PrepareStage::PrepareStage(int workerCount)
    : m_WorkerCount(std::max(1, workerCount))
{
}

void PrepareStage::SetWorkerCount(int workerCount)
{
    m_WorkerCount = std::max(1, workerCount);
}

void PrepareStage::Run(RenderWorld &render, IGpuUploader &uploader, FrameStats &stats)
{
    UploadUniforms(render, uploader, stats);

    // Union of the per-camera visible sets, first-seen order
    std::vector<RenderChunkKey> visible;
    std::unordered_set<RenderChunkKey, RenderChunkKeyHash> seen;
    for (const CameraView &view : render.GetViews())
    {
        for (const RenderChunkKey &key : view.visible)
        {
            if (seen.insert(key).second)
                visible.push_back(key);
        }
    }

    std::vector<BuildJob> jobs;
    for (const RenderChunkKey &key : visible)
    {
        RenderChunk *chunk = render.FindChunk(key);
        if (!chunk || !chunk->NeedsBuild())
            continue;
        const ExtractedTilemap *tilemap = render.FindTilemap(key.tilemap);
        jobs.push_back({chunk, &tilemap->geometry});
    }

    BuildMeshes(jobs);

    for (const BuildJob &job : jobs)
    {
        RenderChunk &chunk = *job.chunk;
        ++chunk.buildCount;
        ++stats.chunksRebuilt;

        if (chunk.mesh.IsEmpty())
        {
            render.ReleaseChunkBuffer(chunk);
            chunk.state = ChunkState::Empty;
            continue;
        }

        uploader.UploadChunk(chunk.key, chunk.mesh);
        chunk.hasBuffer = true;
        chunk.state = ChunkState::Clean;
        ++stats.chunksUploaded;
    }

    PatchAnimations(render, visible, uploader, stats);
}

void PrepareStage::BuildMeshes(const std::vector<BuildJob> &jobs) const
{
    if (jobs.empty())
        return;

    const int workers = std::min<int>(m_WorkerCount, static_cast<int>(jobs.size()));
    if (workers <= 1)
    {
        for (const BuildJob &job : jobs)
            BuildChunkMesh(*job.geometry, job.chunk->tiles, job.chunk->mesh);
        return;
    }

    std::atomic<std::size_t> next{0};
    std::vector<std::exception_ptr> errors(static_cast<std::size_t>(workers));
    std::vector<std::thread> threads;
    threads.reserve(static_cast<std::size_t>(workers));

    for (int w = 0; w < workers; ++w)
    {
        threads.emplace_back([&jobs, &next, &errors, w]
        {
            try
            {
                for (std::size_t i = next.fetch_add(1); i < jobs.size(); i = next.fetch_add(1))
                    BuildChunkMesh(*jobs[i].geometry, jobs[i].chunk->tiles, jobs[i].chunk->mesh);
            }
            catch (...)
            {
                errors[static_cast<std::size_t>(w)] = std::current_exception();
            }
        });
    }

    for (std::thread &t : threads)
        t.join();

    for (const std::exception_ptr &error : errors)
    {
        if (error)
            std::rethrow_exception(error);
    }
}

void PrepareStage::UploadUniforms(RenderWorld &render, IGpuUploader &uploader, FrameStats &stats) const
{
    for (auto &[id, tilemap] : render.GetTilemaps())
    {
        if (tilemap.uploadedRevision == tilemap.revision)
            continue;
        uploader.UploadUniform(id, tilemap.BuildUniform());
        tilemap.uploadedRevision = tilemap.revision;
        ++stats.uniformsUploaded;
    }
}

void PrepareStage::PatchAnimations(RenderWorld &render, const std::vector<RenderChunkKey> &visible,
                                   IGpuUploader &uploader, FrameStats &stats) const
{
    const float time = render.GetTime();

    for (const RenderChunkKey &key : visible)
    {
        const RenderChunk *chunk = render.FindChunk(key);
        if (!chunk || !chunk->hasBuffer || !chunk->hasAnimation || !chunk->mesh.HasAnimation())
            continue;

        const ExtractedTilemap *tilemap = render.FindTilemap(key.tilemap);

        AnimationPatch patch;
        patch.key = key;
        patch.lanes.reserve(chunk->mesh.animatedLayers.size());
        for (const AnimatedLayerRef &ref : chunk->mesh.animatedLayers)
        {
            int frame = -1;
            if (ref.animationId >= 0 && static_cast<std::size_t>(ref.animationId) < tilemap->animations.size())
                frame = tilemap->animations[ref.animationId].GetFrameAtTime(time);
            patch.lanes.push_back({ref.firstVertex, ref.layer, frame});
        }

        uploader.PatchAnimation(patch);
        ++stats.animationPatches;
    }
}
