#include "TilemapRenderPipeline.h"

#include <iostream>

TilemapRenderPipeline::TilemapRenderPipeline(const RenderSettings &settings, const TextureRegistry &textures,
                                             IGpuUploader &uploader)
    : m_Settings(settings)
    , m_Textures(textures)
    , m_Uploader(uploader)
    , m_Culling(settings.cullingMargin)
    , m_Prepare(settings.ResolvePrepareThreads())
{
    std::cout << "[Pipeline] Culling margin " << m_Culling.GetMargin()
              << ", " << m_Prepare.GetWorkerCount() << " prepare worker(s)" << std::endl;
}

void TilemapRenderPipeline::ApplySettings(const RenderSettings &settings)
{
    m_Settings = settings;
    m_Culling.SetMargin(settings.cullingMargin);
    m_Prepare.SetWorkerCount(settings.ResolvePrepareThreads());
}

FrameStats TilemapRenderPipeline::RenderFrame(TilemapWorld &world, const std::vector<Camera> &cameras,
                                              const FrameClock &clock)
{
    FrameStats stats;

    m_Extract.Run(world, m_Textures, cameras, clock, m_RenderWorld, m_Uploader, stats);
    m_Culling.Run(m_RenderWorld, stats);
    m_Prepare.Run(m_RenderWorld, m_Uploader, stats);
    m_Queue.Run(m_RenderWorld, stats);

    if (m_Settings.verboseLogging)
        std::cout << "[Pipeline] Frame " << m_FrameCount << ": " << stats << std::endl;

    ++m_FrameCount;
    m_LastStats = stats;
    return stats;
}

const std::vector<DrawSubmission> &TilemapRenderPipeline::GetDraws(uint32_t cameraId) const
{
    static const std::vector<DrawSubmission> empty;
    const CameraView *view = m_RenderWorld.FindView(cameraId);
    return view ? view->draws : empty;
}
