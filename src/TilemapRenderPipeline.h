#pragma once

#include "Camera.h"
#include "CullingStage.h"
#include "ExtractStage.h"
#include "FrameClock.h"
#include "FrameStats.h"
#include "IGpuUploader.h"
#include "PrepareStage.h"
#include "QueueStage.h"
#include "RenderSettings.h"
#include "RenderWorld.h"
#include "TextureRegistry.h"
#include "TilemapWorld.h"

#include <cstdint>
#include <vector>

/**
 * @class TilemapRenderPipeline
 * @brief Drives Extraction, Culling, Prepare and Queue once per frame.
 * @ingroup Pipeline
 *
 * The pipeline owns the RenderWorld. The host owns the TilemapWorld, the
 * TextureRegistry, the FrameClock and the uploader, and calls RenderFrame()
 * once per frame:
 *
 * @code{.cpp}
 * TilemapRenderPipeline pipeline(settings, textures, uploader);
 * while (running)
 * {
 *     clock.Update(deltaTime);
 *     EditTiles(world);
 *     pipeline.RenderFrame(world, cameras, clock);
 *     for (const CameraView& view : pipeline.GetRenderWorld().GetViews())
 *         host.Draw(view.draws);
 * }
 * @endcode
 *
 * @par Synchronization
 * Extraction is the only stage that reads the TilemapWorld. Once
 * RenderFrame() has returned from extraction the host may edit tiles again;
 * the remaining stages read only the mirror.
 */
class TilemapRenderPipeline
{
public:
    TilemapRenderPipeline(const RenderSettings& settings, const TextureRegistry& textures,
                          IGpuUploader& uploader);

    /**
     * @brief Run every stage for one frame.
     * @return Counters collected by the stages.
     * @throws TilemapError (MissingTexture) from extraction.
     */
    FrameStats RenderFrame(TilemapWorld& world, const std::vector<Camera>& cameras, const FrameClock& clock);

    /// Apply new settings (culling margin, worker count, logging) from the next frame on.
    void ApplySettings(const RenderSettings& settings);

    [[nodiscard]] const RenderWorld& GetRenderWorld() const { return m_RenderWorld; }

    /// Draw list of a camera for the last frame (empty for unknown ids).
    [[nodiscard]] const std::vector<DrawSubmission>& GetDraws(uint32_t cameraId) const;

    [[nodiscard]] uint64_t GetFrameCount() const { return m_FrameCount; }
    [[nodiscard]] const FrameStats& GetLastStats() const { return m_LastStats; }

private:
    RenderSettings m_Settings;
    const TextureRegistry& m_Textures;
    IGpuUploader& m_Uploader;

    RenderWorld m_RenderWorld;
    ExtractStage m_Extract;
    CullingStage m_Culling;
    PrepareStage m_Prepare;
    QueueStage m_Queue;

    uint64_t m_FrameCount{0};
    FrameStats m_LastStats;
};
