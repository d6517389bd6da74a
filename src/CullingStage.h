#pragma once

#include "FrameStats.h"
#include "RenderWorld.h"

/**
 * @class CullingStage
 * @brief Per-camera visibility of render chunks.
 * @ingroup Pipeline
 *
 * For every camera view and every mirrored chunk, the chunk's world AABB
 * (ChunkWorldAabb()) is tested against the camera rectangle grown by the
 * culling margin. Passing keys form the view's visible set, in tilemap id
 * then row-major chunk order.
 *
 * Culling never touches chunk buffers: a culled chunk keeps whatever it
 * last built and is reused as-is when it comes back into view.
 */
class CullingStage
{
public:
    explicit CullingStage(float margin = 32.0f)
        : m_Margin(margin)
    {
    }

    void SetMargin(float margin) { m_Margin = margin; }
    float GetMargin() const { return m_Margin; }

    void Run(RenderWorld& render, FrameStats& stats) const;

private:
    float m_Margin;
};
