#pragma once

#include "FrameStats.h"
#include "IGpuUploader.h"
#include "RenderWorld.h"

/**
 * @class QueueStage
 * @brief Emits the sorted draw list of every camera.
 * @ingroup Pipeline
 *
 * One DrawSubmission per visible chunk that has an uploaded, non-empty
 * buffer and whose tilemap texture is ready. Tilemaps with a pending
 * texture are counted in FrameStats::tilemapsDeferred and retried next
 * frame.
 *
 * Read-only with respect to chunks and tilemaps; only the views' draw
 * lists are written.
 */
class QueueStage
{
public:
    void Run(RenderWorld& render, FrameStats& stats) const;

    /// Draw order by DrawSortKey: z-index, then tilemap id, then chunk row, then column.
    static bool DrawsBefore(const DrawSubmission& a, const DrawSubmission& b);
};
