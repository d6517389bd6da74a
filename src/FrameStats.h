#pragma once

#include <cstddef>
#include <ostream>

/**
 * @struct FrameStats
 * @brief Counters collected by the pipeline stages during one frame.
 * @ingroup Pipeline
 */
struct FrameStats
{
    // Extraction
    std::size_t tilemapsExtracted = 0;  ///< Tilemaps mirrored this frame
    std::size_t chunksExtracted = 0;    ///< Dirty chunks snapshotted
    std::size_t chunksReleased = 0;     ///< Chunk buffers handed to the uploader for release
    std::size_t tilemapsReleased = 0;   ///< Uniforms handed to the uploader for release

    // Culling
    std::size_t chunksTested = 0;       ///< Chunk/camera intersection tests
    std::size_t chunksVisible = 0;      ///< Sum of visible set sizes over cameras

    // Prepare
    std::size_t chunksRebuilt = 0;
    std::size_t chunksUploaded = 0;
    std::size_t uniformsUploaded = 0;
    std::size_t animationPatches = 0;

    // Queue
    std::size_t drawSubmissions = 0;
    std::size_t tilemapsDeferred = 0;   ///< Tilemaps skipped because their texture is not ready
};

inline std::ostream& operator<<(std::ostream& os, const FrameStats& s)
{
    os << "extract " << s.chunksExtracted << " chunks/" << s.tilemapsExtracted << " maps"
       << ", release " << s.chunksReleased
       << ", visible " << s.chunksVisible << "/" << s.chunksTested
       << ", rebuild " << s.chunksRebuilt
       << ", uniforms " << s.uniformsUploaded
       << ", anim " << s.animationPatches
       << ", draws " << s.drawSubmissions
       << ", deferred " << s.tilemapsDeferred;
    return os;
}
