#include "CullingStage.h"
#include "CoordinateMapping.h"

#include <algorithm>

void CullingStage::Run(RenderWorld &render, FrameStats &stats) const
{
    for (CameraView &view : render.GetViews())
    {
        view.visible.clear();
        view.draws.clear();
        if (!view.camera.active)
            continue;

        const Aabb2d viewRect = view.camera.GetViewRect(m_Margin);

        for (const auto &[id, tilemap] : render.GetTilemaps())
        {
            (void)id;
            const std::size_t first = view.visible.size();

            for (const auto &[coord, chunk] : tilemap.chunks)
            {
                ++stats.chunksTested;
                Aabb2d bounds = ChunkWorldAabb(tilemap.geometry, tilemap.transform, coord, tilemap.chunkSize);
                if (bounds.Intersects(viewRect))
                    view.visible.push_back(chunk.key);
            }

            // Hash map order is arbitrary; keep the visible set deterministic
            std::sort(view.visible.begin() + static_cast<std::ptrdiff_t>(first), view.visible.end(),
                      [](const RenderChunkKey &a, const RenderChunkKey &b)
                      {
                          if (a.chunk.y != b.chunk.y)
                              return a.chunk.y < b.chunk.y;
                          return a.chunk.x < b.chunk.x;
                      });
        }

        stats.chunksVisible += view.visible.size();
    }
}
