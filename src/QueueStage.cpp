#include "QueueStage.h"

#include <algorithm>
#include <unordered_set>

bool QueueStage::DrawsBefore(const DrawSubmission &a, const DrawSubmission &b)
{
    return a.sortKey < b.sortKey;
}

void QueueStage::Run(RenderWorld &render, FrameStats &stats) const
{
    std::unordered_set<TilemapId> deferred;

    for (CameraView &view : render.GetViews())
    {
        view.draws.clear();

        for (const RenderChunkKey &key : view.visible)
        {
            const ExtractedTilemap *tilemap = render.FindTilemap(key.tilemap);
            const RenderChunk *chunk = render.FindChunk(key);
            if (!tilemap || !chunk)
                continue;

            if (!tilemap->textureReady)
            {
                deferred.insert(key.tilemap);
                continue;
            }
            if (!chunk->hasBuffer || chunk->mesh.IsEmpty() || chunk->NeedsBuild())
                continue;

            DrawSubmission draw;
            draw.key = key;
            draw.indexCount = chunk->mesh.GetIndexCount();
            draw.sortKey = DrawSortKey::For(key, tilemap->transform.zIndex);
            view.draws.push_back(draw);
        }

        std::stable_sort(view.draws.begin(), view.draws.end(), DrawsBefore);
        stats.drawSubmissions += view.draws.size();
    }

    stats.tilemapsDeferred = deferred.size();
}
