#include "ChunkMeshBuilder.h"

void BuildChunkMesh(const GridGeometry &geometry, const std::vector<Tile> &tiles, ChunkMesh &out)
{
    out.Clear();
    out.vertices.reserve(tiles.size() * 4);
    out.indices.reserve(tiles.size() * 6);

    const glm::vec2 half = geometry.renderSize * 0.5f;
    const glm::vec2 offsets[4] = {
        glm::vec2(-half.x, -half.y),
        glm::vec2(half.x, -half.y),
        glm::vec2(half.x, half.y),
        glm::vec2(-half.x, half.y),
    };

    for (const Tile &tile : tiles)
    {
        if (!tile.visible || tile.GetLayerCount() == 0)
            continue;

        ChunkVertex v;
        v.gridIndex = tile.index;
        v.color = tile.color;
        for (int layer = 0; layer < MAX_LAYER_COUNT; ++layer)
        {
            const TileLayer &src = tile.layers[layer];
            v.textureIndices[layer] = src.IsAnimated() ? -1 : src.textureIndex;
            v.animations[layer] = src.animationId;
            v.flips[layer] = src.flip;
        }

        const uint32_t base = static_cast<uint32_t>(out.vertices.size());
        const glm::vec2 center = CellToLocal(geometry, tile.index);
        for (const glm::vec2 &offset : offsets)
        {
            v.position = glm::vec3(center + offset, 0.0f);
            out.vertices.push_back(v);
        }

        out.indices.push_back(base + 0);
        out.indices.push_back(base + 1);
        out.indices.push_back(base + 2);
        out.indices.push_back(base + 0);
        out.indices.push_back(base + 2);
        out.indices.push_back(base + 3);

        for (int layer = 0; layer < MAX_LAYER_COUNT; ++layer)
        {
            if (tile.layers[layer].IsAnimated())
                out.animatedLayers.push_back({base, layer, tile.layers[layer].animationId});
        }
    }
}

ChunkMesh BuildChunkMesh(const GridGeometry &geometry, const std::vector<Tile> &tiles)
{
    ChunkMesh mesh;
    BuildChunkMesh(geometry, tiles, mesh);
    return mesh;
}
