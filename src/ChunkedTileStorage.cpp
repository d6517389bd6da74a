#include "ChunkedTileStorage.h"
#include "TilemapError.h"

#include <algorithm>
#include <cstdint>
#include <string>

ChunkedTileStorage::ChunkedTileStorage(int chunkSize)
    : m_ChunkSize(chunkSize)
{
    if (m_ChunkSize <= 0)
    {
        throw TilemapError(TilemapErrorKind::InvalidDescriptor,
                           "chunk size must be positive, got " + std::to_string(chunkSize));
    }
}

bool ChunkedTileStorage::Accepts(glm::ivec2 coord) const
{
    if (!m_EnforceBounds || !m_Bounds)
        return true;
    return m_Bounds->Contains(coord);
}

TileChunk &ChunkedTileStorage::GetOrCreateChunk(glm::ivec2 chunkCoord)
{
    auto it = m_Chunks.find(chunkCoord);
    if (it == m_Chunks.end())
    {
        it = m_Chunks.emplace(chunkCoord, TileChunk(chunkCoord, m_ChunkSize)).first;
    }
    return it->second;
}

void ChunkedTileStorage::MarkDirty(glm::ivec2 chunkCoord)
{
    m_ReleasedChunks.erase(chunkCoord);
    m_DirtyChunks.insert(chunkCoord);
}

void ChunkedTileStorage::MarkEmptied(glm::ivec2 chunkCoord)
{
    m_DirtyChunks.erase(chunkCoord);
    m_ReleasedChunks.insert(chunkCoord);
}

template<typename Fn>
void ChunkedTileStorage::ForEachChunkSpan(const TileArea &area, Fn &&fn) const
{
    if (area.IsEmpty())
        return;

    glm::ivec2 c0 = CellToChunk(area.origin, m_ChunkSize);
    glm::ivec2 c1 = CellToChunk(area.dest, m_ChunkSize);

    // 64-bit counters: the last chunk may sit at INT_MAX
    for (int64_t cy = c0.y; cy <= c1.y; ++cy)
    {
        for (int64_t cx = c0.x; cx <= c1.x; ++cx)
        {
            glm::ivec2 chunkCoord(static_cast<int>(cx), static_cast<int>(cy));
            TileArea cells = ChunkCellArea(chunkCoord, m_ChunkSize);
            TileArea span;
            span.origin = glm::max(area.origin, cells.origin);
            span.dest = glm::min(area.dest, cells.dest);
            fn(chunkCoord, span);
        }
    }
}

template<typename Fn>
void ChunkedTileStorage::ForEachAllocatedChunkSpan(const TileArea &area, Fn &&fn) const
{
    if (area.IsEmpty())
        return;

    glm::ivec2 c0 = CellToChunk(area.origin, m_ChunkSize);
    glm::ivec2 c1 = CellToChunk(area.dest, m_ChunkSize);
    const int64_t gridCount = (static_cast<int64_t>(c1.x) - c0.x + 1) * (static_cast<int64_t>(c1.y) - c0.y + 1);

    if (gridCount <= static_cast<int64_t>(m_Chunks.size()))
    {
        ForEachChunkSpan(area, fn);
        return;
    }

    // Sparse storage under a large area: walk the allocated chunks instead of the grid
    std::vector<glm::ivec2> coords;
    for (const auto &[coord, chunk] : m_Chunks)
    {
        (void)chunk;
        if (coord.x >= c0.x && coord.x <= c1.x && coord.y >= c0.y && coord.y <= c1.y)
            coords.push_back(coord);
    }
    std::sort(coords.begin(), coords.end(), [](glm::ivec2 a, glm::ivec2 b)
    {
        return a.y != b.y ? a.y < b.y : a.x < b.x;
    });

    for (const glm::ivec2 &chunkCoord : coords)
    {
        TileArea cells = ChunkCellArea(chunkCoord, m_ChunkSize);
        TileArea span;
        span.origin = glm::max(area.origin, cells.origin);
        span.dest = glm::min(area.dest, cells.dest);
        fn(chunkCoord, span);
    }
}

void ChunkedTileStorage::Set(glm::ivec2 coord, const TileBuilder &builder)
{
    if (!Accepts(coord))
        return;

    glm::ivec2 chunkCoord = CellToChunk(coord, m_ChunkSize);
    TileChunk &chunk = GetOrCreateChunk(chunkCoord);
    if (!chunk.Set(CellToChunkLocal(coord, m_ChunkSize), builder.Build(coord)))
        ++m_TileCount;

    m_Aabb.Expand(coord);
    MarkDirty(chunkCoord);
}

void ChunkedTileStorage::FillRect(const TileArea &area, const TileBuilder &builder)
{
    TileArea target = area;
    if (m_EnforceBounds && m_Bounds)
        target = m_Bounds->Clip(area);
    if (target.IsEmpty())
        return;

    Tile tile = builder.Build(target.origin);

    ForEachChunkSpan(target, [&](glm::ivec2 chunkCoord, const TileArea &span)
    {
        TileChunk &chunk = GetOrCreateChunk(chunkCoord);

        for (int64_t y = span.origin.y; y <= span.dest.y; ++y)
        {
            for (int64_t x = span.origin.x; x <= span.dest.x; ++x)
            {
                tile.index = glm::ivec2(static_cast<int>(x), static_cast<int>(y));
                if (!chunk.Set(CellToChunkLocal(tile.index, m_ChunkSize), tile))
                    ++m_TileCount;
            }
        }
        MarkDirty(chunkCoord);
    });

    m_Aabb.Expand(target.origin);
    m_Aabb.Expand(target.dest);
}

void ChunkedTileStorage::UpdateRect(const TileArea &area, const TileUpdater &updater)
{
    // Nothing exists outside the written extent
    if (m_Aabb.IsEmpty())
        return;

    ForEachAllocatedChunkSpan(m_Aabb.Clip(area), [&](glm::ivec2 chunkCoord, const TileArea &span)
    {
        auto it = m_Chunks.find(chunkCoord);
        if (it == m_Chunks.end() || it->second.IsEmpty())
            return;

        TileChunk &chunk = it->second;
        bool touched = false;

        for (int64_t y = span.origin.y; y <= span.dest.y; ++y)
        {
            for (int64_t x = span.origin.x; x <= span.dest.x; ++x)
            {
                const glm::ivec2 cell(static_cast<int>(x), static_cast<int>(y));
                Tile *tile = chunk.GetMutable(CellToChunkLocal(cell, m_ChunkSize));
                if (!tile)
                    continue;

                bool hadAnimation = tile->HasAnimation();
                try
                {
                    updater.Apply(*tile);
                }
                catch (const TilemapError &e)
                {
                    if (touched)
                        MarkDirty(chunkCoord);
                    throw e.WithContext(m_Owner, cell);
                }
                chunk.OnTileEdited(hadAnimation, tile->HasAnimation());
                touched = true;
            }
        }

        if (touched)
            MarkDirty(chunkCoord);
    });
}

bool ChunkedTileStorage::Update(glm::ivec2 coord, const TileUpdater &updater)
{
    if (!Get(coord))
        return false;
    UpdateRect(TileArea(coord, glm::uvec2(1, 1)), updater);
    return true;
}

bool ChunkedTileStorage::Remove(glm::ivec2 coord)
{
    glm::ivec2 chunkCoord = CellToChunk(coord, m_ChunkSize);
    auto it = m_Chunks.find(chunkCoord);
    if (it == m_Chunks.end())
        return false;

    if (!it->second.Remove(CellToChunkLocal(coord, m_ChunkSize)))
        return false;

    --m_TileCount;
    if (it->second.IsEmpty())
        MarkEmptied(chunkCoord);
    else
        MarkDirty(chunkCoord);
    return true;
}

std::size_t ChunkedTileStorage::RemoveRect(const TileArea &area)
{
    std::size_t removed = 0;
    if (m_Aabb.IsEmpty())
        return removed;

    ForEachAllocatedChunkSpan(m_Aabb.Clip(area), [&](glm::ivec2 chunkCoord, const TileArea &span)
    {
        auto it = m_Chunks.find(chunkCoord);
        if (it == m_Chunks.end() || it->second.IsEmpty())
            return;

        TileChunk &chunk = it->second;
        std::size_t before = removed;

        for (int64_t y = span.origin.y; y <= span.dest.y; ++y)
            for (int64_t x = span.origin.x; x <= span.dest.x; ++x)
                if (chunk.Remove(CellToChunkLocal(glm::ivec2(static_cast<int>(x), static_cast<int>(y)), m_ChunkSize)))
                    ++removed;

        if (removed == before)
            return;
        if (chunk.IsEmpty())
            MarkEmptied(chunkCoord);
        else
            MarkDirty(chunkCoord);
    });

    m_TileCount -= removed;
    return removed;
}

void ChunkedTileStorage::Despawn()
{
    for (const auto &[coord, chunk] : m_Chunks)
    {
        (void)chunk;
        m_ReleasedChunks.insert(coord);
    }
    m_DirtyChunks.clear();
    m_Chunks.clear();
    m_Aabb = IAabb2d{};
    m_TileCount = 0;
}

const Tile *ChunkedTileStorage::Get(glm::ivec2 coord) const
{
    glm::ivec2 chunkCoord = CellToChunk(coord, m_ChunkSize);
    auto it = m_Chunks.find(chunkCoord);
    if (it == m_Chunks.end())
        return nullptr;
    return it->second.Get(CellToChunkLocal(coord, m_ChunkSize));
}

const TileChunk *ChunkedTileStorage::GetChunk(glm::ivec2 chunkCoord) const
{
    auto it = m_Chunks.find(chunkCoord);
    return it == m_Chunks.end() ? nullptr : &it->second;
}

void ChunkedTileStorage::SetBounds(const IAabb2d &bounds, bool enforce)
{
    m_Bounds = bounds;
    m_EnforceBounds = enforce;
}

void ChunkedTileStorage::ClearBounds()
{
    m_Bounds.reset();
    m_EnforceBounds = false;
}

std::vector<glm::ivec2> ChunkedTileStorage::TakeDirtyChunks()
{
    std::vector<glm::ivec2> out(m_DirtyChunks.begin(), m_DirtyChunks.end());
    m_DirtyChunks.clear();
    for (const glm::ivec2 &coord : out)
    {
        auto it = m_Chunks.find(coord);
        if (it != m_Chunks.end())
            it->second.ClearDirty();
    }
    return out;
}

std::vector<glm::ivec2> ChunkedTileStorage::TakeReleasedChunks()
{
    std::vector<glm::ivec2> out(m_ReleasedChunks.begin(), m_ReleasedChunks.end());
    m_ReleasedChunks.clear();
    for (const glm::ivec2 &coord : out)
    {
        auto it = m_Chunks.find(coord);
        if (it != m_Chunks.end())
            it->second.ClearDirty();
    }
    return out;
}

void ChunkedTileStorage::MarkAllDirty()
{
    for (auto &[coord, chunk] : m_Chunks)
    {
        if (chunk.IsEmpty())
            continue;
        chunk.MarkDirty();
        MarkDirty(coord);
    }
}
