#pragma once

#include "TileTypes.h"

#include <glm/glm.hpp>

#include <cstddef>
#include <optional>
#include <vector>

/**
 * @class TileChunk
 * @brief Dense slot arena holding the tiles of one chunkSize x chunkSize block.
 * @ingroup Storage
 *
 * A chunk owns every tile whose cell satisfies
 * `floor(cell / chunkSize) == coord`. Slots are addressed by the cell's
 * chunk-local coordinate, so a lookup is a single index computation.
 *
 * @par Memory Layout
 * Slots are stored in row-major order:
 * @code
 *     local x:  0   1   2   3
 *            +---+---+---+---+
 *   local y0 | 0 | 1 | 2 | 3 |
 *            +---+---+---+---+
 *   local y1 | 4 | 5 | 6 | 7 |
 *            +---+---+---+---+
 * @endcode
 * Index formula: `i = y * chunkSize + x`.
 *
 * @par Bounds Handling
 * - **Read**: Out-of-range local coordinates return `nullptr`
 * - **Write**: Out-of-range local coordinates are silently ignored
 *
 * @par Emptied Chunks
 * Removing the last tile leaves the slot arena allocated so that refilling
 * the chunk does not reallocate. The owning storage decides when to release.
 *
 * @par Thread Safety
 * Not thread-safe. Concurrent reads are safe; writes require synchronization.
 */
class TileChunk
{
public:
    TileChunk() = default;

    TileChunk(glm::ivec2 coord, int chunkSize)
        : m_Coord(coord)
        , m_Size(chunkSize)
        , m_Slots(static_cast<std::size_t>(chunkSize) * static_cast<std::size_t>(chunkSize))
    {
    }

    TileChunk(TileChunk&&) noexcept = default;
    TileChunk& operator=(TileChunk&&) noexcept = default;
    TileChunk(const TileChunk&) = default;
    TileChunk& operator=(const TileChunk&) = default;

    /**
     * @brief Tile at a chunk-local coordinate.
     * @return Pointer to the tile, or `nullptr` if empty or out of range.
     */
    [[nodiscard]] const Tile* Get(glm::ivec2 local) const noexcept
    {
        if (!InRange(local))
            return nullptr;
        const auto& slot = m_Slots[SlotIndex(local)];
        return slot ? &*slot : nullptr;
    }

    /// Mutable variant of Get().
    [[nodiscard]] Tile* GetMutable(glm::ivec2 local) noexcept
    {
        if (!InRange(local))
            return nullptr;
        auto& slot = m_Slots[SlotIndex(local)];
        return slot ? &*slot : nullptr;
    }

    /**
     * @brief Insert or replace a tile and mark the chunk dirty.
     * @return `true` if a previous tile was replaced.
     */
    bool Set(glm::ivec2 local, const Tile& tile)
    {
        if (!InRange(local))
            return false;
        auto& slot = m_Slots[SlotIndex(local)];
        bool replaced = slot.has_value();
        if (replaced)
            Forget(*slot);
        slot = tile;
        ++m_TileCount;
        if (tile.HasAnimation())
            ++m_AnimatedCount;
        m_Dirty = true;
        return replaced;
    }

    /**
     * @brief Remove a tile and mark the chunk dirty.
     * @return `true` if a tile was removed, `false` if the slot was empty.
     */
    bool Remove(glm::ivec2 local)
    {
        if (!InRange(local))
            return false;
        auto& slot = m_Slots[SlotIndex(local)];
        if (!slot)
            return false;
        Forget(*slot);
        slot.reset();
        m_Dirty = true;
        return true;
    }

    /**
     * @brief Re-count animation flags after an in-place edit of a tile.
     *
     * Call with the tile's state before and after the edit.
     */
    void OnTileEdited(bool hadAnimation, bool hasAnimation) noexcept
    {
        if (hadAnimation && !hasAnimation)
            --m_AnimatedCount;
        else if (!hadAnimation && hasAnimation)
            ++m_AnimatedCount;
        m_Dirty = true;
    }

    /// Drop every tile, keeping the slot arena.
    void Clear()
    {
        for (auto& slot : m_Slots)
            slot.reset();
        m_TileCount = 0;
        m_AnimatedCount = 0;
        m_Dirty = true;
    }

    /**
     * @brief Visit every tile in row-major order.
     * @param fn Callable taking `const Tile&`.
     */
    template<typename Fn>
    void ForEachTile(Fn&& fn) const
    {
        if (m_TileCount == 0)
            return;
        for (const auto& slot : m_Slots)
            if (slot)
                fn(*slot);
    }

    /// Cells covered by this chunk.
    [[nodiscard]] TileArea GetCellArea() const noexcept
    {
        return ChunkCellArea(m_Coord, m_Size);
    }

    [[nodiscard]] glm::ivec2 GetCoord() const noexcept { return m_Coord; }
    [[nodiscard]] int GetSize() const noexcept { return m_Size; }
    [[nodiscard]] int GetTileCount() const noexcept { return m_TileCount; }
    [[nodiscard]] bool IsEmpty() const noexcept { return m_TileCount == 0; }
    [[nodiscard]] bool HasAnimation() const noexcept { return m_AnimatedCount > 0; }

    [[nodiscard]] bool IsDirty() const noexcept { return m_Dirty; }
    void MarkDirty() noexcept { m_Dirty = true; }
    void ClearDirty() noexcept { m_Dirty = false; }

private:
    [[nodiscard]] bool InRange(glm::ivec2 local) const noexcept
    {
        return local.x >= 0 && local.x < m_Size && local.y >= 0 && local.y < m_Size;
    }

    [[nodiscard]] std::size_t SlotIndex(glm::ivec2 local) const noexcept
    {
        return static_cast<std::size_t>(local.y * m_Size + local.x);
    }

    void Forget(const Tile& tile) noexcept
    {
        --m_TileCount;
        if (tile.HasAnimation())
            --m_AnimatedCount;
    }

    glm::ivec2 m_Coord{0, 0};
    int m_Size{0};
    std::vector<std::optional<Tile>> m_Slots{};
    int m_TileCount{0};
    int m_AnimatedCount{0};
    bool m_Dirty{false};
};
