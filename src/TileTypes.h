#pragma once

#include <glm/glm.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <vector>

/// Maximum number of stacked layers per tile (one GPU ivec4 lane each).
constexpr int MAX_LAYER_COUNT = 4;

/// Dense identifier of a tilemap inside a TilemapWorld.
using TilemapId = uint32_t;
constexpr TilemapId INVALID_TILEMAP_ID = 0xFFFFFFFFu;

/// Host-side handle of a texture atlas (0 = no texture, pure color tilemap).
using TextureHandle = uint32_t;
constexpr TextureHandle NO_TEXTURE = 0;

/// Host-side render material identifier.
using MaterialId = uint32_t;
constexpr MaterialId STANDARD_MATERIAL = 0;

/**
 * @enum TileType
 * @brief Lattice shape of a tilemap.
 *
 * Only affects the cell-to-world mapping and the shader selected by the host.
 */
enum class TileType : uint32_t
{
    Square = 0,     ///< Axis-aligned square cells
    Isometric = 1,  ///< Diamond cells, 2:1 projection
    Hexagonal = 2   ///< Staggered hex cells with configurable leg length
};

/// UV flip bits stored per layer.
enum TileFlip : uint32_t
{
    FLIP_NONE = 0,        ///< No flip
    FLIP_HORIZONTAL = 1,  ///< Mirror U
    FLIP_VERTICAL = 2,    ///< Mirror V
    FLIP_BOTH = 3         ///< Mirror U and V
};

/**
 * @struct TileLayer
 * @brief One stacked sub-tile: a static atlas index or an animation reference.
 * @ingroup Storage
 *
 * Exactly one of textureIndex / animationId is >= 0 for a non-empty layer.
 */
struct TileLayer
{
    int textureIndex;   ///< Atlas index (-1 = none)
    int animationId;    ///< Index into the tilemap's animation table (-1 = none)
    uint32_t flip;      ///< TileFlip bits

    TileLayer() : textureIndex(-1), animationId(-1), flip(FLIP_NONE) {}

    static TileLayer FromTexture(int index, uint32_t flip = FLIP_NONE)
    {
        TileLayer layer;
        layer.textureIndex = index;
        layer.flip = flip;
        return layer;
    }

    static TileLayer FromAnimation(int animId, uint32_t flip = FLIP_NONE)
    {
        TileLayer layer;
        layer.animationId = animId;
        layer.flip = flip;
        return layer;
    }

    bool IsEmpty() const { return textureIndex < 0 && animationId < 0; }
    bool IsAnimated() const { return animationId >= 0; }

    bool operator==(const TileLayer& other) const = default;
};

/**
 * @struct TileLayerPosition
 * @brief Where a layer lands in a tile's stack.
 *
 * | Kind   | Behaviour                                                   |
 * |--------|-------------------------------------------------------------|
 * | Top    | Above the highest occupied slot; replaces it when full      |
 * | Bottom | Inserted at slot 0, shifting others up; the top falls off   |
 * | Index  | Written at the given slot                                   |
 */
struct TileLayerPosition
{
    enum class Kind
    {
        Top,
        Bottom,
        Index
    };

    Kind kind;
    int index;

    static TileLayerPosition Top() { return {Kind::Top, 0}; }
    static TileLayerPosition Bottom() { return {Kind::Bottom, 0}; }
    static TileLayerPosition At(int i) { return {Kind::Index, i}; }
};

/**
 * @struct Tile
 * @brief A tile record: up to MAX_LAYER_COUNT layers plus tint and visibility.
 * @ingroup Storage
 */
struct Tile
{
    glm::ivec2 index{0, 0};                          ///< Cell coordinate
    std::array<TileLayer, MAX_LAYER_COUNT> layers{};  ///< Layer stack, slot 0 = bottom
    glm::vec4 color{1.0f};                           ///< RGBA tint
    bool visible{true};                              ///< Hidden tiles are skipped by the mesh builder

    /// Highest occupied slot + 1 (0 for a tile without layers).
    int GetLayerCount() const
    {
        for (int i = MAX_LAYER_COUNT - 1; i >= 0; --i)
            if (!layers[i].IsEmpty())
                return i + 1;
        return 0;
    }

    bool HasAnimation() const
    {
        for (const TileLayer& layer : layers)
            if (layer.IsAnimated())
                return true;
        return false;
    }

    bool operator==(const Tile& other) const = default;
};

/**
 * @brief Place a layer into a tile's stack according to a position policy.
 *
 * @throws TilemapError (LayerConflict) when an occupied slot would switch
 *         between a static texture and an animation.
 */
void PlaceLayer(Tile& tile, TileLayerPosition position, const TileLayer& layer);

/**
 * @class TileBuilder
 * @brief Describes a tile to be written by Set / FillRect.
 * @ingroup Storage
 *
 * @code{.cpp}
 * storage.Set({4, 2}, TileBuilder()
 *     .WithLayer(0, TileLayer::FromTexture(3))
 *     .WithColor(glm::vec4(1.0f, 0.5f, 0.5f, 1.0f)));
 * @endcode
 */
class TileBuilder
{
public:
    TileBuilder() = default;

    /// Write a layer at an explicit stack slot (out-of-range slots are ignored).
    TileBuilder& WithLayer(int index, const TileLayer& layer);

    /// Shorthand for an animated layer.
    TileBuilder& WithAnimation(int animId, int index = 0);

    TileBuilder& WithColor(const glm::vec4& color);
    TileBuilder& WithVisible(bool visible);

    /// Produce the tile record for a cell.
    Tile Build(glm::ivec2 index) const;

    const std::array<TileLayer, MAX_LAYER_COUNT>& GetLayers() const { return m_Layers; }

private:
    std::array<TileLayer, MAX_LAYER_COUNT> m_Layers{};
    glm::vec4 m_Color{1.0f};
    bool m_Visible{true};
};

/// Partial layer mutation used by TileUpdater.
struct LayerUpdater
{
    TileLayerPosition position;
    TileLayer layer;
};

/**
 * @struct TileUpdater
 * @brief Partial mutation of an existing tile. Unset fields are left untouched.
 * @ingroup Storage
 */
struct TileUpdater
{
    std::optional<LayerUpdater> layer;     ///< Place a layer
    std::optional<glm::vec4> color;        ///< Replace the tint
    std::optional<bool> visible;           ///< Replace visibility
    std::optional<uint32_t> flip;          ///< Replace flip bits on every occupied layer

    /// Apply to a tile. May throw TilemapError on a layer conflict.
    void Apply(Tile& tile) const;
};

/**
 * @struct TileArea
 * @brief Inclusive rectangle of cells.
 */
struct TileArea
{
    glm::ivec2 origin{0, 0};  ///< Lowest corner
    glm::ivec2 dest{0, 0};    ///< Highest corner (inclusive)

    TileArea() = default;

    /// Rectangle starting at origin covering extent.x * extent.y cells, clipped to the int domain.
    TileArea(glm::ivec2 o, glm::uvec2 extent)
        : origin(o)
        , dest(o)
    {
        if (extent.x == 0 || extent.y == 0)
        {
            // Empty: dest below origin without leaving the int range
            origin = glm::ivec2(1, 1);
            dest = glm::ivec2(0, 0);
            return;
        }
        const int64_t maxInt = std::numeric_limits<int>::max();
        dest.x = static_cast<int>(std::min<int64_t>(static_cast<int64_t>(o.x) + extent.x - 1, maxInt));
        dest.y = static_cast<int>(std::min<int64_t>(static_cast<int64_t>(o.y) + extent.y - 1, maxInt));
    }

    static TileArea FromCorners(glm::ivec2 a, glm::ivec2 b)
    {
        TileArea area;
        area.origin = glm::min(a, b);
        area.dest = glm::max(a, b);
        return area;
    }

    bool IsEmpty() const { return dest.x < origin.x || dest.y < origin.y; }

    int64_t GetCellCount() const
    {
        if (IsEmpty())
            return 0;
        return (static_cast<int64_t>(dest.x) - origin.x + 1) * (static_cast<int64_t>(dest.y) - origin.y + 1);
    }
};

/**
 * @struct IAabb2d
 * @brief Inclusive integer bounding box over cell coordinates.
 */
struct IAabb2d
{
    glm::ivec2 min{0, 0};
    glm::ivec2 max{-1, -1};

    static IAabb2d FromArea(const TileArea& area) { return {area.origin, area.dest}; }

    bool IsEmpty() const { return max.x < min.x || max.y < min.y; }

    bool Contains(glm::ivec2 p) const
    {
        return p.x >= min.x && p.x <= max.x && p.y >= min.y && p.y <= max.y;
    }

    void Expand(glm::ivec2 p)
    {
        if (IsEmpty())
        {
            min = p;
            max = p;
            return;
        }
        min = glm::min(min, p);
        max = glm::max(max, p);
    }

    /// Clip an area to this box. The result may be empty.
    TileArea Clip(const TileArea& area) const
    {
        TileArea clipped;
        clipped.origin = glm::max(area.origin, min);
        clipped.dest = glm::min(area.dest, max);
        return clipped;
    }
};

/**
 * @struct Aabb2d
 * @brief Float world-space bounding box used by culling.
 */
struct Aabb2d
{
    glm::vec2 min{0.0f};
    glm::vec2 max{0.0f};

    bool Intersects(const Aabb2d& other) const
    {
        return min.x <= other.max.x && max.x >= other.min.x &&
               min.y <= other.max.y && max.y >= other.min.y;
    }

    Aabb2d Expanded(float margin) const
    {
        return {min - glm::vec2(margin), max + glm::vec2(margin)};
    }
};

/**
 * @struct AnimatedTile
 * @brief Definition of an animated tile sequence.
 */
struct AnimatedTile
{
    std::vector<int> frames;    ///< Atlas indices for each frame
    float frameDuration;        ///< Seconds per frame

    AnimatedTile() : frameDuration(0.2f) {}
    AnimatedTile(const std::vector<int>& f, float duration = 0.2f)
        : frames(f), frameDuration(duration) {}

    /// Get the atlas index for the current time
    int GetFrameAtTime(float time) const
    {
        if (frames.empty()) return -1;
        if (!(frameDuration > 0.0f) || !(time > 0.0f) || !std::isfinite(time) || !std::isfinite(frameDuration))
            return frames[0];
        // Elapsed frame count can exceed int; wrap it in double precision
        double cycle = std::floor(static_cast<double>(time) / static_cast<double>(frameDuration));
        double frameIndex = std::fmod(cycle, static_cast<double>(frames.size()));
        if (!(frameIndex >= 0.0))
            return frames[0];
        return frames[static_cast<std::size_t>(frameIndex)];
    }
};

/// Hash for cell and chunk coordinates used as unordered_map keys.
struct IVec2Hash
{
    std::size_t operator()(const glm::ivec2& v) const noexcept
    {
        uint64_t packed = (static_cast<uint64_t>(static_cast<uint32_t>(v.x)) << 32) |
                          static_cast<uint32_t>(v.y);
        return std::hash<uint64_t>{}(packed);
    }
};

/// Floor division for signed cell -> chunk mapping.
inline int FloorDiv(int a, int b)
{
    int q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0)))
        --q;
    return q;
}

/// Chunk containing a cell: floor(cell / chunkSize).
inline glm::ivec2 CellToChunk(glm::ivec2 cell, int chunkSize)
{
    return {FloorDiv(cell.x, chunkSize), FloorDiv(cell.y, chunkSize)};
}

/// Remainder of a / b in [0, b) for b > 0.
inline int FloorMod(int a, int b)
{
    int r = a % b;
    return r < 0 ? r + b : r;
}

/// Cell position inside its chunk, each component in [0, chunkSize).
inline glm::ivec2 CellToChunkLocal(glm::ivec2 cell, int chunkSize)
{
    return {FloorMod(cell.x, chunkSize), FloorMod(cell.y, chunkSize)};
}

/// Clamp a 64-bit cell component into the int cell domain.
inline int ClampCell(int64_t v)
{
    return static_cast<int>(std::clamp<int64_t>(v, std::numeric_limits<int>::min(),
                                                std::numeric_limits<int>::max()));
}

/**
 * @brief Cells covered by a chunk.
 *
 * Computed in 64 bits. Chunks at the edges of the int domain whose nominal
 * span leaves it (chunk sizes that do not divide 2^32) are clipped.
 */
inline TileArea ChunkCellArea(glm::ivec2 chunk, int chunkSize)
{
    const int64_t x0 = static_cast<int64_t>(chunk.x) * chunkSize;
    const int64_t y0 = static_cast<int64_t>(chunk.y) * chunkSize;
    TileArea area;
    area.origin = glm::ivec2(ClampCell(x0), ClampCell(y0));
    area.dest = glm::ivec2(ClampCell(x0 + chunkSize - 1), ClampCell(y0 + chunkSize - 1));
    return area;
}
