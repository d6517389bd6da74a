#pragma once

#include "ChunkedTileStorage.h"
#include "CoordinateMapping.h"
#include "TileTypes.h"

#include <glm/glm.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @enum TilemapRotation
 * @brief Clockwise rotation of every atlas tile's UVs, in degrees.
 *
 * Applied in the shader from TilemapUniform::textureRotation. Lets atlases
 * authored in another orientation be used without repacking.
 */
enum class TilemapRotation : uint32_t
{
    None = 0,
    Cw90 = 90,
    Cw180 = 180,
    Cw270 = 270
};

/// Whether `degrees` names a TilemapRotation.
inline bool IsTilemapRotation(uint32_t degrees)
{
    return degrees == 0 || degrees == 90 || degrees == 180 || degrees == 270;
}

/**
 * @struct TilemapTexture
 * @brief Atlas binding of a tilemap.
 *
 * `handle` refers to an entry of the TextureRegistry. NO_TEXTURE draws pure
 * tint colors and is always considered ready.
 */
struct TilemapTexture
{
    TextureHandle handle{NO_TEXTURE};
    glm::uvec2 atlasSize{0, 0};       ///< Atlas dimensions in pixels
    glm::vec2 tileSize{16.0f, 16.0f}; ///< Size of one atlas tile in pixels
    TilemapRotation rotation{TilemapRotation::None};

    bool operator==(const TilemapTexture& other) const = default;
};

/**
 * @struct TilemapDescriptor
 * @brief Everything a tilemap is created from.
 * @ingroup Storage
 *
 * All fields except `chunkSize` may be changed after creation through the
 * Tilemap setters; each change bumps the tilemap's descriptor revision so the
 * render side re-uploads the uniform block.
 */
struct TilemapDescriptor
{
    std::string name;
    GridGeometry geometry;
    int chunkSize{32};
    TilemapTransform transform;
    TilemapTexture texture;
    MaterialId material{STANDARD_MATERIAL};
    std::array<float, MAX_LAYER_COUNT> layerOpacities{1.0f, 1.0f, 1.0f, 1.0f};
    uint32_t flip{FLIP_NONE};         ///< UV flip of every tile, combined with per-layer flips
    std::vector<AnimatedTile> animations;
    std::optional<IAabb2d> bounds;
    bool enforceBounds{false};

    /**
     * @brief Check sizes and animation definitions.
     * @throws TilemapError (InvalidDescriptor) on non-positive chunk, slot or
     *         render size, negative hex legs, unknown flip bits or texture
     *         rotation, or an animation without frames or with a frame
     *         duration that is not finite and positive.
     */
    void Validate() const;
};

/**
 * @class Tilemap
 * @brief A named grid instance: descriptor plus authoritative tile storage.
 * @ingroup Storage
 *
 * Edit calls validate animation references against the tilemap's animation
 * table, then forward to ChunkedTileStorage. The tilemap never touches
 * render-side state; extraction reads it once per frame.
 *
 * @par Revisions
 * | Change                 | Effect                                    |
 * |------------------------|-------------------------------------------|
 * | Transform, opacities   | Revision bump, uniform re-upload          |
 * | Texture binding        | Revision bump, readiness re-checked       |
 * | Geometry               | Revision bump, every chunk rebuilt        |
 * | Material               | Revision bump, chunks re-keyed and rebuilt|
 * | Animation table        | Revision bump                             |
 *
 * @par Usage Example
 * @code{.cpp}
 * TilemapDescriptor desc;
 * desc.name = "ground";
 * desc.chunkSize = 16;
 * Tilemap& map = world.Create(desc);
 * map.FillRect(TileArea({0, 0}, {20, 10}), TileBuilder().WithLayer(0, TileLayer::FromTexture(0)));
 * @endcode
 */
class Tilemap
{
public:
    /**
     * @brief Construct an empty tilemap.
     * @throws TilemapError if the descriptor fails Validate().
     */
    Tilemap(TilemapId id, TilemapDescriptor descriptor);

    [[nodiscard]] TilemapId GetId() const { return m_Id; }
    [[nodiscard]] const std::string& GetName() const { return m_Descriptor.name; }
    [[nodiscard]] const TilemapDescriptor& GetDescriptor() const { return m_Descriptor; }
    [[nodiscard]] uint64_t GetRevision() const { return m_Revision; }

    /// @name Descriptor Setters
    /// @{
    void SetTransform(const TilemapTransform& transform);
    void SetGeometry(const GridGeometry& geometry);
    /// @throws TilemapError (InvalidDescriptor) for an unknown rotation.
    void SetTexture(const TilemapTexture& texture);
    void SetMaterial(MaterialId material);

    /// Tilemap-wide UV flip (FLIP_* bits). Uniform-only change.
    /// @throws TilemapError (InvalidDescriptor) for bits outside FLIP_BOTH.
    void SetFlip(uint32_t flip);

    /// Opacity of one stack slot, clamped to [0, 1]. Out-of-range slots are ignored.
    void SetLayerOpacity(int layer, float opacity);

    /**
     * @brief Append an animation to the table.
     * @return The new animation id.
     * @throws TilemapError (InvalidDescriptor) if `animation` has no frames
     *         or a frame duration that is not finite and positive.
     */
    int AddAnimation(const AnimatedTile& animation);

    /// Animation by id, or `nullptr` if absent.
    [[nodiscard]] const AnimatedTile* GetAnimation(int id) const;
    [[nodiscard]] std::size_t GetAnimationCount() const { return m_Descriptor.animations.size(); }
    /// @}

    /// @name Edit Operations
    /// @brief Forward to ChunkedTileStorage after validating animation ids.
    /// @{

    /// @throws TilemapError (MissingAnimation) for an unknown animation id.
    void Set(glm::ivec2 coord, const TileBuilder& builder);

    /// @throws TilemapError (MissingAnimation) for an unknown animation id.
    void FillRect(const TileArea& area, const TileBuilder& builder);

    /// @throws TilemapError (MissingAnimation, LayerConflict).
    void UpdateRect(const TileArea& area, const TileUpdater& updater);

    /// @throws TilemapError (MissingAnimation, LayerConflict).
    bool Update(glm::ivec2 coord, const TileUpdater& updater);

    bool Remove(glm::ivec2 coord);
    std::size_t RemoveRect(const TileArea& area);

    /// Remove every tile; all chunks are released on the next extraction.
    void Despawn();

    [[nodiscard]] const Tile* Get(glm::ivec2 coord) const { return m_Storage.Get(coord); }
    /// @}

    /// Declare an extent. With `enforce`, edits outside it become no-ops.
    void SetBounds(const IAabb2d& bounds, bool enforce);

    [[nodiscard]] const ChunkedTileStorage& GetStorage() const { return m_Storage; }
    [[nodiscard]] ChunkedTileStorage& GetStorage() { return m_Storage; }

private:
    void CheckAnimation(int animationId, std::optional<glm::ivec2> cell) const;
    void CheckBuilder(const TileBuilder& builder, std::optional<glm::ivec2> cell) const;
    void CheckUpdater(const TileUpdater& updater) const;

    TilemapId m_Id;
    TilemapDescriptor m_Descriptor;
    ChunkedTileStorage m_Storage;
    uint64_t m_Revision{1};
};
