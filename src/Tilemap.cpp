#include "Tilemap.h"
#include "TilemapError.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace
{
std::string FormatVec(glm::vec2 v)
{
    return "(" + std::to_string(v.x) + ", " + std::to_string(v.y) + ")";
}

void ValidateAnimation(const AnimatedTile &animation, const std::string &name, TilemapId id)
{
    if (animation.frames.empty())
        throw TilemapError(TilemapErrorKind::InvalidDescriptor, name + " has no frames", id);
    if (!std::isfinite(animation.frameDuration) || animation.frameDuration <= 0.0f)
    {
        throw TilemapError(TilemapErrorKind::InvalidDescriptor,
                           name + " frame duration must be finite and positive, got " +
                               std::to_string(animation.frameDuration),
                           id);
    }
}

TilemapDescriptor Validated(TilemapDescriptor descriptor, TilemapId id)
{
    try
    {
        descriptor.Validate();
    }
    catch (const TilemapError &e)
    {
        throw TilemapError(e.GetKind(), e.GetDetail(), id);
    }
    return descriptor;
}
} // namespace

void TilemapDescriptor::Validate() const
{
    if (chunkSize <= 0)
    {
        throw TilemapError(TilemapErrorKind::InvalidDescriptor,
                           "chunk size must be positive, got " + std::to_string(chunkSize));
    }
    if (geometry.slotSize.x <= 0.0f || geometry.slotSize.y <= 0.0f)
    {
        throw TilemapError(TilemapErrorKind::InvalidDescriptor,
                           "slot size must be positive, got " + FormatVec(geometry.slotSize));
    }
    if (geometry.renderSize.x <= 0.0f || geometry.renderSize.y <= 0.0f)
    {
        throw TilemapError(TilemapErrorKind::InvalidDescriptor,
                           "render size must be positive, got " + FormatVec(geometry.renderSize));
    }
    if (geometry.hexLegs < 0)
    {
        throw TilemapError(TilemapErrorKind::InvalidDescriptor,
                           "hex legs must not be negative, got " + std::to_string(geometry.hexLegs));
    }
    if ((flip & ~static_cast<uint32_t>(FLIP_BOTH)) != 0)
    {
        throw TilemapError(TilemapErrorKind::InvalidDescriptor,
                           "unknown flip bits " + std::to_string(flip));
    }
    if (!IsTilemapRotation(static_cast<uint32_t>(texture.rotation)))
    {
        throw TilemapError(TilemapErrorKind::InvalidDescriptor,
                           "texture rotation must be 0, 90, 180 or 270, got " +
                               std::to_string(static_cast<uint32_t>(texture.rotation)));
    }
    for (std::size_t i = 0; i < animations.size(); ++i)
        ValidateAnimation(animations[i], "animation " + std::to_string(i), INVALID_TILEMAP_ID);
}

Tilemap::Tilemap(TilemapId id, TilemapDescriptor descriptor)
    : m_Id(id)
    , m_Descriptor(Validated(std::move(descriptor), id))
    , m_Storage(m_Descriptor.chunkSize)
{
    m_Storage.SetOwner(m_Id);
    if (m_Descriptor.bounds)
        m_Storage.SetBounds(*m_Descriptor.bounds, m_Descriptor.enforceBounds);
}

void Tilemap::SetTransform(const TilemapTransform &transform)
{
    if (m_Descriptor.transform == transform)
        return;
    m_Descriptor.transform = transform;
    ++m_Revision;
}

void Tilemap::SetGeometry(const GridGeometry &geometry)
{
    if (m_Descriptor.geometry == geometry)
        return;

    TilemapDescriptor candidate = m_Descriptor;
    candidate.geometry = geometry;
    Validated(std::move(candidate), m_Id);

    m_Descriptor.geometry = geometry;
    m_Storage.MarkAllDirty();
    ++m_Revision;
}

void Tilemap::SetTexture(const TilemapTexture &texture)
{
    if (!IsTilemapRotation(static_cast<uint32_t>(texture.rotation)))
    {
        throw TilemapError(TilemapErrorKind::InvalidDescriptor,
                           "texture rotation must be 0, 90, 180 or 270, got " +
                               std::to_string(static_cast<uint32_t>(texture.rotation)),
                           m_Id);
    }
    if (m_Descriptor.texture == texture)
        return;
    m_Descriptor.texture = texture;
    ++m_Revision;
}

void Tilemap::SetMaterial(MaterialId material)
{
    if (m_Descriptor.material == material)
        return;
    m_Descriptor.material = material;
    m_Storage.MarkAllDirty();
    ++m_Revision;
}

void Tilemap::SetFlip(uint32_t flip)
{
    if ((flip & ~static_cast<uint32_t>(FLIP_BOTH)) != 0)
    {
        throw TilemapError(TilemapErrorKind::InvalidDescriptor,
                           "unknown flip bits " + std::to_string(flip), m_Id);
    }
    if (m_Descriptor.flip == flip)
        return;
    m_Descriptor.flip = flip;
    ++m_Revision;
}

void Tilemap::SetLayerOpacity(int layer, float opacity)
{
    if (layer < 0 || layer >= MAX_LAYER_COUNT)
        return;
    float clamped = std::clamp(opacity, 0.0f, 1.0f);
    if (m_Descriptor.layerOpacities[layer] == clamped)
        return;
    m_Descriptor.layerOpacities[layer] = clamped;
    ++m_Revision;
}

int Tilemap::AddAnimation(const AnimatedTile &animation)
{
    ValidateAnimation(animation, "animation", m_Id);
    m_Descriptor.animations.push_back(animation);
    ++m_Revision;
    return static_cast<int>(m_Descriptor.animations.size() - 1);
}

const AnimatedTile *Tilemap::GetAnimation(int id) const
{
    if (id < 0 || static_cast<std::size_t>(id) >= m_Descriptor.animations.size())
        return nullptr;
    return &m_Descriptor.animations[id];
}

void Tilemap::CheckAnimation(int animationId, std::optional<glm::ivec2> cell) const
{
    if (animationId < 0 || GetAnimation(animationId))
        return;
    throw TilemapError(TilemapErrorKind::MissingAnimation,
                       "animation " + std::to_string(animationId) + " is not registered (table holds " +
                           std::to_string(m_Descriptor.animations.size()) + ")",
                       m_Id, cell);
}

void Tilemap::CheckBuilder(const TileBuilder &builder, std::optional<glm::ivec2> cell) const
{
    for (const TileLayer &layer : builder.GetLayers())
        CheckAnimation(layer.animationId, cell);
}

void Tilemap::CheckUpdater(const TileUpdater &updater) const
{
    if (updater.layer)
        CheckAnimation(updater.layer->layer.animationId, std::nullopt);
}

void Tilemap::Set(glm::ivec2 coord, const TileBuilder &builder)
{
    CheckBuilder(builder, coord);
    m_Storage.Set(coord, builder);
}

void Tilemap::FillRect(const TileArea &area, const TileBuilder &builder)
{
    CheckBuilder(builder, std::nullopt);
    m_Storage.FillRect(area, builder);
}

void Tilemap::UpdateRect(const TileArea &area, const TileUpdater &updater)
{
    CheckUpdater(updater);
    m_Storage.UpdateRect(area, updater);
}

bool Tilemap::Update(glm::ivec2 coord, const TileUpdater &updater)
{
    CheckUpdater(updater);
    return m_Storage.Update(coord, updater);
}

bool Tilemap::Remove(glm::ivec2 coord)
{
    return m_Storage.Remove(coord);
}

std::size_t Tilemap::RemoveRect(const TileArea &area)
{
    return m_Storage.RemoveRect(area);
}

void Tilemap::Despawn()
{
    m_Storage.Despawn();
}

void Tilemap::SetBounds(const IAabb2d &bounds, bool enforce)
{
    m_Descriptor.bounds = bounds;
    m_Descriptor.enforceBounds = enforce;
    m_Storage.SetBounds(bounds, enforce);
}
