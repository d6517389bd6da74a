#include "TileTypes.h"
#include "TilemapError.h"

#include <string>

namespace
{
void CheckLayerConflict(const TileLayer& existing, const TileLayer& incoming, int slot)
{
    if (existing.IsEmpty() || incoming.IsEmpty())
        return;
    if (existing.IsAnimated() != incoming.IsAnimated())
    {
        throw TilemapError(TilemapErrorKind::LayerConflict,
                           "slot " + std::to_string(slot) + " holds " +
                               (existing.IsAnimated() ? "an animation" : "a static texture") +
                               ", refusing to place " +
                               (incoming.IsAnimated() ? "an animation" : "a static texture"));
    }
}
} // namespace

void PlaceLayer(Tile& tile, TileLayerPosition position, const TileLayer& layer)
{
    switch (position.kind)
    {
        case TileLayerPosition::Kind::Index:
        {
            if (position.index < 0 || position.index >= MAX_LAYER_COUNT)
                return;
            CheckLayerConflict(tile.layers[position.index], layer, position.index);
            tile.layers[position.index] = layer;
            break;
        }
        case TileLayerPosition::Kind::Top:
        {
            int count = tile.GetLayerCount();
            if (count < MAX_LAYER_COUNT)
            {
                tile.layers[count] = layer;
            }
            else
            {
                CheckLayerConflict(tile.layers[MAX_LAYER_COUNT - 1], layer, MAX_LAYER_COUNT - 1);
                tile.layers[MAX_LAYER_COUNT - 1] = layer;
            }
            break;
        }
        case TileLayerPosition::Kind::Bottom:
        {
            // Shift up; whatever sat in the last slot is dropped
            for (int i = MAX_LAYER_COUNT - 1; i > 0; --i)
                tile.layers[i] = tile.layers[i - 1];
            tile.layers[0] = layer;
            break;
        }
    }
}

TileBuilder& TileBuilder::WithLayer(int index, const TileLayer& layer)
{
    if (index < 0 || index >= MAX_LAYER_COUNT)
        return *this;
    CheckLayerConflict(m_Layers[index], layer, index);
    m_Layers[index] = layer;
    return *this;
}

TileBuilder& TileBuilder::WithAnimation(int animId, int index)
{
    return WithLayer(index, TileLayer::FromAnimation(animId));
}

TileBuilder& TileBuilder::WithColor(const glm::vec4& color)
{
    m_Color = color;
    return *this;
}

TileBuilder& TileBuilder::WithVisible(bool visible)
{
    m_Visible = visible;
    return *this;
}

Tile TileBuilder::Build(glm::ivec2 index) const
{
    Tile tile;
    tile.index = index;
    tile.layers = m_Layers;
    tile.color = m_Color;
    tile.visible = m_Visible;
    return tile;
}

void TileUpdater::Apply(Tile& tile) const
{
    if (layer)
        PlaceLayer(tile, layer->position, layer->layer);
    if (color)
        tile.color = *color;
    if (visible)
        tile.visible = *visible;
    if (flip)
    {
        for (TileLayer& l : tile.layers)
            if (!l.IsEmpty())
                l.flip = *flip;
    }
}
