#include "TilemapWorld.h"

#include <utility>

Tilemap &TilemapWorld::Create(TilemapDescriptor descriptor)
{
    TilemapId id = m_NextId;
    auto tilemap = std::make_unique<Tilemap>(id, std::move(descriptor));
    ++m_NextId;

    Tilemap &ref = *tilemap;
    m_Tilemaps.emplace(id, std::move(tilemap));
    return ref;
}

Tilemap *TilemapWorld::Get(TilemapId id)
{
    auto it = m_Tilemaps.find(id);
    return it == m_Tilemaps.end() ? nullptr : it->second.get();
}

const Tilemap *TilemapWorld::Get(TilemapId id) const
{
    auto it = m_Tilemaps.find(id);
    return it == m_Tilemaps.end() ? nullptr : it->second.get();
}

bool TilemapWorld::Despawn(TilemapId id)
{
    auto it = m_Tilemaps.find(id);
    if (it == m_Tilemaps.end())
        return false;

    m_Tilemaps.erase(it);
    m_Despawned.push_back(id);
    return true;
}

void TilemapWorld::Clear()
{
    for (const auto &[id, tilemap] : m_Tilemaps)
    {
        (void)tilemap;
        m_Despawned.push_back(id);
    }
    m_Tilemaps.clear();
}

std::vector<TilemapId> TilemapWorld::TakeDespawned()
{
    std::vector<TilemapId> out;
    out.swap(m_Despawned);
    return out;
}
