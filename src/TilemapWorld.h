#pragma once

#include "Tilemap.h"

#include <cstddef>
#include <map>
#include <memory>
#include <vector>

/**
 * @class TilemapWorld
 * @brief Simulation-side owner of every tilemap.
 * @ingroup Storage
 *
 * Tilemaps are addressed by dense integer ids handed out in creation order
 * and never reused. Despawning a tilemap removes it immediately from the
 * world and records its id; extraction drains that list to release the
 * tilemap's render-side chunks and uniform.
 */
class TilemapWorld
{
public:
    using TilemapMap = std::map<TilemapId, std::unique_ptr<Tilemap>>;

    /**
     * @brief Create an empty tilemap.
     * @throws TilemapError (InvalidDescriptor) on a bad descriptor.
     */
    Tilemap& Create(TilemapDescriptor descriptor);

    /// Tilemap by id, or `nullptr` if it was never created or is despawned.
    [[nodiscard]] Tilemap* Get(TilemapId id);
    [[nodiscard]] const Tilemap* Get(TilemapId id) const;

    /**
     * @brief Destroy a tilemap and queue its render state for release.
     * @return `false` if the id is unknown.
     */
    bool Despawn(TilemapId id);

    /// Despawn every tilemap.
    void Clear();

    [[nodiscard]] const TilemapMap& GetTilemaps() const { return m_Tilemaps; }
    [[nodiscard]] TilemapMap& GetTilemaps() { return m_Tilemaps; }
    [[nodiscard]] std::size_t GetTilemapCount() const { return m_Tilemaps.size(); }

    /// Ids despawned since the last call.
    std::vector<TilemapId> TakeDespawned();

private:
    TilemapMap m_Tilemaps;
    std::vector<TilemapId> m_Despawned;
    TilemapId m_NextId{0};
};
