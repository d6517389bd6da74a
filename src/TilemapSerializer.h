#pragma once

#include "Tilemap.h"
#include "TilemapWorld.h"

#include <string>

/**
 * @class TilemapSerializer
 * @brief Sparse JSON persistence of a tilemap descriptor and its tiles.
 * @ingroup Storage
 *
 * Only occupied cells are written, keyed by `"x,y"`:
 * @code{.json}
 * {
 *     "name": "ground",
 *     "tileType": "Isometric",
 *     "chunkSize": 16,
 *     "slotSize": [32, 16],
 *     "renderSize": [32, 16],
 *     "texture": { "handle": 2, "atlasSize": [128, 64], "tileSize": [32, 16], "rotation": 90 },
 *     "flip": 1,
 *     "animations": [{ "frames": [4, 5, 6], "frameDuration": 0.25 }],
 *     "tiles": {
 *         "0,0": { "layers": [{ "texture": 3 }, { "animation": 0, "flip": 1 }] },
 *         "-4,2": { "layers": [{ "texture": 1 }], "color": [1, 0.5, 0.5, 1], "visible": false }
 *     }
 * }
 * @endcode
 * Layer arrays keep their slot positions; empty slots are written as `null`.
 * Missing keys take the TilemapDescriptor defaults.
 */
class TilemapSerializer
{
public:
    /// Serialize to a JSON string (pretty-printed with `indent` >= 0).
    static std::string SaveToString(const Tilemap& tilemap, int indent = 4);

    /// Write a tilemap to a file. Returns `false` on I/O error.
    static bool SaveToFile(const Tilemap& tilemap, const std::string& path);

    /**
     * @brief Create a tilemap in `world` from a JSON string.
     *
     * On any error nothing is left in the world and a diagnostic is printed.
     *
     * @param outId Receives the new tilemap id on success (may be null).
     * @return `true` on success.
     */
    static bool LoadFromString(const std::string& text, TilemapWorld& world, TilemapId* outId = nullptr);

    /// File form of LoadFromString().
    static bool LoadFromFile(const std::string& path, TilemapWorld& world, TilemapId* outId = nullptr);
};
