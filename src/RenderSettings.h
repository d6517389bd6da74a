#pragma once

#include <string>

/**
 * @struct RenderSettings
 * @brief Tunables of the tilemap render pipeline, loadable from JSON.
 * @ingroup Core
 *
 * @par File Format
 * @code{.json}
 * {
 *     "cullingMargin": 32.0,
 *     "defaultChunkSize": 32,
 *     "prepareThreads": 4,
 *     "enforceBoundsByDefault": false,
 *     "verboseLogging": false
 * }
 * @endcode
 * Missing keys keep their defaults.
 */
struct RenderSettings
{
    float cullingMargin = 32.0f;         ///< World units added around each camera view
    int defaultChunkSize = 32;           ///< Chunk edge used by hosts that do not specify one
    int prepareThreads = 0;              ///< Mesh build workers; 0 = hardware concurrency
    bool enforceBoundsByDefault = false; ///< Applied to descriptors created by the host
    bool verboseLogging = false;         ///< Print a per-frame stage summary

    /**
     * @brief Load settings from a JSON file.
     *
     * On failure the settings are left unchanged and an error is printed.
     *
     * @return `true` on success.
     */
    bool LoadFromFile(const std::string& path);

    /// Write settings as pretty-printed JSON. Returns `false` on I/O error.
    bool SaveToFile(const std::string& path) const;

    /// Worker count after resolving 0 to the hardware concurrency (at least 1).
    int ResolvePrepareThreads() const;
};
