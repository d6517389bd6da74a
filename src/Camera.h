#pragma once

#include "TileTypes.h"

#include <glm/glm.hpp>

#include <cstdint>

/**
 * @struct Camera
 * @brief Per-frame view supplied by the host.
 * @ingroup Pipeline
 *
 * `position` is the world-space center of the view and `viewportSize` its
 * world-space extent. Each camera gets its own visible set and draw list.
 */
struct Camera
{
    uint32_t id{0};
    glm::vec2 position{0.0f, 0.0f};
    glm::vec2 viewportSize{1280.0f, 720.0f};
    bool active{true};  ///< Inactive cameras are culled to an empty set

    /// World rectangle seen by the camera, grown by `margin` on each side.
    Aabb2d GetViewRect(float margin = 0.0f) const
    {
        const glm::vec2 half = viewportSize * 0.5f;
        return Aabb2d{position - half, position + half}.Expanded(margin);
    }
};
