#pragma once

#include "TileTypes.h"

#include <glm/glm.hpp>

#include <cstddef>
#include <string>
#include <unordered_map>

/**
 * @enum TextureState
 * @brief Load state of an atlas as reported by the host's asset layer.
 */
enum class TextureState
{
    Unregistered,  ///< Handle never registered (a caller bug)
    Pending,       ///< Registered, still loading
    Ready,         ///< Uploaded and bindable
    Failed         ///< Load failed; treated like Pending, never drawn
};

/**
 * @class TextureRegistry
 * @brief Readiness signal for texture atlases referenced by tilemaps.
 * @ingroup Rendering
 *
 * Tessera never loads textures itself. The host registers a handle when it
 * starts loading an atlas and marks it ready once the GPU copy exists.
 * Tilemaps bound to a pending texture are prepared as usual but left out of
 * the draw queue every frame until the texture becomes ready.
 *
 * @par Thread Safety
 * Not thread-safe. Update it between frames.
 */
class TextureRegistry
{
public:
    /**
     * @brief Register a handle in Pending state.
     * @param handle Non-zero texture handle.
     * @param path   Descriptive source path, used in diagnostics only.
     * @return `false` if the handle is NO_TEXTURE or already registered.
     */
    bool Register(TextureHandle handle, const std::string& path = "");

    /// Mark a registered texture as loaded. Returns `false` if unknown.
    bool MarkReady(TextureHandle handle, glm::uvec2 size = glm::uvec2(0, 0));

    /// Mark a registered texture as failed. Returns `false` if unknown.
    bool MarkFailed(TextureHandle handle);

    /// Forget a texture. Tilemaps still bound to it become a MissingTexture error.
    bool Unregister(TextureHandle handle);

    /// NO_TEXTURE is always Ready.
    [[nodiscard]] TextureState GetState(TextureHandle handle) const;
    [[nodiscard]] bool IsReady(TextureHandle handle) const { return GetState(handle) == TextureState::Ready; }
    [[nodiscard]] bool IsRegistered(TextureHandle handle) const;

    /// Pixel size reported by MarkReady(), or (0, 0).
    [[nodiscard]] glm::uvec2 GetSize(TextureHandle handle) const;
    [[nodiscard]] const std::string& GetPath(TextureHandle handle) const;

    [[nodiscard]] std::size_t GetCount() const { return m_Entries.size(); }

private:
    struct Entry
    {
        std::string path;
        TextureState state{TextureState::Pending};
        glm::uvec2 size{0, 0};
    };

    std::unordered_map<TextureHandle, Entry> m_Entries;
};
