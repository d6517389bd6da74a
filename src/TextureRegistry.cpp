#include "TextureRegistry.h"

#include <iostream>

bool TextureRegistry::Register(TextureHandle handle, const std::string &path)
{
    if (handle == NO_TEXTURE)
    {
        std::cerr << "[Texture] Refusing to register the reserved handle 0" << std::endl;
        return false;
    }

    Entry entry;
    entry.path = path;
    if (!m_Entries.emplace(handle, entry).second)
    {
        std::cerr << "[Texture] Handle " << handle << " already registered" << std::endl;
        return false;
    }
    return true;
}

bool TextureRegistry::MarkReady(TextureHandle handle, glm::uvec2 size)
{
    auto it = m_Entries.find(handle);
    if (it == m_Entries.end())
        return false;
    it->second.state = TextureState::Ready;
    it->second.size = size;
    return true;
}

bool TextureRegistry::MarkFailed(TextureHandle handle)
{
    auto it = m_Entries.find(handle);
    if (it == m_Entries.end())
        return false;
    it->second.state = TextureState::Failed;
    std::cerr << "[Texture] Failed to load " << handle;
    if (!it->second.path.empty())
        std::cerr << " (" << it->second.path << ")";
    std::cerr << std::endl;
    return true;
}

bool TextureRegistry::Unregister(TextureHandle handle)
{
    return m_Entries.erase(handle) > 0;
}

TextureState TextureRegistry::GetState(TextureHandle handle) const
{
    if (handle == NO_TEXTURE)
        return TextureState::Ready;
    auto it = m_Entries.find(handle);
    return it == m_Entries.end() ? TextureState::Unregistered : it->second.state;
}

bool TextureRegistry::IsRegistered(TextureHandle handle) const
{
    return handle == NO_TEXTURE || m_Entries.count(handle) > 0;
}

glm::uvec2 TextureRegistry::GetSize(TextureHandle handle) const
{
    auto it = m_Entries.find(handle);
    return it == m_Entries.end() ? glm::uvec2(0, 0) : it->second.size;
}

const std::string &TextureRegistry::GetPath(TextureHandle handle) const
{
    static const std::string empty;
    auto it = m_Entries.find(handle);
    return it == m_Entries.end() ? empty : it->second.path;
}
