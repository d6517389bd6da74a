#include "VulkanChunkUploader.h"

#include <cstddef>
#include <cstring>
#include <iostream>
#include <stdexcept>

#define VK_CHECK(x)                                                                                         \
    do                                                                                                      \
    {                                                                                                       \
        VkResult result = x;                                                                                \
        if (result != VK_SUCCESS)                                                                           \
        {                                                                                                   \
            std::cerr << "Vulkan error at " << __FILE__ << ":" << __LINE__ << " - " << result << std::endl; \
            throw std::runtime_error("Vulkan operation failed");                                            \
        }                                                                                                   \
    } while (0)

namespace
{
constexpr VkMemoryPropertyFlags HOST_MEMORY =
    VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT;
}

VulkanChunkUploader::VulkanChunkUploader(VkPhysicalDevice physicalDevice, VkDevice device)
    : m_PhysicalDevice(physicalDevice)
    , m_Device(device)
{
    if (m_PhysicalDevice == VK_NULL_HANDLE || m_Device == VK_NULL_HANDLE)
        throw std::runtime_error("VulkanChunkUploader requires a valid physical device and device");
}

VulkanChunkUploader::~VulkanChunkUploader()
{
    Shutdown();
}

void VulkanChunkUploader::Shutdown()
{
    for (auto &[key, chunk] : m_Chunks)
    {
        (void)key;
        DestroyChunk(chunk);
    }
    m_Chunks.clear();

    for (auto &[id, uniform] : m_Uniforms)
    {
        (void)id;
        DestroyBuffer(uniform.buffer, uniform.memory, uniform.mapped);
    }
    m_Uniforms.clear();
}

uint32_t VulkanChunkUploader::FindMemoryType(uint32_t typeFilter, VkMemoryPropertyFlags properties) const
{
    VkPhysicalDeviceMemoryProperties memProperties;
    vkGetPhysicalDeviceMemoryProperties(m_PhysicalDevice, &memProperties);

    for (uint32_t i = 0; i < memProperties.memoryTypeCount; i++)
    {
        if ((typeFilter & (1 << i)) && (memProperties.memoryTypes[i].propertyFlags & properties) == properties)
        {
            return i;
        }
    }

    throw std::runtime_error("Failed to find suitable memory type!");
}

void VulkanChunkUploader::CreateBuffer(VkDeviceSize size, VkBufferUsageFlags usage, VkMemoryPropertyFlags properties,
                                       VkBuffer &buffer, VkDeviceMemory &bufferMemory) const
{
    VkBufferCreateInfo bufferInfo{};
    bufferInfo.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    bufferInfo.size = size;
    bufferInfo.usage = usage;
    bufferInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

    VK_CHECK(vkCreateBuffer(m_Device, &bufferInfo, nullptr, &buffer));

    VkMemoryRequirements memRequirements;
    vkGetBufferMemoryRequirements(m_Device, buffer, &memRequirements);

    VkMemoryAllocateInfo allocInfo{};
    allocInfo.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
    allocInfo.allocationSize = memRequirements.size;
    allocInfo.memoryTypeIndex = FindMemoryType(memRequirements.memoryTypeBits, properties);

    VK_CHECK(vkAllocateMemory(m_Device, &allocInfo, nullptr, &bufferMemory));
    VK_CHECK(vkBindBufferMemory(m_Device, buffer, bufferMemory, 0));
}

void VulkanChunkUploader::DestroyBuffer(VkBuffer &buffer, VkDeviceMemory &memory, void *&mapped) const
{
    if (mapped)
    {
        vkUnmapMemory(m_Device, memory);
        mapped = nullptr;
    }
    if (buffer != VK_NULL_HANDLE)
    {
        vkDestroyBuffer(m_Device, buffer, nullptr);
        buffer = VK_NULL_HANDLE;
    }
    if (memory != VK_NULL_HANDLE)
    {
        vkFreeMemory(m_Device, memory, nullptr);
        memory = VK_NULL_HANDLE;
    }
}

void VulkanChunkUploader::DestroyChunk(ChunkBuffers &chunk) const
{
    DestroyBuffer(chunk.vertexBuffer, chunk.vertexMemory, chunk.vertexMapped);
    DestroyBuffer(chunk.indexBuffer, chunk.indexMemory, chunk.indexMapped);
    chunk.vertexCapacity = 0;
    chunk.indexCapacity = 0;
}

void VulkanChunkUploader::UploadChunk(const RenderChunkKey &key, const ChunkMesh &mesh)
{
    const VkDeviceSize vertexSize = sizeof(ChunkVertex) * mesh.vertices.size();
    const VkDeviceSize indexSize = sizeof(uint32_t) * mesh.indices.size();

    ChunkBuffers &chunk = m_Chunks[key];

    // Reuse the existing allocation when the new mesh fits
    if (chunk.vertexCapacity < vertexSize)
    {
        DestroyBuffer(chunk.vertexBuffer, chunk.vertexMemory, chunk.vertexMapped);
        CreateBuffer(vertexSize, VK_BUFFER_USAGE_VERTEX_BUFFER_BIT, HOST_MEMORY,
                     chunk.vertexBuffer, chunk.vertexMemory);
        VK_CHECK(vkMapMemory(m_Device, chunk.vertexMemory, 0, vertexSize, 0, &chunk.vertexMapped));
        chunk.vertexCapacity = vertexSize;
    }
    if (chunk.indexCapacity < indexSize)
    {
        DestroyBuffer(chunk.indexBuffer, chunk.indexMemory, chunk.indexMapped);
        CreateBuffer(indexSize, VK_BUFFER_USAGE_INDEX_BUFFER_BIT, HOST_MEMORY,
                     chunk.indexBuffer, chunk.indexMemory);
        VK_CHECK(vkMapMemory(m_Device, chunk.indexMemory, 0, indexSize, 0, &chunk.indexMapped));
        chunk.indexCapacity = indexSize;
    }

    std::memcpy(chunk.vertexMapped, mesh.vertices.data(), static_cast<std::size_t>(vertexSize));
    std::memcpy(chunk.indexMapped, mesh.indices.data(), static_cast<std::size_t>(indexSize));
    chunk.vertexCount = static_cast<uint32_t>(mesh.vertices.size());
    chunk.indexCount = mesh.GetIndexCount();
}

void VulkanChunkUploader::PatchAnimation(const AnimationPatch &patch)
{
    auto it = m_Chunks.find(patch.key);
    if (it == m_Chunks.end() || !it->second.vertexMapped)
        return;

    ChunkBuffers &chunk = it->second;
    auto *base = static_cast<unsigned char *>(chunk.vertexMapped);
    const std::size_t lanesOffset = offsetof(ChunkVertex, textureIndices);

    for (const AnimationLane &lane : patch.lanes)
    {
        if (lane.layer < 0 || lane.layer >= MAX_LAYER_COUNT)
            continue;
        for (uint32_t v = lane.firstVertex; v < lane.firstVertex + 4 && v < chunk.vertexCount; ++v)
        {
            unsigned char *dst = base + v * sizeof(ChunkVertex) + lanesOffset + lane.layer * sizeof(int32_t);
            int32_t value = lane.textureIndex;
            std::memcpy(dst, &value, sizeof(value));
        }
    }
}

void VulkanChunkUploader::ReleaseChunk(const RenderChunkKey &key)
{
    auto it = m_Chunks.find(key);
    if (it == m_Chunks.end())
        return;
    DestroyChunk(it->second);
    m_Chunks.erase(it);
}

void VulkanChunkUploader::UploadUniform(TilemapId tilemap, const TilemapUniform &uniform)
{
    UniformBuffer &ubo = m_Uniforms[tilemap];
    if (ubo.buffer == VK_NULL_HANDLE)
    {
        CreateBuffer(sizeof(TilemapUniform), VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT, HOST_MEMORY,
                     ubo.buffer, ubo.memory);
        VK_CHECK(vkMapMemory(m_Device, ubo.memory, 0, sizeof(TilemapUniform), 0, &ubo.mapped));
    }
    std::memcpy(ubo.mapped, &uniform, sizeof(TilemapUniform));
}

void VulkanChunkUploader::ReleaseTilemap(TilemapId tilemap)
{
    auto it = m_Uniforms.find(tilemap);
    if (it == m_Uniforms.end())
        return;
    DestroyBuffer(it->second.buffer, it->second.memory, it->second.mapped);
    m_Uniforms.erase(it);
}

const VulkanChunkUploader::ChunkBuffers *VulkanChunkUploader::FindChunk(const RenderChunkKey &key) const
{
    auto it = m_Chunks.find(key);
    return it == m_Chunks.end() ? nullptr : &it->second;
}

const VulkanChunkUploader::UniformBuffer *VulkanChunkUploader::FindUniform(TilemapId tilemap) const
{
    auto it = m_Uniforms.find(tilemap);
    return it == m_Uniforms.end() ? nullptr : &it->second;
}
