#pragma once

#include "IGpuUploader.h"

#include <vulkan/vulkan.h>

#include <cstddef>
#include <unordered_map>

/**
 * @class VulkanChunkUploader
 * @brief IGpuUploader backed by host-visible Vulkan buffers.
 * @ingroup Rendering
 *
 * The host owns the instance, device and queues and hands the device in.
 * Each chunk gets its own vertex and index buffer, each tilemap its own
 * uniform buffer. All memory is HOST_VISIBLE | HOST_COHERENT and stays
 * persistently mapped, so animation patches are plain memory writes into
 * the textureIndices lanes of the affected vertices.
 *
 * @par Buffer Lifetime
 * The pipeline defers ReleaseChunk() by one frame. Hosts running more than
 * one frame in flight must wait on the matching fence before calling
 * TilemapRenderPipeline::RenderFrame() again.
 *
 * @par Error Handling
 * Vulkan failures throw `std::runtime_error` after printing the result code.
 */
class VulkanChunkUploader : public IGpuUploader
{
public:
    struct ChunkBuffers
    {
        VkBuffer vertexBuffer = VK_NULL_HANDLE;
        VkDeviceMemory vertexMemory = VK_NULL_HANDLE;
        void* vertexMapped = nullptr;
        VkDeviceSize vertexCapacity = 0;

        VkBuffer indexBuffer = VK_NULL_HANDLE;
        VkDeviceMemory indexMemory = VK_NULL_HANDLE;
        void* indexMapped = nullptr;
        VkDeviceSize indexCapacity = 0;

        uint32_t vertexCount = 0;
        uint32_t indexCount = 0;
    };

    struct UniformBuffer
    {
        VkBuffer buffer = VK_NULL_HANDLE;
        VkDeviceMemory memory = VK_NULL_HANDLE;
        void* mapped = nullptr;
    };

    VulkanChunkUploader(VkPhysicalDevice physicalDevice, VkDevice device);
    ~VulkanChunkUploader() override;

    VulkanChunkUploader(const VulkanChunkUploader&) = delete;
    VulkanChunkUploader& operator=(const VulkanChunkUploader&) = delete;

    void UploadChunk(const RenderChunkKey& key, const ChunkMesh& mesh) override;
    void PatchAnimation(const AnimationPatch& patch) override;
    void ReleaseChunk(const RenderChunkKey& key) override;
    void UploadUniform(TilemapId tilemap, const TilemapUniform& uniform) override;
    void ReleaseTilemap(TilemapId tilemap) override;

    /// Buffers of a chunk for binding at draw time, or `nullptr`.
    const ChunkBuffers* FindChunk(const RenderChunkKey& key) const;
    const UniformBuffer* FindUniform(TilemapId tilemap) const;

    std::size_t GetResidentChunkCount() const { return m_Chunks.size(); }

    /// Destroy every buffer. Called by the destructor.
    void Shutdown();

private:
    uint32_t FindMemoryType(uint32_t typeFilter, VkMemoryPropertyFlags properties) const;
    void CreateBuffer(VkDeviceSize size, VkBufferUsageFlags usage, VkMemoryPropertyFlags properties,
                      VkBuffer& buffer, VkDeviceMemory& bufferMemory) const;
    void DestroyBuffer(VkBuffer& buffer, VkDeviceMemory& memory, void*& mapped) const;
    void DestroyChunk(ChunkBuffers& chunk) const;

    VkPhysicalDevice m_PhysicalDevice;
    VkDevice m_Device;
    std::unordered_map<RenderChunkKey, ChunkBuffers, RenderChunkKeyHash> m_Chunks;
    std::unordered_map<TilemapId, UniformBuffer> m_Uniforms;
};
