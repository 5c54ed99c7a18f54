#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: vk_gpu_device.hpp
    MODULE: rhi/vulkan
    PURPOSE: Vulkan implementation of IGpuDevice. Buffers, images, pipelines and
            render passes over an instance/device created by the compositor.
            One descriptor set layout covers every RHIBufferSlot (storage buffers) and
            RHITextureSlot (combined image samplers, placeholders when unbound);
            view amplification is instancing times view count with the view index
            selecting gl_ViewportIndex or gl_Layer in the vertex stage.
            Destroyed GPU objects are retired and released kMaxFramesInFlight frames later.
*/


#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <vulkan/vulkan.h>

#include "mxr/rhi/gpu_device.hpp"
#include "mxr/rhi/vulkan/vk_descriptor_allocator.hpp"
#include "mxr/rhi/vulkan/vk_frame_ring.hpp"

namespace mxr
{
    struct VulkanDeviceHandles
    {
        VkInstance instance = VK_NULL_HANDLE;
        VkPhysicalDevice physical_device = VK_NULL_HANDLE;
        VkDevice device = VK_NULL_HANDLE;
        VkQueue graphics_queue = VK_NULL_HANDLE;
        uint32_t graphics_queue_family = 0;
        bool debug_utils = false;
        bool shader_output_layer = false;
        bool shader_output_viewport_index = false;
        bool multi_viewport = false;
    };

    struct VulkanShaderPaths
    {
        std::string vertex_main{};
        std::string vertex_skin{};
        std::string fragment_pbr{};
        std::string fragment_occlusion{};
    };

    // SPIR-V produced by the build (MXR_*_SPV definitions).
    VulkanShaderPaths default_shader_paths();

    VkFormat vk_format_from_rhi(RHIFormat format);
    RHIFormat rhi_format_from_vk(VkFormat format);

    class VulkanGpuDevice;

    class VulkanBuffer final : public IGpuBuffer
    {
    public:
        VulkanBuffer(VulkanGpuDevice& device, RHIBufferDesc desc, VkBuffer buffer, VkDeviceMemory memory, void* mapped);
        ~VulkanBuffer() override;

        uint64_t size() const override { return desc_.size_bytes; }
        void* contents() override { return mapped_; }
        const void* contents() const override { return mapped_; }
        const std::string& label() const override { return desc_.label; }

        VkBuffer handle() const { return buffer_; }

    private:
        VulkanGpuDevice& device_;
        RHIBufferDesc desc_{};
        VkBuffer buffer_ = VK_NULL_HANDLE;
        VkDeviceMemory memory_ = VK_NULL_HANDLE;
        void* mapped_ = nullptr;
    };

    class VulkanImage final : public IGpuImage
    {
    public:
        // `memory == VK_NULL_HANDLE` marks an image owned elsewhere (swapchain); only the view is released.
        VulkanImage(VulkanGpuDevice& device, RHIImageDesc desc, VkImage image, VkDeviceMemory memory, VkImageView view);
        ~VulkanImage() override;

        const RHIImageDesc& desc() const override { return desc_; }

        VkImage handle() const { return image_; }
        VkImageView view() const { return view_; }
        VkFormat vk_format() const { return vk_format_from_rhi(desc_.format); }

    private:
        VulkanGpuDevice& device_;
        RHIImageDesc desc_{};
        VkImage image_ = VK_NULL_HANDLE;
        VkDeviceMemory memory_ = VK_NULL_HANDLE;
        VkImageView view_ = VK_NULL_HANDLE;
    };

    class VulkanRenderPipeline final : public IRenderPipeline
    {
    public:
        VulkanRenderPipeline(VulkanGpuDevice& device, RHIRenderPipelineDesc desc, VkPipeline pipeline);
        ~VulkanRenderPipeline() override;

        const RHIRenderPipelineDesc& desc() const override { return desc_; }
        VkPipeline handle() const { return pipeline_; }

    private:
        VulkanGpuDevice& device_;
        RHIRenderPipelineDesc desc_{};
        VkPipeline pipeline_ = VK_NULL_HANDLE;
    };

    class VulkanSamplerState final : public ISamplerState
    {
    public:
        VulkanSamplerState(VulkanGpuDevice& device, RHISamplerDesc desc, VkSampler sampler);
        ~VulkanSamplerState() override;

        const RHISamplerDesc& desc() const override { return desc_; }
        VkSampler handle() const { return sampler_; }

    private:
        VulkanGpuDevice& device_;
        RHISamplerDesc desc_{};
        VkSampler sampler_ = VK_NULL_HANDLE;
    };

    class VulkanDepthStencilState final : public IDepthStencilState
    {
    public:
        explicit VulkanDepthStencilState(RHIDepthStencilDesc desc) : desc_(desc) {}
        const RHIDepthStencilDesc& desc() const override { return desc_; }

    private:
        RHIDepthStencilDesc desc_{};
    };

    // Attachment signature a VkRenderPass is built from. Load/store ops do not affect
    // compatibility, so pipelines are created against a pass with default ops.
    struct VulkanRenderPassKey
    {
        VkFormat color_format = VK_FORMAT_UNDEFINED;
        VkFormat depth_format = VK_FORMAT_UNDEFINED;
        uint32_t samples = 1;
        bool color_resolve = false;
        bool depth_resolve = false;
        RHILoadAction color_load = RHILoadAction::Clear;
        RHIStoreAction color_store = RHIStoreAction::Store;
        RHILoadAction depth_load = RHILoadAction::Clear;
        RHIStoreAction depth_store = RHIStoreAction::DontCare;

        bool operator==(const VulkanRenderPassKey&) const = default;
    };

    struct VulkanRenderPassKeyHash
    {
        size_t operator()(const VulkanRenderPassKey& k) const noexcept
        {
            size_t h = (size_t)k.color_format * 1315423911u;
            h ^= (size_t)k.depth_format + 0x9e3779b9u + (h << 6) + (h >> 2);
            h ^= (size_t)k.samples + 0x9e3779b9u + (h << 6) + (h >> 2);
            h ^= ((size_t)k.color_resolve << 1) | (size_t)k.depth_resolve;
            h ^= ((size_t)k.color_load << 8) | ((size_t)k.color_store << 10) | ((size_t)k.depth_load << 12) | ((size_t)k.depth_store << 14);
            return h;
        }
    };

    class VulkanGpuDevice final : public IGpuDevice
    {
    public:
        explicit VulkanGpuDevice(const VulkanDeviceHandles& handles, const VulkanShaderPaths& shaders = default_shader_paths());
        ~VulkanGpuDevice() override;

        VulkanGpuDevice(const VulkanGpuDevice&) = delete;
        VulkanGpuDevice& operator=(const VulkanGpuDevice&) = delete;

        const RHIDeviceCaps& capabilities() const override { return caps_; }
        std::shared_ptr<IGpuBuffer> create_buffer(const RHIBufferDesc& desc, const void* initial_data = nullptr) override;
        std::shared_ptr<IGpuImage> create_image(const RHIImageDesc& desc, const void* initial_texels = nullptr) override;
        std::shared_ptr<IRenderPipeline> create_render_pipeline(const RHIRenderPipelineDesc& desc) override;
        std::shared_ptr<IDepthStencilState> create_depth_stencil_state(const RHIDepthStencilDesc& desc) override;
        std::shared_ptr<ISamplerState> create_sampler_state(const RHISamplerDesc& desc) override;
        // Standalone command buffer; commit() submits and waits for completion.
        std::unique_ptr<ICommandBuffer> create_command_buffer(const std::string& label) override;

        // Wraps a begun frame command buffer owned by the compositor. commit() ends it and calls `submit`.
        std::unique_ptr<ICommandBuffer> wrap_command_buffer(VkCommandBuffer cmd, std::function<void(VkCommandBuffer)> submit);
        // Wraps a swapchain image; the image itself stays owned by the swapchain.
        std::shared_ptr<VulkanImage> wrap_external_image(VkImage image, const RHIImageDesc& desc);

        // Call once the fence of `frame_index`'s slot has been waited on.
        void begin_frame(uint64_t frame_index);
        void retire(std::function<void()> destroy);
        void wait_idle();
        // The graphics queue is shared with the compositor's submit/present path.
        VkResult queue_submit(const VkSubmitInfo& submit, VkFence fence);
        std::mutex& queue_mutex() { return queue_mutex_; }

        VkDevice device() const { return handles_.device; }
        VkPhysicalDevice physical_device() const { return handles_.physical_device; }
        VkInstance instance() const { return handles_.instance; }
        VkQueue graphics_queue() const { return handles_.graphics_queue; }
        VkPipelineLayout pipeline_layout() const { return pipeline_layout_; }
        VkBuffer null_buffer() const { return null_buffer_; }
        // 1x1 white stand-in for an unbound texture slot; a cube for the environment slot.
        const VulkanImage& placeholder_image(RHITextureSlot slot) const;
        VkSampler placeholder_sampler() const;

        VkRenderPass render_pass_for(const VulkanRenderPassKey& key);
        VkDescriptorSet allocate_descriptor_set();

        void cmd_begin_label(VkCommandBuffer cmd, const std::string& name) const;
        void cmd_end_label(VkCommandBuffer cmd) const;

    private:
        void create_layouts();
        void load_shaders(const VulkanShaderPaths& shaders);
        void fill_capabilities();
        VkShaderModule module_for(RHIShaderProgram program) const;
        void upload_to_gpu_only(VkBuffer dst, const void* data, uint64_t size);
        // Staging copy (when `texels` is set) and transition to shader-read layout.
        void prepare_sampled_image(VkImage image, const RHIImageDesc& desc, const void* texels);
        void create_staging_buffer(const void* data, uint64_t size, VkBuffer& buffer, VkDeviceMemory& memory);
        // Records, submits and waits for a one-off command buffer on the graphics queue.
        bool run_one_time_commands(const std::function<void(VkCommandBuffer)>& record);
        void create_placeholder_images();
        void release_all_retired();

        VulkanDeviceHandles handles_{};
        RHIDeviceCaps caps_{};

        VkDescriptorSetLayout set_layout_ = VK_NULL_HANDLE;
        VkPipelineLayout pipeline_layout_ = VK_NULL_HANDLE;
        std::array<VkShaderModule, 5> modules_{};

        VkBuffer null_buffer_ = VK_NULL_HANDLE;
        VkDeviceMemory null_memory_ = VK_NULL_HANDLE;
        std::shared_ptr<VulkanImage> placeholder_2d_{};
        std::shared_ptr<VulkanImage> placeholder_cube_{};
        std::shared_ptr<VulkanSamplerState> placeholder_sampler_{};

        std::mutex pool_mutex_{};
        VkCommandPool transient_pool_ = VK_NULL_HANDLE;

        std::mutex render_pass_mutex_{};
        std::unordered_map<VulkanRenderPassKey, VkRenderPass, VulkanRenderPassKeyHash> render_passes_{};

        std::mutex frame_mutex_{};
        std::mutex queue_mutex_{};
        uint64_t current_frame_ = 0;
        VkFrameRing<std::vector<std::function<void()>>> retired_{};
        VkFrameRing<VulkanDescriptorAllocator> descriptors_{};

        PFN_vkCmdBeginDebugUtilsLabelEXT begin_label_ = nullptr;
        PFN_vkCmdEndDebugUtilsLabelEXT end_label_ = nullptr;
    };
}
