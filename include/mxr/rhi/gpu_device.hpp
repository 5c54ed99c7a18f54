#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: gpu_device.hpp
    MODULE: rhi
    PURPOSE: GPU device contract consumed by meshes and the scene renderer:
            resource creation, pipeline/depth/sampler state objects, command recording.
            Creation failures throw GpuResourceError.
*/


#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "mxr/rhi/pipeline_desc.hpp"
#include "mxr/rhi/resource_desc.hpp"

namespace mxr
{
    class IGpuBuffer
    {
    public:
        virtual ~IGpuBuffer() = default;
        virtual uint64_t size() const = 0;
        // Host pointer for CPU-visible buffers, nullptr for GPU-only memory.
        virtual void* contents() = 0;
        virtual const void* contents() const = 0;
        virtual const std::string& label() const = 0;
    };

    class IGpuImage
    {
    public:
        virtual ~IGpuImage() = default;
        virtual const RHIImageDesc& desc() const = 0;

        uint32_t width() const { return desc().width; }
        uint32_t height() const { return desc().height; }
        uint32_t array_length() const { return desc().array_length; }
        uint32_t sample_count() const { return desc().sample_count; }
        RHIFormat format() const { return desc().format; }
    };

    class IRenderPipeline
    {
    public:
        virtual ~IRenderPipeline() = default;
        virtual const RHIRenderPipelineDesc& desc() const = 0;
    };

    class IDepthStencilState
    {
    public:
        virtual ~IDepthStencilState() = default;
        virtual const RHIDepthStencilDesc& desc() const = 0;
    };

    class ISamplerState
    {
    public:
        virtual ~ISamplerState() = default;
        virtual const RHISamplerDesc& desc() const = 0;
    };

    struct RHIViewport
    {
        float x = 0.0f;
        float y = 0.0f;
        float width = 0.0f;
        float height = 0.0f;
        float min_depth = 0.0f;
        float max_depth = 1.0f;
    };

    enum class RHILoadAction : uint8_t
    {
        DontCare = 0,
        Load,
        Clear
    };

    enum class RHIStoreAction : uint8_t
    {
        DontCare = 0,
        Store,
        MultisampleResolve
    };

    struct RHIColorAttachment
    {
        IGpuImage* image = nullptr;
        IGpuImage* resolve_image = nullptr;
        RHILoadAction load = RHILoadAction::Clear;
        RHIStoreAction store = RHIStoreAction::Store;
        glm::vec4 clear_color{0.0f};
    };

    struct RHIDepthAttachment
    {
        IGpuImage* image = nullptr;
        IGpuImage* resolve_image = nullptr;
        RHILoadAction load = RHILoadAction::Clear;
        RHIStoreAction store = RHIStoreAction::DontCare;
        float clear_depth = 0.0f;
    };

    struct RHIRenderPassDesc
    {
        RHIColorAttachment color{};
        RHIDepthAttachment depth{};
        uint32_t render_target_array_length = 1;
        // Attachment-less passes (vertex-only work) still need a render area.
        uint32_t default_width = 1;
        uint32_t default_height = 1;
        const void* rasterization_rate_map = nullptr;
        std::string label{};
    };

    // Buffer binding points shared with the shaders (see shaders/shader_interface.glsl).
    enum class RHIBufferSlot : uint32_t
    {
        PassConstants = 0,
        InstanceConstants = 1,
        MaterialConstants = 2,
        Lights = 3,
        SkinningJoints = 4,
        SkinningOutput = 5
    };

    inline constexpr uint32_t kRHIBufferSlotCount = 6;

    // Fragment texture binding points. Shader binding = kRHIBufferSlotCount + slot.
    enum class RHITextureSlot : uint32_t
    {
        BaseColor = 0,
        Normal = 1,
        Metalness = 2,
        Roughness = 3,
        Emissive = 4,
        EnvironmentLight = 5
    };

    inline constexpr uint32_t kRHITextureSlotCount = 6;

    class IRenderCommandEncoder
    {
    public:
        virtual ~IRenderCommandEncoder() = default;

        virtual void set_viewports(const std::vector<RHIViewport>& viewports) = 0;
        virtual void set_amplification_count(uint32_t count) = 0;
        virtual void set_front_face(RHIFrontFace face) = 0;
        virtual void set_cull_mode(RHICullMode mode) = 0;
        virtual void set_render_pipeline(const IRenderPipeline& pipeline) = 0;
        virtual void set_depth_stencil_state(const IDepthStencilState& state) = 0;
        virtual void set_vertex_buffer(uint32_t index, const IGpuBuffer& buffer, uint64_t offset) = 0;
        virtual void set_buffer(RHIBufferSlot slot, const IGpuBuffer& buffer, uint64_t offset, uint64_t range) = 0;
        // A null image leaves a device-provided 1x1 placeholder bound to the slot.
        virtual void set_texture(RHITextureSlot slot, const IGpuImage* image, const ISamplerState& sampler) = 0;
        virtual void draw_primitives(RHIPrimitiveType type, uint32_t vertex_start, uint32_t vertex_count) = 0;
        virtual void draw_indexed(
            RHIPrimitiveType type,
            uint32_t index_count,
            RHIIndexType index_type,
            const IGpuBuffer& index_buffer,
            uint64_t index_offset,
            uint32_t instance_count) = 0;
        virtual void end_encoding() = 0;
    };

    class ICommandBuffer
    {
    public:
        virtual ~ICommandBuffer() = default;

        virtual std::unique_ptr<IRenderCommandEncoder> begin_render_pass(const RHIRenderPassDesc& desc) = 0;
        virtual void push_debug_group(const std::string& name) = 0;
        virtual void pop_debug_group() = 0;
        virtual void commit() = 0;
    };

    struct RHIDeviceCaps
    {
        uint32_t min_buffer_offset_alignment = 256;
        uint32_t max_amplification_count = 1;
        bool supports_layered_rendering = false;
        bool supports_viewport_index_output = false;
        uint32_t supported_sample_counts_mask = 1u;
        RHIFormat preferred_color_format = RHIFormat::BGRA8_sRGB;
        RHIFormat preferred_depth_format = RHIFormat::D32F;
        bool unified_memory = false;
    };

    class IGpuDevice
    {
    public:
        virtual ~IGpuDevice() = default;

        virtual const RHIDeviceCaps& capabilities() const = 0;
        virtual std::shared_ptr<IGpuBuffer> create_buffer(const RHIBufferDesc& desc, const void* initial_data = nullptr) = 0;
        // `initial_texels` holds rhi_image_byte_size(desc) bytes; sampled images are readable once this returns.
        virtual std::shared_ptr<IGpuImage> create_image(const RHIImageDesc& desc, const void* initial_texels = nullptr) = 0;
        virtual std::shared_ptr<IRenderPipeline> create_render_pipeline(const RHIRenderPipelineDesc& desc) = 0;
        virtual std::shared_ptr<IDepthStencilState> create_depth_stencil_state(const RHIDepthStencilDesc& desc) = 0;
        virtual std::shared_ptr<ISamplerState> create_sampler_state(const RHISamplerDesc& desc) = 0;
        virtual std::unique_ptr<ICommandBuffer> create_command_buffer(const std::string& label) = 0;

        bool supports_sample_count(uint32_t count) const
        {
            if (count == 0 || count > 31) return false;
            return (capabilities().supported_sample_counts_mask & (1u << (count - 1u))) != 0;
        }
    };

    inline constexpr std::array<uint32_t, 6> kRasterSampleCountCandidates{16u, 8u, 5u, 4u, 2u, 1u};

    // Largest supported candidate not exceeding the requested count.
    inline uint32_t preferred_raster_sample_count(const IGpuDevice& device, uint32_t requested)
    {
        for (uint32_t n : kRasterSampleCountCandidates)
        {
            if (n <= requested && device.supports_sample_count(n)) return n;
        }
        return 1u;
    }

    inline uint32_t sample_count_mask_bit(uint32_t count)
    {
        return 1u << (count - 1u);
    }
}
