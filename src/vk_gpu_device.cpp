#include "mxr/rhi/vulkan/vk_gpu_device.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

#include "mxr/core/log.hpp"
#include "mxr/rhi/vulkan/vk_cmd_utils.hpp"
#include "mxr/rhi/vulkan/vk_memory_utils.hpp"
#include "mxr/rhi/vulkan/vk_shader_utils.hpp"

namespace mxr
{
    namespace
    {
        constexpr uint32_t kMaxAmplification = 2;
        constexpr VkDeviceSize kNullBufferBytes = 256;

        VkSampleCountFlagBits vk_samples(uint32_t count)
        {
            switch (count)
            {
                case 2: return VK_SAMPLE_COUNT_2_BIT;
                case 4: return VK_SAMPLE_COUNT_4_BIT;
                case 8: return VK_SAMPLE_COUNT_8_BIT;
                case 16: return VK_SAMPLE_COUNT_16_BIT;
                default: return VK_SAMPLE_COUNT_1_BIT;
            }
        }

        VkFormat vk_vertex_format(VertexFormat f)
        {
            switch (f)
            {
                case VertexFormat::Float2: return VK_FORMAT_R32G32_SFLOAT;
                case VertexFormat::Float3: return VK_FORMAT_R32G32B32_SFLOAT;
                case VertexFormat::Float4: return VK_FORMAT_R32G32B32A32_SFLOAT;
                case VertexFormat::UShort4: return VK_FORMAT_R16G16B16A16_UINT;
            }
            return VK_FORMAT_UNDEFINED;
        }

        VkCompareOp vk_compare_op(RHICompareOp op)
        {
            switch (op)
            {
                case RHICompareOp::Always: return VK_COMPARE_OP_ALWAYS;
                case RHICompareOp::Greater: return VK_COMPARE_OP_GREATER;
                case RHICompareOp::GreaterEqual: return VK_COMPARE_OP_GREATER_OR_EQUAL;
                case RHICompareOp::Less: return VK_COMPARE_OP_LESS;
                case RHICompareOp::Never: return VK_COMPARE_OP_NEVER;
            }
            return VK_COMPARE_OP_ALWAYS;
        }

        VkAttachmentLoadOp vk_load_op(RHILoadAction a)
        {
            switch (a)
            {
                case RHILoadAction::Load: return VK_ATTACHMENT_LOAD_OP_LOAD;
                case RHILoadAction::Clear: return VK_ATTACHMENT_LOAD_OP_CLEAR;
                case RHILoadAction::DontCare: return VK_ATTACHMENT_LOAD_OP_DONT_CARE;
            }
            return VK_ATTACHMENT_LOAD_OP_DONT_CARE;
        }

        // MultisampleResolve keeps only the resolved copy.
        VkAttachmentStoreOp vk_store_op(RHIStoreAction a)
        {
            return a == RHIStoreAction::Store ? VK_ATTACHMENT_STORE_OP_STORE : VK_ATTACHMENT_STORE_OP_DONT_CARE;
        }

        VkBufferUsageFlags vk_buffer_usage(uint32_t usage)
        {
            VkBufferUsageFlags out = VK_BUFFER_USAGE_TRANSFER_DST_BIT | VK_BUFFER_USAGE_TRANSFER_SRC_BIT;
            if (usage & RHIBufferUsage_Vertex) out |= VK_BUFFER_USAGE_VERTEX_BUFFER_BIT;
            if (usage & RHIBufferUsage_Index) out |= VK_BUFFER_USAGE_INDEX_BUFFER_BIT;
            if (usage & RHIBufferUsage_Storage) out |= VK_BUFFER_USAGE_STORAGE_BUFFER_BIT;
            return out;
        }

        VkImageUsageFlags vk_image_usage(uint32_t usage)
        {
            VkImageUsageFlags out = 0;
            if (usage & RHIImageUsage_Sampled) out |= VK_IMAGE_USAGE_SAMPLED_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT;
            if (usage & RHIImageUsage_ColorAttachment) out |= VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_TRANSFER_SRC_BIT;
            if (usage & RHIImageUsage_DepthStencilAttachment) out |= VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT;
            return out;
        }

        VkFilter vk_filter(RHIFilter f)
        {
            return f == RHIFilter::Nearest ? VK_FILTER_NEAREST : VK_FILTER_LINEAR;
        }

        VkSamplerAddressMode vk_address_mode(RHIAddressMode m)
        {
            switch (m)
            {
                case RHIAddressMode::Repeat: return VK_SAMPLER_ADDRESS_MODE_REPEAT;
                case RHIAddressMode::MirroredRepeat: return VK_SAMPLER_ADDRESS_MODE_MIRRORED_REPEAT;
                case RHIAddressMode::ClampToEdge: return VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
            }
            return VK_SAMPLER_ADDRESS_MODE_REPEAT;
        }

        VkImageView create_view(VkDevice device, VkImage image, const RHIImageDesc& desc)
        {
            VkImageViewCreateInfo iv{};
            iv.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
            iv.image = image;
            if (desc.type == RHIImageType::Cube)
            {
                iv.viewType = VK_IMAGE_VIEW_TYPE_CUBE;
            }
            else
            {
                iv.viewType = desc.array_length > 1 ? VK_IMAGE_VIEW_TYPE_2D_ARRAY : VK_IMAGE_VIEW_TYPE_2D;
            }
            iv.format = vk_format_from_rhi(desc.format);
            iv.subresourceRange.aspectMask = rhi_format_is_depth(desc.format) ? VK_IMAGE_ASPECT_DEPTH_BIT : VK_IMAGE_ASPECT_COLOR_BIT;
            iv.subresourceRange.baseMipLevel = 0;
            iv.subresourceRange.levelCount = 1;
            iv.subresourceRange.baseArrayLayer = 0;
            iv.subresourceRange.layerCount = std::max(1u, desc.array_length);

            VkImageView view = VK_NULL_HANDLE;
            if (vkCreateImageView(device, &iv, nullptr, &view) != VK_SUCCESS)
            {
                throw GpuResourceError(ResourceError::AllocationFailure, "vkCreateImageView failed for '" + desc.label + "'");
            }
            return view;
        }

        class VulkanRenderCommandEncoder final : public IRenderCommandEncoder
        {
        public:
            VulkanRenderCommandEncoder(VulkanGpuDevice& device, VkCommandBuffer cmd)
                : device_(device)
                , cmd_(cmd)
            {}

            ~VulkanRenderCommandEncoder() override
            {
                if (!ended_) end_encoding();
            }

            void set_viewports(const std::vector<RHIViewport>& viewports) override
            {
                vk_cmd_set_viewports(cmd_, viewports);
            }

            void set_amplification_count(uint32_t count) override
            {
                amplification_ = std::max(1u, count);
            }

            void set_front_face(RHIFrontFace face) override
            {
                vkCmdSetFrontFace(cmd_, face == RHIFrontFace::CCW ? VK_FRONT_FACE_COUNTER_CLOCKWISE : VK_FRONT_FACE_CLOCKWISE);
            }

            void set_cull_mode(RHICullMode mode) override
            {
                VkCullModeFlags flags = VK_CULL_MODE_NONE;
                if (mode == RHICullMode::Back) flags = VK_CULL_MODE_BACK_BIT;
                if (mode == RHICullMode::Front) flags = VK_CULL_MODE_FRONT_BIT;
                vkCmdSetCullMode(cmd_, flags);
            }

            void set_render_pipeline(const IRenderPipeline& pipeline) override
            {
                const auto& vk = static_cast<const VulkanRenderPipeline&>(pipeline);
                vkCmdBindPipeline(cmd_, VK_PIPELINE_BIND_POINT_GRAPHICS, vk.handle());
            }

            void set_depth_stencil_state(const IDepthStencilState& state) override
            {
                const RHIDepthStencilDesc& d = state.desc();
                vkCmdSetDepthTestEnable(cmd_, VK_TRUE);
                vkCmdSetDepthWriteEnable(cmd_, d.depth_write ? VK_TRUE : VK_FALSE);
                vkCmdSetDepthCompareOp(cmd_, vk_compare_op(d.depth_compare));
            }

            void set_vertex_buffer(uint32_t index, const IGpuBuffer& buffer, uint64_t offset) override
            {
                const VkBuffer vb = static_cast<const VulkanBuffer&>(buffer).handle();
                const VkDeviceSize off = offset;
                vkCmdBindVertexBuffers(cmd_, index, 1, &vb, &off);
            }

            void set_buffer(RHIBufferSlot slot, const IGpuBuffer& buffer, uint64_t offset, uint64_t range) override
            {
                Binding& b = bindings_[(uint32_t)slot];
                b.buffer = static_cast<const VulkanBuffer&>(buffer).handle();
                b.offset = offset;
                b.range = range;
                if (slot == RHIBufferSlot::SkinningOutput) wrote_vertices_ = true;
            }

            void set_texture(RHITextureSlot slot, const IGpuImage* image, const ISamplerState& sampler) override
            {
                const VulkanImage& vk_image = image ? static_cast<const VulkanImage&>(*image) : device_.placeholder_image(slot);
                TextureBinding& t = textures_[(uint32_t)slot];
                t.view = vk_image.view();
                t.sampler = static_cast<const VulkanSamplerState&>(sampler).handle();
            }

            void draw_primitives(RHIPrimitiveType type, uint32_t vertex_start, uint32_t vertex_count) override
            {
                (void)type;
                flush_bindings();
                vkCmdDraw(cmd_, vertex_count, amplification_, vertex_start, 0);
            }

            void draw_indexed(
                RHIPrimitiveType type,
                uint32_t index_count,
                RHIIndexType index_type,
                const IGpuBuffer& index_buffer,
                uint64_t index_offset,
                uint32_t instance_count) override
            {
                (void)type;
                flush_bindings();
                vkCmdBindIndexBuffer(
                    cmd_,
                    static_cast<const VulkanBuffer&>(index_buffer).handle(),
                    index_offset,
                    index_type == RHIIndexType::UInt16 ? VK_INDEX_TYPE_UINT16 : VK_INDEX_TYPE_UINT32);
                vkCmdDrawIndexed(cmd_, index_count, instance_count * amplification_, 0, 0, 0);
            }

            void end_encoding() override
            {
                if (ended_) return;
                vkCmdEndRenderPass(cmd_);
                if (wrote_vertices_) vk_cmd_vertex_write_to_input_barrier(cmd_);
                ended_ = true;
            }

        private:
            struct Binding
            {
                VkBuffer buffer = VK_NULL_HANDLE;
                VkDeviceSize offset = 0;
                VkDeviceSize range = VK_WHOLE_SIZE;
            };

            struct TextureBinding
            {
                VkImageView view = VK_NULL_HANDLE;
                VkSampler sampler = VK_NULL_HANDLE;
            };

            void flush_bindings()
            {
                const VkDescriptorSet set = device_.allocate_descriptor_set();

                constexpr uint32_t kWriteCount = kRHIBufferSlotCount + kRHITextureSlotCount;
                std::array<VkDescriptorBufferInfo, kRHIBufferSlotCount> infos{};
                std::array<VkDescriptorImageInfo, kRHITextureSlotCount> image_infos{};
                std::array<VkWriteDescriptorSet, kWriteCount> writes{};
                for (uint32_t i = 0; i < kRHIBufferSlotCount; ++i)
                {
                    const Binding& b = bindings_[i];
                    if (b.buffer != VK_NULL_HANDLE)
                    {
                        infos[i] = {b.buffer, b.offset, b.range};
                    }
                    else
                    {
                        infos[i] = {device_.null_buffer(), 0, VK_WHOLE_SIZE};
                    }
                    writes[i].sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
                    writes[i].dstSet = set;
                    writes[i].dstBinding = i;
                    writes[i].descriptorCount = 1;
                    writes[i].descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
                    writes[i].pBufferInfo = &infos[i];
                }
                for (uint32_t i = 0; i < kRHITextureSlotCount; ++i)
                {
                    const TextureBinding& t = textures_[i];
                    image_infos[i].imageView = t.view != VK_NULL_HANDLE ? t.view : device_.placeholder_image((RHITextureSlot)i).view();
                    image_infos[i].sampler = t.sampler != VK_NULL_HANDLE ? t.sampler : device_.placeholder_sampler();
                    image_infos[i].imageLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;

                    VkWriteDescriptorSet& w = writes[kRHIBufferSlotCount + i];
                    w.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
                    w.dstSet = set;
                    w.dstBinding = kRHIBufferSlotCount + i;
                    w.descriptorCount = 1;
                    w.descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
                    w.pImageInfo = &image_infos[i];
                }
                vkUpdateDescriptorSets(device_.device(), kWriteCount, writes.data(), 0, nullptr);
                vkCmdBindDescriptorSets(cmd_, VK_PIPELINE_BIND_POINT_GRAPHICS, device_.pipeline_layout(), 0, 1, &set, 0, nullptr);
            }

            VulkanGpuDevice& device_;
            VkCommandBuffer cmd_ = VK_NULL_HANDLE;
            std::array<Binding, kRHIBufferSlotCount> bindings_{};
            std::array<TextureBinding, kRHITextureSlotCount> textures_{};
            uint32_t amplification_ = 1;
            bool wrote_vertices_ = false;
            bool ended_ = false;
        };

        class VulkanCommandBuffer final : public ICommandBuffer
        {
        public:
            VulkanCommandBuffer(
                VulkanGpuDevice& device,
                VkCommandBuffer cmd,
                std::function<void(VkCommandBuffer)> submit,
                std::function<void(VkCommandBuffer)> discard = {})
                : device_(device)
                , cmd_(cmd)
                , submit_(std::move(submit))
                , discard_(std::move(discard))
            {
                // The previous frame may still read vertex buffers the skinning pass rewrites.
                vkCmdPipelineBarrier(
                    cmd_,
                    VK_PIPELINE_STAGE_VERTEX_INPUT_BIT,
                    VK_PIPELINE_STAGE_VERTEX_SHADER_BIT,
                    0, 0, nullptr, 0, nullptr, 0, nullptr);
            }

            ~VulkanCommandBuffer() override
            {
                if (!committed_ && discard_) discard_(cmd_);
            }

            std::unique_ptr<IRenderCommandEncoder> begin_render_pass(const RHIRenderPassDesc& desc) override
            {
                auto* color = static_cast<VulkanImage*>(desc.color.image);
                auto* color_resolve = static_cast<VulkanImage*>(desc.color.resolve_image);
                auto* depth = static_cast<VulkanImage*>(desc.depth.image);
                auto* depth_resolve = static_cast<VulkanImage*>(desc.depth.resolve_image);

                VulkanRenderPassKey key{};
                key.color_format = color ? color->vk_format() : VK_FORMAT_UNDEFINED;
                key.depth_format = depth ? depth->vk_format() : VK_FORMAT_UNDEFINED;
                key.samples = color ? color->sample_count() : (depth ? depth->sample_count() : 1u);
                key.color_resolve = color && color_resolve;
                key.depth_resolve = depth && depth_resolve;
                key.color_load = desc.color.load;
                key.color_store = desc.color.store;
                key.depth_load = desc.depth.load;
                key.depth_store = desc.depth.store;
                const VkRenderPass rp = device_.render_pass_for(key);

                std::vector<VkImageView> views{};
                std::vector<VkClearValue> clears{};
                if (color)
                {
                    views.push_back(color->view());
                    VkClearValue c{};
                    c.color = {{desc.color.clear_color.r, desc.color.clear_color.g, desc.color.clear_color.b, desc.color.clear_color.a}};
                    clears.push_back(c);
                }
                if (depth)
                {
                    views.push_back(depth->view());
                    VkClearValue c{};
                    c.depthStencil = {desc.depth.clear_depth, 0};
                    clears.push_back(c);
                }
                if (key.color_resolve)
                {
                    views.push_back(color_resolve->view());
                    clears.push_back(VkClearValue{});
                }
                if (key.depth_resolve)
                {
                    views.push_back(depth_resolve->view());
                    clears.push_back(VkClearValue{});
                }

                const IGpuImage* extent_source = color ? static_cast<const IGpuImage*>(color) : static_cast<const IGpuImage*>(depth);
                const uint32_t width = extent_source ? extent_source->width() : std::max(1u, desc.default_width);
                const uint32_t height = extent_source ? extent_source->height() : std::max(1u, desc.default_height);

                VkFramebufferCreateInfo fb{};
                fb.sType = VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO;
                fb.renderPass = rp;
                fb.attachmentCount = static_cast<uint32_t>(views.size());
                fb.pAttachments = views.empty() ? nullptr : views.data();
                fb.width = width;
                fb.height = height;
                fb.layers = std::max(1u, desc.render_target_array_length);

                VkFramebuffer framebuffer = VK_NULL_HANDLE;
                if (vkCreateFramebuffer(device_.device(), &fb, nullptr, &framebuffer) != VK_SUCCESS)
                {
                    throw GpuResourceError(ResourceError::AllocationFailure, "vkCreateFramebuffer failed for '" + desc.label + "'");
                }
                const VkDevice vk_device = device_.device();
                device_.retire([vk_device, framebuffer]() { vkDestroyFramebuffer(vk_device, framebuffer, nullptr); });

                VkRenderPassBeginInfo rbi{};
                rbi.sType = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
                rbi.renderPass = rp;
                rbi.framebuffer = framebuffer;
                rbi.renderArea.offset = {0, 0};
                rbi.renderArea.extent = {width, height};
                rbi.clearValueCount = static_cast<uint32_t>(clears.size());
                rbi.pClearValues = clears.empty() ? nullptr : clears.data();
                vkCmdBeginRenderPass(cmd_, &rbi, VK_SUBPASS_CONTENTS_INLINE);

                return std::make_unique<VulkanRenderCommandEncoder>(device_, cmd_);
            }

            void push_debug_group(const std::string& name) override { device_.cmd_begin_label(cmd_, name); }
            void pop_debug_group() override { device_.cmd_end_label(cmd_); }

            void commit() override
            {
                if (committed_) return;
                if (vkEndCommandBuffer(cmd_) != VK_SUCCESS)
                {
                    throw GpuResourceError(ResourceError::InvalidState, "vkEndCommandBuffer failed");
                }
                committed_ = true;
                submit_(cmd_);
            }

        private:
            VulkanGpuDevice& device_;
            VkCommandBuffer cmd_ = VK_NULL_HANDLE;
            std::function<void(VkCommandBuffer)> submit_{};
            std::function<void(VkCommandBuffer)> discard_{};
            bool committed_ = false;
        };
    }

    VulkanShaderPaths default_shader_paths()
    {
        VulkanShaderPaths p{};
        p.vertex_main = MXR_VERTEX_MAIN_SPV;
        p.vertex_skin = MXR_VERTEX_SKIN_SPV;
        p.fragment_pbr = MXR_FRAGMENT_PBR_SPV;
        p.fragment_occlusion = MXR_FRAGMENT_OCCLUSION_SPV;
        return p;
    }

    VkFormat vk_format_from_rhi(RHIFormat format)
    {
        switch (format)
        {
            case RHIFormat::RGBA8_UNorm: return VK_FORMAT_R8G8B8A8_UNORM;
            case RHIFormat::BGRA8_UNorm: return VK_FORMAT_B8G8R8A8_UNORM;
            case RHIFormat::BGRA8_sRGB: return VK_FORMAT_B8G8R8A8_SRGB;
            case RHIFormat::RGBA16F: return VK_FORMAT_R16G16B16A16_SFLOAT;
            case RHIFormat::RGBA8_sRGB: return VK_FORMAT_R8G8B8A8_SRGB;
            case RHIFormat::D32F: return VK_FORMAT_D32_SFLOAT;
            case RHIFormat::Unknown: break;
        }
        return VK_FORMAT_UNDEFINED;
    }

    RHIFormat rhi_format_from_vk(VkFormat format)
    {
        switch (format)
        {
            case VK_FORMAT_R8G8B8A8_UNORM: return RHIFormat::RGBA8_UNorm;
            case VK_FORMAT_B8G8R8A8_UNORM: return RHIFormat::BGRA8_UNorm;
            case VK_FORMAT_B8G8R8A8_SRGB: return RHIFormat::BGRA8_sRGB;
            case VK_FORMAT_R16G16B16A16_SFLOAT: return RHIFormat::RGBA16F;
            case VK_FORMAT_R8G8B8A8_SRGB: return RHIFormat::RGBA8_sRGB;
            case VK_FORMAT_D32_SFLOAT: return RHIFormat::D32F;
            default: break;
        }
        return RHIFormat::Unknown;
    }

    VulkanBuffer::VulkanBuffer(VulkanGpuDevice& device, RHIBufferDesc desc, VkBuffer buffer, VkDeviceMemory memory, void* mapped)
        : device_(device)
        , desc_(std::move(desc))
        , buffer_(buffer)
        , memory_(memory)
        , mapped_(mapped)
    {}

    VulkanBuffer::~VulkanBuffer()
    {
        const VkDevice vk_device = device_.device();
        VkBuffer buffer = buffer_;
        VkDeviceMemory memory = memory_;
        const bool mapped = mapped_ != nullptr;
        device_.retire([vk_device, buffer, memory, mapped]() mutable {
            if (mapped) vkUnmapMemory(vk_device, memory);
            vk_destroy_buffer(vk_device, buffer, memory);
        });
    }

    VulkanImage::VulkanImage(VulkanGpuDevice& device, RHIImageDesc desc, VkImage image, VkDeviceMemory memory, VkImageView view)
        : device_(device)
        , desc_(std::move(desc))
        , image_(image)
        , memory_(memory)
        , view_(view)
    {}

    VulkanImage::~VulkanImage()
    {
        const VkDevice vk_device = device_.device();
        VkImage image = image_;
        VkDeviceMemory memory = memory_;
        VkImageView view = view_;
        device_.retire([vk_device, image, memory, view]() mutable {
            if (view != VK_NULL_HANDLE) vkDestroyImageView(vk_device, view, nullptr);
            if (memory != VK_NULL_HANDLE) vk_destroy_image(vk_device, image, memory);
        });
    }

    VulkanRenderPipeline::VulkanRenderPipeline(VulkanGpuDevice& device, RHIRenderPipelineDesc desc, VkPipeline pipeline)
        : device_(device)
        , desc_(std::move(desc))
        , pipeline_(pipeline)
    {}

    VulkanRenderPipeline::~VulkanRenderPipeline()
    {
        const VkDevice vk_device = device_.device();
        VkPipeline pipeline = pipeline_;
        device_.retire([vk_device, pipeline]() { vkDestroyPipeline(vk_device, pipeline, nullptr); });
    }

    VulkanSamplerState::VulkanSamplerState(VulkanGpuDevice& device, RHISamplerDesc desc, VkSampler sampler)
        : device_(device)
        , desc_(desc)
        , sampler_(sampler)
    {}

    VulkanSamplerState::~VulkanSamplerState()
    {
        const VkDevice vk_device = device_.device();
        VkSampler sampler = sampler_;
        device_.retire([vk_device, sampler]() { vkDestroySampler(vk_device, sampler, nullptr); });
    }

    VulkanGpuDevice::VulkanGpuDevice(const VulkanDeviceHandles& handles, const VulkanShaderPaths& shaders)
        : handles_(handles)
    {
        if (handles_.device == VK_NULL_HANDLE || handles_.physical_device == VK_NULL_HANDLE)
        {
            throw GpuResourceError(ResourceError::InvalidState, "VulkanGpuDevice needs a created VkDevice");
        }

        fill_capabilities();
        create_layouts();
        load_shaders(shaders);

        for (VulkanDescriptorAllocator& a : descriptors_) a.init(handles_.device, kRHIBufferSlotCount, kRHITextureSlotCount);

        VkCommandPoolCreateInfo cp{};
        cp.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
        cp.flags = VK_COMMAND_POOL_CREATE_TRANSIENT_BIT | VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
        cp.queueFamilyIndex = handles_.graphics_queue_family;
        if (vkCreateCommandPool(handles_.device, &cp, nullptr, &transient_pool_) != VK_SUCCESS)
        {
            throw GpuResourceError(ResourceError::AllocationFailure, "vkCreateCommandPool failed");
        }

        if (!vk_create_buffer(
                handles_.device,
                handles_.physical_device,
                kNullBufferBytes,
                VK_BUFFER_USAGE_STORAGE_BUFFER_BIT,
                vk_memory_props(RHIMemoryClass::GPUOnly),
                null_buffer_,
                null_memory_))
        {
            throw GpuResourceError(ResourceError::AllocationFailure, "null storage buffer");
        }
        create_placeholder_images();

        if (handles_.debug_utils && handles_.instance != VK_NULL_HANDLE)
        {
            begin_label_ = (PFN_vkCmdBeginDebugUtilsLabelEXT)vkGetInstanceProcAddr(handles_.instance, "vkCmdBeginDebugUtilsLabelEXT");
            end_label_ = (PFN_vkCmdEndDebugUtilsLabelEXT)vkGetInstanceProcAddr(handles_.instance, "vkCmdEndDebugUtilsLabelEXT");
        }

        log_info("VulkanGpuDevice: ready (offset alignment " + std::to_string(caps_.min_buffer_offset_alignment) +
                 ", max amplification " + std::to_string(caps_.max_amplification_count) + ")");
    }

    VulkanGpuDevice::~VulkanGpuDevice()
    {
        wait_idle();
        placeholder_2d_.reset();
        placeholder_cube_.reset();
        placeholder_sampler_.reset();
        release_all_retired();
        for (VulkanDescriptorAllocator& a : descriptors_) a.cleanup();
        for (auto& [key, rp] : render_passes_) vkDestroyRenderPass(handles_.device, rp, nullptr);
        render_passes_.clear();
        for (VkShaderModule m : modules_)
        {
            if (m != VK_NULL_HANDLE) vkDestroyShaderModule(handles_.device, m, nullptr);
        }
        vk_destroy_buffer(handles_.device, null_buffer_, null_memory_);
        if (transient_pool_ != VK_NULL_HANDLE) vkDestroyCommandPool(handles_.device, transient_pool_, nullptr);
        if (pipeline_layout_ != VK_NULL_HANDLE) vkDestroyPipelineLayout(handles_.device, pipeline_layout_, nullptr);
        if (set_layout_ != VK_NULL_HANDLE) vkDestroyDescriptorSetLayout(handles_.device, set_layout_, nullptr);
    }

    void VulkanGpuDevice::fill_capabilities()
    {
        VkPhysicalDeviceProperties props{};
        vkGetPhysicalDeviceProperties(handles_.physical_device, &props);

        caps_.min_buffer_offset_alignment = std::max<uint32_t>(16u, static_cast<uint32_t>(props.limits.minStorageBufferOffsetAlignment));
        caps_.supports_layered_rendering = handles_.shader_output_layer;
        caps_.supports_viewport_index_output = handles_.shader_output_viewport_index && handles_.multi_viewport;
        caps_.max_amplification_count =
            (caps_.supports_layered_rendering || caps_.supports_viewport_index_output) ? kMaxAmplification : 1u;
        caps_.preferred_color_format = RHIFormat::BGRA8_sRGB;
        caps_.preferred_depth_format = RHIFormat::D32F;
        caps_.unified_memory = props.deviceType == VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU;

        const VkSampleCountFlags counts = props.limits.framebufferColorSampleCounts & props.limits.framebufferDepthSampleCounts;
        uint32_t mask = 0;
        for (uint32_t n : {1u, 2u, 4u, 8u, 16u})
        {
            if ((counts & n) != 0) mask |= sample_count_mask_bit(n);
        }
        caps_.supported_sample_counts_mask = mask == 0 ? 1u : mask;
    }

    void VulkanGpuDevice::create_layouts()
    {
        std::array<VkDescriptorSetLayoutBinding, kRHIBufferSlotCount + kRHITextureSlotCount> bindings{};
        for (uint32_t i = 0; i < kRHIBufferSlotCount; ++i)
        {
            bindings[i].binding = i;
            bindings[i].descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
            bindings[i].descriptorCount = 1;
            bindings[i].stageFlags = VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT;
        }
        for (uint32_t i = kRHIBufferSlotCount; i < (uint32_t)bindings.size(); ++i)
        {
            bindings[i].binding = i;
            bindings[i].descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
            bindings[i].descriptorCount = 1;
            bindings[i].stageFlags = VK_SHADER_STAGE_FRAGMENT_BIT;
        }

        VkDescriptorSetLayoutCreateInfo dl{};
        dl.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
        dl.bindingCount = (uint32_t)bindings.size();
        dl.pBindings = bindings.data();
        if (vkCreateDescriptorSetLayout(handles_.device, &dl, nullptr, &set_layout_) != VK_SUCCESS)
        {
            throw GpuResourceError(ResourceError::AllocationFailure, "vkCreateDescriptorSetLayout failed");
        }

        VkPipelineLayoutCreateInfo pl{};
        pl.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
        pl.setLayoutCount = 1;
        pl.pSetLayouts = &set_layout_;
        if (vkCreatePipelineLayout(handles_.device, &pl, nullptr, &pipeline_layout_) != VK_SUCCESS)
        {
            throw GpuResourceError(ResourceError::AllocationFailure, "vkCreatePipelineLayout failed");
        }
    }

    void VulkanGpuDevice::load_shaders(const VulkanShaderPaths& shaders)
    {
        modules_[(size_t)RHIShaderProgram::VertexMain] = vk_load_shader_module(handles_.device, shaders.vertex_main.c_str());
        modules_[(size_t)RHIShaderProgram::VertexSkin] = vk_load_shader_module(handles_.device, shaders.vertex_skin.c_str());
        modules_[(size_t)RHIShaderProgram::FragmentPbr] = vk_load_shader_module(handles_.device, shaders.fragment_pbr.c_str());
        modules_[(size_t)RHIShaderProgram::FragmentOcclusion] = vk_load_shader_module(handles_.device, shaders.fragment_occlusion.c_str());
    }

    VkShaderModule VulkanGpuDevice::module_for(RHIShaderProgram program) const
    {
        return modules_[(size_t)program];
    }

    std::shared_ptr<IGpuBuffer> VulkanGpuDevice::create_buffer(const RHIBufferDesc& desc, const void* initial_data)
    {
        const bool host_visible = desc.memory == RHIMemoryClass::CPUVisible;
        const VkMemoryPropertyFlags props = vk_memory_props(desc.memory);

        VkBuffer buffer = VK_NULL_HANDLE;
        VkDeviceMemory memory = VK_NULL_HANDLE;
        if (!vk_create_buffer(handles_.device, handles_.physical_device, desc.size_bytes, vk_buffer_usage(desc.usage), props, buffer, memory))
        {
            throw GpuResourceError(ResourceError::AllocationFailure, "buffer '" + desc.label + "' of " + std::to_string(desc.size_bytes) + " bytes");
        }

        void* mapped = nullptr;
        if (host_visible)
        {
            if (vkMapMemory(handles_.device, memory, 0, desc.size_bytes, 0, &mapped) != VK_SUCCESS)
            {
                vk_destroy_buffer(handles_.device, buffer, memory);
                throw GpuResourceError(ResourceError::AllocationFailure, "vkMapMemory failed for '" + desc.label + "'");
            }
            if (initial_data) std::memcpy(mapped, initial_data, (size_t)desc.size_bytes);
        }
        else if (initial_data)
        {
            upload_to_gpu_only(buffer, initial_data, desc.size_bytes);
        }

        return std::make_shared<VulkanBuffer>(*this, desc, buffer, memory, mapped);
    }

    void VulkanGpuDevice::create_staging_buffer(const void* data, uint64_t size, VkBuffer& buffer, VkDeviceMemory& memory)
    {
        if (!vk_create_buffer(
                handles_.device,
                handles_.physical_device,
                size,
                VK_BUFFER_USAGE_TRANSFER_SRC_BIT,
                vk_memory_props(RHIMemoryClass::CPUVisible),
                buffer,
                memory))
        {
            throw GpuResourceError(ResourceError::AllocationFailure, "staging buffer of " + std::to_string(size) + " bytes");
        }

        void* mapped = nullptr;
        if (vkMapMemory(handles_.device, memory, 0, size, 0, &mapped) != VK_SUCCESS)
        {
            vk_destroy_buffer(handles_.device, buffer, memory);
            throw GpuResourceError(ResourceError::AllocationFailure, "vkMapMemory failed for staging buffer");
        }
        std::memcpy(mapped, data, (size_t)size);
        vkUnmapMemory(handles_.device, memory);
    }

    bool VulkanGpuDevice::run_one_time_commands(const std::function<void(VkCommandBuffer)>& record)
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        VkCommandBufferAllocateInfo cba{};
        cba.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
        cba.commandPool = transient_pool_;
        cba.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
        cba.commandBufferCount = 1;
        VkCommandBuffer cmd = VK_NULL_HANDLE;
        VkFence fence = VK_NULL_HANDLE;
        VkFenceCreateInfo fci{};
        fci.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;

        bool ok = vkAllocateCommandBuffers(handles_.device, &cba, &cmd) == VK_SUCCESS;
        ok = ok && vkCreateFence(handles_.device, &fci, nullptr, &fence) == VK_SUCCESS;
        if (ok)
        {
            VkCommandBufferBeginInfo bi{};
            bi.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
            bi.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
            ok = vkBeginCommandBuffer(cmd, &bi) == VK_SUCCESS;
        }
        if (ok)
        {
            record(cmd);
            ok = vkEndCommandBuffer(cmd) == VK_SUCCESS;
        }
        if (ok)
        {
            VkSubmitInfo si{};
            si.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
            si.commandBufferCount = 1;
            si.pCommandBuffers = &cmd;
            ok = queue_submit(si, fence) == VK_SUCCESS;
            ok = ok && vkWaitForFences(handles_.device, 1, &fence, VK_TRUE, UINT64_MAX) == VK_SUCCESS;
        }

        if (fence != VK_NULL_HANDLE) vkDestroyFence(handles_.device, fence, nullptr);
        if (cmd != VK_NULL_HANDLE) vkFreeCommandBuffers(handles_.device, transient_pool_, 1, &cmd);
        return ok;
    }

    void VulkanGpuDevice::upload_to_gpu_only(VkBuffer dst, const void* data, uint64_t size)
    {
        VkBuffer staging = VK_NULL_HANDLE;
        VkDeviceMemory staging_memory = VK_NULL_HANDLE;
        create_staging_buffer(data, size, staging, staging_memory);

        const bool ok = run_one_time_commands([&](VkCommandBuffer cmd) {
            VkBufferCopy region{};
            region.size = size;
            vkCmdCopyBuffer(cmd, staging, dst, 1, &region);
        });
        vk_destroy_buffer(handles_.device, staging, staging_memory);
        if (!ok)
        {
            throw GpuResourceError(ResourceError::AllocationFailure, "staging upload failed");
        }
    }

    void VulkanGpuDevice::prepare_sampled_image(VkImage image, const RHIImageDesc& desc, const void* texels)
    {
        const uint32_t layers = std::max(1u, desc.array_length);
        VkBuffer staging = VK_NULL_HANDLE;
        VkDeviceMemory staging_memory = VK_NULL_HANDLE;
        if (texels) create_staging_buffer(texels, rhi_image_byte_size(desc), staging, staging_memory);

        const bool ok = run_one_time_commands([&](VkCommandBuffer cmd) {
            if (staging == VK_NULL_HANDLE)
            {
                vk_cmd_image_barrier(
                    cmd, image, VK_IMAGE_ASPECT_COLOR_BIT, layers,
                    VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL,
                    0, VK_ACCESS_SHADER_READ_BIT,
                    VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT, VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT);
                return;
            }

            vk_cmd_image_barrier(
                cmd, image, VK_IMAGE_ASPECT_COLOR_BIT, layers,
                VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
                0, VK_ACCESS_TRANSFER_WRITE_BIT,
                VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT, VK_PIPELINE_STAGE_TRANSFER_BIT);

            // Layers are tightly packed one after another.
            VkBufferImageCopy region{};
            region.imageSubresource.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
            region.imageSubresource.mipLevel = 0;
            region.imageSubresource.baseArrayLayer = 0;
            region.imageSubresource.layerCount = layers;
            region.imageExtent = {desc.width, desc.height, 1};
            vkCmdCopyBufferToImage(cmd, staging, image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1, &region);

            vk_cmd_image_barrier(
                cmd, image, VK_IMAGE_ASPECT_COLOR_BIT, layers,
                VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL,
                VK_ACCESS_TRANSFER_WRITE_BIT, VK_ACCESS_SHADER_READ_BIT,
                VK_PIPELINE_STAGE_TRANSFER_BIT, VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT);
        });
        if (staging != VK_NULL_HANDLE) vk_destroy_buffer(handles_.device, staging, staging_memory);
        if (!ok)
        {
            throw GpuResourceError(ResourceError::AllocationFailure, "upload of image '" + desc.label + "' failed");
        }
    }

    std::shared_ptr<IGpuImage> VulkanGpuDevice::create_image(const RHIImageDesc& desc, const void* initial_texels)
    {
        const bool cube = desc.type == RHIImageType::Cube;
        if (cube && (desc.array_length != 6 || desc.width != desc.height))
        {
            throw GpuResourceError(ResourceError::InvalidImageFormat, "cube image '" + desc.label + "' needs six square layers");
        }
        const bool sampled_only = desc.usage == RHIImageUsage_Sampled;
        if (initial_texels && !sampled_only)
        {
            throw GpuResourceError(ResourceError::InvalidState, "initial texels for non-sampled image '" + desc.label + "'");
        }

        VkImageCreateInfo ici{};
        ici.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
        ici.flags = cube ? VK_IMAGE_CREATE_CUBE_COMPATIBLE_BIT : 0u;
        ici.imageType = VK_IMAGE_TYPE_2D;
        ici.extent = {desc.width, desc.height, 1};
        ici.mipLevels = 1;
        ici.arrayLayers = std::max(1u, desc.array_length);
        ici.format = vk_format_from_rhi(desc.format);
        ici.tiling = VK_IMAGE_TILING_OPTIMAL;
        ici.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
        ici.usage = vk_image_usage(desc.usage);
        ici.samples = vk_samples(desc.sample_count);
        ici.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
        if (ici.format == VK_FORMAT_UNDEFINED || ici.usage == 0)
        {
            throw GpuResourceError(ResourceError::InvalidImageFormat, "image '" + desc.label + "'");
        }

        VkImage image = VK_NULL_HANDLE;
        VkDeviceMemory memory = VK_NULL_HANDLE;
        if (!vk_create_image(handles_.device, handles_.physical_device, ici, vk_memory_props(RHIMemoryClass::GPUOnly), image, memory))
        {
            throw GpuResourceError(ResourceError::AllocationFailure, "image '" + desc.label + "'");
        }

        VkImageView view = VK_NULL_HANDLE;
        try
        {
            view = create_view(handles_.device, image, desc);
            if (sampled_only) prepare_sampled_image(image, desc, initial_texels);
        }
        catch (const GpuResourceError&)
        {
            if (view != VK_NULL_HANDLE) vkDestroyImageView(handles_.device, view, nullptr);
            vk_destroy_image(handles_.device, image, memory);
            throw;
        }
        return std::make_shared<VulkanImage>(*this, desc, image, memory, view);
    }

    std::shared_ptr<VulkanImage> VulkanGpuDevice::wrap_external_image(VkImage image, const RHIImageDesc& desc)
    {
        const VkImageView view = create_view(handles_.device, image, desc);
        return std::make_shared<VulkanImage>(*this, desc, image, VK_NULL_HANDLE, view);
    }

    VkRenderPass VulkanGpuDevice::render_pass_for(const VulkanRenderPassKey& key)
    {
        std::lock_guard<std::mutex> lock(render_pass_mutex_);
        auto it = render_passes_.find(key);
        if (it != render_passes_.end()) return it->second;

        const bool has_color = key.color_format != VK_FORMAT_UNDEFINED;
        const bool has_depth = key.depth_format != VK_FORMAT_UNDEFINED;

        std::vector<VkAttachmentDescription2> attachments{};
        VkAttachmentReference2 color_ref{VK_STRUCTURE_TYPE_ATTACHMENT_REFERENCE_2};
        VkAttachmentReference2 depth_ref{VK_STRUCTURE_TYPE_ATTACHMENT_REFERENCE_2};
        VkAttachmentReference2 color_resolve_ref{VK_STRUCTURE_TYPE_ATTACHMENT_REFERENCE_2};
        VkAttachmentReference2 depth_resolve_ref{VK_STRUCTURE_TYPE_ATTACHMENT_REFERENCE_2};

        if (has_color)
        {
            VkAttachmentDescription2 a{VK_STRUCTURE_TYPE_ATTACHMENT_DESCRIPTION_2};
            a.format = key.color_format;
            a.samples = vk_samples(key.samples);
            a.loadOp = vk_load_op(key.color_load);
            a.storeOp = vk_store_op(key.color_store);
            a.stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
            a.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
            a.initialLayout = key.color_load == RHILoadAction::Load ? VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL : VK_IMAGE_LAYOUT_UNDEFINED;
            a.finalLayout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
            color_ref.attachment = static_cast<uint32_t>(attachments.size());
            color_ref.layout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
            color_ref.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
            attachments.push_back(a);
        }
        if (has_depth)
        {
            VkAttachmentDescription2 a{VK_STRUCTURE_TYPE_ATTACHMENT_DESCRIPTION_2};
            a.format = key.depth_format;
            a.samples = vk_samples(key.samples);
            a.loadOp = vk_load_op(key.depth_load);
            a.storeOp = vk_store_op(key.depth_store);
            a.stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
            a.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
            a.initialLayout = key.depth_load == RHILoadAction::Load ? VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL : VK_IMAGE_LAYOUT_UNDEFINED;
            a.finalLayout = VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL;
            depth_ref.attachment = static_cast<uint32_t>(attachments.size());
            depth_ref.layout = VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL;
            depth_ref.aspectMask = VK_IMAGE_ASPECT_DEPTH_BIT;
            attachments.push_back(a);
        }
        if (has_color && key.color_resolve)
        {
            VkAttachmentDescription2 a{VK_STRUCTURE_TYPE_ATTACHMENT_DESCRIPTION_2};
            a.format = key.color_format;
            a.samples = VK_SAMPLE_COUNT_1_BIT;
            a.loadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
            a.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
            a.stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
            a.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
            a.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
            a.finalLayout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
            color_resolve_ref.attachment = static_cast<uint32_t>(attachments.size());
            color_resolve_ref.layout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
            color_resolve_ref.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
            attachments.push_back(a);
        }
        if (has_depth && key.depth_resolve)
        {
            VkAttachmentDescription2 a{VK_STRUCTURE_TYPE_ATTACHMENT_DESCRIPTION_2};
            a.format = key.depth_format;
            a.samples = VK_SAMPLE_COUNT_1_BIT;
            a.loadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
            a.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
            a.stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
            a.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
            a.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
            a.finalLayout = VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL;
            depth_resolve_ref.attachment = static_cast<uint32_t>(attachments.size());
            depth_resolve_ref.layout = VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL;
            depth_resolve_ref.aspectMask = VK_IMAGE_ASPECT_DEPTH_BIT;
            attachments.push_back(a);
        }

        VkSubpassDescriptionDepthStencilResolve ds_resolve{};
        ds_resolve.sType = VK_STRUCTURE_TYPE_SUBPASS_DESCRIPTION_DEPTH_STENCIL_RESOLVE;
        ds_resolve.depthResolveMode = VK_RESOLVE_MODE_SAMPLE_ZERO_BIT;
        ds_resolve.stencilResolveMode = VK_RESOLVE_MODE_NONE;
        ds_resolve.pDepthStencilResolveAttachment = &depth_resolve_ref;

        VkSubpassDescription2 sub{VK_STRUCTURE_TYPE_SUBPASS_DESCRIPTION_2};
        sub.pipelineBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
        if (has_color)
        {
            sub.colorAttachmentCount = 1;
            sub.pColorAttachments = &color_ref;
            if (key.color_resolve) sub.pResolveAttachments = &color_resolve_ref;
        }
        if (has_depth)
        {
            sub.pDepthStencilAttachment = &depth_ref;
            if (key.depth_resolve) sub.pNext = &ds_resolve;
        }

        VkSubpassDependency2 dep{VK_STRUCTURE_TYPE_SUBPASS_DEPENDENCY_2};
        dep.srcSubpass = VK_SUBPASS_EXTERNAL;
        dep.dstSubpass = 0;
        dep.srcStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT | VK_PIPELINE_STAGE_LATE_FRAGMENT_TESTS_BIT | VK_PIPELINE_STAGE_TRANSFER_BIT;
        dep.dstStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT | VK_PIPELINE_STAGE_EARLY_FRAGMENT_TESTS_BIT;
        dep.dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT | VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT;

        VkRenderPassCreateInfo2 rp{VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO_2};
        rp.attachmentCount = static_cast<uint32_t>(attachments.size());
        rp.pAttachments = attachments.empty() ? nullptr : attachments.data();
        rp.subpassCount = 1;
        rp.pSubpasses = &sub;
        rp.dependencyCount = 1;
        rp.pDependencies = &dep;

        VkRenderPass pass = VK_NULL_HANDLE;
        if (vkCreateRenderPass2(handles_.device, &rp, nullptr, &pass) != VK_SUCCESS)
        {
            throw GpuResourceError(ResourceError::AllocationFailure, "vkCreateRenderPass2 failed");
        }
        render_passes_.emplace(key, pass);
        return pass;
    }

    std::shared_ptr<IRenderPipeline> VulkanGpuDevice::create_render_pipeline(const RHIRenderPipelineDesc& desc)
    {
        const bool raster = desc.rasterization_enabled;

        const uint32_t spec_data[2] = {std::max(1u, desc.amplification_count), (uint32_t)desc.view_select};
        const VkSpecializationMapEntry spec_entries[2] = {
            {0, 0, sizeof(uint32_t)},
            {1, sizeof(uint32_t), sizeof(uint32_t)},
        };
        VkSpecializationInfo spec{};
        spec.mapEntryCount = 2;
        spec.pMapEntries = spec_entries;
        spec.dataSize = sizeof(spec_data);
        spec.pData = spec_data;

        std::vector<VkPipelineShaderStageCreateInfo> stages{};
        VkPipelineShaderStageCreateInfo vs{};
        vs.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
        vs.stage = VK_SHADER_STAGE_VERTEX_BIT;
        vs.module = module_for(desc.vertex_program);
        vs.pName = "main";
        vs.pSpecializationInfo = &spec;
        stages.push_back(vs);
        if (raster && desc.fragment_program != RHIShaderProgram::None)
        {
            VkPipelineShaderStageCreateInfo fs{};
            fs.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
            fs.stage = VK_SHADER_STAGE_FRAGMENT_BIT;
            fs.module = module_for(desc.fragment_program);
            fs.pName = "main";
            stages.push_back(fs);
        }

        std::vector<VkVertexInputBindingDescription> bindings{};
        for (uint32_t i = 0; i < (uint32_t)desc.vertex_layout.buffers.size(); ++i)
        {
            bindings.push_back({i, desc.vertex_layout.buffers[i].stride, VK_VERTEX_INPUT_RATE_VERTEX});
        }
        std::vector<VkVertexInputAttributeDescription> attributes{};
        for (const VertexAttribute& a : desc.vertex_layout.attributes)
        {
            attributes.push_back({(uint32_t)a.semantic, a.buffer_index, vk_vertex_format(a.format), a.offset});
        }

        VkPipelineVertexInputStateCreateInfo vi{};
        vi.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
        vi.vertexBindingDescriptionCount = static_cast<uint32_t>(bindings.size());
        vi.pVertexBindingDescriptions = bindings.data();
        vi.vertexAttributeDescriptionCount = static_cast<uint32_t>(attributes.size());
        vi.pVertexAttributeDescriptions = attributes.data();

        VkPipelineInputAssemblyStateCreateInfo ia{};
        ia.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
        ia.topology = raster ? VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST : VK_PRIMITIVE_TOPOLOGY_POINT_LIST;

        const uint32_t viewport_count = desc.view_select == RHIViewSelect::ViewportIndex ? std::max(1u, desc.amplification_count) : 1u;
        VkPipelineViewportStateCreateInfo vp{};
        vp.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
        vp.viewportCount = viewport_count;
        vp.scissorCount = viewport_count;

        VkPipelineRasterizationStateCreateInfo rs{};
        rs.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
        rs.rasterizerDiscardEnable = raster ? VK_FALSE : VK_TRUE;
        rs.polygonMode = VK_POLYGON_MODE_FILL;
        rs.cullMode = VK_CULL_MODE_NONE;
        rs.frontFace = VK_FRONT_FACE_COUNTER_CLOCKWISE;
        rs.lineWidth = 1.0f;

        VkPipelineMultisampleStateCreateInfo ms{};
        ms.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
        ms.rasterizationSamples = vk_samples(desc.sample_count);

        VkPipelineDepthStencilStateCreateInfo ds{};
        ds.sType = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO;
        ds.depthTestEnable = VK_TRUE;
        ds.depthWriteEnable = VK_TRUE;
        ds.depthCompareOp = VK_COMPARE_OP_GREATER;

        VkPipelineColorBlendAttachmentState blend{};
        blend.colorWriteMask = desc.color_write_mask;
        if (desc.blend == RHIBlendMode::SourceOverPremultiplied)
        {
            blend.blendEnable = VK_TRUE;
            blend.srcColorBlendFactor = VK_BLEND_FACTOR_ONE;
            blend.dstColorBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
            blend.colorBlendOp = VK_BLEND_OP_ADD;
            blend.srcAlphaBlendFactor = VK_BLEND_FACTOR_ONE;
            blend.dstAlphaBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
            blend.alphaBlendOp = VK_BLEND_OP_ADD;
        }
        const bool has_color = vk_format_from_rhi(desc.color_format) != VK_FORMAT_UNDEFINED;
        VkPipelineColorBlendStateCreateInfo cb{};
        cb.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
        cb.attachmentCount = has_color ? 1u : 0u;
        cb.pAttachments = has_color ? &blend : nullptr;

        const std::array<VkDynamicState, 7> dynamic_states{
            VK_DYNAMIC_STATE_VIEWPORT,
            VK_DYNAMIC_STATE_SCISSOR,
            VK_DYNAMIC_STATE_CULL_MODE,
            VK_DYNAMIC_STATE_FRONT_FACE,
            VK_DYNAMIC_STATE_DEPTH_TEST_ENABLE,
            VK_DYNAMIC_STATE_DEPTH_WRITE_ENABLE,
            VK_DYNAMIC_STATE_DEPTH_COMPARE_OP,
        };
        VkPipelineDynamicStateCreateInfo dyn{};
        dyn.sType = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
        dyn.dynamicStateCount = static_cast<uint32_t>(dynamic_states.size());
        dyn.pDynamicStates = dynamic_states.data();

        VulkanRenderPassKey pass_key{};
        pass_key.color_format = vk_format_from_rhi(desc.color_format);
        pass_key.depth_format = vk_format_from_rhi(desc.depth_format);
        pass_key.samples = raster ? std::max(1u, desc.sample_count) : 1u;
        pass_key.color_resolve = pass_key.samples > 1 && pass_key.color_format != VK_FORMAT_UNDEFINED;
        pass_key.depth_resolve = pass_key.samples > 1 && pass_key.depth_format != VK_FORMAT_UNDEFINED;

        VkGraphicsPipelineCreateInfo gp{};
        gp.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
        gp.stageCount = static_cast<uint32_t>(stages.size());
        gp.pStages = stages.data();
        gp.pVertexInputState = &vi;
        gp.pInputAssemblyState = &ia;
        gp.pRasterizationState = &rs;
        if (raster)
        {
            gp.pViewportState = &vp;
            gp.pMultisampleState = &ms;
            gp.pDepthStencilState = &ds;
            gp.pColorBlendState = &cb;
            gp.pDynamicState = &dyn;
        }
        gp.layout = pipeline_layout_;
        gp.renderPass = render_pass_for(pass_key);
        gp.subpass = 0;

        VkPipeline pipeline = VK_NULL_HANDLE;
        if (vkCreateGraphicsPipelines(handles_.device, VK_NULL_HANDLE, 1, &gp, nullptr, &pipeline) != VK_SUCCESS)
        {
            throw GpuResourceError(ResourceError::AllocationFailure, "vkCreateGraphicsPipelines failed for '" + desc.label + "'");
        }
        return std::make_shared<VulkanRenderPipeline>(*this, desc, pipeline);
    }

    std::shared_ptr<IDepthStencilState> VulkanGpuDevice::create_depth_stencil_state(const RHIDepthStencilDesc& desc)
    {
        return std::make_shared<VulkanDepthStencilState>(desc);
    }

    std::shared_ptr<ISamplerState> VulkanGpuDevice::create_sampler_state(const RHISamplerDesc& desc)
    {
        VkSamplerCreateInfo si{};
        si.sType = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO;
        si.magFilter = vk_filter(desc.mag_filter);
        si.minFilter = vk_filter(desc.min_filter);
        si.mipmapMode = desc.mip_filter == RHIFilter::Nearest ? VK_SAMPLER_MIPMAP_MODE_NEAREST : VK_SAMPLER_MIPMAP_MODE_LINEAR;
        si.addressModeU = vk_address_mode(desc.address_u);
        si.addressModeV = vk_address_mode(desc.address_v);
        si.addressModeW = vk_address_mode(desc.address_w);
        si.minLod = 0.0f;
        si.maxLod = VK_LOD_CLAMP_NONE;
        si.borderColor = VK_BORDER_COLOR_FLOAT_OPAQUE_BLACK;

        VkSampler sampler = VK_NULL_HANDLE;
        if (vkCreateSampler(handles_.device, &si, nullptr, &sampler) != VK_SUCCESS)
        {
            throw GpuResourceError(ResourceError::AllocationFailure, "vkCreateSampler failed");
        }
        return std::make_shared<VulkanSamplerState>(*this, desc, sampler);
    }

    void VulkanGpuDevice::create_placeholder_images()
    {
        std::array<uint8_t, 4 * 6> white{};
        white.fill(255);

        RHIImageDesc d{};
        d.width = 1;
        d.height = 1;
        d.format = RHIFormat::RGBA8_UNorm;
        d.usage = RHIImageUsage_Sampled;
        d.label = "Placeholder Texture";
        placeholder_2d_ = std::static_pointer_cast<VulkanImage>(create_image(d, white.data()));

        d.type = RHIImageType::Cube;
        d.array_length = 6;
        d.label = "Placeholder Environment";
        placeholder_cube_ = std::static_pointer_cast<VulkanImage>(create_image(d, white.data()));

        placeholder_sampler_ = std::static_pointer_cast<VulkanSamplerState>(create_sampler_state(RHISamplerDesc{}));
    }

    const VulkanImage& VulkanGpuDevice::placeholder_image(RHITextureSlot slot) const
    {
        return slot == RHITextureSlot::EnvironmentLight ? *placeholder_cube_ : *placeholder_2d_;
    }

    VkSampler VulkanGpuDevice::placeholder_sampler() const
    {
        return placeholder_sampler_->handle();
    }

    std::unique_ptr<ICommandBuffer> VulkanGpuDevice::create_command_buffer(const std::string& label)
    {
        VkCommandBuffer cmd = VK_NULL_HANDLE;
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            VkCommandBufferAllocateInfo cba{};
            cba.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
            cba.commandPool = transient_pool_;
            cba.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
            cba.commandBufferCount = 1;
            if (vkAllocateCommandBuffers(handles_.device, &cba, &cmd) != VK_SUCCESS)
            {
                throw GpuResourceError(ResourceError::AllocationFailure, "command buffer '" + label + "'");
            }
        }

        VkCommandBufferBeginInfo bi{};
        bi.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
        bi.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
        if (vkBeginCommandBuffer(cmd, &bi) != VK_SUCCESS)
        {
            throw GpuResourceError(ResourceError::InvalidState, "vkBeginCommandBuffer failed for '" + label + "'");
        }

        auto free_cmd = [this](VkCommandBuffer c) {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            vkFreeCommandBuffers(handles_.device, transient_pool_, 1, &c);
        };
        auto submit = [this, free_cmd, label](VkCommandBuffer c) {
            VkFenceCreateInfo fci{};
            fci.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
            VkFence fence = VK_NULL_HANDLE;
            if (vkCreateFence(handles_.device, &fci, nullptr, &fence) != VK_SUCCESS)
            {
                free_cmd(c);
                throw GpuResourceError(ResourceError::AllocationFailure, "fence for '" + label + "'");
            }
            VkSubmitInfo si{};
            si.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
            si.commandBufferCount = 1;
            si.pCommandBuffers = &c;
            const bool ok = queue_submit(si, fence) == VK_SUCCESS &&
                            vkWaitForFences(handles_.device, 1, &fence, VK_TRUE, UINT64_MAX) == VK_SUCCESS;
            vkDestroyFence(handles_.device, fence, nullptr);
            free_cmd(c);
            if (!ok) throw GpuResourceError(ResourceError::InvalidState, "submission of '" + label + "' failed");
        };
        return std::make_unique<VulkanCommandBuffer>(*this, cmd, submit, free_cmd);
    }

    std::unique_ptr<ICommandBuffer> VulkanGpuDevice::wrap_command_buffer(VkCommandBuffer cmd, std::function<void(VkCommandBuffer)> submit)
    {
        return std::make_unique<VulkanCommandBuffer>(*this, cmd, std::move(submit));
    }

    VkResult VulkanGpuDevice::queue_submit(const VkSubmitInfo& submit, VkFence fence)
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        return vkQueueSubmit(handles_.graphics_queue, 1, &submit, fence);
    }

    void VulkanGpuDevice::begin_frame(uint64_t frame_index)
    {
        std::vector<std::function<void()>> release{};
        {
            std::lock_guard<std::mutex> lock(frame_mutex_);
            release.swap(retired_.at_frame(frame_index));
            descriptors_.at_frame(frame_index).reset_pools();
            current_frame_ = frame_index;
        }
        for (auto& destroy : release) destroy();
    }

    void VulkanGpuDevice::retire(std::function<void()> destroy)
    {
        std::lock_guard<std::mutex> lock(frame_mutex_);
        retired_.at_frame(current_frame_).push_back(std::move(destroy));
    }

    void VulkanGpuDevice::release_all_retired()
    {
        std::vector<std::function<void()>> release{};
        {
            std::lock_guard<std::mutex> lock(frame_mutex_);
            for (auto& slot : retired_)
            {
                for (auto& fn : slot) release.push_back(std::move(fn));
                slot.clear();
            }
        }
        for (auto& destroy : release) destroy();
    }

    void VulkanGpuDevice::wait_idle()
    {
        if (handles_.device == VK_NULL_HANDLE) return;
        std::lock_guard<std::mutex> lock(queue_mutex_);
        const VkResult res = vkDeviceWaitIdle(handles_.device);
        if (res != VK_SUCCESS)
        {
            log_error("VulkanGpuDevice: vkDeviceWaitIdle returned " + std::to_string((int)res));
        }
    }

    VkDescriptorSet VulkanGpuDevice::allocate_descriptor_set()
    {
        std::lock_guard<std::mutex> lock(frame_mutex_);
        return descriptors_.at_frame(current_frame_).allocate(set_layout_);
    }

    void VulkanGpuDevice::cmd_begin_label(VkCommandBuffer cmd, const std::string& name) const
    {
        if (!begin_label_) return;
        VkDebugUtilsLabelEXT label{};
        label.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_LABEL_EXT;
        label.pLabelName = name.c_str();
        begin_label_(cmd, &label);
    }

    void VulkanGpuDevice::cmd_end_label(VkCommandBuffer cmd) const
    {
        if (end_label_) end_label_(cmd);
    }
}
