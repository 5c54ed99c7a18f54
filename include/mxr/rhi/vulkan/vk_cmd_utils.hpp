#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: vk_cmd_utils.hpp
    MODULE: rhi/vulkan
    PURPOSE: Command recording helpers: viewport conversion and image layout barriers.
*/


#include <cstdint>
#include <vector>

#include <vulkan/vulkan.h>

#include "mxr/rhi/gpu_device.hpp"

namespace mxr
{
    // Flips Y so clip space +Y points up, matching the projection helpers.
    inline VkViewport vk_make_viewport(const RHIViewport& v)
    {
        VkViewport vp{};
        vp.x = v.x;
        vp.y = v.y + v.height;
        vp.width = v.width;
        vp.height = -v.height;
        vp.minDepth = v.min_depth;
        vp.maxDepth = v.max_depth;
        return vp;
    }

    inline VkRect2D vk_make_scissor(const RHIViewport& v)
    {
        VkRect2D sc{};
        sc.offset = {static_cast<int32_t>(v.x), static_cast<int32_t>(v.y)};
        sc.extent = {static_cast<uint32_t>(v.width), static_cast<uint32_t>(v.height)};
        return sc;
    }

    inline void vk_cmd_set_viewports(VkCommandBuffer cmd, const std::vector<RHIViewport>& viewports)
    {
        std::vector<VkViewport> vps{};
        std::vector<VkRect2D> scs{};
        vps.reserve(viewports.size());
        scs.reserve(viewports.size());
        for (const RHIViewport& v : viewports)
        {
            vps.push_back(vk_make_viewport(v));
            scs.push_back(vk_make_scissor(v));
        }
        if (vps.empty()) return;
        vkCmdSetViewport(cmd, 0, static_cast<uint32_t>(vps.size()), vps.data());
        vkCmdSetScissor(cmd, 0, static_cast<uint32_t>(scs.size()), scs.data());
    }

    inline void vk_cmd_image_barrier(
        VkCommandBuffer cmd,
        VkImage image,
        VkImageAspectFlags aspect,
        uint32_t layer_count,
        VkImageLayout old_layout,
        VkImageLayout new_layout,
        VkAccessFlags src_access,
        VkAccessFlags dst_access,
        VkPipelineStageFlags src_stage,
        VkPipelineStageFlags dst_stage)
    {
        VkImageMemoryBarrier b{};
        b.sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER;
        b.oldLayout = old_layout;
        b.newLayout = new_layout;
        b.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        b.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        b.image = image;
        b.subresourceRange.aspectMask = aspect;
        b.subresourceRange.baseMipLevel = 0;
        b.subresourceRange.levelCount = 1;
        b.subresourceRange.baseArrayLayer = 0;
        b.subresourceRange.layerCount = layer_count;
        b.srcAccessMask = src_access;
        b.dstAccessMask = dst_access;
        vkCmdPipelineBarrier(cmd, src_stage, dst_stage, 0, 0, nullptr, 0, nullptr, 1, &b);
    }

    // Skinned vertices written by a vertex shader become vertex input for later passes.
    inline void vk_cmd_vertex_write_to_input_barrier(VkCommandBuffer cmd)
    {
        VkMemoryBarrier b{};
        b.sType = VK_STRUCTURE_TYPE_MEMORY_BARRIER;
        b.srcAccessMask = VK_ACCESS_SHADER_WRITE_BIT;
        b.dstAccessMask = VK_ACCESS_VERTEX_ATTRIBUTE_READ_BIT;
        vkCmdPipelineBarrier(
            cmd,
            VK_PIPELINE_STAGE_VERTEX_SHADER_BIT,
            VK_PIPELINE_STAGE_VERTEX_INPUT_BIT,
            0, 1, &b, 0, nullptr, 0, nullptr);
    }
}
