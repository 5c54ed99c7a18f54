#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: vk_memory_utils.hpp
    MODULE: rhi/vulkan
    PURPOSE: Memory type lookup and buffer/image creation with dedicated device memory.
*/


#include <cstdint>

#include <vulkan/vulkan.h>

#include "mxr/rhi/resource_desc.hpp"

namespace mxr
{
    // CPU-visible memory is mapped once and written through the ring buffer,
    // so it must be coherent.
    inline VkMemoryPropertyFlags vk_memory_props(RHIMemoryClass memory)
    {
        return memory == RHIMemoryClass::CPUVisible
            ? (VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT)
            : VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT;
    }

    inline uint32_t vk_find_memory_type(
        VkPhysicalDevice physical_device,
        uint32_t type_bits,
        VkMemoryPropertyFlags required_props)
    {
        if (physical_device == VK_NULL_HANDLE) return UINT32_MAX;

        VkPhysicalDeviceMemoryProperties mp{};
        vkGetPhysicalDeviceMemoryProperties(physical_device, &mp);
        for (uint32_t i = 0; i < mp.memoryTypeCount; ++i)
        {
            const bool type_ok = (type_bits & (1u << i)) != 0;
            const bool props_ok = (mp.memoryTypes[i].propertyFlags & required_props) == required_props;
            if (type_ok && props_ok) return i;
        }
        return UINT32_MAX;
    }

    inline bool vk_allocate_for_requirements(
        VkDevice device,
        VkPhysicalDevice physical_device,
        const VkMemoryRequirements& req,
        VkMemoryPropertyFlags memory_props,
        VkDeviceMemory& out_memory)
    {
        const uint32_t memory_type = vk_find_memory_type(physical_device, req.memoryTypeBits, memory_props);
        if (memory_type == UINT32_MAX) return false;

        VkMemoryAllocateInfo mai{};
        mai.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
        mai.allocationSize = req.size;
        mai.memoryTypeIndex = memory_type;
        return vkAllocateMemory(device, &mai, nullptr, &out_memory) == VK_SUCCESS;
    }

    inline bool vk_create_buffer(
        VkDevice device,
        VkPhysicalDevice physical_device,
        VkDeviceSize size,
        VkBufferUsageFlags usage,
        VkMemoryPropertyFlags memory_props,
        VkBuffer& out_buffer,
        VkDeviceMemory& out_memory)
    {
        out_buffer = VK_NULL_HANDLE;
        out_memory = VK_NULL_HANDLE;
        if (device == VK_NULL_HANDLE || physical_device == VK_NULL_HANDLE || size == 0) return false;

        VkBufferCreateInfo bci{};
        bci.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
        bci.size = size;
        bci.usage = usage;
        bci.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
        if (vkCreateBuffer(device, &bci, nullptr, &out_buffer) != VK_SUCCESS) return false;

        VkMemoryRequirements req{};
        vkGetBufferMemoryRequirements(device, out_buffer, &req);
        if (!vk_allocate_for_requirements(device, physical_device, req, memory_props, out_memory))
        {
            vkDestroyBuffer(device, out_buffer, nullptr);
            out_buffer = VK_NULL_HANDLE;
            return false;
        }

        if (vkBindBufferMemory(device, out_buffer, out_memory, 0) != VK_SUCCESS)
        {
            vkFreeMemory(device, out_memory, nullptr);
            vkDestroyBuffer(device, out_buffer, nullptr);
            out_memory = VK_NULL_HANDLE;
            out_buffer = VK_NULL_HANDLE;
            return false;
        }
        return true;
    }

    inline void vk_destroy_buffer(VkDevice device, VkBuffer& buffer, VkDeviceMemory& memory)
    {
        if (device != VK_NULL_HANDLE)
        {
            if (buffer != VK_NULL_HANDLE) vkDestroyBuffer(device, buffer, nullptr);
            if (memory != VK_NULL_HANDLE) vkFreeMemory(device, memory, nullptr);
        }
        buffer = VK_NULL_HANDLE;
        memory = VK_NULL_HANDLE;
    }

    inline bool vk_create_image(
        VkDevice device,
        VkPhysicalDevice physical_device,
        const VkImageCreateInfo& ici,
        VkMemoryPropertyFlags memory_props,
        VkImage& out_image,
        VkDeviceMemory& out_memory)
    {
        out_image = VK_NULL_HANDLE;
        out_memory = VK_NULL_HANDLE;
        if (device == VK_NULL_HANDLE || physical_device == VK_NULL_HANDLE) return false;
        if (vkCreateImage(device, &ici, nullptr, &out_image) != VK_SUCCESS) return false;

        VkMemoryRequirements req{};
        vkGetImageMemoryRequirements(device, out_image, &req);
        if (!vk_allocate_for_requirements(device, physical_device, req, memory_props, out_memory))
        {
            vkDestroyImage(device, out_image, nullptr);
            out_image = VK_NULL_HANDLE;
            return false;
        }

        if (vkBindImageMemory(device, out_image, out_memory, 0) != VK_SUCCESS)
        {
            vkFreeMemory(device, out_memory, nullptr);
            vkDestroyImage(device, out_image, nullptr);
            out_memory = VK_NULL_HANDLE;
            out_image = VK_NULL_HANDLE;
            return false;
        }
        return true;
    }

    inline void vk_destroy_image(VkDevice device, VkImage& image, VkDeviceMemory& memory)
    {
        if (device != VK_NULL_HANDLE)
        {
            if (image != VK_NULL_HANDLE) vkDestroyImage(device, image, nullptr);
            if (memory != VK_NULL_HANDLE) vkFreeMemory(device, memory, nullptr);
        }
        image = VK_NULL_HANDLE;
        memory = VK_NULL_HANDLE;
    }
}
