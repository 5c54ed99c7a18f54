#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: vk_descriptor_allocator.hpp
    MODULE: rhi/vulkan
    PURPOSE: Growable per-frame descriptor pool set. Pools are reset wholesale once the
            frame that used them has retired; sets are never freed individually.
*/


#include <utility>
#include <vector>

#include <vulkan/vulkan.h>

#include "mxr/rhi/resource_desc.hpp"

namespace mxr
{
    class VulkanDescriptorAllocator
    {
    public:
        static constexpr uint32_t kSetsPerPool = 512;

        void init(VkDevice device, uint32_t storage_buffers_per_set, uint32_t image_samplers_per_set)
        {
            device_ = device;
            storage_buffers_per_set_ = storage_buffers_per_set;
            image_samplers_per_set_ = image_samplers_per_set;
        }

        void cleanup()
        {
            for (VkDescriptorPool p : free_pools_) vkDestroyDescriptorPool(device_, p, nullptr);
            for (VkDescriptorPool p : used_pools_) vkDestroyDescriptorPool(device_, p, nullptr);
            free_pools_.clear();
            used_pools_.clear();
            current_pool_ = VK_NULL_HANDLE;
        }

        void reset_pools()
        {
            for (VkDescriptorPool p : used_pools_)
            {
                vkResetDescriptorPool(device_, p, 0);
                free_pools_.push_back(p);
            }
            used_pools_.clear();
            current_pool_ = VK_NULL_HANDLE;
        }

        VkDescriptorSet allocate(VkDescriptorSetLayout layout)
        {
            if (current_pool_ == VK_NULL_HANDLE)
            {
                current_pool_ = grab_pool();
                used_pools_.push_back(current_pool_);
            }

            VkDescriptorSetAllocateInfo ai{};
            ai.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
            ai.descriptorPool = current_pool_;
            ai.descriptorSetCount = 1;
            ai.pSetLayouts = &layout;

            VkDescriptorSet set = VK_NULL_HANDLE;
            VkResult res = vkAllocateDescriptorSets(device_, &ai, &set);
            if (res == VK_ERROR_FRAGMENTED_POOL || res == VK_ERROR_OUT_OF_POOL_MEMORY)
            {
                current_pool_ = grab_pool();
                used_pools_.push_back(current_pool_);
                ai.descriptorPool = current_pool_;
                res = vkAllocateDescriptorSets(device_, &ai, &set);
            }
            if (res != VK_SUCCESS)
            {
                throw GpuResourceError(ResourceError::AllocationFailure, "vkAllocateDescriptorSets failed");
            }
            return set;
        }

    private:
        VkDescriptorPool create_pool()
        {
            VkDescriptorPoolSize sizes[2]{};
            sizes[0].type = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
            sizes[0].descriptorCount = kSetsPerPool * storage_buffers_per_set_;
            sizes[1].type = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
            sizes[1].descriptorCount = kSetsPerPool * image_samplers_per_set_;

            VkDescriptorPoolCreateInfo ci{};
            ci.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
            ci.maxSets = kSetsPerPool;
            ci.poolSizeCount = image_samplers_per_set_ > 0 ? 2u : 1u;
            ci.pPoolSizes = sizes;

            VkDescriptorPool pool = VK_NULL_HANDLE;
            if (vkCreateDescriptorPool(device_, &ci, nullptr, &pool) != VK_SUCCESS)
            {
                throw GpuResourceError(ResourceError::AllocationFailure, "vkCreateDescriptorPool failed");
            }
            return pool;
        }

        VkDescriptorPool grab_pool()
        {
            if (!free_pools_.empty())
            {
                VkDescriptorPool pool = free_pools_.back();
                free_pools_.pop_back();
                return pool;
            }
            return create_pool();
        }

        VkDevice device_ = VK_NULL_HANDLE;
        uint32_t storage_buffers_per_set_ = 1;
        uint32_t image_samplers_per_set_ = 0;
        VkDescriptorPool current_pool_ = VK_NULL_HANDLE;
        std::vector<VkDescriptorPool> used_pools_{};
        std::vector<VkDescriptorPool> free_pools_{};
    };
}
