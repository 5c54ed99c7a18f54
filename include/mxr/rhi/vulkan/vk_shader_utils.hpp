#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: vk_shader_utils.hpp
    MODULE: rhi/vulkan
    PURPOSE: Loads the build-time SPIR-V binaries (MXR_*_SPV) into shader modules.
*/


#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include <vulkan/vulkan.h>

#include "mxr/rhi/resource_desc.hpp"

namespace mxr
{
    inline constexpr uint32_t kSpirvMagic = 0x07230203u;

    // Reads straight into words so pCode is suitably aligned.
    inline bool vk_try_read_spirv(const char* path, std::vector<uint32_t>& out_words) noexcept
    {
        out_words.clear();
        if (!path || path[0] == '\0') return false;

        std::ifstream f(path, std::ios::ate | std::ios::binary);
        if (!f.is_open()) return false;

        const std::streampos end_pos = f.tellg();
        if (end_pos <= 0 || (static_cast<size_t>(end_pos) % sizeof(uint32_t)) != 0) return false;

        out_words.resize(static_cast<size_t>(end_pos) / sizeof(uint32_t));
        f.seekg(0);
        f.read(reinterpret_cast<char*>(out_words.data()), static_cast<std::streamsize>(end_pos));
        if (!f || out_words[0] != kSpirvMagic)
        {
            out_words.clear();
            return false;
        }
        return true;
    }

    // Missing shader binaries leave the renderer without pipelines: fatal.
    inline VkShaderModule vk_load_shader_module(VkDevice device, const char* spirv_path)
    {
        const std::string name = spirv_path ? spirv_path : "<null>";
        std::vector<uint32_t> words{};
        if (!vk_try_read_spirv(spirv_path, words))
        {
            throw GpuResourceError(ResourceError::AllocationFailure, "unreadable SPIR-V file: " + name);
        }

        VkShaderModuleCreateInfo ci{};
        ci.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
        ci.codeSize = words.size() * sizeof(uint32_t);
        ci.pCode = words.data();

        VkShaderModule out = VK_NULL_HANDLE;
        if (vkCreateShaderModule(device, &ci, nullptr, &out) != VK_SUCCESS)
        {
            throw GpuResourceError(ResourceError::AllocationFailure, "vkCreateShaderModule failed for " + name);
        }
        return out;
    }
}
