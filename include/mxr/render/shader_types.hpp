#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: shader_types.hpp
    MODULE: render
    PURPOSE: CPU mirrors of the std430 blocks declared in shaders/shader_interface.glsl.
*/


#include <cstdint>

#include <glm/glm.hpp>

namespace mxr
{
    inline constexpr uint32_t kMaxViewCount = 2;

    inline constexpr uint32_t kLightTypeDirectional = 0;
    inline constexpr uint32_t kLightTypePoint = 1;
    inline constexpr uint32_t kLightTypeSpot = 2;

    // PbrMaterialConstants::texture_mask bits; bit i is RHITextureSlot i.
    inline constexpr uint32_t kMaterialTextureBaseColor = 1u << 0u;
    inline constexpr uint32_t kMaterialTextureNormal = 1u << 1u;
    inline constexpr uint32_t kMaterialTextureMetalness = 1u << 2u;
    inline constexpr uint32_t kMaterialTextureRoughness = 1u << 3u;
    inline constexpr uint32_t kMaterialTextureEmissive = 1u << 4u;

    struct PassConstants
    {
        glm::mat4 view_matrices[kMaxViewCount]{};
        glm::mat4 projection_matrices[kMaxViewCount]{};
        glm::vec4 camera_positions[kMaxViewCount]{};
        glm::mat4 environment_light_matrix{1.0f};
        uint32_t active_light_count = 0;
        uint32_t view_count = 1;
        float environment_intensity = 0.0f;
        uint32_t environment_texture_bound = 0;
    };

    // Normal matrix is the inverse-transpose upper 3x3, stored in mat4 columns.
    struct InstanceConstants
    {
        glm::mat4 model_matrix{1.0f};
        glm::mat4 normal_matrix{1.0f};
    };

    struct PbrMaterialConstants
    {
        glm::vec4 base_color_factor{1.0f};
        glm::vec3 emissive_color{0.0f};
        float normal_scale = 1.0f;
        float metallic_factor = 1.0f;
        float roughness_factor = 1.0f;
        float emissive_strength = 1.0f;
        uint32_t texture_mask = 0;
    };

    struct PbrLight
    {
        glm::vec3 direction{0.0f, 0.0f, -1.0f};
        float range = 0.0f;
        glm::vec3 position{0.0f};
        float intensity = 1.0f;
        glm::vec3 color{1.0f};
        float inner_cone_cos = 0.0f;
        float outer_cone_cos = 0.0f;
        uint32_t type = kLightTypeDirectional;
        uint32_t pad0 = 0;
        uint32_t pad1 = 0;
    };

    static_assert(sizeof(PassConstants) == 368, "PassConstants must match the std430 layout");
    static_assert(sizeof(InstanceConstants) == 128, "InstanceConstants must match the std430 layout");
    static_assert(sizeof(PbrMaterialConstants) == 48, "PbrMaterialConstants must match the std430 layout");
    static_assert(sizeof(PbrLight) == 64, "PbrLight must match the std430 layout");
}
