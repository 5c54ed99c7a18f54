#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: material.hpp
    MODULE: resources
    PURPOSE: Material node (occlusion-only or physically based) with blend/depth/cull state,
            plus the per-variant capability set used by the renderer:
            shader programs, category, relative sort order, resource binding
            (constants and the five PBR texture slots).
*/


#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>

#include <glm/glm.hpp>

#include "mxr/render/shader_types.hpp"
#include "mxr/resources/texture.hpp"
#include "mxr/rhi/gpu_device.hpp"
#include "mxr/rhi/pipeline_desc.hpp"
#include "mxr/rhi/ring_buffer.hpp"

namespace mxr
{
    // Second half of the pipeline cache key.
    enum class MaterialCategory : uint8_t
    {
        Skinning = 0,
        Occlusion,
        PhysicallyBasedOpaque,
        PhysicallyBasedBlended,
        PhysicallyBasedDepthOnly
    };

    inline const char* material_category_name(MaterialCategory c)
    {
        switch (c)
        {
            case MaterialCategory::Skinning: return "skinning";
            case MaterialCategory::Occlusion: return "occlusion";
            case MaterialCategory::PhysicallyBasedOpaque: return "pbr-opaque";
            case MaterialCategory::PhysicallyBasedBlended: return "pbr-blended";
            case MaterialCategory::PhysicallyBasedDepthOnly: return "pbr-depth-only";
        }
        return "unknown";
    }

    struct OcclusionParams
    {
    };

    // Each texture, when present, multiplies its factor.
    struct PbrParams
    {
        glm::vec4 base_color_factor{1.0f};
        TextureResource base_color_texture{};
        glm::vec3 emissive_color{0.0f};
        float emissive_strength = 1.0f;
        TextureResource emissive_texture{};
        float normal_scale = 1.0f;
        TextureResource normal_texture{};
        float metallic_factor = 1.0f;
        TextureResource metalness_texture{};
        float roughness_factor = 1.0f;
        TextureResource roughness_texture{};
    };

    using MaterialParams = std::variant<OcclusionParams, PbrParams>;

    class Material
    {
    public:
        explicit Material(MaterialParams params)
            : params(std::move(params))
            , id_(next_id())
        {
            if (std::holds_alternative<OcclusionParams>(this->params))
            {
                color_write_mask = RHIColorWrite_None;
            }
        }

        static std::shared_ptr<Material> make_occlusion()
        {
            auto m = std::make_shared<Material>(OcclusionParams{});
            m->name = "Occlusion";
            return m;
        }

        static std::shared_ptr<Material> make_pbr(const glm::vec4& base_color, float roughness, bool is_metal)
        {
            PbrParams p{};
            p.base_color_factor = base_color;
            p.roughness_factor = roughness;
            p.metallic_factor = is_metal ? 1.0f : 0.0f;
            return std::make_shared<Material>(p);
        }

        static std::shared_ptr<Material> make_default_pbr()
        {
            auto m = make_pbr(glm::vec4(0.5f, 0.5f, 0.5f, 1.0f), 0.5f, false);
            m->name = "Default";
            return m;
        }

        // Stable per-instance identity; keys the depth state cache.
        uint64_t id() const { return id_; }

        std::string name{};
        RHIBlendMode blend_mode = RHIBlendMode::Opaque;
        bool double_sided = false;
        bool writes_depth = true;
        bool reads_depth = true;
        uint8_t color_write_mask = RHIColorWrite_All;
        MaterialParams params{};

    private:
        static uint64_t next_id()
        {
            static std::atomic<uint64_t> counter{1};
            return counter.fetch_add(1, std::memory_order_relaxed);
        }

        uint64_t id_ = 0;
    };

    template<class... Ts>
    struct overloaded : Ts...
    {
        using Ts::operator()...;
    };
    template<class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;

    inline MaterialCategory material_category(const Material& m)
    {
        return std::visit(overloaded{
            [](const OcclusionParams&) { return MaterialCategory::Occlusion; },
            [&m](const PbrParams&) {
                if (m.color_write_mask == RHIColorWrite_None) return MaterialCategory::PhysicallyBasedDepthOnly;
                if (m.blend_mode != RHIBlendMode::Opaque) return MaterialCategory::PhysicallyBasedBlended;
                return MaterialCategory::PhysicallyBasedOpaque;
            }
        }, m.params);
    }

    inline RHIShaderProgram material_vertex_program(const Material&)
    {
        return RHIShaderProgram::VertexMain;
    }

    inline RHIShaderProgram material_fragment_program(const Material& m)
    {
        return std::visit(overloaded{
            [](const OcclusionParams&) { return RHIShaderProgram::FragmentOcclusion; },
            [](const PbrParams&) { return RHIShaderProgram::FragmentPbr; }
        }, m.params);
    }

    // Occluders first (they lay down real-world depth), blended last.
    inline int material_sort_order(const Material& m)
    {
        return std::visit(overloaded{
            [](const OcclusionParams&) { return -1; },
            [&m](const PbrParams&) {
                if (m.color_write_mask == RHIColorWrite_None) return -1;
                if (m.blend_mode != RHIBlendMode::Opaque) return 1;
                return 0;
            }
        }, m.params);
    }

    // Every material slot is rebound per draw; absent textures leave a placeholder behind
    // the default sampler and a cleared texture_mask bit.
    inline void bind_material_resources(
        const Material& m,
        RingBuffer& constants,
        const ISamplerState& default_sampler,
        IRenderCommandEncoder& encoder)
    {
        std::visit(overloaded{
            [](const OcclusionParams&) {},
            [&](const PbrParams& p) {
                PbrMaterialConstants c{};
                c.base_color_factor = p.base_color_factor;
                c.emissive_color = p.emissive_color;
                c.normal_scale = p.normal_scale;
                c.metallic_factor = p.metallic_factor;
                c.roughness_factor = p.roughness_factor;
                c.emissive_strength = p.emissive_strength;

                auto bind = [&](RHITextureSlot slot, const TextureResource& tex, uint32_t bit) {
                    const ISamplerState& sampler = tex.sampler ? *tex.sampler : default_sampler;
                    encoder.set_texture(slot, tex.image.get(), sampler);
                    if (tex) c.texture_mask |= bit;
                };
                bind(RHITextureSlot::BaseColor, p.base_color_texture, kMaterialTextureBaseColor);
                bind(RHITextureSlot::Normal, p.normal_texture, kMaterialTextureNormal);
                bind(RHITextureSlot::Metalness, p.metalness_texture, kMaterialTextureMetalness);
                bind(RHITextureSlot::Roughness, p.roughness_texture, kMaterialTextureRoughness);
                bind(RHITextureSlot::Emissive, p.emissive_texture, kMaterialTextureEmissive);

                const uint64_t offset = constants.copy(c);
                encoder.set_buffer(RHIBufferSlot::MaterialConstants, constants.buffer(), offset, sizeof(c));
            }
        }, m.params);
    }
}
