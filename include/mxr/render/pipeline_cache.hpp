#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: pipeline_cache.hpp
    MODULE: render
    PURPOSE: Render pipeline cache keyed by (vertex layout, material category) and
            depth/stencil state cache keyed by material identity.
*/


#include <cstddef>
#include <cstdint>
#include <memory>
#include <unordered_map>

#include "mxr/core/log.hpp"
#include "mxr/resources/material.hpp"
#include "mxr/rhi/gpu_device.hpp"
#include "mxr/rhi/pipeline_desc.hpp"
#include "mxr/rhi/vertex_layout.hpp"

namespace mxr
{
    struct PipelineKey
    {
        VertexLayout layout{};
        MaterialCategory category = MaterialCategory::PhysicallyBasedOpaque;

        bool operator==(const PipelineKey&) const = default;
    };

    struct PipelineKeyHash
    {
        size_t operator()(const PipelineKey& k) const noexcept
        {
            return k.layout.hash() ^ ((size_t)k.category * 0x9e3779b97f4a7c15ull);
        }
    };

    // Attachment formats and view amplification shared by every main-pass pipeline.
    struct PipelineTargetDesc
    {
        RHIFormat color_format = RHIFormat::BGRA8_sRGB;
        RHIFormat depth_format = RHIFormat::D32F;
        uint32_t sample_count = 1;
        uint32_t amplification_count = 1;
        RHIViewSelect view_select = RHIViewSelect::None;

        bool operator==(const PipelineTargetDesc&) const = default;
    };

    class PipelineCache
    {
    public:
        PipelineCache(IGpuDevice& device, const PipelineTargetDesc& target)
            : device_(device)
            , target_(target)
        {}

        const PipelineTargetDesc& target() const { return target_; }

        // Compiled pipelines depend on the target; changing it drops them.
        void set_target(const PipelineTargetDesc& target)
        {
            if (target == target_) return;
            target_ = target;
            pipelines_.clear();
        }

        std::shared_ptr<IRenderPipeline> pipeline_for(const VertexLayout& layout, const Material& material)
        {
            const PipelineKey key{layout, material_category(material)};
            auto it = pipelines_.find(key);
            if (it != pipelines_.end()) return it->second;

            RHIRenderPipelineDesc desc{};
            desc.vertex_layout = layout;
            desc.vertex_program = material_vertex_program(material);
            desc.fragment_program = material_fragment_program(material);
            desc.color_format = target_.color_format;
            desc.depth_format = target_.depth_format;
            desc.sample_count = target_.sample_count;
            desc.amplification_count = target_.amplification_count;
            desc.view_select = target_.view_select;
            desc.rasterization_enabled = true;
            desc.color_write_mask = material.color_write_mask;
            desc.blend = material.blend_mode;
            desc.label = std::string("Main ") + material_category_name(key.category);
            return insert(key, desc);
        }

        // Non-rasterizing pipeline that writes skinned vertices from the vertex stage.
        std::shared_ptr<IRenderPipeline> skinning_pipeline_for(const VertexLayout& layout)
        {
            const PipelineKey key{layout, MaterialCategory::Skinning};
            auto it = pipelines_.find(key);
            if (it != pipelines_.end()) return it->second;

            RHIRenderPipelineDesc desc{};
            desc.vertex_layout = layout;
            desc.vertex_program = RHIShaderProgram::VertexSkin;
            desc.fragment_program = RHIShaderProgram::None;
            desc.color_format = RHIFormat::Unknown;
            desc.depth_format = RHIFormat::Unknown;
            desc.sample_count = 1;
            desc.amplification_count = 1;
            desc.view_select = RHIViewSelect::None;
            desc.rasterization_enabled = false;
            desc.color_write_mask = RHIColorWrite_None;
            desc.label = "Vertex Skinning";
            return insert(key, desc);
        }

        std::shared_ptr<IDepthStencilState> depth_state_for(const Material& material)
        {
            auto it = depth_states_.find(material.id());
            if (it != depth_states_.end()) return it->second;

            RHIDepthStencilDesc desc{};
            desc.depth_write = material.writes_depth;
            // Reversed Z: nearer fragments have greater depth.
            desc.depth_compare = material.reads_depth ? RHICompareOp::Greater : RHICompareOp::Always;
            auto state = device_.create_depth_stencil_state(desc);
            if (!state)
            {
                throw GpuResourceError(ResourceError::AllocationFailure, "depth state for material '" + material.name + "'");
            }
            depth_states_.emplace(material.id(), state);
            return state;
        }

        size_t pipeline_count() const { return pipelines_.size(); }
        size_t depth_state_count() const { return depth_states_.size(); }

    private:
        std::shared_ptr<IRenderPipeline> insert(const PipelineKey& key, const RHIRenderPipelineDesc& desc)
        {
            auto pipeline = device_.create_render_pipeline(desc);
            if (!pipeline)
            {
                throw GpuResourceError(ResourceError::AllocationFailure, "render pipeline '" + desc.label + "'");
            }
            log_info("PipelineCache: compiled '" + desc.label + "' (" + std::to_string(pipelines_.size() + 1) + " cached)");
            pipelines_.emplace(key, pipeline);
            return pipeline;
        }

        IGpuDevice& device_;
        PipelineTargetDesc target_{};
        std::unordered_map<PipelineKey, std::shared_ptr<IRenderPipeline>, PipelineKeyHash> pipelines_{};
        std::unordered_map<uint64_t, std::shared_ptr<IDepthStencilState>> depth_states_{};
    };
}
