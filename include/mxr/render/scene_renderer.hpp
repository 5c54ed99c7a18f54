#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: scene_renderer.hpp
    MODULE: render
    PURPOSE: Per-frame encoder: skinning pre-pass for dirty skinners, then one main pass per
            view (dedicated layout) or a single amplified pass covering every view.
            Draws are sorted by material order: depth-only first, opaque, blended last.
            The environment cube, when the scene has one, is bound once per pass.
            Reversed-Z: depth clears to 0 and compares with "greater".
*/


#include <cstdint>
#include <memory>
#include <vector>

#include <glm/glm.hpp>

#include "mxr/core/context.hpp"
#include "mxr/render/frame_views.hpp"
#include "mxr/render/pipeline_cache.hpp"
#include "mxr/render/shader_types.hpp"
#include "mxr/resources/mesh.hpp"
#include "mxr/rhi/ring_buffer.hpp"
#include "mxr/scene/scene_content.hpp"

namespace mxr
{
    struct DrawCall
    {
        EntityId entity{};
        const Mesh* mesh = nullptr;
        const Submesh* submesh = nullptr;
        const Material* material = nullptr;
        glm::mat4 model_matrix{1.0f};
        int sort_order = 0;
    };

    // Visible entities with a mesh, one call per submesh, stable-sorted by material order.
    std::vector<DrawCall> build_draw_calls(const ISceneContent& scene);

    InstanceConstants make_instance_constants(const glm::mat4& model);

    class SceneRenderer
    {
    public:
        static constexpr const char* kConstantsRingLabel = "Constants Scratch Buffer";
        static constexpr const char* kJointRingLabel = "Skinning Joint Matrix Buffer";

        explicit SceneRenderer(Context& ctx);

        SceneRenderer(const SceneRenderer&) = delete;
        SceneRenderer& operator=(const SceneRenderer&) = delete;

        // Records the frame into `cmd`. Submission and presentation belong to the caller.
        void draw_frame(ICommandBuffer& cmd, const ISceneContent& scene, const FrameViews& views, const FrameTargets& targets);

        uint32_t raster_sample_count() const { return raster_sample_count_; }
        RenderLayout layout() const { return layout_; }
        uint32_t pass_count(uint32_t view_count) const;

        const PipelineCache& pipelines() const { return pipelines_; }
        PipelineCache& pipelines() { return pipelines_; }
        const RingBuffer& constants_ring() const { return constants_; }
        const RingBuffer& joint_ring() const { return joints_; }
        // Linear filtering, repeat addressing; used by material textures without their own sampler.
        const ISamplerState& default_sampler() const { return *default_sampler_; }
        const ISamplerState& environment_sampler() const { return *environment_sampler_; }

        const std::vector<std::shared_ptr<IGpuImage>>& msaa_color_targets() const { return msaa_color_; }
        const std::vector<std::shared_ptr<IGpuImage>>& msaa_depth_targets() const { return msaa_depth_; }
        uint64_t msaa_allocations() const { return msaa_allocations_; }

    private:
        void encode_skinning_pass(ICommandBuffer& cmd, const ISceneContent& scene);
        void encode_main_pass(
            ICommandBuffer& cmd,
            const ISceneContent& scene,
            const FrameViews& views,
            const FrameTargets& targets,
            uint32_t pass_index,
            const std::vector<DrawCall>& draws,
            const std::vector<uint64_t>& instance_offsets);
        void draw_mesh(IRenderCommandEncoder& enc, const DrawCall& draw, uint64_t instance_offset);
        void ensure_msaa_targets(const FrameTargets& targets);
        PipelineTargetDesc target_desc_for(const FrameViews& views, const FrameTargets& targets) const;

        Context& ctx_;
        RenderLayout layout_ = RenderLayout::Dedicated;
        uint32_t raster_sample_count_ = 1;
        RingBuffer constants_;
        RingBuffer joints_;
        PipelineCache pipelines_;
        std::shared_ptr<ISamplerState> default_sampler_{};
        std::shared_ptr<ISamplerState> environment_sampler_{};

        std::vector<std::shared_ptr<IGpuImage>> msaa_color_{};
        std::vector<std::shared_ptr<IGpuImage>> msaa_depth_{};
        uint32_t msaa_width_ = 0;
        uint32_t msaa_height_ = 0;
        uint32_t msaa_array_length_ = 0;
        uint64_t msaa_allocations_ = 0;
    };
}
