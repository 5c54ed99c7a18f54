#include "mxr/render/scene_renderer.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>

#include <glm/gtc/matrix_inverse.hpp>

#include "mxr/core/log.hpp"

namespace mxr
{
    std::vector<DrawCall> build_draw_calls(const ISceneContent& scene)
    {
        const EntityGraph& graph = scene.graph();
        std::vector<DrawCall> draws{};
        for (EntityId id : scene.entities())
        {
            const EntityNode* node = graph.get(id);
            if (!node || !node->mesh) continue;
            if (!graph.is_visible(id)) continue;

            const glm::mat4 model = graph.world_matrix(id);
            for (const Submesh& submesh : node->mesh->submeshes())
            {
                const Material* material = node->mesh->material_for(submesh);
                if (!material) continue;

                DrawCall d{};
                d.entity = id;
                d.mesh = node->mesh.get();
                d.submesh = &submesh;
                d.material = material;
                d.model_matrix = model;
                d.sort_order = material_sort_order(*material);
                draws.push_back(d);
            }
        }
        std::stable_sort(draws.begin(), draws.end(), [](const DrawCall& a, const DrawCall& b) {
            return a.sort_order < b.sort_order;
        });
        return draws;
    }

    InstanceConstants make_instance_constants(const glm::mat4& model)
    {
        InstanceConstants out{};
        out.model_matrix = model;
        out.normal_matrix = glm::mat4(glm::inverseTranspose(glm::mat3(model)));
        return out;
    }

    SceneRenderer::SceneRenderer(Context& ctx)
        : ctx_(ctx)
        , layout_(ctx.config.renderer.layout)
        , raster_sample_count_(preferred_raster_sample_count(ctx.gpu(), ctx.config.renderer.raster_sample_count))
        , constants_(ctx.gpu(), ctx.config.renderer.constants_ring_bytes, kConstantsRingLabel, ctx.gpu().capabilities().min_buffer_offset_alignment)
        , joints_(ctx.gpu(), ctx.config.renderer.joint_ring_bytes, kJointRingLabel, ctx.gpu().capabilities().min_buffer_offset_alignment)
        , pipelines_(ctx.gpu(), PipelineTargetDesc{})
        , default_sampler_(ctx.gpu().create_sampler_state(RHISamplerDesc{}))
        , environment_sampler_(ctx.gpu().create_sampler_state(rhi_clamped_sampler_desc()))
    {
        if (!default_sampler_ || !environment_sampler_)
        {
            throw GpuResourceError(ResourceError::AllocationFailure, "scene renderer sampler states");
        }
        log_info("SceneRenderer: layout " + std::string(render_layout_name(layout_)) +
                 ", " + std::to_string(raster_sample_count_) + "x raster samples");
    }

    uint32_t SceneRenderer::pass_count(uint32_t view_count) const
    {
        if (view_count == 0) return 0;
        return layout_ == RenderLayout::Dedicated ? view_count : 1u;
    }

    PipelineTargetDesc SceneRenderer::target_desc_for(const FrameViews& views, const FrameTargets& targets) const
    {
        PipelineTargetDesc desc{};
        desc.color_format = targets.color_textures.front()->format();
        desc.depth_format = targets.depth_textures.empty() ? RHIFormat::Unknown : targets.depth_textures.front()->format();
        desc.sample_count = raster_sample_count_;
        switch (layout_)
        {
            case RenderLayout::Dedicated:
                desc.amplification_count = 1;
                desc.view_select = RHIViewSelect::None;
                break;
            case RenderLayout::Shared:
                desc.amplification_count = std::min(views.view_count(), kMaxViewCount);
                desc.view_select = RHIViewSelect::ViewportIndex;
                break;
            case RenderLayout::Layered:
                desc.amplification_count = std::min(views.view_count(), kMaxViewCount);
                desc.view_select = RHIViewSelect::Layer;
                break;
        }
        return desc;
    }

    void SceneRenderer::draw_frame(ICommandBuffer& cmd, const ISceneContent& scene, const FrameViews& views, const FrameTargets& targets)
    {
        ctx_.debug.reset_frame();

        const uint32_t view_count = views.view_count();
        if (view_count == 0 || targets.color_textures.empty())
        {
            log_warn("SceneRenderer: frame has no views or no color target, skipping");
            return;
        }
        if (views.view_matrices.size() < view_count ||
            views.projection_matrices.size() < view_count ||
            views.camera_positions.size() < view_count)
        {
            throw std::invalid_argument("SceneRenderer: per-view data is shorter than the viewport list");
        }
        const uint32_t passes = pass_count(view_count);
        if (targets.color_textures.size() < passes)
        {
            throw std::invalid_argument(
                "SceneRenderer: " + std::to_string(passes) + " passes need as many color targets, got " +
                std::to_string(targets.color_textures.size()));
        }

        pipelines_.set_target(target_desc_for(views, targets));

        encode_skinning_pass(cmd, scene);

        const std::vector<DrawCall> draws = build_draw_calls(scene);

        // Instance data is shared by every pass of the frame.
        std::vector<uint64_t> instance_offsets{};
        instance_offsets.reserve(draws.size());
        for (const DrawCall& d : draws)
        {
            instance_offsets.push_back(constants_.copy(make_instance_constants(d.model_matrix)));
        }

        ensure_msaa_targets(targets);

        for (uint32_t i = 0; i < passes; ++i)
        {
            encode_main_pass(cmd, scene, views, targets, i, draws, instance_offsets);
        }

        ctx_.debug.pipelines_compiled = pipelines_.pipeline_count();
        ctx_.debug.depth_states_created = pipelines_.depth_state_count();
    }

    void SceneRenderer::encode_skinning_pass(ICommandBuffer& cmd, const ISceneContent& scene)
    {
        const EntityGraph& graph = scene.graph();
        std::vector<EntityId> skinned{};
        for (EntityId id : scene.entities())
        {
            const EntityNode* node = graph.get(id);
            if (node && node->skinner && node->mesh && node->skinner->dirty())
            {
                skinned.push_back(id);
            }
        }
        if (skinned.empty()) return;

        cmd.push_debug_group("Mesh Vertex Skinning");

        RHIRenderPassDesc pass{};
        pass.color.image = nullptr;
        pass.depth.image = nullptr;
        pass.label = "Mesh Vertex Skinning";
        std::unique_ptr<IRenderCommandEncoder> enc = cmd.begin_render_pass(pass);

        for (EntityId id : skinned)
        {
            const EntityNode& node = graph.node(id);
            Skinner& skinner = *node.skinner;
            const std::shared_ptr<const Mesh>& base = skinner.base_mesh();
            const Mesh& output = *node.mesh;

            if (!base || base->vertex_buffers().empty() || output.vertex_buffers().empty() || skinner.skeleton().joint_count() == 0)
            {
                log_warn("SceneRenderer: entity '" + node.name + "' has an incomplete skinner, skipping");
                skinner.clear_dirty();
                continue;
            }

            cmd.push_debug_group("Vertex Skinning (" + node.name + ")");

            const auto pipeline = pipelines_.skinning_pipeline_for(base->layout());
            enc->set_render_pipeline(*pipeline);

            const std::vector<BufferView>& inputs = base->vertex_buffers();
            for (uint32_t i = 0; i < (uint32_t)inputs.size(); ++i)
            {
                enc->set_vertex_buffer(i, *inputs[i].buffer, inputs[i].offset);
            }

            const std::vector<glm::mat4> joint_matrices = skinner.skinning_matrices();
            const uint64_t joint_bytes = (uint64_t)(joint_matrices.size() * sizeof(glm::mat4));
            const uint64_t joint_offset = joints_.copy(joint_matrices);
            enc->set_buffer(RHIBufferSlot::SkinningJoints, joints_.buffer(), joint_offset, joint_bytes);

            const BufferView& out = output.vertex_buffers().front();
            const uint64_t out_bytes = (uint64_t)output.layout().stride(0) * output.vertex_count();
            enc->set_buffer(RHIBufferSlot::SkinningOutput, *out.buffer, out.offset, out_bytes);

            enc->draw_primitives(RHIPrimitiveType::Point, 0, base->vertex_count());
            ++ctx_.debug.skinning_draws;
            skinner.clear_dirty();

            cmd.pop_debug_group();
        }

        enc->end_encoding();
        cmd.pop_debug_group();
    }

    void SceneRenderer::ensure_msaa_targets(const FrameTargets& targets)
    {
        if (raster_sample_count_ <= 1)
        {
            msaa_color_.clear();
            msaa_depth_.clear();
            return;
        }

        const IGpuImage& first = *targets.color_textures.front();
        const bool same_shape =
            first.width() == msaa_width_ &&
            first.height() == msaa_height_ &&
            first.array_length() == msaa_array_length_ &&
            msaa_color_.size() == targets.color_textures.size() &&
            msaa_depth_.size() == targets.depth_textures.size();
        if (same_shape) return;

        msaa_color_.clear();
        msaa_depth_.clear();
        IGpuDevice& device = ctx_.gpu();

        for (size_t i = 0; i < targets.color_textures.size(); ++i)
        {
            const IGpuImage& color = *targets.color_textures[i];
            RHIImageDesc desc{};
            desc.width = color.width();
            desc.height = color.height();
            desc.array_length = color.array_length();
            desc.sample_count = raster_sample_count_;
            desc.format = color.format();
            desc.usage = RHIImageUsage_ColorAttachment;
            desc.label = "Multisample Color Target " + std::to_string(i);
            auto image = device.create_image(desc);
            if (!image) throw GpuResourceError(ResourceError::AllocationFailure, desc.label);
            msaa_color_.push_back(std::move(image));
        }
        for (size_t i = 0; i < targets.depth_textures.size(); ++i)
        {
            const IGpuImage& depth = *targets.depth_textures[i];
            RHIImageDesc desc{};
            desc.width = depth.width();
            desc.height = depth.height();
            desc.array_length = depth.array_length();
            desc.sample_count = raster_sample_count_;
            desc.format = depth.format();
            desc.usage = RHIImageUsage_DepthStencilAttachment;
            desc.label = "Multisample Depth Target " + std::to_string(i);
            auto image = device.create_image(desc);
            if (!image) throw GpuResourceError(ResourceError::AllocationFailure, desc.label);
            msaa_depth_.push_back(std::move(image));
        }

        msaa_width_ = first.width();
        msaa_height_ = first.height();
        msaa_array_length_ = first.array_length();
        ++msaa_allocations_;
        log_info("SceneRenderer: allocated multisample targets " + std::to_string(msaa_width_) + "x" +
                 std::to_string(msaa_height_) + "x" + std::to_string(msaa_array_length_));
    }

    void SceneRenderer::encode_main_pass(
        ICommandBuffer& cmd,
        const ISceneContent& scene,
        const FrameViews& views,
        const FrameTargets& targets,
        uint32_t pass_index,
        const std::vector<DrawCall>& draws,
        const std::vector<uint64_t>& instance_offsets)
    {
        const bool multisampled = raster_sample_count_ > 1;
        const bool dedicated = layout_ == RenderLayout::Dedicated;
        IGpuImage* color = targets.color_textures[pass_index].get();
        IGpuImage* depth = pass_index < targets.depth_textures.size() ? targets.depth_textures[pass_index].get() : nullptr;

        RHIRenderPassDesc pass{};
        pass.label = "Main Pass #" + std::to_string(pass_index);
        pass.color.load = RHILoadAction::Clear;
        pass.color.clear_color = ctx_.config.renderer.clear_color;
        if (multisampled)
        {
            pass.color.image = msaa_color_[pass_index].get();
            pass.color.resolve_image = color;
            pass.color.store = RHIStoreAction::MultisampleResolve;
        }
        else
        {
            pass.color.image = color;
            pass.color.store = RHIStoreAction::Store;
        }

        if (depth)
        {
            pass.depth.load = RHILoadAction::Clear;
            pass.depth.clear_depth = 0.0f;
            if (multisampled)
            {
                pass.depth.image = msaa_depth_[pass_index].get();
                pass.depth.resolve_image = depth;
                pass.depth.store = RHIStoreAction::MultisampleResolve;
            }
            else
            {
                pass.depth.image = depth;
                pass.depth.store = targets.store_depth ? RHIStoreAction::Store : RHIStoreAction::DontCare;
            }
        }

        pass.render_target_array_length = color->array_length();
        pass.default_width = color->width();
        pass.default_height = color->height();
        if (pass_index < targets.rasterization_rate_maps.size())
        {
            pass.rasterization_rate_map = targets.rasterization_rate_maps[pass_index];
        }

        cmd.push_debug_group(pass.label);
        std::unique_ptr<IRenderCommandEncoder> enc = cmd.begin_render_pass(pass);
        ++ctx_.debug.passes;

        // Dedicated passes see only their own view; amplified passes see all of them.
        const uint32_t first_view = dedicated ? pass_index : 0u;
        const uint32_t pass_views = dedicated ? 1u : std::min(views.view_count(), kMaxViewCount);

        std::vector<RHIViewport> viewports(views.viewports.begin() + first_view, views.viewports.begin() + first_view + pass_views);
        enc->set_viewports(viewports);
        enc->set_amplification_count(dedicated ? 1u : pass_views);
        enc->set_front_face(RHIFrontFace::CCW);

        PassConstants constants{};
        for (uint32_t v = 0; v < kMaxViewCount; ++v)
        {
            // Unused slots repeat the last view so out-of-range amplification ids stay defined.
            const uint32_t src = first_view + std::min(v, pass_views - 1u);
            constants.view_matrices[v] = views.view_matrices[src];
            constants.projection_matrices[v] = views.projection_matrices[src];
            constants.camera_positions[v] = glm::vec4(views.camera_positions[src], 1.0f);
        }
        constants.view_count = pass_views;

        std::vector<PbrLight> lights{};
        for (const Light& l : scene.lights())
        {
            if (lights.size() >= ctx_.config.renderer.max_lights) break;
            lights.push_back(l.to_shader());
        }
        constants.active_light_count = (uint32_t)lights.size();
        if (lights.empty()) lights.emplace_back();

        const std::optional<EnvironmentLight>& env = scene.environment_light();
        const IGpuImage* env_texture = nullptr;
        if (env)
        {
            constants.environment_light_matrix = env->cube_from_world;
            constants.environment_intensity = env->scale_factor;
            if (env->texture && env->texture->desc().type == RHIImageType::Cube) env_texture = env->texture.get();
        }
        constants.environment_texture_bound = env_texture ? 1u : 0u;
        enc->set_texture(RHITextureSlot::EnvironmentLight, env_texture, *environment_sampler_);

        const uint64_t pass_offset = constants_.copy(constants);
        enc->set_buffer(RHIBufferSlot::PassConstants, constants_.buffer(), pass_offset, sizeof(PassConstants));
        const uint64_t light_offset = constants_.copy(lights);
        enc->set_buffer(RHIBufferSlot::Lights, constants_.buffer(), light_offset, (uint64_t)(lights.size() * sizeof(PbrLight)));

        for (size_t i = 0; i < draws.size(); ++i)
        {
            draw_mesh(*enc, draws[i], instance_offsets[i]);
        }

        enc->end_encoding();
        cmd.pop_debug_group();
    }

    void SceneRenderer::draw_mesh(IRenderCommandEncoder& enc, const DrawCall& draw, uint64_t instance_offset)
    {
        const Mesh& mesh = *draw.mesh;
        const Material& material = *draw.material;

        enc.set_buffer(RHIBufferSlot::InstanceConstants, constants_.buffer(), instance_offset, sizeof(InstanceConstants));

        const std::vector<BufferView>& buffers = mesh.vertex_buffers();
        for (uint32_t i = 0; i < (uint32_t)buffers.size(); ++i)
        {
            enc.set_vertex_buffer(i, *buffers[i].buffer, buffers[i].offset);
        }

        const auto pipeline = pipelines_.pipeline_for(mesh.layout(), material);
        enc.set_render_pipeline(*pipeline);

        bind_material_resources(material, constants_, *default_sampler_, enc);

        enc.set_cull_mode(material.double_sided ? RHICullMode::None : RHICullMode::Back);

        const auto depth_state = pipelines_.depth_state_for(material);
        enc.set_depth_stencil_state(*depth_state);

        const Submesh& submesh = *draw.submesh;
        if (submesh.index_buffer && submesh.index_buffer->buffer)
        {
            enc.draw_indexed(
                submesh.primitive,
                submesh.index_count,
                submesh.index_type,
                *submesh.index_buffer->buffer,
                submesh.index_buffer->offset,
                1);
            ++ctx_.debug.draw_calls;
        }
    }
}
