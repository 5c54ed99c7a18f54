#include <cstdio>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "mxr/core/config.hpp"
#include "mxr/core/context.hpp"
#include "mxr/math/projection.hpp"
#include "mxr/render/pipeline_cache.hpp"
#include "mxr/render/scene_renderer.hpp"
#include "mxr/resources/material.hpp"
#include "mxr/resources/mesh.hpp"
#include "mxr/resources/skeleton.hpp"
#include "mxr/resources/texture.hpp"
#include "mxr/scene/entity_graph.hpp"
#include "mxr/scene/light.hpp"
#include "mxr/scene/scene_content.hpp"

#include "recording_device.hpp"

namespace
{
    struct TestScene final : mxr::ISceneContent
    {
        const mxr::EntityGraph& graph() const override { return g; }

        std::vector<mxr::EntityId> entities() const override
        {
            std::vector<mxr::EntityId> out = g.flattened(g.root());
            if (!out.empty()) out.erase(out.begin());
            return out;
        }

        const std::vector<mxr::Light>& lights() const override { return scene_lights; }
        const std::optional<mxr::EnvironmentLight>& environment_light() const override { return env; }

        mxr::EntityId add(const std::string& name, std::shared_ptr<mxr::Mesh> mesh)
        {
            const mxr::EntityId e = g.create(name);
            g.node(e).mesh = std::move(mesh);
            g.add_child(g.root(), e);
            return e;
        }

        mxr::EntityGraph g{};
        std::vector<mxr::Light> scene_lights{mxr::Light(mxr::LightType::Directional, glm::vec3(1.0f), 1.0f)};
        std::optional<mxr::EnvironmentLight> env{};
    };

    mxr::FrameViews make_views(uint32_t count, float width, float height)
    {
        mxr::FrameViews views{};
        for (uint32_t i = 0; i < count; ++i)
        {
            views.view_matrices.push_back(glm::mat4(1.0f));
            views.projection_matrices.push_back(mxr::perspective_infinite_reverse_z(1.2f, width / height, 0.01f));
            mxr::RHIViewport vp{};
            vp.x = width * (float)i;
            vp.width = width;
            vp.height = height;
            views.viewports.push_back(vp);
            views.camera_positions.push_back(glm::vec3(0.03f * (float)i, 1.5f, 0.0f));
        }
        return views;
    }

    mxr::FrameTargets make_targets(uint32_t count, uint32_t width, uint32_t height, uint32_t layers = 1)
    {
        mxr::FrameTargets targets{};
        for (uint32_t i = 0; i < count; ++i)
        {
            targets.color_textures.push_back(mxr_test::make_target(width, height, mxr::RHIFormat::BGRA8_sRGB, layers));
            targets.depth_textures.push_back(mxr_test::make_target(width, height, mxr::RHIFormat::D32F, layers));
        }
        return targets;
    }

    mxr::EngineConfig config_for(mxr::RenderLayout layout, uint32_t samples)
    {
        mxr::EngineConfig cfg{};
        cfg.renderer.layout = layout;
        cfg.renderer.raster_sample_count = samples;
        return cfg;
    }

    std::shared_ptr<mxr::Mesh> box_with(mxr::IGpuDevice& device, std::shared_ptr<mxr::Material> material)
    {
        auto mesh = mxr::Mesh::generate_box(device, glm::vec3(0.1f));
        mesh->materials = {std::move(material)};
        return mesh;
    }

    std::shared_ptr<mxr::Material> blended_material()
    {
        auto m = mxr::Material::make_pbr(glm::vec4(1.0f, 1.0f, 1.0f, 0.5f), 0.5f, false);
        m->blend_mode = mxr::RHIBlendMode::SourceOverPremultiplied;
        return m;
    }

    bool test_pipeline_cache_identity()
    {
        mxr_test::RecordingDevice device{};
        mxr::PipelineCache cache(device, mxr::PipelineTargetDesc{});
        const mxr::VertexLayout layout = mxr::Mesh::generate_box(device, glm::vec3(1.0f))->layout();

        auto red = mxr::Material::make_pbr(glm::vec4(1.0f, 0.0f, 0.0f, 1.0f), 0.5f, false);
        auto blue = mxr::Material::make_pbr(glm::vec4(0.0f, 0.0f, 1.0f, 1.0f), 0.2f, true);
        auto occluder = mxr::Material::make_occlusion();
        auto glass = blended_material();

        if (cache.pipeline_for(layout, *red) != cache.pipeline_for(layout, *blue)) return false;
        if (cache.pipeline_count() != 1 || device.pipelines.size() != 1) return false;
        if (cache.pipeline_for(layout, *occluder) == cache.pipeline_for(layout, *red)) return false;
        if (cache.pipeline_for(layout, *glass)->desc().blend != mxr::RHIBlendMode::SourceOverPremultiplied) return false;
        if (cache.pipeline_count() != 3) return false;
        if (cache.pipeline_for(layout, *occluder)->desc().fragment_program != mxr::RHIShaderProgram::FragmentOcclusion) return false;
        if (cache.pipeline_for(layout, *occluder)->desc().color_write_mask != mxr::RHIColorWrite_None) return false;

        // Same category on another vertex layout compiles its own pipeline.
        const mxr::VertexLayout skinned = mxr::skinned_vertex_layout();
        if (skinned == layout) return false;
        const auto red_skinned = cache.pipeline_for(skinned, *red);
        if (red_skinned == cache.pipeline_for(layout, *red)) return false;
        if (red_skinned != cache.pipeline_for(skinned, *blue)) return false;
        if (!(red_skinned->desc().vertex_layout == skinned)) return false;
        if (cache.pipeline_count() != 4 || device.pipelines.size() != 4) return false;

        const auto skin = cache.skinning_pipeline_for(layout);
        if (skin->desc().rasterization_enabled || skin->desc().vertex_program != mxr::RHIShaderProgram::VertexSkin) return false;
        if (cache.skinning_pipeline_for(layout) != skin) return false;

        // Depth states follow material identity, not category.
        if (cache.depth_state_for(*red) == cache.depth_state_for(*blue)) return false;
        if (cache.depth_state_for(*red) != cache.depth_state_for(*red)) return false;
        if (cache.depth_state_count() != 2 || device.depth_states_created != 2) return false;
        if (cache.depth_state_for(*red)->desc().depth_compare != mxr::RHICompareOp::Greater) return false;

        auto overlay = mxr::Material::make_default_pbr();
        overlay->writes_depth = false;
        overlay->reads_depth = false;
        const auto overlay_state = cache.depth_state_for(*overlay);
        if (overlay_state->desc().depth_write || overlay_state->desc().depth_compare != mxr::RHICompareOp::Always) return false;

        const size_t compiled = device.pipelines.size();
        cache.set_target(mxr::PipelineTargetDesc{});
        if (cache.pipeline_count() != 5) return false;
        mxr::PipelineTargetDesc msaa{};
        msaa.sample_count = 4;
        cache.set_target(msaa);
        if (cache.pipeline_count() != 0) return false;
        if (cache.pipeline_for(layout, *red)->desc().sample_count != 4) return false;
        return device.pipelines.size() == compiled + 1 && cache.depth_state_count() == 3;
    }

    bool test_draw_order_occluders_opaque_blended()
    {
        mxr_test::RecordingDevice device{};
        mxr::Context ctx(device, config_for(mxr::RenderLayout::Shared, 1));
        mxr::SceneRenderer renderer(ctx);

        TestScene scene{};
        scene.add("Glass", box_with(device, blended_material()));
        scene.add("Wood", box_with(device, mxr::Material::make_default_pbr()));
        scene.add("Room", box_with(device, mxr::Material::make_occlusion()));
        const mxr::EntityId hidden = scene.add("Hidden", box_with(device, mxr::Material::make_default_pbr()));
        scene.g.node(hidden).hidden = true;
        scene.add("Empty", nullptr);

        const auto calls = mxr::build_draw_calls(scene);
        if (calls.size() != 3) return false;
        if (calls[0].sort_order != -1 || calls[1].sort_order != 0 || calls[2].sort_order != 1) return false;
        if (scene.g.node(calls[0].entity).name != "Room") return false;

        mxr_test::RecordingCommandBuffer cmd{};
        renderer.draw_frame(cmd, scene, make_views(2, 64.0f, 64.0f), make_targets(1, 128, 64));

        if (cmd.passes.size() != 1 || cmd.depth != 0) return false;
        const mxr_test::RecordedPass& pass = *cmd.passes[0];
        if (!pass.ended || pass.draws.size() != 3) return false;
        if (pass.draws[0].pipeline->desc().fragment_program != mxr::RHIShaderProgram::FragmentOcclusion) return false;
        if (pass.draws[1].pipeline->desc().blend != mxr::RHIBlendMode::Opaque) return false;
        if (pass.draws[2].pipeline->desc().blend != mxr::RHIBlendMode::SourceOverPremultiplied) return false;
        for (const mxr_test::RecordedDraw& d : pass.draws)
        {
            if (!d.indexed || d.cull != mxr::RHICullMode::Back) return false;
            if (d.depth_state->desc().depth_compare != mxr::RHICompareOp::Greater) return false;
        }
        return ctx.debug.draw_calls == 3 && ctx.debug.passes == 1;
    }

    bool test_skinning_prepass_only_when_dirty()
    {
        mxr_test::RecordingDevice device{};
        mxr::Context ctx(device, config_for(mxr::RenderLayout::Dedicated, 1));
        mxr::SceneRenderer renderer(ctx);

        std::vector<mxr::SkinnedVertex> vertices(3);
        vertices[1].position = glm::vec3(1.0f, 0.0f, 0.0f);
        vertices[2].position = glm::vec3(0.0f, 1.0f, 0.0f);
        auto base = mxr::Mesh::from_skinned_vertices(device, vertices, {0, 1, 2}, "Hand");

        auto skeleton = std::make_shared<mxr::Skeleton>();
        skeleton->name = "Hand Skeleton";
        skeleton->joint_paths = {"wrist"};
        skeleton->inverse_bind_transforms = {glm::mat4(1.0f)};
        skeleton->rest_transforms = {glm::mat4(1.0f)};

        TestScene scene{};
        const mxr::EntityId hand = scene.add("Mesh", base->copy_for_skinning(device));
        auto skinner = std::make_shared<mxr::Skinner>(skeleton, base);
        scene.g.node(hand).skinner = skinner;

        const mxr::FrameViews views = make_views(1, 32.0f, 32.0f);
        const mxr::FrameTargets targets = make_targets(1, 32, 32);

        mxr_test::RecordingCommandBuffer first{};
        renderer.draw_frame(first, scene, views, targets);
        if (first.passes.size() != 2) return false;
        const mxr_test::RecordedPass& skin = *first.passes[0];
        if (skin.desc.label != "Mesh Vertex Skinning" || skin.desc.color.image || skin.desc.depth.image) return false;
        if (skin.draws.size() != 1) return false;
        const mxr_test::RecordedDraw& d = skin.draws[0];
        if (d.primitive != mxr::RHIPrimitiveType::Point || d.indexed || d.count != 3) return false;
        if (d.skinning_output != scene.g.node(hand).mesh->vertex_buffers().front().buffer.get()) return false;
        if (d.pipeline->desc().rasterization_enabled) return false;
        if (skinner->dirty() || ctx.debug.skinning_draws != 1) return false;
        if (first.passes[1]->desc.label != "Main Pass #0" || first.passes[1]->draws.size() != 1) return false;

        mxr_test::RecordingCommandBuffer second{};
        renderer.draw_frame(second, scene, views, targets);
        if (second.passes.size() != 1 || ctx.debug.skinning_draws != 0) return false;

        if (!skinner->set_joint_transforms({glm::mat4(1.0f)})) return false;
        if (skinner->set_joint_transforms({})) return false;
        mxr_test::RecordingCommandBuffer third{};
        renderer.draw_frame(third, scene, views, targets);
        return third.passes.size() == 2 && third.passes[0]->draws.size() == 1 && third.depth == 0;
    }

    bool test_pass_count_per_layout()
    {
        TestScene scene{};
        mxr_test::RecordingDevice device{};
        scene.add("Block", box_with(device, mxr::Material::make_default_pbr()));
        const mxr::FrameViews stereo = make_views(2, 64.0f, 64.0f);

        {
            mxr::Context ctx(device, config_for(mxr::RenderLayout::Dedicated, 1));
            mxr::SceneRenderer renderer(ctx);
            if (renderer.pass_count(2) != 2 || renderer.pass_count(0) != 0) return false;
            mxr_test::RecordingCommandBuffer cmd{};
            const mxr::FrameTargets targets = make_targets(2, 64, 64);
            renderer.draw_frame(cmd, scene, stereo, targets);
            if (cmd.passes.size() != 2) return false;
            for (size_t i = 0; i < 2; ++i)
            {
                const mxr_test::RecordedPass& p = *cmd.passes[i];
                if (p.desc.label != "Main Pass #" + std::to_string(i)) return false;
                if (p.desc.color.image != targets.color_textures[i].get()) return false;
                if (p.viewports.size() != 1 || p.amplification_count != 1) return false;
                if (p.viewports[0].x != stereo.viewports[i].x) return false;
                if (p.draws.size() != 1 || p.draws[0].instance_count != 1) return false;
            }
            if (renderer.pipelines().target().view_select != mxr::RHIViewSelect::None) return false;

            mxr_test::RecordingCommandBuffer short_cmd{};
            try
            {
                renderer.draw_frame(short_cmd, scene, stereo, make_targets(1, 64, 64));
                return false;
            }
            catch (const std::invalid_argument&)
            {
            }
            if (!short_cmd.passes.empty()) return false;

            mxr_test::RecordingCommandBuffer empty_cmd{};
            renderer.draw_frame(empty_cmd, scene, mxr::FrameViews{}, targets);
            if (!empty_cmd.passes.empty()) return false;
        }
        {
            mxr::Context ctx(device, config_for(mxr::RenderLayout::Shared, 1));
            mxr::SceneRenderer renderer(ctx);
            mxr_test::RecordingCommandBuffer cmd{};
            renderer.draw_frame(cmd, scene, stereo, make_targets(1, 128, 64));
            if (cmd.passes.size() != 1) return false;
            const mxr_test::RecordedPass& p = *cmd.passes[0];
            if (p.viewports.size() != 2 || p.amplification_count != 2) return false;
            if (renderer.pipelines().target().view_select != mxr::RHIViewSelect::ViewportIndex) return false;
            if (p.draws[0].pipeline->desc().amplification_count != 2) return false;
        }
        {
            mxr::Context ctx(device, config_for(mxr::RenderLayout::Layered, 1));
            mxr::SceneRenderer renderer(ctx);
            mxr_test::RecordingCommandBuffer cmd{};
            renderer.draw_frame(cmd, scene, stereo, make_targets(1, 64, 64, 2));
            if (cmd.passes.size() != 1) return false;
            const mxr_test::RecordedPass& p = *cmd.passes[0];
            if (p.desc.render_target_array_length != 2 || p.amplification_count != 2) return false;
            if (renderer.pipelines().target().view_select != mxr::RHIViewSelect::Layer) return false;
        }
        return true;
    }

    bool test_lazy_msaa_targets()
    {
        mxr_test::RecordingDevice device{};
        mxr::Context ctx(device, config_for(mxr::RenderLayout::Dedicated, 4));
        mxr::SceneRenderer renderer(ctx);
        if (renderer.raster_sample_count() != 4) return false;
        if (renderer.msaa_allocations() != 0 || !device.images.empty()) return false;

        TestScene scene{};
        scene.add("Block", box_with(device, mxr::Material::make_default_pbr()));
        const mxr::FrameViews views = make_views(1, 64.0f, 64.0f);
        const mxr::FrameTargets small = make_targets(1, 64, 64);

        mxr_test::RecordingCommandBuffer first{};
        renderer.draw_frame(first, scene, views, small);
        if (renderer.msaa_allocations() != 1 || device.images.size() != 2) return false;
        if (device.images[0].sample_count != 4 || device.images[0].width != 64) return false;

        const mxr_test::RecordedPass& pass = *first.passes[0];
        if (pass.desc.color.image != renderer.msaa_color_targets()[0].get()) return false;
        if (pass.desc.color.resolve_image != small.color_textures[0].get()) return false;
        if (pass.desc.color.store != mxr::RHIStoreAction::MultisampleResolve) return false;
        if (pass.desc.depth.load != mxr::RHILoadAction::Clear || pass.desc.depth.clear_depth != 0.0f) return false;
        if (pass.desc.depth.resolve_image != small.depth_textures[0].get()) return false;
        if (pass.draws[0].pipeline->desc().sample_count != 4) return false;

        mxr_test::RecordingCommandBuffer second{};
        renderer.draw_frame(second, scene, views, small);
        if (renderer.msaa_allocations() != 1 || device.images.size() != 2) return false;

        mxr_test::RecordingCommandBuffer resized{};
        renderer.draw_frame(resized, scene, make_views(1, 128.0f, 64.0f), make_targets(1, 128, 64));
        return renderer.msaa_allocations() == 2 && device.images.size() == 4 && device.images[2].width == 128;
    }

    bool test_single_sample_depth_store()
    {
        mxr_test::RecordingDevice device(0x1u);
        mxr::Context ctx(device, config_for(mxr::RenderLayout::Dedicated, 4));
        mxr::SceneRenderer renderer(ctx);
        if (renderer.raster_sample_count() != 1) return false;

        TestScene scene{};
        mxr::FrameTargets targets = make_targets(1, 32, 32);

        mxr_test::RecordingCommandBuffer discard{};
        renderer.draw_frame(discard, scene, make_views(1, 32.0f, 32.0f), targets);
        const mxr_test::RecordedPass& a = *discard.passes[0];
        if (a.desc.color.image != targets.color_textures[0].get() || a.desc.color.resolve_image) return false;
        if (a.desc.depth.store != mxr::RHIStoreAction::DontCare || a.desc.depth.clear_depth != 0.0f) return false;
        if (!a.draws.empty() || !device.images.empty()) return false;

        targets.store_depth = true;
        mxr_test::RecordingCommandBuffer keep{};
        renderer.draw_frame(keep, scene, make_views(1, 32.0f, 32.0f), targets);
        return keep.passes[0]->desc.depth.store == mxr::RHIStoreAction::Store;
    }

    bool test_material_and_environment_textures()
    {
        mxr_test::RecordingDevice device{};
        mxr::Context ctx(device, config_for(mxr::RenderLayout::Dedicated, 1));
        mxr::SceneRenderer renderer(ctx);

        mxr::TextureData checker(2, 2, glm::u8vec4(255));
        checker.at(1, 0) = glm::u8vec4(0, 0, 0, 255);
        checker.at(0, 1) = glm::u8vec4(0, 0, 0, 255);
        const auto albedo = mxr::upload_texture(device, checker, mxr::TextureContent::Color, "Checker");
        if (device.images.back().format != mxr::RHIFormat::RGBA8_sRGB) return false;
        const auto bump = mxr::upload_texture(device, mxr::TextureData(1, 1, {128, 128, 255, 255}), mxr::TextureContent::Data, "Flat Normal");
        if (device.images.back().format != mxr::RHIFormat::RGBA8_UNorm) return false;
        const auto clamped = device.create_sampler_state(mxr::rhi_clamped_sampler_desc());

        auto textured = mxr::Material::make_default_pbr();
        mxr::PbrParams p = std::get<mxr::PbrParams>(textured->params);
        p.base_color_texture.image = albedo;
        p.normal_texture.image = bump;
        p.normal_texture.sampler = clamped;
        textured->params = p;

        TestScene scene{};
        mxr::EnvironmentLight sky{};
        sky.texture = mxr::upload_cubemap(
            device, mxr::make_gradient_cubemap(4, {90, 140, 255, 255}, {200, 200, 200, 255}, {40, 40, 40, 255}), "Sky");
        scene.env = sky;
        scene.add("Textured", box_with(device, textured));
        scene.add("Plain", box_with(device, mxr::Material::make_default_pbr()));

        mxr_test::RecordingCommandBuffer cmd{};
        renderer.draw_frame(cmd, scene, make_views(1, 64.0f, 64.0f), make_targets(1, 64, 64));
        if (cmd.passes.size() != 1 || cmd.passes[0]->draws.size() != 2) return false;

        const auto env_slot = (size_t)mxr::RHITextureSlot::EnvironmentLight;
        const auto base_slot = (size_t)mxr::RHITextureSlot::BaseColor;
        const auto normal_slot = (size_t)mxr::RHITextureSlot::Normal;
        const auto metal_slot = (size_t)mxr::RHITextureSlot::Metalness;
        int textured_draws = 0;
        for (const mxr_test::RecordedDraw& d : cmd.passes[0]->draws)
        {
            if (d.textures[env_slot] != sky.texture.get() || d.samplers[env_slot] != &renderer.environment_sampler()) return false;
            if (d.textures[metal_slot] != nullptr || d.samplers[metal_slot] != &renderer.default_sampler()) return false;
            if (d.textures[base_slot] == albedo.get())
            {
                ++textured_draws;
                if (d.samplers[base_slot] != &renderer.default_sampler()) return false;
                if (d.textures[normal_slot] != bump.get() || d.samplers[normal_slot] != clamped.get()) return false;
            }
            else if (d.textures[base_slot] != nullptr || d.textures[normal_slot] != nullptr)
            {
                return false;
            }
        }
        if (textured_draws != 1) return false;

        // A flat image is not a usable environment; the slot falls back to the placeholder.
        scene.env->texture = albedo;
        mxr_test::RecordingCommandBuffer flat{};
        renderer.draw_frame(flat, scene, make_views(1, 64.0f, 64.0f), make_targets(1, 64, 64));
        for (const mxr_test::RecordedDraw& d : flat.passes[0]->draws)
        {
            if (d.textures[env_slot] != nullptr) return false;
        }

        const mxr::RHIImageDesc& cube = sky.texture->desc();
        return cube.type == mxr::RHIImageType::Cube && cube.array_length == 6 &&
               cube.format == mxr::RHIFormat::RGBA8_sRGB && (cube.usage & mxr::RHIImageUsage_Sampled) != 0;
    }
}

int main()
{
    const bool ok_cache = test_pipeline_cache_identity();
    const bool ok_order = test_draw_order_occluders_opaque_blended();
    const bool ok_skin = test_skinning_prepass_only_when_dirty();
    const bool ok_passes = test_pass_count_per_layout();
    const bool ok_msaa = test_lazy_msaa_targets();
    const bool ok_depth = test_single_sample_depth_store();
    const bool ok_textures = test_material_and_environment_textures();

    if (!ok_cache) std::fprintf(stderr, "[mxr-tests] pipeline cache identity failed\n");
    if (!ok_order) std::fprintf(stderr, "[mxr-tests] draw ordering failed\n");
    if (!ok_skin) std::fprintf(stderr, "[mxr-tests] skinning pre-pass failed\n");
    if (!ok_passes) std::fprintf(stderr, "[mxr-tests] pass count per layout failed\n");
    if (!ok_msaa) std::fprintf(stderr, "[mxr-tests] lazy multisample targets failed\n");
    if (!ok_depth) std::fprintf(stderr, "[mxr-tests] single-sample depth store failed\n");
    if (!ok_textures) std::fprintf(stderr, "[mxr-tests] material and environment textures failed\n");

    if (!(ok_cache && ok_order && ok_skin && ok_passes && ok_msaa && ok_depth && ok_textures)) return 1;
    std::fprintf(stderr, "[mxr-tests] renderer: all tests passed\n");
    return 0;
}
