#include <atomic>
#include <cstdio>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "mxr/core/config.hpp"
#include "mxr/core/context.hpp"
#include "mxr/math/projection.hpp"
#include "mxr/physics/jolt_physics_world.hpp"
#include "mxr/render/render_loop.hpp"
#include "mxr/render/scene_renderer.hpp"
#include "mxr/scene/spatial_scene.hpp"
#include "mxr/scene/spatial_session.hpp"

#include "recording_device.hpp"

namespace
{
    class LoopSession final : public mxr::ISpatialSession
    {
    public:
        mxr::Result<bool> start(mxr::ISpatialEventSink&) override
        {
            ++start_calls;
            if (!start_error.empty()) return mxr::Result<bool>::failure(start_error);
            return mxr::Result<bool>::success(true);
        }

        void stop() override { ++stop_calls; }

        mxr::Result<mxr::AnchorId> add_world_anchor(const glm::mat4&) override
        {
            return mxr::Result<mxr::AnchorId>::success(next_anchor++);
        }

        void remove_all_world_anchors() override {}

        std::vector<mxr::HandAnchor> hand_anchors(double predicted_time) override
        {
            last_hand_query.store(predicted_time);
            return {};
        }

        std::string start_error{};
        std::atomic<int> start_calls{0};
        std::atomic<int> stop_calls{0};
        std::atomic<double> last_hand_query{-1.0};
        mxr::AnchorId next_anchor = 900;
    };

    // Hands out a fixed number of frames 1/90 s apart, then invalidates itself.
    class ScriptedCompositor final : public mxr::ICompositor
    {
    public:
        ScriptedCompositor(mxr::IGpuDevice& device, uint64_t frame_budget)
            : device_(device)
            , frame_budget_(frame_budget)
        {}

        mxr::RenderLayout layout() const override { return mxr::RenderLayout::Dedicated; }
        mxr::CompositorState state() const override { return state_.load(); }

        std::optional<mxr::CompositorFrame> next_frame() override
        {
            ++frames_requested;
            if (issued_ >= frame_budget_) return std::nullopt;

            mxr::CompositorFrame frame{};
            frame.index = issued_;
            frame.predicted_presentation_time = 1.0 + (double)issued_ / 90.0;
            frame.command_buffer = device_.create_command_buffer("Frame Commands");
            ++issued_;

            mxr::RHIViewport vp{};
            vp.width = 64.0f;
            vp.height = 64.0f;
            frame.views.view_matrices.push_back(glm::mat4(1.0f));
            frame.views.projection_matrices.push_back(mxr::perspective_infinite_reverse_z(1.2f, 1.0f, 0.01f));
            frame.views.viewports.push_back(vp);
            frame.views.camera_positions.push_back(glm::vec3(0.0f, 1.5f, 0.0f));
            frame.targets.color_textures.push_back(mxr_test::make_target(64, 64, mxr::RHIFormat::BGRA8_sRGB));
            frame.targets.depth_textures.push_back(mxr_test::make_target(64, 64, mxr::RHIFormat::D32F));
            return frame;
        }

        void present(mxr::CompositorFrame& frame) override
        {
            if (!present_error.empty()) throw std::runtime_error(present_error);
            auto* recorded = dynamic_cast<mxr_test::RecordingCommandBuffer*>(frame.command_buffer.get());
            if (recorded && !recorded->passes.empty()) ++presented_with_passes;
            ++presented;
            if (issued_ >= frame_budget_) state_.store(mxr::CompositorState::Invalidated);
        }

        void set_state(mxr::CompositorState s) { state_.store(s); }

        std::string present_error{};
        std::atomic<int> frames_requested{0};
        std::atomic<int> presented{0};
        std::atomic<int> presented_with_passes{0};

    private:
        mxr::IGpuDevice& device_;
        uint64_t frame_budget_ = 0;
        uint64_t issued_ = 0;
        std::atomic<mxr::CompositorState> state_{mxr::CompositorState::Running};
    };

    mxr::EngineConfig dedicated_config()
    {
        mxr::EngineConfig cfg{};
        cfg.renderer.layout = mxr::RenderLayout::Dedicated;
        cfg.renderer.raster_sample_count = 1;
        return cfg;
    }

    struct LoopFixture
    {
        explicit LoopFixture(uint64_t frame_budget)
            : ctx(device, dedicated_config())
            , world(ctx.config.physics)
            , scene(ctx, world, session)
            , renderer(ctx)
            , compositor(device, frame_budget)
        {}

        mxr_test::RecordingDevice device{};
        mxr::Context ctx;
        mxr::JoltPhysicsWorld world;
        LoopSession session{};
        mxr::SpatialScene scene;
        mxr::SceneRenderer renderer;
        ScriptedCompositor compositor;
    };

    bool test_session_start_failure_is_returned()
    {
        LoopFixture f(4);
        f.session.start_error = "world sensing not authorized";

        {
            mxr::SpatialRenderLoop loop(f.ctx, f.session, f.compositor, f.scene, f.renderer);
            const mxr::Result<bool> started = loop.start();
            if (started.ok) return false;
            if (started.error.find("world sensing not authorized") == std::string::npos) return false;
            if (loop.running()) return false;

            const mxr::Result<bool> ran = loop.run();
            if (ran.ok || ran.error.find("session start failed") == std::string::npos) return false;
            if (loop.frames_rendered() != 0) return false;
        }

        // The frame thread never ran and a session that never started is never stopped.
        return f.session.start_calls.load() == 2 && f.session.stop_calls.load() == 0 &&
               f.compositor.frames_requested.load() == 0 && f.ctx.frame_index == 0;
    }

    bool test_run_frame_on_calling_thread()
    {
        LoopFixture f(1);
        mxr::SpatialRenderLoop loop(f.ctx, f.session, f.compositor, f.scene, f.renderer);

        if (!loop.run_frame()) return false;
        if (loop.frames_rendered() != 1 || f.ctx.frame_index != 1) return false;
        if (f.compositor.presented.load() != 1 || f.compositor.presented_with_passes.load() != 1) return false;
        if (f.session.last_hand_query.load() != 1.0) return false;

        // No drawable: nothing is encoded or presented.
        if (loop.run_frame()) return false;
        return loop.frames_rendered() == 1 && f.compositor.presented.load() == 1;
    }

    bool test_run_until_compositor_invalidated()
    {
        LoopFixture f(3);
        mxr::SpatialRenderLoop loop(f.ctx, f.session, f.compositor, f.scene, f.renderer);

        const mxr::Result<bool> ran = loop.run();
        if (!ran.ok) return false;
        if (loop.running()) return false;
        if (loop.frames_rendered() != 3 || f.compositor.presented.load() != 3) return false;
        return f.session.start_calls.load() == 1 && f.session.stop_calls.load() == 1;
    }

    bool test_fatal_frame_error_is_returned()
    {
        LoopFixture f(5);
        f.compositor.present_error = "drawable lost";
        mxr::SpatialRenderLoop loop(f.ctx, f.session, f.compositor, f.scene, f.renderer);

        const mxr::Result<bool> ran = loop.run();
        if (ran.ok || ran.error.find("drawable lost") == std::string::npos) return false;
        return loop.frames_rendered() == 0 && f.session.stop_calls.load() == 1;
    }

    bool test_second_start_is_rejected()
    {
        LoopFixture f(0);
        f.compositor.set_state(mxr::CompositorState::Paused);
        mxr::SpatialRenderLoop loop(f.ctx, f.session, f.compositor, f.scene, f.renderer);

        if (!loop.start().ok) return false;
        const mxr::Result<bool> again = loop.start();
        loop.request_stop();
        const mxr::Result<bool> joined = loop.join();
        return !again.ok && joined.ok && f.session.start_calls.load() == 1 && f.session.stop_calls.load() == 1;
    }
}

int main()
{
    std::fprintf(stderr, "[mxr-tests] render loop: running\n");

    const bool ok_start_failure = test_session_start_failure_is_returned();
    const bool ok_run_frame = test_run_frame_on_calling_thread();
    const bool ok_invalidated = test_run_until_compositor_invalidated();
    const bool ok_fatal = test_fatal_frame_error_is_returned();
    const bool ok_restart = test_second_start_is_rejected();

    if (!ok_start_failure) std::fprintf(stderr, "[mxr-tests] session start failure failed\n");
    if (!ok_run_frame) std::fprintf(stderr, "[mxr-tests] run frame on calling thread failed\n");
    if (!ok_invalidated) std::fprintf(stderr, "[mxr-tests] run until invalidated failed\n");
    if (!ok_fatal) std::fprintf(stderr, "[mxr-tests] fatal frame error failed\n");
    if (!ok_restart) std::fprintf(stderr, "[mxr-tests] second start rejected failed\n");

    if (!(ok_start_failure && ok_run_frame && ok_invalidated && ok_fatal && ok_restart)) return 1;
    std::fprintf(stderr, "[mxr-tests] render loop: all tests passed\n");
    return 0;
}
