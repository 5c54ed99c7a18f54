#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: render_loop.hpp
    MODULE: render
    PURPOSE: Compositor contract and the dedicated-thread frame loop:
            next frame -> clamp dt -> hand updates -> scene update -> encode -> present.
*/


#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "mxr/core/context.hpp"
#include "mxr/core/result.hpp"
#include "mxr/core/time.hpp"
#include "mxr/render/frame_views.hpp"
#include "mxr/render/scene_renderer.hpp"
#include "mxr/scene/spatial_scene.hpp"
#include "mxr/scene/spatial_session.hpp"

namespace mxr
{
    enum class CompositorState : uint8_t
    {
        Paused = 0,
        Running,
        Invalidated
    };

    inline const char* compositor_state_name(CompositorState s)
    {
        switch (s)
        {
            case CompositorState::Paused: return "paused";
            case CompositorState::Running: return "running";
            case CompositorState::Invalidated: return "invalidated";
        }
        return "unknown";
    }

    struct CompositorFrame
    {
        uint64_t index = 0;
        double predicted_presentation_time = 0.0;
        FrameViews views{};
        FrameTargets targets{};
        std::unique_ptr<ICommandBuffer> command_buffer{};
    };

    class ICompositor
    {
    public:
        virtual ~ICompositor() = default;

        virtual RenderLayout layout() const = 0;
        virtual CompositorState state() const = 0;
        // None when no drawable is available this iteration.
        virtual std::optional<CompositorFrame> next_frame() = 0;
        // Submits the frame's command buffer and presents its targets.
        virtual void present(CompositorFrame& frame) = 0;
    };

    class SpatialRenderLoop
    {
    public:
        SpatialRenderLoop(
            Context& ctx,
            ISpatialSession& session,
            ICompositor& compositor,
            SpatialScene& scene,
            SceneRenderer& renderer);
        ~SpatialRenderLoop();

        SpatialRenderLoop(const SpatialRenderLoop&) = delete;
        SpatialRenderLoop& operator=(const SpatialRenderLoop&) = delete;

        // Starts sensing and the frame thread, then blocks until the loop ends.
        // Session start failure and fatal frame errors come back as the error.
        Result<bool> run();

        // Non-blocking variant for callers that own another loop (window events).
        Result<bool> start();
        Result<bool> join();
        void request_stop();

        // One loop iteration on the calling thread. False when no frame was available.
        bool run_frame();

        bool running() const { return running_.load(); }
        uint64_t frames_rendered() const { return frames_rendered_.load(); }

    private:
        void thread_main();

        Context& ctx_;
        ISpatialSession& session_;
        ICompositor& compositor_;
        SpatialScene& scene_;
        SceneRenderer& renderer_;
        PresentationClock clock_{};

        std::thread thread_{};
        std::atomic<bool> stop_requested_{false};
        std::atomic<bool> running_{false};
        std::atomic<uint64_t> frames_rendered_{0};
        bool session_started_ = false;

        std::mutex error_mutex_{};
        std::string fatal_error_{};
    };
}
