#include "mxr/render/render_loop.hpp"

#include <chrono>
#include <exception>
#include <vector>

#include "mxr/core/log.hpp"

namespace mxr
{
    SpatialRenderLoop::SpatialRenderLoop(
        Context& ctx,
        ISpatialSession& session,
        ICompositor& compositor,
        SpatialScene& scene,
        SceneRenderer& renderer)
        : ctx_(ctx)
        , session_(session)
        , compositor_(compositor)
        , scene_(scene)
        , renderer_(renderer)
    {
        clock_.max_dt = ctx.config.max_timestep;
        if (compositor_.layout() != renderer_.layout())
        {
            log_warn(std::string("SpatialRenderLoop: compositor layout ") + render_layout_name(compositor_.layout()) +
                     " differs from renderer layout " + render_layout_name(renderer_.layout()));
        }
    }

    SpatialRenderLoop::~SpatialRenderLoop()
    {
        request_stop();
        if (thread_.joinable()) thread_.join();
        if (session_started_) session_.stop();
    }

    Result<bool> SpatialRenderLoop::run()
    {
        const Result<bool> started = start();
        if (!started) return started;
        return join();
    }

    Result<bool> SpatialRenderLoop::start()
    {
        if (running_.load() || thread_.joinable())
        {
            return Result<bool>::failure("render loop already started");
        }

        const Result<bool> session = session_.start(scene_);
        if (!session)
        {
            log_error("SpatialRenderLoop: session failed to start: " + session.error);
            return Result<bool>::failure("session start failed: " + session.error);
        }
        session_started_ = true;

        stop_requested_.store(false);
        running_.store(true);
        thread_ = std::thread([this]() { thread_main(); });
        return Result<bool>::success(true);
    }

    Result<bool> SpatialRenderLoop::join()
    {
        if (thread_.joinable()) thread_.join();
        if (session_started_)
        {
            session_.stop();
            session_started_ = false;
        }

        std::lock_guard<std::mutex> lock(error_mutex_);
        if (!fatal_error_.empty()) return Result<bool>::failure(fatal_error_);
        return Result<bool>::success(true);
    }

    void SpatialRenderLoop::request_stop()
    {
        stop_requested_.store(true);
    }

    bool SpatialRenderLoop::run_frame()
    {
        std::optional<CompositorFrame> frame = compositor_.next_frame();
        if (!frame || !frame->command_buffer) return false;

        const float dt = clock_.advance(frame->predicted_presentation_time);

        std::vector<SpatialEvent> hand_events{};
        for (HandAnchor& hand : session_.hand_anchors(frame->predicted_presentation_time))
        {
            hand_events.emplace_back(HandAnchorEvent{std::move(hand), AnchorEvent::Updated});
        }
        if (!hand_events.empty()) scene_.enqueue_events(std::move(hand_events));

        scene_.update(dt);

        renderer_.draw_frame(*frame->command_buffer, scene_, frame->views, frame->targets);
        compositor_.present(*frame);

        ++ctx_.frame_index;
        ++frames_rendered_;
        return true;
    }

    void SpatialRenderLoop::thread_main()
    {
        log_info("SpatialRenderLoop: frame thread started");
        try
        {
            while (!stop_requested_.load())
            {
                const CompositorState state = compositor_.state();
                if (state == CompositorState::Invalidated) break;
                if (state == CompositorState::Paused)
                {
                    std::this_thread::sleep_for(std::chrono::milliseconds(10));
                    continue;
                }
                if (!run_frame())
                {
                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
                }
            }
        }
        catch (const std::exception& e)
        {
            log_error(std::string("SpatialRenderLoop: fatal frame error: ") + e.what());
            std::lock_guard<std::mutex> lock(error_mutex_);
            fatal_error_ = e.what();
        }
        running_.store(false);
        log_info("SpatialRenderLoop: frame thread stopped after " + std::to_string(frames_rendered_.load()) + " frames");
    }
}
