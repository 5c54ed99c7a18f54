#define SDL_MAIN_HANDLED

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <SDL2/SDL.h>
#include <SDL2/SDL_vulkan.h>

#include <mxr/core/config.hpp>
#include <mxr/core/context.hpp>
#include <mxr/core/log.hpp>
#include <mxr/physics/jolt_adapter.hpp>
#include <mxr/physics/jolt_physics_world.hpp>
#include <mxr/render/render_loop.hpp>
#include <mxr/render/scene_renderer.hpp>
#include <mxr/resources/mesh.hpp>
#include <mxr/resources/model_loader_assimp.hpp>
#include <mxr/resources/texture.hpp>
#include <mxr/resources/texture_loader_sdl.hpp>
#include <mxr/rhi/vulkan/vk_window_compositor.hpp>
#include <mxr/scene/spatial_scene.hpp>

namespace
{
constexpr mxr::AnchorId kTablePlaneId = 1;
constexpr mxr::AnchorId kEnvironmentProbeId = 2;
constexpr mxr::AnchorId kLeftHandId = 10;
constexpr mxr::AnchorId kRightHandId = 11;
constexpr mxr::AnchorId kFirstWorldAnchorId = 1000;

const glm::vec3 kTableCenter{0.0f, 0.75f, -0.8f};
const glm::vec3 kHeadPosition{0.0f, 1.35f, 0.0f};

// Stand-in for a headset sensing service: a single table plane, a dim environment probe,
// untracked hands, and an automatic pinch on the table once it has been seen.
// MXR_ENVIRONMENT_DIR names a folder of six cube faces for the probe; otherwise it is a sky gradient.
class SimulatedSession final : public mxr::ISpatialSession
{
public:
    explicit SimulatedSession(mxr::IGpuDevice& device)
        : device_(device)
    {}

    ~SimulatedSession() override
    {
        stop();
    }

    mxr::Result<bool> start(mxr::ISpatialEventSink& sink) override
    {
        if (worker_.joinable()) return mxr::Result<bool>::failure("session already running");

        std::shared_ptr<mxr::Mesh> table{};
        std::shared_ptr<mxr::IGpuImage> environment{};
        try
        {
            environment = mxr::upload_cubemap(device_, environment_faces(), "Simulated Environment");
            const float hw = 0.6f;
            const float hd = 0.4f;
            table = mxr::Mesh::from_indexed_triangles(
                device_,
                {{-hw, 0.0f, -hd}, {-hw, 0.0f, hd}, {hw, 0.0f, hd}, {hw, 0.0f, -hd}},
                {0, 1, 2, 0, 2, 3},
                "Simulated Table Plane");
        }
        catch (const mxr::GpuResourceError& e)
        {
            return mxr::Result<bool>::failure(std::string("simulated anchors: ") + e.what());
        }

        stop_requested_ = false;
        worker_ = std::thread([this, &sink, table, environment]() { produce(sink, table, environment); });
        return mxr::Result<bool>::success(true);
    }

    void stop() override
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_requested_ = true;
        }
        cv_.notify_all();
        if (worker_.joinable()) worker_.join();
    }

    mxr::Result<mxr::AnchorId> add_world_anchor(const glm::mat4&) override
    {
        return mxr::Result<mxr::AnchorId>::success(next_world_anchor_.fetch_add(1));
    }

    void remove_all_world_anchors() override
    {
    }

    std::vector<mxr::HandAnchor> hand_anchors(double) override
    {
        mxr::HandAnchor left{};
        left.id = kLeftHandId;
        left.handedness = mxr::Handedness::Left;
        mxr::HandAnchor right{};
        right.id = kRightHandId;
        right.handedness = mxr::Handedness::Right;
        return {left, right};
    }

private:
    static mxr::CubemapData environment_faces()
    {
        if (const char* dir = std::getenv("MXR_ENVIRONMENT_DIR"))
        {
            mxr::CubemapData faces = mxr::load_cubemap_sdl_folder(dir);
            if (faces.valid()) return faces;
            mxr::log_warn(std::string("Simulated session: no usable cube faces in '") + dir + "', using the sky gradient");
        }
        return mxr::make_gradient_cubemap(32, {150, 190, 235, 255}, {220, 215, 200, 255}, {70, 60, 55, 255});
    }

    bool wait_for(std::chrono::milliseconds d)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return !cv_.wait_for(lock, d, [this]() { return stop_requested_; });
    }

    void produce(mxr::ISpatialEventSink& sink, std::shared_ptr<mxr::Mesh> table, std::shared_ptr<mxr::IGpuImage> environment)
    {
        if (!wait_for(std::chrono::milliseconds(500))) return;

        mxr::PlaneAnchorEvent plane{};
        plane.anchor.id = kTablePlaneId;
        plane.anchor.origin_from_anchor = mxr::Transform(kTableCenter, glm::quat(1.0f, 0.0f, 0.0f, 0.0f)).matrix();
        plane.anchor.alignment = mxr::PlaneAlignment::Horizontal;
        plane.anchor.classification = mxr::PlaneClassification::Table;
        plane.anchor.mesh = table;

        mxr::EnvironmentLightEvent probe{};
        probe.anchor.id = kEnvironmentProbeId;
        probe.anchor.light.texture = environment;
        probe.anchor.light.scale_factor = 0.35f;

        std::vector<mxr::SpatialEvent> events{};
        events.emplace_back(plane);
        events.emplace_back(probe);
        sink.enqueue_events(std::move(events));
        mxr::log_info("Simulated session: table plane detected");

        if (!wait_for(std::chrono::milliseconds(1500))) return;

        mxr::SpatialInputEvent pinch{};
        pinch.kind = mxr::InputKind::IndirectPinch;
        pinch.phase = mxr::InputPhase::Ended;
        pinch.selection_ray = mxr::Ray{kHeadPosition, glm::normalize(kTableCenter - kHeadPosition)};
        pinch.chirality = mxr::Handedness::Right;
        sink.enqueue_event(pinch);
    }

    mxr::IGpuDevice& device_;
    std::thread worker_{};
    std::mutex mutex_{};
    std::condition_variable cv_{};
    bool stop_requested_ = false;
    std::atomic<mxr::AnchorId> next_world_anchor_{kFirstWorldAnchorId};
};

class PreviewApp
{
public:
    PreviewApp(int argc, char** argv)
    {
        if (argc > 1) hand_model_path_ = argv[1];
        if (argc > 2) block_model_path_ = argv[2];
        mxr::apply_env_overrides(cfg_);
    }

    ~PreviewApp()
    {
        cleanup();
    }

    int run()
    {
        init_sdl();
        init_compositor();

        mxr::Context ctx(compositor_.device(), cfg_);
        mxr::jolt::PhysicsRuntime physics_runtime{};
        mxr::JoltPhysicsWorld physics_world(cfg_.physics);
        SimulatedSession session(compositor_.device());
        mxr::SpatialScene scene(ctx, physics_world, session);
        mxr::SceneRenderer renderer(ctx);

        load_optional_models(ctx, scene);

        mxr::SpatialRenderLoop loop(ctx, session, compositor_, scene, renderer);
        const mxr::Result<bool> started = loop.start();
        if (!started)
        {
            std::fprintf(stderr, "[mxr] %s\n", started.error.c_str());
            return 1;
        }

        scene_sink_ = &scene;
        main_loop(loop);

        compositor_.invalidate();
        loop.request_stop();
        const mxr::Result<bool> finished = loop.join();
        scene_sink_ = nullptr;
        compositor_.device().wait_idle();
        if (!finished)
        {
            std::fprintf(stderr, "[mxr] %s\n", finished.error.c_str());
            return 1;
        }
        mxr::log_info("Rendered " + std::to_string(loop.frames_rendered()) + " frames");
        return 0;
    }

private:
    void init_sdl()
    {
        if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0)
        {
            throw std::runtime_error(std::string("SDL_Init failed: ") + SDL_GetError());
        }
        sdl_ready_ = true;
        win_ = SDL_CreateWindow(
            cfg_.preview.app_name,
            SDL_WINDOWPOS_CENTERED,
            SDL_WINDOWPOS_CENTERED,
            cfg_.preview.width,
            cfg_.preview.height,
            SDL_WINDOW_VULKAN | SDL_WINDOW_RESIZABLE
        );
        if (!win_) throw std::runtime_error(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
    }

    void init_compositor()
    {
        int dw = 0;
        int dh = 0;
        SDL_Vulkan_GetDrawableSize(win_, &dw, &dh);
        if (dw <= 0 || dh <= 0)
        {
            dw = cfg_.preview.width;
            dh = cfg_.preview.height;
        }

        mxr::VulkanWindowCompositor::InitDesc init{};
        init.window = win_;
        init.width = dw;
        init.height = dh;
        init.enable_validation = cfg_.preview.enable_validation;
        init.present_mode = cfg_.preview.present_mode;
        init.layout = cfg_.renderer.layout;
        init.app_name = cfg_.preview.app_name;
        const mxr::Result<bool> ok = compositor_.init_sdl(init);
        if (!ok) throw std::runtime_error("Vulkan compositor init failed: " + ok.error);

        // The device may not support the requested layout.
        cfg_.renderer.layout = compositor_.layout();

        mxr::Transform head{};
        head.look(kTableCenter, kHeadPosition, glm::vec3(0.0f, 1.0f, 0.0f));
        compositor_.set_head_pose(head);
        std::fprintf(stderr, "[mxr] render layout: %s\n", mxr::render_layout_name(compositor_.layout()));
    }

    void load_optional_models(mxr::Context& ctx, mxr::SpatialScene& scene)
    {
        if (!hand_model_path_.empty())
        {
            const auto hand = mxr::load_model_assimp(ctx.gpu(), scene.graph(), hand_model_path_);
            mxr::HandRig* rig = scene.hand(mxr::Handedness::Right);
            if (hand && rig)
            {
                const auto skinned = scene.graph().collect_matching(hand.value, [](const mxr::EntityNode& n) {
                    return n.skinner != nullptr;
                });
                if (!skinned.empty()) rig->mesh_entity_name = scene.graph().node(skinned.front()).name;
                rig->attach_armature(scene.graph(), hand.value);
            }
            else if (!hand)
            {
                mxr::log_warn(hand.error + "; using the generated hand collider only");
            }
        }

        if (!block_model_path_.empty())
        {
            const auto block = mxr::load_model_assimp(ctx.gpu(), scene.graph(), block_model_path_);
            if (block)
            {
                scene.set_block_prototypes({block.value});
            }
            else
            {
                mxr::log_warn(block.error + "; using generated blocks");
            }
        }
    }

    void handle_event(const SDL_Event& e)
    {
        if (e.type == SDL_QUIT) running_ = false;
        if (e.type == SDL_KEYDOWN && e.key.keysym.sym == SDLK_ESCAPE) running_ = false;

        if (e.type == SDL_WINDOWEVENT)
        {
            switch (e.window.event)
            {
                case SDL_WINDOWEVENT_SIZE_CHANGED:
                case SDL_WINDOWEVENT_RESIZED:
                    compositor_.request_resize(e.window.data1, e.window.data2);
                    break;
                case SDL_WINDOWEVENT_MINIMIZED:
                    compositor_.set_paused(true);
                    break;
                case SDL_WINDOWEVENT_RESTORED:
                case SDL_WINDOWEVENT_SHOWN:
                    compositor_.set_paused(false);
                    break;
                default:
                    break;
            }
        }

        if (e.type == SDL_MOUSEBUTTONUP && e.button.button == SDL_BUTTON_LEFT && scene_sink_)
        {
            mxr::SpatialInputEvent input{};
            input.kind = mxr::InputKind::Pointer;
            input.phase = mxr::InputPhase::Ended;
            input.selection_ray = compositor_.ray_from_window_point((float)e.button.x, (float)e.button.y);
            scene_sink_->enqueue_event(input);
        }
    }

    void main_loop(mxr::SpatialRenderLoop& loop)
    {
        running_ = true;
        while (running_ && loop.running())
        {
            SDL_Event e{};
            while (SDL_PollEvent(&e))
            {
                handle_event(e);
            }
            SDL_Delay(4);
        }
    }

    void cleanup()
    {
        if (cleaned_up_) return;
        cleaned_up_ = true;

        compositor_.shutdown();
        if (win_)
        {
            SDL_DestroyWindow(win_);
            win_ = nullptr;
        }
        if (sdl_ready_)
        {
            SDL_Quit();
            sdl_ready_ = false;
        }
    }

    mxr::EngineConfig cfg_{};
    std::string hand_model_path_{};
    std::string block_model_path_{};
    bool cleaned_up_ = false;
    bool running_ = false;
    bool sdl_ready_ = false;
    SDL_Window* win_ = nullptr;
    mxr::VulkanWindowCompositor compositor_{};
    mxr::ISpatialEventSink* scene_sink_ = nullptr;
};
}

int main(int argc, char** argv)
{
    try
    {
        PreviewApp app(argc, argv);
        return app.run();
    }
    catch (const std::exception& e)
    {
        std::fprintf(stderr, "Fatal: %s\n", e.what());
        return 1;
    }
}
