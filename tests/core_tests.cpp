#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

#include <glm/gtc/quaternion.hpp>

#include "mxr/core/config.hpp"
#include "mxr/core/event_queue.hpp"
#include "mxr/core/time.hpp"
#include "mxr/logic/state_machine.hpp"
#include "mxr/math/bounding_box.hpp"
#include "mxr/math/projection.hpp"
#include "mxr/math/transform.hpp"
#include "mxr/resources/texture.hpp"
#include "mxr/rhi/ring_buffer.hpp"

#include "recording_device.hpp"

namespace
{
    bool approx_eq(float a, float b, float eps = 1e-4f)
    {
        return std::abs(a - b) <= eps;
    }

    bool approx_vec(const glm::vec3& a, const glm::vec3& b, float eps = 1e-4f)
    {
        return approx_eq(a.x, b.x, eps) && approx_eq(a.y, b.y, eps) && approx_eq(a.z, b.z, eps);
    }

    bool test_event_queue_multi_producer()
    {
        struct Item
        {
            int producer = 0;
            int seq = 0;
        };

        constexpr int kProducers = 4;
        constexpr int kPerProducer = 500;
        mxr::LockingQueue<Item> queue{};

        std::vector<std::thread> producers{};
        for (int p = 0; p < kProducers; ++p)
        {
            producers.emplace_back([&queue, p]() {
                for (int i = 0; i < kPerProducer; ++i)
                {
                    queue.enqueue(Item{p, i});
                }
            });
        }

        std::vector<Item> drained{};
        for (auto& t : producers) t.join();
        for (const Item& it : queue.drain_all()) drained.push_back(it);

        if ((int)drained.size() != kProducers * kPerProducer) return false;
        if (!queue.empty()) return false;

        // Each producer's items come out in the order it pushed them.
        std::vector<int> next(kProducers, 0);
        for (const Item& it : drained)
        {
            if (it.seq != next[it.producer]) return false;
            ++next[it.producer];
        }

        std::vector<Item> batch{{0, 0}, {0, 1}, {0, 2}};
        queue.enqueue(std::move(batch));
        queue.enqueue(std::vector<Item>{});
        return queue.size() == 3 && queue.drain_all().size() == 3 && queue.drain_all().empty();
    }

    bool test_transform_math()
    {
        const mxr::Transform t(
            glm::vec3(1.0f, 2.0f, -3.0f),
            glm::angleAxis(0.7f, glm::normalize(glm::vec3(0.3f, 1.0f, 0.2f))),
            glm::vec3(1.0f, 2.0f, 0.5f));

        const mxr::Transform decomposed(t.matrix());
        if (!mxr::transforms_near(decomposed, t)) return false;
        if (!approx_vec(decomposed.scale, t.scale)) return false;

        // Inverting a non-uniform scale under rotation introduces shear, so use a uniform one.
        const mxr::Transform u(t.position, t.rotation, glm::vec3(2.0f));
        const mxr::Transform round = u * u.inverse();
        if (!mxr::transforms_near(round, mxr::Transform::identity())) return false;

        mxr::Transform eye{};
        eye.look(glm::vec3(0.0f, 0.0f, -5.0f), glm::vec3(0.0f, 1.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f));
        const glm::vec3 expected = glm::normalize(glm::vec3(0.0f, -1.0f, -5.0f));
        if (!approx_vec(eye.forward(), expected)) return false;
        if (!approx_vec(eye.position, glm::vec3(0.0f, 1.0f, 0.0f))) return false;

        return approx_vec(t.transform_point(glm::vec3(0.0f)), t.position);
    }

    bool test_reverse_z_projection()
    {
        const float near_z = 0.005f;
        const glm::mat4 p = mxr::perspective_infinite_reverse_z(glm::radians(60.0f), 16.0f / 9.0f, near_z);

        auto depth_at = [&p](float distance) {
            const glm::vec4 clip = p * glm::vec4(0.0f, 0.0f, -distance, 1.0f);
            return clip.z / clip.w;
        };
        if (!approx_eq(depth_at(near_z), 1.0f)) return false;
        if (!(depth_at(1.0f) < depth_at(0.5f))) return false;
        if (!(depth_at(1.0e6f) < 1.0e-6f)) return false;

        const float sy = 1.0f / std::tan(glm::radians(60.0f) * 0.5f);
        if (!approx_eq(p[1][1], sy) || !approx_eq(p[0][0], sy / (16.0f / 9.0f))) return false;

        const glm::mat4 o = mxr::orthographic_reverse_z(-1.0f, 1.0f, -1.0f, 1.0f, 0.1f, 10.0f);
        const glm::vec4 on_near = o * glm::vec4(0.0f, 0.0f, -0.1f, 1.0f);
        const glm::vec4 on_far = o * glm::vec4(0.0f, 0.0f, -10.0f, 1.0f);
        return approx_eq(on_near.z, 1.0f) && approx_eq(on_far.z, 0.0f);
    }

    bool test_bounding_box()
    {
        mxr::BoundingBox box{};
        if (box.valid()) return false;
        box.expand(glm::vec3(-1.0f, 0.0f, 2.0f));
        box.expand(glm::vec3(3.0f, 4.0f, -2.0f));
        if (!box.valid()) return false;
        if (!approx_vec(box.center(), glm::vec3(1.0f, 2.0f, 0.0f))) return false;
        if (!approx_vec(box.extent(), glm::vec3(2.0f, 2.0f, 2.0f))) return false;
        if (!approx_vec(box.size(), glm::vec3(4.0f, 4.0f, 4.0f))) return false;

        const mxr::Transform shift(glm::vec3(10.0f, 0.0f, 0.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f));
        const mxr::BoundingBox moved = box.transformed(shift.matrix());
        return approx_vec(moved.minv, glm::vec3(9.0f, 0.0f, -2.0f)) && approx_vec(moved.maxv, glm::vec3(13.0f, 4.0f, 2.0f));
    }

    bool test_ring_buffer()
    {
        mxr_test::RecordingDevice device{};
        mxr::RingBuffer ring(device, 1024, "Test Ring", 256);

        if (ring.alloc(100) != 0) return false;
        if (ring.alloc(100) != 256) return false;
        if (ring.alloc(100) != 512) return false;
        if (ring.alloc(100) != 768) return false;
        // Next aligned offset runs past the end, so the ring wraps.
        if (ring.alloc(100) != 0) return false;

        const float payload[4] = {1.0f, 2.0f, 3.0f, 4.0f};
        const uint64_t offset = ring.copy_bytes(payload, sizeof(payload));
        if (offset != 256) return false;
        const auto* stored = reinterpret_cast<const float*>(static_cast<const uint8_t*>(ring.buffer().contents()) + offset);
        if (stored[2] != 3.0f) return false;

        if (ring.copy(std::vector<float>{}) != 0) return false;

        // A request that ends exactly at the buffer end fits without wrapping.
        mxr::RingBuffer exact(device, 1024, "Exact Ring", 256);
        for (uint64_t expected : {0ull, 256ull, 512ull, 768ull})
        {
            if (exact.alloc(256) != expected) return false;
        }
        if (exact.next_offset() != 1024) return false;
        if (exact.alloc(256) != 0) return false;
        if (exact.alloc(768) != 256) return false;
        mxr::RingBuffer whole(device, 1024, "Whole Ring", 256);
        if (whole.alloc(1024) != 0 || whole.alloc(1024) != 0) return false;

        try
        {
            (void)ring.alloc(2048);
            return false;
        }
        catch (const mxr::GpuResourceError& e)
        {
            return e.kind() == mxr::ResourceError::InvalidState;
        }
    }

    bool test_state_machine_one_way()
    {
        enum class Phase
        {
            Selecting,
            Playing
        };
        struct Ctx
        {
            int entered_playing = 0;
            double updated = 0.0;
            bool allow = false;
        };

        mxr::StateMachine<Phase, Ctx> sm{};
        mxr::StateMachine<Phase, Ctx>::StateCallbacks playing{};
        playing.on_enter = [](Ctx& c, Phase) { ++c.entered_playing; };
        playing.on_update = [](Ctx& c, double dt, double) { c.updated += dt; };
        if (!sm.add_state(Phase::Selecting)) return false;
        if (!sm.add_state(Phase::Playing, playing)) return false;
        if (sm.add_state(Phase::Playing)) return false;
        if (!sm.add_edge(Phase::Selecting, Phase::Playing, [](const Ctx& c) { return c.allow; })) return false;

        Ctx ctx{};
        if (sm.transition_to(Phase::Playing, ctx)) return false;
        if (!sm.start(Phase::Selecting, ctx)) return false;
        if (sm.transition_to(Phase::Playing, ctx)) return false;

        ctx.allow = true;
        if (!sm.transition_to(Phase::Playing, ctx)) return false;
        if (!sm.in_state(Phase::Playing) || ctx.entered_playing != 1) return false;

        // No edge back.
        if (sm.transition_to(Phase::Selecting, ctx)) return false;
        if (sm.transition_to(Phase::Playing, ctx)) return false;

        sm.tick(ctx, 0.25);
        sm.tick(ctx, -1.0);
        return approx_eq((float)ctx.updated, 0.25f) && approx_eq((float)sm.state_time(), 0.25f);
    }

    bool test_config_env_overrides()
    {
        if (!mxr::parse_env_bool("YES", false) || mxr::parse_env_bool("off", true)) return false;
        if (!mxr::parse_env_bool("maybe", true)) return false;
        if (mxr::parse_env_u32("abc", 7) != 7 || mxr::parse_env_u32("0", 7) != 1) return false;
        if (mxr::parse_env_render_layout("sideways", mxr::RenderLayout::Shared) != mxr::RenderLayout::Shared) return false;

        setenv("MXR_RENDER_LAYOUT", "layered", 1);
        setenv("MXR_TOWER_LAYERS", "0", 1);
        setenv("MXR_PHYSICS_COLLISION_STEPS", "3", 1);
        setenv("MXR_VK_VALIDATION", "on", 1);
        setenv("MXR_VK_PRESENT_MODE", "mailbox", 1);
        setenv("MXR_MAX_TIMESTEP", "0.05", 1);
        setenv("MXR_RASTER_SAMPLES", "8", 1);

        mxr::EngineConfig cfg{};
        mxr::apply_env_overrides(cfg);

        unsetenv("MXR_RENDER_LAYOUT");
        unsetenv("MXR_TOWER_LAYERS");
        unsetenv("MXR_PHYSICS_COLLISION_STEPS");
        unsetenv("MXR_VK_VALIDATION");
        unsetenv("MXR_VK_PRESENT_MODE");
        unsetenv("MXR_MAX_TIMESTEP");
        unsetenv("MXR_RASTER_SAMPLES");

        if (cfg.renderer.layout != mxr::RenderLayout::Layered) return false;
        if (cfg.scene.tower_layers != 1) return false;
        if (cfg.physics.collision_steps != 3) return false;
        if (!cfg.preview.enable_validation) return false;
        if (cfg.preview.present_mode != mxr::PresentModePreference::Mailbox) return false;
        if (!approx_eq((float)cfg.max_timestep, 0.05f)) return false;
        if (cfg.renderer.raster_sample_count != 8) return false;

        mxr::EngineConfig defaults{};
        mxr::apply_env_overrides(defaults);
        return defaults.scene.tower_layers == 7 &&
               defaults.physics.collision_steps == 6 &&
               defaults.renderer.constants_ring_bytes == 256u * 1024u &&
               defaults.renderer.joint_ring_bytes == 4u * 1024u * 1024u;
    }

    bool test_sample_count_selection()
    {
        // 1, 2 and 4 samples supported.
        mxr_test::RecordingDevice device(0x1u | 0x2u | 0x8u);
        return mxr::preferred_raster_sample_count(device, 4) == 4 &&
               mxr::preferred_raster_sample_count(device, 16) == 4 &&
               mxr::preferred_raster_sample_count(device, 3) == 2 &&
               mxr::preferred_raster_sample_count(device, 1) == 1 &&
               mxr::preferred_raster_sample_count(device, 0) == 1;
    }

    bool test_presentation_clock_clamps()
    {
        mxr::PresentationClock clock{};
        if (clock.advance(10.0) != 0.0f) return false;
        if (!approx_eq(clock.advance(10.016), 0.016f)) return false;
        if (!approx_eq(clock.advance(12.0), (float)mxr::kDefaultMaxTimestep)) return false;
        return clock.advance(11.0) == 0.0f;
    }

    bool test_gradient_cubemap_upload()
    {
        // Face centers look down the six axes.
        if (!approx_vec(mxr::cube_face_direction(0, 3, 3, 7), glm::vec3(1.0f, 0.0f, 0.0f))) return false;
        if (!approx_vec(mxr::cube_face_direction(2, 3, 3, 7), glm::vec3(0.0f, 1.0f, 0.0f))) return false;
        if (!approx_vec(mxr::cube_face_direction(5, 3, 3, 7), glm::vec3(0.0f, 0.0f, -1.0f))) return false;

        const mxr::CubemapData sky = mxr::make_gradient_cubemap(8, {0, 0, 200, 255}, {200, 200, 200, 255}, {0, 0, 0, 255});
        if (!sky.valid()) return false;
        for (int y = 0; y < 8; ++y)
        {
            for (int x = 0; x < 8; ++x)
            {
                if (sky.face[2].at(x, y).r >= 100 || sky.face[2].at(x, y).b < 190) return false;
                if (sky.face[3].at(x, y).b >= 100) return false;
                if (sky.face[0].at(x, y).a != 255) return false;
            }
            if (sky.face[0].at(y, 3).r <= 150 || sky.face[0].at(y, 4).r <= 150) return false;
        }

        mxr_test::RecordingDevice device{};
        const auto image = mxr::upload_cubemap(device, sky, "Sky");
        const mxr::RHIImageDesc& d = image->desc();
        if (d.type != mxr::RHIImageType::Cube || d.array_length != 6 || d.width != 8 || d.height != 8) return false;
        if (mxr::rhi_image_byte_size(d) != 8u * 8u * 4u * 6u) return false;
        const auto* fake = static_cast<const mxr_test::FakeImage*>(image.get());
        if (fake->texels.size() != 8u * 8u * 4u * 6u) return false;
        // Faces are packed in +X, -X, +Y, -Y, +Z, -Z order.
        const size_t face_bytes = 8u * 8u * 4u;
        if (fake->texels[2 * face_bytes] != sky.face[2].at(0, 0).r) return false;
        if (fake->texels[3 * face_bytes + 2] != sky.face[3].at(0, 0).b) return false;

        mxr::CubemapData uneven = sky;
        uneven.face[4] = mxr::TextureData(8, 4);
        try
        {
            mxr::upload_cubemap(device, uneven, "Uneven");
            return false;
        }
        catch (const mxr::GpuResourceError&)
        {
        }
        return device.images.size() == 1;
    }
}

int main()
{
    const bool ok_queue = test_event_queue_multi_producer();
    const bool ok_transform = test_transform_math();
    const bool ok_projection = test_reverse_z_projection();
    const bool ok_bounds = test_bounding_box();
    const bool ok_ring = test_ring_buffer();
    const bool ok_state = test_state_machine_one_way();
    const bool ok_config = test_config_env_overrides();
    const bool ok_samples = test_sample_count_selection();
    const bool ok_clock = test_presentation_clock_clamps();
    const bool ok_cubemap = test_gradient_cubemap_upload();

    if (!ok_queue) std::fprintf(stderr, "[mxr-tests] event queue multi-producer failed\n");
    if (!ok_transform) std::fprintf(stderr, "[mxr-tests] transform math failed\n");
    if (!ok_projection) std::fprintf(stderr, "[mxr-tests] reverse-z projection failed\n");
    if (!ok_bounds) std::fprintf(stderr, "[mxr-tests] bounding box failed\n");
    if (!ok_ring) std::fprintf(stderr, "[mxr-tests] ring buffer failed\n");
    if (!ok_state) std::fprintf(stderr, "[mxr-tests] one-way state machine failed\n");
    if (!ok_config) std::fprintf(stderr, "[mxr-tests] config env overrides failed\n");
    if (!ok_samples) std::fprintf(stderr, "[mxr-tests] raster sample count selection failed\n");
    if (!ok_clock) std::fprintf(stderr, "[mxr-tests] presentation clock failed\n");
    if (!ok_cubemap) std::fprintf(stderr, "[mxr-tests] gradient cube map upload failed\n");

    if (!(ok_queue && ok_transform && ok_projection && ok_bounds && ok_ring && ok_state && ok_config && ok_samples && ok_clock &&
          ok_cubemap))
    {
        return 1;
    }
    std::fprintf(stderr, "[mxr-tests] core: all tests passed\n");
    return 0;
}
