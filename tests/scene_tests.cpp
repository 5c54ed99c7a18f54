#include <cmath>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include <glm/gtc/constants.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>

#include "mxr/core/config.hpp"
#include "mxr/core/context.hpp"
#include "mxr/physics/jolt_adapter.hpp"
#include "mxr/physics/jolt_physics_world.hpp"
#include "mxr/resources/mesh.hpp"
#include "mxr/scene/spatial_scene.hpp"
#include "mxr/scene/spatial_session.hpp"

#include "recording_device.hpp"

namespace
{
    constexpr double kTick = 1.0 / 60.0;

    bool approx_vec(const glm::vec3& a, const glm::vec3& b, float eps = 1e-3f)
    {
        return std::abs(a.x - b.x) <= eps && std::abs(a.y - b.y) <= eps && std::abs(a.z - b.z) <= eps;
    }

    bool same_rotation(const glm::quat& a, const glm::quat& b, float eps = 1e-3f)
    {
        return std::abs(std::abs(glm::dot(a, b)) - 1.0f) <= eps;
    }

    class FakeSession final : public mxr::ISpatialSession
    {
    public:
        mxr::Result<bool> start(mxr::ISpatialEventSink&) override { return mxr::Result<bool>::success(true); }
        void stop() override {}

        mxr::Result<mxr::AnchorId> add_world_anchor(const glm::mat4& origin_from_anchor) override
        {
            if (refuse_anchors) return mxr::Result<mxr::AnchorId>::failure("world tracking unavailable");
            last_anchor_pose = origin_from_anchor;
            return mxr::Result<mxr::AnchorId>::success(next_anchor++);
        }

        void remove_all_world_anchors() override { ++remove_all_calls; }
        std::vector<mxr::HandAnchor> hand_anchors(double) override { return {}; }

        bool refuse_anchors = false;
        mxr::AnchorId next_anchor = 500;
        int remove_all_calls = 0;
        glm::mat4 last_anchor_pose{1.0f};
    };

    // 1.2 m x 0.8 m quad in anchor space, facing +Y.
    std::shared_ptr<mxr::Mesh> make_table_mesh(mxr::IGpuDevice& device)
    {
        const std::vector<glm::vec3> positions{
            {-0.6f, 0.0f, -0.4f},
            {-0.6f, 0.0f, 0.4f},
            {0.6f, 0.0f, 0.4f},
            {0.6f, 0.0f, -0.4f},
        };
        const std::vector<uint32_t> indices{0, 1, 2, 0, 2, 3};
        return mxr::Mesh::from_indexed_triangles(device, positions, indices, "Table Plane");
    }

    mxr::SpatialEvent table_plane(mxr::IGpuDevice& device, mxr::AnchorId id, const glm::vec3& center)
    {
        mxr::PlaneAnchorEvent e{};
        e.anchor.id = id;
        e.anchor.origin_from_anchor = glm::translate(glm::mat4(1.0f), center);
        e.anchor.alignment = mxr::PlaneAlignment::Horizontal;
        e.anchor.classification = mxr::PlaneClassification::Table;
        e.anchor.mesh = make_table_mesh(device);
        return e;
    }

    mxr::SpatialEvent pinch_toward(const glm::vec3& from, const glm::vec3& at, mxr::InputPhase phase = mxr::InputPhase::Ended)
    {
        mxr::SpatialInputEvent e{};
        e.kind = mxr::InputKind::IndirectPinch;
        e.phase = phase;
        e.selection_ray = mxr::Ray{from, at - from};
        e.chirality = mxr::Handedness::Right;
        return e;
    }

    struct SceneFixture
    {
        explicit SceneFixture(mxr::EngineConfig cfg = {})
            : ctx(device, cfg)
            , world(cfg.physics)
            , scene(ctx, world, session)
        {}

        mxr_test::RecordingDevice device{};
        mxr::Context ctx;
        mxr::JoltPhysicsWorld world;
        FakeSession session{};
        mxr::SpatialScene scene;
    };

    bool test_initial_scene_contents()
    {
        SceneFixture f{};
        const mxr::EntityGraph& g = f.scene.graph();

        if (f.scene.phase() != mxr::ScenePhase::SelectingPlacement) return false;
        if (f.scene.lights().size() != 1 || f.scene.environment_light().has_value()) return false;
        if (f.scene.block_prototypes().size() != 3) return false;

        mxr::HandRig* left = f.scene.hand(mxr::Handedness::Left);
        mxr::HandRig* right = f.scene.hand(mxr::Handedness::Right);
        if (!left || !right || f.scene.hand(mxr::Handedness::None)) return false;
        if (g.is_visible(left->node()) || g.is_visible(right->node())) return false;

        const auto ground = g.find_child_by_name(g.root(), "Ground Plane", false);
        if (!ground || !f.scene.physics().is_registered(*ground)) return false;

        // Prototypes are detached, so they are neither drawn nor simulated.
        for (mxr::EntityId proto : f.scene.block_prototypes())
        {
            if (g.is_attached(proto) || f.scene.physics().is_registered(proto)) return false;
        }
        for (mxr::EntityId e : f.scene.entities())
        {
            if (e == g.root()) return false;
        }
        return f.scene.tower_blocks().empty() && !f.scene.anchored_content_root().has_value();
    }

    bool test_placement_builds_tower()
    {
        SceneFixture f{};
        const glm::vec3 table_center(0.0f, 0.75f, -0.8f);
        const glm::vec3 head(0.0f, 1.35f, 0.0f);

        f.scene.enqueue_event(table_plane(f.device, 7, table_center));
        f.scene.update(kTick);

        const auto plane = f.scene.plane_entity(7);
        if (!plane || !f.scene.is_candidate_surface(*plane)) return false;
        const mxr::EntityGraph& g = f.scene.graph();
        if (g.node(*plane).name != "Plane 7") return false;
        if (!f.scene.physics().is_registered(*plane)) return false;
        const mxr::Material* plane_material = g.node(*plane).mesh->material_for(g.node(*plane).mesh->submeshes().front());
        if (!plane_material || mxr::material_category(*plane_material) != mxr::MaterialCategory::Occlusion) return false;
        if (!g.find_child_by_name(*plane, "Reticle Pivot", false).has_value()) return false;

        // Presses that have not ended, or carry no ray, select nothing.
        f.scene.enqueue_event(pinch_toward(head, table_center, mxr::InputPhase::Active));
        mxr::SpatialInputEvent no_ray{};
        no_ray.phase = mxr::InputPhase::Ended;
        f.scene.enqueue_event(no_ray);
        f.scene.update(kTick);
        if (f.scene.phase() != mxr::ScenePhase::SelectingPlacement) return false;

        f.scene.enqueue_event(pinch_toward(head, table_center));
        f.scene.update(kTick);

        if (f.scene.phase() != mxr::ScenePhase::Playing) return false;
        if (f.scene.selected_surface() != plane) return false;
        if (g.find_child_by_name(*plane, "Reticle Pivot", false).has_value()) return false;
        if (f.session.remove_all_calls != 1) return false;

        const auto root = f.scene.anchored_content_root();
        if (!root || g.node(*root).name != "Tower Anchor") return false;
        if (f.scene.world_anchor_entity(500) != root) return false;
        if (!approx_vec(g.world_transform(*root).position, table_center)) return false;

        const auto blocks = f.scene.tower_blocks();
        if (blocks.size() != 21) return false;
        for (mxr::EntityId b : blocks)
        {
            const auto& body = g.node(b).physics_body;
            if (!body || body->mode != mxr::BodyMode::Dynamic) return false;
            if (!f.scene.physics().is_registered(b)) return false;
            if (!g.node(b).mesh) return false;
        }
        // Seven layers stacked bottom-up from the anchor.
        const float lowest = g.node(blocks.front()).model_transform.position.y;
        const float highest = g.node(blocks.back()).model_transform.position.y;
        if (!(lowest > 0.0f && highest > lowest + 5.0f * 0.03f)) return false;

        // Layers alternate: even layers run along X, odd layers are turned a quarter about +Y.
        const glm::quat identity(1.0f, 0.0f, 0.0f, 0.0f);
        const glm::quat quarter = glm::angleAxis(glm::half_pi<float>(), glm::vec3(0.0f, 1.0f, 0.0f));
        for (size_t i = 0; i < blocks.size(); ++i)
        {
            const bool odd_layer = ((i / 3) % 2) == 1;
            const glm::quat& r = g.node(blocks[i]).model_transform.rotation;
            if (!same_rotation(r, odd_layer ? quarter : identity)) return false;
        }

        // The quarter turn swings the side blocks of layer 1 from the Z axis onto the X axis.
        const auto side = g.find_child_by_name(*root, "Block 4", false);
        if (!side) return false;
        const mxr::SceneConfig& cfg = f.ctx.config.scene;
        const glm::vec3 p = g.node(*side).model_transform.position;
        return std::abs(p.x + (cfg.block_extents.z + cfg.lateral_margin)) < 2e-3f && std::abs(p.z) < 2e-3f;
    }

    bool test_placement_is_one_way()
    {
        SceneFixture f{};
        const glm::vec3 table_center(0.0f, 0.75f, -0.8f);
        f.scene.enqueue_event(table_plane(f.device, 1, table_center));
        f.scene.enqueue_event(pinch_toward(glm::vec3(0.0f, 1.35f, 0.0f), table_center));
        f.scene.update(kTick);
        if (f.scene.phase() != mxr::ScenePhase::Playing) return false;

        const auto first_root = f.scene.anchored_content_root();

        f.scene.enqueue_event(table_plane(f.device, 2, glm::vec3(1.0f, 0.75f, -0.8f)));
        f.scene.enqueue_event(pinch_toward(glm::vec3(1.0f, 1.35f, 0.0f), glm::vec3(1.0f, 0.75f, -0.8f)));
        f.scene.update(kTick);

        const auto second = f.scene.plane_entity(2);
        if (!second || f.scene.is_candidate_surface(*second)) return false;
        if (f.scene.phase() != mxr::ScenePhase::Playing) return false;
        return f.scene.anchored_content_root() == first_root && f.scene.tower_blocks().size() == 21 &&
               f.session.remove_all_calls == 1;
    }

    bool test_non_table_planes_are_not_candidates()
    {
        SceneFixture f{};
        mxr::PlaneAnchorEvent wall{};
        wall.anchor.id = 3;
        wall.anchor.alignment = mxr::PlaneAlignment::Vertical;
        wall.anchor.classification = mxr::PlaneClassification::Wall;
        wall.anchor.mesh = make_table_mesh(f.device);
        mxr::PlaneAnchorEvent floor{};
        floor.anchor.id = 4;
        floor.anchor.classification = mxr::PlaneClassification::Floor;
        floor.anchor.mesh = make_table_mesh(f.device);
        f.scene.enqueue_events({wall, floor});
        f.scene.update(kTick);

        if (f.scene.candidate_surface_count() != 0) return false;
        if (!f.scene.plane_entity(3) || !f.scene.plane_entity(4)) return false;

        mxr::PlaneAnchorEvent removed{};
        removed.anchor.id = 3;
        removed.event = mxr::AnchorEvent::Removed;
        f.scene.enqueue_event(removed);
        f.scene.update(kTick);
        return !f.scene.plane_entity(3).has_value() && f.scene.plane_entity(4).has_value();
    }

    bool test_mesh_anchor_lifecycle()
    {
        SceneFixture f{};
        const std::vector<glm::vec3> positions{{0.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {0.0f, 0.0f, -1.0f}};
        const std::vector<uint32_t> indices{0, 1, 2};

        mxr::MeshAnchorEvent added{};
        added.anchor.id = 42;
        added.anchor.mesh = mxr::Mesh::from_indexed_triangles(f.device, positions, indices, "Room Chunk");
        f.scene.enqueue_event(added);
        f.scene.update(kTick);

        const auto node = f.scene.mesh_entity(42);
        const mxr::EntityGraph& g = f.scene.graph();
        if (!node || g.node(*node).name != "World Mesh 42") return false;
        if (!f.scene.physics().is_registered(*node)) return false;
        const size_t registered = f.scene.physics().registered_count();

        mxr::MeshAnchorEvent updated = added;
        updated.event = mxr::AnchorEvent::Updated;
        updated.anchor.origin_from_anchor = glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 0.5f, 0.0f));
        updated.anchor.mesh = mxr::Mesh::from_indexed_triangles(f.device, positions, indices, "Room Chunk v2");
        f.scene.enqueue_event(updated);
        f.scene.update(kTick);

        if (f.scene.mesh_entity(42) != node) return false;
        if (!approx_vec(g.world_transform(*node).position, glm::vec3(0.0f, 0.5f, 0.0f))) return false;
        if (g.node(*node).mesh != updated.anchor.mesh) return false;
        if (!f.scene.physics().is_registered(*node) || f.scene.physics().registered_count() != registered) return false;

        mxr::MeshAnchorEvent removed{};
        removed.anchor.id = 42;
        removed.event = mxr::AnchorEvent::Removed;
        f.scene.enqueue_event(removed);
        f.scene.update(kTick);
        return !f.scene.mesh_entity(42).has_value() && !g.alive(*node) &&
               f.scene.physics().registered_count() == registered - 1;
    }

    bool test_mesh_anchor_added_and_removed_in_one_drain()
    {
        SceneFixture f{};
        const mxr::EntityGraph& g = f.scene.graph();
        const size_t nodes_before = g.size();
        const size_t registered_before = f.scene.physics().registered_count();

        mxr::MeshAnchorEvent added{};
        added.anchor.id = 77;
        added.anchor.mesh = mxr::Mesh::from_indexed_triangles(
            f.device,
            {{0.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {0.0f, 0.0f, -1.0f}},
            {0, 1, 2},
            "Short Lived Chunk");
        mxr::MeshAnchorEvent removed{};
        removed.anchor.id = 77;
        removed.event = mxr::AnchorEvent::Removed;
        f.scene.enqueue_events({added, removed});
        f.scene.update(kTick);

        if (f.scene.mesh_entity(77).has_value()) return false;
        if (g.find_child_by_name(g.root(), "World Mesh 77").has_value()) return false;
        return g.size() == nodes_before && f.scene.physics().registered_count() == registered_before;
    }

    bool test_world_anchor_lifecycle()
    {
        SceneFixture f{};
        mxr::WorldAnchorEvent added{};
        added.anchor.id = 9;
        added.anchor.origin_from_anchor = glm::translate(glm::mat4(1.0f), glm::vec3(1.0f, 0.0f, 0.0f));
        f.scene.enqueue_event(added);
        f.scene.update(kTick);

        const auto node = f.scene.world_anchor_entity(9);
        if (!node || f.scene.graph().node(*node).name != "Anchor 9") return false;

        mxr::WorldAnchorEvent moved = added;
        moved.event = mxr::AnchorEvent::Updated;
        moved.anchor.origin_from_anchor = glm::translate(glm::mat4(1.0f), glm::vec3(2.0f, 0.0f, 0.0f));
        f.scene.enqueue_event(moved);
        f.scene.update(kTick);
        if (!approx_vec(f.scene.graph().world_transform(*node).position, glm::vec3(2.0f, 0.0f, 0.0f))) return false;

        mxr::WorldAnchorEvent removed{};
        removed.anchor.id = 9;
        removed.event = mxr::AnchorEvent::Removed;
        f.scene.enqueue_event(removed);
        f.scene.update(kTick);
        return !f.scene.world_anchor_entity(9).has_value() && !f.scene.graph().alive(*node);
    }

    bool test_hand_visibility_follows_tracking()
    {
        SceneFixture f{};
        const mxr::HandRig* left = f.scene.hand(mxr::Handedness::Left);

        mxr::HandAnchorEvent seen{};
        seen.anchor.handedness = mxr::Handedness::Left;
        seen.anchor.tracked = true;
        seen.anchor.origin_from_anchor = glm::translate(glm::mat4(1.0f), glm::vec3(-0.2f, 1.0f, -0.3f));
        f.scene.enqueue_event(seen);
        f.scene.update(kTick);

        const mxr::EntityGraph& g = f.scene.graph();
        if (!g.is_visible(left->node())) return false;
        if (!approx_vec(g.world_transform(left->node()).position, glm::vec3(-0.2f, 1.0f, -0.3f))) return false;
        if (g.is_visible(f.scene.hand(mxr::Handedness::Right)->node())) return false;

        mxr::HandAnchorEvent lost = seen;
        lost.event = mxr::AnchorEvent::Updated;
        lost.anchor.tracked = false;
        f.scene.enqueue_event(lost);
        f.scene.update(kTick);
        if (g.is_visible(left->node())) return false;

        f.scene.enqueue_event(seen);
        f.scene.update(kTick);
        if (!g.is_visible(left->node())) return false;

        mxr::HandAnchorEvent removed = seen;
        removed.event = mxr::AnchorEvent::Removed;
        f.scene.enqueue_event(removed);
        f.scene.update(kTick);
        return !g.is_visible(left->node());
    }

    bool test_environment_light_updates()
    {
        SceneFixture f{};

        mxr::EnvironmentLightEvent probe{};
        probe.anchor.light.scale_factor = 0.35f;
        f.scene.enqueue_event(probe);
        f.scene.update(kTick);
        if (f.scene.environment_light().has_value()) return false;

        probe.anchor.light.texture = mxr_test::make_target(16, 16, mxr::RHIFormat::RGBA16F, 6);
        f.scene.enqueue_event(probe);
        f.scene.update(kTick);
        const auto& light = f.scene.environment_light();
        if (!light || light->texture != probe.anchor.light.texture || light->scale_factor != 0.35f) return false;

        mxr::EnvironmentLightEvent removed{};
        removed.event = mxr::AnchorEvent::Removed;
        f.scene.enqueue_event(removed);
        f.scene.update(kTick);
        return f.scene.environment_light().has_value() && f.scene.environment_light()->texture == probe.anchor.light.texture;
    }

    bool test_anchor_failure_uses_fallback_placement()
    {
        mxr::EngineConfig cfg{};
        cfg.scene.tower_layers = 2;
        SceneFixture f(cfg);
        f.session.refuse_anchors = true;

        const glm::vec3 table_center(0.0f, 0.75f, -0.8f);
        f.scene.enqueue_event(table_plane(f.device, 1, table_center));
        f.scene.update(kTick);
        f.scene.enqueue_event(pinch_toward(glm::vec3(0.0f, 1.35f, 0.0f), table_center));
        f.scene.update(kTick);

        if (f.scene.phase() != mxr::ScenePhase::Playing) return false;
        const auto root = f.scene.anchored_content_root();
        if (!root) return false;
        if (!approx_vec(f.scene.graph().world_transform(*root).position, cfg.scene.fallback_anchor_position)) return false;
        return f.scene.tower_blocks().size() == 6 && f.session.remove_all_calls == 1;
    }
}

int main()
{
    mxr::jolt::PhysicsRuntime runtime{};

    const bool ok_initial = test_initial_scene_contents();
    const bool ok_tower = test_placement_builds_tower();
    const bool ok_one_way = test_placement_is_one_way();
    const bool ok_planes = test_non_table_planes_are_not_candidates();
    const bool ok_mesh = test_mesh_anchor_lifecycle();
    const bool ok_mesh_drain = test_mesh_anchor_added_and_removed_in_one_drain();
    const bool ok_world = test_world_anchor_lifecycle();
    const bool ok_hands = test_hand_visibility_follows_tracking();
    const bool ok_light = test_environment_light_updates();
    const bool ok_fallback = test_anchor_failure_uses_fallback_placement();

    if (!ok_initial) std::fprintf(stderr, "[mxr-tests] initial scene contents failed\n");
    if (!ok_tower) std::fprintf(stderr, "[mxr-tests] placement builds tower failed\n");
    if (!ok_one_way) std::fprintf(stderr, "[mxr-tests] one-way placement failed\n");
    if (!ok_planes) std::fprintf(stderr, "[mxr-tests] non-table plane handling failed\n");
    if (!ok_mesh) std::fprintf(stderr, "[mxr-tests] mesh anchor lifecycle failed\n");
    if (!ok_mesh_drain) std::fprintf(stderr, "[mxr-tests] mesh anchor added and removed in one drain failed\n");
    if (!ok_world) std::fprintf(stderr, "[mxr-tests] world anchor lifecycle failed\n");
    if (!ok_hands) std::fprintf(stderr, "[mxr-tests] hand visibility failed\n");
    if (!ok_light) std::fprintf(stderr, "[mxr-tests] environment light updates failed\n");
    if (!ok_fallback) std::fprintf(stderr, "[mxr-tests] fallback placement failed\n");

    if (!(ok_initial && ok_tower && ok_one_way && ok_planes && ok_mesh && ok_mesh_drain && ok_world && ok_hands && ok_light && ok_fallback)) return 1;
    std::fprintf(stderr, "[mxr-tests] scene: all tests passed\n");
    return 0;
}
