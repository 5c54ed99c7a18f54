#include <cmath>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include "mxr/core/config.hpp"
#include "mxr/physics/jolt_adapter.hpp"
#include "mxr/physics/jolt_physics_world.hpp"
#include "mxr/physics/physics_bridge.hpp"
#include "mxr/resources/mesh.hpp"
#include "mxr/scene/entity_graph.hpp"

#include "recording_device.hpp"

namespace
{
    bool approx_eq(float a, float b, float eps = 1e-3f)
    {
        return std::abs(a - b) <= eps;
    }

    mxr::PhysicsConfig zero_gravity()
    {
        mxr::PhysicsConfig cfg{};
        cfg.gravity = glm::vec3(0.0f);
        return cfg;
    }

    mxr::PhysicsBody box_body(mxr::BodyMode mode, const glm::vec3& extents)
    {
        mxr::PhysicsBody body{};
        body.mode = mode;
        body.shape = mxr::BoxShape{extents};
        return body;
    }

    bool test_world_pose_round_trip()
    {
        mxr::JoltPhysicsWorld world(zero_gravity());

        mxr::BodyCreateDesc desc{};
        desc.mode = mxr::BodyMode::Kinematic;
        desc.shape = mxr::BoxGeometry{glm::vec3(0.1f)};
        desc.pose.position = glm::vec3(1.0f, 2.0f, 3.0f);
        auto body = world.create_body(desc);
        if (!body || world.body_count() != 1) return false;

        const auto pose = world.pose(body.value);
        if (!pose || !approx_eq(pose->position.y, 2.0f)) return false;

        const glm::quat turned = glm::angleAxis(0.5f, glm::vec3(0.0f, 1.0f, 0.0f));
        if (!world.set_pose(body.value, mxr::BodyPose{glm::vec3(-1.0f, 0.0f, 0.0f), turned})) return false;
        const auto moved = world.pose(body.value);
        if (!moved || !approx_eq(moved->position.x, -1.0f)) return false;
        if (!approx_eq(std::abs(glm::dot(moved->rotation, turned)), 1.0f)) return false;

        world.destroy_body(body.value);
        return world.body_count() == 0 && !world.pose(body.value).has_value() &&
               !world.set_pose(body.value, mxr::BodyPose{});
    }

    bool test_ray_cast_hits_static_box()
    {
        mxr::JoltPhysicsWorld world(zero_gravity());

        mxr::BodyCreateDesc desc{};
        desc.shape = mxr::BoxGeometry{glm::vec3(0.5f)};
        desc.pose.position = glm::vec3(0.0f, 0.0f, -2.0f);
        auto body = world.create_body(desc);
        if (!body) return false;

        const auto hits = world.cast_ray(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, -5.0f));
        if (hits.size() != 1) return false;
        if (hits[0].body != body.value) return false;
        if (!approx_eq(hits[0].distance, 1.5f) || !approx_eq(hits[0].position.z, -1.5f)) return false;

        // Segment stops short of the box.
        if (!world.cast_ray(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, -1.0f)).empty()) return false;
        return world.cast_ray(glm::vec3(0.0f), glm::vec3(0.0f)).empty();
    }

    bool test_ray_cast_hits_static_plane()
    {
        mxr::JoltPhysicsWorld world(zero_gravity());

        mxr::TriangleMeshGeometry quad{};
        quad.points = {{-0.6f, 0.0f, -0.4f}, {-0.6f, 0.0f, 0.4f}, {0.6f, 0.0f, 0.4f}, {0.6f, 0.0f, -0.4f}};
        quad.indices = {0, 1, 2, 0, 2, 3};

        mxr::BodyCreateDesc desc{};
        desc.shape = quad;
        desc.pose.position = glm::vec3(0.0f, 0.75f, -0.8f);
        auto body = world.create_body(desc);
        if (!body) return false;

        const glm::vec3 head(0.0f, 1.35f, 0.0f);
        const glm::vec3 dir = glm::normalize(glm::vec3(0.0f, 0.75f, -0.8f) - head);
        const auto hits = world.cast_ray(head, head + dir * 3.0f);
        if (hits.size() != 1 || hits[0].body != body.value) return false;
        if (glm::length(hits[0].position - glm::vec3(0.0f, 0.75f, -0.8f)) > 1e-3f) return false;

        mxr::TriangleMeshGeometry ragged = quad;
        ragged.indices.pop_back();
        desc.shape = ragged;
        return !world.create_body(desc) && world.body_count() == 1;
    }

    bool test_degenerate_hull_rejected()
    {
        mxr::JoltPhysicsWorld world(zero_gravity());

        mxr::BodyCreateDesc desc{};
        desc.mode = mxr::BodyMode::Dynamic;
        desc.shape = mxr::ConvexHullGeometry{{{0.0f, 0.0f, 0.0f}, {0.1f, 0.0f, 0.0f}, {0.2f, 0.0f, 0.0f}, {0.3f, 0.0f, 0.0f}}};
        auto collinear = world.create_body(desc);
        if (collinear || collinear.error.empty()) return false;

        desc.shape = mxr::ConvexHullGeometry{{
            {-0.1f, -0.1f, -0.1f}, {0.1f, -0.1f, -0.1f}, {0.1f, 0.1f, -0.1f}, {-0.1f, 0.1f, -0.1f},
            {-0.1f, -0.1f, 0.1f}, {0.1f, -0.1f, 0.1f}, {0.1f, 0.1f, 0.1f}, {-0.1f, 0.1f, 0.1f},
        }};
        auto cube = world.create_body(desc);
        return cube && world.body_count() == 1;
    }

    bool test_collision_filter_groups()
    {
        mxr::JoltPhysicsWorld world{};

        mxr::BodyCreateDesc floor{};
        floor.shape = mxr::BoxGeometry{glm::vec3(2.0f, 0.5f, 0.5f)};
        floor.filter.group = mxr::CollisionGroupSceneUnderstanding;
        auto floor_body = world.create_body(floor);
        if (!floor_body) return false;

        mxr::BodyCreateDesc ball{};
        ball.mode = mxr::BodyMode::Dynamic;
        ball.shape = mxr::SphereGeometry{0.05f};
        ball.pose.position = glm::vec3(1.0f, 0.7f, 0.0f);
        auto resting = world.create_body(ball);
        ball.pose.position = glm::vec3(-1.0f, 0.7f, 0.0f);
        ball.filter.mask = mxr::CollisionGroupDefault;
        auto ghost = world.create_body(ball);
        if (!resting || !ghost) return false;

        // Ray masks select by group.
        const glm::vec3 above(0.0f, 2.0f, 0.0f);
        const glm::vec3 below(0.0f, -2.0f, 0.0f);
        const auto scene_hits = world.cast_ray(above, below, mxr::CollisionGroupSceneUnderstanding);
        if (scene_hits.size() != 1 || scene_hits[0].body != floor_body.value) return false;
        if (!world.cast_ray(above, below, mxr::CollisionGroupDefault).empty()) return false;

        for (int i = 0; i < 60; ++i) world.step(1.0f / 60.0f);

        // The masked ball ignores the floor group and keeps falling.
        const auto rest_pose = world.pose(resting.value);
        const auto ghost_pose = world.pose(ghost.value);
        if (!rest_pose || !ghost_pose) return false;
        return rest_pose->position.y > 0.4f && ghost_pose->position.y < 0.0f;
    }

    bool test_dynamic_body_falls_under_gravity()
    {
        mxr::JoltPhysicsWorld world{};

        mxr::BodyCreateDesc desc{};
        desc.mode = mxr::BodyMode::Dynamic;
        desc.shape = mxr::SphereGeometry{0.05f};
        desc.pose.position = glm::vec3(0.0f, 1.0f, 0.0f);
        auto body = world.create_body(desc);
        if (!body) return false;

        for (int i = 0; i < 10; ++i) world.step(1.0f / 60.0f);
        const auto pose = world.pose(body.value);
        if (!pose || !(pose->position.y < 0.95f)) return false;

        world.step(0.0f);
        const auto unchanged = world.pose(body.value);
        return unchanged && approx_eq(unchanged->position.y, pose->position.y, 1e-6f);
    }

    bool test_shape_geometry_requires_host_data()
    {
        mxr_test::RecordingDevice device{};
        const auto box_mesh = mxr::Mesh::generate_box(device, glm::vec3(0.2f));

        mxr::PhysicsBody box = box_body(mxr::BodyMode::Dynamic, glm::vec3(0.2f, 0.4f, 0.6f));
        auto box_geo = mxr::shape_geometry_for(box);
        const auto* half = box_geo ? std::get_if<mxr::BoxGeometry>(&box_geo.value) : nullptr;
        if (!half || !approx_eq(half->half_extents.z, 0.3f)) return false;

        mxr::PhysicsBody hull{};
        hull.shape = mxr::ConvexHullShape{box_mesh};
        auto hull_geo = mxr::shape_geometry_for(hull);
        if (!hull_geo || std::get<mxr::ConvexHullGeometry>(hull_geo.value).points.size() != box_mesh->vertex_count()) return false;

        mxr::PhysicsBody concave{};
        concave.shape = mxr::ConcaveMeshShape{box_mesh};
        auto concave_geo = mxr::shape_geometry_for(concave);
        if (!concave_geo || std::get<mxr::TriangleMeshGeometry>(concave_geo.value).indices.size() % 3 != 0) return false;

        // Skinning targets live in GPU-only memory and cannot feed the solver.
        mxr::PhysicsBody gpu_only{};
        gpu_only.shape = mxr::ConvexHullShape{box_mesh->copy_for_skinning(device)};
        if (mxr::shape_geometry_for(gpu_only)) return false;

        mxr::PhysicsBody missing{};
        missing.shape = mxr::ConcaveMeshShape{};
        return !mxr::shape_geometry_for(missing);
    }

    bool test_bridge_registration_rules()
    {
        mxr_test::RecordingDevice device{};
        mxr::JoltPhysicsWorld world(zero_gravity());
        mxr::EntityGraph g{};

        auto bridge = std::make_unique<mxr::PhysicsBridge>(world);

        const mxr::EntityId block = g.create("Block 0");
        g.node(block).physics_body = box_body(mxr::BodyMode::Dynamic, glm::vec3(0.15f, 0.03f, 0.05f));
        const mxr::EntityId plain = g.create("Plain");
        const mxr::EntityId broken = g.create("Broken");
        mxr::PhysicsBody broken_body{};
        broken_body.shape = mxr::ConvexHullShape{mxr::Mesh::generate_box(device, glm::vec3(0.1f))->copy_for_skinning(device)};
        g.node(broken).physics_body = broken_body;

        if (!bridge->add_entity(g, block)) return false;
        if (bridge->add_entity(g, block)) return false;
        if (bridge->add_entity(g, plain)) return false;
        if (bridge->add_entity(g, broken) || bridge->is_registered(broken)) return false;
        if (bridge->registered_count() != 1 || world.body_count() != 1) return false;
        if (!bridge->body_for(block).has_value() || bridge->body_for(plain).has_value()) return false;

        bridge->remove_entity(block);
        bridge->remove_entity(block);
        if (bridge->is_registered(block) || world.body_count() != 0) return false;

        // Bodies still registered when the bridge goes away are released.
        if (!bridge->add_entity(g, block)) return false;
        bridge.reset();
        return world.body_count() == 0;
    }

    bool test_bridge_dynamic_round_trip_keeps_pose_and_scale()
    {
        mxr::JoltPhysicsWorld world(zero_gravity());
        mxr::PhysicsBridge bridge(world);
        mxr::EntityGraph g{};

        const glm::quat identity(1.0f, 0.0f, 0.0f, 0.0f);
        const mxr::EntityId loose = g.create("Loose Block", mxr::Transform(glm::vec3(-3.0f, 1.0f, 0.0f), identity));
        const mxr::EntityId anchor = g.create("Scaled Anchor", mxr::Transform(glm::vec3(3.0f, 1.0f, 0.0f), identity, glm::vec3(2.0f)));
        const mxr::EntityId child = g.create("Child Block", mxr::Transform(glm::vec3(0.0f, 0.5f, 0.0f), identity));

        mxr::PhysicsBody body = box_body(mxr::BodyMode::Dynamic, glm::vec3(0.15f, 0.03f, 0.05f));
        body.affected_by_gravity = false;
        g.node(loose).physics_body = body;
        g.node(child).physics_body = body;
        if (!g.add_child(g.root(), loose) || !g.add_child(g.root(), anchor) || !g.add_child(anchor, child)) return false;
        if (!bridge.add_entity(g, loose) || !bridge.add_entity(g, child)) return false;

        const glm::vec3 loose_start = g.world_transform(loose).position;
        const glm::vec3 child_start = g.world_transform(child).position;
        const std::vector<mxr::EntityId> entities = g.flattened(g.root());
        for (int i = 0; i < 8; ++i) bridge.update(g, entities, 1.0 / 60.0);

        // No forces: the solver hands back the pose it was given.
        if (glm::length(g.world_transform(loose).position - loose_start) > 1e-3f) return false;
        if (glm::length(g.world_transform(child).position - child_start) > 1e-3f) return false;

        // Local scale survives repeated write-back under a scaled parent.
        const mxr::Transform& local = g.node(child).model_transform;
        if (!approx_eq(local.scale.x, 1.0f) || !approx_eq(local.scale.y, 1.0f) || !approx_eq(local.scale.z, 1.0f)) return false;
        if (!approx_eq(g.world_transform(child).scale.x, 2.0f)) return false;
        return approx_eq(g.node(loose).model_transform.scale.y, 1.0f);
    }

    bool test_bridge_syncs_poses()
    {
        mxr::JoltPhysicsWorld world{};
        mxr::PhysicsBridge bridge(world);
        mxr::EntityGraph g{};

        const mxr::EntityId anchor = g.create("Tower Anchor", mxr::Transform(glm::vec3(0.0f, 1.0f, 0.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f)));
        const mxr::EntityId block = g.create("Block 0");
        g.node(block).physics_body = box_body(mxr::BodyMode::Dynamic, glm::vec3(0.15f, 0.03f, 0.05f));
        const mxr::EntityId wall = g.create("Wall", mxr::Transform(glm::vec3(0.0f, 0.0f, -2.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f)));
        g.node(wall).physics_body = box_body(mxr::BodyMode::Static, glm::vec3(1.0f));
        if (!g.add_child(g.root(), anchor) || !g.add_child(anchor, block) || !g.add_child(g.root(), wall)) return false;
        if (!bridge.add_entity(g, block) || !bridge.add_entity(g, wall)) return false;

        const std::vector<mxr::EntityId> entities = g.flattened(g.root());
        for (int i = 0; i < 10; ++i) bridge.update(g, entities, 1.0 / 60.0);

        // Solver-owned pose is written back in world space under the anchor.
        const mxr::Transform fallen = g.world_transform(block);
        if (!(fallen.position.y < 0.95f)) return false;
        if (!(g.node(block).model_transform.position.y < -0.05f)) return false;

        // Moving a static entity moves its solver body on the next update.
        g.node(wall).model_transform.position = glm::vec3(5.0f, 0.0f, -2.0f);
        bridge.update(g, entities, 1.0 / 60.0);
        const auto hits = bridge.hit_test_with_segment(glm::vec3(5.0f, 0.0f, 0.0f), glm::vec3(5.0f, 0.0f, -5.0f));
        if (hits.size() != 1 || !(hits[0].entity == wall)) return false;
        if (!approx_eq(hits[0].world_position.z, -1.5f)) return false;

        return bridge.hit_test_with_segment(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, -5.0f)).empty();
    }
}

int main()
{
    mxr::jolt::PhysicsRuntime runtime{};

    const bool ok_pose = test_world_pose_round_trip();
    const bool ok_ray = test_ray_cast_hits_static_box();
    const bool ok_plane = test_ray_cast_hits_static_plane();
    const bool ok_hull = test_degenerate_hull_rejected();
    const bool ok_filter = test_collision_filter_groups();
    const bool ok_gravity = test_dynamic_body_falls_under_gravity();
    const bool ok_geometry = test_shape_geometry_requires_host_data();
    const bool ok_register = test_bridge_registration_rules();
    const bool ok_round_trip = test_bridge_dynamic_round_trip_keeps_pose_and_scale();
    const bool ok_sync = test_bridge_syncs_poses();

    if (!ok_pose) std::fprintf(stderr, "[mxr-tests] body pose round trip failed\n");
    if (!ok_ray) std::fprintf(stderr, "[mxr-tests] ray cast against static box failed\n");
    if (!ok_plane) std::fprintf(stderr, "[mxr-tests] ray cast against static plane failed\n");
    if (!ok_hull) std::fprintf(stderr, "[mxr-tests] degenerate hull rejection failed\n");
    if (!ok_filter) std::fprintf(stderr, "[mxr-tests] collision filter groups failed\n");
    if (!ok_gravity) std::fprintf(stderr, "[mxr-tests] dynamic body under gravity failed\n");
    if (!ok_geometry) std::fprintf(stderr, "[mxr-tests] shape geometry extraction failed\n");
    if (!ok_register) std::fprintf(stderr, "[mxr-tests] bridge registration rules failed\n");
    if (!ok_round_trip) std::fprintf(stderr, "[mxr-tests] bridge dynamic round trip failed\n");
    if (!ok_sync) std::fprintf(stderr, "[mxr-tests] bridge pose sync failed\n");

    if (!(ok_pose && ok_ray && ok_plane && ok_hull && ok_filter && ok_gravity && ok_geometry && ok_register && ok_round_trip && ok_sync)) return 1;
    std::fprintf(stderr, "[mxr-tests] physics: all tests passed\n");
    return 0;
}
