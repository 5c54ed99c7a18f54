#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

#include <glm/gtc/quaternion.hpp>

#include "mxr/resources/mesh.hpp"
#include "mxr/scene/entity_graph.hpp"

#include "recording_device.hpp"

namespace
{
    bool approx_vec(const glm::vec3& a, const glm::vec3& b, float eps = 1e-4f)
    {
        return std::abs(a.x - b.x) <= eps && std::abs(a.y - b.y) <= eps && std::abs(a.z - b.z) <= eps;
    }

    struct CountingObserver final : mxr::IGraphObserver
    {
        int attached = 0;
        int detached = 0;
        void did_attach(mxr::EntityGraph&, mxr::EntityId) override { ++attached; }
        void did_detach(mxr::EntityGraph&, mxr::EntityId) override { ++detached; }
    };

    bool test_world_transform_folds_parent_chain()
    {
        mxr::EntityGraph g{};
        const glm::quat quarter = glm::angleAxis(glm::radians(90.0f), glm::vec3(0.0f, 1.0f, 0.0f));
        const mxr::EntityId a = g.create("A", mxr::Transform(glm::vec3(1.0f, 0.0f, 0.0f), quarter, glm::vec3(2.0f)));
        const mxr::EntityId b = g.create("B", mxr::Transform(glm::vec3(0.0f, 0.0f, -1.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f)));
        if (!g.add_child(g.root(), a) || !g.add_child(a, b)) return false;

        // Parent scale 2 and a quarter turn about +Y map local -Z onto world -X.
        const mxr::Transform world = g.world_transform(b);
        if (!approx_vec(world.position, glm::vec3(-1.0f, 0.0f, 0.0f))) return false;
        if (!approx_vec(world.scale, glm::vec3(2.0f))) return false;

        const mxr::Transform target(glm::vec3(3.0f, 1.0f, 2.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f), glm::vec3(2.0f));
        g.set_world_transform(b, target);
        if (!mxr::transforms_near(g.world_transform(b), target)) return false;
        return approx_vec(g.node(b).model_transform.scale, glm::vec3(1.0f));
    }

    bool test_reparenting_and_cycle_rejection()
    {
        mxr::EntityGraph g{};
        CountingObserver observer{};
        g.set_observer(&observer);

        const mxr::EntityId a = g.create("A");
        const mxr::EntityId b = g.create("B");
        const mxr::EntityId c = g.create("C");
        if (!g.add_child(a, b) || !g.add_child(b, c)) return false;
        // A is detached, so nothing was announced yet.
        if (observer.attached != 0) return false;

        if (g.add_child(c, a)) return false;
        if (g.add_child(a, a)) return false;
        if (g.add_child(a, g.root())) return false;

        if (!g.add_child(g.root(), a)) return false;
        if (observer.attached != 1 || !g.is_attached(c)) return false;

        // Moving C directly under A removes it from B.
        if (!g.add_child(a, c)) return false;
        if (!g.node(b).children.empty() || g.node(a).children.size() != 2) return false;
        if (observer.detached != 1 || observer.attached != 2) return false;

        g.remove_from_parent(a);
        return !g.is_attached(c) && observer.detached == 2;
    }

    bool test_clone_never_copies_physics()
    {
        mxr_test::RecordingDevice device{};
        mxr::EntityGraph g{};
        const mxr::EntityId proto = g.create("Block Prototype 0", mxr::Transform(glm::vec3(0.0f, 1.0f, 0.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f)));
        g.node(proto).mesh = mxr::Mesh::generate_box(device, glm::vec3(0.15f, 0.03f, 0.05f));
        g.node(proto).hidden = true;
        g.node(proto).physics_body = mxr::PhysicsBody{};
        const mxr::EntityId child = g.create("Child");
        g.node(child).physics_body = mxr::PhysicsBody{};
        if (!g.add_child(proto, child)) return false;

        const mxr::EntityId deep = g.clone_subtree(proto, true);
        const mxr::EntityNode& copy = g.node(deep);
        if (deep == proto || copy.name != "Block Prototype 0") return false;
        if (copy.mesh != g.node(proto).mesh || !copy.hidden) return false;
        if (copy.physics_body.has_value() || copy.parent.valid()) return false;
        if (copy.children.size() != 1) return false;
        const mxr::EntityNode& child_copy = g.node(copy.children[0]);
        if (copy.children[0] == child || child_copy.name != "Child" || child_copy.physics_body.has_value()) return false;

        const mxr::EntityId shallow = g.clone_subtree(proto, false);
        if (!g.node(shallow).children.empty()) return false;

        return !g.clone_subtree(mxr::kNullEntity).valid();
    }

    bool test_find_child_prefers_immediate_children()
    {
        mxr::EntityGraph g{};
        const mxr::EntityId rig = g.create("Hand");
        const mxr::EntityId armature = g.create("Armature");
        const mxr::EntityId nested = g.create("Mesh");
        const mxr::EntityId direct = g.create("Mesh");
        if (!g.add_child(rig, armature) || !g.add_child(armature, nested) || !g.add_child(rig, direct)) return false;

        const auto found = g.find_child_by_name(rig, "Mesh");
        if (!found || *found != direct) return false;
        const auto deep = g.find_child_by_name(armature, "Mesh");
        if (!deep || *deep != nested) return false;
        if (g.find_child_by_name(rig, "Armature", false) != armature) return false;
        if (g.find_child_by_name(g.root(), "Mesh", false).has_value()) return false;
        return !g.find_child_by_name(rig, "Missing").has_value();
    }

    bool test_collect_matching_excludes_start()
    {
        mxr::EntityGraph g{};
        const mxr::EntityId anchor = g.create("Block Anchor");
        for (int i = 0; i < 3; ++i)
        {
            if (!g.add_child(anchor, g.create("Block " + std::to_string(i)))) return false;
        }
        if (!g.add_child(anchor, g.create("Marker"))) return false;

        const auto blocks = g.collect_matching(anchor, [](const mxr::EntityNode& n) {
            return n.name.rfind("Block", 0) == 0;
        });
        if (blocks.size() != 3) return false;
        for (mxr::EntityId b : blocks)
        {
            if (b == anchor) return false;
        }
        return g.flattened(anchor).size() == 5;
    }

    bool test_visibility_is_inherited()
    {
        mxr::EntityGraph g{};
        const mxr::EntityId parent = g.create("Parent");
        const mxr::EntityId child = g.create("Child");
        const mxr::EntityId sibling = g.create("Sibling");
        if (!g.add_child(g.root(), parent) || !g.add_child(parent, child) || !g.add_child(g.root(), sibling)) return false;

        if (!g.is_visible(child)) return false;
        g.node(parent).hidden = true;
        if (g.is_visible(child) || !g.is_visible(sibling)) return false;

        const auto visible = g.visible_flattened(g.root());
        if (visible.size() != 2) return false;

        g.node(parent).hidden = false;
        return g.visible_flattened(g.root()).size() == 4;
    }

    bool test_destroy_invalidates_handles()
    {
        mxr::EntityGraph g{};
        const mxr::EntityId parent = g.create("Parent");
        const mxr::EntityId child = g.create("Child");
        if (!g.add_child(g.root(), parent) || !g.add_child(parent, child)) return false;
        const size_t before = g.size();

        g.destroy(parent);
        if (g.alive(parent) || g.alive(child) || g.size() != before - 2) return false;
        if (!g.node(g.root()).children.empty()) return false;

        // The freed slot is recycled with a new generation.
        const mxr::EntityId fresh = g.create("Fresh");
        if (g.alive(parent) && fresh == parent) return false;
        if (g.add_child(parent, fresh)) return false;

        g.destroy(g.root());
        if (!g.alive(g.root())) return false;

        try
        {
            (void)g.node(child);
            return false;
        }
        catch (const std::out_of_range&)
        {
            return true;
        }
    }

    bool test_generate_collision_shapes()
    {
        mxr_test::RecordingDevice device{};
        mxr::EntityGraph g{};
        const mxr::EntityId model = g.create("Model");
        const mxr::EntityId part = g.create("Part");
        const mxr::EntityId empty = g.create("Empty");
        g.node(part).mesh = mxr::Mesh::generate_sphere(device, 0.1f);
        if (!g.add_child(model, part) || !g.add_child(model, empty)) return false;

        g.generate_collision_shapes(model, false, mxr::BodyMode::Dynamic);
        if (g.node(part).physics_body.has_value()) return false;

        g.generate_collision_shapes(model, true, mxr::BodyMode::Dynamic);
        const auto& body = g.node(part).physics_body;
        if (!body || body->mode != mxr::BodyMode::Dynamic) return false;
        const auto* hull = std::get_if<mxr::ConvexHullShape>(&body->shape);
        return hull && hull->mesh == g.node(part).mesh && !g.node(empty).physics_body.has_value();
    }
}

int main()
{
    const bool ok_world = test_world_transform_folds_parent_chain();
    const bool ok_reparent = test_reparenting_and_cycle_rejection();
    const bool ok_clone = test_clone_never_copies_physics();
    const bool ok_find = test_find_child_prefers_immediate_children();
    const bool ok_collect = test_collect_matching_excludes_start();
    const bool ok_visible = test_visibility_is_inherited();
    const bool ok_destroy = test_destroy_invalidates_handles();
    const bool ok_shapes = test_generate_collision_shapes();

    if (!ok_world) std::fprintf(stderr, "[mxr-tests] world transform fold failed\n");
    if (!ok_reparent) std::fprintf(stderr, "[mxr-tests] reparenting/cycle rejection failed\n");
    if (!ok_clone) std::fprintf(stderr, "[mxr-tests] clone without physics failed\n");
    if (!ok_find) std::fprintf(stderr, "[mxr-tests] find child by name failed\n");
    if (!ok_collect) std::fprintf(stderr, "[mxr-tests] collect matching failed\n");
    if (!ok_visible) std::fprintf(stderr, "[mxr-tests] inherited visibility failed\n");
    if (!ok_destroy) std::fprintf(stderr, "[mxr-tests] destroy/stale handle failed\n");
    if (!ok_shapes) std::fprintf(stderr, "[mxr-tests] collision shape generation failed\n");

    if (!(ok_world && ok_reparent && ok_clone && ok_find && ok_collect && ok_visible && ok_destroy && ok_shapes)) return 1;
    std::fprintf(stderr, "[mxr-tests] scene graph: all tests passed\n");
    return 0;
}
