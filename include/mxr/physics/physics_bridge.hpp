#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: physics_bridge.hpp
    MODULE: physics
    PURPOSE: One-to-one mapping between entities carrying a PhysicsBody and solver bodies.
            Pushes non-dynamic poses in, steps, pulls dynamic poses out, maps ray hits
            back to entities. Touched only from the update thread.
*/


#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

#include <glm/glm.hpp>

#include "mxr/core/result.hpp"
#include "mxr/physics/physics_world.hpp"
#include "mxr/scene/entity_graph.hpp"

namespace mxr
{
    struct EntityHit
    {
        // kNullEntity when the body belongs to nothing the bridge registered.
        EntityId entity{};
        glm::vec3 world_position{0.0f};
        float distance = 0.0f;
    };

    // Solver geometry for a body descriptor at the given world scale.
    // Fails when mesh data is missing or not host-visible.
    Result<ShapeGeometry> shape_geometry_for(const PhysicsBody& body);

    class PhysicsBridge
    {
    public:
        explicit PhysicsBridge(IPhysicsWorld& world);
        ~PhysicsBridge();

        PhysicsBridge(const PhysicsBridge&) = delete;
        PhysicsBridge& operator=(const PhysicsBridge&) = delete;

        // Returns true when a solver body was created. Entities without a body are skipped,
        // already registered entities are rejected with a diagnostic.
        bool add_entity(const EntityGraph& graph, EntityId entity);
        void remove_entity(EntityId entity);

        void update(EntityGraph& graph, const std::vector<EntityId>& entities, double timestep);

        // Only bodies whose collision group intersects group_mask are reported.
        std::vector<EntityHit> hit_test_with_segment(
            const glm::vec3& from,
            const glm::vec3& to,
            uint32_t group_mask = CollisionGroupAll) const;

        bool is_registered(EntityId entity) const;
        std::optional<BodyHandle> body_for(EntityId entity) const;
        size_t registered_count() const { return registrations_.size(); }

    private:
        struct Registration
        {
            BodyHandle body = kInvalidBody;
            BodyMode mode = BodyMode::Static;
        };

        IPhysicsWorld& world_;
        std::unordered_map<EntityId, Registration> registrations_{};
        std::unordered_map<BodyHandle, EntityId> entities_by_body_{};
    };
}
