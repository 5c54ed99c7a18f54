#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: physics_body.hpp
    MODULE: physics
    PURPOSE: Physics body descriptor owned by an entity. The bridge derives a
            simulation body from it; the descriptor never holds solver state.
*/


#include <cstdint>
#include <memory>
#include <variant>

#include <glm/glm.hpp>

namespace mxr
{
    class Mesh;

    enum class BodyMode : uint8_t
    {
        Static = 0,
        Dynamic,
        Kinematic
    };

    inline const char* body_mode_name(BodyMode mode)
    {
        switch (mode)
        {
            case BodyMode::Static: return "static";
            case BodyMode::Dynamic: return "dynamic";
            case BodyMode::Kinematic: return "kinematic";
        }
        return "unknown";
    }

    // Full edge lengths, not half extents.
    struct BoxShape
    {
        glm::vec3 extents{1.0f};
    };

    struct SphereShape
    {
        float radius = 0.5f;
    };

    struct ConvexHullShape
    {
        std::shared_ptr<const Mesh> mesh{};
    };

    struct ConcaveMeshShape
    {
        std::shared_ptr<const Mesh> mesh{};
    };

    using PhysicsShape = std::variant<BoxShape, SphereShape, ConvexHullShape, ConcaveMeshShape>;

    enum CollisionGroupBits : uint32_t
    {
        CollisionGroupDefault = 1u << 0,
        CollisionGroupSceneUnderstanding = 1u << 1,
        CollisionGroupAll = 0xffffffffu
    };

    // Two bodies collide when each one's group intersects the other's mask.
    struct CollisionFilter
    {
        uint32_t group = CollisionGroupDefault;
        uint32_t mask = CollisionGroupAll;

        bool operator==(const CollisionFilter&) const = default;
    };

    struct PhysicsBody
    {
        BodyMode mode = BodyMode::Static;
        PhysicsShape shape{BoxShape{}};
        // Dynamic/kinematic only: 0 lets the solver compute mass from shape density.
        float mass = 0.0f;
        float friction = 0.5f;
        float restitution = 0.0f;
        bool affected_by_gravity = true;
        CollisionFilter filter{};
    };
}
