#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: physics_world.hpp
    MODULE: physics
    PURPOSE: Narrow contract of the rigid-body solver behind the physics bridge.
            Shapes arrive as plain geometry; the solver never sees entities or meshes.
*/


#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include "mxr/core/result.hpp"
#include "mxr/physics/physics_body.hpp"

namespace mxr
{
    using BodyHandle = uint32_t;
    inline constexpr BodyHandle kInvalidBody = 0xffffffffu;

    struct BoxGeometry
    {
        glm::vec3 half_extents{0.5f};
    };

    struct SphereGeometry
    {
        float radius = 0.5f;
    };

    struct ConvexHullGeometry
    {
        std::vector<glm::vec3> points{};
    };

    struct TriangleMeshGeometry
    {
        std::vector<glm::vec3> points{};
        std::vector<uint32_t> indices{};
    };

    using ShapeGeometry = std::variant<BoxGeometry, SphereGeometry, ConvexHullGeometry, TriangleMeshGeometry>;

    struct BodyPose
    {
        glm::vec3 position{0.0f};
        glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
    };

    struct BodyProperties
    {
        float mass = 0.0f;
        float friction = 0.5f;
        float restitution = 0.0f;
        bool affected_by_gravity = true;
    };

    struct BodyCreateDesc
    {
        BodyMode mode = BodyMode::Static;
        ShapeGeometry shape{BoxGeometry{}};
        // Applied on top of the shape geometry; unit scale is passed through untouched.
        glm::vec3 scale{1.0f};
        BodyPose pose{};
        BodyProperties properties{};
        CollisionFilter filter{};
    };

    struct RayHit
    {
        BodyHandle body = kInvalidBody;
        glm::vec3 position{0.0f};
        float distance = 0.0f;
    };

    class IPhysicsWorld
    {
    public:
        virtual ~IPhysicsWorld() = default;

        virtual Result<BodyHandle> create_body(const BodyCreateDesc& desc) = 0;
        virtual void destroy_body(BodyHandle body) = 0;
        virtual bool set_pose(BodyHandle body, const BodyPose& pose) = 0;
        virtual std::optional<BodyPose> pose(BodyHandle body) const = 0;
        virtual void step(float dt) = 0;
        // Hits along the segment [from, to] against bodies whose group intersects
        // group_mask; no ordering guarantee.
        virtual std::vector<RayHit> cast_ray(
            const glm::vec3& from,
            const glm::vec3& to,
            uint32_t group_mask = CollisionGroupAll) const = 0;
        virtual size_t body_count() const = 0;
    };
}
