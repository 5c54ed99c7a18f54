#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: jolt_physics_world.hpp
    MODULE: physics
    PURPOSE: IPhysicsWorld backed by a Jolt PhysicsSystem.
            Two object layers: non-moving (static) bodies only collide with moving ones.
            Body pairs are further filtered by CollisionFilter group/mask bits.
            Requires a live jolt::PhysicsRuntime.
*/


#include <memory>
#include <optional>
#include <vector>

#include "mxr/core/config.hpp"
#include "mxr/physics/physics_world.hpp"

namespace mxr
{
    class JoltPhysicsWorld final : public IPhysicsWorld
    {
    public:
        explicit JoltPhysicsWorld(const PhysicsConfig& config = {});
        ~JoltPhysicsWorld() override;

        JoltPhysicsWorld(const JoltPhysicsWorld&) = delete;
        JoltPhysicsWorld& operator=(const JoltPhysicsWorld&) = delete;

        Result<BodyHandle> create_body(const BodyCreateDesc& desc) override;
        void destroy_body(BodyHandle body) override;
        bool set_pose(BodyHandle body, const BodyPose& pose) override;
        std::optional<BodyPose> pose(BodyHandle body) const override;
        void step(float dt) override;
        std::vector<RayHit> cast_ray(
            const glm::vec3& from,
            const glm::vec3& to,
            uint32_t group_mask = CollisionGroupAll) const override;
        size_t body_count() const override;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl_;
    };
}
