/*
    MXR SPATIAL RENDERER

    FILE: jolt_physics_world.cpp
    MODULE: physics
    PURPOSE: Jolt implementation of the solver contract (shapes, bodies, step, ray cast).
*/

#include "mxr/physics/jolt_physics_world.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_set>

#include <Jolt/Jolt.h>
#include <Jolt/Core/JobSystemThreadPool.h>
#include <Jolt/Core/TempAllocator.h>
#include <Jolt/Physics/Body/Body.h>
#include <Jolt/Physics/Body/BodyCreationSettings.h>
#include <Jolt/Physics/Body/BodyFilter.h>
#include <Jolt/Physics/Collision/CastResult.h>
#include <Jolt/Physics/Collision/CollisionCollectorImpl.h>
#include <Jolt/Physics/Collision/GroupFilter.h>
#include <Jolt/Physics/Collision/RayCast.h>
#include <Jolt/Physics/Collision/Shape/BoxShape.h>
#include <Jolt/Physics/Collision/Shape/ConvexHullShape.h>
#include <Jolt/Physics/Collision/Shape/MeshShape.h>
#include <Jolt/Physics/Collision/Shape/SphereShape.h>
#include <Jolt/Physics/PhysicsSettings.h>
#include <Jolt/Physics/PhysicsSystem.h>

#include "mxr/core/log.hpp"
#include "mxr/physics/jolt_adapter.hpp"

namespace mxr
{
    namespace
    {
        namespace Layers
        {
            constexpr JPH::ObjectLayer NON_MOVING = 0;
            constexpr JPH::ObjectLayer MOVING = 1;
            constexpr JPH::ObjectLayer NUM_LAYERS = 2;
        }

        namespace BroadPhaseLayers
        {
            constexpr JPH::BroadPhaseLayer NON_MOVING(0);
            constexpr JPH::BroadPhaseLayer MOVING(1);
            constexpr JPH::uint NUM_LAYERS(2);
        }

        class BPLayerInterfaceImpl final : public JPH::BroadPhaseLayerInterface
        {
        public:
            BPLayerInterfaceImpl()
            {
                object_to_broad_phase_[Layers::NON_MOVING] = BroadPhaseLayers::NON_MOVING;
                object_to_broad_phase_[Layers::MOVING] = BroadPhaseLayers::MOVING;
            }

            JPH::uint GetNumBroadPhaseLayers() const override { return BroadPhaseLayers::NUM_LAYERS; }

            JPH::BroadPhaseLayer GetBroadPhaseLayer(JPH::ObjectLayer layer) const override
            {
                return object_to_broad_phase_[layer];
            }

#if defined(JPH_EXTERNAL_PROFILE) || defined(JPH_PROFILE_ENABLED)
            const char* GetBroadPhaseLayerName(JPH::BroadPhaseLayer layer) const override
            {
                switch ((JPH::BroadPhaseLayer::Type)layer)
                {
                    case (JPH::BroadPhaseLayer::Type)BroadPhaseLayers::NON_MOVING: return "NON_MOVING";
                    case (JPH::BroadPhaseLayer::Type)BroadPhaseLayers::MOVING: return "MOVING";
                    default: return "INVALID";
                }
            }
#endif

        private:
            JPH::BroadPhaseLayer object_to_broad_phase_[Layers::NUM_LAYERS];
        };

        class ObjectVsBroadPhaseLayerFilterImpl final : public JPH::ObjectVsBroadPhaseLayerFilter
        {
        public:
            bool ShouldCollide(JPH::ObjectLayer layer1, JPH::BroadPhaseLayer layer2) const override
            {
                switch (layer1)
                {
                    case Layers::NON_MOVING: return layer2 == BroadPhaseLayers::MOVING;
                    case Layers::MOVING: return true;
                    default: return false;
                }
            }
        };

        class ObjectLayerPairFilterImpl final : public JPH::ObjectLayerPairFilter
        {
        public:
            bool ShouldCollide(JPH::ObjectLayer object1, JPH::ObjectLayer object2) const override
            {
                switch (object1)
                {
                    case Layers::NON_MOVING: return object2 == Layers::MOVING;
                    case Layers::MOVING: return true;
                    default: return false;
                }
            }
        };

        // CollisionGroup carries the filter group in GroupID and the mask in SubGroupID.
        class GroupMaskFilter final : public JPH::GroupFilter
        {
        public:
            bool CanCollide(const JPH::CollisionGroup& a, const JPH::CollisionGroup& b) const override
            {
                return (a.GetGroupID() & b.GetSubGroupID()) != 0 && (b.GetGroupID() & a.GetSubGroupID()) != 0;
            }
        };

        class GroupMaskBodyFilter final : public JPH::BodyFilter
        {
        public:
            explicit GroupMaskBodyFilter(uint32_t mask)
                : mask_(mask)
            {}

            bool ShouldCollideLocked(const JPH::Body& body) const override
            {
                return (body.GetCollisionGroup().GetGroupID() & mask_) != 0;
            }

        private:
            uint32_t mask_ = CollisionGroupAll;
        };

        bool scale_is_unity(const glm::vec3& s)
        {
            constexpr float eps = 1e-4f;
            return std::abs(s.x - 1.0f) < eps && std::abs(s.y - 1.0f) < eps && std::abs(s.z - 1.0f) < eps;
        }

        Result<JPH::ShapeRefC> shape_from_result(JPH::ShapeSettings::ShapeResult result, const char* what)
        {
            if (result.HasError())
            {
                return Result<JPH::ShapeRefC>::failure(std::string(what) + ": " + result.GetError().c_str());
            }
            return Result<JPH::ShapeRefC>::success(result.Get());
        }

        Result<JPH::ShapeRefC> build_unscaled_shape(const ShapeGeometry& geometry)
        {
            if (const auto* box = std::get_if<BoxGeometry>(&geometry))
            {
                constexpr float convex_radius = 0.0f;
                JPH::BoxShapeSettings settings(jolt::to_jph(box->half_extents), convex_radius);
                settings.SetEmbedded();
                return shape_from_result(settings.Create(), "box shape");
            }
            if (const auto* sphere = std::get_if<SphereGeometry>(&geometry))
            {
                JPH::SphereShapeSettings settings(sphere->radius);
                settings.SetEmbedded();
                return shape_from_result(settings.Create(), "sphere shape");
            }
            if (const auto* hull = std::get_if<ConvexHullGeometry>(&geometry))
            {
                JPH::Array<JPH::Vec3> points{};
                points.reserve(hull->points.size());
                for (const glm::vec3& p : hull->points) points.push_back(jolt::to_jph(p));
                JPH::ConvexHullShapeSettings settings(points);
                settings.SetEmbedded();
                settings.mMaxConvexRadius = 0.005f;
                return shape_from_result(settings.Create(), "convex hull shape");
            }
            const auto& mesh = std::get<TriangleMeshGeometry>(geometry);
            if (mesh.indices.size() % 3 != 0)
            {
                return Result<JPH::ShapeRefC>::failure("triangle mesh shape: index count is not a multiple of 3");
            }
            JPH::VertexList vertices{};
            vertices.reserve(mesh.points.size());
            for (const glm::vec3& p : mesh.points) vertices.push_back(JPH::Float3(p.x, p.y, p.z));
            JPH::IndexedTriangleList triangles{};
            triangles.reserve(mesh.indices.size() / 3);
            for (size_t i = 0; i + 2 < mesh.indices.size(); i += 3)
            {
                triangles.push_back(JPH::IndexedTriangle(mesh.indices[i], mesh.indices[i + 1], mesh.indices[i + 2], 0));
            }
            JPH::MeshShapeSettings settings(vertices, triangles);
            settings.SetEmbedded();
            return shape_from_result(settings.Create(), "triangle mesh shape");
        }

        Result<JPH::ShapeRefC> build_shape(const ShapeGeometry& geometry, const glm::vec3& scale)
        {
            Result<JPH::ShapeRefC> shape = build_unscaled_shape(geometry);
            if (!shape.ok || scale_is_unity(scale)) return shape;
            return shape_from_result(shape.value->ScaleShape(jolt::to_jph(scale)), "scaled shape");
        }

        JPH::EMotionType motion_type(BodyMode mode)
        {
            switch (mode)
            {
                case BodyMode::Static: return JPH::EMotionType::Static;
                case BodyMode::Dynamic: return JPH::EMotionType::Dynamic;
                case BodyMode::Kinematic: return JPH::EMotionType::Kinematic;
            }
            return JPH::EMotionType::Static;
        }
    }

    struct JoltPhysicsWorld::Impl
    {
        PhysicsConfig config{};
        std::unique_ptr<JPH::TempAllocatorImpl> temp_allocator{};
        std::unique_ptr<JPH::JobSystemThreadPool> job_system{};
        BPLayerInterfaceImpl broad_phase_layers{};
        ObjectVsBroadPhaseLayerFilterImpl object_vs_broad_phase_filter{};
        ObjectLayerPairFilterImpl object_pair_filter{};
        JPH::Ref<GroupMaskFilter> group_filter = new GroupMaskFilter();
        JPH::PhysicsSystem system{};
        std::unordered_set<BodyHandle> live_bodies{};

        static JPH::BodyID body_id(BodyHandle handle)
        {
            return JPH::BodyID(handle);
        }
    };

    JoltPhysicsWorld::JoltPhysicsWorld(const PhysicsConfig& config)
        : impl_(std::make_unique<Impl>())
    {
        if (!jolt::jolt_initialized())
        {
            throw std::runtime_error("JoltPhysicsWorld: solver runtime is not initialized");
        }
        impl_->config = config;
        impl_->temp_allocator = std::make_unique<JPH::TempAllocatorImpl>((JPH::uint)config.temp_allocator_bytes);
        const unsigned hw = std::thread::hardware_concurrency();
        const int worker_count = (int)std::max(1u, hw > 1u ? hw - 1u : 1u);
        impl_->job_system = std::make_unique<JPH::JobSystemThreadPool>(
            JPH::cMaxPhysicsJobs,
            JPH::cMaxPhysicsBarriers,
            worker_count);

        constexpr JPH::uint kNumBodyMutexes = 0;
        impl_->system.Init(
            config.max_bodies,
            kNumBodyMutexes,
            config.max_body_pairs,
            config.max_contact_constraints,
            impl_->broad_phase_layers,
            impl_->object_vs_broad_phase_filter,
            impl_->object_pair_filter);

        JPH::PhysicsSettings settings = impl_->system.GetPhysicsSettings();
        settings.mPenetrationSlop = config.penetration_slop;
        impl_->system.SetPhysicsSettings(settings);
        impl_->system.SetGravity(jolt::to_jph(config.gravity));
    }

    JoltPhysicsWorld::~JoltPhysicsWorld()
    {
        JPH::BodyInterface& bodies = impl_->system.GetBodyInterface();
        for (BodyHandle handle : impl_->live_bodies)
        {
            const JPH::BodyID id = Impl::body_id(handle);
            bodies.RemoveBody(id);
            bodies.DestroyBody(id);
        }
        impl_->live_bodies.clear();
    }

    Result<BodyHandle> JoltPhysicsWorld::create_body(const BodyCreateDesc& desc)
    {
        Result<JPH::ShapeRefC> shape = build_shape(desc.shape, desc.scale);
        if (!shape.ok)
        {
            return Result<BodyHandle>::failure(shape.error);
        }

        const bool is_static = desc.mode == BodyMode::Static;
        JPH::BodyCreationSettings settings(
            shape.value.GetPtr(),
            JPH::RVec3(desc.pose.position.x, desc.pose.position.y, desc.pose.position.z),
            jolt::to_jph(glm::normalize(desc.pose.rotation)),
            motion_type(desc.mode),
            is_static ? Layers::NON_MOVING : Layers::MOVING);
        settings.mAllowDynamicOrKinematic = desc.mode == BodyMode::Dynamic;
        settings.mFriction = desc.properties.friction;
        settings.mRestitution = desc.properties.restitution;
        settings.mGravityFactor = desc.properties.affected_by_gravity ? 1.0f : 0.0f;
        settings.mLinearDamping = 0.05f;
        settings.mAngularDamping = 0.05f;
        settings.mCollisionGroup = JPH::CollisionGroup(impl_->group_filter, desc.filter.group, desc.filter.mask);
        if (!is_static && desc.properties.mass != 0.0f)
        {
            settings.mOverrideMassProperties = JPH::EOverrideMassProperties::CalculateInertia;
            settings.mMassPropertiesOverride.mMass = desc.properties.mass;
        }

        JPH::BodyInterface& bodies = impl_->system.GetBodyInterface();
        const JPH::BodyID id = bodies.CreateAndAddBody(
            settings,
            is_static ? JPH::EActivation::DontActivate : JPH::EActivation::Activate);
        if (id.IsInvalid())
        {
            return Result<BodyHandle>::failure("body limit reached");
        }
        const BodyHandle handle = id.GetIndexAndSequenceNumber();
        impl_->live_bodies.insert(handle);
        return Result<BodyHandle>::success(handle);
    }

    void JoltPhysicsWorld::destroy_body(BodyHandle body)
    {
        auto it = impl_->live_bodies.find(body);
        if (it == impl_->live_bodies.end()) return;
        JPH::BodyInterface& bodies = impl_->system.GetBodyInterface();
        const JPH::BodyID id = Impl::body_id(body);
        bodies.RemoveBody(id);
        bodies.DestroyBody(id);
        impl_->live_bodies.erase(it);
    }

    bool JoltPhysicsWorld::set_pose(BodyHandle body, const BodyPose& pose)
    {
        if (impl_->live_bodies.count(body) == 0) return false;
        impl_->system.GetBodyInterface().SetPositionAndRotationWhenChanged(
            Impl::body_id(body),
            JPH::RVec3(pose.position.x, pose.position.y, pose.position.z),
            jolt::to_jph(glm::normalize(pose.rotation)),
            JPH::EActivation::Activate);
        return true;
    }

    std::optional<BodyPose> JoltPhysicsWorld::pose(BodyHandle body) const
    {
        if (impl_->live_bodies.count(body) == 0) return std::nullopt;
        JPH::RVec3 position{};
        JPH::Quat rotation{};
        impl_->system.GetBodyInterface().GetPositionAndRotation(Impl::body_id(body), position, rotation);
        BodyPose out{};
        out.position = glm::vec3((float)position.GetX(), (float)position.GetY(), (float)position.GetZ());
        out.rotation = jolt::to_glm(rotation);
        return out;
    }

    void JoltPhysicsWorld::step(float dt)
    {
        if (dt <= 0.0f) return;
        const JPH::EPhysicsUpdateError err = impl_->system.Update(
            dt,
            (int)impl_->config.collision_steps,
            impl_->temp_allocator.get(),
            impl_->job_system.get());
        if (err != JPH::EPhysicsUpdateError::None)
        {
            log_warn("Physics step reported error flags " + std::to_string((uint32_t)err));
        }
    }

    std::vector<RayHit> JoltPhysicsWorld::cast_ray(const glm::vec3& from, const glm::vec3& to, uint32_t group_mask) const
    {
        std::vector<RayHit> out{};
        const glm::vec3 dir = to - from;
        const float length = glm::length(dir);
        if (length <= 0.0f) return out;

        const JPH::RRayCast ray{JPH::RVec3(from.x, from.y, from.z), jolt::to_jph(dir)};
        JPH::RayCastSettings settings{};
        JPH::AllHitCollisionCollector<JPH::CastRayCollector> collector{};
        const GroupMaskBodyFilter body_filter(group_mask);
        impl_->system.GetNarrowPhaseQuery().CastRay(
            ray,
            settings,
            collector,
            JPH::BroadPhaseLayerFilter{},
            JPH::ObjectLayerFilter{},
            body_filter);

        out.reserve(collector.mHits.size());
        for (const JPH::RayCastResult& hit : collector.mHits)
        {
            const JPH::RVec3 p = ray.GetPointOnRay(hit.mFraction);
            RayHit r{};
            r.body = hit.mBodyID.GetIndexAndSequenceNumber();
            r.position = glm::vec3((float)p.GetX(), (float)p.GetY(), (float)p.GetZ());
            r.distance = hit.mFraction * length;
            out.push_back(r);
        }
        return out;
    }

    size_t JoltPhysicsWorld::body_count() const
    {
        return impl_->live_bodies.size();
    }
}
