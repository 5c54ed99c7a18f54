#include "mxr/physics/physics_bridge.hpp"

#include <type_traits>
#include <variant>

#include "mxr/core/log.hpp"
#include "mxr/resources/mesh.hpp"

namespace mxr
{
    Result<ShapeGeometry> shape_geometry_for(const PhysicsBody& body)
    {
        return std::visit([](const auto& shape) -> Result<ShapeGeometry> {
            using T = std::decay_t<decltype(shape)>;
            if constexpr (std::is_same_v<T, BoxShape>)
            {
                return Result<ShapeGeometry>::success(BoxGeometry{shape.extents * 0.5f});
            }
            else if constexpr (std::is_same_v<T, SphereShape>)
            {
                return Result<ShapeGeometry>::success(SphereGeometry{shape.radius});
            }
            else if constexpr (std::is_same_v<T, ConvexHullShape>)
            {
                if (!shape.mesh) return Result<ShapeGeometry>::failure("convex hull shape has no mesh");
                ConvexHullGeometry hull{};
                hull.points = shape.mesh->packed_positions();
                if (hull.points.empty())
                {
                    return Result<ShapeGeometry>::failure("convex hull mesh '" + shape.mesh->name + "' has no readable positions");
                }
                return Result<ShapeGeometry>::success(std::move(hull));
            }
            else
            {
                if (!shape.mesh) return Result<ShapeGeometry>::failure("concave shape has no mesh");
                TriangleMeshGeometry tris{};
                tris.points = shape.mesh->packed_positions();
                tris.indices = shape.mesh->packed_indices();
                if (tris.points.empty() || tris.indices.empty())
                {
                    return Result<ShapeGeometry>::failure("concave mesh '" + shape.mesh->name + "' has no readable triangles");
                }
                return Result<ShapeGeometry>::success(std::move(tris));
            }
        }, body.shape);
    }

    PhysicsBridge::PhysicsBridge(IPhysicsWorld& world)
        : world_(world)
    {}

    PhysicsBridge::~PhysicsBridge()
    {
        for (const auto& [entity, reg] : registrations_)
        {
            world_.destroy_body(reg.body);
        }
    }

    bool PhysicsBridge::add_entity(const EntityGraph& graph, EntityId entity)
    {
        const EntityNode* node = graph.get(entity);
        if (!node) return false;

        if (registrations_.count(entity) != 0)
        {
            log_warn("PhysicsBridge: entity '" + node->name + "' is already registered");
            return false;
        }
        if (!node->physics_body) return false;

        const PhysicsBody& body = *node->physics_body;
        auto geometry = shape_geometry_for(body);
        if (!geometry)
        {
            log_error("PhysicsBridge: failed to register entity '" + node->name + "': " + geometry.error);
            return false;
        }

        const Transform world = graph.world_transform(entity);

        BodyCreateDesc desc{};
        desc.mode = body.mode;
        desc.shape = std::move(geometry.value);
        desc.scale = world.scale;
        desc.pose.position = world.position;
        desc.pose.rotation = world.rotation;
        desc.properties.mass = body.mass;
        desc.properties.friction = body.friction;
        desc.properties.restitution = body.restitution;
        desc.properties.affected_by_gravity = body.affected_by_gravity;
        desc.filter = body.filter;

        auto handle = world_.create_body(desc);
        if (!handle)
        {
            log_error("PhysicsBridge: failed to register entity '" + node->name + "': " + handle.error);
            return false;
        }

        registrations_[entity] = Registration{handle.value, body.mode};
        entities_by_body_[handle.value] = entity;
        return true;
    }

    void PhysicsBridge::remove_entity(EntityId entity)
    {
        auto it = registrations_.find(entity);
        if (it == registrations_.end()) return;
        world_.destroy_body(it->second.body);
        entities_by_body_.erase(it->second.body);
        registrations_.erase(it);
    }

    void PhysicsBridge::update(EntityGraph& graph, const std::vector<EntityId>& entities, double timestep)
    {
        for (EntityId e : entities)
        {
            auto it = registrations_.find(e);
            if (it == registrations_.end() || it->second.mode == BodyMode::Dynamic) continue;
            if (!graph.alive(e)) continue;
            const Transform world = graph.world_transform(e);
            world_.set_pose(it->second.body, BodyPose{world.position, world.rotation});
        }

        world_.step((float)timestep);

        for (EntityId e : entities)
        {
            auto it = registrations_.find(e);
            if (it == registrations_.end() || it->second.mode != BodyMode::Dynamic) continue;
            if (!graph.alive(e)) continue;
            const auto pose = world_.pose(it->second.body);
            if (!pose) continue;
            // The solver owns position and orientation, never scale: keep the
            // world scale so the back-solved local scale is unchanged.
            const glm::vec3 world_scale = graph.world_transform(e).scale;
            graph.set_world_transform(e, Transform(pose->position, pose->rotation, world_scale));
        }
    }

    std::vector<EntityHit> PhysicsBridge::hit_test_with_segment(const glm::vec3& from, const glm::vec3& to, uint32_t group_mask) const
    {
        std::vector<EntityHit> out{};
        for (const RayHit& hit : world_.cast_ray(from, to, group_mask))
        {
            EntityHit h{};
            auto it = entities_by_body_.find(hit.body);
            if (it != entities_by_body_.end()) h.entity = it->second;
            h.world_position = hit.position;
            h.distance = hit.distance;
            out.push_back(h);
        }
        return out;
    }

    bool PhysicsBridge::is_registered(EntityId entity) const
    {
        return registrations_.count(entity) != 0;
    }

    std::optional<BodyHandle> PhysicsBridge::body_for(EntityId entity) const
    {
        auto it = registrations_.find(entity);
        if (it == registrations_.end()) return std::nullopt;
        return it->second.body;
    }
}
