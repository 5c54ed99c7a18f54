#include "mxr/scene/hand_rig.hpp"

#include <glm/gtc/constants.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include "mxr/resources/mesh.hpp"
#include "mxr/resources/skeleton.hpp"

namespace mxr
{
    glm::mat4 hand_joint_conformation(Handedness handedness)
    {
        if (handedness == Handedness::Right)
        {
            return glm::rotate(glm::mat4(1.0f), glm::half_pi<float>(), glm::vec3(0.0f, 1.0f, 0.0f));
        }
        return glm::rotate(glm::mat4(1.0f), glm::pi<float>(), glm::normalize(glm::vec3(1.0f, 0.0f, -1.0f)));
    }

    HandRig::HandRig(EntityGraph& graph, IGpuDevice& device, Handedness handedness)
        : handedness_(handedness)
        , conformation_(hand_joint_conformation(handedness))
    {
        const bool right = handedness == Handedness::Right;
        node_ = graph.create(right ? "Right Hand" : "Left Hand");
        collider_ = graph.create(right ? "Right Index Tip Collider" : "Left Index Tip Collider");

        auto sphere = Mesh::generate_sphere(device, kHandColliderRadius);
        const glm::vec4 color(right ? 0.8f : 0.0f, right ? 0.0f : 0.8f, 0.0f, 1.0f);
        sphere->materials = {Material::make_pbr(color, 0.5f, false)};

        EntityNode& collider = graph.node(collider_);
        collider.mesh = sphere;
        PhysicsBody body{};
        body.mode = BodyMode::Kinematic;
        body.shape = SphereShape{kHandColliderRadius};
        body.mass = kHandColliderMass;
        collider.physics_body = body;

        graph.add_child(node_, collider_);
    }

    void HandRig::attach_armature(EntityGraph& graph, EntityId armature)
    {
        graph.add_child(node_, armature);
    }

    void HandRig::update_pose(EntityGraph& graph, const HandAnchor& anchor)
    {
        if (!graph.alive(node_)) return;

        if (anchor.skeleton)
        {
            const auto mesh_entity = graph.find_child_by_name(node_, mesh_entity_name, true);
            const EntityNode* mesh_node = mesh_entity ? graph.get(*mesh_entity) : nullptr;
            if (mesh_node && mesh_node->skinner)
            {
                Skinner& skinner = *mesh_node->skinner;
                const Skeleton& skeleton = skinner.skeleton();
                std::vector<glm::mat4> poses = skeleton.rest_transforms;
                poses.resize(skeleton.joint_count(), glm::mat4(1.0f));
                for (size_t i = 0; i < skeleton.joint_paths.size(); ++i)
                {
                    // Joint paths may be hierarchical ("wrist/thumb_metacarpal"); the leaf names the joint.
                    const std::string& path = skeleton.joint_paths[i];
                    const size_t slash = path.find_last_of('/');
                    const std::string leaf = slash == std::string::npos ? path : path.substr(slash + 1);
                    const auto joint = hand_joint_from_webxr_name(leaf);
                    if (!joint) continue;
                    poses[i] = anchor.skeleton->joint(*joint).anchor_from_joint * conformation_;
                }
                skinner.set_joint_transforms(std::move(poses));
            }
        }

        EntityNode& hand = graph.node(node_);
        if (!anchor.tracked)
        {
            hand.hidden = true;
            return;
        }

        graph.set_world_transform(node_, Transform(anchor.origin_from_anchor));

        if (anchor.skeleton)
        {
            const HandJointPose& tip = anchor.skeleton->joint(HandJoint::IndexFingerTip);
            EntityNode& collider = graph.node(collider_);
            collider.hidden = !tip.tracked;
            if (tip.tracked)
            {
                collider.model_transform = Transform(tip.anchor_from_joint);
            }
        }
    }
}
