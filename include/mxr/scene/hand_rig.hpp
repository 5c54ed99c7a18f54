#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: hand_rig.hpp
    MODULE: scene
    PURPOSE: Persistent hand node driven by tracked hand anchors: skinned armature joint
            poses plus a kinematic fingertip collider. Hidden, never destroyed, while untracked.
*/


#include <string>

#include <glm/glm.hpp>

#include "mxr/core/units.hpp"
#include "mxr/rhi/gpu_device.hpp"
#include "mxr/scene/anchor.hpp"
#include "mxr/scene/entity_graph.hpp"

namespace mxr
{
    inline constexpr float kHandColliderRadius = 7.5f * units::millimeter;
    inline constexpr float kHandColliderMass = 0.5f;

    // Rotates tracked joint frames into the armature's joint convention.
    glm::mat4 hand_joint_conformation(Handedness handedness);

    class HandRig
    {
    public:
        // Creates the (detached) hand node and its collider child.
        HandRig(EntityGraph& graph, IGpuDevice& device, Handedness handedness);

        Handedness handedness() const { return handedness_; }
        EntityId node() const { return node_; }
        EntityId collider() const { return collider_; }
        const glm::mat4& conformation() const { return conformation_; }

        // Parents an imported armature under the hand node. The skinned mesh node inside it
        // must be named `mesh_entity_name`.
        void attach_armature(EntityGraph& graph, EntityId armature);

        void update_pose(EntityGraph& graph, const HandAnchor& anchor);

        std::string mesh_entity_name = "Mesh";

    private:
        Handedness handedness_ = Handedness::Right;
        glm::mat4 conformation_{1.0f};
        EntityId node_{};
        EntityId collider_{};
    };
}
