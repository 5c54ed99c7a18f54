#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: anchor.hpp
    MODULE: scene
    PURPOSE: Anchor records delivered by the sensing collaborator: world, plane, mesh,
            hand (27-joint skeleton) and environment-light probes.
*/


#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <glm/glm.hpp>

#include "mxr/scene/light.hpp"

namespace mxr
{
    class Mesh;

    using AnchorId = uint64_t;

    enum class AnchorEvent : uint8_t
    {
        Added = 0,
        Updated,
        Removed
    };

    inline const char* anchor_event_name(AnchorEvent e)
    {
        switch (e)
        {
            case AnchorEvent::Added: return "added";
            case AnchorEvent::Updated: return "updated";
            case AnchorEvent::Removed: return "removed";
        }
        return "unknown";
    }

    struct WorldAnchor
    {
        AnchorId id = 0;
        glm::mat4 origin_from_anchor{1.0f};
        bool tracked = true;
    };

    enum class PlaneAlignment : uint8_t
    {
        Horizontal = 0,
        Vertical,
        Slanted
    };

    enum class PlaneClassification : uint8_t
    {
        Unknown = 0,
        Wall,
        Floor,
        Ceiling,
        Table,
        Seat,
        Window,
        Door
    };

    struct PlaneAnchor
    {
        AnchorId id = 0;
        glm::mat4 origin_from_anchor{1.0f};
        PlaneAlignment alignment = PlaneAlignment::Horizontal;
        PlaneClassification classification = PlaneClassification::Unknown;
        // Triangulated plane geometry in anchor space.
        std::shared_ptr<Mesh> mesh{};
    };

    struct MeshAnchor
    {
        AnchorId id = 0;
        glm::mat4 origin_from_anchor{1.0f};
        std::shared_ptr<Mesh> mesh{};
    };

    enum class Handedness : uint8_t
    {
        Left = 0,
        Right,
        None
    };

    inline const char* handedness_name(Handedness h)
    {
        switch (h)
        {
            case Handedness::Left: return "left";
            case Handedness::Right: return "right";
            case Handedness::None: return "none";
        }
        return "unknown";
    }

    enum class HandJoint : uint8_t
    {
        Wrist = 0,
        ThumbKnuckle,
        ThumbIntermediateBase,
        ThumbIntermediateTip,
        ThumbTip,
        IndexFingerMetacarpal,
        IndexFingerKnuckle,
        IndexFingerIntermediateBase,
        IndexFingerIntermediateTip,
        IndexFingerTip,
        MiddleFingerMetacarpal,
        MiddleFingerKnuckle,
        MiddleFingerIntermediateBase,
        MiddleFingerIntermediateTip,
        MiddleFingerTip,
        RingFingerMetacarpal,
        RingFingerKnuckle,
        RingFingerIntermediateBase,
        RingFingerIntermediateTip,
        RingFingerTip,
        LittleFingerMetacarpal,
        LittleFingerKnuckle,
        LittleFingerIntermediateBase,
        LittleFingerIntermediateTip,
        LittleFingerTip,
        ForearmWrist,
        ForearmArm
    };

    inline constexpr size_t kHandJointCount = 27;

    // WebXR hand-input joint names, indexed by HandJoint. Forearm joints have none.
    inline constexpr std::array<std::string_view, kHandJointCount> kWebXRJointNames{
        "wrist",
        "thumb_metacarpal",
        "thumb_phalanx_proximal",
        "thumb_phalanx_distal",
        "thumb_tip",
        "index_finger_metacarpal",
        "index_finger_phalanx_proximal",
        "index_finger_phalanx_intermediate",
        "index_finger_phalanx_distal",
        "index_finger_tip",
        "middle_finger_metacarpal",
        "middle_finger_phalanx_proximal",
        "middle_finger_phalanx_intermediate",
        "middle_finger_phalanx_distal",
        "middle_finger_tip",
        "ring_finger_metacarpal",
        "ring_finger_phalanx_proximal",
        "ring_finger_phalanx_intermediate",
        "ring_finger_phalanx_distal",
        "ring_finger_tip",
        "pinky_finger_metacarpal",
        "pinky_finger_phalanx_proximal",
        "pinky_finger_phalanx_intermediate",
        "pinky_finger_phalanx_distal",
        "pinky_finger_tip",
        "",
        "",
    };

    inline std::optional<HandJoint> hand_joint_from_webxr_name(std::string_view name)
    {
        if (name.empty()) return std::nullopt;
        for (size_t i = 0; i < kHandJointCount; ++i)
        {
            if (kWebXRJointNames[i] == name) return static_cast<HandJoint>(i);
        }
        return std::nullopt;
    }

    inline std::string_view webxr_joint_name(HandJoint joint)
    {
        return kWebXRJointNames[static_cast<size_t>(joint)];
    }

    struct HandJointPose
    {
        glm::mat4 anchor_from_joint{1.0f};
        bool tracked = false;
    };

    struct HandSkeletonPose
    {
        std::array<HandJointPose, kHandJointCount> joints{};

        const HandJointPose& joint(HandJoint j) const { return joints[static_cast<size_t>(j)]; }
        HandJointPose& joint(HandJoint j) { return joints[static_cast<size_t>(j)]; }
    };

    struct HandAnchor
    {
        AnchorId id = 0;
        Handedness handedness = Handedness::Right;
        glm::mat4 origin_from_anchor{1.0f};
        bool tracked = false;
        std::optional<HandSkeletonPose> skeleton{};
    };

    struct EnvironmentLightAnchor
    {
        AnchorId id = 0;
        glm::mat4 origin_from_anchor{1.0f};
        EnvironmentLight light{};
    };
}
