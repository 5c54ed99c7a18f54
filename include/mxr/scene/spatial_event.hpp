#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: spatial_event.hpp
    MODULE: scene
    PURPOSE: Internal events queued by sensing/input producers and drained by the scene
            once per update tick, plus the sink interface producers push into.
*/


#include <optional>
#include <variant>
#include <vector>

#include <glm/glm.hpp>

#include "mxr/scene/anchor.hpp"

namespace mxr
{
    struct WorldAnchorEvent
    {
        WorldAnchor anchor{};
        AnchorEvent event = AnchorEvent::Added;
    };

    struct PlaneAnchorEvent
    {
        PlaneAnchor anchor{};
        AnchorEvent event = AnchorEvent::Added;
    };

    struct MeshAnchorEvent
    {
        MeshAnchor anchor{};
        AnchorEvent event = AnchorEvent::Added;
    };

    struct HandAnchorEvent
    {
        HandAnchor anchor{};
        AnchorEvent event = AnchorEvent::Added;
    };

    struct EnvironmentLightEvent
    {
        EnvironmentLightAnchor anchor{};
        AnchorEvent event = AnchorEvent::Added;
    };

    enum class InputPhase : uint8_t
    {
        Active = 0,
        Ended,
        Cancelled
    };

    enum class InputKind : uint8_t
    {
        IndirectPinch = 0,
        DirectPinch,
        Pointer,
        Touch
    };

    struct Ray
    {
        glm::vec3 origin{0.0f};
        glm::vec3 direction{0.0f, 0.0f, -1.0f};
    };

    struct SpatialInputEvent
    {
        InputKind kind = InputKind::IndirectPinch;
        InputPhase phase = InputPhase::Active;
        std::optional<Ray> selection_ray{};
        Handedness chirality = Handedness::None;
    };

    using SpatialEvent = std::variant<
        WorldAnchorEvent,
        PlaneAnchorEvent,
        MeshAnchorEvent,
        HandAnchorEvent,
        EnvironmentLightEvent,
        SpatialInputEvent>;

    // Producers on any thread only ever enqueue.
    class ISpatialEventSink
    {
    public:
        virtual ~ISpatialEventSink() = default;
        virtual void enqueue_event(SpatialEvent event) = 0;
        virtual void enqueue_events(std::vector<SpatialEvent> events) = 0;
    };
}
