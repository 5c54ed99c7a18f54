#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: spatial_session.hpp
    MODULE: scene
    PURPOSE: Sensing collaborator contract. The session pushes anchor events into a sink
            from its own threads and answers world-anchor and hand queries.
*/


#include <vector>

#include <glm/glm.hpp>

#include "mxr/core/result.hpp"
#include "mxr/scene/anchor.hpp"
#include "mxr/scene/spatial_event.hpp"

namespace mxr
{
    class ISpatialSession
    {
    public:
        virtual ~ISpatialSession() = default;

        // Begins sensing; anchor events are delivered to `sink` until stop().
        virtual Result<bool> start(ISpatialEventSink& sink) = 0;
        virtual void stop() = 0;

        virtual Result<AnchorId> add_world_anchor(const glm::mat4& origin_from_anchor) = 0;
        virtual void remove_all_world_anchors() = 0;

        // Hand poses predicted for the given presentation time.
        virtual std::vector<HandAnchor> hand_anchors(double predicted_time) = 0;
    };
}
