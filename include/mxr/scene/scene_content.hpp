#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: scene_content.hpp
    MODULE: scene
    PURPOSE: What the renderer reads from a scene each frame.
*/


#include <optional>
#include <vector>

#include "mxr/scene/entity_graph.hpp"
#include "mxr/scene/light.hpp"

namespace mxr
{
    class ISceneContent
    {
    public:
        virtual ~ISceneContent() = default;

        virtual const EntityGraph& graph() const = 0;
        // Every node reachable from the root, breadth-first.
        virtual std::vector<EntityId> entities() const = 0;
        virtual const std::vector<Light>& lights() const = 0;
        virtual const std::optional<EnvironmentLight>& environment_light() const = 0;
    };
}
