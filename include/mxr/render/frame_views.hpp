#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: frame_views.hpp
    MODULE: render
    PURPOSE: Per-frame data supplied by the compositor: view/projection/viewport per view
            and the output color/depth targets (array-sliced for layered output).
*/


#include <cstdint>
#include <memory>
#include <vector>

#include <glm/glm.hpp>

#include "mxr/rhi/gpu_device.hpp"

namespace mxr
{
    struct FrameViews
    {
        std::vector<glm::mat4> view_matrices{};
        std::vector<glm::mat4> projection_matrices{};
        std::vector<RHIViewport> viewports{};
        std::vector<glm::vec3> camera_positions{};

        uint32_t view_count() const { return (uint32_t)viewports.size(); }
    };

    struct FrameTargets
    {
        // One entry per pass: per view for the dedicated layout, a single entry otherwise.
        std::vector<std::shared_ptr<IGpuImage>> color_textures{};
        std::vector<std::shared_ptr<IGpuImage>> depth_textures{};
        // Optional foveation maps, one per pass when present.
        std::vector<const void*> rasterization_rate_maps{};
        bool store_depth = false;
    };
}
