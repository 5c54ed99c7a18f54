#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: context.hpp
    MODULE: core
    PURPOSE: Explicitly constructed engine context handed to the renderer, physics bridge,
            scene and asset loaders at startup. Holds no ownership of the GPU device.
*/


#include <cstdint>

#include "mxr/core/config.hpp"
#include "mxr/rhi/gpu_device.hpp"

namespace mxr
{
    // Per-frame counters filled by the renderer.
    struct RenderDebugStats
    {
        uint64_t passes = 0;
        uint64_t draw_calls = 0;
        uint64_t skinning_draws = 0;
        uint64_t pipelines_compiled = 0;
        uint64_t depth_states_created = 0;

        void reset_frame()
        {
            passes = 0;
            draw_calls = 0;
            skinning_draws = 0;
        }
    };

    struct Context
    {
        IGpuDevice* device = nullptr;
        EngineConfig config{};
        uint64_t frame_index = 0;
        RenderDebugStats debug{};

        Context() = default;
        Context(IGpuDevice& gpu, EngineConfig cfg)
            : device(&gpu)
            , config(cfg)
        {}

        bool has_device() const
        {
            return device != nullptr;
        }

        IGpuDevice& gpu() const
        {
            return *device;
        }
    };
}
