#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: model_loader_assimp.hpp
    MODULE: resources
    PURPOSE: Imports a model file through Assimp into a detached entity subtree: node hierarchy,
            meshes with PBR materials (factors plus file or embedded textures decoded through
            SDL2_image), and skeleton/skinner bindings for rigged meshes.
*/


#include <string>

#include "mxr/core/result.hpp"
#include "mxr/rhi/gpu_device.hpp"
#include "mxr/scene/entity_graph.hpp"

namespace mxr
{
    struct ModelLoadOptions
    {
        bool triangulate = true;
        bool generate_normals = true;
        bool join_identical_vertices = true;
        bool flip_uvs = false;
        bool limit_bone_weights = true;
    };

    unsigned int to_assimp_flags(const ModelLoadOptions& opt);

    // Root of the new subtree; nothing is attached to the graph root.
    Result<EntityId> load_model_assimp(
        IGpuDevice& device,
        EntityGraph& graph,
        const std::string& path,
        const ModelLoadOptions& opt = {});
}
