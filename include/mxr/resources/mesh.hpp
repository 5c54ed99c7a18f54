#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: mesh.hpp
    MODULE: resources
    PURPOSE: GPU mesh: vertex buffers described by a VertexLayout, bounds, submeshes
            (index range + material index) and the material list shared by its submeshes.
*/


#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "mxr/math/bounding_box.hpp"
#include "mxr/resources/material.hpp"
#include "mxr/rhi/gpu_device.hpp"
#include "mxr/rhi/vertex_layout.hpp"

namespace mxr
{
    struct BufferView
    {
        std::shared_ptr<IGpuBuffer> buffer{};
        uint64_t offset = 0;
    };

    struct Submesh
    {
        RHIPrimitiveType primitive = RHIPrimitiveType::Triangle;
        std::optional<BufferView> index_buffer{};
        RHIIndexType index_type = RHIIndexType::UInt32;
        uint32_t index_count = 0;
        uint32_t material_index = 0;
    };

    // Interleaved element of skinned_vertex_layout().
    struct SkinnedVertex
    {
        glm::vec3 position{0.0f};
        glm::vec3 normal{0.0f, 1.0f, 0.0f};
        glm::vec2 uv{0.0f};
        glm::vec4 joint_weights{1.0f, 0.0f, 0.0f, 0.0f};
        uint16_t joint_indices[4]{0, 0, 0, 0};
    };
    static_assert(sizeof(SkinnedVertex) == 56, "skinned layout stride is 56");

    class Mesh
    {
    public:
        // Bounds are computed from host-visible positions when not supplied.
        Mesh(
            VertexLayout layout,
            std::vector<BufferView> vertex_buffers,
            uint32_t vertex_count,
            std::vector<Submesh> submeshes,
            std::vector<std::shared_ptr<Material>> materials = {},
            std::optional<BoundingBox> bounds = std::nullopt);

        const VertexLayout& layout() const { return layout_; }
        const std::vector<BufferView>& vertex_buffers() const { return vertex_buffers_; }
        uint32_t vertex_count() const { return vertex_count_; }
        const std::vector<Submesh>& submeshes() const { return submeshes_; }
        const BoundingBox& bounds() const { return bounds_; }

        // Material used by a submesh; indices wrap around the material list.
        const Material* material_for(const Submesh& submesh) const;

        // Host copies of the position stream and triangle indices. Both come back empty
        // when the data lives in GPU-only memory.
        std::vector<glm::vec3> packed_positions() const;
        std::vector<uint32_t> packed_indices() const;

        // Same submeshes/materials/bounds, with a GPU-only post-skinning vertex buffer
        // that the skinning pre-pass writes into.
        std::shared_ptr<Mesh> copy_for_skinning(IGpuDevice& device) const;

        static std::shared_ptr<Mesh> generate_sphere(IGpuDevice& device, float radius, uint32_t segments = 24);
        static std::shared_ptr<Mesh> generate_box(IGpuDevice& device, const glm::vec3& extents);
        static std::shared_ptr<Mesh> from_indexed_triangles(
            IGpuDevice& device,
            const std::vector<glm::vec3>& positions,
            const std::vector<uint32_t>& indices,
            const std::string& label);
        // Caller-provided normals/uvs; sizes must match positions.
        static std::shared_ptr<Mesh> from_vertex_data(
            IGpuDevice& device,
            const std::vector<glm::vec3>& positions,
            const std::vector<glm::vec3>& normals,
            const std::vector<glm::vec2>& uvs,
            const std::vector<uint32_t>& indices,
            const std::string& label);
        // Host-visible base mesh for the skinning pre-pass.
        static std::shared_ptr<Mesh> from_skinned_vertices(
            IGpuDevice& device,
            const std::vector<SkinnedVertex>& vertices,
            const std::vector<uint32_t>& indices,
            const std::string& label);

        std::string name{};
        std::vector<std::shared_ptr<Material>> materials{};

    private:
        VertexLayout layout_{};
        std::vector<BufferView> vertex_buffers_{};
        uint32_t vertex_count_ = 0;
        std::vector<Submesh> submeshes_{};
        BoundingBox bounds_{};
    };
}
