#include "mxr/resources/mesh.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

#include <glm/gtc/constants.hpp>

namespace mxr
{
    namespace
    {
        // Buffer 1 of the default layout.
        struct SurfaceAttributes
        {
            glm::vec3 normal{0.0f, 1.0f, 0.0f};
            float pad0 = 0.0f;
            glm::vec2 uv{0.0f};
        };
        static_assert(sizeof(SurfaceAttributes) == 24, "default layout buffer 1 stride is 24");

        constexpr uint32_t kPostSkinningStride = 32;

        std::shared_ptr<IGpuBuffer> create_host_buffer(
            IGpuDevice& device,
            const void* data,
            uint64_t size,
            uint32_t usage,
            const std::string& label)
        {
            RHIBufferDesc desc{};
            desc.size_bytes = size;
            desc.usage = usage;
            desc.memory = RHIMemoryClass::CPUVisible;
            desc.label = label;
            auto buffer = device.create_buffer(desc, data);
            if (!buffer)
            {
                throw GpuResourceError(ResourceError::AllocationFailure, "mesh buffer '" + label + "'");
            }
            return buffer;
        }

        std::shared_ptr<Mesh> build_default_mesh(
            IGpuDevice& device,
            const std::vector<glm::vec3>& positions,
            const std::vector<SurfaceAttributes>& surface,
            const std::vector<uint32_t>& indices,
            const std::string& label)
        {
            std::vector<glm::vec4> packed(positions.size());
            BoundingBox bounds{};
            for (size_t i = 0; i < positions.size(); ++i)
            {
                packed[i] = glm::vec4(positions[i], 1.0f);
                bounds.expand(positions[i]);
            }

            // Zero-sized buffers are not allowed; keep at least one element of storage.
            const uint64_t position_bytes = std::max<uint64_t>(16, packed.size() * sizeof(glm::vec4));
            const uint64_t surface_bytes = std::max<uint64_t>(24, surface.size() * sizeof(SurfaceAttributes));
            const uint64_t index_bytes = std::max<uint64_t>(4, indices.size() * sizeof(uint32_t));

            std::vector<BufferView> vertex_buffers{
                {create_host_buffer(device, packed.empty() ? nullptr : packed.data(), position_bytes, RHIBufferUsage_Vertex, label + " Positions"), 0},
                {create_host_buffer(device, surface.empty() ? nullptr : surface.data(), surface_bytes, RHIBufferUsage_Vertex, label + " Attributes"), 0},
            };

            Submesh submesh{};
            submesh.primitive = RHIPrimitiveType::Triangle;
            submesh.index_buffer = BufferView{
                create_host_buffer(device, indices.empty() ? nullptr : indices.data(), index_bytes, RHIBufferUsage_Index, label + " Indices"), 0};
            submesh.index_type = RHIIndexType::UInt32;
            submesh.index_count = (uint32_t)indices.size();
            submesh.material_index = 0;

            auto mesh = std::make_shared<Mesh>(
                default_vertex_layout(),
                std::move(vertex_buffers),
                (uint32_t)positions.size(),
                std::vector<Submesh>{submesh},
                std::vector<std::shared_ptr<Material>>{Material::make_default_pbr()},
                bounds);
            mesh->name = label;
            return mesh;
        }
    }

    Mesh::Mesh(
        VertexLayout layout,
        std::vector<BufferView> vertex_buffers,
        uint32_t vertex_count,
        std::vector<Submesh> submeshes,
        std::vector<std::shared_ptr<Material>> materials,
        std::optional<BoundingBox> bounds)
        : materials(std::move(materials))
        , layout_(std::move(layout))
        , vertex_buffers_(std::move(vertex_buffers))
        , vertex_count_(vertex_count)
        , submeshes_(std::move(submeshes))
    {
        if (bounds)
        {
            bounds_ = *bounds;
        }
        else
        {
            for (const glm::vec3& p : packed_positions())
            {
                bounds_.expand(p);
            }
        }
    }

    const Material* Mesh::material_for(const Submesh& submesh) const
    {
        if (materials.empty()) return nullptr;
        return materials[submesh.material_index % materials.size()].get();
    }

    std::vector<glm::vec3> Mesh::packed_positions() const
    {
        std::vector<glm::vec3> out{};
        const auto attr = layout_.attribute(VertexSemantic::Position);
        if (!attr || attr->format != VertexFormat::Float3) return out;
        if (attr->buffer_index >= vertex_buffers_.size()) return out;

        const BufferView& view = vertex_buffers_[attr->buffer_index];
        if (!view.buffer || !view.buffer->contents()) return out;

        const uint32_t stride = layout_.stride(attr->buffer_index);
        const uint64_t last = view.offset + (uint64_t)stride * (vertex_count_ > 0 ? vertex_count_ - 1 : 0) + attr->offset + 12;
        if (vertex_count_ == 0 || last > view.buffer->size()) return out;

        const auto* bytes = static_cast<const uint8_t*>(view.buffer->contents()) + view.offset;
        out.resize(vertex_count_);
        for (uint32_t i = 0; i < vertex_count_; ++i)
        {
            std::memcpy(&out[i], bytes + (uint64_t)i * stride + attr->offset, sizeof(glm::vec3));
        }
        return out;
    }

    std::vector<uint32_t> Mesh::packed_indices() const
    {
        std::vector<uint32_t> out{};
        for (const Submesh& submesh : submeshes_)
        {
            if (submesh.primitive != RHIPrimitiveType::Triangle) continue;

            if (!submesh.index_buffer)
            {
                for (uint32_t i = 0; i + 2 < vertex_count_; i += 3)
                {
                    out.push_back(i);
                    out.push_back(i + 1);
                    out.push_back(i + 2);
                }
                continue;
            }

            const BufferView& view = *submesh.index_buffer;
            if (!view.buffer || !view.buffer->contents()) return {};
            const uint32_t index_size = rhi_index_size(submesh.index_type);
            if (view.offset + (uint64_t)submesh.index_count * index_size > view.buffer->size()) return {};

            const auto* bytes = static_cast<const uint8_t*>(view.buffer->contents()) + view.offset;
            for (uint32_t i = 0; i < submesh.index_count; ++i)
            {
                if (submesh.index_type == RHIIndexType::UInt16)
                {
                    uint16_t v = 0;
                    std::memcpy(&v, bytes + (uint64_t)i * 2, 2);
                    out.push_back(v);
                }
                else
                {
                    uint32_t v = 0;
                    std::memcpy(&v, bytes + (uint64_t)i * 4, 4);
                    out.push_back(v);
                }
            }
        }
        out.resize(out.size() - out.size() % 3);
        return out;
    }

    std::shared_ptr<Mesh> Mesh::copy_for_skinning(IGpuDevice& device) const
    {
        RHIBufferDesc desc{};
        desc.size_bytes = std::max<uint64_t>(kPostSkinningStride, (uint64_t)kPostSkinningStride * vertex_count_);
        desc.usage = RHIBufferUsage_Vertex | RHIBufferUsage_Storage;
        desc.memory = RHIMemoryClass::GPUOnly;
        desc.label = "Post-Skinning Vertex Attributes";
        auto buffer = device.create_buffer(desc);
        if (!buffer)
        {
            throw GpuResourceError(ResourceError::AllocationFailure, desc.label);
        }

        auto copy = std::make_shared<Mesh>(
            post_skinning_vertex_layout(),
            std::vector<BufferView>{{buffer, 0}},
            vertex_count_,
            submeshes_,
            materials,
            bounds_);
        copy->name = name;
        return copy;
    }

    std::shared_ptr<Mesh> Mesh::generate_sphere(IGpuDevice& device, float radius, uint32_t segments)
    {
        const uint32_t s = std::max(3u, segments);
        std::vector<glm::vec3> positions{};
        std::vector<SurfaceAttributes> surface{};
        std::vector<uint32_t> indices{};
        positions.reserve((s + 1) * (s + 1));
        surface.reserve((s + 1) * (s + 1));

        for (uint32_t i = 0; i <= s; ++i)
        {
            const float theta = glm::pi<float>() * (float)i / (float)s;
            for (uint32_t j = 0; j <= s; ++j)
            {
                const float phi = glm::two_pi<float>() * (float)j / (float)s;
                const glm::vec3 n(std::sin(theta) * std::sin(phi), std::cos(theta), std::sin(theta) * std::cos(phi));
                positions.push_back(n * radius);
                SurfaceAttributes a{};
                a.normal = n;
                a.uv = glm::vec2((float)j / (float)s, (float)i / (float)s);
                surface.push_back(a);
            }
        }

        const uint32_t row = s + 1;
        for (uint32_t i = 0; i < s; ++i)
        {
            for (uint32_t j = 0; j < s; ++j)
            {
                const uint32_t a = i * row + j;
                const uint32_t b = (i + 1) * row + j;
                const uint32_t c = (i + 1) * row + j + 1;
                const uint32_t d = i * row + j + 1;
                indices.insert(indices.end(), {a, b, c, a, c, d});
            }
        }

        return build_default_mesh(device, positions, surface, indices, "Sphere");
    }

    std::shared_ptr<Mesh> Mesh::generate_box(IGpuDevice& device, const glm::vec3& extents)
    {
        struct Face
        {
            glm::vec3 n;
            glm::vec3 u;
            glm::vec3 v;
        };
        // u x v == n so corners wind counter-clockwise seen from outside.
        const Face faces[6] = {
            {{ 1, 0, 0}, { 0, 0, -1}, {0, 1,  0}},
            {{-1, 0, 0}, { 0, 0,  1}, {0, 1,  0}},
            {{ 0, 1, 0}, { 1, 0,  0}, {0, 0, -1}},
            {{ 0,-1, 0}, { 1, 0,  0}, {0, 0,  1}},
            {{ 0, 0, 1}, { 1, 0,  0}, {0, 1,  0}},
            {{ 0, 0,-1}, {-1, 0,  0}, {0, 1,  0}},
        };
        const glm::vec3 h = extents * 0.5f;
        const glm::vec2 corners[4] = {{-1, -1}, {1, -1}, {1, 1}, {-1, 1}};

        std::vector<glm::vec3> positions{};
        std::vector<SurfaceAttributes> surface{};
        std::vector<uint32_t> indices{};
        for (const Face& f : faces)
        {
            const uint32_t base = (uint32_t)positions.size();
            for (const glm::vec2& c : corners)
            {
                positions.push_back((f.n + f.u * c.x + f.v * c.y) * h);
                SurfaceAttributes a{};
                a.normal = f.n;
                a.uv = glm::vec2(c.x * 0.5f + 0.5f, 0.5f - c.y * 0.5f);
                surface.push_back(a);
            }
            indices.insert(indices.end(), {base, base + 1, base + 2, base, base + 2, base + 3});
        }

        return build_default_mesh(device, positions, surface, indices, "Box");
    }

    std::shared_ptr<Mesh> Mesh::from_indexed_triangles(
        IGpuDevice& device,
        const std::vector<glm::vec3>& positions,
        const std::vector<uint32_t>& indices,
        const std::string& label)
    {
        std::vector<glm::vec3> normals(positions.size(), glm::vec3(0.0f));
        for (size_t t = 0; t + 2 < indices.size(); t += 3)
        {
            const uint32_t i0 = indices[t];
            const uint32_t i1 = indices[t + 1];
            const uint32_t i2 = indices[t + 2];
            if (i0 >= positions.size() || i1 >= positions.size() || i2 >= positions.size()) continue;
            const glm::vec3 n = glm::cross(positions[i1] - positions[i0], positions[i2] - positions[i0]);
            normals[i0] += n;
            normals[i1] += n;
            normals[i2] += n;
        }
        for (glm::vec3& n : normals)
        {
            const float len = glm::length(n);
            n = len > 1e-12f ? n / len : glm::vec3(0.0f, 1.0f, 0.0f);
        }
        return from_vertex_data(device, positions, normals, {}, indices, label);
    }

    std::shared_ptr<Mesh> Mesh::from_vertex_data(
        IGpuDevice& device,
        const std::vector<glm::vec3>& positions,
        const std::vector<glm::vec3>& normals,
        const std::vector<glm::vec2>& uvs,
        const std::vector<uint32_t>& indices,
        const std::string& label)
    {
        std::vector<SurfaceAttributes> surface(positions.size());
        for (size_t i = 0; i < positions.size(); ++i)
        {
            if (i < normals.size()) surface[i].normal = normals[i];
            if (i < uvs.size()) surface[i].uv = uvs[i];
        }
        return build_default_mesh(device, positions, surface, indices, label);
    }

    std::shared_ptr<Mesh> Mesh::from_skinned_vertices(
        IGpuDevice& device,
        const std::vector<SkinnedVertex>& vertices,
        const std::vector<uint32_t>& indices,
        const std::string& label)
    {
        BoundingBox bounds{};
        for (const SkinnedVertex& v : vertices)
        {
            bounds.expand(v.position);
        }

        const uint64_t vertex_bytes = std::max<uint64_t>(sizeof(SkinnedVertex), vertices.size() * sizeof(SkinnedVertex));
        const uint64_t index_bytes = std::max<uint64_t>(4, indices.size() * sizeof(uint32_t));

        std::vector<BufferView> vertex_buffers{
            {create_host_buffer(device, vertices.empty() ? nullptr : vertices.data(), vertex_bytes, RHIBufferUsage_Vertex, label + " Skinned Vertices"), 0},
        };

        Submesh submesh{};
        submesh.primitive = RHIPrimitiveType::Triangle;
        submesh.index_buffer = BufferView{
            create_host_buffer(device, indices.empty() ? nullptr : indices.data(), index_bytes, RHIBufferUsage_Index, label + " Indices"), 0};
        submesh.index_type = RHIIndexType::UInt32;
        submesh.index_count = (uint32_t)indices.size();

        auto mesh = std::make_shared<Mesh>(
            skinned_vertex_layout(),
            std::move(vertex_buffers),
            (uint32_t)vertices.size(),
            std::vector<Submesh>{submesh},
            std::vector<std::shared_ptr<Material>>{Material::make_default_pbr()},
            bounds);
        mesh->name = label;
        return mesh;
    }
}
