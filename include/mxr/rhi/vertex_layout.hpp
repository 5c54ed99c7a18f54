#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: vertex_layout.hpp
    MODULE: rhi
    PURPOSE: Vertex attribute/buffer layout descriptor. Half of the pipeline cache key,
            so it is hashable and compared by value.
*/


#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace mxr
{
    enum class VertexFormat : uint8_t
    {
        Float2 = 0,
        Float3,
        Float4,
        UShort4
    };

    inline uint32_t vertex_format_size(VertexFormat f)
    {
        switch (f)
        {
            case VertexFormat::Float2: return 8;
            case VertexFormat::Float3: return 12;
            case VertexFormat::Float4: return 16;
            case VertexFormat::UShort4: return 8;
        }
        return 0;
    }

    enum class VertexSemantic : uint8_t
    {
        Position = 0,
        Normal,
        TexCoord,
        JointWeights,
        JointIndices
    };

    struct VertexAttribute
    {
        VertexSemantic semantic = VertexSemantic::Position;
        VertexFormat format = VertexFormat::Float3;
        uint32_t offset = 0;
        uint32_t buffer_index = 0;

        bool operator==(const VertexAttribute&) const = default;
    };

    struct VertexBufferLayout
    {
        uint32_t stride = 0;

        bool operator==(const VertexBufferLayout&) const = default;
    };

    struct VertexLayout
    {
        std::vector<VertexAttribute> attributes{};
        std::vector<VertexBufferLayout> buffers{};

        bool operator==(const VertexLayout&) const = default;

        std::optional<VertexAttribute> attribute(VertexSemantic semantic) const
        {
            for (const VertexAttribute& a : attributes)
            {
                if (a.semantic == semantic) return a;
            }
            return std::nullopt;
        }

        uint32_t stride(uint32_t buffer_index) const
        {
            return buffer_index < buffers.size() ? buffers[buffer_index].stride : 0u;
        }

        size_t hash() const
        {
            size_t h = 1469598103934665603ull;
            auto mix = [&h](size_t v) {
                h ^= v + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
            };
            for (const VertexAttribute& a : attributes)
            {
                mix((size_t)a.semantic);
                mix((size_t)a.format);
                mix(a.offset);
                mix(a.buffer_index);
            }
            for (const VertexBufferLayout& b : buffers)
            {
                mix(b.stride);
            }
            return h;
        }
    };

    // Positions in buffer 0 (float4 stride), normal + texcoord in buffer 1.
    inline VertexLayout default_vertex_layout()
    {
        VertexLayout l{};
        l.attributes = {
            {VertexSemantic::Position, VertexFormat::Float3, 0, 0},
            {VertexSemantic::Normal, VertexFormat::Float3, 0, 1},
            {VertexSemantic::TexCoord, VertexFormat::Float2, 16, 1},
        };
        l.buffers = {{16}, {24}};
        return l;
    }

    // Single interleaved buffer carrying up to four joint influences per vertex.
    inline VertexLayout skinned_vertex_layout()
    {
        VertexLayout l{};
        l.attributes = {
            {VertexSemantic::Position, VertexFormat::Float3, 0, 0},
            {VertexSemantic::Normal, VertexFormat::Float3, 12, 0},
            {VertexSemantic::TexCoord, VertexFormat::Float2, 24, 0},
            {VertexSemantic::JointWeights, VertexFormat::Float4, 32, 0},
            {VertexSemantic::JointIndices, VertexFormat::UShort4, 48, 0},
        };
        l.buffers = {{56}};
        return l;
    }

    // Output of the skinning pre-pass, consumed by the main pass.
    inline VertexLayout post_skinning_vertex_layout()
    {
        VertexLayout l{};
        l.attributes = {
            {VertexSemantic::Position, VertexFormat::Float3, 0, 0},
            {VertexSemantic::Normal, VertexFormat::Float3, 12, 0},
            {VertexSemantic::TexCoord, VertexFormat::Float2, 24, 0},
        };
        l.buffers = {{32}};
        return l;
    }
}

template<>
struct std::hash<mxr::VertexLayout>
{
    size_t operator()(const mxr::VertexLayout& l) const noexcept { return l.hash(); }
};
