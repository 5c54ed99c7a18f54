#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: pipeline_desc.hpp
    MODULE: rhi
    PURPOSE: Render pipeline and depth state descriptors.
*/


#include <cstdint>
#include <string>

#include "mxr/rhi/resource_desc.hpp"
#include "mxr/rhi/vertex_layout.hpp"

namespace mxr
{
    enum class RHIShaderProgram : uint8_t
    {
        None = 0,
        VertexMain,
        VertexSkin,
        FragmentPbr,
        FragmentOcclusion
    };

    inline const char* shader_program_name(RHIShaderProgram p)
    {
        switch (p)
        {
            case RHIShaderProgram::None: return "none";
            case RHIShaderProgram::VertexMain: return "vertex_main";
            case RHIShaderProgram::VertexSkin: return "vertex_skin";
            case RHIShaderProgram::FragmentPbr: return "fragment_pbr";
            case RHIShaderProgram::FragmentOcclusion: return "fragment_occlusion";
        }
        return "unknown";
    }

    enum class RHIBlendMode : uint8_t
    {
        Opaque = 0,
        SourceOverPremultiplied
    };

    enum RHIColorWriteBits : uint8_t
    {
        RHIColorWrite_None = 0,
        RHIColorWrite_R = 1u << 0u,
        RHIColorWrite_G = 1u << 1u,
        RHIColorWrite_B = 1u << 2u,
        RHIColorWrite_A = 1u << 3u,
        RHIColorWrite_All = 0x0f
    };

    enum class RHICompareOp : uint8_t
    {
        Always = 0,
        Greater,
        GreaterEqual,
        Less,
        Never
    };

    enum class RHICullMode : uint8_t
    {
        None = 0,
        Back = 1,
        Front = 2
    };

    enum class RHIFrontFace : uint8_t
    {
        CCW = 0,
        CW = 1
    };

    enum class RHIPrimitiveType : uint8_t
    {
        Point = 0,
        Triangle,
        TriangleStrip
    };

    enum class RHIIndexType : uint8_t
    {
        UInt16 = 0,
        UInt32
    };

    inline uint32_t rhi_index_size(RHIIndexType t)
    {
        return t == RHIIndexType::UInt16 ? 2u : 4u;
    }

    // Writes into a view-selecting output (viewport index or layer) when amplified.
    enum class RHIViewSelect : uint8_t
    {
        None = 0,
        ViewportIndex,
        Layer
    };

    struct RHIRenderPipelineDesc
    {
        VertexLayout vertex_layout{};
        RHIShaderProgram vertex_program = RHIShaderProgram::VertexMain;
        RHIShaderProgram fragment_program = RHIShaderProgram::FragmentPbr;
        RHIFormat color_format = RHIFormat::BGRA8_sRGB;
        RHIFormat depth_format = RHIFormat::D32F;
        uint32_t sample_count = 1;
        uint32_t amplification_count = 1;
        RHIViewSelect view_select = RHIViewSelect::None;
        bool rasterization_enabled = true;
        uint8_t color_write_mask = RHIColorWrite_All;
        RHIBlendMode blend = RHIBlendMode::Opaque;
        std::string label{};
    };

    struct RHIDepthStencilDesc
    {
        bool depth_write = true;
        RHICompareOp depth_compare = RHICompareOp::Greater;
    };
}
