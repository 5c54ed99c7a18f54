#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: resource_desc.hpp
    MODULE: rhi
    PURPOSE: Buffer/image/sampler descriptors and the fatal GPU resource error type.
*/


#include <cstdint>
#include <stdexcept>
#include <string>

namespace mxr
{
    enum class RHIFormat : uint16_t
    {
        Unknown = 0,
        RGBA8_UNorm = 1,
        BGRA8_UNorm = 2,
        BGRA8_sRGB = 3,
        RGBA16F = 4,
        RGBA8_sRGB = 5,
        D32F = 11
    };

    inline bool rhi_format_is_depth(RHIFormat f)
    {
        return f == RHIFormat::D32F;
    }

    inline uint32_t rhi_format_bytes_per_pixel(RHIFormat f)
    {
        switch (f)
        {
            case RHIFormat::RGBA8_UNorm:
            case RHIFormat::BGRA8_UNorm:
            case RHIFormat::BGRA8_sRGB:
            case RHIFormat::RGBA8_sRGB:
            case RHIFormat::D32F:
                return 4;
            case RHIFormat::RGBA16F:
                return 8;
            case RHIFormat::Unknown:
                break;
        }
        return 0;
    }

    enum class RHIMemoryClass : uint8_t
    {
        CPUVisible = 0,
        GPUOnly = 1
    };

    enum RHIBufferUsageBits : uint32_t
    {
        RHIBufferUsage_None = 0,
        RHIBufferUsage_Vertex = 1u << 0u,
        RHIBufferUsage_Index = 1u << 1u,
        RHIBufferUsage_Storage = 1u << 2u
    };

    enum RHIImageUsageBits : uint32_t
    {
        RHIImageUsage_None = 0,
        RHIImageUsage_Sampled = 1u << 0u,
        RHIImageUsage_ColorAttachment = 1u << 1u,
        RHIImageUsage_DepthStencilAttachment = 1u << 2u
    };

    struct RHIBufferDesc
    {
        uint64_t size_bytes = 0;
        uint32_t usage = RHIBufferUsage_None;
        RHIMemoryClass memory = RHIMemoryClass::CPUVisible;
        std::string label{};
    };

    enum class RHIImageType : uint8_t
    {
        Image2D = 0,
        // Six square faces in +X, -X, +Y, -Y, +Z, -Z order; array_length must be 6.
        Cube
    };

    struct RHIImageDesc
    {
        RHIImageType type = RHIImageType::Image2D;
        uint32_t width = 0;
        uint32_t height = 0;
        uint32_t array_length = 1;
        uint32_t sample_count = 1;
        RHIFormat format = RHIFormat::Unknown;
        uint32_t usage = RHIImageUsage_None;
        std::string label{};
    };

    // Tightly packed texel bytes of every layer, layer after layer.
    inline uint64_t rhi_image_byte_size(const RHIImageDesc& d)
    {
        return (uint64_t)d.width * d.height * (d.array_length ? d.array_length : 1u) * rhi_format_bytes_per_pixel(d.format);
    }

    enum class RHIFilter : uint8_t
    {
        Nearest = 0,
        Linear
    };

    enum class RHIAddressMode : uint8_t
    {
        Repeat = 0,
        MirroredRepeat,
        ClampToEdge
    };

    struct RHISamplerDesc
    {
        RHIFilter min_filter = RHIFilter::Linear;
        RHIFilter mag_filter = RHIFilter::Linear;
        RHIFilter mip_filter = RHIFilter::Linear;
        RHIAddressMode address_u = RHIAddressMode::Repeat;
        RHIAddressMode address_v = RHIAddressMode::Repeat;
        RHIAddressMode address_w = RHIAddressMode::Repeat;

        bool operator==(const RHISamplerDesc&) const = default;
    };

    inline RHISamplerDesc rhi_clamped_sampler_desc()
    {
        RHISamplerDesc d{};
        d.address_u = RHIAddressMode::ClampToEdge;
        d.address_v = RHIAddressMode::ClampToEdge;
        d.address_w = RHIAddressMode::ClampToEdge;
        return d;
    }

    enum class ResourceError : uint8_t
    {
        AllocationFailure = 0,
        ImageLoadFailure,
        InvalidImageFormat,
        InvalidState
    };

    inline const char* resource_error_name(ResourceError e)
    {
        switch (e)
        {
            case ResourceError::AllocationFailure: return "allocation failure";
            case ResourceError::ImageLoadFailure: return "image load failure";
            case ResourceError::InvalidImageFormat: return "invalid image format";
            case ResourceError::InvalidState: return "invalid state";
        }
        return "unknown";
    }

    // Thrown when a core GPU resource cannot be created. Not recoverable.
    class GpuResourceError : public std::runtime_error
    {
    public:
        GpuResourceError(ResourceError kind, const std::string& what)
            : std::runtime_error(std::string(resource_error_name(kind)) + ": " + what)
            , kind_(kind)
        {}

        ResourceError kind() const { return kind_; }

    private:
        ResourceError kind_;
    };
}
