#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: texture.hpp
    MODULE: resources
    PURPOSE: CPU-side RGBA8 texel data (2D and cube), its upload to sampled GPU images,
            and the image + sampler pair a material slot refers to.
*/


#include <array>
#include <cmath>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/type_precision.hpp>

#include "mxr/rhi/gpu_device.hpp"

namespace mxr
{
    struct TextureData
    {
        std::string source_path{};
        int w = 0;
        int h = 0;
        std::vector<glm::u8vec4> texels{};

        TextureData() = default;
        TextureData(int W, int H, glm::u8vec4 clear = {0, 0, 0, 255})
            : w(W), h(H), texels((size_t)W * (size_t)H, clear)
        {}

        bool valid() const
        {
            return w > 0 && h > 0 && texels.size() == (size_t)w * (size_t)h;
        }

        glm::u8vec4& at(int x, int y)
        {
            return texels[(size_t)y * (size_t)w + (size_t)x];
        }

        const glm::u8vec4& at(int x, int y) const
        {
            return texels[(size_t)y * (size_t)w + (size_t)x];
        }
    };

    struct CubemapData
    {
        // 0:+X, 1:-X, 2:+Y, 3:-Y, 4:+Z, 5:-Z
        std::array<TextureData, 6> face{};

        // Faces must be square and share one size.
        bool valid() const
        {
            for (const TextureData& f : face)
            {
                if (!f.valid() || f.w != f.h || f.w != face[0].w) return false;
            }
            return true;
        }
    };

    // Color content (base color, emissive) is stored sRGB; everything else is linear data.
    enum class TextureContent : uint8_t
    {
        Color = 0,
        Data
    };

    struct TextureResource
    {
        std::shared_ptr<IGpuImage> image{};
        // Null falls back to the renderer's linear/repeat sampler.
        std::shared_ptr<ISamplerState> sampler{};

        explicit operator bool() const { return image != nullptr; }
    };

    inline std::shared_ptr<IGpuImage> upload_texture(
        IGpuDevice& device,
        const TextureData& data,
        TextureContent content,
        const std::string& label)
    {
        if (!data.valid())
        {
            throw GpuResourceError(ResourceError::InvalidImageFormat, "texture '" + label + "' has no texels");
        }
        RHIImageDesc desc{};
        desc.type = RHIImageType::Image2D;
        desc.width = (uint32_t)data.w;
        desc.height = (uint32_t)data.h;
        desc.format = content == TextureContent::Color ? RHIFormat::RGBA8_sRGB : RHIFormat::RGBA8_UNorm;
        desc.usage = RHIImageUsage_Sampled;
        desc.label = label;
        return device.create_image(desc, data.texels.data());
    }

    inline std::shared_ptr<IGpuImage> upload_cubemap(IGpuDevice& device, const CubemapData& data, const std::string& label)
    {
        if (!data.valid())
        {
            throw GpuResourceError(ResourceError::InvalidImageFormat, "cube map '" + label + "' needs six square faces of one size");
        }
        const size_t face_texels = data.face[0].texels.size();
        std::vector<glm::u8vec4> packed{};
        packed.reserve(face_texels * 6u);
        for (const TextureData& f : data.face)
        {
            packed.insert(packed.end(), f.texels.begin(), f.texels.end());
        }

        RHIImageDesc desc{};
        desc.type = RHIImageType::Cube;
        desc.width = (uint32_t)data.face[0].w;
        desc.height = (uint32_t)data.face[0].h;
        desc.array_length = 6;
        desc.format = RHIFormat::RGBA8_sRGB;
        desc.usage = RHIImageUsage_Sampled;
        desc.label = label;
        return device.create_image(desc, packed.data());
    }

    // World direction through texel (x, y) of a cube face, following the Vulkan face orientation.
    inline glm::vec3 cube_face_direction(int face, int x, int y, int size)
    {
        const float s = 2.0f * ((float)x + 0.5f) / (float)size - 1.0f;
        const float t = 2.0f * ((float)y + 0.5f) / (float)size - 1.0f;
        switch (face)
        {
            case 0: return glm::normalize(glm::vec3(1.0f, -t, -s));
            case 1: return glm::normalize(glm::vec3(-1.0f, -t, s));
            case 2: return glm::normalize(glm::vec3(s, 1.0f, t));
            case 3: return glm::normalize(glm::vec3(s, -1.0f, -t));
            case 4: return glm::normalize(glm::vec3(s, -t, 1.0f));
            default: return glm::normalize(glm::vec3(-s, -t, -1.0f));
        }
    }

    // Sky-style environment: horizon color blending up to the zenith and down to the nadir.
    inline CubemapData make_gradient_cubemap(int size, glm::u8vec4 zenith, glm::u8vec4 horizon, glm::u8vec4 nadir)
    {
        CubemapData cm{};
        const glm::vec4 z(zenith), hz(horizon), nd(nadir);
        for (int f = 0; f < 6; ++f)
        {
            TextureData face(size, size);
            for (int y = 0; y < size; ++y)
            {
                for (int x = 0; x < size; ++x)
                {
                    const float up = cube_face_direction(f, x, y, size).y;
                    const glm::vec4 c = up >= 0.0f ? glm::mix(hz, z, up) : glm::mix(hz, nd, -up);
                    face.at(x, y) = glm::u8vec4(glm::clamp(glm::round(c), glm::vec4(0.0f), glm::vec4(255.0f)));
                }
            }
            cm.face[(size_t)f] = std::move(face);
        }
        return cm;
    }
}
