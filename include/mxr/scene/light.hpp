#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: light.hpp
    MODULE: scene
    PURPOSE: Punctual lights and the environment (image-based) light estimate.
*/


#include <cmath>
#include <cstdint>
#include <memory>

#include <glm/glm.hpp>

#include "mxr/core/units.hpp"
#include "mxr/math/transform.hpp"
#include "mxr/render/shader_types.hpp"
#include "mxr/rhi/gpu_device.hpp"

namespace mxr
{
    enum class LightType : uint8_t
    {
        Directional = 0,
        Point,
        Spot
    };

    struct Light
    {
        LightType type = LightType::Directional;
        glm::vec3 color{1.0f};
        float intensity = 1.0f;
        // 0 means unbounded.
        float range = 0.0f;
        float inner_cone_angle = units::radians_from_degrees(90.0f);
        float outer_cone_angle = units::radians_from_degrees(90.0f);
        bool cast_shadows = false;
        Transform transform{};

        Light() = default;
        Light(LightType t, const glm::vec3& c, float i)
            : type(t)
            , color(c)
            , intensity(i)
        {}

        // Lights shine down their local -Z axis.
        glm::vec3 direction() const
        {
            return -glm::normalize(glm::vec3(transform.matrix()[2]));
        }

        PbrLight to_shader() const
        {
            PbrLight out{};
            out.direction = direction();
            out.range = range;
            out.position = transform.position;
            out.intensity = intensity;
            out.color = color;
            out.inner_cone_cos = std::cos(inner_cone_angle);
            out.outer_cone_cos = std::cos(outer_cone_angle);
            switch (type)
            {
                case LightType::Directional: out.type = kLightTypeDirectional; break;
                case LightType::Point: out.type = kLightTypePoint; break;
                case LightType::Spot: out.type = kLightTypeSpot; break;
            }
            return out;
        }
    };

    struct EnvironmentLight
    {
        glm::mat4 cube_from_world{1.0f};
        // Sampled cube image (six layers) supplied by the sensing collaborator.
        std::shared_ptr<IGpuImage> texture{};
        float scale_factor = 1.0f;
    };
}
