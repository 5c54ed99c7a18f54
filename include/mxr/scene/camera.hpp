#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: camera.hpp
    MODULE: scene
    PURPOSE: Camera models producing reversed-Z projections (near -> 1, far -> 0).
*/


#include <glm/glm.hpp>

#include "mxr/core/units.hpp"
#include "mxr/math/projection.hpp"
#include "mxr/math/transform.hpp"

namespace mxr
{
    struct PerspectiveCamera
    {
        float fov_y = units::radians_from_degrees(60.0f);
        float near_z = 0.005f;

        glm::mat4 projection(float aspect) const
        {
            return perspective_infinite_reverse_z(fov_y, aspect, near_z);
        }
    };

    struct OrthographicCamera
    {
        float near_z = 0.0f;
        float far_z = 1.0f;
        float left = 0.0f;
        float top = 0.0f;
        float right = 1.0f;
        float bottom = 1.0f;

        glm::mat4 projection() const
        {
            return orthographic_reverse_z(left, right, bottom, top, near_z, far_z);
        }

        // Pixel-space camera: origin top-left, y down.
        static OrthographicCamera pixel_space(float width, float height)
        {
            OrthographicCamera c{};
            c.right = width;
            c.bottom = height;
            return c;
        }
    };

    // View matrix for a camera placed by `camera_world`.
    inline glm::mat4 view_matrix_from(const Transform& camera_world)
    {
        return glm::inverse(camera_world.matrix());
    }
}
