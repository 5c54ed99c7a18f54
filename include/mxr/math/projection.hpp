#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: projection.hpp
    MODULE: math
    PURPOSE: Reversed-Z projections (near -> 1, far -> 0) for the "greater" depth test.
*/


#include <cmath>

#include <glm/glm.hpp>

namespace mxr
{
    // Infinite far plane; clip w = -z_view, clip z = near.
    inline glm::mat4 perspective_infinite_reverse_z(float fov_y_radians, float aspect, float near_z)
    {
        const float sy = 1.0f / std::tan(fov_y_radians * 0.5f);
        const float sx = sy / aspect;
        glm::mat4 m(0.0f);
        m[0][0] = sx;
        m[1][1] = sy;
        m[2][3] = -1.0f;
        m[3][2] = near_z;
        return m;
    }

    inline glm::mat4 orthographic_reverse_z(float left, float right, float bottom, float top, float near_z, float far_z)
    {
        const float sx = 2.0f / (right - left);
        const float sy = 2.0f / (top - bottom);
        const float sz = 1.0f / (far_z - near_z);
        glm::mat4 m(1.0f);
        m[0][0] = sx;
        m[1][1] = sy;
        m[2][2] = sz;
        m[3][0] = -(right + left) / (right - left);
        m[3][1] = -(top + bottom) / (top - bottom);
        m[3][2] = far_z * sz;
        return m;
    }
}
