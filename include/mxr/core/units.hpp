#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: units.hpp
    MODULE: core
    PURPOSE: Unit conventions shared by sensing data, the scene and the solver.

    Anchors arrive in meters in a right-handed, +Y up, -Z forward world,
    and the solver runs in the same frame without rescaling.
*/

#include <glm/glm.hpp>

namespace mxr::units
{
    inline constexpr float meter = 1.0f;
    inline constexpr float centimeter = 0.01f * meter;
    inline constexpr float millimeter = 0.001f * meter;

    inline constexpr float degree = 0.017453292519943295769f; // pi / 180

    inline constexpr float standard_gravity = 9.81f;

    inline constexpr glm::vec3 gravity_world_y_down()
    {
        return glm::vec3(0.0f, -standard_gravity, 0.0f);
    }

    inline constexpr float radians_from_degrees(float value_deg)
    {
        return value_deg * degree;
    }
}
