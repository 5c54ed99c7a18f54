#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: transform.hpp
    MODULE: math
    PURPOSE: Position / non-uniform scale / rotation transform.
            Composition is TRS matrix multiplication; decomposition assumes no shear.
*/


#include <cmath>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>

namespace mxr
{
    struct Transform
    {
        glm::vec3 position{0.0f};
        glm::vec3 scale{1.0f};
        glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};

        Transform() = default;

        Transform(const glm::vec3& p, const glm::quat& r, const glm::vec3& s = glm::vec3(1.0f))
            : position(p)
            , scale(s)
            , rotation(r)
        {}

        explicit Transform(const glm::mat4& m)
        {
            position = glm::vec3(m[3]);
            const glm::vec3 c0 = glm::vec3(m[0]);
            const glm::vec3 c1 = glm::vec3(m[1]);
            const glm::vec3 c2 = glm::vec3(m[2]);
            scale = glm::vec3(glm::length(c0), glm::length(c1), glm::length(c2));
            const glm::mat3 r(
                scale.x > 0.0f ? c0 / scale.x : glm::vec3(1.0f, 0.0f, 0.0f),
                scale.y > 0.0f ? c1 / scale.y : glm::vec3(0.0f, 1.0f, 0.0f),
                scale.z > 0.0f ? c2 / scale.z : glm::vec3(0.0f, 0.0f, 1.0f));
            rotation = glm::normalize(glm::quat_cast(r));
        }

        static Transform identity() { return Transform{}; }

        glm::mat4 matrix() const
        {
            glm::mat4 m = glm::mat4_cast(rotation);
            m[0] *= scale.x;
            m[1] *= scale.y;
            m[2] *= scale.z;
            m[3] = glm::vec4(position, 1.0f);
            return m;
        }

        glm::vec3 right() const { return rotation * glm::vec3(1.0f, 0.0f, 0.0f); }
        glm::vec3 up() const { return rotation * glm::vec3(0.0f, 1.0f, 0.0f); }
        glm::vec3 forward() const { return rotation * glm::vec3(0.0f, 0.0f, -1.0f); }

        // Places the transform at `from` with its -Z axis pointing toward `at`.
        void look(const glm::vec3& at, const glm::vec3& from, const glm::vec3& up_hint)
        {
            const glm::vec3 z_neg = glm::normalize(at - from);
            const glm::vec3 x = glm::normalize(glm::cross(z_neg, up_hint));
            const glm::vec3 y = glm::normalize(glm::cross(x, z_neg));
            rotation = glm::normalize(glm::quat_cast(glm::mat3(x, y, -z_neg)));
            position = from;
        }

        glm::vec3 transform_point(const glm::vec3& p) const
        {
            return position + rotation * (scale * p);
        }

        Transform inverse() const
        {
            return Transform(glm::inverse(matrix()));
        }

        friend Transform operator*(const Transform& lhs, const Transform& rhs)
        {
            return Transform(lhs.matrix() * rhs.matrix());
        }
    };

    inline bool transforms_near(const Transform& a, const Transform& b, float eps = 1e-4f)
    {
        const glm::mat4 ma = a.matrix();
        const glm::mat4 mb = b.matrix();
        for (int c = 0; c < 4; ++c)
        {
            for (int r = 0; r < 4; ++r)
            {
                if (std::abs(ma[c][r] - mb[c][r]) > eps) return false;
            }
        }
        return true;
    }
}
