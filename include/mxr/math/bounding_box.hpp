#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: bounding_box.hpp
    MODULE: math
    PURPOSE: Axis-aligned bounds used for mesh extents and block footprints.
*/

#include <algorithm>

#include <glm/glm.hpp>

namespace mxr
{
    struct BoundingBox
    {
        glm::vec3 minv{ 1e30f};
        glm::vec3 maxv{-1e30f};

        BoundingBox() = default;
        BoundingBox(const glm::vec3& mn, const glm::vec3& mx) : minv(mn), maxv(mx) {}

        inline bool valid() const
        {
            return minv.x <= maxv.x && minv.y <= maxv.y && minv.z <= maxv.z;
        }

        inline void expand(const glm::vec3& p)
        {
            minv = glm::min(minv, p);
            maxv = glm::max(maxv, p);
        }

        inline void expand(const BoundingBox& other)
        {
            if (!other.valid()) return;
            expand(other.minv);
            expand(other.maxv);
        }

        inline glm::vec3 center() const { return 0.5f * (minv + maxv); }
        inline glm::vec3 extent() const { return 0.5f * (maxv - minv); }
        inline glm::vec3 size() const { return maxv - minv; }

        BoundingBox transformed(const glm::mat4& m) const
        {
            BoundingBox out{};
            if (!valid()) return out;
            for (int i = 0; i < 8; ++i)
            {
                const glm::vec3 corner(
                    (i & 1) ? maxv.x : minv.x,
                    (i & 2) ? maxv.y : minv.y,
                    (i & 4) ? maxv.z : minv.z);
                out.expand(glm::vec3(m * glm::vec4(corner, 1.0f)));
            }
            return out;
        }
    };
}
