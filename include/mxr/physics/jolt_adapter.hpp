#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: jolt_adapter.hpp
    MODULE: physics
    PURPOSE: Jolt Physics integration base layer: glm <-> Jolt conversions
            and the process-wide solver runtime (allocator, factory, type registry).

    CONVENTION:
        MXR:  Right-handed, Y-up, -Z = forward
        Jolt: Right-handed, Y-up, -Z = forward
        Conversion is component-wise; no axis flip.
*/

#include <cstdarg>
#include <cstdio>
#include <string>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include <Jolt/Jolt.h>
#include <Jolt/RegisterTypes.h>
#include <Jolt/Core/Factory.h>
#include <Jolt/Core/Memory.h>
#include <Jolt/Math/Vec3.h>
#include <Jolt/Math/Quat.h>

#include "mxr/core/log.hpp"

namespace mxr::jolt
{
    inline JPH::Vec3 to_jph(const glm::vec3& v) noexcept
    {
        return JPH::Vec3(v.x, v.y, v.z);
    }

    inline glm::vec3 to_glm(const JPH::Vec3& v) noexcept
    {
        return glm::vec3(v.GetX(), v.GetY(), v.GetZ());
    }

    inline JPH::Quat to_jph(const glm::quat& q) noexcept
    {
        return JPH::Quat(q.x, q.y, q.z, q.w);
    }

    inline glm::quat to_glm(const JPH::Quat& q) noexcept
    {
        return glm::quat(q.GetW(), q.GetX(), q.GetY(), q.GetZ());
    }

    inline bool jolt_initialized() noexcept
    {
        return JPH::Factory::sInstance != nullptr;
    }

    inline void jolt_trace(const char* fmt, ...)
    {
        va_list args;
        va_start(args, fmt);
        char buffer[1024];
        std::vsnprintf(buffer, sizeof(buffer), fmt, args);
        va_end(args);
        log_info(std::string("[jolt] ") + buffer);
    }

    inline void init_jolt()
    {
        if (jolt_initialized()) return;

        JPH::RegisterDefaultAllocator();
        JPH::Trace = jolt_trace;
        JPH::Factory::sInstance = new JPH::Factory();
        JPH::RegisterTypes();
    }

    inline void shutdown_jolt()
    {
        if (!jolt_initialized()) return;

        JPH::UnregisterTypes();
        delete JPH::Factory::sInstance;
        JPH::Factory::sInstance = nullptr;
    }

    // Solver global state lives for the lifetime of this object.
    // Construct one before any physics world, destroy it after the last one.
    class PhysicsRuntime
    {
    public:
        PhysicsRuntime() { init_jolt(); }
        ~PhysicsRuntime() { shutdown_jolt(); }

        PhysicsRuntime(const PhysicsRuntime&) = delete;
        PhysicsRuntime& operator=(const PhysicsRuntime&) = delete;
    };
}
