#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: config.hpp
    MODULE: core
    PURPOSE: Runtime configuration structs with defaults and MXR_* environment overrides.
*/


#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>

#include <glm/glm.hpp>

#include "mxr/core/time.hpp"
#include "mxr/core/units.hpp"

namespace mxr
{
    // How the compositor maps views onto render targets.
    //   Dedicated: one target per view, one pass per view.
    //   Shared:    all views in one target, side by side viewports, one amplified pass.
    //   Layered:   one array-sliced target, one layer per view, one amplified pass.
    enum class RenderLayout : uint8_t
    {
        Dedicated = 0,
        Shared,
        Layered
    };

    inline const char* render_layout_name(RenderLayout layout)
    {
        switch (layout)
        {
            case RenderLayout::Dedicated: return "dedicated";
            case RenderLayout::Shared: return "shared";
            case RenderLayout::Layered: return "layered";
        }
        return "unknown";
    }

    enum class PresentModePreference : uint8_t
    {
        Fifo = 0,
        Mailbox,
        Immediate
    };

    struct RendererConfig
    {
        uint32_t raster_sample_count = 4;
        size_t constants_ring_bytes = 256u * 1024u;
        size_t joint_ring_bytes = 4u * 1024u * 1024u;
        uint32_t max_lights = 16;
        RenderLayout layout = RenderLayout::Dedicated;
        glm::vec4 clear_color{0.0f, 0.0f, 0.0f, 0.0f};
    };

    struct PhysicsConfig
    {
        glm::vec3 gravity = units::gravity_world_y_down();
        uint32_t collision_steps = 6;
        float penetration_slop = 5.0f * units::millimeter;
        uint32_t max_bodies = 1024;
        uint32_t max_body_pairs = 1024;
        uint32_t max_contact_constraints = 1024;
        size_t temp_allocator_bytes = 10u * 1024u * 1024u;
    };

    struct SceneConfig
    {
        uint32_t tower_layers = 7;
        float lateral_margin = 2.5f * units::millimeter;
        float vertical_margin = 5.0f * units::millimeter;
        glm::vec3 fallback_anchor_position{0.0f, 0.0f, -0.5f};
        float hit_test_segment_length = 3.0f;
        float floor_level = 0.0f;
        glm::vec3 block_extents{15.0f * units::centimeter, 3.0f * units::centimeter, 5.0f * units::centimeter};
        uint32_t block_seed = 1;
        bool create_ground_plane = true;
    };

    struct PreviewConfig
    {
        int width = 1280;
        int height = 720;
        bool enable_validation = false;
        PresentModePreference present_mode = PresentModePreference::Fifo;
        const char* app_name = "mxr-preview";
    };

    struct EngineConfig
    {
        RendererConfig renderer{};
        PhysicsConfig physics{};
        SceneConfig scene{};
        PreviewConfig preview{};
        double max_timestep = kDefaultMaxTimestep;
    };

    inline bool parse_env_bool(const char* value, bool fallback)
    {
        if (!value || *value == '\0') return fallback;
        std::string v(value);
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (v == "1" || v == "true" || v == "on" || v == "yes") return true;
        if (v == "0" || v == "false" || v == "off" || v == "no") return false;
        return fallback;
    }

    inline uint32_t parse_env_u32(const char* value, uint32_t fallback, uint32_t min_value = 1u)
    {
        if (!value || *value == '\0') return fallback;
        char* end = nullptr;
        const unsigned long parsed = std::strtoul(value, &end, 10);
        if (end == value) return fallback;
        const uint32_t out = static_cast<uint32_t>(std::min<unsigned long>(
            parsed,
            static_cast<unsigned long>(std::numeric_limits<uint32_t>::max())));
        return std::max(min_value, out);
    }

    inline double parse_env_f64(const char* value, double fallback, double min_value = 0.0)
    {
        if (!value || *value == '\0') return fallback;
        char* end = nullptr;
        const double parsed = std::strtod(value, &end);
        if (end == value || !std::isfinite(parsed)) return fallback;
        return std::max(min_value, parsed);
    }

    inline RenderLayout parse_env_render_layout(const char* value, RenderLayout fallback)
    {
        if (!value || *value == '\0') return fallback;
        const std::string v(value);
        if (v == "dedicated") return RenderLayout::Dedicated;
        if (v == "shared") return RenderLayout::Shared;
        if (v == "layered") return RenderLayout::Layered;
        return fallback;
    }

    inline PresentModePreference parse_env_present_mode(const char* value, PresentModePreference fallback)
    {
        if (!value || *value == '\0') return fallback;
        const std::string v(value);
        if (v == "fifo") return PresentModePreference::Fifo;
        if (v == "mailbox") return PresentModePreference::Mailbox;
        if (v == "immediate") return PresentModePreference::Immediate;
        return fallback;
    }

    inline void apply_env_overrides(EngineConfig& cfg)
    {
        cfg.renderer.raster_sample_count = parse_env_u32(std::getenv("MXR_RASTER_SAMPLES"), cfg.renderer.raster_sample_count);
        cfg.renderer.layout = parse_env_render_layout(std::getenv("MXR_RENDER_LAYOUT"), cfg.renderer.layout);
        cfg.scene.tower_layers = parse_env_u32(std::getenv("MXR_TOWER_LAYERS"), cfg.scene.tower_layers);
        cfg.physics.collision_steps = parse_env_u32(std::getenv("MXR_PHYSICS_COLLISION_STEPS"), cfg.physics.collision_steps);
        cfg.preview.enable_validation = parse_env_bool(std::getenv("MXR_VK_VALIDATION"), cfg.preview.enable_validation);
        cfg.preview.present_mode = parse_env_present_mode(std::getenv("MXR_VK_PRESENT_MODE"), cfg.preview.present_mode);
        cfg.max_timestep = parse_env_f64(std::getenv("MXR_MAX_TIMESTEP"), cfg.max_timestep, 1.0 / 1000.0);
    }
}
