#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: time.hpp
    MODULE: core
    PURPOSE: Presentation clock and timestep clamping for the update thread.
            A missed frame budget is absorbed by capping the next step.
*/


#include <algorithm>

namespace mxr
{
    inline constexpr double kDefaultMaxTimestep = 1.0 / 30.0;

    // The compositor reports predicted presentation times in seconds.
    struct PresentationClock
    {
        double last_time = -1.0;
        double max_dt = kDefaultMaxTimestep;

        float advance(double presentation_time)
        {
            if (last_time < 0.0)
            {
                last_time = presentation_time;
                return 0.0f;
            }
            const double dt = std::clamp(presentation_time - last_time, 0.0, max_dt);
            last_time = presentation_time;
            return (float)dt;
        }
    };
}
