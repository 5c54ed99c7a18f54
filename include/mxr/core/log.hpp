#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: log.hpp
    MODULE: core
    PURPOSE: Diagnostic output shared by the scene, physics bridge and renderer.
            The sensing thread and the frame thread both log, so lines are
            written whole under one lock.
*/


#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

namespace mxr
{
    namespace detail
    {
        inline std::mutex& log_mutex()
        {
            static std::mutex m{};
            return m;
        }

        inline void write_line(std::ostream& out, const char* tag, const std::string& msg)
        {
            std::lock_guard<std::mutex> lock(log_mutex());
            out << tag << msg << std::endl;
        }
    }

    inline void log_info(const std::string& msg)
    {
        detail::write_line(std::cout, "[INFO] ", msg);
    }

    inline void log_warn(const std::string& msg)
    {
        detail::write_line(std::cout, "[WARN] ", msg);
    }

    inline void log_error(const std::string& msg)
    {
        detail::write_line(std::cerr, "[ERROR] ", msg);
    }

    // Validation layer messages, kept apart from engine diagnostics.
    inline void log_validation(const std::string& msg)
    {
        detail::write_line(std::cerr, "[vulkan] ", msg);
    }
}
