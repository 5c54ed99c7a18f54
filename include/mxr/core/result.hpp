#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: result.hpp
    MODULE: core
    PURPOSE: Value-or-error return type for recoverable failures
            (shape construction, body creation, session start, anchor requests).
*/


#include <string>
#include <utility>

namespace mxr
{
    template<typename T>
    struct Result
    {
        bool ok = false;
        T value{};
        std::string error{};

        static Result<T> success(T v)
        {
            return Result<T>{true, std::move(v), {}};
        }

        static Result<T> failure(std::string e)
        {
            return Result<T>{false, T{}, std::move(e)};
        }

        explicit operator bool() const { return ok; }
    };
}
