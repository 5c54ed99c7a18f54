#include "mxr/resources/texture_loader_sdl.hpp"

#include <cstdint>

#include <SDL2/SDL.h>
#include <SDL2/SDL_image.h>

#include "mxr/core/log.hpp"

namespace mxr
{
    namespace
    {
        // Takes ownership of `loaded`.
        TextureData texture_from_surface(SDL_Surface* loaded, const std::string& source, bool flip_y)
        {
            if (!loaded)
            {
                log_warn("texture loader: cannot decode '" + source + "': " + IMG_GetError());
                return TextureData{};
            }

            SDL_Surface* rgba = SDL_ConvertSurfaceFormat(loaded, SDL_PIXELFORMAT_RGBA32, 0);
            SDL_FreeSurface(loaded);
            if (!rgba)
            {
                log_warn("texture loader: cannot convert '" + source + "' to RGBA: " + SDL_GetError());
                return TextureData{};
            }

            TextureData out{rgba->w, rgba->h};
            out.source_path = source;

            const bool locked = SDL_MUSTLOCK(rgba) && SDL_LockSurface(rgba) == 0;
            const auto* pixels = static_cast<const uint8_t*>(rgba->pixels);
            const int pitch = rgba->pitch;
            for (int y = 0; y < out.h; ++y)
            {
                const int dst_y = flip_y ? (out.h - 1 - y) : y;
                const auto* row = reinterpret_cast<const uint32_t*>(pixels + y * pitch);
                for (int x = 0; x < out.w; ++x)
                {
                    uint8_t r = 0, g = 0, b = 0, a = 0;
                    SDL_GetRGBA(row[x], rgba->format, &r, &g, &b, &a);
                    out.at(x, dst_y) = glm::u8vec4(r, g, b, a);
                }
            }
            if (locked) SDL_UnlockSurface(rgba);

            SDL_FreeSurface(rgba);
            return out;
        }
    }

    TextureData load_texture_sdl_image(const std::string& path, bool flip_y)
    {
        return texture_from_surface(IMG_Load(path.c_str()), path, flip_y);
    }

    TextureData load_texture_sdl_image_memory(const void* bytes, size_t size, const std::string& label, bool flip_y)
    {
        if (!bytes || size == 0) return TextureData{};
        SDL_RWops* rw = SDL_RWFromConstMem(bytes, (int)size);
        if (!rw)
        {
            log_warn("texture loader: cannot wrap '" + label + "': " + SDL_GetError());
            return TextureData{};
        }
        // freesrc = 1 closes the stream.
        return texture_from_surface(IMG_Load_RW(rw, 1), label, flip_y);
    }

    CubemapData load_cubemap_sdl_folder(const std::string& folder)
    {
        static const char* const kFaceFiles[6] = {"right.png", "left.png", "top.png", "bottom.png", "front.png", "back.png"};
        CubemapData cm{};
        for (size_t i = 0; i < 6; ++i)
        {
            cm.face[i] = load_texture_sdl_image(folder + "/" + kFaceFiles[i]);
        }
        return cm;
    }
}
