#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: texture_loader_sdl.hpp
    MODULE: resources
    PURPOSE: Image decoding through SDL2_image into RGBA8 TextureData, from files,
            in-memory encoded images (embedded model textures) and six-face cube folders.
            Failures return invalid TextureData rather than throwing.
*/


#include <cstddef>
#include <string>

#include "mxr/resources/texture.hpp"

namespace mxr
{
    // Rows come out top row first unless `flip_y` is set.
    TextureData load_texture_sdl_image(const std::string& path, bool flip_y = false);

    TextureData load_texture_sdl_image_memory(const void* bytes, size_t size, const std::string& label, bool flip_y = false);

    // right/left/top/bottom/front/back.png in `folder`, in +X, -X, +Y, -Y, +Z, -Z order.
    CubemapData load_cubemap_sdl_folder(const std::string& folder);
}
