#include "asset/surface_utils.hpp"

#include <SDL_image.h>

#include <cstring>
#include <sstream>
#include <stdexcept>

#include "core/errors.hpp"
#include "utils/log.hpp"

namespace charsheet::surface_utils {

SurfacePtr make_surface_ptr(SDL_Surface* surface) {
    return SurfacePtr(surface, SDL_FreeSurface);
}

SurfacePtr create_rgba_surface(int width, int height) {
    SurfacePtr surface = make_surface_ptr(SDL_CreateRGBSurfaceWithFormat(0, width, height, 32, kRasterFormat));
    if (!surface) {
        std::ostringstream oss;
        oss << "Unable to allocate " << width << "x" << height << " surface: " << SDL_GetError();
        throw std::runtime_error(oss.str());
    }
    SDL_SetSurfaceBlendMode(surface.get(), SDL_BLENDMODE_NONE);
    SDL_FillRect(surface.get(), nullptr, 0);
    return surface;
}

SurfacePtr load_png_rgba(const std::filesystem::path& path) {
    SurfacePtr loaded = make_surface_ptr(IMG_Load(path.string().c_str()));
    if (!loaded) {
        log::warn("[surface_utils] Failed to load '" + path.generic_string() + "': " + IMG_GetError());
        return make_surface_ptr(nullptr);
    }
    SurfacePtr converted = make_surface_ptr(SDL_ConvertSurfaceFormat(loaded.get(), kRasterFormat, 0));
    if (!converted) {
        log::warn("[surface_utils] Failed to convert '" + path.generic_string() + "': " + SDL_GetError());
        return make_surface_ptr(nullptr);
    }
    SDL_SetSurfaceBlendMode(converted.get(), SDL_BLENDMODE_NONE);
    return converted;
}

void save_png(SDL_Surface* surface, const std::filesystem::path& path) {
    if (!surface) {
        throw std::runtime_error("save_png: null surface for '" + path.generic_string() + "'");
    }
    if (IMG_SavePNG(surface, path.string().c_str()) != 0) {
        throw std::runtime_error("save_png: unable to write '" + path.generic_string() + "': " + IMG_GetError());
    }
}

SurfacePtr duplicate_surface(SDL_Surface* surface) {
    if (!surface) {
        return make_surface_ptr(nullptr);
    }
    SurfacePtr copy = make_surface_ptr(SDL_ConvertSurfaceFormat(surface, kRasterFormat, 0));
    if (copy) {
        SDL_SetSurfaceBlendMode(copy.get(), SDL_BLENDMODE_NONE);
    }
    return copy;
}

SurfacePtr copy_region(const SDL_Surface* surface, const SDL_Rect& rect) {
    if (!surface || rect.x < 0 || rect.y < 0 || rect.w <= 0 || rect.h <= 0 ||
        rect.x + rect.w > surface->w || rect.y + rect.h > surface->h) {
        std::ostringstream oss;
        oss << "Region " << rect.w << "x" << rect.h << "+" << rect.x << "+" << rect.y << " lies outside surface "
            << (surface ? surface->w : 0) << "x" << (surface ? surface->h : 0);
        throw GeometryError(oss.str());
    }
    SurfacePtr out = create_rgba_surface(rect.w, rect.h);
    const std::size_t row_bytes = static_cast<std::size_t>(rect.w) * 4;
    for (int row = 0; row < rect.h; ++row) {
        std::memcpy(pixel_at(out.get(), 0, row), pixel_at(surface, rect.x, rect.y + row), row_bytes);
    }
    return out;
}

std::uint64_t mix_signature(std::uint64_t seed, std::uint64_t value) {
    seed ^= value;
    seed *= kSignaturePrime;
    return seed;
}

std::uint64_t hash_surface_pixels(const SDL_Surface* surface, std::uint64_t seed) {
    if (!surface || !surface->pixels) {
        return mix_signature(seed, 0);
    }
    seed = mix_signature(seed, static_cast<std::uint64_t>(surface->w));
    seed = mix_signature(seed, static_cast<std::uint64_t>(surface->h));
    const std::size_t row_bytes = static_cast<std::size_t>(surface->w) * 4;
    for (int y = 0; y < surface->h; ++y) {
        const Uint8* row = pixel_at(surface, 0, y);
        for (std::size_t idx = 0; idx < row_bytes; ++idx) {
            seed ^= static_cast<std::uint64_t>(row[idx]);
            seed *= kSignaturePrime;
        }
    }
    return seed;
}

}
