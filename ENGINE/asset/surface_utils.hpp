#pragma once

#include <SDL.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>

namespace charsheet::surface_utils {

inline constexpr std::uint64_t kSignatureOffset = 1469598103934665603ull;
inline constexpr std::uint64_t kSignaturePrime  = 1099511628211ull;

// Every raster in the pipeline uses this format: bytes R, G, B, A in memory order.
inline constexpr Uint32 kRasterFormat = SDL_PIXELFORMAT_RGBA32;

using SurfacePtr = std::unique_ptr<SDL_Surface, decltype(&SDL_FreeSurface)>;

SurfacePtr make_surface_ptr(SDL_Surface* surface);

// Fully transparent surface. Throws std::runtime_error when SDL cannot allocate it.
SurfacePtr create_rgba_surface(int width, int height);

// Converted to kRasterFormat; nullptr (with a logged reason) when the file cannot be decoded.
SurfacePtr load_png_rgba(const std::filesystem::path& path);

// Throws std::runtime_error on failure.
void save_png(SDL_Surface* surface, const std::filesystem::path& path);

SurfacePtr duplicate_surface(SDL_Surface* surface);

// Exact pixel copy of `rect`, no blending. Throws GeometryError when `rect` leaves the surface.
SurfacePtr copy_region(const SDL_Surface* surface, const SDL_Rect& rect);

inline Uint8* pixel_at(SDL_Surface* surface, int x, int y) {
    return static_cast<Uint8*>(surface->pixels) + static_cast<std::ptrdiff_t>(y) * surface->pitch + x * 4;
}

inline const Uint8* pixel_at(const SDL_Surface* surface, int x, int y) {
    return static_cast<const Uint8*>(surface->pixels) + static_cast<std::ptrdiff_t>(y) * surface->pitch + x * 4;
}

std::uint64_t mix_signature(std::uint64_t seed, std::uint64_t value);

// Hashes dimensions and visible row bytes only, so row padding never affects the result.
std::uint64_t hash_surface_pixels(const SDL_Surface* surface, std::uint64_t seed = kSignatureOffset);

}
