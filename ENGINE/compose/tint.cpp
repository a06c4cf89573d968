#include "compose/tint.hpp"

#include <stdexcept>

#include "asset/surface_utils.hpp"
#include "utils/color.hpp"

namespace charsheet {

Uint8 tint_channel(Uint8 base, Uint8 tint, TintMode mode) {
    const int c = base;
    const int t = tint;
    switch (mode) {
        case TintMode::Multiply:
            return static_cast<Uint8>((c * t + 127) / 255);
        case TintMode::Screen:
            return static_cast<Uint8>(255 - ((255 - c) * (255 - t) + 127) / 255);
        case TintMode::Overlay:
            if (c < 128) {
                return static_cast<Uint8>((2 * c * t + 127) / 255);
            }
            return static_cast<Uint8>(255 - (2 * (255 - c) * (255 - t) + 127) / 255);
        case TintMode::Replace:
            return tint;
    }
    return base;
}

void apply_tint(SDL_Surface* surface, const LayerTint& tint) {
    if (!surface) {
        return;
    }
    auto colour = color::parse_hex_color(tint.rgb);
    if (!colour) {
        throw std::runtime_error("Invalid tint colour '" + tint.rgb + "'");
    }
    for (int y = 0; y < surface->h; ++y) {
        for (int x = 0; x < surface->w; ++x) {
            Uint8* px = surface_utils::pixel_at(surface, x, y);
            if (px[3] == 0) {
                continue;
            }
            px[0] = tint_channel(px[0], colour->r, tint.mode);
            px[1] = tint_channel(px[1], colour->g, tint.mode);
            px[2] = tint_channel(px[2], colour->b, tint.mode);
        }
    }
}

}
