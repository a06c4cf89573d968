#pragma once

#include <SDL.h>

#include "build/build.hpp"

namespace charsheet {

// Applies the tint to every pixel with non-zero alpha, in place. Alpha is untouched.
// Throws std::runtime_error when the rgb string is not a #rrggbb colour.
void apply_tint(SDL_Surface* surface, const LayerTint& tint);

Uint8 tint_channel(Uint8 base, Uint8 tint, TintMode mode);

}
