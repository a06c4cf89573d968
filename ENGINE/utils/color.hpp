#pragma once

#include <SDL.h>

#include <optional>
#include <string>

namespace charsheet::color {

std::optional<SDL_Color> parse_hex_color(const std::string& text);
std::string to_hex_string(SDL_Color color);

}
