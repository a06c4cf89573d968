#include "utils/color.hpp"

#include <cstdio>

namespace charsheet::color {

namespace {

std::optional<int> parse_hex_pair(const std::string& text, std::size_t offset) {
    if (offset + 2 > text.size()) {
        return std::nullopt;
    }
    int value = 0;
    for (std::size_t i = offset; i < offset + 2; ++i) {
        const char c = text[i];
        int digit = 0;
        if (c >= '0' && c <= '9') {
            digit = c - '0';
        } else if (c >= 'a' && c <= 'f') {
            digit = 10 + (c - 'a');
        } else if (c >= 'A' && c <= 'F') {
            digit = 10 + (c - 'A');
        } else {
            return std::nullopt;
        }
        value = (value << 4) | digit;
    }
    return value;
}

}

std::optional<SDL_Color> parse_hex_color(const std::string& text) {
    if (text.empty() || text[0] != '#') {
        return std::nullopt;
    }
    if (text.size() != 7 && text.size() != 9) {
        return std::nullopt;
    }
    auto r = parse_hex_pair(text, 1);
    auto g = parse_hex_pair(text, 3);
    auto b = parse_hex_pair(text, 5);
    auto a = text.size() == 9 ? parse_hex_pair(text, 7) : std::optional<int>{255};
    if (!r || !g || !b || !a) {
        return std::nullopt;
    }
    return SDL_Color{static_cast<Uint8>(*r), static_cast<Uint8>(*g), static_cast<Uint8>(*b), static_cast<Uint8>(*a)};
}

std::string to_hex_string(SDL_Color color) {
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "#%02x%02x%02x", color.r, color.g, color.b);
    return std::string(buffer);
}

}
