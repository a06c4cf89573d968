#include "slice/facing.hpp"

#include "utils/string_utils.hpp"

namespace charsheet::facings {

std::string_view to_string(Facing facing) {
    switch (facing) {
        case Facing::Back:  return "back";
        case Facing::Left:  return "left";
        case Facing::Front: return "front";
        case Facing::Right: return "right";
    }
    return "front";
}

std::optional<Facing> parse(std::string_view value) {
    const std::string n = strings::to_lower_copy(strings::trim_copy(value));
    if (strings::starts_with(n, "down") || strings::starts_with(n, "south") || strings::starts_with(n, "front")) {
        return Facing::Front;
    }
    if (strings::starts_with(n, "up") || strings::starts_with(n, "north") || strings::starts_with(n, "back")) {
        return Facing::Back;
    }
    if (strings::starts_with(n, "left") || strings::starts_with(n, "west")) {
        return Facing::Left;
    }
    if (strings::starts_with(n, "right") || strings::starts_with(n, "east")) {
        return Facing::Right;
    }
    return std::nullopt;
}

std::optional<Facing> default_for_row(int row_index) {
    if (row_index < 0 || row_index >= static_cast<int>(kDefaultRowFacings.size())) {
        return std::nullopt;
    }
    return kDefaultRowFacings[static_cast<std::size_t>(row_index)];
}

}
