#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace charsheet {

enum class Facing {
    Back,
    Left,
    Front,
    Right,
};

namespace facings {

// Row index -> facing for sheets that carry no orientation metadata. Rows past the
// end of this table are left unlabeled.
inline constexpr std::array<Facing, 4> kDefaultRowFacings{ Facing::Back, Facing::Left, Facing::Front, Facing::Right };

// Output order when all four facings are present.
inline constexpr std::array<Facing, 4> kCanonicalCycle{ Facing::Back, Facing::Left, Facing::Front, Facing::Right };

std::string_view to_string(Facing facing);

// Accepts back/up/north, front/down/south, left/west, right/east (prefix match, any case).
std::optional<Facing> parse(std::string_view value);

std::optional<Facing> default_for_row(int row_index);

}

}
