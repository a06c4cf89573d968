#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "build/build.hpp"
#include "slice/facing.hpp"

namespace charsheet {

struct GridInfo {
    FrameSize frame;
    int rows = 0;
    int cols = 0;
    // Explicit per-row labels; empty when the source declares none.
    std::vector<Facing> directions;

    int width() const { return frame.w * cols; }
    int height() const { return frame.h * rows; }
};

inline constexpr int kDefaultFrameSize = 64;

// Reads one of the metadata shapes used by sheet definitions:
//   { frame_w, frame_h, rows, cols, directions? }   (also frameWidth/frameHeight/columns)
//   { frame: {w, h}, rows, cols }   or   { grid: {w, h, rows, cols} }
// Rows/cols are derived from the sheet size when only the frame size is given.
std::optional<GridInfo> normalize_grid(const nlohmann::json& shape, int sheet_w, int sheet_h);

// Looks for `animations.<name>`, `animations[] {name}` or a flat shape in `metadata`.
std::optional<GridInfo> grid_from_metadata(const nlohmann::json& metadata, const std::string& animation,
                                           int sheet_w, int sheet_h);

// Explicit frame size if given, else a 64x64 frame when it divides the sheet, else one frame.
// Throws GeometryError when an explicit frame size does not tile the sheet exactly.
GridInfo fallback_grid(int sheet_w, int sheet_h, std::optional<FrameSize> frame_override = std::nullopt);

nlohmann::json grid_to_json(const GridInfo& grid);

}
