#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "asset/surface_utils.hpp"
#include "build/build.hpp"
#include "compose/grid_info.hpp"
#include "slice/facing.hpp"

namespace charsheet {

struct ComposedRaster;

struct SliceOptions {
    int zero_pad = 3;
    int fps = 8;
    // false puts every frame of the animation into one folder named after it.
    bool orientation_dirs = true;
    std::string slug = "character";
};

struct Frame {
    std::string folder;
    std::string file_name;
    int index = 0;
    int source_row = 0;
    int source_col = 0;
    std::optional<Facing> facing;
    surface_utils::SurfacePtr pixels{nullptr, &SDL_FreeSurface};

    std::string id() const { return folder + "/" + file_name; }
};

struct FrameManifest {
    std::string animation;
    int fps = 8;
    FrameSize frame_size;
    // Facing of each labeled row, in output order.
    std::vector<Facing> orientations;
    // Folder name -> frame ids, folders in output order.
    std::vector<std::pair<std::string, std::vector<std::string>>> folders;

    std::size_t frame_count() const;
    const std::vector<std::string>* frames_in(const std::string& folder) const;
    nlohmann::json to_json() const;
};

struct SliceResult {
    std::vector<Frame> frames;
    FrameManifest manifest;
};

// Row labels before reordering: explicit directions when there is one per row,
// otherwise the default table for multi-row sheets. Unlabeled rows are nullopt.
std::vector<std::optional<Facing>> assign_row_facings(const GridInfo& grid);

// Source row indices in output order. When back, left, front and right are all present,
// their first occurrences lead in that cycle; every other row follows in source order.
std::vector<int> canonical_row_order(const std::vector<std::optional<Facing>>& facings);

// Throws GeometryError when the surface is not exactly rows x cols frames of the grid's size.
SliceResult slice(const SDL_Surface* surface, const GridInfo& grid, const std::string& animation,
                  const SliceOptions& options = SliceOptions{});

SliceResult slice(const ComposedRaster& raster, const SliceOptions& options = SliceOptions{});

// Writes every frame under `out_dir/<folder>/<file>`. Folders are assembled in a staging
// directory first and replace any existing folder of the same name. Returns the written files.
std::vector<std::filesystem::path> write_frames(const SliceResult& result, const std::filesystem::path& out_dir);

}
