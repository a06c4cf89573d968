#include "slice/frame_slicer.hpp"

#include <algorithm>
#include <array>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <nlohmann/json.hpp>

#include "compose/compositor.hpp"
#include "core/errors.hpp"
#include "utils/log.hpp"
#include "utils/staged_publish.hpp"
#include "utils/string_utils.hpp"

namespace charsheet {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

std::string folder_for_row(const std::string& animation,
                           const std::optional<Facing>& facing,
                           int source_row,
                           int total_rows,
                           bool first_of_facing,
                           const SliceOptions& options) {
    if (!options.orientation_dirs) {
        return animation;
    }
    const std::string base = strings::title_case_first(animation);
    if (!facing) {
        return total_rows == 1 ? base : base + "_row" + std::to_string(source_row);
    }
    std::string folder = base + "_" + std::string(facings::to_string(*facing));
    if (!first_of_facing) {
        folder += "_row" + std::to_string(source_row);
    }
    return folder;
}

void check_geometry(const SDL_Surface* surface, const GridInfo& grid) {
    if (!surface) {
        throw GeometryError("Cannot slice an empty raster");
    }
    if (grid.frame.w <= 0 || grid.frame.h <= 0) {
        std::ostringstream oss;
        oss << "Invalid frame size " << grid.frame.w << "x" << grid.frame.h;
        throw GeometryError(oss.str());
    }
    if (surface->w % grid.frame.w != 0 || surface->h % grid.frame.h != 0) {
        std::ostringstream oss;
        oss << "Raster " << surface->w << "x" << surface->h << " is not divisible by frame " << grid.frame.w << "x"
            << grid.frame.h;
        throw GeometryError(oss.str());
    }
    const int cols = surface->w / grid.frame.w;
    const int rows = surface->h / grid.frame.h;
    if (cols != grid.cols || rows != grid.rows) {
        std::ostringstream oss;
        oss << "Grid mismatch: expected " << grid.cols << "x" << grid.rows << " frames, raster holds " << cols << "x"
            << rows;
        throw GeometryError(oss.str());
    }
}

}

std::size_t FrameManifest::frame_count() const {
    std::size_t total = 0;
    for (const auto& folder : folders) {
        total += folder.second.size();
    }
    return total;
}

const std::vector<std::string>* FrameManifest::frames_in(const std::string& folder) const {
    for (const auto& entry : folders) {
        if (entry.first == folder) {
            return &entry.second;
        }
    }
    return nullptr;
}

json FrameManifest::to_json() const {
    json orientation_list = json::array();
    for (Facing f : orientations) {
        orientation_list.push_back(std::string(facings::to_string(f)));
    }
    json frames = json::object();
    json folder_order = json::array();
    for (const auto& entry : folders) {
        frames[entry.first] = entry.second;
        folder_order.push_back(entry.first);
    }
    return json{
        {"animation", animation},
        {"fps", fps},
        {"frame_size", {{"w", frame_size.w}, {"h", frame_size.h}}},
        {"orientations", std::move(orientation_list)},
        {"folders", std::move(folder_order)},
        {"frames", std::move(frames)},
        {"frame_count", frame_count()},
    };
}

std::vector<std::optional<Facing>> assign_row_facings(const GridInfo& grid) {
    std::vector<std::optional<Facing>> out(static_cast<std::size_t>(std::max(0, grid.rows)));
    if (!grid.directions.empty() && static_cast<int>(grid.directions.size()) == grid.rows) {
        for (std::size_t r = 0; r < out.size(); ++r) {
            out[r] = grid.directions[r];
        }
        return out;
    }
    if (grid.rows > 1) {
        for (std::size_t r = 0; r < out.size(); ++r) {
            out[r] = facings::default_for_row(static_cast<int>(r));
        }
    }
    return out;
}

std::vector<int> canonical_row_order(const std::vector<std::optional<Facing>>& row_facings) {
    std::array<int, 4> first_row{ -1, -1, -1, -1 };
    for (std::size_t c = 0; c < facings::kCanonicalCycle.size(); ++c) {
        for (std::size_t r = 0; r < row_facings.size(); ++r) {
            if (row_facings[r] && *row_facings[r] == facings::kCanonicalCycle[c]) {
                first_row[c] = static_cast<int>(r);
                break;
            }
        }
    }
    const bool full_cycle = std::none_of(first_row.begin(), first_row.end(), [](int r) { return r < 0; });

    std::vector<int> order;
    order.reserve(row_facings.size());
    if (full_cycle) {
        order.assign(first_row.begin(), first_row.end());
    }
    for (int r = 0; r < static_cast<int>(row_facings.size()); ++r) {
        if (std::find(order.begin(), order.end(), r) == order.end()) {
            order.push_back(r);
        }
    }
    return order;
}

SliceResult slice(const SDL_Surface* surface, const GridInfo& grid, const std::string& animation,
                  const SliceOptions& options) {
    check_geometry(surface, grid);

    const auto row_facings = assign_row_facings(grid);
    const auto order = canonical_row_order(row_facings);

    SliceResult result;
    result.manifest.animation = animation;
    result.manifest.fps = options.fps;
    result.manifest.frame_size = grid.frame;
    result.frames.reserve(static_cast<std::size_t>(grid.rows) * static_cast<std::size_t>(grid.cols));

    std::vector<Facing> seen;
    int index = 0;
    for (int row : order) {
        const auto& facing = row_facings[static_cast<std::size_t>(row)];
        bool first_of_facing = true;
        if (facing) {
            first_of_facing = std::find(seen.begin(), seen.end(), *facing) == seen.end();
            seen.push_back(*facing);
            result.manifest.orientations.push_back(*facing);
        }
        const std::string folder = folder_for_row(animation, facing, row, grid.rows, first_of_facing, options);

        auto& folders = result.manifest.folders;
        auto slot = std::find_if(folders.begin(), folders.end(), [&](const auto& e) { return e.first == folder; });
        if (slot == folders.end()) {
            folders.emplace_back(folder, std::vector<std::string>{});
            slot = std::prev(folders.end());
        }

        for (int col = 0; col < grid.cols; ++col) {
            const SDL_Rect rect{ col * grid.frame.w, row * grid.frame.h, grid.frame.w, grid.frame.h };
            Frame frame;
            frame.folder = folder;
            frame.file_name = options.slug + "_" + animation + "_" + strings::zero_pad(index, options.zero_pad) + ".png";
            frame.index = index;
            frame.source_row = row;
            frame.source_col = col;
            frame.facing = facing;
            frame.pixels = surface_utils::copy_region(surface, rect);
            slot->second.push_back(frame.id());
            result.frames.push_back(std::move(frame));
            ++index;
        }
    }

    log::info("[FrameSlicer] '" + animation + "': " + std::to_string(result.frames.size()) + " frames in " +
              std::to_string(result.manifest.folders.size()) + " folders");
    return result;
}

SliceResult slice(const ComposedRaster& raster, const SliceOptions& options) {
    return slice(raster.pixels.get(), raster.grid, raster.animation, options);
}

std::vector<fs::path> write_frames(const SliceResult& result, const fs::path& out_dir) {
    const fs::path staging = out_dir / (".staging_" + result.manifest.animation);
    std::error_code ec;
    fs::remove_all(staging, ec);
    fs::create_directories(staging, ec);
    if (ec) {
        throw std::runtime_error("Unable to create staging directory '" + staging.generic_string() + "': " + ec.message());
    }

    try {
        for (const auto& folder : result.manifest.folders) {
            fs::create_directories(staging / folder.first);
        }
        for (const auto& frame : result.frames) {
            surface_utils::save_png(frame.pixels.get(), staging / frame.folder / frame.file_name);
        }
    } catch (...) {
        fs::remove_all(staging, ec);
        throw;
    }

    std::vector<std::string> folder_names;
    folder_names.reserve(result.manifest.folders.size());
    for (const auto& folder : result.manifest.folders) {
        folder_names.push_back(folder.first);
    }
    staged_publish::commit(staging, folder_names, out_dir);

    std::vector<fs::path> written;
    written.reserve(result.frames.size());
    for (const auto& frame : result.frames) {
        written.push_back(out_dir / frame.folder / frame.file_name);
    }
    log::debug("[FrameSlicer] Wrote " + std::to_string(written.size()) + " frames under '" + out_dir.generic_string() + "'");
    return written;
}

}
