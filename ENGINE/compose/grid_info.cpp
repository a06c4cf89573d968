#include "compose/grid_info.hpp"

#include <algorithm>
#include <initializer_list>
#include <string>

#include <nlohmann/json.hpp>

#include "core/errors.hpp"

namespace charsheet {

using nlohmann::json;

namespace {

std::optional<int> positive_int(const json& obj, std::initializer_list<const char*> keys) {
    if (!obj.is_object()) {
        return std::nullopt;
    }
    for (const char* key : keys) {
        auto it = obj.find(key);
        if (it != obj.end() && it->is_number_integer() && it->get<int>() > 0) {
            return it->get<int>();
        }
    }
    return std::nullopt;
}

std::optional<int> nested_int(const json& obj, const char* parent, const char* key) {
    auto it = obj.find(parent);
    if (it == obj.end()) {
        return std::nullopt;
    }
    return positive_int(*it, {key});
}

std::vector<Facing> read_directions(const json& shape) {
    std::vector<Facing> out;
    for (const char* key : {"directions", "facings", "orientation", "faces"}) {
        auto it = shape.find(key);
        if (it == shape.end() || !it->is_array()) {
            continue;
        }
        for (const auto& raw : *it) {
            auto facing = raw.is_string() ? facings::parse(raw.get<std::string>()) : std::nullopt;
            if (!facing) {
                return {};
            }
            out.push_back(*facing);
        }
        return out;
    }
    return out;
}

}

std::optional<GridInfo> normalize_grid(const json& shape, int sheet_w, int sheet_h) {
    if (!shape.is_object()) {
        return std::nullopt;
    }
    auto fw = positive_int(shape, {"frame_w", "frameWidth"});
    if (!fw) fw = nested_int(shape, "frame", "w");
    if (!fw) fw = nested_int(shape, "grid", "w");
    auto fh = positive_int(shape, {"frame_h", "frameHeight"});
    if (!fh) fh = nested_int(shape, "frame", "h");
    if (!fh) fh = nested_int(shape, "grid", "h");
    auto rows = positive_int(shape, {"rows"});
    if (!rows) rows = nested_int(shape, "grid", "rows");
    auto cols = positive_int(shape, {"cols", "columns"});
    if (!cols) cols = nested_int(shape, "grid", "cols");

    if (!fw || !fh) {
        return std::nullopt;
    }

    GridInfo grid;
    grid.frame = FrameSize{*fw, *fh};
    grid.directions = read_directions(shape);
    if (rows && cols) {
        grid.rows = *rows;
        grid.cols = *cols;
        return grid;
    }
    if (sheet_w > 0 && sheet_h > 0 && sheet_w % *fw == 0 && sheet_h % *fh == 0) {
        grid.rows = sheet_h / *fh;
        grid.cols = sheet_w / *fw;
        return grid;
    }
    return std::nullopt;
}

std::optional<GridInfo> grid_from_metadata(const json& metadata, const std::string& animation, int sheet_w, int sheet_h) {
    if (!metadata.is_object()) {
        return std::nullopt;
    }
    if (auto anims = metadata.find("animations"); anims != metadata.end()) {
        if (anims->is_object()) {
            if (auto it = anims->find(animation); it != anims->end()) {
                if (auto grid = normalize_grid(*it, sheet_w, sheet_h)) {
                    return grid;
                }
            }
        } else if (anims->is_array()) {
            for (const auto& entry : *anims) {
                auto name = entry.find("name");
                if (name != entry.end() && name->is_string() && name->get<std::string>() == animation) {
                    if (auto grid = normalize_grid(entry, sheet_w, sheet_h)) {
                        return grid;
                    }
                }
            }
        }
    }
    if (metadata.contains("frame") || metadata.contains("grid") || metadata.contains("rows") ||
        metadata.contains("cols") || metadata.contains("frame_w")) {
        return normalize_grid(metadata, sheet_w, sheet_h);
    }
    return std::nullopt;
}

GridInfo fallback_grid(int sheet_w, int sheet_h, std::optional<FrameSize> frame_override) {
    GridInfo grid;
    if (frame_override && frame_override->w > 0 && frame_override->h > 0) {
        if (sheet_w <= 0 || sheet_h <= 0 || sheet_w % frame_override->w != 0 || sheet_h % frame_override->h != 0) {
            throw GeometryError("Sheet " + std::to_string(sheet_w) + "x" + std::to_string(sheet_h) +
                                " is not divisible by frame " + std::to_string(frame_override->w) + "x" +
                                std::to_string(frame_override->h));
        }
        grid.frame = *frame_override;
        grid.cols = sheet_w / frame_override->w;
        grid.rows = sheet_h / frame_override->h;
        return grid;
    }
    if (sheet_w > 0 && sheet_h > 0 && sheet_w % kDefaultFrameSize == 0 && sheet_h % kDefaultFrameSize == 0) {
        grid.frame = FrameSize{kDefaultFrameSize, kDefaultFrameSize};
        grid.cols = sheet_w / kDefaultFrameSize;
        grid.rows = sheet_h / kDefaultFrameSize;
        return grid;
    }
    grid.frame = FrameSize{sheet_w, sheet_h};
    grid.cols = 1;
    grid.rows = 1;
    return grid;
}

json grid_to_json(const GridInfo& grid) {
    json directions = json::array();
    for (Facing f : grid.directions) {
        directions.push_back(std::string(facings::to_string(f)));
    }
    return json{
        {"frame_w", grid.frame.w},
        {"frame_h", grid.frame.h},
        {"rows", grid.rows},
        {"cols", grid.cols},
        {"directions", std::move(directions)},
    };
}

}
