#include "config/pipeline_config.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include <nlohmann/json.hpp>

#include "utils/json_io.hpp"
#include "utils/log.hpp"
#include "utils/string_utils.hpp"

namespace charsheet {

namespace {
constexpr int kMinZeroPad = 1;
constexpr int kMaxZeroPad = 8;
constexpr int kMinFps = 1;
constexpr int kMaxFps = 120;

std::optional<FrameSize> read_frame_size(const nlohmann::json& obj) {
    if (!obj.is_object()) {
        return std::nullopt;
    }
    auto w = obj.find("w");
    auto h = obj.find("h");
    if (w == obj.end() || h == obj.end() || !w->is_number_integer() || !h->is_number_integer()) {
        return std::nullopt;
    }
    FrameSize size{w->get<int>(), h->get<int>()};
    if (size.w <= 0 || size.h <= 0) {
        return std::nullopt;
    }
    return size;
}
}

PipelineConfig PipelineConfig::defaults() {
    return PipelineConfig{};
}

PipelineConfig PipelineConfig::from_json(const nlohmann::json* obj) {
    PipelineConfig config = defaults();
    if (!obj || !obj->is_object()) {
        return config;
    }
    if (auto it = obj->find("animations"); it != obj->end() && it->is_array()) {
        std::vector<std::string> animations;
        for (const auto& entry : *it) {
            if (entry.is_string() && !strings::is_blank(entry.get<std::string>())) {
                animations.push_back(strings::trim_copy(entry.get<std::string>()));
            }
        }
        if (!animations.empty()) {
            config.animations = std::move(animations);
        }
    }
    if (auto it = obj->find("zero_pad"); it != obj->end() && it->is_number_integer()) {
        config.zero_pad = it->get<int>();
    }
    if (auto it = obj->find("fps"); it != obj->end() && it->is_number_integer()) {
        config.fps = it->get<int>();
    }
    if (auto it = obj->find("orientation_dirs"); it != obj->end() && it->is_boolean()) {
        config.orientation_dirs = it->get<bool>();
    }
    if (auto it = obj->find("output_mode"); it != obj->end() && it->is_string()) {
        if (auto mode = parse_output_mode(it->get<std::string>())) {
            config.output_mode = *mode;
        } else {
            log::warn("[PipelineConfig] Unknown output_mode '" + it->get<std::string>() + "', keeping default");
        }
    }
    if (auto it = obj->find("frame_size"); it != obj->end()) {
        config.frame_size = read_frame_size(*it);
    }
    if (auto it = obj->find("slug"); it != obj->end() && it->is_string() && !strings::is_blank(it->get<std::string>())) {
        config.slug = strings::trim_copy(it->get<std::string>());
    }
    if (auto it = obj->find("z_order"); it != obj->end() && it->is_object()) {
        try {
            config.z_order = ZOrderTable::from_json(*it);
        } catch (const std::exception& ex) {
            log::warn(std::string("[PipelineConfig] Ignoring z_order: ") + ex.what());
        }
    }
    config.clamp();
    return config;
}

PipelineConfig PipelineConfig::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        log::debug("[PipelineConfig] No config at '" + path.generic_string() + "', using defaults");
        return defaults();
    }
    nlohmann::json doc;
    if (!json_io::load_json(path, doc)) {
        throw std::runtime_error("Unable to parse pipeline config '" + path.generic_string() + "'");
    }
    return from_json(&doc);
}

void PipelineConfig::clamp() {
    zero_pad = std::clamp(zero_pad, kMinZeroPad, kMaxZeroPad);
    fps = std::clamp(fps, kMinFps, kMaxFps);
}

void PipelineConfig::apply_to_json(nlohmann::json& obj) const {
    if (!obj.is_object()) {
        obj = nlohmann::json::object();
    }
    obj["animations"] = animations;
    obj["zero_pad"] = zero_pad;
    obj["fps"] = fps;
    obj["orientation_dirs"] = orientation_dirs;
    obj["output_mode"] = std::string(to_string(output_mode));
    obj["slug"] = slug;
    if (frame_size) {
        obj["frame_size"] = {{"w", frame_size->w}, {"h", frame_size->h}};
    } else {
        obj.erase("frame_size");
    }
}

void PipelineConfig::merge_build_output(const BuildOutput& output) {
    if (output.mode) output_mode = *output.mode;
    if (output.frame_size) frame_size = output.frame_size;
    if (output.zero_pad) zero_pad = *output.zero_pad;
    if (output.fps) fps = *output.fps;
    clamp();
}

bool PipelineConfig::writes_sheets() const {
    return output_mode != OutputMode::SplitByFrame;
}

bool PipelineConfig::writes_frames() const {
    return output_mode == OutputMode::SplitByFrame || output_mode == OutputMode::Both;
}

SliceOptions PipelineConfig::slice_options() const {
    SliceOptions options;
    options.zero_pad = zero_pad;
    options.fps = fps;
    options.orientation_dirs = orientation_dirs;
    options.slug = slug;
    return options;
}

ResolveOptions PipelineConfig::resolve_options() const {
    ResolveOptions options;
    options.animations = animations;
    return options;
}

}
