#include "build/build.hpp"

#include <utility>

#include <nlohmann/json.hpp>

#include "core/errors.hpp"
#include "utils/color.hpp"
#include "utils/string_utils.hpp"

namespace charsheet {

using nlohmann::json;

std::string_view to_string(TintMode mode) {
    switch (mode) {
        case TintMode::Multiply: return "multiply";
        case TintMode::Screen:   return "screen";
        case TintMode::Overlay:  return "overlay";
        case TintMode::Replace:  return "replace";
    }
    return "multiply";
}

std::optional<TintMode> parse_tint_mode(std::string_view value) {
    const std::string lower = strings::to_lower_copy(std::string(value));
    if (lower == "multiply") return TintMode::Multiply;
    if (lower == "screen") return TintMode::Screen;
    if (lower == "overlay") return TintMode::Overlay;
    if (lower == "replace") return TintMode::Replace;
    return std::nullopt;
}

std::string_view to_string(OutputMode mode) {
    switch (mode) {
        case OutputMode::Full:             return "full";
        case OutputMode::SplitByAnimation: return "split_by_animation";
        case OutputMode::SplitByFrame:     return "split_by_frame";
        case OutputMode::Both:             return "both";
    }
    return "full";
}

std::optional<OutputMode> parse_output_mode(std::string_view value) {
    if (value == "full") return OutputMode::Full;
    if (value == "split_by_animation") return OutputMode::SplitByAnimation;
    if (value == "split_by_frame") return OutputMode::SplitByFrame;
    if (value == "both") return OutputMode::Both;
    return std::nullopt;
}

bool Layer::is_body() const {
    return strings::starts_with(category, kBodyNamespace);
}

bool Layer::is_head() const {
    return strings::starts_with(category, kHeadNamespace);
}

namespace {

class FailureCollector {
public:
    void add(std::string path, std::string message) {
        failures_.push_back(FieldFailure{std::move(path), std::move(message)});
    }
    bool empty() const { return failures_.empty(); }
    std::vector<FieldFailure> take() { return std::move(failures_); }

private:
    std::vector<FieldFailure> failures_;
};

std::optional<int> read_int(const json& obj, const char* key, const std::string& path, FailureCollector& failures) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return std::nullopt;
    }
    if (!it->is_number_integer()) {
        failures.add(path + "/" + key, "must be an integer");
        return std::nullopt;
    }
    return it->get<int>();
}

Layer parse_layer(const json& raw, const std::string& path, FailureCollector& failures) {
    Layer layer;
    if (!raw.is_object()) {
        failures.add(path, "must be an object");
        return layer;
    }
    if (auto it = raw.find("category"); it != raw.end() && it->is_string() && !it->get<std::string>().empty()) {
        layer.category = it->get<std::string>();
    } else {
        failures.add(path + "/category", "must be a non-empty string");
    }
    if (auto it = raw.find("variant"); it != raw.end() && it->is_string() && !it->get<std::string>().empty()) {
        layer.variant = it->get<std::string>();
    } else {
        failures.add(path + "/variant", "must be a non-empty string");
    }
    if (auto it = raw.find("visible"); it != raw.end()) {
        if (it->is_boolean()) {
            layer.visible = it->get<bool>();
        } else {
            failures.add(path + "/visible", "must be a boolean");
        }
    }
    layer.z_override = read_int(raw, "z_override", path, failures);
    if (auto it = raw.find("offset"); it != raw.end()) {
        if (it->is_object()) {
            LayerOffset offset;
            offset.x = read_int(*it, "x", path + "/offset", failures).value_or(0);
            offset.y = read_int(*it, "y", path + "/offset", failures).value_or(0);
            layer.offset = offset;
        } else {
            failures.add(path + "/offset", "must be an object");
        }
    }
    if (auto color_it = raw.find("color"); color_it != raw.end()) {
        if (!color_it->is_object()) {
            failures.add(path + "/color", "must be an object");
        } else if (auto tint_it = color_it->find("tint"); tint_it != color_it->end()) {
            const std::string tint_path = path + "/color/tint";
            if (!tint_it->is_object()) {
                failures.add(tint_path, "must be an object");
            } else {
                LayerTint tint;
                bool ok = true;
                if (auto rgb = tint_it->find("rgb"); rgb != tint_it->end()) {
                    if (rgb->is_string() && color::parse_hex_color(rgb->get<std::string>())) {
                        tint.rgb = rgb->get<std::string>();
                    } else {
                        failures.add(tint_path + "/rgb", "must be a #rrggbb colour");
                        ok = false;
                    }
                }
                if (auto mode = tint_it->find("mode"); mode != tint_it->end()) {
                    auto parsed = mode->is_string() ? parse_tint_mode(mode->get<std::string>()) : std::nullopt;
                    if (parsed) {
                        tint.mode = *parsed;
                    } else {
                        failures.add(tint_path + "/mode", "must be one of multiply, screen, overlay, replace");
                        ok = false;
                    }
                }
                if (ok && !tint.rgb.empty()) {
                    layer.tint = tint;
                }
            }
        }
    }
    return layer;
}

BuildOutput parse_output(const json& raw, FailureCollector& failures) {
    BuildOutput output;
    if (auto it = raw.find("mode"); it != raw.end()) {
        auto parsed = it->is_string() ? parse_output_mode(it->get<std::string>()) : std::nullopt;
        if (parsed) {
            output.mode = *parsed;
        } else {
            failures.add("/output/mode", "must be one of full, split_by_animation, split_by_frame, both");
        }
    }
    if (auto it = raw.find("frame_size"); it != raw.end()) {
        const auto w = it->is_object() ? read_int(*it, "w", "/output/frame_size", failures) : std::nullopt;
        const auto h = it->is_object() ? read_int(*it, "h", "/output/frame_size", failures) : std::nullopt;
        if (w && h && *w > 0 && *h > 0) {
            output.frame_size = FrameSize{*w, *h};
        } else {
            failures.add("/output/frame_size", "must be an object with positive integer w and h");
        }
    }
    output.zero_pad = read_int(raw, "zero_pad", "/output", failures);
    output.fps = read_int(raw, "fps", "/output", failures);
    return output;
}

}

Layer* Build::body_layer() {
    return const_cast<Layer*>(static_cast<const Build&>(*this).body_layer());
}

Layer* Build::head_layer() {
    return const_cast<Layer*>(static_cast<const Build&>(*this).head_layer());
}

const Layer* Build::body_layer() const {
    for (const auto& layer : layers) {
        if (layer.is_body()) return &layer;
    }
    return nullptr;
}

const Layer* Build::head_layer() const {
    for (const auto& layer : layers) {
        if (layer.is_head()) return &layer;
    }
    return nullptr;
}

bool Build::operator==(const Build& other) const {
    return build_to_json(*this) == build_to_json(other);
}

json build_to_json(const Build& build) {
    json out = json::object();
    out["schema"] = build.schema;
    out["generator"] = json{{"project", build.generator.project}, {"version", build.generator.version}};
    out["animations"] = build.animations;
    json layers = json::array();
    for (const auto& layer : build.layers) {
        json entry = json{{"category", layer.category}, {"variant", layer.variant}};
        if (layer.visible) entry["visible"] = *layer.visible;
        if (layer.z_override) entry["z_override"] = *layer.z_override;
        if (layer.offset) entry["offset"] = json{{"x", layer.offset->x}, {"y", layer.offset->y}};
        if (layer.tint) {
            entry["color"] = json{{"tint", json{{"rgb", layer.tint->rgb}, {"mode", std::string(to_string(layer.tint->mode))}}}};
        }
        layers.push_back(std::move(entry));
    }
    out["layers"] = std::move(layers);
    if (build.output) {
        json output = json::object();
        if (build.output->mode) output["mode"] = std::string(to_string(*build.output->mode));
        if (build.output->frame_size) output["frame_size"] = json{{"w", build.output->frame_size->w}, {"h", build.output->frame_size->h}};
        if (build.output->zero_pad) output["zero_pad"] = *build.output->zero_pad;
        if (build.output->fps) output["fps"] = *build.output->fps;
        out["output"] = std::move(output);
    }
    return out;
}

Build build_from_json(const json& value) {
    FailureCollector failures;
    Build build;
    if (!value.is_object()) {
        failures.add("", "must be an object");
        throw BuildValidationError(failures.take());
    }

    if (auto it = value.find("schema"); it != value.end() && it->is_string() && it->get<std::string>() == kBuildSchema) {
        build.schema = it->get<std::string>();
    } else {
        failures.add("/schema", std::string("must equal \"") + std::string(kBuildSchema) + "\"");
    }

    if (auto it = value.find("generator"); it != value.end()) {
        if (it->is_object()) {
            for (const char* key : {"project", "version"}) {
                auto field = it->find(key);
                if (field == it->end()) {
                    continue;
                }
                if (!field->is_string()) {
                    failures.add(std::string("/generator/") + key, "must be a string");
                    continue;
                }
                (std::string(key) == "project" ? build.generator.project : build.generator.version) = field->get<std::string>();
            }
        } else {
            failures.add("/generator", "must be an object");
        }
    }

    if (auto it = value.find("animations"); it != value.end()) {
        if (it->is_array()) {
            for (std::size_t i = 0; i < it->size(); ++i) {
                const auto& anim = (*it)[i];
                if (anim.is_string() && !anim.get<std::string>().empty()) {
                    build.animations.push_back(anim.get<std::string>());
                } else {
                    failures.add("/animations/" + std::to_string(i), "must be a non-empty string");
                }
            }
        } else {
            failures.add("/animations", "must be an array");
        }
    }

    auto layers_it = value.find("layers");
    if (layers_it == value.end() || !layers_it->is_array()) {
        failures.add("/layers", "must be an array");
    } else {
        for (std::size_t i = 0; i < layers_it->size(); ++i) {
            build.layers.push_back(parse_layer((*layers_it)[i], "/layers/" + std::to_string(i), failures));
        }
    }

    if (auto it = value.find("output"); it != value.end()) {
        if (it->is_object()) {
            build.output = parse_output(*it, failures);
        } else {
            failures.add("/output", "must be an object");
        }
    }

    if (!failures.empty()) {
        throw BuildValidationError(failures.take());
    }
    return build;
}

}
