#include "validate/build_validator.hpp"

#include <sstream>

#include "utils/color.hpp"
#include "utils/log.hpp"

namespace charsheet {

namespace {

std::string layer_path(std::size_t index, const char* field) {
    return "/layers/" + std::to_string(index) + "/" + field;
}

std::string join_set(const std::set<std::string>& values) {
    std::string out;
    for (const auto& v : values) {
        if (!out.empty()) {
            out += ", ";
        }
        out += v;
    }
    return out;
}

std::optional<FieldFailure> head_body_failure(const Build& build) {
    const Layer* body = build.body_layer();
    const Layer* head = build.head_layer();
    if (!body || !head || body->variant == head->variant) {
        return std::nullopt;
    }
    std::ostringstream oss;
    oss << "head/body variant mismatch: head=\"" << head->variant << "\" must equal body=\"" << body->variant
        << "\"; the body colour is the single source of truth";
    return FieldFailure{"/layers", oss.str()};
}

}

BuildValidator::BuildValidator(const VariantContract& contract)
    : contract_(contract) {}

void BuildValidator::check_shape(const Build& build, std::vector<FieldFailure>& failures) const {
    if (build.schema != kBuildSchema) {
        failures.push_back({"/schema", "must equal \"" + std::string(kBuildSchema) + "\""});
    }
    if (build.generator.project.empty()) {
        failures.push_back({"/generator/project", "must be a non-empty string"});
    }
    if (build.animations.empty()) {
        failures.push_back({"/animations", "must list at least one animation"});
    }
    for (std::size_t i = 0; i < build.animations.size(); ++i) {
        if (build.animations[i].empty()) {
            failures.push_back({"/animations/" + std::to_string(i), "must be a non-empty string"});
        }
    }
    if (build.layers.empty()) {
        failures.push_back({"/layers", "must contain at least one layer"});
    }

    int body_count = 0;
    int head_count = 0;
    for (std::size_t i = 0; i < build.layers.size(); ++i) {
        const Layer& layer = build.layers[i];
        if (layer.is_body()) ++body_count;
        if (layer.is_head()) ++head_count;

        const auto* allowed = contract_.variants_for(layer.category);
        if (!allowed) {
            failures.push_back({layer_path(i, "category"), "\"" + layer.category + "\" is not a known category"});
        } else if (allowed->count(layer.variant) == 0) {
            failures.push_back({layer_path(i, "variant"),
                                "\"" + layer.variant + "\" is not an allowed variant for category \"" +
                                    layer.category + "\" (allowed: " + join_set(*allowed) + ")"});
        }
        if (layer.tint && !color::parse_hex_color(layer.tint->rgb)) {
            failures.push_back({layer_path(i, "color"), "tint rgb must be a #rrggbb colour"});
        }
    }
    if (body_count != 1) {
        failures.push_back({"/layers", "must contain exactly one body layer (found " + std::to_string(body_count) + ")"});
    }
    if (head_count != 1) {
        failures.push_back({"/layers", "must contain exactly one head layer (found " + std::to_string(head_count) + ")"});
    }
}

std::vector<FieldFailure> BuildValidator::check(const Build& build) const {
    std::vector<FieldFailure> failures;
    check_shape(build, failures);
    if (auto mismatch = head_body_failure(build)) {
        failures.push_back(std::move(*mismatch));
    }
    return failures;
}

void BuildValidator::validate(const Build& build) const {
    auto failures = check(build);
    if (failures.empty()) {
        return;
    }
    BuildValidationError error(std::move(failures));
    log::error(std::string("[BuildValidator] ") + error.what());
    throw error;
}

void assert_head_body_variant_equal(const Build& build) {
    if (auto mismatch = head_body_failure(build)) {
        throw BuildValidationError({std::move(*mismatch)});
    }
}

}
