#include "catalog/sheet_definition.hpp"

#include <algorithm>

#include "utils/string_utils.hpp"

namespace charsheet {

namespace {

void set_problem(std::string* problem, const std::string& text) {
    if (problem) {
        *problem = text;
    }
}

}

std::optional<SheetDefinition> SheetDefinition::from_json(const nlohmann::json& value,
                                                          const std::string& file,
                                                          std::string* problem) {
    if (!value.is_object()) {
        set_problem(problem, "not_an_object");
        return std::nullopt;
    }

    SheetDefinition def;
    def.file = file;
    def.raw = value;

    if (auto it = value.find("name"); it != value.end() && it->is_string()) {
        def.name = it->get<std::string>();
    }

    auto layer_it = value.find("layer_1");
    if (layer_it == value.end() || !layer_it->is_object()) {
        set_problem(problem, "missing_layer_1");
        return std::nullopt;
    }
    for (auto it = layer_it->begin(); it != layer_it->end(); ++it) {
        if (it.value().is_string()) {
            def.layer_1[it.key()] = it.value().get<std::string>();
        }
    }

    auto variants_it = value.find("variants");
    if (variants_it == value.end() || !variants_it->is_array()) {
        set_problem(problem, "missing_variants");
        return std::nullopt;
    }
    for (const auto& entry : *variants_it) {
        if (entry.is_string()) {
            def.variants.push_back(entry.get<std::string>());
        }
    }

    if (auto it = value.find("animations"); it != value.end() && it->is_array()) {
        for (const auto& entry : *it) {
            if (entry.is_string()) {
                def.animations.push_back(entry.get<std::string>());
            }
        }
    }

    return def;
}

std::optional<std::string> SheetDefinition::category_path(BodyType body_type) const {
    auto it = layer_1.find(std::string(body_types::to_string(body_type)));
    if (it == layer_1.end() && body_type == BodyType::Child) {
        it = layer_1.find(std::string(body_types::teen));
    }
    if (it == layer_1.end()) {
        return std::nullopt;
    }
    std::string path = strings::strip_trailing_slashes(it->second);
    if (path.empty()) {
        return std::nullopt;
    }
    return path;
}

std::vector<std::string> SheetDefinition::all_category_paths() const {
    std::vector<std::string> paths;
    for (const auto& [body, raw_path] : layer_1) {
        std::string path = strings::strip_trailing_slashes(raw_path);
        if (!path.empty() && std::find(paths.begin(), paths.end(), path) == paths.end()) {
            paths.push_back(std::move(path));
        }
    }
    return paths;
}

bool SheetDefinition::supports_animation(const std::string& animation) const {
    if (animations.empty()) {
        return true;
    }
    return std::find(animations.begin(), animations.end(), animation) != animations.end();
}

}
