#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "catalog/body_type.hpp"

namespace charsheet {

// One asset definition file: `{ name?, layer_1: {<body_type>: <path>}, variants: [], animations?: [] }`.
struct SheetDefinition {
    std::string file;
    std::optional<std::string> name;
    std::map<std::string, std::string> layer_1;
    std::vector<std::string> variants;
    std::vector<std::string> animations;
    nlohmann::json raw;

    // Returns nullopt and fills `problem` when the document does not have the definition shape.
    static std::optional<SheetDefinition> from_json(const nlohmann::json& value,
                                                    const std::string& file,
                                                    std::string* problem = nullptr);

    // Category path for a body type with trailing slashes stripped; `child` falls back to `teen`.
    std::optional<std::string> category_path(BodyType body_type) const;

    std::vector<std::string> all_category_paths() const;

    bool supports_animation(const std::string& animation) const;
};

}
