#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "catalog/body_type.hpp"

namespace charsheet {

struct CategorySelection {
    std::string category;
    std::optional<std::string> preferred_colour;
    std::vector<std::string> items;
};

// Caller-authored character description. Immutable once handed to the resolver.
struct SemanticSelection {
    BodyType body_type = BodyType::Male;
    std::string head_type;
    std::vector<CategorySelection> categories;

    const CategorySelection* find_category(const std::string& name) const;

    // Validates the untyped document into the strict record. Throws SelectionError.
    static SemanticSelection from_json(const nlohmann::json& value);
};

nlohmann::json selection_to_json(const SemanticSelection& selection);

}
