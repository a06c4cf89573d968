#include "resolve/selection.hpp"

#include <nlohmann/json.hpp>

#include "core/errors.hpp"

namespace charsheet {

using nlohmann::json;

const CategorySelection* SemanticSelection::find_category(const std::string& name) const {
    for (const auto& sel : categories) {
        if (sel.category == name) {
            return &sel;
        }
    }
    return nullptr;
}

SemanticSelection SemanticSelection::from_json(const json& value) {
    std::vector<FieldFailure> failures;
    SemanticSelection selection;

    if (!value.is_object()) {
        throw SelectionError({FieldFailure{"", "must be an object"}});
    }

    auto body_it = value.find("body_type");
    if (body_it != value.end() && body_it->is_string()) {
        if (auto parsed = body_types::parse(body_it->get<std::string>())) {
            selection.body_type = *parsed;
        } else {
            failures.push_back({"/body_type", "must be one of male, muscular, female, teen, child"});
        }
    } else {
        failures.push_back({"/body_type", "is required"});
    }

    auto head_it = value.find("head_type");
    if (head_it != value.end() && head_it->is_string() && !head_it->get<std::string>().empty()) {
        selection.head_type = head_it->get<std::string>();
    } else {
        failures.push_back({"/head_type", "must be a non-empty string"});
    }

    auto cats_it = value.find("categories");
    if (cats_it != value.end() && !cats_it->is_array()) {
        failures.push_back({"/categories", "must be an array"});
    } else if (cats_it != value.end()) {
        for (std::size_t i = 0; i < cats_it->size(); ++i) {
            const auto& raw = (*cats_it)[i];
            const std::string path = "/categories/" + std::to_string(i);
            if (!raw.is_object()) {
                failures.push_back({path, "must be an object"});
                continue;
            }
            CategorySelection sel;
            if (auto it = raw.find("category"); it != raw.end() && it->is_string() && !it->get<std::string>().empty()) {
                sel.category = it->get<std::string>();
            } else {
                failures.push_back({path + "/category", "must be a non-empty string"});
            }
            if (auto it = raw.find("preferred_colour"); it != raw.end() && !it->is_null()) {
                if (it->is_string()) {
                    sel.preferred_colour = it->get<std::string>();
                } else {
                    failures.push_back({path + "/preferred_colour", "must be a string"});
                }
            }
            if (auto it = raw.find("items"); it != raw.end()) {
                if (!it->is_array()) {
                    failures.push_back({path + "/items", "must be an array"});
                } else {
                    for (const auto& item : *it) {
                        if (item.is_string()) {
                            sel.items.push_back(item.get<std::string>());
                        } else {
                            failures.push_back({path + "/items", "must contain only strings"});
                            break;
                        }
                    }
                }
            }
            selection.categories.push_back(std::move(sel));
        }
    }

    if (!failures.empty()) {
        throw SelectionError(std::move(failures));
    }
    return selection;
}

json selection_to_json(const SemanticSelection& selection) {
    json cats = json::array();
    for (const auto& sel : selection.categories) {
        json entry = json{{"category", sel.category}, {"items", sel.items}};
        entry["preferred_colour"] = sel.preferred_colour ? json(*sel.preferred_colour) : json(nullptr);
        cats.push_back(std::move(entry));
    }
    return json{
        {"body_type", std::string(body_types::to_string(selection.body_type))},
        {"head_type", selection.head_type},
        {"categories", std::move(cats)},
    };
}

}
