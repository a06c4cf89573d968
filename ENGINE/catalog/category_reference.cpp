#include "catalog/category_reference.hpp"

#include <utility>

#include <nlohmann/json.hpp>

#include "core/errors.hpp"
#include "utils/json_io.hpp"

namespace charsheet {

CategoryReference::CategoryReference(std::vector<CategoryReferenceEntry> entries)
    : entries_(std::move(entries)) {}

CategoryReference CategoryReference::from_json(const nlohmann::json& value) {
    if (!value.is_array()) {
        throw CatalogError("category_reference_not_array");
    }
    std::vector<CategoryReferenceEntry> entries;
    entries.reserve(value.size());
    for (const auto& raw : value) {
        if (!raw.is_object() || !raw.contains("category") || !raw["category"].is_string() ||
            !raw.contains("items") || !raw["items"].is_array()) {
            throw CatalogError("category_reference_invalid_shape");
        }
        CategoryReferenceEntry entry;
        entry.category = raw["category"].get<std::string>();
        for (const auto& item : raw["items"]) {
            if (!item.is_string()) {
                throw CatalogError("category_reference_invalid_shape");
            }
            entry.items.push_back(item.get<std::string>());
        }
        if (auto it = raw.find("required"); it != raw.end() && it->is_boolean()) {
            entry.required = it->get<bool>();
        }
        entries.push_back(std::move(entry));
    }
    return CategoryReference(std::move(entries));
}

CategoryReference CategoryReference::load(const std::filesystem::path& path) {
    nlohmann::json document;
    if (!json_io::load_json(path, document)) {
        throw CatalogError("Unable to read category reference '" + path.generic_string() + "'");
    }
    return from_json(document);
}

const CategoryReferenceEntry* CategoryReference::find(const std::string& category) const {
    // Later entries win, matching a map built front to back.
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->category == category) {
            return &*it;
        }
    }
    return nullptr;
}

}
