#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace charsheet {

struct CategoryReferenceEntry {
    std::string category;
    std::vector<std::string> items;
    bool required = false;
};

// Category name -> item definition files that may satisfy it, in preference order.
class CategoryReference {
public:
    CategoryReference() = default;
    explicit CategoryReference(std::vector<CategoryReferenceEntry> entries);

    // Throws CatalogError ("category_reference_not_array" / "category_reference_invalid_shape").
    static CategoryReference from_json(const nlohmann::json& value);
    static CategoryReference load(const std::filesystem::path& path);

    const CategoryReferenceEntry* find(const std::string& category) const;
    const std::vector<CategoryReferenceEntry>& entries() const { return entries_; }

private:
    std::vector<CategoryReferenceEntry> entries_;
};

}
