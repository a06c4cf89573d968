#pragma once

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace charsheet {

class SheetCatalog;

// Category path -> allowed variant identifiers. Variant validity is only meaningful
// relative to a category.
class VariantContract {
public:
    void allow(const std::string& category, const std::string& variant);
    void allow_all(const std::string& category, const std::vector<std::string>& variants);
    void merge(const VariantContract& other);

    bool knows_category(const std::string& category) const;
    bool allows(const std::string& category, const std::string& variant) const;
    const std::set<std::string>* variants_for(const std::string& category) const;

    std::size_t category_count() const { return allowed_.size(); }
    const std::map<std::string, std::set<std::string>>& all() const { return allowed_; }

    // Every definition's layer_1 paths mapped to its variants.
    static VariantContract from_catalog(const SheetCatalog& catalog);

    // <root>/<category...>/<animation>/<variant>.png, variants unioned across animations.
    static VariantContract from_spritesheets(const std::filesystem::path& root);

private:
    std::map<std::string, std::set<std::string>> allowed_;
};

}
