#include "validate/variant_contract.hpp"

#include <system_error>

#include "catalog/sheet_catalog.hpp"
#include "utils/log.hpp"
#include "utils/string_utils.hpp"

namespace charsheet {

namespace fs = std::filesystem;

void VariantContract::allow(const std::string& category, const std::string& variant) {
    allowed_[category].insert(variant);
}

void VariantContract::allow_all(const std::string& category, const std::vector<std::string>& variants) {
    auto& slot = allowed_[category];
    slot.insert(variants.begin(), variants.end());
}

void VariantContract::merge(const VariantContract& other) {
    for (const auto& [category, variants] : other.allowed_) {
        allowed_[category].insert(variants.begin(), variants.end());
    }
}

bool VariantContract::knows_category(const std::string& category) const {
    return allowed_.find(category) != allowed_.end();
}

bool VariantContract::allows(const std::string& category, const std::string& variant) const {
    const auto* variants = variants_for(category);
    return variants && variants->count(variant) > 0;
}

const std::set<std::string>* VariantContract::variants_for(const std::string& category) const {
    auto it = allowed_.find(category);
    return it == allowed_.end() ? nullptr : &it->second;
}

VariantContract VariantContract::from_catalog(const SheetCatalog& catalog) {
    VariantContract contract;
    for (const auto& [file, def] : catalog.all()) {
        for (const auto& path : def.all_category_paths()) {
            contract.allow_all(path, def.variants);
        }
    }
    log::debug("[VariantContract] " + std::to_string(contract.category_count()) + " categories from catalog");
    return contract;
}

VariantContract VariantContract::from_spritesheets(const fs::path& root) {
    VariantContract contract;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        log::warn("[VariantContract] Spritesheet root '" + root.generic_string() + "' not found");
        return contract;
    }
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    fs::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        const fs::path& path = it->path();
        if (strings::to_lower_copy(path.extension().string()) != ".png") {
            continue;
        }
        const fs::path rel = path.lexically_relative(root);
        std::vector<std::string> parts;
        for (const auto& part : rel) {
            parts.push_back(part.generic_string());
        }
        if (parts.size() < 3) {
            continue;
        }
        std::string category;
        for (std::size_t i = 0; i + 2 < parts.size(); ++i) {
            if (!category.empty()) {
                category += '/';
            }
            category += parts[i];
        }
        contract.allow(category, path.stem().string());
    }
    if (ec) {
        log::warn("[VariantContract] Error scanning '" + root.generic_string() + "': " + ec.message());
    }
    log::debug("[VariantContract] " + std::to_string(contract.category_count()) + " categories from spritesheets");
    return contract;
}

}
