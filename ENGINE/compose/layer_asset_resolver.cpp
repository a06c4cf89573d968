#include "compose/layer_asset_resolver.hpp"

#include <system_error>

#include "core/errors.hpp"
#include "utils/json_io.hpp"
#include "utils/string_utils.hpp"

namespace charsheet {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

bool is_file(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

bool has_image_extension(const fs::path& p) {
    const std::string ext = strings::to_lower_copy(p.extension().string());
    return ext == ".png";
}

fs::path absolute_from(const fs::path& json_file, const fs::path& fallback_root, const std::string& rel) {
    const fs::path candidate(rel);
    if (candidate.is_absolute()) {
        return candidate;
    }
    const fs::path beside = json_file.parent_path() / candidate;
    if (is_file(beside)) {
        return beside;
    }
    return fallback_root / candidate;
}

std::optional<fs::path> png_from_json(const fs::path& json_file, const fs::path& fallback_root, const json& obj) {
    if (!obj.is_object()) {
        return std::nullopt;
    }
    std::vector<std::string> fields;
    for (const char* key : {"file", "png", "path", "image"}) {
        auto it = obj.find(key);
        if (it != obj.end() && it->is_string()) {
            fields.push_back(it->get<std::string>());
        }
        if (std::string(key) == "file") {
            auto files = obj.find("files");
            if (files != obj.end() && files->is_array() && !files->empty() && files->front().is_string()) {
                fields.push_back(files->front().get<std::string>());
            }
        }
    }
    for (const auto& rel : fields) {
        const fs::path abs = absolute_from(json_file, fallback_root, rel);
        if (has_image_extension(abs) && is_file(abs)) {
            return abs;
        }
    }
    return std::nullopt;
}

bool variant_entry_matches(const json& entry, const std::string& variant) {
    if (!entry.is_object()) {
        return false;
    }
    for (const char* key : {"id", "name", "file"}) {
        auto it = entry.find(key);
        if (it != entry.end() && it->is_string()) {
            const std::string value = it->get<std::string>();
            if (value == variant || value == variant + ".png") {
                return true;
            }
        }
    }
    return false;
}

std::string trim_variant_suffix(std::string category, const std::string& variant) {
    category = strings::strip_trailing_slashes(std::move(category));
    const std::string suffix = "/" + strings::to_lower_copy(variant);
    if (strings::ends_with(strings::to_lower_copy(category), suffix)) {
        category.resize(category.size() - suffix.size());
    }
    return category;
}

}

LayerAssetResolver::LayerAssetResolver(fs::path definitions_dir, fs::path spritesheets_dir)
    : definitions_dir_(std::move(definitions_dir)),
      spritesheets_dir_(std::move(spritesheets_dir)) {}

std::vector<json> LayerAssetResolver::read_metadata(const fs::path& category_dir, const std::string& variant) const {
    std::vector<json> docs;
    for (const fs::path& candidate : {category_dir / (variant + ".json"), category_dir / "index.json"}) {
        if (auto doc = json_io::load_json(candidate); doc && doc->is_object()) {
            docs.push_back(std::move(*doc));
        }
    }
    return docs;
}

LayerAsset LayerAssetResolver::resolve(const std::string& category_in,
                                       const std::string& variant,
                                       const std::string& animation) const {
    const std::string category = trim_variant_suffix(category_in, variant);
    const fs::path category_defs = definitions_dir_ / fs::path(category);
    const fs::path category_sprites = spritesheets_dir_ / fs::path(category);

    LayerAsset asset;
    asset.metadata = read_metadata(category_defs, variant);

    const fs::path per_animation = category_sprites / animation / (variant + ".png");
    if (is_file(per_animation)) {
        asset.image = per_animation;
        return asset;
    }

    const fs::path direct_json = category_defs / (variant + ".json");
    if (auto doc = json_io::load_json(direct_json)) {
        if (auto png = png_from_json(direct_json, spritesheets_dir_, *doc)) {
            asset.image = *png;
            return asset;
        }
    }

    const fs::path index_json = category_defs / "index.json";
    if (auto index = json_io::load_json(index_json); index && index->is_object()) {
        auto variants = index->find("variants");
        if (variants != index->end() && variants->is_array()) {
            for (const auto& entry : *variants) {
                if (!variant_entry_matches(entry, variant)) {
                    continue;
                }
                auto per_anim = entry.find("animations");
                if (per_anim != entry.end() && per_anim->is_object() && per_anim->contains(animation)) {
                    if (auto png = png_from_json(index_json, spritesheets_dir_, (*per_anim)[animation])) {
                        asset.image = *png;
                        return asset;
                    }
                }
                if (auto png = png_from_json(index_json, spritesheets_dir_, entry)) {
                    asset.image = *png;
                    return asset;
                }
                break;
            }
        }
    }

    const fs::path flat = category_sprites / (variant + ".png");
    if (is_file(flat)) {
        asset.image = flat;
        return asset;
    }

    throw AssetResolutionError("Unable to resolve image for " + category + "/" + variant + " (animation=" + animation + ")");
}

}
