#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace charsheet {

struct LayerAsset {
    std::filesystem::path image;
    // Grid metadata documents found beside the asset, most specific first.
    std::vector<nlohmann::json> metadata;
};

// Maps (category, variant, animation) onto an image in the external asset tree.
class LayerAssetResolver {
public:
    LayerAssetResolver(std::filesystem::path definitions_dir, std::filesystem::path spritesheets_dir);

    // Lookup order:
    //   <sprites>/<category>/<animation>/<variant>.png
    //   <defs>/<category>/<variant>.json naming a png (file|files[0]|png|path|image)
    //   <defs>/<category>/index.json variants[] entry matching id|name|file
    //   <sprites>/<category>/<variant>.png
    // Throws AssetResolutionError when nothing matches.
    LayerAsset resolve(const std::string& category, const std::string& variant, const std::string& animation) const;

    const std::filesystem::path& definitions_dir() const { return definitions_dir_; }
    const std::filesystem::path& spritesheets_dir() const { return spritesheets_dir_; }

private:
    std::vector<nlohmann::json> read_metadata(const std::filesystem::path& category_dir, const std::string& variant) const;

    std::filesystem::path definitions_dir_;
    std::filesystem::path spritesheets_dir_;
};

}
