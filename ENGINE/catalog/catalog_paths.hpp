#pragma once

#include <filesystem>
#include <vector>

namespace charsheet {

struct CatalogPaths {
    std::filesystem::path definitions;
    std::filesystem::path spritesheets;

    // Candidates, in order: $CHARSHEET_SHEET_DEFS, $ULPC_SHEET_DEFS, then the usual
    // locations under `root`. The spritesheet root is $CHARSHEET_SPRITES_ROOT or the
    // `spritesheets` directory beside the definitions. Throws CatalogError listing
    // every candidate when none exists.
    static CatalogPaths discover(const std::filesystem::path& root);

    static std::vector<std::filesystem::path> definition_candidates(const std::filesystem::path& root);
};

}
