#include "catalog/catalog_paths.hpp"

#include <cstdlib>
#include <sstream>
#include <system_error>

#include "core/errors.hpp"
#include "utils/log.hpp"

namespace charsheet {

namespace fs = std::filesystem;

namespace {

void push_env(std::vector<fs::path>& out, const char* name) {
    const char* value = std::getenv(name);
    if (value && *value) {
        out.emplace_back(value);
    }
}

}

std::vector<fs::path> CatalogPaths::definition_candidates(const fs::path& root) {
    std::vector<fs::path> candidates;
    push_env(candidates, "CHARSHEET_SHEET_DEFS");
    push_env(candidates, "ULPC_SHEET_DEFS");
    candidates.push_back(root / "assets" / "ulpc" / "sheet_definitions");
    candidates.push_back(root / "assets" / "sheet_definitions");
    candidates.push_back(root / "sheet_definitions");
    return candidates;
}

CatalogPaths CatalogPaths::discover(const fs::path& root) {
    const auto candidates = definition_candidates(root);
    CatalogPaths paths;
    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (fs::is_directory(candidate, ec)) {
            paths.definitions = candidate;
            break;
        }
    }
    if (paths.definitions.empty()) {
        std::ostringstream oss;
        oss << "Sheet definitions not found. Tried:";
        for (const auto& candidate : candidates) {
            oss << "\n - " << candidate.generic_string();
        }
        oss << "\nSet CHARSHEET_SHEET_DEFS to the sheet_definitions directory.";
        throw CatalogError(oss.str());
    }

    if (const char* sprites = std::getenv("CHARSHEET_SPRITES_ROOT"); sprites && *sprites) {
        paths.spritesheets = sprites;
    } else {
        paths.spritesheets = paths.definitions.parent_path() / "spritesheets";
    }
    log::debug("[CatalogPaths] definitions=" + paths.definitions.generic_string() +
               " spritesheets=" + paths.spritesheets.generic_string());
    return paths;
}

}
