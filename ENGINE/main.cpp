#include <SDL.h>
#include <SDL_image.h>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "catalog/catalog_paths.hpp"
#include "catalog/category_reference.hpp"
#include "catalog/color_dictionary.hpp"
#include "catalog/sheet_catalog.hpp"
#include "compose/layer_asset_resolver.hpp"
#include "config/pipeline_config.hpp"
#include "core/errors.hpp"
#include "pipeline/sprite_pipeline.hpp"
#include "resolve/resolver.hpp"
#include "resolve/selection.hpp"
#include "utils/json_io.hpp"
#include "utils/log.hpp"
#include "validate/build_validator.hpp"
#include "validate/variant_contract.hpp"

namespace fs = std::filesystem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailure = 2;

struct CliArgs {
        fs::path selection;
        fs::path out_dir;
        std::optional<fs::path> defs;
        std::optional<fs::path> sprites;
        std::optional<fs::path> reference;
        std::optional<fs::path> colors;
        std::optional<fs::path> config;
};

void print_usage(const char* argv0) {
        std::cerr << "Usage: " << (argv0 ? argv0 : "charsheet")
                  << " <selection.json> <out_dir> [--defs DIR] [--sprites DIR]"
                     " [--reference FILE] [--colors FILE] [--config FILE]\n";
}

std::optional<CliArgs> parse_args(int argc, char* argv[]) {
        CliArgs args;
        int positional = 0;
        for (int i = 1; i < argc; ++i) {
                const std::string arg = argv[i] ? argv[i] : "";
                auto take_value = [&](std::optional<fs::path>& slot) {
                        if (i + 1 >= argc) {
                                charsheet::log::error("[Main] Missing value for " + arg);
                                return false;
                        }
                        slot = fs::path(argv[++i]);
                        return true;
                };
                bool ok = true;
                if (arg == "--defs") {
                        ok = take_value(args.defs);
                } else if (arg == "--sprites") {
                        ok = take_value(args.sprites);
                } else if (arg == "--reference") {
                        ok = take_value(args.reference);
                } else if (arg == "--colors") {
                        ok = take_value(args.colors);
                } else if (arg == "--config") {
                        ok = take_value(args.config);
                } else if (!arg.empty() && arg[0] == '-') {
                        charsheet::log::error("[Main] Unknown option " + arg);
                        ok = false;
                } else if (positional == 0) {
                        args.selection = arg;
                        ++positional;
                } else if (positional == 1) {
                        args.out_dir = arg;
                        ++positional;
                } else {
                        charsheet::log::error("[Main] Unexpected argument " + arg);
                        ok = false;
                }
                if (!ok) {
                        return std::nullopt;
                }
        }
        if (positional != 2) {
                return std::nullopt;
        }
        return args;
}

fs::path project_root() {
#ifdef PROJECT_ROOT
        return fs::path(PROJECT_ROOT);
#else
        return fs::current_path();
#endif
}

charsheet::CatalogPaths locate_catalog(const CliArgs& args) {
        charsheet::CatalogPaths paths;
        if (args.defs) {
                if (!fs::is_directory(*args.defs)) {
                        throw charsheet::CatalogError("Sheet definitions directory '" + args.defs->generic_string() + "' not found");
                }
                paths.definitions = *args.defs;
                paths.spritesheets = paths.definitions.parent_path() / "spritesheets";
        } else {
                paths = charsheet::CatalogPaths::discover(project_root());
        }
        if (args.sprites) {
                paths.spritesheets = *args.sprites;
        }
        return paths;
}

charsheet::ColorDictionary load_colors(const CliArgs& args) {
        if (args.colors) {
                return charsheet::ColorDictionary::load(*args.colors);
        }
        const fs::path bundled = project_root() / "data" / "color_dictionary.v1.json";
        if (fs::exists(bundled)) {
                return charsheet::ColorDictionary::load(bundled);
        }
        charsheet::log::info("[Main] No colour dictionary; only direct colour matches will resolve");
        return charsheet::ColorDictionary{};
}

int run(const CliArgs& args) {
        const auto selection_json = charsheet::json_io::load_json(args.selection);
        if (!selection_json) {
                charsheet::log::error("[Main] Unable to read selection '" + args.selection.generic_string() + "'");
                return kExitFailure;
        }
        const charsheet::SemanticSelection selection = charsheet::SemanticSelection::from_json(*selection_json);

        const charsheet::CatalogPaths paths = locate_catalog(args);
        const charsheet::SheetCatalog catalog(paths.definitions);
        const fs::path reference_path =
                args.reference ? *args.reference : paths.definitions.parent_path() / "category_reference.json";
        const charsheet::CategoryReference reference = charsheet::CategoryReference::load(reference_path);
        const charsheet::ColorDictionary colors = load_colors(args);
        const charsheet::PipelineConfig config =
                args.config ? charsheet::PipelineConfig::load(*args.config) : charsheet::PipelineConfig::defaults();

        charsheet::VariantContract contract = charsheet::VariantContract::from_catalog(catalog);
        contract.merge(charsheet::VariantContract::from_spritesheets(paths.spritesheets));

        const charsheet::Resolver resolver(catalog, reference, colors);
        const charsheet::BuildValidator validator(contract);
        const charsheet::LayerAssetResolver assets(paths.definitions, paths.spritesheets);
        const charsheet::SpritePipeline pipeline(resolver, validator, assets);

        const charsheet::PipelineResult result = pipeline.run(selection, config, args.out_dir);
        for (const auto& name : result.unknown_categories) {
                charsheet::log::warn("[Main] Category '" + name + "' is not in the category reference");
        }
        charsheet::log::info("[Main] Done: " + std::to_string(result.build.layers.size()) + " layers, " +
                             std::to_string(result.written.size()) + " files in '" + args.out_dir.generic_string() + "'");
        return kExitOk;
}

}

int main(int argc, char* argv[]) {
        const std::optional<CliArgs> args = parse_args(argc, argv);
        if (!args) {
                print_usage(argc > 0 ? argv[0] : nullptr);
                return kExitUsage;
        }

        if (SDL_Init(0) < 0) {
                charsheet::log::error(std::string("SDL_Init failed: ") + SDL_GetError());
                return kExitFailure;
        }
        if (!(IMG_Init(IMG_INIT_PNG) & IMG_INIT_PNG)) {
                charsheet::log::error(std::string("IMG_Init failed: ") + IMG_GetError());
                SDL_Quit();
                return kExitFailure;
        }

        int code = kExitFailure;
        try {
                code = run(*args);
        } catch (const charsheet::BuildValidationError& ex) {
                charsheet::log::error(std::string("[Main] ") + ex.what());
        } catch (const charsheet::ResolutionError& ex) {
                charsheet::log::error(std::string("[Main] Resolution failed: ") + ex.what());
        } catch (const charsheet::SelectionError& ex) {
                charsheet::log::error(std::string("[Main] ") + ex.what());
        } catch (const std::exception& ex) {
                charsheet::log::error(std::string("[Main] Pipeline failed: ") + ex.what());
        }

        IMG_Quit();
        SDL_Quit();
        return code;
}
