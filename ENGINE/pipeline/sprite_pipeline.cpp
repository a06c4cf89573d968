#include "pipeline/sprite_pipeline.hpp"

#include <system_error>

#include "compose/layer_asset_resolver.hpp"
#include "resolve/invariant_enforcer.hpp"
#include "utils/json_io.hpp"
#include "utils/log.hpp"
#include "utils/staged_publish.hpp"

namespace charsheet {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

fs::path sheet_path(const std::string& animation) {
    return fs::path("sheets") / animation / "sheet.png";
}

fs::path staging_dir_for(const fs::path& out_dir) {
    fs::path target = out_dir;
    if (target.filename().empty()) {
        target = target.parent_path();
    }
    return target.parent_path() / (target.filename().string() + ".staging");
}

}

SpritePipeline::SpritePipeline(const Resolver& resolver, const BuildValidator& validator, const LayerAssetResolver& assets)
    : resolver_(resolver), validator_(validator), assets_(assets) {}

std::vector<RenderedAnimation> SpritePipeline::render(const Build& build, const PipelineConfig& config) const {
    validator_.validate(build);
    Compositor compositor(assets_, config.z_order);
    const SliceOptions slice_options = config.slice_options();

    std::vector<RenderedAnimation> rendered;
    rendered.reserve(build.animations.size());
    for (const auto& animation : build.animations) {
        RenderedAnimation item;
        item.raster = compositor.compose(build, animation, config.frame_size);
        if (config.writes_frames()) {
            item.slices = slice(item.raster, slice_options);
        }
        rendered.push_back(std::move(item));
    }
    return rendered;
}

json SpritePipeline::make_manifest(const std::vector<RenderedAnimation>& rendered, const PipelineConfig& config) {
    json animations = json::object();
    json frame_size = nullptr;
    for (const auto& item : rendered) {
        if (!item.slices) {
            continue;
        }
        json entry = item.slices->manifest.to_json();
        for (auto& ids : entry["frames"]) {
            for (auto& id : ids) {
                id = "frames/" + id.get<std::string>();
            }
        }
        if (config.writes_sheets()) {
            entry["sheet"] = sheet_path(item.raster.animation).generic_string();
        }
        if (frame_size.is_null()) {
            frame_size = entry["frame_size"];
        }
        animations[item.raster.animation] = std::move(entry);
    }
    return json{
        {"schema", kManifestSchema},
        {"slug", config.slug},
        {"frame_size", frame_size},
        {"animations", std::move(animations)},
    };
}

PipelineResult SpritePipeline::run(const SemanticSelection& selection,
                                   PipelineConfig config,
                                   const fs::path& out_dir) const {
    PipelineResult result;

    ResolveResult resolved = resolver_.resolve(selection, config.resolve_options());
    result.trace = std::move(resolved.trace);
    result.unknown_categories = std::move(resolved.unknown_categories);
    if (!resolved.ok || !resolved.build) {
        const ResolveFailure failure = resolved.errors.empty()
            ? ResolveFailure{"required_category_unresolved", "body", std::string()}
            : resolved.errors.front();
        throw ResolutionError(failure.reason, failure.category, failure.item);
    }
    result.build = std::move(*resolved.build);

    result.head_overridden = enforce_head_matches_body(result.build, result.trace);
    if (result.build.output) {
        config.merge_build_output(*result.build.output);
    }

    const std::vector<RenderedAnimation> rendered = render(result.build, config);

    const fs::path staging = staging_dir_for(out_dir);
    std::error_code ec;
    fs::remove_all(staging, ec);
    std::vector<std::string> names;
    try {
        fs::create_directories(staging);
        for (const auto& item : rendered) {
            const std::string& animation = item.raster.animation;
            if (config.writes_sheets()) {
                const fs::path rel = sheet_path(animation);
                fs::create_directories((staging / rel).parent_path());
                surface_utils::save_png(item.raster.pixels.get(), staging / rel);
                result.written.push_back(rel);
            }
            if (item.slices) {
                for (const auto& file : write_frames(*item.slices, staging / "frames")) {
                    result.written.push_back(fs::path("frames") / file.lexically_relative(staging / "frames"));
                }
            }
        }
        if (config.writes_frames()) {
            result.manifest = make_manifest(rendered, config);
            const fs::path rel = config.slug + "_sprite_manifest.json";
            json_io::save_json(staging / rel, *result.manifest);
            result.written.push_back(rel);
        }
        const fs::path build_rel = config.slug + "_build.json";
        json_io::save_json(staging / build_rel, build_to_json(result.build));
        result.written.push_back(build_rel);
        const fs::path trace_rel = config.slug + "_trace.json";
        json_io::save_json(staging / trace_rel, trace_to_json(result.trace));
        result.written.push_back(trace_rel);
        names = staged_publish::entry_names(staging);
    } catch (...) {
        fs::remove_all(staging, ec);
        throw;
    }
    staged_publish::commit(staging, names, out_dir);

    log::info("[SpritePipeline] Wrote " + std::to_string(result.written.size()) + " files for '" + config.slug +
              "' to '" + out_dir.generic_string() + "'");
    return result;
}

}
