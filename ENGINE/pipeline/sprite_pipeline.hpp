#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "build/build.hpp"
#include "compose/compositor.hpp"
#include "config/pipeline_config.hpp"
#include "resolve/resolver.hpp"
#include "resolve/selection.hpp"
#include "resolve/trace.hpp"
#include "slice/frame_slicer.hpp"
#include "validate/build_validator.hpp"

namespace charsheet {

class LayerAssetResolver;

inline constexpr const char* kManifestSchema = "ulpc.manifest/1.0";

struct RenderedAnimation {
    ComposedRaster raster;
    std::optional<SliceResult> slices;
};

struct PipelineResult {
    Build build;
    std::vector<TraceEntry> trace;
    std::vector<std::string> unknown_categories;
    bool head_overridden = false;
    std::optional<nlohmann::json> manifest;
    // Relative to the output directory.
    std::vector<std::filesystem::path> written;
};

// resolve -> enforce -> validate -> compose -> slice, strictly in that order. A failure in
// any stage aborts the run before anything reaches the output directory.
class SpritePipeline {
public:
    SpritePipeline(const Resolver& resolver, const BuildValidator& validator, const LayerAssetResolver& assets);

    PipelineResult run(const SemanticSelection& selection,
                       PipelineConfig config,
                       const std::filesystem::path& out_dir) const;

    // Validates `build` and renders every animation it requests, in memory.
    std::vector<RenderedAnimation> render(const Build& build, const PipelineConfig& config) const;

    // `rendered` must come from render() with the same config.
    static nlohmann::json make_manifest(const std::vector<RenderedAnimation>& rendered, const PipelineConfig& config);

private:
    const Resolver& resolver_;
    const BuildValidator& validator_;
    const LayerAssetResolver& assets_;
};

}
