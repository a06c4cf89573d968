#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "asset/surface_utils.hpp"
#include "build/build.hpp"
#include "compose/grid_info.hpp"
#include "compose/z_order.hpp"

namespace charsheet {

class LayerAssetResolver;

struct ComposedRaster {
    surface_utils::SurfacePtr pixels{nullptr, &SDL_FreeSurface};
    GridInfo grid;
    std::string animation;

    int width() const { return pixels ? pixels->w : 0; }
    int height() const { return pixels ? pixels->h : 0; }
    std::uint64_t signature() const;
};

class Compositor {
public:
    explicit Compositor(const LayerAssetResolver& assets, ZOrderTable z_order = ZOrderTable::defaults());

    // Stacks the visible layers of `build` for one animation onto a transparent canvas.
    // `frame_override` is only consulted for layers without grid metadata.
    // Throws AssetResolutionError or GeometryError; never returns a partial raster.
    ComposedRaster compose(const Build& build,
                           const std::string& animation,
                           std::optional<FrameSize> frame_override = std::nullopt) const;

    // Indices into build.layers, bottom first. Invisible layers are omitted;
    // equal depths keep their build order.
    std::vector<std::size_t> draw_order(const Build& build) const;

    const ZOrderTable& z_order() const { return z_order_; }

private:
    const LayerAssetResolver& assets_;
    ZOrderTable z_order_;
};

// Porter-Duff source-over of `src` onto `dst` with `src` shifted by (dx, dy).
// Both surfaces must be in surface_utils::kRasterFormat. Pixels outside `dst` are dropped.
void blend_over(SDL_Surface* dst, const SDL_Surface* src, int dx, int dy);

}
