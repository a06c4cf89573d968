#include "compose/compositor.hpp"

#include <algorithm>
#include <sstream>

#include "compose/layer_asset_resolver.hpp"
#include "compose/tint.hpp"
#include "core/errors.hpp"
#include "utils/log.hpp"

namespace charsheet {

namespace {

struct PreparedLayer {
    const Layer* layer = nullptr;
    surface_utils::SurfacePtr surface{nullptr, &SDL_FreeSurface};
    GridInfo grid;
};

std::string describe(const GridInfo& grid) {
    std::ostringstream oss;
    oss << grid.frame.w << "x" << grid.frame.h << " frames, " << grid.rows << " rows";
    return oss.str();
}

std::string layer_name(const Layer& layer) {
    return layer.category + "/" + layer.variant;
}

GridInfo layer_grid(const LayerAsset& asset, const std::string& animation, int w, int h,
                    std::optional<FrameSize> frame_override) {
    for (const auto& doc : asset.metadata) {
        if (auto grid = grid_from_metadata(doc, animation, w, h)) {
            return *grid;
        }
    }
    return fallback_grid(w, h, frame_override);
}

// Frame size, row count and explicit row labels must agree; columns may differ.
GridInfo union_grid(const std::vector<PreparedLayer>& prepared) {
    GridInfo out = prepared.front().grid;
    const std::string& first = layer_name(*prepared.front().layer);
    for (std::size_t i = 1; i < prepared.size(); ++i) {
        const GridInfo& g = prepared[i].grid;
        const std::string name = layer_name(*prepared[i].layer);
        if (g.frame != out.frame || g.rows != out.rows) {
            throw GeometryError("Layer geometry mismatch: " + first + " declares " + describe(out) + " but " +
                                name + " declares " + describe(g));
        }
        if (!g.directions.empty()) {
            if (out.directions.empty()) {
                out.directions = g.directions;
            } else if (out.directions != g.directions) {
                throw GeometryError("Layer row orientation mismatch between " + first + " and " + name);
            }
        }
        out.cols = std::max(out.cols, g.cols);
    }
    return out;
}

}

std::uint64_t ComposedRaster::signature() const {
    return surface_utils::hash_surface_pixels(pixels.get());
}

void blend_over(SDL_Surface* dst, const SDL_Surface* src, int dx, int dy) {
    if (!dst || !src) {
        return;
    }
    const int x0 = std::max(0, dx);
    const int y0 = std::max(0, dy);
    const int x1 = std::min(dst->w, dx + src->w);
    const int y1 = std::min(dst->h, dy + src->h);
    for (int y = y0; y < y1; ++y) {
        for (int x = x0; x < x1; ++x) {
            const Uint8* s = surface_utils::pixel_at(src, x - dx, y - dy);
            const int sa = s[3];
            if (sa == 0) {
                continue;
            }
            Uint8* d = surface_utils::pixel_at(dst, x, y);
            if (sa == 255) {
                d[0] = s[0];
                d[1] = s[1];
                d[2] = s[2];
                d[3] = 255;
                continue;
            }
            const int da = d[3];
            const int dst_weight = da * (255 - sa);
            const int alpha_num = sa * 255 + dst_weight;
            for (int c = 0; c < 3; ++c) {
                const int num = s[c] * sa * 255 + d[c] * dst_weight;
                d[c] = static_cast<Uint8>((num + alpha_num / 2) / alpha_num);
            }
            d[3] = static_cast<Uint8>((alpha_num + 127) / 255);
        }
    }
}

Compositor::Compositor(const LayerAssetResolver& assets, ZOrderTable z_order)
    : assets_(assets), z_order_(std::move(z_order)) {}

std::vector<std::size_t> Compositor::draw_order(const Build& build) const {
    std::vector<std::pair<int, std::size_t>> keyed;
    for (std::size_t i = 0; i < build.layers.size(); ++i) {
        const Layer& layer = build.layers[i];
        if (!layer.is_visible()) {
            continue;
        }
        const int z = layer.z_override ? *layer.z_override : z_order_.z_for(layer.category);
        keyed.emplace_back(z, i);
    }
    std::sort(keyed.begin(), keyed.end());
    std::vector<std::size_t> order;
    order.reserve(keyed.size());
    for (const auto& entry : keyed) {
        order.push_back(entry.second);
    }
    return order;
}

ComposedRaster Compositor::compose(const Build& build,
                                   const std::string& animation,
                                   std::optional<FrameSize> frame_override) const {
    const std::vector<std::size_t> order = draw_order(build);
    if (order.empty()) {
        throw GeometryError("Nothing to compose for animation '" + animation + "': no visible layers");
    }

    std::vector<PreparedLayer> prepared;
    prepared.reserve(order.size());
    for (std::size_t index : order) {
        const Layer& layer = build.layers[index];
        LayerAsset asset = assets_.resolve(layer.category, layer.variant, animation);
        auto surface = surface_utils::load_png_rgba(asset.image);
        if (!surface) {
            throw AssetResolutionError("Unable to decode '" + asset.image.generic_string() + "' for layer " +
                                       layer_name(layer));
        }
        if (layer.tint) {
            apply_tint(surface.get(), *layer.tint);
        }
        PreparedLayer p;
        p.layer = &layer;
        p.grid = layer_grid(asset, animation, surface->w, surface->h, frame_override);
        p.surface = std::move(surface);
        log::debug("[Compositor] " + layer_name(layer) + " <- " + asset.image.generic_string());
        prepared.push_back(std::move(p));
    }

    ComposedRaster raster;
    raster.animation = animation;
    raster.grid = union_grid(prepared);
    raster.pixels = surface_utils::create_rgba_surface(raster.grid.width(), raster.grid.height());

    for (const auto& p : prepared) {
        const LayerOffset offset = p.layer->offset.value_or(LayerOffset{});
        blend_over(raster.pixels.get(), p.surface.get(), offset.x, offset.y);
    }

    log::info("[Compositor] Composed '" + animation + "' from " + std::to_string(prepared.size()) + " layers (" +
              std::to_string(raster.width()) + "x" + std::to_string(raster.height()) + ", " + describe(raster.grid) +
              ")");
    return raster;
}

}
