#pragma once

#include <strokevault/core/Error.hpp>
#include <strokevault/core/Geometry.hpp>
#include <strokevault/render/ImageCache.hpp>
#include <strokevault/render/RenderCache.hpp>
#include <strokevault/store/Stroke.hpp>
#include <strokevault/task/Task.hpp>

#include <vector>

namespace SV::Render {

struct RasterRequest {
    StrokePtr stroke;
    double    zoom     = 1.0;
    Aabb      region{};      // document-space area to cover
    int       tileSize = 256; // pixels
};

struct RasterResult {
    Aabb                    coveredRect{};
    std::vector<RenderTile> tiles; // fully transparent tiles are omitted
};

// Pixel rectangle (document coordinates times zoom) enclosing `region`.
[[nodiscard]] auto pixelRectFor(Aabb const& region, double zoom) -> IntRect;

/**
 * Rasterizes the part of a stroke inside request.region into premultiplied
 * RGBA8 tiles aligned to a tileSize grid in pixel space.
 *
 * Checks `cancel` before every tile row and returns RenderJobCancelled as soon
 * as it is set; a cancelled call returns no partial tiles. Undecodable image
 * bytes give DecodeFailed.
 */
[[nodiscard]] auto rasterize(RasterRequest const& request, CancellationToken const& cancel, ImageCache& images)
        -> Expected<RasterResult>;

} // namespace SV::Render
