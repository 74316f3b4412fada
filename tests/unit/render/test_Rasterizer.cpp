#include <doctest/doctest.h>
#include <strokevault/render/Rasterizer.hpp>

#include "render/RenderTestImages.hpp"

#include <memory>

using namespace SV;
using namespace SV::Render;

namespace {

auto redLine() -> StrokePtr {
    InkPath path;
    path.points = {InkPoint{{0.0, 5.0}, 1.0}, InkPoint{{20.0, 5.0}, 1.0}};
    path.width  = 4.0;
    path.color  = Color{1.0f, 0.0f, 0.0f, 1.0f};
    return std::make_shared<const Stroke>(Stroke{path});
}

auto pixelAt(RasterResult const& result, std::int32_t x, std::int32_t y) -> std::uint8_t const* {
    for (auto const& tile : result.tiles) {
        auto const& r = tile.pixelRect;
        if (x >= r.min_x && x < r.max_x && y >= r.min_y && y < r.max_y) {
            auto const idx = (static_cast<std::size_t>(y - r.min_y) * static_cast<std::size_t>(r.width())
                              + static_cast<std::size_t>(x - r.min_x))
                             * 4u;
            return &tile.rgba[idx];
        }
    }
    return nullptr;
}

} // namespace

TEST_CASE("pixelRectFor") {
    CHECK(pixelRectFor(Aabb{{0.2, 0.2}, {1.7, 3.1}}, 2.0) == IntRect{0, 0, 4, 7});
    CHECK(pixelRectFor(Aabb{{-1.5, 2.0}, {1.5, 2.0}}, 1.0) == IntRect{-2, 2, 2, 3});
}

TEST_CASE("rasterize ink into grid aligned tiles") {
    ImageCache        images;
    CancellationToken token;
    auto const        stroke = redLine();

    RasterRequest request{.stroke = stroke, .zoom = 1.0, .region = stroke->bounds(), .tileSize = 8};
    auto result = rasterize(request, token, images);
    REQUIRE(result.has_value());
    CHECK(result->coveredRect == stroke->bounds());
    CHECK(result->tiles.size() == 4);

    auto const bounds = pixelRectFor(stroke->bounds(), 1.0);
    for (auto const& tile : result->tiles) {
        CHECK(tile.pixelRect.min_x >= bounds.min_x);
        CHECK(tile.pixelRect.max_x <= bounds.max_x);
        CHECK(tile.pixelRect.width() <= 8);
        CHECK(tile.rgba.size() == static_cast<std::size_t>(tile.pixelRect.width() * tile.pixelRect.height() * 4));
    }

    auto const* center = pixelAt(*result, 10, 5);
    REQUIRE(center != nullptr);
    CHECK(center[0] == 255);
    CHECK(center[1] == 0);
    CHECK(center[3] == 255);

    SUBCASE("higher zoom gives more pixels") {
        request.zoom = 4.0;
        auto zoomed  = rasterize(request, token, images);
        REQUIRE(zoomed.has_value());
        CHECK(zoomed->tiles.size() > result->tiles.size());
    }

    SUBCASE("a region away from the stroke gives no tiles") {
        request.region = Aabb{{100.0, 100.0}, {200.0, 200.0}};
        auto empty     = rasterize(request, token, images);
        REQUIRE(empty.has_value());
        CHECK(empty->tiles.empty());
    }
}

TEST_CASE("rasterize honours cancellation") {
    ImageCache        images;
    CancellationToken token;
    auto const        stroke = redLine();
    token.cancel();

    auto result = rasterize(RasterRequest{.stroke = stroke, .zoom = 1.0, .region = stroke->bounds()}, token, images);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::RenderJobCancelled);
}

TEST_CASE("rasterize rejects invalid requests") {
    ImageCache        images;
    CancellationToken token;
    auto const        stroke = redLine();

    CHECK(rasterize(RasterRequest{.stroke = stroke, .zoom = 0.0, .region = stroke->bounds()}, token, images).error().code
          == Error::Code::MalformedInput);
    CHECK(rasterize(RasterRequest{.stroke = nullptr, .zoom = 1.0, .region = stroke->bounds()}, token, images).error().code
          == Error::Code::MalformedInput);
}

TEST_CASE("rasterize raster images") {
    ImageCache        images;
    CancellationToken token;

    RasterImage image;
    image.encoded = std::make_shared<const std::vector<std::uint8_t>>(tinyPpm());
    image.size    = Vec2{2.0, 2.0};
    auto const stroke = std::make_shared<const Stroke>(Stroke{image});

    auto result = rasterize(RasterRequest{.stroke = stroke, .zoom = 2.0, .region = stroke->bounds()}, token, images);
    REQUIRE(result.has_value());
    auto const* topLeft = pixelAt(*result, 0, 0);
    REQUIRE(topLeft != nullptr);
    CHECK(topLeft[0] == 255);
    CHECK(topLeft[1] == 0);
    auto const* bottomRight = pixelAt(*result, 3, 3);
    REQUIRE(bottomRight != nullptr);
    CHECK(bottomRight[1] == 255);
    CHECK(bottomRight[2] == 255);
    CHECK(images.size() == 1);

    SUBCASE("undecodable bytes fail the job") {
        RasterImage broken;
        broken.encoded   = std::make_shared<const std::vector<std::uint8_t>>(garbageImage());
        broken.size      = Vec2{2.0, 2.0};
        auto const bad   = std::make_shared<const Stroke>(Stroke{broken});
        auto const failed = rasterize(RasterRequest{.stroke = bad, .zoom = 1.0, .region = bad->bounds()}, token, images);
        REQUIRE_FALSE(failed.has_value());
        CHECK(failed.error().code == Error::Code::DecodeFailed);
    }
}
