#include <strokevault/render/Rasterizer.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <string>
#include <variant>

namespace SV::Render {

namespace {

constexpr std::int64_t kMaxPixels = 64ll * 1024ll * 1024ll;

struct Premul {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 0.0f;
};

auto premultiply(Color const& c, float coverage) -> Premul {
    auto const alpha = std::clamp(c.a * coverage, 0.0f, 1.0f);
    return Premul{c.r * alpha, c.g * alpha, c.b * alpha, alpha};
}

auto toByte(float v) -> std::uint8_t {
    return static_cast<std::uint8_t>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f));
}

class PixelSource {
public:
    virtual ~PixelSource() = default;
    // Called once per tile with the tile's document-space rectangle.
    virtual auto beginTile(Aabb const&) -> void {}
    [[nodiscard]] virtual auto sample(Vec2 const& p) const -> Premul = 0;
};

// Thick polylines: ink paths and vector image outlines.
class SegmentSource final : public PixelSource {
public:
    struct Segment {
        Vec2   a;
        Vec2   b;
        double halfWidth;
    };

    SegmentSource(std::vector<Segment> segments, Color color, double zoom)
        : segments_(std::move(segments)), color_(color), zoom_(zoom) {}

    auto beginTile(Aabb const& rect) -> void override {
        candidates_.clear();
        auto const pad = 1.0 / zoom_;
        for (auto const& s : segments_) {
            auto const box = Aabb::fromCorners(s.a, s.b).extended(s.halfWidth + pad);
            if (box.intersects(rect)) {
                candidates_.push_back(&s);
            }
        }
    }

    [[nodiscard]] auto sample(Vec2 const& p) const -> Premul override {
        if (candidates_.empty()) {
            return {};
        }
        auto best = std::numeric_limits<double>::infinity();
        for (auto const* s : candidates_) {
            best = std::min(best, distanceToSegment(p, s->a, s->b) - s->halfWidth);
        }
        // Signed distance to the edge, half a pixel of antialiasing.
        auto const coverage = std::clamp(0.5 - best * zoom_, 0.0, 1.0);
        return coverage > 0.0 ? premultiply(color_, static_cast<float>(coverage)) : Premul{};
    }

private:
    std::vector<Segment>        segments_;
    std::vector<Segment const*> candidates_;
    Color                       color_;
    double                      zoom_;
};

class ImageSource final : public PixelSource {
public:
    ImageSource(std::shared_ptr<ImageCache::ImageData const> image, Vec2 size, Transform transform)
        : image_(std::move(image)), size_(size), transform_(transform) {}

    [[nodiscard]] auto sample(Vec2 const& p) const -> Premul override {
        auto const local = transform_.applyInverse(p);
        if (size_.x <= 0.0 || size_.y <= 0.0 || local.x < 0.0 || local.y < 0.0 || local.x >= size_.x || local.y >= size_.y) {
            return {};
        }
        auto const u   = std::min<std::uint32_t>(static_cast<std::uint32_t>(local.x / size_.x * image_->width), image_->width - 1);
        auto const v   = std::min<std::uint32_t>(static_cast<std::uint32_t>(local.y / size_.y * image_->height), image_->height - 1);
        auto const idx = (static_cast<std::size_t>(v) * image_->width + u) * 4u;
        auto const c   = Color{image_->rgba[idx] / 255.0f,
                               image_->rgba[idx + 1] / 255.0f,
                               image_->rgba[idx + 2] / 255.0f,
                               image_->rgba[idx + 3] / 255.0f};
        return premultiply(c, 1.0f);
    }

private:
    std::shared_ptr<ImageCache::ImageData const> image_;
    Vec2                                         size_;
    Transform                                    transform_;
};

// Text as filled glyph cells of the monospace layout.
class TextSource final : public PixelSource {
public:
    TextSource(TextRun const& text, Transform transform)
        : color_(text.color), transform_(transform),
          advance_(TextMetrics::kAdvanceFactor * text.fontSize),
          lineHeight_(TextMetrics::kLineHeightFactor * text.fontSize) {
        lines_.emplace_back();
        for (unsigned char c : text.text) {
            if (c == '\n') {
                lines_.emplace_back();
            } else if ((c & 0xC0u) != 0x80u) {
                lines_.back().push_back(c != ' ' && c != '\t');
            }
        }
    }

    [[nodiscard]] auto sample(Vec2 const& p) const -> Premul override {
        if (advance_ <= 0.0 || lineHeight_ <= 0.0) {
            return {};
        }
        auto const local = transform_.applyInverse(p);
        if (local.x < 0.0 || local.y < 0.0) {
            return {};
        }
        auto const col  = static_cast<std::size_t>(local.x / advance_);
        auto const line = static_cast<std::size_t>(local.y / lineHeight_);
        if (line >= lines_.size() || col >= lines_[line].size() || !lines_[line][col]) {
            return {};
        }
        auto const fx = local.x / advance_ - static_cast<double>(col);
        auto const fy = local.y / lineHeight_ - static_cast<double>(line);
        if (fx < 0.1 || fx > 0.9 || fy < 0.2 || fy > 0.85) {
            return {};
        }
        return premultiply(color_, 1.0f);
    }

private:
    Color                          color_;
    Transform                      transform_;
    double                         advance_;
    double                         lineHeight_;
    std::vector<std::vector<bool>> lines_;
};

auto scaleFactor(Transform const& transform) -> double {
    return std::max(std::abs(transform.scale.x), std::abs(transform.scale.y));
}

auto inkSegments(InkPath const& ink, Transform const& transform) -> std::vector<SegmentSource::Segment> {
    std::vector<SegmentSource::Segment> segments;
    auto const                          scale = scaleFactor(transform);
    if (ink.points.size() == 1) {
        auto const p = transform.apply(ink.points.front().pos);
        segments.push_back({p, p, ink.width * ink.points.front().pressure * 0.5 * scale});
        return segments;
    }
    for (std::size_t i = 1; i < ink.points.size(); ++i) {
        auto const& a        = ink.points[i - 1];
        auto const& b        = ink.points[i];
        auto const  pressure = (a.pressure + b.pressure) * 0.5;
        segments.push_back({transform.apply(a.pos), transform.apply(b.pos), ink.width * pressure * 0.5 * scale});
    }
    return segments;
}

auto vectorSegments(VectorImage const& image, Transform const& transform) -> std::vector<SegmentSource::Segment> {
    std::vector<SegmentSource::Segment> segments;
    auto const                          halfWidth = image.strokeWidth * 0.5 * scaleFactor(transform);
    for (auto const& path : image.paths) {
        if (path.size() == 1) {
            auto const p = transform.apply(path.front());
            segments.push_back({p, p, halfWidth});
        }
        for (std::size_t i = 1; i < path.size(); ++i) {
            segments.push_back({transform.apply(path[i - 1]), transform.apply(path[i]), halfWidth});
        }
    }
    return segments;
}

auto makeSource(Stroke const& stroke, double zoom, ImageCache& images) -> Expected<std::unique_ptr<PixelSource>> {
    auto const& transform = stroke.transform;
    if (auto const* ink = std::get_if<InkPath>(&stroke.geometry)) {
        return std::make_unique<SegmentSource>(inkSegments(*ink, transform), ink->color, zoom);
    }
    if (auto const* vector = std::get_if<VectorImage>(&stroke.geometry)) {
        return std::make_unique<SegmentSource>(vectorSegments(*vector, transform), vector->color, zoom);
    }
    if (auto const* raster = std::get_if<RasterImage>(&stroke.geometry)) {
        if (!raster->encoded) {
            return std::unexpected(Error{Error::Code::DecodeFailed, "raster image has no data"});
        }
        auto image = images.load(*raster->encoded);
        if (!image) {
            return std::unexpected(image.error());
        }
        if ((*image)->width == 0 || (*image)->height == 0) {
            return std::unexpected(Error{Error::Code::DecodeFailed, "raster image has no pixels"});
        }
        return std::make_unique<ImageSource>(std::move(*image), raster->size, transform);
    }
    auto const& text = std::get<TextRun>(stroke.geometry);
    return std::make_unique<TextSource>(text, transform);
}

auto cancelled() -> Error {
    return Error{Error::Code::RenderJobCancelled, "render job cancelled"};
}

} // namespace

auto pixelRectFor(Aabb const& region, double zoom) -> IntRect {
    if (region.empty()) {
        return IntRect{};
    }
    IntRect rect{static_cast<std::int32_t>(std::floor(region.min.x * zoom)),
                 static_cast<std::int32_t>(std::floor(region.min.y * zoom)),
                 static_cast<std::int32_t>(std::ceil(region.max.x * zoom)),
                 static_cast<std::int32_t>(std::ceil(region.max.y * zoom))};
    // Degenerate extents still cover one pixel.
    if (rect.max_x == rect.min_x) {
        rect.max_x += 1;
    }
    if (rect.max_y == rect.min_y) {
        rect.max_y += 1;
    }
    return rect;
}

auto rasterize(RasterRequest const& request, CancellationToken const& cancel, ImageCache& images)
        -> Expected<RasterResult> {
    if (!request.stroke) {
        return std::unexpected(Error{Error::Code::MalformedInput, "rasterize without a stroke"});
    }
    if (!(request.zoom > 0.0) || !std::isfinite(request.zoom) || request.tileSize <= 0) {
        return std::unexpected(Error{Error::Code::MalformedInput, "invalid zoom or tile size"});
    }
    if (cancel.isCancelled()) {
        return std::unexpected(cancelled());
    }

    RasterResult result;
    result.coveredRect = request.region;

    auto const& stroke = *request.stroke;
    auto const  area   = stroke.bounds().intersection(request.region);
    if (area.empty()) {
        return result;
    }

    auto const pixels = pixelRectFor(area, request.zoom);
    if (static_cast<std::int64_t>(pixels.width()) * pixels.height() > kMaxPixels) {
        return std::unexpected(Error{Error::Code::NotSupported,
                                     "render area of " + std::to_string(pixels.width()) + "x" + std::to_string(pixels.height())
                                             + " pixels is too large"});
    }

    auto source = makeSource(stroke, request.zoom, images);
    if (!source) {
        return std::unexpected(source.error());
    }

    auto const tile  = request.tileSize;
    auto const floorDiv = [](std::int32_t v, std::int32_t d) {
        return v >= 0 ? v / d : -((-v + d - 1) / d);
    };
    auto const minTx = floorDiv(pixels.min_x, tile);
    auto const maxTx = floorDiv(pixels.max_x - 1, tile);
    auto const minTy = floorDiv(pixels.min_y, tile);
    auto const maxTy = floorDiv(pixels.max_y - 1, tile);

    for (std::int32_t ty = minTy; ty <= maxTy; ++ty) {
        if (cancel.isCancelled()) {
            sv_log("rasterize cancelled at tile row " + std::to_string(ty), "Render");
            return std::unexpected(cancelled());
        }
        for (std::int32_t tx = minTx; tx <= maxTx; ++tx) {
            IntRect const rect{std::max(tx * tile, pixels.min_x),
                               std::max(ty * tile, pixels.min_y),
                               std::min((tx + 1) * tile, pixels.max_x),
                               std::min((ty + 1) * tile, pixels.max_y)};
            if (rect.empty()) {
                continue;
            }
            (*source)->beginTile(Aabb{{rect.min_x / request.zoom, rect.min_y / request.zoom},
                                      {rect.max_x / request.zoom, rect.max_y / request.zoom}});

            RenderTile out;
            out.pixelRect = rect;
            out.rgba.assign(static_cast<std::size_t>(rect.width()) * static_cast<std::size_t>(rect.height()) * 4u, 0);
            bool any = false;
            for (std::int32_t y = rect.min_y; y < rect.max_y; ++y) {
                for (std::int32_t x = rect.min_x; x < rect.max_x; ++x) {
                    auto const p = Vec2{(x + 0.5) / request.zoom, (y + 0.5) / request.zoom};
                    auto const c = (*source)->sample(p);
                    if (c.a <= 0.0f) {
                        continue;
                    }
                    auto const idx = (static_cast<std::size_t>(y - rect.min_y) * static_cast<std::size_t>(rect.width())
                                      + static_cast<std::size_t>(x - rect.min_x))
                                     * 4u;
                    out.rgba[idx]     = toByte(c.r);
                    out.rgba[idx + 1] = toByte(c.g);
                    out.rgba[idx + 2] = toByte(c.b);
                    out.rgba[idx + 3] = toByte(c.a);
                    any               = true;
                }
            }
            if (any) {
                result.tiles.push_back(std::move(out));
            }
        }
    }
    return result;
}

} // namespace SV::Render
