#include <strokevault/store/Stroke.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <type_traits>

namespace SV {

namespace {

struct Fnv1a {
    std::uint64_t state = 0xcbf29ce484222325ull;

    auto bytes(void const* data, std::size_t size) -> void {
        auto const* p = static_cast<unsigned char const*>(data);
        for (std::size_t i = 0; i < size; ++i) {
            state ^= p[i];
            state *= 0x100000001b3ull;
        }
    }

    template <typename T>
        requires std::is_arithmetic_v<T>
    auto value(T v) -> void {
        if constexpr (std::is_floating_point_v<T>) {
            // +0.0 and -0.0 hash alike.
            if (v == T{0}) {
                v = T{0};
            }
        }
        bytes(&v, sizeof(v));
    }

    auto vec(Vec2 const& v) -> void {
        value(v.x);
        value(v.y);
    }

    auto color(Color const& c) -> void {
        value(c.r);
        value(c.g);
        value(c.b);
        value(c.a);
    }
};

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

auto maxPressure(InkPath const& ink) -> double {
    double result = 0.0;
    for (auto const& p : ink.points) {
        result = std::max(result, p.pressure);
    }
    return result;
}

auto scaleFactor(Transform const& transform) -> double {
    return std::max(std::abs(transform.scale.x), std::abs(transform.scale.y));
}

auto inkHalfWidth(InkPath const& ink, Transform const& transform) -> double {
    return ink.width * maxPressure(ink) * 0.5 * scaleFactor(transform);
}

auto inkBounds(InkPath const& ink, Transform const& transform) -> Aabb {
    if (ink.points.empty()) {
        return Aabb{transform.position, transform.position};
    }
    std::vector<Vec2> world;
    world.reserve(ink.points.size());
    for (auto const& p : ink.points) {
        world.push_back(transform.apply(p.pos));
    }
    return Aabb::fromPoints(world).extended(inkHalfWidth(ink, transform));
}

auto inkDistance(InkPath const& ink, Transform const& transform, Vec2 const& point) -> double {
    if (ink.points.empty()) {
        return length(point - transform.position);
    }
    auto best = std::numeric_limits<double>::infinity();
    auto prev = transform.apply(ink.points.front().pos);
    if (ink.points.size() == 1) {
        best = length(point - prev);
    }
    for (std::size_t i = 1; i < ink.points.size(); ++i) {
        auto const next = transform.apply(ink.points[i].pos);
        best            = std::min(best, distanceToSegment(point, prev, next));
        prev            = next;
    }
    return std::max(0.0, best - inkHalfWidth(ink, transform));
}

} // namespace

auto strokeKindName(StrokeKind kind) -> std::string_view {
    switch (kind) {
    case StrokeKind::Ink:
        return "ink";
    case StrokeKind::RasterImage:
        return "raster_image";
    case StrokeKind::VectorImage:
        return "vector_image";
    case StrokeKind::Text:
        return "text";
    }
    return "unknown";
}

auto defaultLayerFor(StrokeGeometry const& geometry) -> StrokeLayer {
    return std::visit(Overloaded{
                              [](InkPath const& ink) {
                                  return ink.highlighter && ink.color.a < 1.0f ? StrokeLayer::highlighter()
                                                                                : StrokeLayer::userLayer(0);
                              },
                              [](RasterImage const&) { return StrokeLayer::image(); },
                              [](VectorImage const&) { return StrokeLayer::image(); },
                              [](TextRun const&) { return StrokeLayer::userLayer(0); },
                      },
                      geometry);
}

auto measureText(TextRun const& text) -> TextMetrics {
    TextMetrics metrics;
    std::size_t column = 0;
    for (unsigned char c : text.text) {
        if (c == '\n') {
            metrics.columns = std::max(metrics.columns, column);
            column          = 0;
            ++metrics.lines;
            continue;
        }
        // Count code points, not continuation bytes.
        if ((c & 0xC0u) != 0x80u) {
            ++column;
        }
    }
    metrics.columns = std::max(metrics.columns, column);
    metrics.size    = Vec2{static_cast<double>(metrics.columns) * TextMetrics::kAdvanceFactor * text.fontSize,
                        static_cast<double>(metrics.lines) * TextMetrics::kLineHeightFactor * text.fontSize};
    return metrics;
}

Stroke::Stroke(StrokeGeometry geometryIn, Transform transformIn)
    : geometry(std::move(geometryIn)), transform(transformIn), layer(defaultLayerFor(geometry)) {
    refresh();
}

Stroke::Stroke(StrokeGeometry geometryIn, Transform transformIn, StrokeLayer layerIn)
    : geometry(std::move(geometryIn)), transform(transformIn), layer(layerIn) {
    refresh();
}

auto Stroke::kind() const -> StrokeKind {
    return static_cast<StrokeKind>(geometry.index());
}

auto Stroke::localRect() const -> Aabb {
    return std::visit(Overloaded{
                              [](InkPath const& ink) {
                                  std::vector<Vec2> local;
                                  local.reserve(ink.points.size());
                                  for (auto const& p : ink.points) {
                                      local.push_back(p.pos);
                                  }
                                  return Aabb::fromPoints(local);
                              },
                              [](RasterImage const& image) { return Aabb{{0.0, 0.0}, image.size}; },
                              [](VectorImage const& image) { return Aabb{{0.0, 0.0}, image.intrinsicSize}; },
                              [](TextRun const& text) { return Aabb{{0.0, 0.0}, measureText(text).size}; },
                      },
                      geometry);
}

auto Stroke::refresh() -> void {
    if (auto const* ink = std::get_if<InkPath>(&geometry)) {
        bounds_ = inkBounds(*ink, transform);
    } else {
        bounds_ = transform.mapRect(localRect());
    }

    Fnv1a h;
    h.value(static_cast<std::uint8_t>(geometry.index()));
    h.vec(transform.position);
    h.value(transform.rotation);
    h.vec(transform.scale);
    h.value(static_cast<std::uint8_t>(layer.kind));
    h.value(layer.user);
    std::visit(Overloaded{
                       [&h](InkPath const& ink) {
                           h.value(ink.width);
                           h.color(ink.color);
                           h.value(static_cast<std::uint8_t>(ink.highlighter));
                           h.value(static_cast<std::uint64_t>(ink.points.size()));
                           for (auto const& p : ink.points) {
                               h.vec(p.pos);
                               h.value(p.pressure);
                           }
                       },
                       [&h](RasterImage const& image) {
                           h.vec(image.size);
                           if (image.encoded) {
                               h.value(static_cast<std::uint64_t>(image.encoded->size()));
                               h.bytes(image.encoded->data(), image.encoded->size());
                           }
                       },
                       [&h](VectorImage const& image) {
                           h.vec(image.intrinsicSize);
                           h.value(image.strokeWidth);
                           h.color(image.color);
                           h.value(static_cast<std::uint64_t>(image.paths.size()));
                           for (auto const& path : image.paths) {
                               h.value(static_cast<std::uint64_t>(path.size()));
                               for (auto const& p : path) {
                                   h.vec(p);
                               }
                           }
                       },
                       [&h](TextRun const& text) {
                           h.value(text.fontSize);
                           h.color(text.color);
                           h.bytes(text.text.data(), text.text.size());
                       },
               },
               geometry);
    hash_ = h.state;
}

auto Stroke::hitDistance(Vec2 const& point) const -> double {
    if (auto const* ink = std::get_if<InkPath>(&geometry)) {
        return inkDistance(*ink, transform, point);
    }
    auto const local = localRect();
    if (local.contains(transform.applyInverse(point))) {
        return 0.0;
    }
    // Distance to the transformed outline, not to the axis-aligned bounds.
    Vec2 const corners[4] = {transform.apply(local.min),
                             transform.apply({local.max.x, local.min.y}),
                             transform.apply(local.max),
                             transform.apply({local.min.x, local.max.y})};
    auto best = std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < 4; ++i) {
        best = std::min(best, distanceToSegment(point, corners[i], corners[(i + 1) % 4]));
    }
    return best;
}

} // namespace SV
