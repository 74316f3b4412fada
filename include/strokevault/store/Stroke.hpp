#pragma once

#include <strokevault/core/Geometry.hpp>

#include <compare>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace SV {

struct InkPoint {
    Vec2   pos{};
    double pressure = 1.0;

    friend auto operator==(InkPoint const&, InkPoint const&) -> bool = default;
};

struct InkPath {
    std::vector<InkPoint> points;
    double                width       = 2.0;
    Color                 color{};
    bool                  highlighter = false;
};

// Encoded bytes (PNG, JPEG, ...) are decoded lazily by render jobs; `size` is
// the intrinsic size in document units.
struct RasterImage {
    std::shared_ptr<const std::vector<std::uint8_t>> encoded;
    Vec2                                             size{};
};

struct VectorImage {
    std::vector<std::vector<Vec2>> paths;
    Vec2                           intrinsicSize{};
    double                         strokeWidth = 1.0;
    Color                          color{};
};

struct TextRun {
    std::string text;
    double      fontSize = 12.0;
    Color       color{};
};

using StrokeGeometry = std::variant<InkPath, RasterImage, VectorImage, TextRun>;

enum class StrokeKind : std::uint8_t {
    Ink = 0,
    RasterImage,
    VectorImage,
    Text
};

[[nodiscard]] auto strokeKindName(StrokeKind kind) -> std::string_view;

/**
 * Paint layer of a stroke, ordered back to front:
 * Document < Image < Highlighter < UserLayer(0) < UserLayer(1) < ...
 */
struct StrokeLayer {
    enum class Kind : std::uint8_t {
        Document = 0,
        Image,
        Highlighter,
        UserLayer
    };

    Kind          kind = Kind::UserLayer;
    std::uint32_t user = 0;

    friend auto operator==(StrokeLayer const&, StrokeLayer const&) -> bool = default;
    friend auto operator<=>(StrokeLayer const&, StrokeLayer const&)        = default;

    static auto document() -> StrokeLayer { return {Kind::Document, 0}; }
    static auto image() -> StrokeLayer { return {Kind::Image, 0}; }
    static auto highlighter() -> StrokeLayer { return {Kind::Highlighter, 0}; }
    static auto userLayer(std::uint32_t n) -> StrokeLayer { return {Kind::UserLayer, n}; }
};

[[nodiscard]] auto defaultLayerFor(StrokeGeometry const& geometry) -> StrokeLayer;

// Monospace text layout approximation used for bounds and hit testing.
struct TextMetrics {
    static constexpr double kAdvanceFactor    = 0.6;
    static constexpr double kLineHeightFactor = 1.2;

    std::size_t lines   = 1;
    std::size_t columns = 0;
    Vec2        size{};
};

[[nodiscard]] auto measureText(TextRun const& text) -> TextMetrics;

/**
 * One drawable element of a document.
 *
 * The geometry, transform and layer are plain data. Bounds and the content
 * hash are derived and cached; anything that edits the public fields must call
 * refresh() before the stroke is handed back to a store. Stored strokes are
 * shared as `std::shared_ptr<const Stroke>` and never mutated in place.
 */
class Stroke {
public:
    explicit Stroke(StrokeGeometry geometryIn, Transform transformIn = {});
    Stroke(StrokeGeometry geometryIn, Transform transformIn, StrokeLayer layerIn);

    StrokeGeometry geometry;
    Transform      transform{};
    StrokeLayer    layer{};

    auto refresh() -> void;

    [[nodiscard]] auto bounds() const -> Aabb const& { return bounds_; }
    [[nodiscard]] auto contentHash() const -> std::uint64_t { return hash_; }
    [[nodiscard]] auto kind() const -> StrokeKind;
    [[nodiscard]] auto kindName() const -> std::string_view { return strokeKindName(kind()); }

    // Exact distance from `point` to the painted geometry; 0 inside filled areas.
    [[nodiscard]] auto hitDistance(Vec2 const& point) const -> double;

    // Local rectangle covered by images and text; empty for ink.
    [[nodiscard]] auto localRect() const -> Aabb;

private:
    Aabb          bounds_{};
    std::uint64_t hash_ = 0;
};

using StrokePtr = std::shared_ptr<const Stroke>;

} // namespace SV
