#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <span>

namespace SV {

struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    friend auto operator==(Vec2 const&, Vec2 const&) -> bool = default;
};

inline auto operator+(Vec2 const& a, Vec2 const& b) -> Vec2 {
    return {a.x + b.x, a.y + b.y};
}

inline auto operator-(Vec2 const& a, Vec2 const& b) -> Vec2 {
    return {a.x - b.x, a.y - b.y};
}

inline auto operator*(Vec2 const& a, double s) -> Vec2 {
    return {a.x * s, a.y * s};
}

[[nodiscard]] inline auto dot(Vec2 const& a, Vec2 const& b) -> double {
    return a.x * b.x + a.y * b.y;
}

[[nodiscard]] inline auto length(Vec2 const& v) -> double {
    return std::hypot(v.x, v.y);
}

// Distance from p to the closed segment [a, b].
[[nodiscard]] inline auto distanceToSegment(Vec2 const& p, Vec2 const& a, Vec2 const& b) -> double {
    auto const ab    = b - a;
    auto const lenSq = dot(ab, ab);
    if (lenSq <= 0.0) {
        return length(p - a);
    }
    auto const t = std::clamp(dot(p - a, ab) / lenSq, 0.0, 1.0);
    return length(p - (a + ab * t));
}

struct Aabb {
    Vec2 min{};
    Vec2 max{};

    friend auto operator==(Aabb const&, Aabb const&) -> bool = default;

    [[nodiscard]] static auto fromPoints(std::span<Vec2 const> points) -> Aabb {
        if (points.empty()) {
            return Aabb{};
        }
        Aabb box{points.front(), points.front()};
        for (auto const& p : points) {
            box.min.x = std::min(box.min.x, p.x);
            box.min.y = std::min(box.min.y, p.y);
            box.max.x = std::max(box.max.x, p.x);
            box.max.y = std::max(box.max.y, p.y);
        }
        return box;
    }

    [[nodiscard]] static auto fromCorners(Vec2 a, Vec2 b) -> Aabb {
        return Aabb{{std::min(a.x, b.x), std::min(a.y, b.y)}, {std::max(a.x, b.x), std::max(a.y, b.y)}};
    }

    // A degenerate box (zero width or height) is still a valid point/line extent;
    // only inverted boxes are empty.
    [[nodiscard]] auto empty() const -> bool {
        return min.x > max.x || min.y > max.y;
    }

    [[nodiscard]] auto width() const -> double { return max.x - min.x; }
    [[nodiscard]] auto height() const -> double { return max.y - min.y; }
    [[nodiscard]] auto center() const -> Vec2 { return {(min.x + max.x) * 0.5, (min.y + max.y) * 0.5}; }

    [[nodiscard]] auto intersects(Aabb const& other) const -> bool {
        return min.x <= other.max.x && max.x >= other.min.x
               && min.y <= other.max.y && max.y >= other.min.y;
    }

    [[nodiscard]] auto contains(Vec2 const& p) const -> bool {
        return p.x >= min.x && p.x <= max.x && p.y >= min.y && p.y <= max.y;
    }

    [[nodiscard]] auto contains(Aabb const& other) const -> bool {
        return other.min.x >= min.x && other.max.x <= max.x
               && other.min.y >= min.y && other.max.y <= max.y;
    }

    [[nodiscard]] auto merged(Aabb const& other) const -> Aabb {
        return Aabb{{std::min(min.x, other.min.x), std::min(min.y, other.min.y)},
                    {std::max(max.x, other.max.x), std::max(max.y, other.max.y)}};
    }

    [[nodiscard]] auto extended(double margin) const -> Aabb {
        return Aabb{{min.x - margin, min.y - margin}, {max.x + margin, max.y + margin}};
    }

    [[nodiscard]] auto extendedBy(Vec2 margin) const -> Aabb {
        return Aabb{{min.x - margin.x, min.y - margin.y}, {max.x + margin.x, max.y + margin.y}};
    }

    [[nodiscard]] auto translated(Vec2 const& offset) const -> Aabb {
        return Aabb{min + offset, max + offset};
    }

    [[nodiscard]] auto intersection(Aabb const& other) const -> Aabb {
        return Aabb{{std::max(min.x, other.min.x), std::max(min.y, other.min.y)},
                    {std::min(max.x, other.max.x), std::min(max.y, other.max.y)}};
    }

    // Zero when p lies inside.
    [[nodiscard]] auto distanceTo(Vec2 const& p) const -> double {
        auto const dx = std::max({min.x - p.x, 0.0, p.x - max.x});
        auto const dy = std::max({min.y - p.y, 0.0, p.y - max.y});
        return std::hypot(dx, dy);
    }
};

struct IntRect {
    std::int32_t min_x = 0;
    std::int32_t min_y = 0;
    std::int32_t max_x = 0;
    std::int32_t max_y = 0;

    friend auto operator==(IntRect const&, IntRect const&) -> bool = default;

    [[nodiscard]] auto empty() const -> bool {
        return min_x >= max_x || min_y >= max_y;
    }
    [[nodiscard]] auto width() const -> std::int32_t { return max_x - min_x; }
    [[nodiscard]] auto height() const -> std::int32_t { return max_y - min_y; }
};

struct Transform {
    Vec2   position{};
    double rotation = 0.0; // radians, around the local origin
    Vec2   scale{1.0, 1.0};

    friend auto operator==(Transform const&, Transform const&) -> bool = default;

    [[nodiscard]] auto isIdentity() const -> bool {
        return position == Vec2{} && rotation == 0.0 && scale == Vec2{1.0, 1.0};
    }

    [[nodiscard]] auto apply(Vec2 const& local) const -> Vec2 {
        auto const sx = local.x * scale.x;
        auto const sy = local.y * scale.y;
        auto const c  = std::cos(rotation);
        auto const s  = std::sin(rotation);
        return {sx * c - sy * s + position.x, sx * s + sy * c + position.y};
    }

    // Inverse of apply; a zero scale axis maps everything onto the origin.
    [[nodiscard]] auto applyInverse(Vec2 const& world) const -> Vec2 {
        auto const dx = world.x - position.x;
        auto const dy = world.y - position.y;
        auto const c  = std::cos(rotation);
        auto const s  = std::sin(rotation);
        auto const rx = dx * c + dy * s;
        auto const ry = -dx * s + dy * c;
        return {scale.x != 0.0 ? rx / scale.x : 0.0, scale.y != 0.0 ? ry / scale.y : 0.0};
    }

    [[nodiscard]] auto translated(Vec2 const& offset) const -> Transform {
        auto copy     = *this;
        copy.position = position + offset;
        return copy;
    }

    // Bounds of a local rectangle after the transform.
    [[nodiscard]] auto mapRect(Aabb const& local) const -> Aabb {
        Vec2 const corners[4] = {apply(local.min),
                                 apply({local.max.x, local.min.y}),
                                 apply(local.max),
                                 apply({local.min.x, local.max.y})};
        return Aabb::fromPoints(corners);
    }
};

struct Color {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    friend auto operator==(Color const&, Color const&) -> bool = default;
};

} // namespace SV
