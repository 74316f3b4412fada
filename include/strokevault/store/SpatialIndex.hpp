#pragma once

#include <strokevault/core/Error.hpp>
#include <strokevault/core/Geometry.hpp>
#include <strokevault/core/StrokeHandle.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace SV::Store {

/**
 * R-tree over stroke bounding boxes.
 *
 * Holds (box, handle) leaves plus a handle -> box map so removal needs only
 * the handle. The index never dereferences handles; keeping its entry set
 * equal to the valid handles it should contain is the owner's job.
 * Query results are unordered.
 */
class SpatialIndex {
public:
    using Entry = std::pair<StrokeHandle, Aabb>;

    SpatialIndex();
    ~SpatialIndex();
    SpatialIndex(SpatialIndex&&) noexcept;
    SpatialIndex& operator=(SpatialIndex&&) noexcept;

    // Re-inserting an existing handle replaces its box.
    auto insert(StrokeHandle handle, Aabb const& box) -> void;
    auto remove(StrokeHandle handle) -> Expected<void>;
    auto update(StrokeHandle handle, Aabb const& box) -> Expected<void>;

    [[nodiscard]] auto contains(StrokeHandle handle) const -> bool;
    [[nodiscard]] auto boxFor(StrokeHandle handle) const -> std::optional<Aabb>;

    // Boxes intersecting `region`, boundaries included.
    [[nodiscard]] auto queryRange(Aabb const& region) const -> std::vector<StrokeHandle>;
    // Boxes lying completely inside `region`.
    [[nodiscard]] auto queryContained(Aabb const& region) const -> std::vector<StrokeHandle>;
    // Box closest to `point`, if one is within `maxDist`.
    [[nodiscard]] auto queryNearest(Vec2 const& point, double maxDist) const -> std::optional<StrokeHandle>;
    // Up to `k` boxes within `maxDist` of `point`, closest first.
    [[nodiscard]] auto queryNearestCandidates(Vec2 const& point, double maxDist, std::size_t k) const
            -> std::vector<StrokeHandle>;

    // Bulk load; replaces the whole content.
    auto rebuild(std::vector<Entry> const& entries) -> void;
    auto clear() -> void;

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto empty() const -> bool { return size() == 0; }
    [[nodiscard]] auto bounds() const -> std::optional<Aabb>;
    [[nodiscard]] auto entries() const -> std::vector<Entry>;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace SV::Store
