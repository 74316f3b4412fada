#include <strokevault/store/SpatialIndex.hpp>

#include "log/TaggedLogger.hpp"

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/geometries/point.hpp>
#include <boost/geometry/index/rtree.hpp>
#include <parallel_hashmap/phmap.h>

#include <algorithm>
#include <iterator>

namespace SV::Store {

namespace bg  = boost::geometry;
namespace bgi = boost::geometry::index;

namespace {

using Point = bg::model::point<double, 2, bg::cs::cartesian>;
using Box   = bg::model::box<Point>;
using Value = std::pair<Box, StrokeHandle>;
using Tree  = bgi::rtree<Value, bgi::quadratic<16>>;

auto toBox(Aabb const& a) -> Box {
    return Box{Point{a.min.x, a.min.y}, Point{a.max.x, a.max.y}};
}

auto toAabb(Box const& b) -> Aabb {
    return Aabb{{bg::get<bg::min_corner, 0>(b), bg::get<bg::min_corner, 1>(b)},
                {bg::get<bg::max_corner, 0>(b), bg::get<bg::max_corner, 1>(b)}};
}

auto handlesOf(std::vector<Value> const& values) -> std::vector<StrokeHandle> {
    std::vector<StrokeHandle> handles;
    handles.reserve(values.size());
    for (auto const& v : values) {
        handles.push_back(v.second);
    }
    return handles;
}

} // namespace

struct SpatialIndex::Impl {
    Tree                                         tree;
    phmap::flat_hash_map<StrokeHandle, Aabb>     boxes;
};

SpatialIndex::SpatialIndex()
    : impl_(std::make_unique<Impl>()) {}

SpatialIndex::~SpatialIndex()                                  = default;
SpatialIndex::SpatialIndex(SpatialIndex&&) noexcept            = default;
SpatialIndex& SpatialIndex::operator=(SpatialIndex&&) noexcept = default;

auto SpatialIndex::insert(StrokeHandle handle, Aabb const& box) -> void {
    if (auto it = impl_->boxes.find(handle); it != impl_->boxes.end()) {
        impl_->tree.remove(Value{toBox(it->second), handle});
        it->second = box;
    } else {
        impl_->boxes.emplace(handle, box);
    }
    impl_->tree.insert(Value{toBox(box), handle});
}

auto SpatialIndex::remove(StrokeHandle handle) -> Expected<void> {
    auto it = impl_->boxes.find(handle);
    if (it == impl_->boxes.end()) {
        sv_log("SpatialIndex::remove of unindexed handle " + toString(handle), "SpatialIndex");
        return std::unexpected(invalidHandleError("handle " + toString(handle) + " is not indexed"));
    }
    impl_->tree.remove(Value{toBox(it->second), handle});
    impl_->boxes.erase(it);
    return {};
}

auto SpatialIndex::update(StrokeHandle handle, Aabb const& box) -> Expected<void> {
    if (auto removed = remove(handle); !removed) {
        return removed;
    }
    insert(handle, box);
    return {};
}

auto SpatialIndex::contains(StrokeHandle handle) const -> bool {
    return impl_->boxes.contains(handle);
}

auto SpatialIndex::boxFor(StrokeHandle handle) const -> std::optional<Aabb> {
    auto it = impl_->boxes.find(handle);
    if (it == impl_->boxes.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto SpatialIndex::queryRange(Aabb const& region) const -> std::vector<StrokeHandle> {
    if (region.empty()) {
        return {};
    }
    std::vector<Value> found;
    impl_->tree.query(bgi::intersects(toBox(region)), std::back_inserter(found));
    return handlesOf(found);
}

auto SpatialIndex::queryContained(Aabb const& region) const -> std::vector<StrokeHandle> {
    if (region.empty()) {
        return {};
    }
    std::vector<Value> found;
    impl_->tree.query(bgi::covered_by(toBox(region)), std::back_inserter(found));
    return handlesOf(found);
}

auto SpatialIndex::queryNearest(Vec2 const& point, double maxDist) const -> std::optional<StrokeHandle> {
    auto candidates = queryNearestCandidates(point, maxDist, 1);
    if (candidates.empty()) {
        return std::nullopt;
    }
    return candidates.front();
}

auto SpatialIndex::queryNearestCandidates(Vec2 const& point, double maxDist, std::size_t k) const
        -> std::vector<StrokeHandle> {
    if (k == 0 || maxDist < 0.0 || impl_->tree.empty()) {
        return {};
    }
    auto const search = Aabb{point, point}.extended(maxDist);

    std::vector<Value> found;
    impl_->tree.query(bgi::intersects(toBox(search)) && bgi::nearest(Point{point.x, point.y}, static_cast<unsigned>(k)),
                      std::back_inserter(found));

    std::vector<std::pair<double, StrokeHandle>> ranked;
    ranked.reserve(found.size());
    for (auto const& v : found) {
        auto const d = toAabb(v.first).distanceTo(point);
        if (d <= maxDist) {
            ranked.emplace_back(d, v.second);
        }
    }
    std::sort(ranked.begin(), ranked.end());

    std::vector<StrokeHandle> handles;
    handles.reserve(ranked.size());
    for (auto const& r : ranked) {
        handles.push_back(r.second);
    }
    return handles;
}

auto SpatialIndex::rebuild(std::vector<Entry> const& entries) -> void {
    std::vector<Value> values;
    values.reserve(entries.size());
    impl_->boxes.clear();
    for (auto const& [handle, box] : entries) {
        if (impl_->boxes.contains(handle)) {
            continue;
        }
        impl_->boxes.emplace(handle, box);
        values.emplace_back(toBox(box), handle);
    }
    // The range constructor uses the packing algorithm.
    impl_->tree = Tree(values.begin(), values.end());
    sv_log("SpatialIndex::rebuild entries=" + std::to_string(values.size()), "SpatialIndex");
}

auto SpatialIndex::clear() -> void {
    impl_->tree.clear();
    impl_->boxes.clear();
}

auto SpatialIndex::size() const -> std::size_t {
    return impl_->boxes.size();
}

auto SpatialIndex::bounds() const -> std::optional<Aabb> {
    if (impl_->tree.empty()) {
        return std::nullopt;
    }
    return toAabb(impl_->tree.bounds());
}

auto SpatialIndex::entries() const -> std::vector<Entry> {
    std::vector<Entry> result;
    result.reserve(impl_->boxes.size());
    for (auto const& [handle, box] : impl_->boxes) {
        result.emplace_back(handle, box);
    }
    return result;
}

} // namespace SV::Store
