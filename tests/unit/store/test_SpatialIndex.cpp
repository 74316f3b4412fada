#include <doctest/doctest.h>
#include <strokevault/store/SpatialIndex.hpp>

#include <algorithm>
#include <map>
#include <random>

using namespace SV;
using namespace SV::Store;

namespace {

auto sorted(std::vector<StrokeHandle> handles) -> std::vector<StrokeHandle> {
    std::sort(handles.begin(), handles.end());
    return handles;
}

auto randomBox(std::mt19937& rng) -> Aabb {
    std::uniform_real_distribution<double> pos(-500.0, 500.0);
    std::uniform_real_distribution<double> extent(0.0, 60.0);
    Vec2 const min{pos(rng), pos(rng)};
    return Aabb{min, {min.x + extent(rng), min.y + extent(rng)}};
}

} // namespace

TEST_CASE("SpatialIndex basic queries") {
    SpatialIndex index;
    StrokeHandle const a{0, 0};
    StrokeHandle const b{1, 0};
    index.insert(a, Aabb{{0.0, 0.0}, {10.0, 10.0}});
    index.insert(b, Aabb{{20.0, 20.0}, {30.0, 30.0}});

    CHECK(index.size() == 2);
    CHECK(sorted(index.queryRange(Aabb{{5.0, 5.0}, {25.0, 25.0}})) == std::vector<StrokeHandle>{a, b});
    CHECK(index.queryRange(Aabb{{10.0, 10.0}, {12.0, 12.0}}) == std::vector<StrokeHandle>{a}); // touching counts
    CHECK(index.queryContained(Aabb{{-1.0, -1.0}, {25.0, 25.0}}) == std::vector<StrokeHandle>{a});
    CHECK(index.queryNearest(Vec2{12.0, 10.0}, 5.0) == a);
    CHECK_FALSE(index.queryNearest(Vec2{15.0, 15.0}, 1.0).has_value());
    CHECK(index.bounds() == Aabb{{0.0, 0.0}, {30.0, 30.0}});

    SUBCASE("re-inserting replaces the box") {
        index.insert(a, Aabb{{100.0, 100.0}, {110.0, 110.0}});
        CHECK(index.size() == 2);
        CHECK(index.queryRange(Aabb{{0.0, 0.0}, {10.0, 10.0}}).empty());
        CHECK(index.boxFor(a) == Aabb{{100.0, 100.0}, {110.0, 110.0}});
    }

    SUBCASE("removing an unknown handle is an error") {
        REQUIRE(index.remove(a).has_value());
        auto again = index.remove(a);
        REQUIRE_FALSE(again.has_value());
        CHECK(again.error().code == Error::Code::InvalidHandle);
        CHECK_FALSE(index.update(a, Aabb{}).has_value());
        CHECK_FALSE(index.contains(a));
    }

    SUBCASE("nearest candidates are ordered by distance") {
        StrokeHandle const c{2, 0};
        index.insert(c, Aabb{{12.0, 0.0}, {14.0, 2.0}});
        auto near = index.queryNearestCandidates(Vec2{15.0, 1.0}, 25.0, 3);
        REQUIRE(near.size() == 3);
        CHECK(near[0] == c);
        CHECK(near[1] == a);
        CHECK(near[2] == b);
    }
}

TEST_CASE("SpatialIndex matches a linear scan on random documents") {
    std::mt19937                     rng(20240611u);
    SpatialIndex                     index;
    std::map<StrokeHandle, Aabb>     reference;
    std::uint32_t                    nextIndex = 0;
    std::uniform_int_distribution<int> action(0, 9);

    for (int step = 0; step < 2000; ++step) {
        auto const roll = action(rng);
        if (roll < 5 || reference.empty()) {
            StrokeHandle const handle{nextIndex++, 0};
            auto const         box = randomBox(rng);
            index.insert(handle, box);
            reference[handle] = box;
        } else if (roll < 8) {
            std::uniform_int_distribution<std::size_t> pick(0, reference.size() - 1);
            auto it = std::next(reference.begin(), static_cast<std::ptrdiff_t>(pick(rng)));
            REQUIRE(index.remove(it->first).has_value());
            reference.erase(it);
        } else {
            std::uniform_int_distribution<std::size_t> pick(0, reference.size() - 1);
            auto it  = std::next(reference.begin(), static_cast<std::ptrdiff_t>(pick(rng)));
            auto box = randomBox(rng);
            REQUIRE(index.update(it->first, box).has_value());
            it->second = box;
        }

        if (step % 50 == 0) {
            auto const region = randomBox(rng).extended(80.0);
            std::vector<StrokeHandle> expected;
            std::vector<StrokeHandle> contained;
            for (auto const& [handle, box] : reference) {
                if (box.intersects(region)) {
                    expected.push_back(handle);
                }
                if (region.contains(box)) {
                    contained.push_back(handle);
                }
            }
            CHECK(sorted(index.queryRange(region)) == expected);
            CHECK(sorted(index.queryContained(region)) == contained);
            CHECK(index.size() == reference.size());
        }
    }

    SUBCASE("bulk rebuild gives the same answers") {
        std::vector<SpatialIndex::Entry> entries(reference.begin(), reference.end());
        SpatialIndex                     rebuilt;
        rebuilt.rebuild(entries);
        auto const region = Aabb{{-200.0, -200.0}, {200.0, 200.0}};
        CHECK(sorted(rebuilt.queryRange(region)) == sorted(index.queryRange(region)));
        CHECK(rebuilt.size() == index.size());
    }
}
