#include <doctest/doctest.h>
#include <strokevault/store/ComponentTables.hpp>
#include <strokevault/store/IdentityArena.hpp>

#include <memory>

using namespace SV;
using namespace SV::Store;

namespace {

auto pointStroke(double x, double y) -> StrokePtr {
    InkPath path;
    path.points = {InkPoint{{x, y}, 1.0}};
    return std::make_shared<const Stroke>(Stroke{path});
}

} // namespace

TEST_CASE("ComponentTables rows follow the arena") {
    IdentityArena   arena;
    ComponentTables tables{arena};

    auto a = arena.allocate();
    auto b = arena.allocate();
    REQUIRE(tables.insert(a, pointStroke(0.0, 0.0)).has_value());
    REQUIRE(tables.insert(b, pointStroke(5.0, 5.0)).has_value());

    SUBCASE("chrono stamps increase with insertion") {
        auto ca = tables.chrono(a);
        auto cb = tables.chrono(b);
        REQUIRE(ca.has_value());
        REQUIRE(cb.has_value());
        CHECK(chronoLess(*ca, *cb));
        REQUIRE(tables.restampChrono(a).has_value());
        CHECK(chronoLess(*tables.chrono(b), *tables.chrono(a)));
    }

    SUBCASE("update replaces the stroke and bumps the version") {
        auto before = tables.version(a);
        REQUIRE(before.has_value());
        auto updated = tables.update(a, [](Stroke& stroke) { stroke.transform.position = {10.0, 0.0}; });
        REQUIRE(updated.has_value());
        CHECK((*updated)->bounds().min.x > 8.0);
        CHECK(*tables.version(a) > *before);
    }

    SUBCASE("stale handles are rejected everywhere") {
        REQUIRE(tables.remove(b).has_value());
        REQUIRE(arena.free(b).has_value());
        CHECK(tables.get(b).error().code == Error::Code::InvalidHandle);
        CHECK(tables.version(b).error().code == Error::Code::InvalidHandle);
        CHECK(tables.isTrashed(b).error().code == Error::Code::InvalidHandle);
        CHECK(tables.insert(b, pointStroke(1.0, 1.0)).error().code == Error::Code::InvalidHandle);
        CHECK(tables.renderCache(b) == nullptr);
    }

    SUBCASE("trash flag reports whether it changed") {
        CHECK(*tables.setTrashed(a, true));
        CHECK_FALSE(*tables.setTrashed(a, true));
        CHECK(*tables.isTrashed(a));
    }

    SUBCASE("null strokes are malformed") {
        auto c = arena.allocate();
        CHECK(tables.insert(c, nullptr).error().code == Error::Code::MalformedInput);
    }
}

TEST_CASE("ComponentTables restore stamps only changed rows") {
    IdentityArena   arena;
    ComponentTables tables{arena};
    auto a = arena.allocate();
    auto b = arena.allocate();
    REQUIRE(tables.insert(a, pointStroke(0.0, 0.0)).has_value());
    REQUIRE(tables.insert(b, pointStroke(5.0, 5.0)).has_value());

    auto const arenaBefore  = arena.capture();
    auto const tablesBefore = tables.capture();
    auto const versionA     = *tables.version(a);
    auto const versionB     = *tables.version(b);

    REQUIRE(tables.update(b, [](Stroke& stroke) { stroke.transform.position = {1.0, 1.0}; }).has_value());
    auto const versionBUpdated = *tables.version(b);

    arena.restore(arenaBefore);
    auto changed = tables.restore(tablesBefore);
    REQUIRE(changed.size() == 1);
    CHECK(changed.front() == b);
    CHECK(*tables.version(a) == versionA);
    // Versions never go back, even to content seen before.
    CHECK(*tables.version(b) > versionBUpdated);
    CHECK(*tables.version(b) != versionB);
    CHECK(tables.capture().identicalTo(tablesBefore));
}

TEST_CASE("ComponentTables restore stamps rows whose trash flag changed") {
    IdentityArena   arena;
    ComponentTables tables{arena};
    auto a = arena.allocate();
    REQUIRE(tables.insert(a, pointStroke(0.0, 0.0)).has_value());

    auto const arenaBefore  = arena.capture();
    auto const tablesBefore = tables.capture();
    REQUIRE(*tables.setTrashed(a, true));
    auto const versionTrashed = *tables.version(a);

    arena.restore(arenaBefore);
    auto changed = tables.restore(tablesBefore);
    REQUIRE(changed.size() == 1);
    CHECK(changed.front() == a);
    CHECK_FALSE(*tables.isTrashed(a));
    CHECK(*tables.version(a) > versionTrashed);
}

TEST_CASE("ComponentTables validate catches inconsistent snapshots") {
    IdentityArena   arena;
    ComponentTables tables{arena};
    auto a = arena.allocate();
    REQUIRE(tables.insert(a, pointStroke(0.0, 0.0)).has_value());

    CHECK_FALSE(ComponentTables::validate(tables.capture(), arena.capture()).has_value());

    auto arenaState = arena.capture();
    arenaState.slots.mutate(a.index).occupied = false;
    auto error = ComponentTables::validate(tables.capture(), arenaState);
    REQUIRE(error.has_value());
    CHECK(error->code == Error::Code::CorruptSnapshotState);
}
