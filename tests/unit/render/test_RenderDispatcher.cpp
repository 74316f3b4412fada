#include <doctest/doctest.h>
#include <strokevault/render/RenderDispatcher.hpp>
#include <strokevault/store/DocumentStore.hpp>
#include <strokevault/task/TaskPool.hpp>

#include "ManualExecutor.hpp"
#include "StrokeVaultTestHelper.hpp"
#include "render/RenderTestImages.hpp"

#include <memory>
#include <utility>
#include <vector>

using namespace SV;
using namespace SV::Render;
using SV::Store::DocumentStore;

namespace {

auto line(Vec2 from, Vec2 to) -> Stroke {
    InkPath path;
    path.points = {InkPoint{from, 1.0}, InkPoint{to, 1.0}};
    path.width  = 2.0;
    return Stroke{path};
}

Aabb const kViewport{{0.0, 0.0}, {100.0, 100.0}};

// A store wired to a dispatcher the way a document wires them.
struct Fixture {
    explicit Fixture(RenderConfig config = {})
        : executor(std::make_shared<ManualExecutor>()), dispatcher(store, executor, config) {
        store.setChangeListener([this](Store::StoreChange const& change) { dispatcher.handleStoreChange(change); });
    }

    auto cache(StrokeHandle handle) const -> RenderCacheEntry const& {
        auto const* entry = store.findRenderCache(handle);
        REQUIRE(entry != nullptr);
        return *entry;
    }

    DocumentStore                   store;
    std::shared_ptr<ManualExecutor> executor;
    RenderDispatcher                dispatcher;
};

} // namespace

TEST_CASE("RenderDispatcher renders and installs a stroke") {
    Fixture f;
    auto    a = f.store.insertStroke(line({10.0, 10.0}, {30.0, 10.0}));
    CHECK(f.cache(a).state == RenderState::Dirty);

    std::vector<std::pair<StrokeHandle, double>> ready;
    f.dispatcher.addCacheReadyListener([&](StrokeHandle handle, double zoom) { ready.emplace_back(handle, zoom); });

    CHECK(f.dispatcher.requestRenderViewport(kViewport, 1.0) == 1);
    CHECK(f.cache(a).state == RenderState::Pending);
    CHECK(f.dispatcher.isPending(a, 1.0));
    CHECK(f.dispatcher.processCompletions() == 0);

    CHECK(f.executor->runAll() == 1);
    CHECK(f.dispatcher.processCompletions() == 1);

    auto const& entry = f.cache(a);
    CHECK(entry.state == RenderState::Clean);
    CHECK(entry.version == *f.store.version(a));
    REQUIRE(entry.levels.size() == 1);
    CHECK(entry.levels.front().zoomKey == f.dispatcher.zoomKey(1.0));
    CHECK_FALSE(entry.levels.front().tiles.empty());
    CHECK(entry.residentBytes() > 0);
    CHECK(f.dispatcher.pendingCount() == 0);

    REQUIRE(ready.size() == 1);
    CHECK(ready.front().first == a);
    CHECK(ready.front().second == 1.0);

    SUBCASE("a covered clean level is not rendered again") {
        CHECK(f.dispatcher.requestRenderViewport(kViewport, 1.0) == 0);
        CHECK(f.executor->pending() == 0);
    }

    auto const stats = f.dispatcher.stats();
    CHECK(stats.installed == 1);
    auto const json = statsToJson(stats);
    CHECK(json["installed"] == 1);
    CHECK(json.contains("evicted_levels"));
}

TEST_CASE("RenderDispatcher deduplicates identical requests") {
    Fixture           f;
    auto              a       = f.store.insertStroke(line({10.0, 10.0}, {30.0, 10.0}));
    StrokeHandle const one[]  = {a};

    CHECK(f.dispatcher.requestRender(one, kViewport, 1.0) == 1);
    CHECK(f.dispatcher.requestRender(one, kViewport, 1.0) == 0);
    CHECK(f.dispatcher.requestRender(one, kViewport, 1.004) == 0);
    CHECK(f.dispatcher.stats().deduplicated == 2);
    CHECK(f.dispatcher.pendingCount() == 1);
    CHECK(f.executor->pending() == 1);

    CHECK(f.dispatcher.requestRender(one, kViewport, 2.0) == 1);
    CHECK(f.dispatcher.pendingCount() == 2);
}

TEST_CASE("RenderDispatcher discards results for mutated strokes") {
    Fixture            f;
    auto               a     = f.store.insertStroke(line({10.0, 10.0}, {30.0, 10.0}));
    StrokeHandle const one[] = {a};

    REQUIRE(f.dispatcher.requestRender(one, kViewport, 1.0) == 1);
    REQUIRE(f.store.translateStrokes(one, {5.0, 5.0}).has_value());
    CHECK(f.cache(a).state == RenderState::Superseded);
    CHECK(f.dispatcher.pendingCount() == 0);

    f.executor->runAll();
    CHECK(f.dispatcher.processCompletions() == 0);
    CHECK(f.cache(a).state == RenderState::Dirty);
    CHECK(f.cache(a).levels.empty());
    CHECK(f.dispatcher.stats().discarded == 1);

    REQUIRE(f.dispatcher.requestRender(one, kViewport, 1.0) == 1);
    f.executor->runAll();
    CHECK(f.dispatcher.processCompletions() == 1);
    CHECK(f.cache(a).state == RenderState::Clean);
    CHECK(f.cache(a).version == *f.store.version(a));
    REQUIRE(f.cache(a).levels.size() == 1);
    CHECK(f.cache(a).levels.front().coveredRect.contains((*f.store.getStroke(a))->bounds()));
}

TEST_CASE("RenderDispatcher settles a superseded stroke whose queued job was skipped") {
    Fixture            f;
    auto               a     = f.store.insertStroke(line({10.0, 10.0}, {30.0, 10.0}));
    StrokeHandle const one[] = {a};

    REQUIRE(f.dispatcher.requestRender(one, kViewport, 1.0) == 1);
    REQUIRE(f.store.translateStrokes(one, {1.0, 0.0}).has_value());
    REQUIRE(f.store.translateStrokes(one, {1.0, 0.0}).has_value());
    CHECK(f.cache(a).state == RenderState::Superseded);

    // The token fired while the task was still queued, so it never runs.
    CHECK(f.executor->runAll() == 1);
    CHECK(f.dispatcher.processCompletions() == 0);
    CHECK(f.cache(a).state == RenderState::Dirty);
    CHECK(f.dispatcher.pendingCount() == 0);

    // Nothing is left to settle on later passes.
    CHECK(f.dispatcher.processCompletions() == 0);
    CHECK(f.cache(a).state == RenderState::Dirty);
    CHECK(f.dispatcher.stats().discarded == 1);
}

TEST_CASE("RenderDispatcher cancels jobs of removed strokes") {
    Fixture            f;
    auto               a     = f.store.insertStroke(line({10.0, 10.0}, {30.0, 10.0}));
    StrokeHandle const one[] = {a};

    REQUIRE(f.dispatcher.requestRender(one, kViewport, 1.0) == 1);
    REQUIRE(f.store.removeStroke(a).has_value());
    CHECK(f.dispatcher.pendingCount() == 0);
    CHECK(f.dispatcher.stats().cancelled == 1);

    f.executor->runAll();
    CHECK(f.dispatcher.processCompletions() == 0);
    CHECK(f.store.findRenderCache(a) == nullptr);
    CHECK(f.dispatcher.stats().installed == 0);
}

TEST_CASE("RenderDispatcher never installs an older version over a newer one") {
    Fixture            f;
    auto               a     = f.store.insertStroke(line({10.0, 10.0}, {30.0, 10.0}));
    StrokeHandle const one[] = {a};

    REQUIRE(f.dispatcher.requestRender(one, kViewport, 1.0) == 1);
    REQUIRE(f.store.updateStroke(a, [](Stroke& s) { s.transform.position = {0.0, 20.0}; }).has_value());
    REQUIRE(f.dispatcher.requestRender(one, kViewport, 1.0) == 1);
    REQUIRE(f.executor->pending() == 2);

    // The newer job finishes first.
    CHECK(f.executor->runLast());
    CHECK(f.dispatcher.processCompletions() == 1);
    auto const installedVersion = f.cache(a).version;
    CHECK(installedVersion == *f.store.version(a));

    CHECK(f.executor->runNext());
    CHECK(f.dispatcher.processCompletions() == 0);
    CHECK(f.cache(a).version == installedVersion);
    CHECK(f.cache(a).state == RenderState::Clean);
    CHECK(f.cache(a).levels.size() == 1);
}

TEST_CASE("RenderDispatcher completes zoom levels in any order") {
    Fixture            f;
    auto               a     = f.store.insertStroke(line({10.0, 10.0}, {30.0, 10.0}));
    StrokeHandle const one[] = {a};

    REQUIRE(f.dispatcher.requestRender(one, kViewport, 1.0) == 1);
    REQUIRE(f.dispatcher.requestRender(one, kViewport, 2.0) == 1);
    CHECK(f.executor->runLast());
    CHECK(f.dispatcher.processCompletions() == 1);
    CHECK(f.cache(a).state == RenderState::Pending);
    CHECK(f.executor->runNext());
    CHECK(f.dispatcher.processCompletions() == 1);
    CHECK(f.cache(a).state == RenderState::Clean);
    CHECK(f.cache(a).levels.size() == 2);
    CHECK(f.cache(a).level(f.dispatcher.zoomKey(2.0)) != nullptr);
}

TEST_CASE("RenderDispatcher reports decode failures") {
    Fixture     f;
    RasterImage image;
    image.encoded = std::make_shared<const std::vector<std::uint8_t>>(garbageImage());
    image.size    = Vec2{20.0, 20.0};
    Transform placement;
    placement.position = Vec2{10.0, 10.0};
    auto const         a     = f.store.insertStroke(Stroke{image, placement});
    StrokeHandle const one[] = {a};

    REQUIRE(f.dispatcher.requestRender(one, kViewport, 1.0) == 1);
    f.executor->runAll();
    CHECK(f.dispatcher.processCompletions() == 0);
    CHECK(f.cache(a).state == RenderState::Failed);
    REQUIRE(f.cache(a).failure.has_value());
    CHECK(f.dispatcher.stats().failed == 1);

    // The same version is not retried.
    CHECK(f.dispatcher.requestRender(one, kViewport, 1.0) == 0);

    REQUIRE(f.store.updateStroke(a, [](Stroke& s) {
                        auto& raster   = std::get<RasterImage>(s.geometry);
                        raster.encoded = std::make_shared<const std::vector<std::uint8_t>>(tinyPpm());
                    })
                    .has_value());
    CHECK(f.cache(a).state == RenderState::Dirty);
    REQUIRE(f.dispatcher.requestRender(one, kViewport, 1.0) == 1);
    f.executor->runAll();
    CHECK(f.dispatcher.processCompletions() == 1);
    CHECK(f.cache(a).state == RenderState::Clean);
    CHECK_FALSE(f.cache(a).failure.has_value());
}

TEST_CASE("RenderDispatcher skips strokes it should not render") {
    Fixture f;
    auto    far     = f.store.insertStroke(line({1000.0, 1000.0}, {1010.0, 1000.0}));
    auto    trashed = f.store.insertStroke(line({10.0, 10.0}, {20.0, 10.0}));
    StrokeHandle const trash[] = {trashed};
    REQUIRE(f.store.setTrashed(trash, true).has_value());
    StrokeHandle const stale{77, 3};

    std::vector<StrokeHandle> const handles{far, trashed, stale};
    CHECK(f.dispatcher.requestRender(handles, kViewport, 1.0) == 0);
    CHECK(f.dispatcher.requestRender(std::vector<StrokeHandle>{far}, Aabb{{990.0, 990.0}, {1020.0, 1010.0}}, 0.0) == 0);
    CHECK(f.executor->pending() == 0);

    SUBCASE("the extended viewport reaches strokes just outside the view") {
        auto near = f.store.insertStroke(line({120.0, 50.0}, {130.0, 50.0}));
        CHECK(f.dispatcher.extendedViewport(kViewport) == Aabb{{-40.0, -40.0}, {140.0, 140.0}});
        CHECK(f.dispatcher.requestRenderViewport(kViewport, 1.0) == 1);
        CHECK(f.dispatcher.isPending(near, 1.0));
    }
}

TEST_CASE("RenderDispatcher keeps a bounded number of zoom levels") {
    RenderConfig config;
    config.maxZoomLevelsPerStroke = 2;
    Fixture            f(config);
    auto               a     = f.store.insertStroke(line({10.0, 10.0}, {30.0, 10.0}));
    StrokeHandle const one[] = {a};

    for (double zoom : {1.0, 2.0, 3.0}) {
        REQUIRE(f.dispatcher.requestRender(one, kViewport, zoom) == 1);
        f.executor->runAll();
        REQUIRE(f.dispatcher.processCompletions() == 1);
    }
    auto const& entry = f.cache(a);
    REQUIRE(entry.levels.size() == 2);
    CHECK(entry.level(f.dispatcher.zoomKey(1.0)) == nullptr);
    CHECK(entry.level(f.dispatcher.zoomKey(3.0)) != nullptr);
    CHECK(f.dispatcher.stats().evictedLevels == 1);
}

TEST_CASE("RenderDispatcher drops caches far outside the viewport") {
    Fixture f;
    auto    a = f.store.insertStroke(line({10.0, 10.0}, {30.0, 10.0}));
    auto    b = f.store.insertStroke(line({60.0, 60.0}, {80.0, 60.0}));
    REQUIRE(f.dispatcher.requestRenderViewport(kViewport, 1.0) == 2);
    f.executor->runAll();
    REQUIRE(f.dispatcher.processCompletions() == 2);

    CHECK(f.dispatcher.clearOutsideViewport(Aabb{{0.0, 0.0}, {20.0, 20.0}}) == 1);
    CHECK_FALSE(f.cache(a).levels.empty());
    CHECK(f.cache(b).levels.empty());
    CHECK(f.cache(b).state == RenderState::Dirty);
}

TEST_CASE("RenderDispatcher cancelAll") {
    Fixture f;
    auto    a = f.store.insertStroke(line({10.0, 10.0}, {30.0, 10.0}));
    f.store.insertStroke(line({60.0, 60.0}, {80.0, 60.0}));
    REQUIRE(f.dispatcher.requestRenderViewport(kViewport, 1.0) == 2);

    f.dispatcher.cancelAll();
    CHECK(f.dispatcher.pendingCount() == 0);
    CHECK(f.dispatcher.stats().cancelled == 2);
    CHECK(f.cache(a).state == RenderState::Dirty);

    f.executor->runAll();
    CHECK(f.dispatcher.processCompletions() == 0);
    CHECK(f.dispatcher.stats().discarded == 2);
    CHECK(f.cache(a).levels.empty());
}

TEST_CASE("RenderDispatcher marks jobs failed when the executor drops them") {
    Fixture f;
    auto    a = f.store.insertStroke(line({10.0, 10.0}, {30.0, 10.0}));
    REQUIRE(f.dispatcher.requestRenderViewport(kViewport, 1.0) == 1);

    f.executor->shutdown();
    CHECK(f.dispatcher.processCompletions() == 0);
    CHECK(f.dispatcher.pendingCount() == 0);
    CHECK(f.cache(a).state == RenderState::Failed);
    CHECK(StrokeVaultTestHelper::submittedCount(f.dispatcher) == 0);

    auto b = f.store.insertStroke(line({40.0, 40.0}, {50.0, 40.0}));
    StrokeHandle const refused[] = {b};
    CHECK(f.dispatcher.requestRender(refused, kViewport, 1.0) == 0);
    CHECK(f.cache(b).state == RenderState::Dirty);
}

TEST_CASE("RenderDispatcher on a worker pool") {
    auto          pool = std::make_shared<TaskPool>(2);
    DocumentStore store;
    {
        RenderDispatcher dispatcher(store, pool);
        store.setChangeListener([&](Store::StoreChange const& change) { dispatcher.handleStoreChange(change); });

        std::vector<StrokeHandle> handles;
        for (int i = 0; i < 16; ++i) {
            handles.push_back(store.insertStroke(line({5.0 * i, 5.0}, {5.0 * i + 4.0, 25.0})));
        }
        REQUIRE(dispatcher.requestRenderViewport(kViewport, 1.5) == 16);
        dispatcher.waitIdle();
        CHECK(dispatcher.processCompletions() == 16);
        for (auto const handle : handles) {
            CHECK(store.findRenderCache(handle)->state == RenderState::Clean);
        }

        // Destroying the dispatcher with jobs in flight is safe.
        StrokeHandle const first[] = {handles.front()};
        REQUIRE(store.translateStrokes(first, {1.0, 0.0}).has_value());
        dispatcher.requestRender(first, kViewport, 1.5);
        store.setChangeListener({});
    }
    pool->shutdown();
}
