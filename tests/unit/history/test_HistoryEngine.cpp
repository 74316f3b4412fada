#include <doctest/doctest.h>
#include <strokevault/history/HistoryEngine.hpp>
#include <strokevault/store/DocumentStore.hpp>

#include "StrokeVaultTestHelper.hpp"

using namespace SV;
using namespace SV::History;
using SV::Store::DocumentStore;

namespace {

auto dash(double x) -> Stroke {
    InkPath path;
    path.points = {InkPoint{{x, 0.0}, 1.0}, InkPoint{{x + 4.0, 0.0}, 1.0}};
    return Stroke{path};
}

// Applies an undo/redo target to the store the way a document does.
auto apply(DocumentStore& store, HistoryEngine& history, Expected<std::optional<DocumentState>> const& target) -> bool {
    REQUIRE(target.has_value());
    if (!target->has_value()) {
        return false;
    }
    REQUIRE(store.importSnapshot(**target).has_value());
    history.rebaseCurrent(store.exportSnapshot());
    return true;
}

} // namespace

TEST_CASE("HistoryEngine undo, redo and redo truncation") {
    DocumentStore store;
    HistoryEngine history;
    history.reset(store.exportSnapshot());
    CHECK_FALSE(history.canUndo());
    CHECK_FALSE(history.canRedo());

    auto a = store.insertStroke(dash(0.0));
    REQUIRE(history.commit(store.exportSnapshot(), "A"));
    auto b = store.insertStroke(dash(10.0));
    REQUIRE(history.commit(store.exportSnapshot(), "B"));
    auto c = store.insertStroke(dash(20.0));
    REQUIRE(history.commit(store.exportSnapshot(), "C"));
    CHECK(history.undoCount() == 3);
    CHECK(history.undoLabel() == "C");

    CHECK(apply(store, history, history.undo()));
    CHECK(store.liveCount() == 2);
    CHECK(store.isValid(a));
    CHECK(store.isValid(b));
    CHECK_FALSE(store.isValid(c));
    CHECK(store.getStroke(c).error().code == Error::Code::InvalidHandle);

    CHECK(apply(store, history, history.undo()));
    CHECK(store.keysSortedChrono() == std::vector<StrokeHandle>{a});
    CHECK(history.redoLabel() == "B");

    CHECK(apply(store, history, history.redo()));
    CHECK(store.keysSortedChrono() == std::vector<StrokeHandle>{a, b});
    CHECK(history.canRedo());

    auto d = store.insertStroke(dash(30.0));
    REQUIRE(history.commit(store.exportSnapshot(), "D"));
    CHECK_FALSE(history.canRedo());
    CHECK_FALSE(apply(store, history, history.redo()));
    CHECK(store.keysSortedChrono() == std::vector<StrokeHandle>{a, b, d});
    CHECK(d != c);
    CHECK_FALSE(store.isValid(c));
}

TEST_CASE("HistoryEngine undo then redo restores identical content") {
    DocumentStore store;
    HistoryEngine history;
    history.reset(store.exportSnapshot());

    auto a = store.insertStroke(dash(0.0));
    REQUIRE(history.commit(store.exportSnapshot()));
    StrokeHandle const moved[] = {a};
    REQUIRE(store.translateStrokes(moved, {7.0, 3.0}).has_value());
    REQUIRE(history.commit(store.exportSnapshot()));
    auto const after = (*store.getStroke(a))->bounds();
    auto const versionAfter = *store.version(a);

    CHECK(apply(store, history, history.undo()));
    CHECK((*store.getStroke(a))->bounds() == Aabb{{-1.0, -1.0}, {5.0, 1.0}});
    CHECK(apply(store, history, history.redo()));
    CHECK((*store.getStroke(a))->bounds() == after);
    CHECK(*store.version(a) > versionAfter);

    CHECK(apply(store, history, history.undo()));
    CHECK(apply(store, history, history.undo()));
    CHECK(store.liveCount() == 0);
    CHECK_FALSE(apply(store, history, history.undo()));
}

TEST_CASE("HistoryEngine commit without changes records nothing") {
    DocumentStore store;
    HistoryEngine history;
    history.reset(store.exportSnapshot());

    CHECK_FALSE(history.commit(store.exportSnapshot()));
    store.insertStroke(dash(0.0));
    CHECK(history.commit(store.exportSnapshot()));
    CHECK_FALSE(history.commit(store.exportSnapshot()));
    CHECK(history.size() == 2);
}

TEST_CASE("HistoryEngine retention") {
    DocumentStore store;
    HistoryEngine history(3);
    history.reset(store.exportSnapshot());

    for (int i = 0; i < 5; ++i) {
        store.insertStroke(dash(10.0 * i));
        REQUIRE(history.commit(store.exportSnapshot()));
    }
    CHECK(history.size() == 3);
    CHECK(history.undoCount() == 2);
    CHECK(history.stats().evicted == 3);

    CHECK(apply(store, history, history.undo()));
    CHECK(apply(store, history, history.undo()));
    CHECK(store.liveCount() == 3);
    CHECK_FALSE(history.canUndo());

    SUBCASE("shrinking with the cursor at the front keeps the live snapshot") {
        history.setMaxSnapshots(1);
        CHECK(history.size() == 1);
        CHECK(history.current().state.liveCount() == 3);
    }

    SUBCASE("zero keeps everything") {
        history.setMaxSnapshots(0);
        for (int i = 0; i < 10; ++i) {
            store.insertStroke(dash(100.0 + i));
            REQUIRE(history.commit(store.exportSnapshot()));
        }
        CHECK(history.size() == 11);
    }
}

TEST_CASE("HistoryEngine drops corrupt snapshots") {
    DocumentStore store;
    HistoryEngine history;
    history.reset(store.exportSnapshot());

    auto a = store.insertStroke(dash(0.0));
    REQUIRE(history.commit(store.exportSnapshot(), "A"));
    store.insertStroke(dash(10.0));
    REQUIRE(history.commit(store.exportSnapshot(), "B"));
    store.insertStroke(dash(20.0));
    REQUIRE(history.commit(store.exportSnapshot(), "C"));

    SUBCASE("undo") {
        StrokeVaultTestHelper::corruptSnapshot(history, 2);
        auto result = history.undo();
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::CorruptSnapshotState);
        CHECK(history.size() == 3);
        CHECK(store.liveCount() == 3);
        CHECK(history.stats().corrupted == 1);

        CHECK(apply(store, history, history.undo()));
        CHECK(store.keysSortedChrono() == std::vector<StrokeHandle>{a});
    }

    SUBCASE("redo") {
        CHECK(apply(store, history, history.undo()));
        CHECK(apply(store, history, history.undo()));
        StrokeVaultTestHelper::corruptSnapshot(history, 2);
        auto result = history.redo();
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::CorruptSnapshotState);
        CHECK(StrokeVaultTestHelper::cursor(history) == 1);
        CHECK(history.redoCount() == 1);
        CHECK(apply(store, history, history.redo()));
        CHECK(store.liveCount() == 3);
        CHECK_FALSE(history.canRedo());
    }
}

TEST_CASE("HistoryEngine snapshots share unchanged buckets") {
    DocumentStore store;
    HistoryEngine history(0);
    history.reset(store.exportSnapshot());

    std::vector<StrokeHandle> handles;
    for (int i = 0; i < 200; ++i) {
        handles.push_back(store.insertStroke(dash(5.0 * i)));
    }
    REQUIRE(history.commit(store.exportSnapshot()));

    for (int i = 0; i < 20; ++i) {
        StrokeHandle const one[] = {handles[static_cast<std::size_t>(i) * 7]};
        REQUIRE(store.translateStrokes(one, {0.0, 1.0}).has_value());
        REQUIRE(history.commit(store.exportSnapshot()));
    }

    auto const stats = history.stats();
    CHECK(stats.snapshots == 22);
    CHECK(stats.undoCount == 21);
    CHECK(stats.sharedBuckets > stats.uniqueBuckets);

    auto const json = statsToJson(stats);
    CHECK(json["snapshots"] == 22);
    CHECK(json["undo_count"] == 21);
    CHECK(json["redo_count"] == 0);
    CHECK(json.contains("shared_buckets"));
}
