#include <strokevault/store/DocumentStore.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <span>
#include <vector>

namespace SV::Store {

namespace {

// Each handle once, so batch edits apply once per stroke.
auto uniqueHandles(std::span<StrokeHandle const> handles) -> std::vector<StrokeHandle> {
    std::vector<StrokeHandle> result(handles.begin(), handles.end());
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

} // namespace

DocumentStore::DocumentStore() = default;

auto DocumentStore::notify(StoreChange const& change) const -> void {
    if (listener_ && (!change.dirtied.empty() || !change.removed.empty())) {
        listener_(change);
    }
}

auto DocumentStore::requireValid(Handles handles) const -> Expected<void> {
    for (auto const& handle : handles) {
        if (!tables_.get(handle)) {
            return std::unexpected(invalidHandleError("stale or unknown handle " + toString(handle)));
        }
    }
    return {};
}

auto DocumentStore::index(StrokeHandle handle, Aabb const& bounds, bool trashed) -> void {
    if (trashed) {
        trashIndex_.insert(handle, bounds);
    } else {
        liveIndex_.insert(handle, bounds);
    }
}

auto DocumentStore::insertStroke(Stroke stroke) -> StrokeHandle {
    stroke.refresh();
    auto const handle = arena_.allocate();
    auto const bounds = stroke.bounds();
    auto       shared = std::make_shared<const Stroke>(std::move(stroke));
    if (auto inserted = tables_.insert(handle, std::move(shared)); !inserted) {
        sv_log("DocumentStore::insertStroke " + describeError(inserted.error()), "Store", "ERROR");
    }
    index(handle, bounds, false);
    sv_log("DocumentStore::insertStroke " + toString(handle), "Store");
    notify(StoreChange{.dirtied = {handle}, .removed = {}});
    return handle;
}

auto DocumentStore::applyUpdate(StrokeHandle handle, std::function<void(Stroke&)> const& mutator) -> Expected<void> {
    auto trashed = tables_.isTrashed(handle);
    if (!trashed) {
        return std::unexpected(trashed.error());
    }
    auto updated = tables_.update(handle, mutator);
    if (!updated) {
        return std::unexpected(updated.error());
    }
    index(handle, (*updated)->bounds(), *trashed);
    return {};
}

auto DocumentStore::updateStroke(StrokeHandle handle, std::function<void(Stroke&)> const& mutator) -> Expected<void> {
    if (auto result = applyUpdate(handle, mutator); !result) {
        sv_log("DocumentStore::updateStroke " + describeError(result.error()), "Store");
        return result;
    }
    notify(StoreChange{.dirtied = {handle}, .removed = {}});
    return {};
}

auto DocumentStore::eraseStroke(StrokeHandle handle) -> Expected<StrokePtr> {
    auto trashed = tables_.isTrashed(handle);
    if (!trashed) {
        return std::unexpected(trashed.error());
    }
    auto removed = tables_.remove(handle);
    if (!removed) {
        return removed;
    }
    auto& owner = *trashed ? trashIndex_ : liveIndex_;
    if (auto unindexed = owner.remove(handle); !unindexed) {
        sv_log("DocumentStore::eraseStroke index was missing " + toString(handle), "Store", "ERROR");
    }
    selection_.erase(handle);
    // Freed last: the generation bump makes the handle stale everywhere.
    if (auto freed = arena_.free(handle); !freed) {
        return std::unexpected(freed.error());
    }
    return removed;
}

auto DocumentStore::removeStroke(StrokeHandle handle) -> Expected<StrokePtr> {
    auto removed = eraseStroke(handle);
    if (!removed) {
        return removed;
    }
    sv_log("DocumentStore::removeStroke " + toString(handle), "Store");
    notify(StoreChange{.dirtied = {}, .removed = {handle}});
    return removed;
}

auto DocumentStore::getStroke(StrokeHandle handle) const -> Expected<StrokePtr> {
    return tables_.get(handle);
}

auto DocumentStore::translateStrokes(Handles handles, Vec2 delta) -> Expected<void> {
    if (auto valid = requireValid(handles); !valid) {
        return valid;
    }
    StoreChange change;
    for (auto const& handle : uniqueHandles(handles)) {
        if (auto moved = applyUpdate(handle, [delta](Stroke& stroke) { stroke.transform = stroke.transform.translated(delta); });
            !moved) {
            return moved;
        }
        change.dirtied.push_back(handle);
    }
    notify(change);
    return {};
}

auto DocumentStore::setTrashed(Handles handles, bool trashed) -> Expected<void> {
    if (auto valid = requireValid(handles); !valid) {
        return valid;
    }
    for (auto const& handle : handles) {
        auto changed = tables_.setTrashed(handle, trashed);
        if (!changed) {
            return std::unexpected(changed.error());
        }
        if (!*changed) {
            continue;
        }
        auto& from = trashed ? liveIndex_ : trashIndex_;
        auto  box  = from.boxFor(handle);
        if (auto unindexed = from.remove(handle); !unindexed) {
            sv_log("DocumentStore::setTrashed index was missing " + toString(handle), "Store", "ERROR");
        }
        if (box) {
            index(handle, *box, trashed);
        }
        if (trashed) {
            selection_.erase(handle);
        }
    }
    return {};
}

auto DocumentStore::removeTrashed() -> std::vector<StrokeHandle> {
    auto                      trashed = trashedKeys();
    std::vector<StrokeHandle> removed;
    removed.reserve(trashed.size());
    for (auto const& handle : trashed) {
        if (auto erased = eraseStroke(handle); !erased) {
            sv_log("DocumentStore::removeTrashed " + describeError(erased.error()), "Store", "ERROR");
            continue;
        }
        removed.push_back(handle);
    }
    sv_log("DocumentStore::removeTrashed count=" + std::to_string(removed.size()), "Store");
    notify(StoreChange{.dirtied = {}, .removed = removed});
    return removed;
}

auto DocumentStore::moveToFront(Handles handles) -> Expected<void> {
    if (auto valid = requireValid(handles); !valid) {
        return valid;
    }
    // Restamp in current order so the moved strokes keep their relative order.
    auto ordered = uniqueHandles(handles);
    sortChrono(ordered);
    for (auto const& handle : ordered) {
        if (auto stamped = tables_.restampChrono(handle); !stamped) {
            return stamped;
        }
    }
    return {};
}

auto DocumentStore::setLayer(Handles handles, StrokeLayer layer) -> Expected<void> {
    if (auto valid = requireValid(handles); !valid) {
        return valid;
    }
    StoreChange change;
    for (auto const& handle : uniqueHandles(handles)) {
        if (auto updated = applyUpdate(handle, [layer](Stroke& stroke) { stroke.layer = layer; }); !updated) {
            return updated;
        }
        change.dirtied.push_back(handle);
    }
    notify(change);
    return {};
}

auto DocumentStore::sortChrono(std::vector<StrokeHandle>& handles) const -> void {
    std::vector<std::pair<ChronoComponent, StrokeHandle>> keyed;
    keyed.reserve(handles.size());
    for (auto const& handle : handles) {
        if (auto c = tables_.chrono(handle)) {
            keyed.emplace_back(*c, handle);
        }
    }
    std::sort(keyed.begin(), keyed.end(), [](auto const& a, auto const& b) { return chronoLess(a.first, b.first); });
    handles.clear();
    for (auto const& [c, handle] : keyed) {
        handles.push_back(handle);
    }
}

auto DocumentStore::keysSortedChrono() const -> std::vector<StrokeHandle> {
    std::vector<StrokeHandle> keys;
    keys.reserve(liveIndex_.size());
    for (auto const& handle : arena_.liveHandles()) {
        if (liveIndex_.contains(handle)) {
            keys.push_back(handle);
        }
    }
    sortChrono(keys);
    return keys;
}

auto DocumentStore::keysSortedChronoIntersecting(Aabb const& region) const -> std::vector<StrokeHandle> {
    auto keys = liveIndex_.queryRange(region);
    sortChrono(keys);
    return keys;
}

auto DocumentStore::trashedKeys() const -> std::vector<StrokeHandle> {
    std::vector<StrokeHandle> keys;
    for (auto const& [handle, box] : trashIndex_.entries()) {
        keys.push_back(handle);
    }
    sortChrono(keys);
    return keys;
}

auto DocumentStore::strokesInViewport(Aabb const& viewport) const -> std::vector<StrokeHandle> {
    return liveIndex_.queryRange(viewport);
}

auto DocumentStore::strokesContainedIn(Aabb const& region) const -> std::vector<StrokeHandle> {
    return liveIndex_.queryContained(region);
}

auto DocumentStore::hitTest(Vec2 const& point, double tolerance) const -> std::optional<StrokeHandle> {
    // Every box within reach is a candidate; the exact test decides, and the
    // topmost stroke wins among the hits.
    auto candidates = liveIndex_.queryNearestCandidates(point, tolerance, liveIndex_.size());
    std::optional<std::pair<ChronoComponent, StrokeHandle>> best;
    for (auto const& handle : candidates) {
        auto stroke = tables_.get(handle);
        auto c      = tables_.chrono(handle);
        if (!stroke || !c) {
            continue;
        }
        if ((*stroke)->hitDistance(point) > tolerance) {
            continue;
        }
        if (!best || chronoLess(best->first, *c)) {
            best = std::make_pair(*c, handle);
        }
    }
    if (!best) {
        return std::nullopt;
    }
    return best->second;
}

auto DocumentStore::boundsFor(Handles handles) const -> std::optional<Aabb> {
    std::optional<Aabb> result;
    for (auto const& handle : handles) {
        auto stroke = tables_.get(handle);
        if (!stroke) {
            continue;
        }
        result = result ? result->merged((*stroke)->bounds()) : (*stroke)->bounds();
    }
    return result;
}

auto DocumentStore::totalBounds() const -> std::optional<Aabb> {
    return liveIndex_.bounds();
}

auto DocumentStore::select(Handles handles) -> Expected<void> {
    if (auto valid = requireValid(handles); !valid) {
        return valid;
    }
    for (auto const& handle : handles) {
        if (trashIndex_.contains(handle)) {
            return std::unexpected(Error{Error::Code::MalformedInput, "cannot select trashed stroke " + toString(handle)});
        }
    }
    for (auto const& handle : handles) {
        selection_.insert(handle);
    }
    return {};
}

auto DocumentStore::deselect(Handles handles) -> Expected<void> {
    if (auto valid = requireValid(handles); !valid) {
        return valid;
    }
    for (auto const& handle : handles) {
        selection_.erase(handle);
    }
    return {};
}

auto DocumentStore::setSelection(Handles handles) -> Expected<void> {
    if (auto valid = requireValid(handles); !valid) {
        return valid;
    }
    auto previous = std::move(selection_);
    selection_.clear();
    if (auto selected = select(handles); !selected) {
        selection_ = std::move(previous);
        return selected;
    }
    return {};
}

auto DocumentStore::clearSelection() -> void {
    selection_.clear();
}

auto DocumentStore::selection() const -> std::vector<StrokeHandle> {
    std::vector<StrokeHandle> keys(selection_.begin(), selection_.end());
    sortChrono(keys);
    return keys;
}

auto DocumentStore::isSelected(StrokeHandle handle) const -> bool {
    return selection_.contains(handle);
}

auto DocumentStore::selectionBounds() const -> std::optional<Aabb> {
    auto keys = selection();
    return boundsFor(keys);
}

auto DocumentStore::setMeta(DocumentMeta meta) -> void {
    meta_ = std::make_shared<const DocumentMeta>(std::move(meta));
}

auto DocumentStore::exportSnapshot() const -> DocumentState {
    return DocumentState{.arena = arena_.capture(), .tables = tables_.capture(), .meta = meta_};
}

auto DocumentStore::rebuildIndexes() -> void {
    std::vector<SpatialIndex::Entry> live;
    std::vector<SpatialIndex::Entry> trashed;
    for (auto const& handle : arena_.liveHandles()) {
        auto stroke = tables_.get(handle);
        if (!stroke) {
            continue;
        }
        auto isTrashed = tables_.isTrashed(handle);
        auto& target   = isTrashed && *isTrashed ? trashed : live;
        target.emplace_back(handle, (*stroke)->bounds());
    }
    liveIndex_.rebuild(live);
    trashIndex_.rebuild(trashed);
}

auto DocumentStore::importSnapshot(DocumentState const& state) -> Expected<void> {
    if (!state.meta) {
        return std::unexpected(Error{Error::Code::CorruptSnapshotState, "snapshot has no document metadata"});
    }
    if (auto invalid = ComponentTables::validate(state.tables, state.arena)) {
        sv_log("DocumentStore::importSnapshot rejected: " + describeError(*invalid), "Store", "ERROR");
        return std::unexpected(*invalid);
    }

    auto const previouslyLive = arena_.liveHandles();
    arena_.restore(state.arena);
    auto dirtied = tables_.restore(state.tables);
    meta_        = state.meta;
    rebuildIndexes();

    for (auto it = selection_.begin(); it != selection_.end();) {
        if (!arena_.isValid(*it) || trashIndex_.contains(*it)) {
            selection_.erase(it++);
        } else {
            ++it;
        }
    }

    StoreChange change;
    change.dirtied = std::move(dirtied);
    for (auto const& handle : previouslyLive) {
        if (!arena_.isValid(handle)) {
            change.removed.push_back(handle);
        }
    }
    sv_log("DocumentStore::importSnapshot live=" + std::to_string(arena_.liveCount()), "Store");
    notify(change);
    return {};
}

} // namespace SV::Store
