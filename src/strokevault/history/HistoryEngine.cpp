#include <strokevault/history/HistoryEngine.hpp>

#include "log/TaggedLogger.hpp"

#include <unordered_set>

namespace SV::History {

HistoryEngine::HistoryEngine(std::size_t maxSnapshots)
    : maxSnapshots_(maxSnapshots) {
    reset(DocumentState{});
}

auto HistoryEngine::reset(DocumentState initial) -> void {
    snapshots_.clear();
    snapshots_.push_back(HistorySnapshot{.state = std::move(initial), .sequence = nextSequence_++, .label = "initial"});
    cursor_    = 0;
    evicted_   = 0;
    corrupted_ = 0;
}

auto HistoryEngine::commit(DocumentState state, std::string label) -> bool {
    if (snapshots_[cursor_].state.identicalTo(state)) {
        sv_log("HistoryEngine::commit skipped, state unchanged", "History");
        return false;
    }
    dropRedoTail();
    snapshots_.push_back(HistorySnapshot{.state = std::move(state), .sequence = nextSequence_++, .label = std::move(label)});
    cursor_ = snapshots_.size() - 1;
    enforceRetention();
    sv_log("HistoryEngine::commit '" + snapshots_[cursor_].label + "' undo=" + std::to_string(undoCount()), "History");
    return true;
}

auto HistoryEngine::amendLatest(DocumentState state) -> void {
    dropRedoTail();
    snapshots_[cursor_].state = std::move(state);
}

auto HistoryEngine::rebaseCurrent(DocumentState state) -> void {
    snapshots_[cursor_].state = std::move(state);
}

auto HistoryEngine::validate(DocumentState const& state) -> std::optional<Error> {
    if (!state.meta) {
        return Error{Error::Code::CorruptSnapshotState, "snapshot has no document metadata"};
    }
    return Store::ComponentTables::validate(state.tables, state.arena);
}

auto HistoryEngine::undo() -> Expected<std::optional<DocumentState>> {
    if (!canUndo()) {
        return std::optional<DocumentState>{};
    }
    auto const target = cursor_ - 1;
    if (auto invalid = validate(snapshots_[target].state)) {
        sv_log("HistoryEngine::undo dropping corrupt snapshot #" + std::to_string(snapshots_[target].sequence), "History", "ERROR");
        snapshots_.erase(snapshots_.begin() + static_cast<std::ptrdiff_t>(target));
        cursor_ -= 1;
        ++corrupted_;
        return std::unexpected(*invalid);
    }
    cursor_ = target;
    return std::optional<DocumentState>{snapshots_[cursor_].state};
}

auto HistoryEngine::redo() -> Expected<std::optional<DocumentState>> {
    if (!canRedo()) {
        return std::optional<DocumentState>{};
    }
    auto const target = cursor_ + 1;
    if (auto invalid = validate(snapshots_[target].state)) {
        sv_log("HistoryEngine::redo dropping corrupt snapshot #" + std::to_string(snapshots_[target].sequence), "History", "ERROR");
        snapshots_.erase(snapshots_.begin() + static_cast<std::ptrdiff_t>(target));
        ++corrupted_;
        return std::unexpected(*invalid);
    }
    cursor_ = target;
    return std::optional<DocumentState>{snapshots_[cursor_].state};
}

auto HistoryEngine::undoLabel() const -> std::optional<std::string> {
    if (!canUndo()) {
        return std::nullopt;
    }
    return snapshots_[cursor_].label;
}

auto HistoryEngine::redoLabel() const -> std::optional<std::string> {
    if (!canRedo()) {
        return std::nullopt;
    }
    return snapshots_[cursor_ + 1].label;
}

auto HistoryEngine::setMaxSnapshots(std::size_t maxSnapshots) -> void {
    maxSnapshots_ = maxSnapshots;
    enforceRetention();
}

auto HistoryEngine::stats() const -> HistoryStats {
    HistoryStats s;
    s.undoCount = undoCount();
    s.redoCount = redoCount();
    s.snapshots = snapshots_.size();
    s.evicted   = evicted_;
    s.corrupted = corrupted_;

    std::unordered_set<void const*> seen;
    std::size_t                     references = 0;
    for (auto const& snapshot : snapshots_) {
        snapshot.state.collectBuckets(seen);
        references += snapshot.state.bucketCount();
    }
    s.uniqueBuckets = seen.size();
    s.sharedBuckets = references - seen.size();
    return s;
}

auto HistoryEngine::dropRedoTail() -> void {
    while (snapshots_.size() > cursor_ + 1) {
        snapshots_.pop_back();
    }
}

auto HistoryEngine::enforceRetention() -> void {
    if (maxSnapshots_ == 0) {
        return;
    }
    // The live snapshot is never evicted; with the cursor at the front the
    // redo tail goes first.
    while (snapshots_.size() > maxSnapshots_ && snapshots_.size() > 1) {
        if (cursor_ == 0) {
            snapshots_.pop_back();
        } else {
            snapshots_.pop_front();
            cursor_ -= 1;
        }
        ++evicted_;
    }
}

auto statsToJson(HistoryStats const& stats) -> nlohmann::json {
    return nlohmann::json{{"undo_count", stats.undoCount},
                          {"redo_count", stats.redoCount},
                          {"snapshots", stats.snapshots},
                          {"evicted", stats.evicted},
                          {"corrupted", stats.corrupted},
                          {"unique_buckets", stats.uniqueBuckets},
                          {"shared_buckets", stats.sharedBuckets}};
}

} // namespace SV::History
