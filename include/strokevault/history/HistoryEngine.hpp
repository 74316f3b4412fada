#pragma once

#include <strokevault/core/Error.hpp>
#include <strokevault/store/DocumentState.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <deque>
#include <optional>
#include <string>

namespace SV {
struct StrokeVaultTestHelper;
}

namespace SV::History {

struct HistorySnapshot {
    DocumentState state;
    std::uint64_t sequence = 0;
    std::string   label;
};

struct HistoryStats {
    std::size_t undoCount     = 0;
    std::size_t redoCount     = 0;
    std::size_t snapshots     = 0;
    std::size_t evicted       = 0;
    std::size_t corrupted     = 0;
    std::size_t uniqueBuckets = 0; // distinct buckets referenced by all snapshots
    std::size_t sharedBuckets = 0; // bucket references saved by sharing
};

/**
 * Undo/redo over structurally shared DocumentStates.
 *
 * Snapshots live in a deque with a cursor on the live one; the initial state is
 * always present so undo can never step before it. Committing after an undo
 * drops the redo tail. With a maximum set, the oldest snapshots are evicted
 * from the front; buckets only they referenced are freed with them.
 */
class HistoryEngine {
public:
    explicit HistoryEngine(std::size_t maxSnapshots = 100);

    auto reset(DocumentState initial) -> void;

    // Records `state` as a new undo step. Returns false and records nothing when
    // it shares everything with the live snapshot.
    auto commit(DocumentState state, std::string label = {}) -> bool;
    // Replaces the live snapshot and drops the redo tail.
    auto amendLatest(DocumentState state) -> void;
    // Replaces the live snapshot with an equivalent state, keeping redo.
    auto rebaseCurrent(DocumentState state) -> void;

    // std::nullopt when there is nothing to undo/redo. A target snapshot that
    // fails validation is dropped and reported as CorruptSnapshotState; the
    // cursor stays on the live snapshot.
    auto undo() -> Expected<std::optional<DocumentState>>;
    auto redo() -> Expected<std::optional<DocumentState>>;

    [[nodiscard]] auto canUndo() const -> bool { return cursor_ > 0; }
    [[nodiscard]] auto canRedo() const -> bool { return cursor_ + 1 < snapshots_.size(); }
    [[nodiscard]] auto undoCount() const -> std::size_t { return cursor_; }
    [[nodiscard]] auto redoCount() const -> std::size_t { return snapshots_.size() - cursor_ - 1; }
    [[nodiscard]] auto size() const -> std::size_t { return snapshots_.size(); }

    [[nodiscard]] auto current() const -> HistorySnapshot const& { return snapshots_[cursor_]; }
    [[nodiscard]] auto undoLabel() const -> std::optional<std::string>;
    [[nodiscard]] auto redoLabel() const -> std::optional<std::string>;

    auto setMaxSnapshots(std::size_t maxSnapshots) -> void;
    [[nodiscard]] auto maxSnapshots() const -> std::size_t { return maxSnapshots_; }

    [[nodiscard]] auto stats() const -> HistoryStats;

private:
    friend struct SV::StrokeVaultTestHelper;

    static auto validate(DocumentState const& state) -> std::optional<Error>;
    auto        dropRedoTail() -> void;
    auto        enforceRetention() -> void;

    std::deque<HistorySnapshot> snapshots_;
    std::size_t                 cursor_       = 0;
    std::size_t                 maxSnapshots_ = 100; // 0 == unlimited
    std::uint64_t               nextSequence_ = 0;
    std::size_t                 evicted_      = 0;
    std::size_t                 corrupted_    = 0;
};

[[nodiscard]] auto statsToJson(HistoryStats const& stats) -> nlohmann::json;

} // namespace SV::History
