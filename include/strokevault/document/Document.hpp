#pragma once

#include <strokevault/core/Config.hpp>
#include <strokevault/core/Error.hpp>
#include <strokevault/core/Geometry.hpp>
#include <strokevault/core/StrokeHandle.hpp>
#include <strokevault/history/HistoryEngine.hpp>
#include <strokevault/input/EditIntent.hpp>
#include <strokevault/render/RenderDispatcher.hpp>
#include <strokevault/store/DocumentState.hpp>
#include <strokevault/store/DocumentStore.hpp>
#include <strokevault/task/Executor.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace SV {

class Document;

/**
 * Groups every intent applied while it is open into one undo step.
 * commit() records that step; a transaction destroyed without commit()
 * records nothing and leaves its changes live for the next commit.
 */
class GestureTransaction {
public:
    GestureTransaction(GestureTransaction&& other) noexcept;
    GestureTransaction& operator=(GestureTransaction&& other) noexcept;
    GestureTransaction(GestureTransaction const&)            = delete;
    GestureTransaction& operator=(GestureTransaction const&) = delete;
    ~GestureTransaction();

    // Returns true when a snapshot was recorded.
    auto commit() -> bool;
    [[nodiscard]] auto isOpen() const -> bool { return document_ != nullptr; }

private:
    friend class Document;
    GestureTransaction(Document& document, std::string label);
    auto close() -> void;

    Document*   document_ = nullptr;
    std::string label_;
};

/**
 * Document: one open document with its store, history and renderer.
 *
 * Edit intents are applied on the owner thread. With CommitPolicy::PerIntent
 * every completed gesture records one history snapshot unless a
 * GestureTransaction is open; with CommitPolicy::Manual only commitHistory()
 * and GestureTransaction::commit() record snapshots.
 */
class Document {
public:
    explicit Document(Config config = {});
    Document(Config config, std::shared_ptr<Executor> executor);
    ~Document();

    Document(Document const&)            = delete;
    Document& operator=(Document const&) = delete;

    auto apply(Input::EditIntent const& intent) -> Expected<Input::IntentOutcome>;

    [[nodiscard]] auto beginGesture(std::string label) -> GestureTransaction;
    // Records the live state as an undo step; false when nothing changed.
    auto commitHistory(std::string label = {}) -> bool;

    // Uncommitted live changes are discarded by the first undo. Redo never
    // discards them: with uncommitted changes it returns false.
    auto undo() -> Expected<bool>;
    auto redo() -> Expected<bool>;
    [[nodiscard]] auto canUndo() const -> bool { return history_.canUndo() || hasUncommittedChanges(); }
    [[nodiscard]] auto canRedo() const -> bool { return history_.canRedo() && !hasUncommittedChanges(); }
    [[nodiscard]] auto hasUncommittedChanges() const -> bool;

    [[nodiscard]] auto exportSnapshot() const -> DocumentState { return store_.exportSnapshot(); }
    // Replaces the document content and starts a fresh history at it.
    auto importSnapshot(DocumentState const& state) -> Expected<void>;

    // Render boundary
    [[nodiscard]] auto strokesInViewport(Aabb const& viewport) const -> std::vector<StrokeHandle> {
        return store_.strokesInViewport(viewport);
    }
    auto requestRender(std::span<StrokeHandle const> handles, Aabb const& viewport, double zoom) -> std::size_t {
        return dispatcher_.requestRender(handles, viewport, zoom);
    }
    auto requestRenderViewport(Aabb const& viewport, double zoom) -> std::size_t {
        return dispatcher_.requestRenderViewport(viewport, zoom);
    }
    auto processRenderCompletions() -> std::size_t { return dispatcher_.processCompletions(); }
    auto onCacheReady(Render::RenderDispatcher::CacheReadyListener listener) -> void {
        dispatcher_.addCacheReadyListener(std::move(listener));
    }

    // Query boundary
    [[nodiscard]] auto hitTest(Vec2 const& point, double tolerance) const -> std::optional<StrokeHandle> {
        return store_.hitTest(point, tolerance);
    }
    [[nodiscard]] auto selection() const -> std::vector<StrokeHandle> { return store_.selection(); }
    auto setSelection(std::span<StrokeHandle const> handles) -> Expected<void> { return store_.setSelection(handles); }
    [[nodiscard]] auto activeStroke() const -> std::optional<StrokeHandle> { return activeStroke_; }

    [[nodiscard]] auto store() -> Store::DocumentStore& { return store_; }
    [[nodiscard]] auto store() const -> Store::DocumentStore const& { return store_; }
    [[nodiscard]] auto history() const -> History::HistoryEngine const& { return history_; }
    [[nodiscard]] auto dispatcher() -> Render::RenderDispatcher& { return dispatcher_; }
    [[nodiscard]] auto config() const -> Config const& { return config_; }

private:
    friend class GestureTransaction;

    auto applyIntent(Input::BeginStroke const& intent, Input::IntentOutcome& outcome) -> Expected<void>;
    auto applyIntent(Input::AppendPoint const& intent, Input::IntentOutcome& outcome) -> Expected<void>;
    auto applyIntent(Input::EndStroke const& intent, Input::IntentOutcome& outcome) -> Expected<void>;
    auto applyIntent(Input::MoveSelection const& intent, Input::IntentOutcome& outcome) -> Expected<void>;
    auto applyIntent(Input::DeleteSelection const& intent, Input::IntentOutcome& outcome) -> Expected<void>;
    auto applyIntent(Input::ImportImage const& intent, Input::IntentOutcome& outcome) -> Expected<void>;
    auto applyIntent(Input::ImportVectorImage const& intent, Input::IntentOutcome& outcome) -> Expected<void>;
    auto applyIntent(Input::InsertText const& intent, Input::IntentOutcome& outcome) -> Expected<void>;
    auto applyIntent(Input::SelectAt const& intent, Input::IntentOutcome& outcome) -> Expected<void>;
    auto applyIntent(Input::SelectInRect const& intent, Input::IntentOutcome& outcome) -> Expected<void>;
    auto applyIntent(Input::ClearSelection const& intent, Input::IntentOutcome& outcome) -> Expected<void>;
    auto applyIntent(Input::TrashSelection const& intent, Input::IntentOutcome& outcome) -> Expected<void>;
    auto applyIntent(Input::EmptyTrash const& intent, Input::IntentOutcome& outcome) -> Expected<void>;

    // Commits after a completed gesture when the policy allows it.
    auto commitGesture(std::string label) -> bool;
    auto restore(DocumentState const& state) -> Expected<void>;

    Config                    config_;
    std::shared_ptr<Executor> executor_;
    Store::DocumentStore      store_;
    History::HistoryEngine    history_;
    Render::RenderDispatcher  dispatcher_;
    std::optional<StrokeHandle> activeStroke_;
    std::size_t               openTransactions_ = 0;
};

} // namespace SV
