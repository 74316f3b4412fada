#include <strokevault/document/Document.hpp>
#include <strokevault/task/TaskPool.hpp>

#include "log/TaggedLogger.hpp"

#include <utility>
#include <variant>

namespace SV {

GestureTransaction::GestureTransaction(Document& document, std::string label)
    : document_(&document), label_(std::move(label)) {
    ++document_->openTransactions_;
}

GestureTransaction::GestureTransaction(GestureTransaction&& other) noexcept
    : document_(std::exchange(other.document_, nullptr)), label_(std::move(other.label_)) {}

GestureTransaction& GestureTransaction::operator=(GestureTransaction&& other) noexcept {
    if (this != &other) {
        close();
        document_ = std::exchange(other.document_, nullptr);
        label_    = std::move(other.label_);
    }
    return *this;
}

GestureTransaction::~GestureTransaction() {
    close();
}

auto GestureTransaction::close() -> void {
    if (document_ != nullptr) {
        --document_->openTransactions_;
        document_ = nullptr;
    }
}

auto GestureTransaction::commit() -> bool {
    if (document_ == nullptr) {
        return false;
    }
    auto* document = document_;
    close();
    return document->commitHistory(label_);
}

Document::Document(Config config)
    : Document(config, std::make_shared<TaskPool>(config.render.workerCount)) {}

Document::Document(Config config, std::shared_ptr<Executor> executor)
    : config_(std::move(config)),
      executor_(executor ? std::move(executor) : std::shared_ptr<Executor>(std::make_shared<TaskPool>(config_.render.workerCount))),
      history_(config_.history.maxSnapshots),
      dispatcher_(store_, executor_, config_.render) {
    store_.setChangeListener([this](Store::StoreChange const& change) { dispatcher_.handleStoreChange(change); });
    history_.reset(store_.exportSnapshot());
}

Document::~Document() {
    store_.setChangeListener({});
    dispatcher_.cancelAll();
}

auto Document::apply(Input::EditIntent const& intent) -> Expected<Input::IntentOutcome> {
    Input::IntentOutcome outcome;
    auto result = std::visit([&](auto const& concrete) { return applyIntent(concrete, outcome); }, intent);
    if (!result) {
        sv_log(std::string("Document::apply ") + std::string(Input::intentName(intent)) + " " + describeError(result.error()),
               "Document");
        return std::unexpected(result.error());
    }
    return outcome;
}

auto Document::beginGesture(std::string label) -> GestureTransaction {
    return GestureTransaction(*this, std::move(label));
}

auto Document::commitHistory(std::string label) -> bool {
    auto const recorded = history_.commit(store_.exportSnapshot(), std::move(label));
    sv_log("Document::commitHistory recorded=" + std::string(recorded ? "true" : "false"), "History");
    return recorded;
}

auto Document::commitGesture(std::string label) -> bool {
    if (config_.gesture.policy == CommitPolicy::Manual || openTransactions_ > 0) {
        return false;
    }
    return commitHistory(std::move(label));
}

auto Document::hasUncommittedChanges() const -> bool {
    return !store_.exportSnapshot().identicalTo(history_.current().state);
}

auto Document::restore(DocumentState const& state) -> Expected<void> {
    if (auto imported = store_.importSnapshot(state); !imported) {
        return imported;
    }
    activeStroke_.reset();
    return {};
}

auto Document::undo() -> Expected<bool> {
    if (hasUncommittedChanges()) {
        if (auto restored = restore(history_.current().state); !restored) {
            return std::unexpected(restored.error());
        }
        history_.rebaseCurrent(store_.exportSnapshot());
        return true;
    }
    auto target = history_.undo();
    if (!target) {
        return std::unexpected(target.error());
    }
    if (!*target) {
        return false;
    }
    if (auto restored = restore(**target); !restored) {
        return std::unexpected(restored.error());
    }
    history_.rebaseCurrent(store_.exportSnapshot());
    return true;
}

auto Document::redo() -> Expected<bool> {
    // Live edits after an undo start a new branch; the redo tail is dropped by their commit.
    if (hasUncommittedChanges()) {
        return false;
    }
    auto target = history_.redo();
    if (!target) {
        return std::unexpected(target.error());
    }
    if (!*target) {
        return false;
    }
    if (auto restored = restore(**target); !restored) {
        return std::unexpected(restored.error());
    }
    history_.rebaseCurrent(store_.exportSnapshot());
    return true;
}

auto Document::importSnapshot(DocumentState const& state) -> Expected<void> {
    if (auto restored = restore(state); !restored) {
        return restored;
    }
    store_.clearSelection();
    history_.reset(store_.exportSnapshot());
    return {};
}

auto Document::applyIntent(Input::BeginStroke const& intent, Input::IntentOutcome& outcome) -> Expected<void> {
    if (activeStroke_) {
        return std::unexpected(Error{Error::Code::MalformedInput, "a stroke is already in progress"});
    }
    InkPath path;
    path.points.push_back(InkPoint{intent.pos, intent.pressure});
    path.width       = intent.width;
    path.color       = intent.color;
    path.highlighter = intent.highlighter;

    auto const handle = store_.insertStroke(Stroke{std::move(path)});
    activeStroke_     = handle;
    outcome.created.push_back(handle);
    return {};
}

auto Document::applyIntent(Input::AppendPoint const& intent, Input::IntentOutcome&) -> Expected<void> {
    if (!activeStroke_) {
        return std::unexpected(Error{Error::Code::MalformedInput, "append_point without an active stroke"});
    }
    auto updated = store_.updateStroke(*activeStroke_, [&](Stroke& stroke) {
        if (auto* path = std::get_if<InkPath>(&stroke.geometry)) {
            path->points.push_back(InkPoint{intent.pos, intent.pressure});
        }
    });
    if (!updated) {
        activeStroke_.reset();
    }
    return updated;
}

auto Document::applyIntent(Input::EndStroke const&, Input::IntentOutcome& outcome) -> Expected<void> {
    if (!activeStroke_) {
        return std::unexpected(Error{Error::Code::MalformedInput, "end_stroke without an active stroke"});
    }
    activeStroke_.reset();
    outcome.committed = commitGesture("Draw");
    return {};
}

auto Document::applyIntent(Input::MoveSelection const& intent, Input::IntentOutcome& outcome) -> Expected<void> {
    auto const selected = store_.selection();
    if (selected.empty()) {
        return {};
    }
    if (auto moved = store_.translateStrokes(selected, intent.delta); !moved) {
        return moved;
    }
    outcome.committed = commitGesture("Move");
    return {};
}

auto Document::applyIntent(Input::DeleteSelection const&, Input::IntentOutcome& outcome) -> Expected<void> {
    auto const selected = store_.selection();
    if (selected.empty()) {
        return {};
    }
    for (auto const handle : selected) {
        if (auto removed = store_.removeStroke(handle); !removed) {
            return std::unexpected(removed.error());
        }
    }
    outcome.committed = commitGesture("Delete");
    return {};
}

auto Document::applyIntent(Input::ImportImage const& intent, Input::IntentOutcome& outcome) -> Expected<void> {
    if (intent.bytes.empty()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "import_image without image data"});
    }
    auto size = intent.size;
    if (size.x <= 0.0 || size.y <= 0.0) {
        auto decoded = dispatcher_.images().load(intent.bytes);
        if (!decoded) {
            return std::unexpected(decoded.error());
        }
        size = Vec2{static_cast<double>((*decoded)->width), static_cast<double>((*decoded)->height)};
    }

    RasterImage image;
    image.encoded = std::make_shared<const std::vector<std::uint8_t>>(intent.bytes);
    image.size    = size;
    Transform transform;
    transform.position = intent.position;

    outcome.created.push_back(store_.insertStroke(Stroke{std::move(image), transform}));
    outcome.committed = commitGesture("Import image");
    return {};
}

auto Document::applyIntent(Input::ImportVectorImage const& intent, Input::IntentOutcome& outcome) -> Expected<void> {
    if (intent.image.paths.empty()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "import_vector_image without paths"});
    }
    Transform transform;
    transform.position = intent.position;
    outcome.created.push_back(store_.insertStroke(Stroke{intent.image, transform}));
    outcome.committed = commitGesture("Import vector image");
    return {};
}

auto Document::applyIntent(Input::InsertText const& intent, Input::IntentOutcome& outcome) -> Expected<void> {
    if (intent.text.empty() || intent.fontSize <= 0.0) {
        return std::unexpected(Error{Error::Code::MalformedInput, "insert_text needs text and a positive font size"});
    }
    Transform transform;
    transform.position = intent.position;
    outcome.created.push_back(store_.insertStroke(Stroke{TextRun{intent.text, intent.fontSize, intent.color}, transform}));
    outcome.committed = commitGesture("Insert text");
    return {};
}

auto Document::applyIntent(Input::SelectAt const& intent, Input::IntentOutcome&) -> Expected<void> {
    auto const hit = store_.hitTest(intent.point, intent.tolerance);
    if (!intent.extend) {
        store_.clearSelection();
    }
    if (!hit) {
        return {};
    }
    StrokeHandle const handles[] = {*hit};
    return store_.select(handles);
}

auto Document::applyIntent(Input::SelectInRect const& intent, Input::IntentOutcome&) -> Expected<void> {
    auto const inside = store_.strokesContainedIn(intent.rect);
    return intent.extend ? store_.select(inside) : store_.setSelection(inside);
}

auto Document::applyIntent(Input::ClearSelection const&, Input::IntentOutcome&) -> Expected<void> {
    store_.clearSelection();
    return {};
}

auto Document::applyIntent(Input::TrashSelection const&, Input::IntentOutcome& outcome) -> Expected<void> {
    auto const selected = store_.selection();
    if (selected.empty()) {
        return {};
    }
    if (auto trashed = store_.setTrashed(selected, true); !trashed) {
        return trashed;
    }
    outcome.committed = commitGesture("Trash");
    return {};
}

auto Document::applyIntent(Input::EmptyTrash const&, Input::IntentOutcome& outcome) -> Expected<void> {
    if (store_.removeTrashed().empty()) {
        return {};
    }
    outcome.committed = commitGesture("Empty trash");
    return {};
}

} // namespace SV
