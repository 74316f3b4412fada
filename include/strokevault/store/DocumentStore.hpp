#pragma once

#include <strokevault/core/Error.hpp>
#include <strokevault/core/Geometry.hpp>
#include <strokevault/core/StrokeHandle.hpp>
#include <strokevault/render/RenderCache.hpp>
#include <strokevault/store/ComponentTables.hpp>
#include <strokevault/store/DocumentState.hpp>
#include <strokevault/store/IdentityArena.hpp>
#include <strokevault/store/SpatialIndex.hpp>
#include <strokevault/store/Stroke.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <vector>

namespace SV {
struct StrokeVaultTestHelper;
}

namespace SV::Store {

// Reported after every mutation that changes what strokes exist or look like.
struct StoreChange {
    std::vector<StrokeHandle> dirtied; // content or version changed
    std::vector<StrokeHandle> removed; // no longer valid
};

/**
 * DocumentStore is the single mutation gateway of one document.
 *
 * Owns the identity arena, the component tables, the two spatial indexes
 * (regular and trashed strokes) and the selection, and keeps them consistent:
 * every method either applies its whole effect to all of them or, when a
 * handle is stale, returns InvalidHandle without touching anything.
 *
 * Single writer. All methods run on the owner thread; render jobs only ever
 * see the immutable StrokePtr snapshots handed out by getStroke().
 */
class DocumentStore {
public:
    using ChangeListener = std::function<void(StoreChange const&)>;
    using Handles        = std::span<StrokeHandle const>;

    DocumentStore();

    DocumentStore(DocumentStore const&)            = delete;
    DocumentStore& operator=(DocumentStore const&) = delete;

    // Strokes
    auto insertStroke(Stroke stroke) -> StrokeHandle;
    auto updateStroke(StrokeHandle handle, std::function<void(Stroke&)> const& mutator) -> Expected<void>;
    auto removeStroke(StrokeHandle handle) -> Expected<StrokePtr>;
    [[nodiscard]] auto getStroke(StrokeHandle handle) const -> Expected<StrokePtr>;
    [[nodiscard]] auto isValid(StrokeHandle handle) const -> bool { return arena_.isValid(handle); }
    [[nodiscard]] auto version(StrokeHandle handle) const -> Expected<std::uint64_t> { return tables_.version(handle); }
    [[nodiscard]] auto isTrashed(StrokeHandle handle) const -> Expected<bool> { return tables_.isTrashed(handle); }
    [[nodiscard]] auto chrono(StrokeHandle handle) const -> Expected<ChronoComponent> { return tables_.chrono(handle); }

    // Batches validate every handle before changing anything.
    auto translateStrokes(Handles handles, Vec2 delta) -> Expected<void>;
    auto setTrashed(Handles handles, bool trashed) -> Expected<void>;
    auto removeTrashed() -> std::vector<StrokeHandle>;
    auto moveToFront(Handles handles) -> Expected<void>;
    auto setLayer(Handles handles, StrokeLayer layer) -> Expected<void>;

    // Queries over non-trashed strokes
    [[nodiscard]] auto keysSortedChrono() const -> std::vector<StrokeHandle>;
    [[nodiscard]] auto keysSortedChronoIntersecting(Aabb const& region) const -> std::vector<StrokeHandle>;
    [[nodiscard]] auto trashedKeys() const -> std::vector<StrokeHandle>;
    [[nodiscard]] auto strokesInViewport(Aabb const& viewport) const -> std::vector<StrokeHandle>;
    [[nodiscard]] auto strokesContainedIn(Aabb const& region) const -> std::vector<StrokeHandle>;
    [[nodiscard]] auto hitTest(Vec2 const& point, double tolerance) const -> std::optional<StrokeHandle>;
    [[nodiscard]] auto boundsFor(Handles handles) const -> std::optional<Aabb>;
    [[nodiscard]] auto totalBounds() const -> std::optional<Aabb>;
    [[nodiscard]] auto liveCount() const -> std::size_t { return arena_.liveCount(); }

    // Selection
    auto select(Handles handles) -> Expected<void>;
    auto deselect(Handles handles) -> Expected<void>;
    auto setSelection(Handles handles) -> Expected<void>;
    auto clearSelection() -> void;
    [[nodiscard]] auto selection() const -> std::vector<StrokeHandle>;
    [[nodiscard]] auto isSelected(StrokeHandle handle) const -> bool;
    [[nodiscard]] auto selectionCount() const -> std::size_t { return selection_.size(); }
    [[nodiscard]] auto selectionBounds() const -> std::optional<Aabb>;

    // Metadata
    [[nodiscard]] auto meta() const -> DocumentMeta const& { return *meta_; }
    auto setMeta(DocumentMeta meta) -> void;

    // Snapshots
    [[nodiscard]] auto exportSnapshot() const -> DocumentState;
    auto importSnapshot(DocumentState const& state) -> Expected<void>;

    // Render cache access for the dispatcher
    [[nodiscard]] auto renderCache(StrokeHandle handle) -> Render::RenderCacheEntry* { return tables_.renderCache(handle); }
    [[nodiscard]] auto findRenderCache(StrokeHandle handle) const -> Render::RenderCacheEntry const* {
        return tables_.findRenderCache(handle);
    }

    auto setChangeListener(ChangeListener listener) -> void { listener_ = std::move(listener); }

private:
    friend struct SV::StrokeVaultTestHelper;

    auto requireValid(Handles handles) const -> Expected<void>;
    auto applyUpdate(StrokeHandle handle, std::function<void(Stroke&)> const& mutator) -> Expected<void>;
    auto eraseStroke(StrokeHandle handle) -> Expected<StrokePtr>;
    auto index(StrokeHandle handle, Aabb const& bounds, bool trashed) -> void;
    auto rebuildIndexes() -> void;
    auto sortChrono(std::vector<StrokeHandle>& handles) const -> void;
    auto notify(StoreChange const& change) const -> void;

    IdentityArena                         arena_;
    ComponentTables                       tables_{arena_};
    SpatialIndex                          liveIndex_;
    SpatialIndex                          trashIndex_;
    phmap::flat_hash_set<StrokeHandle>    selection_;
    std::shared_ptr<const DocumentMeta>   meta_ = std::make_shared<const DocumentMeta>();
    ChangeListener                        listener_;
};

} // namespace SV::Store
