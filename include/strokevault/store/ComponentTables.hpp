#pragma once

#include <strokevault/core/Error.hpp>
#include <strokevault/core/StrokeHandle.hpp>
#include <strokevault/render/RenderCache.hpp>
#include <strokevault/store/CowSlotVector.hpp>
#include <strokevault/store/IdentityArena.hpp>
#include <strokevault/store/Stroke.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <unordered_set>
#include <vector>

namespace SV {
struct StrokeVaultTestHelper;
}

namespace SV::Store {

// Z-order stamp. Strokes sort by layer first, then by `t`.
struct ChronoComponent {
    std::uint32_t t = 0;
    StrokeLayer   layer{};

    friend auto operator==(ChronoComponent const&, ChronoComponent const&) -> bool = default;
};

[[nodiscard]] inline auto chronoLess(ChronoComponent const& a, ChronoComponent const& b) -> bool {
    if (a.layer != b.layer) {
        return a.layer < b.layer;
    }
    return a.t < b.t;
}

// The snapshotted part of the tables.
struct TablesState {
    CowSlotVector<StrokePtr>       strokes;
    CowSlotVector<ChronoComponent> chrono;
    CowSlotVector<std::uint8_t>    trashed;
    std::uint32_t                  chronoCounter = 0;

    [[nodiscard]] auto identicalTo(TablesState const& other) const -> bool {
        return chronoCounter == other.chronoCounter && strokes.identicalTo(other.strokes)
               && chrono.identicalTo(other.chrono) && trashed.identicalTo(other.trashed);
    }

    auto collectBuckets(std::unordered_set<void const*>& seen) const -> void {
        strokes.collectBuckets(seen);
        chrono.collectBuckets(seen);
        trashed.collectBuckets(seen);
    }

    [[nodiscard]] auto bucketCount() const -> std::size_t {
        return strokes.bucketCount() + chrono.bucketCount() + trashed.bucketCount();
    }
};

/**
 * Per-stroke component storage indexed by arena slot.
 *
 * Every accessor validates the handle against the arena first, so a stale
 * handle can never read data that a reused slot holds for another stroke.
 * Strokes, z-order stamps and trash flags live in copy-on-write buckets and
 * are captured by snapshots. Versions and render caches are live-only:
 * versions come from a table-wide clock that never runs backwards, so a
 * render result computed before an undo can never match the restored stroke.
 */
class ComponentTables {
public:
    explicit ComponentTables(IdentityArena const& arena);

    ComponentTables(ComponentTables const&)            = delete;
    ComponentTables& operator=(ComponentTables const&) = delete;

    auto insert(StrokeHandle handle, StrokePtr stroke) -> Expected<void>;
    [[nodiscard]] auto get(StrokeHandle handle) const -> Expected<StrokePtr>;
    auto replace(StrokeHandle handle, StrokePtr stroke) -> Expected<void>;
    // Copy-on-write edit: the mutator works on a private copy which is
    // refreshed and installed afterwards.
    auto update(StrokeHandle handle, std::function<void(Stroke&)> const& mutator) -> Expected<StrokePtr>;
    auto remove(StrokeHandle handle) -> Expected<StrokePtr>;

    [[nodiscard]] auto chrono(StrokeHandle handle) const -> Expected<ChronoComponent>;
    auto restampChrono(StrokeHandle handle) -> Expected<void>;
    [[nodiscard]] auto isTrashed(StrokeHandle handle) const -> Expected<bool>;
    // Returns whether the flag changed.
    auto setTrashed(StrokeHandle handle, bool trashed) -> Expected<bool>;

    [[nodiscard]] auto version(StrokeHandle handle) const -> Expected<std::uint64_t>;
    auto bumpVersion(StrokeHandle handle) -> Expected<std::uint64_t>;

    // Render cache of a valid handle, created on first use; nullptr for stale handles.
    [[nodiscard]] auto renderCache(StrokeHandle handle) -> Render::RenderCacheEntry*;
    [[nodiscard]] auto findRenderCache(StrokeHandle handle) const -> Render::RenderCacheEntry const*;
    [[nodiscard]] auto renderCacheCount() const -> std::size_t { return renderCache_.size(); }

    [[nodiscard]] auto chronoCounter() const -> std::uint32_t { return state_.chronoCounter; }

    [[nodiscard]] auto capture() const -> TablesState { return state_; }
    // Installs `state`; the arena must already hold the matching ArenaState.
    // Returns the handles whose content differs from before the restore.
    auto restore(TablesState const& state) -> std::vector<StrokeHandle>;
    auto clear() -> void;

    // Consistency of a snapshot pair, checked before anything is restored.
    [[nodiscard]] static auto validate(TablesState const& tables, ArenaState const& arena) -> std::optional<Error>;

private:
    friend struct SV::StrokeVaultTestHelper;

    auto ensureSlot(std::uint32_t index) -> void;
    auto stamp(std::uint32_t index) -> std::uint64_t;

    IdentityArena const&                                        arena_;
    TablesState                                                 state_;
    std::vector<std::uint64_t>                                  versions_;
    std::uint64_t                                               clock_ = 0;
    phmap::flat_hash_map<StrokeHandle, Render::RenderCacheEntry> renderCache_;
};

} // namespace SV::Store
