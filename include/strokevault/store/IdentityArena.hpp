#pragma once

#include <strokevault/core/Error.hpp>
#include <strokevault/core/StrokeHandle.hpp>
#include <strokevault/store/CowSlotVector.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace SV::Store {

struct SlotRecord {
    std::uint32_t generation = 0;
    bool          occupied   = false;
};

// Snapshot of the arena occupancy; shares buckets with the live arena.
struct ArenaState {
    CowSlotVector<SlotRecord> slots;
};

/**
 * Generational slot allocator.
 *
 * allocate() pops the most recently freed slot (LIFO) or grows the arena.
 * free() bumps the slot generation so every handle issued before it is
 * detectably stale. Generations issued for a slot are tracked outside of the
 * snapshotted state so that restoring an older snapshot never re-issues a
 * generation that a discarded handle might still carry.
 */
class IdentityArena {
public:
    IdentityArena() = default;

    [[nodiscard]] auto allocate() -> StrokeHandle;
    auto free(StrokeHandle handle) -> Expected<void>;
    [[nodiscard]] auto isValid(StrokeHandle handle) const -> bool;

    [[nodiscard]] auto liveCount() const -> std::size_t { return liveCount_; }
    [[nodiscard]] auto capacity() const -> std::size_t { return state_.slots.size(); }
    [[nodiscard]] auto liveHandles() const -> std::vector<StrokeHandle>;

    // Handle currently occupying `index`, if any.
    [[nodiscard]] auto handleAt(std::uint32_t index) const -> std::optional<StrokeHandle>;

    [[nodiscard]] auto capture() const -> ArenaState { return state_; }
    auto restore(ArenaState const& state) -> void;
    auto clear() -> void;

private:
    auto noteIssued(std::uint32_t index, std::uint32_t generation) -> void;
    auto rebuildFreeList() -> void;

    ArenaState                 state_;
    std::vector<std::uint32_t> freeList_;
    std::vector<std::uint32_t> highestIssued_;
    std::size_t                liveCount_ = 0;
};

} // namespace SV::Store
