#include <strokevault/store/IdentityArena.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace SV::Store {

auto IdentityArena::allocate() -> StrokeHandle {
    if (!freeList_.empty()) {
        auto const index = freeList_.back();
        freeList_.pop_back();
        auto& slot    = state_.slots.mutate(index);
        slot.occupied = true;
        noteIssued(index, slot.generation);
        ++liveCount_;
        return StrokeHandle{index, slot.generation};
    }

    auto const index = static_cast<std::uint32_t>(state_.slots.pushBack(SlotRecord{.generation = 0, .occupied = true}));
    noteIssued(index, 0);
    ++liveCount_;
    return StrokeHandle{index, 0};
}

auto IdentityArena::free(StrokeHandle handle) -> Expected<void> {
    if (!isValid(handle)) {
        sv_log("IdentityArena::free rejected stale handle " + toString(handle), "Arena");
        return std::unexpected(invalidHandleError("free of stale or unknown handle " + toString(handle)));
    }
    auto& slot    = state_.slots.mutate(handle.index);
    slot.occupied = false;
    slot.generation = std::max(slot.generation, highestIssued_[handle.index]) + 1;
    freeList_.push_back(handle.index);
    --liveCount_;
    return {};
}

auto IdentityArena::isValid(StrokeHandle handle) const -> bool {
    if (handle.index >= state_.slots.size()) {
        return false;
    }
    auto const& slot = state_.slots.get(handle.index);
    return slot.occupied && slot.generation == handle.generation;
}

auto IdentityArena::liveHandles() const -> std::vector<StrokeHandle> {
    std::vector<StrokeHandle> handles;
    handles.reserve(liveCount_);
    for (std::size_t i = 0; i < state_.slots.size(); ++i) {
        auto const& slot = state_.slots.get(i);
        if (slot.occupied) {
            handles.push_back(StrokeHandle{static_cast<std::uint32_t>(i), slot.generation});
        }
    }
    return handles;
}

auto IdentityArena::handleAt(std::uint32_t index) const -> std::optional<StrokeHandle> {
    if (index >= state_.slots.size()) {
        return std::nullopt;
    }
    auto const& slot = state_.slots.get(index);
    if (!slot.occupied) {
        return std::nullopt;
    }
    return StrokeHandle{index, slot.generation};
}

auto IdentityArena::restore(ArenaState const& state) -> void {
    state_ = state;
    if (highestIssued_.size() < state_.slots.size()) {
        highestIssued_.resize(state_.slots.size(), 0);
    }
    // Slots that only exist in a discarded future stay allocated as free
    // slots, otherwise growing the arena again would restart them at 0.
    for (auto i = state_.slots.size(); i < highestIssued_.size(); ++i) {
        state_.slots.pushBack(SlotRecord{.generation = highestIssued_[i] + 1, .occupied = false});
    }
    liveCount_ = 0;
    for (std::size_t i = 0; i < state_.slots.size(); ++i) {
        auto const& slot  = state_.slots.get(i);
        auto const  index = static_cast<std::uint32_t>(i);
        if (slot.occupied) {
            noteIssued(index, slot.generation);
            ++liveCount_;
        } else if (slot.generation <= highestIssued_[i]) {
            // The snapshot predates handles issued for this slot; move the
            // free generation past all of them.
            state_.slots.mutate(i).generation = highestIssued_[i] + 1;
        }
    }
    rebuildFreeList();
    sv_log("IdentityArena::restore live=" + std::to_string(liveCount_), "Arena");
}

auto IdentityArena::clear() -> void {
    // Generations already handed out stay reserved across a clear.
    ArenaState fresh;
    for (std::size_t i = 0; i < highestIssued_.size(); ++i) {
        fresh.slots.pushBack(SlotRecord{.generation = highestIssued_[i] + 1, .occupied = false});
    }
    state_     = std::move(fresh);
    liveCount_ = 0;
    rebuildFreeList();
}

auto IdentityArena::noteIssued(std::uint32_t index, std::uint32_t generation) -> void {
    if (highestIssued_.size() <= index) {
        highestIssued_.resize(static_cast<std::size_t>(index) + 1, 0);
    }
    highestIssued_[index] = std::max(highestIssued_[index], generation);
}

auto IdentityArena::rebuildFreeList() -> void {
    freeList_.clear();
    // Highest index first so pop_back hands out the lowest free slot.
    for (std::size_t i = state_.slots.size(); i > 0; --i) {
        if (!state_.slots.get(i - 1).occupied) {
            freeList_.push_back(static_cast<std::uint32_t>(i - 1));
        }
    }
}

} // namespace SV::Store
