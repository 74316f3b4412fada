#include <strokevault/store/ComponentTables.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace SV::Store {

namespace {

auto staleError(char const* operation, StrokeHandle handle) -> Error {
    return invalidHandleError(std::string(operation) + " on stale or unknown handle " + toString(handle));
}

} // namespace

ComponentTables::ComponentTables(IdentityArena const& arena)
    : arena_(arena) {}

auto ComponentTables::ensureSlot(std::uint32_t index) -> void {
    while (state_.strokes.size() <= index) {
        state_.strokes.pushBack(nullptr);
        state_.chrono.pushBack(ChronoComponent{});
        state_.trashed.pushBack(0);
    }
    if (versions_.size() <= index) {
        versions_.resize(static_cast<std::size_t>(index) + 1, 0);
    }
}

auto ComponentTables::stamp(std::uint32_t index) -> std::uint64_t {
    versions_[index] = ++clock_;
    return versions_[index];
}

auto ComponentTables::insert(StrokeHandle handle, StrokePtr stroke) -> Expected<void> {
    if (!arena_.isValid(handle)) {
        return std::unexpected(staleError("insert", handle));
    }
    if (!stroke) {
        return std::unexpected(Error{Error::Code::MalformedInput, "insert of a null stroke"});
    }
    ensureSlot(handle.index);
    auto const layer = stroke->layer;
    state_.strokes.set(handle.index, std::move(stroke));
    state_.chrono.set(handle.index, ChronoComponent{++state_.chronoCounter, layer});
    state_.trashed.set(handle.index, 0);
    stamp(handle.index);
    renderCache_.insert_or_assign(handle, Render::RenderCacheEntry{});
    return {};
}

auto ComponentTables::get(StrokeHandle handle) const -> Expected<StrokePtr> {
    if (!arena_.isValid(handle) || handle.index >= state_.strokes.size()) {
        return std::unexpected(staleError("get", handle));
    }
    auto const& stroke = state_.strokes.get(handle.index);
    if (!stroke) {
        return std::unexpected(staleError("get", handle));
    }
    return stroke;
}

auto ComponentTables::replace(StrokeHandle handle, StrokePtr stroke) -> Expected<void> {
    if (!get(handle)) {
        return std::unexpected(staleError("replace", handle));
    }
    if (!stroke) {
        return std::unexpected(Error{Error::Code::MalformedInput, "replace with a null stroke"});
    }
    if (state_.chrono.get(handle.index).layer != stroke->layer) {
        state_.chrono.mutate(handle.index).layer = stroke->layer;
    }
    state_.strokes.set(handle.index, std::move(stroke));
    stamp(handle.index);
    if (auto* cache = renderCache(handle)) {
        cache->markDirty();
    }
    return {};
}

auto ComponentTables::update(StrokeHandle handle, std::function<void(Stroke&)> const& mutator) -> Expected<StrokePtr> {
    auto current = get(handle);
    if (!current) {
        return std::unexpected(current.error());
    }
    auto copy = std::make_shared<Stroke>(**current);
    mutator(*copy);
    copy->refresh();
    StrokePtr installed = std::move(copy);
    if (auto replaced = replace(handle, installed); !replaced) {
        return std::unexpected(replaced.error());
    }
    return installed;
}

auto ComponentTables::remove(StrokeHandle handle) -> Expected<StrokePtr> {
    auto current = get(handle);
    if (!current) {
        return std::unexpected(staleError("remove", handle));
    }
    state_.strokes.set(handle.index, nullptr);
    state_.chrono.set(handle.index, ChronoComponent{});
    state_.trashed.set(handle.index, 0);
    stamp(handle.index);
    renderCache_.erase(handle);
    return current;
}

auto ComponentTables::chrono(StrokeHandle handle) const -> Expected<ChronoComponent> {
    if (!get(handle)) {
        return std::unexpected(staleError("chrono", handle));
    }
    return state_.chrono.get(handle.index);
}

auto ComponentTables::restampChrono(StrokeHandle handle) -> Expected<void> {
    if (!get(handle)) {
        return std::unexpected(staleError("restampChrono", handle));
    }
    state_.chrono.mutate(handle.index).t = ++state_.chronoCounter;
    return {};
}

auto ComponentTables::isTrashed(StrokeHandle handle) const -> Expected<bool> {
    if (!get(handle)) {
        return std::unexpected(staleError("isTrashed", handle));
    }
    return state_.trashed.get(handle.index) != 0;
}

auto ComponentTables::setTrashed(StrokeHandle handle, bool trashed) -> Expected<bool> {
    auto current = isTrashed(handle);
    if (!current) {
        return std::unexpected(current.error());
    }
    if (*current == trashed) {
        return false;
    }
    state_.trashed.set(handle.index, trashed ? 1 : 0);
    return true;
}

auto ComponentTables::version(StrokeHandle handle) const -> Expected<std::uint64_t> {
    if (!get(handle)) {
        return std::unexpected(staleError("version", handle));
    }
    return versions_[handle.index];
}

auto ComponentTables::bumpVersion(StrokeHandle handle) -> Expected<std::uint64_t> {
    if (!get(handle)) {
        return std::unexpected(staleError("bumpVersion", handle));
    }
    auto const v = stamp(handle.index);
    if (auto* cache = renderCache(handle)) {
        cache->markDirty();
    }
    return v;
}

auto ComponentTables::renderCache(StrokeHandle handle) -> Render::RenderCacheEntry* {
    if (!get(handle)) {
        return nullptr;
    }
    return &renderCache_[handle];
}

auto ComponentTables::findRenderCache(StrokeHandle handle) const -> Render::RenderCacheEntry const* {
    if (!arena_.isValid(handle)) {
        return nullptr;
    }
    auto it = renderCache_.find(handle);
    return it == renderCache_.end() ? nullptr : &it->second;
}

auto ComponentTables::restore(TablesState const& state) -> std::vector<StrokeHandle> {
    auto previous = std::move(state_);
    state_        = state;

    auto const slots = std::max(previous.strokes.size(), state_.strokes.size());
    if (versions_.size() < slots) {
        versions_.resize(slots, 0);
    }

    std::vector<StrokeHandle> changed;
    for (std::size_t i = 0; i < slots; ++i) {
        StrokePtr       before;
        StrokePtr       after;
        ChronoComponent chronoBefore;
        ChronoComponent chronoAfter;
        std::uint8_t    trashedBefore = 0;
        std::uint8_t    trashedAfter  = 0;
        if (i < previous.strokes.size()) {
            before        = previous.strokes.get(i);
            chronoBefore  = previous.chrono.get(i);
            trashedBefore = previous.trashed.get(i);
        }
        if (i < state_.strokes.size()) {
            after        = state_.strokes.get(i);
            chronoAfter  = state_.chrono.get(i);
            trashedAfter = state_.trashed.get(i);
        }
        if (before == after && chronoBefore == chronoAfter && trashedBefore == trashedAfter) {
            continue;
        }
        auto const index = static_cast<std::uint32_t>(i);
        stamp(index);
        if (auto handle = arena_.handleAt(index); handle && after) {
            changed.push_back(*handle);
        }
    }

    // Entries of handles that no longer resolve are dropped; changed ones are
    // marked dirty so they get re-rendered against the restored content.
    for (auto it = renderCache_.begin(); it != renderCache_.end();) {
        if (!arena_.isValid(it->first) || !get(it->first)) {
            renderCache_.erase(it++);
        } else {
            ++it;
        }
    }
    for (auto const& handle : changed) {
        if (auto* cache = renderCache(handle)) {
            cache->markDirty();
        }
    }
    sv_log("ComponentTables::restore changed=" + std::to_string(changed.size()), "Store");
    return changed;
}

auto ComponentTables::clear() -> void {
    state_ = TablesState{};
    // Versions keep counting so nothing rendered before the clear can match.
    std::fill(versions_.begin(), versions_.end(), ++clock_);
    renderCache_.clear();
}

auto ComponentTables::validate(TablesState const& tables, ArenaState const& arena) -> std::optional<Error> {
    auto const slots = arena.slots.size();
    if (tables.strokes.size() > slots || tables.chrono.size() != tables.strokes.size()
        || tables.trashed.size() != tables.strokes.size()) {
        return Error{Error::Code::CorruptSnapshotState, "component table sizes disagree with the arena"};
    }
    for (std::size_t i = 0; i < slots; ++i) {
        auto const& slot   = arena.slots.get(i);
        auto const  stroke = i < tables.strokes.size() ? tables.strokes.get(i) : StrokePtr{};
        if (slot.occupied != static_cast<bool>(stroke)) {
            return Error{Error::Code::CorruptSnapshotState,
                         "slot " + std::to_string(i) + (slot.occupied ? " is occupied without a stroke" : " holds a stroke but is free")};
        }
        if (stroke && tables.chrono.get(i).t > tables.chronoCounter) {
            return Error{Error::Code::CorruptSnapshotState, "chrono stamp of slot " + std::to_string(i) + " is ahead of the counter"};
        }
    }
    return std::nullopt;
}

} // namespace SV::Store
