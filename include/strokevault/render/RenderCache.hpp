#pragma once

#include <strokevault/core/Geometry.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace SV::Render {

enum class RenderState : std::uint8_t {
    Clean = 0,  // cache version matches the stroke version
    Dirty,      // stroke changed, nothing queued
    Pending,    // a job is queued or running
    Superseded, // the queued job is stale and its result will be dropped
    Failed      // rasterization failed; see RenderCacheEntry::failure
};

[[nodiscard]] inline auto renderStateToString(RenderState state) -> std::string_view {
    switch (state) {
    case RenderState::Clean:
        return "clean";
    case RenderState::Dirty:
        return "dirty";
    case RenderState::Pending:
        return "pending";
    case RenderState::Superseded:
        return "superseded";
    case RenderState::Failed:
        return "failed";
    }
    return "unknown";
}

// Premultiplied RGBA8, row-major, pixelRect.width() * pixelRect.height() * 4 bytes.
struct RenderTile {
    IntRect                   pixelRect{};
    std::vector<std::uint8_t> rgba;
};

// Rasterized output of one stroke at one zoom level.
struct ZoomCache {
    std::int64_t            zoomKey = 0;
    double                  zoom    = 1.0;
    std::uint64_t           version = 0;
    Aabb                    coveredRect{};
    std::vector<RenderTile> tiles;
};

struct RenderCacheEntry {
    RenderState                state   = RenderState::Dirty;
    std::uint64_t              version = 0; // stroke version the installed levels were rendered from
    std::vector<ZoomCache>     levels;      // oldest installed first
    std::optional<std::string> failure;

    [[nodiscard]] auto level(std::int64_t zoomKey) const -> ZoomCache const* {
        for (auto const& l : levels) {
            if (l.zoomKey == zoomKey) {
                return &l;
            }
        }
        return nullptr;
    }

    [[nodiscard]] auto residentBytes() const -> std::size_t {
        std::size_t total = 0;
        for (auto const& l : levels) {
            for (auto const& tile : l.tiles) {
                total += tile.rgba.size();
            }
        }
        return total;
    }

    auto markDirty() -> void {
        state = RenderState::Dirty;
        failure.reset();
    }
};

} // namespace SV::Render
