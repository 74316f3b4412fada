#pragma once

#include <strokevault/core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string_view>

namespace SV {

struct HistoryConfig {
    std::size_t maxSnapshots = 100; // 0 == unlimited
};

struct RenderConfig {
    std::size_t workerCount            = 0; // 0 == hardware concurrency
    int         tileSize               = 256;
    double      viewportMarginFactor   = 0.4;  // viewport grown by this fraction on each side
    double      zoomTolerance          = 0.01; // zooms closer than this share cached tiles
    std::size_t maxZoomLevelsPerStroke = 4;
};

enum class CommitPolicy {
    PerIntent, // one snapshot per completed gesture unless a transaction is open
    Manual     // snapshots only on explicit commit
};

struct GestureConfig {
    CommitPolicy policy = CommitPolicy::PerIntent;
};

struct Config {
    HistoryConfig history;
    RenderConfig  render;
    GestureConfig gesture;
};

// Parses {"history": {...}, "render": {...}, "gesture": {...}}. Missing keys
// keep their defaults, unknown keys are ignored; wrong types or out of range
// values give InvalidConfig.
[[nodiscard]] auto loadConfigJson(std::string_view text) -> Expected<Config>;
[[nodiscard]] auto configToJson(Config const& config) -> nlohmann::json;

// Applies STROKEVAULT_HISTORY_MAX and STROKEVAULT_RENDER_WORKERS when set.
auto applyEnvironmentOverrides(Config& config) -> std::optional<Error>;

// Truthy unless unset, "0", "false", "off" or "no" (case-insensitive).
[[nodiscard]] auto envFlagEnabled(char const* name) -> bool;

} // namespace SV
