#include <strokevault/core/Config.hpp>

#include "log/TaggedLogger.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string>

namespace SV {

namespace {

using Json = nlohmann::json;

auto invalid(std::string message) -> Error {
    return Error{Error::Code::InvalidConfig, std::move(message)};
}

auto readUnsigned(Json const& section, char const* key, std::size_t& out, std::size_t minimum) -> std::optional<Error> {
    auto it = section.find(key);
    if (it == section.end()) {
        return std::nullopt;
    }
    if (!it->is_number_integer()) {
        return invalid(std::string(key) + " must be an integer");
    }
    auto const value = it->get<long long>();
    if (value < 0 || static_cast<std::size_t>(value) < minimum) {
        return invalid(std::string(key) + " must be at least " + std::to_string(minimum));
    }
    out = static_cast<std::size_t>(value);
    return std::nullopt;
}

auto readDouble(Json const& section, char const* key, double& out, double lo, double hi) -> std::optional<Error> {
    auto it = section.find(key);
    if (it == section.end()) {
        return std::nullopt;
    }
    if (!it->is_number()) {
        return invalid(std::string(key) + " must be a number");
    }
    auto const value = it->get<double>();
    if (!std::isfinite(value) || value < lo || value > hi) {
        return invalid(std::string(key) + " is out of range");
    }
    out = value;
    return std::nullopt;
}

auto section(Json const& root, char const* name, Json const*& out) -> std::optional<Error> {
    out     = nullptr;
    auto it = root.find(name);
    if (it == root.end()) {
        return std::nullopt;
    }
    if (!it->is_object()) {
        return invalid(std::string(name) + " must be an object");
    }
    out = &*it;
    return std::nullopt;
}

auto parseEnvUnsigned(char const* name, std::size_t& out) -> std::optional<Error> {
    auto const* raw = std::getenv(name);
    if (raw == nullptr) {
        return std::nullopt;
    }
    std::string_view text{raw};
    std::size_t      value = 0;
    auto const [ptr, ec]   = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return invalid(std::string(name) + " must be a non-negative integer, got '" + std::string(text) + "'");
    }
    out = value;
    return std::nullopt;
}

} // namespace

auto loadConfigJson(std::string_view text) -> Expected<Config> {
    auto root = Json::parse(text.begin(), text.end(), nullptr, false);
    if (root.is_discarded()) {
        return std::unexpected(invalid("config is not valid JSON"));
    }
    if (!root.is_object()) {
        return std::unexpected(invalid("config root must be an object"));
    }

    Config      config;
    Json const* history = nullptr;
    Json const* render  = nullptr;
    Json const* gesture = nullptr;
    for (auto error : {section(root, "history", history), section(root, "render", render), section(root, "gesture", gesture)}) {
        if (error) {
            return std::unexpected(*error);
        }
    }

    if (history) {
        if (auto error = readUnsigned(*history, "max_snapshots", config.history.maxSnapshots, 0)) {
            return std::unexpected(*error);
        }
    }

    if (render) {
        std::size_t tileSize = static_cast<std::size_t>(config.render.tileSize);
        if (auto error = readUnsigned(*render, "worker_count", config.render.workerCount, 0)) {
            return std::unexpected(*error);
        }
        if (auto error = readUnsigned(*render, "tile_size", tileSize, 16)) {
            return std::unexpected(*error);
        }
        if (tileSize > 4096) {
            return std::unexpected(invalid("tile_size must be at most 4096"));
        }
        config.render.tileSize = static_cast<int>(tileSize);
        if (auto error = readDouble(*render, "viewport_margin_factor", config.render.viewportMarginFactor, 0.0, 10.0)) {
            return std::unexpected(*error);
        }
        if (auto error = readDouble(*render, "zoom_tolerance", config.render.zoomTolerance, 1e-6, 1.0)) {
            return std::unexpected(*error);
        }
        if (auto error = readUnsigned(*render, "max_zoom_levels_per_stroke", config.render.maxZoomLevelsPerStroke, 1)) {
            return std::unexpected(*error);
        }
    }

    if (gesture) {
        if (auto it = gesture->find("policy"); it != gesture->end()) {
            if (!it->is_string()) {
                return std::unexpected(invalid("policy must be a string"));
            }
            auto const policy = it->get<std::string>();
            if (policy == "per_intent") {
                config.gesture.policy = CommitPolicy::PerIntent;
            } else if (policy == "manual") {
                config.gesture.policy = CommitPolicy::Manual;
            } else {
                return std::unexpected(invalid("unknown commit policy '" + policy + "'"));
            }
        }
    }

    sv_log("loadConfigJson parsed history.max_snapshots=" + std::to_string(config.history.maxSnapshots), "Config");
    return config;
}

auto configToJson(Config const& config) -> nlohmann::json {
    return Json{{"history", {{"max_snapshots", config.history.maxSnapshots}}},
                {"render",
                 {{"worker_count", config.render.workerCount},
                  {"tile_size", config.render.tileSize},
                  {"viewport_margin_factor", config.render.viewportMarginFactor},
                  {"zoom_tolerance", config.render.zoomTolerance},
                  {"max_zoom_levels_per_stroke", config.render.maxZoomLevelsPerStroke}}},
                {"gesture", {{"policy", config.gesture.policy == CommitPolicy::Manual ? "manual" : "per_intent"}}}};
}

auto applyEnvironmentOverrides(Config& config) -> std::optional<Error> {
    auto updated = config;
    if (auto error = parseEnvUnsigned("STROKEVAULT_HISTORY_MAX", updated.history.maxSnapshots)) {
        return error;
    }
    if (auto error = parseEnvUnsigned("STROKEVAULT_RENDER_WORKERS", updated.render.workerCount)) {
        return error;
    }
    config = updated;
    return std::nullopt;
}

auto envFlagEnabled(char const* name) -> bool {
    auto const* value = std::getenv(name);
    if (value == nullptr) {
        return false;
    }
    std::string_view text{value};
    auto is_space = [](char ch) {
        return ch == ' ' || ch == '\t' || ch == '\n';
    };
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    std::string normalized;
    normalized.reserve(text.size());
    for (char ch : text) {
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return !(normalized == "0" || normalized == "false" || normalized == "off" || normalized == "no");
}

} // namespace SV
