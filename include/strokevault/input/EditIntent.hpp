#pragma once

#include <strokevault/core/Geometry.hpp>
#include <strokevault/core/StrokeHandle.hpp>
#include <strokevault/store/Stroke.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace SV::Input {

// Starts a new ink stroke at `pos`.
struct BeginStroke {
    Vec2   pos{};
    double pressure    = 1.0;
    double width       = 2.0;
    Color  color{};
    bool   highlighter = false;
};

struct AppendPoint {
    Vec2   pos{};
    double pressure = 1.0;
};

struct EndStroke {};

struct MoveSelection {
    Vec2 delta{};
};

struct DeleteSelection {};

// `size` in document units; a zero size uses the decoded pixel size.
struct ImportImage {
    std::vector<std::uint8_t> bytes;
    Vec2                      position{};
    Vec2                      size{};
};

struct ImportVectorImage {
    VectorImage image;
    Vec2        position{};
};

struct InsertText {
    std::string text;
    Vec2        position{};
    double      fontSize = 12.0;
    Color       color{};
};

struct SelectAt {
    Vec2   point{};
    double tolerance = 4.0;
    bool   extend    = false; // add to the selection instead of replacing it
};

struct SelectInRect {
    Aabb rect{};
    bool extend = false;
};

struct ClearSelection {};
struct TrashSelection {};
struct EmptyTrash {};

using EditIntent = std::variant<BeginStroke,
                                AppendPoint,
                                EndStroke,
                                MoveSelection,
                                DeleteSelection,
                                ImportImage,
                                ImportVectorImage,
                                InsertText,
                                SelectAt,
                                SelectInRect,
                                ClearSelection,
                                TrashSelection,
                                EmptyTrash>;

struct IntentOutcome {
    std::vector<StrokeHandle> created;
    bool                      committed = false; // a history snapshot was recorded
};

[[nodiscard]] auto intentName(EditIntent const& intent) -> std::string_view;

} // namespace SV::Input
