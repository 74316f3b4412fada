#include <strokevault/input/EditIntent.hpp>

#include <array>

namespace SV::Input {

auto intentName(EditIntent const& intent) -> std::string_view {
    static constexpr std::array<std::string_view, std::variant_size_v<EditIntent>> names{
            "begin_stroke",
            "append_point",
            "end_stroke",
            "move_selection",
            "delete_selection",
            "import_image",
            "import_vector_image",
            "insert_text",
            "select_at",
            "select_in_rect",
            "clear_selection",
            "trash_selection",
            "empty_trash"};
    return names[intent.index()];
}

} // namespace SV::Input
