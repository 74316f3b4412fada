#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace SV {

/**
 * Generational reference to a stroke slot.
 *
 * `index` names the slot, `generation` distinguishes reuses of that slot. A
 * handle only resolves while the slot is occupied at exactly this generation;
 * raw slot indices never leave the store.
 */
struct StrokeHandle {
    std::uint32_t index      = 0;
    std::uint32_t generation = 0;

    friend auto operator==(StrokeHandle const&, StrokeHandle const&) -> bool = default;
    friend auto operator<=>(StrokeHandle const&, StrokeHandle const&)        = default;

    [[nodiscard]] auto packed() const -> std::uint64_t {
        return (static_cast<std::uint64_t>(generation) << 32) | index;
    }

    [[nodiscard]] static auto fromPacked(std::uint64_t value) -> StrokeHandle {
        return StrokeHandle{static_cast<std::uint32_t>(value & 0xffffffffu),
                            static_cast<std::uint32_t>(value >> 32)};
    }
};

[[nodiscard]] inline auto toString(StrokeHandle const& handle) -> std::string {
    return std::to_string(handle.index) + "v" + std::to_string(handle.generation);
}

} // namespace SV

template <>
struct std::hash<SV::StrokeHandle> {
    auto operator()(SV::StrokeHandle const& handle) const noexcept -> std::size_t {
        return std::hash<std::uint64_t>{}(handle.packed());
    }
};
