#pragma once

#include <strokevault/core/Geometry.hpp>
#include <strokevault/store/ComponentTables.hpp>
#include <strokevault/store/IdentityArena.hpp>

#include <cstdint>
#include <memory>
#include <string_view>
#include <unordered_set>

namespace SV {

enum class PageLayout : std::uint8_t {
    FixedSize = 0,
    ContinuousVertical,
    SemiInfinite,
    Infinite
};

enum class BackgroundPattern : std::uint8_t {
    None = 0,
    Lines,
    Grid,
    Dots
};

[[nodiscard]] inline auto pageLayoutToString(PageLayout layout) -> std::string_view {
    switch (layout) {
    case PageLayout::FixedSize:
        return "fixed_size";
    case PageLayout::ContinuousVertical:
        return "continuous_vertical";
    case PageLayout::SemiInfinite:
        return "semi_infinite";
    case PageLayout::Infinite:
        return "infinite";
    }
    return "unknown";
}

struct DocumentMeta {
    PageLayout        layout = PageLayout::Infinite;
    Vec2              pageSize{595.0, 842.0};
    Color             background{1.0f, 1.0f, 1.0f, 1.0f};
    BackgroundPattern pattern     = BackgroundPattern::Dots;
    double            patternSize = 32.0;

    friend auto operator==(DocumentMeta const&, DocumentMeta const&) -> bool = default;
};

/**
 * Everything an undo step restores.
 *
 * Copies are cheap: the arena and the component tables share their buckets
 * with the live store until it writes to them. Selection, versions and render
 * caches are not part of a DocumentState.
 */
struct DocumentState {
    Store::ArenaState                   arena;
    Store::TablesState                  tables;
    std::shared_ptr<const DocumentMeta> meta = std::make_shared<const DocumentMeta>();

    // True when both states share every bucket and the metadata object.
    [[nodiscard]] auto identicalTo(DocumentState const& other) const -> bool {
        return meta == other.meta && arena.slots.identicalTo(other.arena.slots) && tables.identicalTo(other.tables);
    }

    [[nodiscard]] auto liveCount() const -> std::size_t {
        std::size_t count = 0;
        for (std::size_t i = 0; i < arena.slots.size(); ++i) {
            if (arena.slots.get(i).occupied) {
                ++count;
            }
        }
        return count;
    }

    auto collectBuckets(std::unordered_set<void const*>& seen) const -> void {
        arena.slots.collectBuckets(seen);
        tables.collectBuckets(seen);
    }

    [[nodiscard]] auto bucketCount() const -> std::size_t {
        return arena.slots.bucketCount() + tables.bucketCount();
    }
};

} // namespace SV
