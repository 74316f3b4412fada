#pragma once

#include <strokevault/core/Error.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <vector>

namespace SV::Render {

// Decoded raster images shared between render jobs, keyed by a fingerprint
// of the encoded bytes. Safe to use from several worker threads.
class ImageCache {
public:
    struct ImageData {
        std::uint32_t width = 0;
        std::uint32_t height = 0;
        // Straight (non-premultiplied) RGBA8 in row-major order.
        std::vector<std::uint8_t> rgba;
    };

    auto load(std::span<std::uint8_t const> encoded) -> SV::Expected<std::shared_ptr<ImageData const>>;

    void clear();
    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto resident_bytes() const -> std::size_t;

    [[nodiscard]] static auto fingerprint(std::span<std::uint8_t const> encoded) -> std::uint64_t;
    [[nodiscard]] static auto decode(std::span<std::uint8_t const> encoded) -> SV::Expected<std::shared_ptr<ImageData const>>;

private:
    mutable std::mutex mutex_;
    phmap::flat_hash_map<std::uint64_t, std::shared_ptr<ImageData const>> cache_;
};

} // namespace SV::Render
