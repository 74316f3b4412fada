#include <strokevault/render/ImageCache.hpp>

#include "log/TaggedLogger.hpp"

#include <cstring>
#include <limits>
#include <string>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_STDIO
#include <stb_image.h>

namespace SV::Render {

namespace {

auto make_decode_error(std::string message) -> SV::Error {
    return SV::Error{SV::Error::Code::DecodeFailed, std::move(message)};
}

} // namespace

auto ImageCache::fingerprint(std::span<std::uint8_t const> encoded) -> std::uint64_t {
    std::uint64_t hash = 0xcbf29ce484222325ull;
    for (auto byte : encoded) {
        hash ^= byte;
        hash *= 0x100000001b3ull;
    }
    return hash ^ static_cast<std::uint64_t>(encoded.size());
}

auto ImageCache::load(std::span<std::uint8_t const> encoded) -> SV::Expected<std::shared_ptr<ImageData const>> {
    auto const key = fingerprint(encoded);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            return it->second;
        }
    }

    // Decoding runs unlocked; two jobs racing on the same image both decode
    // and the second insert wins, which is harmless.
    auto decoded = decode(encoded);
    if (!decoded) {
        return std::unexpected(decoded.error());
    }

    auto shared = std::move(*decoded);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_.insert_or_assign(key, shared);
    }
    return shared;
}

void ImageCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

auto ImageCache::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

auto ImageCache::resident_bytes() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t total = 0;
    for (auto const& entry : cache_) {
        auto const& image = entry.second;
        if (image) {
            total += image->rgba.size();
        }
    }
    return total;
}

auto ImageCache::decode(std::span<std::uint8_t const> encoded) -> SV::Expected<std::shared_ptr<ImageData const>> {
    if (encoded.empty()) {
        return std::unexpected(make_decode_error("image data is empty"));
    }
    if (encoded.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return std::unexpected(make_decode_error("image data too large"));
    }

    int width = 0;
    int height = 0;
    int channels = 0;

    unsigned char* pixels = stbi_load_from_memory(encoded.data(),
                                                  static_cast<int>(encoded.size()),
                                                  &width,
                                                  &height,
                                                  &channels,
                                                  4);
    if (pixels == nullptr) {
        auto const* reason = stbi_failure_reason();
        sv_log(std::string("ImageCache::decode failed: ") + (reason ? reason : "unknown"), "Render");
        return std::unexpected(make_decode_error(reason ? std::string{"failed to decode image: "} + reason
                                                        : std::string{"failed to decode image"}));
    }

    auto image = std::make_shared<ImageData>();
    image->width = static_cast<std::uint32_t>(width);
    image->height = static_cast<std::uint32_t>(height);
    auto const bytes = static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4u;
    image->rgba.resize(bytes);
    std::memcpy(image->rgba.data(), pixels, bytes);
    stbi_image_free(pixels);
    return std::shared_ptr<ImageData const>(std::move(image));
}

} // namespace SV::Render
