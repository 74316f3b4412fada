#include <doctest/doctest.h>
#include <strokevault/render/ImageCache.hpp>

#include "render/RenderTestImages.hpp"

using namespace SV;
using SV::Render::ImageCache;

TEST_CASE("ImageCache decodes and memoizes images") {
    ImageCache cache;
    auto const bytes = tinyPpm();

    auto first = cache.load(bytes);
    REQUIRE(first.has_value());
    CHECK((*first)->width == 2);
    CHECK((*first)->height == 2);
    REQUIRE((*first)->rgba.size() == 16);
    CHECK((*first)->rgba[0] == 255);
    CHECK((*first)->rgba[1] == 0);
    CHECK((*first)->rgba[3] == 255);
    CHECK((*first)->rgba[5] == 255);
    CHECK((*first)->rgba[10] == 255);

    auto second = cache.load(bytes);
    REQUIRE(second.has_value());
    CHECK(first->get() == second->get());
    CHECK(cache.size() == 1);
    CHECK(cache.resident_bytes() == 16);

    cache.clear();
    CHECK(cache.size() == 0);
}

TEST_CASE("ImageCache reports undecodable data") {
    ImageCache cache;

    auto garbage = cache.load(garbageImage());
    REQUIRE_FALSE(garbage.has_value());
    CHECK(garbage.error().code == Error::Code::DecodeFailed);

    auto empty = cache.load(std::vector<std::uint8_t>{});
    REQUIRE_FALSE(empty.has_value());
    CHECK(empty.error().code == Error::Code::DecodeFailed);

    CHECK(cache.size() == 0);
}

TEST_CASE("ImageCache fingerprints differ for different bytes") {
    auto a = tinyPpm();
    auto b = tinyPpm();
    b.back() = 0;
    CHECK(ImageCache::fingerprint(a) == ImageCache::fingerprint(tinyPpm()));
    CHECK(ImageCache::fingerprint(a) != ImageCache::fingerprint(b));
}
