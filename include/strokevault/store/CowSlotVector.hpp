#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <unordered_set>
#include <vector>

namespace SV::Store {

/**
 * Copy-on-write slot storage for history snapshots.
 *
 * Slots are grouped in fixed-size buckets held through shared pointers. Copying
 * a CowSlotVector copies only the bucket pointers, so a snapshot shares every
 * bucket with the live tables. The first write to a bucket that is still
 * referenced elsewhere clones that bucket; untouched buckets stay shared.
 *
 * Not thread-safe: the owner thread mutates, snapshots are only read on the
 * owner thread as well.
 */
template <typename T, std::size_t BucketSize = 64>
class CowSlotVector {
public:
    static constexpr std::size_t kBucketSize = BucketSize;

    struct Bucket {
        std::array<T, BucketSize> slots{};
    };
    using BucketPtr = std::shared_ptr<Bucket>;

    struct SharingStats {
        std::size_t buckets       = 0;
        std::size_t sharedBuckets = 0;
        std::size_t uniqueBuckets = 0;
    };

    CowSlotVector() = default;

    [[nodiscard]] auto size() const -> std::size_t { return size_; }
    [[nodiscard]] auto bucketCount() const -> std::size_t { return buckets_.size(); }

    [[nodiscard]] auto get(std::size_t index) const -> T const& {
        return buckets_[index / BucketSize]->slots[index % BucketSize];
    }

    // Mutable access; clones the bucket when a snapshot still references it.
    [[nodiscard]] auto mutate(std::size_t index) -> T& {
        auto& bucket = buckets_[index / BucketSize];
        if (bucket.use_count() > 1) {
            bucket = std::make_shared<Bucket>(*bucket);
            ++clonedBuckets_;
        }
        return bucket->slots[index % BucketSize];
    }

    auto set(std::size_t index, T value) -> void {
        mutate(index) = std::move(value);
    }

    auto pushBack(T value) -> std::size_t {
        auto const index = size_;
        if (index / BucketSize >= buckets_.size()) {
            buckets_.push_back(std::make_shared<Bucket>());
        }
        ++size_;
        set(index, std::move(value));
        return index;
    }

    auto clear() -> void {
        buckets_.clear();
        size_ = 0;
    }

    // Number of buckets cloned by copy-on-write since construction.
    [[nodiscard]] auto clonedBuckets() const -> std::size_t { return clonedBuckets_; }

    [[nodiscard]] auto sharesBucketWith(CowSlotVector const& other, std::size_t bucketIndex) const -> bool {
        return bucketIndex < buckets_.size() && bucketIndex < other.buckets_.size()
               && buckets_[bucketIndex] == other.buckets_[bucketIndex];
    }

    // Buckets of this vector that are pointer-identical to the ones in `other`.
    [[nodiscard]] auto sharingStats(CowSlotVector const& other) const -> SharingStats {
        SharingStats stats;
        stats.buckets = buckets_.size();
        for (std::size_t i = 0; i < buckets_.size(); ++i) {
            if (sharesBucketWith(other, i)) {
                ++stats.sharedBuckets;
            } else {
                ++stats.uniqueBuckets;
            }
        }
        return stats;
    }

    // Adds the addresses of all buckets to `seen`; used to count distinct
    // buckets across a whole history.
    auto collectBuckets(std::unordered_set<void const*>& seen) const -> void {
        for (auto const& bucket : buckets_) {
            seen.insert(bucket.get());
        }
    }

    [[nodiscard]] auto identicalTo(CowSlotVector const& other) const -> bool {
        return size_ == other.size_ && buckets_ == other.buckets_;
    }

private:
    std::vector<BucketPtr> buckets_;
    std::size_t            size_          = 0;
    std::size_t            clonedBuckets_ = 0;
};

} // namespace SV::Store
