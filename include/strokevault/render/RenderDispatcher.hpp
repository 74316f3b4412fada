#pragma once

#include <strokevault/core/Config.hpp>
#include <strokevault/core/Error.hpp>
#include <strokevault/core/Geometry.hpp>
#include <strokevault/core/StrokeHandle.hpp>
#include <strokevault/render/ImageCache.hpp>
#include <strokevault/render/Rasterizer.hpp>
#include <strokevault/render/RenderCache.hpp>
#include <strokevault/store/DocumentStore.hpp>
#include <strokevault/task/Executor.hpp>
#include <strokevault/task/Task.hpp>

#include <nlohmann/json.hpp>
#include <parallel_hashmap/phmap.h>

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <utility>
#include <vector>

namespace SV {
struct StrokeVaultTestHelper;
}

namespace SV::Render {

struct DispatcherStats {
    std::size_t queued       = 0; // jobs submitted
    std::size_t deduplicated = 0; // requests folded into a pending job
    std::size_t installed    = 0; // results written to a cache entry
    std::size_t discarded    = 0; // stale or superseded results dropped
    std::size_t cancelled    = 0; // jobs cancelled before install
    std::size_t failed       = 0; // rasterizations that reported an error
    std::size_t evictedLevels = 0;
};

[[nodiscard]] auto statsToJson(DispatcherStats const& stats) -> nlohmann::json;

/**
 * RenderDispatcher keeps render cache entries in sync with stroke content.
 *
 * All public methods run on the owner thread, the same thread that mutates the
 * DocumentStore. Rasterization runs on the executor against the immutable
 * stroke snapshot taken when the job was queued. Workers only append to a
 * completion queue; processCompletions() installs results on the owner
 * thread, all or nothing, and only when the stroke is still valid, the job
 * was not cancelled and its version is still the stroke's current version.
 *
 * Jobs are keyed by (handle, zoom key). The zoom key is the zoom divided by
 * RenderConfig::zoomTolerance and rounded, so nearby zooms share a level.
 */
class RenderDispatcher {
public:
    using CacheReadyListener = std::function<void(StrokeHandle handle, double zoom)>;

    RenderDispatcher(Store::DocumentStore& store, std::shared_ptr<Executor> executor, RenderConfig config = {});
    ~RenderDispatcher();

    RenderDispatcher(RenderDispatcher const&)            = delete;
    RenderDispatcher& operator=(RenderDispatcher const&) = delete;

    // Returns the number of jobs queued.
    auto requestRender(std::span<StrokeHandle const> handles, Aabb const& viewport, double zoom) -> std::size_t;
    auto requestRenderViewport(Aabb const& viewport, double zoom) -> std::size_t;

    // Installs finished jobs; returns how many results were installed.
    auto processCompletions() -> std::size_t;

    // Cancels or supersedes work affected by a store mutation.
    auto handleStoreChange(Store::StoreChange const& change) -> void;

    auto cancelAll() -> void;
    // Blocks until every submitted job has finished running.
    auto waitIdle() -> void;
    // Drops the cached levels of strokes far outside `viewport`.
    auto clearOutsideViewport(Aabb const& viewport) -> std::size_t;

    auto addCacheReadyListener(CacheReadyListener listener) -> void;

    [[nodiscard]] auto pendingCount() const -> std::size_t { return jobs_.size(); }
    [[nodiscard]] auto isPending(StrokeHandle handle, double zoom) const -> bool;
    [[nodiscard]] auto zoomKey(double zoom) const -> std::int64_t;
    [[nodiscard]] auto extendedViewport(Aabb const& viewport) const -> Aabb;
    [[nodiscard]] auto stats() const -> DispatcherStats { return stats_; }
    [[nodiscard]] auto config() const -> RenderConfig const& { return config_; }
    [[nodiscard]] auto images() -> ImageCache& { return *images_; }

private:
    friend struct SV::StrokeVaultTestHelper;

    struct JobKey {
        StrokeHandle handle;
        std::int64_t zoomKey = 0;

        friend auto operator==(JobKey const&, JobKey const&) -> bool = default;
    };

    struct JobKeyHash {
        auto operator()(JobKey const& key) const noexcept -> std::size_t {
            auto const mixed = key.handle.packed() ^ (static_cast<std::uint64_t>(key.zoomKey) * 0x9E3779B97F4A7C15ull);
            return std::hash<std::uint64_t>{}(mixed);
        }
    };

    struct Job {
        std::uint64_t         id      = 0;
        double                zoom    = 1.0;
        std::uint64_t         version = 0;
        Aabb                  region{};
        CancellationToken     token;
        std::shared_ptr<Task> task;
    };

    struct Completion {
        std::uint64_t          jobId = 0;
        JobKey                 key;
        double                 zoom    = 1.0;
        std::uint64_t          version = 0;
        Expected<RasterResult> result  = std::unexpected(Error{Error::Code::UnknownError, "no result"});
    };

    // Shared with the worker lambdas so jobs can outlive the dispatcher.
    struct CompletionQueue {
        std::mutex              mutex;
        std::condition_variable cv;
        std::deque<Completion>  completed;
    };

    auto cancelJobs(StrokeHandle handle, bool onlyStale, RenderState newState) -> std::size_t;
    auto hasJobs(StrokeHandle handle) const -> bool;
    auto settleState(StrokeHandle handle) -> void;
    auto install(Completion& completion, Render::RenderCacheEntry& cache) -> bool;
    auto collectAbandoned() -> void;

    Store::DocumentStore&                                store_;
    std::shared_ptr<Executor>                            executor_;
    RenderConfig                                         config_;
    std::shared_ptr<ImageCache>                          images_ = std::make_shared<ImageCache>();
    std::shared_ptr<CompletionQueue>                     queue_  = std::make_shared<CompletionQueue>();
    phmap::flat_hash_map<JobKey, Job, JobKeyHash>        jobs_;
    std::vector<std::shared_ptr<Task>>                   submitted_;
    // Cancelled jobs whose task may finish without posting a completion.
    std::vector<std::pair<StrokeHandle, std::shared_ptr<Task>>> cancelled_;
    std::vector<CacheReadyListener>                      listeners_;
    std::uint64_t                                        nextJobId_ = 1;
    DispatcherStats                                      stats_;
};

} // namespace SV::Render
