#include <strokevault/render/RenderDispatcher.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <string>

namespace SV::Render {

auto statsToJson(DispatcherStats const& stats) -> nlohmann::json {
    return nlohmann::json{{"queued", stats.queued},
                          {"deduplicated", stats.deduplicated},
                          {"installed", stats.installed},
                          {"discarded", stats.discarded},
                          {"cancelled", stats.cancelled},
                          {"failed", stats.failed},
                          {"evicted_levels", stats.evictedLevels}};
}

RenderDispatcher::RenderDispatcher(Store::DocumentStore& store, std::shared_ptr<Executor> executor, RenderConfig config)
    : store_(store), executor_(std::move(executor)), config_(config) {
    sv_log("RenderDispatcher created with tile size " + std::to_string(config_.tileSize), "Render");
}

RenderDispatcher::~RenderDispatcher() {
    // Running jobs keep the completion queue alive through their own reference.
    for (auto& [key, job] : jobs_) {
        job.token.cancel();
    }
}

auto RenderDispatcher::zoomKey(double zoom) const -> std::int64_t {
    return static_cast<std::int64_t>(std::llround(zoom / config_.zoomTolerance));
}

auto RenderDispatcher::extendedViewport(Aabb const& viewport) const -> Aabb {
    auto const f = config_.viewportMarginFactor;
    return viewport.extendedBy(Vec2{viewport.width() * f, viewport.height() * f});
}

auto RenderDispatcher::isPending(StrokeHandle handle, double zoom) const -> bool {
    return jobs_.contains(JobKey{handle, zoomKey(zoom)});
}

auto RenderDispatcher::requestRenderViewport(Aabb const& viewport, double zoom) -> std::size_t {
    auto const handles = store_.keysSortedChronoIntersecting(extendedViewport(viewport));
    return requestRender(handles, viewport, zoom);
}

auto RenderDispatcher::requestRender(std::span<StrokeHandle const> handles, Aabb const& viewport, double zoom) -> std::size_t {
    if (!std::isfinite(zoom) || zoom <= 0.0 || viewport.empty()) {
        sv_log("requestRender ignored: invalid zoom or viewport", "Render", "ERROR");
        return 0;
    }
    auto const extended = extendedViewport(viewport);
    auto const key      = zoomKey(zoom);
    std::size_t queued  = 0;

    for (auto const handle : handles) {
        auto stroke  = store_.getStroke(handle);
        auto trashed = store_.isTrashed(handle);
        auto version = store_.version(handle);
        if (!stroke || !trashed || !version || *trashed) {
            continue;
        }
        auto const bounds = (*stroke)->bounds();
        if (!bounds.intersects(extended)) {
            continue;
        }
        auto const region = bounds.intersection(extended);
        auto*      cache  = store_.renderCache(handle);
        if (cache == nullptr) {
            continue;
        }

        JobKey const jobKey{handle, key};
        if (auto it = jobs_.find(jobKey); it != jobs_.end()) {
            if (it->second.version == *version && it->second.region.contains(region)) {
                ++stats_.deduplicated;
                continue;
            }
            it->second.token.cancel();
            ++stats_.cancelled;
            jobs_.erase(it);
        }

        if (cache->state == RenderState::Failed && cache->version == *version) {
            continue;
        }
        if (auto const* level = cache->level(key); level != nullptr && level->version == *version
                                                   && cache->version == *version && level->coveredRect.contains(region)) {
            continue;
        }

        Job job;
        job.id      = nextJobId_++;
        job.zoom    = zoom;
        job.version = *version;
        job.region  = region;

        RasterRequest request{*stroke, zoom, region, config_.tileSize};
        job.task = Task::Create(
                [queue = queue_, images = images_, request, jobKey, jobId = job.id, jobVersion = job.version](Task& task) {
                    Completion completion;
                    completion.jobId   = jobId;
                    completion.key     = jobKey;
                    completion.zoom    = request.zoom;
                    completion.version = jobVersion;
                    completion.result  = rasterize(request, task.cancellation(), *images);
                    {
                        std::lock_guard<std::mutex> lock(queue->mutex);
                        queue->completed.push_back(std::move(completion));
                    }
                    queue->cv.notify_all();
                },
                job.token);

        if (auto error = executor_->submit(job.task)) {
            sv_log("requestRender could not submit " + toString(handle) + ": " + describeError(*error), "Render", "ERROR");
            continue;
        }
        submitted_.push_back(job.task);
        cache->state = RenderState::Pending;
        jobs_.insert_or_assign(jobKey, std::move(job));
        ++queued;
        ++stats_.queued;
    }
    sv_log("requestRender queued " + std::to_string(queued) + " jobs", "Render");
    return queued;
}

auto RenderDispatcher::processCompletions() -> std::size_t {
    collectAbandoned();

    std::deque<Completion> batch;
    {
        std::lock_guard<std::mutex> lock(queue_->mutex);
        batch.swap(queue_->completed);
    }

    std::vector<std::pair<StrokeHandle, double>> ready;
    for (auto& completion : batch) {
        auto const handle = completion.key.handle;
        auto       it     = jobs_.find(completion.key);
        if (it == jobs_.end() || it->second.id != completion.jobId) {
            ++stats_.discarded;
            settleState(handle);
            continue;
        }
        auto const cancelled = it->second.token.isCancelled();
        jobs_.erase(it);

        auto* cache   = store_.renderCache(handle);
        auto  current = store_.version(handle);
        if (cache == nullptr || !current) {
            ++stats_.discarded;
            continue;
        }
        if (cancelled || *current != completion.version) {
            ++stats_.discarded;
            settleState(handle);
            continue;
        }

        if (!completion.result) {
            auto const& error = completion.result.error();
            if (error.code == Error::Code::RenderJobCancelled) {
                ++stats_.discarded;
                settleState(handle);
                continue;
            }
            sv_log("render of " + toString(handle) + " failed: " + describeError(error), "Render", "ERROR");
            ++stats_.failed;
            std::erase_if(cache->levels, [&](ZoomCache const& level) { return level.version != completion.version; });
            cache->state   = RenderState::Failed;
            cache->version = completion.version;
            cache->failure = describeError(error);
            continue;
        }

        if (install(completion, *cache)) {
            ++stats_.installed;
            ready.emplace_back(handle, completion.zoom);
        } else {
            ++stats_.discarded;
        }
        settleState(handle);
    }

    for (auto const& [handle, zoom] : ready) {
        for (auto const& listener : listeners_) {
            listener(handle, zoom);
        }
    }
    return ready.size();
}

auto RenderDispatcher::install(Completion& completion, RenderCacheEntry& cache) -> bool {
    // Never replace levels rendered from a newer version.
    if (!cache.levels.empty() && cache.version > completion.version) {
        return false;
    }
    auto& result = *completion.result;

    std::erase_if(cache.levels, [&](ZoomCache const& level) {
        return level.version != completion.version || level.zoomKey == completion.key.zoomKey;
    });
    cache.levels.push_back(ZoomCache{completion.key.zoomKey, completion.zoom, completion.version, result.coveredRect,
                                     std::move(result.tiles)});
    while (cache.levels.size() > config_.maxZoomLevelsPerStroke) {
        cache.levels.erase(cache.levels.begin());
        ++stats_.evictedLevels;
    }
    cache.version = completion.version;
    cache.failure.reset();
    return true;
}

auto RenderDispatcher::settleState(StrokeHandle handle) -> void {
    auto* cache = store_.renderCache(handle);
    if (cache == nullptr) {
        return;
    }
    if (hasJobs(handle)) {
        cache->state = RenderState::Pending;
        return;
    }
    auto const version = store_.version(handle);
    if (cache->state == RenderState::Failed && version && cache->version == *version) {
        return;
    }
    auto const fresh = version && !cache->levels.empty() && cache->version == *version;
    if (fresh) {
        cache->state = RenderState::Clean;
    } else {
        cache->markDirty();
    }
}

auto RenderDispatcher::hasJobs(StrokeHandle handle) const -> bool {
    return std::any_of(jobs_.begin(), jobs_.end(), [&](auto const& entry) { return entry.first.handle == handle; });
}

auto RenderDispatcher::collectAbandoned() -> void {
    for (auto it = jobs_.begin(); it != jobs_.end();) {
        auto const& task = it->second.task;
        if (!task || !task->isFailed()) {
            ++it;
            continue;
        }
        auto const handle  = it->first.handle;
        auto const version = it->second.version;
        auto const message = task->failureMessage().value_or("render task failed");
        jobs_.erase(it++);
        ++stats_.failed;
        sv_log("render task for " + toString(handle) + " failed: " + message, "Render", "ERROR");

        auto* cache   = store_.renderCache(handle);
        auto  current = store_.version(handle);
        if (cache != nullptr && current && *current == version) {
            cache->state   = RenderState::Failed;
            cache->version = version;
            cache->failure = message;
        }
    }
    std::erase_if(submitted_, [](std::shared_ptr<Task> const& task) { return task->isTerminal(); });

    // A cancelled task skipped in the queue (or dropped by the executor) never
    // posts a completion, so nothing else would move its stroke out of Superseded.
    std::vector<StrokeHandle> settle;
    std::erase_if(cancelled_, [&](auto const& entry) {
        auto const& task = entry.second;
        if (!task->isTerminal()) {
            return false;
        }
        if (task->wasSkipped() || task->isFailed()) {
            ++stats_.discarded;
            settle.push_back(entry.first);
        }
        return true;
    });
    for (auto const handle : settle) {
        settleState(handle);
    }
}

auto RenderDispatcher::cancelJobs(StrokeHandle handle, bool onlyStale, RenderState newState) -> std::size_t {
    auto const  version = store_.version(handle);
    std::size_t count   = 0;
    for (auto it = jobs_.begin(); it != jobs_.end();) {
        auto const stale = !version || it->second.version != *version;
        if (it->first.handle == handle && (!onlyStale || stale)) {
            it->second.token.cancel();
            if (it->second.task) {
                cancelled_.emplace_back(handle, it->second.task);
            }
            jobs_.erase(it++);
            ++count;
        } else {
            ++it;
        }
    }
    stats_.cancelled += count;
    if (count > 0) {
        if (auto* cache = store_.renderCache(handle); cache != nullptr && !hasJobs(handle)) {
            cache->state = newState;
        }
    }
    return count;
}

auto RenderDispatcher::handleStoreChange(Store::StoreChange const& change) -> void {
    for (auto const handle : change.removed) {
        cancelJobs(handle, false, RenderState::Dirty);
    }
    for (auto const handle : change.dirtied) {
        cancelJobs(handle, true, RenderState::Superseded);
    }
}

auto RenderDispatcher::cancelAll() -> void {
    std::vector<StrokeHandle> handles;
    handles.reserve(jobs_.size());
    for (auto& [key, job] : jobs_) {
        job.token.cancel();
        if (job.task) {
            cancelled_.emplace_back(key.handle, job.task);
        }
        handles.push_back(key.handle);
    }
    stats_.cancelled += jobs_.size();
    jobs_.clear();
    for (auto const handle : handles) {
        settleState(handle);
    }
}

auto RenderDispatcher::waitIdle() -> void {
    for (;;) {
        std::erase_if(submitted_, [](std::shared_ptr<Task> const& task) { return task->isTerminal(); });
        if (submitted_.empty()) {
            return;
        }
        std::unique_lock<std::mutex> lock(queue_->mutex);
        queue_->cv.wait_for(lock, std::chrono::milliseconds(1));
    }
}

auto RenderDispatcher::clearOutsideViewport(Aabb const& viewport) -> std::size_t {
    auto const  keep    = extendedViewport(viewport);
    std::size_t cleared = 0;
    auto        handles = store_.keysSortedChrono();
    auto        trashed = store_.trashedKeys();
    handles.insert(handles.end(), trashed.begin(), trashed.end());
    for (auto const handle : handles) {
        auto stroke = store_.getStroke(handle);
        if (!stroke || (*stroke)->bounds().intersects(keep)) {
            continue;
        }
        cancelJobs(handle, false, RenderState::Dirty);
        auto* cache = store_.renderCache(handle);
        if (cache == nullptr || cache->levels.empty()) {
            continue;
        }
        cache->levels.clear();
        cache->markDirty();
        ++cleared;
    }
    return cleared;
}

auto RenderDispatcher::addCacheReadyListener(CacheReadyListener listener) -> void {
    listeners_.push_back(std::move(listener));
}

} // namespace SV::Render
