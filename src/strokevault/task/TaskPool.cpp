#include <strokevault/task/TaskPool.hpp>

#include "log/TaggedLogger.hpp"

#include <string>
#include <system_error>

namespace SV {

TaskPool::TaskPool(size_t threadCount) {
    if (threadCount == 0)
        threadCount = std::thread::hardware_concurrency();
    if (threadCount == 0)
        threadCount = 1;

    workers.reserve(threadCount);
    for (size_t i = 0; i < threadCount; ++i) {
        try {
            workers.emplace_back(&TaskPool::workerLoop, this, i);
        } catch (std::system_error const& e) {
            sv_log(std::string("TaskPool could not spawn worker: ") + e.what(), "TaskPool", "ERROR");
            break;
        }
    }
    sv_log("TaskPool started " + std::to_string(workers.size()) + " workers", "TaskPool");
}

TaskPool::~TaskPool() {
    shutdown();
}

auto TaskPool::submit(std::weak_ptr<Task>&& task) -> std::optional<Error> {
    auto locked = task.lock();
    if (!locked) {
        return Error{Error::Code::UnknownError, "Task expired before enqueue"};
    }
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stopping) {
            return Error{Error::Code::ShuttingDown, "Executor shutting down"};
        }
        // A task that was already accepted once is not queued again.
        if (!locked->tryStart()) {
            return std::nullopt;
        }
        queue.push_back(std::move(task));
    }
    available.notify_one();
    return std::nullopt;
}

auto TaskPool::shutdown() -> void {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopping = true;
    }
    available.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable())
            worker.join();
    }
    workers.clear();

    // Workers drain the queue before exiting; anything left never ran.
    std::lock_guard<std::mutex> lock(mutex);
    for (auto& pending : queue) {
        if (auto task = pending.lock())
            task->abandon("executor shut down before the task ran");
    }
    queue.clear();
}

auto TaskPool::size() const -> size_t {
    return workers.size();
}

auto TaskPool::queuedCount() const -> size_t {
    std::lock_guard<std::mutex> lock(mutex);
    return queue.size();
}

auto TaskPool::nextTask() -> std::shared_ptr<Task> {
    std::unique_lock<std::mutex> lock(mutex);
    while (true) {
        available.wait(lock, [this] { return stopping || !queue.empty(); });
        if (queue.empty())
            return nullptr;

        auto task = queue.front().lock();
        queue.pop_front();
        if (task)
            return task;
        sv_log("TaskPool dropped a task that expired in the queue", "TaskPool");
    }
}

auto TaskPool::workerLoop(size_t workerIndex) -> void {
#ifdef SV_LOG_DEBUG
    set_thread_name("RenderWorker " + std::to_string(workerIndex));
#else
    (void)workerIndex;
#endif
    while (auto task = nextTask()) {
        ++running;
        task->execute();
        --running;
        if (task->wasSkipped())
            ++skipped;
    }
}

} // namespace SV
