#pragma once
#include <strokevault/core/Error.hpp>
#include <strokevault/task/Executor.hpp>
#include <strokevault/task/Task.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace SV {

/**
 * Fixed set of worker threads draining one FIFO queue of render tasks.
 * Tasks whose cancellation token fired while they were queued are skipped
 * by the worker without running their function.
 */
class TaskPool : public Executor {
public:
    // 0 picks std::thread::hardware_concurrency().
    explicit TaskPool(size_t threadCount = 0);
    ~TaskPool() override;

    TaskPool(TaskPool const&)                    = delete;
    auto operator=(TaskPool const&) -> TaskPool& = delete;

    using Executor::submit;
    auto submit(std::weak_ptr<Task>&& task) -> std::optional<Error> override;
    auto shutdown() -> void override;
    auto size() const -> size_t override;

    auto queuedCount() const -> size_t;
    auto runningCount() const -> size_t { return running.load(); }
    auto skippedCount() const -> size_t { return skipped.load(); }

private:
    // Blocks until a task is available; nullptr once shutting down with an empty queue.
    auto nextTask() -> std::shared_ptr<Task>;
    auto workerLoop(size_t workerIndex) -> void;

    std::vector<std::jthread>       workers;
    std::deque<std::weak_ptr<Task>> queue;
    mutable std::mutex              mutex;
    std::condition_variable         available;
    bool                            stopping = false;
    std::atomic<size_t>             running{0};
    std::atomic<size_t>             skipped{0};
};

} // namespace SV
