#pragma once
#include <strokevault/task/TaskStateAtomic.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace SV {

/**
 * Shared cancellation flag. Copies observe the same flag; a default
 * constructed token is live and can be cancelled like any other.
 */
class CancellationToken {
public:
    CancellationToken() : flag(std::make_shared<std::atomic<bool>>(false)) {}

    auto cancel() const -> void { flag->store(true, std::memory_order_release); }
    [[nodiscard]] auto isCancelled() const -> bool { return flag->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag;
};

struct Task {
    using Function = std::function<void(Task& task)>;

    static auto Create(Function fun, CancellationToken token = {}) -> std::shared_ptr<Task>;

    auto isCompleted() const -> bool;
    auto isFailed() const -> bool;
    auto isTerminal() const -> bool;
    // Skipped because the token was cancelled before a worker reached it.
    auto wasSkipped() const -> bool;
    auto hasStarted() const -> bool;
    auto tryStart() -> bool;
    auto stateString() const -> std::string_view { return this->state.toString(); }

    auto cancellation() const -> CancellationToken const& { return this->token; }
    auto isCancelled() const -> bool { return this->token.isCancelled(); }

    // Runs the task function on the calling thread unless the token is
    // already cancelled. Exceptions mark the task failed and are kept as
    // failureMessage().
    auto execute() -> void;
    // Marks a queued task failed without running it (executor shutdown).
    auto abandon(std::string reason) -> void;
    auto failureMessage() const -> std::optional<std::string>;

private:
    Task()                       = default; // use Create()
    Task(const Task&)            = delete;
    Task& operator=(const Task&) = delete;
    Task(Task&&)                 = delete;
    Task& operator=(Task&&)      = delete;

    TaskStateAtomic            state;
    Function                   function;
    CancellationToken          token;
    mutable std::mutex         failureMutex;
    std::optional<std::string> failure;
};

} // namespace SV
