#include <strokevault/task/Task.hpp>

#include "log/TaggedLogger.hpp"

#include <exception>

namespace SV {

auto Task::Create(Function fun, CancellationToken token) -> std::shared_ptr<Task> {
    auto task      = std::shared_ptr<Task>(new Task{});
    task->function = std::move(fun);
    task->token    = std::move(token);
    return task;
}

auto Task::isCompleted() const -> bool {
    return this->state.isCompleted();
}

auto Task::isFailed() const -> bool {
    return this->state.isFailed();
}

auto Task::isTerminal() const -> bool {
    return this->state.isTerminal();
}

auto Task::wasSkipped() const -> bool {
    return this->state.isCancelled();
}

auto Task::hasStarted() const -> bool {
    return this->state.hasStarted();
}

auto Task::tryStart() -> bool {
    return this->state.tryStart();
}

auto Task::execute() -> void {
    if (this->token.isCancelled() && this->state.markCancelled()) {
        return;
    }
    if (!this->state.transitionToRunning()) {
        sv_log("Task::execute called in state " + std::string(this->state.toString()), "TaskPool", "ERROR");
        return;
    }
    try {
        if (this->function) {
            this->function(*this);
        }
        this->state.markCompleted();
    } catch (std::exception const& e) {
        this->abandon(e.what());
        sv_log(std::string("Exception in running Task: ") + e.what(), "TaskPool", "ERROR");
    } catch (...) {
        this->abandon("unknown exception");
        sv_log("Unknown exception in running Task", "TaskPool", "ERROR");
    }
}

auto Task::abandon(std::string reason) -> void {
    {
        std::lock_guard<std::mutex> lock(this->failureMutex);
        this->failure = std::move(reason);
    }
    this->state.markFailed();
}

auto Task::failureMessage() const -> std::optional<std::string> {
    std::lock_guard<std::mutex> lock(this->failureMutex);
    return this->failure;
}

} // namespace SV
