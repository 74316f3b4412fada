#pragma once

#include <atomic>
#include <string_view>

namespace SV {

enum class TaskState {
    NotStarted,
    Starting,  // accepted by an executor, waiting in its queue
    Running,
    Completed,
    Failed,    // the function threw, or the executor dropped the task
    Cancelled  // the token was cancelled before the function ran
};

[[nodiscard]] auto taskStateToString(TaskState state) -> std::string_view;

/**
 * Lock-free task lifecycle.
 *
 *   NotStarted -> Starting -> Running -> Completed
 *        \            \           \
 *         +------------+-----------+--> Failed
 *         +------------+--------------> Cancelled
 *
 * Every transition is a single compare-exchange, so exactly one caller wins.
 */
struct TaskStateAtomic {
    TaskStateAtomic() = default;
    // Copies take a snapshot of the other state.
    TaskStateAtomic(const TaskStateAtomic& other);
    TaskStateAtomic& operator=(const TaskStateAtomic& other);

    bool tryStart();
    bool transitionToRunning();
    bool markCompleted();
    bool markFailed();
    bool markCancelled();

    bool isTerminal() const;
    bool hasStarted() const;
    bool isCompleted() const;
    bool isFailed() const;
    bool isCancelled() const;
    bool isRunning() const;

    TaskState        get() const;
    std::string_view toString() const;

private:
    bool advance(TaskState from, TaskState to);

    std::atomic<TaskState> state{TaskState::NotStarted};
};

} // namespace SV
