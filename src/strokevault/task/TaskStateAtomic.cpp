#include <strokevault/task/TaskStateAtomic.hpp>

#include <array>
#include <cstddef>

namespace SV {

namespace {

constexpr std::array<std::string_view, 6> kStateNames{"NotStarted", "Starting", "Running", "Completed", "Failed", "Cancelled"};

constexpr auto terminal(TaskState state) -> bool {
    return state == TaskState::Completed || state == TaskState::Failed || state == TaskState::Cancelled;
}

} // namespace

auto taskStateToString(TaskState state) -> std::string_view {
    auto const index = static_cast<std::size_t>(state);
    return index < kStateNames.size() ? kStateNames[index] : std::string_view{"Unknown"};
}

TaskStateAtomic::TaskStateAtomic(const TaskStateAtomic& other) : state(other.get()) {}

TaskStateAtomic& TaskStateAtomic::operator=(const TaskStateAtomic& other) {
    state.store(other.get(), std::memory_order_release);
    return *this;
}

bool TaskStateAtomic::advance(TaskState from, TaskState to) {
    return state.compare_exchange_strong(from, to, std::memory_order_acq_rel);
}

bool TaskStateAtomic::tryStart() {
    return advance(TaskState::NotStarted, TaskState::Starting);
}

bool TaskStateAtomic::transitionToRunning() {
    return advance(TaskState::Starting, TaskState::Running);
}

bool TaskStateAtomic::markCompleted() {
    return advance(TaskState::Running, TaskState::Completed);
}

bool TaskStateAtomic::markFailed() {
    auto current = get();
    while (!terminal(current)) {
        if (state.compare_exchange_weak(current, TaskState::Failed, std::memory_order_acq_rel))
            return true;
    }
    return false;
}

bool TaskStateAtomic::markCancelled() {
    // Once running, the function owns the outcome.
    return advance(TaskState::Starting, TaskState::Cancelled) || advance(TaskState::NotStarted, TaskState::Cancelled);
}

TaskState TaskStateAtomic::get() const {
    return state.load(std::memory_order_acquire);
}

bool TaskStateAtomic::isTerminal() const {
    return terminal(get());
}

bool TaskStateAtomic::hasStarted() const {
    return get() != TaskState::NotStarted;
}

bool TaskStateAtomic::isCompleted() const {
    return get() == TaskState::Completed;
}

bool TaskStateAtomic::isFailed() const {
    return get() == TaskState::Failed;
}

bool TaskStateAtomic::isCancelled() const {
    return get() == TaskState::Cancelled;
}

bool TaskStateAtomic::isRunning() const {
    return get() == TaskState::Running;
}

std::string_view TaskStateAtomic::toString() const {
    return taskStateToString(get());
}

} // namespace SV
