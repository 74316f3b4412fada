#pragma once

#include <strokevault/core/Error.hpp>

#include <cstddef>
#include <memory>
#include <optional>

namespace SV {

struct Task;

/**
 * Where render jobs run. The dispatcher only talks to this interface, so
 * tests can swap the thread pool for a deterministic executor.
 *
 * - submit() moves an accepted task to Starting and returns std::nullopt.
 *   It refuses with ShuttingDown after shutdown(), and with UnknownError
 *   when the task already expired. Submitting an accepted task again is a
 *   no-op.
 * - A task is later run through Task::execute(); one whose token was
 *   cancelled meanwhile ends up Cancelled without running.
 * - shutdown() stops accepting work and fails every task still queued.
 *
 * submit() and shutdown() may be called concurrently.
 */
struct Executor {
    virtual ~Executor() = default;

    // The executor holds tasks weakly; an owner dropping a job drops it from the queue too.
    virtual auto submit(std::weak_ptr<Task>&&) -> std::optional<Error> = 0;

    auto submit(std::shared_ptr<Task> const& task) -> std::optional<Error> {
        return submit(std::weak_ptr<Task>(task));
    }

    virtual auto shutdown() -> void = 0;

    // Number of workers.
    virtual auto size() const -> size_t = 0;
};

} // namespace SV
