#include <doctest/doctest.h>
#include <strokevault/task/Task.hpp>

#include <stdexcept>

using namespace SV;

TEST_SUITE("task.task") {
TEST_CASE("Task runs its function once") {
    int  runs = 0;
    auto task = Task::Create([&runs](Task&) { ++runs; });
    CHECK_FALSE(task->hasStarted());

    // execute() before an executor accepted the task does nothing.
    task->execute();
    CHECK(runs == 0);

    REQUIRE(task->tryStart());
    task->execute();
    CHECK(runs == 1);
    CHECK(task->isCompleted());
    CHECK(task->stateString() == "Completed");

    task->execute();
    CHECK(runs == 1);
}

TEST_CASE("Task records exceptions as failures") {
    auto task = Task::Create([](Task&) { throw std::runtime_error("tile buffer exhausted"); });
    REQUIRE(task->tryStart());
    task->execute();
    CHECK(task->isFailed());
    CHECK(task->isTerminal());
    CHECK(task->failureMessage() == "tile buffer exhausted");
}

TEST_CASE("Task abandon") {
    auto task = Task::Create([](Task&) {});
    REQUIRE(task->tryStart());
    task->abandon("executor shut down");
    CHECK(task->isFailed());
    CHECK(task->failureMessage() == "executor shut down");
}

TEST_CASE("CancellationToken copies share one flag") {
    CancellationToken token;
    auto              copy = token;
    CHECK_FALSE(copy.isCancelled());

    bool sawCancel = false;
    auto task      = Task::Create(
            [&sawCancel, token](Task& self) {
                token.cancel();
                sawCancel = self.isCancelled();
            },
            copy);
    REQUIRE(task->tryStart());
    task->execute();
    CHECK(sawCancel);
    CHECK(copy.isCancelled());
    // Cancelled mid-run still completes; the function decides what to do.
    CHECK(task->isCompleted());
}

TEST_CASE("Task cancelled before it runs is skipped") {
    CancellationToken token;
    int               runs = 0;
    auto              task = Task::Create([&runs](Task&) { ++runs; }, token);
    REQUIRE(task->tryStart());
    token.cancel();
    task->execute();
    CHECK(runs == 0);
    CHECK(task->wasSkipped());
    CHECK(task->isTerminal());
    CHECK_FALSE(task->isFailed());
    CHECK(task->stateString() == "Cancelled");
}
}
