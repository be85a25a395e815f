//
// StepStateManagerTests.cpp - Step status transitions, counters and reverse-order rollback
//

#include <catch2/catch_test_macros.hpp>
#include <Workflow/RollbackCoordinator.h>
#include <Workflow/StepStateManager.h>
#include <Workflow/WorkflowScheduler.h>
#include <Workflow/WorkflowValidator.h>
#include "WorkflowTestHelpers.h"
#include <stdexcept>

using namespace MaestroEngine::Core;
using namespace MaestroEngine::Core::Workflow;
using namespace MaestroEngine::Core::Testing;
using namespace std::chrono_literals;

TEST_CASE("Step transition table", "[workflow][state]") {
    CHECK(StepStateManager::canTransition(StepStatus::Pending, StepStatus::Running));
    CHECK(StepStateManager::canTransition(StepStatus::Running, StepStatus::Succeeded));
    CHECK(StepStateManager::canTransition(StepStatus::Running, StepStatus::Pending));
    CHECK(StepStateManager::canTransition(StepStatus::Succeeded, StepStatus::RolledBack));
    CHECK(StepStateManager::canTransition(StepStatus::Pending, StepStatus::Skipped));

    CHECK_FALSE(StepStateManager::canTransition(StepStatus::Pending, StepStatus::Succeeded));
    CHECK_FALSE(StepStateManager::canTransition(StepStatus::Failed, StepStatus::Running));
    CHECK_FALSE(StepStateManager::canTransition(StepStatus::RolledBack, StepStatus::Succeeded));
    CHECK_FALSE(StepStateManager::canTransition(StepStatus::Running, StepStatus::Skipped));
    CHECK_FALSE(StepStateManager::canTransition(StepStatus::Skipped, StepStatus::Running));
    CHECK_FALSE(StepStateManager::canTransition(StepStatus::Skipped, StepStatus::RolledBack));

    CHECK(std::string(StepStateManager::getStatusName(StepStatus::RolledBack)) == "rolled_back");
    CHECK(std::string(StepStateManager::getStatusName(StepStatus::Skipped)) == "skipped");
}

SCENARIO("StepStateManager applies and reports transitions", "[workflow][state]") {
    GIVEN("A fresh record for a two-step workflow") {
        auto definition = makeWorkflow("pair", {
            makeStep("first", {}, returning(1)),
            makeStep("second", {"first"}, returning(2)),
        });
        auto record = WorkflowScheduler::createRecord(definition, "exec_state", {}, {});
        auto sink = std::make_shared<RecordingEventSink>();
        WorkflowEventEmitter emitter(sink);
        StepStateManager manager(*record, emitter);

        THEN("Every step starts pending") {
            auto counts = manager.getCounts();
            CHECK(counts.pending == 2);
            CHECK(counts.total() == 2);
        }

        WHEN("The first step runs and succeeds") {
            auto startedAt = Clock::now();
            REQUIRE(manager.markRunning("first", 1, startedAt));
            REQUIRE(manager.markSucceeded("first", StepValue(std::string("done")), startedAt + 5ms));

            THEN("Its result, the counters and the events agree") {
                auto snapshot = record->snapshot();
                const auto& first = snapshot.stepResults.at("first");
                CHECK(first.status == StepStatus::Succeeded);
                CHECK(first.attempts == 1);
                CHECK(first.duration() == 5ms);
                CHECK(snapshot.completionOrder == std::vector<std::string>{"first"});

                auto counts = manager.getCounts();
                CHECK(counts.succeeded == 1);
                CHECK(counts.pending == 1);

                CHECK(sink->namesFor("exec_state") ==
                      std::vector<std::string>{"step:started first", "step:completed first"});

                auto outputs = manager.collectOutputs({"first", "second"});
                REQUIRE(outputs.size() == 1);
                CHECK(std::any_cast<std::string>(outputs.at("first")) == "done");
            }
        }

        WHEN("An invalid transition is attempted") {
            ScopedLogCapture capture;
            bool accepted = manager.markSucceeded("second", StepValue(2), Clock::now());

            THEN("It is rejected, logged and changes nothing") {
                CHECK_FALSE(accepted);
                CHECK(manager.getStatus("second") == StepStatus::Pending);
                CHECK(capture.sink().contains("Invalid step transition"));
                CHECK(sink->events().empty());
            }
        }

        WHEN("A failed attempt is scheduled for retry") {
            REQUIRE(manager.markRunning("first", 1, Clock::now()));
            auto error = std::make_exception_ptr(std::runtime_error("flaky"));
            REQUIRE(manager.markRetrying("first", error, false, 2, 10ms));

            THEN("The step is pending again with the error recorded") {
                auto snapshot = record->snapshot();
                const auto& first = snapshot.stepResults.at("first");
                CHECK(first.status == StepStatus::Pending);
                REQUIRE(first.error);
                CHECK(*first.error == "flaky");
                CHECK(sink->count(WorkflowEventKind::StepRetrying) == 1);
            }
        }

        WHEN("The first step is skipped") {
            REQUIRE(manager.markSkipped("first", "condition not met", Clock::now()));

            THEN("It settles without running and contributes no output") {
                auto snapshot = record->snapshot();
                const auto& first = snapshot.stepResults.at("first");
                CHECK(first.status == StepStatus::Skipped);
                CHECK(first.skipped);
                CHECK(first.skipReason == std::string("condition not met"));
                CHECK(first.attempts == 0);
                CHECK(snapshot.completionOrder.empty());

                auto counts = manager.getCounts();
                CHECK(counts.skipped == 1);
                CHECK(counts.pending == 1);
                CHECK(counts.total() == 2);

                CHECK(sink->namesFor("exec_state") == std::vector<std::string>{"step:skipped first"});
                CHECK(manager.collectOutputs({"first"}).empty());
                CHECK_FALSE(manager.markRunning("first", 1, Clock::now()));
            }
        }

        WHEN("An optional step fails") {
            REQUIRE(manager.markRunning("first", 1, Clock::now()));
            REQUIRE(manager.markFailed("first", std::make_exception_ptr(std::runtime_error("smtp down")),
                                       false, Clock::now()));
            manager.recordOptionalFailure("first");

            THEN("It stays failed but is flagged as skipped") {
                auto snapshot = record->snapshot();
                const auto& first = snapshot.stepResults.at("first");
                CHECK(first.status == StepStatus::Failed);
                CHECK(first.skipped);
                CHECK(first.skipReason == std::string("failed but optional"));
                CHECK(manager.getCounts().failed == 1);
                CHECK(manager.getCounts().skipped == 0);
            }
        }

        WHEN("A pending step is flagged as an optional failure") {
            manager.recordOptionalFailure("second");

            THEN("Nothing changes") {
                CHECK_FALSE(record->snapshot().stepResults.at("second").skipped);
            }
        }

        WHEN("The execution moves through its own states") {
            CHECK(manager.transitionExecution(ExecutionStatus::Running));
            CHECK_FALSE(manager.transitionExecution(ExecutionStatus::Pending));
            CHECK(manager.transitionExecution(ExecutionStatus::Completed));

            THEN("It ends terminal with a completion time") {
                auto snapshot = record->snapshot();
                CHECK(snapshot.status == ExecutionStatus::Completed);
                CHECK(snapshot.completedAt);
                CHECK_FALSE(manager.transitionExecution(ExecutionStatus::Failed));
            }
        }
    }
}

TEST_CASE("RollbackCoordinator compensates in reverse completion order", "[workflow][rollback]") {
    std::vector<std::string> compensated;
    auto compensate = [&compensated](std::string id) -> RollbackHandler {
        return [&compensated, id](const StepValue& output, const StepContext& ctx) {
            CHECK(ctx.stepId == id);
            CHECK(std::any_cast<std::string>(output) == id + "-out");
            compensated.push_back(id);
        };
    };

    auto a = makeStep("a", {}, returning(1));
    a.rollback = compensate("a");
    auto b = makeStep("b", {"a"}, returning(1));
    b.rollback = compensate("b");
    auto c = makeStep("c", {}, returning(1));
    auto d = makeStep("d", {"b"}, returning(1));
    d.rollback = compensate("d");
    auto definition = makeWorkflow("compensate", {a, b, c, d});

    auto record = WorkflowScheduler::createRecord(definition, "exec_rollback", {}, {});
    auto sink = std::make_shared<RecordingEventSink>();
    WorkflowEventEmitter emitter(sink);
    StepStateManager manager(*record, emitter);
    auto graph = WorkflowValidator::buildGraph(definition);

    // a, c and b succeed in that order; d never starts
    for (const std::string id : {"a", "c", "b"}) {
        REQUIRE(manager.markRunning(id, 1, Clock::now()));
        REQUIRE(manager.markSucceeded(id, StepValue(id + "-out"), Clock::now()));
    }

    RollbackCoordinator coordinator(definition, graph, *record, manager, emitter);
    auto summary = coordinator.run();

    CHECK(compensated == std::vector<std::string>{"b", "a"});
    CHECK(summary.order == compensated);
    CHECK(summary.candidates == 2);
    CHECK(summary.rolledBack == 2);
    CHECK(summary.failures == 0);

    CHECK(manager.getStatus("a") == StepStatus::RolledBack);
    CHECK(manager.getStatus("b") == StepStatus::RolledBack);
    CHECK(manager.getStatus("c") == StepStatus::Succeeded);
    CHECK(manager.getStatus("d") == StepStatus::Pending);
    CHECK(manager.getCounts().rolledBack == 2);

    CHECK(sink->count(WorkflowEventKind::RollbackStarted) == 1);
    CHECK(sink->count(WorkflowEventKind::StepRolledBack) == 2);
    CHECK(sink->count(WorkflowEventKind::RollbackCompleted) == 1);
}
