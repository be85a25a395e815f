//
// StepExecutorTests.cpp - Worker-thread step attempts and deadlines
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <Core/Errors.h>
#include <Workflow/StepExecutor.h>
#include "WorkflowTestHelpers.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

using namespace MaestroEngine::Core;
using namespace MaestroEngine::Core::Workflow;
using namespace MaestroEngine::Core::Testing;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;

namespace {
    std::shared_ptr<const WorkflowDefinition> singleStep(WorkflowStep step) {
        return std::make_shared<const WorkflowDefinition>(makeWorkflow("single", {std::move(step)}));
    }

    StepContext contextFor(const std::string& stepId) {
        StepContext context;
        context.workflowId = "single";
        context.executionId = "exec_test";
        context.stepId = stepId;
        context.state = std::make_shared<ExecutionState>();
        return context;
    }
}

SCENARIO("StepExecutor runs a handler to completion", "[workflow][executor]") {
    GIVEN("A step that doubles its input") {
        auto step = makeStep("double", {}, [](const StepValue& input, const StepContext& ctx) -> StepValue {
            CHECK(ctx.stepId == "double");
            return std::any_cast<int>(input) * 2;
        });
        StepExecutor executor(singleStep(step), std::make_shared<CompletionQueue>());

        WHEN("It runs with input 21") {
            auto outcome = executor.runToCompletion(0, StepValue(21), contextFor("double"), 1000ms);

            THEN("The outcome carries the doubled value") {
                REQUIRE(outcome.succeeded);
                CHECK(std::any_cast<int>(outcome.output) == 42);
                CHECK(outcome.error == nullptr);
            }
        }
    }

    GIVEN("A step with an input transform") {
        auto step = makeStep("shout", {}, [](const StepValue& input, const StepContext&) -> StepValue {
            return std::any_cast<std::string>(input) + "!";
        });
        step.transformInput = [](const StepValue& workflowInput, const StepOutputs&) -> StepValue {
            return std::string("hello ") + std::any_cast<std::string>(workflowInput);
        };
        StepExecutor executor(singleStep(step), nullptr);

        WHEN("It runs") {
            auto outcome = executor.runToCompletion(0, StepValue(std::string("world")), contextFor("shout"), 1000ms);

            THEN("The handler received the transformed input") {
                REQUIRE(outcome.succeeded);
                CHECK(std::any_cast<std::string>(outcome.output) == "hello world!");
            }
        }
    }
}

TEST_CASE("StepExecutor wraps handler exceptions", "[workflow][executor]") {
    StepExecutor executor(singleStep(makeStep("boom", {}, throwing("disk full"))), nullptr);

    auto outcome = executor.runToCompletion(0, {}, contextFor("boom"), 1000ms);
    REQUIRE_FALSE(outcome.succeeded);
    REQUIRE(outcome.error);

    try {
        std::rethrow_exception(outcome.error);
    } catch (const StepExecutionError& e) {
        CHECK(e.stepId() == "boom");
        CHECK_THAT(std::string(e.what()), ContainsSubstring("disk full"));
        CHECK_THROWS_AS(e.rethrowCause(), std::runtime_error);
    }
}

TEST_CASE("StepExecutor abandons attempts past their deadline", "[workflow][executor][timeout]") {
    ScopedLogCapture capture;
    auto observedStop = std::make_shared<std::atomic<bool>>(false);

    auto step = makeStep("slow", {}, [observedStop](const StepValue&, const StepContext& ctx) -> StepValue {
        auto deadline = std::chrono::steady_clock::now() + 2s;
        while (std::chrono::steady_clock::now() < deadline) {
            if (ctx.stopRequested()) {
                observedStop->store(true);
                return {};
            }
            std::this_thread::sleep_for(1ms);
        }
        return {};
    });
    StepExecutor executor(singleStep(step), nullptr);

    auto started = std::chrono::steady_clock::now();
    auto outcome = executor.runToCompletion(0, {}, contextFor("slow"), 50ms);
    auto waited = std::chrono::steady_clock::now() - started;

    REQUIRE_FALSE(outcome.succeeded);
    CHECK_THROWS_AS(std::rethrow_exception(outcome.error), StepTimeoutError);
    CHECK(waited < 1s);
    CHECK(capture.sink().contains("abandoning"));

    // The abandoned handler sees its stop token shortly after
    auto giveUp = std::chrono::steady_clock::now() + 1s;
    while (!observedStop->load() && std::chrono::steady_clock::now() < giveUp) {
        std::this_thread::sleep_for(1ms);
    }
    CHECK(observedStop->load());
}

TEST_CASE("CompletionQueue wakes without an outcome", "[workflow][executor]") {
    CompletionQueue queue;

    SECTION("Deadline expiry returns empty") {
        auto outcomes = queue.waitFor(std::chrono::steady_clock::now() + 10ms);
        CHECK(outcomes.empty());
    }

    SECTION("wake() interrupts an indefinite wait") {
        std::thread waker([&queue]() {
            std::this_thread::sleep_for(10ms);
            queue.wake();
        });
        auto outcomes = queue.waitFor(std::nullopt);
        waker.join();
        CHECK(outcomes.empty());
    }

    SECTION("Pushed outcomes are drained in order") {
        StepAttemptOutcome first;
        first.ticket = 1;
        StepAttemptOutcome second;
        second.ticket = 2;
        queue.push(first);
        queue.push(second);
        CHECK(queue.pending() == 2);

        auto outcomes = queue.waitFor(std::nullopt);
        REQUIRE(outcomes.size() == 2);
        CHECK(outcomes[0].ticket == 1);
        CHECK(outcomes[1].ticket == 2);
        CHECK(queue.pending() == 0);
    }
}
