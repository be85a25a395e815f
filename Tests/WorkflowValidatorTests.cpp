//
// WorkflowValidatorTests.cpp - Static checks on workflow definitions
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <catch2/matchers/catch_matchers_vector.hpp>
#include <Core/Errors.h>
#include <Workflow/WorkflowValidator.h>
#include "WorkflowTestHelpers.h"

using namespace MaestroEngine::Core;
using namespace MaestroEngine::Core::Workflow;
using MaestroEngine::Core::Testing::makeStep;
using MaestroEngine::Core::Testing::makeWorkflow;
using MaestroEngine::Core::Testing::returning;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::VectorContains;

TEST_CASE("Valid definitions pass", "[workflow][validator]") {
    auto definition = makeWorkflow("pipeline", {
        makeStep("fetch", {}, returning(1)),
        makeStep("build", {"fetch"}, returning(2)),
        makeStep("test", {"build"}, returning(3)),
        makeStep("lint", {"fetch"}, returning(4)),
    });

    auto report = WorkflowValidator::check(definition);
    CHECK(report.valid());
    CHECK(report.cycle.empty());
    CHECK_NOTHROW(WorkflowValidator::validate(definition));

    auto graph = WorkflowValidator::buildGraph(definition);
    CHECK(graph.getRoots() == std::vector<uint32_t>{0});
    CHECK(graph.getOutgoing(0).size() == 2);
}

TEST_CASE("Identity fields are required", "[workflow][validator]") {
    WorkflowDefinition definition;
    definition.steps.push_back(makeStep("only", {}, returning(0)));

    auto report = WorkflowValidator::check(definition);
    CHECK_THAT(report.problems, VectorContains(std::string("workflow id is required")));
    CHECK_THAT(report.problems, VectorContains(std::string("workflow name is required")));
    CHECK_THAT(report.problems, VectorContains(std::string("workflow version is required")));
}

TEST_CASE("Step problems are all reported", "[workflow][validator]") {
    SECTION("No steps") {
        auto report = WorkflowValidator::check(makeWorkflow("empty", {}));
        REQUIRE(report.problems.size() == 1);
        CHECK(report.problems[0] == "workflow must have at least one step");
    }

    SECTION("Missing id, duplicate id and missing handler") {
        WorkflowStep unnamed;
        unnamed.handler = returning(0);
        WorkflowStep noHandler;
        noHandler.id = "b";

        auto report = WorkflowValidator::check(makeWorkflow("broken", {
            makeStep("a", {}, returning(1)),
            makeStep("a", {}, returning(2)),
            unnamed,
            noHandler,
        }));

        CHECK_THAT(report.problems, VectorContains(std::string("duplicate step id 'a'")));
        CHECK_THAT(report.problems, VectorContains(std::string("step at position 2 has no id")));
        CHECK_THAT(report.problems, VectorContains(std::string("step 'b' has no handler")));
    }

    SECTION("Dangling dependency") {
        auto definition = makeWorkflow("dangling", {
            makeStep("a", {}, returning(1)),
            makeStep("b", {"ghost"}, returning(2)),
        });

        auto report = WorkflowValidator::check(definition);
        REQUIRE(report.problems.size() == 1);
        CHECK(report.problems[0] == "step 'b' depends on unknown step 'ghost'");
        CHECK_THROWS_AS(WorkflowValidator::validate(definition), ValidationError);
    }
}

TEST_CASE("Dependency cycles are named", "[workflow][validator][cycle]") {
    auto definition = makeWorkflow("loop", {
        makeStep("A", {"B"}, returning(1)),
        makeStep("B", {"A"}, returning(2)),
    });

    auto report = WorkflowValidator::check(definition);
    CHECK(report.cycle == std::vector<std::string>{"A", "B", "A"});
    CHECK_THAT(report.problems, VectorContains(std::string("dependency cycle: A -> B -> A")));

    try {
        WorkflowValidator::validate(definition);
        FAIL("validate() accepted a cyclic workflow");
    } catch (const ValidationError& e) {
        CHECK(e.workflowId() == "loop");
        CHECK(e.hasCycle());
        CHECK(e.cycle() == std::vector<std::string>{"A", "B", "A"});
        CHECK_THAT(std::string(e.what()), ContainsSubstring("Invalid workflow 'loop'"));
        CHECK_THAT(std::string(e.what()), ContainsSubstring("A -> B -> A"));
    }
}
