//
// AgentEquilibriumTests.cpp - Participation equilibrium for multi-agent task assignment
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <Agents/AgentEquilibrium.h>
#include "WorkflowTestHelpers.h"
#include <algorithm>
#include <stdexcept>

using namespace MaestroEngine::Core::Agents;
using MaestroEngine::Core::Testing::ScopedLogCapture;
using Catch::Approx;

namespace {
    AgentInfo agent(std::string id, AgentType type, std::vector<std::string> capabilities) {
        AgentInfo info;
        info.id = id;
        info.name = std::move(id);
        info.type = type;
        info.capabilities = std::move(capabilities);
        return info;
    }

    Task task(std::string description, std::vector<std::string> required) {
        Task t;
        t.id = "task-1";
        t.description = std::move(description);
        t.requiredCapabilities = std::move(required);
        return t;
    }

    const AgentParticipation* findParticipant(const std::vector<AgentParticipation>& participants,
                                              const std::string& id) {
        auto it = std::find_if(participants.begin(), participants.end(),
                               [&id](const AgentParticipation& p) { return p.agentId == id; });
        return it == participants.end() ? nullptr : &*it;
    }
}

TEST_CASE("Agent type names", "[agents]") {
    for (AgentType type : kAllAgentTypes) {
        REQUIRE(agentTypeFromString(agentTypeToString(type)) == type);
    }
    CHECK(agentTypeToString(AgentType::Tester) == "tester");
    CHECK_FALSE(agentTypeFromString("wizard"));
    CHECK(taskPriorityToString(TaskPriority::Critical) == "critical");
}

TEST_CASE("Effectiveness and overlap", "[agents][equilibrium]") {
    SECTION("Role keywords are matched case-insensitively by substring") {
        auto matched = AgentEquilibriumSelector::matchedAgentTypes("Design and IMPLEMENT the code");
        CHECK(matched == std::vector<AgentType>{AgentType::Coder, AgentType::Architect});
        CHECK(AgentEquilibriumSelector::matchedAgentTypes("").empty());
    }

    SECTION("Effectiveness blends capability match and role fit") {
        auto tester = agent("t1", AgentType::Tester, {"test", "qa"});
        CHECK(AgentEquilibriumSelector::calculateEffectiveness(tester, task("Write unit tests", {"test"})) == Approx(1.0));
        CHECK(AgentEquilibriumSelector::calculateEffectiveness(tester, task("Write unit tests", {"test", "perf"})) == Approx(0.65));
        CHECK(AgentEquilibriumSelector::calculateEffectiveness(tester, task("Refactor", {"code"})) == Approx(0.09));
        // No requirements counts as a half match
        CHECK(AgentEquilibriumSelector::calculateEffectiveness(tester, task("Refactor", {})) == Approx(0.44));
        CHECK(AgentEquilibriumSelector::typeBoost(AgentType::Tester, task("testing", {})) == Approx(1.0));
        CHECK(AgentEquilibriumSelector::typeBoost(AgentType::Coder, task("testing", {})) == Approx(0.3));
    }

    SECTION("Overlap is shared capabilities over the larger set") {
        auto a = agent("a", AgentType::Coder, {"x", "y"});
        auto b = agent("b", AgentType::Coder, {"y", "z", "w"});
        CHECK(AgentEquilibriumSelector::capabilityOverlap(a, b) == Approx(1.0 / 3.0));
        CHECK(AgentEquilibriumSelector::capabilityOverlap(b, a) == Approx(1.0 / 3.0));
        CHECK(AgentEquilibriumSelector::capabilityOverlap(a, a) == Approx(1.0));

        auto blankCoder = agent("c", AgentType::Coder, {});
        auto blankTester = agent("d", AgentType::Tester, {});
        CHECK(AgentEquilibriumSelector::capabilityOverlap(a, blankCoder) == Approx(0.8));
        CHECK(AgentEquilibriumSelector::capabilityOverlap(a, blankTester) == Approx(0.2));
    }
}

SCENARIO("Equilibrium on trivial agent sets", "[agents][equilibrium]") {
    AgentEquilibriumSelector selector;

    GIVEN("No agents") {
        auto result = selector.computeEquilibrium(task("anything", {}), {});
        THEN("The empty result is converged without iterating") {
            CHECK(result.participants.empty());
            CHECK(result.converged);
            CHECK(result.iterations == 0);
            CHECK(result.totalUtility == 0.0);
        }
    }

    GIVEN("A single agent") {
        auto only = agent("solo", AgentType::Coder, {"code"});
        auto result = selector.computeEquilibrium(task("Implement parser", {"code"}), {only});
        THEN("It takes the whole task") {
            REQUIRE(result.participants.size() == 1);
            CHECK(result.participants[0].participationLevel == 1.0);
            CHECK(result.participants[0].utility == Approx(1.0));
            CHECK(result.totalUtility == Approx(1.0));
            CHECK(result.converged);
        }
    }
}

SCENARIO("The better suited agent takes the task", "[agents][equilibrium]") {
    GIVEN("A tester and a coder competing for a testing task") {
        EquilibriumConfig config;
        config.maxIterations = 500;
        AgentEquilibriumSelector selector(config);

        std::vector<AgentInfo> agents = {
            agent("c1", AgentType::Coder, {"code"}),
            agent("t1", AgentType::Tester, {"test"}),
        };
        auto testing = task("Write unit tests for the parser", {"test"});

        WHEN("The equilibrium is computed") {
            auto result = selector.computeEquilibrium(testing, agents);

            THEN("The tester dominates and the coder all but drops out") {
                CHECK(result.converged);
                REQUIRE(result.participants.size() == 2);
                CHECK(result.participants[0].agentId == "t1");
                CHECK(result.participants[0].participationLevel > 0.9);
                CHECK(result.participants[1].participationLevel < 0.05);
                CHECK(result.participants[0].effectivenessScore == Approx(1.0));
            }

            THEN("Total participation never exceeds one") {
                REQUIRE_FALSE(result.history.empty());
                CHECK(result.history.size() == result.iterations);
                for (const auto& record : result.history) {
                    CHECK(record.totalParticipation <= 1.0 + 1e-9);
                }
                CHECK(result.history.back().maxDelta < config.convergenceThreshold);
            }
        }

        WHEN("Agents are updated sequentially") {
            config.updateMode = UpdateMode::Sequential;
            selector.setConfig(config);
            auto result = selector.computeEquilibrium(testing, agents);

            THEN("The outcome agrees") {
                REQUIRE_FALSE(result.participants.empty());
                CHECK(result.participants[0].agentId == "t1");
                CHECK(result.participants[0].participationLevel > 0.9);
            }
        }

        WHEN("Only positive participation is requested") {
            auto participants = selector.findEquilibrium(testing, agents);
            THEN("Every returned agent participates") {
                REQUIRE_FALSE(participants.empty());
                CHECK(participants[0].agentId == "t1");
                for (const auto& participant : participants) {
                    CHECK(participant.participationLevel > 0.0);
                }
            }
        }
    }

    GIVEN("Two interchangeable testers and a coder") {
        EquilibriumConfig config;
        config.maxIterations = 10;
        AgentEquilibriumSelector selector(config);
        selector.setName("team-selector");
        ScopedLogCapture capture;
        std::vector<AgentInfo> agents = {
            agent("t1", AgentType::Tester, {"test"}),
            agent("t2", AgentType::Tester, {"test"}),
            agent("c1", AgentType::Coder, {"code"}),
        };
        auto result = selector.computeEquilibrium(task("Write unit tests", {"test"}), agents);

        THEN("Non-convergence is reported, not thrown") {
            CHECK_FALSE(result.converged);
            CHECK(capture.sink().contains("did not converge"));
            CHECK(capture.sink().contains("team-selector"));
        }

        THEN("The redundant testers penalise each other equally and lose ground") {
            const auto* t1 = findParticipant(result.participants, "t1");
            const auto* t2 = findParticipant(result.participants, "t2");
            const auto* c1 = findParticipant(result.participants, "c1");
            REQUIRE(t1);
            REQUIRE(t2);
            REQUIRE(c1);
            CHECK_FALSE(result.converged);
            CHECK(result.iterations == 10);
            CHECK(t1->participationLevel == Approx(t2->participationLevel));
            CHECK(t1->participationLevel < 1.0 / 3.0);
            CHECK(t1->redundancyPenalty > 0.0);
            CHECK(c1->redundancyPenalty == 0.0);
            CHECK(c1->participationLevel > t1->participationLevel);
        }
    }
}

TEST_CASE("Selecting the top agents", "[agents][equilibrium]") {
    EquilibriumConfig config;
    config.maxIterations = 500;
    AgentEquilibriumSelector selector(config);
    std::vector<AgentInfo> agents = {
        agent("c1", AgentType::Coder, {"code"}),
        agent("t1", AgentType::Tester, {"test"}),
    };
    auto testing = task("Write unit tests", {"test"});

    auto top = selector.selectTopAgents(testing, agents, 1);
    REQUIRE(top.size() == 1);
    CHECK(top[0].id == "t1");
    CHECK(top[0].type == AgentType::Tester);

    CHECK(selector.selectTopAgents(testing, agents, 0).empty());
    CHECK(selector.selectTopAgents(testing, agents, 5).size() <= agents.size());
}

TEST_CASE("Equilibrium configuration is validated", "[agents][equilibrium]") {
    EquilibriumConfig bad;

    SECTION("Learning rate") {
        bad.learningRate = 0.0;
        CHECK_THROWS_AS(AgentEquilibriumSelector(bad), std::invalid_argument);
    }

    SECTION("Iterations") {
        bad.maxIterations = 0;
        CHECK_THROWS_AS(bad.validate(), std::invalid_argument);
    }

    SECTION("Minimum participation") {
        bad.minParticipation = 1.0;
        CHECK_THROWS_AS(bad.validate(), std::invalid_argument);
    }

    SECTION("setConfig keeps the previous config on error") {
        AgentEquilibriumSelector selector;
        bad.convergenceThreshold = -1.0;
        CHECK_THROWS_AS(selector.setConfig(bad), std::invalid_argument);
        CHECK(selector.getConfig().convergenceThreshold == Approx(0.001));
    }

    SECTION("History can be disabled") {
        EquilibriumConfig quiet;
        quiet.recordHistory = false;
        AgentEquilibriumSelector selector(quiet);
        auto result = selector.computeEquilibrium(task("Review code", {}), {
            agent("r1", AgentType::Reviewer, {"review"}),
            agent("c1", AgentType::Coder, {"code"}),
        });
        CHECK(result.history.empty());
        CHECK(result.iterations > 0);
    }
}
