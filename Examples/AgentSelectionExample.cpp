#include <iomanip>
#include <iostream>
#include "../src/Agents/AgentEquilibrium.h"

using namespace MaestroEngine::Core::Agents;

int main() {
    std::vector<AgentInfo> agents = {
        {"alice", "Alice", AgentType::Coder, {"code", "refactor"}},
        {"bob", "Bob", AgentType::Tester, {"test", "qa"}},
        {"carol", "Carol", AgentType::Reviewer, {"review", "code"}},
        {"dave", "Dave", AgentType::Documenter, {"docs"}},
    };

    std::vector<Task> tasks = {
        {"t1", "Write unit tests for the scheduler", {"test"}, TaskPriority::High, 0.4},
        {"t2", "Implement retry backoff and review the code", {"code", "review"}, TaskPriority::Medium, 0.7},
        {"t3", "Document the public API", {"docs"}, TaskPriority::Low, 0.2},
    };

    AgentEquilibriumSelector selector;
    std::cout << std::fixed << std::setprecision(3);

    for (const auto& task : tasks) {
        auto result = selector.computeEquilibrium(task, agents);
        std::cout << "\n=== " << task.id << ": " << task.description << " ===\n";
        std::cout << (result.converged ? "converged" : "did not converge")
                  << " after " << result.iterations << " iterations, total utility "
                  << result.totalUtility << "\n";

        for (const auto& participant : result.participants) {
            std::cout << "  " << std::setw(6) << participant.agentId
                      << " (" << agentTypeToString(participant.agentType) << ")"
                      << " participation " << participant.participationLevel
                      << " effectiveness " << participant.effectivenessScore << "\n";
        }

        auto top = selector.selectTopAgents(task, agents, 2);
        std::cout << "  selected:";
        for (const auto& agent : top) {
            std::cout << " " << agent.name;
        }
        std::cout << "\n";
    }
    return 0;
}
