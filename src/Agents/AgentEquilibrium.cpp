/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

#include "AgentEquilibrium.h"
#include "../Debug/Profiling.h"
#include "../Logging/Logger.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>
#include <mutex>
#include <set>
#include <stdexcept>
#include <utility>

namespace MaestroEngine {
namespace Core {
namespace Agents {

namespace {

    struct RoleKeyword {
        std::string_view keyword;
        AgentType type;
    };

    constexpr RoleKeyword kRoleKeywords[] = {
        {"review", AgentType::Reviewer},
        {"test", AgentType::Tester},
        {"code", AgentType::Coder},
        {"implement", AgentType::Coder},
        {"document", AgentType::Documenter},
        {"plan", AgentType::Planner},
        {"optimize", AgentType::Optimizer},
        {"research", AgentType::Researcher},
        {"analyze", AgentType::Analyst},
        {"architect", AgentType::Architect},
        {"design", AgentType::Architect},
        {"coordinate", AgentType::Coordinator},
    };

    constexpr double kCapabilityWeight = 0.7;
    constexpr double kTypeWeight = 0.3;
    constexpr double kTypeMatchBoost = 1.0;
    constexpr double kTypeMissBoost = 0.3;
    constexpr double kNoRequirementsMatch = 0.5;
    constexpr double kSameTypeOverlap = 0.8;
    constexpr double kOtherTypeOverlap = 0.2;
    constexpr double kPenaltyFactor = 0.5;

    std::set<std::string_view> asSet(const std::vector<std::string>& values) {
        return std::set<std::string_view>(values.begin(), values.end());
    }

    double sumLevels(const std::vector<AgentParticipation>& participants) {
        double total = 0.0;
        for (const auto& participant : participants) {
            total += participant.participationLevel;
        }
        return total;
    }

    double sumUtility(const std::vector<AgentParticipation>& participants) {
        double total = 0.0;
        for (const auto& participant : participants) {
            total += participant.utility;
        }
        return total;
    }

} // namespace

void EquilibriumConfig::validate() const {
    if (!std::isfinite(learningRate) || learningRate <= 0.0) {
        throw std::invalid_argument(std::format("learningRate must be positive, got {}", learningRate));
    }
    if (maxIterations == 0) {
        throw std::invalid_argument("maxIterations must be at least 1");
    }
    if (!std::isfinite(convergenceThreshold) || convergenceThreshold <= 0.0) {
        throw std::invalid_argument(std::format("convergenceThreshold must be positive, got {}", convergenceThreshold));
    }
    if (!std::isfinite(minParticipation) || minParticipation < 0.0 || minParticipation >= 1.0) {
        throw std::invalid_argument(std::format("minParticipation must be in [0, 1), got {}", minParticipation));
    }
}

AgentEquilibriumSelector::AgentEquilibriumSelector()
    : AgentEquilibriumSelector(EquilibriumConfig{}) {
}

AgentEquilibriumSelector::AgentEquilibriumSelector(EquilibriumConfig config)
    : Debug::Named("AgentEquilibriumSelector")
    , _config(std::move(config)) {
    _config.validate();
}

EquilibriumConfig AgentEquilibriumSelector::getConfig() const {
    std::shared_lock<std::shared_mutex> lock(_configMutex);
    return _config;
}

void AgentEquilibriumSelector::setConfig(EquilibriumConfig config) {
    config.validate();
    std::unique_lock<std::shared_mutex> lock(_configMutex);
    _config = std::move(config);
}

std::vector<AgentType> AgentEquilibriumSelector::matchedAgentTypes(std::string_view description) {
    std::string lowered(description);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    std::vector<AgentType> matched;
    for (const auto& role : kRoleKeywords) {
        if (lowered.find(role.keyword) == std::string::npos) continue;
        if (std::find(matched.begin(), matched.end(), role.type) == matched.end()) {
            matched.push_back(role.type);
        }
    }
    return matched;
}

double AgentEquilibriumSelector::typeBoost(AgentType type, const Task& task) {
    auto matched = matchedAgentTypes(task.description);
    return std::find(matched.begin(), matched.end(), type) != matched.end() ? kTypeMatchBoost : kTypeMissBoost;
}

double AgentEquilibriumSelector::calculateEffectiveness(const AgentInfo& agent, const Task& task) {
    auto required = asSet(task.requiredCapabilities);
    auto held = asSet(agent.capabilities);

    double capabilityMatch = kNoRequirementsMatch;
    if (!required.empty()) {
        size_t matches = 0;
        for (auto capability : required) {
            if (held.count(capability)) ++matches;
        }
        capabilityMatch = static_cast<double>(matches) / static_cast<double>(required.size());
    }

    return kCapabilityWeight * capabilityMatch + kTypeWeight * typeBoost(agent.type, task);
}

double AgentEquilibriumSelector::capabilityOverlap(const AgentInfo& a, const AgentInfo& b) {
    auto capsA = asSet(a.capabilities);
    auto capsB = asSet(b.capabilities);

    if (capsA.empty() || capsB.empty()) {
        return a.type == b.type ? kSameTypeOverlap : kOtherTypeOverlap;
    }

    size_t shared = 0;
    for (auto capability : capsA) {
        if (capsB.count(capability)) ++shared;
    }
    return static_cast<double>(shared) / static_cast<double>(std::max(capsA.size(), capsB.size()));
}

EquilibriumResult AgentEquilibriumSelector::computeEquilibrium(const Task& task,
                                                               const std::vector<AgentInfo>& agents) const {
    MAESTRO_PROFILE_ZONE_NC("AgentEquilibriumSelector::computeEquilibrium", Debug::ProfileColors::Equilibrium);
    const auto config = getConfig();

    EquilibriumResult result;
    if (agents.empty()) {
        result.converged = true;
        return result;
    }

    if (agents.size() == 1) {
        const auto& agent = agents.front();
        AgentParticipation only;
        only.agentId = agent.id;
        only.agentType = agent.type;
        only.participationLevel = 1.0;
        only.effectivenessScore = calculateEffectiveness(agent, task);
        only.utility = only.effectivenessScore;
        result.totalUtility = only.utility;
        result.participants.push_back(std::move(only));
        result.converged = true;
        return result;
    }

    const size_t count = agents.size();
    std::vector<AgentParticipation> participants(count);
    for (size_t i = 0; i < count; ++i) {
        participants[i].agentId = agents[i].id;
        participants[i].agentType = agents[i].type;
        participants[i].participationLevel = 1.0 / static_cast<double>(count);
        participants[i].effectivenessScore = calculateEffectiveness(agents[i], task);
    }

    // Overlap is symmetric and fixed for the whole run
    std::vector<double> overlap(count * count, 0.0);
    for (size_t i = 0; i < count; ++i) {
        for (size_t j = i + 1; j < count; ++j) {
            double value = capabilityOverlap(agents[i], agents[j]);
            overlap[i * count + j] = value;
            overlap[j * count + i] = value;
        }
    }

    std::vector<double> previous(count);
    for (uint32_t iteration = 0; iteration < config.maxIterations; ++iteration) {
        for (size_t i = 0; i < count; ++i) {
            previous[i] = participants[i].participationLevel;
        }

        for (size_t i = 0; i < count; ++i) {
            auto& participant = participants[i];

            double competition = 0.0;
            for (size_t j = 0; j < count; ++j) {
                if (j == i) continue;
                double level = config.updateMode == UpdateMode::Snapshot
                    ? previous[j]
                    : participants[j].participationLevel;
                competition += overlap[i * count + j] * level;
            }

            participant.redundancyPenalty = kPenaltyFactor * competition;
            participant.utility = participant.effectivenessScore * participant.participationLevel
                                - participant.redundancyPenalty;

            double level = participant.participationLevel
                         + config.learningRate * (participant.utility - competition);
            level = std::clamp(level, 0.0, 1.0);
            if (level < config.minParticipation) {
                level = 0.0;
            }
            participant.participationLevel = level;
        }

        double total = sumLevels(participants);
        if (total > 1.0) {
            for (auto& participant : participants) {
                participant.participationLevel /= total;
            }
        }

        double maxDelta = 0.0;
        for (size_t i = 0; i < count; ++i) {
            maxDelta = std::max(maxDelta, std::abs(participants[i].participationLevel - previous[i]));
        }

        result.iterations = iteration + 1;
        if (config.recordHistory) {
            result.history.push_back({iteration, sumUtility(participants), sumLevels(participants), maxDelta});
        }

        if (maxDelta < config.convergenceThreshold) {
            result.converged = true;
            break;
        }
    }

    if (!result.converged) {
        MAESTRO_LOG_DEBUG_CAT("AgentEquilibrium", "{}: task '{}' did not converge after {} iterations",
                              getName(), task.id, config.maxIterations);
    }

    result.totalUtility = sumUtility(participants);
    std::stable_sort(participants.begin(), participants.end(), [](const AgentParticipation& a, const AgentParticipation& b) {
        return a.participationLevel > b.participationLevel;
    });
    result.participants = std::move(participants);
    return result;
}

std::vector<AgentParticipation> AgentEquilibriumSelector::findEquilibrium(const Task& task,
                                                                          const std::vector<AgentInfo>& agents) const {
    auto result = computeEquilibrium(task, agents);
    std::vector<AgentParticipation> positive;
    for (auto& participant : result.participants) {
        if (participant.participationLevel > 0.0) {
            positive.push_back(std::move(participant));
        }
    }
    return positive;
}

std::vector<AgentInfo> AgentEquilibriumSelector::selectTopAgents(const Task& task,
                                                                 const std::vector<AgentInfo>& agents,
                                                                 size_t count) const {
    auto participants = findEquilibrium(task, agents);
    std::vector<AgentInfo> selected;
    for (const auto& participant : participants) {
        if (selected.size() >= count) break;
        auto it = std::find_if(agents.begin(), agents.end(), [&participant](const AgentInfo& agent) {
            return agent.id == participant.agentId;
        });
        if (it != agents.end()) {
            selected.push_back(*it);
        }
    }
    return selected;
}

} // namespace Agents
} // namespace Core
} // namespace MaestroEngine
