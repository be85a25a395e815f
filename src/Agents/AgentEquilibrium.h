/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

/**
 * @file AgentEquilibrium.h
 * @brief Participation levels for a pool of agents competing for one task
 *
 * Each agent starts with an equal share of the task. Every iteration it moves
 * its share up in proportion to how effective it is at the task, and down in
 * proportion to how much it overlaps with the other agents that are still
 * participating. Agents dominated by a better-matched competitor drift to
 * zero; the survivors are the recommended allocation.
 */

#pragma once

#include "AgentTypes.h"
#include "../Debug/INamed.h"
#include <shared_mutex>
#include <string_view>
#include <vector>

namespace MaestroEngine {
namespace Core {
namespace Agents {

    /// How one iteration reads the participation levels it updates
    enum class UpdateMode : uint8_t {
        /// Every agent sees the levels of the previous iteration
        Snapshot = 0,

        /// Agents update in place in list order, so later agents see earlier agents' new levels
        Sequential = 1
    };

    struct EquilibriumConfig {
        double learningRate = 0.1;
        uint32_t maxIterations = 100;

        /// Converged once no level moved by this much in one iteration
        double convergenceThreshold = 0.001;

        /// Levels below this collapse to zero
        double minParticipation = 0.01;

        UpdateMode updateMode = UpdateMode::Snapshot;

        /// Keep an IterationRecord per iteration in EquilibriumResult::history
        bool recordHistory = true;

        /// @throws std::invalid_argument describing the first bad value
        void validate() const;
    };

    struct AgentParticipation {
        std::string agentId;
        AgentType agentType = AgentType::Custom;
        double participationLevel = 0.0;
        double effectivenessScore = 0.0;
        double redundancyPenalty = 0.0;
        double utility = 0.0;
    };

    struct IterationRecord {
        uint32_t iteration = 0;
        double totalUtility = 0.0;

        /// Sum of levels after normalization; never above 1
        double totalParticipation = 0.0;

        double maxDelta = 0.0;
    };

    struct EquilibriumResult {
        /// Every agent, highest participation first; ties keep input order
        std::vector<AgentParticipation> participants;

        uint32_t iterations = 0;
        bool converged = false;
        double totalUtility = 0.0;
        std::vector<IterationRecord> history;
    };

    /**
     * @brief Allocates a task among agents by iterating to a fixed point
     *
     * For agent a with level p:
     * - effectiveness = 0.7 * capabilityMatch + 0.3 * typeBoost
     * - competition   = sum over other agents b of overlap(a, b) * p_b
     * - penalty       = 0.5 * competition
     * - utility       = effectiveness * p - penalty
     * - p            += learningRate * (utility - competition), clamped to [0, 1]
     *
     * A level under minParticipation becomes 0. After every iteration the
     * levels are scaled down if they sum to more than 1. They are never
     * scaled up.
     *
     * Apart from its configuration the selector holds no state, so one
     * instance may serve concurrent calls.
     *
     * @code
     * AgentEquilibriumSelector selector;
     * Task task{.id = "t-17", .description = "Review the storage patch",
     *           .requiredCapabilities = {"review", "cpp"}};
     *
     * auto team = selector.selectTopAgents(task, pool, 2);
     * @endcode
     */
    class AgentEquilibriumSelector : public Debug::Named {
    public:
        AgentEquilibriumSelector();

        /// @throws std::invalid_argument if @p config is invalid
        explicit AgentEquilibriumSelector(EquilibriumConfig config);

        /// Agents with positive participation, highest first
        std::vector<AgentParticipation> findEquilibrium(const Task& task,
                                                        const std::vector<AgentInfo>& agents) const;

        /// Full result including collapsed agents, iteration count and history
        EquilibriumResult computeEquilibrium(const Task& task,
                                             const std::vector<AgentInfo>& agents) const;

        /// Up to @p count agents, highest participation first
        std::vector<AgentInfo> selectTopAgents(const Task& task,
                                               const std::vector<AgentInfo>& agents,
                                               size_t count) const;

        /// 0.7 * fraction of required capabilities held (0.5 if none required) + 0.3 * typeBoost
        static double calculateEffectiveness(const AgentInfo& agent, const Task& task);

        /// 1.0 if a keyword in the description names @p type's role, else 0.3
        static double typeBoost(AgentType type, const Task& task);

        /**
         * @brief Shared capabilities over the larger capability set
         *
         * If either agent lists no capabilities, falls back to 0.8 for agents
         * of the same type and 0.2 otherwise.
         */
        static double capabilityOverlap(const AgentInfo& a, const AgentInfo& b);

        /// Roles whose keywords occur in @p description (case-insensitive, substring match)
        static std::vector<AgentType> matchedAgentTypes(std::string_view description);

        EquilibriumConfig getConfig() const;

        /// @throws std::invalid_argument if @p config is invalid; the old config is kept
        void setConfig(EquilibriumConfig config);

    private:
        mutable std::shared_mutex _configMutex;
        EquilibriumConfig _config;
    };

} // namespace Agents
} // namespace Core
} // namespace MaestroEngine
