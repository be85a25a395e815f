/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

/**
 * @file AgentTypes.h
 * @brief Agents and tasks as seen by the equilibrium selector
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace MaestroEngine {
namespace Core {
namespace Agents {

    enum class AgentType : uint8_t {
        Researcher = 0,
        Coder,
        Tester,
        Analyst,
        Architect,
        Reviewer,
        Coordinator,
        Optimizer,
        Documenter,
        Planner,
        Custom
    };

    inline constexpr std::array<AgentType, 11> kAllAgentTypes = {
        AgentType::Researcher, AgentType::Coder, AgentType::Tester, AgentType::Analyst,
        AgentType::Architect, AgentType::Reviewer, AgentType::Coordinator, AgentType::Optimizer,
        AgentType::Documenter, AgentType::Planner, AgentType::Custom
    };

    inline constexpr std::string_view agentTypeToString(AgentType type) {
        switch (type) {
            case AgentType::Researcher:  return "researcher";
            case AgentType::Coder:       return "coder";
            case AgentType::Tester:      return "tester";
            case AgentType::Analyst:     return "analyst";
            case AgentType::Architect:   return "architect";
            case AgentType::Reviewer:    return "reviewer";
            case AgentType::Coordinator: return "coordinator";
            case AgentType::Optimizer:   return "optimizer";
            case AgentType::Documenter:  return "documenter";
            case AgentType::Planner:     return "planner";
            case AgentType::Custom:      return "custom";
        }
        return "unknown";
    }

    /// Inverse of agentTypeToString(); nullopt for unknown names
    inline constexpr std::optional<AgentType> agentTypeFromString(std::string_view name) {
        for (AgentType type : kAllAgentTypes) {
            if (agentTypeToString(type) == name) {
                return type;
            }
        }
        return std::nullopt;
    }

    struct AgentInfo {
        std::string id;
        std::string name;
        AgentType type = AgentType::Custom;

        /// Treated as a set; duplicates are ignored
        std::vector<std::string> capabilities;
    };

    enum class TaskPriority : uint8_t {
        Low = 0,
        Medium,
        High,
        Critical
    };

    inline constexpr std::string_view taskPriorityToString(TaskPriority priority) {
        switch (priority) {
            case TaskPriority::Low:      return "low";
            case TaskPriority::Medium:   return "medium";
            case TaskPriority::High:     return "high";
            case TaskPriority::Critical: return "critical";
        }
        return "unknown";
    }

    /**
     * @brief Work to be allocated among agents
     *
     * The description is scanned for role keywords (see
     * AgentEquilibriumSelector::matchedAgentTypes). Priority and complexity
     * are carried for the caller and do not affect the allocation.
     */
    struct Task {
        std::string id;
        std::string description;

        /// Treated as a set; duplicates are ignored
        std::vector<std::string> requiredCapabilities;

        TaskPriority priority = TaskPriority::Medium;

        /// 0..1
        double complexity = 0.5;
    };

} // namespace Agents
} // namespace Core
} // namespace MaestroEngine
