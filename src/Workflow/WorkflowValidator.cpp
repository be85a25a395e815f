/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

#include "WorkflowValidator.h"
#include "../Core/Errors.h"
#include <format>
#include <unordered_map>

namespace MaestroEngine {
namespace Core {
namespace Workflow {

namespace {

    /// First position of each non-empty step id
    std::unordered_map<std::string, uint32_t> indexSteps(const WorkflowDefinition& definition) {
        std::unordered_map<std::string, uint32_t> index;
        for (uint32_t i = 0; i < definition.steps.size(); ++i) {
            const auto& id = definition.steps[i].id;
            if (!id.empty()) {
                index.emplace(id, i);
            }
        }
        return index;
    }

} // namespace

ValidationReport WorkflowValidator::check(const WorkflowDefinition& definition) {
    ValidationReport report;

    if (definition.id.empty()) {
        report.problems.emplace_back("workflow id is required");
    }
    if (definition.name.empty()) {
        report.problems.emplace_back("workflow name is required");
    }
    if (definition.version.empty()) {
        report.problems.emplace_back("workflow version is required");
    }
    if (definition.steps.empty()) {
        report.problems.emplace_back("workflow must have at least one step");
        return report;
    }

    std::unordered_map<std::string, uint32_t> seen;
    for (uint32_t i = 0; i < definition.steps.size(); ++i) {
        const auto& step = definition.steps[i];
        if (step.id.empty()) {
            report.problems.push_back(std::format("step at position {} has no id", i));
            continue;
        }
        if (!seen.emplace(step.id, i).second) {
            report.problems.push_back(std::format("duplicate step id '{}'", step.id));
        }
        if (!step.handler) {
            report.problems.push_back(std::format("step '{}' has no handler", step.id));
        }
    }

    for (const auto& step : definition.steps) {
        for (const auto& dependency : step.dependencies) {
            if (seen.find(dependency) == seen.end()) {
                report.problems.push_back(std::format("step '{}' depends on unknown step '{}'",
                                                      step.id.empty() ? "<unnamed>" : step.id,
                                                      dependency));
            }
        }
    }

    auto graph = buildGraph(definition);
    auto cycle = graph.findCycle();
    if (!cycle.empty()) {
        std::string path;
        for (uint32_t node : cycle) {
            const auto& id = definition.steps[node].id;
            if (!path.empty()) {
                path += " -> ";
            }
            path += id;
            report.cycle.push_back(id);
        }
        report.problems.push_back("dependency cycle: " + path);
    }

    return report;
}

void WorkflowValidator::validate(const WorkflowDefinition& definition) {
    auto report = check(definition);
    if (!report.valid()) {
        throw ValidationError(definition.id, std::move(report.problems), std::move(report.cycle));
    }
}

Graph::DependencyGraph WorkflowValidator::buildGraph(const WorkflowDefinition& definition) {
    auto index = indexSteps(definition);
    Graph::DependencyGraph graph(definition.steps.size());

    for (uint32_t i = 0; i < definition.steps.size(); ++i) {
        for (const auto& dependency : definition.steps[i].dependencies) {
            auto it = index.find(dependency);
            if (it != index.end()) {
                graph.addEdge(it->second, i);
            }
        }
    }

    return graph;
}

} // namespace Workflow
} // namespace Core
} // namespace MaestroEngine
