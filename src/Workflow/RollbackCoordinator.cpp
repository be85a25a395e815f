/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

#include "RollbackCoordinator.h"
#include "../Debug/Profiling.h"
#include "../Logging/Logger.h"

namespace MaestroEngine {
namespace Core {
namespace Workflow {

StepContext RollbackCoordinator::makeContext(uint32_t stepIndex, const StepResult& result) const {
    StepContext context;
    context.workflowId = _record.execution.workflowId;
    context.executionId = _record.execution.id;
    context.stepId = result.stepId;
    context.attempt = result.attempts;
    context.state = _record.state;
    context.metadata = _record.execution.metadata;

    for (uint32_t dependency : _graph.collectDependencies(stepIndex)) {
        const auto& dependencyId = _definition.steps[dependency].id;
        const auto* dependencyResult = _record.execution.findStep(dependencyId);
        if (dependencyResult) {
            context.previousResults.emplace(dependencyId, dependencyResult->output);
        }
    }
    return context;
}

RollbackSummary RollbackCoordinator::run() {
    MAESTRO_PROFILE_ZONE_NC("RollbackCoordinator::run", Debug::ProfileColors::Rollback);

    struct Pending {
        uint32_t stepIndex;
        StepValue output;
        StepContext context;
    };

    // Gather everything under the lock, then call handlers without it
    std::vector<Pending> pending;
    std::string executionId;
    std::string workflowId;
    {
        std::lock_guard<std::mutex> lock(_record.mutex);
        executionId = _record.execution.id;
        workflowId = _record.execution.workflowId;

        const auto& order = _record.execution.completionOrder;
        for (auto it = order.rbegin(); it != order.rend(); ++it) {
            const auto* result = _record.execution.findStep(*it);
            if (!result || result->status != StepStatus::Succeeded) {
                continue;
            }
            for (uint32_t i = 0; i < _definition.steps.size(); ++i) {
                const auto& step = _definition.steps[i];
                if (step.id == *it && step.rollback) {
                    pending.push_back({i, result->output, makeContext(i, *result)});
                    break;
                }
            }
        }
    }

    RollbackSummary summary;
    summary.candidates = pending.size();
    _emitter.emit(executionId, workflowId, std::nullopt, Events::RollbackStarted{summary.candidates});

    for (auto& entry : pending) {
        const auto& step = _definition.steps[entry.stepIndex];
        summary.order.push_back(step.id);

        std::optional<std::string> failure;
        try {
            step.rollback(entry.output, entry.context);
        } catch (const std::exception& e) {
            failure = e.what();
        } catch (...) {
            failure = "unknown exception";
        }

        if (failure) {
            ++summary.failures;
            MAESTRO_LOG_ERROR_CAT("Rollback", "Rollback of step '{}' in execution {} failed: {}",
                                  step.id, executionId, *failure);
            _stateManager.recordRollbackFailure(step.id, *failure);
        } else if (_stateManager.markRolledBack(step.id)) {
            ++summary.rolledBack;
        }
    }

    _emitter.emit(executionId, workflowId, std::nullopt,
                  Events::RollbackCompleted{summary.rolledBack, summary.failures});
    return summary;
}

} // namespace Workflow
} // namespace Core
} // namespace MaestroEngine
