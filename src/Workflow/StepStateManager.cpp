/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

#include "StepStateManager.h"
#include "../Core/Errors.h"
#include "../Logging/Logger.h"
#include <format>
#include <stdexcept>

namespace MaestroEngine {
namespace Core {
namespace Workflow {

StepStateManager::StepStateManager(ExecutionRecord& record, const WorkflowEventEmitter& emitter)
    : _record(record)
    , _emitter(emitter) {
    std::lock_guard<std::mutex> lock(_record.mutex);
    for (const auto& [stepId, result] : _record.execution.stepResults) {
        ++counterFor(_counts, result.status);
    }
}

size_t& StepStateManager::counterFor(StepStatusCounts& counts, StepStatus status) {
    switch (status) {
        case StepStatus::Pending:    return counts.pending;
        case StepStatus::Running:    return counts.running;
        case StepStatus::Succeeded:  return counts.succeeded;
        case StepStatus::Failed:     return counts.failed;
        case StepStatus::RolledBack: return counts.rolledBack;
        case StepStatus::Skipped:    return counts.skipped;
    }
    throw std::logic_error("Unhandled step status");
}

void StepStateManager::updateCounts(StepStatus from, StepStatus to) {
    --counterFor(_counts, from);
    ++counterFor(_counts, to);
}

StepStatusCounts StepStateManager::getCounts() const {
    std::lock_guard<std::mutex> lock(_record.mutex);
    return _counts;
}

StepResult* StepStateManager::findLocked(const std::string& stepId) {
    auto it = _record.execution.stepResults.find(stepId);
    if (it == _record.execution.stepResults.end()) {
        MAESTRO_LOG_WARNING_CAT("StepStateManager", "Unknown step '{}' in execution {}",
                                stepId, _record.execution.id);
        return nullptr;
    }
    return &it->second;
}

bool StepStateManager::transitionLocked(StepResult& result, StepStatus to) {
    if (!canTransition(result.status, to)) {
        auto msg = std::format("Invalid step transition {} -> {} for step '{}' in execution {}",
                               getStatusName(result.status), getStatusName(to),
                               result.stepId, _record.execution.id);
        MAESTRO_LOG_WARNING_CAT("StepStateManager", msg);
        return false;
    }
    updateCounts(result.status, to);
    result.status = to;
    return true;
}

bool StepStateManager::markRunning(const std::string& stepId, uint32_t attempt, TimePoint startedAt) {
    std::string executionId;
    std::string workflowId;
    {
        std::lock_guard<std::mutex> lock(_record.mutex);
        auto* result = findLocked(stepId);
        if (!result || !transitionLocked(*result, StepStatus::Running)) {
            return false;
        }
        result->attempts = attempt;
        if (!result->startedAt) {
            result->startedAt = startedAt;
        }
        result->completedAt.reset();
        executionId = _record.execution.id;
        workflowId = _record.execution.workflowId;
    }

    _emitter.emit(executionId, workflowId, stepId, Events::StepStarted{attempt});
    return true;
}

bool StepStateManager::markSucceeded(const std::string& stepId, StepValue output, TimePoint completedAt) {
    std::string executionId;
    std::string workflowId;
    Events::StepCompleted payload;
    {
        std::lock_guard<std::mutex> lock(_record.mutex);
        auto* result = findLocked(stepId);
        if (!result || !transitionLocked(*result, StepStatus::Succeeded)) {
            return false;
        }
        result->output = std::move(output);
        result->completedAt = completedAt;
        result->error.reset();
        result->cause = nullptr;
        result->timedOut = false;
        _record.execution.completionOrder.push_back(stepId);

        payload.attempt = result->attempts;
        payload.duration = result->duration().value_or(std::chrono::milliseconds{0});
        executionId = _record.execution.id;
        workflowId = _record.execution.workflowId;
    }

    _emitter.emit(executionId, workflowId, stepId, payload);
    return true;
}

bool StepStateManager::markRetrying(const std::string& stepId, const std::exception_ptr& error, bool timedOut,
                                    uint32_t nextAttempt, std::chrono::milliseconds delay) {
    std::string executionId;
    std::string workflowId;
    std::string message = describeException(error);
    {
        std::lock_guard<std::mutex> lock(_record.mutex);
        auto* result = findLocked(stepId);
        if (!result || !transitionLocked(*result, StepStatus::Pending)) {
            return false;
        }
        result->error = message;
        result->cause = error;
        result->timedOut = timedOut;
        executionId = _record.execution.id;
        workflowId = _record.execution.workflowId;
    }

    _emitter.emit(executionId, workflowId, stepId, Events::StepRetrying{nextAttempt, delay}, message);
    return true;
}

bool StepStateManager::markFailed(const std::string& stepId, const std::exception_ptr& error, bool timedOut,
                                  TimePoint completedAt) {
    std::string executionId;
    std::string workflowId;
    std::string message = describeException(error);
    Events::StepFailed payload;
    {
        std::lock_guard<std::mutex> lock(_record.mutex);
        auto* result = findLocked(stepId);
        if (!result || !transitionLocked(*result, StepStatus::Failed)) {
            return false;
        }
        result->error = message;
        result->cause = error;
        result->timedOut = timedOut;
        result->completedAt = completedAt;

        payload.attempts = result->attempts;
        payload.timedOut = timedOut;
        executionId = _record.execution.id;
        workflowId = _record.execution.workflowId;
    }

    _emitter.emit(executionId, workflowId, stepId, payload, message);
    return true;
}

bool StepStateManager::markSkipped(const std::string& stepId, const std::string& reason, TimePoint at) {
    std::string executionId;
    std::string workflowId;
    {
        std::lock_guard<std::mutex> lock(_record.mutex);
        auto* result = findLocked(stepId);
        if (!result || !transitionLocked(*result, StepStatus::Skipped)) {
            return false;
        }
        result->skipped = true;
        result->skipReason = reason;
        result->completedAt = at;
        executionId = _record.execution.id;
        workflowId = _record.execution.workflowId;
    }

    _emitter.emit(executionId, workflowId, stepId, Events::StepSkipped{reason});
    return true;
}

void StepStateManager::recordOptionalFailure(const std::string& stepId) {
    std::lock_guard<std::mutex> lock(_record.mutex);
    auto* result = findLocked(stepId);
    if (!result || result->status != StepStatus::Failed) {
        return;
    }
    result->skipped = true;
    result->skipReason = "failed but optional";
}

bool StepStateManager::markRolledBack(const std::string& stepId) {
    std::string executionId;
    std::string workflowId;
    {
        std::lock_guard<std::mutex> lock(_record.mutex);
        auto* result = findLocked(stepId);
        if (!result || !transitionLocked(*result, StepStatus::RolledBack)) {
            return false;
        }
        executionId = _record.execution.id;
        workflowId = _record.execution.workflowId;
    }

    _emitter.emit(executionId, workflowId, stepId, Events::StepRolledBack{true});
    return true;
}

void StepStateManager::recordRollbackFailure(const std::string& stepId, const std::string& message) {
    std::string executionId;
    std::string workflowId;
    {
        std::lock_guard<std::mutex> lock(_record.mutex);
        auto* result = findLocked(stepId);
        if (!result) {
            return;
        }
        result->rollbackError = message;
        executionId = _record.execution.id;
        workflowId = _record.execution.workflowId;
    }

    _emitter.emit(executionId, workflowId, stepId, Events::StepRolledBack{false}, message);
}

StepStatus StepStateManager::getStatus(const std::string& stepId) const {
    std::lock_guard<std::mutex> lock(_record.mutex);
    const auto* result = _record.execution.findStep(stepId);
    return result ? result->status : StepStatus::Pending;
}

StepOutputs StepStateManager::collectOutputs(const std::vector<std::string>& stepIds) const {
    std::lock_guard<std::mutex> lock(_record.mutex);
    StepOutputs outputs;
    for (const auto& stepId : stepIds) {
        const auto* result = _record.execution.findStep(stepId);
        if (result && result->status == StepStatus::Succeeded) {
            outputs.emplace(stepId, result->output);
        }
    }
    return outputs;
}

StepOutputs StepStateManager::collectAllOutputs() const {
    std::lock_guard<std::mutex> lock(_record.mutex);
    StepOutputs outputs;
    for (const auto& [stepId, result] : _record.execution.stepResults) {
        if (result.status == StepStatus::Succeeded) {
            outputs.emplace(stepId, result.output);
        }
    }
    return outputs;
}

bool StepStateManager::transitionExecution(ExecutionStatus to) {
    std::lock_guard<std::mutex> lock(_record.mutex);
    auto from = _record.execution.status;
    if (!isValidTransition(from, to)) {
        auto msg = std::format("Invalid execution transition {} -> {} for execution {}",
                               executionStatusToString(from), executionStatusToString(to),
                               _record.execution.id);
        MAESTRO_LOG_WARNING_CAT("StepStateManager", msg);
        return false;
    }
    _record.execution.status = to;
    if (to == ExecutionStatus::Running) {
        _record.execution.startedAt = Clock::now();
    } else if (isTerminalStatus(to)) {
        _record.execution.completedAt = Clock::now();
    }
    return true;
}

} // namespace Workflow
} // namespace Core
} // namespace MaestroEngine
