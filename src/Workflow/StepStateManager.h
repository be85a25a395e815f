/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

/**
 * @file StepStateManager.h
 * @brief Validated status transitions for the steps of one execution
 */

#pragma once

#include "ExecutionRecord.h"
#include "IWorkflowEventSink.h"
#include <string>
#include <vector>

namespace MaestroEngine {
namespace Core {
namespace Workflow {

/// Number of steps currently in each status
struct StepStatusCounts {
    size_t pending = 0;
    size_t running = 0;
    size_t succeeded = 0;
    size_t failed = 0;
    size_t rolledBack = 0;
    size_t skipped = 0;

    size_t total() const { return pending + running + succeeded + failed + rolledBack + skipped; }
};

/**
 * @brief Single place where step and execution statuses change
 *
 * Every mutation:
 * - checks the transition against isValidTransition();
 * - applies it under the execution record's mutex;
 * - emits the matching lifecycle event after the lock is released, so a
 *   sink may query the registry without deadlocking.
 *
 * Rejected transitions are logged at Warning level and return false.
 */
class StepStateManager {
public:
    StepStateManager(ExecutionRecord& record, const WorkflowEventEmitter& emitter);

    static bool canTransition(StepStatus from, StepStatus to) {
        return isValidTransition(from, to);
    }

    static const char* getStatusName(StepStatus status) {
        return stepStatusToString(status);
    }

    /// Pending → Running for attempt number @p attempt
    bool markRunning(const std::string& stepId, uint32_t attempt, TimePoint startedAt);

    /// Running → Succeeded; appends the step to the completion order
    bool markSucceeded(const std::string& stepId, StepValue output, TimePoint completedAt);

    /// Running → Pending, recording the failed attempt's error before a retry
    bool markRetrying(const std::string& stepId, const std::exception_ptr& error, bool timedOut,
                      uint32_t nextAttempt, std::chrono::milliseconds delay);

    /// Running or Pending (abandoned retry) → Failed
    bool markFailed(const std::string& stepId, const std::exception_ptr& error, bool timedOut,
                    TimePoint completedAt);

    /// Pending → Skipped when the step's condition declined to run it
    bool markSkipped(const std::string& stepId, const std::string& reason, TimePoint at);

    /// Flag an already Failed optional step so dependents may proceed without it
    void recordOptionalFailure(const std::string& stepId);

    /// Succeeded → RolledBack after a compensation ran cleanly
    bool markRolledBack(const std::string& stepId);

    /// Keep the step Succeeded but note that its compensation threw
    void recordRollbackFailure(const std::string& stepId, const std::string& message);

    StepStatus getStatus(const std::string& stepId) const;

    /// Outputs of those @p stepIds that have succeeded
    StepOutputs collectOutputs(const std::vector<std::string>& stepIds) const;

    /// Outputs of every succeeded step
    StepOutputs collectAllOutputs() const;

    /// Status distribution, maintained incrementally on every accepted transition
    StepStatusCounts getCounts() const;

    /// Validated execution-level transition (Pending → Running → terminal)
    bool transitionExecution(ExecutionStatus to);

private:
    bool transitionLocked(StepResult& result, StepStatus to);
    StepResult* findLocked(const std::string& stepId);
    void updateCounts(StepStatus from, StepStatus to);
    static size_t& counterFor(StepStatusCounts& counts, StepStatus status);

    ExecutionRecord& _record;
    const WorkflowEventEmitter& _emitter;
    StepStatusCounts _counts;
};

} // namespace Workflow
} // namespace Core
} // namespace MaestroEngine
