/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

/**
 * @file WorkflowScheduler.h
 * @brief Drives one execution from pending to a terminal status
 *
 * The scheduler owns the dependency bookkeeping of a single execution. It
 * launches every step whose dependencies have succeeded, sleeps on the
 * completion queue until the nearest attempt deadline or retry time, and
 * reacts to whatever woke it: an outcome, a cancellation, or a deadline.
 *
 * Lifecycle of an execution:
 * 1. Pending → Running, workflow:started, onStart hook
 * 2. Launch ready steps, retry failed attempts with exponential backoff
 * 3. On the first final step failure, stop in-flight attempts and stop
 *    scheduling; on cancel, the same without rollback
 * 4. Settle: rollback (failure only), terminal status, terminal event, hook
 */

#pragma once

#include "ExecutionRecord.h"
#include "IWorkflowEventSink.h"
#include "RollbackCoordinator.h"
#include "StepExecutor.h"
#include "StepStateManager.h"
#include "../Graph/DependencyGraph.h"
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace MaestroEngine {
namespace Core {
namespace Workflow {

    /**
     * @brief Runs one execution on the calling thread
     *
     * @code
     * auto record = WorkflowScheduler::createRecord(definition, "exec_1", input, options);
     * WorkflowScheduler scheduler(definition, record, config, options);
     * WorkflowExecution finished = scheduler.run();
     * @endcode
     *
     * A scheduler is single-use. Other threads interact with the running
     * execution only through its ExecutionRecord (snapshot, requestCancel).
     */
    class WorkflowScheduler {
    public:
        /**
         * @brief Build the live record of a new execution in Pending status
         *
         * Every step gets a Pending StepResult, and the shared state is
         * seeded from options.sharedState.
         */
        static std::shared_ptr<ExecutionRecord> createRecord(const WorkflowDefinition& definition,
                                                             std::string executionId,
                                                             StepValue input,
                                                             const ExecutionOptions& options);

        WorkflowScheduler(std::shared_ptr<const WorkflowDefinition> definition,
                          std::shared_ptr<ExecutionRecord> record,
                          const WorkflowRegistryConfig& config,
                          const ExecutionOptions& options);

        WorkflowScheduler(const WorkflowScheduler&) = delete;
        WorkflowScheduler& operator=(const WorkflowScheduler&) = delete;

        /// Run to a terminal status and return the final snapshot
        WorkflowExecution run();

        std::chrono::milliseconds resolveTimeout(const WorkflowStep& step) const;
        uint32_t resolveMaxRetries(const WorkflowStep& step) const;

        /// Delay before attempt @p failedAttempt + 1: retryDelay * 2^(failedAttempt-1)
        std::chrono::milliseconds resolveRetryDelay(const WorkflowStep& step, uint32_t failedAttempt) const;

    private:
        struct StepProgress {
            StepStatus status = StepStatus::Pending;
            uint32_t attempts = 0;
            std::optional<TimePoint> retryAt;
            std::exception_ptr lastError;
            bool lastTimedOut = false;
        };

        /// First final failure; no step index when transformOutput threw
        struct Failure {
            std::optional<uint32_t> stepIndex;
            std::exception_ptr error;
        };

        bool isStopping() const { return _failure.has_value() || _cancelling; }

        void start();
        void pollCancellation();
        size_t launchReadySteps();
        /// @return false if the step was skipped or failed before launching
        bool launchStep(uint32_t stepIndex);
        std::optional<TimePoint> nextWakeup() const;
        void processOutcome(StepAttemptOutcome& outcome);
        void processTimeouts();
        void handleFailure(uint32_t stepIndex, std::exception_ptr error, bool timedOut, TimePoint at,
                           bool retryable = true);
        void stopInFlight();
        void failPendingRetries();
        bool hasPendingRetries() const;
        /// Succeeded, skipped, or failed while optional
        bool satisfiesDependents(uint32_t stepIndex) const;
        bool allSatisfied() const;

        void finishCompleted();
        void finishFailed();
        void finishCancelled();

        void invokeHook(const char* hookName, const std::function<void()>& hook);

        std::shared_ptr<const WorkflowDefinition> _definition;
        std::shared_ptr<ExecutionRecord> _record;
        WorkflowRegistryConfig _config;
        ExecutionOptions _options;

        Graph::DependencyGraph _graph;
        std::vector<std::vector<std::string>> _ancestorIds;

        WorkflowEventEmitter _emitter;
        StepStateManager _stateManager;
        StepExecutor _executor;

        std::vector<StepProgress> _progress;
        std::map<uint64_t, std::unique_ptr<StepAttempt>> _inFlight;

        std::optional<Failure> _failure;
        bool _cancelling = false;
        bool _ran = false;
    };

} // namespace Workflow
} // namespace Core
} // namespace MaestroEngine
