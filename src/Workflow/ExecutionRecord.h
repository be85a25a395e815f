/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

/**
 * @file ExecutionRecord.h
 * @brief Live, lock-guarded state of one running execution
 */

#pragma once

#include "WorkflowTypes.h"
#include "StepExecutor.h"
#include <atomic>
#include <memory>
#include <mutex>

namespace MaestroEngine {
namespace Core {
namespace Workflow {

    /**
     * @brief Shared between the registry (queries, cancel) and the scheduler
     *
     * The scheduler is the only writer of execution. Readers take a snapshot()
     * under the mutex and never hold references into it.
     */
    struct ExecutionRecord {
        mutable std::mutex mutex;
        WorkflowExecution execution;

        std::atomic<bool> cancelRequested{false};
        std::shared_ptr<CompletionQueue> completions = std::make_shared<CompletionQueue>();
        std::shared_ptr<ExecutionState> state = std::make_shared<ExecutionState>();

        WorkflowExecution snapshot() const {
            std::lock_guard<std::mutex> lock(mutex);
            return execution;
        }

        /**
         * @brief Flag the execution for cancellation and wake its scheduler
         *
         * @return false if the execution is already terminal or already cancelling
         */
        bool requestCancel() {
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (execution.isTerminal() || execution.cancelRequested) {
                    return false;
                }
                execution.cancelRequested = true;
            }
            cancelRequested.store(true, std::memory_order_release);
            completions->wake();
            return true;
        }
    };

} // namespace Workflow
} // namespace Core
} // namespace MaestroEngine
