/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

/**
 * @file WorkflowRegistry.h
 * @brief Registration, execution and bookkeeping of workflows
 *
 * The registry is the entry point of the workflow subsystem. It validates
 * and stores definitions, admits executions up to the configured limit, runs
 * each one through a WorkflowScheduler, and keeps finished executions in a
 * bounded history.
 */

#pragma once

#include "ExecutionHistory.h"
#include "ExecutionRecord.h"
#include "WorkflowTypes.h"
#include "../Debug/INamed.h"
#include <condition_variable>
#include <future>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace MaestroEngine {
namespace Core {
namespace Workflow {

    /**
     * @brief Handle to an execution started with executeAsync()
     *
     * The id is known immediately, so the caller can cancel() or
     * getExecution() while the execution runs.
     */
    struct PendingExecution {
        std::string executionId;
        std::shared_future<WorkflowResult> result;

        /// Block until the execution is terminal
        const WorkflowResult& get() const { return result.get(); }

        bool isReady() const {
            return result.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        }
    };

    /**
     * @brief Thread-safe workflow registry and executor
     *
     * Definitions are immutable once registered. Replacing one means
     * unregistering it first; executions already running keep the definition
     * they started with.
     *
     * @code
     * WorkflowRegistry registry;
     *
     * WorkflowDefinition deploy{.id = "deploy", .name = "Deploy", .version = "1.0.0"};
     * deploy.steps.push_back({.id = "build", .handler = buildHandler});
     * deploy.steps.push_back({.id = "upload", .dependencies = {"build"},
     *                         .handler = uploadHandler, .rollback = deleteUpload});
     * registry.registerWorkflow(std::move(deploy));
     *
     * WorkflowResult result = registry.execute("deploy", std::string("release-7"));
     * if (!result.success) {
     *     std::cerr << result.execution.error->message << "\n";
     * }
     * @endcode
     *
     * Destroying the registry cancels every running execution and waits for
     * each to settle.
     */
    class WorkflowRegistry : public Debug::Named {
    public:
        WorkflowRegistry();

        /// @throws std::invalid_argument if a limit in @p config is zero
        explicit WorkflowRegistry(WorkflowRegistryConfig config);

        ~WorkflowRegistry() override;

        WorkflowRegistry(const WorkflowRegistry&) = delete;
        WorkflowRegistry& operator=(const WorkflowRegistry&) = delete;

        /**
         * @brief Validate and store a definition
         *
         * @throws ValidationError if the definition is invalid or its id is
         *         already registered. Nothing is stored in that case.
         */
        void registerWorkflow(WorkflowDefinition definition);

        /// @return true if a definition with @p workflowId existed
        bool unregisterWorkflow(std::string_view workflowId);

        /// @return The definition, or nullptr if unknown
        std::shared_ptr<const WorkflowDefinition> get(std::string_view workflowId) const;

        bool has(std::string_view workflowId) const;
        size_t size() const;

        /**
         * @brief Registered definitions matching @p filter, ordered by id
         *
         * @throws std::regex_error if a pattern in @p filter is malformed
         */
        std::vector<std::shared_ptr<const WorkflowDefinition>> list(const WorkflowListFilter& filter = {}) const;

        /**
         * @brief Run a workflow on the calling thread until it is terminal
         *
         * Step failures do not throw; they produce a failed result.
         *
         * @throws NotFoundError if @p workflowId is not registered
         * @throws CapacityError if maxConcurrentExecutions are already running
         */
        WorkflowResult execute(std::string_view workflowId,
                               StepValue input = {},
                               const ExecutionOptions& options = {});

        /**
         * @brief Start a workflow on a background thread
         *
         * Admission happens before this returns, so NotFoundError and
         * CapacityError are thrown here rather than through the future.
         */
        [[nodiscard]] PendingExecution executeAsync(std::string_view workflowId,
                                                    StepValue input = {},
                                                    const ExecutionOptions& options = {});

        /**
         * @brief Request cancellation of a running execution
         *
         * In-flight steps are signalled through their stop token and may
         * finish. Nothing else is scheduled and no rollback runs.
         *
         * @return false for unknown, terminal or already-cancelling executions
         */
        bool cancel(std::string_view executionId);

        /// Cancel every running execution; returns how many were signalled
        size_t cancelAll();

        /// Snapshot of a running or recorded execution
        std::optional<WorkflowExecution> getExecution(std::string_view executionId) const;

        /// Ids of executions that have not reached a terminal status, ordered by id
        std::vector<std::string> getActiveExecutions() const;

        std::vector<WorkflowExecution> getHistory(const HistoryFilter& filter = {}) const;

        /// Drop recorded history; running executions are untouched
        void clear();

        const WorkflowRegistryConfig& getConfig() const { return _config; }

        static ExecutionStats computeStats(const WorkflowExecution& execution);

    private:
        struct Admission {
            std::shared_ptr<const WorkflowDefinition> definition;
            std::shared_ptr<ExecutionRecord> record;
        };

        Admission admit(std::string_view workflowId, StepValue input, const ExecutionOptions& options);
        WorkflowResult runAdmitted(const Admission& admission, const ExecutionOptions& options);
        void retire(const std::string& executionId);
        std::string generateExecutionId() const;

        WorkflowRegistryConfig _config;

        mutable std::shared_mutex _mutex;
        std::condition_variable_any _idle;
        std::map<std::string, std::shared_ptr<const WorkflowDefinition>, std::less<>> _workflows;
        std::map<std::string, std::shared_ptr<ExecutionRecord>, std::less<>> _active;

        ExecutionHistory _history;
    };

} // namespace Workflow
} // namespace Core
} // namespace MaestroEngine
