/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

/**
 * @file WorkflowTypes.h
 * @brief Definitions, execution records, statuses and configuration for workflows
 *
 * Everything the registry, the scheduler and callers exchange lives here so
 * the other Workflow headers can include it without pulling in each other.
 */

#pragma once

#include <any>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace MaestroEngine {
namespace Core {
namespace Workflow {

    class IWorkflowEventSink;
    struct WorkflowExecution;

    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    /// Step inputs and outputs are type-erased; handlers any_cast to what they expect
    using StepValue = std::any;

    /// Outputs of succeeded steps keyed by step id (transparent lookup by string_view)
    using StepOutputs = std::map<std::string, StepValue, std::less<>>;

    using Metadata = std::map<std::string, std::string, std::less<>>;

    /**
     * @brief Lifecycle of one execution
     *
     * Pending → Running → Completed | Failed | Cancelled. The last three are
     * terminal.
     */
    enum class ExecutionStatus : uint8_t {
        Pending = 0,    ///< Created, scheduler not yet started
        Running = 1,    ///< Steps are being scheduled
        Completed = 2,  ///< Every step succeeded, was skipped, or failed but was optional
        Failed = 3,     ///< A step failed; succeeded steps were rolled back
        Cancelled = 4   ///< cancel() was called; in-flight steps settled, nothing else ran
    };

    /**
     * @brief Lifecycle of one step within an execution
     *
     * Valid transitions:
     * - Pending → Running (attempt launched)
     * - Pending → Failed (a retry was pending when the execution stopped, or the condition threw)
     * - Pending → Skipped (the step's condition returned false)
     * - Running → Succeeded | Failed
     * - Running → Pending (attempt failed, retry scheduled)
     * - Succeeded → RolledBack (compensation ran without error)
     */
    enum class StepStatus : uint8_t {
        Pending = 0,
        Running = 1,
        Succeeded = 2,
        Failed = 3,
        RolledBack = 4,
        Skipped = 5
    };

    inline constexpr bool isTerminalStatus(ExecutionStatus status) {
        return status == ExecutionStatus::Completed ||
               status == ExecutionStatus::Failed ||
               status == ExecutionStatus::Cancelled;
    }

    inline constexpr bool isValidTransition(ExecutionStatus from, ExecutionStatus to) {
        switch (from) {
            case ExecutionStatus::Pending:
                return to == ExecutionStatus::Running || to == ExecutionStatus::Cancelled;
            case ExecutionStatus::Running:
                return isTerminalStatus(to);
            default:
                return false;
        }
    }

    inline constexpr bool isValidTransition(StepStatus from, StepStatus to) {
        switch (from) {
            case StepStatus::Pending:
                return to == StepStatus::Running || to == StepStatus::Failed || to == StepStatus::Skipped;
            case StepStatus::Running:
                return to == StepStatus::Succeeded || to == StepStatus::Failed || to == StepStatus::Pending;
            case StepStatus::Succeeded:
                return to == StepStatus::RolledBack;
            default:
                return false;
        }
    }

    inline constexpr const char* executionStatusToString(ExecutionStatus status) {
        switch (status) {
            case ExecutionStatus::Pending:   return "pending";
            case ExecutionStatus::Running:   return "running";
            case ExecutionStatus::Completed: return "completed";
            case ExecutionStatus::Failed:    return "failed";
            case ExecutionStatus::Cancelled: return "cancelled";
        }
        return "unknown";
    }

    inline constexpr const char* stepStatusToString(StepStatus status) {
        switch (status) {
            case StepStatus::Pending:    return "pending";
            case StepStatus::Running:    return "running";
            case StepStatus::Succeeded:  return "succeeded";
            case StepStatus::Failed:     return "failed";
            case StepStatus::RolledBack: return "rolled_back";
            case StepStatus::Skipped:    return "skipped";
        }
        return "unknown";
    }

    /**
     * @brief Thread-safe key/value store shared by every step of one execution
     *
     * Steps that need to coordinate outside the dependency outputs (counters,
     * handles, accumulated reports) use this instead of captured globals.
     *
     * @code
     * step.handler = [](const StepValue&, const StepContext& ctx) -> StepValue {
     *     ctx.state->set("artifact", std::string("build-42.tar.gz"));
     *     return {};
     * };
     * // later step
     * auto artifact = ctx.state->getAs<std::string>("artifact");
     * @endcode
     */
    class ExecutionState {
    public:
        ExecutionState() = default;
        explicit ExecutionState(std::map<std::string, StepValue, std::less<>> initial)
            : _values(std::move(initial)) {}

        void set(std::string key, StepValue value) {
            std::lock_guard<std::mutex> lock(_mutex);
            _values[std::move(key)] = std::move(value);
        }

        std::optional<StepValue> get(std::string_view key) const {
            std::lock_guard<std::mutex> lock(_mutex);
            auto it = _values.find(key);
            if (it == _values.end()) return std::nullopt;
            return it->second;
        }

        /// @return The value if present and holding a T, otherwise nullopt
        template<typename T>
        std::optional<T> getAs(std::string_view key) const {
            std::lock_guard<std::mutex> lock(_mutex);
            auto it = _values.find(key);
            if (it == _values.end()) return std::nullopt;
            if (const T* value = std::any_cast<T>(&it->second)) {
                return *value;
            }
            return std::nullopt;
        }

        bool contains(std::string_view key) const {
            std::lock_guard<std::mutex> lock(_mutex);
            return _values.find(key) != _values.end();
        }

        bool erase(std::string_view key) {
            std::lock_guard<std::mutex> lock(_mutex);
            auto it = _values.find(key);
            if (it == _values.end()) return false;
            _values.erase(it);
            return true;
        }

        std::vector<std::string> keys() const {
            std::lock_guard<std::mutex> lock(_mutex);
            std::vector<std::string> result;
            result.reserve(_values.size());
            for (const auto& [key, value] : _values) {
                result.push_back(key);
            }
            return result;
        }

    private:
        mutable std::mutex _mutex;
        std::map<std::string, StepValue, std::less<>> _values;
    };

    /**
     * @brief Everything a step handler can see about its invocation
     *
     * previousResults holds the outputs of the step's transitive dependencies
     * that succeeded; skipped and optional failed ones contribute nothing.
     * stopToken is signalled when the execution is cancelled, when another
     * step fails, or when this attempt times out. Long-running handlers
     * should poll it and return early.
     */
    struct StepContext {
        std::string workflowId;
        std::string executionId;
        std::string stepId;
        uint32_t attempt = 1;
        StepOutputs previousResults;
        std::stop_token stopToken;
        std::shared_ptr<ExecutionState> state;
        Metadata metadata;

        bool stopRequested() const { return stopToken.stop_requested(); }

        /// Typed access to a dependency's output; nullptr if absent or of another type
        template<typename T>
        const T* previousResult(std::string_view stepId) const {
            auto it = previousResults.find(stepId);
            if (it == previousResults.end()) return nullptr;
            return std::any_cast<T>(&it->second);
        }
    };

    using StepHandler = std::function<StepValue(const StepValue& input, const StepContext& context)>;
    using RollbackHandler = std::function<void(const StepValue& output, const StepContext& context)>;
    using InputTransform = std::function<StepValue(const StepValue& workflowInput, const StepOutputs& previousResults)>;
    using OutputTransform = std::function<StepValue(const StepOutputs& stepOutputs)>;
    using StepCondition = std::function<bool(const StepContext& context)>;

    /**
     * @brief One unit of work in a workflow
     *
     * Only id and handler are required. Unset timeout and retry fields fall
     * back to the registry configuration.
     */
    struct WorkflowStep {
        std::string id;
        std::string name;
        std::string description;

        /// Ids of steps that must succeed before this one starts
        std::vector<std::string> dependencies;

        StepHandler handler;

        /// Compensating action, run if a later step fails after this one succeeded
        RollbackHandler rollback;

        /// Builds the handler input; by default the handler receives the workflow input
        InputTransform transformInput;

        std::optional<std::chrono::milliseconds> timeout;
        std::optional<uint32_t> maxRetries;
        std::optional<std::chrono::milliseconds> retryDelay;

        /**
         * @brief Evaluated on the scheduler thread once the dependencies are satisfied
         *
         * Returning false marks the step Skipped without running it; dependents
         * still run. A condition that throws fails the step without retries.
         */
        StepCondition condition;

        /// A final failure is recorded but neither stops the workflow nor blocks dependents
        bool optional = false;

        const std::string& displayName() const { return name.empty() ? id : name; }
    };

    /**
     * @brief A registered workflow
     *
     * Immutable once registered; the registry hands out
     * shared_ptr<const WorkflowDefinition>. Hooks run on the scheduler thread
     * and any std::exception they throw is logged and ignored.
     */
    struct WorkflowDefinition {
        std::string id;
        std::string name;
        std::string version;
        std::string description;
        std::vector<std::string> tags;
        std::vector<WorkflowStep> steps;
        Metadata metadata;

        std::function<void(const WorkflowExecution&)> onStart;
        std::function<void(const WorkflowExecution&)> onComplete;
        std::function<void(const std::exception_ptr&, const WorkflowExecution&)> onError;

        /// Produces WorkflowExecution::output; defaults to the last completed step's output
        OutputTransform transformOutput;

        /// Run the rollback handlers of succeeded steps when the execution fails
        bool enableRollback = true;

        const WorkflowStep* findStep(std::string_view stepId) const {
            for (const auto& step : steps) {
                if (step.id == stepId) return &step;
            }
            return nullptr;
        }
    };

    struct StepResult {
        std::string stepId;
        StepStatus status = StepStatus::Pending;

        /// Set once the step has succeeded
        StepValue output;

        std::optional<std::string> error;
        std::exception_ptr cause;
        bool timedOut = false;

        /// Number of attempts launched so far
        uint32_t attempts = 0;

        /// Message of a compensating action that threw; the step stays Succeeded
        std::optional<std::string> rollbackError;

        /// Dependents proceeded without this step's output (condition false, or optional failure)
        bool skipped = false;
        std::optional<std::string> skipReason;

        std::optional<TimePoint> startedAt;
        std::optional<TimePoint> completedAt;

        std::optional<std::chrono::milliseconds> duration() const {
            if (!startedAt || !completedAt) return std::nullopt;
            return std::chrono::duration_cast<std::chrono::milliseconds>(*completedAt - *startedAt);
        }
    };

    /// Terminal error of an execution, taken from the step that failed first
    struct ExecutionError {
        std::string message;
        std::optional<std::string> stepId;
        std::exception_ptr cause;
    };

    struct WorkflowExecution {
        std::string id;
        std::string workflowId;
        std::string workflowVersion;
        ExecutionStatus status = ExecutionStatus::Pending;

        std::map<std::string, StepResult, std::less<>> stepResults;

        /// Step ids in the order they succeeded; rollback walks this backwards
        std::vector<std::string> completionOrder;

        StepValue input;
        StepValue output;
        Metadata metadata;

        TimePoint startedAt{};
        std::optional<TimePoint> completedAt;
        std::optional<ExecutionError> error;
        bool cancelRequested = false;

        bool isTerminal() const { return isTerminalStatus(status); }

        const StepResult* findStep(std::string_view stepId) const {
            auto it = stepResults.find(stepId);
            return it == stepResults.end() ? nullptr : &it->second;
        }

        size_t countSteps(StepStatus stepStatus) const {
            size_t count = 0;
            for (const auto& [id, result] : stepResults) {
                if (result.status == stepStatus) ++count;
            }
            return count;
        }

        /// Fraction of steps that have settled (succeeded, failed, skipped or rolled back), 0..1
        double progress() const {
            if (stepResults.empty()) return 1.0;
            size_t settled = stepResults.size()
                - countSteps(StepStatus::Pending)
                - countSteps(StepStatus::Running);
            return static_cast<double>(settled) / static_cast<double>(stepResults.size());
        }

        std::optional<std::chrono::milliseconds> duration() const {
            if (!completedAt) return std::nullopt;
            return std::chrono::duration_cast<std::chrono::milliseconds>(*completedAt - startedAt);
        }
    };

    struct ExecutionStats {
        size_t totalSteps = 0;
        size_t succeededSteps = 0;
        size_t failedSteps = 0;
        size_t rolledBackSteps = 0;
        size_t pendingSteps = 0;

        /// Steps whose condition returned false
        size_t skippedSteps = 0;

        /// Attempts beyond the first, summed over all steps
        uint32_t retries = 0;

        std::chrono::milliseconds duration{0};
    };

    /// What execute() resolves with, for every outcome including failure
    struct WorkflowResult {
        WorkflowExecution execution;
        bool success = false;
        ExecutionStats stats;

        const std::string& executionId() const { return execution.id; }
        ExecutionStatus status() const { return execution.status; }
    };

    /// Per-call overrides for execute()
    struct ExecutionOptions {
        /// Replaces every step's timeout for this execution
        std::optional<std::chrono::milliseconds> timeout;

        Metadata metadata;

        /// Seed values for the execution's shared ExecutionState
        std::map<std::string, StepValue, std::less<>> sharedState;
    };

    enum class SortOrder : uint8_t {
        NewestFirst = 0,
        OldestFirst = 1
    };

    struct HistoryFilter {
        std::optional<std::string> workflowId;
        std::optional<ExecutionStatus> status;

        /// Inclusive bounds on WorkflowExecution::startedAt
        std::optional<TimePoint> startedAfter;
        std::optional<TimePoint> startedBefore;

        SortOrder sortOrder = SortOrder::NewestFirst;
        size_t offset = 0;
        std::optional<size_t> limit;
    };

    struct WorkflowListFilter {
        /// Match workflows carrying any of these tags
        std::vector<std::string> tags;

        /// ECMAScript regex searched for in the version string (anchor with ^ and $ for an exact match)
        std::optional<std::string> versionPattern;

        /// Case-insensitive ECMAScript regex searched for in the name
        std::optional<std::string> namePattern;

        size_t offset = 0;
        std::optional<size_t> limit;
    };

    /**
     * @brief Registry-wide settings
     *
     * @code
     * WorkflowRegistryConfig config;
     * config.defaultStepTimeout = std::chrono::seconds(5);
     * config.defaultMaxRetries = 2;
     * config.eventSink = std::make_shared<EventBusSink>(bus);
     * WorkflowRegistry registry(config);
     * @endcode
     */
    struct WorkflowRegistryConfig {
        /// Executions allowed to run at once; further execute() calls throw CapacityError
        size_t maxConcurrentExecutions = 10;

        /// Timeout for steps that do not set their own
        std::chrono::milliseconds defaultStepTimeout{30000};

        /// Retries after the first failed attempt, for steps that do not set their own
        uint32_t defaultMaxRetries = 0;

        /// Base delay before the first retry; doubles for each further retry
        std::chrono::milliseconds defaultRetryDelay{1000};

        /// Terminal executions kept in history; the oldest are evicted first
        size_t maxHistoryEntries = 1000;

        /// Record terminal executions in the history store at all
        bool persistHistory = true;

        /// Verbose per-step scheduling traces at Debug level
        bool enableDebugLogging = false;

        /// Receives lifecycle events; may be null
        std::shared_ptr<IWorkflowEventSink> eventSink;
    };

} // namespace Workflow
} // namespace Core
} // namespace MaestroEngine
