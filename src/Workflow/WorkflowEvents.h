/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

/**
 * @file WorkflowEvents.h
 * @brief Lifecycle events emitted while a workflow executes
 *
 * Every event shares a common envelope (execution, workflow, optional step,
 * timestamp, optional error) and carries a payload struct specific to its
 * kind. The kind is derived from which payload alternative is held, so the
 * two can never disagree.
 */

#pragma once

#include "WorkflowTypes.h"
#include <string_view>
#include <variant>

namespace MaestroEngine {
namespace Core {
namespace Workflow {

    /// Closed set of lifecycle events. Order matches WorkflowEventPayload.
    enum class WorkflowEventKind : uint8_t {
        WorkflowStarted = 0,
        StepStarted,
        StepCompleted,
        StepFailed,
        StepRetrying,
        StepSkipped,
        StepRolledBack,
        RollbackStarted,
        RollbackCompleted,
        WorkflowCompleted,
        WorkflowFailed,
        WorkflowCancelled
    };

    /// Wire name of an event kind, e.g. "step:completed"
    inline constexpr std::string_view workflowEventKindToString(WorkflowEventKind kind) {
        switch (kind) {
            case WorkflowEventKind::WorkflowStarted:   return "workflow:started";
            case WorkflowEventKind::StepStarted:       return "step:started";
            case WorkflowEventKind::StepCompleted:     return "step:completed";
            case WorkflowEventKind::StepFailed:        return "step:failed";
            case WorkflowEventKind::StepRetrying:      return "step:retrying";
            case WorkflowEventKind::StepSkipped:       return "step:skipped";
            case WorkflowEventKind::StepRolledBack:    return "step:rolled_back";
            case WorkflowEventKind::RollbackStarted:   return "rollback:started";
            case WorkflowEventKind::RollbackCompleted: return "rollback:completed";
            case WorkflowEventKind::WorkflowCompleted: return "workflow:completed";
            case WorkflowEventKind::WorkflowFailed:    return "workflow:failed";
            case WorkflowEventKind::WorkflowCancelled: return "workflow:cancelled";
        }
        return "unknown";
    }

    namespace Events {

        struct WorkflowStarted {
            size_t stepCount = 0;
        };

        struct StepStarted {
            uint32_t attempt = 1;
        };

        struct StepCompleted {
            uint32_t attempt = 1;
            std::chrono::milliseconds duration{0};
        };

        /// Final failure of a step; intermediate failures are StepRetrying
        struct StepFailed {
            uint32_t attempts = 1;
            bool timedOut = false;
        };

        struct StepRetrying {
            uint32_t nextAttempt = 2;
            std::chrono::milliseconds delay{0};
        };

        /// The step's condition returned false; it never ran
        struct StepSkipped {
            std::string reason;
        };

        /// Emitted once per step whose compensating action ran
        struct StepRolledBack {
            bool succeeded = true;
        };

        struct RollbackStarted {
            size_t candidateSteps = 0;
        };

        struct RollbackCompleted {
            size_t rolledBack = 0;
            size_t failures = 0;
        };

        struct WorkflowCompleted {
            std::chrono::milliseconds duration{0};
        };

        struct WorkflowFailed {
            std::chrono::milliseconds duration{0};
            std::optional<std::string> failedStepId;
        };

        struct WorkflowCancelled {
            std::chrono::milliseconds duration{0};
        };

    } // namespace Events

    using WorkflowEventPayload = std::variant<
        Events::WorkflowStarted,
        Events::StepStarted,
        Events::StepCompleted,
        Events::StepFailed,
        Events::StepRetrying,
        Events::StepSkipped,
        Events::StepRolledBack,
        Events::RollbackStarted,
        Events::RollbackCompleted,
        Events::WorkflowCompleted,
        Events::WorkflowFailed,
        Events::WorkflowCancelled>;

    static_assert(std::variant_size_v<WorkflowEventPayload> ==
                  static_cast<size_t>(WorkflowEventKind::WorkflowCancelled) + 1,
                  "WorkflowEventKind and WorkflowEventPayload must list the same events");

    struct WorkflowEvent {
        WorkflowEventKind kind = WorkflowEventKind::WorkflowStarted;
        std::string executionId;
        std::string workflowId;
        std::optional<std::string> stepId;
        TimePoint timestamp{};
        std::optional<std::string> error;
        WorkflowEventPayload payload;

        std::string_view name() const { return workflowEventKindToString(kind); }

        /// The payload as @p T, or nullptr if this event is of another kind
        template<typename T>
        const T* payloadAs() const { return std::get_if<T>(&payload); }
    };

    /**
     * @brief Build an event whose kind matches its payload
     *
     * @code
     * auto event = makeWorkflowEvent(execId, "deploy", std::string("upload"),
     *                                Events::StepStarted{1});
     * // event.kind == WorkflowEventKind::StepStarted
     * @endcode
     */
    template<typename Payload>
    WorkflowEvent makeWorkflowEvent(std::string executionId,
                                    std::string workflowId,
                                    std::optional<std::string> stepId,
                                    Payload payload,
                                    std::optional<std::string> error = std::nullopt) {
        WorkflowEvent event;
        event.payload = std::move(payload);
        event.kind = static_cast<WorkflowEventKind>(event.payload.index());
        event.executionId = std::move(executionId);
        event.workflowId = std::move(workflowId);
        event.stepId = std::move(stepId);
        event.timestamp = Clock::now();
        event.error = std::move(error);
        return event;
    }

} // namespace Workflow
} // namespace Core
} // namespace MaestroEngine
