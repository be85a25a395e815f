/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

/**
 * @file RollbackCoordinator.h
 * @brief Compensating sweep over the succeeded steps of a failed execution
 */

#pragma once

#include "StepStateManager.h"
#include "../Graph/DependencyGraph.h"
#include <string>
#include <vector>

namespace MaestroEngine {
namespace Core {
namespace Workflow {

    struct RollbackSummary {
        /// Succeeded steps that had a rollback handler
        size_t candidates = 0;
        size_t rolledBack = 0;
        size_t failures = 0;

        /// Step ids in the order their rollback handlers were invoked
        std::vector<std::string> order;
    };

    /**
     * @brief Runs rollback handlers newest-first
     *
     * Walks the execution's completion order backwards and invokes the
     * rollback handler of every step that is still Succeeded. Handlers run
     * synchronously on the calling thread with a stop token that is never
     * signalled. A handler that throws is logged at Error level, recorded on
     * its step, and the sweep moves on to the next step.
     *
     * Steps without a rollback handler are skipped and stay Succeeded.
     */
    class RollbackCoordinator {
    public:
        RollbackCoordinator(const WorkflowDefinition& definition,
                            const Graph::DependencyGraph& graph,
                            ExecutionRecord& record,
                            StepStateManager& stateManager,
                            const WorkflowEventEmitter& emitter)
            : _definition(definition)
            , _graph(graph)
            , _record(record)
            , _stateManager(stateManager)
            , _emitter(emitter) {}

        RollbackSummary run();

    private:
        StepContext makeContext(uint32_t stepIndex, const StepResult& result) const;

        const WorkflowDefinition& _definition;
        const Graph::DependencyGraph& _graph;
        ExecutionRecord& _record;
        StepStateManager& _stateManager;
        const WorkflowEventEmitter& _emitter;
    };

} // namespace Workflow
} // namespace Core
} // namespace MaestroEngine
