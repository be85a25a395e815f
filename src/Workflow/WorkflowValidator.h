/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

/**
 * @file WorkflowValidator.h
 * @brief Static checks run on a definition before it is registered
 */

#pragma once

#include "WorkflowTypes.h"
#include "../Graph/DependencyGraph.h"
#include <string>
#include <vector>

namespace MaestroEngine {
namespace Core {
namespace Workflow {

    /// Outcome of WorkflowValidator::check()
    struct ValidationReport {
        std::vector<std::string> problems;

        /// Step ids along the first cycle found, first id repeated at the end
        std::vector<std::string> cycle;

        bool valid() const { return problems.empty(); }
    };

    /**
     * @brief Checks identity fields, step ids, handlers, references and cycles
     *
     * All checks run and all problems are collected, so a caller fixing a
     * definition sees every issue at once. Cycle detection runs on the edges
     * that resolve to a known step.
     *
     * @code
     * WorkflowDefinition def{.id = "loop", .name = "Loop", .version = "1.0"};
     * def.steps = {makeStep("A", {"B"}), makeStep("B", {"A"})};
     *
     * auto report = WorkflowValidator::check(def);
     * // report.cycle == {"A", "B", "A"}
     * // report.problems.back() == "dependency cycle: A -> B -> A"
     * @endcode
     */
    class WorkflowValidator {
    public:
        static ValidationReport check(const WorkflowDefinition& definition);

        /// @throws ValidationError listing every problem check() found
        static void validate(const WorkflowDefinition& definition);

        /**
         * @brief Dependency graph over step positions
         *
         * Node i is definition.steps[i]; an edge runs from each dependency to
         * its dependent. Unknown dependency ids are skipped, so call this on
         * validated definitions.
         */
        static Graph::DependencyGraph buildGraph(const WorkflowDefinition& definition);
    };

} // namespace Workflow
} // namespace Core
} // namespace MaestroEngine
