/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

/**
 * @file ExecutionHistory.h
 * @brief Bounded store of finished executions
 */

#pragma once

#include "WorkflowTypes.h"
#include <deque>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace MaestroEngine {
namespace Core {
namespace Workflow {

    /**
     * @brief FIFO of terminal executions with oldest-first eviction
     *
     * Entries are kept in the order they were recorded. Once capacity is
     * reached, recording a new entry evicts the oldest one.
     *
     * @code
     * ExecutionHistory history(100);
     * history.record(finished);
     *
     * HistoryFilter filter;
     * filter.workflowId = "deploy";
     * filter.status = ExecutionStatus::Failed;
     * filter.limit = 10;
     * auto recentFailures = history.query(filter);
     * @endcode
     */
    class ExecutionHistory {
    public:
        /// @throws std::invalid_argument if @p capacity is 0
        explicit ExecutionHistory(size_t capacity = 1000);

        void record(WorkflowExecution execution);

        std::optional<WorkflowExecution> find(std::string_view executionId) const;

        /// Filter, sort by startedAt, then apply offset and limit
        std::vector<WorkflowExecution> query(const HistoryFilter& filter = {}) const;

        size_t size() const;
        size_t capacity() const { return _capacity; }

        /// Entries evicted since construction or the last clear()
        size_t evictedCount() const;

        void clear();

    private:
        static bool matches(const WorkflowExecution& execution, const HistoryFilter& filter);

        mutable std::mutex _mutex;
        std::deque<WorkflowExecution> _entries;
        size_t _capacity;
        size_t _evicted = 0;
    };

} // namespace Workflow
} // namespace Core
} // namespace MaestroEngine
