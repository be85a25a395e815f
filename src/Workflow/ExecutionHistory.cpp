/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

#include "ExecutionHistory.h"
#include "../Debug/Profiling.h"
#include "../Logging/Logger.h"
#include <algorithm>
#include <stdexcept>

namespace MaestroEngine {
namespace Core {
namespace Workflow {

ExecutionHistory::ExecutionHistory(size_t capacity)
    : _capacity(capacity) {
    if (_capacity == 0) {
        throw std::invalid_argument("ExecutionHistory capacity must be greater than zero");
    }
}

void ExecutionHistory::record(WorkflowExecution execution) {
    std::lock_guard<std::mutex> lock(_mutex);
    while (_entries.size() >= _capacity) {
        MAESTRO_LOG_TRACE_CAT("ExecutionHistory", "Evicting execution {}", _entries.front().id);
        _entries.pop_front();
        ++_evicted;
    }
    _entries.push_back(std::move(execution));
}

std::optional<WorkflowExecution> ExecutionHistory::find(std::string_view executionId) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = std::find_if(_entries.begin(), _entries.end(), [executionId](const WorkflowExecution& entry) {
        return entry.id == executionId;
    });
    if (it == _entries.end()) {
        return std::nullopt;
    }
    return *it;
}

bool ExecutionHistory::matches(const WorkflowExecution& execution, const HistoryFilter& filter) {
    if (filter.workflowId && execution.workflowId != *filter.workflowId) return false;
    if (filter.status && execution.status != *filter.status) return false;
    if (filter.startedAfter && execution.startedAt < *filter.startedAfter) return false;
    if (filter.startedBefore && execution.startedAt > *filter.startedBefore) return false;
    return true;
}

std::vector<WorkflowExecution> ExecutionHistory::query(const HistoryFilter& filter) const {
    MAESTRO_PROFILE_ZONE_NC("ExecutionHistory::query", Debug::ProfileColors::History);

    std::vector<WorkflowExecution> result;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        for (const auto& entry : _entries) {
            if (matches(entry, filter)) {
                result.push_back(entry);
            }
        }
    }

    // Stable so executions started in the same tick keep recording order
    std::stable_sort(result.begin(), result.end(), [&filter](const WorkflowExecution& a, const WorkflowExecution& b) {
        return filter.sortOrder == SortOrder::NewestFirst ? a.startedAt > b.startedAt
                                                          : a.startedAt < b.startedAt;
    });

    if (filter.offset >= result.size()) {
        return {};
    }
    auto first = result.begin() + static_cast<std::ptrdiff_t>(filter.offset);
    auto last = result.end();
    if (filter.limit && *filter.limit < static_cast<size_t>(last - first)) {
        last = first + static_cast<std::ptrdiff_t>(*filter.limit);
    }
    return std::vector<WorkflowExecution>(std::make_move_iterator(first), std::make_move_iterator(last));
}

size_t ExecutionHistory::size() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _entries.size();
}

size_t ExecutionHistory::evictedCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _evicted;
}

void ExecutionHistory::clear() {
    std::lock_guard<std::mutex> lock(_mutex);
    _entries.clear();
    _evicted = 0;
}

} // namespace Workflow
} // namespace Core
} // namespace MaestroEngine
