/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

#include "WorkflowRegistry.h"
#include "WorkflowScheduler.h"
#include "WorkflowValidator.h"
#include "../Core/Errors.h"
#include "../Debug/Profiling.h"
#include "../Logging/Logger.h"
#include <algorithm>
#include <format>
#include <mutex>
#include <random>
#include <regex>
#include <stdexcept>
#include <system_error>

namespace MaestroEngine {
namespace Core {
namespace Workflow {

namespace {

    std::string toBase36(uint64_t value) {
        static constexpr char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
        if (value == 0) return "0";
        std::string result;
        while (value > 0) {
            result.push_back(digits[value % 36]);
            value /= 36;
        }
        std::reverse(result.begin(), result.end());
        return result;
    }

    size_t validatedHistoryCapacity(const WorkflowRegistryConfig& config) {
        if (config.maxConcurrentExecutions == 0) {
            throw std::invalid_argument("maxConcurrentExecutions must be greater than zero");
        }
        if (config.maxHistoryEntries == 0) {
            throw std::invalid_argument("maxHistoryEntries must be greater than zero");
        }
        return config.maxHistoryEntries;
    }

} // namespace

WorkflowRegistry::WorkflowRegistry()
    : WorkflowRegistry(WorkflowRegistryConfig{}) {
}

WorkflowRegistry::WorkflowRegistry(WorkflowRegistryConfig config)
    : Debug::Named("WorkflowRegistry")
    , _config(std::move(config))
    , _history(validatedHistoryCapacity(_config)) {
}

WorkflowRegistry::~WorkflowRegistry() {
    size_t cancelled = cancelAll();
    if (cancelled > 0) {
        MAESTRO_LOG_INFO_CAT("WorkflowRegistry", "{} shutting down, waiting for {} execution(s)",
                             getName(), cancelled);
    }

    std::unique_lock<std::shared_mutex> lock(_mutex);
    _idle.wait(lock, [this]() { return _active.empty(); });
}

void WorkflowRegistry::registerWorkflow(WorkflowDefinition definition) {
    MAESTRO_PROFILE_ZONE();
    WorkflowValidator::validate(definition);

    auto stored = std::make_shared<const WorkflowDefinition>(std::move(definition));
    {
        std::unique_lock<std::shared_mutex> lock(_mutex);
        if (_workflows.find(stored->id) != _workflows.end()) {
            throw ValidationError(stored->id, {std::format("workflow '{}' is already registered", stored->id)});
        }
        _workflows.emplace(stored->id, stored);
    }

    MAESTRO_LOG_INFO_CAT("WorkflowRegistry", "Registered workflow '{}' v{} ({} steps)",
                         stored->id, stored->version, stored->steps.size());
}

bool WorkflowRegistry::unregisterWorkflow(std::string_view workflowId) {
    std::unique_lock<std::shared_mutex> lock(_mutex);
    auto it = _workflows.find(workflowId);
    if (it == _workflows.end()) {
        return false;
    }
    _workflows.erase(it);
    return true;
}

std::shared_ptr<const WorkflowDefinition> WorkflowRegistry::get(std::string_view workflowId) const {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    auto it = _workflows.find(workflowId);
    return it == _workflows.end() ? nullptr : it->second;
}

bool WorkflowRegistry::has(std::string_view workflowId) const {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return _workflows.find(workflowId) != _workflows.end();
}

size_t WorkflowRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return _workflows.size();
}

std::vector<std::shared_ptr<const WorkflowDefinition>> WorkflowRegistry::list(const WorkflowListFilter& filter) const {
    std::optional<std::regex> versionPattern;
    std::optional<std::regex> namePattern;
    if (filter.versionPattern) {
        versionPattern.emplace(*filter.versionPattern, std::regex::ECMAScript);
    }
    if (filter.namePattern) {
        namePattern.emplace(*filter.namePattern, std::regex::ECMAScript | std::regex::icase);
    }

    std::vector<std::shared_ptr<const WorkflowDefinition>> matching;
    {
        std::shared_lock<std::shared_mutex> lock(_mutex);
        for (const auto& [id, definition] : _workflows) {
            if (!filter.tags.empty()) {
                bool tagged = std::any_of(definition->tags.begin(), definition->tags.end(), [&filter](const std::string& tag) {
                    return std::find(filter.tags.begin(), filter.tags.end(), tag) != filter.tags.end();
                });
                if (!tagged) continue;
            }
            if (versionPattern && !std::regex_search(definition->version, *versionPattern)) continue;
            if (namePattern && !std::regex_search(definition->name, *namePattern)) continue;
            matching.push_back(definition);
        }
    }

    if (filter.offset >= matching.size()) {
        return {};
    }
    auto first = matching.begin() + static_cast<std::ptrdiff_t>(filter.offset);
    auto last = matching.end();
    if (filter.limit && *filter.limit < static_cast<size_t>(last - first)) {
        last = first + static_cast<std::ptrdiff_t>(*filter.limit);
    }
    return std::vector<std::shared_ptr<const WorkflowDefinition>>(first, last);
}

std::string WorkflowRegistry::generateExecutionId() const {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::uniform_int_distribution<uint64_t> distribution(0, 36ull * 36 * 36 * 36 * 36 * 36 * 36 * 36 - 1);
    auto random = toBase36(distribution(engine));
    random.insert(0, 8 - std::min<size_t>(random.size(), 8), '0');

    return "exec_" + toBase36(static_cast<uint64_t>(millis)) + "_" + random;
}

WorkflowRegistry::Admission WorkflowRegistry::admit(std::string_view workflowId,
                                                    StepValue input,
                                                    const ExecutionOptions& options) {
    std::unique_lock<std::shared_mutex> lock(_mutex);

    auto it = _workflows.find(workflowId);
    if (it == _workflows.end()) {
        throw NotFoundError("Workflow", std::string(workflowId));
    }
    if (_active.size() >= _config.maxConcurrentExecutions) {
        MAESTRO_LOG_WARNING_CAT("WorkflowRegistry", "Rejected execution of '{}': {} executions already running",
                                workflowId, _active.size());
        throw CapacityError(_config.maxConcurrentExecutions);
    }

    std::string executionId;
    do {
        executionId = generateExecutionId();
    } while (_active.find(executionId) != _active.end());

    Admission admission;
    admission.definition = it->second;
    admission.record = WorkflowScheduler::createRecord(*admission.definition, executionId, std::move(input), options);
    _active.emplace(std::move(executionId), admission.record);
    return admission;
}

void WorkflowRegistry::retire(const std::string& executionId) {
    std::unique_lock<std::shared_mutex> lock(_mutex);
    _active.erase(executionId);
    // Notify under the lock: once it is released the destructor may finish
    _idle.notify_all();
}

WorkflowResult WorkflowRegistry::runAdmitted(const Admission& admission, const ExecutionOptions& options) {
    // Leaves the active set even if the scheduler throws
    struct Retirement {
        WorkflowRegistry& registry;
        std::string executionId;
        ~Retirement() { registry.retire(executionId); }
    } retirement{*this, admission.record->execution.id};

    WorkflowResult result;
    {
        WorkflowScheduler scheduler(admission.definition, admission.record, _config, options);
        result.execution = scheduler.run();
    }
    result.success = result.execution.status == ExecutionStatus::Completed;
    result.stats = computeStats(result.execution);

    if (_config.persistHistory) {
        _history.record(result.execution);
    }
    return result;
}

WorkflowResult WorkflowRegistry::execute(std::string_view workflowId,
                                         StepValue input,
                                         const ExecutionOptions& options) {
    auto admission = admit(workflowId, std::move(input), options);
    return runAdmitted(admission, options);
}

PendingExecution WorkflowRegistry::executeAsync(std::string_view workflowId,
                                                StepValue input,
                                                const ExecutionOptions& options) {
    auto admission = admit(workflowId, std::move(input), options);

    PendingExecution pending;
    pending.executionId = admission.record->execution.id;
    try {
        pending.result = std::async(std::launch::async, [this, admission, options]() {
            return runAdmitted(admission, options);
        }).share();
    } catch (const std::system_error& e) {
        // No thread could be started, so the admission must be undone here
        MAESTRO_LOG_ERROR_CAT("WorkflowRegistry", "Could not start execution {}: {}", pending.executionId, e.what());
        retire(pending.executionId);
        throw;
    }
    return pending;
}

bool WorkflowRegistry::cancel(std::string_view executionId) {
    std::shared_ptr<ExecutionRecord> record;
    {
        std::shared_lock<std::shared_mutex> lock(_mutex);
        auto it = _active.find(executionId);
        if (it == _active.end()) {
            return false;
        }
        record = it->second;
    }

    bool cancelled = record->requestCancel();
    if (cancelled) {
        MAESTRO_LOG_INFO_CAT("WorkflowRegistry", "Cancellation requested for execution {}", executionId);
    }
    return cancelled;
}

size_t WorkflowRegistry::cancelAll() {
    std::vector<std::shared_ptr<ExecutionRecord>> records;
    {
        std::shared_lock<std::shared_mutex> lock(_mutex);
        for (const auto& [id, record] : _active) {
            records.push_back(record);
        }
    }

    size_t cancelled = 0;
    for (const auto& record : records) {
        if (record->requestCancel()) {
            ++cancelled;
        }
    }
    return cancelled;
}

std::optional<WorkflowExecution> WorkflowRegistry::getExecution(std::string_view executionId) const {
    {
        std::shared_lock<std::shared_mutex> lock(_mutex);
        auto it = _active.find(executionId);
        if (it != _active.end()) {
            return it->second->snapshot();
        }
    }
    return _history.find(executionId);
}

std::vector<std::string> WorkflowRegistry::getActiveExecutions() const {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    std::vector<std::string> ids;
    ids.reserve(_active.size());
    for (const auto& [id, record] : _active) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<WorkflowExecution> WorkflowRegistry::getHistory(const HistoryFilter& filter) const {
    return _history.query(filter);
}

void WorkflowRegistry::clear() {
    _history.clear();
}

ExecutionStats WorkflowRegistry::computeStats(const WorkflowExecution& execution) {
    ExecutionStats stats;
    stats.totalSteps = execution.stepResults.size();
    stats.succeededSteps = execution.countSteps(StepStatus::Succeeded);
    stats.failedSteps = execution.countSteps(StepStatus::Failed);
    stats.rolledBackSteps = execution.countSteps(StepStatus::RolledBack);
    stats.skippedSteps = execution.countSteps(StepStatus::Skipped);
    stats.pendingSteps = execution.countSteps(StepStatus::Pending);
    for (const auto& [id, result] : execution.stepResults) {
        if (result.attempts > 1) {
            stats.retries += result.attempts - 1;
        }
    }
    stats.duration = execution.duration().value_or(std::chrono::milliseconds{0});
    return stats;
}

} // namespace Workflow
} // namespace Core
} // namespace MaestroEngine
