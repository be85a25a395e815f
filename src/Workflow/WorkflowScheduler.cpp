/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

#include "WorkflowScheduler.h"
#include "WorkflowValidator.h"
#include "../Core/Errors.h"
#include "../Debug/Profiling.h"
#include "../Logging/Logger.h"
#include <algorithm>
#include <stdexcept>

namespace MaestroEngine {
namespace Core {
namespace Workflow {

namespace {

    template<typename T>
    std::shared_ptr<T> requireNonNull(std::shared_ptr<T> pointer, const char* what) {
        if (!pointer) {
            throw std::invalid_argument(std::string("WorkflowScheduler requires ") + what);
        }
        return pointer;
    }

} // namespace

std::shared_ptr<ExecutionRecord> WorkflowScheduler::createRecord(const WorkflowDefinition& definition,
                                                                 std::string executionId,
                                                                 StepValue input,
                                                                 const ExecutionOptions& options) {
    auto record = std::make_shared<ExecutionRecord>();
    auto& execution = record->execution;
    execution.id = std::move(executionId);
    execution.workflowId = definition.id;
    execution.workflowVersion = definition.version;
    execution.status = ExecutionStatus::Pending;
    execution.input = std::move(input);
    execution.metadata = options.metadata;
    execution.startedAt = Clock::now();

    for (const auto& step : definition.steps) {
        StepResult result;
        result.stepId = step.id;
        execution.stepResults.emplace(step.id, std::move(result));
    }

    record->state = std::make_shared<ExecutionState>(options.sharedState);
    return record;
}

WorkflowScheduler::WorkflowScheduler(std::shared_ptr<const WorkflowDefinition> definition,
                                     std::shared_ptr<ExecutionRecord> record,
                                     const WorkflowRegistryConfig& config,
                                     const ExecutionOptions& options)
    : _definition(requireNonNull(std::move(definition), "a workflow definition"))
    , _record(requireNonNull(std::move(record), "an execution record"))
    , _config(config)
    , _options(options)
    , _graph(WorkflowValidator::buildGraph(*_definition))
    , _emitter(config.eventSink)
    , _stateManager(*_record, _emitter)
    , _executor(_definition, _record->completions)
    , _progress(_definition->steps.size()) {
    _ancestorIds.resize(_definition->steps.size());
    for (uint32_t i = 0; i < _definition->steps.size(); ++i) {
        for (uint32_t ancestor : _graph.collectDependencies(i)) {
            _ancestorIds[i].push_back(_definition->steps[ancestor].id);
        }
    }
}

std::chrono::milliseconds WorkflowScheduler::resolveTimeout(const WorkflowStep& step) const {
    if (_options.timeout) return *_options.timeout;
    if (step.timeout) return *step.timeout;
    return _config.defaultStepTimeout;
}

uint32_t WorkflowScheduler::resolveMaxRetries(const WorkflowStep& step) const {
    return step.maxRetries.value_or(_config.defaultMaxRetries);
}

std::chrono::milliseconds WorkflowScheduler::resolveRetryDelay(const WorkflowStep& step, uint32_t failedAttempt) const {
    auto base = step.retryDelay.value_or(_config.defaultRetryDelay);
    uint32_t exponent = std::min<uint32_t>(failedAttempt > 0 ? failedAttempt - 1 : 0, 20);
    return base * (int64_t{1} << exponent);
}

WorkflowExecution WorkflowScheduler::run() {
    MAESTRO_PROFILE_ZONE_NC("WorkflowScheduler::run", Debug::ProfileColors::Scheduler);

    if (_ran) {
        throw std::logic_error("WorkflowScheduler::run() may only be called once");
    }
    _ran = true;

    start();

    while (true) {
        pollCancellation();

        if (!isStopping()) {
            launchReadySteps();
        }

        if (_inFlight.empty() && (isStopping() || !hasPendingRetries())) {
            break;
        }

        auto outcomes = _record->completions->waitFor(nextWakeup());
        for (auto& outcome : outcomes) {
            processOutcome(outcome);
        }
        processTimeouts();
    }

    if (!_failure && !_cancelling && allSatisfied()) {
        finishCompleted();
    }
    if (_failure) {
        finishFailed();
    } else if (_cancelling) {
        finishCancelled();
    } else if (!_record->snapshot().isTerminal()) {
        // Only reachable if the definition bypassed validation
        _failure = Failure{std::nullopt, std::make_exception_ptr(
            std::logic_error("Execution stalled with unsatisfiable dependencies"))};
        finishFailed();
    }

    return _record->snapshot();
}

void WorkflowScheduler::start() {
    if (!_stateManager.transitionExecution(ExecutionStatus::Running)) {
        throw std::logic_error("Execution " + _record->execution.id + " is not pending");
    }

    const auto& execution = _record->execution;
    if (_config.enableDebugLogging) {
        MAESTRO_LOG_DEBUG_CAT("WorkflowScheduler", "Execution {} of '{}' started with {} steps",
                              execution.id, execution.workflowId, _definition->steps.size());
    }

    _emitter.emit(execution.id, execution.workflowId, std::nullopt,
                  Events::WorkflowStarted{_definition->steps.size()});

    if (_definition->onStart) {
        auto snapshot = _record->snapshot();
        invokeHook("onStart", [&]() { _definition->onStart(snapshot); });
    }
}

void WorkflowScheduler::pollCancellation() {
    if (_cancelling || !_record->cancelRequested.load(std::memory_order_acquire)) {
        return;
    }
    _cancelling = true;
    MAESTRO_LOG_INFO_CAT("WorkflowScheduler", "Execution {} cancelled with {} step(s) in flight",
                         _record->execution.id, _inFlight.size());
    stopInFlight();
    failPendingRetries();
}

size_t WorkflowScheduler::launchReadySteps() {
    size_t launched = 0;

    // A step that settles without running may unblock dependents listed before it
    bool settledWithoutRunning = true;
    while (settledWithoutRunning && !isStopping()) {
        settledWithoutRunning = false;
        auto now = Clock::now();

        for (uint32_t i = 0; i < _progress.size() && !isStopping(); ++i) {
            auto& progress = _progress[i];
            if (progress.status != StepStatus::Pending) continue;
            if (progress.retryAt && *progress.retryAt > now) continue;

            bool ready = true;
            for (uint32_t dependency : _graph.getIncoming(i)) {
                if (!satisfiesDependents(dependency)) {
                    ready = false;
                    break;
                }
            }
            if (!ready) continue;

            if (launchStep(i)) {
                ++launched;
            } else if (progress.status != StepStatus::Pending) {
                settledWithoutRunning = true;
            }
        }
    }
    return launched;
}

bool WorkflowScheduler::launchStep(uint32_t stepIndex) {
    MAESTRO_PROFILE_ZONE_N("WorkflowScheduler::launchStep");
    const auto& step = _definition->steps[stepIndex];
    auto& progress = _progress[stepIndex];

    uint32_t attempt = progress.attempts + 1;
    auto timeout = resolveTimeout(step);

    StepContext context;
    context.workflowId = _definition->id;
    context.executionId = _record->execution.id;
    context.stepId = step.id;
    context.attempt = attempt;
    context.previousResults = _stateManager.collectOutputs(_ancestorIds[stepIndex]);
    context.state = _record->state;
    context.metadata = _options.metadata;

    if (step.condition && attempt == 1) {
        std::exception_ptr conditionError;
        bool shouldRun = true;
        try {
            shouldRun = step.condition(context);
        } catch (const std::exception& e) {
            MAESTRO_LOG_WARNING_CAT("WorkflowScheduler", "Condition of step '{}' threw: {}", step.id, e.what());
            conditionError = std::current_exception();
        } catch (...) {
            MAESTRO_LOG_WARNING_CAT("WorkflowScheduler", "Condition of step '{}' threw: unknown exception", step.id);
            conditionError = std::current_exception();
        }

        if (conditionError) {
            handleFailure(stepIndex, conditionError, false, Clock::now(), false);
            return false;
        }
        if (!shouldRun) {
            if (_stateManager.markSkipped(step.id, "condition not met", Clock::now())) {
                progress.status = StepStatus::Skipped;
            }
            if (_config.enableDebugLogging) {
                MAESTRO_LOG_DEBUG_CAT("WorkflowScheduler", "Skipping step '{}': condition not met", step.id);
            }
            return false;
        }
    }

    // Status first so step:started precedes anything the worker can cause
    auto startedAt = Clock::now();
    if (!_stateManager.markRunning(step.id, attempt, startedAt)) {
        return false;
    }
    progress.status = StepStatus::Running;
    progress.attempts = attempt;
    progress.retryAt.reset();

    if (_config.enableDebugLogging) {
        MAESTRO_LOG_DEBUG_CAT("WorkflowScheduler", "Launching step '{}' attempt {} (timeout {}ms)",
                              step.id, attempt, timeout.count());
    }

    auto handle = _executor.launch(stepIndex, attempt, _record->execution.input, std::move(context), timeout);
    uint64_t ticket = handle->getTicket();
    _inFlight.emplace(ticket, std::move(handle));
    return true;
}

std::optional<TimePoint> WorkflowScheduler::nextWakeup() const {
    std::optional<TimePoint> wakeup;
    auto consider = [&wakeup](TimePoint candidate) {
        if (!wakeup || candidate < *wakeup) wakeup = candidate;
    };

    for (const auto& [ticket, attempt] : _inFlight) {
        consider(attempt->getDeadline());
    }
    if (!isStopping()) {
        for (const auto& progress : _progress) {
            if (progress.status == StepStatus::Pending && progress.retryAt) {
                consider(*progress.retryAt);
            }
        }
    }
    return wakeup;
}

void WorkflowScheduler::processOutcome(StepAttemptOutcome& outcome) {
    auto it = _inFlight.find(outcome.ticket);
    if (it == _inFlight.end()) {
        if (_config.enableDebugLogging) {
            MAESTRO_LOG_DEBUG_CAT("WorkflowScheduler", "Discarding late result of step '{}' attempt {}",
                                  _definition->steps[outcome.stepIndex].id, outcome.attempt);
        }
        return;
    }

    it->second->join();
    _inFlight.erase(it);

    const auto& step = _definition->steps[outcome.stepIndex];
    if (outcome.succeeded) {
        if (_stateManager.markSucceeded(step.id, std::move(outcome.output), outcome.finishedAt)) {
            _progress[outcome.stepIndex].status = StepStatus::Succeeded;
        }
        if (_config.enableDebugLogging) {
            MAESTRO_LOG_DEBUG_CAT("WorkflowScheduler", "Step '{}' succeeded on attempt {}",
                                  step.id, outcome.attempt);
        }
    } else {
        handleFailure(outcome.stepIndex, outcome.error, false, outcome.finishedAt);
    }
}

void WorkflowScheduler::processTimeouts() {
    auto now = Clock::now();
    for (auto it = _inFlight.begin(); it != _inFlight.end();) {
        auto& attempt = *it->second;
        if (now < attempt.getDeadline()) {
            ++it;
            continue;
        }

        uint32_t stepIndex = attempt.getStepIndex();
        const auto& step = _definition->steps[stepIndex];
        MAESTRO_LOG_WARNING_CAT("WorkflowScheduler", "Step '{}' attempt {} exceeded {}ms and was abandoned",
                                step.id, attempt.getAttempt(), attempt.getTimeout().count());

        attempt.abandon();
        auto error = std::make_exception_ptr(StepTimeoutError(step.id, attempt.getTimeout()));
        it = _inFlight.erase(it);
        handleFailure(stepIndex, error, true, now);
    }
}

void WorkflowScheduler::handleFailure(uint32_t stepIndex, std::exception_ptr error, bool timedOut, TimePoint at,
                                      bool retryable) {
    const auto& step = _definition->steps[stepIndex];
    auto& progress = _progress[stepIndex];
    progress.lastError = error;
    progress.lastTimedOut = timedOut;

    if (retryable && !isStopping() && progress.attempts <= resolveMaxRetries(step)) {
        auto delay = resolveRetryDelay(step, progress.attempts);
        if (_stateManager.markRetrying(step.id, error, timedOut, progress.attempts + 1, delay)) {
            progress.status = StepStatus::Pending;
            progress.retryAt = Clock::now() + delay;
            MAESTRO_LOG_INFO_CAT("WorkflowScheduler", "Retrying step '{}' in {}ms (attempt {} of {})",
                                 step.id, delay.count(), progress.attempts + 1, resolveMaxRetries(step) + 1);
        }
        return;
    }

    if (_stateManager.markFailed(step.id, error, timedOut, at)) {
        progress.status = StepStatus::Failed;
    }

    if (step.optional && !isStopping()) {
        _stateManager.recordOptionalFailure(step.id);
        MAESTRO_LOG_INFO_CAT("WorkflowScheduler", "Optional step '{}' failed, continuing: {}",
                             step.id, describeException(error));
        return;
    }

    if (!isStopping()) {
        MAESTRO_LOG_WARNING_CAT("WorkflowScheduler", "Execution {} stopping: {}",
                                _record->execution.id, describeException(error));
        _failure = Failure{stepIndex, error};
        stopInFlight();
        failPendingRetries();
    }
}

void WorkflowScheduler::stopInFlight() {
    for (auto& [ticket, attempt] : _inFlight) {
        attempt->requestStop();
    }
}

void WorkflowScheduler::failPendingRetries() {
    auto now = Clock::now();
    for (uint32_t i = 0; i < _progress.size(); ++i) {
        auto& progress = _progress[i];
        if (progress.status != StepStatus::Pending || !progress.retryAt) continue;

        if (_stateManager.markFailed(_definition->steps[i].id, progress.lastError, progress.lastTimedOut, now)) {
            progress.status = StepStatus::Failed;
        }
        progress.retryAt.reset();
    }
}

bool WorkflowScheduler::hasPendingRetries() const {
    return std::any_of(_progress.begin(), _progress.end(), [](const StepProgress& progress) {
        return progress.status == StepStatus::Pending && progress.retryAt.has_value();
    });
}

bool WorkflowScheduler::satisfiesDependents(uint32_t stepIndex) const {
    switch (_progress[stepIndex].status) {
        case StepStatus::Succeeded:
        case StepStatus::Skipped:
            return true;
        case StepStatus::Failed:
            return _definition->steps[stepIndex].optional;
        default:
            return false;
    }
}

bool WorkflowScheduler::allSatisfied() const {
    for (uint32_t i = 0; i < _progress.size(); ++i) {
        if (!satisfiesDependents(i)) return false;
    }
    return true;
}

void WorkflowScheduler::finishCompleted() {
    StepValue output;
    try {
        if (_definition->transformOutput) {
            output = _definition->transformOutput(_stateManager.collectAllOutputs());
        } else {
            std::lock_guard<std::mutex> lock(_record->mutex);
            const auto& order = _record->execution.completionOrder;
            if (!order.empty()) {
                output = _record->execution.stepResults.at(order.back()).output;
            }
        }
    } catch (const std::exception& e) {
        MAESTRO_LOG_ERROR_CAT("WorkflowScheduler", "transformOutput of '{}' threw: {}", _definition->id, e.what());
        _failure = Failure{std::nullopt, std::current_exception()};
        return;
    } catch (...) {
        MAESTRO_LOG_ERROR_CAT("WorkflowScheduler", "transformOutput of '{}' threw: unknown exception", _definition->id);
        _failure = Failure{std::nullopt, std::current_exception()};
        return;
    }

    {
        std::lock_guard<std::mutex> lock(_record->mutex);
        _record->execution.output = std::move(output);
    }
    _stateManager.transitionExecution(ExecutionStatus::Completed);

    auto snapshot = _record->snapshot();
    auto duration = snapshot.duration().value_or(std::chrono::milliseconds{0});
    MAESTRO_LOG_INFO_CAT("WorkflowScheduler", "Execution {} of '{}' completed in {}ms",
                         snapshot.id, snapshot.workflowId, duration.count());
    _emitter.emit(snapshot.id, snapshot.workflowId, std::nullopt, Events::WorkflowCompleted{duration});

    if (_definition->onComplete) {
        invokeHook("onComplete", [&]() { _definition->onComplete(snapshot); });
    }
}

void WorkflowScheduler::finishFailed() {
    if (!_definition->enableRollback) {
        MAESTRO_LOG_INFO_CAT("WorkflowScheduler", "Rollback disabled for '{}'; completed steps of {} keep their effects",
                             _definition->id, _record->execution.id);
    } else {
        MAESTRO_PROFILE_ZONE_NC("Rollback", Debug::ProfileColors::Rollback);
        RollbackCoordinator rollback(*_definition, _graph, *_record, _stateManager, _emitter);
        auto summary = rollback.run();
        if (_config.enableDebugLogging) {
            MAESTRO_LOG_DEBUG_CAT("WorkflowScheduler", "Rollback of {}: {} rolled back, {} failed",
                                  _record->execution.id, summary.rolledBack, summary.failures);
        }
    }

    std::optional<std::string> failedStepId;
    if (_failure->stepIndex) {
        failedStepId = _definition->steps[*_failure->stepIndex].id;
    }
    auto message = describeException(_failure->error);

    {
        std::lock_guard<std::mutex> lock(_record->mutex);
        _record->execution.error = ExecutionError{message, failedStepId, _failure->error};
    }
    _stateManager.transitionExecution(ExecutionStatus::Failed);

    auto snapshot = _record->snapshot();
    auto duration = snapshot.duration().value_or(std::chrono::milliseconds{0});
    MAESTRO_LOG_WARNING_CAT("WorkflowScheduler", "Execution {} of '{}' failed: {}",
                            snapshot.id, snapshot.workflowId, message);
    _emitter.emit(snapshot.id, snapshot.workflowId, failedStepId,
                  Events::WorkflowFailed{duration, failedStepId}, message);

    if (_definition->onError) {
        invokeHook("onError", [&]() { _definition->onError(_failure->error, snapshot); });
    }
}

void WorkflowScheduler::finishCancelled() {
    _stateManager.transitionExecution(ExecutionStatus::Cancelled);

    auto snapshot = _record->snapshot();
    auto duration = snapshot.duration().value_or(std::chrono::milliseconds{0});
    _emitter.emit(snapshot.id, snapshot.workflowId, std::nullopt, Events::WorkflowCancelled{duration});
}

void WorkflowScheduler::invokeHook(const char* hookName, const std::function<void()>& hook) {
    try {
        hook();
    } catch (const std::exception& e) {
        MAESTRO_LOG_ERROR_CAT("WorkflowScheduler", "{} hook of '{}' threw: {}", hookName, _definition->id, e.what());
    } catch (...) {
        MAESTRO_LOG_ERROR_CAT("WorkflowScheduler", "{} hook of '{}' threw: unknown exception", hookName, _definition->id);
    }
}

} // namespace Workflow
} // namespace Core
} // namespace MaestroEngine
