/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

#include "StepExecutor.h"
#include "../Core/Errors.h"
#include "../Debug/Profiling.h"
#include "../Logging/Logger.h"
#include <stdexcept>

namespace MaestroEngine {
namespace Core {
namespace Workflow {

void CompletionQueue::push(StepAttemptOutcome outcome) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _outcomes.push_back(std::move(outcome));
    }
    _condition.notify_all();
}

void CompletionQueue::wake() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _woken = true;
    }
    _condition.notify_all();
}

std::vector<StepAttemptOutcome> CompletionQueue::waitFor(std::optional<TimePoint> deadline) {
    std::unique_lock<std::mutex> lock(_mutex);
    auto ready = [this]() { return !_outcomes.empty() || _woken; };

    if (deadline) {
        _condition.wait_until(lock, *deadline, ready);
    } else {
        _condition.wait(lock, ready);
    }

    _woken = false;
    std::vector<StepAttemptOutcome> drained(std::make_move_iterator(_outcomes.begin()),
                                            std::make_move_iterator(_outcomes.end()));
    _outcomes.clear();
    return drained;
}

size_t CompletionQueue::pending() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _outcomes.size();
}

void StepAttempt::requestStop() {
    _thread.request_stop();
}

void StepAttempt::join() {
    if (_thread.joinable()) {
        _thread.join();
    }
}

void StepAttempt::abandon() {
    _abandoned = true;
    _thread.request_stop();
    if (_thread.joinable()) {
        _thread.detach();
    }
}

StepExecutor::StepExecutor(std::shared_ptr<const WorkflowDefinition> definition,
                           std::shared_ptr<CompletionQueue> completions)
    : _definition(std::move(definition))
    , _completions(std::move(completions)) {
    if (!_definition) {
        throw std::invalid_argument("StepExecutor requires a workflow definition");
    }
    if (!_completions) {
        _completions = std::make_shared<CompletionQueue>();
    }
}

std::unique_ptr<StepAttempt> StepExecutor::launch(uint32_t stepIndex,
                                                  uint32_t attempt,
                                                  const StepValue& workflowInput,
                                                  StepContext context,
                                                  std::chrono::milliseconds timeout) {
    if (stepIndex >= _definition->steps.size()) {
        throw std::out_of_range("Step index out of range for workflow '" + _definition->id + "'");
    }

    auto handle = std::make_unique<StepAttempt>(_nextTicket++, stepIndex, attempt, Clock::now(), timeout);

    // The worker owns copies of everything it needs; nothing refers back to the scheduler
    handle->_thread = std::jthread(
        [definition = _definition,
         completions = _completions,
         ticket = handle->getTicket(),
         stepIndex,
         attempt,
         workflowInput,
         context = std::move(context)](std::stop_token stopToken) mutable {
            MAESTRO_PROFILE_ZONE_N("StepAttempt");
            const auto& step = definition->steps[stepIndex];
            context.stopToken = stopToken;
            context.attempt = attempt;

            StepAttemptOutcome outcome;
            outcome.ticket = ticket;
            outcome.stepIndex = stepIndex;
            outcome.attempt = attempt;

            try {
                StepValue input = step.transformInput
                    ? step.transformInput(workflowInput, context.previousResults)
                    : workflowInput;
                outcome.output = step.handler(input, context);
                outcome.succeeded = true;
            } catch (const std::exception& e) {
                outcome.error = std::make_exception_ptr(
                    StepExecutionError(step.id, e.what(), std::current_exception()));
            } catch (...) {
                outcome.error = std::make_exception_ptr(
                    StepExecutionError(step.id, "unknown exception", std::current_exception()));
            }

            outcome.finishedAt = Clock::now();
            completions->push(std::move(outcome));
        });

    return handle;
}

StepAttemptOutcome StepExecutor::runToCompletion(uint32_t stepIndex,
                                                 const StepValue& workflowInput,
                                                 StepContext context,
                                                 std::chrono::milliseconds timeout) {
    auto attempt = launch(stepIndex, context.attempt, workflowInput, std::move(context), timeout);

    while (true) {
        auto outcomes = _completions->waitFor(attempt->getDeadline());
        for (auto& outcome : outcomes) {
            if (outcome.ticket == attempt->getTicket()) {
                attempt->join();
                return std::move(outcome);
            }
        }

        if (Clock::now() >= attempt->getDeadline()) {
            const auto& stepId = _definition->steps[stepIndex].id;
            MAESTRO_LOG_WARNING_CAT("StepExecutor", "Step '{}' exceeded {}ms, abandoning attempt {}",
                                    stepId, timeout.count(), attempt->getAttempt());
            attempt->abandon();

            StepAttemptOutcome timedOut;
            timedOut.ticket = attempt->getTicket();
            timedOut.stepIndex = stepIndex;
            timedOut.attempt = attempt->getAttempt();
            timedOut.error = std::make_exception_ptr(StepTimeoutError(stepId, timeout));
            timedOut.finishedAt = Clock::now();
            return timedOut;
        }
    }
}

} // namespace Workflow
} // namespace Core
} // namespace MaestroEngine
