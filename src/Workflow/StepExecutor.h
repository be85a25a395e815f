/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

/**
 * @file StepExecutor.h
 * @brief Runs step attempts on worker threads with a deadline
 *
 * Each attempt gets its own std::jthread. The attempt reports back through a
 * CompletionQueue shared with the scheduler. If the deadline passes first,
 * the scheduler abandons the attempt: its stop token is signalled, its thread
 * is detached and whatever it eventually posts is ignored. Everything the
 * worker touches is owned through shared_ptr, so an abandoned attempt can
 * outlive the scheduler and even the registry safely.
 */

#pragma once

#include "WorkflowTypes.h"
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

namespace MaestroEngine {
namespace Core {
namespace Workflow {

    /// Result of one handler invocation as reported by the worker thread
    struct StepAttemptOutcome {
        uint64_t ticket = 0;
        uint32_t stepIndex = 0;
        uint32_t attempt = 0;
        bool succeeded = false;
        StepValue output;

        /// StepExecutionError wrapping what the handler threw
        std::exception_ptr error;

        TimePoint finishedAt{};
    };

    /**
     * @brief Mailbox between worker threads and the scheduler
     *
     * Workers push() outcomes. The scheduler sleeps in waitFor() until an
     * outcome arrives, wake() is called (cancellation), or its deadline passes.
     */
    class CompletionQueue {
    public:
        void push(StepAttemptOutcome outcome);

        /// Wake the waiting scheduler without delivering an outcome
        void wake();

        /**
         * @brief Block until there is something to do, then drain the queue
         *
         * @param deadline Return no later than this; nullopt waits indefinitely
         * @return Outcomes received, oldest first (possibly empty)
         */
        std::vector<StepAttemptOutcome> waitFor(std::optional<TimePoint> deadline);

        size_t pending() const;

    private:
        mutable std::mutex _mutex;
        std::condition_variable _condition;
        std::deque<StepAttemptOutcome> _outcomes;
        bool _woken = false;
    };

    /**
     * @brief Handle for one in-flight attempt
     *
     * Owned by the scheduler. Either join() after its outcome arrives, or
     * abandon() once its deadline has passed. Destroying a handle that was
     * neither joined nor abandoned joins the thread.
     */
    class StepAttempt {
    public:
        StepAttempt(uint64_t ticket, uint32_t stepIndex, uint32_t attempt,
                    TimePoint startedAt, std::chrono::milliseconds timeout)
            : _ticket(ticket)
            , _stepIndex(stepIndex)
            , _attempt(attempt)
            , _startedAt(startedAt)
            , _timeout(timeout)
            , _deadline(startedAt + timeout) {}

        StepAttempt(const StepAttempt&) = delete;
        StepAttempt& operator=(const StepAttempt&) = delete;

        uint64_t getTicket() const { return _ticket; }
        uint32_t getStepIndex() const { return _stepIndex; }
        uint32_t getAttempt() const { return _attempt; }
        TimePoint getStartedAt() const { return _startedAt; }
        TimePoint getDeadline() const { return _deadline; }
        std::chrono::milliseconds getTimeout() const { return _timeout; }

        /// Signal the handler's stop token
        void requestStop();

        /// Wait for the worker thread to exit; call after its outcome arrived
        void join();

        /// Signal stop and detach; the worker's eventual outcome must be ignored
        void abandon();

        bool isAbandoned() const { return _abandoned; }

    private:
        friend class StepExecutor;

        uint64_t _ticket;
        uint32_t _stepIndex;
        uint32_t _attempt;
        TimePoint _startedAt;
        std::chrono::milliseconds _timeout;
        TimePoint _deadline;
        bool _abandoned = false;
        std::jthread _thread;
    };

    /**
     * @brief Launches attempts of one execution's steps
     *
     * The executor does not enforce deadlines itself. It stamps each attempt
     * with one, and the scheduler compares the deadline against its clock
     * while waiting on the completion queue.
     *
     * @code
     * auto completions = std::make_shared<CompletionQueue>();
     * StepExecutor executor(definition, completions);
     *
     * auto attempt = executor.launch(0, 1, input, context, 250ms);
     * auto outcomes = completions->waitFor(attempt->getDeadline());
     * if (outcomes.empty()) {
     *     attempt->abandon();          // timed out
     * } else {
     *     attempt->join();
     * }
     * @endcode
     */
    class StepExecutor {
    public:
        StepExecutor(std::shared_ptr<const WorkflowDefinition> definition,
                     std::shared_ptr<CompletionQueue> completions);

        /**
         * @brief Start one attempt of steps[stepIndex] on a new thread
         *
         * The handler receives the step's transformInput result, or
         * @p workflowInput if the step has none. context.stopToken is replaced
         * with the attempt's own token.
         */
        std::unique_ptr<StepAttempt> launch(uint32_t stepIndex,
                                            uint32_t attempt,
                                            const StepValue& workflowInput,
                                            StepContext context,
                                            std::chrono::milliseconds timeout);

        /**
         * @brief Run one attempt and wait for it, up to @p timeout
         *
         * Convenience for callers outside the scheduler. A timeout yields an
         * outcome whose error is a StepTimeoutError. The abandoned handler
         * keeps running in the background.
         */
        StepAttemptOutcome runToCompletion(uint32_t stepIndex,
                                           const StepValue& workflowInput,
                                           StepContext context,
                                           std::chrono::milliseconds timeout);

        const std::shared_ptr<CompletionQueue>& getCompletionQueue() const { return _completions; }

    private:
        std::shared_ptr<const WorkflowDefinition> _definition;
        std::shared_ptr<CompletionQueue> _completions;
        uint64_t _nextTicket = 1;
    };

} // namespace Workflow
} // namespace Core
} // namespace MaestroEngine
