/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

/**
 * @file Errors.h
 * @brief Exception types raised by the workflow engine
 *
 * Malformed definitions are std::invalid_argument (ValidationError), thrown
 * synchronously from registration. Everything that can go wrong at run time
 * derives from std::runtime_error. Step failures are never thrown out of
 * execute(); they are captured as exception_ptrs on the step result and the
 * execution error.
 */

#pragma once

#include <chrono>
#include <exception>
#include <format>
#include <stdexcept>
#include <string>
#include <vector>

namespace MaestroEngine {
namespace Core {

    /**
     * @brief A workflow definition failed static validation
     *
     * what() summarizes every problem found, separated by "; ". When a
     * dependency cycle was detected, cycle() holds the step ids along the
     * cycle with the first id repeated at the end (e.g. A, B, A).
     */
    class ValidationError : public std::invalid_argument {
    public:
        ValidationError(std::string workflowId,
                        std::vector<std::string> problems,
                        std::vector<std::string> cycle = {})
            : std::invalid_argument(buildMessage(workflowId, problems))
            , _workflowId(std::move(workflowId))
            , _problems(std::move(problems))
            , _cycle(std::move(cycle)) {}

        const std::string& workflowId() const noexcept { return _workflowId; }
        const std::vector<std::string>& problems() const noexcept { return _problems; }
        const std::vector<std::string>& cycle() const noexcept { return _cycle; }
        bool hasCycle() const noexcept { return !_cycle.empty(); }

    private:
        static std::string buildMessage(const std::string& workflowId,
                                        const std::vector<std::string>& problems) {
            std::string message = std::format("Invalid workflow '{}'", workflowId);
            for (size_t i = 0; i < problems.size(); ++i) {
                message += (i == 0) ? ": " : "; ";
                message += problems[i];
            }
            return message;
        }

        std::string _workflowId;
        std::vector<std::string> _problems;
        std::vector<std::string> _cycle;
    };

    /// Unknown workflow or execution id
    class NotFoundError : public std::runtime_error {
    public:
        NotFoundError(std::string kind, std::string id)
            : std::runtime_error(std::format("{} not found: {}", kind, id))
            , _kind(std::move(kind))
            , _id(std::move(id)) {}

        const std::string& kind() const noexcept { return _kind; }
        const std::string& id() const noexcept { return _id; }

    private:
        std::string _kind;
        std::string _id;
    };

    /// The registry is already running its maximum number of executions
    class CapacityError : public std::runtime_error {
    public:
        explicit CapacityError(size_t limit)
            : std::runtime_error(std::format("Maximum concurrent executions ({}) reached", limit))
            , _limit(limit) {}

        size_t limit() const noexcept { return _limit; }

    private:
        size_t _limit;
    };

    /// A step attempt did not settle before its deadline
    class StepTimeoutError : public std::runtime_error {
    public:
        StepTimeoutError(std::string stepId, std::chrono::milliseconds timeout)
            : std::runtime_error(std::format("Step '{}' timed out after {}ms", stepId, timeout.count()))
            , _stepId(std::move(stepId))
            , _timeout(timeout) {}

        const std::string& stepId() const noexcept { return _stepId; }
        std::chrono::milliseconds timeout() const noexcept { return _timeout; }

    private:
        std::string _stepId;
        std::chrono::milliseconds _timeout;
    };

    /**
     * @brief A step handler threw
     *
     * cause() is the exception the handler threw. rethrowCause() rethrows it
     * so callers can catch the original type.
     */
    class StepExecutionError : public std::runtime_error {
    public:
        StepExecutionError(std::string stepId, const std::string& causeMessage, std::exception_ptr cause)
            : std::runtime_error(std::format("Step '{}' failed: {}", stepId, causeMessage))
            , _stepId(std::move(stepId))
            , _cause(std::move(cause)) {}

        const std::string& stepId() const noexcept { return _stepId; }
        std::exception_ptr cause() const noexcept { return _cause; }

        [[noreturn]] void rethrowCause() const {
            if (_cause) {
                std::rethrow_exception(_cause);
            }
            throw std::runtime_error(what());
        }

    private:
        std::string _stepId;
        std::exception_ptr _cause;
    };

    /**
     * @brief Best-effort message for an exception_ptr
     *
     * Returns what() for std::exception derivatives and a fixed placeholder
     * for anything else. An empty pointer yields an empty string.
     */
    inline std::string describeException(const std::exception_ptr& error) {
        if (!error) {
            return {};
        }
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            return e.what();
        } catch (...) {
            return "unknown exception";
        }
    }

} // namespace Core
} // namespace MaestroEngine
