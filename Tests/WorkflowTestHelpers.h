/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 */

#pragma once

#include "Logging/Logger.h"
#include "Logging/MemorySink.h"
#include "Workflow/IWorkflowEventSink.h"
#include "Workflow/WorkflowTypes.h"
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace MaestroEngine {
namespace Core {
namespace Testing {

/**
 * @brief Attaches a MemorySink to the global logger for one test
 *
 * The sink is detached again on destruction so captures do not leak into
 * other test cases.
 */
class ScopedLogCapture {
public:
    explicit ScopedLogCapture(size_t capacity = 4096)
        : _sink(std::make_shared<Logging::MemorySink>(capacity)) {
        Logging::Logger::global().addSink(_sink);
    }

    ~ScopedLogCapture() {
        Logging::Logger::global().removeSink(_sink);
    }

    ScopedLogCapture(const ScopedLogCapture&) = delete;
    ScopedLogCapture& operator=(const ScopedLogCapture&) = delete;

    Logging::MemorySink& sink() { return *_sink; }

private:
    std::shared_ptr<Logging::MemorySink> _sink;
};

/// Event sink that keeps every event it receives
class RecordingEventSink : public Workflow::IWorkflowEventSink {
public:
    void emit(const Workflow::WorkflowEvent& event) override {
        std::lock_guard<std::mutex> lock(_mutex);
        _events.push_back(event);
    }

    std::vector<Workflow::WorkflowEvent> events() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _events;
    }

    /// Wire names of the events of one execution, in emission order
    std::vector<std::string> namesFor(const std::string& executionId) const {
        std::lock_guard<std::mutex> lock(_mutex);
        std::vector<std::string> names;
        for (const auto& event : _events) {
            if (event.executionId == executionId) {
                std::string name(event.name());
                if (event.stepId) {
                    name += " " + *event.stepId;
                }
                names.push_back(std::move(name));
            }
        }
        return names;
    }

    size_t count(Workflow::WorkflowEventKind kind) const {
        std::lock_guard<std::mutex> lock(_mutex);
        size_t total = 0;
        for (const auto& event : _events) {
            if (event.kind == kind) ++total;
        }
        return total;
    }

private:
    mutable std::mutex _mutex;
    std::vector<Workflow::WorkflowEvent> _events;
};

inline Workflow::WorkflowStep makeStep(std::string id,
                                       std::vector<std::string> dependencies,
                                       Workflow::StepHandler handler) {
    Workflow::WorkflowStep step;
    step.id = std::move(id);
    step.dependencies = std::move(dependencies);
    step.handler = std::move(handler);
    return step;
}

/// Handler that returns @p value
template<typename T>
Workflow::StepHandler returning(T value) {
    return [value](const Workflow::StepValue&, const Workflow::StepContext&) -> Workflow::StepValue {
        return value;
    };
}

/// Handler that throws std::runtime_error(@p message)
inline Workflow::StepHandler throwing(std::string message) {
    return [message](const Workflow::StepValue&, const Workflow::StepContext&) -> Workflow::StepValue {
        throw std::runtime_error(message);
    };
}

/**
 * @brief Handler that sleeps for @p duration, waking early if stopped
 *
 * Returns @p value when it ran to the end, throws if it was stopped.
 */
template<typename T>
Workflow::StepHandler sleeping(std::chrono::milliseconds duration, T value) {
    return [duration, value](const Workflow::StepValue&, const Workflow::StepContext& ctx) -> Workflow::StepValue {
        auto deadline = std::chrono::steady_clock::now() + duration;
        while (std::chrono::steady_clock::now() < deadline) {
            if (ctx.stopRequested()) {
                throw std::runtime_error("stopped");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        return value;
    };
}

inline Workflow::WorkflowDefinition makeWorkflow(std::string id, std::vector<Workflow::WorkflowStep> steps) {
    Workflow::WorkflowDefinition definition;
    definition.id = id;
    definition.name = id;
    definition.version = "1.0.0";
    definition.steps = std::move(steps);
    return definition;
}

} // namespace Testing
} // namespace Core
} // namespace MaestroEngine
