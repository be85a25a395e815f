/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

/**
 * @file IWorkflowEventSink.h
 * @brief Destination for workflow lifecycle events
 */

#pragma once

#include "WorkflowEvents.h"
#include "../Core/EventBus.h"
#include <memory>

namespace MaestroEngine {
namespace Core {
namespace Workflow {

    /**
     * @brief Receives lifecycle events from the scheduler
     *
     * Events of one execution are emitted from that execution's scheduler
     * thread, in causal order. Events of different executions may arrive
     * concurrently, so implementations must be thread-safe. A sink must not
     * block for long; the scheduler waits for emit() to return.
     */
    class IWorkflowEventSink {
    public:
        virtual ~IWorkflowEventSink() = default;
        virtual void emit(const WorkflowEvent& event) = 0;
    };

    /**
     * @brief Republishes every workflow event on an EventBus
     *
     * @code
     * auto bus = std::make_shared<EventBus>();
     * bus->subscribe<WorkflowEvent>([](const WorkflowEvent& e) {
     *     std::cout << e.name() << " " << e.executionId << "\n";
     * });
     *
     * WorkflowRegistryConfig config;
     * config.eventSink = std::make_shared<EventBusSink>(bus);
     * @endcode
     */
    class EventBusSink : public IWorkflowEventSink {
    public:
        explicit EventBusSink(std::shared_ptr<EventBus> bus) : _bus(std::move(bus)) {}

        void emit(const WorkflowEvent& event) override {
            if (_bus) {
                _bus->publish(event);
            }
        }

        const std::shared_ptr<EventBus>& getEventBus() const { return _bus; }

    private:
        std::shared_ptr<EventBus> _bus;
    };

    /**
     * @brief Null-safe wrapper the scheduler emits through
     *
     * Exceptions thrown by the sink are logged and never reach the scheduler.
     */
    class WorkflowEventEmitter {
    public:
        explicit WorkflowEventEmitter(std::shared_ptr<IWorkflowEventSink> sink = nullptr)
            : _sink(std::move(sink)) {}

        void emit(const WorkflowEvent& event) const;

        template<typename Payload>
        void emit(const std::string& executionId,
                  const std::string& workflowId,
                  std::optional<std::string> stepId,
                  Payload payload,
                  std::optional<std::string> error = std::nullopt) const {
            if (!_sink) return;
            emit(makeWorkflowEvent(executionId, workflowId, std::move(stepId),
                                   std::move(payload), std::move(error)));
        }

        bool hasSink() const { return static_cast<bool>(_sink); }

    private:
        std::shared_ptr<IWorkflowEventSink> _sink;
    };

} // namespace Workflow
} // namespace Core
} // namespace MaestroEngine
