/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

/**
 * @file EventBus.h
 * @brief Per-instance, type-indexed publish/subscribe bus
 *
 * An EventBus is a plain object, not a global. A registry, a coordinator or a
 * test fixture each own their own bus, and subscribers only need to share the
 * event struct definitions with publishers.
 */

#pragma once

#include "../Logging/Logger.h"
#include <any>
#include <functional>
#include <memory>
#include <mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>

namespace MaestroEngine {
namespace Core {

/**
 * @brief Type-safe publish/subscribe dispatcher
 *
 * Handlers are keyed by the std::type_index of the event type. publish()
 * copies the matching handler list under the lock and invokes the copies
 * outside it, so a handler may subscribe, unsubscribe or publish again without
 * deadlocking. A handler that throws a std::exception is logged under the
 * "EventBus" category and the remaining handlers still run.
 *
 * Subscribe: O(1) amortized. Publish: O(n) in the subscribers of that type.
 *
 * @code
 * EventBus bus;
 * auto id = bus.subscribe<Workflow::WorkflowEvent>([](const Workflow::WorkflowEvent& e) {
 *     if (e.kind == Workflow::WorkflowEventKind::StepFailed) {
 *         alertOnCall(e.workflowId, e.stepId.value_or("?"));
 *     }
 * });
 *
 * bus.publish(event);
 * bus.unsubscribe<Workflow::WorkflowEvent>(id);
 * @endcode
 */
class EventBus {
public:
    using HandlerId = size_t;
    using EventHandler = std::function<void(const std::any&)>;

    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;
    EventBus(EventBus&&) = delete;
    EventBus& operator=(EventBus&&) = delete;

    /**
     * @brief Register a handler for events of type EventType
     *
     * @return Id to pass to unsubscribe(). Ids are never reused by this bus.
     */
    template<typename EventType>
    HandlerId subscribe(std::function<void(const EventType&)> handler) {
        std::lock_guard<std::mutex> lock(_mutex);

        auto wrappedHandler = [handler = std::move(handler)](const std::any& event) {
            if (const auto* typedEvent = std::any_cast<EventType>(&event)) {
                handler(*typedEvent);
            }
        };

        HandlerId id = _nextHandlerId++;
        _handlers[std::type_index(typeid(EventType))].emplace_back(id, std::move(wrappedHandler));
        return id;
    }

    /**
     * @brief Remove a handler registered for EventType
     *
     * Empty per-type lists are erased.
     *
     * @return false if no handler with that id exists for EventType
     */
    template<typename EventType>
    bool unsubscribe(HandlerId handlerId) {
        std::lock_guard<std::mutex> lock(_mutex);

        auto it = _handlers.find(std::type_index(typeid(EventType)));
        if (it == _handlers.end()) {
            return false;
        }

        auto& handlers = it->second;
        for (auto handlerIt = handlers.begin(); handlerIt != handlers.end(); ++handlerIt) {
            if (handlerIt->first == handlerId) {
                handlers.erase(handlerIt);
                if (handlers.empty()) {
                    _handlers.erase(it);
                }
                return true;
            }
        }

        return false;
    }

    /**
     * @brief Deliver @p event synchronously to every subscriber of its type
     *
     * @return Number of handlers that were invoked
     */
    template<typename EventType>
    size_t publish(const EventType& event) {
        std::vector<EventHandler> handlersToCall;

        {
            std::lock_guard<std::mutex> lock(_mutex);
            auto it = _handlers.find(std::type_index(typeid(EventType)));
            if (it != _handlers.end()) {
                handlersToCall.reserve(it->second.size());
                for (const auto& [id, handler] : it->second) {
                    handlersToCall.push_back(handler);
                }
            }
        }

        if (handlersToCall.empty()) {
            return 0;
        }

        const std::any boxed(event);
        for (const auto& handler : handlersToCall) {
            try {
                handler(boxed);
            } catch (const std::exception& e) {
                MAESTRO_LOG_WARNING_CAT("EventBus", "Handler for {} threw: {}",
                                        typeid(EventType).name(), e.what());
            }
        }
        return handlersToCall.size();
    }

    /// Number of subscribers currently registered for EventType
    template<typename EventType>
    size_t getSubscriberCount() const {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _handlers.find(std::type_index(typeid(EventType)));
        return (it != _handlers.end()) ? it->second.size() : 0;
    }

    bool hasSubscribers() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return !_handlers.empty();
    }

    size_t getTotalSubscriptions() const {
        std::lock_guard<std::mutex> lock(_mutex);
        size_t total = 0;
        for (const auto& [type, handlers] : _handlers) {
            total += handlers.size();
        }
        return total;
    }

    /// Drop every subscription. Outstanding handler ids become invalid.
    void clear() {
        std::lock_guard<std::mutex> lock(_mutex);
        _handlers.clear();
    }

private:
    mutable std::mutex _mutex;
    std::unordered_map<std::type_index, std::vector<std::pair<HandlerId, EventHandler>>> _handlers;
    HandlerId _nextHandlerId = 1;
};

} // namespace Core
} // namespace MaestroEngine
