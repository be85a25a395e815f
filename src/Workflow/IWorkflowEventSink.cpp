/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

#include "IWorkflowEventSink.h"
#include "../Logging/Logger.h"

namespace MaestroEngine {
namespace Core {
namespace Workflow {

void WorkflowEventEmitter::emit(const WorkflowEvent& event) const {
    if (!_sink) {
        return;
    }

    try {
        _sink->emit(event);
    } catch (const std::exception& e) {
        MAESTRO_LOG_WARNING_CAT("WorkflowEvents", "Event sink threw while handling {} for execution {}: {}",
                                event.name(), event.executionId, e.what());
    } catch (...) {
        MAESTRO_LOG_WARNING_CAT("WorkflowEvents", "Event sink threw while handling {} for execution {}: unknown exception",
                                event.name(), event.executionId);
    }
}

} // namespace Workflow
} // namespace Core
} // namespace MaestroEngine
