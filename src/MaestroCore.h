/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

#pragma once

/**
 * @file MaestroCore.h
 * @brief Single header that includes all MaestroCore components
 */

// Core
#include "Core/Errors.h"
#include "Core/EventBus.h"

// Graph
#include "Graph/DependencyGraph.h"

// Debug
#include "Debug/INamed.h"
#include "Debug/Profiling.h"

// Logging
#include "Logging/LogLevel.h"
#include "Logging/LogEntry.h"
#include "Logging/ILogSink.h"
#include "Logging/ConsoleSink.h"
#include "Logging/MemorySink.h"
#include "Logging/Logger.h"

// Workflow
#include "Workflow/WorkflowTypes.h"
#include "Workflow/WorkflowEvents.h"
#include "Workflow/IWorkflowEventSink.h"
#include "Workflow/WorkflowValidator.h"
#include "Workflow/StepExecutor.h"
#include "Workflow/ExecutionHistory.h"
#include "Workflow/WorkflowScheduler.h"
#include "Workflow/WorkflowRegistry.h"

// Agents
#include "Agents/AgentTypes.h"
#include "Agents/AgentEquilibrium.h"
