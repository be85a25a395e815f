/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

/**
 * @file LogEntry.h
 * @brief A single captured log event
 */

#pragma once

#include "LogLevel.h"
#include <chrono>
#include <thread>
#include <string>
#include <source_location>

namespace MaestroEngine {
namespace Core {
namespace Logging {

    /**
     * @brief Raw data for one log event
     *
     * The entry owns its strings so sinks may keep it after the call returns
     * (MemorySink does). Formatting is left to the sink.
     */
    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        std::thread::id threadId;
        LogLevel level;

        /// Subsystem name, e.g. "WorkflowScheduler" or "AgentEquilibrium"
        std::string category;

        std::string message;
        std::source_location location;

        LogEntry(LogLevel lvl,
                 std::string_view cat,
                 std::string msg,
                 const std::source_location& loc = std::source_location::current())
            : timestamp(std::chrono::system_clock::now())
            , threadId(std::this_thread::get_id())
            , level(lvl)
            , category(cat)
            , message(std::move(msg))
            , location(loc) {}
    };

} // namespace Logging
} // namespace Core
} // namespace MaestroEngine
