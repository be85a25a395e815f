/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

/**
 * @file ILogSink.h
 * @brief Output destination interface for the logger
 */

#pragma once

#include "LogEntry.h"
#include <memory>

namespace MaestroEngine {
namespace Core {
namespace Logging {

    /**
     * @brief Destination for log entries
     *
     * The library ships ConsoleSink (terminal output) and MemorySink (bounded
     * in-memory capture). Embedders can route entries anywhere else by
     * implementing this interface. Every method may be called from step worker
     * threads concurrently, so implementations must be thread-safe.
     *
     * @code
     * class SyslogSink : public ILogSink {
     * public:
     *     void write(const LogEntry& entry) override {
     *         syslog(toPriority(entry.level), "%s", entry.message.c_str());
     *     }
     *     void flush() override {}
     *     bool shouldLog(LogLevel level) const override { return level >= _min; }
     *     void setMinLevel(LogLevel level) override { _min = level; }
     * private:
     *     std::atomic<LogLevel> _min{LogLevel::Info};
     * };
     * @endcode
     */
    class ILogSink {
    public:
        virtual ~ILogSink() = default;

        /// Write one entry. Called only for levels accepted by shouldLog().
        virtual void write(const LogEntry& entry) = 0;

        /// Push out anything buffered. The logger calls this after Error and Fatal entries.
        virtual void flush() = 0;

        /// @return true if this sink wants entries of the given level
        virtual bool shouldLog(LogLevel level) const = 0;

        /// Set the inclusive minimum level this sink accepts
        virtual void setMinLevel(LogLevel level) = 0;
    };

    using LogSinkPtr = std::shared_ptr<ILogSink>;

} // namespace Logging
} // namespace Core
} // namespace MaestroEngine
