/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

#include "Logger.h"
#include "ConsoleSink.h"
#include <algorithm>
#include <cstdlib>
#include <optional>

namespace MaestroEngine {
namespace Core {
namespace Logging {

namespace {

    std::optional<std::string_view> readEnvironment(const char* variable) {
        const char* value = std::getenv(variable);
        if (!value || *value == '\0') {
            return std::nullopt;
        }
        return std::string_view(value);
    }

    bool isDisabledFlag(std::string_view value) {
        return value == "0" || value == "off" || value == "false" || value == "no";
    }

    /// Global logger as configured by MAESTRO_LOG_LEVEL, MAESTRO_LOG_COLOR and MAESTRO_LOG_THREAD_IDS
    Logger* createGlobalLogger() {
        auto* logger = new Logger("Global");

        auto console = std::make_shared<ConsoleSink>();
        if (auto color = readEnvironment("MAESTRO_LOG_COLOR")) {
            console->setUseColor(!isDisabledFlag(*color));
        }
        if (auto threadIds = readEnvironment("MAESTRO_LOG_THREAD_IDS")) {
            console->setShowThreadId(!isDisabledFlag(*threadIds));
        }
        logger->addSink(std::move(console));

        if (auto level = readEnvironment("MAESTRO_LOG_LEVEL")) {
            logger->setMinLevel(stringToLogLevel(*level));
        }
        return logger;
    }

} // namespace

    Logger* Logger::s_globalLogger = nullptr;
    std::mutex Logger::s_globalMutex;

    Logger& Logger::global() {
        std::lock_guard<std::mutex> lock(s_globalMutex);
        if (!s_globalLogger) {
            s_globalLogger = createGlobalLogger();
        }
        return *s_globalLogger;
    }

    void Logger::setGlobal(Logger* logger) {
        std::lock_guard<std::mutex> lock(s_globalMutex);
        if (s_globalLogger != logger) {
            delete s_globalLogger;
        }
        s_globalLogger = logger;
    }

    void Logger::addSink(LogSinkPtr sink) {
        if (!sink) return;
        std::unique_lock<std::shared_mutex> lock(_sinkMutex);
        if (std::find(_sinks.begin(), _sinks.end(), sink) == _sinks.end()) {
            _sinks.push_back(std::move(sink));
        }
    }

    void Logger::removeSink(const LogSinkPtr& sink) {
        std::unique_lock<std::shared_mutex> lock(_sinkMutex);
        std::erase(_sinks, sink);
    }

    void Logger::clearSinks() {
        std::unique_lock<std::shared_mutex> lock(_sinkMutex);
        _sinks.clear();
    }

    size_t Logger::getSinkCount() const {
        std::shared_lock<std::shared_mutex> lock(_sinkMutex);
        return _sinks.size();
    }

    void Logger::flush() {
        std::shared_lock<std::shared_mutex> lock(_sinkMutex);
        for (const auto& sink : _sinks) {
            sink->flush();
        }
    }

    void Logger::writeToSinks(const LogEntry& entry) {
        // Error and Fatal entries are flushed sink by sink
        const bool urgent = entry.level >= LogLevel::Error;

        std::shared_lock<std::shared_mutex> lock(_sinkMutex);
        for (const auto& sink : _sinks) {
            if (!sink->shouldLog(entry.level)) {
                continue;
            }
            sink->write(entry);
            if (urgent) {
                sink->flush();
            }
        }
    }

} // namespace Logging
} // namespace Core
} // namespace MaestroEngine
