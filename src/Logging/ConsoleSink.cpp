/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

#include "ConsoleSink.h"
#include <ctime>
#include <format>
#include <iostream>
#include <sstream>

namespace MaestroEngine {
namespace Core {
namespace Logging {

    void ConsoleSink::write(const LogEntry& entry) {
        if (!shouldLog(entry.level)) return;

        std::string line = formatEntry(entry);

        std::lock_guard<std::mutex> lock(_mutex);
        auto& stream = (entry.level >= LogLevel::Error) ? std::cerr : std::cout;
        stream << line << '\n';
    }

    void ConsoleSink::flush() {
        std::lock_guard<std::mutex> lock(_mutex);
        std::cout.flush();
        std::cerr.flush();
    }

    bool ConsoleSink::shouldLog(LogLevel level) const {
        return level >= _minLevel.load(std::memory_order_relaxed);
    }

    void ConsoleSink::setMinLevel(LogLevel level) {
        _minLevel.store(level, std::memory_order_relaxed);
    }

    const char* ConsoleSink::getColorForLevel(LogLevel level) const {
        if (!_useColor) return "";

        switch (level) {
            case LogLevel::Trace:   return GRAY;
            case LogLevel::Debug:   return CYAN;
            case LogLevel::Info:    return GREEN;
            case LogLevel::Warning: return YELLOW;
            case LogLevel::Error:   return RED;
            case LogLevel::Fatal:   return MAGENTA;
            default:                return RESET;
        }
    }

    std::string ConsoleSink::formatEntry(const LogEntry& entry) const {
        auto time = std::chrono::system_clock::to_time_t(entry.timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            entry.timestamp.time_since_epoch()) % 1000;

        std::tm local{};
        localtime_r(&time, &local);

        std::string line = std::format("[{:02}:{:02}:{:02}.{:03}] ",
                                       local.tm_hour, local.tm_min, local.tm_sec,
                                       static_cast<int>(ms.count()));

        if (_useColor) {
            line += std::format("{}[{}]{} ", getColorForLevel(entry.level),
                                logLevelToString(entry.level), RESET);
        } else {
            line += std::format("[{}] ", logLevelToString(entry.level));
        }

        if (_showThreadId) {
            std::ostringstream threadStr;
            threadStr << entry.threadId;
            auto threadId = threadStr.str();
            // Last four digits are enough to tell worker threads apart
            if (threadId.length() > 4) {
                threadId = threadId.substr(threadId.length() - 4);
            }
            line += std::format("[{:>4}] ", threadId);
        }

        if (!entry.category.empty()) {
            line += std::format("[{}] ", entry.category);
        }

        line += entry.message;

        if (_showLocation && entry.location.line() != 0) {
            line += std::format(" ({}:{})", entry.location.file_name(), entry.location.line());
        }

        return line;
    }

} // namespace Logging
} // namespace Core
} // namespace MaestroEngine
