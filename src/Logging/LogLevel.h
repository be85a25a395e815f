/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

/**
 * @file LogLevel.h
 * @brief Severity levels used by the logger and its sinks
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>

namespace MaestroEngine {
namespace Core {
namespace Logging {

    /**
     * @brief Log severity, ordered from least to most severe
     *
     * A minimum level admits itself and everything above it, so a sink set to
     * Warning still receives Error and Fatal entries. Off disables output.
     */
    enum class LogLevel : uint8_t {
        Trace = 0,    ///< Per-step scheduling chatter
        Debug = 1,    ///< Diagnostic detail (retries, deadlines, equilibrium progress)
        Info = 2,     ///< Normal lifecycle messages (registration, completion)
        Warning = 3,  ///< Recoverable anomalies such as rejected state transitions
        Error = 4,    ///< Failed steps, failed rollbacks
        Fatal = 5,    ///< Unrecoverable conditions
        Off = 6       ///< Disable all logging output
    };

    /**
     * @brief Fixed-width (5 character) name of a level
     *
     * @code
     * std::cout << "[" << logLevelToString(LogLevel::Warning) << "] rollback failed\n";
     * // Output: "[WARN ] rollback failed"
     * @endcode
     */
    inline constexpr std::string_view logLevelToString(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:   return "TRACE";
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO ";
            case LogLevel::Warning: return "WARN ";
            case LogLevel::Error:   return "ERROR";
            case LogLevel::Fatal:   return "FATAL";
            case LogLevel::Off:     return "OFF  ";
        }
        return "UNKNOWN";
    }

    /// Single character tag for compact output ('T', 'D', 'I', 'W', 'E', 'F', 'O')
    inline constexpr char logLevelToChar(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:   return 'T';
            case LogLevel::Debug:   return 'D';
            case LogLevel::Info:    return 'I';
            case LogLevel::Warning: return 'W';
            case LogLevel::Error:   return 'E';
            case LogLevel::Fatal:   return 'F';
            case LogLevel::Off:     return 'O';
        }
        return '?';
    }

    /**
     * @brief Parse a level name, ignoring case
     *
     * "WARN" is accepted as an alias for Warning. Unrecognized input maps to Info
     * so a bad configuration value never silences the logger.
     *
     * @code
     * stringToLogLevel("debug");   // LogLevel::Debug
     * stringToLogLevel("WARN");    // LogLevel::Warning
     * stringToLogLevel("verbose"); // LogLevel::Info
     * @endcode
     */
    inline LogLevel stringToLogLevel(std::string_view str) {
        std::string lowered(str);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lowered == "trace") return LogLevel::Trace;
        if (lowered == "debug") return LogLevel::Debug;
        if (lowered == "info") return LogLevel::Info;
        if (lowered == "warning" || lowered == "warn") return LogLevel::Warning;
        if (lowered == "error") return LogLevel::Error;
        if (lowered == "fatal") return LogLevel::Fatal;
        if (lowered == "off") return LogLevel::Off;
        return LogLevel::Info;
    }

} // namespace Logging
} // namespace Core
} // namespace MaestroEngine
