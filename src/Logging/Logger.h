/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

/**
 * @file Logger.h
 * @brief Central logger and the MAESTRO_LOG_* macros
 *
 * The Logger fans each entry out to its sinks. The workflow engine and the
 * equilibrium selector log through the global instance with explicit
 * categories, so an embedder can silence or redirect a whole subsystem by
 * swapping sinks or raising the minimum level.
 */

#pragma once

#include "LogEntry.h"
#include "ILogSink.h"
#include <atomic>
#include <format>
#include <mutex>
#include <shared_mutex>
#include <source_location>
#include <type_traits>
#include <vector>

namespace MaestroEngine {
namespace Core {
namespace Logging {

    /**
     * @brief Format string that also records the call site
     *
     * A defaulted std::source_location parameter cannot follow a deduced
     * argument pack, so the location travels with the format string instead.
     * The constructor is consteval and checks the format at compile time.
     */
    template<typename... Args>
    struct FormatString {
        std::format_string<Args...> format;
        std::source_location location;

        template<typename S>
            requires std::is_convertible_v<const S&, std::string_view>
        consteval FormatString(const S& str,
                               std::source_location loc = std::source_location::current())
            : format(str)
            , location(loc) {}
    };

    /**
     * @brief Thread-safe logger that dispatches entries to a set of sinks
     *
     * Sinks are held by shared_ptr and guarded by a shared mutex: logging takes
     * a shared lock, reconfiguration takes an exclusive one. Entries below the
     * logger's minimum level are dropped before any formatting happens.
     *
     * @code
     * Logger logger("Scheduler");
     * logger.addSink(std::make_shared<ConsoleSink>());
     * logger.setMinLevel(LogLevel::Debug);
     *
     * logger.info("WorkflowScheduler", "Execution {} started with {} steps", id, count);
     * logger.error("Rollback", "Compensation failed");
     * @endcode
     */
    class Logger {
    private:
        std::string _name;
        std::vector<LogSinkPtr> _sinks;
        mutable std::shared_mutex _sinkMutex;
        std::atomic<LogLevel> _minLevel{LogLevel::Trace};

        static Logger* s_globalLogger;
        static std::mutex s_globalMutex;

    public:
        explicit Logger(std::string name) : _name(std::move(name)) {}

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        /**
         * @brief Process-wide logger used by the MAESTRO_LOG_* macros
         *
         * Created on first use with a ConsoleSink attached. The environment
         * configures it once, at creation:
         * - MAESTRO_LOG_LEVEL: minimum level name, e.g. "debug" or "warn";
         * - MAESTRO_LOG_COLOR: "0", "off", "false" or "no" disables ANSI colors;
         * - MAESTRO_LOG_THREAD_IDS: same values hide the thread id column.
         */
        static Logger& global();

        /**
         * @brief Replace the global logger
         *
         * Takes ownership of @p logger and deletes the previous instance.
         */
        static void setGlobal(Logger* logger);

        const std::string& getName() const { return _name; }

        void addSink(LogSinkPtr sink);
        void removeSink(const LogSinkPtr& sink);
        void clearSinks();
        size_t getSinkCount() const;

        /// Entries below @p level are discarded before reaching any sink
        void setMinLevel(LogLevel level) { _minLevel.store(level, std::memory_order_relaxed); }
        LogLevel getMinLevel() const { return _minLevel.load(std::memory_order_relaxed); }

        /// @return true if an entry at @p level would be dispatched
        bool isEnabled(LogLevel level) const {
            return level != LogLevel::Off && level >= getMinLevel();
        }

        /// Log a pre-formatted message
        void log(LogLevel level,
                 std::string_view category,
                 const std::string& message,
                 const std::source_location& location = std::source_location::current()) {
            if (!isEnabled(level)) return;
            writeToSinks(LogEntry(level, category, message, location));
        }

        /// Log a std::format message, formatting only if the level is enabled
        template<typename... Args>
        void log(LogLevel level,
                 std::string_view category,
                 FormatString<std::type_identity_t<Args>...> fmt,
                 Args&&... args) {
            if (!isEnabled(level)) return;
            writeToSinks(LogEntry(level, category,
                                  std::format(fmt.format, std::forward<Args>(args)...),
                                  fmt.location));
        }

        template<typename... Args>
        void trace(std::string_view category, FormatString<std::type_identity_t<Args>...> fmt, Args&&... args) {
            log(LogLevel::Trace, category, fmt, std::forward<Args>(args)...);
        }

        void trace(std::string_view category, const std::string& message,
                   const std::source_location& loc = std::source_location::current()) {
            log(LogLevel::Trace, category, message, loc);
        }

        template<typename... Args>
        void debug(std::string_view category, FormatString<std::type_identity_t<Args>...> fmt, Args&&... args) {
            log(LogLevel::Debug, category, fmt, std::forward<Args>(args)...);
        }

        void debug(std::string_view category, const std::string& message,
                   const std::source_location& loc = std::source_location::current()) {
            log(LogLevel::Debug, category, message, loc);
        }

        template<typename... Args>
        void info(std::string_view category, FormatString<std::type_identity_t<Args>...> fmt, Args&&... args) {
            log(LogLevel::Info, category, fmt, std::forward<Args>(args)...);
        }

        void info(std::string_view category, const std::string& message,
                  const std::source_location& loc = std::source_location::current()) {
            log(LogLevel::Info, category, message, loc);
        }

        template<typename... Args>
        void warning(std::string_view category, FormatString<std::type_identity_t<Args>...> fmt, Args&&... args) {
            log(LogLevel::Warning, category, fmt, std::forward<Args>(args)...);
        }

        void warning(std::string_view category, const std::string& message,
                     const std::source_location& loc = std::source_location::current()) {
            log(LogLevel::Warning, category, message, loc);
        }

        template<typename... Args>
        void error(std::string_view category, FormatString<std::type_identity_t<Args>...> fmt, Args&&... args) {
            log(LogLevel::Error, category, fmt, std::forward<Args>(args)...);
        }

        void error(std::string_view category, const std::string& message,
                   const std::source_location& loc = std::source_location::current()) {
            log(LogLevel::Error, category, message, loc);
        }

        template<typename... Args>
        void fatal(std::string_view category, FormatString<std::type_identity_t<Args>...> fmt, Args&&... args) {
            log(LogLevel::Fatal, category, fmt, std::forward<Args>(args)...);
            flush();
        }

        void fatal(std::string_view category, const std::string& message,
                   const std::source_location& loc = std::source_location::current()) {
            log(LogLevel::Fatal, category, message, loc);
            flush();
        }

        /// Flush every sink. Called automatically after Error and Fatal entries.
        void flush();

    private:
        void writeToSinks(const LogEntry& entry);
    };

} // namespace Logging
} // namespace Core
} // namespace MaestroEngine

/**
 * @brief Logging macros bound to the global logger
 *
 * The plain variants use the calling function's name as the category; the
 * _CAT variants take an explicit category. Both accept either a plain string
 * or a std::format string followed by its arguments.
 *
 * @code
 * MAESTRO_LOG_INFO_CAT("WorkflowRegistry", "Registered workflow '{}' ({} steps)", def.id, def.steps.size());
 * MAESTRO_LOG_WARNING("Deadline passed with no result");
 * @endcode
 */
#define MAESTRO_LOG_TRACE(fmt, ...) \
    ::MaestroEngine::Core::Logging::Logger::global().trace(__func__, fmt, ##__VA_ARGS__)

#define MAESTRO_LOG_DEBUG(fmt, ...) \
    ::MaestroEngine::Core::Logging::Logger::global().debug(__func__, fmt, ##__VA_ARGS__)

#define MAESTRO_LOG_INFO(fmt, ...) \
    ::MaestroEngine::Core::Logging::Logger::global().info(__func__, fmt, ##__VA_ARGS__)

#define MAESTRO_LOG_WARNING(fmt, ...) \
    ::MaestroEngine::Core::Logging::Logger::global().warning(__func__, fmt, ##__VA_ARGS__)

#define MAESTRO_LOG_ERROR(fmt, ...) \
    ::MaestroEngine::Core::Logging::Logger::global().error(__func__, fmt, ##__VA_ARGS__)

#define MAESTRO_LOG_FATAL(fmt, ...) \
    ::MaestroEngine::Core::Logging::Logger::global().fatal(__func__, fmt, ##__VA_ARGS__)

#define MAESTRO_LOG_TRACE_CAT(category, fmt, ...) \
    ::MaestroEngine::Core::Logging::Logger::global().trace(category, fmt, ##__VA_ARGS__)

#define MAESTRO_LOG_DEBUG_CAT(category, fmt, ...) \
    ::MaestroEngine::Core::Logging::Logger::global().debug(category, fmt, ##__VA_ARGS__)

#define MAESTRO_LOG_INFO_CAT(category, fmt, ...) \
    ::MaestroEngine::Core::Logging::Logger::global().info(category, fmt, ##__VA_ARGS__)

#define MAESTRO_LOG_WARNING_CAT(category, fmt, ...) \
    ::MaestroEngine::Core::Logging::Logger::global().warning(category, fmt, ##__VA_ARGS__)

#define MAESTRO_LOG_ERROR_CAT(category, fmt, ...) \
    ::MaestroEngine::Core::Logging::Logger::global().error(category, fmt, ##__VA_ARGS__)

#define MAESTRO_LOG_FATAL_CAT(category, fmt, ...) \
    ::MaestroEngine::Core::Logging::Logger::global().fatal(category, fmt, ##__VA_ARGS__)
