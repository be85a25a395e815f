/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

/**
 * @file MemorySink.h
 * @brief Bounded in-memory log sink
 */

#pragma once

#include "ILogSink.h"
#include <atomic>
#include <deque>
#include <mutex>
#include <string_view>
#include <vector>

namespace MaestroEngine {
namespace Core {
namespace Logging {

    /**
     * @brief Keeps the most recent log entries in a ring buffer
     *
     * Once capacity is reached the oldest entry is dropped for each new one.
     * Useful for attaching recent log context to a failure report, and for
     * asserting on log output in tests.
     *
     * @code
     * auto memory = std::make_shared<MemorySink>(256);
     * Logger::global().addSink(memory);
     *
     * registry.execute("deploy", input);
     * for (const auto& entry : memory->entriesForCategory("Rollback")) {
     *     report.append(entry.message);
     * }
     * @endcode
     */
    class MemorySink : public ILogSink {
    public:
        explicit MemorySink(size_t capacity = 1024);

        void write(const LogEntry& entry) override;
        void flush() override {}
        bool shouldLog(LogLevel level) const override;
        void setMinLevel(LogLevel level) override;

        /// Copy of all retained entries, oldest first
        std::vector<LogEntry> entries() const;

        /// Retained entries whose category equals @p category, oldest first
        std::vector<LogEntry> entriesForCategory(std::string_view category) const;

        /// @return true if any retained entry's message contains @p needle
        bool contains(std::string_view needle) const;

        size_t size() const;
        size_t capacity() const { return _capacity; }

        /// Number of entries dropped because the buffer was full
        size_t droppedCount() const;

        void clear();

    private:
        mutable std::mutex _mutex;
        std::deque<LogEntry> _entries;
        size_t _capacity;
        size_t _dropped = 0;
        std::atomic<LogLevel> _minLevel{LogLevel::Trace};
    };

} // namespace Logging
} // namespace Core
} // namespace MaestroEngine
