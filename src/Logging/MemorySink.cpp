/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

#include "MemorySink.h"
#include <stdexcept>

namespace MaestroEngine {
namespace Core {
namespace Logging {

    MemorySink::MemorySink(size_t capacity)
        : _capacity(capacity) {
        if (_capacity == 0) {
            throw std::invalid_argument("MemorySink capacity must be greater than zero");
        }
    }

    void MemorySink::write(const LogEntry& entry) {
        if (!shouldLog(entry.level)) return;

        std::lock_guard<std::mutex> lock(_mutex);
        if (_entries.size() >= _capacity) {
            _entries.pop_front();
            _dropped++;
        }
        _entries.push_back(entry);
    }

    bool MemorySink::shouldLog(LogLevel level) const {
        return level >= _minLevel.load(std::memory_order_relaxed);
    }

    void MemorySink::setMinLevel(LogLevel level) {
        _minLevel.store(level, std::memory_order_relaxed);
    }

    std::vector<LogEntry> MemorySink::entries() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return {_entries.begin(), _entries.end()};
    }

    std::vector<LogEntry> MemorySink::entriesForCategory(std::string_view category) const {
        std::lock_guard<std::mutex> lock(_mutex);
        std::vector<LogEntry> result;
        for (const auto& entry : _entries) {
            if (entry.category == category) {
                result.push_back(entry);
            }
        }
        return result;
    }

    bool MemorySink::contains(std::string_view needle) const {
        std::lock_guard<std::mutex> lock(_mutex);
        for (const auto& entry : _entries) {
            if (entry.message.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    size_t MemorySink::size() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _entries.size();
    }

    size_t MemorySink::droppedCount() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _dropped;
    }

    void MemorySink::clear() {
        std::lock_guard<std::mutex> lock(_mutex);
        _entries.clear();
        _dropped = 0;
    }

} // namespace Logging
} // namespace Core
} // namespace MaestroEngine
