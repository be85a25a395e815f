/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

/**
 * @file INamed.h
 * @brief Debug names for long-lived engine objects
 */

#pragma once

#include <mutex>
#include <string>
#include <string_view>

namespace MaestroEngine {
namespace Core {
namespace Debug {

    /**
     * @brief Interface for objects that carry a human-readable debug name
     *
     * Registries and selectors put their name in log lines so output from
     * several instances in one process can be told apart.
     */
    class INamed {
    public:
        virtual ~INamed() = default;

        virtual void setName(std::string_view name) = 0;

        /// @return The current name; empty if unnamed
        [[nodiscard]] virtual std::string getName() const = 0;

        [[nodiscard]] virtual bool hasName() const {
            return !getName().empty();
        }
    };

    /**
     * @brief Thread-safe INamed implementation to inherit from
     *
     * getName() returns a copy because the name may be changed while worker
     * threads are logging with it.
     *
     * @code
     * class WorkflowRegistry : public Debug::Named {
     * public:
     *     WorkflowRegistry() : Named("WorkflowRegistry") {}
     * };
     * @endcode
     */
    class Named : public virtual INamed {
    private:
        mutable std::mutex _nameMutex;
        std::string _name;

    public:
        Named() = default;
        explicit Named(std::string_view name) : _name(name) {}

        void setName(std::string_view name) override {
            std::lock_guard<std::mutex> lock(_nameMutex);
            _name = name;
        }

        [[nodiscard]] std::string getName() const override {
            std::lock_guard<std::mutex> lock(_nameMutex);
            return _name;
        }
    };

} // namespace Debug
} // namespace Core
} // namespace MaestroEngine
