/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Maestro Core project.
 */

/**
 * @file Profiling.h
 * @brief Tracy profiler zones for the scheduler and the equilibrium solver
 *
 * With TRACY_ENABLE defined (CMake option MAESTRO_ENABLE_PROFILING) the
 * macros expand to Tracy instrumentation. Otherwise they expand to nothing.
 */

#pragma once

#ifdef TRACY_ENABLE
    #include <tracy/Tracy.hpp>
#endif

#include <cstdint>
#include <string_view>

namespace MaestroEngine {
namespace Core {
namespace Debug {

    /**
     * @brief Profiling macros
     *
     * @code
     * void WorkflowScheduler::run() {
     *     MAESTRO_PROFILE_ZONE();
     *     ...
     *     {
     *         MAESTRO_PROFILE_ZONE_NC("Rollback", ProfileColors::Rollback);
     *         _rollback.run(...);
     *     }
     * }
     * @endcode
     */
    #ifdef TRACY_ENABLE
        #define MAESTRO_PROFILE_ZONE() ZoneScoped
        #define MAESTRO_PROFILE_ZONE_N(name) ZoneScopedN(name)
        #define MAESTRO_PROFILE_ZONE_NC(name, color) ZoneScopedNC(name, color)
        #define MAESTRO_PROFILE_ZONE_TEXT(text, size) ZoneText(text, size)

        #define MAESTRO_PROFILE_PLOT(name, val) TracyPlot(name, val)
        #define MAESTRO_PROFILE_MESSAGE(txt, size) TracyMessage(txt, size)
    #else
        #define MAESTRO_PROFILE_ZONE()
        #define MAESTRO_PROFILE_ZONE_N(name)
        #define MAESTRO_PROFILE_ZONE_NC(name, color)
        #define MAESTRO_PROFILE_ZONE_TEXT(text, size)

        #define MAESTRO_PROFILE_PLOT(name, val)
        #define MAESTRO_PROFILE_MESSAGE(txt, size)
    #endif

    /// Zone colors per subsystem, for MAESTRO_PROFILE_ZONE_NC
    namespace ProfileColors {
        constexpr uint32_t Scheduler = 0x4444FF;
        constexpr uint32_t StepWork = 0x44FF44;
        constexpr uint32_t Rollback = 0xFF4444;
        constexpr uint32_t Equilibrium = 0xFFFF44;
        constexpr uint32_t History = 0x44FFFF;
    }

} // namespace Debug
} // namespace Core
} // namespace MaestroEngine
