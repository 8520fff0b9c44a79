/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <tether/internal/types.h>

#define I_TELEMETRY_LEVEL_TRACE 0
#define I_TELEMETRY_LEVEL_DEBUG 1
#define I_TELEMETRY_LEVEL_INFO 2
#define I_TELEMETRY_LEVEL_WARN 3
#define I_TELEMETRY_LEVEL_ERROR 4
#define I_TELEMETRY_LEVEL_CRITICAL 5
#define I_TELEMETRY_LEVEL_OFF 6

namespace tether
{
    class i_telemetry_service
    {
    public:
        enum level_enum
        {
            trace = I_TELEMETRY_LEVEL_TRACE,
            debug = I_TELEMETRY_LEVEL_DEBUG,
            info = I_TELEMETRY_LEVEL_INFO,
            warn = I_TELEMETRY_LEVEL_WARN,
            err = I_TELEMETRY_LEVEL_ERROR,
            critical = I_TELEMETRY_LEVEL_CRITICAL,
            off = I_TELEMETRY_LEVEL_OFF,
            n_levels
        };
        virtual ~i_telemetry_service() = default;

        // call lifecycle
        virtual void on_call_registered(uint64_t call_id, const std::string& name, spinner_mode mode) const = 0;
        virtual void on_call_started(uint64_t call_id, const std::string& name, uint32_t attempt) const = 0;
        virtual void on_call_completed(uint64_t call_id, const std::string& name) const = 0;
        virtual void on_call_faulted(uint64_t call_id, const std::string& name, int error_code) const = 0;
        virtual void on_call_cancelled(uint64_t call_id, const std::string& name) const = 0;
        virtual void on_call_retried(uint64_t call_id, const std::string& name, uint32_t attempt) const = 0;

        // escalation
        virtual void on_state_change(manager_state old_state, manager_state new_state) const = 0;
        virtual void on_spinner_visibility(bool visible) const = 0;
        virtual void on_timeout_extended(
            timeout_phase phase, std::chrono::milliseconds before, std::chrono::milliseconds after) const
            = 0;
        virtual void on_timeout_declared(uint64_t aborted_handles) const = 0;
        virtual void on_connectivity_fast_path(connectivity_state state) const = 0;
        virtual void on_recovery_started() const = 0;
        virtual void on_recovery_finished(uint64_t retried_calls) const = 0;

        virtual void message(level_enum level, const std::string& message) const = 0;
    };
}
