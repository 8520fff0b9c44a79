/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <tether/internal/types.h>

namespace tether
{
    const char* to_string(spinner_mode mode)
    {
        switch (mode)
        {
        case spinner_mode::invisible:
            return "invisible";
        case spinner_mode::after_timeout:
            return "after_timeout";
        case spinner_mode::instant:
            return "instant";
        }
        return "unknown";
    }

    const char* to_string(manager_state state)
    {
        switch (state)
        {
        case manager_state::idle:
            return "IDLE";
        case manager_state::processing:
            return "PROCESSING";
        case manager_state::timed_out:
            return "TIMED_OUT";
        case manager_state::error:
            return "ERROR";
        }
        return "UNKNOWN";
    }

    const char* to_string(timeout_phase phase)
    {
        switch (phase)
        {
        case timeout_phase::to_spinner:
            return "to_spinner";
        case timeout_phase::to_popup:
            return "to_popup";
        }
        return "unknown";
    }

    const char* to_string(connectivity_state state)
    {
        switch (state)
        {
        case connectivity_state::reachable:
            return "reachable";
        case connectivity_state::degraded:
            return "degraded";
        case connectivity_state::unreachable:
            return "unreachable";
        }
        return "unknown";
    }

    const char* to_string(call_status status)
    {
        switch (status)
        {
        case call_status::completed:
            return "completed";
        case call_status::faulted:
            return "faulted";
        case call_status::cancelled:
            return "cancelled";
        }
        return "unknown";
    }
}
