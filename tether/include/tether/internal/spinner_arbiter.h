/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <tether/internal/types.h>

namespace tether
{
    // Merges the spinner preferences of all contributing calls into one effective mode.
    // The mode only rises within an escalation cycle, reset() is the only way down.
    class spinner_arbiter
    {
        spinner_mode mode_ = spinner_mode::invisible;

    public:
        // raises the effective mode to at least `requested`, returns true if the spinner must now be shown
        bool update(spinner_mode requested);
        void force(spinner_mode mode) { mode_ = mode; }
        void reset() { mode_ = spinner_mode::invisible; }

        spinner_mode get_mode() const { return mode_; }

        // whether the indicator should be visible given the progress of the escalation cycle
        bool should_show(bool spinner_phase_elapsed) const;
    };
}
