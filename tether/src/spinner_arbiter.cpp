/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <tether/internal/spinner_arbiter.h>

namespace tether
{
    bool spinner_arbiter::update(spinner_mode requested)
    {
        if (requested > mode_)
            mode_ = requested;
        return mode_ == spinner_mode::instant;
    }

    bool spinner_arbiter::should_show(bool spinner_phase_elapsed) const
    {
        switch (mode_)
        {
        case spinner_mode::instant:
            return true;
        case spinner_mode::after_timeout:
            return spinner_phase_elapsed;
        case spinner_mode::invisible:
            return false;
        }
        return false;
    }
}
