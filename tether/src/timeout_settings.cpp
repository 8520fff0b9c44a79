/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <tether/internal/logger.h>
#include <tether/internal/timeout_settings.h>

namespace tether
{
    static_timeout_settings::static_timeout_settings()
        : spinner_timeout_(default_spinner_timeout)
        , popup_timeout_(default_popup_timeout)
    {
    }

    static_timeout_settings::static_timeout_settings(
        std::chrono::milliseconds spinner_timeout, std::chrono::milliseconds popup_timeout)
        : static_timeout_settings()
    {
        set_spinner_timeout(spinner_timeout);
        set_popup_timeout(popup_timeout);
    }

    bool static_timeout_settings::set_spinner_timeout(std::chrono::milliseconds value)
    {
        if (value.count() <= 0)
        {
            TETHER_WARNING("rejected spinner timeout of {}ms, keeping {}ms", value.count(), spinner_timeout_.count());
            return false;
        }
        spinner_timeout_ = value;
        return true;
    }

    bool static_timeout_settings::set_popup_timeout(std::chrono::milliseconds value)
    {
        if (value.count() <= 0)
        {
            TETHER_WARNING("rejected popup timeout of {}ms, keeping {}ms", value.count(), popup_timeout_.count());
            return false;
        }
        popup_timeout_ = value;
        return true;
    }
}
