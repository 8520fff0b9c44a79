/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <chrono>

namespace tether
{
    // source of the two escalation deadlines, queried at every cycle start and on every new call
    class i_timeout_settings
    {
    public:
        virtual ~i_timeout_settings() = default;
        virtual std::chrono::milliseconds spinner_timeout() const = 0;
        virtual std::chrono::milliseconds popup_timeout() const = 0;
    };

    class static_timeout_settings : public i_timeout_settings
    {
        std::chrono::milliseconds spinner_timeout_;
        std::chrono::milliseconds popup_timeout_;

    public:
        static constexpr std::chrono::milliseconds default_spinner_timeout{2000};
        static constexpr std::chrono::milliseconds default_popup_timeout{8000};

        static_timeout_settings();
        static_timeout_settings(std::chrono::milliseconds spinner_timeout, std::chrono::milliseconds popup_timeout);

        std::chrono::milliseconds spinner_timeout() const override { return spinner_timeout_; }
        std::chrono::milliseconds popup_timeout() const override { return popup_timeout_; }

        // non positive values are rejected and leave the previous value in place
        bool set_spinner_timeout(std::chrono::milliseconds value);
        bool set_popup_timeout(std::chrono::milliseconds value);
    };
}
