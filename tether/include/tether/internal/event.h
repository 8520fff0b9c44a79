/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <tether/internal/coroutine_support.h>

namespace tether
{
    class event
    {
    public:
        // Signal the event: resume every waiting coroutine
        void set() { event_.set(); }

        // Reset the event: future calls to wait() will suspend
        void reset() { event_.reset(); }

        bool is_set() const { return event_.is_set(); }

        // Suspend until the event is set
        CORO_TASK(void) wait() const { CO_AWAIT event_; }

    private:
        coro::event event_;
    };
}
