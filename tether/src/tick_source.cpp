/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <tether/internal/logger.h>
#include <tether/internal/tick_source.h>

namespace tether
{
    scheduler_tick_source::scheduler_tick_source(
        std::shared_ptr<coro::io_scheduler> scheduler, std::chrono::milliseconds resolution)
        : scheduler_(std::move(scheduler))
        , resolution_(resolution)
        , epoch_(std::chrono::steady_clock::now())
    {
        // a zero length tick would never let a phase deadline elapse
        if (resolution_ < std::chrono::milliseconds(1))
        {
            TETHER_WARNING("tick resolution of {}ms is too small, using 1ms", resolution_.count());
            resolution_ = std::chrono::milliseconds(1);
        }
    }

    CORO_TASK(std::chrono::milliseconds) scheduler_tick_source::next_tick()
    {
        auto start = std::chrono::steady_clock::now();
        CO_AWAIT scheduler_->schedule_after(resolution_);
        CO_RETURN std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    }

    std::chrono::milliseconds scheduler_tick_source::now() const
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - epoch_);
    }
}
