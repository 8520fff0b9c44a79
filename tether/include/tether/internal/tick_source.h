/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <chrono>
#include <memory>

#include <tether/internal/coroutine_support.h>

namespace tether
{
    // The scheduling "frame" used by the timeout phases and the transaction lock
    class i_tick_source
    {
    public:
        virtual ~i_tick_source() = default;

        // suspend for one tick and return how much time passed while suspended
        virtual CORO_TASK(std::chrono::milliseconds) next_tick() = 0;
        virtual std::chrono::milliseconds now() const = 0;
    };

    // real time ticks, one tick is a sleep of `resolution` on the io_scheduler
    class scheduler_tick_source : public i_tick_source
    {
        std::shared_ptr<coro::io_scheduler> scheduler_;
        std::chrono::milliseconds resolution_;
        std::chrono::steady_clock::time_point epoch_;

    public:
        explicit scheduler_tick_source(
            std::shared_ptr<coro::io_scheduler> scheduler, std::chrono::milliseconds resolution = std::chrono::milliseconds(10));

        CORO_TASK(std::chrono::milliseconds) next_tick() override;
        std::chrono::milliseconds now() const override;

        std::chrono::milliseconds get_resolution() const { return resolution_; }
    };
}
