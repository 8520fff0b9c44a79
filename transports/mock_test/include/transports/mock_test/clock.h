/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <chrono>
#include <memory>

#include <tether/internal/event.h>
#include <tether/internal/tick_source.h>

namespace tether::mock_test
{
    // Tick source whose time only moves when the test advances it.
    // Every coroutine waiting in next_tick() is resumed, inline, by advance().
    class simulated_tick_source : public i_tick_source
    {
        std::chrono::milliseconds step_;
        std::chrono::milliseconds now_{0};
        std::shared_ptr<event> current_tick_;
        size_t waiter_count_ = 0;
        uint64_t tick_count_ = 0;

    public:
        explicit simulated_tick_source(std::chrono::milliseconds step = std::chrono::milliseconds(10));

        CORO_TASK(std::chrono::milliseconds) next_tick() override;
        std::chrono::milliseconds now() const override { return now_; }

        // completes one tick of `step` milliseconds
        void advance();

        std::chrono::milliseconds get_step() const { return step_; }
        size_t get_waiter_count() const { return waiter_count_; }
        uint64_t get_tick_count() const { return tick_count_; }
    };
}
