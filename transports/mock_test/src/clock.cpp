/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <transports/mock_test/clock.h>

namespace tether::mock_test
{
    simulated_tick_source::simulated_tick_source(std::chrono::milliseconds step)
        : step_(step)
        , current_tick_(std::make_shared<event>())
    {
        if (step_ < std::chrono::milliseconds(1))
            step_ = std::chrono::milliseconds(1);
    }

    CORO_TASK(std::chrono::milliseconds) simulated_tick_source::next_tick()
    {
        auto tick = current_tick_;
        waiter_count_++;
        CO_AWAIT tick->wait();
        CO_RETURN step_;
    }

    void simulated_tick_source::advance()
    {
        // waiters resumed below queue up on the fresh event
        auto tick = std::move(current_tick_);
        current_tick_ = std::make_shared<event>();
        waiter_count_ = 0;
        now_ += step_;
        tick_count_++;
        tick->set();
    }
}
