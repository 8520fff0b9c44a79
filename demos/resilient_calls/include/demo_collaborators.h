/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <tether/tether.h>

namespace demo
{
    // Stands in for a loading indicator: logs every claim change
    class console_spinner : public tether::i_spinner
    {
        std::shared_ptr<tether::i_tick_source> ticks_;

    public:
        explicit console_spinner(std::shared_ptr<tether::i_tick_source> ticks)
            : ticks_(std::move(ticks))
        {
        }

        void show(const void* owner) override
        {
            TETHER_INFO("[spinner] +{}ms shown for {}", ticks_->now().count(), owner);
        }
        void hide(const void* owner) override
        {
            TETHER_INFO("[spinner] +{}ms hidden for {}", ticks_->now().count(), owner);
        }
    };

    // Pretends to bring the network back after `delay`
    class simulated_resolver : public tether::i_connectivity_resolver
    {
        std::shared_ptr<tether::i_tick_source> ticks_;
        std::chrono::milliseconds delay_;

    public:
        simulated_resolver(std::shared_ptr<tether::i_tick_source> ticks, std::chrono::milliseconds delay)
            : ticks_(std::move(ticks))
            , delay_(delay)
        {
        }

        CORO_TASK(void) resolve(bool blocking) override
        {
            TETHER_WARNING("[resolver] reconnecting ({})", blocking ? "blocking" : "background");
            auto deadline = ticks_->now() + delay_;
            while (ticks_->now() < deadline)
                CO_AWAIT ticks_->next_tick();
            TETHER_INFO("[resolver] connectivity restored");
        }
    };

    class logging_user_data_sink : public tether::i_user_data_sink
    {
    public:
        void apply_user_data_update(const std::string& payload) override
        {
            TETHER_INFO("[app] user data updated: {}", payload);
        }
    };

    class logging_resource_sink : public tether::i_resource_sink
    {
    public:
        void apply_resource_update(const std::string& payload) override
        {
            TETHER_INFO("[app] resources updated: {}", payload);
        }
    };
}
