/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

// Timeout escalation and connectivity recovery of call_manager

#include <tether/internal/call_manager.h>
#include <tether/telemetry/i_telemetry_service.h>

namespace tether
{
    // Entry point of an escalation cycle, called for every dispatched call.
    // A running cycle is not restarted, it only picks up the freshly armed deadlines as extensions.
    void call_manager::time_out_flow()
    {
        arm_timeout(timeout_phase::to_spinner);
        arm_timeout(timeout_phase::to_popup);

        if (state_ != manager_state::idle)
            return;

        set_state(manager_state::processing);
        escalation_clock_ = std::make_shared<cancellation_source>();
        auto cycle = ++escalation_cycle_;

        if (!spawn(run_escalation(shared_from_this(), escalation_clock_, cycle)))
        {
            // nothing supervises the calls now, treat it as a fault
            show_spinner(false);
            set_state(manager_state::error);
        }
    }

    CORO_TASK(void)
    call_manager::run_escalation(
        std::shared_ptr<call_manager> keep_alive, std::shared_ptr<cancellation_source> clock, uint64_t cycle)
    {
        // let calls placed in the same tick register before the clock starts, so they do not each extend it
        CO_AWAIT options_.ticks->next_tick();

        CO_AWAIT time_out_or_finish(timeout_phase::to_spinner, clock, cycle);
        if (is_cycle_over(cycle))
            CO_RETURN;

        if (arbiter_.should_show(true))
            show_spinner(true);

        CO_AWAIT time_out_or_finish(timeout_phase::to_popup, clock, cycle);
        if (is_cycle_over(cycle))
            CO_RETURN;

        set_state(manager_state::timed_out);
        show_spinner(false);
        auto aborted = registry_.cancel_all_handles();
        TETHER_WARNING("calls timed out, aborted {} active attempts of {} pending calls", aborted, registry_.size());
        if (options_.telemetry)
        {
            options_.telemetry->on_timeout_declared(aborted);
            options_.telemetry->on_recovery_started();
        }

        CO_AWAIT options_.connectivity_resolver->resolve(true);

        // shutdown while the resolver was running
        if (shut_down_ || cycle != escalation_cycle_)
            CO_RETURN;

        initiate_reattempt();
    }

    /**
     * Counts down one phase, once per tick.
     * Leaves early when the clock is cancelled or the cycle is over. Resets the manager when every call has
     * concluded. Newly armed deadlines are added to the remaining time, so the countdown is extended but never
     * restarted.
     */
    CORO_TASK(void)
    call_manager::time_out_or_finish(timeout_phase phase, std::shared_ptr<cancellation_source> clock, uint64_t cycle)
    {
        if (clock->is_cancelled())
            CO_RETURN;

        auto remaining = get_pending_timeout(phase);
        set_pending_timeout(phase, std::chrono::milliseconds(0));

        while (remaining > std::chrono::milliseconds(0))
        {
            auto elapsed = CO_AWAIT options_.ticks->next_tick();

            auto additional = get_pending_timeout(phase);
            if (additional > std::chrono::milliseconds(0))
            {
                auto before = remaining;
                remaining += additional;
                set_pending_timeout(phase, std::chrono::milliseconds(0));
                TETHER_DEBUG("{} deadline extended from {}ms to {}ms", to_string(phase), before.count(), remaining.count());
                if (options_.telemetry)
                    options_.telemetry->on_timeout_extended(phase, before, remaining);
            }

            remaining -= elapsed;

            if (clock->is_cancelled() || is_cycle_over(cycle))
                CO_RETURN;

            if (registry_.empty())
            {
                TETHER_DEBUG("all calls concluded during the {} phase", to_string(phase));
                reset_manager();
                CO_RETURN;
            }
        }
    }

    bool call_manager::is_cycle_over(uint64_t cycle) const
    {
        return shut_down_ || cycle != escalation_cycle_ || state_ == manager_state::idle
               || state_ == manager_state::error;
    }

    void call_manager::arm_timeout(timeout_phase phase)
    {
        if (!options_.settings)
            return;
        if (phase == timeout_phase::to_spinner)
            pending_spinner_timeout_ = options_.settings->spinner_timeout();
        else
            pending_popup_timeout_ = options_.settings->popup_timeout();
    }

    std::chrono::milliseconds call_manager::get_pending_timeout(timeout_phase phase) const
    {
        return phase == timeout_phase::to_spinner ? pending_spinner_timeout_ : pending_popup_timeout_;
    }

    void call_manager::set_pending_timeout(timeout_phase phase, std::chrono::milliseconds value)
    {
        if (phase == timeout_phase::to_spinner)
            pending_spinner_timeout_ = value;
        else
            pending_popup_timeout_ = value;
    }

    void call_manager::reset_manager()
    {
        set_state(manager_state::idle);
        arbiter_.reset();
        arm_timeout(timeout_phase::to_spinner);
        arm_timeout(timeout_phase::to_popup);
        registry_.clear_handles();
        show_spinner(false);
    }

    // Replays every registered call after connectivity has been recovered and starts a new cycle over them
    void call_manager::initiate_reattempt()
    {
        set_state(manager_state::idle);

        auto ids = registry_.get_ids();
        uint64_t retried = 0;
        for (auto id : ids)
        {
            auto* envelope = registry_.find(id);
            if (!envelope)
                continue;

            TETHER_WARNING("retrying function {} call {} (attempt {})", envelope->name, id, envelope->attempts + 1);
            if (options_.telemetry)
                options_.telemetry->on_call_retried(id, envelope->name, envelope->attempts + 1);

            if (!spawn(execute(shared_from_this(), id)))
            {
                auto failed = registry_.take(id);
                if (failed)
                    failed->completion->resolve(error::SPAWN_FAILED(), {});
                continue;
            }
            ++retried;
        }

        arbiter_.force(spinner_mode::instant);
        show_spinner(true);
        if (options_.telemetry)
            options_.telemetry->on_recovery_finished(retried);

        time_out_flow();
    }

    void call_manager::cancel_escalation_clock()
    {
        if (escalation_clock_)
            escalation_clock_->cancel();
    }

    void call_manager::on_connectivity_changed(connectivity_state state)
    {
        if (state != connectivity_state::degraded && state != connectivity_state::unreachable)
            return;

        TETHER_WARNING("connectivity is {}, short circuiting the escalation clock", to_string(state));
        if (options_.telemetry)
            options_.telemetry->on_connectivity_fast_path(state);
        cancel_escalation_clock();
    }
}
