/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <tether/internal/call_manager.h>
#include <tether/telemetry/i_telemetry_service.h>

namespace tether
{
    call_manager::call_manager(std::shared_ptr<coro::io_scheduler> scheduler, options opts)
        : scheduler_(std::move(scheduler))
        , options_(std::move(opts))
        , transactions_(options_.ticks)
    {
    }

    std::shared_ptr<call_manager> call_manager::create(std::shared_ptr<coro::io_scheduler> scheduler, options opts)
    {
        return std::shared_ptr<call_manager>(new call_manager(std::move(scheduler), std::move(opts)));
    }

    call_manager::~call_manager()
    {
        if (!registry_.empty())
            TETHER_WARNING("call_manager destroyed with {} pending calls", registry_.size());
    }

    int call_manager::init()
    {
        if (shut_down_)
            return error::ENGINE_SHUTDOWN();
        if (initialised_)
            return error::OK();

        if (!scheduler_ || !options_.transport || !options_.connectivity_resolver || !options_.settings
            || !options_.ticks)
        {
            TETHER_ERROR("call_manager::init failed, scheduler, transport, connectivity resolver, settings and tick "
                         "source are all required");
            return error::NOT_INITIALISED();
        }

        registry_.reset_ids();
        arm_timeout(timeout_phase::to_spinner);
        arm_timeout(timeout_phase::to_popup);

        if (options_.connectivity_monitor)
            options_.connectivity_monitor->subscribe(std::static_pointer_cast<i_connectivity_listener>(shared_from_this()));

        initialised_ = true;
        TETHER_DEBUG("call_manager initialised");
        return error::OK();
    }

    void call_manager::shutdown()
    {
        if (shut_down_)
            return;
        shut_down_ = true;
        TETHER_INFO("call_manager shutting down with {} pending calls", registry_.size());

        if (options_.connectivity_monitor && initialised_)
            options_.connectivity_monitor->unsubscribe(this);

        // invalidates any running escalation cycle, including one waiting on the connectivity resolver
        ++escalation_cycle_;
        cancel_escalation_clock();
        registry_.cancel_all_handles();

        auto envelopes = registry_.take_all();
        for (auto& envelope : envelopes)
        {
            envelope.completion->resolve(error::ENGINE_SHUTDOWN(), {});
        }

        set_state(manager_state::idle);
        arbiter_.reset();
        show_spinner(false);
    }

    void call_manager::acknowledge_error()
    {
        if (state_ != manager_state::error)
            return;

        TETHER_INFO("error acknowledged, {} calls still registered", registry_.size());
        set_state(manager_state::idle);
        arbiter_.reset();
        // a call issued while in error may have claimed the spinner, surviving instant calls claim it again below
        show_spinner(false);
        if (!registry_.empty())
        {
            // the surviving calls need supervision again, anything stuck waiting is replayed on the next timeout
            for (auto id : registry_.get_ids())
            {
                auto* envelope = registry_.find(id);
                if (envelope && arbiter_.update(envelope->requested_mode))
                    show_spinner(true);
            }
            time_out_flow();
        }
    }

    CORO_TASK(int)
    call_manager::call_resilient(
        function_descriptor descriptor, function_parameters parameters, spinner_mode mode, function_response& response)
    {
        if (shut_down_)
            CO_RETURN error::ENGINE_SHUTDOWN();
        if (!initialised_)
            CO_RETURN error::NOT_INITIALISED();

        // the caller's name may not outlive the first suspension
        std::string name = descriptor.name;
        descriptor.name = name.c_str();

        TETHER_INFO("calling function {} with spinner mode {}", descriptor.name, to_string(mode));

        transaction_guard guard;
        if (descriptor.transaction)
        {
            CO_AWAIT transactions_.acquire(descriptor.family);
            guard = transaction_guard(transactions_, descriptor.family);
            if (shut_down_)
                CO_RETURN error::ENGINE_SHUTDOWN();
        }

        update_spinner_mode(mode);

        auto& envelope = registry_.add(descriptor, std::move(parameters), mode);
        auto call_id = envelope.id;
        auto completion = envelope.completion;
        if (options_.telemetry)
            options_.telemetry->on_call_registered(call_id, descriptor.name, mode);

        // while timed out the call waits for the replay that follows connectivity recovery
        if (state_ != manager_state::timed_out)
        {
            if (!spawn(execute(shared_from_this(), call_id)))
            {
                registry_.remove(call_id);
                CO_RETURN error::SPAWN_FAILED();
            }
            time_out_flow();
        }

        CO_AWAIT completion->wait();

        auto err = completion->get_error_code();
        if (err != error::OK())
            CO_RETURN err;

        response = std::move(completion->get_response());
        react_to_base_payload(response);
        CO_RETURN error::OK();
    }

    CORO_TASK(int)
    call_manager::call_ignoring_issues(
        function_descriptor descriptor, function_parameters parameters, function_response& response)
    {
        if (shut_down_)
            CO_RETURN error::ENGINE_SHUTDOWN();
        if (!initialised_)
            CO_RETURN error::NOT_INITIALISED();

        if (descriptor.transaction)
        {
            TETHER_ERROR("transactions cannot ignore issues, call to {} rejected", descriptor.name);
            CO_RETURN error::INVALID_USAGE();
        }

        std::string name = descriptor.name;
        descriptor.name = name.c_str();

        TETHER_INFO("calling function {} without treating issues", descriptor.name);

        // independent handle, never part of the cancellation set so a timeout does not abort it
        auto handle = std::make_shared<cancellation_source>();
        auto outcome = CO_AWAIT invoke_or_cancel(descriptor, std::move(parameters), handle);

        switch (outcome.status)
        {
        case call_status::completed:
            response = std::move(outcome.response);
            react_to_base_payload(response);
            CO_RETURN error::OK();

        case call_status::faulted:
        {
            auto err = outcome.error_code != error::OK() ? outcome.error_code : error::TRANSPORT_ERROR();
            TETHER_WARNING("silent error in {}: {} ({})", descriptor.name, outcome.fault_message, error::to_string(err));
            CO_RETURN err;
        }

        case call_status::cancelled:
            // only the transport cancels this handle, which it does when it suspects connectivity problems
            if (!shut_down_)
            {
                TETHER_WARNING("{} was cancelled by the backend, short circuiting the escalation clock", descriptor.name);
                cancel_escalation_clock();
            }
            CO_RETURN error::CALL_CANCELLED();
        }
        CO_RETURN error::CALL_CANCELLED();
    }

    bool call_manager::call_detached(function_descriptor descriptor, function_parameters parameters)
    {
        return spawn(forget(shared_from_this(), descriptor.name, descriptor, std::move(parameters)));
    }

    CORO_TASK(void)
    call_manager::forget(std::shared_ptr<call_manager> keep_alive,
        std::string name,
        function_descriptor descriptor,
        function_parameters parameters)
    {
        descriptor.name = name.c_str();
        function_response response;
        auto err = CO_AWAIT keep_alive->call_ignoring_issues(descriptor, std::move(parameters), response);
        if (err != error::OK())
            TETHER_WARNING("fire and forget call to {} failed: {}", descriptor.name, error::to_string(err));
    }

    CORO_TASK(void) call_manager::execute(std::shared_ptr<call_manager> keep_alive, uint64_t call_id)
    {
        auto* envelope = registry_.find(call_id);
        if (!envelope)
            CO_RETURN;

        envelope->attempts++;
        auto name = envelope->name;
        auto descriptor = envelope->descriptor;
        descriptor.name = name.c_str();
        auto parameters = envelope->parameters;
        auto attempt = envelope->attempts;

        auto handle = std::make_shared<cancellation_source>();
        registry_.add_handle(handle);
        if (options_.telemetry)
            options_.telemetry->on_call_started(call_id, descriptor.name, attempt);

        auto outcome = CO_AWAIT invoke_or_cancel(descriptor, std::move(parameters), handle);
        registry_.remove_handle(handle);

        switch (outcome.status)
        {
        case call_status::completed:
        {
            auto concluded = registry_.take(call_id);
            if (!concluded)
            {
                // resolved by shutdown in the meantime
                CO_RETURN;
            }
            TETHER_DEBUG("function {} call {} completed on attempt {}", descriptor.name, call_id, attempt);
            if (options_.telemetry)
                options_.telemetry->on_call_completed(call_id, descriptor.name);
            concluded->completion->resolve(error::OK(), std::move(outcome.response));
            break;
        }

        case call_status::faulted:
        {
            auto err = outcome.error_code != error::OK() ? outcome.error_code : error::TRANSPORT_ERROR();
            show_spinner(false);
            set_state(manager_state::error);
            cancel_escalation_clock();
            TETHER_ERROR("function {} call {} failed: {} ({})",
                descriptor.name,
                call_id,
                outcome.fault_message,
                error::to_string(err));
            if (options_.telemetry)
                options_.telemetry->on_call_faulted(call_id, descriptor.name, err);

            // the caller is released with the fault instead of being left suspended
            auto concluded = registry_.take(call_id);
            if (concluded)
                concluded->completion->resolve(err, {});
            break;
        }

        case call_status::cancelled:
            if (shut_down_)
                break;
            // the envelope stays registered, it is replayed once connectivity is recovered
            TETHER_WARNING("function {} call {} was cancelled, awaiting connectivity recovery", descriptor.name, call_id);
            if (options_.telemetry)
                options_.telemetry->on_call_cancelled(call_id, descriptor.name);
            // an aborted handle means the timeout cancelled it, the clock of the next cycle may already be running
            if (!handle->is_cancelled())
                cancel_escalation_clock();
            break;
        }
    }

    CORO_TASK(call_outcome)
    call_manager::invoke_or_cancel(
        function_descriptor descriptor, function_parameters parameters, std::shared_ptr<cancellation_source> handle)
    {
        auto pending = std::make_shared<pending_invocation>();
        auto callback_id = handle->on_cancel(
            [pending]()
            {
                if (pending->concluded)
                    return;
                pending->concluded = true;
                pending->outcome.status = call_status::cancelled;
                pending->outcome.error_code = error::CALL_CANCELLED();
                pending->done.set();
            });

        if (!pending->concluded
            && !spawn(run_invocation(
                options_.transport, descriptor.name, descriptor, std::move(parameters), handle->get_token(), pending)))
        {
            pending->concluded = true;
            pending->outcome.status = call_status::faulted;
            pending->outcome.error_code = error::SPAWN_FAILED();
            pending->outcome.fault_message = "unable to start the backend invocation";
            pending->done.set();
        }

        CO_AWAIT pending->done.wait();
        handle->remove_callback(callback_id);

        // continue on a later pass so that whoever concluded the invocation finishes first
        CO_AWAIT scheduler_->schedule();
        CO_RETURN std::move(pending->outcome);
    }

    CORO_TASK(void)
    call_manager::run_invocation(std::shared_ptr<i_backend_transport> transport,
        std::string name,
        function_descriptor descriptor,
        function_parameters parameters,
        cancellation_token token,
        std::shared_ptr<pending_invocation> pending)
    {
        // may outlive the call that spawned it
        descriptor.name = name.c_str();
        auto outcome = CO_AWAIT transport->invoke(descriptor, parameters, token);
        if (pending->concluded)
        {
            // aborted while in flight, the late outcome is dropped
            TETHER_DEBUG("dropping late {} outcome of aborted call to {}", to_string(outcome.status), descriptor.name);
            CO_RETURN;
        }
        pending->concluded = true;
        pending->outcome = std::move(outcome);
        pending->done.set();
    }

    void call_manager::react_to_base_payload(const function_response& response)
    {
        if (!response.user_data.empty() && options_.user_data)
            options_.user_data->apply_user_data_update(response.user_data);

        if (!response.resources.empty() && options_.resources)
            options_.resources->apply_resource_update(response.resources);
    }

    void call_manager::update_spinner_mode(spinner_mode mode)
    {
        if (arbiter_.update(mode))
            show_spinner(true);
    }

    void call_manager::show_spinner(bool show)
    {
        if (show == spinner_visible_)
            return;
        spinner_visible_ = show;

        if (options_.spinner)
        {
            if (show)
                options_.spinner->show(this);
            else
                options_.spinner->hide(this);
        }
        if (options_.telemetry)
            options_.telemetry->on_spinner_visibility(show);
    }

    void call_manager::set_state(manager_state new_state)
    {
        if (new_state == state_)
            return;
        auto old_state = state_;
        state_ = new_state;
        TETHER_DEBUG("call_manager state {} -> {}", to_string(old_state), to_string(new_state));
        if (options_.telemetry)
            options_.telemetry->on_state_change(old_state, new_state);
    }

    bool call_manager::spawn(CORO_TASK(void) task)
    {
        if (!scheduler_->spawn(std::move(task)))
        {
            TETHER_ERROR("call_manager unable to spawn a task on the io_scheduler");
            return false;
        }
        return true;
    }
}
