/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

/**
 * @file call_manager.h
 * @brief Resilient remote call orchestration
 *
 * The call_manager dispatches remote calls to an i_backend_transport and supervises them with a two phase
 * escalation clock:
 *
 *   IDLE → PROCESSING → (spinner phase elapses, spinner shown) → (popup phase elapses) → TIMED_OUT
 *
 * If every registered call concludes before a phase elapses the manager returns to IDLE. On TIMED_OUT every
 * active attempt is aborted, the connectivity resolver is awaited and every registered call is replayed, after
 * which a new escalation cycle starts. A backend fault moves the manager to ERROR, which stops the escalation
 * machinery until acknowledge_error() is called.
 *
 * Threading:
 * - Every member is touched from the single thread that pumps the io_scheduler, there is no locking.
 * - Suspension points are: awaiting a backend invocation, awaiting a transaction family, awaiting a tick.
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <tether/internal/call_registry.h>
#include <tether/internal/cancellation.h>
#include <tether/internal/collaborators.h>
#include <tether/internal/coroutine_support.h>
#include <tether/internal/error_codes.h>
#include <tether/internal/event.h>
#include <tether/internal/logger.h>
#include <tether/internal/spinner_arbiter.h>
#include <tether/internal/tick_source.h>
#include <tether/internal/timeout_settings.h>
#include <tether/internal/transaction_lock.h>
#include <tether/internal/types.h>

namespace tether
{
    class i_telemetry_service;

    class call_manager : public i_connectivity_listener, public std::enable_shared_from_this<call_manager>
    {
    public:
        struct options
        {
            // required
            std::shared_ptr<i_backend_transport> transport;
            std::shared_ptr<i_connectivity_resolver> connectivity_resolver;
            std::shared_ptr<i_timeout_settings> settings;
            std::shared_ptr<i_tick_source> ticks;

            // optional
            std::shared_ptr<i_connectivity_monitor> connectivity_monitor;
            std::shared_ptr<i_spinner> spinner;
            std::shared_ptr<i_user_data_sink> user_data;
            std::shared_ptr<i_resource_sink> resources;
            std::shared_ptr<i_telemetry_service> telemetry;
        };

    private:
        // shared between an invocation coroutine and the attempt awaiting it, whichever concludes first wins
        struct pending_invocation
        {
            bool concluded = false;
            call_outcome outcome;
            event done;
        };

        std::shared_ptr<coro::io_scheduler> scheduler_;
        options options_;

        call_registry registry_;
        transaction_lock transactions_;
        spinner_arbiter arbiter_;

        manager_state state_ = manager_state::idle;
        bool initialised_ = false;
        bool shut_down_ = false;
        bool spinner_visible_ = false;

        // cancelled to short circuit the running escalation cycle
        std::shared_ptr<cancellation_source> escalation_clock_;
        // generation of the running escalation cycle, superseded cycles exit at their next check point
        uint64_t escalation_cycle_ = 0;

        // deadlines armed by the most recent call, a running phase consumes them as extensions
        std::chrono::milliseconds pending_spinner_timeout_{0};
        std::chrono::milliseconds pending_popup_timeout_{0};

        call_manager(std::shared_ptr<coro::io_scheduler> scheduler, options opts);

        // dispatch
        CORO_TASK(void) execute(std::shared_ptr<call_manager> keep_alive, uint64_t call_id);
        CORO_TASK(call_outcome)
        invoke_or_cancel(
            function_descriptor descriptor, function_parameters parameters, std::shared_ptr<cancellation_source> handle);
        static CORO_TASK(void) run_invocation(std::shared_ptr<i_backend_transport> transport,
            std::string name,
            function_descriptor descriptor,
            function_parameters parameters,
            cancellation_token token,
            std::shared_ptr<pending_invocation> pending);
        CORO_TASK(void)
        forget(std::shared_ptr<call_manager> keep_alive,
            std::string name,
            function_descriptor descriptor,
            function_parameters parameters);
        void react_to_base_payload(const function_response& response);

        // escalation
        void time_out_flow();
        CORO_TASK(void)
        run_escalation(
            std::shared_ptr<call_manager> keep_alive, std::shared_ptr<cancellation_source> clock, uint64_t cycle);
        CORO_TASK(void)
        time_out_or_finish(timeout_phase phase, std::shared_ptr<cancellation_source> clock, uint64_t cycle);
        bool is_cycle_over(uint64_t cycle) const;
        void arm_timeout(timeout_phase phase);
        std::chrono::milliseconds get_pending_timeout(timeout_phase phase) const;
        void set_pending_timeout(timeout_phase phase, std::chrono::milliseconds value);
        void reset_manager();

        // recovery
        void initiate_reattempt();
        void cancel_escalation_clock();

        void update_spinner_mode(spinner_mode mode);
        void show_spinner(bool show);
        void set_state(manager_state new_state);
        bool spawn(CORO_TASK(void) task);

    public:
        static std::shared_ptr<call_manager> create(std::shared_ptr<coro::io_scheduler> scheduler, options opts);
        virtual ~call_manager();

        call_manager(const call_manager&) = delete;
        call_manager& operator=(const call_manager&) = delete;

        // lifecycle
        int init();
        void shutdown();
        // leaves the ERROR state, calls still registered are supervised by a fresh escalation cycle
        void acknowledge_error();

        /**
         * Calls the backend, wrapped in the escalation flow. If connectivity problems are detected the call is
         * aborted and replayed once they are resolved, the caller only sees the final outcome.
         * Transaction calls first wait until no other call of their family is executing.
         * descriptor.name only has to stay valid until the call starts, the engine keeps its own copy.
         */
        CORO_TASK(int)
        call_resilient(function_descriptor descriptor,
            function_parameters parameters,
            spinner_mode mode,
            function_response& response);

        // No escalation, no spinner and no retry. Backend faults are logged silently.
        CORO_TASK(int)
        call_ignoring_issues(function_descriptor descriptor, function_parameters parameters, function_response& response);

        // spawns call_ignoring_issues without awaiting it, failures are logged
        bool call_detached(function_descriptor descriptor, function_parameters parameters);

        template<class T>
        CORO_TASK(int) call(function_parameters parameters, T& result, spinner_mode mode = spinner_mode::after_timeout)
        {
            function_response response;
            auto err = CO_AWAIT call_resilient(T::descriptor, std::move(parameters), mode, response);
            if (err != error::OK())
                CO_RETURN err;
            err = T::load(response, result);
            if (err != error::OK())
                TETHER_ERROR("unable to load the response of {}: {}", T::descriptor.name, error::to_string(err));
            CO_RETURN err;
        }

        template<class T> CORO_TASK(std::optional<T>) call_and_ignore_issues(function_parameters parameters = {})
        {
            static_assert(!T::descriptor.transaction, "transactions cannot ignore issues");
            function_response response;
            auto err = CO_AWAIT call_ignoring_issues(T::descriptor, std::move(parameters), response);
            if (err != error::OK())
                CO_RETURN std::nullopt;
            T result;
            err = T::load(response, result);
            if (err != error::OK())
            {
                TETHER_WARNING("unable to load the response of {}: {}", T::descriptor.name, error::to_string(err));
                CO_RETURN std::nullopt;
            }
            CO_RETURN result;
        }

        template<class T> bool call_and_forget(function_parameters parameters = {})
        {
            static_assert(!T::descriptor.transaction, "transactions cannot ignore issues");
            return call_detached(T::descriptor, std::move(parameters));
        }

        // i_connectivity_listener
        void on_connectivity_changed(connectivity_state state) override;

        manager_state get_state() const { return state_; }
        spinner_mode get_spinner_mode() const { return arbiter_.get_mode(); }
        bool is_spinner_visible() const { return spinner_visible_; }
        bool is_initialised() const { return initialised_; }
        size_t get_pending_call_count() const { return registry_.size(); }
        size_t get_active_handle_count() const { return registry_.get_handle_count(); }
        std::vector<call_snapshot> get_pending_calls() const { return registry_.get_snapshots(); }
        bool is_transaction_held(call_family family) const { return transactions_.is_held(family); }
        std::shared_ptr<coro::io_scheduler> get_scheduler() const { return scheduler_; }
    };
}
