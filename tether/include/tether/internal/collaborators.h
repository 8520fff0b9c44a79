/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <memory>
#include <string>

#include <tether/internal/cancellation.h>
#include <tether/internal/coroutine_support.h>
#include <tether/internal/types.h>

namespace tether
{
    // Performs the actual remote call. A transport that detects connectivity problems itself reports
    // call_status::cancelled, an application level failure is call_status::faulted.
    class i_backend_transport
    {
    public:
        virtual ~i_backend_transport() = default;
        virtual CORO_TASK(call_outcome) invoke(
            const function_descriptor& descriptor, const function_parameters& parameters, cancellation_token token)
            = 0;
    };

    class i_connectivity_listener
    {
    public:
        virtual ~i_connectivity_listener() = default;
        virtual void on_connectivity_changed(connectivity_state state) = 0;
    };

    class i_connectivity_monitor
    {
    public:
        virtual ~i_connectivity_monitor() = default;
        virtual void subscribe(std::weak_ptr<i_connectivity_listener> listener) = 0;
        virtual void unsubscribe(const i_connectivity_listener* listener) = 0;
    };

    // resolves a connectivity issue, typically by telling the user and waiting until the server is reachable
    class i_connectivity_resolver
    {
    public:
        virtual ~i_connectivity_resolver() = default;
        virtual CORO_TASK(void) resolve(bool blocking) = 0;
    };

    // loading indicator, claims are tracked per owner so that independent claimants can coexist
    class i_spinner
    {
    public:
        virtual ~i_spinner() = default;
        virtual void show(const void* owner) = 0;
        virtual void hide(const void* owner) = 0;
    };

    class i_user_data_sink
    {
    public:
        virtual ~i_user_data_sink() = default;
        virtual void apply_user_data_update(const std::string& payload) = 0;
    };

    class i_resource_sink
    {
    public:
        virtual ~i_resource_sink() = default;
        virtual void apply_resource_update(const std::string& payload) = 0;
    };
}
