/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <gmock/gmock.h>

#include <tether/internal/collaborators.h>
#include <tether/internal/tick_source.h>
#include <tether/telemetry/i_telemetry_service.h>

namespace tether::test
{
    // Records every show/hide with the simulated time it happened at
    class fake_spinner : public i_spinner
    {
    public:
        struct transition
        {
            bool visible;
            const void* owner;
            std::chrono::milliseconds at;
        };

    private:
        std::shared_ptr<i_tick_source> ticks_;
        std::vector<transition> transitions_;
        bool visible_ = false;

    public:
        explicit fake_spinner(std::shared_ptr<i_tick_source> ticks);

        void show(const void* owner) override;
        void hide(const void* owner) override;

        bool is_visible() const { return visible_; }
        size_t get_show_count() const;
        const std::vector<transition>& get_transitions() const { return transitions_; }
        // time of the first show, or -1ms if never shown
        std::chrono::milliseconds first_shown_at() const;
    };

    // Counts resolve requests, optionally taking `delay` of simulated time to resolve
    class fake_connectivity_resolver : public i_connectivity_resolver
    {
        std::shared_ptr<i_tick_source> ticks_;
        std::chrono::milliseconds delay_{0};
        std::vector<std::chrono::milliseconds> requested_at_;
        std::vector<bool> blocking_;

    public:
        explicit fake_connectivity_resolver(std::shared_ptr<i_tick_source> ticks);

        CORO_TASK(void) resolve(bool blocking) override;

        void set_delay(std::chrono::milliseconds delay) { delay_ = delay; }
        size_t get_resolve_count() const { return requested_at_.size(); }
        const std::vector<std::chrono::milliseconds>& get_requested_at() const { return requested_at_; }
        const std::vector<bool>& get_blocking() const { return blocking_; }
    };

    class fake_connectivity_monitor : public i_connectivity_monitor
    {
        std::vector<std::weak_ptr<i_connectivity_listener>> listeners_;

    public:
        void subscribe(std::weak_ptr<i_connectivity_listener> listener) override;
        void unsubscribe(const i_connectivity_listener* listener) override;

        void notify(connectivity_state state);
        size_t get_listener_count() const { return listeners_.size(); }
    };

    class mock_user_data_sink : public i_user_data_sink
    {
    public:
        MOCK_METHOD(void, apply_user_data_update, (const std::string& payload), (override));
    };

    class mock_resource_sink : public i_resource_sink
    {
    public:
        MOCK_METHOD(void, apply_resource_update, (const std::string& payload), (override));
    };

    // Keeps the engine events a test wants to assert on
    class recording_telemetry_service : public i_telemetry_service
    {
    public:
        struct extension
        {
            timeout_phase phase;
            std::chrono::milliseconds before;
            std::chrono::milliseconds after;
        };

    private:
        mutable std::vector<std::pair<manager_state, manager_state>> state_changes_;
        mutable std::vector<extension> extensions_;
        mutable std::vector<uint64_t> timeouts_declared_;
        mutable std::vector<std::pair<uint64_t, uint32_t>> retries_;
        mutable std::vector<uint64_t> recoveries_finished_;
        mutable std::vector<connectivity_state> fast_paths_;
        mutable std::vector<int> faults_;
        mutable uint64_t recoveries_started_ = 0;
        mutable uint64_t registered_ = 0;
        mutable uint64_t completed_ = 0;

    public:
        void on_call_registered(uint64_t call_id, const std::string& name, spinner_mode mode) const override;
        void on_call_started(uint64_t call_id, const std::string& name, uint32_t attempt) const override;
        void on_call_completed(uint64_t call_id, const std::string& name) const override;
        void on_call_faulted(uint64_t call_id, const std::string& name, int error_code) const override;
        void on_call_cancelled(uint64_t call_id, const std::string& name) const override;
        void on_call_retried(uint64_t call_id, const std::string& name, uint32_t attempt) const override;
        void on_state_change(manager_state old_state, manager_state new_state) const override;
        void on_spinner_visibility(bool visible) const override;
        void on_timeout_extended(
            timeout_phase phase, std::chrono::milliseconds before, std::chrono::milliseconds after) const override;
        void on_timeout_declared(uint64_t aborted_handles) const override;
        void on_connectivity_fast_path(connectivity_state state) const override;
        void on_recovery_started() const override;
        void on_recovery_finished(uint64_t retried_calls) const override;
        void message(level_enum level, const std::string& message) const override;

        const std::vector<std::pair<manager_state, manager_state>>& get_state_changes() const { return state_changes_; }
        const std::vector<extension>& get_extensions() const { return extensions_; }
        const std::vector<uint64_t>& get_timeouts_declared() const { return timeouts_declared_; }
        const std::vector<std::pair<uint64_t, uint32_t>>& get_retries() const { return retries_; }
        const std::vector<uint64_t>& get_recoveries_finished() const { return recoveries_finished_; }
        const std::vector<connectivity_state>& get_fast_paths() const { return fast_paths_; }
        const std::vector<int>& get_faults() const { return faults_; }
        uint64_t get_recoveries_started() const { return recoveries_started_; }
        uint64_t get_registered_count() const { return registered_; }
        uint64_t get_completed_count() const { return completed_; }
        bool has_entered(manager_state state) const;
    };
}
