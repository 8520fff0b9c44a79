/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <tether/telemetry/console_telemetry_service.h>
#include <tether/telemetry/multiplexing_telemetry_service.h>

namespace tether
{
    std::shared_ptr<multiplexing_telemetry_service> multiplexing_telemetry_service::create(
        std::vector<std::shared_ptr<i_telemetry_service>>&& child_services)
    {
        // an empty multiplexer is allowed, children can be added later
        return std::make_shared<multiplexing_telemetry_service>(std::move(child_services));
    }

    multiplexing_telemetry_service::multiplexing_telemetry_service(
        std::vector<std::shared_ptr<i_telemetry_service>>&& child_services)
        : children_(std::move(child_services))
    {
    }

    void multiplexing_telemetry_service::add_child(std::shared_ptr<i_telemetry_service> child)
    {
        if (child)
            children_.push_back(std::move(child));
    }

    size_t multiplexing_telemetry_service::get_child_count() const
    {
        return children_.size();
    }

    void multiplexing_telemetry_service::clear_children()
    {
        children_.clear();
    }

    void multiplexing_telemetry_service::register_service_config(
        const std::string& type, const std::filesystem::path& output_path)
    {
        service_configs_.emplace_back(type, output_path);
    }

    void multiplexing_telemetry_service::start_test(const std::string& test_suite_name, const std::string& name)
    {
        children_.clear();
        for (const auto& config : service_configs_)
        {
            std::shared_ptr<i_telemetry_service> service;
            if (config.first == "console")
            {
                if (console_telemetry_service::create(service, test_suite_name, name, config.second))
                    children_.push_back(service);
            }
        }
    }

    void multiplexing_telemetry_service::reset_for_test()
    {
        children_.clear();
    }

    void multiplexing_telemetry_service::on_call_registered(uint64_t call_id, const std::string& name, spinner_mode mode) const
    {
        for (const auto& child : children_)
            child->on_call_registered(call_id, name, mode);
    }

    void multiplexing_telemetry_service::on_call_started(uint64_t call_id, const std::string& name, uint32_t attempt) const
    {
        for (const auto& child : children_)
            child->on_call_started(call_id, name, attempt);
    }

    void multiplexing_telemetry_service::on_call_completed(uint64_t call_id, const std::string& name) const
    {
        for (const auto& child : children_)
            child->on_call_completed(call_id, name);
    }

    void multiplexing_telemetry_service::on_call_faulted(uint64_t call_id, const std::string& name, int error_code) const
    {
        for (const auto& child : children_)
            child->on_call_faulted(call_id, name, error_code);
    }

    void multiplexing_telemetry_service::on_call_cancelled(uint64_t call_id, const std::string& name) const
    {
        for (const auto& child : children_)
            child->on_call_cancelled(call_id, name);
    }

    void multiplexing_telemetry_service::on_call_retried(uint64_t call_id, const std::string& name, uint32_t attempt) const
    {
        for (const auto& child : children_)
            child->on_call_retried(call_id, name, attempt);
    }

    void multiplexing_telemetry_service::on_state_change(manager_state old_state, manager_state new_state) const
    {
        for (const auto& child : children_)
            child->on_state_change(old_state, new_state);
    }

    void multiplexing_telemetry_service::on_spinner_visibility(bool visible) const
    {
        for (const auto& child : children_)
            child->on_spinner_visibility(visible);
    }

    void multiplexing_telemetry_service::on_timeout_extended(
        timeout_phase phase, std::chrono::milliseconds before, std::chrono::milliseconds after) const
    {
        for (const auto& child : children_)
            child->on_timeout_extended(phase, before, after);
    }

    void multiplexing_telemetry_service::on_timeout_declared(uint64_t aborted_handles) const
    {
        for (const auto& child : children_)
            child->on_timeout_declared(aborted_handles);
    }

    void multiplexing_telemetry_service::on_connectivity_fast_path(connectivity_state state) const
    {
        for (const auto& child : children_)
            child->on_connectivity_fast_path(state);
    }

    void multiplexing_telemetry_service::on_recovery_started() const
    {
        for (const auto& child : children_)
            child->on_recovery_started();
    }

    void multiplexing_telemetry_service::on_recovery_finished(uint64_t retried_calls) const
    {
        for (const auto& child : children_)
            child->on_recovery_finished(retried_calls);
    }

    void multiplexing_telemetry_service::message(level_enum level, const std::string& message) const
    {
        for (const auto& child : children_)
            child->message(level, message);
    }
}
