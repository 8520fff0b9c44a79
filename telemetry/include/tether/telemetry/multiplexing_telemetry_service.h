/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <tether/telemetry/i_telemetry_service.h>

namespace tether
{
    // Forwards every event to each child service
    class multiplexing_telemetry_service : public i_telemetry_service
    {
        std::vector<std::shared_ptr<i_telemetry_service>> children_;

        // (type, output path) pairs used to rebuild the children at the start of each test
        std::vector<std::pair<std::string, std::filesystem::path>> service_configs_;

    public:
        explicit multiplexing_telemetry_service(std::vector<std::shared_ptr<i_telemetry_service>>&& child_services);
        ~multiplexing_telemetry_service() override = default;

        static std::shared_ptr<multiplexing_telemetry_service> create(
            std::vector<std::shared_ptr<i_telemetry_service>>&& child_services);

        void add_child(std::shared_ptr<i_telemetry_service> child);
        size_t get_child_count() const;
        void clear_children();

        void register_service_config(const std::string& type, const std::filesystem::path& output_path);
        void start_test(const std::string& test_suite_name, const std::string& name);
        void reset_for_test();

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
    };
}
