/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include <tether/telemetry/i_telemetry_service.h>

namespace spdlog
{
    class logger;
}

namespace tether
{
    // Writes every engine event as a coloured line to the console, and optionally to
    // <directory>/<suite>/<name>_console.log
    class console_telemetry_service : public i_telemetry_service
    {
        mutable std::shared_ptr<spdlog::logger> logger_;
        mutable std::string logger_name_;
        std::filesystem::path log_directory_;
        std::string test_suite_name_;
        std::string test_name_;

        console_telemetry_service(
            const std::string& test_suite_name, const std::string& test_name, const std::filesystem::path& directory);

        void init_logger() const;
        std::string get_call_colour(uint64_t call_id) const;
        std::string get_level_colour(level_enum level) const;
        std::string reset_colour() const;

    public:
        console_telemetry_service();
        ~console_telemetry_service() override;

        static bool create(std::shared_ptr<i_telemetry_service>& service,
            const std::string& test_suite_name,
            const std::string& name,
            const std::filesystem::path& directory);

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
