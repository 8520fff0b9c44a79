/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
// Standard C++ headers
#include <cstdint>
#include <system_error>
#include <vector>

// tether headers
#include <tether/internal/error_codes.h>
#include <tether/telemetry/console_telemetry_service.h>

// Other headers
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace tether
{
    console_telemetry_service::console_telemetry_service() = default;

    console_telemetry_service::console_telemetry_service(
        const std::string& test_suite_name, const std::string& test_name, const std::filesystem::path& directory)
        : log_directory_(directory)
        , test_suite_name_(test_suite_name)
        , test_name_(test_name)
    {
    }

    console_telemetry_service::~console_telemetry_service()
    {
        if (logger_)
        {
            logger_->flush();
            if (!logger_name_.empty())
                spdlog::drop(logger_name_);
        }
    }

    bool console_telemetry_service::create(std::shared_ptr<i_telemetry_service>& service,
        const std::string& test_suite_name,
        const std::string& name,
        const std::filesystem::path& directory)
    {
        std::shared_ptr<console_telemetry_service> console_service;
        if (!directory.empty())
            console_service = std::shared_ptr<console_telemetry_service>(
                new console_telemetry_service(test_suite_name, name, directory));
        else
            console_service = std::make_shared<console_telemetry_service>();

        console_service->init_logger();
        service = console_service;
        return true;
    }

    void console_telemetry_service::init_logger() const
    {
        if (logger_)
            return;

        if (log_directory_.empty() || test_suite_name_.empty() || test_name_.empty())
        {
            logger_ = spdlog::default_logger();
            return;
        }

        // parameterised suite names contain '/'
        auto fixed_suite_name = test_suite_name_;
        for (auto& ch : fixed_suite_name)
        {
            if (ch == '/' || ch == '\\' || ch == ':' || ch == '*')
                ch = '#';
        }

        std::error_code ec;
        auto full_directory_path = log_directory_ / fixed_suite_name;
        std::filesystem::create_directories(full_directory_path, ec);
        if (ec)
        {
            spdlog::default_logger()->warn(
                "Failed to create console telemetry directory '{}': {} - falling back to console-only mode",
                full_directory_path.string(),
                ec.message());
            logger_ = spdlog::default_logger();
            return;
        }

        auto log_file_path = full_directory_path / (test_name_ + "_console.log");
        logger_name_ = "console_telemetry_" + std::to_string(reinterpret_cast<uintptr_t>(this));

        try
        {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file_path.string());
            console_sink->set_pattern("%v");
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");

            std::vector<spdlog::sink_ptr> sinks = {console_sink, file_sink};
            logger_ = std::make_shared<spdlog::logger>(logger_name_, sinks.begin(), sinks.end());
            logger_->set_level(spdlog::level::trace);
            logger_->flush_on(spdlog::level::trace);
            spdlog::register_logger(logger_);
            spdlog::default_logger()->info("Console telemetry logging to file: {}", log_file_path.string());
        }
        catch (const spdlog::spdlog_ex& ex)
        {
            spdlog::default_logger()->warn(
                "Unable to open console telemetry file '{}': {} - falling back to console-only mode",
                log_file_path.string(),
                ex.what());
            logger_name_.clear();
            logger_ = spdlog::default_logger();
        }
    }

    std::string console_telemetry_service::get_call_colour(uint64_t call_id) const
    {
        static const char* colours[] = {
            "\033[91m", // Bright Red
            "\033[92m", // Bright Green
            "\033[93m", // Bright Yellow
            "\033[94m", // Bright Blue
            "\033[95m", // Bright Magenta
            "\033[96m", // Bright Cyan
            "\033[97m", // Bright White
            "\033[90m"  // Bright Black (Gray)
        };
        return colours[call_id % 8];
    }

    std::string console_telemetry_service::get_level_colour(level_enum level) const
    {
        switch (level)
        {
        case warn:
            return "\033[93m";
        case err:
            return "\033[91m";
        case critical:
            return "\033[95m";
        default:
            return "";
        }
    }

    std::string console_telemetry_service::reset_colour() const
    {
        return "\033[0m";
    }

    void console_telemetry_service::on_call_registered(uint64_t call_id, const std::string& name, spinner_mode mode) const
    {
        init_logger();
        logger_->info("{}[CALL {}] registered {} spinner={}{}", get_call_colour(call_id), call_id, name, to_string(mode), reset_colour());
    }

    void console_telemetry_service::on_call_started(uint64_t call_id, const std::string& name, uint32_t attempt) const
    {
        init_logger();
        logger_->info("{}[CALL {}] started {} attempt={}{}", get_call_colour(call_id), call_id, name, attempt, reset_colour());
    }

    void console_telemetry_service::on_call_completed(uint64_t call_id, const std::string& name) const
    {
        init_logger();
        logger_->info("{}[CALL {}] completed {}{}", get_call_colour(call_id), call_id, name, reset_colour());
    }

    void console_telemetry_service::on_call_faulted(uint64_t call_id, const std::string& name, int error_code) const
    {
        init_logger();
        logger_->error("{}[CALL {}] faulted {} error={}{}",
            get_level_colour(err),
            call_id,
            name,
            error::to_string(error_code),
            reset_colour());
    }

    void console_telemetry_service::on_call_cancelled(uint64_t call_id, const std::string& name) const
    {
        init_logger();
        logger_->info("{}[CALL {}] attempt cancelled {}{}", get_call_colour(call_id), call_id, name, reset_colour());
    }

    void console_telemetry_service::on_call_retried(uint64_t call_id, const std::string& name, uint32_t attempt) const
    {
        init_logger();
        logger_->warn("{}[CALL {}] retrying {} attempt={}{}", get_level_colour(warn), call_id, name, attempt, reset_colour());
    }

    void console_telemetry_service::on_state_change(manager_state old_state, manager_state new_state) const
    {
        init_logger();
        auto colour = new_state == manager_state::error || new_state == manager_state::timed_out ? get_level_colour(warn) : "";
        logger_->info("{}state {} -> {}{}", colour, to_string(old_state), to_string(new_state), reset_colour());
    }

    void console_telemetry_service::on_spinner_visibility(bool visible) const
    {
        init_logger();
        logger_->info("spinner {}", visible ? "shown" : "hidden");
    }

    void console_telemetry_service::on_timeout_extended(
        timeout_phase phase, std::chrono::milliseconds before, std::chrono::milliseconds after) const
    {
        init_logger();
        logger_->debug("{} deadline extended {}ms -> {}ms", to_string(phase), before.count(), after.count());
    }

    void console_telemetry_service::on_timeout_declared(uint64_t aborted_handles) const
    {
        init_logger();
        logger_->warn("{}TIMEOUT declared, {} attempts aborted{}", get_level_colour(warn), aborted_handles, reset_colour());
    }

    void console_telemetry_service::on_connectivity_fast_path(connectivity_state state) const
    {
        init_logger();
        logger_->warn("{}connectivity {} short circuits the escalation clock{}", get_level_colour(warn), to_string(state), reset_colour());
    }

    void console_telemetry_service::on_recovery_started() const
    {
        init_logger();
        logger_->warn("{}=== RECOVERY STARTED ==={}", get_level_colour(warn), reset_colour());
    }

    void console_telemetry_service::on_recovery_finished(uint64_t retried_calls) const
    {
        init_logger();
        logger_->info("=== RECOVERY FINISHED, {} calls replayed ===", retried_calls);
    }

    void console_telemetry_service::message(level_enum level, const std::string& message) const
    {
        init_logger();
        logger_->log(static_cast<spdlog::level::level_enum>(level), "{}{}{}", get_level_colour(level), message, reset_colour());
    }
}
