/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <tether/internal/collaborators.h>
#include <tether/internal/error_codes.h>
#include <tether/internal/tick_source.h>

namespace tether::mock_test
{
    // Scripted backend for testing the call manager
    // Each function name is given a behaviour, every invocation is recorded with its start and end time.
    class mock_backend : public i_backend_transport
    {
    public:
        struct behaviour
        {
            enum class kind
            {
                // completes with `response` after `delay`
                RESPOND,
                // never completes, only returns once the caller aborts it
                NEVER,
                // faults with `error_code` after `delay`
                FAULT,
                // the backend gives up on the call itself after `delay`
                CANCEL
            };

            kind type = kind::RESPOND;
            std::chrono::milliseconds delay{0};
            function_response response;
            int error_code = error::TRANSPORT_ERROR();
            std::string fault_message = "scripted fault";
            // the first `hang_attempts` invocations behave as NEVER, later ones as `type`
            uint32_t hang_attempts = 0;
            // the first `cancel_attempts` invocations behave as CANCEL, later ones as `type`
            uint32_t cancel_attempts = 0;
        };

        struct invocation_record
        {
            uint64_t sequence;
            std::string name;
            function_parameters parameters;
            std::chrono::milliseconds started;
            std::optional<std::chrono::milliseconds> ended;
            std::optional<call_status> status;
            // the caller aborted the invocation while it was in flight
            bool aborted = false;
        };

    private:
        std::shared_ptr<i_tick_source> ticks_;
        behaviour default_behaviour_;
        std::map<std::string, behaviour> behaviours_;
        std::map<std::string, uint32_t> attempts_;
        std::map<std::string, uint32_t> in_flight_;
        std::map<std::string, uint32_t> max_in_flight_;
        std::vector<invocation_record> history_;
        uint64_t invoke_count_ = 0;

        CORO_TASK(bool) wait_for(std::chrono::milliseconds delay, const cancellation_token& token);
        void conclude(uint64_t sequence, const std::string& name, call_status status, bool aborted);

    public:
        explicit mock_backend(std::shared_ptr<i_tick_source> ticks);
        virtual ~mock_backend() = default;

        // Control methods for testing
        void set_behaviour(const std::string& name, behaviour b);
        void set_default_behaviour(behaviour b);
        void respond_after(const std::string& name, std::chrono::milliseconds delay, function_response response = {});
        void never_respond(const std::string& name);
        void fault_after(const std::string& name, std::chrono::milliseconds delay, int error_code, std::string message);
        void clear_history();

        std::vector<invocation_record> get_history() const { return history_; }
        std::vector<invocation_record> get_history(const std::string& name) const;
        uint64_t get_invoke_count() const { return invoke_count_; }
        uint32_t get_attempts(const std::string& name) const;
        uint32_t get_in_flight(const std::string& name) const;
        uint32_t get_max_in_flight(const std::string& name) const;

        CORO_TASK(call_outcome)
        invoke(const function_descriptor& descriptor,
            const function_parameters& parameters,
            cancellation_token token) override;
    };
}
